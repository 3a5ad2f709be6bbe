#include <mutex>
#include <string>
#include <string_view>
#include <wasmbox/server/log.h>

namespace wasmbox::server
{

void DiagnosticLog::line(std::string_view text)
{
    std::string buffered;
    buffered.reserve(text.size() + 1);
    buffered += text;
    buffered += '\n';
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << buffered;
    out_.flush();
}

void DiagnosticLog::message(std::string_view text)
{
    std::string buffered = "[LOG] Received message: ";
    buffered += text;
    line(buffered);
}

} // namespace wasmbox::server
