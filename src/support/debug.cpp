#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <wasmbox/support/debug.h>

namespace wasmbox::support
{

bool debug_enabled()
{
    static const bool enabled = []
    {
        const char* v = std::getenv("WASMBOX_DEBUG");
        return v != nullptr && *v != '\0' && std::string_view(v) != "0";
    }();
    return enabled;
}

void debug_line(std::string_view tag, std::string_view message)
{
    if (!debug_enabled())
    {
        return;
    }
    static std::mutex mutex;
    std::string line;
    line.reserve(tag.size() + message.size() + 4);
    line += '[';
    line += tag;
    line += "] ";
    line += message;
    line += '\n';
    std::lock_guard<std::mutex> lock(mutex);
    std::cerr << line << std::flush;
}

} // namespace wasmbox::support
