#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <wasmbox/runtime/output_buffer.h>

namespace wasmbox::runtime
{

std::size_t OutputBuffer::append(std::string_view bytes)
{
    const std::size_t room = capacity_ - std::min(capacity_, data_.size());
    const std::size_t kept = std::min(room, bytes.size());
    if (kept < bytes.size())
    {
        truncated_ = true;
    }
    data_.append(bytes.data(), kept);
    return kept;
}

std::size_t OutputBuffer::append(const std::uint8_t* data, std::size_t size)
{
    return append(std::string_view(reinterpret_cast<const char*>(data), size));
}

} // namespace wasmbox::runtime
