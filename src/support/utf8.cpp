#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <wasmbox/support/utf8.h>

namespace wasmbox::support
{

namespace
{

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

// Length of the well-formed prefix of the sequence starting at `i`, or 0 when the sequence is
// complete and valid (its full length is written to `full`).
std::size_t scan_sequence(std::string_view s, std::size_t i, std::size_t& full)
{
    const auto b0 = static_cast<std::uint8_t>(s[i]);
    full = 0;
    if (b0 < 0x80)
    {
        full = 1;
        return 0;
    }

    std::size_t need = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF)
    {
        need = 1;
    }
    else if (b0 == 0xE0)
    {
        need = 2;
        lo = 0xA0;
    }
    else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF)
    {
        need = 2;
    }
    else if (b0 == 0xED)
    {
        need = 2;
        hi = 0x9F;
    }
    else if (b0 == 0xF0)
    {
        need = 3;
        lo = 0x90;
    }
    else if (b0 >= 0xF1 && b0 <= 0xF3)
    {
        need = 3;
    }
    else if (b0 == 0xF4)
    {
        need = 3;
        hi = 0x8F;
    }
    else
    {
        return 1;
    }

    std::size_t consumed = 1;
    for (std::size_t k = 0; k < need; ++k)
    {
        const std::size_t at = i + 1 + k;
        if (at >= s.size())
        {
            return consumed;
        }
        const auto b = static_cast<std::uint8_t>(s[at]);
        const std::uint8_t min = (k == 0) ? lo : 0x80;
        const std::uint8_t max = (k == 0) ? hi : 0xBF;
        if (b < min || b > max)
        {
            return consumed;
        }
        ++consumed;
    }

    full = consumed;
    return 0;
}

} // namespace

bool is_valid_utf8(std::string_view bytes)
{
    std::size_t i = 0;
    while (i < bytes.size())
    {
        std::size_t full = 0;
        if (scan_sequence(bytes, i, full) != 0)
        {
            return false;
        }
        i += full;
    }
    return true;
}

std::string decode_lossy(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size())
    {
        std::size_t full = 0;
        const std::size_t bad = scan_sequence(bytes, i, full);
        if (bad == 0)
        {
            out.append(bytes.substr(i, full));
            i += full;
            continue;
        }
        out.append(kReplacement);
        i += bad;
    }
    return out;
}

} // namespace wasmbox::support
