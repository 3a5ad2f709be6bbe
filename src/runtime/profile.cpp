#include <optional>
#include <string_view>
#include <wasmbox/runtime/profile.h>

namespace wasmbox::runtime
{

std::string_view to_string(Profile profile)
{
    switch (profile)
    {
    case Profile::Module:
        return "module";
    case Profile::Component:
        return "component";
    }
    return "unknown";
}

std::optional<Profile> parse_profile(std::string_view text)
{
    if (text == "module")
    {
        return Profile::Module;
    }
    if (text == "component")
    {
        return Profile::Component;
    }
    return std::nullopt;
}

} // namespace wasmbox::runtime
