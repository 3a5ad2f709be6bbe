#include <string_view>
#include <wasmbox/runtime/outcome.h>

namespace wasmbox::runtime
{

std::string_view to_string(Stage stage)
{
    switch (stage)
    {
    case Stage::Compilation:
        return "compilation";
    case Stage::Linking:
        return "linking";
    case Stage::EntryResolution:
        return "entry resolution";
    case Stage::Cancellation:
        return "cancellation";
    }
    return "unknown";
}

} // namespace wasmbox::runtime
