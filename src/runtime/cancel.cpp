#include <string_view>
#include <wasmbox/runtime/cancel.h>

namespace wasmbox::runtime
{

std::string_view to_string(CancelReason reason)
{
    switch (reason)
    {
    case CancelReason::None:
        return "not cancelled";
    case CancelReason::ClientDisconnected:
        return "client disconnected";
    case CancelReason::Shutdown:
        return "server shutting down";
    case CancelReason::Requested:
        return "cancellation requested";
    }
    return "cancelled";
}

} // namespace wasmbox::runtime
