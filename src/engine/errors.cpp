#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <wasmbox/engine/errors.h>

namespace wasmbox::engine
{

namespace
{

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    {
        s.remove_prefix(1);
    }
    while (!s.empty() && (std::isspace(static_cast<unsigned char>(s.back())) || s.back() == '\0'))
    {
        s.remove_suffix(1);
    }
    return s;
}

// "0: message" as anyhow numbers multiple causes.
std::string_view strip_cause_number(std::string_view line)
{
    std::size_t i = 0;
    while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i])))
    {
        ++i;
    }
    if (i > 0 && i + 1 < line.size() && line[i] == ':' && line[i + 1] == ' ')
    {
        return trim(line.substr(i + 1));
    }
    return line;
}

std::optional<std::string> wording_for(wasmtime_trap_code_t code)
{
    switch (code)
    {
    case WASMTIME_TRAP_CODE_STACK_OVERFLOW:
        return "call stack exhausted";
    case WASMTIME_TRAP_CODE_MEMORY_OUT_OF_BOUNDS:
        return "out of bounds memory access";
    case WASMTIME_TRAP_CODE_HEAP_MISALIGNED:
        return "unaligned atomic";
    case WASMTIME_TRAP_CODE_TABLE_OUT_OF_BOUNDS:
        return "out of bounds table access";
    case WASMTIME_TRAP_CODE_INDIRECT_CALL_TO_NULL:
        return "uninitialized element";
    case WASMTIME_TRAP_CODE_BAD_SIGNATURE:
        return "indirect call type mismatch";
    case WASMTIME_TRAP_CODE_INTEGER_OVERFLOW:
        return "integer overflow";
    case WASMTIME_TRAP_CODE_INTEGER_DIVISION_BY_ZERO:
        return "integer divide by zero";
    case WASMTIME_TRAP_CODE_BAD_CONVERSION_TO_INTEGER:
        return "invalid conversion to integer";
    case WASMTIME_TRAP_CODE_UNREACHABLE_CODE_REACHED:
        return "unreachable executed";
    default:
        return std::nullopt;
    }
}

std::string byte_vec_text(wasm_byte_vec_t& vec)
{
    std::string text(vec.data, vec.size);
    wasm_byte_vec_delete(&vec);
    return text;
}

} // namespace

std::string flatten_message(std::string_view rendered)
{
    std::vector<std::string_view> parts;
    bool in_frames = false;
    while (!rendered.empty())
    {
        const std::size_t nl = rendered.find('\n');
        const std::string_view raw = rendered.substr(0, nl);
        rendered.remove_prefix(nl == std::string_view::npos ? rendered.size() : nl + 1);

        const std::string_view line = trim(raw);
        if (line.empty())
        {
            in_frames = false;
            continue;
        }
        if (line == "Stack backtrace:")
        {
            break;
        }
        if (in_frames || line == "Caused by:")
        {
            continue;
        }
        if (line.size() >= 15 && line.substr(line.size() - 15) == "wasm backtrace:")
        {
            in_frames = true;
            continue;
        }
        parts.push_back(strip_cause_number(line));
    }

    std::string out;
    for (const std::string_view part : parts)
    {
        if (!out.empty())
        {
            out += ": ";
        }
        out += part;
    }
    return out;
}

std::string trap_wording(std::string_view engine_text)
{
    std::string_view text = trim(engine_text);
    constexpr std::string_view kPrefix = "wasm trap: ";
    if (text.substr(0, kPrefix.size()) == kPrefix)
    {
        text.remove_prefix(kPrefix.size());
    }
    if (text == "wasm `unreachable` instruction executed")
    {
        return "unreachable executed";
    }
    if (text == "undefined element: out of bounds table access")
    {
        return "out of bounds table access";
    }
    return std::string(text);
}

std::string error_message(const wasmtime_error_t* error)
{
    wasm_byte_vec_t rendered;
    wasmtime_error_message(error, &rendered);
    return flatten_message(byte_vec_text(rendered));
}

CallError from_trap(const wasm_trap_t* trap)
{
    CallError out{.kind = CallError::Kind::Trap};
    wasmtime_trap_code_t code = 0;
    if (wasmtime_trap_code(trap, &code))
    {
        out.out_of_fuel = code == WASMTIME_TRAP_CODE_OUT_OF_FUEL;
        if (auto wording = wording_for(code))
        {
            out.message = std::move(*wording);
            return out;
        }
    }
    // A host-raised trap carries its own text.
    wasm_message_t rendered;
    wasm_trap_message(trap, &rendered);
    out.message = trap_wording(flatten_message(byte_vec_text(rendered)));
    return out;
}

CallError from_error(const wasmtime_error_t* error)
{
    int status = 0;
    if (wasmtime_error_exit_status(error, &status))
    {
        return CallError{.kind = CallError::Kind::Exit, .exit_status = status};
    }

    wasm_frame_vec_t frames;
    wasmtime_error_wasm_trace(error, &frames);
    const bool from_guest = frames.size > 0;
    wasm_frame_vec_delete(&frames);

    std::string message = error_message(error);
    if (!from_guest)
    {
        return CallError{.kind = CallError::Kind::Error, .message = std::move(message)};
    }
    // Raised while guest code was on the stack.
    std::string wording = trap_wording(message);
    const bool out_of_fuel = wording == "all fuel consumed by WebAssembly";
    return CallError{.kind = CallError::Kind::Trap,
                     .message = std::move(wording),
                     .out_of_fuel = out_of_fuel};
}

CallError from_trap_error(const wasmtime::TrapError& error)
{
    if (const auto* trap = std::get_if<wasmtime::Trap>(&error.data))
    {
        return from_trap(trap->capi());
    }
    const auto& err = std::get<wasmtime::Error>(error.data);
    if (auto status = err.i32_exit())
    {
        return CallError{.kind = CallError::Kind::Exit, .exit_status = *status};
    }
    return CallError{.kind = CallError::Kind::Error, .message = flatten_message(err.message())};
}

} // namespace wasmbox::engine
