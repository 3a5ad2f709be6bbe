#include <string>
#include <type_traits>
#include <variant>
#include <wasmbox/runtime/report.h>
#include <wasmbox/support/utf8.h>

namespace wasmbox::runtime
{

namespace
{

void append_stream(std::string& out, const char* label, const std::string& bytes, bool truncated)
{
    out += "-- ";
    out += label;
    out += " --\n";
    out += support::decode_lossy(bytes);
    if (!bytes.empty() && bytes.back() != '\n')
    {
        out += '\n';
    }
    if (truncated)
    {
        out += "(truncated)\n";
    }
}

void append_output(std::string& out, const CapturedOutput& output)
{
    out += '\n';
    append_stream(out, "stdout", output.stdout_bytes, output.stdout_truncated);
    if (!output.stderr_bytes.empty())
    {
        out += '\n';
        append_stream(out, "stderr", output.stderr_bytes, output.stderr_truncated);
    }
}

} // namespace

std::string render_failure(const Failed& failed)
{
    return "WASM error: " + std::string(to_string(failed.stage)) + ": " + failed.message + "\n";
}

std::string render_report(const ExecutionOutcome& outcome)
{
    return std::visit(
        [](const auto& o) -> std::string
        {
            using T = std::decay_t<decltype(o)>;
            std::string out;
            if constexpr (std::is_same_v<T, Completed>)
            {
                out += "status: completed\n";
                out += "entry: " + std::string(to_string(o.entry)) + "\n";
                out += "exit code: " + std::to_string(o.exit_code) + "\n";
                append_output(out, o.output);
            }
            else if constexpr (std::is_same_v<T, Trapped>)
            {
                out += "status: trapped\n";
                if (o.entry.has_value())
                {
                    out += "entry: " + std::string(to_string(*o.entry)) + "\n";
                }
                else
                {
                    out += "entry: (instantiation)\n";
                }
                out += "trap: " + o.message + "\n";
                append_output(out, o.output);
            }
            else
            {
                out = render_failure(o);
            }
            return out;
        },
        outcome);
}

} // namespace wasmbox::runtime
