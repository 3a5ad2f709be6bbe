#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <wasmbox/runtime/report.h>
#include <wasmbox/server/router.h>
#include <wasmbox/support/utf8.h>

namespace wasmbox::server
{

namespace
{

Response text(int status, std::string body)
{
    return Response{.status = status, .body = std::move(body)};
}

std::string outcome_tag(const runtime::ExecutionOutcome& outcome)
{
    return std::visit(
        [](const auto& o) -> std::string
        {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, runtime::Completed>)
            {
                return "completed exit=" + std::to_string(o.exit_code);
            }
            else if constexpr (std::is_same_v<T, runtime::Trapped>)
            {
                return "trapped";
            }
            else
            {
                return "failed:" + std::string(runtime::to_string(o.stage));
            }
        },
        outcome);
}

} // namespace

const std::string& usage_text()
{
    static const std::string text =
        "wasmbox: sandboxed WebAssembly execution service\n"
        "\n"
        "  GET  /              this text\n"
        "  POST /log           append the UTF-8 body to the server's diagnostic log\n"
        "  POST /execute-wasm  run the body as a WebAssembly program and return its output\n"
        "\n"
        "Execution reports are plain text. A run that completes or traps answers 200 with the\n"
        "captured stdout (and stderr, when non-empty). A payload that cannot be compiled,\n"
        "linked or started answers 400 with `WASM error: <stage>: <message>`; a run cancelled\n"
        "by timeout, fuel or memory limits answers 503.\n";
    return text;
}

int http_status(const runtime::ExecutionOutcome& outcome)
{
    if (const auto* failed = std::get_if<runtime::Failed>(&outcome))
    {
        return failed->stage == runtime::Stage::Cancellation ? 503 : 400;
    }
    return 200;
}

Response Router::handle(Request& request, const runtime::CancelToken* cancel) const
{
    if (request.method == "GET" && request.path == "/")
    {
        return text(200, usage_text());
    }
    if (request.method == "POST" && request.path == "/log")
    {
        return log_message(request);
    }
    if (request.method == "POST" && request.path == "/execute-wasm")
    {
        return execute(request, cancel);
    }
    return text(404, "Not Found\n");
}

Response Router::log_message(const Request& request) const
{
    if (!support::is_valid_utf8(request.body))
    {
        return text(400, "Invalid UTF-8 in request body\n");
    }
    log_.message(request.body);
    return text(200, "Message logged successfully\n");
}

Response Router::execute(Request& request, const runtime::CancelToken* cancel) const
{
    // The payload is owned by this request and dropped once the run is over.
    const std::vector<std::uint8_t> payload(request.body.begin(), request.body.end());
    std::string().swap(request.body);

    runtime::ExecutionOptions options;
    options.cancel = cancel;

    const auto started = std::chrono::steady_clock::now();
    const runtime::ExecutionOutcome outcome = supervisor_.execute(payload, options);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    const int status = http_status(outcome);
    log_.line("[exec] " + std::to_string(status) + " " + outcome_tag(outcome) + " " +
              std::to_string(payload.size()) + "B " + std::to_string(elapsed.count()) + "ms");
    return text(status, runtime::render_report(outcome));
}

} // namespace wasmbox::server
