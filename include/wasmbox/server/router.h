#pragma once

#include <string>
#include <wasmbox/runtime/cancel.h>
#include <wasmbox/runtime/outcome.h>
#include <wasmbox/runtime/supervisor.h>
#include <wasmbox/server/http.h>
#include <wasmbox/server/log.h>

/**
 * @file router.h
 * @brief Maps requests to the usage page, the diagnostic log and the execution core.
 */

namespace wasmbox::server
{

/** @brief Text served by `GET /`. */
[[nodiscard]] const std::string& usage_text();

/** @brief 200 for completed and trapped runs, 400 for payload failures, 503 for cancellation. */
[[nodiscard]] int http_status(const runtime::ExecutionOutcome& outcome);

class Router
{
  public:
    /** @brief Both references must outlive the router. */
    Router(const runtime::Supervisor& supervisor, DiagnosticLog& log)
        : supervisor_(supervisor), log_(log)
    {
    }

    /**
     * @brief Serve one parsed request.
     *
     * `cancel` is handed to the execution core for `/execute-wasm`; it may be null.
     */
    [[nodiscard]] Response handle(Request& request, const runtime::CancelToken* cancel) const;

  private:
    const runtime::Supervisor& supervisor_;
    DiagnosticLog& log_;

    Response log_message(const Request& request) const;
    Response execute(Request& request, const runtime::CancelToken* cancel) const;
};

} // namespace wasmbox::server
