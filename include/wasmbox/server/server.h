#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <wasmbox/runtime/cancel.h>
#include <wasmbox/server/config.h>
#include <wasmbox/server/log.h>
#include <wasmbox/server/router.h>

/**
 * @file server.h
 * @brief HTTP/1.1 gateway: listening socket, fixed worker pool and disconnect monitor.
 */

namespace wasmbox::server
{

/**
 * @brief Accepts connections and hands each one to a worker.
 *
 * Lifecycle: `listen`, then `serve` on the calling thread until `request_stop`. Stopping closes
 * the listening socket, gives in-flight requests `shutdown_grace` to finish, cancels whatever is
 * still running and joins every thread before `serve` returns.
 */
class Server
{
  public:
    /** @brief All references must outlive the server. */
    Server(const ServerConfig& config, const Router& router, DiagnosticLog& log);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /** @brief Bind and listen; returns the reason on failure. */
    [[nodiscard]] std::optional<std::string> listen();

    /** @brief Bound port; differs from the configured one when that was 0. */
    [[nodiscard]] std::uint16_t port() const { return port_; }

    void serve();

    /** @brief Ask `serve` to shut down. Async-signal-safe; may be called from any thread. */
    void request_stop() noexcept;

  private:
    struct InFlight
    {
        int fd = -1;
        std::shared_ptr<runtime::CancelToken> cancel;
    };

    const ServerConfig& config_;
    const Router& router_;
    DiagnosticLog& log_;

    int listen_fd_ = -1;
    int wake_read_ = -1;
    int wake_write_ = -1;
    std::uint16_t port_ = 0;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<int> queue_;
    std::size_t active_ = 0;
    bool stopping_ = false;

    std::mutex inflight_mutex_;
    std::map<std::uint64_t, InFlight> inflight_;
    std::uint64_t next_id_ = 0;
    bool cancel_all_ = false;

    std::atomic<bool> monitor_stop_{false};
    std::vector<std::thread> workers_;
    std::thread monitor_;

    void accept_one();
    void worker_loop();
    void monitor_loop();
    void handle_connection(int fd);

    std::uint64_t track(int fd, const std::shared_ptr<runtime::CancelToken>& cancel);
    void untrack(std::uint64_t id);
    std::size_t cancel_in_flight(runtime::CancelReason reason);
    void close_fds();
};

/**
 * @brief Route SIGINT and SIGTERM to `server.request_stop()` and ignore SIGPIPE.
 *
 * Only one server can receive signals at a time; `clear_stop_signals` restores the defaults.
 */
void install_stop_signals(Server& server);
void clear_stop_signals();

} // namespace wasmbox::server
