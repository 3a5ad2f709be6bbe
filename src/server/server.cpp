#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#include <wasmbox/server/http.h>
#include <wasmbox/server/server.h>
#include <wasmbox/support/debug.h>

namespace wasmbox::server
{

namespace
{

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr int kMonitorIntervalMs = 50;

std::atomic<Server*> g_signal_target{nullptr};

void on_stop_signal(int)
{
    Server* server = g_signal_target.load();
    if (server != nullptr)
    {
        server->request_stop();
    }
}

void set_timeouts(int fd, std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0)
    {
        return;
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    (void)setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// False when the peer went away before everything was written.
bool write_all(int fd, const std::string& data)
{
    const char* p = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0)
    {
        const ssize_t n = ::send(fd, p, remaining, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        p += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

void respond_and_close(int fd, const Response& response)
{
    if (!write_all(fd, serialize(response)))
    {
        support::debug_line("http", std::string("response not delivered: ") + std::strerror(errno));
    }
    (void)::shutdown(fd, SHUT_WR);
    ::close(fd);
}

} // namespace

Server::Server(const ServerConfig& config, const Router& router, DiagnosticLog& log)
    : config_(config), router_(router), log_(log)
{
}

Server::~Server()
{
    close_fds();
}

void Server::close_fds()
{
    for (int* fd : {&listen_fd_, &wake_read_, &wake_write_})
    {
        if (*fd >= 0)
        {
            ::close(*fd);
            *fd = -1;
        }
    }
}

std::optional<std::string> Server::listen()
{
    int wake[2] = {-1, -1};
    if (::pipe2(wake, O_CLOEXEC | O_NONBLOCK) != 0)
    {
        return std::string("cannot create wake pipe: ") + std::strerror(errno);
    }
    wake_read_ = wake[0];
    wake_write_ = wake[1];

    const std::string where = config_.host + ":" + std::to_string(config_.port);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (::inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1)
    {
        return "invalid listen address `" + config_.host + "` (expected an IPv4 address)";
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0)
    {
        return std::string("socket failed: ") + std::strerror(errno);
    }
    int yes = 1;
    (void)setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
    {
        return "cannot bind " + where + ": " + std::strerror(errno);
    }
    if (::listen(listen_fd_, 128) != 0)
    {
        return "cannot listen on " + where + ": " + std::strerror(errno);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0)
    {
        port_ = ntohs(bound.sin_port);
    }
    else
    {
        port_ = config_.port;
    }
    return std::nullopt;
}

void Server::request_stop() noexcept
{
    const int saved = errno;
    if (wake_write_ >= 0)
    {
        const char byte = 1;
        (void)::write(wake_write_, &byte, 1);
    }
    errno = saved;
}

void Server::serve()
{
    log_.line("listening on http://" + config_.host + ":" + std::to_string(port_));
    log_.line("profile " + std::string(runtime::to_string(config_.profile)) + ", " +
              std::to_string(config_.workers) + " workers");

    for (std::uint32_t i = 0; i < config_.workers; ++i)
    {
        workers_.emplace_back([this] { worker_loop(); });
    }
    monitor_ = std::thread([this] { monitor_loop(); });

    for (;;)
    {
        pollfd fds[2] = {{listen_fd_, POLLIN, 0}, {wake_read_, POLLIN, 0}};
        if (::poll(fds, 2, -1) < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            log_.line(std::string("poll failed: ") + std::strerror(errno));
            break;
        }
        if ((fds[1].revents & POLLIN) != 0)
        {
            break;
        }
        if ((fds[0].revents & POLLIN) != 0)
        {
            accept_one();
        }
    }

    ::close(listen_fd_);
    listen_fd_ = -1;
    log_.line("shutting down: waiting up to " + std::to_string(config_.shutdown_grace.count()) +
              "ms for in-flight requests");

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        const auto deadline = std::chrono::steady_clock::now() + config_.shutdown_grace;
        const bool idle = idle_cv_.wait_until(lock, deadline,
                                              [this] { return queue_.empty() && active_ == 0; });
        if (!idle)
        {
            lock.unlock();
            const std::size_t cancelled = cancel_in_flight(runtime::CancelReason::Shutdown);
            log_.line("grace period expired: cancelled " + std::to_string(cancelled) +
                      " in-flight runs");
            lock.lock();
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (std::thread& t : workers_)
    {
        t.join();
    }
    workers_.clear();

    monitor_stop_.store(true);
    monitor_.join();
    log_.line("shutdown complete");
}

void Server::accept_one()
{
    const int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0)
    {
        if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK && errno != ECONNABORTED)
        {
            log_.line(std::string("accept failed: ") + std::strerror(errno));
            // Out of descriptors: back off instead of spinning on a readable listen socket.
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() < config_.queue_capacity)
        {
            queue_.push_back(fd);
            queue_cv_.notify_one();
            return;
        }
    }
    log_.line("[http] 503 connection queue full");
    set_timeouts(fd, std::chrono::milliseconds(1000));
    respond_and_close(fd, Response{.status = 503, .body = "server busy\n"});
}

void Server::worker_loop()
{
    for (;;)
    {
        int fd = -1;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
            {
                return;
            }
            fd = queue_.front();
            queue_.pop_front();
            ++active_;
        }

        handle_connection(fd);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

void Server::handle_connection(int fd)
{
    set_timeouts(fd, config_.read_timeout);

    RequestParser parser(config_.max_body_bytes);
    std::vector<char> buf(kReadChunk);
    while (parser.status() == RequestParser::Status::Incomplete)
    {
        const ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n > 0)
        {
            (void)parser.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)));
            continue;
        }
        if (n == 0)
        {
            (void)parser.finish();
            continue;
        }
        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            respond_and_close(fd, Response{.status = 408, .body = "request timed out\n"});
            return;
        }
        support::debug_line("http", std::string("read failed: ") + std::strerror(errno));
        ::close(fd);
        return;
    }

    if (parser.status() == RequestParser::Status::Error)
    {
        const HttpError& err = parser.error();
        log_.line("[http] " + std::to_string(err.status) + " " + err.message);
        respond_and_close(fd, Response{.status = err.status, .body = err.message + "\n"});
        return;
    }

    auto cancel = std::make_shared<runtime::CancelToken>();
    const std::uint64_t id = track(fd, cancel);
    Response response = router_.handle(parser.request(), cancel.get());
    untrack(id);

    if (cancel->reason() == runtime::CancelReason::ClientDisconnected)
    {
        support::debug_line("http", "client went away; dropping the response");
        ::close(fd);
        return;
    }
    respond_and_close(fd, response);
}

std::uint64_t Server::track(int fd, const std::shared_ptr<runtime::CancelToken>& cancel)
{
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    const std::uint64_t id = next_id_++;
    inflight_.emplace(id, InFlight{.fd = fd, .cancel = cancel});
    if (cancel_all_)
    {
        cancel->cancel(runtime::CancelReason::Shutdown);
    }
    return id;
}

void Server::untrack(std::uint64_t id)
{
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_.erase(id);
}

std::size_t Server::cancel_in_flight(runtime::CancelReason reason)
{
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    cancel_all_ = true;
    for (auto& [id, entry] : inflight_)
    {
        entry.cancel->cancel(reason);
    }
    return inflight_.size();
}

void Server::monitor_loop()
{
    std::vector<InFlight> watched;
    std::vector<pollfd> fds;
    while (!monitor_stop_.load())
    {
        watched.clear();
        {
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            for (const auto& [id, entry] : inflight_)
            {
                if (!entry.cancel->cancelled())
                {
                    watched.push_back(entry);
                }
            }
        }
        if (watched.empty())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(kMonitorIntervalMs));
            continue;
        }

        fds.clear();
        for (const InFlight& entry : watched)
        {
            fds.push_back(pollfd{entry.fd, POLLRDHUP, 0});
        }
        const int ready = ::poll(fds.data(), fds.size(), kMonitorIntervalMs);
        if (ready <= 0)
        {
            continue;
        }
        for (std::size_t i = 0; i < fds.size(); ++i)
        {
            if ((fds[i].revents & (POLLRDHUP | POLLHUP | POLLERR)) != 0)
            {
                watched[i].cancel->cancel(runtime::CancelReason::ClientDisconnected);
                log_.line("[http] client disconnected; cancelling its run");
            }
        }
    }
}

void install_stop_signals(Server& server)
{
    g_signal_target.store(&server);
    struct sigaction sa{};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    (void)sigaction(SIGINT, &sa, nullptr);
    (void)sigaction(SIGTERM, &sa, nullptr);
    (void)std::signal(SIGPIPE, SIG_IGN);
}

void clear_stop_signals()
{
    (void)std::signal(SIGINT, SIG_DFL);
    (void)std::signal(SIGTERM, SIG_DFL);
    g_signal_target.store(nullptr);
}

} // namespace wasmbox::server
