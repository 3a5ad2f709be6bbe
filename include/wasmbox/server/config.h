#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <wasmbox/runtime/profile.h>
#include <wasmbox/runtime/sandbox_limits.h>

/**
 * @file config.h
 * @brief Gateway configuration: listening address, worker pool and per-request limits.
 */

namespace wasmbox::server
{

struct ServerConfig
{
    std::string host = "0.0.0.0";
    std::uint16_t port = 3000;
    runtime::Profile profile = runtime::Profile::Module;
    std::uint32_t workers = 4;
    /** @brief Accepted connections waiting for a worker; one more is answered with 503. */
    std::size_t queue_capacity = 64;
    std::size_t max_body_bytes = 16 * runtime::kMiB;
    /** @brief Compiled modules kept across requests; 0 disables the cache. */
    std::size_t cache_entries = 0;
    std::chrono::milliseconds shutdown_grace{5000};
    /** @brief How long a client may take to send its request. */
    std::chrono::milliseconds read_timeout{30000};
    runtime::SandboxLimits limits;
};

constexpr std::uint32_t kMaxWorkers = 256;

/** @brief `PORT`-style value: 0..65535. */
[[nodiscard]] std::optional<std::uint16_t> parse_port(std::string_view text);

/** @brief Range checks that are not already part of `runtime::validate(SandboxLimits)`. */
[[nodiscard]] std::optional<runtime::ConfigError> validate(const ServerConfig& config);

/**
 * @brief Defaults overridden by `HOST`, `PORT` and the `WASMBOX_*` variables.
 *
 * The result is not validated yet so that command-line flags can still override it; call
 * `validate` once every source has been applied.
 */
[[nodiscard]] std::variant<ServerConfig, runtime::ConfigError>
load_server_config(const runtime::EnvLookup& env);

} // namespace wasmbox::server
