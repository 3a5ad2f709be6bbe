#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <wasmbox/server/config.h>

namespace wasmbox::server
{

std::optional<std::uint16_t> parse_port(std::string_view text)
{
    const auto v = runtime::parse_uint(text);
    if (!v.has_value() || *v > 65535)
    {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(*v);
}

std::optional<runtime::ConfigError> validate(const ServerConfig& config)
{
    if (config.host.empty())
    {
        return runtime::ConfigError{.message = "HOST must not be empty"};
    }
    if (config.workers == 0 || config.workers > kMaxWorkers)
    {
        return runtime::ConfigError{.message = "worker count must be between 1 and 256"};
    }
    if (config.queue_capacity == 0)
    {
        return runtime::ConfigError{.message = "connection queue capacity must be greater than zero"};
    }
    return runtime::validate(config.limits);
}

std::variant<ServerConfig, runtime::ConfigError> load_server_config(const runtime::EnvLookup& env)
{
    auto limits = runtime::load_sandbox_limits(env);
    if (auto* err = std::get_if<runtime::ConfigError>(&limits))
    {
        return *err;
    }

    ServerConfig config;
    config.limits = std::get<runtime::SandboxLimits>(limits);

    if (const auto host = env("HOST"); host.has_value() && !host->empty())
    {
        config.host = *host;
    }
    if (const auto raw = env("PORT"))
    {
        const auto port = parse_port(*raw);
        if (!port.has_value())
        {
            return runtime::ConfigError{.message = "PORT: expected 0..65535, got '" + *raw + "'"};
        }
        config.port = *port;
    }
    if (const auto raw = env("WASMBOX_PROFILE"))
    {
        const auto profile = runtime::parse_profile(*raw);
        if (!profile.has_value())
        {
            return runtime::ConfigError{
                .message = "WASMBOX_PROFILE: expected 'module' or 'component', got '" + *raw + "'"};
        }
        config.profile = *profile;
    }
    if (const auto raw = env("WASMBOX_WORKERS"))
    {
        const auto v = runtime::parse_uint(*raw);
        if (!v.has_value() || *v == 0 || *v > kMaxWorkers)
        {
            return runtime::ConfigError{.message = "WASMBOX_WORKERS: expected 1..256, got '" + *raw +
                                                   "'"};
        }
        config.workers = static_cast<std::uint32_t>(*v);
    }
    if (const auto raw = env("WASMBOX_MAX_BODY"))
    {
        const auto v = runtime::parse_size(*raw);
        if (!v.has_value() || *v == 0)
        {
            return runtime::ConfigError{.message = "WASMBOX_MAX_BODY: expected a byte size, got '" +
                                                   *raw + "'"};
        }
        config.max_body_bytes = static_cast<std::size_t>(*v);
    }
    if (const auto raw = env("WASMBOX_CACHE_ENTRIES"))
    {
        const auto v = runtime::parse_uint(*raw);
        if (!v.has_value())
        {
            return runtime::ConfigError{
                .message = "WASMBOX_CACHE_ENTRIES: expected a non-negative integer, got '" + *raw +
                           "'"};
        }
        config.cache_entries = static_cast<std::size_t>(*v);
    }
    if (const auto raw = env("WASMBOX_SHUTDOWN_GRACE_MS"))
    {
        const auto v = runtime::parse_uint(*raw);
        if (!v.has_value())
        {
            return runtime::ConfigError{
                .message = "WASMBOX_SHUTDOWN_GRACE_MS: expected milliseconds, got '" + *raw + "'"};
        }
        config.shutdown_grace = std::chrono::milliseconds(static_cast<std::int64_t>(*v));
    }
    return config;
}

} // namespace wasmbox::server
