#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <wasmbox/runtime/sandbox_limits.h>

namespace wasmbox::runtime
{

namespace
{

constexpr std::uint64_t kMaxReservation = 8 * kGiB;
constexpr std::uint64_t kMaxGuard = 2 * kGiB;
constexpr std::uint64_t kMaxMemoryCeiling = 4 * kGiB;

std::string lower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (const char c : s)
    {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

bool read_size(const EnvLookup& env, const std::string& key, std::uint64_t& out,
               std::optional<ConfigError>& error)
{
    const auto raw = env(key);
    if (!raw.has_value())
    {
        return true;
    }
    const auto v = parse_size(*raw);
    if (!v.has_value())
    {
        error = ConfigError{.message = key + ": expected a byte size such as 1048576, 64K or 16M, got '" +
                                       *raw + "'"};
        return false;
    }
    out = *v;
    return true;
}

bool read_uint(const EnvLookup& env, const std::string& key, std::uint64_t& out,
               std::optional<ConfigError>& error)
{
    const auto raw = env(key);
    if (!raw.has_value())
    {
        return true;
    }
    const auto v = parse_uint(*raw);
    if (!v.has_value())
    {
        error = ConfigError{.message = key + ": expected a non-negative integer, got '" + *raw + "'"};
        return false;
    }
    out = *v;
    return true;
}

} // namespace

EnvLookup process_env()
{
    return [](const std::string& key) -> std::optional<std::string>
    {
        const char* v = std::getenv(key.c_str());
        if (v == nullptr)
        {
            return std::nullopt;
        }
        return std::string(v);
    };
}

std::optional<std::uint64_t> parse_uint(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    std::uint64_t v = 0;
    for (const char c : text)
    {
        if (c < '0' || c > '9')
        {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
        {
            return std::nullopt;
        }
        v = v * 10 + digit;
    }
    return v;
}

std::optional<std::uint64_t> parse_size(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    std::uint64_t multiplier = 1;
    const char last = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
    if (last == 'K' || last == 'M' || last == 'G')
    {
        multiplier = last == 'K' ? kKiB : (last == 'M' ? kMiB : kGiB);
        text.remove_suffix(1);
    }
    const auto base = parse_uint(text);
    if (!base.has_value())
    {
        return std::nullopt;
    }
    if (*base > std::numeric_limits<std::uint64_t>::max() / multiplier)
    {
        return std::nullopt;
    }
    return *base * multiplier;
}

std::optional<bool> parse_bool(std::string_view text)
{
    const std::string v = lower(text);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
    {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off")
    {
        return false;
    }
    return std::nullopt;
}

std::optional<ConfigError> validate(const SandboxLimits& limits)
{
    if (limits.initial_memory_reservation_bytes == 0)
    {
        return ConfigError{.message = "memory reservation must be greater than zero"};
    }
    if (limits.initial_memory_reservation_bytes > kMaxReservation)
    {
        return ConfigError{.message = "memory reservation must be at most 8G"};
    }
    if (limits.growth_reservation_bytes > kMaxReservation)
    {
        return ConfigError{.message = "memory growth reservation must be at most 8G"};
    }
    if (limits.guard_size_bytes > kMaxGuard)
    {
        return ConfigError{.message = "memory guard size must be at most 2G"};
    }
    if (limits.max_memory_bytes < 64 * kKiB || limits.max_memory_bytes > kMaxMemoryCeiling)
    {
        return ConfigError{.message = "max memory must be between 64K and 4G"};
    }
    if (limits.output_capacity_bytes == 0)
    {
        return ConfigError{.message = "output capacity must be greater than zero"};
    }
    if (limits.max_wasm_stack_bytes == 0 || limits.max_table_elements == 0)
    {
        return ConfigError{.message = "wasm stack and table limits must be greater than zero"};
    }
    return std::nullopt;
}

std::variant<SandboxLimits, ConfigError> load_sandbox_limits(const EnvLookup& env)
{
    SandboxLimits limits;
    std::optional<ConfigError> error;

    std::uint64_t output_capacity = limits.output_capacity_bytes;
    if (!read_size(env, "WASMBOX_MEMORY_RESERVATION", limits.initial_memory_reservation_bytes,
                   error) ||
        !read_size(env, "WASMBOX_MEMORY_RESERVATION_FOR_GROWTH", limits.growth_reservation_bytes,
                   error) ||
        !read_size(env, "WASMBOX_MEMORY_GUARD_SIZE", limits.guard_size_bytes, error) ||
        !read_size(env, "WASMBOX_MAX_MEMORY", limits.max_memory_bytes, error) ||
        !read_uint(env, "WASMBOX_FUEL", limits.fuel, error) ||
        !read_uint(env, "WASMBOX_TIMEOUT_MS", limits.timeout_ms, error) ||
        !read_size(env, "WASMBOX_OUTPUT_CAPACITY", output_capacity, error))
    {
        return *error;
    }
    limits.output_capacity_bytes = static_cast<std::size_t>(output_capacity);

    if (const auto raw = env("WASMBOX_MEMORY_MAY_MOVE"))
    {
        const auto v = parse_bool(*raw);
        if (!v.has_value())
        {
            return ConfigError{.message = "WASMBOX_MEMORY_MAY_MOVE: expected a boolean, got '" +
                                          *raw + "'"};
        }
        limits.allow_memory_relocation = *v;
    }

    if (auto err = validate(limits))
    {
        return *err;
    }
    return limits;
}

} // namespace wasmbox::runtime
