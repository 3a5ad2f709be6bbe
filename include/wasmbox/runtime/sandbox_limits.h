#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file sandbox_limits.h
 * @brief Process-wide, immutable sandbox resource configuration.
 */

namespace wasmbox::runtime
{

constexpr std::uint64_t kKiB = 1024;
constexpr std::uint64_t kMiB = 1024 * kKiB;
constexpr std::uint64_t kGiB = 1024 * kMiB;

/**
 * @brief Resource limits applied to every sandbox.
 *
 * Built once at startup and shared read-only by every request; pass it by const reference.
 */
struct SandboxLimits
{
    /** @brief Virtual address range reserved for a linear memory up front. Must be > 0. */
    std::uint64_t initial_memory_reservation_bytes = 1 * kMiB;
    /** @brief Extra reservation placed after a memory that had to move to grow. */
    std::uint64_t growth_reservation_bytes = 16 * kMiB;
    /** @brief Inaccessible region mapped after each reservation. */
    std::uint64_t guard_size_bytes = 0;
    /** @brief Whether a memory may be relocated when growth exceeds its reservation. */
    bool allow_memory_relocation = true;

    /** @brief Hard ceiling on one linear memory; growth past it cancels the run. */
    std::uint64_t max_memory_bytes = 256 * kMiB;
    /** @brief Instruction budget per run; 0 disables fuel metering. */
    std::uint64_t fuel = 0;
    /** @brief Wall-clock budget per run in milliseconds; 0 disables the deadline. */
    std::uint64_t timeout_ms = 10000;
    /** @brief Capacity of each captured stdio buffer. */
    std::size_t output_capacity_bytes = 1 * kMiB;

    /** @brief Native stack the engine lets guest code use; deeper recursion traps. */
    std::size_t max_wasm_stack_bytes = 512 * kKiB;
    std::uint32_t max_table_elements = 10000000;
};

struct ConfigError
{
    std::string message;
};

/** @brief Lookup of a configuration variable; the process environment in production. */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

[[nodiscard]] EnvLookup process_env();

/** @brief Byte count with an optional `K`, `M` or `G` suffix (binary multiples). */
[[nodiscard]] std::optional<std::uint64_t> parse_size(std::string_view text);
[[nodiscard]] std::optional<std::uint64_t> parse_uint(std::string_view text);
/** @brief `1/0`, `true/false`, `yes/no`, `on/off`. */
[[nodiscard]] std::optional<bool> parse_bool(std::string_view text);

/** @brief Check internal consistency; a returned error means the process must not start. */
[[nodiscard]] std::optional<ConfigError> validate(const SandboxLimits& limits);

/**
 * @brief Defaults overridden by `WASMBOX_*` variables, then validated.
 */
[[nodiscard]] std::variant<SandboxLimits, ConfigError> load_sandbox_limits(const EnvLookup& env);

} // namespace wasmbox::runtime
