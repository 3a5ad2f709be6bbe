#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <wasmbox/engine/component.h>
#include <wasmbox/engine/engine.h>
#include <wasmbox/runtime/cancel.h>
#include <wasmbox/runtime/module_cache.h>
#include <wasmbox/runtime/outcome.h>
#include <wasmbox/runtime/profile.h>
#include <wasmbox/runtime/sandbox_limits.h>

/**
 * @file supervisor.h
 * @brief Drives one payload from raw bytes to its terminal outcome.
 */

namespace wasmbox::runtime
{

/** @brief Per-request inputs that are not part of the payload. */
struct ExecutionOptions
{
    /** @brief Guest argv; conventionally `args[0]` is the program name. */
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    /** @brief Checked at every interrupt poll; may be null. Must outlive `execute`. */
    const CancelToken* cancel = nullptr;
    /** @brief Replaces `SandboxLimits::timeout_ms` for this run; zero disables the deadline. */
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief Compile, link, instantiate and run payloads under one profile and one set of limits.
 *
 * The supervisor owns the engine; per-request state lives only inside `execute`, so one instance
 * may serve concurrent calls from many threads. Every call builds its own store, linker,
 * capability set and output buffers.
 */
class Supervisor
{
  public:
    /** @brief `limits` and `cache` (when given) must outlive the supervisor. */
    Supervisor(const SandboxLimits& limits, Profile profile, ModuleCache* cache = nullptr);
    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    [[nodiscard]] Profile profile() const { return profile_; }
    [[nodiscard]] const SandboxLimits& limits() const { return limits_; }

    /**
     * @brief Run `payload` to exactly one terminal outcome.
     *
     * Never throws for anything the payload does; malformed input, traps and resource
     * exhaustion all become an `ExecutionOutcome`.
     */
    [[nodiscard]] ExecutionOutcome execute(const std::uint8_t* data, std::size_t size,
                                           const ExecutionOptions& options) const;
    [[nodiscard]] ExecutionOutcome execute(const std::vector<std::uint8_t>& payload,
                                           const ExecutionOptions& options) const;

  private:
    const SandboxLimits& limits_;
    Profile profile_;
    ModuleCache* cache_;
    std::unique_ptr<engine::Engine> engine_;
    /** @brief Shared by component runs; holds the reason when WASI 0.2 could not be defined. */
    std::optional<std::variant<engine::CommandLinker, std::string>> command_linker_;
};

} // namespace wasmbox::runtime
