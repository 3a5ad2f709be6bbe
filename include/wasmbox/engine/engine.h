#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <wasmbox/engine/errors.h>
#include <wasmbox/engine/linear_memory.h>
#include <wasmbox/runtime/cancel.h>
#include <wasmbox/runtime/entry_point.h>
#include <wasmbox/runtime/sandbox_limits.h>
#include <wasmtime.hh>

/**
 * @file engine.h
 * @brief The WebAssembly engine configured for sandboxed execution.
 */

namespace wasmbox::engine
{

struct CompileError
{
    std::string message;
};

enum class BinaryKind
{
    CoreModule,
    Component,
    /** @brief Not a WebAssembly binary at all. */
    Unknown,
};

/** @brief Classify a payload by its preamble (magic, version and layer). */
[[nodiscard]] BinaryKind sniff(const std::uint8_t* data, std::size_t size);

/** @brief Interval between epoch ticks; bounds how late a cancellation is noticed. */
constexpr std::chrono::milliseconds kEpochTick{5};

/**
 * @brief One engine per deployment: compiled code, its configuration and the epoch clock.
 *
 * Fuel metering and epoch interruption are always on; memories are allocated by
 * `LinearMemory` under the sandbox's reservation and ceiling. A background thread advances the
 * epoch every `kEpochTick` so that stores can notice cancellation while guest code runs.
 *
 * Safe to share between threads; every run creates its own `wasmtime::Store` from `handle()`.
 */
class Engine
{
  public:
    /** @brief `limits` must outlive the engine and everything compiled with it. */
    explicit Engine(const runtime::SandboxLimits& limits);
    ~Engine();
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]] wasmtime::Engine& handle() { return engine_; }
    [[nodiscard]] const runtime::SandboxLimits& limits() const { return limits_; }

    /** @brief Validate and compile a core module. */
    [[nodiscard]] std::variant<wasmtime::Module, CompileError> compile_module(const std::uint8_t* data,
                                                                              std::size_t size);

  private:
    const runtime::SandboxLimits& limits_;
    wasmtime::Engine engine_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::thread ticker_;

    void tick();
};

/** @brief Signature of an exported function in wasmbox's own value types. */
[[nodiscard]] runtime::Signature signature_of(const wasmtime::FuncType::Ref& type);

/** @brief Every function export of `module`, in declaration order. */
[[nodiscard]] std::vector<runtime::ExportedFunc> exported_funcs(const wasmtime::Module& module);

/** @brief Limits that end a run early; checked at every epoch tick. */
struct RunBudget
{
    const runtime::CancelToken* cancel = nullptr;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    const MemoryWatch* memory = nullptr;
};

/**
 * @brief The message a run must stop with, or nothing while it may continue.
 *
 * Cancellation is checked first, then the deadline, then the memory ceiling.
 */
[[nodiscard]] std::optional<std::string> interruption(const RunBudget& budget);

/**
 * @brief Prepare a fresh store for one run.
 *
 * Grants `granted_fuel(limits)`, applies the table and instance limits, and
 * interrupts guest code at the first epoch tick where `interruption(budget)` has an answer.
 * `budget` must outlive the store.
 */
[[nodiscard]] std::optional<std::string> prepare_store(wasmtime::Store& store, const RunBudget& budget,
                                                       const runtime::SandboxLimits& limits);

/** @brief Fuel every store starts with: the configured budget, or a practically endless one. */
[[nodiscard]] std::uint64_t granted_fuel(const runtime::SandboxLimits& limits);

/** @brief Fuel burnt so far by a store prepared with `prepare_store`. */
[[nodiscard]] std::uint64_t fuel_consumed(wasmtime::Store& store, const runtime::SandboxLimits& limits);

/**
 * @brief A module whose imports have all been resolved against a linker.
 *
 * Nothing runs until `instantiate`; link errors are therefore reported before the module's
 * start function could execute.
 */
class LinkedModule
{
  public:
    [[nodiscard]] static std::variant<LinkedModule, std::string> link(wasmtime::Linker& linker,
                                                                      const wasmtime::Module& module);

    /** @brief Create the instance, running the start function. */
    [[nodiscard]] std::variant<wasmtime::Instance, CallError> instantiate(wasmtime::Store& store) const;

  private:
    struct Deleter
    {
        void operator()(wasmtime_instance_pre_t* pre) const { wasmtime_instance_pre_delete(pre); }
    };

    explicit LinkedModule(wasmtime_instance_pre_t* pre) : pre_(pre) {}

    std::unique_ptr<wasmtime_instance_pre_t, Deleter> pre_;
};

} // namespace wasmbox::engine
