#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <wasmbox/engine/component.h>
#include <wasmbox/engine/engine.h>
#include <wasmbox/engine/errors.h>
#include <wasmbox/engine/linear_memory.h>
#include <wasmbox/runtime/capabilities.h>
#include <wasmbox/runtime/entry_point.h>
#include <wasmbox/runtime/output_buffer.h>
#include <wasmbox/runtime/supervisor.h>
#include <wasmbox/runtime/wasi_preview1.h>
#include <wasmbox/support/debug.h>
#include <wasmtime.hh>

namespace wasmbox::runtime
{

namespace
{

using CommandLinkerSlot = std::variant<engine::CommandLinker, std::string>;

// Pipeline states. Each step consumes one state and yields the next; `Finished` is terminal.

struct Configured
{
};

struct ModuleCompiled
{
    wasmtime::Module module;
};

struct ComponentCompiled
{
    engine::Component component;
};

/** @brief Every import resolved and the entry chosen; no guest code has run yet. */
struct Linked
{
    engine::LinkedModule module;
    EntryCandidate entry;
};

struct Instantiated
{
    wasmtime::Instance instance;
    EntryCandidate entry;
};

struct Running
{
    wasmtime::Func entry;
    EntryKind kind = EntryKind::LegacyStart;
};

struct CommandInstantiated
{
    engine::Command command;
};

struct Finished
{
    ExecutionOutcome outcome;
};

using State = std::variant<Configured, ModuleCompiled, ComponentCompiled, Linked, Instantiated, Running,
                           CommandInstantiated, Finished>;

Finished failed(Stage stage, std::string message)
{
    support::debug_line("exec", "failed at " + std::string(to_string(stage)) + ": " + message);
    return Finished{Failed{.stage = stage, .message = std::move(message)}};
}

engine::RunBudget budget_for(const SandboxLimits& limits, const ExecutionOptions& options,
                             const engine::MemoryWatch& watch)
{
    engine::RunBudget budget{.cancel = options.cancel, .memory = &watch};
    if (options.timeout.has_value())
    {
        if (options.timeout->count() > 0)
        {
            budget.deadline = std::chrono::steady_clock::now() + *options.timeout;
        }
    }
    else if (limits.timeout_ms > 0)
    {
        budget.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(limits.timeout_ms);
    }
    return budget;
}

/**
 * @brief Everything one execution owns: capture buffers, capabilities, store and linker.
 *
 * Destroyed when `execute` returns, which releases every guest memory mapping.
 */
class Run
{
  public:
    Run(const SandboxLimits& limits, Profile profile, ModuleCache* cache, engine::Engine& engine,
        const CommandLinkerSlot* command_linker, const std::uint8_t* data, std::size_t size,
        const ExecutionOptions& options)
        : limits_(limits), profile_(profile), cache_(cache), engine_(engine),
          command_linker_(command_linker), data_(data), size_(size),
          out_(limits.output_capacity_bytes), err_(limits.output_capacity_bytes),
          budget_(budget_for(limits, options, watch_)), store_(engine.handle())
    {
        caps_.args = options.args;
        caps_.env = options.env;
        caps_.stdio = CapturedStdio{.out = &out_, .err = &err_};
    }

    Run(const Run&) = delete;
    Run& operator=(const Run&) = delete;

    ExecutionOutcome drive()
    {
        // Memories created on this thread report limit overruns to this run.
        const engine::MemoryWatchScope scope(watch_);
        State state = Configured{};
        while (!std::holds_alternative<Finished>(state))
        {
            state = std::visit([this](auto& current) -> State { return step(current); }, state);
        }
        return std::get<Finished>(std::move(state)).outcome;
    }

  private:
    const SandboxLimits& limits_;
    Profile profile_;
    ModuleCache* cache_;
    engine::Engine& engine_;
    const CommandLinkerSlot* command_linker_;
    const std::uint8_t* data_;
    std::size_t size_;
    OutputBuffer out_;
    OutputBuffer err_;
    CapabilitySet caps_;
    engine::MemoryWatch watch_;
    engine::RunBudget budget_;
    ExitRecord exit_;
    wasmtime::Store store_;
    std::optional<wasmtime::Linker> linker_;

    [[nodiscard]] CapturedOutput capture() const
    {
        return CapturedOutput{.stdout_bytes = out_.snapshot(),
                              .stderr_bytes = err_.snapshot(),
                              .stdout_truncated = out_.truncated(),
                              .stderr_truncated = err_.truncated()};
    }

    [[nodiscard]] std::uint64_t fuel() { return engine::fuel_consumed(store_, limits_); }

    Finished completed(std::int32_t exit_code, EntryKind kind)
    {
        // A memory overrun the guest survived still ends the run as a limit violation.
        if (watch_.limit_exceeded)
        {
            return failed(Stage::Cancellation, watch_.message);
        }
        support::debug_line("exec", "entry `" + std::string(to_string(kind)) + "` finished; exit code " +
                                        std::to_string(exit_code) + ", fuel " + std::to_string(fuel()));
        return Finished{Completed{
            .output = capture(), .exit_code = exit_code, .entry = kind, .fuel_consumed = fuel()}};
    }

    /**
     * @brief Classify a call that did not return normally.
     *
     * An exit request wins, then the run's own limits (cancellation, deadline, memory, fuel), and
     * only then the guest's fault. `entry` is empty while instantiating.
     */
    Finished classify(const engine::CallError& error, std::optional<EntryKind> entry, EntryKind kind)
    {
        if (exit_.code.has_value())
        {
            return completed(*exit_.code, kind);
        }
        if (error.kind == engine::CallError::Kind::Exit)
        {
            return completed(error.exit_status, kind);
        }
        if (auto reason = engine::interruption(budget_))
        {
            return failed(Stage::Cancellation, std::move(*reason));
        }
        if (error.out_of_fuel || (limits_.fuel > 0 && fuel() >= limits_.fuel))
        {
            return failed(Stage::Cancellation, "fuel exhausted");
        }
        if (error.kind == engine::CallError::Kind::Error && !entry.has_value())
        {
            return failed(Stage::Linking, error.message);
        }
        support::debug_line("exec", "trapped: " + error.message);
        return Finished{Trapped{
            .message = error.message, .output = capture(), .entry = entry, .fuel_consumed = fuel()}};
    }

    State step(Configured&)
    {
        if (profile_ == Profile::Component)
        {
            auto compiled = engine::Component::compile(engine_, data_, size_);
            if (auto* err = std::get_if<engine::CompileError>(&compiled))
            {
                return failed(Stage::Compilation, err->message);
            }
            return ComponentCompiled{std::get<engine::Component>(std::move(compiled))};
        }

        std::optional<wasmtime::Module> module;
        if (cache_ != nullptr)
        {
            module = cache_->find(engine_, data_, size_);
        }
        if (module.has_value())
        {
            support::debug_line("exec", "compiled module served from cache");
            return ModuleCompiled{std::move(*module)};
        }

        auto compiled = engine_.compile_module(data_, size_);
        if (auto* err = std::get_if<engine::CompileError>(&compiled))
        {
            return failed(Stage::Compilation, err->message);
        }
        auto& fresh = std::get<wasmtime::Module>(compiled);
        if (cache_ != nullptr)
        {
            cache_->insert(engine_, data_, size_, fresh);
        }
        return ModuleCompiled{std::move(fresh)};
    }

    State step(ModuleCompiled& compiled)
    {
        if (auto err = engine::prepare_store(store_, budget_, limits_))
        {
            return failed(Stage::Linking, std::move(*err));
        }
        linker_.emplace(engine_.handle());
        if (auto err = link_preview1(*linker_, caps_, exit_))
        {
            return failed(Stage::Linking, err->message);
        }
        auto linked = engine::LinkedModule::link(*linker_, compiled.module);
        if (auto* err = std::get_if<std::string>(&linked))
        {
            return failed(Stage::Linking, std::move(*err));
        }

        auto entry = resolve_module_entry(engine::exported_funcs(compiled.module));
        if (auto* missing = std::get_if<EntryPointNotFound>(&entry))
        {
            return failed(Stage::EntryResolution, missing->message);
        }
        return Linked{.module = std::get<engine::LinkedModule>(std::move(linked)),
                      .entry = std::get<EntryCandidate>(std::move(entry))};
    }

    State step(Linked& linked)
    {
        // Linking can be slow; do not start guest code for a request that is already gone.
        if (auto reason = engine::interruption(budget_))
        {
            return failed(Stage::Cancellation, std::move(*reason));
        }
        auto instance = linked.module.instantiate(store_);
        if (auto* err = std::get_if<engine::CallError>(&instance))
        {
            return classify(*err, std::nullopt, linked.entry.kind);
        }
        support::debug_line("exec", "instantiated; entry `" + linked.entry.name + "`");
        return Instantiated{.instance = std::get<wasmtime::Instance>(std::move(instance)),
                            .entry = std::move(linked.entry)};
    }

    State step(Instantiated& ready)
    {
        if (auto reason = engine::interruption(budget_))
        {
            return failed(Stage::Cancellation, std::move(*reason));
        }
        auto exported = ready.instance.get(store_.context(), ready.entry.name);
        const auto* func = exported.has_value() ? std::get_if<wasmtime::Func>(&*exported) : nullptr;
        if (func == nullptr)
        {
            return failed(Stage::EntryResolution, "entry `" + ready.entry.name + "` is not a function");
        }
        return Running{.entry = *func, .kind = ready.entry.kind};
    }

    State step(Running& running)
    {
        auto result = running.entry.call(store_.context(), std::vector<wasmtime::Val>{});
        if (!result)
        {
            return classify(engine::from_trap_error(result.err()), running.kind, running.kind);
        }
        std::int32_t exit_code = 0;
        if (running.kind == EntryKind::LegacyMain)
        {
            exit_code = result.ok().at(0).i32();
        }
        return completed(exit_code, running.kind);
    }

    State step(ComponentCompiled& compiled)
    {
        if (auto err = engine::prepare_store(store_, budget_, limits_))
        {
            return failed(Stage::Linking, std::move(*err));
        }
        if (auto err = engine::attach_wasi(store_, caps_))
        {
            return failed(Stage::Linking, std::move(*err));
        }
        if (const auto* reason = std::get_if<std::string>(command_linker_))
        {
            return failed(Stage::Linking, *reason);
        }
        if (auto reason = engine::interruption(budget_))
        {
            return failed(Stage::Cancellation, std::move(*reason));
        }

        auto command = engine::Command::instantiate(std::get<engine::CommandLinker>(*command_linker_),
                                                    compiled.component, store_);
        if (auto* err = std::get_if<engine::ComponentLinkError>(&command))
        {
            return failed(Stage::Linking, err->message);
        }
        if (auto* missing = std::get_if<EntryPointNotFound>(&command))
        {
            return failed(Stage::EntryResolution, missing->message);
        }
        if (auto* err = std::get_if<engine::CallError>(&command))
        {
            return classify(*err, std::nullopt, EntryKind::ComponentRun);
        }
        auto& ready = std::get<engine::Command>(command);
        support::debug_line("exec", "instantiated component; entry `" + ready.interface_name() + "`");
        return CommandInstantiated{std::move(ready)};
    }

    State step(CommandInstantiated& ready)
    {
        if (auto reason = engine::interruption(budget_))
        {
            return failed(Stage::Cancellation, std::move(*reason));
        }
        auto result = ready.command.run(store_);
        if (auto* err = std::get_if<engine::CallError>(&result))
        {
            return classify(*err, EntryKind::ComponentRun, EntryKind::ComponentRun);
        }
        return completed(std::get<std::int32_t>(result), EntryKind::ComponentRun);
    }

    State step(Finished& done) { return std::move(done); }
};

} // namespace

Supervisor::Supervisor(const SandboxLimits& limits, Profile profile, ModuleCache* cache)
    : limits_(limits), profile_(profile), cache_(cache), engine_(std::make_unique<engine::Engine>(limits))
{
    if (profile_ == Profile::Component)
    {
        command_linker_ = engine::CommandLinker::create(*engine_);
    }
}

ExecutionOutcome Supervisor::execute(const std::uint8_t* data, std::size_t size,
                                     const ExecutionOptions& options) const
{
    const CommandLinkerSlot* command_linker = command_linker_.has_value() ? &*command_linker_ : nullptr;
    Run run(limits_, profile_, cache_, *engine_, command_linker, data, size, options);
    return run.drive();
}

ExecutionOutcome Supervisor::execute(const std::vector<std::uint8_t>& payload,
                                     const ExecutionOptions& options) const
{
    return execute(payload.data(), payload.size(), options);
}

} // namespace wasmbox::runtime
