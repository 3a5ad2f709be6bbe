#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <wasmbox/engine/engine.h>
#include <wasmbox/support/debug.h>

namespace wasmbox::engine
{

namespace
{

constexpr std::uint64_t kUnmeteredFuel = std::numeric_limits<std::int64_t>::max();

wasmtime::Config make_config(const runtime::SandboxLimits& limits)
{
    wasmtime::Config config;
    config.consume_fuel(true);
    config.epoch_interruption(true);
    config.max_wasm_stack(limits.max_wasm_stack_bytes);
    wasmtime_config_memory_reservation_set(config.capi(), limits.initial_memory_reservation_bytes);
    wasmtime_config_memory_reservation_for_growth_set(config.capi(), limits.growth_reservation_bytes);
    wasmtime_config_memory_guard_size_set(config.capi(), limits.guard_size_bytes);
    wasmtime_config_memory_may_move_set(config.capi(), limits.allow_memory_relocation);
    install_memory_creator(config, limits);
    return config;
}

wasmtime_error_t* on_epoch(wasmtime_context_t*, void* data, std::uint64_t* delta,
                           wasmtime_update_deadline_kind_t* kind)
{
    const auto* budget = static_cast<const RunBudget*>(data);
    if (auto reason = interruption(*budget))
    {
        return wasmtime_error_new(reason->c_str());
    }
    *delta = 1;
    *kind = WASMTIME_UPDATE_DEADLINE_CONTINUE;
    return nullptr;
}

runtime::ValueType value_type(wasmtime::ValKind kind)
{
    switch (kind)
    {
    case wasmtime::ValKind::I32:
        return runtime::ValueType::I32;
    case wasmtime::ValKind::I64:
        return runtime::ValueType::I64;
    case wasmtime::ValKind::F32:
        return runtime::ValueType::F32;
    case wasmtime::ValKind::F64:
        return runtime::ValueType::F64;
    case wasmtime::ValKind::V128:
        return runtime::ValueType::V128;
    case wasmtime::ValKind::FuncRef:
        return runtime::ValueType::FuncRef;
    case wasmtime::ValKind::ExternRef:
        return runtime::ValueType::ExternRef;
    default:
        return runtime::ValueType::AnyRef;
    }
}

} // namespace

BinaryKind sniff(const std::uint8_t* data, std::size_t size)
{
    if (size < 8 || data[0] != 0x00 || data[1] != 'a' || data[2] != 's' || data[3] != 'm')
    {
        return BinaryKind::Unknown;
    }
    if (data[4] == 0x01 && data[5] == 0x00 && data[6] == 0x00 && data[7] == 0x00)
    {
        return BinaryKind::CoreModule;
    }
    // Components keep the magic but put layer 1 in the upper half of the version field.
    if (data[6] == 0x01 && data[7] == 0x00)
    {
        return BinaryKind::Component;
    }
    return BinaryKind::Unknown;
}

Engine::Engine(const runtime::SandboxLimits& limits)
    : limits_(limits), engine_(make_config(limits)), ticker_([this] { tick(); })
{
}

Engine::~Engine()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    ticker_.join();
}

void Engine::tick()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!wake_.wait_for(lock, kEpochTick, [this] { return stopping_; }))
    {
        engine_.increment_epoch();
    }
}

std::variant<wasmtime::Module, CompileError> Engine::compile_module(const std::uint8_t* data,
                                                                    std::size_t size)
{
    if (size == 0)
    {
        return CompileError{"empty payload: expected a WebAssembly binary"};
    }
    if (size < 4 || data[0] != 0x00 || data[1] != 'a' || data[2] != 's' || data[3] != 'm')
    {
        return CompileError{"magic header not detected: expected `\\0asm`"};
    }
    if (sniff(data, size) == BinaryKind::Component)
    {
        return CompileError{"binary is a WebAssembly component, not a core module"};
    }

    // The engine only reads the span.
    auto compiled = wasmtime::Module::compile(
        engine_, wasmtime::Span<std::uint8_t>(const_cast<std::uint8_t*>(data), size));
    if (!compiled)
    {
        return CompileError{flatten_message(compiled.err().message())};
    }
    support::debug_line("engine", "compiled module of " + std::to_string(size) + " bytes");
    return compiled.ok();
}

runtime::Signature signature_of(const wasmtime::FuncType::Ref& type)
{
    runtime::Signature sig;
    for (const auto& param : type.params())
    {
        sig.params.push_back(value_type(param.kind()));
    }
    for (const auto& result : type.results())
    {
        sig.results.push_back(value_type(result.kind()));
    }
    return sig;
}

std::vector<runtime::ExportedFunc> exported_funcs(const wasmtime::Module& module)
{
    std::vector<runtime::ExportedFunc> funcs;
    for (const auto& exp : module.exports())
    {
        const auto type = exp.type();
        if (const auto* func = std::get_if<wasmtime::FuncType::Ref>(&type))
        {
            funcs.push_back(
                runtime::ExportedFunc{.name = std::string(exp.name()), .signature = signature_of(*func)});
        }
    }
    return funcs;
}

std::optional<std::string> interruption(const RunBudget& budget)
{
    if (budget.cancel != nullptr && budget.cancel->cancelled())
    {
        return "execution cancelled: " + std::string(runtime::to_string(budget.cancel->reason()));
    }
    if (budget.deadline.has_value() && std::chrono::steady_clock::now() >= *budget.deadline)
    {
        return std::string("deadline exceeded");
    }
    if (budget.memory != nullptr && budget.memory->limit_exceeded)
    {
        return budget.memory->message;
    }
    return std::nullopt;
}

std::optional<std::string> prepare_store(wasmtime::Store& store, const RunBudget& budget,
                                         const runtime::SandboxLimits& limits)
{
    // Memory is capped by LinearMemory, which reports the overrun instead of failing silently.
    store.limiter(-1, static_cast<std::int64_t>(limits.max_table_elements), -1, -1, -1);
    auto fueled = store.context().set_fuel(granted_fuel(limits));
    if (!fueled)
    {
        return flatten_message(fueled.err().message());
    }
    store.context().set_epoch_deadline(1);
    wasmtime_store_epoch_deadline_callback(store.capi(), on_epoch, const_cast<RunBudget*>(&budget),
                                           nullptr);
    return std::nullopt;
}

std::uint64_t granted_fuel(const runtime::SandboxLimits& limits)
{
    return limits.fuel > 0 ? limits.fuel : kUnmeteredFuel;
}

std::uint64_t fuel_consumed(wasmtime::Store& store, const runtime::SandboxLimits& limits)
{
    auto left = store.context().get_fuel();
    if (!left)
    {
        return 0;
    }
    const std::uint64_t remaining = left.ok();
    const std::uint64_t granted = granted_fuel(limits);
    return remaining < granted ? granted - remaining : 0;
}

std::variant<LinkedModule, std::string> LinkedModule::link(wasmtime::Linker& linker,
                                                           const wasmtime::Module& module)
{
    wasmtime_instance_pre_t* pre = nullptr;
    std::unique_ptr<wasmtime_error_t, ErrorDeleter> err(
        wasmtime_linker_instantiate_pre(linker.capi(), module.capi(), &pre));
    if (err != nullptr)
    {
        return error_message(err.get());
    }
    return LinkedModule(pre);
}

std::variant<wasmtime::Instance, CallError> LinkedModule::instantiate(wasmtime::Store& store) const
{
    wasmtime_instance_t instance;
    wasm_trap_t* raw_trap = nullptr;
    std::unique_ptr<wasmtime_error_t, ErrorDeleter> err(
        wasmtime_instance_pre_instantiate(pre_.get(), store.context().capi(), &instance, &raw_trap));
    if (err != nullptr)
    {
        return from_error(err.get());
    }
    if (raw_trap != nullptr)
    {
        const std::unique_ptr<wasm_trap_t, TrapDeleter> trap(raw_trap);
        return from_trap(trap.get());
    }
    return wasmtime::Instance(instance);
}

} // namespace wasmbox::engine
