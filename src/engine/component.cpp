#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <wasmbox/engine/component.h>
#include <wasmbox/runtime/output_buffer.h>
#include <wasmbox/support/debug.h>

namespace wasmbox::engine
{

namespace
{

constexpr int kMaxRunMinorVersion = 16;

std::ptrdiff_t capture_write(void* data, const unsigned char* buf, std::size_t len)
{
    auto* buffer = static_cast<runtime::OutputBuffer*>(data);
    // Bytes past capacity are dropped but still reported as written.
    (void)buffer->append(buf, len);
    return static_cast<std::ptrdiff_t>(len);
}

struct WasiConfigDeleter
{
    void operator()(wasi_config_t* config) const { wasi_config_delete(config); }
};

struct ExportIndexDeleter
{
    void operator()(wasmtime_component_export_index_t* index) const
    {
        wasmtime_component_export_index_delete(index);
    }
};

using ExportIndex = std::unique_ptr<wasmtime_component_export_index_t, ExportIndexDeleter>;

ExportIndex export_index(const wasmtime_component_instance_t& instance, wasmtime_context_t* context,
                         const wasmtime_component_export_index_t* parent, const std::string& name)
{
    return ExportIndex(wasmtime_component_instance_get_export_index(&instance, context, parent,
                                                                    name.data(), name.size()));
}

} // namespace

std::variant<Component, CompileError> Component::compile(Engine& engine, const std::uint8_t* data,
                                                         std::size_t size)
{
    if (size == 0)
    {
        return CompileError{"empty payload: expected a WebAssembly binary"};
    }
    switch (sniff(data, size))
    {
    case BinaryKind::CoreModule:
        return CompileError{"binary is a core WebAssembly module, not a component"};
    case BinaryKind::Unknown:
        if (size < 4 || data[0] != 0x00 || data[1] != 'a' || data[2] != 's' || data[3] != 'm')
        {
            return CompileError{"magic header not detected: expected `\\0asm`"};
        }
        break;
    case BinaryKind::Component:
        break;
    }

    wasmtime_component_t* component = nullptr;
    std::unique_ptr<wasmtime_error_t, ErrorDeleter> err(
        wasmtime_component_new(engine.handle().capi(), data, size, &component));
    if (err != nullptr)
    {
        return CompileError{error_message(err.get())};
    }
    support::debug_line("engine", "compiled component of " + std::to_string(size) + " bytes");
    return Component(component);
}

std::optional<std::string> attach_wasi(wasmtime::Store& store, const runtime::CapabilitySet& caps)
{
    if (std::holds_alternative<runtime::InheritedStdio>(caps.stdio))
    {
        return "inherited stdio is not permitted";
    }
    const auto& captured = std::get<runtime::CapturedStdio>(caps.stdio);
    if (captured.out == nullptr || captured.err == nullptr)
    {
        return "captured stdio requires both output buffers";
    }

    std::unique_ptr<wasi_config_t, WasiConfigDeleter> config(wasi_config_new());

    std::vector<const char*> argv;
    for (const std::string& arg : caps.args)
    {
        argv.push_back(arg.c_str());
    }
    if (!wasi_config_set_argv(config.get(), argv.size(), argv.data()))
    {
        return "arguments are not valid UTF-8";
    }

    std::vector<const char*> names;
    std::vector<const char*> values;
    for (const auto& [key, value] : caps.env)
    {
        names.push_back(key.c_str());
        values.push_back(value.c_str());
    }
    if (!wasi_config_set_env(config.get(), names.size(), names.data(), values.data()))
    {
        return "environment is not valid UTF-8";
    }

    wasi_config_set_stdout_custom(config.get(), capture_write, captured.out, nullptr);
    wasi_config_set_stderr_custom(config.get(), capture_write, captured.err, nullptr);

    // The store takes the configuration over, even on failure.
    std::unique_ptr<wasmtime_error_t, ErrorDeleter> err(
        wasmtime_context_set_wasi(store.context().capi(), config.release()));
    if (err != nullptr)
    {
        return error_message(err.get());
    }
    return std::nullopt;
}

std::variant<CommandLinker, std::string> CommandLinker::create(Engine& engine)
{
    CommandLinker linker(wasmtime_component_linker_new(engine.handle().capi()));
    std::unique_ptr<wasmtime_error_t, ErrorDeleter> err(
        wasmtime_component_linker_add_wasip2(linker.linker_.get()));
    if (err != nullptr)
    {
        return error_message(err.get());
    }
    return linker;
}

std::variant<Command, ComponentLinkError, runtime::EntryPointNotFound, CallError>
Command::instantiate(const CommandLinker& linker, const Component& component, wasmtime::Store& store)
{
    wasmtime_context_t* context = store.context().capi();
    wasmtime_component_instance_t instance;
    std::unique_ptr<wasmtime_error_t, ErrorDeleter> err(
        wasmtime_component_linker_instantiate(linker.capi(), context, component.capi(), &instance));
    if (err != nullptr)
    {
        CallError failure = from_error(err.get());
        if (failure.kind == CallError::Kind::Error)
        {
            return ComponentLinkError{std::move(failure.message)};
        }
        return failure;
    }

    for (int minor = 0; minor <= kMaxRunMinorVersion; ++minor)
    {
        const std::string name = "wasi:cli/run@0.2." + std::to_string(minor);
        const ExportIndex iface = export_index(instance, context, nullptr, name);
        if (iface == nullptr)
        {
            continue;
        }
        const ExportIndex run = export_index(instance, context, iface.get(), "run");
        wasmtime_component_func_t func;
        if (run == nullptr || !wasmtime_component_instance_get_func(&instance, context, run.get(), &func))
        {
            return runtime::EntryPointNotFound{"no entry point: `" + name +
                                               "` does not export a `run` function"};
        }
        return Command(func, name);
    }
    return runtime::EntryPointNotFound{
        "no entry point: expected an export `wasi:cli/run@0.2.x` with a `run` function"};
}

std::variant<std::int32_t, CallError> Command::run(wasmtime::Store& store) const
{
    wasmtime_context_t* context = store.context().capi();
    wasmtime_component_val_t result;
    std::unique_ptr<wasmtime_error_t, ErrorDeleter> err(
        wasmtime_component_func_call(&run_, context, nullptr, 0, &result, 1));
    if (err != nullptr)
    {
        return from_error(err.get());
    }

    std::int32_t exit_code = 0;
    if (result.kind == WASMTIME_COMPONENT_RESULT && !result.of.result.is_ok)
    {
        exit_code = 1;
    }
    wasmtime_component_val_delete(&result);

    std::unique_ptr<wasmtime_error_t, ErrorDeleter> post(
        wasmtime_component_func_post_return(&run_, context));
    if (post != nullptr)
    {
        return from_error(post.get());
    }
    return exit_code;
}

} // namespace wasmbox::engine
