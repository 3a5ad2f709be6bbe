#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <wasmbox/engine/engine.h>
#include <wasmbox/engine/errors.h>
#include <wasmbox/runtime/capabilities.h>
#include <wasmbox/runtime/entry_point.h>
#include <wasmtime.hh>

/**
 * @file component.h
 * @brief WASI 0.2 command components on the engine's component model.
 */

namespace wasmbox::engine
{

/** @brief A compiled component; shares the engine's code and limits. */
class Component
{
  public:
    [[nodiscard]] static std::variant<Component, CompileError> compile(Engine& engine,
                                                                       const std::uint8_t* data,
                                                                       std::size_t size);

    [[nodiscard]] const wasmtime_component_t* capi() const { return component_.get(); }

  private:
    struct Deleter
    {
        void operator()(wasmtime_component_t* component) const { wasmtime_component_delete(component); }
    };

    explicit Component(wasmtime_component_t* component) : component_(component) {}

    std::unique_ptr<wasmtime_component_t, Deleter> component_;
};

/**
 * @brief Give `store` a WASI context built from `caps`.
 *
 * Only captured stdio is accepted: guest stdout and stderr are appended to the capability's
 * buffers. Stdin is empty and nothing from the host environment is inherited. The buffers must
 * outlive the store.
 */
[[nodiscard]] std::optional<std::string> attach_wasi(wasmtime::Store& store,
                                                     const runtime::CapabilitySet& caps);

/** @brief The component linker with every WASI 0.2 interface defined. */
class CommandLinker
{
  public:
    [[nodiscard]] static std::variant<CommandLinker, std::string> create(Engine& engine);

    [[nodiscard]] const wasmtime_component_linker_t* capi() const { return linker_.get(); }

  private:
    struct Deleter
    {
        void operator()(wasmtime_component_linker_t* linker) const
        {
            wasmtime_component_linker_delete(linker);
        }
    };

    explicit CommandLinker(wasmtime_component_linker_t* linker) : linker_(linker) {}

    std::unique_ptr<wasmtime_component_linker_t, Deleter> linker_;
};

/** @brief A failure to satisfy the component's imports. */
struct ComponentLinkError
{
    std::string message;
};

/** @brief An instantiated command with its `wasi:cli/run` `run` function resolved. */
class Command
{
  public:
    /**
     * @brief Instantiate `component` into `store` and look up `wasi:cli/run@0.2.x`.
     *
     * Any 0.2 minor version of the interface is accepted, lowest first.
     */
    [[nodiscard]] static std::variant<Command, ComponentLinkError, runtime::EntryPointNotFound, CallError>
    instantiate(const CommandLinker& linker, const Component& component, wasmtime::Store& store);

    /** @brief Call `run`; `result::ok` is exit code 0 and `result::err` is 1. */
    [[nodiscard]] std::variant<std::int32_t, CallError> run(wasmtime::Store& store) const;

    [[nodiscard]] const std::string& interface_name() const { return interface_name_; }

  private:
    Command(wasmtime_component_func_t run, std::string interface_name)
        : run_(run), interface_name_(std::move(interface_name))
    {
    }

    wasmtime_component_func_t run_;
    std::string interface_name_;
};

} // namespace wasmbox::engine
