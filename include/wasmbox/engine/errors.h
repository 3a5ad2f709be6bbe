#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <wasmtime.hh>

/**
 * @file errors.h
 * @brief Engine errors and traps translated into wasmbox's wording.
 */

namespace wasmbox::engine
{

/** @brief How a call into guest code ended when it did not return normally. */
struct CallError
{
    enum class Kind
    {
        /** @brief Guest code faulted, or a host function trapped on its behalf. */
        Trap,
        /** @brief The guest asked the process to exit with `exit_status`. */
        Exit,
        /** @brief Anything else the engine reported: link errors, interrupts, host failures. */
        Error,
    };

    Kind kind = Kind::Error;
    std::string message;
    std::int32_t exit_status = 0;
    /** @brief Set when the engine stopped the guest for running out of fuel. */
    bool out_of_fuel = false;
};

/**
 * @brief Collapse the engine's multi-line error rendering onto one line.
 *
 * The headline and every "Caused by" entry are kept, joined with ": "; wasm backtraces and
 * native stack backtraces are dropped.
 */
[[nodiscard]] std::string flatten_message(std::string_view rendered);

/** @brief Conventional wording for engine trap text such as "wasm `unreachable` instruction executed". */
[[nodiscard]] std::string trap_wording(std::string_view engine_text);

[[nodiscard]] std::string error_message(const wasmtime_error_t* error);

[[nodiscard]] CallError from_trap(const wasm_trap_t* trap);
[[nodiscard]] CallError from_error(const wasmtime_error_t* error);
[[nodiscard]] CallError from_trap_error(const wasmtime::TrapError& error);

/** @brief Owns a raw `wasmtime_error_t` returned by the C API. */
struct ErrorDeleter
{
    void operator()(wasmtime_error_t* error) const { wasmtime_error_delete(error); }
};

struct TrapDeleter
{
    void operator()(wasm_trap_t* trap) const { wasm_trap_delete(trap); }
};

} // namespace wasmbox::engine
