#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <wasmbox/runtime/capabilities.h>
#include <wasmtime.hh>

/**
 * @file wasi_preview1.h
 * @brief The `wasi_snapshot_preview1` host module for the Module profile.
 */

namespace wasmbox::runtime
{

constexpr const char* kPreview1Module = "wasi_snapshot_preview1";

/** @brief WASI preview1 errno values returned by the host functions. */
namespace wasi_errno
{
constexpr std::int32_t kSuccess = 0;
constexpr std::int32_t kBadf = 8;
constexpr std::int32_t kFault = 21;
constexpr std::int32_t kInval = 28;
constexpr std::int32_t kNotsup = 58;
constexpr std::int32_t kOverflow = 61;
constexpr std::int32_t kSpipe = 70;
constexpr std::int32_t kNotcapable = 76;
} // namespace wasi_errno

struct LinkError
{
    std::string message;
};

/** @brief Set by `proc_exit`; the trap that unwinds the guest afterwards is not a fault. */
struct ExitRecord
{
    std::optional<std::int32_t> code;
};

/**
 * @brief Define every preview1 function in `linker`, backed by `caps`.
 *
 * Stdio, arguments, environment, clocks and randomness are implemented; filesystem and socket
 * functions are present with their exact signatures but only return an error. `caps`, the
 * buffers it points to and `exit` must outlive every store the linker instantiates into.
 *
 * Fails when `caps` asks for inherited stdio, or when captured stdio has no buffers.
 */
[[nodiscard]] std::optional<LinkError> link_preview1(wasmtime::Linker& linker, const CapabilitySet& caps,
                                                     ExitRecord& exit);

} // namespace wasmbox::runtime
