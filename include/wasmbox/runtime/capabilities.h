#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>
#include <wasmbox/runtime/output_buffer.h>

/**
 * @file capabilities.h
 * @brief Per-run capabilities granted to a guest.
 */

namespace wasmbox::runtime
{

/** @brief Guest stdout/stderr go to in-memory buffers owned by the run. */
struct CapturedStdio
{
    OutputBuffer* out = nullptr;
    OutputBuffer* err = nullptr;
};

/**
 * @brief Guest stdio bound to the host process.
 *
 * Representable so that callers can ask for it, but every adapter refuses it.
 */
struct InheritedStdio
{
};

using StdioBinding = std::variant<CapturedStdio, InheritedStdio>;

/**
 * @brief Explicit, opt-in grants for one run.
 *
 * Nothing beyond these is reachable by the guest: no filesystem, no sockets.
 */
struct CapabilitySet
{
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    StdioBinding stdio = CapturedStdio{};
};

} // namespace wasmbox::runtime
