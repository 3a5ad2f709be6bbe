#pragma once

#include <string_view>

/**
 * @file debug.h
 * @brief Opt-in debug tracing on stderr, enabled by `WASMBOX_DEBUG`.
 */

namespace wasmbox::support
{

/** @brief True when `WASMBOX_DEBUG` is set to something other than `0`; read once. */
[[nodiscard]] bool debug_enabled();

/** @brief Write `[tag] message` to stderr as one line when debugging is enabled. */
void debug_line(std::string_view tag, std::string_view message);

} // namespace wasmbox::support
