#pragma once

#include <string>
#include <wasmbox/runtime/outcome.h>

/**
 * @file report.h
 * @brief Plain-text rendering of an execution outcome.
 */

namespace wasmbox::runtime
{

/**
 * @brief Deterministic, human-readable report for `outcome`.
 *
 * Completed and trapped runs show a short header followed by the captured stdout; stderr gets its
 * own delimited section only when non-empty. Guest bytes are decoded as lossy UTF-8. A failed
 * run renders as a single `WASM error: <stage>: <message>` line.
 */
[[nodiscard]] std::string render_report(const ExecutionOutcome& outcome);

/** @brief The `WASM error: <stage>: <message>` line for a failure. */
[[nodiscard]] std::string render_failure(const Failed& failed);

} // namespace wasmbox::runtime
