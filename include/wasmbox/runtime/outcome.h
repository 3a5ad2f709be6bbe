#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <wasmbox/runtime/entry_point.h>

/**
 * @file outcome.h
 * @brief Terminal result of one execution request.
 */

namespace wasmbox::runtime
{

/** @brief Captured guest output as it stood when the run ended. */
struct CapturedOutput
{
    std::string stdout_bytes;
    std::string stderr_bytes;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

/** @brief The entry returned normally (or the guest exited explicitly). */
struct Completed
{
    CapturedOutput output;
    std::int32_t exit_code = 0;
    EntryKind entry = EntryKind::LegacyStart;
    std::uint64_t fuel_consumed = 0;
};

/** @brief The guest faulted; whatever it wrote before the fault is kept. */
struct Trapped
{
    std::string message;
    CapturedOutput output;
    /** @brief Unset when the trap fired during instantiation, before an entry ran. */
    std::optional<EntryKind> entry;
    std::uint64_t fuel_consumed = 0;
};

enum class Stage
{
    Compilation,
    Linking,
    EntryResolution,
    Cancellation,
};

[[nodiscard]] std::string_view to_string(Stage stage);

/** @brief The request could not be carried out; `stage` says where it stopped. */
struct Failed
{
    Stage stage = Stage::Compilation;
    std::string message;
};

using ExecutionOutcome = std::variant<Completed, Trapped, Failed>;

} // namespace wasmbox::runtime
