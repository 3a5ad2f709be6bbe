#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file entry_point.h
 * @brief Selection of the function a run starts in.
 */

namespace wasmbox::runtime
{

enum class EntryKind
{
    /** @brief `_start: [] -> []`, the WASI command convention. */
    LegacyStart,
    /** @brief `main: [] -> [i32]`; the result is the exit code. */
    LegacyMain,
    /** @brief `run` of the `wasi:cli/run` interface of a component. */
    ComponentRun,
};

[[nodiscard]] std::string_view to_string(EntryKind kind);

enum class ValueType
{
    I32,
    I64,
    F32,
    F64,
    V128,
    FuncRef,
    ExternRef,
    AnyRef,
};

[[nodiscard]] std::string_view to_string(ValueType type);

/** @brief Core function type, e.g. `[i32 i32] -> [i32]`. */
struct Signature
{
    std::vector<ValueType> params;
    std::vector<ValueType> results;

    bool operator==(const Signature&) const = default;
};

[[nodiscard]] std::string to_string(const Signature& signature);

/** @brief A function export as the compiled module declares it. */
struct ExportedFunc
{
    std::string name;
    Signature signature;
};

/** @brief One export name/signature pair an entry may have. */
struct EntryCandidate
{
    std::string name;
    Signature signature;
    EntryKind kind = EntryKind::LegacyStart;
};

/** @brief Module profile candidates in priority order. */
[[nodiscard]] const std::vector<EntryCandidate>& module_entry_candidates();

struct EntryPointNotFound
{
    std::string message;
};

/**
 * @brief First candidate among `exports` whose signature is exactly the candidate's type.
 *
 * A candidate exported with another signature is skipped rather than rejected.
 */
[[nodiscard]] std::variant<EntryCandidate, EntryPointNotFound>
resolve_module_entry(const std::vector<ExportedFunc>& exports);

} // namespace wasmbox::runtime
