#pragma once

#include <optional>
#include <string_view>

/**
 * @file profile.h
 * @brief Binary format / ABI profile accepted by a deployment.
 */

namespace wasmbox::runtime
{

enum class Profile
{
    /** @brief Core module with the flat `wasi_snapshot_preview1` ABI. */
    Module,
    /** @brief Component binary exporting the WASI 0.2 `wasi:cli/run` interface. */
    Component,
};

[[nodiscard]] std::string_view to_string(Profile profile);
[[nodiscard]] std::optional<Profile> parse_profile(std::string_view text);

} // namespace wasmbox::runtime
