#pragma once

#include <string>
#include <string_view>

/**
 * @file utf8.h
 * @brief UTF-8 validation and lossy decoding for untrusted byte streams.
 */

namespace wasmbox::support
{

/** @brief True when `bytes` is well-formed UTF-8 (no overlongs, surrogates or values past U+10FFFF). */
[[nodiscard]] bool is_valid_utf8(std::string_view bytes);

/**
 * @brief Decode `bytes` as UTF-8, replacing every maximal ill-formed subsequence with U+FFFD.
 *
 * Never fails: the output is always well-formed UTF-8.
 */
[[nodiscard]] std::string decode_lossy(std::string_view bytes);

} // namespace wasmbox::support
