/**
 * @file utf8.hpp
 * @brief Permissive UTF-8 decoding of captured program output.
 */

#pragma once

#include <string>
#include <string_view>

namespace runbox {

/**
 * @brief Return `raw` as valid UTF-8.
 *
 * Each maximal ill-formed subsequence (overlong forms, surrogates, code points
 * above U+10FFFF, stray or missing continuation bytes) becomes one U+FFFD.
 * Never fails.
 */
[[nodiscard]] std::string decode_utf8_lossy(std::string_view raw);

/// True when `raw` is already well-formed UTF-8.
[[nodiscard]] bool is_valid_utf8(std::string_view raw) noexcept;

}  // namespace runbox
