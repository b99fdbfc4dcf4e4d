/**
 * @file language_classifier.hpp
 * @brief Coarse per-line script classification (Chinese vs Latin)
 *
 * Selects the tokenization strategy; not a language-identification model.
 */

#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

namespace wenjiao {

/// Dominant script of a line
enum class Script { Latin, Chinese };

/**
 * @brief Checks whether a codepoint is a CJK ideograph
 *
 * Unified Ideographs, Extension A and Compatibility Ideographs.
 */
[[nodiscard]] constexpr bool is_cjk_ideograph(char32_t cp) noexcept {
  return (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
         (cp >= 0xF900 && cp <= 0xFAFF);
}

/**
 * @brief Counts CJK ideographs and ASCII letters
 * @param text UTF-8 string
 * @return Pair (cjk, latin)
 */
[[nodiscard]] std::pair<std::size_t, std::size_t>
count_scripts(std::string_view text) noexcept;

/**
 * @brief Classifies a line by its dominant script
 * @return Script::Chinese if CJK ideographs outnumber ASCII letters,
 *         Script::Latin otherwise (ties included)
 */
[[nodiscard]] Script classify(std::string_view text) noexcept;

} // namespace wenjiao
