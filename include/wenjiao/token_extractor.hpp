/**
 * @file token_extractor.hpp
 * @brief Candidate word extraction for dictionary and typo checks
 *
 * Latin lines are split on whitespace. Chinese lines are scanned for
 * embedded runs of ASCII letters; CJK characters never become tokens.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "wenjiao/language_classifier.hpp"

namespace wenjiao {

/// Candidate word with its position in the line
struct Token {
  std::string text;
  std::size_t start = 0;      ///< Character offset
  std::size_t end = 0;        ///< Character offset, one past the end
  std::size_t byte_start = 0; ///< Byte offset into the line
  std::size_t byte_end = 0;

  bool operator==(const Token &) const = default;
};

/// Minimum token length (characters); shorter candidates are dropped
inline constexpr std::size_t kMinTokenChars = 3;

/**
 * @brief Extracts the ordered candidate tokens of a line
 * @param line UTF-8 line without the line terminator
 * @param script Result of classify() for the line
 * @return Tokens in line order
 */
[[nodiscard]] std::vector<Token> extract_tokens(std::string_view line,
                                                Script script);

/// Convenience overload that classifies the line first
[[nodiscard]] std::vector<Token> extract_tokens(std::string_view line);

} // namespace wenjiao
