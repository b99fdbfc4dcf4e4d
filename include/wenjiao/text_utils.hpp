/**
 * @file text_utils.hpp
 * @brief Character-boundary-safe operations over UTF-8 text
 *
 * Every cursor in the engine advances with next_char_len(), so any offset
 * derived from these helpers lands on a character boundary. Malformed
 * sequences are consumed one byte at a time.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wenjiao {

// ===========================================================================
// Low-level UTF-8
// ===========================================================================

/**
 * @brief Determines the UTF-8 sequence length from its first byte
 * @param first_byte First byte of a UTF-8 sequence
 * @return Length in bytes (1-4), or 0 for an invalid lead byte
 */
[[nodiscard]] constexpr std::size_t
utf8_char_len(unsigned char first_byte) noexcept {
  if ((first_byte & 0x80) == 0)
    return 1; // ASCII
  if ((first_byte & 0xE0) == 0xC0)
    return 2; // 110xxxxx
  if ((first_byte & 0xF0) == 0xE0)
    return 3; // 1110xxxx
  if ((first_byte & 0xF8) == 0xF0)
    return 4; // 11110xxx
  return 0;   // Invalid
}

/**
 * @brief Storage length of the character starting at @p pos
 *
 * Never returns 0 for pos < text.size(): invalid lead bytes, missing
 * continuation bytes and sequences cut by the end of the buffer count as a
 * single one-byte character.
 */
[[nodiscard]] std::size_t next_char_len(std::string_view text,
                                        std::size_t pos) noexcept;

/**
 * @brief Decodes the codepoint at @p pos
 * @return Codepoint, or U+FFFD for a malformed sequence
 */
[[nodiscard]] char32_t decode_char(std::string_view text,
                                   std::size_t pos) noexcept;

/// Number of characters (not bytes) in @p text
[[nodiscard]] std::size_t char_count(std::string_view text) noexcept;

/// Checks that @p text is well-formed UTF-8
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

// ===========================================================================
// Truncation and offsets
// ===========================================================================

/**
 * @brief Returns the longest prefix holding at most @p max_chars characters
 *
 * Stops scanning as soon as max_chars characters were consumed, so the cost
 * does not depend on the length of the remainder.
 */
[[nodiscard]] std::string_view truncate_safe(std::string_view text,
                                             std::size_t max_chars) noexcept;

/**
 * @brief Converts a byte offset into a character offset
 *
 * A byte offset inside a character is rounded down to that character.
 */
[[nodiscard]] std::size_t byte_to_char_offset(std::string_view text,
                                              std::size_t byte_pos) noexcept;

/// Converts a character offset into a byte offset (clamped to text.size())
[[nodiscard]] std::size_t char_to_byte_offset(std::string_view text,
                                              std::size_t char_pos) noexcept;

// ===========================================================================
// Lines and words
// ===========================================================================

/**
 * @brief Splits text into lines
 *
 * Splits on '\n', strips one trailing '\r' per line and does not produce an
 * empty line after a final newline. The views point into @p text.
 */
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

/// Lowercases ASCII letters, leaves every other byte unchanged
[[nodiscard]] std::string to_lower_ascii(std::string_view text);

/// Strips ASCII whitespace from both ends
[[nodiscard]] std::string_view trim(std::string_view sv) noexcept;

/// ASCII whitespace or one of the Unicode spaces used in CJK text
[[nodiscard]] bool is_space_char(char32_t cp) noexcept;

/// ASCII alphanumeric, or a non-ASCII codepoint outside punctuation blocks
[[nodiscard]] bool is_word_char(char32_t cp) noexcept;

/**
 * @brief Finds @p word in @p text as a whole word (byte offset)
 *
 * A match must not be preceded or followed by a word character. After a
 * rejected match the search resumes one character further.
 *
 * @param from Byte offset to start from (must be a character boundary)
 * @return Byte offset of the match or std::string_view::npos
 */
[[nodiscard]] std::size_t find_whole_word(std::string_view text,
                                          std::string_view word,
                                          std::size_t from = 0) noexcept;

/// Encodes a codepoint as UTF-8
[[nodiscard]] std::string encode_utf8(char32_t cp);

/**
 * @brief Checks whether a character is ASCII latin
 * @param c ASCII character
 */
[[nodiscard]] constexpr bool is_latin_char(char c) noexcept {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

} // namespace wenjiao
