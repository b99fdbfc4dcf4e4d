/**
 * @file text_utils.cpp
 * @brief Implementation of the boundary-safe UTF-8 helpers
 */

#include "wenjiao/text_utils.hpp"

#include <cctype>

namespace wenjiao {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

constexpr bool is_continuation(unsigned char b) noexcept {
  return (b & 0xC0) == 0x80;
}

} // namespace

std::size_t next_char_len(std::string_view text, std::size_t pos) noexcept {
  if (pos >= text.size()) {
    return 0;
  }

  auto len = utf8_char_len(static_cast<unsigned char>(text[pos]));
  if (len <= 1 || pos + len > text.size()) {
    return 1;
  }

  for (std::size_t k = 1; k < len; ++k) {
    if (!is_continuation(static_cast<unsigned char>(text[pos + k]))) {
      return 1;
    }
  }
  return len;
}

char32_t decode_char(std::string_view text, std::size_t pos) noexcept {
  if (pos >= text.size()) {
    return kReplacementChar;
  }

  const auto b0 = static_cast<unsigned char>(text[pos]);
  const auto len = next_char_len(text, pos);

  if (len == 1) {
    return (b0 & 0x80) == 0 ? static_cast<char32_t>(b0) : kReplacementChar;
  }

  char32_t cp = 0;
  switch (len) {
  case 2:
    cp = b0 & 0x1F;
    break;
  case 3:
    cp = b0 & 0x0F;
    break;
  default:
    cp = b0 & 0x07;
    break;
  }
  for (std::size_t k = 1; k < len; ++k) {
    cp = (cp << 6) | (static_cast<unsigned char>(text[pos + k]) & 0x3F);
  }
  return cp;
}

std::size_t char_count(std::string_view text) noexcept {
  std::size_t count = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    i += next_char_len(text, i);
    ++count;
  }
  return count;
}

bool is_valid_utf8(std::string_view text) noexcept {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto b0 = static_cast<unsigned char>(text[i]);
    const auto len = next_char_len(text, i);
    if (len == 1 && (b0 & 0x80) != 0) {
      return false;
    }
    if (len > 1) {
      const char32_t cp = decode_char(text, i);
      // Overlong forms, surrogates and out-of-range values
      if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
          (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) ||
          (cp >= 0xD800 && cp <= 0xDFFF)) {
        return false;
      }
    }
    i += len;
  }
  return true;
}

std::string_view truncate_safe(std::string_view text,
                               std::size_t max_chars) noexcept {
  std::size_t i = 0;
  std::size_t consumed = 0;
  while (i < text.size() && consumed < max_chars) {
    i += next_char_len(text, i);
    ++consumed;
  }
  return text.substr(0, i);
}

std::size_t byte_to_char_offset(std::string_view text,
                                std::size_t byte_pos) noexcept {
  std::size_t chars = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    const auto len = next_char_len(text, i);
    if (i + len > byte_pos) {
      break;
    }
    i += len;
    ++chars;
  }
  return chars;
}

std::size_t char_to_byte_offset(std::string_view text,
                                std::size_t char_pos) noexcept {
  return truncate_safe(text, char_pos).size();
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;

  std::size_t start = 0;
  while (start < text.size()) {
    auto nl = text.find('\n', start);
    std::size_t end = (nl == std::string_view::npos) ? text.size() : nl;

    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);

    if (nl == std::string_view::npos) {
      break;
    }
    start = nl + 1;
  }

  return lines;
}

std::string to_lower_ascii(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

std::string_view trim(std::string_view sv) noexcept {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

bool is_space_char(char32_t cp) noexcept {
  return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' ||
         cp == U'\v' || cp == U'\f' || cp == 0x00A0 || cp == 0x3000 ||
         (cp >= 0x2000 && cp <= 0x200B);
}

bool is_word_char(char32_t cp) noexcept {
  if (cp < 0x80) {
    return std::isalnum(static_cast<unsigned char>(cp)) != 0;
  }
  if (cp == 0xFFFD || is_space_char(cp)) {
    return false;
  }
  // Latin-1 punctuation and symbols
  if (cp >= 0x00A1 && cp <= 0x00BF) {
    return false;
  }
  // General punctuation
  if (cp >= 0x2000 && cp <= 0x206F) {
    return false;
  }
  // CJK symbols and punctuation
  if (cp >= 0x3000 && cp <= 0x303F) {
    return false;
  }
  // CJK compatibility forms, small form variants
  if (cp >= 0xFE30 && cp <= 0xFE6F) {
    return false;
  }
  // Fullwidth ASCII punctuation
  if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
      (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65)) {
    return false;
  }
  return true;
}

std::size_t find_whole_word(std::string_view text, std::string_view word,
                            std::size_t from) noexcept {
  if (word.empty()) {
    return std::string_view::npos;
  }

  std::size_t pos = from;
  while (pos <= text.size()) {
    auto found = text.find(word, pos);
    if (found == std::string_view::npos) {
      return std::string_view::npos;
    }

    bool start_ok = true;
    if (found > 0) {
      // Step back to the start of the preceding character
      std::size_t prev = found - 1;
      while (prev > 0 &&
             (static_cast<unsigned char>(text[prev]) & 0xC0) == 0x80) {
        --prev;
      }
      start_ok = !is_word_char(decode_char(text, prev));
    }

    const std::size_t after = found + word.size();
    const bool end_ok =
        after >= text.size() || !is_word_char(decode_char(text, after));

    if (start_ok && end_ok) {
      return found;
    }

    pos = found + next_char_len(text, found);
  }
  return std::string_view::npos;
}

std::string encode_utf8(char32_t cp) {
  std::string out;
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  return out;
}

} // namespace wenjiao
