/**
 * @file token_extractor.cpp
 * @brief Implementation of the per-script tokenizers
 */

#include "wenjiao/token_extractor.hpp"
#include "wenjiao/language_classifier.hpp"
#include "wenjiao/text_utils.hpp"

namespace wenjiao {

namespace {

/// Decoded character with its storage position
struct CharInfo {
  std::size_t byte = 0;
  std::size_t len = 0;
  char32_t cp = 0;
};

std::vector<CharInfo> decode_line(std::string_view line) {
  std::vector<CharInfo> chars;
  chars.reserve(line.size());
  std::size_t i = 0;
  while (i < line.size()) {
    const auto len = next_char_len(line, i);
    chars.push_back({i, len, decode_char(line, i)});
    i += len;
  }
  return chars;
}

bool is_token_char(char32_t cp) noexcept {
  return is_word_char(cp) || cp == U'\'' || cp == U'-';
}

/// Ideographs split words even without surrounding whitespace
bool is_separator(char32_t cp) noexcept {
  return is_space_char(cp) || is_cjk_ideograph(cp);
}

bool is_run_char(char32_t cp) noexcept {
  return (cp < 0x80 && is_latin_char(static_cast<char>(cp))) || cp == U'\'' ||
         cp == U'-';
}

bool all_digits(const std::vector<CharInfo> &chars, std::size_t first,
                std::size_t last) noexcept {
  for (std::size_t k = first; k < last; ++k) {
    if (chars[k].cp < U'0' || chars[k].cp > U'9') {
      return false;
    }
  }
  return true;
}

/// Applies the length/digit filters to chars [first, last) and emits a token
void emit_token(std::string_view line, const std::vector<CharInfo> &chars,
                std::size_t first, std::size_t last, std::vector<Token> &out) {
  if (last <= first || last - first < kMinTokenChars) {
    return;
  }
  if (all_digits(chars, first, last)) {
    return;
  }

  Token token;
  token.start = first;
  token.end = last;
  token.byte_start = chars[first].byte;
  token.byte_end = chars[last - 1].byte + chars[last - 1].len;
  token.text =
      std::string{line.substr(token.byte_start, token.byte_end - token.byte_start)};
  out.push_back(std::move(token));
}

std::vector<Token> extract_latin(std::string_view line,
                                 const std::vector<CharInfo> &chars) {
  std::vector<Token> tokens;

  std::size_t k = 0;
  while (k < chars.size()) {
    while (k < chars.size() && is_separator(chars[k].cp)) {
      ++k;
    }
    std::size_t seg_start = k;
    while (k < chars.size() && !is_separator(chars[k].cp)) {
      ++k;
    }
    std::size_t seg_end = k;

    // Trim edge punctuation, keeping apostrophes and hyphens
    while (seg_start < seg_end && !is_token_char(chars[seg_start].cp)) {
      ++seg_start;
    }
    while (seg_end > seg_start && !is_token_char(chars[seg_end - 1].cp)) {
      --seg_end;
    }

    emit_token(line, chars, seg_start, seg_end, tokens);
  }

  return tokens;
}

std::vector<Token> extract_chinese(std::string_view line,
                                   const std::vector<CharInfo> &chars) {
  std::vector<Token> tokens;

  std::size_t run_start = 0;
  bool in_run = false;

  for (std::size_t k = 0; k < chars.size(); ++k) {
    if (is_run_char(chars[k].cp)) {
      if (!in_run) {
        run_start = k;
        in_run = true;
      }
      continue;
    }
    if (in_run) {
      emit_token(line, chars, run_start, k, tokens);
      in_run = false;
    }
  }
  if (in_run) {
    emit_token(line, chars, run_start, chars.size(), tokens);
  }

  return tokens;
}

} // namespace

std::vector<Token> extract_tokens(std::string_view line, Script script) {
  const auto chars = decode_line(line);
  if (script == Script::Chinese) {
    return extract_chinese(line, chars);
  }
  return extract_latin(line, chars);
}

std::vector<Token> extract_tokens(std::string_view line) {
  return extract_tokens(line, classify(line));
}

} // namespace wenjiao
