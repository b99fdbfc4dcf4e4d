/**
 * @file language_classifier.cpp
 * @brief Script counting over UTF-8 text
 */

#include "wenjiao/language_classifier.hpp"
#include "wenjiao/text_utils.hpp"

namespace wenjiao {

std::pair<std::size_t, std::size_t>
count_scripts(std::string_view text) noexcept {
  std::size_t cjk = 0;
  std::size_t latin = 0;

  std::size_t i = 0;
  while (i < text.size()) {
    const auto len = next_char_len(text, i);
    if (len == 1) {
      if (is_latin_char(text[i])) {
        ++latin;
      }
    } else if (is_cjk_ideograph(decode_char(text, i))) {
      ++cjk;
    }
    i += len;
  }

  return {cjk, latin};
}

Script classify(std::string_view text) noexcept {
  auto [cjk, latin] = count_scripts(text);
  return cjk > latin ? Script::Chinese : Script::Latin;
}

} // namespace wenjiao
