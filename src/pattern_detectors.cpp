/**
 * @file pattern_detectors.cpp
 * @brief Line-based detectors: headings, repeats, sentences, phrases, articles
 */

#include "wenjiao/detectors.hpp"
#include "wenjiao/text_utils.hpp"

#include <utility>

namespace wenjiao {

namespace {

// ===========================================================================
// Character classes
// ===========================================================================

constexpr bool is_terminator(char32_t cp) noexcept {
  switch (cp) {
  case U'.':
  case U'。':
  case U'!':
  case U'！':
  case U'?':
  case U'？':
  case U';':
  case U'；':
    return true;
  default:
    return false;
  }
}

constexpr bool is_run_punct(char32_t cp) noexcept {
  switch (cp) {
  case U'，':
  case U'。':
  case U'！':
  case U'？':
  case U'；':
  case U'：':
  case U'、':
  case U',':
  case U'.':
  case U'!':
  case U'?':
  case U';':
  case U':':
    return true;
  default:
    return false;
  }
}

constexpr bool is_ascii_digit(char32_t cp) noexcept {
  return cp >= U'0' && cp <= U'9';
}

constexpr bool is_ascii_upper(char c) noexcept { return c >= 'A' && c <= 'Z'; }

constexpr bool is_cn_numeral(char32_t cp) noexcept {
  constexpr std::u32string_view kNumerals = U"一二三四五六七八九十百零";
  return kNumerals.find(cp) != std::u32string_view::npos;
}

// ===========================================================================
// Whitespace-delimited words
// ===========================================================================

struct WordSpan {
  std::size_t byte_start = 0;
  std::size_t byte_end = 0;
  std::size_t core_start = 0; ///< Without leading/trailing punctuation
  std::size_t core_end = 0;
};

std::vector<WordSpan> split_words(std::string_view text) {
  std::vector<WordSpan> words;
  std::size_t pos = 0;

  while (pos < text.size()) {
    while (pos < text.size() && is_space_char(decode_char(text, pos))) {
      pos += next_char_len(text, pos);
    }
    if (pos >= text.size()) {
      break;
    }

    WordSpan w;
    w.byte_start = pos;
    w.core_start = pos;
    w.core_end = pos;
    bool core_open = false;

    while (pos < text.size()) {
      const char32_t cp = decode_char(text, pos);
      if (is_space_char(cp)) {
        break;
      }
      const std::size_t len = next_char_len(text, pos);
      if (is_word_char(cp) || (core_open && (cp == U'\'' || cp == U'-'))) {
        if (!core_open) {
          w.core_start = pos;
          core_open = true;
        }
        if (is_word_char(cp)) {
          w.core_end = pos + len;
        }
      }
      pos += len;
    }

    w.byte_end = pos;
    if (!core_open) {
      w.core_start = w.core_end = w.byte_end;
    }
    words.push_back(w);
  }

  return words;
}

std::string_view core_of(std::string_view text, const WordSpan &w) {
  return text.substr(w.core_start, w.core_end - w.core_start);
}

bool has_letter(std::string_view word) {
  std::size_t pos = 0;
  while (pos < word.size()) {
    const char32_t cp = decode_char(word, pos);
    if (is_word_char(cp) && !is_ascii_digit(cp)) {
      return true;
    }
    pos += next_char_len(word, pos);
  }
  return false;
}

// ===========================================================================
// Heading heuristics
// ===========================================================================

/// "1.", "1.2", "3 " or "2、" followed by text
bool starts_with_arabic_number(std::string_view t) {
  std::size_t i = 0;
  while (i < t.size() && is_ascii_digit(static_cast<unsigned char>(t[i]))) {
    ++i;
  }
  if (i == 0 || i > 3) {
    return false;
  }
  // Sub-section numbers: 1.2.3
  while (i + 1 < t.size() && t[i] == '.' &&
         is_ascii_digit(static_cast<unsigned char>(t[i + 1]))) {
    ++i;
    while (i < t.size() && is_ascii_digit(static_cast<unsigned char>(t[i]))) {
      ++i;
    }
  }
  if (i >= t.size()) {
    return false;
  }
  std::string_view rest = t.substr(i);
  return rest.starts_with(". ") || rest.starts_with(" ") ||
         rest.starts_with("、") || (rest.starts_with(".") && rest.size() > 1);
}

bool starts_with_chinese_marker(std::string_view t) {
  // 第一章 / 第3节 / 第二部分
  if (t.starts_with("第")) {
    std::size_t pos = std::string_view{"第"}.size();
    for (int n = 0; n < 4 && pos < t.size(); ++n) {
      std::string_view rest = t.substr(pos);
      if (rest.starts_with("章") || rest.starts_with("节") ||
          rest.starts_with("部分")) {
        return n > 0;
      }
      pos += next_char_len(t, pos);
    }
    return false;
  }

  // 一、 / 十二、
  std::size_t pos = 0;
  while (pos < t.size() && is_cn_numeral(decode_char(t, pos))) {
    pos += next_char_len(t, pos);
  }
  if (pos > 0 && t.substr(pos).starts_with("、")) {
    return true;
  }

  // （一） / (1)
  for (std::string_view open : {std::string_view{"（"}, std::string_view{"("}}) {
    if (!t.starts_with(open)) {
      continue;
    }
    pos = open.size();
    std::size_t inner = 0;
    while (pos < t.size()) {
      const char32_t cp = decode_char(t, pos);
      if (!is_cn_numeral(cp) && !is_ascii_digit(cp)) {
        break;
      }
      pos += next_char_len(t, pos);
      ++inner;
    }
    std::string_view rest = t.substr(pos);
    if (inner > 0 && (rest.starts_with("）") || rest.starts_with(")"))) {
      return true;
    }
  }

  return false;
}

bool is_section_keyword(std::string_view t) {
  constexpr std::string_view kChinese[] = {"摘要", "引言", "绪论", "结论",
                                           "参考文献", "致谢", "附录"};
  for (std::string_view kw : kChinese) {
    if (t.starts_with(kw) && char_count(t) <= 10) {
      return true;
    }
  }

  // Latin keywords must stand alone ("Abstract", "References:")
  std::string lower = to_lower_ascii(t);
  while (!lower.empty() && (lower.back() == ':' || lower.back() == '.' ||
                            lower.back() == ' ')) {
    lower.pop_back();
  }
  constexpr std::string_view kLatin[] = {
      "abstract",   "introduction", "conclusion",      "conclusions",
      "references", "bibliography", "acknowledgements", "acknowledgments",
      "appendix",   "methods",      "results",         "discussion",
  };
  for (std::string_view kw : kLatin) {
    if (lower == kw) {
      return true;
    }
  }
  return false;
}

/// "Deep Learning for Graph Data": every long word capitalized
bool is_capitalized_latin(std::string_view t) {
  auto [cjk, latin] = count_scripts(t);
  if (latin == 0 || cjk >= latin) {
    return false;
  }

  std::size_t words = 0;
  for (const auto &w : split_words(t)) {
    std::string_view core = core_of(t, w);
    if (core.empty() || !is_latin_char(core.front())) {
      continue;
    }
    ++words;
    if (words == 1 && !is_ascii_upper(core.front())) {
      return false;
    }
    // Short function words may stay lowercase
    if (core.size() > 3 && !is_ascii_upper(core.front())) {
      return false;
    }
  }
  return words >= 2;
}

/// Sentence punctuation anywhere but at the very end
bool has_inner_punctuation(std::string_view t) {
  std::size_t pos = 0;
  while (pos < t.size()) {
    const std::size_t len = next_char_len(t, pos);
    const bool last = pos + len >= t.size();
    const char32_t cp = decode_char(t, pos);
    if (!last && (cp == U'，' || cp == U',' || cp == U'；' || cp == U';' ||
                  cp == U'。' || cp == U'！' || cp == U'？' || cp == U'!' ||
                  cp == U'?')) {
      return true;
    }
    pos += len;
  }
  return false;
}

/// Byte offset of the last character of @p t
std::size_t last_char_pos(std::string_view t) {
  std::size_t pos = 0;
  std::size_t last = 0;
  while (pos < t.size()) {
    last = pos;
    pos += next_char_len(t, pos);
  }
  return last;
}

} // namespace

// ===========================================================================
// Shared helpers
// ===========================================================================

Issue make_issue(const LineView &line, std::size_t byte_start,
                 std::size_t byte_end, std::string_view type,
                 std::string message, std::string suggestion) {
  Issue issue;
  issue.line_number = line.line_number;
  issue.start = byte_to_char_offset(line.text, byte_start);
  issue.end = byte_to_char_offset(line.text, byte_end);
  issue.issue_type = std::string{type};
  issue.message = std::move(message);
  issue.suggestion = std::move(suggestion);
  return issue;
}

std::size_t find_pattern(std::string_view line, std::string_view lower_line,
                         const PhraseRule &rule) {
  if (rule.pattern.empty()) {
    return std::string_view::npos;
  }
  if (rule.latin) {
    return find_whole_word(lower_line, rule.pattern);
  }
  return line.find(rule.pattern);
}

bool is_title_line(std::string_view line, std::size_t title_max_chars) {
  const std::string_view t = trim(line);
  if (t.empty()) {
    return false;
  }
  if (t.front() == '#') {
    return true;
  }
  if (char_count(t) > title_max_chars || has_inner_punctuation(t)) {
    return false;
  }

  if (starts_with_arabic_number(t) || starts_with_chinese_marker(t) ||
      is_section_keyword(t)) {
    return true;
  }

  if (is_terminator(decode_char(t, last_char_pos(t)))) {
    return false;
  }
  return is_capitalized_latin(t);
}

// ===========================================================================
// TitleDetector
// ===========================================================================

TitleDetector::TitleDetector(std::shared_ptr<const RuleSet> rules,
                             std::size_t title_max_chars)
    : rules_{std::move(rules)}, title_max_chars_{title_max_chars} {}

std::vector<Issue> TitleDetector::detect(const LineView &line,
                                         DedupContext &dedup) const {
  std::vector<Issue> issues;
  if (!is_title_line(line.text, title_max_chars_)) {
    return issues;
  }

  // Heading typos are reported once per document
  for (const auto &token : line.tokens) {
    auto correction = rules_->title_typo_correction(token.text);
    if (!correction) {
      continue;
    }
    if (dedup.seen_on_line(token.text) || dedup.seen_in_document(token.text)) {
      continue;
    }

    Issue issue;
    issue.line_number = line.line_number;
    issue.start = token.start;
    issue.end = token.end;
    issue.issue_type = std::string{issue_type::kTitleSpelling};
    issue.message = "可能的拼写错误: '" + token.text + "'";
    issue.suggestion = "建议修改为: '" + std::string{*correction} + "'";
    issues.push_back(std::move(issue));

    dedup.mark(token.text);
  }

  const std::string lower = to_lower_ascii(line.text);
  for (const auto &rule : rules_->casual_title_phrases()) {
    const std::size_t pos = find_pattern(line.text, lower, rule);
    if (pos == std::string_view::npos) {
      continue;
    }
    issues.push_back(make_issue(line, pos, pos + rule.pattern.size(),
                                rule.issue_type, rule.message,
                                rule.suggestion));
  }

  // Trailing full stop (ellipses excepted)
  std::string_view t = line.text;
  while (!t.empty()) {
    const std::size_t last = last_char_pos(t);
    if (!is_space_char(decode_char(t, last))) {
      break;
    }
    t = t.substr(0, last);
  }
  const bool ends_cn = t.ends_with("。") && !t.ends_with("。。");
  const bool ends_en = t.ends_with(".") && !t.ends_with("..");
  if (ends_cn || ends_en) {
    const std::size_t pos = last_char_pos(t);
    issues.push_back(make_issue(line, pos, t.size(), issue_type::kTitleStyle,
                                "标题末尾不应使用句号", "删除末尾句号"));
  }

  return issues;
}

// ===========================================================================
// RepeatedDetector
// ===========================================================================

RepeatedDetector::RepeatedDetector(std::shared_ptr<const RuleSet> rules)
    : rules_{std::move(rules)} {}

std::vector<Issue> RepeatedDetector::detect(const LineView &line,
                                            DedupContext &) const {
  std::vector<Issue> issues;
  detect_words(line, issues);
  detect_chars(line, issues);
  return issues;
}

void RepeatedDetector::detect_words(const LineView &line,
                                    std::vector<Issue> &out) const {
  const auto words = split_words(line.text);

  std::vector<std::string> normalized;
  normalized.reserve(words.size());
  for (const auto &w : words) {
    normalized.push_back(to_lower_ascii(core_of(line.text, w)));
  }

  std::size_t i = 0;
  while (i < words.size()) {
    std::size_t j = i + 1;
    while (j < words.size() && normalized[j] == normalized[i]) {
      ++j;
    }

    const std::string &word = normalized[i];
    if (j - i >= 2 && !word.empty() && has_letter(word) &&
        !rules_->is_repeat_allowed(word)) {
      const std::string shown{core_of(line.text, words[i])};
      out.push_back(make_issue(line, words[i].core_start, words[j - 1].core_end,
                               issue_type::kRepeatedWord,
                               "重复使用词语 '" + shown + "'",
                               "删除重复的 '" + shown + "'"));
    }
    i = j;
  }
}

void RepeatedDetector::detect_chars(const LineView &line,
                                    std::vector<Issue> &out) const {
  const std::string_view text = line.text;
  std::size_t pos = 0;

  while (pos < text.size()) {
    const char32_t cp = decode_char(text, pos);
    const std::size_t run_start = pos;
    std::size_t run_len = 0;

    while (pos < text.size() && decode_char(text, pos) == cp) {
      pos += next_char_len(text, pos);
      ++run_len;
    }

    if (run_len < 2 || !is_cjk_ideograph(cp)) {
      continue;
    }
    if (run_len == 2 && rules_->is_reduplication_allowed(cp)) {
      continue;
    }

    const std::string ch = encode_utf8(cp);
    out.push_back(make_issue(line, run_start, pos, issue_type::kRepeatedChar,
                             "重复使用字 '" + ch + "'",
                             "删除重复的 '" + ch + "'"));
  }
}

// ===========================================================================
// SentenceDetector
// ===========================================================================

SentenceDetector::SentenceDetector(std::size_t max_chars_zh,
                                   std::size_t max_chars_en)
    : max_chars_zh_{max_chars_zh}, max_chars_en_{max_chars_en} {}

std::vector<Issue> SentenceDetector::detect(const LineView &line,
                                            DedupContext &) const {
  std::vector<Issue> issues;
  detect_length(line, issues);
  detect_punctuation(line, issues);
  detect_brackets(line, issues);
  return issues;
}

void SentenceDetector::detect_length(const LineView &line,
                                     std::vector<Issue> &out) const {
  const std::string_view text = line.text;
  const std::size_t limit =
      line.script == Script::Chinese ? max_chars_zh_ : max_chars_en_;

  auto push = [&](std::size_t start, std::size_t end, bool terminated) {
    const std::size_t length = end - start;
    Issue issue;
    issue.line_number = line.line_number;
    issue.start = start;
    issue.end = end;
    issue.issue_type = std::string{issue_type::kSentenceLength};
    issue.message = (terminated ? "句子过长 (" : "可能的长句 (") +
                    std::to_string(length) + " 字符)";
    issue.suggestion = "考虑将长句拆分为多个短句，以提高可读性";
    out.push_back(std::move(issue));
  };

  std::size_t pos = 0;
  std::size_t index = 0;
  std::size_t start = 0;
  bool in_sentence = false;
  char32_t prev = 0;

  while (pos < text.size()) {
    const std::size_t len = next_char_len(text, pos);
    const char32_t cp = decode_char(text, pos);

    bool terminator = is_terminator(cp);
    // 3.14 is a number, not a sentence end
    if (cp == U'.' && is_ascii_digit(prev) && pos + len < text.size() &&
        is_ascii_digit(decode_char(text, pos + len))) {
      terminator = false;
    }

    if (terminator) {
      if (in_sentence && index + 1 - start > limit) {
        push(start, index + 1, true);
      }
      in_sentence = false;
    } else if (!in_sentence && !is_space_char(cp)) {
      start = index;
      in_sentence = true;
    }

    prev = cp;
    pos += len;
    ++index;
  }

  if (in_sentence && index - start > limit) {
    push(start, index, false);
  }
}

void SentenceDetector::detect_punctuation(const LineView &line,
                                          std::vector<Issue> &out) const {
  const std::string_view text = line.text;
  std::size_t pos = 0;
  char32_t before = 0;

  while (pos < text.size()) {
    char32_t cp = decode_char(text, pos);
    if (!is_run_punct(cp)) {
      before = cp;
      pos += next_char_len(text, pos);
      continue;
    }

    const std::size_t run_start = pos;
    std::u32string run;
    while (pos < text.size() && is_run_punct(cp = decode_char(text, pos))) {
      run.push_back(cp);
      pos += next_char_len(text, pos);
    }

    const bool ellipsis =
        run.size() >= 3 &&
        (run.find_first_not_of(U'.') == std::u32string::npos ||
         run.find_first_not_of(U'。') == std::u32string::npos);
    // "e.g.," and "etc.;"
    const bool abbreviation = run.size() == 2 && run[0] == U'.' &&
                              (run[1] == U',' || run[1] == U';' ||
                               run[1] == U':') &&
                              before < 0x80 &&
                              is_latin_char(static_cast<char>(before));

    if (run.size() >= 2 && !ellipsis && !abbreviation) {
      out.push_back(make_issue(line, run_start, pos, issue_type::kPunctuation,
                               "连续使用多个标点符号",
                               "使用单个适当的标点符号"));
    }
    before = run.back();
  }
}

void SentenceDetector::detect_brackets(const LineView &line,
                                       std::vector<Issue> &out) const {
  const std::string_view text = line.text;
  std::vector<std::size_t> open;
  std::size_t pos = 0;

  while (pos < text.size()) {
    const char32_t cp = decode_char(text, pos);
    if (cp == U'（') {
      open.push_back(pos);
    } else if (cp == U'）' && !open.empty()) {
      open.pop_back();
    }
    pos += next_char_len(text, pos);
  }

  if (!open.empty()) {
    const std::size_t at = open.front();
    out.push_back(make_issue(line, at, at + next_char_len(text, at),
                             issue_type::kPunctuation, "圆括号不配对",
                             "添加右括号）"));
  }
}

// ===========================================================================
// PhraseRuleDetector
// ===========================================================================

PhraseRuleDetector::PhraseRuleDetector(std::shared_ptr<const RuleSet> rules)
    : rules_{std::move(rules)} {}

std::vector<Issue> PhraseRuleDetector::detect(const LineView &line,
                                              DedupContext &) const {
  std::vector<Issue> issues;
  const std::string_view text = line.text;
  const std::string lower = to_lower_ascii(text);

  for (const auto &rule : rules_->phrase_rules()) {
    const std::size_t pos = find_pattern(text, lower, rule);
    if (pos == std::string_view::npos) {
      continue;
    }
    issues.push_back(make_issue(line, pos, pos + rule.pattern.size(),
                                rule.issue_type, rule.message,
                                rule.suggestion));
  }

  for (const auto &rule : rules_->paired_rules()) {
    const std::size_t first = text.find(rule.first);
    if (first == std::string_view::npos) {
      continue;
    }
    const std::size_t second = text.find(rule.second, first + rule.first.size());
    if (second == std::string_view::npos) {
      continue;
    }
    const std::size_t end = second + rule.second.size();
    issues.push_back(make_issue(
        line, first, end, rule.issue_type,
        "语序结构: " + std::string{text.substr(first, end - first)},
        rule.suggestion));
  }

  // 的/地/得: needs the neighbours of every character
  std::vector<std::pair<std::size_t, char32_t>> chars;
  for (std::size_t pos = 0; pos < text.size(); pos += next_char_len(text, pos)) {
    chars.emplace_back(pos, decode_char(text, pos));
  }

  for (const auto &rule : rules_->particle_rules()) {
    for (std::size_t i = 1; i + 1 < chars.size(); ++i) {
      if (chars[i].second != rule.particle ||
          rule.before.find(chars[i - 1].second) == std::u32string::npos ||
          rule.after.find(chars[i + 1].second) == std::u32string::npos) {
        continue;
      }
      issues.push_back(make_issue(line, chars[i].first, chars[i + 1].first,
                                  issue_type::kGrammar, rule.message,
                                  "将'" + encode_utf8(rule.particle) +
                                      "'改为'" +
                                      encode_utf8(rule.replacement) + "'"));
      break;
    }
  }

  return issues;
}

// ===========================================================================
// ArticleDetector
// ===========================================================================

ArticleDetector::ArticleDetector(std::shared_ptr<const RuleSet> rules)
    : rules_{std::move(rules)} {}

std::vector<Issue> ArticleDetector::detect(const LineView &line,
                                           DedupContext &) const {
  std::vector<Issue> issues;
  const std::string_view text = line.text;
  const auto words = split_words(text);

  for (std::size_t i = 0; i + 1 < words.size(); ++i) {
    const WordSpan &w = words[i];
    // The article must be a bare word ("a," ends a clause)
    if (w.core_start != w.byte_start || w.core_end != w.byte_end) {
      continue;
    }

    const std::string_view article = core_of(text, w);
    const bool is_a = (article == "a" || article == "A");
    const bool is_an = (article == "an" || article == "An");
    if (!is_a && !is_an) {
      continue;
    }

    // Capitalized only at the start of a sentence ("Figure A shows")
    if (is_ascii_upper(article.front()) && i > 0) {
      const std::string_view prev =
          text.substr(words[i - 1].byte_start,
                      words[i - 1].byte_end - words[i - 1].byte_start);
      if (prev.empty() || !is_terminator(decode_char(prev, last_char_pos(prev)))) {
        continue;
      }
    }

    const std::string_view next = core_of(text, words[i + 1]);
    if (next.size() < 2 || !is_latin_char(next.front())) {
      continue;
    }
    // Acronyms are read letter by letter
    if (is_ascii_upper(next[0]) && is_ascii_upper(next[1])) {
      continue;
    }

    const std::string lower = to_lower_ascii(next);
    const bool vowel = lower.front() == 'a' || lower.front() == 'e' ||
                       lower.front() == 'i' || lower.front() == 'o' ||
                       lower.front() == 'u';
    const bool vowel_sound =
        (vowel && !rules_->takes_a(lower)) || rules_->takes_an(lower);

    if (is_a && vowel_sound) {
      issues.push_back(make_issue(line, w.byte_start, w.byte_end,
                                  issue_type::kGrammar,
                                  "冠词使用不当: '" + std::string{next} +
                                      "' 前应使用 'an'",
                                  "将 'a' 改为 'an'"));
    } else if (is_an && !vowel_sound) {
      issues.push_back(make_issue(line, w.byte_start, w.byte_end,
                                  issue_type::kGrammar,
                                  "冠词使用不当: '" + std::string{next} +
                                      "' 前应使用 'a'",
                                  "将 'an' 改为 'a'"));
    }
  }

  return issues;
}

// ===========================================================================
// AgreementDetector
// ===========================================================================

namespace {

// After these the verb is a bare infinitive ("does it have", "let them do")
constexpr std::string_view kBareVerbTriggers[] = {
    "do",    "does",  "did",   "can",   "could", "will",  "would",
    "shall", "should", "may",  "might", "must",  "to",    "let",
    "lets",  "make",  "makes", "made",  "help",  "helps", "see",
    "saw",   "watch", "hear",  "had",   "have",  "has"};

bool after_bare_verb_trigger(std::string_view text,
                             const std::vector<WordSpan> &words,
                             std::size_t i) {
  if (i == 0 || words[i - 1].core_end != words[i - 1].byte_end) {
    return false;
  }
  const std::string prev = to_lower_ascii(core_of(text, words[i - 1]));
  for (std::string_view trigger : kBareVerbTriggers) {
    if (prev == trigger) {
      return true;
    }
  }
  return false;
}

} // namespace

AgreementDetector::AgreementDetector(std::shared_ptr<const RuleSet> rules)
    : rules_{std::move(rules)} {}

std::vector<Issue> AgreementDetector::detect(const LineView &line,
                                             DedupContext &) const {
  std::vector<Issue> issues;
  const std::string_view text = line.text;
  const auto words = split_words(text);

  for (std::size_t i = 0; i + 1 < words.size(); ++i) {
    const WordSpan &subject = words[i];
    const WordSpan &verb = words[i + 1];
    // Punctuation between the two words ends the clause
    if (subject.core_end != subject.byte_end ||
        verb.core_start != verb.byte_start) {
      continue;
    }

    const std::string_view subject_word = core_of(text, subject);
    const std::string_view verb_word = core_of(text, verb);
    auto suggestion = rules_->agreement_error(to_lower_ascii(subject_word),
                                              to_lower_ascii(verb_word));
    if (!suggestion || after_bare_verb_trigger(text, words, i)) {
      continue;
    }

    issues.push_back(make_issue(line, subject.core_start, verb.core_end,
                                issue_type::kGrammar,
                                "主谓不一致: '" + std::string{subject_word} +
                                    " " + std::string{verb_word} + "'",
                                std::string{*suggestion}));
  }

  return issues;
}

// ===========================================================================
// CitationDetector
// ===========================================================================

namespace {

enum class CitationForm {
  None,
  AuthorYear,   ///< (Smith, 2020)
  AuthorPage,   ///< (Smith 12)
  MissingComma, ///< (Smith 2020)
  MissingYear   ///< (Smith)
};

struct CitationMatch {
  CitationForm form = CitationForm::None;
  std::size_t end = 0; ///< Byte after ')'
};

std::size_t skip_blanks(std::string_view t, std::size_t i) noexcept {
  while (i < t.size() && (t[i] == ' ' || t[i] == '\t')) {
    ++i;
  }
  return i;
}

std::size_t skip_digits(std::string_view t, std::size_t i) noexcept {
  while (i < t.size() && t[i] >= '0' && t[i] <= '9') {
    ++i;
  }
  return i;
}

bool all_upper(std::string_view word) noexcept {
  for (char c : word) {
    if (!is_ascii_upper(c)) {
      return false;
    }
  }
  return true;
}

/// Classifies the ASCII parenthesized group opening at @p open
CitationMatch match_parenthesized(std::string_view t, std::size_t open,
                                  const RuleSet &rules) {
  std::size_t i = skip_blanks(t, open + 1);
  const bool padded = i > open + 1;

  const std::size_t word_start = i;
  while (i < t.size() && is_latin_char(t[i])) {
    ++i;
  }
  if (i == word_start || !is_ascii_upper(t[word_start])) {
    return {};
  }
  const std::string_view author = t.substr(word_start, i - word_start);
  if (rules.is_reference_label(to_lower_ascii(author))) {
    return {};
  }

  if (i < t.size() && t[i] == ',') {
    const std::size_t after_comma = i + 1;
    const std::size_t digits_start = skip_blanks(t, after_comma);
    i = skip_digits(t, digits_start);
    if (!padded && digits_start > after_comma && i - digits_start == 4 &&
        i < t.size() && t[i] == ')') {
      return {CitationForm::AuthorYear, i + 1};
    }
    return {};
  }

  const std::size_t digits_start = skip_blanks(t, i);
  const bool gap = digits_start > i;
  i = skip_digits(t, digits_start);
  const std::size_t digits = i - digits_start;
  const std::size_t close = skip_blanks(t, i);
  if (close >= t.size() || t[close] != ')') {
    return {};
  }

  if (digits == 4) {
    return {CitationForm::MissingComma, close + 1};
  }
  if (digits >= 1 && digits <= 3 && gap && !padded && close == i) {
    return {CitationForm::AuthorPage, close + 1};
  }
  // Acronyms in parentheses introduce abbreviations, not authors
  if (digits == 0 && !all_upper(author)) {
    return {CitationForm::MissingYear, close + 1};
  }
  return {};
}

} // namespace

CitationDetector::CitationDetector(std::shared_ptr<const RuleSet> rules)
    : rules_{std::move(rules)} {}

std::vector<Issue> CitationDetector::detect(const LineView &line,
                                            DedupContext &) const {
  std::vector<Issue> issues;
  const std::string_view text = line.text;

  bool author_year = false;
  bool author_page = false;
  bool numeric = false;

  // Only ASCII brackets are matched, so stepping by bytes stays on boundaries
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] == '(') {
      const CitationMatch m = match_parenthesized(text, pos, *rules_);
      switch (m.form) {
      case CitationForm::AuthorYear:
        author_year = true;
        break;
      case CitationForm::AuthorPage:
        author_page = true;
        break;
      case CitationForm::MissingComma:
        issues.push_back(make_issue(line, pos, m.end, issue_type::kCitation,
                                    "引用格式可能缺少逗号",
                                    "例如：(Smith, 2020)"));
        break;
      case CitationForm::MissingYear:
        issues.push_back(make_issue(line, pos, m.end, issue_type::kCitation,
                                    "引用格式可能缺少年份",
                                    "例如：(Smith, 2020)"));
        break;
      case CitationForm::None:
        break;
      }
      if (m.form != CitationForm::None) {
        pos = m.end;
        continue;
      }
    } else if (text[pos] == '[') {
      const std::size_t close = skip_digits(text, pos + 1);
      if (close > pos + 1 && close < text.size() && text[close] == ']') {
        numeric = true;
        pos = close + 1;
        continue;
      }
    }
    ++pos;
  }

  const int styles = static_cast<int>(author_year) +
                     static_cast<int>(author_page) + static_cast<int>(numeric);
  if (styles > 1) {
    issues.push_back(make_issue(line, 0, text.size(), issue_type::kCitation,
                                "同一行中存在不同的引用格式",
                                "请统一使用一种引用格式（如APA、MLA或IEEE）"));
  }

  return issues;
}

} // namespace wenjiao
