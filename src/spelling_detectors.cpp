/**
 * @file spelling_detectors.cpp
 * @brief Dictionary spelling and typo-table detectors
 */

#include "wenjiao/detectors.hpp"
#include "wenjiao/edit_distance.hpp"
#include "wenjiao/text_utils.hpp"

#include <span>
#include <string>
#include <utility>

namespace wenjiao {

namespace {

constexpr std::string_view kGenericHint = "请检查拼写是否正确";

/// Letters and apostrophes only
bool is_plain_word(std::string_view word) noexcept {
  bool has_letter = false;
  for (char c : word) {
    if (is_latin_char(c)) {
      has_letter = true;
    } else if (c != '\'') {
      return false;
    }
  }
  return has_letter;
}

/// "'model's'" -> "model"
std::string_view lookup_form(std::string_view word) noexcept {
  while (!word.empty() && word.front() == '\'') {
    word.remove_prefix(1);
  }
  while (!word.empty() && word.back() == '\'') {
    word.remove_suffix(1);
  }
  if (word.size() > 2 && (word.ends_with("'s") || word.ends_with("'S"))) {
    word.remove_suffix(2);
  }
  return word;
}

/// Another token on the line spells @p word starting with a lowercase letter
bool has_lowercase_variant(std::span<const Token> tokens,
                           std::string_view word) {
  const std::string lower = to_lower_ascii(word);
  for (const auto &token : tokens) {
    const std::string_view other = lookup_form(token.text);
    if (!other.empty() && other.front() >= 'a' && other.front() <= 'z' &&
        to_lower_ascii(other) == lower) {
      return true;
    }
  }
  return false;
}

std::string quote_correction(std::string_view correction) {
  std::string s{"建议修改为: '"};
  s.append(correction);
  s.push_back('\'');
  return s;
}

} // namespace

// ===========================================================================
// SpellingDetector
// ===========================================================================

SpellingDetector::SpellingDetector(std::shared_ptr<const Dictionary> dictionary,
                                   std::shared_ptr<const RuleSet> rules,
                                   bool skip_capitalized)
    : dictionary_{std::move(dictionary)}, rules_{std::move(rules)},
      skip_capitalized_{skip_capitalized} {}

std::string SpellingDetector::suggestion_for(std::string_view word) const {
  if (auto correction = rules_->typo_correction(word)) {
    return quote_correction(*correction);
  }

  if (dictionary_->is_hunspell_available()) {
    auto candidates = dictionary_->suggest(std::string{word});
    if (auto best = closest_candidate(word, candidates)) {
      return quote_correction(*best);
    }
  }

  return std::string{kGenericHint};
}

std::vector<Issue> SpellingDetector::detect(const LineView &line,
                                            DedupContext &dedup) const {
  std::vector<Issue> issues;

  for (const auto &token : line.tokens) {
    const std::string_view word = token.text;

    // Hyphenated compounds are usually domain terms
    if (word.find('-') != std::string_view::npos || !is_plain_word(word)) {
      continue;
    }

    const std::string_view lookup = lookup_form(word);
    // Contractions belong to the style rules
    if (lookup.size() < kMinTokenChars ||
        lookup.find('\'') != std::string_view::npos) {
      continue;
    }

    // A capitalized form is checked when the line also has it in lowercase,
    // so the report lands on the first occurrence
    if (skip_capitalized_ && lookup.front() >= 'A' && lookup.front() <= 'Z' &&
        !has_lowercase_variant(line.tokens, lookup)) {
      continue;
    }

    if (dedup.seen_on_line(word) || dictionary_->contains(lookup)) {
      continue;
    }

    Issue issue;
    issue.line_number = line.line_number;
    issue.start = token.start;
    issue.end = token.end;
    issue.issue_type = std::string{issue_type::kSpelling};
    issue.message = "词典中未找到: '" + token.text + "'";
    issue.suggestion = suggestion_for(lookup);
    issues.push_back(std::move(issue));

    dedup.mark(word);
  }

  return issues;
}

// ===========================================================================
// TypoDetector
// ===========================================================================

TypoDetector::TypoDetector(std::shared_ptr<const RuleSet> rules)
    : rules_{std::move(rules)} {}

std::vector<Issue> TypoDetector::detect(const LineView &line,
                                        DedupContext &dedup) const {
  std::vector<Issue> issues;

  for (const auto &token : line.tokens) {
    const std::string_view word = token.text;
    auto correction = rules_->typo_correction(lookup_form(word));
    if (!correction || dedup.seen_on_line(word)) {
      continue;
    }

    Issue issue;
    issue.line_number = line.line_number;
    issue.start = token.start;
    issue.end = token.end;
    issue.issue_type = std::string{issue_type::kTypo};
    issue.message = "可能的错别字: '" + token.text + "'";
    issue.suggestion = quote_correction(*correction);
    issues.push_back(std::move(issue));

    dedup.mark(word);
  }

  return issues;
}

} // namespace wenjiao
