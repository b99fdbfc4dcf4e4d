/**
 * @file detectors.hpp
 * @brief Concrete detectors and the ordered registry
 *
 * Registry order: spelling, typo, title, repeated, sentence, phrase,
 * article, agreement, citation. The two token-based detectors share the dedup context so a token
 * is reported at most once per line.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

#include "wenjiao/config.hpp"
#include "wenjiao/detector.hpp"
#include "wenjiao/dictionary.hpp"
#include "wenjiao/rule_set.hpp"

namespace wenjiao {

// ===========================================================================
// Token-based detectors
// ===========================================================================

/// Words unknown to the dictionary
class SpellingDetector final : public Detector {
public:
  SpellingDetector(std::shared_ptr<const Dictionary> dictionary,
                   std::shared_ptr<const RuleSet> rules,
                   bool skip_capitalized = true);

  [[nodiscard]] std::string_view name() const noexcept override {
    return "spelling";
  }

  [[nodiscard]] std::vector<Issue> detect(const LineView &line,
                                          DedupContext &dedup) const override;

private:
  /// Typo table first, then the closest Hunspell candidate
  [[nodiscard]] std::string suggestion_for(std::string_view word) const;

  std::shared_ptr<const Dictionary> dictionary_;
  std::shared_ptr<const RuleSet> rules_;
  bool skip_capitalized_;
};

/// Known misspellings from the typo table
class TypoDetector final : public Detector {
public:
  explicit TypoDetector(std::shared_ptr<const RuleSet> rules);

  [[nodiscard]] std::string_view name() const noexcept override {
    return "typo";
  }

  [[nodiscard]] std::vector<Issue> detect(const LineView &line,
                                          DedupContext &dedup) const override;

private:
  std::shared_ptr<const RuleSet> rules_;
};

// ===========================================================================
// Line-based detectors
// ===========================================================================

/// Heading rules: title typos, casual phrasing, trailing full stop
class TitleDetector final : public Detector {
public:
  TitleDetector(std::shared_ptr<const RuleSet> rules,
                std::size_t title_max_chars = 80);

  [[nodiscard]] std::string_view name() const noexcept override {
    return "title";
  }

  [[nodiscard]] std::vector<Issue> detect(const LineView &line,
                                          DedupContext &dedup) const override;

private:
  std::shared_ptr<const RuleSet> rules_;
  std::size_t title_max_chars_;
};

/**
 * @brief Heuristic heading recognition
 *
 * A line is a heading when it starts with '#', or when it is short, has no
 * inner sentence punctuation and either opens with a section marker
 * ("1.", "1.1", "第一章", "一、", "（一）", "Abstract", "摘要", ...) or is
 * unterminated Latin with every significant word capitalized.
 */
[[nodiscard]] bool is_title_line(std::string_view line,
                                 std::size_t title_max_chars);

/// Adjacent repeated words and CJK characters
class RepeatedDetector final : public Detector {
public:
  explicit RepeatedDetector(std::shared_ptr<const RuleSet> rules);

  [[nodiscard]] std::string_view name() const noexcept override {
    return "repeated";
  }

  [[nodiscard]] std::vector<Issue> detect(const LineView &line,
                                          DedupContext &dedup) const override;

private:
  void detect_words(const LineView &line, std::vector<Issue> &out) const;
  void detect_chars(const LineView &line, std::vector<Issue> &out) const;

  std::shared_ptr<const RuleSet> rules_;
};

/// Sentence length, punctuation runs, unmatched brackets
class SentenceDetector final : public Detector {
public:
  SentenceDetector(std::size_t max_chars_zh = 100,
                   std::size_t max_chars_en = 200);

  [[nodiscard]] std::string_view name() const noexcept override {
    return "sentence";
  }

  [[nodiscard]] std::vector<Issue> detect(const LineView &line,
                                          DedupContext &dedup) const override;

private:
  void detect_length(const LineView &line, std::vector<Issue> &out) const;
  void detect_punctuation(const LineView &line, std::vector<Issue> &out) const;
  void detect_brackets(const LineView &line, std::vector<Issue> &out) const;

  std::size_t max_chars_zh_;
  std::size_t max_chars_en_;
};

/// Table-driven phrase rules (redundancy, idioms, style, grammar)
class PhraseRuleDetector final : public Detector {
public:
  explicit PhraseRuleDetector(std::shared_ptr<const RuleSet> rules);

  [[nodiscard]] std::string_view name() const noexcept override {
    return "phrase";
  }

  [[nodiscard]] std::vector<Issue> detect(const LineView &line,
                                          DedupContext &dedup) const override;

private:
  std::shared_ptr<const RuleSet> rules_;
};

/// a/an agreement with the following word
class ArticleDetector final : public Detector {
public:
  explicit ArticleDetector(std::shared_ptr<const RuleSet> rules);

  [[nodiscard]] std::string_view name() const noexcept override {
    return "article";
  }

  [[nodiscard]] std::vector<Issue> detect(const LineView &line,
                                          DedupContext &dedup) const override;

private:
  std::shared_ptr<const RuleSet> rules_;
};

/// Pronoun subject followed by a verb of the other number ("they is")
class AgreementDetector final : public Detector {
public:
  explicit AgreementDetector(std::shared_ptr<const RuleSet> rules);

  [[nodiscard]] std::string_view name() const noexcept override {
    return "agreement";
  }

  [[nodiscard]] std::vector<Issue> detect(const LineView &line,
                                          DedupContext &dedup) const override;

private:
  std::shared_ptr<const RuleSet> rules_;
};

/**
 * @brief In-text citation format
 *
 * Flags a line mixing author-year "(Smith, 2020)", author-page
 * "(Smith 12)" and numeric "[3]" citations, an author-year citation without
 * the comma and an author citation without a year.
 */
class CitationDetector final : public Detector {
public:
  explicit CitationDetector(std::shared_ptr<const RuleSet> rules);

  [[nodiscard]] std::string_view name() const noexcept override {
    return "citation";
  }

  [[nodiscard]] std::vector<Issue> detect(const LineView &line,
                                          DedupContext &dedup) const override;

private:
  std::shared_ptr<const RuleSet> rules_;
};

// ===========================================================================
// Registry
// ===========================================================================

using DetectorRegistry = std::vector<std::unique_ptr<Detector>>;

/**
 * @brief Builds the enabled detectors in their fixed order
 *
 * The spelling detector is left out when the dictionary is not ready.
 */
[[nodiscard]] DetectorRegistry
make_registry(const Config &config, std::shared_ptr<const Dictionary> dictionary,
              std::shared_ptr<const RuleSet> rules);

// ===========================================================================
// Shared helpers
// ===========================================================================

/**
 * @brief Finds a phrase rule pattern in a line
 *
 * @param lower_line The line with ASCII letters lowercased (same byte layout)
 * @return Byte offset or std::string_view::npos
 */
[[nodiscard]] std::size_t find_pattern(std::string_view line,
                                       std::string_view lower_line,
                                       const PhraseRule &rule);

/// Creates an issue from byte offsets inside @p line
[[nodiscard]] Issue make_issue(const LineView &line, std::size_t byte_start,
                               std::size_t byte_end, std::string_view type,
                               std::string message, std::string suggestion);

} // namespace wenjiao
