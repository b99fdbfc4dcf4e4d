/**
 * @file rule_set.hpp
 * @brief Table data shared by the detectors
 *
 * Misspelling tables, phrase rules and allow-lists. Built once, then shared
 * read-only between analysis runs.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wenjiao {

/// Literal pattern searched in a line
struct PhraseRule {
  std::string pattern;    ///< Lowercase for Latin rules
  std::string issue_type; ///< One of issue_type::k*
  std::string message;
  std::string suggestion;
  /// Case-insensitive whole-word match; otherwise plain substring
  bool latin = false;
};

/// Two markers that should not both appear in one sentence
struct PairedRule {
  std::string first;
  std::string second;
  std::string issue_type;
  std::string suggestion;
};

/// Adjective/verb sets for the 的/地/得 check
struct ParticleRule {
  std::u32string before; ///< Any of these characters ...
  char32_t particle = 0; ///< ... followed by this one ...
  std::u32string after;  ///< ... followed by any of these is wrong
  char32_t replacement = 0;
  std::string message;
};

class RuleSet {
public:
  /// Rule set with every built-in table loaded
  [[nodiscard]] static RuleSet builtin();

  /**
   * @brief Merges a misspelling table file
   *
   * One "typo<TAB>correction" (or space separated) pair per line, '#' starts
   * a comment. Existing entries are overwritten.
   *
   * @return Number of pairs loaded, std::nullopt if the file cannot be read
   */
  std::optional<std::size_t> load_typo_file(const std::filesystem::path &path);

  void add_typo(std::string_view typo, std::string_view correction);

  /// Correction for a common misspelling (case-insensitive)
  [[nodiscard]] std::optional<std::string_view>
  typo_correction(std::string_view word) const;

  /// Correction for a misspelling typical of paper headings
  [[nodiscard]] std::optional<std::string_view>
  title_typo_correction(std::string_view word) const;

  [[nodiscard]] const std::vector<PhraseRule> &phrase_rules() const noexcept {
    return phrase_rules_;
  }
  [[nodiscard]] const std::vector<PairedRule> &paired_rules() const noexcept {
    return paired_rules_;
  }
  [[nodiscard]] const std::vector<ParticleRule> &
  particle_rules() const noexcept {
    return particle_rules_;
  }

  /// Casual expressions that do not belong in a heading
  [[nodiscard]] const std::vector<PhraseRule> &
  casual_title_phrases() const noexcept {
    return casual_title_phrases_;
  }

  /// Legitimate reduplication such as 常常 or 谢谢
  [[nodiscard]] bool is_reduplication_allowed(char32_t cp) const {
    return reduplication_.count(cp) > 0;
  }

  /// Words that may legitimately repeat ("had had", "that that")
  [[nodiscard]] bool is_repeat_allowed(std::string_view lower_word) const {
    return repeat_allowed_.count(std::string{lower_word}) > 0;
  }

  /// Vowel-initial words read with a consonant sound ("a university")
  [[nodiscard]] bool takes_a(std::string_view lower_word) const;

  /// Consonant-initial words read with a vowel sound ("an hour")
  [[nodiscard]] bool takes_an(std::string_view lower_word) const;

  /**
   * @brief Number agreement between a pronoun and the verb after it
   * @param subject Lowercase subject ("it", "they", ...)
   * @param verb Lowercase verb
   * @return Suggestion when the pair disagrees ("it are"), std::nullopt
   *         otherwise
   */
  [[nodiscard]] std::optional<std::string_view>
  agreement_error(std::string_view subject, std::string_view verb) const;

  /// Nouns that label figures, tables and sections ("Table 3"), not authors
  [[nodiscard]] bool is_reference_label(std::string_view lower_word) const {
    return reference_labels_.count(std::string{lower_word}) > 0;
  }

  [[nodiscard]] std::size_t typo_count() const noexcept {
    return typos_.size();
  }

private:
  std::unordered_map<std::string, std::string> typos_;
  std::unordered_map<std::string, std::string> title_typos_;
  std::vector<PhraseRule> phrase_rules_;
  std::vector<PairedRule> paired_rules_;
  std::vector<ParticleRule> particle_rules_;
  std::vector<PhraseRule> casual_title_phrases_;
  std::unordered_set<char32_t> reduplication_;
  std::unordered_set<std::string> repeat_allowed_;
  /// "subject verb" -> suggestion
  std::unordered_map<std::string, std::string> agreement_;
  std::unordered_set<std::string> reference_labels_;
  std::vector<std::string> a_prefixes_;
  std::vector<std::string> an_prefixes_;
};

} // namespace wenjiao
