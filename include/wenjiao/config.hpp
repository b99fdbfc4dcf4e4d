/**
 * @file config.hpp
 * @brief Engine configuration
 *
 * Type-safe configuration parsed from a YAML subset.
 * Every value has a sensible default.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wenjiao/types.hpp"

namespace wenjiao {

// ===========================================================================
// Configuration structure
// ===========================================================================

/// Size limits. Exceeding them truncates and flags the result.
struct LimitsConfig {
  std::size_t max_text_length = kDefaultMaxTextLength; ///< characters
  std::size_t max_line_length = kDefaultMaxLineLength; ///< characters
  /// Document-wide cap on collected issues
  std::size_t max_issues = kDefaultMaxIssues;
};

/// Chunked async execution
struct SchedulerConfig {
  /// Lines processed between two progress events / yield points
  std::size_t chunk_size = kDefaultChunkSize;

  /// Inputs longer than this (characters) are analyzed asynchronously by the
  /// command line tool
  std::size_t async_threshold = 200'000;
};

/// Known-word sources
struct DictionaryConfig {
  /// Plain word lists or hunspell .dic files (one word per line)
  std::vector<std::filesystem::path> word_lists;

  /// Hunspell affix/dictionary pair (used only when built with Hunspell)
  std::filesystem::path hunspell_aff{"/usr/share/hunspell/en_US.aff"};
  std::filesystem::path hunspell_dic{"/usr/share/hunspell/en_US.dic"};

  /// Extra misspelling table: "typo<TAB>correction" per line
  std::filesystem::path typo_table;

  /// Capitalized words are treated as proper nouns by the spelling check
  bool skip_capitalized = true;
};

/// Detector switches and thresholds
struct DetectorConfig {
  bool spelling = true;
  bool typo = true;
  bool title = true;
  bool repeated = true;
  bool sentence = true;
  bool phrase = true;
  bool article = true;
  bool agreement = true;
  bool citation = true;

  /// Longest acceptable sentence (characters) in Chinese lines
  std::size_t max_sentence_chars_zh = 100;
  /// Longest acceptable sentence (characters) in Latin lines
  std::size_t max_sentence_chars_en = 200;

  /// Lines longer than this are never treated as headings
  std::size_t title_max_chars = 80;
};

/// Full engine configuration
struct Config {
  LimitsConfig limits;
  SchedulerConfig scheduler;
  DictionaryConfig dictionary;
  DetectorConfig detectors;
  std::filesystem::path config_path{std::string{kConfigPath}};
};

// ===========================================================================
// Configuration loader
// ===========================================================================

/// Result of loading the configuration from a file.
///
/// Unlike `load_config()`, this API performs no hidden fallbacks and lets
/// the caller decide (fail fast, fall back, report).
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Loads the configuration from a specific file
 *
 * @param path Absolute or relative path to the config file
 * @return ConfigLoadOutcome with the result code and error message
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Parses configuration text (same format as the file)
 *
 * Unknown keys are ignored; malformed values keep their defaults and make
 * the result ConfigResult::ParseError.
 */
[[nodiscard]] ConfigLoadOutcome parse_config_text(std::string_view text);

/**
 * @brief Loads the configuration (best effort)
 *
 * When @p path is the system default, ~/.config/wenjiao/config.yaml wins if
 * it exists. On read or validation errors the defaults are returned and a
 * warning is logged.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Validates the configuration
 * @return true if every value is within its allowed range
 */
[[nodiscard]] bool validate_config(const Config &config);

/// Parses a non-negative count ("1000", "1_000" is rejected)
[[nodiscard]] std::optional<std::size_t> parse_count(std::string_view value);

/// Parses yes/no/true/false/on/off/1/0
[[nodiscard]] std::optional<bool> parse_bool(std::string_view value);

} // namespace wenjiao
