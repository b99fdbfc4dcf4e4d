/**
 * @file types.hpp
 * @brief Base types and data structures of the analysis engine
 *
 * Everything a caller receives from the engine (issues, statistics,
 * progress and event payloads) is declared here.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wenjiao {

// ===========================================================================
// Constants
// ===========================================================================

/// Path of the system-wide configuration file
inline constexpr std::string_view kConfigPath = "/etc/wenjiao/config.yaml";

/// Path of the per-user configuration (relative to $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/wenjiao/config.yaml";

/// Default text limit (characters) before the input is truncated
inline constexpr std::size_t kDefaultMaxTextLength = 1'000'000;

/// Default line limit (characters) before a line is truncated
inline constexpr std::size_t kDefaultMaxLineLength = 10'000;

/// Default document-wide issue cap
inline constexpr std::size_t kDefaultMaxIssues = 1'000;

/// Default number of lines per async chunk
inline constexpr std::size_t kDefaultChunkSize = 50;

// ===========================================================================
// Issue type tags
// ===========================================================================

namespace issue_type {
inline constexpr std::string_view kSpelling = "spelling";
inline constexpr std::string_view kTypo = "typo";
inline constexpr std::string_view kTitleSpelling = "title_spelling";
inline constexpr std::string_view kTitleStyle = "title_style";
inline constexpr std::string_view kRepeatedWord = "repeated_word";
inline constexpr std::string_view kRepeatedChar = "repeated_char";
inline constexpr std::string_view kSentenceLength = "sentence_length";
inline constexpr std::string_view kPunctuation = "punctuation";
inline constexpr std::string_view kRedundancy = "redundancy";
inline constexpr std::string_view kIdiom = "idiom";
inline constexpr std::string_view kStyle = "style";
inline constexpr std::string_view kGrammar = "grammar";
inline constexpr std::string_view kCitation = "citation";
} // namespace issue_type

// ===========================================================================
// Analysis results
// ===========================================================================

/// A single localized finding. Offsets are characters within the line.
struct Issue {
  std::size_t line_number = 0; ///< 1-based
  std::size_t start = 0;       ///< First character of the span
  std::size_t end = 0;         ///< One past the last character
  std::string issue_type;
  std::string message;
  std::string suggestion;

  bool operator==(const Issue &) const = default;
};

/// Metric name -> count (total_chars, total_words, total_lines, ...)
using AnalysisStats = std::map<std::string, std::size_t>;

struct AnalysisResult {
  std::vector<Issue> issues;
  AnalysisStats stats;
  /// Text, a line or the issue list was capped. The view is partial but valid.
  bool truncated = false;
};

// ===========================================================================
// Async progress and events
// ===========================================================================

struct AnalysisProgress {
  double progress = 0.0; ///< 0..100
  std::size_t current_line = 0;
  std::size_t total_lines = 0;
  std::size_t issues_found = 0;
  std::string message;
};

/// Event payload: exactly one of progress / result / error is set.
struct AsyncAnalysisResult {
  bool completed = false;
  std::optional<AnalysisProgress> progress;
  std::optional<AnalysisResult> result;
  std::optional<std::string> error;
};

enum class EventKind { Progress, Complete };

/// Value placed on the event channel for every progress/completion event
struct AnalysisEvent {
  std::string analysis_id;
  EventKind kind = EventKind::Progress;
  AsyncAnalysisResult payload;
};

// ===========================================================================
// Operation result codes
// ===========================================================================

/// Configuration parsing result
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Document decoding result
enum class DecodeStatus { Ok, NotFound, ReadError, UnsupportedFormat,
                          InvalidEncoding };

} // namespace wenjiao
