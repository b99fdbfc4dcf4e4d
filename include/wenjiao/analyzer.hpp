/**
 * @file analyzer.hpp
 * @brief Analysis orchestration: truncation, per-line pipeline, statistics
 *
 * Synchronous analysis, chunked async tasks and file analysis all drive the
 * same AnalysisSession, so they produce identical results for equal input.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

#include "wenjiao/config.hpp"
#include "wenjiao/dedup_context.hpp"
#include "wenjiao/detectors.hpp"
#include "wenjiao/types.hpp"

namespace wenjiao {

/**
 * @brief Immutable analysis pipeline
 *
 * Owns the detector registry and the size limits. Safe to share between
 * concurrent sessions.
 */
class Analyzer {
public:
  Analyzer(DetectorRegistry registry, LimitsConfig limits);

  Analyzer(const Analyzer &) = delete;
  Analyzer &operator=(const Analyzer &) = delete;

  /// Analyzes a whole text in one blocking call
  [[nodiscard]] AnalysisResult analyze(std::string_view text) const;

  [[nodiscard]] const LimitsConfig &limits() const noexcept { return limits_; }

  [[nodiscard]] const DetectorRegistry &detectors() const noexcept {
    return registry_;
  }

private:
  DetectorRegistry registry_;
  LimitsConfig limits_;
};

/**
 * @brief Incremental analysis of one text
 *
 * The text is truncated to limits().max_text_length characters on
 * construction and split into line views; no line is copied. The caller
 * keeps @p text alive until finish().
 */
class AnalysisSession {
public:
  AnalysisSession(const Analyzer &analyzer, std::string_view text);

  AnalysisSession(const AnalysisSession &) = delete;
  AnalysisSession &operator=(const AnalysisSession &) = delete;

  /**
   * @brief Processes the next line
   * @return false when every line was already processed
   */
  bool feed_line();

  /**
   * @brief Processes up to @p max_lines lines
   * @return Number of lines processed
   */
  std::size_t feed_lines(std::size_t max_lines);

  [[nodiscard]] bool done() const noexcept {
    return next_line_ >= lines_.size();
  }

  /// Lines processed so far
  [[nodiscard]] std::size_t current_line() const noexcept {
    return next_line_;
  }
  [[nodiscard]] std::size_t total_lines() const noexcept {
    return lines_.size();
  }
  [[nodiscard]] std::size_t issues_found() const noexcept {
    return issues_.size();
  }

  /// Builds the result; the session must not be fed afterwards
  [[nodiscard]] AnalysisResult finish();

private:
  void run_detectors(const LineView &line);

  const Analyzer *analyzer_;
  std::string_view text_;
  std::vector<std::string_view> lines_;
  std::size_t next_line_ = 0;

  DedupContext dedup_;
  std::vector<Issue> issues_;
  bool truncated_ = false;
  bool capped_ = false; ///< Issue cap hit, detectors no longer run

  std::size_t total_chars_ = 0;
  std::size_t total_words_ = 0;
  std::size_t cjk_chars_ = 0;
  std::size_t chinese_lines_ = 0;
  std::size_t latin_lines_ = 0;
};

} // namespace wenjiao
