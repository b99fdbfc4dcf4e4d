/**
 * @file engine.hpp
 * @brief Public entry point of the analysis engine
 *
 * Owns the shared read-only state (dictionary, rule set, analyzer), the
 * background scheduler and the event channel fed by asynchronous runs.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "wenjiao/analysis_scheduler.hpp"
#include "wenjiao/analyzer.hpp"
#include "wenjiao/concurrent_queue.hpp"
#include "wenjiao/config.hpp"
#include "wenjiao/dictionary.hpp"
#include "wenjiao/document_decoder.hpp"
#include "wenjiao/rule_set.hpp"
#include "wenjiao/types.hpp"

namespace wenjiao {

/// Result of analyzing a file: the analysis never starts if decoding fails
struct FileAnalysisOutcome {
  AnalysisResult result;
  DecodeStatus status = DecodeStatus::Ok;
  std::string error;
};

class Engine {
public:
  /// Loads the dictionary and rule tables named by @p config
  explicit Engine(Config config);

  /// Uses prepared collaborators (embedding, tests)
  Engine(Config config, std::shared_ptr<const Dictionary> dictionary,
         std::shared_ptr<const RuleSet> rules);

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  /// Cancels and joins running analyses
  ~Engine();

  /// Blocking analysis of @p text
  [[nodiscard]] AnalysisResult analyze_text(std::string_view text) const;

  /**
   * @brief Starts a background analysis
   *
   * Progress and completion arrive on the event channel tagged with the
   * returned id.
   */
  [[nodiscard]] std::string analyze_text_async(std::string text);

  /// Decodes @p path and analyzes it synchronously
  [[nodiscard]] FileAnalysisOutcome
  analyze_large_file(const std::filesystem::path &path) const;

  /**
   * @brief Cancels a background analysis
   *
   * No completion event is emitted for it afterwards; progress events
   * already queued stay in the channel.
   */
  bool cancel(const std::string &analysis_id);

  /// Blocks until every background analysis has ended
  void wait_idle();

  [[nodiscard]] std::optional<AnalysisEvent> try_pop_event();

  /// Blocks until an event arrives or @p st is stopped
  [[nodiscard]] std::optional<AnalysisEvent> wait_event(std::stop_token st);

  [[nodiscard]] std::optional<AnalysisEvent>
  wait_event_for(std::chrono::milliseconds timeout);

  /// Replaces the file decoder (default: PlainTextDecoder)
  void set_decoder(std::unique_ptr<DocumentDecoder> decoder);

  [[nodiscard]] const Config &config() const noexcept { return config_; }

  [[nodiscard]] const Dictionary &dictionary() const noexcept {
    return *dictionary_;
  }

private:
  void build_pipeline();

  Config config_;
  std::shared_ptr<const Dictionary> dictionary_;
  std::shared_ptr<const RuleSet> rules_;
  std::shared_ptr<const Analyzer> analyzer_;
  std::unique_ptr<DocumentDecoder> decoder_;

  ConcurrentQueue<AnalysisEvent> events_;
  // Declared after events_: its threads push into the channel
  std::unique_ptr<AnalysisScheduler> scheduler_;
};

} // namespace wenjiao
