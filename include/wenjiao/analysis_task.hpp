/**
 * @file analysis_task.hpp
 * @brief One cancellable, chunked analysis run
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "wenjiao/analyzer.hpp"
#include "wenjiao/types.hpp"

namespace wenjiao {

/// Receives progress and completion events (called on the worker thread)
using EventSink = std::function<void(AnalysisEvent)>;

/**
 * @brief Chunked analysis of a text owned by the task
 *
 * Every chunk of chunk_size lines is followed by one progress event.
 * Cancellation is observed between chunks only. Truncation and line
 * splitting happen in run(), on the worker thread.
 */
class AnalysisTask {
public:
  AnalysisTask(std::string id, std::shared_ptr<const Analyzer> analyzer,
               std::string text, std::size_t chunk_size);

  AnalysisTask(const AnalysisTask &) = delete;
  AnalysisTask &operator=(const AnalysisTask &) = delete;

  [[nodiscard]] const std::string &id() const noexcept { return id_; }

  /// The text was split into lines (run() has begun)
  [[nodiscard]] bool started() const noexcept { return session_.has_value(); }

  /**
   * @brief Runs to completion unless @p st is stopped
   *
   * Emits zero or more progress events, then exactly one completion event
   * (result or error). Emits nothing after a stop was observed.
   */
  void run(std::stop_token st, const EventSink &sink);

private:
  /// Processes the next chunk and reports cumulative progress
  [[nodiscard]] AnalysisProgress run_chunk();

  std::string id_;
  std::shared_ptr<const Analyzer> analyzer_;
  std::string text_;
  std::size_t chunk_size_;
  // Views into text_; declared last, built by run()
  std::optional<AnalysisSession> session_;
};

} // namespace wenjiao
