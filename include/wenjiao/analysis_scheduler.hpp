/**
 * @file analysis_scheduler.hpp
 * @brief Runs analysis tasks in the background
 *
 * One std::jthread per run. Cancellation requests the thread's stop token;
 * it never blocks, so it may be called from inside an event callback.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "wenjiao/analysis_task.hpp"
#include "wenjiao/analyzer.hpp"

namespace wenjiao {

class AnalysisScheduler {
public:
  AnalysisScheduler(std::shared_ptr<const Analyzer> analyzer,
                    std::size_t chunk_size, EventSink sink);

  AnalysisScheduler(const AnalysisScheduler &) = delete;
  AnalysisScheduler &operator=(const AnalysisScheduler &) = delete;

  /// Cancels and joins every run
  ~AnalysisScheduler();

  /**
   * @brief Starts analyzing @p text in the background
   * @return Analysis id ("analysis-<n>")
   */
  [[nodiscard]] std::string submit(std::string text);

  /**
   * @brief Requests cancellation of a run
   * @return false if the id is unknown or the run already finished
   */
  bool cancel(const std::string &analysis_id);

  void cancel_all();

  /// Blocks until every submitted run has ended
  void wait_all();

  /// Runs that have not finished yet
  [[nodiscard]] std::size_t active() const;

private:
  struct Run {
    std::unique_ptr<AnalysisTask> task;
    std::shared_ptr<std::atomic<bool>> finished;
    // Declared last: joined before the task is destroyed
    std::jthread thread;
  };

  /// Joins and erases finished runs (caller holds mutex_)
  void reap_finished_locked();

  std::shared_ptr<const Analyzer> analyzer_;
  std::size_t chunk_size_;
  EventSink sink_;

  mutable std::mutex mutex_;
  std::map<std::string, Run> runs_;
  std::atomic<std::uint64_t> next_id_{1};
};

} // namespace wenjiao
