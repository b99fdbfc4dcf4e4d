/**
 * @file analysis_scheduler.cpp
 * @brief Background execution of analysis tasks
 */

#include "wenjiao/analysis_scheduler.hpp"

#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace wenjiao {

AnalysisScheduler::AnalysisScheduler(std::shared_ptr<const Analyzer> analyzer,
                                     std::size_t chunk_size, EventSink sink)
    : analyzer_{std::move(analyzer)}, chunk_size_{chunk_size},
      sink_{std::move(sink)} {}

AnalysisScheduler::~AnalysisScheduler() {
  cancel_all();
  wait_all();
}

std::string AnalysisScheduler::submit(std::string text) {
  std::string id = "analysis-" + std::to_string(next_id_.fetch_add(1));

  Run run;
  run.task = std::make_unique<AnalysisTask>(id, analyzer_, std::move(text),
                                            chunk_size_);
  run.finished = std::make_shared<std::atomic<bool>>(false);

  std::lock_guard lock(mutex_);
  reap_finished_locked();

  auto [it, inserted] = runs_.emplace(id, std::move(run));
  Run &slot = it->second;

  AnalysisTask *task = slot.task.get();
  auto finished = slot.finished;
  const EventSink &sink = sink_;

  slot.thread = std::jthread([task, finished, &sink](std::stop_token st) {
    try {
      task->run(st, sink);
    } catch (const std::exception &e) {
      std::cerr << "[wenjiao] " << task->id() << " failed: " << e.what()
                << "\n";
    }
    finished->store(true);
  });

  return id;
}

bool AnalysisScheduler::cancel(const std::string &analysis_id) {
  std::lock_guard lock(mutex_);
  auto it = runs_.find(analysis_id);
  if (it == runs_.end() || it->second.finished->load()) {
    return false;
  }
  return it->second.thread.request_stop();
}

void AnalysisScheduler::cancel_all() {
  std::lock_guard lock(mutex_);
  for (auto &[id, run] : runs_) {
    run.thread.request_stop();
  }
}

void AnalysisScheduler::wait_all() {
  // Join outside the lock: an event callback may call cancel()
  std::map<std::string, Run> runs;
  {
    std::lock_guard lock(mutex_);
    runs.swap(runs_);
  }
  for (auto &[id, run] : runs) {
    if (run.thread.joinable()) {
      run.thread.join();
    }
  }
}

std::size_t AnalysisScheduler::active() const {
  std::lock_guard lock(mutex_);
  std::size_t count = 0;
  for (const auto &[id, run] : runs_) {
    if (!run.finished->load()) {
      ++count;
    }
  }
  return count;
}

void AnalysisScheduler::reap_finished_locked() {
  for (auto it = runs_.begin(); it != runs_.end();) {
    if (it->second.finished->load()) {
      it->second.thread.join();
      it = runs_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace wenjiao
