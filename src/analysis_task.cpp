/**
 * @file analysis_task.cpp
 * @brief Chunked execution of one analysis run
 */

#include "wenjiao/analysis_task.hpp"

#include <exception>
#include <thread>
#include <utility>

namespace wenjiao {

AnalysisTask::AnalysisTask(std::string id,
                           std::shared_ptr<const Analyzer> analyzer,
                           std::string text, std::size_t chunk_size)
    : id_{std::move(id)}, analyzer_{std::move(analyzer)},
      text_{std::move(text)},
      chunk_size_{chunk_size == 0 ? 1 : chunk_size} {}

AnalysisProgress AnalysisTask::run_chunk() {
  session_->feed_lines(chunk_size_);

  AnalysisProgress progress;
  progress.current_line = session_->current_line();
  progress.total_lines = session_->total_lines();
  progress.issues_found = session_->issues_found();
  progress.progress =
      progress.total_lines == 0
          ? 100.0
          : static_cast<double>(progress.current_line) * 100.0 /
                static_cast<double>(progress.total_lines);
  progress.message = "已分析 " + std::to_string(progress.current_line) + "/" +
                     std::to_string(progress.total_lines) + " 行";
  return progress;
}

void AnalysisTask::run(std::stop_token st, const EventSink &sink) {
  try {
    if (st.stop_requested()) {
      return;
    }
    session_.emplace(*analyzer_, text_);

    while (!session_->done()) {
      if (st.stop_requested()) {
        return;
      }

      AnalysisEvent event;
      event.analysis_id = id_;
      event.kind = EventKind::Progress;
      event.payload.progress = run_chunk();
      sink(std::move(event));

      std::this_thread::yield();
    }

    if (st.stop_requested()) {
      return;
    }

    AnalysisEvent done;
    done.analysis_id = id_;
    done.kind = EventKind::Complete;
    done.payload.completed = true;
    done.payload.result = session_->finish();
    sink(std::move(done));
  } catch (const std::exception &e) {
    AnalysisEvent failed;
    failed.analysis_id = id_;
    failed.kind = EventKind::Complete;
    failed.payload.completed = true;
    failed.payload.error = e.what();
    sink(std::move(failed));
  }
}

} // namespace wenjiao
