#include "test_support.hpp"

#include "wenjiao/analysis_scheduler.hpp"
#include "wenjiao/analysis_task.hpp"
#include "wenjiao/concurrent_queue.hpp"
#include "wenjiao/engine.hpp"

#include <chrono>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace {

using namespace wenjiao;
using wenjiao::test::make_analyzer;
using wenjiao::test::make_dictionary;

/// Mixed document with a few findings per block
std::string make_document(std::size_t blocks) {
  std::string text;
  for (std::size_t i = 0; i < blocks; ++i) {
    text += "本研究采用了machien learning方法。\n";
    text += "The the model recieve a apple in order to win!!\n";
    text += "我我认为这个方法不可思异\n";
    text += "plain line number " + std::to_string(i) + "\n";
  }
  return text;
}

Config small_chunks() {
  Config config;
  config.scheduler.chunk_size = 10;
  return config;
}

/// Collects every event of an engine until its run completes
std::vector<AnalysisEvent> collect_until_complete(Engine &engine,
                                                  const std::string &id) {
  std::vector<AnalysisEvent> events;
  for (;;) {
    auto event = engine.wait_event_for(std::chrono::seconds{10});
    CHECK(event.has_value());
    if (event->analysis_id != id) {
      continue;
    }
    const bool complete = event->kind == EventKind::Complete;
    events.push_back(std::move(*event));
    if (complete) {
      return events;
    }
  }
}

void test_task_chunks_and_progress() {
  auto analyzer = make_analyzer(Config{});
  const std::string text = make_document(25); // 100 lines

  AnalysisTask task("analysis-test", analyzer, text, 10);
  // Splitting waits for the worker thread
  CHECK(!task.started());
  std::vector<AnalysisEvent> events;
  std::stop_source source;
  task.run(source.get_token(),
           [&](AnalysisEvent e) { events.push_back(std::move(e)); });

  CHECK(task.started());
  CHECK(events.size() == 11);

  std::size_t last_line = 0;
  double last_progress = 0.0;
  for (std::size_t i = 0; i + 1 < events.size(); ++i) {
    const auto &e = events[i];
    CHECK(e.kind == EventKind::Progress);
    CHECK(e.analysis_id == "analysis-test");
    CHECK(e.payload.progress.has_value());
    CHECK(!e.payload.result.has_value());
    CHECK(!e.payload.error.has_value());

    const auto &p = *e.payload.progress;
    CHECK(p.current_line >= last_line);
    CHECK(p.progress >= last_progress);
    CHECK(p.current_line <= p.total_lines);
    CHECK(p.total_lines == 100);
    last_line = p.current_line;
    last_progress = p.progress;
  }
  CHECK(last_line == 100);
  CHECK(last_progress == 100.0);
  CHECK(events.front().payload.progress->current_line == 10);
  CHECK(events.front().payload.progress->message == "已分析 10/100 行");

  const auto &done = events.back();
  CHECK(done.kind == EventKind::Complete);
  CHECK(done.payload.completed);
  CHECK(done.payload.result.has_value());
  CHECK(!done.payload.progress.has_value());
}

void test_async_matches_sync() {
  auto analyzer = make_analyzer(Config{});
  const std::string text = make_document(30);
  auto expected = analyzer->analyze(text);

  for (std::size_t chunk : {std::size_t{1}, std::size_t{7}, std::size_t{50},
                            std::size_t{1000}}) {
    AnalysisTask task("analysis-eq", analyzer, text, chunk);
    std::optional<AnalysisResult> result;
    std::stop_source source;
    task.run(source.get_token(), [&](AnalysisEvent e) {
      if (e.kind == EventKind::Complete) {
        result = std::move(e.payload.result);
      }
    });

    CHECK(result.has_value());
    CHECK(result->issues == expected.issues);
    CHECK(result->stats == expected.stats);
    CHECK(result->truncated == expected.truncated);
  }
}

void test_stopped_task_emits_nothing() {
  auto analyzer = make_analyzer(Config{});
  AnalysisTask task("analysis-stop", analyzer, make_document(5), 2);

  std::stop_source source;
  source.request_stop();
  std::size_t events = 0;
  task.run(source.get_token(), [&](AnalysisEvent) { ++events; });
  CHECK(events == 0);
  CHECK(!task.started());
}

void test_empty_text_completes() {
  auto analyzer = make_analyzer(Config{});
  AnalysisTask task("analysis-empty", analyzer, "", 50);

  std::vector<AnalysisEvent> events;
  std::stop_source source;
  task.run(source.get_token(),
           [&](AnalysisEvent e) { events.push_back(std::move(e)); });

  CHECK(events.size() == 1);
  CHECK(events[0].kind == EventKind::Complete);
  CHECK(events[0].payload.result->stats.at("total_lines") == 0);
}

void test_scheduler_cancel_from_sink() {
  auto analyzer = make_analyzer(Config{});

  std::mutex mutex;
  std::vector<AnalysisEvent> events;
  AnalysisScheduler *self = nullptr;

  AnalysisScheduler scheduler(analyzer, 5, [&](AnalysisEvent e) {
    std::lock_guard lock(mutex);
    if (e.kind == EventKind::Progress && events.empty()) {
      self->cancel(e.analysis_id);
    }
    events.push_back(std::move(e));
  });
  self = &scheduler;

  const std::string id = scheduler.submit(make_document(20));
  CHECK(id.starts_with("analysis-"));
  scheduler.wait_all();

  std::lock_guard lock(mutex);
  CHECK(events.size() == 1);
  CHECK(events[0].kind == EventKind::Progress);
  CHECK(scheduler.active() == 0);
  CHECK(!scheduler.cancel(id));
}

void test_engine_async_run() {
  Engine engine(small_chunks(), make_dictionary(), nullptr);
  const std::string text = make_document(10);
  auto expected = engine.analyze_text(text);

  const std::string first = engine.analyze_text_async(text);
  auto events = collect_until_complete(engine, first);

  CHECK(events.size() == 5); // 40 lines, 10 per chunk
  const auto &done = events.back();
  CHECK(done.payload.result.has_value());
  CHECK(done.payload.result->issues == expected.issues);

  // Ids are unique per run
  const std::string second = engine.analyze_text_async("teh");
  CHECK(second != first);
  auto more = collect_until_complete(engine, second);
  CHECK(more.back().payload.result->issues.size() == 1);

  engine.wait_idle();
  CHECK(!engine.try_pop_event().has_value());
  CHECK(!engine.cancel("analysis-unknown"));
}

void test_concurrent_runs() {
  Engine engine(small_chunks(), make_dictionary(), nullptr);
  const std::string text = make_document(15);
  auto expected = engine.analyze_text(text);

  std::set<std::string> ids;
  for (int i = 0; i < 4; ++i) {
    ids.insert(engine.analyze_text_async(text));
  }
  CHECK(ids.size() == 4);

  std::size_t completed = 0;
  while (completed < ids.size()) {
    auto event = engine.wait_event_for(std::chrono::seconds{10});
    CHECK(event.has_value());
    CHECK(ids.count(event->analysis_id) == 1);
    if (event->kind == EventKind::Complete) {
      CHECK(event->payload.result->issues == expected.issues);
      ++completed;
    }
  }
  engine.wait_idle();
}

void test_event_queue() {
  ConcurrentQueue<int> queue;
  CHECK(queue.empty());
  CHECK(!queue.try_pop().has_value());
  CHECK(!queue.pop_wait_for(std::chrono::milliseconds{1}).has_value());

  queue.push(1);
  queue.push(2);
  queue.push(3);
  CHECK(queue.size() == 3);
  CHECK(queue.try_pop() == std::optional<int>{1});

  auto rest = queue.drain();
  CHECK((rest == std::vector<int>{2, 3}));
  CHECK(queue.empty());
}

void test_wait_event_stops() {
  Engine engine(Config{}, make_dictionary(), nullptr);

  std::stop_source source;
  source.request_stop();
  CHECK(!engine.wait_event(source.get_token()).has_value());
}

} // namespace

int main() {
  test_task_chunks_and_progress();
  test_async_matches_sync();
  test_stopped_task_emits_nothing();
  test_empty_text_completes();
  test_scheduler_cancel_from_sink();
  test_engine_async_run();
  test_concurrent_runs();
  test_event_queue();
  test_wait_event_stops();
  return 0;
}
