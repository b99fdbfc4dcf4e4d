/**
 * @file engine.cpp
 * @brief Engine wiring
 */

#include "wenjiao/engine.hpp"
#include "wenjiao/detectors.hpp"

#include <iostream>
#include <utility>

namespace wenjiao {

namespace {

std::shared_ptr<const Dictionary> load_dictionary(const DictionaryConfig &dc) {
  auto dictionary = std::make_shared<Dictionary>();
  if (!dictionary->initialize(dc)) {
    std::cerr << "[wenjiao] Warning: no word list could be loaded\n";
  }
  return dictionary;
}

std::shared_ptr<const RuleSet> load_rules(const DictionaryConfig &dc) {
  auto rules = std::make_shared<RuleSet>(RuleSet::builtin());
  if (!dc.typo_table.empty()) {
    if (auto added = rules->load_typo_file(dc.typo_table)) {
      std::cerr << "[wenjiao] Loaded " << *added << " typo pairs from "
                << dc.typo_table.string() << "\n";
    } else {
      std::cerr << "[wenjiao] Warning: cannot read typo table "
                << dc.typo_table.string() << "\n";
    }
  }
  return rules;
}

} // namespace

Engine::Engine(Config config)
    : config_{std::move(config)},
      dictionary_{load_dictionary(config_.dictionary)},
      rules_{load_rules(config_.dictionary)} {
  build_pipeline();
}

Engine::Engine(Config config, std::shared_ptr<const Dictionary> dictionary,
               std::shared_ptr<const RuleSet> rules)
    : config_{std::move(config)}, dictionary_{std::move(dictionary)},
      rules_{std::move(rules)} {
  if (!dictionary_) {
    dictionary_ = std::make_shared<Dictionary>();
  }
  if (!rules_) {
    rules_ = std::make_shared<RuleSet>(RuleSet::builtin());
  }
  build_pipeline();
}

Engine::~Engine() {
  // Join the workers while the channel is still alive
  scheduler_.reset();
}

void Engine::build_pipeline() {
  analyzer_ = std::make_shared<Analyzer>(
      make_registry(config_, dictionary_, rules_), config_.limits);
  decoder_ = std::make_unique<PlainTextDecoder>();
  scheduler_ = std::make_unique<AnalysisScheduler>(
      analyzer_, config_.scheduler.chunk_size,
      [this](AnalysisEvent event) { events_.push(std::move(event)); });
}

AnalysisResult Engine::analyze_text(std::string_view text) const {
  return analyzer_->analyze(text);
}

std::string Engine::analyze_text_async(std::string text) {
  return scheduler_->submit(std::move(text));
}

FileAnalysisOutcome
Engine::analyze_large_file(const std::filesystem::path &path) const {
  FileAnalysisOutcome out;

  DecodeOutcome decoded = decoder_->decode(path);
  if (decoded.status != DecodeStatus::Ok) {
    out.status = decoded.status;
    out.error = std::move(decoded.error);
    return out;
  }

  // The session views the decoded buffer line by line
  AnalysisSession session(*analyzer_, decoded.text);
  while (session.feed_line()) {
  }
  out.result = session.finish();
  return out;
}

bool Engine::cancel(const std::string &analysis_id) {
  return scheduler_->cancel(analysis_id);
}

void Engine::wait_idle() { scheduler_->wait_all(); }

std::optional<AnalysisEvent> Engine::try_pop_event() {
  return events_.try_pop();
}

std::optional<AnalysisEvent> Engine::wait_event(std::stop_token st) {
  return events_.pop_wait(st);
}

std::optional<AnalysisEvent>
Engine::wait_event_for(std::chrono::milliseconds timeout) {
  return events_.pop_wait_for(timeout);
}

void Engine::set_decoder(std::unique_ptr<DocumentDecoder> decoder) {
  if (decoder) {
    decoder_ = std::move(decoder);
  }
}

} // namespace wenjiao
