/**
 * @file analyzer.cpp
 * @brief Implementation of the analysis pipeline
 */

#include "wenjiao/analyzer.hpp"
#include "wenjiao/language_classifier.hpp"
#include "wenjiao/text_utils.hpp"
#include "wenjiao/token_extractor.hpp"

#include <algorithm>
#include <utility>

namespace wenjiao {

namespace {

bool issue_before(const Issue &a, const Issue &b) noexcept {
  if (a.start != b.start) {
    return a.start < b.start;
  }
  return a.end < b.end;
}

} // namespace

// ===========================================================================
// Analyzer
// ===========================================================================

Analyzer::Analyzer(DetectorRegistry registry, LimitsConfig limits)
    : registry_{std::move(registry)}, limits_{limits} {}

AnalysisResult Analyzer::analyze(std::string_view text) const {
  AnalysisSession session(*this, text);
  while (session.feed_line()) {
  }
  return session.finish();
}

// ===========================================================================
// AnalysisSession
// ===========================================================================

AnalysisSession::AnalysisSession(const Analyzer &analyzer, std::string_view text)
    : analyzer_{&analyzer} {
  text_ = truncate_safe(text, analyzer.limits().max_text_length);
  if (text_.size() < text.size()) {
    truncated_ = true;
  }

  lines_ = split_lines(text_);
  total_chars_ = char_count(text_);
}

bool AnalysisSession::feed_line() {
  if (done()) {
    return false;
  }

  const std::string_view full = lines_[next_line_];
  ++next_line_;

  // Statistics cover the whole line even when analysis is capped
  Script script = classify(full);
  std::vector<Token> tokens = extract_tokens(full, script);
  total_words_ += tokens.size();

  const auto [cjk, latin] = count_scripts(full);
  cjk_chars_ += cjk;
  if (cjk > 0 || latin > 0) {
    if (cjk > latin) {
      ++chinese_lines_;
    } else {
      ++latin_lines_;
    }
  }

  dedup_.begin_line();
  if (capped_) {
    return true;
  }

  std::string_view view =
      truncate_safe(full, analyzer_->limits().max_line_length);
  if (view.size() < full.size()) {
    truncated_ = true;
    script = classify(view);
    tokens = extract_tokens(view, script);
  }

  LineView line;
  line.text = view;
  line.line_number = next_line_;
  line.script = script;
  line.tokens = tokens;

  run_detectors(line);
  return true;
}

std::size_t AnalysisSession::feed_lines(std::size_t max_lines) {
  std::size_t processed = 0;
  while (processed < max_lines && feed_line()) {
    ++processed;
  }
  return processed;
}

void AnalysisSession::run_detectors(const LineView &line) {
  const std::size_t max_issues = analyzer_->limits().max_issues;

  for (const auto &detector : analyzer_->detectors()) {
    std::vector<Issue> found = detector->detect(line, dedup_);
    std::stable_sort(found.begin(), found.end(), issue_before);

    for (auto &issue : found) {
      if (issues_.size() >= max_issues) {
        truncated_ = true;
        capped_ = true;
        return;
      }
      issues_.push_back(std::move(issue));
    }
  }
}

AnalysisResult AnalysisSession::finish() {
  AnalysisResult result;
  result.issues = std::move(issues_);
  result.truncated = truncated_;

  result.stats["total_chars"] = total_chars_;
  result.stats["total_words"] = total_words_;
  result.stats["total_lines"] = lines_.size();
  result.stats["cjk_chars"] = cjk_chars_;
  result.stats["chinese_lines"] = chinese_lines_;
  result.stats["latin_lines"] = latin_lines_;
  result.stats["flagged_tokens"] = dedup_.document_size();

  issues_.clear();
  return result;
}

} // namespace wenjiao
