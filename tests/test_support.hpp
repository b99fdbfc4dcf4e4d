/**
 * @file test_support.hpp
 * @brief CHECK macro and engine fixtures shared by the test executables
 */

#pragma once

#include "wenjiao/analyzer.hpp"
#include "wenjiao/config.hpp"
#include "wenjiao/detectors.hpp"
#include "wenjiao/dictionary.hpp"
#include "wenjiao/rule_set.hpp"

#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <memory>
#include <string_view>
#include <vector>

namespace wenjiao::test {

[[noreturn]] inline void test_fail(const char *expr, const char *file,
                                   int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      ::wenjiao::test::test_fail(#expr, __FILE__, __LINE__);                   \
    }                                                                          \
  } while (0)

/// Small English vocabulary, no system word lists involved
inline std::shared_ptr<Dictionary>
make_dictionary(std::initializer_list<std::string_view> extra = {}) {
  static constexpr std::string_view kWords[] = {
      "the",    "and",     "this",     "that",   "is",       "are",
      "was",    "model",   "data",     "works",  "work",     "simple",
      "sentence", "results", "study",  "learning", "machine", "method",
      "apple",  "hour",    "university", "book", "agent",    "shows",
      "figure", "win",     "order",    "version", "test",    "text",
  };
  auto dict = std::make_shared<Dictionary>();
  std::vector<std::string_view> words(std::begin(kWords), std::end(kWords));
  words.insert(words.end(), extra.begin(), extra.end());
  dict->add_words(words);
  return dict;
}

/// Config with every detector switched off
inline Config quiet_config() {
  Config config;
  DetectorConfig &d = config.detectors;
  d.spelling = d.typo = d.title = d.repeated = d.sentence = d.phrase =
      d.article = false;
  return config;
}

inline std::shared_ptr<const Analyzer>
make_analyzer(const Config &config,
              std::shared_ptr<const Dictionary> dict = make_dictionary()) {
  auto rules = std::make_shared<RuleSet>(RuleSet::builtin());
  return std::make_shared<Analyzer>(
      make_registry(config, std::move(dict), std::move(rules)), config.limits);
}

/// Issues of one type
inline std::vector<Issue> of_type(const AnalysisResult &result,
                                  std::string_view type) {
  std::vector<Issue> out;
  for (const auto &issue : result.issues) {
    if (issue.issue_type == type) {
      out.push_back(issue);
    }
  }
  return out;
}

} // namespace wenjiao::test
