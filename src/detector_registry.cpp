/**
 * @file detector_registry.cpp
 * @brief Assembles the enabled detectors in their fixed order
 */

#include "wenjiao/detectors.hpp"

#include <iostream>

namespace wenjiao {

DetectorRegistry make_registry(const Config &config,
                               std::shared_ptr<const Dictionary> dictionary,
                               std::shared_ptr<const RuleSet> rules) {
  const DetectorConfig &dc = config.detectors;
  DetectorRegistry registry;

  if (dc.spelling) {
    if (dictionary && dictionary->is_ready()) {
      registry.push_back(std::make_unique<SpellingDetector>(
          dictionary, rules, config.dictionary.skip_capitalized));
    } else {
      std::cerr << "[wenjiao] No dictionary loaded, spelling check disabled\n";
    }
  }
  if (dc.typo) {
    registry.push_back(std::make_unique<TypoDetector>(rules));
  }
  if (dc.title) {
    registry.push_back(
        std::make_unique<TitleDetector>(rules, dc.title_max_chars));
  }
  if (dc.repeated) {
    registry.push_back(std::make_unique<RepeatedDetector>(rules));
  }
  if (dc.sentence) {
    registry.push_back(std::make_unique<SentenceDetector>(
        dc.max_sentence_chars_zh, dc.max_sentence_chars_en));
  }
  if (dc.phrase) {
    registry.push_back(std::make_unique<PhraseRuleDetector>(rules));
  }
  if (dc.article) {
    registry.push_back(std::make_unique<ArticleDetector>(rules));
  }
  if (dc.agreement) {
    registry.push_back(std::make_unique<AgreementDetector>(rules));
  }
  if (dc.citation) {
    registry.push_back(std::make_unique<CitationDetector>(rules));
  }

  return registry;
}

} // namespace wenjiao
