/**
 * @file detector.hpp
 * @brief Interface implemented by every issue detector
 */

#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include "wenjiao/dedup_context.hpp"
#include "wenjiao/language_classifier.hpp"
#include "wenjiao/token_extractor.hpp"
#include "wenjiao/types.hpp"

namespace wenjiao {

/// Everything a detector may look at for one line
struct LineView {
  std::string_view text;       ///< Line without terminator (possibly capped)
  std::size_t line_number = 0; ///< 1-based
  Script script = Script::Latin;
  std::span<const Token> tokens;
};

/**
 * @brief A single analysis rule family
 *
 * Detectors keep no state between lines and are shared by concurrent runs,
 * hence detect() is const. Cross-detector state lives in the DedupContext.
 */
class Detector {
public:
  virtual ~Detector() = default;

  /// Stable identifier ("spelling", "typo", ...)
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /**
   * @brief Inspects one line
   * @return Issues with character offsets inside line.text
   */
  [[nodiscard]] virtual std::vector<Issue> detect(const LineView &line,
                                                  DedupContext &dedup) const = 0;
};

} // namespace wenjiao
