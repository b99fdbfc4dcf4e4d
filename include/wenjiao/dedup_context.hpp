/**
 * @file dedup_context.hpp
 * @brief Per-line and per-document sets of already reported tokens
 *
 * Marking a token stores both its exact and its lowercase form, so case
 * variants count as duplicates once either form was seen. The line scope is
 * cleared by the orchestrator before every line; the document scope only
 * grows for the duration of one analysis run.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace wenjiao {

class DedupContext {
public:
  DedupContext() = default;

  DedupContext(const DedupContext &) = delete;
  DedupContext &operator=(const DedupContext &) = delete;
  DedupContext(DedupContext &&) = default;
  DedupContext &operator=(DedupContext &&) = default;

  /// Called by the orchestrator before each line
  void begin_line() noexcept { line_scope_.clear(); }

  /// Exact or lowercase form already reported on the current line
  [[nodiscard]] bool seen_on_line(std::string_view token) const;

  /// Exact or lowercase form already reported anywhere in this run
  [[nodiscard]] bool seen_in_document(std::string_view token) const;

  /// Registers both case forms in both scopes
  void mark(std::string_view token);

  [[nodiscard]] std::size_t line_size() const noexcept {
    return line_scope_.size();
  }
  [[nodiscard]] std::size_t document_size() const noexcept {
    return document_scope_.size();
  }

private:
  [[nodiscard]] static bool contains(const std::unordered_set<std::string> &set,
                                     std::string_view token);

  std::unordered_set<std::string> line_scope_;
  std::unordered_set<std::string> document_scope_;
};

} // namespace wenjiao
