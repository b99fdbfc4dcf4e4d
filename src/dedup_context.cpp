/**
 * @file dedup_context.cpp
 * @brief Implementation of the dedup scopes
 */

#include "wenjiao/dedup_context.hpp"
#include "wenjiao/text_utils.hpp"

namespace wenjiao {

bool DedupContext::contains(const std::unordered_set<std::string> &set,
                            std::string_view token) {
  std::string key{token};
  if (set.count(key) > 0) {
    return true;
  }
  return set.count(to_lower_ascii(token)) > 0;
}

bool DedupContext::seen_on_line(std::string_view token) const {
  return contains(line_scope_, token);
}

bool DedupContext::seen_in_document(std::string_view token) const {
  return contains(document_scope_, token);
}

void DedupContext::mark(std::string_view token) {
  std::string exact{token};
  std::string lower = to_lower_ascii(token);

  line_scope_.insert(exact);
  line_scope_.insert(lower);
  document_scope_.insert(std::move(exact));
  document_scope_.insert(std::move(lower));
}

} // namespace wenjiao
