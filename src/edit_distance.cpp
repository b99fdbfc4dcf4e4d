/**
 * @file edit_distance.cpp
 * @brief Damerau-Levenshtein distance and suggestion ranking
 */

#include "wenjiao/edit_distance.hpp"

#include <algorithm>
#include <vector>

namespace wenjiao {

namespace {

constexpr char fold(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

} // namespace

std::size_t damerau_levenshtein_distance(std::string_view s1,
                                         std::string_view s2) {
  const std::size_t len1 = s1.size();
  const std::size_t len2 = s2.size();

  if (len1 == 0)
    return len2;
  if (len2 == 0)
    return len1;

  // Three rolling rows: i-2, i-1 and i
  std::vector<std::size_t> prev2(len2 + 1);
  std::vector<std::size_t> prev(len2 + 1);
  std::vector<std::size_t> cur(len2 + 1);

  for (std::size_t j = 0; j <= len2; ++j) {
    prev[j] = j;
  }

  for (std::size_t i = 1; i <= len1; ++i) {
    cur[0] = i;
    const char a = fold(s1[i - 1]);

    for (std::size_t j = 1; j <= len2; ++j) {
      const char b = fold(s2[j - 1]);
      const std::size_t cost = (a == b) ? 0 : 1;

      cur[j] = std::min({
          prev[j] + 1,       // deletion
          cur[j - 1] + 1,    // insertion
          prev[j - 1] + cost // substitution
      });

      // Transposition of two neighbours
      if (i > 1 && j > 1 && a == fold(s2[j - 2]) && fold(s1[i - 2]) == b) {
        cur[j] = std::min(cur[j], prev2[j - 2] + cost);
      }
    }

    std::swap(prev2, prev);
    std::swap(prev, cur);
  }

  return prev[len2];
}

std::optional<std::string>
closest_candidate(std::string_view word, std::span<const std::string> candidates,
                  std::size_t max_distance) {
  const std::string *best = nullptr;
  std::size_t best_distance = max_distance + 1;

  for (const auto &candidate : candidates) {
    // Multi-word suggestions are not useful as inline replacements
    if (candidate.empty() || candidate.find(' ') != std::string::npos) {
      continue;
    }
    std::size_t d = damerau_levenshtein_distance(word, candidate);
    if (d < best_distance) {
      best_distance = d;
      best = &candidate;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

} // namespace wenjiao
