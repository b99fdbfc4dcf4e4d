/**
 * @file edit_distance.hpp
 * @brief Edit distance used to rank spelling suggestions
 */

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace wenjiao {

/**
 * @brief Damerau-Levenshtein distance (optimal string alignment)
 *
 * Counts insertions, deletions, substitutions and transpositions of adjacent
 * bytes. ASCII case is ignored.
 *
 * @return Minimum number of operations turning s1 into s2
 */
[[nodiscard]] std::size_t damerau_levenshtein_distance(std::string_view s1,
                                                       std::string_view s2);

/**
 * @brief Picks the candidate closest to @p word
 *
 * Ties keep the earlier candidate, so a provider's own ranking is preserved.
 *
 * @param max_distance Candidates further away than this are ignored
 * @return The closest candidate, or std::nullopt
 */
[[nodiscard]] std::optional<std::string>
closest_candidate(std::string_view word, std::span<const std::string> candidates,
                  std::size_t max_distance = 3);

} // namespace wenjiao
