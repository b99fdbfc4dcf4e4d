/**
 * @file dictionary.hpp
 * @brief Known-word lookup for the spelling detector
 *
 * Loads plain word lists and hunspell .dic files into a hash set. When built
 * with Hunspell, the affix-aware checker complements the word lists and
 * provides suggestions.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#ifdef HAVE_HUNSPELL
#include <hunspell/hunspell.hxx>
#endif

#include "wenjiao/bloom_filter.hpp"
#include "wenjiao/config.hpp"

namespace wenjiao {

/**
 * @brief English known-word dictionary
 *
 * Lookup levels:
 * - Bloom filter (definitely-absent fast path)
 * - sorted FNV-1a hash vector (binary search)
 * - the same two levels after stripping a regular inflection suffix
 * - Hunspell spell() when available (word forms from the .aff rules)
 *
 * Immutable after initialize()/add_words(); concurrent lookups are safe.
 * Hunspell calls are serialized internally.
 */
class Dictionary {
public:
  Dictionary() = default;
  ~Dictionary();

  Dictionary(const Dictionary &) = delete;
  Dictionary &operator=(const Dictionary &) = delete;

  /**
   * @brief Loads the configured sources plus the built-in vocabulary
   *
   * Missing files are skipped. Default system word lists are tried when the
   * configuration names none.
   *
   * @return true if at least one source was loaded
   */
  bool initialize(const DictionaryConfig &config);

  /**
   * @brief Adds words directly (embedding, tests)
   *
   * Marks the dictionary as ready.
   */
  void add_words(std::span<const std::string_view> words);

  /**
   * @brief Loads one word list
   *
   * Files named *.dic are read in hunspell format: the first line (entry
   * count) is skipped and "/flags" suffixes are stripped.
   *
   * @return Number of words loaded (0 if the file cannot be opened)
   */
  std::size_t load_word_list(const std::string &path);

  /// Checks a word (case-insensitive for the word lists)
  [[nodiscard]] bool contains(std::string_view word) const;

  [[nodiscard]] bool is_ready() const noexcept { return initialized_; }

  /// Number of unique hashed words
  [[nodiscard]] std::size_t size() const noexcept { return hashes_.size(); }

  [[nodiscard]] double bloom_fill() const noexcept {
    return bloom_.fill_ratio();
  }

  [[nodiscard]] bool is_hunspell_available() const noexcept {
    return hunspell_available_;
  }

  /**
   * @brief Generates correction candidates through Hunspell
   * @return Candidates in Hunspell order; empty without Hunspell
   */
  [[nodiscard]] std::vector<std::string>
  suggest(const std::string &word, std::size_t max_suggestions = 10) const;

  /// Hunspell verdict (false without Hunspell)
  [[nodiscard]] bool spell(const std::string &word) const;

private:
  [[nodiscard]] static bool
  hash_exists(std::uint64_t hash,
              const std::vector<std::uint64_t> &hashes) noexcept;

  /// Exact lookup in Bloom filter + hash vector
  [[nodiscard]] bool contains_exact(std::string_view word) const noexcept;

  /// Retries the lookup with -s/-es/-ies/-ed/-d/-ing/-ly removed
  [[nodiscard]] bool contains_stem(std::string_view word) const;

  void insert(std::string_view word);

  /// Sorts and deduplicates the hash vector
  void finalize_hashes();

  BloomFilter bloom_;
  std::vector<std::uint64_t> hashes_;

#ifdef HAVE_HUNSPELL
  std::unique_ptr<Hunspell> hunspell_;
#endif
  // Hunspell instances are not thread-safe
  mutable std::mutex hunspell_mutex_;

  bool initialized_ = false;
  bool hunspell_available_ = false;
};

} // namespace wenjiao
