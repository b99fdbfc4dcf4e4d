/**
 * @file hasher.hpp
 * @brief Allocation-free hashing for dictionary lookups
 *
 * FNV-1a 64-bit over lowercase ASCII, plus the derived second hash used by
 * the Bloom filter (double hashing).
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace wenjiao {

class Hasher {
public:
  // FNV-1a 64-bit constants
  static constexpr std::uint64_t kFnvBasis = 14695981039346656037ULL;
  static constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

  /**
   * @brief Hashes a string as-is
   * @param str String to hash
   * @return 64-bit hash
   */
  [[nodiscard]] static constexpr std::uint64_t
  hash_string(std::string_view str) noexcept {
    std::uint64_t hash = kFnvBasis;
    for (char c : str) {
      hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
      hash *= kFnvPrime;
    }
    return hash;
  }

  /**
   * @brief Hashes a word folding ASCII case on the fly
   *
   * Equal to hash_string(to_lower_ascii(word)) without building the copy.
   */
  [[nodiscard]] static constexpr std::uint64_t
  hash_folded(std::string_view word) noexcept {
    std::uint64_t hash = kFnvBasis;
    for (char c : word) {
      if (c >= 'A' && c <= 'Z') {
        c = static_cast<char>(c + ('a' - 'A'));
      }
      hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
      hash *= kFnvPrime;
    }
    return hash;
  }

  /**
   * @brief Derives the second Bloom filter hash from the first
   *
   * h_i = h1 + i * h2 gives the k probe positions.
   */
  [[nodiscard]] static constexpr std::uint64_t
  derive_second(std::uint64_t h1) noexcept {
    std::uint64_t h2 = (h1 >> 17) | (h1 << 47);
    h2 *= kFnvPrime;
    h2 ^= (h1 >> 31);
    return h2;
  }
};

} // namespace wenjiao
