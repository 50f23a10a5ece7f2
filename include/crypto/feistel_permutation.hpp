#ifndef POUS_CRYPTO_FEISTEL_PERMUTATION_HPP
#define POUS_CRYPTO_FEISTEL_PERMUTATION_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace pous::crypto {

// Keyed pseudo-random permutation of the index range [0, num_elements).
// A balanced Feistel network over the smallest even bit width that covers
// the range, with cycle walking to land back inside it.
class FeistelPermutation {
public:
  static constexpr size_t ROUNDS = 4;

  using Index = uint64_t;
  using RoundKeys = std::array<uint64_t, ROUNDS>;

  // ---- CONSTRUCTOR ----
  FeistelPermutation(Index num_elements, const RoundKeys& keys);


  // ---- PERMUTATION ----
  Index permute(Index index) const;
  // Inverts permute() for the same keys
  Index invert(Index index) const;

  Index size() const { return num_elements_; }

private:
  Index num_elements_;
  RoundKeys keys_;
  Index left_mask_;
  Index right_mask_;
  Index half_bits_;

  // Round function F(R, K), truncated to the half width
  Index round(Index right, uint64_t key) const;
  Index encode(Index index) const;
  Index decode(Index index) const;
};

} // namespace pous::crypto

#endif // POUS_CRYPTO_FEISTEL_PERMUTATION_HPP
