#include "crypto/feistel_permutation.hpp"
#include "crypto/crypto_error.hpp"

namespace pous::crypto {

namespace {

// 64-bit finalizer from SplitMix64
uint64_t mix64(uint64_t x) {
  x ^= x >> 30;
  x *= 0xbf58476d1ce4e5b9ULL;
  x ^= x >> 27;
  x *= 0x94d049bb133111ebULL;
  x ^= x >> 31;
  return x;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

FeistelPermutation::FeistelPermutation(Index num_elements, const RoundKeys& keys)
  : num_elements_(num_elements)
  , keys_(keys) {
  if (num_elements_ == 0) {
    throw CryptoError("Feistel: permutation domain must not be empty");
  }

  // Smallest power of four covering the domain, split in two equal halves
  Index next_pow4 = 4;
  Index log4 = 1;
  while (next_pow4 < num_elements_) {
    next_pow4 *= 4;
    log4 += 1;
  }

  half_bits_ = log4;
  right_mask_ = (Index{1} << log4) - 1;
  left_mask_ = right_mask_ << log4;
}

//==============================================
// FEISTEL NETWORK
//==============================================

FeistelPermutation::Index FeistelPermutation::round(Index right, uint64_t key) const {
  return mix64(right ^ mix64(key)) & right_mask_;
}

FeistelPermutation::Index FeistelPermutation::encode(Index index) const {
  Index left = (index & left_mask_) >> half_bits_;
  Index right = index & right_mask_;

  for (size_t i = 0; i < ROUNDS; ++i) {
    Index next_right = left ^ round(right, keys_[i]);
    left = right;
    right = next_right;
  }

  return (left << half_bits_) | right;
}

FeistelPermutation::Index FeistelPermutation::decode(Index index) const {
  Index left = (index & left_mask_) >> half_bits_;
  Index right = index & right_mask_;

  for (size_t i = ROUNDS; i > 0; --i) {
    Index previous_left = right ^ round(left, keys_[i - 1]);
    right = left;
    left = previous_left;
  }

  return (left << half_bits_) | right;
}

//==============================================
// PERMUTATION
//==============================================

FeistelPermutation::Index FeistelPermutation::permute(Index index) const {
  if (index >= num_elements_) {
    throw CryptoError("Feistel: index out of range");
  }
  // The even bit width can encode values above the domain, keep walking
  // the cycle until we land in the permitted range
  Index u = encode(index);
  while (u >= num_elements_) {
    u = encode(u);
  }
  return u;
}

FeistelPermutation::Index FeistelPermutation::invert(Index index) const {
  if (index >= num_elements_) {
    throw CryptoError("Feistel: index out of range");
  }
  Index u = decode(index);
  while (u >= num_elements_) {
    u = decode(u);
  }
  return u;
}

} // namespace pous::crypto
