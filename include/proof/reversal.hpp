#ifndef POUS_PROOF_REVERSAL_HPP
#define POUS_PROOF_REVERSAL_HPP

#include "crypto/keystream_cipher.hpp"
#include "proof/types.hpp"

namespace pous::proof {

// Builds the fast-inverse material of a chunk from the transform it ran.
//
// The mutation permutes byte positions with a Feistel permutation whose
// round keys are harvested from the checkpoint states, then XORs an
// AES-256-CTR keystream keyed by a key derived from the final state. The
// transform key cannot be obtained without running the chain; once stored,
// restoring costs O(chunk length) regardless of the iteration count.
class ReversalKeyGenerator {
public:
  // ---- KEY GENERATION ----
  // initial_state is the chunk's transform seed, nonce makes the keystream
  // unique per chunk
  static ReversalKey generate(const Bytes& original_chunk, const TransformState& initial_state,
                              const VdfResult& transform, const Nonce& nonce);
  // Same, with a fresh random nonce
  static ReversalKey generate(const Bytes& original_chunk, const TransformState& initial_state,
                              const VdfResult& transform);

  // SHA-256(domain || final state || nonce)
  static Digest derive_transform_key(const TransformState& final_state, const Nonce& nonce);
  static crypto::FeistelPermutation::RoundKeys harvest_round_keys(const VdfResult& transform);


  // ---- MUTATION AND RESTORATION ----
  static Bytes apply_mutation(const Bytes& original, const ReversalKey& key);
  // Inverts apply_mutation and checks the result against original_checksum.
  // Throws RestorationVerificationError on mismatch, never returns unverified bytes.
  static Bytes restore_original_data(const Bytes& mutated, const ReversalKey& key);

private:
  static crypto::KeystreamCipher::Iv keystream_iv(const ReversalKey& key);
};

} // namespace pous::proof

#endif // POUS_PROOF_REVERSAL_HPP
