#include "proof/reversal.hpp"
#include "proof/proof_error.hpp"
#include <algorithm>
#include <cstring>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace pous::proof {

namespace {

const std::string TRANSFORM_KEY_DOMAIN = "pous/reversal/transform-key";
const std::string ROUND_KEY_DOMAIN = "pous/reversal/round-key";
const std::string IV_DOMAIN = "pous/reversal/iv";

} // namespace

//==============================================
// KEY GENERATION
//==============================================

Digest ReversalKeyGenerator::derive_transform_key(const TransformState& final_state, const Nonce& nonce) {
  crypto::Hasher hasher;
  return hasher.update(TRANSFORM_KEY_DOMAIN)
               .update(final_state)
               .update(nonce.data(), nonce.size())
               .finalize();
}

crypto::FeistelPermutation::RoundKeys ReversalKeyGenerator::harvest_round_keys(const VdfResult& transform) {
  crypto::FeistelPermutation::RoundKeys keys{};
  crypto::Hasher hasher;

  for (size_t round = 0; round < keys.size(); ++round) {
    // Spread the rounds over the chain; short chains fall back to the final state
    const TransformState& source = transform.checkpoints.empty()
      ? transform.final_state
      : transform.checkpoints[(round * transform.checkpoints.size()) / keys.size()];

    uint32_t net_round = boost::endian::native_to_big(static_cast<uint32_t>(round));
    Digest digest = hasher.update(ROUND_KEY_DOMAIN)
                          .update(source)
                          .update(&net_round, sizeof(net_round))
                          .finalize();

    uint64_t key;
    std::memcpy(&key, digest.data(), sizeof(key));
    keys[round] = boost::endian::big_to_native(key);
  }
  return keys;
}

ReversalKey ReversalKeyGenerator::generate(const Bytes& original_chunk, const TransformState& initial_state,
                                           const VdfResult& transform, const Nonce& nonce) {
  ReversalKey key;
  key.transform_key = derive_transform_key(transform.final_state, nonce);
  key.reversal_matrix = harvest_round_keys(transform);
  key.original_checksum = crypto::sha256(original_chunk);
  key.parameters.iterations = transform.iterations;
  key.parameters.seed = initial_state;
  key.parameters.nonce = nonce;

  BOOST_LOG_TRIVIAL(trace) << "Reversal: Generated reversal key for " << original_chunk.size()
                           << " bytes, checksum " << crypto::to_hex(key.original_checksum);
  return key;
}

ReversalKey ReversalKeyGenerator::generate(const Bytes& original_chunk, const TransformState& initial_state,
                                           const VdfResult& transform) {
  Nonce nonce;
  Bytes random = crypto::random_bytes(nonce.size());
  std::copy(random.begin(), random.end(), nonce.begin());
  return generate(original_chunk, initial_state, transform, nonce);
}

crypto::KeystreamCipher::Iv ReversalKeyGenerator::keystream_iv(const ReversalKey& key) {
  crypto::Hasher hasher;
  Digest digest = hasher.update(IV_DOMAIN)
                        .update(key.parameters.nonce.data(), key.parameters.nonce.size())
                        .update(key.parameters.seed)
                        .finalize();
  crypto::KeystreamCipher::Iv iv;
  std::copy_n(digest.begin(), iv.size(), iv.begin());
  return iv;
}

//==============================================
// MUTATION AND RESTORATION
//==============================================

Bytes ReversalKeyGenerator::apply_mutation(const Bytes& original, const ReversalKey& key) {
  if (original.empty()) {
    return {};
  }

  // Byte i moves to position permute(i)
  crypto::FeistelPermutation permutation(original.size(), key.reversal_matrix);
  Bytes mutated(original.size());
  for (size_t i = 0; i < original.size(); ++i) {
    mutated[permutation.permute(i)] = original[i];
  }

  crypto::KeystreamCipher cipher;
  cipher.initialize(key.transform_key, keystream_iv(key));
  cipher.apply_in_place(mutated);
  return mutated;
}

Bytes ReversalKeyGenerator::restore_original_data(const Bytes& mutated, const ReversalKey& key) {
  Bytes restored;

  if (!mutated.empty()) {
    crypto::KeystreamCipher cipher;
    cipher.initialize(key.transform_key, keystream_iv(key));
    Bytes permuted = cipher.apply(mutated);

    crypto::FeistelPermutation permutation(permuted.size(), key.reversal_matrix);
    restored.resize(permuted.size());
    for (size_t i = 0; i < permuted.size(); ++i) {
      restored[i] = permuted[permutation.permute(i)];
    }
  }

  if (crypto::sha256(restored) != key.original_checksum) {
    BOOST_LOG_TRIVIAL(error) << "Reversal: Restored " << restored.size()
                             << " bytes do not match the original checksum";
    throw RestorationVerificationError("checksum mismatch after reversal");
  }
  return restored;
}

} // namespace pous::proof
