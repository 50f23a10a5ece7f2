#include "validator/proof_verifier.hpp"
#include "crypto/crypto_error.hpp"
#include "proof/binding.hpp"
#include "proof/proof_error.hpp"
#include "proof/reversal.hpp"
#include <boost/log/trivial.hpp>

namespace pous {
namespace validator {

namespace {

VerificationReport accept() {
  return VerificationReport{true, ""};
}

VerificationReport reject(const std::string& reason) {
  BOOST_LOG_TRIVIAL(warning) << "ProofVerifier: Rejected: " << reason;
  return VerificationReport{false, reason};
}

class BundleVisitor {
public:
  explicit BundleVisitor(const VerificationContext& context) : context_(context) {}

  VerificationReport operator()(const KeyLocationProof& proof) const {
    const proof::ServerCoinMemo& memo = proof.memo;
    if (memo.epoch != context_.current_epoch) {
      return reject("memo epoch " + std::to_string(memo.epoch) + " is not the current epoch " +
                    std::to_string(context_.current_epoch));
    }
    if (!verify_server_coin_memo(memo, context_.registry.protocol_prefix())) {
      return reject("memo signature invalid for " + memo.host);
    }
    return accept();
  }

  VerificationReport operator()(const UniqueContentProof& proof) const {
    if (proof.epoch != context_.current_epoch) {
      return reject("proof epoch " + std::to_string(proof.epoch) + " is stale");
    }
    if (!context_.registry.is_registered(proof.public_key, registered_host(proof.location), proof.epoch)) {
      return reject("key is not registered at " + registered_host(proof.location) + " in epoch " +
                    std::to_string(proof.epoch));
    }

    try {
      check_chunk(proof);
    } catch (const std::exception& e) {
      return reject(e.what());
    }
    return accept();
  }

private:
  const VerificationContext& context_;

  void check_chunk(const UniqueContentProof& proof) const {
    const proof::TransformedChunk& chunk = proof.chunk;
    const proof::ChunkProof& chunk_proof = chunk.proof;
    const proof::ReversalKey& key = chunk.reversal_key;

    proof::verify_chunk_bindings(proof.original_chunk, chunk_proof.binding, proof.location, proof.public_key);

    if (chunk.chunk_index == 0 &&
        chunk_proof.previous_state != proof::VdfEngine::chain_seed(proof.public_key, chunk.copy_index)) {
      throw proof::CheckpointMismatchError("chunk 0 does not start from the copy seed");
    }

    proof::TransformState initial =
      proof::VdfEngine::initial_state(proof.original_chunk, chunk_proof.binding, chunk_proof.previous_state);
    context_.engine.verify(initial, chunk_proof.vdf, proof.public_key);

    // The reversal key must come from this transform
    if (key.parameters.seed != initial || key.parameters.iterations != chunk_proof.vdf.iterations) {
      throw proof::ProofError("Reversal parameters do not match the transform");
    }
    if (key.transform_key !=
        proof::ReversalKeyGenerator::derive_transform_key(chunk_proof.vdf.final_state, key.parameters.nonce)) {
      throw proof::ProofError("Transform key was not derived from the final state");
    }
    if (key.reversal_matrix != proof::ReversalKeyGenerator::harvest_round_keys(chunk_proof.vdf)) {
      throw proof::ProofError("Reversal matrix was not harvested from the checkpoints");
    }

    if (proof::ReversalKeyGenerator::restore_original_data(chunk.mutated_data, key) != proof.original_chunk) {
      throw proof::RestorationVerificationError("restored data differs from the original chunk");
    }
  }
};

} // namespace

std::string registered_host(const proof::NetworkLocation& location) {
  return location.hostname ? *location.hostname : location.ip;
}

VerificationReport verify_proof_bundle(const ProofBundle& bundle, const VerificationContext& context) {
  return std::visit(BundleVisitor(context), bundle);
}

} // namespace validator
} // namespace pous
