#include "node/retrieval_service.hpp"
#include "codec/record_codec.hpp"
#include "crypto/crypto_error.hpp"
#include "proof/binding.hpp"
#include "proof/proof_error.hpp"
#include "proof/reversal.hpp"
#include <boost/log/trivial.hpp>

namespace pous {
namespace node {

RetrievalService::RetrievalService(const proof::NodeIdentity& identity, const store::ChunkStore& store,
                                   const validator::Clock& clock, std::optional<proof::PublicKey> validator_key)
  : identity_(identity)
  , store_(store)
  , clock_(clock)
  , validator_key_(std::move(validator_key)) {}

proof::Bytes RetrievalService::serve_chunk(uint32_t copy_index, uint32_t chunk_index) const {
  proof::TransformedChunk chunk = store_.load(identity_.node_id(), copy_index, chunk_index);
  proof::Bytes original = restore_bound_chunk(chunk);
  BOOST_LOG_TRIVIAL(debug) << "RetrievalService: Served copy " << copy_index << " chunk " << chunk_index << " ("
                           << original.size() << " bytes)";
  return original;
}

proof::ChallengeResponse RetrievalService::respond_to_challenge(const proof::StorageChallenge& challenge) const {
  if (validator_key_) {
    crypto::require_valid_signature(*validator_key_, codec::RecordCodec::challenge_signing_bytes(challenge),
                                    challenge.validator_signature, "storage challenge");
  }

  BOOST_LOG_TRIVIAL(info) << "RetrievalService: Answering challenge for copy " << challenge.copy_index
                          << " chunk " << challenge.chunk_index;

  proof::TransformedChunk chunk = store_.load(identity_.node_id(), challenge.copy_index, challenge.chunk_index);
  // Throws on corruption or a copy built elsewhere, the response is aborted
  restore_bound_chunk(chunk);

  proof::ChallengeResponse response;
  response.proof.server_binding = proof::bind_to_location(chunk.mutated_data, identity_.location);
  response.proof.key_signature = identity_.key_pair.sign(chunk.mutated_data);
  response.proof.current_location = identity_.location;
  response.mutated_data = std::move(chunk.mutated_data);
  response.responded_at = clock_.now_ms();
  return response;
}

proof::Bytes RetrievalService::restore_bound_chunk(const proof::TransformedChunk& chunk) const {
  proof::Bytes original = proof::ReversalKeyGenerator::restore_original_data(chunk.mutated_data, chunk.reversal_key);
  if (proof::bind_to_location(original, identity_.location) != chunk.proof.binding.server_binding) {
    BOOST_LOG_TRIVIAL(error) << "RetrievalService: Copy " << chunk.copy_index << " chunk " << chunk.chunk_index
                             << " was bound to another location than " << identity_.location.to_string();
    throw proof::LocationMismatchError("stored chunk " + std::to_string(chunk.chunk_index) + " of copy " +
                                       std::to_string(chunk.copy_index) + " is not bound to " +
                                       identity_.location.to_string());
  }
  return original;
}

} // namespace node
} // namespace pous
