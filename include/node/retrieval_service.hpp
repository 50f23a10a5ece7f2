#ifndef POUS_NODE_RETRIEVAL_SERVICE_HPP
#define POUS_NODE_RETRIEVAL_SERVICE_HPP

#include <cstdint>
#include <optional>
#include "proof/types.hpp"
#include "store/chunk_store.hpp"
#include "validator/clock.hpp"

namespace pous {
namespace node {

// Node-side read path. Answers from stored chunks by fast reversal and never
// runs the sequential transform.
class RetrievalService {
public:
  // With a validator key, challenges not signed by it are refused
  RetrievalService(const proof::NodeIdentity& identity, const store::ChunkStore& store,
                   const validator::Clock& clock,
                   std::optional<proof::PublicKey> validator_key = std::nullopt);

  // Original bytes of a chunk. Throws StoreError when the chunk is missing,
  // RestorationVerificationError when it does not restore cleanly and
  // LocationMismatchError when it was built for another location.
  proof::Bytes serve_chunk(uint32_t copy_index, uint32_t chunk_index) const;

  // Signs the stored mutated chunk for the challenged location. The chunk is
  // restored first so corrupt data is never offered as proof.
  proof::ChallengeResponse respond_to_challenge(const proof::StorageChallenge& challenge) const;

  const proof::NodeIdentity& identity() const { return identity_; }

private:
  const proof::NodeIdentity& identity_;
  const store::ChunkStore& store_;
  const validator::Clock& clock_;
  std::optional<proof::PublicKey> validator_key_;

  // Restores chunk and checks its server binding against the current location
  proof::Bytes restore_bound_chunk(const proof::TransformedChunk& chunk) const;
};

} // namespace node
} // namespace pous

#endif // POUS_NODE_RETRIEVAL_SERVICE_HPP
