#ifndef POUS_VALIDATOR_PROOF_VERIFIER_HPP
#define POUS_VALIDATOR_PROOF_VERIFIER_HPP

#include <cstdint>
#include <string>
#include <variant>
#include "proof/types.hpp"
#include "proof/vdf_engine.hpp"
#include "validator/key_location.hpp"

namespace pous {
namespace validator {

// A node's claim that its key serves from a host in an epoch
struct KeyLocationProof {
  proof::ServerCoinMemo memo;
};

// A node's claim that it transformed one chunk under its key and location
struct UniqueContentProof {
  proof::PublicKey public_key{};
  proof::NetworkLocation location;
  uint64_t epoch{0};
  proof::Bytes original_chunk;
  proof::TransformedChunk chunk;
};

using ProofBundle = std::variant<KeyLocationProof, UniqueContentProof>;

struct VerificationReport {
  bool accepted{false};
  std::string reason;
};

struct VerificationContext {
  const KeyLocationRegistry& registry;
  const proof::VdfEngine& engine;
  uint64_t current_epoch{0};
};

// Host name under which a location registers its key
std::string registered_host(const proof::NetworkLocation& location);

// Checks a bundle of either kind. Unique-content proofs are only accepted
// for a key and host registered in the current epoch.
VerificationReport verify_proof_bundle(const ProofBundle& bundle, const VerificationContext& context);

} // namespace validator
} // namespace pous

#endif // POUS_VALIDATOR_PROOF_VERIFIER_HPP
