#ifndef POUS_PROOF_TYPES_HPP
#define POUS_PROOF_TYPES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "crypto/hash.hpp"
#include "crypto/key_pair.hpp"
#include "crypto/feistel_permutation.hpp"

namespace pous {
namespace proof {

using crypto::Bytes;
using crypto::Digest;
using crypto::PublicKey;
using crypto::Signature;

static constexpr size_t NONCE_SIZE = 16;
using Nonce = std::array<uint8_t, NONCE_SIZE>;

// Per-chunk working state of the sequential transform
using TransformState = Digest;

// Network location a node serves its copies from
struct NetworkLocation {
  std::string ip;
  uint16_t port{0};
  std::optional<std::string> hostname;

  // Normalised "ip|port|hostname" bytes; the IP is parsed and re-printed
  // so equivalent spellings of one address encode identically.
  // Throws ProofError for an unparsable IP.
  Bytes canonical_encoding() const;
  std::string to_string() const;

  // Parses "ip:port" or "[ipv6]:port"
  static NetworkLocation parse(const std::string& endpoint);

  bool operator==(const NetworkLocation& other) const;
  bool operator!=(const NetworkLocation& other) const { return !(*this == other); }
};

// Stable identifier of a node: hex SHA-256 of its public key
std::string node_id_for(const PublicKey& public_key);

struct NodeIdentity {
  crypto::KeyPair key_pair;
  NetworkLocation location;

  const PublicKey& public_key() const { return key_pair.public_key(); }
  std::string node_id() const { return node_id_for(key_pair.public_key()); }
};

struct ChunkDefinition {
  uint32_t index{0};
  uint64_t start_offset{0};
  uint64_t length{0};

  bool operator==(const ChunkDefinition& other) const {
    return index == other.index && start_offset == other.start_offset && length == other.length;
  }
};

struct ChunkBinding {
  Digest server_binding{};
  Signature key_binding{};
  Digest final_binding{};
};

struct VdfResult {
  Digest final_state{};
  // State after every checkpoint_interval iterations, in order
  std::vector<Digest> checkpoints;
  uint64_t iterations{0};
  // Node signature over final_state
  Signature signature{};
};

struct ReversalParameters {
  uint64_t iterations{0};
  // Initial transform state of the chunk
  Digest seed{};
  Nonce nonce{};
};

struct ReversalKey {
  Digest transform_key{};
  // Round keys of the byte-position permutation
  crypto::FeistelPermutation::RoundKeys reversal_matrix{};
  Digest original_checksum{};
  ReversalParameters parameters;
};

struct ChunkProof {
  ChunkBinding binding;
  VdfResult vdf;
  // Final state of the previous chunk, or the copy seed for chunk 0
  Digest previous_state{};
};

struct TransformedChunk {
  Bytes mutated_data;
  ReversalKey reversal_key;
  uint32_t chunk_index{0};
  uint32_t copy_index{0};
  ChunkProof proof;
};

struct StorageChallenge {
  uint32_t copy_index{0};
  uint32_t chunk_index{0};
  Nonce challenge_nonce{};
  // Milliseconds since the epoch of the validator clock
  int64_t timestamp{0};
  Signature validator_signature{};
  uint32_t timeout_ms{0};
};

struct ResponseProof {
  Digest server_binding{};
  Signature key_signature{};
  NetworkLocation current_location;
};

struct ChallengeResponse {
  Bytes mutated_data;
  ResponseProof proof;
  int64_t responded_at{0};
};

// Key-location registration record
struct ServerCoinMemo {
  std::string host;
  PublicKey wallet_public_key{};
  uint64_t epoch{0};
  Signature signature{};
};

} // namespace proof
} // namespace pous

#endif // POUS_PROOF_TYPES_HPP
