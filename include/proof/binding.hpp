#ifndef POUS_PROOF_BINDING_HPP
#define POUS_PROOF_BINDING_HPP

#include "proof/types.hpp"

namespace pous::proof {

// serverBinding = SHA-256(canonical(location) || data)
Digest bind_to_location(const Bytes& data, const NetworkLocation& location);

// Derives the server, key and final bindings of a chunk:
//   server = SHA-256(canonical(location) || chunk)
//   key    = Sign(private key, server || chunk)
//   final  = SHA-256(server || key)
// Ed25519 signatures are deterministic, so the result is reproducible.
ChunkBinding create_chunk_bindings(const Bytes& chunk_data, const NodeIdentity& identity);

// Recomputes and checks all three bindings for a claimed location and key.
// Throws BindingMismatchError or crypto::SignatureInvalidError.
void verify_chunk_bindings(const Bytes& chunk_data, const ChunkBinding& binding,
                           const NetworkLocation& location, const PublicKey& public_key);

} // namespace pous::proof

#endif // POUS_PROOF_BINDING_HPP
