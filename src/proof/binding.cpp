#include "proof/binding.hpp"
#include "proof/proof_error.hpp"
#include <boost/log/trivial.hpp>

namespace pous::proof {

namespace {

Bytes key_binding_message(const Digest& server_binding, const Bytes& chunk_data) {
  Bytes message;
  message.reserve(server_binding.size() + chunk_data.size());
  message.insert(message.end(), server_binding.begin(), server_binding.end());
  message.insert(message.end(), chunk_data.begin(), chunk_data.end());
  return message;
}

Digest final_binding_of(const Digest& server_binding, const Signature& key_binding) {
  crypto::Hasher hasher;
  return hasher.update(server_binding).update(key_binding.data(), key_binding.size()).finalize();
}

} // namespace

Digest bind_to_location(const Bytes& data, const NetworkLocation& location) {
  crypto::Hasher hasher;
  return hasher.update(location.canonical_encoding()).update(data).finalize();
}

ChunkBinding create_chunk_bindings(const Bytes& chunk_data, const NodeIdentity& identity) {
  ChunkBinding binding;
  binding.server_binding = bind_to_location(chunk_data, identity.location);
  binding.key_binding = identity.key_pair.sign(key_binding_message(binding.server_binding, chunk_data));
  binding.final_binding = final_binding_of(binding.server_binding, binding.key_binding);

  BOOST_LOG_TRIVIAL(trace) << "Binding: Created bindings for " << chunk_data.size() << " bytes at "
                           << identity.location.to_string() << ", final "
                           << crypto::to_hex(binding.final_binding);
  return binding;
}

void verify_chunk_bindings(const Bytes& chunk_data, const ChunkBinding& binding,
                           const NetworkLocation& location, const PublicKey& public_key) {
  if (bind_to_location(chunk_data, location) != binding.server_binding) {
    BOOST_LOG_TRIVIAL(warning) << "Binding: Server binding does not match location " << location.to_string();
    throw BindingMismatchError("server binding does not match data and location");
  }

  crypto::require_valid_signature(public_key, key_binding_message(binding.server_binding, chunk_data),
                                  binding.key_binding, "key binding");

  if (final_binding_of(binding.server_binding, binding.key_binding) != binding.final_binding) {
    throw BindingMismatchError("final binding does not match server and key bindings");
  }
}

} // namespace pous::proof
