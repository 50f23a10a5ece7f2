#ifndef POUS_CRYPTO_HASH_HPP
#define POUS_CRYPTO_HASH_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace pous::crypto {

using Bytes = std::vector<uint8_t>;

static constexpr size_t DIGEST_SIZE = 32;  // SHA-256
using Digest = std::array<uint8_t, DIGEST_SIZE>;

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over OpenSSL EVP. The context is reused across
// finalize() calls, which keeps the hot loop of the VDF free of allocations.
class Hasher {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Hasher();
  ~Hasher();

  Hasher(const Hasher&) = delete;
  Hasher& operator=(const Hasher&) = delete;


  // ---- HASHING OPERATIONS ----
  Hasher& update(const void* data, size_t size);
  Hasher& update(const Bytes& data) { return update(data.data(), data.size()); }
  Hasher& update(const Digest& data) { return update(data.data(), data.size()); }
  Hasher& update(const std::string& data) { return update(data.data(), data.size()); }
  // Writes the digest and resets the context for the next message
  Digest finalize();

private:
  std::unique_ptr<DigestContext> context_;

  void reset();
};

// ---- ONE-SHOT HELPERS ----
Digest sha256(const void* data, size_t size);
Digest sha256(const Bytes& data);

// ---- HEX CONVERSION ----
std::string to_hex(const uint8_t* data, size_t size);
template<size_t N>
std::string to_hex(const std::array<uint8_t, N>& data) { return to_hex(data.data(), N); }
inline std::string to_hex(const Bytes& data) { return to_hex(data.data(), data.size()); }
// Throws CryptoError on odd length or non-hex characters
Bytes from_hex(const std::string& hex);

// Cryptographically secure random bytes from OpenSSL's RAND_bytes
Bytes random_bytes(size_t size);

} // namespace pous::crypto

#endif // POUS_CRYPTO_HASH_HPP
