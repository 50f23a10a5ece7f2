#ifndef POUS_CRYPTO_KEY_PAIR_HPP
#define POUS_CRYPTO_KEY_PAIR_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include "crypto/hash.hpp"

namespace pous::crypto {

static constexpr size_t PUBLIC_KEY_SIZE = 32;   // Ed25519
static constexpr size_t PRIVATE_KEY_SIZE = 32;  // Ed25519 seed
static constexpr size_t SIGNATURE_SIZE = 64;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

// Forward declaration for OpenSSL key handle
struct KeyHandle;

// Ed25519 key pair. Move-only: the private key stays inside this object
// and is only exported explicitly for persistence.
class KeyPair {
public:
  // ---- CONSTRUCTION ----
  static KeyPair generate();
  // Rebuilds a key pair from a raw 32-byte private key
  static KeyPair from_private_key(const Bytes& private_key);
  // Loads a hex encoded private key written by save()
  static KeyPair load(const std::filesystem::path& path);

  KeyPair(KeyPair&& other) noexcept;
  KeyPair& operator=(KeyPair&& other) noexcept;
  ~KeyPair();

  KeyPair(const KeyPair&) = delete;
  KeyPair& operator=(const KeyPair&) = delete;


  // ---- SIGNING ----
  Signature sign(const Bytes& message) const;
  Signature sign(const uint8_t* data, size_t size) const;


  // ---- GETTERS ----
  const PublicKey& public_key() const { return public_key_; }
  Bytes private_key_bytes() const;


  // ---- PERSISTENCE ----
  void save(const std::filesystem::path& path) const;

private:
  std::unique_ptr<KeyHandle> handle_;
  PublicKey public_key_{};

  explicit KeyPair(std::unique_ptr<KeyHandle> handle);
};

// ---- VERIFICATION ----
// Returns false on any verification failure, including malformed keys
bool verify_signature(const PublicKey& public_key, const Bytes& message, const Signature& signature);
bool verify_signature(const PublicKey& public_key, const uint8_t* data, size_t size,
                      const Signature& signature);
// Throws SignatureInvalidError when the signature does not verify
void require_valid_signature(const PublicKey& public_key, const Bytes& message,
                             const Signature& signature, const std::string& what);

} // namespace pous::crypto

#endif // POUS_CRYPTO_KEY_PAIR_HPP
