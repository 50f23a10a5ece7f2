#ifndef POUS_CRYPTO_KEYSTREAM_CIPHER_HPP
#define POUS_CRYPTO_KEYSTREAM_CIPHER_HPP

#include <array>
#include <memory>
#include "crypto/hash.hpp"

namespace pous::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-CTR keystream. Applying the cipher twice with the same key and IV
// restores the input, so one operation serves both directions.
class KeystreamCipher {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128-bit counter block

  using Iv = std::array<uint8_t, IV_SIZE>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  KeystreamCipher();
  ~KeystreamCipher();

  KeystreamCipher(const KeystreamCipher&) = delete;
  KeystreamCipher& operator=(const KeystreamCipher&) = delete;


  // ---- INITIALIZATION ----
  void initialize(const Digest& key, const Iv& iv);


  // ---- KEYSTREAM OPERATIONS ----
  // XORs the keystream into data, starting at counter block zero
  void apply_in_place(Bytes& data);
  Bytes apply(const Bytes& data);

private:
  std::unique_ptr<CipherContext> context_;
  Digest key_{};
  Iv iv_{};
  bool is_initialized_ = false;
};

} // namespace pous::crypto

#endif // POUS_CRYPTO_KEYSTREAM_CIPHER_HPP
