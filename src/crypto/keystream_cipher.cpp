#include "crypto/keystream_cipher.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace pous::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CipherError("Keystream: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

KeystreamCipher::KeystreamCipher() : context_(std::make_unique<CipherContext>()) {
}

KeystreamCipher::~KeystreamCipher() = default;

//==============================================
// INITIALIZATION
//==============================================

void KeystreamCipher::initialize(const Digest& key, const Iv& iv) {
  key_ = key;
  iv_ = iv;
  is_initialized_ = true;
}

//==============================================
// KEYSTREAM OPERATIONS
//==============================================

void KeystreamCipher::apply_in_place(Bytes& data) {
  if (!is_initialized_) {
    throw CipherError("Keystream: cipher not initialized");
  }
  if (data.empty()) {
    return;
  }

  // Every call starts from the first counter block
  EVP_CIPHER_CTX_reset(context_->get());
  if (!EVP_EncryptInit_ex(context_->get(), EVP_aes_256_ctr(), nullptr, key_.data(), iv_.data())) {
    throw CipherError("Keystream: Failed to initialize AES-256-CTR context");
  }

  // CTR mode is a stream mode, so the output length always equals the input length
  int outlen = 0;
  if (!EVP_EncryptUpdate(context_->get(), data.data(), &outlen,
                         data.data(), static_cast<int>(data.size())) ||
      static_cast<size_t>(outlen) != data.size()) {
    throw CipherError("Keystream: Failed to apply keystream");
  }

  int final_len = 0;
  if (!EVP_EncryptFinal_ex(context_->get(), data.data() + outlen, &final_len) || final_len != 0) {
    throw CipherError("Keystream: Failed to finalize keystream");
  }

  BOOST_LOG_TRIVIAL(trace) << "Keystream: Applied keystream to " << data.size() << " bytes";
}

Bytes KeystreamCipher::apply(const Bytes& data) {
  Bytes output = data;
  apply_in_place(output);
  return output;
}

} // namespace pous::crypto
