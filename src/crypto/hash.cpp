#include "crypto/hash.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace pous::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;
  EVP_MD* md = nullptr;

  // Fetch SHA-256 once and create a reusable context
  DigestContext() {
    md = EVP_MD_fetch(nullptr, "SHA256", nullptr);
    if (!md) {
      throw CryptoError("Hash: Failed to fetch SHA-256 implementation");
    }
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      EVP_MD_free(md);
      throw CryptoError("Hash: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
    if (md) {
      EVP_MD_free(md);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Hasher::Hasher() : context_(std::make_unique<DigestContext>()) {
  reset();
}

Hasher::~Hasher() = default;

void Hasher::reset() {
  if (!EVP_DigestInit_ex(context_->get(), context_->md, nullptr)) {
    throw CryptoError("Hash: Failed to initialize hash context");
  }
}

//==============================================
// HASHING OPERATIONS
//==============================================

Hasher& Hasher::update(const void* data, size_t size) {
  if (size == 0) {
    return *this;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw CryptoError("Hash: Failed to update hash");
  }
  return *this;
}

Digest Hasher::finalize() {
  Digest digest;
  unsigned int length = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest.data(), &length) || length != DIGEST_SIZE) {
    throw CryptoError("Hash: Failed to finalize hash");
  }
  reset();
  return digest;
}

Digest sha256(const void* data, size_t size) {
  Hasher hasher;
  return hasher.update(data, size).finalize();
}

Digest sha256(const Bytes& data) {
  return sha256(data.data(), data.size());
}

//==============================================
// HEX CONVERSION
//==============================================

std::string to_hex(const uint8_t* data, size_t size) {
  std::stringstream ss;
  for (size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') 
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

Bytes from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw CryptoError("Hash: Hex string has odd length");
  }

  auto nibble = [](char c) -> uint8_t {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw CryptoError(std::string("Hash: Invalid hex character: ") + c);
  };

  Bytes result;
  result.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    result.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
  }
  return result;
}

Bytes random_bytes(size_t size) {
  Bytes result(size);
  if (size > 0 && RAND_bytes(result.data(), static_cast<int>(size)) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Hash: RAND_bytes failed for " << size << " bytes";
    throw CryptoError("Hash: Failed to generate random bytes");
  }
  return result;
}

} // namespace pous::crypto
