#include "crypto/key_pair.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <boost/log/trivial.hpp>

namespace pous::crypto {

//=================================================
// RAII WRAPPERS FOR OPENSSL KEY OBJECTS
//=================================================

struct KeyHandle {
  EVP_PKEY* pkey = nullptr;

  explicit KeyHandle(EVP_PKEY* key) : pkey(key) {}

  ~KeyHandle() {
    if (pkey) {
      EVP_PKEY_free(pkey);
    }
  }

  EVP_PKEY* get() { return pkey; }
};

namespace {

struct SignContext {
  EVP_MD_CTX* ctx = nullptr;

  SignContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw CryptoError("Key pair: Failed to create signing context");
    }
  }

  ~SignContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

PublicKey extract_public_key(EVP_PKEY* pkey) {
  PublicKey public_key{};
  size_t length = public_key.size();
  if (!EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &length) || length != PUBLIC_KEY_SIZE) {
    throw KeyError("Failed to extract public key");
  }
  return public_key;
}

} // namespace

//==============================================
// CONSTRUCTION
//==============================================

KeyPair::KeyPair(std::unique_ptr<KeyHandle> handle)
  : handle_(std::move(handle))
  , public_key_(extract_public_key(handle_->get())) {
}

KeyPair::KeyPair(KeyPair&& other) noexcept = default;
KeyPair& KeyPair::operator=(KeyPair&& other) noexcept = default;
KeyPair::~KeyPair() = default;

KeyPair KeyPair::generate() {
  BOOST_LOG_TRIVIAL(debug) << "Key pair: Generating Ed25519 key pair";

  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
  if (!ctx) {
    throw KeyError("Failed to create key generation context");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen_init(ctx) <= 0 || EVP_PKEY_keygen(ctx, &pkey) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    throw KeyError("Failed to generate Ed25519 key");
  }
  EVP_PKEY_CTX_free(ctx);

  return KeyPair(std::make_unique<KeyHandle>(pkey));
}

KeyPair KeyPair::from_private_key(const Bytes& private_key) {
  if (private_key.size() != PRIVATE_KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Key pair: Invalid private key size: " << private_key.size()
                             << " bytes (expected " << PRIVATE_KEY_SIZE << " bytes)";
    throw KeyError("Invalid private key size");
  }

  EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                private_key.data(), private_key.size());
  if (!pkey) {
    throw KeyError("Failed to import Ed25519 private key");
  }
  return KeyPair(std::make_unique<KeyHandle>(pkey));
}

Bytes KeyPair::private_key_bytes() const {
  Bytes raw(PRIVATE_KEY_SIZE);
  size_t length = raw.size();
  if (!EVP_PKEY_get_raw_private_key(handle_->get(), raw.data(), &length) || length != PRIVATE_KEY_SIZE) {
    throw KeyError("Failed to export private key");
  }
  return raw;
}

//==============================================
// SIGNING
//==============================================

Signature KeyPair::sign(const uint8_t* data, size_t size) const {
  SignContext context;

  // Ed25519 is a one-shot scheme, no message digest is configured
  if (EVP_DigestSignInit(context.get(), nullptr, nullptr, nullptr, handle_->get()) <= 0) {
    throw CryptoError("Key pair: Failed to initialize signing");
  }

  Signature signature{};
  size_t signature_length = signature.size();
  if (EVP_DigestSign(context.get(), signature.data(), &signature_length, data, size) <= 0 ||
      signature_length != SIGNATURE_SIZE) {
    throw CryptoError("Key pair: Failed to sign message");
  }
  return signature;
}

Signature KeyPair::sign(const Bytes& message) const {
  return sign(message.data(), message.size());
}

//==============================================
// PERSISTENCE
//==============================================

void KeyPair::save(const std::filesystem::path& path) const {
  BOOST_LOG_TRIVIAL(info) << "Key pair: Saving private key to: " << path.string();

  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    throw KeyError("Failed to open key file for writing: " + path.string());
  }
  file << to_hex(private_key_bytes()) << '\n';
  if (!file.good()) {
    throw KeyError("Failed to write key file: " + path.string());
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace);
}

KeyPair KeyPair::load(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Key pair: Loading private key from: " << path.string();

  std::ifstream file(path);
  if (!file) {
    throw KeyError("Failed to open key file: " + path.string());
  }
  std::string hex;
  file >> hex;
  return from_private_key(from_hex(hex));
}

//==============================================
// VERIFICATION
//==============================================

bool verify_signature(const PublicKey& public_key, const uint8_t* data, size_t size,
                      const Signature& signature) {
  EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               public_key.data(), public_key.size());
  if (!pkey) {
    BOOST_LOG_TRIVIAL(warning) << "Key pair: Rejected malformed public key";
    return false;
  }
  KeyHandle key(pkey);

  try {
    SignContext context;
    if (EVP_DigestVerifyInit(context.get(), nullptr, nullptr, nullptr, key.get()) <= 0) {
      return false;
    }
    return EVP_DigestVerify(context.get(), signature.data(), signature.size(), data, size) == 1;
  }
  catch (const CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Key pair: Verification failed: " << e.what();
    return false;
  }
}

bool verify_signature(const PublicKey& public_key, const Bytes& message, const Signature& signature) {
  return verify_signature(public_key, message.data(), message.size(), signature);
}

void require_valid_signature(const PublicKey& public_key, const Bytes& message,
                             const Signature& signature, const std::string& what) {
  if (!verify_signature(public_key, message, signature)) {
    BOOST_LOG_TRIVIAL(warning) << "Key pair: Signature check failed for " << what;
    throw SignatureInvalidError(what);
  }
}

} // namespace pous::crypto
