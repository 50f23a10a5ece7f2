#ifndef POUS_CRYPTO_ERROR_HPP
#define POUS_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pous::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class KeyError : public CryptoError {
public:
    explicit KeyError(const std::string& message) 
        : CryptoError("Key error: " + message) {}
};

class CipherError : public CryptoError {
public:
    explicit CipherError(const std::string& message) 
        : CryptoError("Cipher error: " + message) {}
};

// Raised when a signature does not verify under the claimed public key
class SignatureInvalidError : public CryptoError {
public:
    explicit SignatureInvalidError(const std::string& message) 
        : CryptoError("Signature invalid: " + message) {}
};

} // namespace pous::crypto

#endif // POUS_CRYPTO_ERROR_HPP
