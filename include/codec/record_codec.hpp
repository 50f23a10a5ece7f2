#ifndef POUS_CODEC_RECORD_CODEC_HPP
#define POUS_CODEC_RECORD_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include "proof/types.hpp"

namespace pous {
namespace codec {

// Record tag written in front of every encoded record
enum class RecordType : uint8_t {
    TRANSFORMED_CHUNK = 1,
    STORAGE_CHALLENGE = 2,
    CHALLENGE_RESPONSE = 3,
    SERVER_COIN_MEMO = 4
};

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

// Binary encoding of persisted and wire records. Integers are big endian,
// variable-length fields carry a 32-bit length prefix.
class RecordCodec {
public:
  static constexpr uint8_t VERSION = 1;
  // Upper bound for a single length-prefixed field
  static constexpr uint32_t MAX_FIELD_SIZE = 256u * 1024u * 1024u;


  // ---- SERIALIZATION ----
  // Each returns the number of bytes written
  static std::size_t serialize(const proof::TransformedChunk& chunk, std::ostream& output);
  static std::size_t serialize(const proof::StorageChallenge& challenge, std::ostream& output);
  static std::size_t serialize(const proof::ChallengeResponse& response, std::ostream& output);
  static std::size_t serialize(const proof::ServerCoinMemo& memo, std::ostream& output);


  // ---- DESERIALIZATION ----
  // Throw CodecError on a wrong tag, unknown version or truncated input
  static proof::TransformedChunk deserialize_chunk(std::istream& input);
  static proof::StorageChallenge deserialize_challenge(std::istream& input);
  static proof::ChallengeResponse deserialize_response(std::istream& input);
  static proof::ServerCoinMemo deserialize_memo(std::istream& input);


  // ---- SIGNING PAYLOADS ----
  // Challenge fields covered by the validator signature
  static proof::Bytes challenge_signing_bytes(const proof::StorageChallenge& challenge);

private:
  class Writer;
  class Reader;
};

} // namespace codec
} // namespace pous

#endif // POUS_CODEC_RECORD_CODEC_HPP
