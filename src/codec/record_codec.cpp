#include "codec/record_codec.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <sstream>

namespace pous {
namespace codec {

using proof::Bytes;
using proof::Digest;

// Byte sink tracking the number of bytes written
class RecordCodec::Writer {
public:
  explicit Writer(std::ostream& output) : output_(output) {
    if (!output_.good()) {
      BOOST_LOG_TRIVIAL(error) << "RecordCodec: Invalid output stream state";
      throw CodecError("RecordCodec: Invalid output stream");
    }
  }

  void header(RecordType type) {
    u8(static_cast<uint8_t>(type));
    u8(VERSION);
  }

  void write_bytes(const void* data, std::size_t size) {
    if (size == 0) return;
    if (!output_.write(static_cast<const char*>(data), size)) {
      BOOST_LOG_TRIVIAL(error) << "RecordCodec: Failed to write " << size << " bytes to output stream";
      throw CodecError("RecordCodec: Failed to write to output stream");
    }
    total_ += size;
  }

  void u8(uint8_t value) { write_bytes(&value, sizeof(value)); }
  void u16(uint16_t value) {
    uint16_t network_value = boost::endian::native_to_big(value);
    write_bytes(&network_value, sizeof(network_value));
  }
  void u32(uint32_t value) {
    uint32_t network_value = boost::endian::native_to_big(value);
    write_bytes(&network_value, sizeof(network_value));
  }
  void u64(uint64_t value) {
    uint64_t network_value = boost::endian::native_to_big(value);
    write_bytes(&network_value, sizeof(network_value));
  }
  void i64(int64_t value) { u64(static_cast<uint64_t>(value)); }

  template <std::size_t N>
  void fixed(const std::array<uint8_t, N>& value) { write_bytes(value.data(), N); }

  void blob(const void* data, std::size_t size) {
    if (size > MAX_FIELD_SIZE) {
      throw CodecError("RecordCodec: Field of " + std::to_string(size) + " bytes exceeds limit");
    }
    u32(static_cast<uint32_t>(size));
    write_bytes(data, size);
  }
  void blob(const Bytes& value) { blob(value.data(), value.size()); }
  void text(const std::string& value) { blob(value.data(), value.size()); }

  void location(const proof::NetworkLocation& value) {
    text(value.ip);
    u16(value.port);
    u8(value.hostname ? 1 : 0);
    if (value.hostname) text(*value.hostname);
  }

  std::size_t finish() {
    output_.flush();
    return total_;
  }

private:
  std::ostream& output_;
  std::size_t total_{0};
};

// Byte source that fails on truncated input
class RecordCodec::Reader {
public:
  explicit Reader(std::istream& input) : input_(input) {
    if (!input_.good()) {
      BOOST_LOG_TRIVIAL(error) << "RecordCodec: Invalid input stream state";
      throw CodecError("RecordCodec: Invalid input stream");
    }
  }

  void header(RecordType expected) {
    uint8_t type = u8();
    if (type != static_cast<uint8_t>(expected)) {
      BOOST_LOG_TRIVIAL(error) << "RecordCodec: Unexpected record type " << static_cast<int>(type)
                               << ", expected " << static_cast<int>(expected);
      throw CodecError("RecordCodec: Unexpected record type " + std::to_string(type));
    }
    uint8_t version = u8();
    if (version != VERSION) {
      BOOST_LOG_TRIVIAL(error) << "RecordCodec: Unsupported record version " << static_cast<int>(version);
      throw CodecError("RecordCodec: Unsupported record version " + std::to_string(version));
    }
  }

  void read_bytes(void* data, std::size_t size) {
    if (size == 0) return;
    if (!input_.read(static_cast<char*>(data), size)) {
      BOOST_LOG_TRIVIAL(error) << "RecordCodec: Failed to read " << size << " bytes from input stream";
      throw CodecError("RecordCodec: Truncated record");
    }
  }

  uint8_t u8() {
    uint8_t value;
    read_bytes(&value, sizeof(value));
    return value;
  }
  uint16_t u16() {
    uint16_t network_value;
    read_bytes(&network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }
  uint32_t u32() {
    uint32_t network_value;
    read_bytes(&network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }
  uint64_t u64() {
    uint64_t network_value;
    read_bytes(&network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }
  int64_t i64() { return static_cast<int64_t>(u64()); }

  template <std::size_t N>
  void fixed(std::array<uint8_t, N>& value) { read_bytes(value.data(), N); }

  uint32_t field_length() {
    uint32_t length = u32();
    if (length > MAX_FIELD_SIZE) {
      BOOST_LOG_TRIVIAL(error) << "RecordCodec: Field length " << length << " exceeds limit";
      throw CodecError("RecordCodec: Field length exceeds limit");
    }
    return length;
  }
  Bytes blob() {
    Bytes value(field_length());
    read_bytes(value.data(), value.size());
    return value;
  }
  std::string text() {
    std::string value(field_length(), '\0');
    read_bytes(&value[0], value.size());
    return value;
  }

  proof::NetworkLocation location() {
    proof::NetworkLocation value;
    value.ip = text();
    value.port = u16();
    uint8_t has_hostname = u8();
    if (has_hostname > 1) {
      throw CodecError("RecordCodec: Invalid hostname flag");
    }
    if (has_hostname) value.hostname = text();
    return value;
  }

private:
  std::istream& input_;
};


// ---- SERIALIZATION ----

std::size_t RecordCodec::serialize(const proof::TransformedChunk& chunk, std::ostream& output) {
  Writer writer(output);
  writer.header(RecordType::TRANSFORMED_CHUNK);
  writer.u32(chunk.copy_index);
  writer.u32(chunk.chunk_index);
  writer.blob(chunk.mutated_data);

  const proof::ReversalKey& key = chunk.reversal_key;
  writer.fixed(key.transform_key);
  for (uint64_t round_key : key.reversal_matrix) {
    writer.u64(round_key);
  }
  writer.fixed(key.original_checksum);
  writer.u64(key.parameters.iterations);
  writer.fixed(key.parameters.seed);
  writer.fixed(key.parameters.nonce);

  const proof::ChunkProof& proof = chunk.proof;
  writer.fixed(proof.binding.server_binding);
  writer.fixed(proof.binding.key_binding);
  writer.fixed(proof.binding.final_binding);
  writer.fixed(proof.vdf.final_state);
  writer.u64(proof.vdf.iterations);
  writer.fixed(proof.vdf.signature);
  writer.u32(static_cast<uint32_t>(proof.vdf.checkpoints.size()));
  for (const Digest& checkpoint : proof.vdf.checkpoints) {
    writer.fixed(checkpoint);
  }
  writer.fixed(proof.previous_state);

  std::size_t total = writer.finish();
  BOOST_LOG_TRIVIAL(debug) << "RecordCodec: Serialized chunk " << chunk.chunk_index << " of copy "
                           << chunk.copy_index << " (" << total << " bytes)";
  return total;
}

std::size_t RecordCodec::serialize(const proof::StorageChallenge& challenge, std::ostream& output) {
  Writer writer(output);
  writer.header(RecordType::STORAGE_CHALLENGE);
  writer.u32(challenge.copy_index);
  writer.u32(challenge.chunk_index);
  writer.fixed(challenge.challenge_nonce);
  writer.i64(challenge.timestamp);
  writer.u32(challenge.timeout_ms);
  writer.fixed(challenge.validator_signature);
  return writer.finish();
}

std::size_t RecordCodec::serialize(const proof::ChallengeResponse& response, std::ostream& output) {
  Writer writer(output);
  writer.header(RecordType::CHALLENGE_RESPONSE);
  writer.blob(response.mutated_data);
  writer.fixed(response.proof.server_binding);
  writer.fixed(response.proof.key_signature);
  writer.location(response.proof.current_location);
  writer.i64(response.responded_at);
  return writer.finish();
}

std::size_t RecordCodec::serialize(const proof::ServerCoinMemo& memo, std::ostream& output) {
  Writer writer(output);
  writer.header(RecordType::SERVER_COIN_MEMO);
  writer.text(memo.host);
  writer.fixed(memo.wallet_public_key);
  writer.u64(memo.epoch);
  writer.fixed(memo.signature);
  return writer.finish();
}


// ---- DESERIALIZATION ----

proof::TransformedChunk RecordCodec::deserialize_chunk(std::istream& input) {
  Reader reader(input);
  reader.header(RecordType::TRANSFORMED_CHUNK);

  proof::TransformedChunk chunk;
  chunk.copy_index = reader.u32();
  chunk.chunk_index = reader.u32();
  chunk.mutated_data = reader.blob();

  proof::ReversalKey& key = chunk.reversal_key;
  reader.fixed(key.transform_key);
  for (uint64_t& round_key : key.reversal_matrix) {
    round_key = reader.u64();
  }
  reader.fixed(key.original_checksum);
  key.parameters.iterations = reader.u64();
  reader.fixed(key.parameters.seed);
  reader.fixed(key.parameters.nonce);

  proof::ChunkProof& proof = chunk.proof;
  reader.fixed(proof.binding.server_binding);
  reader.fixed(proof.binding.key_binding);
  reader.fixed(proof.binding.final_binding);
  reader.fixed(proof.vdf.final_state);
  proof.vdf.iterations = reader.u64();
  reader.fixed(proof.vdf.signature);
  uint32_t checkpoint_count = reader.u32();
  if (checkpoint_count > MAX_FIELD_SIZE / crypto::DIGEST_SIZE) {
    throw CodecError("RecordCodec: Checkpoint count exceeds limit");
  }
  proof.vdf.checkpoints.resize(checkpoint_count);
  for (Digest& checkpoint : proof.vdf.checkpoints) {
    reader.fixed(checkpoint);
  }
  reader.fixed(proof.previous_state);

  BOOST_LOG_TRIVIAL(debug) << "RecordCodec: Deserialized chunk " << chunk.chunk_index << " of copy "
                           << chunk.copy_index;
  return chunk;
}

proof::StorageChallenge RecordCodec::deserialize_challenge(std::istream& input) {
  Reader reader(input);
  reader.header(RecordType::STORAGE_CHALLENGE);

  proof::StorageChallenge challenge;
  challenge.copy_index = reader.u32();
  challenge.chunk_index = reader.u32();
  reader.fixed(challenge.challenge_nonce);
  challenge.timestamp = reader.i64();
  challenge.timeout_ms = reader.u32();
  reader.fixed(challenge.validator_signature);
  return challenge;
}

proof::ChallengeResponse RecordCodec::deserialize_response(std::istream& input) {
  Reader reader(input);
  reader.header(RecordType::CHALLENGE_RESPONSE);

  proof::ChallengeResponse response;
  response.mutated_data = reader.blob();
  reader.fixed(response.proof.server_binding);
  reader.fixed(response.proof.key_signature);
  response.proof.current_location = reader.location();
  response.responded_at = reader.i64();
  return response;
}

proof::ServerCoinMemo RecordCodec::deserialize_memo(std::istream& input) {
  Reader reader(input);
  reader.header(RecordType::SERVER_COIN_MEMO);

  proof::ServerCoinMemo memo;
  memo.host = reader.text();
  reader.fixed(memo.wallet_public_key);
  memo.epoch = reader.u64();
  reader.fixed(memo.signature);
  return memo;
}


// ---- SIGNING PAYLOADS ----

Bytes RecordCodec::challenge_signing_bytes(const proof::StorageChallenge& challenge) {
  std::ostringstream output(std::ios::binary);
  Writer writer(output);
  writer.header(RecordType::STORAGE_CHALLENGE);
  writer.u32(challenge.copy_index);
  writer.u32(challenge.chunk_index);
  writer.fixed(challenge.challenge_nonce);
  writer.i64(challenge.timestamp);
  writer.u32(challenge.timeout_ms);
  writer.finish();

  const std::string encoded = output.str();
  return Bytes(encoded.begin(), encoded.end());
}

} // namespace codec
} // namespace pous
