#include "validator/key_location.hpp"
#include "crypto/crypto_error.hpp"
#include "proof/proof_error.hpp"
#include <algorithm>
#include <cctype>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace pous {
namespace validator {

namespace {

std::string normalize_host(const std::string& host) {
  std::string normalized = host;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}

} // namespace

proof::Bytes memo_signing_bytes(const proof::PublicKey& public_key, const std::string& host, uint64_t epoch,
                                const std::string& protocol_prefix) {
  proof::Bytes message(public_key.begin(), public_key.end());
  const std::string normalized = normalize_host(host);
  message.insert(message.end(), normalized.begin(), normalized.end());

  uint64_t network_epoch = boost::endian::native_to_big(epoch);
  const uint8_t* epoch_bytes = reinterpret_cast<const uint8_t*>(&network_epoch);
  message.insert(message.end(), epoch_bytes, epoch_bytes + sizeof(network_epoch));

  message.insert(message.end(), protocol_prefix.begin(), protocol_prefix.end());
  return message;
}

proof::ServerCoinMemo make_server_coin_memo(const crypto::KeyPair& key_pair, const std::string& host,
                                            uint64_t epoch, const std::string& protocol_prefix) {
  proof::ServerCoinMemo memo;
  memo.host = normalize_host(host);
  memo.wallet_public_key = key_pair.public_key();
  memo.epoch = epoch;
  memo.signature = key_pair.sign(memo_signing_bytes(memo.wallet_public_key, memo.host, epoch, protocol_prefix));
  return memo;
}

bool verify_server_coin_memo(const proof::ServerCoinMemo& memo, const std::string& protocol_prefix) {
  return crypto::verify_signature(memo.wallet_public_key,
                                  memo_signing_bytes(memo.wallet_public_key, memo.host, memo.epoch, protocol_prefix),
                                  memo.signature);
}

uint64_t current_epoch(const Clock& clock, std::chrono::milliseconds epoch_length) {
  int64_t now = clock.now_ms();
  if (now < 0 || epoch_length.count() <= 0) {
    return 0;
  }
  return static_cast<uint64_t>(now / epoch_length.count());
}


//==============================================
// KEY-LOCATION REGISTRY
//==============================================

KeyLocationRegistry::KeyLocationRegistry(std::string protocol_prefix)
  : protocol_prefix_(std::move(protocol_prefix)) {}

void KeyLocationRegistry::register_memo(const proof::ServerCoinMemo& memo, uint64_t current_epoch) {
  if (memo.epoch != current_epoch) {
    BOOST_LOG_TRIVIAL(warning) << "KeyLocationRegistry: Rejected memo for " << memo.host << " from epoch "
                               << memo.epoch << ", current epoch is " << current_epoch;
    throw proof::StaleEpochError("memo epoch " + std::to_string(memo.epoch) + ", current " +
                                 std::to_string(current_epoch));
  }
  if (!verify_server_coin_memo(memo, protocol_prefix_)) {
    BOOST_LOG_TRIVIAL(warning) << "KeyLocationRegistry: Rejected memo for " << memo.host << ": bad signature";
    throw crypto::SignatureInvalidError("server coin memo for " + memo.host);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  entries_.insert(make_entry(memo.wallet_public_key, memo.host, memo.epoch));
  BOOST_LOG_TRIVIAL(info) << "KeyLocationRegistry: Registered " << crypto::to_hex(memo.wallet_public_key).substr(0, 12)
                          << " at " << memo.host << " for epoch " << memo.epoch;
}

bool KeyLocationRegistry::is_registered(const proof::PublicKey& public_key, const std::string& host,
                                        uint64_t epoch) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(make_entry(public_key, host, epoch)) > 0;
}

size_t KeyLocationRegistry::prune(uint64_t current_epoch) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (std::get<2>(*it) < current_epoch) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

KeyLocationRegistry::Entry KeyLocationRegistry::make_entry(const proof::PublicKey& public_key,
                                                           const std::string& host, uint64_t epoch) {
  return Entry(crypto::to_hex(public_key), normalize_host(host), epoch);
}

} // namespace validator
} // namespace pous
