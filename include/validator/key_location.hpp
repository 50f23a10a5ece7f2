#ifndef POUS_VALIDATOR_KEY_LOCATION_HPP
#define POUS_VALIDATOR_KEY_LOCATION_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include "proof/types.hpp"
#include "validator/clock.hpp"

namespace pous {
namespace validator {

// Bytes covered by a memo signature: public key || host || BE64 epoch || prefix
proof::Bytes memo_signing_bytes(const proof::PublicKey& public_key, const std::string& host, uint64_t epoch,
                                const std::string& protocol_prefix);

// Signed key-location record for host in epoch
proof::ServerCoinMemo make_server_coin_memo(const crypto::KeyPair& key_pair, const std::string& host,
                                            uint64_t epoch, const std::string& protocol_prefix);

bool verify_server_coin_memo(const proof::ServerCoinMemo& memo, const std::string& protocol_prefix);

// Index of the epoch containing clock.now_ms()
uint64_t current_epoch(const Clock& clock, std::chrono::milliseconds epoch_length);

// Registered (key, host, epoch) triples. A unique-content proof is only
// trusted for a key and host registered in the current epoch.
class KeyLocationRegistry {
public:
  explicit KeyLocationRegistry(std::string protocol_prefix);

  // Throws StaleEpochError when memo.epoch != current_epoch and
  // SignatureInvalidError for a bad signature
  void register_memo(const proof::ServerCoinMemo& memo, uint64_t current_epoch);
  bool is_registered(const proof::PublicKey& public_key, const std::string& host, uint64_t epoch) const;
  // Drops registrations older than current_epoch
  size_t prune(uint64_t current_epoch);

  const std::string& protocol_prefix() const { return protocol_prefix_; }

private:
  using Entry = std::tuple<std::string, std::string, uint64_t>;

  std::string protocol_prefix_;
  mutable std::mutex mutex_;
  std::set<Entry> entries_;

  static Entry make_entry(const proof::PublicKey& public_key, const std::string& host, uint64_t epoch);
};

} // namespace validator
} // namespace pous

#endif // POUS_VALIDATOR_KEY_LOCATION_HPP
