#ifndef POUS_CONFIG_PROOF_CONFIG_HPP
#define POUS_CONFIG_PROOF_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace pous {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Parameters shared by the writer (node) and the verifier (validator).
// Both sides must agree on them for proofs to verify.
struct ProofConfig {
  // Chunk planning
  uint32_t standard_chunk_count{60};
  std::chrono::milliseconds target_total_time{60000};

  // Sequential transform
  uint64_t min_iterations{100000};
  uint64_t checkpoint_interval{10000};
  // Checkpoint segments replayed by a verifier on top of the final segment
  uint32_t spot_check_samples{3};

  // Challenge-response
  uint32_t challenge_timeout_ms{5000};

  // Key-location registration
  std::chrono::milliseconds epoch_length{std::chrono::hours(24 * 7)};
  std::string protocol_prefix{"pous/key-location/v1"};

  // Outcomes kept per node for the rolling success rate
  size_t ledger_window{100};

  // ---- PRESETS ----
  static ProofConfig production() { return ProofConfig{}; }

  // Short chains for local testing, same structure as production
  static ProofConfig regtest() {
    ProofConfig config;
    config.standard_chunk_count = 8;
    config.target_total_time = std::chrono::milliseconds(200);
    config.min_iterations = 2000;
    config.checkpoint_interval = 500;
    config.spot_check_samples = 2;
    config.challenge_timeout_ms = 2000;
    return config;
  }

  // ---- VALIDATION ----
  void validate() const {
    if (standard_chunk_count == 0) {
      throw ConfigError("Config: standard_chunk_count must be positive");
    }
    if (target_total_time.count() <= 0) {
      throw ConfigError("Config: target_total_time must be positive");
    }
    if (checkpoint_interval == 0) {
      throw ConfigError("Config: checkpoint_interval must be positive");
    }
    if (min_iterations < checkpoint_interval) {
      throw ConfigError("Config: min_iterations must cover at least one checkpoint interval");
    }
    if (challenge_timeout_ms == 0) {
      throw ConfigError("Config: challenge_timeout_ms must be positive");
    }
    if (epoch_length.count() <= 0) {
      throw ConfigError("Config: epoch_length must be positive");
    }
    if (protocol_prefix.empty()) {
      throw ConfigError("Config: protocol_prefix must not be empty");
    }
    if (ledger_window == 0) {
      throw ConfigError("Config: ledger_window must be positive");
    }
  }
};

} // namespace config
} // namespace pous

#endif // POUS_CONFIG_PROOF_CONFIG_HPP
