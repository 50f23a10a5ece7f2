#ifndef POUS_VALIDATOR_OUTCOME_LEDGER_HPP
#define POUS_VALIDATOR_OUTCOME_LEDGER_HPP

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pous {
namespace validator {

enum class ChallengeStatus {
  Issued,
  AwaitingResponse,
  Verified,
  TimedOut,
  Failed
};

const char* to_string(ChallengeStatus status);

struct ChallengeOutcome {
  std::string node_id;
  // Hex challenge nonce
  std::string nonce;
  ChallengeStatus status{ChallengeStatus::Issued};
  int64_t elapsed_ms{0};
  // Empty when verified
  std::string reason;
};

// Rolling per-node record of finished challenges, read by reward accounting
class OutcomeLedger {
public:
  explicit OutcomeLedger(size_t window);

  // Only terminal outcomes (Verified, TimedOut, Failed) are accepted
  void record(const ChallengeOutcome& outcome);

  // Verified share of the last `window` outcomes; nullopt without history
  std::optional<double> success_rate(const std::string& node_id) const;
  // Oldest first
  std::vector<ChallengeOutcome> history(const std::string& node_id) const;
  size_t window() const { return window_; }

private:
  size_t window_;
  mutable std::mutex mutex_;
  std::map<std::string, std::deque<ChallengeOutcome>> outcomes_;
};

} // namespace validator
} // namespace pous

#endif // POUS_VALIDATOR_OUTCOME_LEDGER_HPP
