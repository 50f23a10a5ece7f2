#include "validator/outcome_ledger.hpp"
#include "config/proof_config.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace pous {
namespace validator {

const char* to_string(ChallengeStatus status) {
  switch (status) {
    case ChallengeStatus::Issued: return "Issued";
    case ChallengeStatus::AwaitingResponse: return "AwaitingResponse";
    case ChallengeStatus::Verified: return "Verified";
    case ChallengeStatus::TimedOut: return "TimedOut";
    case ChallengeStatus::Failed: return "Failed";
  }
  return "Unknown";
}

OutcomeLedger::OutcomeLedger(size_t window) : window_(window) {
  if (window_ == 0) {
    throw config::ConfigError("OutcomeLedger: window must be positive");
  }
}

void OutcomeLedger::record(const ChallengeOutcome& outcome) {
  if (outcome.status == ChallengeStatus::Issued || outcome.status == ChallengeStatus::AwaitingResponse) {
    throw std::invalid_argument(std::string("OutcomeLedger: Not a terminal status: ") + to_string(outcome.status));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto& entries = outcomes_[outcome.node_id];
  entries.push_back(outcome);
  while (entries.size() > window_) {
    entries.pop_front();
  }
  BOOST_LOG_TRIVIAL(debug) << "OutcomeLedger: " << outcome.node_id.substr(0, 12) << " "
                           << to_string(outcome.status) << " in " << outcome.elapsed_ms << " ms";
}

std::optional<double> OutcomeLedger::success_rate(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = outcomes_.find(node_id);
  if (it == outcomes_.end() || it->second.empty()) {
    return std::nullopt;
  }
  auto verified = std::count_if(it->second.begin(), it->second.end(), [](const ChallengeOutcome& outcome) {
    return outcome.status == ChallengeStatus::Verified;
  });
  return static_cast<double>(verified) / static_cast<double>(it->second.size());
}

std::vector<ChallengeOutcome> OutcomeLedger::history(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = outcomes_.find(node_id);
  if (it == outcomes_.end()) {
    return {};
  }
  return std::vector<ChallengeOutcome>(it->second.begin(), it->second.end());
}

} // namespace validator
} // namespace pous
