#ifndef POUS_VALIDATOR_CHALLENGE_VALIDATOR_HPP
#define POUS_VALIDATOR_CHALLENGE_VALIDATOR_HPP

#include <cstdint>
#include <functional>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "config/proof_config.hpp"
#include "proof/copy_builder.hpp"
#include "proof/types.hpp"
#include "validator/clock.hpp"
#include "validator/outcome_ledger.hpp"

namespace pous {
namespace validator {

// What the validator knows about a node before challenging it
struct NodeRecord {
  proof::PublicKey public_key{};
  proof::NetworkLocation expected_location;
  // Mutated-chunk digests per copy index, from the node's manifests
  std::map<uint32_t, std::vector<proof::Digest>> commitments;
};

// A response as received by the validator
struct ValidationContext {
  std::string node_id;
  proof::StorageChallenge challenge;
  proof::ChallengeResponse response;
  // Validator clock when the response arrived
  int64_t received_at{0};
};

using Responder = std::function<proof::ChallengeResponse(const proof::StorageChallenge&)>;

// Challenge signature check run by nodes before answering
bool verify_challenge_signature(const proof::StorageChallenge& challenge, const proof::PublicKey& validator_key);

// Issues signed storage challenges and judges the responses. Each challenge
// moves Issued -> AwaitingResponse -> Verified | TimedOut | Failed and its
// nonce is accepted once. Outcomes are recorded in the owned ledger.
class ChallengeValidator {
public:
  ChallengeValidator(const config::ProofConfig& config, crypto::KeyPair key, const Clock& clock);
  // Waits for responders still running after their deadline
  ~ChallengeValidator();

  ChallengeValidator(const ChallengeValidator&) = delete;
  ChallengeValidator& operator=(const ChallengeValidator&) = delete;

  // ---- NODE REGISTRATION ----
  // Returns the node id
  std::string register_node(const proof::PublicKey& public_key, const proof::NetworkLocation& expected_location);
  // Records the chunk commitments of a built copy. Throws std::invalid_argument
  // for an unknown node.
  void register_copy(const proof::CopyManifest& manifest);
  bool is_registered(const std::string& node_id) const;


  // ---- CHALLENGES ----
  // Picks a copy and chunk uniformly at random. Throws std::invalid_argument
  // for an unknown node or a zero count.
  proof::StorageChallenge issue_challenge(const std::string& node_id, uint32_t total_copies, uint32_t chunks_per_copy);

  // Checks timing, location, binding, signature, nonce freshness and the
  // commitment if one is held. Any failure yields false. Consumes the nonce
  // and records the outcome.
  bool validate_challenge_response(const ValidationContext& context);

  // Sends the challenge to responder on a worker thread and waits at most
  // timeout_ms of real time for it. Elapsed time is measured on the injected
  // clock. A late, missing or failing response is not verified. A responder
  // that overruns keeps its thread until it returns, and the validator joins
  // it on destruction, so whatever the responder references must outlive
  // the validator.
  ChallengeOutcome run_challenge(const std::string& node_id, const proof::StorageChallenge& challenge,
                                 const Responder& responder);

  // Status of a challenge still in flight; nullopt once resolved or unknown
  std::optional<ChallengeStatus> status(const proof::Nonce& nonce) const;


  // ---- GETTERS ----
  const proof::PublicKey& public_key() const { return key_.public_key(); }
  OutcomeLedger& ledger() { return ledger_; }
  const OutcomeLedger& ledger() const { return ledger_; }

private:
  struct PendingChallenge {
    std::string node_id;
    proof::StorageChallenge challenge;
    ChallengeStatus status{ChallengeStatus::Issued};
  };

  config::ProofConfig config_;
  crypto::KeyPair key_;
  const Clock& clock_;
  OutcomeLedger ledger_;

  mutable std::mutex mutex_;
  std::map<std::string, NodeRecord> nodes_;
  std::map<std::string, PendingChallenge> pending_;
  std::mt19937_64 rng_;

  struct StalledResponder {
    std::thread worker;
    std::shared_ptr<std::atomic<bool>> finished;
  };
  std::mutex stalled_mutex_;
  std::vector<StalledResponder> stalled_;

  // Joins stalled responders that have since returned
  void reap_stalled();

  // Removes the pending entry and judges the response
  ChallengeOutcome evaluate(const ValidationContext& context);
  void check_response(const ValidationContext& context, const NodeRecord& node,
                      const PendingChallenge& pending) const;
  ChallengeOutcome resolve(const std::string& node_id, const proof::Nonce& nonce, ChallengeStatus status,
                           int64_t elapsed_ms, const std::string& reason);
};

} // namespace validator
} // namespace pous

#endif // POUS_VALIDATOR_CHALLENGE_VALIDATOR_HPP
