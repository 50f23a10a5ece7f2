#include "validator/challenge_validator.hpp"
#include "codec/record_codec.hpp"
#include "crypto/crypto_error.hpp"
#include "proof/binding.hpp"
#include "proof/proof_error.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <future>
#include <stdexcept>
#include <thread>
#include <boost/log/trivial.hpp>

namespace pous {
namespace validator {

namespace {

uint64_t random_seed() {
  crypto::Bytes seed_bytes = crypto::random_bytes(sizeof(uint64_t));
  uint64_t seed;
  std::memcpy(&seed, seed_bytes.data(), sizeof(seed));
  return seed;
}

bool same_challenge(const proof::StorageChallenge& a, const proof::StorageChallenge& b) {
  return a.copy_index == b.copy_index && a.chunk_index == b.chunk_index && a.challenge_nonce == b.challenge_nonce &&
         a.timestamp == b.timestamp && a.timeout_ms == b.timeout_ms && a.validator_signature == b.validator_signature;
}

} // namespace

bool verify_challenge_signature(const proof::StorageChallenge& challenge, const proof::PublicKey& validator_key) {
  return crypto::verify_signature(validator_key, codec::RecordCodec::challenge_signing_bytes(challenge),
                                  challenge.validator_signature);
}

//==============================================
// CONSTRUCTOR
//==============================================

ChallengeValidator::ChallengeValidator(const config::ProofConfig& config, crypto::KeyPair key, const Clock& clock)
  : config_(config)
  , key_(std::move(key))
  , clock_(clock)
  , ledger_(config.ledger_window)
  , rng_(random_seed()) {
  config_.validate();
  BOOST_LOG_TRIVIAL(info) << "ChallengeValidator: Initialized with timeout " << config_.challenge_timeout_ms << " ms";
}

ChallengeValidator::~ChallengeValidator() {
  std::lock_guard<std::mutex> lock(stalled_mutex_);
  if (!stalled_.empty()) {
    BOOST_LOG_TRIVIAL(info) << "ChallengeValidator: Waiting for " << stalled_.size() << " overdue responders";
  }
  for (StalledResponder& stalled : stalled_) {
    if (stalled.worker.joinable()) {
      stalled.worker.join();
    }
  }
}


//==============================================
// NODE REGISTRATION
//==============================================

std::string ChallengeValidator::register_node(const proof::PublicKey& public_key,
                                              const proof::NetworkLocation& expected_location) {
  // Rejects an unparsable address up front
  expected_location.canonical_encoding();

  std::string node_id = proof::node_id_for(public_key);
  std::lock_guard<std::mutex> lock(mutex_);
  NodeRecord& record = nodes_[node_id];
  if (record.public_key != public_key || record.expected_location != expected_location) {
    // New key or location: earlier commitments no longer apply
    record.commitments.clear();
  }
  record.public_key = public_key;
  record.expected_location = expected_location;
  BOOST_LOG_TRIVIAL(info) << "ChallengeValidator: Registered node " << node_id.substr(0, 12) << " at "
                          << expected_location.to_string();
  return node_id;
}

void ChallengeValidator::register_copy(const proof::CopyManifest& manifest) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(manifest.node_id);
  if (it == nodes_.end()) {
    throw std::invalid_argument("ChallengeValidator: Unknown node " + manifest.node_id);
  }
  it->second.commitments[manifest.copy_index] = manifest.commitments;
  BOOST_LOG_TRIVIAL(debug) << "ChallengeValidator: Recorded " << manifest.commitments.size()
                           << " commitments for copy " << manifest.copy_index;
}

bool ChallengeValidator::is_registered(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.count(node_id) > 0;
}


//==============================================
// CHALLENGES
//==============================================

proof::StorageChallenge ChallengeValidator::issue_challenge(const std::string& node_id, uint32_t total_copies,
                                                            uint32_t chunks_per_copy) {
  if (total_copies == 0 || chunks_per_copy == 0) {
    throw std::invalid_argument("ChallengeValidator: Copy and chunk counts must be positive");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (nodes_.count(node_id) == 0) {
    throw std::invalid_argument("ChallengeValidator: Unknown node " + node_id);
  }

  proof::StorageChallenge challenge;
  challenge.copy_index = std::uniform_int_distribution<uint32_t>(0, total_copies - 1)(rng_);
  challenge.chunk_index = std::uniform_int_distribution<uint32_t>(0, chunks_per_copy - 1)(rng_);
  crypto::Bytes nonce = crypto::random_bytes(proof::NONCE_SIZE);
  std::copy(nonce.begin(), nonce.end(), challenge.challenge_nonce.begin());
  challenge.timestamp = clock_.now_ms();
  challenge.timeout_ms = config_.challenge_timeout_ms;
  challenge.validator_signature = key_.sign(codec::RecordCodec::challenge_signing_bytes(challenge));

  pending_[crypto::to_hex(challenge.challenge_nonce)] = PendingChallenge{node_id, challenge, ChallengeStatus::Issued};
  BOOST_LOG_TRIVIAL(info) << "ChallengeValidator: Issued challenge for copy " << challenge.copy_index << " chunk "
                          << challenge.chunk_index << " to node " << node_id.substr(0, 12);
  return challenge;
}

bool ChallengeValidator::validate_challenge_response(const ValidationContext& context) {
  return evaluate(context).status == ChallengeStatus::Verified;
}

ChallengeOutcome ChallengeValidator::run_challenge(const std::string& node_id,
                                                   const proof::StorageChallenge& challenge,
                                                   const Responder& responder) {
  const std::string nonce_hex = crypto::to_hex(challenge.challenge_nonce);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(nonce_hex);
    if (it == pending_.end() || it->second.node_id != node_id) {
      return resolve(node_id, challenge.challenge_nonce, ChallengeStatus::Failed, 0,
                     "challenge was not issued to this node or was already answered");
    }
    it->second.status = ChallengeStatus::AwaitingResponse;
  }

  auto task = std::make_shared<std::packaged_task<proof::ChallengeResponse()>>(
    [responder, challenge]() { return responder(challenge); });
  std::future<proof::ChallengeResponse> response = task->get_future();
  auto finished = std::make_shared<std::atomic<bool>>(false);
  std::thread worker([task, finished]() {
    (*task)();
    finished->store(true);
  });

  ValidationContext context;
  context.node_id = node_id;
  context.challenge = challenge;

  if (response.wait_for(std::chrono::milliseconds(challenge.timeout_ms)) != std::future_status::ready) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_.erase(nonce_hex);
    }
    reap_stalled();
    {
      // Kept until it returns, the deadline does not wait for it
      std::lock_guard<std::mutex> lock(stalled_mutex_);
      stalled_.push_back(StalledResponder{std::move(worker), finished});
    }
    return resolve(node_id, challenge.challenge_nonce, ChallengeStatus::TimedOut,
                   clock_.now_ms() - challenge.timestamp, "no response within " +
                   std::to_string(challenge.timeout_ms) + " ms");
  }

  // Ready result: the worker is about to return
  worker.join();

  try {
    context.response = response.get();
  } catch (const std::exception& e) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_.erase(nonce_hex);
    }
    return resolve(node_id, challenge.challenge_nonce, ChallengeStatus::Failed,
                   clock_.now_ms() - challenge.timestamp, std::string("node failed to respond: ") + e.what());
  }
  context.received_at = clock_.now_ms();
  return evaluate(context);
}

void ChallengeValidator::reap_stalled() {
  std::lock_guard<std::mutex> lock(stalled_mutex_);
  auto done = std::partition(stalled_.begin(), stalled_.end(),
                             [](const StalledResponder& stalled) { return !stalled.finished->load(); });
  for (auto it = done; it != stalled_.end(); ++it) {
    it->worker.join();
  }
  stalled_.erase(done, stalled_.end());
}

std::optional<ChallengeStatus> ChallengeValidator::status(const proof::Nonce& nonce) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(crypto::to_hex(nonce));
  if (it == pending_.end()) {
    return std::nullopt;
  }
  return it->second.status;
}


//==============================================
// VERIFICATION
//==============================================

ChallengeOutcome ChallengeValidator::evaluate(const ValidationContext& context) {
  const proof::Nonce& nonce = context.challenge.challenge_nonce;
  PendingChallenge pending;
  NodeRecord node;
  bool known_challenge = false;
  bool known_node = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(crypto::to_hex(nonce));
    if (it != pending_.end() && it->second.node_id == context.node_id) {
      known_challenge = true;
      pending = it->second;
      pending_.erase(it);
    }
    auto node_it = nodes_.find(context.node_id);
    if (node_it != nodes_.end()) {
      known_node = true;
      node = node_it->second;
    }
  }

  const int64_t elapsed_ms = context.received_at - context.challenge.timestamp;
  if (!known_challenge) {
    return resolve(context.node_id, nonce, ChallengeStatus::Failed, elapsed_ms,
                   "challenge was not issued to this node or was already answered");
  }
  if (!known_node) {
    return resolve(context.node_id, nonce, ChallengeStatus::Failed, elapsed_ms, "unknown node");
  }

  try {
    check_response(context, node, pending);
  } catch (const proof::TimingViolationError& e) {
    return resolve(context.node_id, nonce, ChallengeStatus::TimedOut, elapsed_ms, e.what());
  } catch (const std::exception& e) {
    return resolve(context.node_id, nonce, ChallengeStatus::Failed, elapsed_ms, e.what());
  }
  return resolve(context.node_id, nonce, ChallengeStatus::Verified, elapsed_ms, "");
}

void ChallengeValidator::check_response(const ValidationContext& context, const NodeRecord& node,
                                        const PendingChallenge& pending) const {
  const proof::StorageChallenge& challenge = pending.challenge;
  const proof::ChallengeResponse& response = context.response;

  if (!same_challenge(challenge, context.challenge)) {
    throw proof::ProofError("Challenge fields differ from the issued challenge");
  }

  // Timing, from the node's claim and from the validator's own clock
  if (response.responded_at < challenge.timestamp) {
    throw proof::ProofError("Response claims to predate the challenge");
  }
  const int64_t timeout = static_cast<int64_t>(challenge.timeout_ms);
  if (response.responded_at - challenge.timestamp > timeout) {
    throw proof::TimingViolationError("node answered after " +
                                      std::to_string(response.responded_at - challenge.timestamp) + " ms");
  }
  if (context.received_at - challenge.timestamp > timeout) {
    throw proof::TimingViolationError("response received after " +
                                      std::to_string(context.received_at - challenge.timestamp) + " ms");
  }

  // Location and binding
  if (response.proof.current_location != node.expected_location) {
    throw proof::LocationMismatchError("served from " + response.proof.current_location.to_string() +
                                       ", registered at " + node.expected_location.to_string());
  }
  if (proof::bind_to_location(response.mutated_data, response.proof.current_location) !=
      response.proof.server_binding) {
    throw proof::BindingMismatchError("server binding does not match data and location");
  }

  // Key
  crypto::require_valid_signature(node.public_key, response.mutated_data, response.proof.key_signature,
                                  "challenge response");

  // Commitment recorded when the copy was registered
  auto copy_it = node.commitments.find(challenge.copy_index);
  if (copy_it != node.commitments.end()) {
    if (challenge.chunk_index >= copy_it->second.size()) {
      throw proof::ProofError("Chunk index " + std::to_string(challenge.chunk_index) + " outside registered copy");
    }
    if (crypto::sha256(response.mutated_data) != copy_it->second[challenge.chunk_index]) {
      throw proof::BindingMismatchError("mutated data does not match the registered commitment");
    }
  }
}

ChallengeOutcome ChallengeValidator::resolve(const std::string& node_id, const proof::Nonce& nonce,
                                             ChallengeStatus status, int64_t elapsed_ms,
                                             const std::string& reason) {
  ChallengeOutcome outcome;
  outcome.node_id = node_id;
  outcome.nonce = crypto::to_hex(nonce);
  outcome.status = status;
  outcome.elapsed_ms = elapsed_ms;
  outcome.reason = reason;
  ledger_.record(outcome);

  if (status == ChallengeStatus::Verified) {
    BOOST_LOG_TRIVIAL(info) << "ChallengeValidator: Node " << node_id.substr(0, 12) << " verified in "
                            << elapsed_ms << " ms";
  } else {
    BOOST_LOG_TRIVIAL(warning) << "ChallengeValidator: Node " << node_id.substr(0, 12) << " "
                               << to_string(status) << ": " << reason;
  }
  return outcome;
}

} // namespace validator
} // namespace pous
