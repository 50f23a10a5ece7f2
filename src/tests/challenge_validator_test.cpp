#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include "node/retrieval_service.hpp"
#include "proof/binding.hpp"
#include "proof/copy_builder.hpp"
#include "validator/challenge_validator.hpp"
#include "test_utils.hpp"

using namespace pous::validator;
using namespace pous::proof;
using pous::crypto::KeyPair;

class ChallengeValidatorTest : public ::testing::Test {
protected:
  TempDir dir{"challenge_validator_test"};
  pous::config::ProofConfig config = test_config();
  ManualClock clock{1700000000000};
  NodeIdentity identity = make_identity("10.0.0.1", 4001);
  std::unique_ptr<pous::store::ChunkStore> store;
  // Responders reference retrieval, so it outlives the validator
  std::unique_ptr<pous::node::RetrievalService> retrieval;
  std::unique_ptr<ChallengeValidator> validator;
  CopyManifest manifest;
  std::string node_id;

  void SetUp() override {
    init_logging(pous::logger::severity_level::error);
    store = std::make_unique<pous::store::ChunkStore>(dir.str());
    validator = std::make_unique<ChallengeValidator>(config, KeyPair::generate(), clock);
    retrieval = std::make_unique<pous::node::RetrievalService>(identity, *store, clock, validator->public_key());

    CopyBuilder builder(config, *store);
    manifest = builder.build(pattern_bytes(60), identity, 0);
    node_id = validator->register_node(identity.public_key(), identity.location);
    validator->register_copy(manifest);
  }

  StorageChallenge issue() {
    return validator->issue_challenge(node_id, 1, manifest.chunk_count);
  }

  ValidationContext answer(const StorageChallenge& challenge, int64_t delay_ms = 20) {
    ValidationContext context;
    context.node_id = node_id;
    context.challenge = challenge;
    context.response = retrieval->respond_to_challenge(challenge);
    clock.advance(delay_ms);
    context.received_at = clock.now_ms();
    return context;
  }

  Responder responder() {
    pous::node::RetrievalService* service = retrieval.get();
    return [service](const StorageChallenge& challenge) { return service->respond_to_challenge(challenge); };
  }

  ChallengeStatus last_status() const {
    return validator->ledger().history(node_id).back().status;
  }
};

TEST_F(ChallengeValidatorTest, IssuedChallengesAreSignedAndInRange) {
  std::set<std::string> nonces;
  for (int i = 0; i < 50; ++i) {
    StorageChallenge challenge = validator->issue_challenge(node_id, 3, manifest.chunk_count);
    EXPECT_LT(challenge.copy_index, 3u);
    EXPECT_LT(challenge.chunk_index, manifest.chunk_count);
    EXPECT_EQ(challenge.timestamp, clock.now_ms());
    EXPECT_EQ(challenge.timeout_ms, config.challenge_timeout_ms);
    EXPECT_TRUE(verify_challenge_signature(challenge, validator->public_key()));
    EXPECT_EQ(validator->status(challenge.challenge_nonce), ChallengeStatus::Issued);
    nonces.insert(pous::crypto::to_hex(challenge.challenge_nonce));
  }
  EXPECT_EQ(nonces.size(), 50u);
}

TEST_F(ChallengeValidatorTest, IssueRejectsUnknownNodeAndEmptyRanges) {
  EXPECT_THROW(validator->issue_challenge(std::string(64, 'f'), 1, 1), std::invalid_argument);
  EXPECT_THROW(validator->issue_challenge(node_id, 0, 1), std::invalid_argument);
  EXPECT_THROW(validator->issue_challenge(node_id, 1, 0), std::invalid_argument);
}

TEST_F(ChallengeValidatorTest, TamperedChallengeSignatureIsDetected) {
  StorageChallenge challenge = issue();
  StorageChallenge tampered = challenge;
  tampered.chunk_index = (challenge.chunk_index + 1) % manifest.chunk_count;
  EXPECT_FALSE(verify_challenge_signature(tampered, validator->public_key()));
  EXPECT_FALSE(verify_challenge_signature(challenge, identity.public_key()));
  EXPECT_THROW(retrieval->respond_to_challenge(tampered), pous::crypto::SignatureInvalidError);
}

TEST_F(ChallengeValidatorTest, GenuineResponseIsVerified) {
  StorageChallenge challenge = issue();
  EXPECT_TRUE(validator->validate_challenge_response(answer(challenge)));
  EXPECT_EQ(last_status(), ChallengeStatus::Verified);
  EXPECT_FALSE(validator->status(challenge.challenge_nonce).has_value());
  EXPECT_DOUBLE_EQ(*validator->ledger().success_rate(node_id), 1.0);
}

TEST_F(ChallengeValidatorTest, RunChallengeVerifiesPromptResponder) {
  ChallengeOutcome outcome = validator->run_challenge(node_id, issue(), responder());
  EXPECT_EQ(outcome.status, ChallengeStatus::Verified) << outcome.reason;
  EXPECT_TRUE(outcome.reason.empty());
  EXPECT_EQ(outcome.node_id, node_id);
}

TEST_F(ChallengeValidatorTest, SpoofedLocationIsRejectedDespiteValidSignature) {
  // Genuine data re-bound to another address by a node that lies about where it serves from
  NetworkLocation spoofed = make_location("203.0.113.9", 4001);

  StorageChallenge challenge = issue();
  ValidationContext context;
  context.node_id = node_id;
  context.challenge = challenge;
  context.response = retrieval->respond_to_challenge(challenge);
  context.response.proof.current_location = spoofed;
  context.response.proof.server_binding = bind_to_location(context.response.mutated_data, spoofed);
  context.received_at = clock.now_ms() + 10;

  // The response is internally consistent
  ASSERT_TRUE(pous::crypto::verify_signature(identity.public_key(), context.response.mutated_data,
                                             context.response.proof.key_signature));

  EXPECT_FALSE(validator->validate_challenge_response(context));
  auto outcome = validator->ledger().history(node_id).back();
  EXPECT_EQ(outcome.status, ChallengeStatus::Failed);
  EXPECT_NE(outcome.reason.find("Location mismatch"), std::string::npos) << outcome.reason;
}

TEST_F(ChallengeValidatorTest, RelocatedNodeCannotAnswerWithItsOldCopy) {
  // Same key re-registered at a new address, chunks still built for the old one
  NodeIdentity moved{KeyPair::from_private_key(identity.key_pair.private_key_bytes()),
                     make_location("10.0.0.99", 4001)};
  ASSERT_EQ(validator->register_node(moved.public_key(), moved.location), node_id);
  pous::node::RetrievalService relocated(moved, *store, clock, validator->public_key());

  ChallengeOutcome outcome = validator->run_challenge(node_id, issue(),
    [&relocated](const StorageChallenge& challenge) { return relocated.respond_to_challenge(challenge); });

  EXPECT_EQ(outcome.status, ChallengeStatus::Failed);
  EXPECT_NE(outcome.reason.find("Location mismatch"), std::string::npos) << outcome.reason;
}

TEST_F(ChallengeValidatorTest, ClaimedBindingMustMatchData) {
  StorageChallenge challenge = issue();
  ValidationContext context = answer(challenge);
  context.response.proof.server_binding[0] ^= 0x01;
  EXPECT_FALSE(validator->validate_challenge_response(context));
  EXPECT_EQ(last_status(), ChallengeStatus::Failed);
}

TEST_F(ChallengeValidatorTest, ForeignKeySignatureIsRejected) {
  StorageChallenge challenge = issue();
  ValidationContext context = answer(challenge);
  context.response.proof.key_signature = KeyPair::generate().sign(context.response.mutated_data);
  EXPECT_FALSE(validator->validate_challenge_response(context));
}

TEST_F(ChallengeValidatorTest, DataMustMatchRegisteredCommitment) {
  CopyManifest altered = manifest;
  for (auto& commitment : altered.commitments) {
    commitment[0] ^= 0x01;
  }
  validator->register_copy(altered);

  EXPECT_FALSE(validator->validate_challenge_response(answer(issue())));
  EXPECT_NE(validator->ledger().history(node_id).back().reason.find("commitment"), std::string::npos);
}

TEST_F(ChallengeValidatorTest, LateNodeClaimTimesOut) {
  StorageChallenge challenge = issue();
  clock.advance(config.challenge_timeout_ms + 1);
  ValidationContext context = answer(challenge, 0);
  EXPECT_FALSE(validator->validate_challenge_response(context));
  EXPECT_EQ(last_status(), ChallengeStatus::TimedOut);
}

TEST_F(ChallengeValidatorTest, LateReceiptTimesOut) {
  StorageChallenge challenge = issue();
  ValidationContext context = answer(challenge, config.challenge_timeout_ms + 1);
  EXPECT_FALSE(validator->validate_challenge_response(context));
  EXPECT_EQ(last_status(), ChallengeStatus::TimedOut);
}

TEST_F(ChallengeValidatorTest, ResponseAtTheDeadlineIsAccepted) {
  StorageChallenge challenge = issue();
  ValidationContext context = answer(challenge, config.challenge_timeout_ms);
  EXPECT_TRUE(validator->validate_challenge_response(context));
}

TEST_F(ChallengeValidatorTest, ReplayedResponseIsRejected) {
  StorageChallenge challenge = issue();
  ValidationContext context = answer(challenge);
  EXPECT_TRUE(validator->validate_challenge_response(context));
  EXPECT_FALSE(validator->validate_challenge_response(context));
  EXPECT_EQ(last_status(), ChallengeStatus::Failed);
}

TEST_F(ChallengeValidatorTest, UnissuedChallengeIsRejected) {
  StorageChallenge forged = issue();
  forged.challenge_nonce.fill(0x00);
  ValidationContext context;
  context.node_id = node_id;
  context.challenge = forged;
  context.response = retrieval->respond_to_challenge(issue());
  context.received_at = clock.now_ms();
  EXPECT_FALSE(validator->validate_challenge_response(context));
}

TEST_F(ChallengeValidatorTest, ChallengeForAnotherNodeIsRejected) {
  NodeIdentity other = make_identity("10.0.0.2", 4001);
  std::string other_id = validator->register_node(other.public_key(), other.location);
  StorageChallenge challenge = validator->issue_challenge(other_id, 1, manifest.chunk_count);

  ChallengeOutcome outcome = validator->run_challenge(node_id, challenge, responder());
  EXPECT_EQ(outcome.status, ChallengeStatus::Failed);
  // Still answerable by the node it was issued to
  EXPECT_EQ(validator->status(challenge.challenge_nonce), ChallengeStatus::Issued);
}

TEST_F(ChallengeValidatorTest, NodeWithoutPrecomputedChunkTimesOut) {
  StorageChallenge challenge = issue();
  pous::node::RetrievalService* service = retrieval.get();
  ManualClock* validator_clock = &clock;

  // Without stored chunks the node has to run the whole transform first
  ChallengeOutcome outcome = validator->run_challenge(node_id, challenge,
    [service, validator_clock](const StorageChallenge& issued) {
      validator_clock->advance(60000);
      return service->respond_to_challenge(issued);
    });

  EXPECT_EQ(outcome.status, ChallengeStatus::TimedOut);
  EXPECT_GE(outcome.elapsed_ms, 60000);
}

TEST_F(ChallengeValidatorTest, SilentNodeTimesOutOnTheDeadline) {
  pous::config::ProofConfig fast = config;
  fast.challenge_timeout_ms = 50;
  ChallengeValidator impatient(fast, KeyPair::generate(), clock);
  std::string id = impatient.register_node(identity.public_key(), identity.location);
  StorageChallenge challenge = impatient.issue_challenge(id, 1, 1);

  auto started = std::chrono::steady_clock::now();
  ChallengeOutcome outcome = impatient.run_challenge(id, challenge, [](const StorageChallenge&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    return ChallengeResponse{};
  });
  auto waited = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(outcome.status, ChallengeStatus::TimedOut);
  EXPECT_LT(waited, std::chrono::milliseconds(450));
}

TEST_F(ChallengeValidatorTest, OverdueResponderIsJoinedBeforeValidatorIsGone) {
  pous::config::ProofConfig fast = config;
  fast.challenge_timeout_ms = 50;
  std::atomic<bool> returned{false};
  auto responder_state = std::make_shared<std::string>("node state");
  std::weak_ptr<std::string> watch = responder_state;

  {
    ChallengeValidator impatient(fast, KeyPair::generate(), clock);
    std::string id = impatient.register_node(identity.public_key(), identity.location);
    StorageChallenge challenge = impatient.issue_challenge(id, 1, 1);

    ChallengeOutcome outcome = impatient.run_challenge(id, challenge,
      [&returned, responder_state](const StorageChallenge&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        returned = true;
        return ChallengeResponse{};
      });
    EXPECT_EQ(outcome.status, ChallengeStatus::TimedOut);

    // The caller drops its handle while the responder is still running
    responder_state.reset();
    EXPECT_FALSE(watch.expired());
    EXPECT_FALSE(returned);
  }

  EXPECT_TRUE(returned);
  EXPECT_TRUE(watch.expired());
}

TEST_F(ChallengeValidatorTest, MissingChunkFailsTheChallenge) {
  store->invalidate_node(node_id);
  ChallengeOutcome outcome = validator->run_challenge(node_id, issue(), responder());
  EXPECT_EQ(outcome.status, ChallengeStatus::Failed);
  EXPECT_NE(outcome.reason.find("node failed to respond"), std::string::npos);
}

TEST_F(ChallengeValidatorTest, ReRegisteringAtNewLocationDropsCommitments) {
  NetworkLocation moved = make_location("10.0.0.50", 4001);
  validator->register_node(identity.public_key(), moved);
  // Old copy is bound to the old location
  EXPECT_FALSE(validator->validate_challenge_response(answer(issue())));
  auto reason = validator->ledger().history(node_id).back().reason;
  EXPECT_NE(reason.find("Location mismatch"), std::string::npos) << reason;
}
