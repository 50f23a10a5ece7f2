#include <gtest/gtest.h>
#include "proof/chunk_planner.hpp"
#include "proof/copy_builder.hpp"
#include "validator/proof_verifier.hpp"
#include "test_utils.hpp"

using namespace pous::validator;
using namespace pous::proof;
using pous::crypto::KeyPair;

class ProofVerifierTest : public ::testing::Test {
protected:
  static constexpr uint64_t EPOCH = 5;

  TempDir dir{"proof_verifier_test"};
  pous::config::ProofConfig config = test_config();
  NodeIdentity identity = make_identity("10.0.0.1", 4001);
  KeyLocationRegistry registry{config.protocol_prefix};
  VdfEngine engine{config};
  std::unique_ptr<pous::store::ChunkStore> store;
  Bytes file = pattern_bytes(90, 3);
  std::vector<Bytes> originals;

  void SetUp() override {
    init_logging(pous::logger::severity_level::error);
    store = std::make_unique<pous::store::ChunkStore>(dir.str());
    CopyBuilder builder(config, *store);
    builder.build(file, identity, 0);
    ChunkPlanner planner(config);
    originals = ChunkPlanner::split(file, planner.plan(file.size()));
  }

  void register_identity(const NodeIdentity& node, uint64_t epoch = EPOCH) {
    registry.register_memo(
      make_server_coin_memo(node.key_pair, registered_host(node.location), epoch, config.protocol_prefix), epoch);
  }

  UniqueContentProof content_proof(uint32_t chunk_index) const {
    UniqueContentProof proof;
    proof.public_key = identity.public_key();
    proof.location = identity.location;
    proof.epoch = EPOCH;
    proof.original_chunk = originals.at(chunk_index);
    proof.chunk = store->load(identity.node_id(), 0, chunk_index);
    return proof;
  }

  VerificationReport verify(const ProofBundle& bundle) const {
    return verify_proof_bundle(bundle, VerificationContext{registry, engine, EPOCH});
  }
};

TEST_F(ProofVerifierTest, RegisteredHostPrefersHostname) {
  NetworkLocation location = make_location("10.0.0.1", 80);
  EXPECT_EQ(registered_host(location), "10.0.0.1");
  location.hostname = "storage.example.org";
  EXPECT_EQ(registered_host(location), "storage.example.org");
}

TEST_F(ProofVerifierTest, AcceptsCurrentKeyLocationMemo) {
  KeyLocationProof proof{make_server_coin_memo(identity.key_pair, "10.0.0.1", EPOCH, config.protocol_prefix)};
  EXPECT_TRUE(verify(proof).accepted);
}

TEST_F(ProofVerifierTest, RejectsStaleOrForgedMemo) {
  KeyLocationProof stale{make_server_coin_memo(identity.key_pair, "10.0.0.1", EPOCH - 1, config.protocol_prefix)};
  EXPECT_FALSE(verify(stale).accepted);

  KeyLocationProof forged{make_server_coin_memo(identity.key_pair, "10.0.0.1", EPOCH, config.protocol_prefix)};
  forged.memo.host = "10.0.0.99";
  VerificationReport report = verify(forged);
  EXPECT_FALSE(report.accepted);
  EXPECT_NE(report.reason.find("signature"), std::string::npos);
}

TEST_F(ProofVerifierTest, AcceptsEveryChunkOfARegisteredNode) {
  register_identity(identity);
  for (uint32_t i = 0; i < originals.size(); ++i) {
    VerificationReport report = verify(content_proof(i));
    EXPECT_TRUE(report.accepted) << "chunk " << i << ": " << report.reason;
  }
}

TEST_F(ProofVerifierTest, RejectsUnregisteredKey) {
  VerificationReport report = verify(content_proof(0));
  EXPECT_FALSE(report.accepted);
  EXPECT_NE(report.reason.find("not registered"), std::string::npos);
}

TEST_F(ProofVerifierTest, RejectsRegistrationFromAnotherEpoch) {
  register_identity(identity, EPOCH - 1);
  EXPECT_FALSE(verify(content_proof(1)).accepted);

  UniqueContentProof old = content_proof(1);
  old.epoch = EPOCH - 1;
  EXPECT_FALSE(verify(old).accepted);
}

TEST_F(ProofVerifierTest, RejectsTamperedCheckpoint) {
  register_identity(identity);
  UniqueContentProof proof = content_proof(2);
  ASSERT_FALSE(proof.chunk.proof.vdf.checkpoints.empty());
  proof.chunk.proof.vdf.checkpoints[1][0] ^= 0x01;
  EXPECT_FALSE(verify(proof).accepted);
}

TEST_F(ProofVerifierTest, RejectsChunkClaimedForAnotherLocation) {
  NodeIdentity moved{KeyPair::from_private_key(identity.key_pair.private_key_bytes()),
                     make_location("10.9.9.9", 4001)};
  register_identity(moved);

  UniqueContentProof proof = content_proof(0);
  proof.location = moved.location;
  VerificationReport report = verify(proof);
  EXPECT_FALSE(report.accepted);
  EXPECT_NE(report.reason.find("Binding mismatch"), std::string::npos) << report.reason;
}

TEST_F(ProofVerifierTest, RejectsSubstitutedReversalKey) {
  register_identity(identity);

  UniqueContentProof wrong_key = content_proof(3);
  wrong_key.chunk.reversal_key.transform_key[0] ^= 0x01;
  EXPECT_FALSE(verify(wrong_key).accepted);

  UniqueContentProof wrong_matrix = content_proof(3);
  wrong_matrix.chunk.reversal_key.reversal_matrix[0] ^= 0x01;
  EXPECT_FALSE(verify(wrong_matrix).accepted);
}

TEST_F(ProofVerifierTest, RejectsDataThatDoesNotRestore) {
  register_identity(identity);
  UniqueContentProof proof = content_proof(4);
  proof.chunk.mutated_data[0] ^= 0xff;
  VerificationReport report = verify(proof);
  EXPECT_FALSE(report.accepted);
  EXPECT_NE(report.reason.find("Restoration"), std::string::npos) << report.reason;
}

TEST_F(ProofVerifierTest, RejectsChainThatSkipsTheCopySeed) {
  register_identity(identity);
  UniqueContentProof proof = content_proof(0);
  proof.chunk.proof.previous_state[0] ^= 0x01;
  EXPECT_FALSE(verify(proof).accepted);
}
