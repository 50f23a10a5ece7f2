#include <gtest/gtest.h>
#include "proof/copy_builder.hpp"
#include "proof/proof_error.hpp"
#include "proof/reversal.hpp"
#include "test_utils.hpp"

using namespace pous::proof;

class CopyBuilderTest : public ::testing::Test {
protected:
    TempDir dir{"copy_builder_test"};
    pous::config::ProofConfig config = test_config();
    std::unique_ptr<pous::store::ChunkStore> store;
    std::unique_ptr<CopyBuilder> builder;
    NodeIdentity identity = make_identity();

    void SetUp() override {
        init_logging();
        store = std::make_unique<pous::store::ChunkStore>(dir.str());
        builder = std::make_unique<CopyBuilder>(config, *store);
    }
};

TEST_F(CopyBuilderTest, BuildStoresEveryChunk) {
    Bytes file = pattern_bytes(100);
    CopyManifest manifest = builder->build(file, identity, 0);

    EXPECT_EQ(manifest.node_id, identity.node_id());
    EXPECT_EQ(manifest.chunk_count, config.standard_chunk_count);
    EXPECT_EQ(manifest.file_size, file.size());
    ASSERT_EQ(manifest.commitments.size(), manifest.chunk_count);
    EXPECT_EQ(store->count(identity.node_id()), manifest.chunk_count);

    Bytes restored;
    for (uint32_t i = 0; i < manifest.chunk_count; ++i) {
        TransformedChunk chunk = store->load(identity.node_id(), 0, i);
        EXPECT_EQ(manifest.commitments[i], pous::crypto::sha256(chunk.mutated_data));
        Bytes original = ReversalKeyGenerator::restore_original_data(chunk.mutated_data, chunk.reversal_key);
        restored.insert(restored.end(), original.begin(), original.end());
    }
    EXPECT_EQ(restored, file);
}

TEST_F(CopyBuilderTest, ChunksFormOneChain) {
    CopyManifest manifest = builder->build(pattern_bytes(60), identity, 2);

    Digest expected_previous = VdfEngine::chain_seed(identity.public_key(), 2);
    for (uint32_t i = 0; i < manifest.chunk_count; ++i) {
        TransformedChunk chunk = store->load(identity.node_id(), 2, i);
        EXPECT_EQ(chunk.proof.previous_state, expected_previous) << "chunk " << i;
        expected_previous = chunk.proof.vdf.final_state;
    }
    EXPECT_EQ(manifest.final_state, expected_previous);
}

TEST_F(CopyBuilderTest, UpstreamChangeInvalidatesDownstreamChunks) {
    Bytes file = pattern_bytes(60);
    builder->build(file, identity, 0);

    Bytes changed = file;
    changed[0] ^= 0x01;
    builder->build(changed, identity, 1);

    for (uint32_t i = 0; i < config.standard_chunk_count; ++i) {
        EXPECT_NE(store->load(identity.node_id(), 0, i).proof.vdf.final_state,
                  store->load(identity.node_id(), 1, i).proof.vdf.final_state) << "chunk " << i;
    }
}

TEST_F(CopyBuilderTest, RebuildingACopyIsRefused) {
    builder->build(pattern_bytes(30), identity, 0);
    EXPECT_THROW(builder->build(pattern_bytes(30), identity, 0), pous::store::StoreError);
}

TEST_F(CopyBuilderTest, JobsBuildIndependentCopiesInParallel) {
    TransformJob first = builder->start(pattern_bytes(90, 1), identity, 0);
    TransformJob second = builder->start(pattern_bytes(90, 2), identity, 1);

    CopyManifest a = first.get();
    CopyManifest b = second.get();
    EXPECT_EQ(a.copy_index, 0u);
    EXPECT_EQ(b.copy_index, 1u);
    EXPECT_NE(a.final_state, b.final_state);
    EXPECT_EQ(store->count(identity.node_id()), a.chunk_count + b.chunk_count);
    EXPECT_THROW(first.get(), ProofError);
}

TEST_F(CopyBuilderTest, CancelledJobProducesNoManifest) {
    builder->engine().set_iterations(50000000);
    TransformJob job = builder->start(pattern_bytes(90), identity, 0);
    job.cancel();

    EXPECT_THROW(job.get(), TransformCancelledError);
    EXPECT_EQ(store->count(identity.node_id()), 0u);
}

TEST_F(CopyBuilderTest, ReadyFlagFollowsCompletion) {
    TransformJob job = builder->start(pattern_bytes(12), identity, 0);
    ASSERT_EQ(job.wait_for(std::chrono::seconds(30)), std::future_status::ready);
    EXPECT_TRUE(job.is_ready());
    EXPECT_EQ(job.get().chunk_count, config.standard_chunk_count);
}

TEST_F(CopyBuilderTest, MovedFromJobCanStillBeCancelled) {
    TransformJob job = builder->start(pattern_bytes(12), identity, 0);
    TransformJob owner(std::move(job));

    EXPECT_NO_THROW(job.cancel());
    EXPECT_FALSE(job.is_ready());
    EXPECT_EQ(owner.get().chunk_count, config.standard_chunk_count);
}
