#include <gtest/gtest.h>
#include <fstream>
#include "codec/record_codec.hpp"
#include "store/chunk_store.hpp"
#include "test_utils.hpp"

using namespace pous::store;
using namespace pous::proof;

class ChunkStoreTest : public ::testing::Test {
protected:
  TempDir dir{"chunk_store_test"};
  std::unique_ptr<ChunkStore> store;
  const std::string node_a = node_id_for(PublicKey{});
  const std::string node_b = std::string(64, 'b');

  void SetUp() override {
    init_logging();
    store = std::make_unique<ChunkStore>(dir.str());
  }

  static TransformedChunk make_chunk(uint32_t copy_index, uint32_t chunk_index) {
    TransformedChunk chunk;
    chunk.copy_index = copy_index;
    chunk.chunk_index = chunk_index;
    chunk.mutated_data = pattern_bytes(10, static_cast<uint8_t>(chunk_index));
    chunk.proof.vdf.iterations = 1200;
    chunk.proof.vdf.checkpoints.resize(4);
    return chunk;
  }
};

TEST_F(ChunkStoreTest, PutAndLoad) {
  ASSERT_FALSE(store->has(node_a, 0, 5));
  store->put(node_a, make_chunk(0, 5));

  EXPECT_TRUE(store->has(node_a, 0, 5));
  EXPECT_FALSE(store->has(node_a, 1, 5));
  EXPECT_FALSE(store->has(node_b, 0, 5));

  TransformedChunk loaded = store->load(node_a, 0, 5);
  EXPECT_EQ(loaded.chunk_index, 5u);
  EXPECT_EQ(loaded.mutated_data, make_chunk(0, 5).mutated_data);
  EXPECT_EQ(loaded.proof.vdf.checkpoints.size(), 4u);
}

TEST_F(ChunkStoreTest, RecordsAreWriteOnce) {
  store->put(node_a, make_chunk(0, 1));
  TransformedChunk replacement = make_chunk(0, 1);
  replacement.mutated_data = to_bytes("forged");
  EXPECT_THROW(store->put(node_a, replacement), StoreError);
  EXPECT_EQ(store->load(node_a, 0, 1).mutated_data, make_chunk(0, 1).mutated_data);
}

TEST_F(ChunkStoreTest, MissingRecordThrows) {
  EXPECT_THROW(store->load(node_a, 0, 0), StoreError);
}

TEST_F(ChunkStoreTest, CountsPerNode) {
  for (uint32_t i = 0; i < 6; ++i) {
    store->put(node_a, make_chunk(0, i));
  }
  store->put(node_a, make_chunk(1, 0));
  store->put(node_b, make_chunk(0, 0));

  EXPECT_EQ(store->count(node_a), 7u);
  EXPECT_EQ(store->count(node_b), 1u);
  EXPECT_EQ(store->count(std::string(64, 'c')), 0u);
}

TEST_F(ChunkStoreTest, InvalidateNodeDropsOnlyThatNode) {
  store->put(node_a, make_chunk(0, 0));
  store->put(node_a, make_chunk(0, 1));
  store->put(node_b, make_chunk(0, 0));

  store->invalidate_node(node_a);
  EXPECT_EQ(store->count(node_a), 0u);
  EXPECT_FALSE(store->has(node_a, 0, 0));
  EXPECT_TRUE(store->has(node_b, 0, 0));

  // A rebuilt copy can be stored again
  EXPECT_NO_THROW(store->put(node_a, make_chunk(0, 0)));
}

TEST_F(ChunkStoreTest, RejectsNodeIdsThatAreNotHex) {
  EXPECT_THROW(store->put("../escape", make_chunk(0, 0)), StoreError);
  EXPECT_THROW(store->has("", 0, 0), StoreError);
  EXPECT_THROW(store->invalidate_node("node/../../x"), StoreError);
}

TEST_F(ChunkStoreTest, CorruptRecordIsReported) {
  store->put(node_a, make_chunk(0, 2));

  // Truncate every record file of the node
  for (const auto& entry : std::filesystem::recursive_directory_iterator(dir.path() / node_a)) {
    if (entry.is_regular_file()) {
      std::filesystem::resize_file(entry.path(), 5);
    }
  }
  EXPECT_THROW(store->load(node_a, 0, 2), pous::codec::CodecError);
}

TEST_F(ChunkStoreTest, RecordKeysAreDistinct) {
  EXPECT_NE(ChunkStore::record_key(1, 11), ChunkStore::record_key(11, 1));
  EXPECT_NE(ChunkStore::record_key(0, 1), ChunkStore::record_key(1, 0));
}
