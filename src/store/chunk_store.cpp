#include "store/chunk_store.hpp"
#include "codec/record_codec.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace pous {
namespace store {

ChunkStore::ChunkStore(const std::string& base_path) : base_path_(base_path) {
  std::filesystem::create_directories(base_path_);
  BOOST_LOG_TRIVIAL(info) << "ChunkStore: Using base path: " << base_path_.string();
}

void ChunkStore::put(const std::string& node_id, const proof::TransformedChunk& chunk) {
  std::stringstream record(std::ios::in | std::ios::out | std::ios::binary);
  codec::RecordCodec::serialize(chunk, record);
  record.seekg(0);

  Store store = node_store(node_id);
  store.put(record_key(chunk.copy_index, chunk.chunk_index), record);
  BOOST_LOG_TRIVIAL(debug) << "ChunkStore: Stored chunk " << chunk.chunk_index << " of copy " << chunk.copy_index
                           << " for node " << node_id.substr(0, 12);
}

proof::TransformedChunk ChunkStore::load(const std::string& node_id, uint32_t copy_index,
                                         uint32_t chunk_index) const {
  std::stringstream record(std::ios::in | std::ios::out | std::ios::binary);
  node_store(node_id).read(record_key(copy_index, chunk_index), record);
  record.seekg(0);

  proof::TransformedChunk chunk = codec::RecordCodec::deserialize_chunk(record);
  if (chunk.copy_index != copy_index || chunk.chunk_index != chunk_index) {
    BOOST_LOG_TRIVIAL(error) << "ChunkStore: Record under copy " << copy_index << " chunk " << chunk_index
                             << " describes copy " << chunk.copy_index << " chunk " << chunk.chunk_index;
    throw StoreError("ChunkStore: Record index mismatch");
  }
  return chunk;
}

bool ChunkStore::has(const std::string& node_id, uint32_t copy_index, uint32_t chunk_index) const {
  if (!std::filesystem::exists(node_path(node_id))) {
    return false;
  }
  return node_store(node_id).contains(record_key(copy_index, chunk_index));
}

std::size_t ChunkStore::count(const std::string& node_id) const {
  if (!std::filesystem::exists(node_path(node_id))) {
    return 0;
  }
  return node_store(node_id).record_count();
}

void ChunkStore::invalidate_node(const std::string& node_id) {
  std::filesystem::path path = node_path(node_id);
  std::uintmax_t removed = std::filesystem::remove_all(path);
  BOOST_LOG_TRIVIAL(info) << "ChunkStore: Invalidated node " << node_id.substr(0, 12) << " (" << removed
                          << " entries removed)";
}

std::string ChunkStore::record_key(uint32_t copy_index, uint32_t chunk_index) {
  return "copy/" + std::to_string(copy_index) + "/chunk/" + std::to_string(chunk_index);
}

Store ChunkStore::node_store(const std::string& node_id) const {
  return Store(node_path(node_id).string());
}

std::filesystem::path ChunkStore::node_path(const std::string& node_id) const {
  bool is_hex = !node_id.empty() && std::all_of(node_id.begin(), node_id.end(), [](unsigned char c) {
    return std::isxdigit(c) != 0;
  });
  if (!is_hex) {
    throw StoreError("ChunkStore: Invalid node id: " + node_id);
  }
  return base_path_ / node_id;
}

} // namespace store
} // namespace pous
