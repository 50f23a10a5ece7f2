#ifndef POUS_STORE_CHUNK_STORE_HPP
#define POUS_STORE_CHUNK_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include "proof/types.hpp"
#include "store/store.hpp"

namespace pous {
namespace store {

// Persists TransformedChunk records keyed by (node id, copy index, chunk index).
// Each node gets its own Store under {base}/{node_id}; records are write-once.
class ChunkStore {
public:
  explicit ChunkStore(const std::string& base_path);

  // Throws StoreError if the record already exists
  void put(const std::string& node_id, const proof::TransformedChunk& chunk);
  // Throws StoreError if missing, CodecError if the record is corrupt
  proof::TransformedChunk load(const std::string& node_id, uint32_t copy_index, uint32_t chunk_index) const;
  bool has(const std::string& node_id, uint32_t copy_index, uint32_t chunk_index) const;
  // Number of records held for node_id
  std::size_t count(const std::string& node_id) const;
  // Drops every record of node_id, e.g. after a key or location change
  void invalidate_node(const std::string& node_id);

  static std::string record_key(uint32_t copy_index, uint32_t chunk_index);

private:
  std::filesystem::path base_path_;

  Store node_store(const std::string& node_id) const;
  std::filesystem::path node_path(const std::string& node_id) const;
};

} // namespace store
} // namespace pous

#endif // POUS_STORE_CHUNK_STORE_HPP
