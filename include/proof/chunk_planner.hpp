#ifndef POUS_PROOF_CHUNK_PLANNER_HPP
#define POUS_PROOF_CHUNK_PLANNER_HPP

#include <cstdint>
#include <vector>
#include "config/proof_config.hpp"
#include "proof/types.hpp"

namespace pous::proof {

class ChunkPlanner {
public:
  // ---- CONSTRUCTOR ----
  explicit ChunkPlanner(const config::ProofConfig& config);


  // ---- PLANNING ----
  // Partitions file_size bytes into the standard chunk count. Every chunk
  // is at least one byte long; files smaller than the chunk count are
  // clamped to one chunk per byte. Throws ChunkPlanError for file_size == 0.
  std::vector<ChunkDefinition> plan(uint64_t file_size) const;

  // Number of chunks plan() returns for file_size
  uint32_t effective_chunk_count(uint64_t file_size) const;

  // Splits data according to a plan
  static std::vector<Bytes> split(const Bytes& data, const std::vector<ChunkDefinition>& plan);

private:
  uint32_t standard_chunk_count_;
};

} // namespace pous::proof

#endif // POUS_PROOF_CHUNK_PLANNER_HPP
