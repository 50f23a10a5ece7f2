#include "proof/chunk_planner.hpp"
#include "proof/proof_error.hpp"
#include <boost/log/trivial.hpp>

namespace pous::proof {

ChunkPlanner::ChunkPlanner(const config::ProofConfig& config)
  : standard_chunk_count_(config.standard_chunk_count) {
  if (standard_chunk_count_ == 0) {
    throw ChunkPlanError("standard chunk count must be positive");
  }
}

uint32_t ChunkPlanner::effective_chunk_count(uint64_t file_size) const {
  if (file_size == 0) {
    throw ChunkPlanError("file size must be positive");
  }
  return file_size < standard_chunk_count_
    ? static_cast<uint32_t>(file_size)
    : standard_chunk_count_;
}

std::vector<ChunkDefinition> ChunkPlanner::plan(uint64_t file_size) const {
  const uint32_t count = effective_chunk_count(file_size);
  if (count < standard_chunk_count_) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk planner: File of " << file_size << " bytes is smaller than "
                               << standard_chunk_count_ << " chunks, clamping to " << count << " chunks";
  }

  std::vector<ChunkDefinition> chunks;
  chunks.reserve(count);

  const uint64_t chunk_size = (file_size + count - 1) / count;
  const bool ceiling_fits = chunk_size * (count - 1) < file_size;

  uint64_t offset = 0;
  for (uint32_t i = 0; i < count; ++i) {
    uint64_t length;
    if (ceiling_fits) {
      // Last chunk absorbs the remainder and may be shorter
      length = (i + 1 < count) ? chunk_size : file_size - offset;
    } else {
      // Ceiling sizes would leave trailing chunks empty, spread the bytes instead
      length = file_size / count + (i < file_size % count ? 1 : 0);
    }
    chunks.push_back(ChunkDefinition{i, offset, length});
    offset += length;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk planner: Planned " << chunks.size() << " chunks for "
                           << file_size << " bytes (chunk size " << chunk_size << ")";
  return chunks;
}

std::vector<Bytes> ChunkPlanner::split(const Bytes& data, const std::vector<ChunkDefinition>& plan) {
  std::vector<Bytes> chunks;
  chunks.reserve(plan.size());
  for (const auto& chunk : plan) {
    if (chunk.start_offset + chunk.length > data.size()) {
      throw ChunkPlanError("chunk " + std::to_string(chunk.index) + " exceeds the data size");
    }
    auto begin = data.begin() + static_cast<std::ptrdiff_t>(chunk.start_offset);
    chunks.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(chunk.length));
  }
  return chunks;
}

} // namespace pous::proof
