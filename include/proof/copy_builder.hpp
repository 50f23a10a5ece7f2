#ifndef POUS_PROOF_COPY_BUILDER_HPP
#define POUS_PROOF_COPY_BUILDER_HPP

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "config/proof_config.hpp"
#include "proof/chunk_planner.hpp"
#include "proof/types.hpp"
#include "proof/vdf_engine.hpp"
#include "store/chunk_store.hpp"

namespace pous::proof {

// Summary of a built copy, handed to validators at registration
struct CopyManifest {
  std::string node_id;
  uint32_t copy_index{0};
  uint32_t chunk_count{0};
  uint64_t file_size{0};
  // SHA-256 of each chunk's mutated data, by chunk index
  std::vector<Digest> commitments;
  // Final state of the last chunk
  Digest final_state{};
};

// Handle on a copy being built on a worker thread. The destructor cancels
// an unfinished build and waits for the worker.
class TransformJob {
public:
  TransformJob(std::future<CopyManifest> result, CancellationToken token, std::unique_ptr<std::thread> worker);
  ~TransformJob();

  TransformJob(TransformJob&&) = default;
  TransformJob& operator=(TransformJob&&) = delete;

  void cancel() { token_.cancel(); }
  bool is_ready() const;
  std::future_status wait_for(std::chrono::milliseconds timeout) const { return result_.wait_for(timeout); }
  // Blocks for the manifest; rethrows the build error, including
  // TransformCancelledError after cancel(). Callable once.
  CopyManifest get();

private:
  std::future<CopyManifest> result_;
  CancellationToken token_;
  std::unique_ptr<std::thread> worker_;
};

// Runs planner -> bindings -> sequential transform -> reversal key -> store
// for every chunk of one copy. Chunks are chained: each chunk starts from
// the previous chunk's final state, chunk 0 from the copy seed.
class CopyBuilder {
public:
  CopyBuilder(const config::ProofConfig& config, store::ChunkStore& store);

  CopyManifest build(const Bytes& file_data, const NodeIdentity& identity, uint32_t copy_index,
                     const CancellationToken& token = CancellationToken());

  // Builds on a worker thread. Both identity and this builder must outlive
  // the job.
  TransformJob start(Bytes file_data, const NodeIdentity& identity, uint32_t copy_index);

  VdfEngine& engine() { return engine_; }
  const ChunkPlanner& planner() const { return planner_; }

private:
  ChunkPlanner planner_;
  VdfEngine engine_;
  store::ChunkStore& store_;
};

} // namespace pous::proof

#endif // POUS_PROOF_COPY_BUILDER_HPP
