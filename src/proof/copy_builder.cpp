#include "proof/copy_builder.hpp"
#include "proof/binding.hpp"
#include "proof/proof_error.hpp"
#include "proof/reversal.hpp"
#include <boost/log/trivial.hpp>

namespace pous::proof {

//==============================================
// TRANSFORM JOB
//==============================================

TransformJob::TransformJob(std::future<CopyManifest> result, CancellationToken token,
                           std::unique_ptr<std::thread> worker)
  : result_(std::move(result))
  , token_(std::move(token))
  , worker_(std::move(worker)) {}

TransformJob::~TransformJob() {
  if (worker_ && worker_->joinable()) {
    if (!is_ready()) {
      BOOST_LOG_TRIVIAL(info) << "TransformJob: Cancelling unfinished build";
      token_.cancel();
    }
    worker_->join();
  }
}

bool TransformJob::is_ready() const {
  return result_.valid() && result_.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
}

CopyManifest TransformJob::get() {
  if (!result_.valid()) {
    throw ProofError("TransformJob: Result already taken");
  }
  CopyManifest manifest = result_.get();
  if (worker_ && worker_->joinable()) {
    worker_->join();
  }
  return manifest;
}


//==============================================
// COPY BUILDER
//==============================================

CopyBuilder::CopyBuilder(const config::ProofConfig& config, store::ChunkStore& store)
  : planner_(config)
  , engine_(config)
  , store_(store) {}

CopyManifest CopyBuilder::build(const Bytes& file_data, const NodeIdentity& identity, uint32_t copy_index,
                                const CancellationToken& token) {
  const std::string node_id = identity.node_id();
  std::vector<ChunkDefinition> plan = planner_.plan(file_data.size());
  std::vector<Bytes> chunks = ChunkPlanner::split(file_data, plan);

  BOOST_LOG_TRIVIAL(info) << "CopyBuilder: Building copy " << copy_index << " of " << file_data.size()
                          << " bytes in " << chunks.size() << " chunks, " << engine_.iterations()
                          << " iterations each";

  CopyManifest manifest;
  manifest.node_id = node_id;
  manifest.copy_index = copy_index;
  manifest.chunk_count = static_cast<uint32_t>(chunks.size());
  manifest.file_size = file_data.size();
  manifest.commitments.reserve(chunks.size());

  Digest previous = VdfEngine::chain_seed(identity.public_key(), copy_index);
  for (const ChunkDefinition& definition : plan) {
    const Bytes& chunk = chunks[definition.index];

    ChunkBinding binding = create_chunk_bindings(chunk, identity);
    TransformState initial = VdfEngine::initial_state(chunk, binding, previous);

    ChunkTransform transform(engine_, initial);
    const VdfResult& vdf = transform.run(identity.key_pair, token);

    TransformedChunk transformed;
    transformed.reversal_key = ReversalKeyGenerator::generate(chunk, initial, vdf);
    transformed.mutated_data = ReversalKeyGenerator::apply_mutation(chunk, transformed.reversal_key);
    transformed.chunk_index = definition.index;
    transformed.copy_index = copy_index;
    transformed.proof = ChunkProof{binding, vdf, previous};

    store_.put(node_id, transformed);
    manifest.commitments.push_back(crypto::sha256(transformed.mutated_data));
    previous = vdf.final_state;

    BOOST_LOG_TRIVIAL(debug) << "CopyBuilder: Chunk " << definition.index << "/" << chunks.size()
                             << " of copy " << copy_index << " stored";
  }

  manifest.final_state = previous;
  BOOST_LOG_TRIVIAL(info) << "CopyBuilder: Copy " << copy_index << " complete for node " << node_id.substr(0, 12);
  return manifest;
}

TransformJob CopyBuilder::start(Bytes file_data, const NodeIdentity& identity, uint32_t copy_index) {
  CancellationToken token;
  std::packaged_task<CopyManifest()> task(
    [this, data = std::move(file_data), &identity, copy_index, token]() {
      return build(data, identity, copy_index, token);
    });
  std::future<CopyManifest> result = task.get_future();
  auto worker = std::make_unique<std::thread>(std::move(task));
  return TransformJob(std::move(result), token, std::move(worker));
}

} // namespace pous::proof
