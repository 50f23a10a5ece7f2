#include "proof/vdf_engine.hpp"
#include "proof/proof_error.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <iterator>
#include <numeric>
#include <random>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace pous::proof {

namespace {

const std::string SEED_DOMAIN = "pous/vdf/seed";
const std::string INITIAL_DOMAIN = "pous/vdf/initial";

constexpr size_t LANES = crypto::DIGEST_SIZE / sizeof(uint64_t);

uint64_t rotl(uint64_t value, unsigned shift) {
  return (value << shift) | (value >> (64 - shift));
}

void load_lanes(const Digest& digest, uint64_t (&lanes)[LANES]) {
  for (size_t i = 0; i < LANES; ++i) {
    uint64_t lane;
    std::memcpy(&lane, digest.data() + i * sizeof(uint64_t), sizeof(lane));
    lanes[i] = boost::endian::little_to_native(lane);
  }
}

// Lane-wise add-rotate-xor of the state with its hash
TransformState mix(const TransformState& state, const Digest& hash) {
  uint64_t s[LANES];
  uint64_t h[LANES];
  load_lanes(state, s);
  load_lanes(hash, h);

  TransformState out;
  for (size_t i = 0; i < LANES; ++i) {
    uint64_t lane = rotl(s[i] + h[i], 23) ^ h[(i + 1) % LANES];
    lane = boost::endian::native_to_little(lane);
    std::memcpy(out.data() + i * sizeof(uint64_t), &lane, sizeof(lane));
  }
  return out;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

VdfEngine::VdfEngine(const config::ProofConfig& config)
  : config_(config)
  , iterations_(config.min_iterations) {
  config_.validate();
  BOOST_LOG_TRIVIAL(debug) << "VDF engine: Initialized with " << iterations_ << " iterations per chunk, checkpoint every "
                           << config_.checkpoint_interval;
}

void VdfEngine::set_iterations(uint64_t iterations) {
  if (iterations < config_.min_iterations) {
    throw InsufficientIterationsError(std::to_string(iterations) + " < minimum " +
                                      std::to_string(config_.min_iterations));
  }
  iterations_ = iterations;
}

//==============================================
// CHAIN SETUP
//==============================================

Digest VdfEngine::chain_seed(const PublicKey& public_key, uint32_t copy_index) {
  uint32_t net_copy_index = boost::endian::native_to_big(copy_index);
  crypto::Hasher hasher;
  return hasher.update(SEED_DOMAIN)
               .update(public_key.data(), public_key.size())
               .update(&net_copy_index, sizeof(net_copy_index))
               .finalize();
}

TransformState VdfEngine::initial_state(const Bytes& chunk_data, const ChunkBinding& binding,
                                        const Digest& previous_state) {
  crypto::Hasher hasher;
  return hasher.update(INITIAL_DOMAIN)
               .update(chunk_data)
               .update(binding.server_binding)
               .update(binding.key_binding.data(), binding.key_binding.size())
               .update(previous_state)
               .finalize();
}

//==============================================
// SEQUENTIAL TRANSFORM
//==============================================

TransformState VdfEngine::step(const TransformState& state, crypto::Hasher& hasher) {
  return mix(state, hasher.update(state).finalize());
}

TransformState VdfEngine::advance(const TransformState& start, uint64_t steps) {
  crypto::Hasher hasher;
  TransformState state = start;
  for (uint64_t i = 0; i < steps; ++i) {
    state = step(state, hasher);
  }
  return state;
}

VdfResult VdfEngine::compute(const TransformState& initial, const crypto::KeyPair& key,
                             const CancellationToken& token) const {
  ChunkTransform transform(*this, initial);
  return transform.run(key, token);
}

//==============================================
// VERIFICATION
//==============================================

void VdfEngine::check_structure(const VdfResult& result) const {
  if (result.iterations < config_.min_iterations) {
    BOOST_LOG_TRIVIAL(warning) << "VDF engine: Rejected result with " << result.iterations
                               << " iterations (minimum " << config_.min_iterations << ")";
    throw InsufficientIterationsError(std::to_string(result.iterations) + " < minimum " +
                                      std::to_string(config_.min_iterations));
  }

  const uint64_t expected = result.iterations / config_.checkpoint_interval;
  if (result.checkpoints.size() != expected) {
    throw CheckpointMismatchError("expected " + std::to_string(expected) + " checkpoints, got " +
                                  std::to_string(result.checkpoints.size()));
  }
}

void VdfEngine::verify_checkpoint(const TransformState& initial, const VdfResult& result, size_t index) const {
  if (index >= result.checkpoints.size()) {
    throw CheckpointMismatchError("checkpoint index " + std::to_string(index) + " out of range");
  }

  const TransformState& start = index == 0 ? initial : result.checkpoints[index - 1];
  TransformState replayed = advance(start, config_.checkpoint_interval);
  if (replayed != result.checkpoints[index]) {
    BOOST_LOG_TRIVIAL(warning) << "VDF engine: Checkpoint " << index << " does not match replay";
    throw CheckpointMismatchError("checkpoint " + std::to_string(index) + " does not match replay");
  }
  BOOST_LOG_TRIVIAL(trace) << "VDF engine: Checkpoint " << index << " verified";
}

void VdfEngine::verify_final_segment(const TransformState& initial, const VdfResult& result) const {
  const uint64_t covered = result.checkpoints.size() * config_.checkpoint_interval;
  if (covered > result.iterations) {
    throw CheckpointMismatchError("checkpoints cover more iterations than claimed");
  }

  const TransformState& start = result.checkpoints.empty() ? initial : result.checkpoints.back();
  if (advance(start, result.iterations - covered) != result.final_state) {
    BOOST_LOG_TRIVIAL(warning) << "VDF engine: Final state does not match replay of the last segment";
    throw CheckpointMismatchError("final state does not match replay");
  }
}

void VdfEngine::verify(const TransformState& initial, const VdfResult& result, const PublicKey& public_key) const {
  check_structure(result);

  crypto::require_valid_signature(public_key, Bytes(result.final_state.begin(), result.final_state.end()),
                                  result.signature, "VDF final state");

  std::vector<size_t> indexes(result.checkpoints.size());
  std::iota(indexes.begin(), indexes.end(), 0);

  std::vector<size_t> sampled;
  if (config_.spot_check_samples >= indexes.size()) {
    sampled = indexes;
  } else {
    std::mt19937_64 rng(std::random_device{}());
    std::sample(indexes.begin(), indexes.end(), std::back_inserter(sampled),
                config_.spot_check_samples, rng);
  }

  for (size_t index : sampled) {
    verify_checkpoint(initial, result, index);
  }
  verify_final_segment(initial, result);

  BOOST_LOG_TRIVIAL(debug) << "VDF engine: Verified result of " << result.iterations << " iterations ("
                           << sampled.size() << " of " << result.checkpoints.size() << " segments replayed)";
}

//==============================================
// CALIBRATION
//==============================================

uint64_t VdfEngine::calibrate_iterations(uint64_t sample_iterations) const {
  if (sample_iterations == 0) {
    throw ProofError("VDF engine: calibration needs at least one sample iteration");
  }

  TransformState state{};
  auto start = std::chrono::steady_clock::now();
  state = advance(state, sample_iterations);
  auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  elapsed = std::max(elapsed, 1e-6);

  const double rate = static_cast<double>(sample_iterations) / elapsed;
  const double per_chunk_seconds = std::chrono::duration<double>(config_.target_total_time).count() /
                                   static_cast<double>(config_.standard_chunk_count);
  auto per_chunk = static_cast<uint64_t>(rate * per_chunk_seconds);

  // Round up to whole checkpoint segments
  const uint64_t interval = config_.checkpoint_interval;
  per_chunk = ((per_chunk + interval - 1) / interval) * interval;
  per_chunk = std::max(per_chunk, config_.min_iterations);

  BOOST_LOG_TRIVIAL(info) << "VDF engine: Calibrated " << static_cast<uint64_t>(rate) << " iterations/s, "
                          << per_chunk << " iterations per chunk";
  return per_chunk;
}

//==============================================
// CHUNK TRANSFORM
//==============================================

ChunkTransform::ChunkTransform(const VdfEngine& engine, const TransformState& initial)
  : engine_(engine)
  , initial_(initial) {
}

const VdfResult& ChunkTransform::run(const crypto::KeyPair& key, const CancellationToken& token) {
  State expected = State::Initialized;
  if (!state_.compare_exchange_strong(expected, State::Running)) {
    throw ProofError(std::string("VDF engine: transform already ") + to_string(expected));
  }

  const uint64_t iterations = engine_.iterations();
  const uint64_t interval = engine_.checkpoint_interval();

  result_ = VdfResult{};
  result_.iterations = iterations;
  result_.checkpoints.reserve(iterations / interval);

  crypto::Hasher hasher;
  TransformState state = initial_;

  // Iteration k consumes the output of iteration k-1
  for (uint64_t k = 1; k <= iterations; ++k) {
    state = VdfEngine::step(state, hasher);

    if (k % interval == 0) {
      result_.checkpoints.push_back(state);
      BOOST_LOG_TRIVIAL(trace) << "VDF engine: Checkpoint " << result_.checkpoints.size() << " at iteration " << k;
    }

    if (k % VdfEngine::CANCEL_CHECK_STRIDE == 0 && token.is_cancelled()) {
      state_ = State::Cancelled;
      result_ = VdfResult{};
      BOOST_LOG_TRIVIAL(info) << "VDF engine: Transform cancelled at iteration " << k;
      throw TransformCancelledError("cancelled at iteration " + std::to_string(k));
    }
  }

  result_.final_state = state;
  result_.signature = key.sign(state.data(), state.size());
  state_ = State::Completed;
  return result_;
}

const char* to_string(ChunkTransform::State state) {
  switch (state) {
    case ChunkTransform::State::Initialized: return "Initialized";
    case ChunkTransform::State::Running:     return "Running";
    case ChunkTransform::State::Completed:   return "Completed";
    case ChunkTransform::State::Cancelled:   return "Cancelled";
    default:                                 return "Unknown";
  }
}

} // namespace pous::proof
