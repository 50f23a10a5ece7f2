#ifndef POUS_PROOF_VDF_ENGINE_HPP
#define POUS_PROOF_VDF_ENGINE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include "config/proof_config.hpp"
#include "crypto/hash.hpp"
#include "proof/types.hpp"

namespace pous::proof {

// Shared cancellation flag handed to long-running transforms. Copies
// observe the same flag.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  // A moved-from token has no flag and is never cancelled
  void cancel() const {
    if (flag_) {
      flag_->store(true);
    }
  }
  bool is_cancelled() const { return flag_ && flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

class VdfEngine {
public:
  // Iterations between two looks at the cancellation token
  static constexpr uint64_t CANCEL_CHECK_STRIDE = 1024;

  // ---- CONSTRUCTOR ----
  explicit VdfEngine(const config::ProofConfig& config);


  // ---- CHAIN SETUP ----
  // Previous state of chunk 0 of a copy
  static Digest chain_seed(const PublicKey& public_key, uint32_t copy_index);
  // SHA-256(domain || chunk || server binding || key binding || previous state)
  static TransformState initial_state(const Bytes& chunk_data, const ChunkBinding& binding,
                                      const Digest& previous_state);


  // ---- SEQUENTIAL TRANSFORM ----
  // One iteration: state <- mix(state, SHA-256(state))
  static TransformState step(const TransformState& state, crypto::Hasher& hasher);
  // Replays `steps` iterations from `start`
  static TransformState advance(const TransformState& start, uint64_t steps);
  // Runs iterations() steps, recording checkpoints and signing the final state.
  // Throws TransformCancelledError if the token fires.
  VdfResult compute(const TransformState& initial, const crypto::KeyPair& key,
                    const CancellationToken& token = CancellationToken()) const;


  // ---- VERIFICATION ----
  // Checks minimum iterations, checkpoint count, the signature and replays
  // spot_check_samples random checkpoint segments plus the final segment.
  // Cost grows with the replayed segments only, it is not succinct.
  void verify(const TransformState& initial, const VdfResult& result, const PublicKey& public_key) const;
  // Replays the segment ending at checkpoint `index`
  void verify_checkpoint(const TransformState& initial, const VdfResult& result, size_t index) const;
  // Replays the segment from the last checkpoint to the final state
  void verify_final_segment(const TransformState& initial, const VdfResult& result) const;


  // ---- CALIBRATION ----
  // Measures the local step rate and returns per-chunk iterations so that
  // standard_chunk_count chunks take about target_total_time. Rounded up to
  // the checkpoint interval, never below min_iterations.
  uint64_t calibrate_iterations(uint64_t sample_iterations = 20000) const;


  // ---- GETTERS AND SETTERS ----
  uint64_t iterations() const { return iterations_; }
  // Throws InsufficientIterationsError below the configured minimum
  void set_iterations(uint64_t iterations);
  uint64_t checkpoint_interval() const { return config_.checkpoint_interval; }
  const config::ProofConfig& config() const { return config_; }

private:
  config::ProofConfig config_;
  uint64_t iterations_;

  void check_structure(const VdfResult& result) const;
};

// Per-chunk run of the transform: Initialized -> Running -> Completed,
// or Cancelled when the token fires. A run is single use.
class ChunkTransform {
public:
  enum class State {
    Initialized,
    Running,
    Completed,
    Cancelled
  };

  ChunkTransform(const VdfEngine& engine, const TransformState& initial);

  const VdfResult& run(const crypto::KeyPair& key, const CancellationToken& token = CancellationToken());

  State state() const { return state_.load(); }
  const TransformState& initial_state() const { return initial_; }

private:
  const VdfEngine& engine_;
  TransformState initial_;
  std::atomic<State> state_{State::Initialized};
  VdfResult result_;
};

const char* to_string(ChunkTransform::State state);

} // namespace pous::proof

#endif // POUS_PROOF_VDF_ENGINE_HPP
