#ifndef POUS_PROOF_ERROR_HPP
#define POUS_PROOF_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pous::proof {

class ProofError : public std::runtime_error {
public:
    explicit ProofError(const std::string& message) 
        : std::runtime_error(message) {}
};

// Invalid file size or planner configuration
class ChunkPlanError : public ProofError {
public:
    explicit ChunkPlanError(const std::string& message) 
        : ProofError("Chunk plan error: " + message) {}
};

// Claimed proof ran fewer iterations than the configured minimum
class InsufficientIterationsError : public ProofError {
public:
    explicit InsufficientIterationsError(const std::string& message) 
        : ProofError("Insufficient iterations: " + message) {}
};

// Recomputed binding differs from the claimed one
class BindingMismatchError : public ProofError {
public:
    explicit BindingMismatchError(const std::string& message) 
        : ProofError("Binding mismatch: " + message) {}
};

// A checkpoint or the final state does not match an independent replay
class CheckpointMismatchError : public ProofError {
public:
    explicit CheckpointMismatchError(const std::string& message) 
        : ProofError("Checkpoint mismatch: " + message) {}
};

// Response arrived after the challenge deadline
class TimingViolationError : public ProofError {
public:
    explicit TimingViolationError(const std::string& message) 
        : ProofError("Timing violation: " + message) {}
};

// Restored bytes do not hash to the recorded checksum
class RestorationVerificationError : public ProofError {
public:
    explicit RestorationVerificationError(const std::string& message) 
        : ProofError("Restoration verification failed: " + message) {}
};

// Response served from a location other than the registered one
class LocationMismatchError : public ProofError {
public:
    explicit LocationMismatchError(const std::string& message) 
        : ProofError("Location mismatch: " + message) {}
};

// Transform stopped through its cancellation token, no result exists
class TransformCancelledError : public ProofError {
public:
    explicit TransformCancelledError(const std::string& message) 
        : ProofError("Transform cancelled: " + message) {}
};

// Key-location registration outside the current epoch
class StaleEpochError : public ProofError {
public:
    explicit StaleEpochError(const std::string& message) 
        : ProofError("Stale epoch: " + message) {}
};

} // namespace pous::proof

#endif // POUS_PROOF_ERROR_HPP
