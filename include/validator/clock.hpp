#ifndef POUS_VALIDATOR_CLOCK_HPP
#define POUS_VALIDATOR_CLOCK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace pous {
namespace validator {

// Millisecond wall clock. Injected so tests can move time by hand.
class Clock {
public:
  virtual ~Clock() = default;
  // Milliseconds since the Unix epoch
  virtual int64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
  int64_t now_ms() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch()).count();
  }
};

// Clock that only moves when told to
class ManualClock : public Clock {
public:
  explicit ManualClock(int64_t start_ms = 0) : now_(start_ms) {}

  int64_t now_ms() const override { return now_.load(); }
  void set(int64_t now_ms) { now_.store(now_ms); }
  void advance(int64_t delta_ms) { now_.fetch_add(delta_ms); }

private:
  std::atomic<int64_t> now_;
};

} // namespace validator
} // namespace pous

#endif // POUS_VALIDATOR_CLOCK_HPP
