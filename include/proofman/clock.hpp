#pragma once

// proofman/clock.hpp - Time source consumed by the ledger.
//
// INVARIANT: now() never decreases. Deadlines are always compared against a
// fresh now() reading at the moment of the check, never cached.

#include <atomic>

#include "proofman/types.hpp"

namespace proofman {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual Timestamp now() const = 0;
};

// Wall clock in unix seconds. Clamped so that a backwards step of the system
// clock is reported as "no time passed" rather than going back in time.
class SystemClock final : public Clock {
 public:
  Timestamp now() const override;

 private:
  mutable std::atomic<Timestamp> last_{0};
};

// Settable clock for tests and script replay.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(Timestamp start = 0) : now_(start) {}

  Timestamp now() const override { return now_.load(std::memory_order_acquire); }

  void advance(Timestamp seconds) { now_.fetch_add(seconds, std::memory_order_acq_rel); }

  // Returns false (and leaves the clock untouched) if t is in the past.
  bool set(Timestamp t);

 private:
  std::atomic<Timestamp> now_;
};

}  // namespace proofman
