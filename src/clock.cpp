#include "proofman/clock.hpp"

#include <chrono>

namespace proofman {

Timestamp SystemClock::now() const {
  using namespace std::chrono;
  const auto wall = static_cast<Timestamp>(
      duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
  Timestamp prev = last_.load(std::memory_order_acquire);
  while (wall > prev && !last_.compare_exchange_weak(prev, wall, std::memory_order_acq_rel)) {
  }
  return wall > prev ? wall : prev;
}

bool ManualClock::set(Timestamp t) {
  Timestamp cur = now_.load(std::memory_order_acquire);
  while (t >= cur) {
    if (now_.compare_exchange_weak(cur, t, std::memory_order_acq_rel)) return true;
  }
  return false;
}

}  // namespace proofman
