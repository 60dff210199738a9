#pragma once

// proofman/admission.hpp - Funds-availability admission control and the
// network assignment policy.
//
// CAPACITY RULE:
//   O = owed(fermah) + owed(lagrange) + potential_future_reward
//   B = escrow token balance, R = reward ceiling, k = in-flight requests
//   capacity exists iff B >= O and (B - O) / R > k   (integer division)
//
//   Each in-flight request may still claim up to R, and the new request may
//   claim up to R as well, so one more free slot than in-flight requests is
//   required.
//
// INVARIANTS:
//   1. check_capacity is pure: it never touches the queue or the token.
//   2. k is the in-flight count AFTER the planned purge, so capacity freed by
//      stale requests is usable by the submission that purges them.
//   3. A failed check aborts the submission before anything is mutated,
//      including the purge.

#include <cstddef>
#include <string>

#include "proofman/types.hpp"

namespace proofman {

// ---------------------------------------------------------------------------
// CapacityCheck - outcome of a pre-submission capacity check
// ---------------------------------------------------------------------------
struct CapacityCheck {
  bool        allowed{false};
  Amount      escrow_balance{0};
  Amount      obligations{0};
  Amount      reward_ceiling{0};
  std::size_t in_flight{0};
  Amount      free_slots{0};  // (B - O) / R, 0 when B < O

  std::string to_json() const;
};

CapacityCheck check_capacity(Amount escrow_balance,
                             Amount obligations,
                             Amount reward_ceiling,
                             std::size_t in_flight);

// ---------------------------------------------------------------------------
// Assignment policy
// ---------------------------------------------------------------------------
// counter % 4 == 0 -> fermah, == 1 -> lagrange, otherwise `preferred`
// (which may be none). Evaluated with the counter value before increment.
ProvingNetwork assign_network(std::uint64_t counter, ProvingNetwork preferred);

}  // namespace proofman
