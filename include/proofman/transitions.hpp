#pragma once

// proofman/transitions.hpp - Proof request state machine tables.
//
//   pending_acknowledgement -> committed | refused | unacknowledged
//   committed               -> proven | timed_out
//   proven                  -> validated | validation_failed
//   validated               -> paid
//
// Every other ordered pair (including self-transitions) is illegal.
// Terminal: refused, unacknowledged, timed_out, validation_failed, paid.
//
// The submitter table is the subset a submitter may request through the
// generic status-update entry point: proven -> validated | validation_failed.

#include <vector>

#include "proofman/types.hpp"

namespace proofman {

struct Transition {
  RequestStatus from;
  RequestStatus to;
};

bool is_legal_transition(RequestStatus from, RequestStatus to);
bool is_submitter_transition(RequestStatus from, RequestStatus to);
bool is_terminal(RequestStatus status);

// True while the request holds an expiry queue entry.
bool is_expirable(RequestStatus status);

// The full table, in declaration order.
const std::vector<Transition>& legal_transitions();

}  // namespace proofman
