#include "proofman/transitions.hpp"

#include <iterator>

namespace proofman {

namespace {

using S = RequestStatus;

const Transition kLegal[] = {
  { S::pending_acknowledgement, S::committed },
  { S::pending_acknowledgement, S::refused },
  { S::pending_acknowledgement, S::unacknowledged },
  { S::committed,               S::proven },
  { S::committed,               S::timed_out },
  { S::proven,                  S::validated },
  { S::proven,                  S::validation_failed },
  { S::validated,               S::paid },
};

const Transition kSubmitter[] = {
  { S::proven, S::validated },
  { S::proven, S::validation_failed },
};

template <std::size_t N>
bool in_table(const Transition (&table)[N], S from, S to) {
  for (const auto& t : table) {
    if (t.from == from && t.to == to) return true;
  }
  return false;
}

}  // namespace

bool is_legal_transition(RequestStatus from, RequestStatus to) {
  return in_table(kLegal, from, to);
}

bool is_submitter_transition(RequestStatus from, RequestStatus to) {
  return in_table(kSubmitter, from, to);
}

bool is_terminal(RequestStatus status) {
  switch (status) {
    case S::refused:
    case S::unacknowledged:
    case S::timed_out:
    case S::validation_failed:
    case S::paid:
      return true;
    default:
      return false;
  }
}

bool is_expirable(RequestStatus status) {
  return status == S::pending_acknowledgement || status == S::committed;
}

const std::vector<Transition>& legal_transitions() {
  static const std::vector<Transition> all(std::begin(kLegal), std::end(kLegal));
  return all;
}

}  // namespace proofman
