#include "proofman/admission.hpp"

#include <sstream>

namespace proofman {

CapacityCheck check_capacity(Amount escrow_balance,
                             Amount obligations,
                             Amount reward_ceiling,
                             std::size_t in_flight) {
  CapacityCheck c;
  c.escrow_balance = escrow_balance;
  c.obligations    = obligations;
  c.reward_ceiling = reward_ceiling;
  c.in_flight      = in_flight;

  if (reward_ceiling == 0 || escrow_balance < obligations) {
    c.allowed = false;
    return c;
  }
  c.free_slots = (escrow_balance - obligations) / reward_ceiling;
  c.allowed    = c.free_slots > static_cast<Amount>(in_flight);
  return c;
}

std::string CapacityCheck::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"allowed\":" << (allowed ? "true" : "false")
    << ",\"escrow_balance\":" << escrow_balance
    << ",\"obligations\":" << obligations
    << ",\"reward_ceiling\":" << reward_ceiling
    << ",\"in_flight\":" << in_flight
    << ",\"free_slots\":" << free_slots
    << "}";
  return o.str();
}

ProvingNetwork assign_network(std::uint64_t counter, ProvingNetwork preferred) {
  switch (counter % 4) {
    case 0:  return ProvingNetwork::fermah;
    case 1:  return ProvingNetwork::lagrange;
    default: return preferred;
  }
}

}  // namespace proofman
