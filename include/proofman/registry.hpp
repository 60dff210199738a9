#pragma once

// proofman/registry.hpp - Proving network registry.
//
// Exactly two real networks (fermah, lagrange) plus the `none` sentinel.
// Each real network carries:
//   address      the only account allowed to act for the network
//   status       inactive networks get every newly assigned request refused
//   owed_reward  validated, unpaid rewards; reset to zero by a claim
//   unpaid       keys behind owed_reward, oldest first; marked paid by a claim
//
// INVARIANTS:
//   - owed_reward == sum of requested_reward over `unpaid`.
//   - The two addresses are never zero and never equal.
//   - `none` is rejected (invalid_network) by every mutator.
//
// Not thread-safe: the owning ProofManager serializes access.

#include <array>
#include <string>
#include <vector>

#include "proofman/types.hpp"

namespace proofman {

struct ProvingNetworkInfo {
  Address                 address;
  NetworkStatus           status{NetworkStatus::active};
  Amount                  owed_reward{0};
  std::vector<RequestKey> unpaid;

  std::string to_json() const;
};

class NetworkRegistry {
 public:
  NetworkRegistry(Address fermah_address, Address lagrange_address);

  static bool is_real(ProvingNetwork network) { return network != ProvingNetwork::none; }

  // nullptr for `none`.
  const ProvingNetworkInfo* find(ProvingNetwork network) const;

  Status set_address(ProvingNetwork network, const Address& address);
  Status set_status(ProvingNetwork network, NetworkStatus status);

  ProvingNetwork preferred() const { return preferred_; }
  void set_preferred(ProvingNetwork network) { preferred_ = network; }

  // The real network registered at `address`, or `none`.
  ProvingNetwork network_for_address(const Address& address) const;

  bool is_active(ProvingNetwork network) const;

  // Sum of owed_reward over both networks.
  Amount total_owed() const;

  // Record a validated request against the network.
  void credit(ProvingNetwork network, const RequestKey& key, Amount amount);

  // Zero the owed balance and hand back the keys it covered.
  std::vector<RequestKey> settle(ProvingNetwork network);

  std::string to_json() const;

 private:
  static std::size_t slot(ProvingNetwork network) {
    return static_cast<std::size_t>(network) - 1;
  }
  ProvingNetworkInfo* find_mut(ProvingNetwork network);

  std::array<ProvingNetworkInfo, kProvingNetworkCount> networks_;
  ProvingNetwork preferred_{ProvingNetwork::none};
};

}  // namespace proofman
