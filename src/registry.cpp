#include "proofman/registry.hpp"

#include <initializer_list>
#include <sstream>

#include "proofman/jsonlite.hpp"

namespace proofman {

std::string ProvingNetworkInfo::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"address\":\"" << jsonlite::escape(address) << "\""
    << ",\"status\":\"" << to_string(status) << "\""
    << ",\"owed_reward\":" << owed_reward
    << ",\"unpaid\":[";
  for (std::size_t i = 0; i < unpaid.size(); ++i) {
    if (i) o << ",";
    o << "\"" << unpaid[i].to_string() << "\"";
  }
  o << "]}";
  return o.str();
}

NetworkRegistry::NetworkRegistry(Address fermah_address, Address lagrange_address) {
  networks_[slot(ProvingNetwork::fermah)].address   = std::move(fermah_address);
  networks_[slot(ProvingNetwork::lagrange)].address = std::move(lagrange_address);
}

const ProvingNetworkInfo* NetworkRegistry::find(ProvingNetwork network) const {
  if (!is_real(network)) return nullptr;
  return &networks_[slot(network)];
}

ProvingNetworkInfo* NetworkRegistry::find_mut(ProvingNetwork network) {
  if (!is_real(network)) return nullptr;
  return &networks_[slot(network)];
}

Status NetworkRegistry::set_address(ProvingNetwork network, const Address& address) {
  ProvingNetworkInfo* info = find_mut(network);
  if (!info) return Status::error(ErrorCode::invalid_network, "network 'none' has no address");
  if (is_zero_address(address)) return Status::error(ErrorCode::zero_address);
  const ProvingNetwork holder = network_for_address(address);
  if (holder != ProvingNetwork::none && holder != network) {
    return Status::error(ErrorCode::duplicate_network_address,
                         "address already registered to " + to_string(holder));
  }
  info->address = address;
  return Status::success();
}

Status NetworkRegistry::set_status(ProvingNetwork network, NetworkStatus status) {
  ProvingNetworkInfo* info = find_mut(network);
  if (!info) return Status::error(ErrorCode::invalid_network, "network 'none' has no status");
  info->status = status;
  return Status::success();
}

ProvingNetwork NetworkRegistry::network_for_address(const Address& address) const {
  if (is_zero_address(address)) return ProvingNetwork::none;
  for (ProvingNetwork n : {ProvingNetwork::fermah, ProvingNetwork::lagrange}) {
    if (networks_[slot(n)].address == address) return n;
  }
  return ProvingNetwork::none;
}

bool NetworkRegistry::is_active(ProvingNetwork network) const {
  const ProvingNetworkInfo* info = find(network);
  return info && info->status == NetworkStatus::active;
}

Amount NetworkRegistry::total_owed() const {
  Amount total = 0;
  for (const auto& n : networks_) total += n.owed_reward;
  return total;
}

void NetworkRegistry::credit(ProvingNetwork network, const RequestKey& key, Amount amount) {
  ProvingNetworkInfo* info = find_mut(network);
  if (!info) return;
  info->owed_reward += amount;
  info->unpaid.push_back(key);
}

std::vector<RequestKey> NetworkRegistry::settle(ProvingNetwork network) {
  ProvingNetworkInfo* info = find_mut(network);
  if (!info) return {};
  std::vector<RequestKey> keys;
  keys.swap(info->unpaid);
  info->owed_reward = 0;
  return keys;
}

std::string NetworkRegistry::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"fermah\":" << networks_[slot(ProvingNetwork::fermah)].to_json()
    << ",\"lagrange\":" << networks_[slot(ProvingNetwork::lagrange)].to_json()
    << ",\"preferred\":\"" << to_string(preferred_) << "\""
    << "}";
  return o.str();
}

}  // namespace proofman
