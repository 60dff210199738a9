#include "proofman/escrow.hpp"

#include <limits>

namespace proofman {

Amount InMemoryToken::balance_of(const Address& holder) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = balances_.find(holder);
  return it == balances_.end() ? 0 : it->second;
}

bool InMemoryToken::transfer(const Address& from, const Address& to, Amount amount) {
  std::lock_guard<std::mutex> lock(mu_);
  if (fail_transfers_) return false;
  auto src = balances_.find(from);
  if (src == balances_.end() || src->second < amount) return false;
  Amount& dst = balances_[to];
  if (from != to && dst > std::numeric_limits<Amount>::max() - amount) return false;
  src = balances_.find(from);  // operator[] may have rehashed
  src->second -= amount;
  balances_[to] += amount;
  ++transfers_;
  return true;
}

void InMemoryToken::mint(const Address& holder, Amount amount) {
  std::lock_guard<std::mutex> lock(mu_);
  balances_[holder] += amount;
}

Amount InMemoryToken::burn(const Address& holder, Amount amount) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = balances_.find(holder);
  if (it == balances_.end()) return 0;
  const Amount removed = it->second < amount ? it->second : amount;
  it->second -= removed;
  return removed;
}

void InMemoryToken::set_fail_transfers(bool fail) {
  std::lock_guard<std::mutex> lock(mu_);
  fail_transfers_ = fail;
}

std::uint64_t InMemoryToken::transfer_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return transfers_;
}

}  // namespace proofman
