#pragma once

// proofman/escrow.hpp - Token capability the ledger pays proving networks from.
//
// DESIGN:
//   The ledger never holds funds itself. It reads the escrow address balance for
//   admission control and asks the token to move funds on claims. transfer() is
//   boolean-returning: a routine refusal (insufficient balance, frozen account)
//   is `false`, never an exception. The ledger maps `false` to transfer_failed
//   and leaves its own books untouched.
//
// InMemoryToken is the bundled implementation used by the CLI replay tool and
// the tests. It is thread-safe and supports failure injection.

#include <mutex>
#include <unordered_map>

#include "proofman/types.hpp"

namespace proofman {

class EscrowToken {
 public:
  virtual ~EscrowToken() = default;

  virtual Amount balance_of(const Address& holder) const = 0;

  // Move `amount` from `from` to `to`. Returns false if nothing was moved.
  virtual bool transfer(const Address& from, const Address& to, Amount amount) = 0;
};

class InMemoryToken final : public EscrowToken {
 public:
  Amount balance_of(const Address& holder) const override;
  bool transfer(const Address& from, const Address& to, Amount amount) override;

  // Credit `amount` to `holder` out of thin air (test/bootstrap only).
  void mint(const Address& holder, Amount amount);

  // Debit up to `amount` from `holder`, e.g. to simulate an outside drain of the
  // escrow. Returns the amount actually removed.
  Amount burn(const Address& holder, Amount amount);

  // When set, every transfer() returns false without moving funds.
  void set_fail_transfers(bool fail);

  std::uint64_t transfer_count() const;

 private:
  mutable std::mutex mu_;
  std::unordered_map<Address, Amount> balances_;
  bool fail_transfers_{false};
  std::uint64_t transfers_{0};
};

}  // namespace proofman
