#pragma once

// proofman/rbac.hpp - Role-based access control for ledger operations.
//
// DESIGN:
//   Every mutating ledger call names the caller's address. Administrative and
//   submitter calls are gated by role membership, looked up through the
//   AccessControl capability the host injects. Proving-network calls are not
//   role-gated: they compare the caller with the registry address of the
//   network the request is assigned to (see registry.hpp).
//
// ROLES (flat, NOT ordered):
//   submitter - submits requests and reports validation results.
//   admin     - manages network addresses, statuses and the preferred network.
//   An admin does not implicitly hold submitter and vice versa. A deployment
//   that wants both grants both.
//
// INVARIANTS:
//   - Role checks run before any other validation of the call.
//   - Fail-closed: a permission missing from the table requires admin.
//   - check() never throws and never mutates.
//
// EXTENSION_POINT: access_control_backend
//   Current: RoleTable, an in-memory address set per role.
//   Upgrade: adapt an external role registry by implementing AccessControl.
//   The check() interface is stable.

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "proofman/types.hpp"

namespace proofman {
namespace rbac {

// ---------------------------------------------------------------------------
// Role
// ---------------------------------------------------------------------------
enum class Role : uint8_t {
  submitter = 0,
  admin     = 1,
};

std::optional<Role> role_from_string(const std::string& s);
std::string role_to_string(Role r);

// ---------------------------------------------------------------------------
// Permission - one entry per gated ledger operation
// ---------------------------------------------------------------------------
enum class Permission {
  // Admin
  network_address_set,
  network_status_set,
  preferred_network_set,

  // Submitter
  request_submit,
  validation_submit,
  status_update,
};

// Role that grants the permission.
Role required_role(Permission permission);

// Error code reported when the caller lacks the permission's role.
ErrorCode denial_code(Permission permission);

// ---------------------------------------------------------------------------
// AccessControl - injected role-membership capability
// ---------------------------------------------------------------------------
class AccessControl {
 public:
  virtual ~AccessControl() = default;
  virtual bool has_role(Role role, const Address& account) const = 0;
};

// In-memory role table. Thread-safe.
class RoleTable final : public AccessControl {
 public:
  bool has_role(Role role, const Address& account) const override;

  // Returns false if the account already held the role (or is a zero address).
  bool grant(Role role, const Address& account);
  // Returns false if the account did not hold the role.
  bool revoke(Role role, const Address& account);

 private:
  mutable std::mutex mu_;
  std::set<std::pair<Role, Address>> members_;
};

// ---------------------------------------------------------------------------
// RbacContext - result of an RBAC check
// ---------------------------------------------------------------------------
struct RbacContext {
  bool        ok{false};
  Role        role{Role::admin};  // role the permission required
  Address     caller;
  ErrorCode   code{ErrorCode::none};
  std::string denial_reason;      // non-empty if !ok

  std::string to_json() const;
};

RbacContext check(const AccessControl& ac, const Address& caller, Permission permission);

}  // namespace rbac
}  // namespace proofman
