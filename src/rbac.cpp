#include "proofman/rbac.hpp"

#include <sstream>

#include "proofman/jsonlite.hpp"

namespace proofman {
namespace rbac {

std::optional<Role> role_from_string(const std::string& s) {
  if (s == "submitter") return Role::submitter;
  if (s == "admin")     return Role::admin;
  return std::nullopt;
}

std::string role_to_string(Role r) {
  switch (r) {
    case Role::submitter: return "submitter";
    case Role::admin:     return "admin";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Permission table
// ---------------------------------------------------------------------------

struct PermissionRule {
  Permission perm;
  Role       role;
  ErrorCode  denial;
};

static const PermissionRule kPermissionTable[] = {
  // Admin
  { Permission::network_address_set,   Role::admin,     ErrorCode::unauthorized_admin },
  { Permission::network_status_set,    Role::admin,     ErrorCode::unauthorized_admin },
  { Permission::preferred_network_set, Role::admin,     ErrorCode::unauthorized_admin },

  // Submitter
  { Permission::request_submit,        Role::submitter, ErrorCode::unauthorized_submitter },
  { Permission::validation_submit,     Role::submitter, ErrorCode::unauthorized_submitter },
  { Permission::status_update,         Role::submitter, ErrorCode::unauthorized_submitter },
};

static const PermissionRule* find_rule(Permission permission) {
  for (const auto& rule : kPermissionTable) {
    if (rule.perm == permission) return &rule;
  }
  return nullptr;
}

Role required_role(Permission permission) {
  const PermissionRule* rule = find_rule(permission);
  return rule ? rule->role : Role::admin;
}

ErrorCode denial_code(Permission permission) {
  const PermissionRule* rule = find_rule(permission);
  return rule ? rule->denial : ErrorCode::unauthorized_admin;
}

// ---------------------------------------------------------------------------
// RoleTable
// ---------------------------------------------------------------------------

bool RoleTable::has_role(Role role, const Address& account) const {
  std::lock_guard<std::mutex> lock(mu_);
  return members_.count({role, account}) != 0;
}

bool RoleTable::grant(Role role, const Address& account) {
  if (is_zero_address(account)) return false;
  std::lock_guard<std::mutex> lock(mu_);
  return members_.insert({role, account}).second;
}

bool RoleTable::revoke(Role role, const Address& account) {
  std::lock_guard<std::mutex> lock(mu_);
  return members_.erase({role, account}) != 0;
}

// ---------------------------------------------------------------------------
// check
// ---------------------------------------------------------------------------

RbacContext check(const AccessControl& ac, const Address& caller, Permission permission) {
  RbacContext ctx;
  ctx.caller = caller;
  ctx.role   = required_role(permission);

  if (ac.has_role(ctx.role, caller)) {
    ctx.ok = true;
  } else {
    ctx.code          = denial_code(permission);
    ctx.denial_reason = "caller lacks role '" + role_to_string(ctx.role) + "'";
  }
  return ctx;
}

std::string RbacContext::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"ok\":" << (ok ? "true" : "false")
    << ",\"role\":\"" << role_to_string(role) << "\""
    << ",\"caller\":\"" << jsonlite::escape(caller) << "\"";
  if (!ok) {
    o << ",\"error_code\":\"" << to_string(code) << "\""
      << ",\"denial_reason\":\"" << jsonlite::escape(denial_reason) << "\"";
  }
  o << "}";
  return o.str();
}

}  // namespace rbac
}  // namespace proofman
