#include "proofman/types.hpp"
#include "proofman/jsonlite.hpp"

#include <sstream>

namespace proofman {

bool is_zero_address(const Address& addr) {
  if (addr.empty()) return true;
  std::size_t start = 0;
  if (addr.size() >= 2 && addr[0] == '0' && (addr[1] == 'x' || addr[1] == 'X')) start = 2;
  for (std::size_t i = start; i < addr.size(); ++i) {
    if (addr[i] != '0') return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::unauthorized_admin: return "unauthorized_admin";
    case ErrorCode::unauthorized_submitter: return "unauthorized_submitter";
    case ErrorCode::unauthorized_network: return "unauthorized_network";
    case ErrorCode::invalid_network: return "invalid_network";
    case ErrorCode::zero_address: return "zero_address";
    case ErrorCode::duplicate_network_address: return "duplicate_network_address";
    case ErrorCode::duplicate_request: return "duplicate_request";
    case ErrorCode::invalid_timeout: return "invalid_timeout";
    case ErrorCode::reward_out_of_bounds: return "reward_out_of_bounds";
    case ErrorCode::empty_proof: return "empty_proof";
    case ErrorCode::request_not_found: return "request_not_found";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::invalid_status: return "invalid_status";
    case ErrorCode::invalid_transition: return "invalid_transition";
    case ErrorCode::ack_deadline_passed: return "ack_deadline_passed";
    case ErrorCode::proving_deadline_passed: return "proving_deadline_passed";
    case ErrorCode::no_funds_available: return "no_funds_available";
    case ErrorCode::no_payment_due: return "no_payment_due";
    case ErrorCode::insufficient_funds: return "insufficient_funds";
    case ErrorCode::transfer_failed: return "transfer_failed";
    case ErrorCode::empty_queue: return "empty_queue";
    case ErrorCode::key_not_found: return "key_not_found";
    case ErrorCode::duplicate_key: return "duplicate_key";
    case ErrorCode::invariant_violation: return "invariant_violation";
  }
  return "";
}

std::string to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::none:          return "none";
    case ErrorCategory::authorization: return "authorization";
    case ErrorCategory::validation:    return "validation";
    case ErrorCategory::state:         return "state";
    case ErrorCategory::temporal:      return "temporal";
    case ErrorCategory::resource:      return "resource";
    case ErrorCategory::downstream:    return "downstream";
    case ErrorCategory::internal:      return "internal";
  }
  return "internal";
}

ErrorCategory error_category(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:
      return ErrorCategory::none;
    case ErrorCode::unauthorized_admin:
    case ErrorCode::unauthorized_submitter:
    case ErrorCode::unauthorized_network:
      return ErrorCategory::authorization;
    case ErrorCode::invalid_network:
    case ErrorCode::zero_address:
    case ErrorCode::duplicate_network_address:
    case ErrorCode::duplicate_request:
    case ErrorCode::invalid_timeout:
    case ErrorCode::reward_out_of_bounds:
    case ErrorCode::empty_proof:
    case ErrorCode::request_not_found:
    case ErrorCode::config_invalid:
      return ErrorCategory::validation;
    case ErrorCode::invalid_status:
    case ErrorCode::invalid_transition:
      return ErrorCategory::state;
    case ErrorCode::ack_deadline_passed:
    case ErrorCode::proving_deadline_passed:
      return ErrorCategory::temporal;
    case ErrorCode::no_funds_available:
    case ErrorCode::no_payment_due:
    case ErrorCode::insufficient_funds:
      return ErrorCategory::resource;
    case ErrorCode::transfer_failed:
      return ErrorCategory::downstream;
    case ErrorCode::empty_queue:
    case ErrorCode::key_not_found:
    case ErrorCode::duplicate_key:
    case ErrorCode::invariant_violation:
      return ErrorCategory::internal;
  }
  return ErrorCategory::internal;
}

bool is_retryable(ErrorCode code) {
  return code == ErrorCode::no_funds_available ||
         code == ErrorCode::insufficient_funds ||
         code == ErrorCode::transfer_failed;
}

// ---------------------------------------------------------------------------
// Enum <-> string
// ---------------------------------------------------------------------------

std::string to_string(RequestStatus status) {
  switch (status) {
    case RequestStatus::pending_acknowledgement: return "pending_acknowledgement";
    case RequestStatus::committed:               return "committed";
    case RequestStatus::refused:                 return "refused";
    case RequestStatus::unacknowledged:          return "unacknowledged";
    case RequestStatus::proven:                  return "proven";
    case RequestStatus::timed_out:               return "timed_out";
    case RequestStatus::validated:               return "validated";
    case RequestStatus::validation_failed:       return "validation_failed";
    case RequestStatus::paid:                    return "paid";
  }
  return "unknown";
}

std::optional<RequestStatus> request_status_from_string(const std::string& s) {
  for (std::size_t i = 0; i < kRequestStatusCount; ++i) {
    const auto st = static_cast<RequestStatus>(i);
    if (to_string(st) == s) return st;
  }
  return std::nullopt;
}

std::string to_string(ProvingNetwork network) {
  switch (network) {
    case ProvingNetwork::none:     return "none";
    case ProvingNetwork::fermah:   return "fermah";
    case ProvingNetwork::lagrange: return "lagrange";
  }
  return "none";
}

std::optional<ProvingNetwork> proving_network_from_string(const std::string& s) {
  if (s == "none")     return ProvingNetwork::none;
  if (s == "fermah")   return ProvingNetwork::fermah;
  if (s == "lagrange") return ProvingNetwork::lagrange;
  return std::nullopt;
}

std::string to_string(NetworkStatus status) {
  return status == NetworkStatus::active ? "active" : "inactive";
}

std::optional<NetworkStatus> network_status_from_string(const std::string& s) {
  if (s == "active")   return NetworkStatus::active;
  if (s == "inactive") return NetworkStatus::inactive;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// RequestKey / ProofRequest
// ---------------------------------------------------------------------------

std::string RequestKey::to_string() const {
  return std::to_string(chain_id) + ":" + std::to_string(block_number);
}

Timestamp ProofRequest::proving_deadline() const {
  return submitted_at + params.timeout_after;
}

std::string ProofRequest::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"chain_id\":" << key.chain_id
    << ",\"block_number\":" << key.block_number
    << ",\"request_id\":" << request_id
    << ",\"status\":\"" << to_string(status) << "\""
    << ",\"assigned_to\":\"" << to_string(assigned_to) << "\""
    << ",\"submitted_at\":" << submitted_at
    << ",\"proof_inputs_url\":\"" << jsonlite::escape(params.proof_inputs_url) << "\""
    << ",\"protocol_version\":\"" << params.protocol_major << "." << params.protocol_minor
    << "." << params.protocol_patch << "\""
    << ",\"timeout_after\":" << params.timeout_after
    << ",\"max_reward\":" << params.max_reward
    << ",\"requested_reward\":" << requested_reward
    << ",\"proof_bytes\":" << proof.size()
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

Status Status::error(ErrorCode code, std::string detail) {
  Status s;
  s.code   = code;
  s.detail = std::move(detail);
  return s;
}

Status Status::bad_status(RequestStatus current, std::string detail) {
  Status s;
  s.code    = ErrorCode::invalid_status;
  s.current = current;
  s.detail  = detail.empty() ? "request is " + to_string(current) : std::move(detail);
  return s;
}

Status Status::bad_transition(RequestStatus from, RequestStatus to) {
  Status s;
  s.code   = ErrorCode::invalid_transition;
  s.from   = from;
  s.to     = to;
  s.detail = "transition " + to_string(from) + " -> " + to_string(to) + " is not allowed";
  return s;
}

std::string Status::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok() ? "true" : "false");
  if (!ok()) {
    o << ",\"error_code\":\"" << to_string(code) << "\""
      << ",\"category\":\"" << to_string(error_category(code)) << "\""
      << ",\"retryable\":" << (is_retryable(code) ? "true" : "false");
    if (!detail.empty()) o << ",\"detail\":\"" << jsonlite::escape(detail) << "\"";
    if (current) o << ",\"current_status\":\"" << to_string(*current) << "\"";
    if (from) o << ",\"from\":\"" << to_string(*from) << "\"";
    if (to) o << ",\"to\":\"" << to_string(*to) << "\"";
  }
  o << "}";
  return o.str();
}

}  // namespace proofman
