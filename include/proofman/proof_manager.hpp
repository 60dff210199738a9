#pragma once

// proofman/proof_manager.hpp - Proof request escrow ledger.
//
// DESIGN:
//   ProofManager owns every request record, the proving network registry, the
//   expiry queue and the aggregate counters, and exposes every ledger
//   operation. It holds references to the three injected collaborators
//   (EscrowToken, AccessControl, Clock); the caller owns them and keeps them
//   alive for the manager's lifetime.
//
// CONCURRENCY:
//   Single writer. One mutex guards all state as a unit and every public call
//   (queries included) holds it for its whole duration, including the clock
//   read and the token calls. There is no background thread: expired requests
//   are purged only at the start of an admitted submission.
//
// INVARIANTS:
//   1. A request key is never recreated, whatever its status.
//   2. A request has an expiry queue entry iff its persisted status is
//      pending_acknowledgement or committed.
//   3. potential_future_reward == sum of requested_reward over proven requests.
//   4. owed_reward(n) == sum of requested_reward over validated requests
//      assigned to n.
//   5. Every failed call leaves all state untouched (no partial mutation).
//   6. Funds leave the escrow only through claim_reward, and the ledger is
//      updated only after the token confirmed the transfer.
//
// ERRORS:
//   Authorization is checked first, then existence, then status, then
//   deadlines, then payload. Network-gated calls need the request to find the
//   assignee, so for them existence comes before authorization.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "proofman/admission.hpp"
#include "proofman/audit.hpp"
#include "proofman/clock.hpp"
#include "proofman/config.hpp"
#include "proofman/escrow.hpp"
#include "proofman/expiry_queue.hpp"
#include "proofman/observability.hpp"
#include "proofman/rbac.hpp"
#include "proofman/registry.hpp"
#include "proofman/types.hpp"

namespace proofman {

struct ManagerDeps {
  EscrowToken&         token;
  rbac::AccessControl& access;
  Clock&               clock;
};

class ProofManager {
 public:
  // Returns nullptr and sets *error when the config fails validate_config
  // (config_invalid), when the escrow or a network address is zero
  // (zero_address), or when both networks share an address
  // (duplicate_network_address). Both networks start active; the preferred
  // network starts as none.
  static std::unique_ptr<ProofManager> create(const ManagerDeps& deps,
                                              const LedgerConfig& config,
                                              Status* error = nullptr);

  ProofManager(const ProofManager&) = delete;
  ProofManager& operator=(const ProofManager&) = delete;

  // -------------------------------------------------------------------------
  // Admin operations
  // -------------------------------------------------------------------------
  Status set_network_address(const Address& caller, ProvingNetwork network, const Address& address);
  Status set_network_status(const Address& caller, ProvingNetwork network, NetworkStatus status);
  Status set_preferred_network(const Address& caller, ProvingNetwork network);

  // -------------------------------------------------------------------------
  // Submitter operations
  // -------------------------------------------------------------------------

  // Creates the request as pending_acknowledgement, or directly as refused
  // when the assignee is none or inactive. Returns the created record.
  Result<ProofRequest> submit_request(const Address& caller,
                                      const RequestKey& key,
                                      const RequestParams& params);

  Status submit_validation_result(const Address& caller, const RequestKey& key, bool valid);

  // Generic status update. Only proven -> validated and
  // proven -> validation_failed are accepted (invalid_transition otherwise).
  Status update_status(const Address& caller, const RequestKey& key, RequestStatus new_status);

  // -------------------------------------------------------------------------
  // Proving network operations
  // -------------------------------------------------------------------------
  Status acknowledge(const Address& caller, const RequestKey& key, bool accept);

  // requested_reward is clamped to the request's max_reward.
  Status submit_proof(const Address& caller,
                      const RequestKey& key,
                      const Bytes& proof,
                      Amount requested_reward);

  // Pays the caller's network its whole owed balance in one transfer and
  // marks the covered requests paid. Returns the amount transferred.
  Result<Amount> claim_reward(const Address& caller);

  // -------------------------------------------------------------------------
  // Queries
  // -------------------------------------------------------------------------

  // Record with the lazily computed status: a pending request past its ack
  // deadline reads as unacknowledged, a committed request past its proving
  // deadline as timed_out, until the purge persists it.
  Result<ProofRequest> get_request(const RequestKey& key) const;

  std::optional<ProvingNetworkInfo> network_info(ProvingNetwork network) const;
  ProvingNetwork preferred_network() const;
  ProvingNetwork network_for_address(const Address& address) const;
  std::uint64_t request_counter() const;
  std::size_t in_flight_count() const;
  Amount potential_future_reward() const;

  // owed(fermah) + owed(lagrange) + potential_future_reward
  Amount total_obligations() const;

  // What a submission arriving now would see (after its planned purge).
  CapacityCheck check_capacity() const;

  std::string snapshot_json() const;

  const LedgerConfig& config() const { return config_; }
  EventLog& events() { return events_; }
  const ImmutableAuditLog& audit_log() const { return audit_; }

 private:
  ProofManager(const ManagerDeps& deps, const LedgerConfig& config);

  // All helpers below expect mu_ to be held.
  Status fail(Status st) const;
  Status require_role(const Address& caller, rbac::Permission permission) const;
  Status require_assignee(const Address& caller, const ProofRequest& req) const;
  RequestStatus effective_status(const ProofRequest& req, Timestamp now) const;
  Timestamp ack_deadline(const ProofRequest& req) const;
  Amount obligations_locked() const;
  Status purge_locked(Timestamp now);
  Status record_validation_locked(const Address& caller, ProofRequest& req,
                                  RequestStatus to, Timestamp now);
  // Fails with invariant_violation, touching nothing, unless from -> to is in
  // the legal transition table.
  Status transition_locked(ProofRequest& req, RequestStatus to, Timestamp now,
                           const Address& actor, const char* cause, Amount amount);
  void emit_locked(EventType type, Timestamp now, const ProofRequest* req,
                   ProvingNetwork network, jsonlite::Object data);

  EscrowToken&         token_;
  rbac::AccessControl& access_;
  Clock&               clock_;
  LedgerConfig         config_;

  mutable std::mutex mu_;
  std::unordered_map<RequestKey, ProofRequest, RequestKeyHash> requests_;
  NetworkRegistry registry_;
  ExpiryQueue     queue_;
  std::uint64_t   request_counter_{0};
  Amount          potential_future_reward_{0};

  EventLog          events_;
  ImmutableAuditLog audit_;
};

}  // namespace proofman
