#include "proofman/proof_manager.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include "proofman/hash.hpp"
#include "proofman/transitions.hpp"
#include "proofman/version.hpp"

namespace proofman {

using rbac::Permission;

namespace {

jsonlite::Value jv(std::uint64_t v) { return jsonlite::Value{v}; }
jsonlite::Value jv(const std::string& v) { return jsonlite::Value{v}; }
jsonlite::Value jv(bool v) { return jsonlite::Value{v}; }

std::string protocol_version(const RequestParams& p) {
  return std::to_string(p.protocol_major) + "." + std::to_string(p.protocol_minor) + "." +
         std::to_string(p.protocol_patch);
}

}  // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

std::unique_ptr<ProofManager> ProofManager::create(const ManagerDeps& deps,
                                                   const LedgerConfig& config,
                                                   Status* error) {
  Status st = validate_config(config);
  if (st.ok() && is_zero_address(config.escrow_address)) {
    st = Status::error(ErrorCode::zero_address, "escrow_address");
  }
  if (st.ok() && is_zero_address(config.fermah_address)) {
    st = Status::error(ErrorCode::zero_address, "fermah_address");
  }
  if (st.ok() && is_zero_address(config.lagrange_address)) {
    st = Status::error(ErrorCode::zero_address, "lagrange_address");
  }
  if (st.ok() && config.fermah_address == config.lagrange_address) {
    st = Status::error(ErrorCode::duplicate_network_address,
                       "fermah and lagrange share an address");
  }
  if (!st.ok()) {
    if (error) *error = st;
    return nullptr;
  }
  if (error) *error = Status::success();
  // The constructor is private, so std::make_unique cannot reach it.
  return std::unique_ptr<ProofManager>(new ProofManager(deps, config));
}

ProofManager::ProofManager(const ManagerDeps& deps, const LedgerConfig& config)
    : token_(deps.token),
      access_(deps.access),
      clock_(deps.clock),
      config_(config),
      registry_(config.fermah_address, config.lagrange_address),
      events_(config.event_log_path),
      audit_(config.audit_log_path) {}

// ---------------------------------------------------------------------------
// Guards and helpers (mu_ held)
// ---------------------------------------------------------------------------

Status ProofManager::fail(Status st) const {
  global_ledger_stats().record_failure(st.code);
  return st;
}

Status ProofManager::require_role(const Address& caller, Permission permission) const {
  const rbac::RbacContext ctx = rbac::check(access_, caller, permission);
  if (!ctx.ok) return Status::error(ctx.code, ctx.denial_reason);
  return Status::success();
}

Status ProofManager::require_assignee(const Address& caller, const ProofRequest& req) const {
  const ProvingNetworkInfo* info = registry_.find(req.assigned_to);
  if (!info || info->address != caller) {
    return Status::error(ErrorCode::unauthorized_network,
                         "caller is not the address of " + to_string(req.assigned_to));
  }
  return Status::success();
}

Timestamp ProofManager::ack_deadline(const ProofRequest& req) const {
  return req.submitted_at + config_.ack_timeout;
}

RequestStatus ProofManager::effective_status(const ProofRequest& req, Timestamp now) const {
  if (req.status == RequestStatus::pending_acknowledgement && now > ack_deadline(req)) {
    return RequestStatus::unacknowledged;
  }
  if (req.status == RequestStatus::committed && now > req.proving_deadline()) {
    return RequestStatus::timed_out;
  }
  return req.status;
}

Amount ProofManager::obligations_locked() const {
  return registry_.total_owed() + potential_future_reward_;
}

Status ProofManager::transition_locked(ProofRequest& req, RequestStatus to, Timestamp now,
                                       const Address& actor, const char* cause, Amount amount) {
  if (!is_legal_transition(req.status, to)) {
    return Status::error(ErrorCode::invariant_violation,
                         "transition " + to_string(req.status) + " -> " + to_string(to) +
                             " is not in the transition table");
  }
  TransitionRecord rec;
  rec.timestamp  = now;
  rec.key        = req.key;
  rec.request_id = req.request_id;
  rec.from       = req.status;
  rec.to         = to;
  rec.network    = req.assigned_to;
  rec.actor      = actor;
  rec.cause      = cause;
  rec.amount     = amount;
  req.status = to;
  audit_.append(rec);
  return Status::success();
}

void ProofManager::emit_locked(EventType type, Timestamp now, const ProofRequest* req,
                               ProvingNetwork network, jsonlite::Object data) {
  LedgerEvent ev;
  ev.timestamp = now;
  ev.type      = type;
  ev.network   = network;
  if (req) {
    ev.key    = req->key;
    ev.status = req->status;
  }
  ev.data = std::move(data);
  events_.emit(std::move(ev));
}

// Processes at most purge_limit entries whose deadline has been reached.
Status ProofManager::purge_locked(Timestamp now) {
  std::size_t processed = 0;
  while (processed < config_.purge_limit) {
    const Result<ExpiryEntry> top = queue_.peek_min();
    if (!top.ok() || top.value->expires_at > now) break;
    const Result<ExpiryEntry> entry = queue_.extract_min();
    if (!entry.ok()) return Status::error(ErrorCode::invariant_violation, entry.status.detail);
    ++processed;

    auto it = requests_.find(entry.value->key);
    if (it == requests_.end() || !is_expirable(it->second.status)) continue;
    ProofRequest& req = it->second;
    const RequestStatus to = req.status == RequestStatus::pending_acknowledgement
                                 ? RequestStatus::unacknowledged
                                 : RequestStatus::timed_out;
    const Status st = transition_locked(req, to, now, "", "purge", 0);
    if (!st.ok()) return st;
    global_ledger_stats().requests_expired.fetch_add(1, std::memory_order_relaxed);
    emit_locked(EventType::request_expired, now, &req, req.assigned_to,
                {{"expired_at", jv(entry.value->expires_at)}});
  }
  return Status::success();
}

// ---------------------------------------------------------------------------
// Admin operations
// ---------------------------------------------------------------------------

Status ProofManager::set_network_address(const Address& caller, ProvingNetwork network,
                                         const Address& address) {
  ScopeTimer timer(global_ledger_stats().latency_histogram);
  std::lock_guard<std::mutex> lk(mu_);
  Status st = require_role(caller, Permission::network_address_set);
  if (!st.ok()) return fail(st);

  const ProvingNetworkInfo* info = registry_.find(network);
  const Address previous = info ? info->address : Address{};
  st = registry_.set_address(network, address);
  if (!st.ok()) return fail(st);

  emit_locked(EventType::network_address_changed, clock_.now(), nullptr, network,
              {{"previous", jv(previous)}, {"address", jv(address)}});
  return Status::success();
}

Status ProofManager::set_network_status(const Address& caller, ProvingNetwork network,
                                        NetworkStatus status) {
  ScopeTimer timer(global_ledger_stats().latency_histogram);
  std::lock_guard<std::mutex> lk(mu_);
  Status st = require_role(caller, Permission::network_status_set);
  if (!st.ok()) return fail(st);
  st = registry_.set_status(network, status);
  if (!st.ok()) return fail(st);

  emit_locked(EventType::network_status_changed, clock_.now(), nullptr, network,
              {{"status", jv(to_string(status))}});
  return Status::success();
}

Status ProofManager::set_preferred_network(const Address& caller, ProvingNetwork network) {
  ScopeTimer timer(global_ledger_stats().latency_histogram);
  std::lock_guard<std::mutex> lk(mu_);
  Status st = require_role(caller, Permission::preferred_network_set);
  if (!st.ok()) return fail(st);

  const ProvingNetwork previous = registry_.preferred();
  registry_.set_preferred(network);
  emit_locked(EventType::preferred_network_changed, clock_.now(), nullptr, ProvingNetwork::none,
              {{"previous", jv(to_string(previous))}, {"preferred", jv(to_string(network))}});
  return Status::success();
}

// ---------------------------------------------------------------------------
// Submitter operations
// ---------------------------------------------------------------------------

Result<ProofRequest> ProofManager::submit_request(const Address& caller,
                                                  const RequestKey& key,
                                                  const RequestParams& params) {
  using R = Result<ProofRequest>;
  ScopeTimer timer(global_ledger_stats().latency_histogram);
  std::lock_guard<std::mutex> lk(mu_);

  Status st = require_role(caller, Permission::request_submit);
  if (!st.ok()) return R::failure(fail(st));

  if (requests_.count(key) != 0) {
    return R::failure(fail(Status::error(ErrorCode::duplicate_request, key.to_string())));
  }
  if (params.timeout_after <= config_.ack_timeout ||
      params.timeout_after > config_.max_timeout_after) {
    return R::failure(fail(Status::error(
        ErrorCode::invalid_timeout,
        "timeout_after must be in (" + std::to_string(config_.ack_timeout) + ", " +
            std::to_string(config_.max_timeout_after) + "]")));
  }
  if (params.max_reward == 0 || params.max_reward > config_.reward_ceiling) {
    return R::failure(fail(Status::error(
        ErrorCode::reward_out_of_bounds,
        "max_reward must be in (0, " + std::to_string(config_.reward_ceiling) + "]")));
  }

  // Plan the purge, check capacity, and only then apply the purge: a rejected
  // submission must leave the queue untouched.
  const Timestamp now = clock_.now();
  const std::size_t planned = queue_.count_expired(now, config_.purge_limit);
  const CapacityCheck cap = proofman::check_capacity(token_.balance_of(config_.escrow_address),
                                                     obligations_locked(),
                                                     config_.reward_ceiling,
                                                     queue_.size() - planned);
  if (!cap.allowed) {
    return R::failure(fail(Status::error(ErrorCode::no_funds_available, cap.to_json())));
  }
  st = purge_locked(now);
  if (!st.ok()) return R::failure(fail(st));

  ProofRequest req;
  req.key          = key;
  req.params       = params;
  req.submitted_at = now;
  req.request_id   = request_counter_;
  req.assigned_to  = assign_network(request_counter_, registry_.preferred());

  const bool refused = !registry_.is_active(req.assigned_to);
  req.status = refused ? RequestStatus::refused : RequestStatus::pending_acknowledgement;
  if (!refused) {
    st = queue_.insert(ack_deadline(req), key);
    if (!st.ok()) {
      return R::failure(fail(Status::error(ErrorCode::invariant_violation, st.detail)));
    }
  }
  ++request_counter_;

  TransitionRecord rec;
  rec.timestamp  = now;
  rec.key        = key;
  rec.request_id = req.request_id;
  rec.to         = req.status;
  rec.network    = req.assigned_to;
  rec.actor      = caller;
  rec.cause      = "submit";
  rec.amount     = params.max_reward;
  audit_.append(rec);

  auto& stats = global_ledger_stats();
  stats.requests_submitted.fetch_add(1, std::memory_order_relaxed);
  if (refused) stats.requests_refused.fetch_add(1, std::memory_order_relaxed);

  requests_.emplace(key, req);
  emit_locked(EventType::request_submitted, now, &req, req.assigned_to,
              {{"request_id", jv(req.request_id)},
               {"proof_inputs_url", jv(params.proof_inputs_url)},
               {"protocol_version", jv(protocol_version(params))},
               {"timeout_after", jv(params.timeout_after)},
               {"max_reward", jv(params.max_reward)},
               {"submitted_at", jv(now)}});
  return R::success(req);
}

Status ProofManager::record_validation_locked(const Address& caller, ProofRequest& req,
                                              RequestStatus to, Timestamp now) {
  const Amount reward = req.requested_reward;
  const Status st = transition_locked(req, to, now, caller, "validation", reward);
  if (!st.ok()) return fail(st);

  potential_future_reward_ -= reward;
  auto& stats = global_ledger_stats();
  if (to == RequestStatus::validated) {
    registry_.credit(req.assigned_to, req.key, reward);
    stats.proofs_validated.fetch_add(1, std::memory_order_relaxed);
  } else {
    stats.proofs_rejected.fetch_add(1, std::memory_order_relaxed);
  }

  const ProvingNetworkInfo* info = registry_.find(req.assigned_to);
  emit_locked(EventType::validation_result, now, &req, req.assigned_to,
              {{"valid", jv(to == RequestStatus::validated)},
               {"requested_reward", jv(reward)},
               {"owed_reward", jv(info ? info->owed_reward : Amount{0})}});
  return Status::success();
}

Status ProofManager::submit_validation_result(const Address& caller, const RequestKey& key,
                                              bool valid) {
  ScopeTimer timer(global_ledger_stats().latency_histogram);
  std::lock_guard<std::mutex> lk(mu_);
  Status st = require_role(caller, Permission::validation_submit);
  if (!st.ok()) return fail(st);

  auto it = requests_.find(key);
  if (it == requests_.end()) {
    return fail(Status::error(ErrorCode::request_not_found, key.to_string()));
  }
  ProofRequest& req = it->second;
  if (req.status != RequestStatus::proven) return fail(Status::bad_status(req.status));

  return record_validation_locked(
      caller, req, valid ? RequestStatus::validated : RequestStatus::validation_failed,
      clock_.now());
}

Status ProofManager::update_status(const Address& caller, const RequestKey& key,
                                   RequestStatus new_status) {
  ScopeTimer timer(global_ledger_stats().latency_histogram);
  std::lock_guard<std::mutex> lk(mu_);
  Status st = require_role(caller, Permission::status_update);
  if (!st.ok()) return fail(st);

  auto it = requests_.find(key);
  if (it == requests_.end()) {
    return fail(Status::error(ErrorCode::request_not_found, key.to_string()));
  }
  ProofRequest& req = it->second;
  if (!is_submitter_transition(req.status, new_status)) {
    return fail(Status::bad_transition(req.status, new_status));
  }
  return record_validation_locked(caller, req, new_status, clock_.now());
}

// ---------------------------------------------------------------------------
// Proving network operations
// ---------------------------------------------------------------------------

Status ProofManager::acknowledge(const Address& caller, const RequestKey& key, bool accept) {
  ScopeTimer timer(global_ledger_stats().latency_histogram);
  std::lock_guard<std::mutex> lk(mu_);

  auto it = requests_.find(key);
  if (it == requests_.end()) {
    return fail(Status::error(ErrorCode::request_not_found, key.to_string()));
  }
  ProofRequest& req = it->second;
  Status st = require_assignee(caller, req);
  if (!st.ok()) return fail(st);
  if (req.status != RequestStatus::pending_acknowledgement) {
    return fail(Status::bad_status(req.status));
  }
  const Timestamp now = clock_.now();
  if (now > ack_deadline(req)) {
    return fail(Status::error(ErrorCode::ack_deadline_passed,
                              "deadline " + std::to_string(ack_deadline(req))));
  }

  st = transition_locked(req, accept ? RequestStatus::committed : RequestStatus::refused, now,
                         caller, "acknowledge", 0);
  if (!st.ok()) return fail(st);
  st = accept ? queue_.rekey(key, req.proving_deadline()) : queue_.remove(key);
  if (!st.ok()) return fail(Status::error(ErrorCode::invariant_violation, st.detail));

  auto& stats = global_ledger_stats();
  if (accept) {
    stats.requests_acknowledged.fetch_add(1, std::memory_order_relaxed);
  } else {
    stats.requests_refused.fetch_add(1, std::memory_order_relaxed);
  }
  emit_locked(EventType::request_acknowledged, now, &req, req.assigned_to,
              {{"accepted", jv(accept)}});
  return Status::success();
}

Status ProofManager::submit_proof(const Address& caller, const RequestKey& key,
                                  const Bytes& proof, Amount requested_reward) {
  ScopeTimer timer(global_ledger_stats().latency_histogram);
  std::lock_guard<std::mutex> lk(mu_);

  auto it = requests_.find(key);
  if (it == requests_.end()) {
    return fail(Status::error(ErrorCode::request_not_found, key.to_string()));
  }
  ProofRequest& req = it->second;
  Status st = require_assignee(caller, req);
  if (!st.ok()) return fail(st);
  if (req.status != RequestStatus::committed) return fail(Status::bad_status(req.status));
  const Timestamp now = clock_.now();
  if (now > req.proving_deadline()) {
    return fail(Status::error(ErrorCode::proving_deadline_passed,
                              "deadline " + std::to_string(req.proving_deadline())));
  }
  if (proof.empty()) return fail(Status::error(ErrorCode::empty_proof));

  const Amount reward = std::min(requested_reward, req.params.max_reward);
  st = transition_locked(req, RequestStatus::proven, now, caller, "proof", reward);
  if (!st.ok()) return fail(st);
  st = queue_.remove(key);
  if (!st.ok()) return fail(Status::error(ErrorCode::invariant_violation, st.detail));

  req.proof = proof;
  req.requested_reward = reward;
  potential_future_reward_ += reward;
  global_ledger_stats().proofs_submitted.fetch_add(1, std::memory_order_relaxed);

  emit_locked(EventType::proof_submitted, now, &req, req.assigned_to,
              {{"proof_digest", jv(proof_digest(proof))},
               {"proof_bytes", jv(static_cast<std::uint64_t>(proof.size()))},
               {"requested_reward", jv(reward)},
               {"asked_reward", jv(requested_reward)}});
  return Status::success();
}

Result<Amount> ProofManager::claim_reward(const Address& caller) {
  using R = Result<Amount>;
  ScopeTimer timer(global_ledger_stats().latency_histogram);
  std::lock_guard<std::mutex> lk(mu_);

  const ProvingNetwork network = registry_.network_for_address(caller);
  if (network == ProvingNetwork::none) {
    return R::failure(fail(Status::error(ErrorCode::unauthorized_network,
                                         "caller is not a proving network")));
  }
  const ProvingNetworkInfo* info = registry_.find(network);
  const Amount owed = info->owed_reward;
  if (owed == 0) return R::failure(fail(Status::error(ErrorCode::no_payment_due)));
  for (const RequestKey& k : info->unpaid) {
    auto it = requests_.find(k);
    if (it == requests_.end() || !is_legal_transition(it->second.status, RequestStatus::paid)) {
      return R::failure(fail(Status::error(ErrorCode::invariant_violation,
                                           "unpaid request " + k.to_string() + " cannot be paid")));
    }
  }

  const Amount balance = token_.balance_of(config_.escrow_address);
  if (balance < owed) {
    return R::failure(fail(Status::error(
        ErrorCode::insufficient_funds,
        "escrow " + std::to_string(balance) + " < owed " + std::to_string(owed))));
  }
  // Books are only touched once the token confirmed the transfer.
  if (!token_.transfer(config_.escrow_address, caller, owed)) {
    return R::failure(fail(Status::error(ErrorCode::transfer_failed)));
  }

  const Timestamp now = clock_.now();
  const std::vector<RequestKey> keys = registry_.settle(network);
  for (const RequestKey& k : keys) {
    auto it = requests_.find(k);
    if (it == requests_.end()) continue;
    // Every key was checked before the transfer; the funds have moved either way.
    const Status st = transition_locked(it->second, RequestStatus::paid, now, caller, "claim",
                                        it->second.requested_reward);
    if (!st.ok()) global_ledger_stats().record_failure(st.code);
  }

  auto& stats = global_ledger_stats();
  stats.claims_paid.fetch_add(1, std::memory_order_relaxed);
  stats.amount_paid.fetch_add(owed, std::memory_order_relaxed);
  emit_locked(EventType::reward_paid, now, nullptr, network,
              {{"amount", jv(owed)},
               {"requests", jv(static_cast<std::uint64_t>(keys.size()))},
               {"to", jv(caller)}});
  return R::success(owed);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<ProofRequest> ProofManager::get_request(const RequestKey& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = requests_.find(key);
  if (it == requests_.end()) {
    return Result<ProofRequest>::failure(
        Status::error(ErrorCode::request_not_found, key.to_string()));
  }
  ProofRequest view = it->second;
  view.status = effective_status(view, clock_.now());
  return Result<ProofRequest>::success(std::move(view));
}

std::optional<ProvingNetworkInfo> ProofManager::network_info(ProvingNetwork network) const {
  std::lock_guard<std::mutex> lk(mu_);
  const ProvingNetworkInfo* info = registry_.find(network);
  if (!info) return std::nullopt;
  return *info;
}

ProvingNetwork ProofManager::preferred_network() const {
  std::lock_guard<std::mutex> lk(mu_);
  return registry_.preferred();
}

ProvingNetwork ProofManager::network_for_address(const Address& address) const {
  std::lock_guard<std::mutex> lk(mu_);
  return registry_.network_for_address(address);
}

std::uint64_t ProofManager::request_counter() const {
  std::lock_guard<std::mutex> lk(mu_);
  return request_counter_;
}

std::size_t ProofManager::in_flight_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

Amount ProofManager::potential_future_reward() const {
  std::lock_guard<std::mutex> lk(mu_);
  return potential_future_reward_;
}

Amount ProofManager::total_obligations() const {
  std::lock_guard<std::mutex> lk(mu_);
  return obligations_locked();
}

CapacityCheck ProofManager::check_capacity() const {
  std::lock_guard<std::mutex> lk(mu_);
  const std::size_t planned = queue_.count_expired(clock_.now(), config_.purge_limit);
  return proofman::check_capacity(token_.balance_of(config_.escrow_address),
                                  obligations_locked(), config_.reward_ceiling,
                                  queue_.size() - planned);
}

std::string ProofManager::snapshot_json() const {
  std::lock_guard<std::mutex> lk(mu_);

  std::vector<const ProofRequest*> reqs;
  reqs.reserve(requests_.size());
  for (const auto& [k, r] : requests_) reqs.push_back(&r);
  std::sort(reqs.begin(), reqs.end(),
            [](const ProofRequest* a, const ProofRequest* b) { return a->key < b->key; });

  std::vector<ExpiryEntry> entries = queue_.entries();
  std::sort(entries.begin(), entries.end(), [](const ExpiryEntry& a, const ExpiryEntry& b) {
    return a.expires_at != b.expires_at ? a.expires_at < b.expires_at : a.key < b.key;
  });

  std::ostringstream o;
  o << "{"
    << "\"ledger_format_version\":" << version::LEDGER_FORMAT_VERSION
    << ",\"request_counter\":" << request_counter_
    << ",\"potential_future_reward\":" << potential_future_reward_
    << ",\"total_obligations\":" << obligations_locked()
    << ",\"escrow_balance\":" << token_.balance_of(config_.escrow_address)
    << ",\"registry\":" << registry_.to_json()
    << ",\"queue\":[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (i) o << ",";
    o << "{\"expires_at\":" << entries[i].expires_at
      << ",\"key\":\"" << entries[i].key.to_string() << "\"}";
  }
  o << "],\"requests\":[";
  for (std::size_t i = 0; i < reqs.size(); ++i) {
    if (i) o << ",";
    o << reqs[i]->to_json();
  }
  o << "]}";
  return o.str();
}

}  // namespace proofman
