#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "proofman/admission.hpp"
#include "proofman/audit.hpp"
#include "proofman/clock.hpp"
#include "proofman/config.hpp"
#include "proofman/escrow.hpp"
#include "proofman/expiry_queue.hpp"
#include "proofman/hash.hpp"
#include "proofman/jsonlite.hpp"
#include "proofman/observability.hpp"
#include "proofman/proof_manager.hpp"
#include "proofman/rbac.hpp"
#include "proofman/transitions.hpp"
#include "proofman/version.hpp"

namespace fs = std::filesystem;

using proofman::Amount;
using proofman::ErrorCode;
using proofman::EventType;
using proofman::NetworkStatus;
using proofman::ProvingNetwork;
using proofman::RequestKey;
using proofman::RequestParams;
using proofman::RequestStatus;
using proofman::rbac::Role;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------

const std::string kAdmin     = "0xad";
const std::string kSubmitter = "0x5b";
const std::string kFermah    = "0xfe";
const std::string kLagrange  = "0x1a";
const std::string kEscrow    = "0xe5c0";
const std::string kStranger  = "0x99";

constexpr Amount kCeiling = 25'000'000;
constexpr proofman::Timestamp kStart = 1'700'000'000;

proofman::LedgerConfig default_config() {
  proofman::LedgerConfig cfg;
  cfg.escrow_address   = kEscrow;
  cfg.fermah_address   = kFermah;
  cfg.lagrange_address = kLagrange;
  return cfg;
}

RequestParams params(proofman::Timestamp timeout_after = 3600, Amount max_reward = 4'000'000) {
  RequestParams p;
  p.proof_inputs_url = "ipfs://inputs";
  p.protocol_major   = 1;
  p.protocol_minor   = 2;
  p.protocol_patch   = 3;
  p.timeout_after    = timeout_after;
  p.max_reward       = max_reward;
  return p;
}

RequestKey key(std::uint64_t block) { return RequestKey{1, block}; }

proofman::Bytes proof_bytes(const std::string& s = "proof-bytes") {
  return proofman::Bytes(s.begin(), s.end());
}

struct Ledger {
  proofman::InMemoryToken token;
  proofman::rbac::RoleTable roles;
  proofman::ManualClock clock{kStart};
  std::unique_ptr<proofman::ProofManager> mgr;

  explicit Ledger(proofman::LedgerConfig cfg = default_config(),
                  Amount escrow = 40 * kCeiling) {
    roles.grant(Role::admin, kAdmin);
    roles.grant(Role::submitter, kSubmitter);
    token.mint(kEscrow, escrow);
    proofman::Status st;
    mgr = proofman::ProofManager::create({token, roles, clock}, cfg, &st);
    expect(mgr != nullptr, "ledger construction: " + st.to_json());
  }

  proofman::ProofManager& operator*() { return *mgr; }
  proofman::ProofManager* operator->() { return mgr.get(); }

  RequestStatus status(const RequestKey& k) {
    auto r = mgr->get_request(k);
    expect(r.ok(), "get_request " + k.to_string());
    return r.value->status;
  }

  // Drives a request to `proven` on fermah. Requires counter % 4 == 0 or a
  // fermah preference.
  void prove(const RequestKey& k, Amount reward) {
    expect(mgr->submit_request(kSubmitter, k, params()).ok(), "prove: submit");
    expect(mgr->acknowledge(kFermah, k, true).ok(), "prove: ack");
    expect(mgr->submit_proof(kFermah, k, proof_bytes(), reward).ok(), "prove: proof");
  }
};

fs::path temp_path(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("proofman_test_" + name);
  fs::remove(p);
  return p;
}

std::vector<std::string> read_lines(const fs::path& p) {
  std::ifstream in(p);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

// ============================================================================
// Foundations
// ============================================================================

void test_blake3_known_vectors() {
  expect(proofman::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(proofman::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "abc";
  const std::string pd = proofman::proof_digest(proofman::Bytes(payload.begin(), payload.end()));
  const std::string ad = proofman::audit_link_digest(payload);
  expect(pd.size() == 64 && ad.size() == 64, "digests are 64 hex chars");
  expect(pd != ad, "proof and audit domains differ");
  expect(pd != proofman::blake3_hex(payload), "domain prefix changes the digest");
}

void test_json_strict_parsing() {
  std::optional<proofman::jsonlite::JsonError> err;
  auto obj = proofman::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate keys rejected");

  err.reset();
  obj = proofman::jsonlite::parse("{\"amount\":18446744073709551615,\"s\":\"x\\ny\"}", &err);
  expect(!err, "valid document parses");
  expect(proofman::jsonlite::get_u64(obj, "amount") == 18446744073709551615ULL,
         "uint64 max survives without a double");
  expect(proofman::jsonlite::get_string(obj, "s") == "x\ny", "escapes decoded");

  std::uint64_t out = 7;
  obj = proofman::jsonlite::parse("{\"neg\":-1}", &err);
  expect(!proofman::jsonlite::read_u64(obj, "neg", &out) && out == 7,
         "negative number is not a u64");
  expect(proofman::jsonlite::read_u64(obj, "absent", &out) && out == 7,
         "absent key leaves output untouched");
}

void test_error_taxonomy() {
  expect(proofman::to_string(ErrorCode::no_funds_available) == "no_funds_available",
         "snake_case code");
  expect(proofman::error_category(ErrorCode::unauthorized_network) ==
             proofman::ErrorCategory::authorization, "auth category");
  expect(proofman::error_category(ErrorCode::ack_deadline_passed) ==
             proofman::ErrorCategory::temporal, "temporal category");
  expect(proofman::error_category(ErrorCode::transfer_failed) ==
             proofman::ErrorCategory::downstream, "downstream category");
  expect(proofman::error_category(ErrorCode::empty_queue) ==
             proofman::ErrorCategory::internal, "internal category");
  expect(proofman::is_retryable(ErrorCode::no_funds_available), "capacity retryable");
  expect(proofman::is_retryable(ErrorCode::transfer_failed), "transfer retryable");
  expect(!proofman::is_retryable(ErrorCode::duplicate_request), "duplicate not retryable");

  const auto st = proofman::Status::bad_transition(RequestStatus::committed, RequestStatus::paid);
  const std::string j = st.to_json();
  expect(j.find("\"from\":\"committed\"") != std::string::npos, "from in status json");
  expect(j.find("\"to\":\"paid\"") != std::string::npos, "to in status json");
}

void test_status_strings() {
  for (std::size_t i = 0; i < proofman::kRequestStatusCount; ++i) {
    const auto s = static_cast<RequestStatus>(i);
    auto back = proofman::request_status_from_string(proofman::to_string(s));
    expect(back && *back == s, "status string round trip " + proofman::to_string(s));
  }
  expect(!proofman::request_status_from_string("bogus"), "unknown status rejected");
  expect(proofman::is_zero_address("") && proofman::is_zero_address("0x0000"),
         "zero address forms");
  expect(!proofman::is_zero_address("0x01"), "non-zero address");
}

// ============================================================================
// Expiry queue
// ============================================================================

void test_queue_basic() {
  proofman::ExpiryQueue q;
  expect(q.peek_min().code() == ErrorCode::empty_queue, "peek on empty");
  expect(q.extract_min().code() == ErrorCode::empty_queue, "extract on empty");

  expect(q.insert(30, key(3)).ok(), "insert 3");
  expect(q.insert(10, key(1)).ok(), "insert 1");
  expect(q.insert(20, key(2)).ok(), "insert 2");
  expect(q.insert(5, key(1)).code == ErrorCode::duplicate_key, "duplicate key rejected");
  expect(q.size() == 3 && q.verify(), "size and heap order");

  expect(q.peek_min().value->key == key(1), "min is key 1");
  expect(q.rekey(key(3), 1).ok(), "rekey 3 down");
  expect(q.peek_min().value->key == key(3), "rekeyed entry is now min");
  expect(q.rekey(key(3), 100).ok() && q.verify(), "rekey 3 up");
  expect(*q.expiry_of(key(3)) == 100, "expiry_of reflects rekey");

  expect(q.remove(key(2)).ok() && !q.contains(key(2)), "remove 2");
  expect(q.remove(key(2)).code == ErrorCode::key_not_found, "remove absent");
  expect(q.rekey(key(9), 1).code == ErrorCode::key_not_found, "rekey absent");

  expect(q.extract_min().value->key == key(1), "extract 1");
  expect(q.extract_min().value->key == key(3), "extract 3");
  expect(q.empty() && q.verify(), "drained");
}

void test_queue_randomized_against_model() {
  proofman::ExpiryQueue q;
  std::map<RequestKey, proofman::Timestamp> model;
  std::mt19937_64 rng(0xC0FFEE);

  for (int step = 0; step < 5000; ++step) {
    const int op = static_cast<int>(rng() % 4);
    const RequestKey k = key(rng() % 200);
    const proofman::Timestamp t = rng() % 1000;
    if (op == 0) {
      const bool fresh = model.count(k) == 0;
      expect(q.insert(t, k).ok() == fresh, "insert agrees with model");
      if (fresh) model[k] = t;
    } else if (op == 1) {
      const bool present = model.erase(k) != 0;
      expect(q.remove(k).ok() == present, "remove agrees with model");
    } else if (op == 2) {
      const bool present = model.count(k) != 0;
      expect(q.rekey(k, t).ok() == present, "rekey agrees with model");
      if (present) model[k] = t;
    } else if (!model.empty()) {
      proofman::Timestamp min_t = model.begin()->second;
      for (const auto& [mk, mt] : model) min_t = std::min(min_t, mt);
      auto e = q.extract_min();
      expect(e.ok() && e.value->expires_at == min_t, "extract returns the minimum");
      expect(model[e.value->key] == min_t, "extracted key carried the minimum");
      model.erase(e.value->key);
    }
    expect(q.verify(), "heap/index consistent at step " + std::to_string(step));
    expect(q.size() == model.size(), "size agrees with model");
  }
}

void test_queue_count_expired_matches_extraction() {
  std::mt19937_64 rng(42);
  for (int round = 0; round < 50; ++round) {
    proofman::ExpiryQueue q;
    const int n = static_cast<int>(rng() % 40);
    for (int i = 0; i < n; ++i) {
      expect(q.insert(rng() % 100, key(static_cast<std::uint64_t>(i))).ok(), "insert");
    }
    const proofman::Timestamp now = rng() % 100;
    const std::size_t limit = 1 + rng() % 15;
    const std::size_t planned = q.count_expired(now, limit);
    const std::size_t before = q.size();
    std::size_t extracted = 0;
    while (extracted < limit) {
      auto top = q.peek_min();
      if (!top.ok() || top.value->expires_at > now) break;
      expect(q.extract_min().ok(), "extract");
      ++extracted;
    }
    expect(planned == extracted, "count_expired equals purge extraction count");
    expect(before - q.size() == extracted, "extraction shrank the queue");
  }
}

// ============================================================================
// State machine / admission / assignment
// ============================================================================

void test_transition_matrix() {
  const std::vector<std::pair<RequestStatus, RequestStatus>> legal = {
    {RequestStatus::pending_acknowledgement, RequestStatus::committed},
    {RequestStatus::pending_acknowledgement, RequestStatus::refused},
    {RequestStatus::pending_acknowledgement, RequestStatus::unacknowledged},
    {RequestStatus::committed, RequestStatus::proven},
    {RequestStatus::committed, RequestStatus::timed_out},
    {RequestStatus::proven, RequestStatus::validated},
    {RequestStatus::proven, RequestStatus::validation_failed},
    {RequestStatus::validated, RequestStatus::paid},
  };
  int distinct_pairs = 0;
  int allowed = 0;
  for (std::size_t f = 0; f < proofman::kRequestStatusCount; ++f) {
    for (std::size_t t = 0; t < proofman::kRequestStatusCount; ++t) {
      const auto from = static_cast<RequestStatus>(f);
      const auto to = static_cast<RequestStatus>(t);
      const bool expected =
          std::find(legal.begin(), legal.end(), std::make_pair(from, to)) != legal.end();
      expect(proofman::is_legal_transition(from, to) == expected,
             "transition " + proofman::to_string(from) + " -> " + proofman::to_string(to));
      if (f != t) ++distinct_pairs;
      if (proofman::is_legal_transition(from, to)) ++allowed;

      const bool submitter_ok = from == RequestStatus::proven &&
                                (to == RequestStatus::validated ||
                                 to == RequestStatus::validation_failed);
      expect(proofman::is_submitter_transition(from, to) == submitter_ok,
             "submitter table " + proofman::to_string(from) + " -> " + proofman::to_string(to));
    }
  }
  expect(distinct_pairs == 72, "72 ordered pairs of distinct states");
  expect(allowed == 8, "exactly 8 legal transitions");
  expect(proofman::legal_transitions().size() == 8, "table size");

  int terminal = 0;
  for (std::size_t i = 0; i < proofman::kRequestStatusCount; ++i) {
    const auto s = static_cast<RequestStatus>(i);
    if (!proofman::is_terminal(s)) continue;
    ++terminal;
    for (std::size_t t = 0; t < proofman::kRequestStatusCount; ++t) {
      expect(!proofman::is_legal_transition(s, static_cast<RequestStatus>(t)),
             "terminal state has no exits");
    }
  }
  expect(terminal == 5, "five terminal states");
}

void test_assignment_policy() {
  using proofman::assign_network;
  for (ProvingNetwork p : {ProvingNetwork::none, ProvingNetwork::fermah, ProvingNetwork::lagrange}) {
    for (std::uint64_t base = 0; base < 16; base += 4) {
      expect(assign_network(base + 0, p) == ProvingNetwork::fermah, "slot 0 -> fermah");
      expect(assign_network(base + 1, p) == ProvingNetwork::lagrange, "slot 1 -> lagrange");
      expect(assign_network(base + 2, p) == p, "slot 2 -> preferred");
      expect(assign_network(base + 3, p) == p, "slot 3 -> preferred");
    }
  }
}

void test_capacity_formula() {
  const Amount R = kCeiling;
  // (B - O) / R > k, strict.
  expect(proofman::check_capacity(3 * R + 10, 10, R, 2).allowed, "3 free slots > 2 in flight");
  expect(!proofman::check_capacity(3 * R + 9, 10, R, 2).allowed, "one unit short of the boundary");
  expect(!proofman::check_capacity(3 * R + 10, 10, R, 3).allowed, "3 free slots not > 3");
  expect(!proofman::check_capacity(5, 10, R, 0).allowed, "balance below obligations");
  const auto c = proofman::check_capacity(2 * R, 0, R, 1);
  expect(c.allowed && c.free_slots == 2, "free slots reported");
  expect(c.to_json().find("\"allowed\":true") != std::string::npos, "capacity json");
}

// ============================================================================
// Construction and access control
// ============================================================================

void test_create_validation() {
  proofman::InMemoryToken token;
  proofman::rbac::RoleTable roles;
  proofman::ManualClock clock(kStart);
  proofman::Status st;

  auto cfg = default_config();
  cfg.escrow_address = "0x000";
  expect(!proofman::ProofManager::create({token, roles, clock}, cfg, &st) &&
             st.code == ErrorCode::zero_address, "zero escrow address");

  cfg = default_config();
  cfg.lagrange_address = "";
  expect(!proofman::ProofManager::create({token, roles, clock}, cfg, &st) &&
             st.code == ErrorCode::zero_address, "zero network address");

  cfg = default_config();
  cfg.lagrange_address = kFermah;
  expect(!proofman::ProofManager::create({token, roles, clock}, cfg, &st) &&
             st.code == ErrorCode::duplicate_network_address, "shared network address");

  cfg = default_config();
  cfg.max_timeout_after = cfg.ack_timeout;
  expect(!proofman::ProofManager::create({token, roles, clock}, cfg, &st) &&
             st.code == ErrorCode::config_invalid, "invalid config");

  auto mgr = proofman::ProofManager::create({token, roles, clock}, default_config(), &st);
  expect(mgr && st.ok(), "valid construction");
  expect(mgr->network_info(ProvingNetwork::fermah)->status == NetworkStatus::active, "fermah active");
  expect(mgr->network_info(ProvingNetwork::lagrange)->status == NetworkStatus::active, "lagrange active");
  expect(!mgr->network_info(ProvingNetwork::none), "none has no info");
  expect(mgr->preferred_network() == ProvingNetwork::none, "no preferred network");
  expect(mgr->request_counter() == 0, "counter starts at zero");
}

void test_role_gates() {
  Ledger l;
  expect(l->submit_request(kStranger, key(1), params()).code() == ErrorCode::unauthorized_submitter,
         "stranger cannot submit");
  expect(l->submit_request(kAdmin, key(1), params()).code() == ErrorCode::unauthorized_submitter,
         "admin does not imply submitter");
  expect(l->set_preferred_network(kSubmitter, ProvingNetwork::fermah).code ==
             ErrorCode::unauthorized_admin, "submitter cannot set preferred network");
  expect(l->set_network_status(kStranger, ProvingNetwork::fermah, NetworkStatus::inactive).code ==
             ErrorCode::unauthorized_admin, "stranger cannot set status");
  expect(l->set_network_address(kFermah, ProvingNetwork::fermah, "0x77").code ==
             ErrorCode::unauthorized_admin, "network cannot move its own address");
  expect(l->submit_validation_result(kFermah, key(1), true).code ==
             ErrorCode::unauthorized_submitter, "network cannot validate");
  expect(l->request_counter() == 0, "rejected calls do not advance the counter");

  const auto ctx = proofman::rbac::check(l.roles, kStranger,
                                         proofman::rbac::Permission::network_status_set);
  expect(!ctx.ok && ctx.code == ErrorCode::unauthorized_admin, "rbac context denial");
  expect(ctx.to_json().find("denial_reason") != std::string::npos, "denial in json");
  expect(l.roles.revoke(Role::submitter, kSubmitter), "revoke submitter");
  expect(l->submit_request(kSubmitter, key(1), params()).code() == ErrorCode::unauthorized_submitter,
         "revoked submitter rejected");
}

void test_registry_admin() {
  Ledger l;
  expect(l->set_network_address(kAdmin, ProvingNetwork::none, "0x77").code ==
             ErrorCode::invalid_network, "none has no address");
  expect(l->set_network_status(kAdmin, ProvingNetwork::none, NetworkStatus::active).code ==
             ErrorCode::invalid_network, "none has no status");
  expect(l->set_network_address(kAdmin, ProvingNetwork::fermah, "0x0").code ==
             ErrorCode::zero_address, "zero address rejected");
  expect(l->set_network_address(kAdmin, ProvingNetwork::fermah, kLagrange).code ==
             ErrorCode::duplicate_network_address, "other network's address rejected");
  expect(l->set_network_address(kAdmin, ProvingNetwork::fermah, kFermah).ok(),
             "re-setting own address is allowed");

  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "submit to fermah");
  expect(l->set_network_address(kAdmin, ProvingNetwork::fermah, "0x77").ok(), "move fermah");
  expect(l->network_for_address("0x77") == ProvingNetwork::fermah, "lookup new address");
  expect(l->network_for_address(kFermah) == ProvingNetwork::none, "old address forgotten");
  expect(l->acknowledge(kFermah, key(1), true).code == ErrorCode::unauthorized_network,
         "old address can no longer act");
  expect(l->acknowledge("0x77", key(1), true).ok(), "new address acts for fermah");

  expect(l->set_preferred_network(kAdmin, ProvingNetwork::lagrange).ok(), "set preferred");
  expect(l->preferred_network() == ProvingNetwork::lagrange, "preferred stored");
  expect(l->set_preferred_network(kAdmin, ProvingNetwork::none).ok(), "preferred may be none");
}

// ============================================================================
// Request lifecycle
// ============================================================================

void test_duplicate_rejection() {
  Ledger l;
  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "first submit");
  auto r = l->submit_request(kSubmitter, key(1), params(1800, 1'000'000));
  expect(r.code() == ErrorCode::duplicate_request, "duplicate with other params");
  expect(l->request_counter() == 1, "duplicate does not advance counter");

  // Counter 1 -> lagrange, counter 2 -> none -> refused. A refused key is
  // still never recreated.
  expect(l->submit_request(kSubmitter, key(2), params()).ok(), "second submit");
  expect(l->submit_request(kSubmitter, key(3), params()).value->status == RequestStatus::refused,
         "third submit refused");
  expect(l->submit_request(kSubmitter, key(3), params()).code() == ErrorCode::duplicate_request,
         "terminal key cannot be recreated");
}

void test_param_validation() {
  Ledger l;
  expect(l->submit_request(kSubmitter, key(1), params(120)).code() == ErrorCode::invalid_timeout,
         "timeout_after equal to ack timeout");
  expect(l->submit_request(kSubmitter, key(1), params(7201)).code() == ErrorCode::invalid_timeout,
         "timeout_after above the maximum");
  expect(l->submit_request(kSubmitter, key(1), params(7200)).ok(), "timeout_after at the maximum");
  expect(l->submit_request(kSubmitter, key(2), params(3600, 0)).code() ==
             ErrorCode::reward_out_of_bounds, "zero max reward");
  expect(l->submit_request(kSubmitter, key(2), params(3600, kCeiling + 1)).code() ==
             ErrorCode::reward_out_of_bounds, "max reward above ceiling");
  expect(l->submit_request(kSubmitter, key(2), params(121, kCeiling)).ok(),
         "boundary params accepted");
}

void test_round_robin() {
  Ledger l;
  expect(l->set_preferred_network(kAdmin, ProvingNetwork::lagrange).ok(), "prefer lagrange");
  const ProvingNetwork expected[] = {ProvingNetwork::fermah, ProvingNetwork::lagrange,
                                     ProvingNetwork::lagrange, ProvingNetwork::lagrange,
                                     ProvingNetwork::fermah, ProvingNetwork::lagrange};
  for (std::uint64_t i = 0; i < 6; ++i) {
    auto r = l->submit_request(kSubmitter, key(i), params());
    expect(r.ok(), "submit " + std::to_string(i));
    expect(r.value->request_id == i, "request id is the pre-increment counter");
    expect(r.value->assigned_to == expected[i], "round robin slot " + std::to_string(i));
    expect(r.value->status == RequestStatus::pending_acknowledgement, "pending");
  }
  expect(l->in_flight_count() == 6, "all six in flight");
}

void test_unassignable_requests_refused() {
  Ledger l;
  // No preferred network: slots 2 and 3 go to none.
  for (std::uint64_t i = 0; i < 4; ++i) {
    expect(l->submit_request(kSubmitter, key(i), params()).ok(), "submit");
  }
  expect(l.status(key(2)) == RequestStatus::refused, "slot 2 refused without preference");
  expect(l.status(key(3)) == RequestStatus::refused, "slot 3 refused without preference");
  expect(l->get_request(key(2)).value->assigned_to == ProvingNetwork::none, "assigned to none");
  expect(l->in_flight_count() == 2, "refused requests have no queue entry");
  expect(l->request_counter() == 4, "refused submissions still advance the counter");

  // Inactive assignee: counter 4 -> fermah.
  expect(l->set_network_status(kAdmin, ProvingNetwork::fermah, NetworkStatus::inactive).ok(),
         "deactivate fermah");
  auto r = l->submit_request(kSubmitter, key(4), params());
  expect(r.ok() && r.value->status == RequestStatus::refused, "inactive assignee refuses");
  expect(r.value->assigned_to == ProvingNetwork::fermah, "assignee recorded");
  expect(l->in_flight_count() == 2, "no queue entry for inactive assignee");
  expect(l->acknowledge(kFermah, key(4), true).code == ErrorCode::invalid_status,
         "refused request cannot be acknowledged");
}

void test_acknowledgement_deadline() {
  Ledger l;
  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "submit (fermah)");
  expect(l->submit_request(kSubmitter, key(2), params()).ok(), "submit (lagrange)");

  l.clock.advance(120);
  expect(l.status(key(1)) == RequestStatus::pending_acknowledgement, "at the deadline: pending");
  expect(l->acknowledge(kFermah, key(1), true).ok(), "ack exactly at the deadline succeeds");

  l.clock.advance(1);
  expect(l.status(key(2)) == RequestStatus::unacknowledged, "lazy unacknowledged");
  auto st = l->acknowledge(kLagrange, key(2), true);
  expect(st.code == ErrorCode::ack_deadline_passed, "ack after the deadline fails");
  expect(l->in_flight_count() == 2, "persisted state untouched until purge");
  expect(l->events().count(EventType::request_expired) == 0, "nothing purged yet");

  // The next submission purges the stale entry.
  expect(l->set_preferred_network(kAdmin, ProvingNetwork::fermah).ok(), "prefer fermah");
  expect(l->submit_request(kSubmitter, key(3), params()).ok(), "submit triggers purge");
  expect(l->events().count(EventType::request_expired) == 1, "one request expired");
  expect(l.status(key(2)) == RequestStatus::unacknowledged, "persisted unacknowledged");
  expect(l->acknowledge(kLagrange, key(2), true).code == ErrorCode::invalid_status,
         "after purge the status check fires first");
  expect(l->in_flight_count() == 2, "committed key 1 and new key 3 in flight");
}

void test_acknowledge_checks() {
  Ledger l;
  expect(l->acknowledge(kFermah, key(1), true).code == ErrorCode::request_not_found,
         "unknown request");
  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "submit (fermah)");
  expect(l->acknowledge(kLagrange, key(1), true).code == ErrorCode::unauthorized_network,
         "other network cannot ack");
  expect(l->acknowledge(kStranger, key(1), true).code == ErrorCode::unauthorized_network,
         "stranger cannot ack");
  expect(l->acknowledge(kFermah, key(1), true).ok(), "assignee acks");
  auto st = l->acknowledge(kFermah, key(1), true);
  expect(st.code == ErrorCode::invalid_status && st.current == RequestStatus::committed,
         "second ack reports the current status");

  expect(l->submit_request(kSubmitter, key(2), params()).ok(), "submit (lagrange)");
  expect(l->acknowledge(kLagrange, key(2), false).ok(), "reject");
  expect(l.status(key(2)) == RequestStatus::refused, "rejected -> refused");
  expect(l->in_flight_count() == 1, "refusal removed the queue entry");
}

void test_proving_deadline() {
  Ledger l;
  expect(l->submit_request(kSubmitter, key(1), params(600)).ok(), "submit");
  expect(l->acknowledge(kFermah, key(1), true).ok(), "ack");
  l.clock.advance(600);
  expect(l.status(key(1)) == RequestStatus::committed, "at the deadline: committed");
  l.clock.advance(1);
  expect(l.status(key(1)) == RequestStatus::timed_out, "lazy timed_out");
  expect(l->submit_proof(kFermah, key(1), proof_bytes(), 1).code ==
             ErrorCode::proving_deadline_passed, "proof after the deadline fails");
  expect(l->potential_future_reward() == 0, "no reward accrued");
}

void test_proof_checks_and_clamping() {
  Ledger l;
  expect(l->submit_proof(kFermah, key(1), proof_bytes(), 1).code == ErrorCode::request_not_found,
         "unknown request");
  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "submit");
  expect(l->submit_proof(kFermah, key(1), proof_bytes(), 1).code == ErrorCode::invalid_status,
         "proof before ack");
  expect(l->acknowledge(kFermah, key(1), true).ok(), "ack");
  expect(l->submit_proof(kLagrange, key(1), proof_bytes(), 1).code ==
             ErrorCode::unauthorized_network, "other network cannot prove");
  expect(l->submit_proof(kFermah, key(1), {}, 1).code == ErrorCode::empty_proof, "empty proof");
  expect(l->submit_proof(kFermah, key(1), proof_bytes(), 10'000'000).ok(), "proof above max");
  auto r = l->get_request(key(1));
  expect(r.value->status == RequestStatus::proven, "proven");
  expect(r.value->requested_reward == 4'000'000, "reward clamped to max_reward");
  expect(r.value->proof == proof_bytes(), "proof stored");
  expect(l->potential_future_reward() == 4'000'000, "potential future reward accrued");
  expect(l->in_flight_count() == 0, "proven request left the queue");

  expect(l->submit_request(kSubmitter, key(2), params()).ok(), "submit (lagrange)");
  expect(l->acknowledge(kLagrange, key(2), true).ok(), "ack");
  expect(l->submit_proof(kLagrange, key(2), proof_bytes(), 1'000'000).ok(), "proof below max");
  expect(l->get_request(key(2)).value->requested_reward == 1'000'000, "reward below max kept");
  expect(l->potential_future_reward() == 5'000'000, "accrual is a sum");
}

void test_validation_results() {
  Ledger l;
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  l.prove(key(1), 3'000'000);
  l.prove(key(2), 2'000'000);
  expect(l->submit_validation_result(kSubmitter, key(1), true).ok(), "valid");
  expect(l->submit_validation_result(kSubmitter, key(2), false).ok(), "invalid");
  expect(l.status(key(1)) == RequestStatus::validated, "validated");
  expect(l.status(key(2)) == RequestStatus::validation_failed, "validation_failed");
  auto info = l->network_info(ProvingNetwork::fermah);
  expect(info->owed_reward == 3'000'000, "only the valid proof is owed");
  expect(info->unpaid.size() == 1 && info->unpaid[0] == key(1), "unpaid list");
  expect(l->potential_future_reward() == 0, "accrual released either way");
  expect(l->total_obligations() == 3'000'000, "obligations = owed");
  auto st = l->submit_validation_result(kSubmitter, key(1), true);
  expect(st.code == ErrorCode::invalid_status && st.current == RequestStatus::validated,
         "second validation rejected");
  expect(l->submit_validation_result(kSubmitter, key(9), true).code ==
             ErrorCode::request_not_found, "unknown request");
}

void test_update_status_gating() {
  Ledger l;
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "submit");
  expect(l->acknowledge(kFermah, key(1), true).ok(), "ack");

  auto st = l->update_status(kSubmitter, key(1), RequestStatus::proven);
  expect(st.code == ErrorCode::invalid_transition, "committed -> proven is not a submitter move");
  expect(st.from == RequestStatus::committed && st.to == RequestStatus::proven, "from/to carried");

  expect(l->submit_proof(kFermah, key(1), proof_bytes(), 3'000'000).ok(), "prove");
  expect(l->update_status(kSubmitter, key(1), RequestStatus::paid).code ==
             ErrorCode::invalid_transition, "proven -> paid rejected");
  expect(l->update_status(kFermah, key(1), RequestStatus::validated).code ==
             ErrorCode::unauthorized_submitter, "network cannot update status");
  expect(l->update_status(kSubmitter, key(1), RequestStatus::validated).ok(),
         "proven -> validated accepted");
  expect(l->network_info(ProvingNetwork::fermah)->owed_reward == 3'000'000,
         "generic update credits like a validation result");
  expect(l->update_status(kSubmitter, key(1), RequestStatus::paid).code ==
             ErrorCode::invalid_transition, "validated -> paid only through a claim");
}

// ============================================================================
// Payout
// ============================================================================

void test_claim_payout_idempotent() {
  Ledger l;
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  l.prove(key(1), 3'000'000);
  l.prove(key(2), 1'500'000);
  l->submit_validation_result(kSubmitter, key(1), true);
  l->submit_validation_result(kSubmitter, key(2), true);

  expect(l->claim_reward(kStranger).code() == ErrorCode::unauthorized_network, "stranger claim");
  expect(l->claim_reward(kLagrange).code() == ErrorCode::no_payment_due, "nothing owed to lagrange");

  const Amount escrow_before = l.token.balance_of(kEscrow);
  auto r = l->claim_reward(kFermah);
  expect(r.ok() && *r.value == 4'500'000, "full owed amount paid");
  expect(l.token.balance_of(kFermah) == 4'500'000, "network received funds");
  expect(l.token.balance_of(kEscrow) == escrow_before - 4'500'000, "escrow debited");
  expect(l.token.transfer_count() == 1, "one transfer");
  expect(l.status(key(1)) == RequestStatus::paid && l.status(key(2)) == RequestStatus::paid,
         "covered requests paid");
  auto info = l->network_info(ProvingNetwork::fermah);
  expect(info->owed_reward == 0 && info->unpaid.empty(), "owed balance zeroed");

  expect(l->claim_reward(kFermah).code() == ErrorCode::no_payment_due, "second claim");
  expect(l.token.transfer_count() == 1, "no second transfer");
}

void test_claim_insufficient_funds() {
  Ledger l(default_config(), 2 * kCeiling);
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  l.prove(key(1), 4'000'000);
  l->submit_validation_result(kSubmitter, key(1), true);
  l.token.burn(kEscrow, 2 * kCeiling - 1'000'000);

  expect(l->claim_reward(kFermah).code() == ErrorCode::insufficient_funds, "escrow drained");
  expect(l->network_info(ProvingNetwork::fermah)->owed_reward == 4'000'000, "owed kept");
  expect(l.status(key(1)) == RequestStatus::validated, "status kept");
}

void test_claim_transfer_failure() {
  Ledger l;
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  l.prove(key(1), 2'000'000);
  l->submit_validation_result(kSubmitter, key(1), true);

  l.token.set_fail_transfers(true);
  auto r = l->claim_reward(kFermah);
  expect(r.code() == ErrorCode::transfer_failed, "token refused the transfer");
  expect(l->network_info(ProvingNetwork::fermah)->owed_reward == 2'000'000,
         "owed unchanged after a failed transfer");
  expect(l->network_info(ProvingNetwork::fermah)->unpaid.size() == 1, "unpaid list unchanged");
  expect(l.status(key(1)) == RequestStatus::validated, "request not marked paid");
  expect(l->events().count(EventType::reward_paid) == 0, "no payment event");

  l.token.set_fail_transfers(false);
  expect(l->claim_reward(kFermah).ok(), "retry succeeds");
  expect(l.status(key(1)) == RequestStatus::paid, "paid after retry");
}

// ============================================================================
// Admission control
// ============================================================================

void test_admission_boundary() {
  Ledger l(default_config(), 3 * kCeiling - 1);
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "k=0, 2 free slots");
  expect(l->submit_request(kSubmitter, key(2), params()).ok(), "k=1, 2 free slots");
  auto r = l->submit_request(kSubmitter, key(3), params());
  expect(r.code() == ErrorCode::no_funds_available, "k=2, 2 free slots: rejected");
  expect(proofman::is_retryable(r.code()), "capacity rejection is retryable");
  expect(l->request_counter() == 2, "rejected submission keeps the counter");

  l.token.mint(kEscrow, 1);
  expect(l->check_capacity().allowed, "exactly at the boundary (3 slots > 2)");
  expect(l->submit_request(kSubmitter, key(3), params()).ok(), "accepted once funded");

  // Obligations count against the balance.
  l.token.mint(kEscrow, kCeiling);
  expect(l->acknowledge(kFermah, key(1), true).ok(), "ack");
  expect(l->submit_proof(kFermah, key(1), proof_bytes(), 4'000'000).ok(), "proof");
  const auto c = l->check_capacity();
  expect(c.obligations == 4'000'000, "proven reward is an obligation");
  expect(c.in_flight == 2, "two requests still in flight");
  expect(c.free_slots == (4 * kCeiling - 4'000'000) / kCeiling, "free slots net of obligations");
}

void test_rejected_submission_is_atomic() {
  Ledger l(default_config(), 2 * kCeiling);
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "submit 1");
  expect(l->submit_request(kSubmitter, key(2), params()).ok(), "submit 2");
  l.clock.advance(500);  // both past the ack deadline
  l.token.burn(kEscrow, kCeiling + 1);

  const std::string before = l->snapshot_json();
  auto r = l->submit_request(kSubmitter, key(3), params());
  expect(r.code() == ErrorCode::no_funds_available, "no capacity even after a purge");
  expect(l->snapshot_json() == before, "rejected submission mutated nothing");
  expect(l->events().count(EventType::request_expired) == 0, "purge not applied");
  expect(l->in_flight_count() == 2, "stale entries still queued");

  l.token.mint(kEscrow, kCeiling + 1);
  expect(l->submit_request(kSubmitter, key(3), params()).ok(), "funded submission accepted");
  expect(l->events().count(EventType::request_expired) == 2, "purge applied with the submission");
  expect(l->in_flight_count() == 1, "only the new request in flight");
}

void test_purge_capacity_reuse() {
  // The in-flight count after the planned purge is what admission sees.
  Ledger l(default_config(), 2 * kCeiling);
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "submit 1");
  expect(l->submit_request(kSubmitter, key(2), params()).ok(), "submit 2");
  expect(l->submit_request(kSubmitter, key(3), params()).code() == ErrorCode::no_funds_available,
         "full");
  l.clock.advance(121);
  expect(l->check_capacity().in_flight == 0, "capacity view nets out the planned purge");
  expect(l->submit_request(kSubmitter, key(3), params()).ok(), "stale slots reusable");
}

void test_purge_limit() {
  auto cfg = default_config();
  cfg.purge_limit = 3;
  Ledger l(cfg);
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  for (std::uint64_t i = 0; i < 5; ++i) {
    expect(l->submit_request(kSubmitter, key(i), params()).ok(), "submit");
  }
  l->acknowledge(kFermah, key(0), true);
  l.clock.advance(4000);  // every deadline passed, key 0 proving deadline too
  expect(l->submit_request(kSubmitter, key(10), params()).ok(), "submit purges");
  expect(l->events().count(EventType::request_expired) == 3, "purge bounded by the limit");
  expect(l->in_flight_count() == 3, "two stale entries remain plus the new one");
  expect(l->submit_request(kSubmitter, key(11), params()).ok(), "next submit purges the rest");
  expect(l->events().count(EventType::request_expired) == 5, "all stale entries processed");
  expect(l.status(key(0)) == RequestStatus::timed_out, "committed entry timed out");
  expect(l->in_flight_count() == 2, "only fresh requests in flight");
}

void test_submission_at_exact_ack_deadline() {
  // One free slot: (2R - 1) / R == 1.
  Ledger l(default_config(), 2 * kCeiling - 1);
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  expect(l->submit_request(kSubmitter, key(1), params()).ok(), "first submit");
  l.clock.advance(l->config().ack_timeout);

  expect(l.status(key(1)) == RequestStatus::pending_acknowledgement,
         "lazy status still pending at the deadline");
  expect(l->check_capacity().in_flight == 0, "entry due now is planned for purge");
  auto r = l->submit_request(kSubmitter, key(2), params());
  expect(r.ok(), "submission at the deadline instant is admitted");
  expect(l->events().count(EventType::request_expired) == 1, "due entry purged");
  expect(l.status(key(1)) == RequestStatus::unacknowledged, "purged to unacknowledged");
  expect(l->in_flight_count() == 1, "only the new request in flight");
  expect(l->acknowledge(kFermah, key(1), true).code == ErrorCode::invalid_status,
         "purged request can no longer be acknowledged");
}

// ============================================================================
// End to end
// ============================================================================

void test_end_to_end_scenario() {
  Ledger l;
  const RequestKey k{1, 1};
  auto r = l->submit_request(kSubmitter, k, params(3600, 4'000'000));
  expect(r.ok() && r.value->assigned_to == ProvingNetwork::fermah, "counter 0 -> fermah");
  expect(l->acknowledge(kFermah, k, true).ok(), "accept");
  expect(l.status(k) == RequestStatus::committed, "committed");
  expect(l->submit_proof(kFermah, k, proof_bytes(), 3'000'000).ok(), "prove");
  auto p = l->get_request(k);
  expect(p.value->status == RequestStatus::proven && p.value->requested_reward == 3'000'000,
         "proven at 3e6");
  expect(l->submit_validation_result(kSubmitter, k, true).ok(), "validate");
  expect(l.status(k) == RequestStatus::validated, "validated");
  expect(l->network_info(ProvingNetwork::fermah)->owed_reward == 3'000'000, "owed 3e6");
  const Amount before = l.token.balance_of(kFermah);
  auto c = l->claim_reward(kFermah);
  expect(c.ok() && *c.value == 3'000'000, "claimed 3e6");
  expect(l.token.balance_of(kFermah) == before + 3'000'000, "fermah balance += 3e6");
  expect(l->network_info(ProvingNetwork::fermah)->owed_reward == 0, "owed reset");
  expect(l.status(k) == RequestStatus::paid, "paid");
}

// ============================================================================
// Events, audit, statistics
// ============================================================================

void test_event_stream() {
  Ledger l;
  std::vector<proofman::LedgerEvent> seen;
  l->events().set_hook([&seen](const proofman::LedgerEvent& ev) { seen.push_back(ev); });

  const RequestKey k{7, 42};
  l->submit_request(kSubmitter, k, params());
  l->acknowledge(kFermah, k, true);
  l->submit_proof(kFermah, k, proof_bytes("zk"), 1'000'000);
  l->submit_validation_result(kSubmitter, k, true);
  l->claim_reward(kFermah);
  l->submit_request(kStranger, key(99), params());  // fails: no event

  const EventType expected[] = {EventType::request_submitted, EventType::request_acknowledged,
                                EventType::proof_submitted, EventType::validation_result,
                                EventType::reward_paid};
  expect(seen.size() == 5, "one event per successful state change");
  for (std::size_t i = 0; i < seen.size(); ++i) {
    expect(seen[i].type == expected[i], "event order " + proofman::to_string(expected[i]));
    expect(seen[i].seq == i + 1, "contiguous sequence numbers");
  }
  const auto& submitted = seen[0].data;
  expect(proofman::jsonlite::get_string(submitted, "proof_inputs_url") == "ipfs://inputs",
         "submission event carries params");
  expect(proofman::jsonlite::get_string(submitted, "protocol_version") == "1.2.3",
         "protocol version rendered");
  expect(proofman::jsonlite::get_u64(submitted, "max_reward") == 4'000'000, "max reward");
  expect(seen[0].key && *seen[0].key == k, "event key");
  expect(proofman::jsonlite::get_string(seen[2].data, "proof_digest") ==
             proofman::proof_digest(proof_bytes("zk")), "proof digest in event");
  expect(proofman::jsonlite::get_u64(seen[4].data, "amount") == 1'000'000, "paid amount");
  expect(seen[4].to_json().find("\"type\":\"reward_paid\"") != std::string::npos, "event json");
  expect(l->events().snapshot().size() == 5, "ring holds the events");
}

void test_event_jsonl_file() {
  const fs::path p = temp_path("events.jsonl");
  auto cfg = default_config();
  cfg.event_log_path = p.string();
  {
    Ledger l(cfg);
    l->submit_request(kSubmitter, key(1), params());
    l->set_network_status(kAdmin, ProvingNetwork::lagrange, NetworkStatus::inactive);
    expect(l->events().write_failures() == 0, "no write failures");
  }
  const auto lines = read_lines(p);
  expect(lines.size() == 2, "two JSONL lines");
  for (const auto& line : lines) {
    expect(!proofman::jsonlite::validate_strict(line), "each line is strict JSON");
  }
  expect(lines[1].find("network_status_changed") != std::string::npos, "status change logged");
  fs::remove(p);
}

void test_audit_chain() {
  const fs::path p = temp_path("audit.ndjson");
  auto cfg = default_config();
  cfg.audit_log_path = p.string();
  {
    Ledger l(cfg);
    l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
    l.prove(key(1), 2'000'000);                               // 3 records
    l->submit_validation_result(kSubmitter, key(1), true);   // 1
    l->claim_reward(kFermah);                                 // 1
    expect(l->audit_log().entry_count() == 5, "five transitions recorded");
    expect(l->audit_log().failure_count() == 0, "no audit failures");
  }
  auto v = proofman::verify_audit_chain(p.string());
  expect(v.ok && v.entries == 5, "chain verifies: " + v.to_json());

  // A second writer resumes the chain.
  {
    Ledger l(cfg);
    l->submit_request(kSubmitter, key(2), params());
  }
  v = proofman::verify_audit_chain(p.string());
  expect(v.ok && v.entries == 6, "resumed chain verifies");

  // Tamper with an amount in the middle of the log.
  auto lines = read_lines(p);
  const std::string needle = "\"amount\":2000000";
  auto pos = lines[2].find(needle);
  expect(pos != std::string::npos, "proof record carries the reward");
  lines[2].replace(pos, needle.size(), "\"amount\":9000000");
  {
    std::ofstream out(p, std::ios::trunc);
    for (const auto& line : lines) out << line << "\n";
  }
  v = proofman::verify_audit_chain(p.string());
  expect(!v.ok && v.error == "audit_chain_broken" && v.failed_sequence == 4,
         "tampering detected at the next link");

  expect(proofman::verify_audit_chain(temp_path("missing.ndjson").string()).error ==
             "audit_unreadable", "missing log");
  fs::remove(p);
}

void test_audit_records_only_legal_transitions() {
  const fs::path p = temp_path("legal.ndjson");
  auto cfg = default_config();
  cfg.audit_log_path = p.string();
  {
    Ledger l(cfg);
    l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
    l.prove(key(1), 2'000'000);
    expect(l->submit_request(kSubmitter, key(2), params()).ok(), "submit 2");
    expect(l->acknowledge(kFermah, key(2), true).ok(), "ack 2");
    expect(l->submit_request(kSubmitter, key(3), params()).ok(), "submit 3");
    expect(l->acknowledge(kFermah, key(3), false).ok(), "refuse 3");
    const auto recorded = l->audit_log().entry_count();

    // Illegal moves driven through the ledger are rejected and leave no record.
    expect(l->submit_validation_result(kSubmitter, key(2), true).code ==
               ErrorCode::invalid_status, "committed cannot be validated");
    expect(l->update_status(kSubmitter, key(2), RequestStatus::paid).code ==
               ErrorCode::invalid_transition, "committed -> paid");
    expect(l->update_status(kSubmitter, key(1), RequestStatus::paid).code ==
               ErrorCode::invalid_transition, "proven -> paid");
    expect(l->acknowledge(kFermah, key(2), true).code == ErrorCode::invalid_status,
           "committed cannot be acknowledged again");
    expect(l->submit_proof(kFermah, key(3), proof_bytes(), 1).code ==
               ErrorCode::invalid_status, "refused cannot be proven");
    expect(l->claim_reward(kFermah).code() == ErrorCode::no_payment_due,
           "nothing validated yet");
    expect(l->audit_log().entry_count() == recorded, "rejected moves not audited");
    expect(l.status(key(2)) == RequestStatus::committed, "status untouched");

    expect(l->submit_validation_result(kSubmitter, key(1), true).ok(), "validate 1");
    expect(l->claim_reward(kFermah).ok(), "claim");
    l.clock.advance(4000);
    expect(l->submit_request(kSubmitter, key(4), params()).ok(), "submit purges 2");
  }

  int transitions = 0;
  for (const auto& line : read_lines(p)) {
    std::optional<proofman::jsonlite::JsonError> err;
    const auto obj = proofman::jsonlite::parse(line, &err);
    expect(!err, "audit line parses");
    const std::string from = proofman::jsonlite::get_string(obj, "from");
    const auto to = proofman::request_status_from_string(proofman::jsonlite::get_string(obj, "to"));
    expect(to.has_value(), "audit target status");
    if (from == "none") continue;  // creation
    const auto f = proofman::request_status_from_string(from);
    expect(f && proofman::is_legal_transition(*f, *to),
           "audited transition " + from + " -> " + proofman::to_string(*to) + " is legal");
    ++transitions;
  }
  // ack 1, proof 1, ack 2, refuse 3, validate 1, pay 1, time out 2
  expect(transitions == 7, "every persisted change audited");
  fs::remove(p);
}

void test_failure_statistics() {
  auto& stats = proofman::global_ledger_stats();
  const auto dup_before = stats.failures(ErrorCode::duplicate_request);
  const auto failed_before = stats.failed_operations.load();
  const auto submitted_before = stats.requests_submitted.load();
  const auto latency_before = stats.latency_histogram.count();

  Ledger l;
  l->submit_request(kSubmitter, key(1), params());
  l->submit_request(kSubmitter, key(1), params());
  expect(stats.failures(ErrorCode::duplicate_request) == dup_before + 1, "failure counted by code");
  expect(stats.failed_operations.load() == failed_before + 1, "failure total");
  expect(stats.requests_submitted.load() == submitted_before + 1, "submission counted");
  expect(stats.latency_histogram.count() >= latency_before + 2, "operations timed");
  expect(stats.to_json().find("\"duplicate_request\"") != std::string::npos, "stats json");
}

// ============================================================================
// Configuration and version
// ============================================================================

void test_config_loading() {
  std::string err;
  auto cfg = proofman::load_config_json("{}", &err);
  expect(err.empty(), "empty document is valid");
  expect(cfg.ack_timeout == 120 && cfg.max_timeout_after == 7200 &&
             cfg.reward_ceiling == 25'000'000 && cfg.purge_limit == 10, "defaults");

  cfg = proofman::load_config_json(
      "{\"ack_timeout\":60,\"fermah_address\":\"0xfe\",\"purge_limit\":4}", &err);
  expect(err.empty() && cfg.ack_timeout == 60 && cfg.purge_limit == 4 &&
             cfg.fermah_address == "0xfe", "overrides applied");

  err.clear();
  proofman::load_config_json("{\"ack_timeout\":60,\"ack_timeout\":61}", &err);
  expect(err == "json_duplicate_key", "duplicate key rejected");

  err.clear();
  proofman::load_config_json("{\"ack_timout\":60}", &err);
  expect(err.rfind("config_invalid", 0) == 0, "unknown key rejected");

  err.clear();
  proofman::load_config_json("{\"ack_timeout\":\"60\"}", &err);
  expect(err.rfind("config_invalid", 0) == 0, "wrong type rejected");

  err.clear();
  proofman::load_config_json("{\"ack_timeout\":7200,\"max_timeout_after\":7200}", &err);
  expect(err.rfind("config_invalid", 0) == 0, "max_timeout_after must exceed ack_timeout");

  err.clear();
  proofman::load_config_json("{\"reward_ceiling\":0}", &err);
  expect(err.rfind("config_invalid", 0) == 0, "zero ceiling rejected");

  err.clear();
  auto full = default_config();
  full.audit_log_path = "/tmp/a \"quoted\".ndjson";
  auto back = proofman::load_config_json(proofman::config_to_json(full), &err);
  expect(err.empty() && back.audit_log_path == full.audit_log_path &&
             back.escrow_address == full.escrow_address, "config_to_json reloads");

  err.clear();
  proofman::load_config_file(temp_path("missing.json").string(), &err);
  expect(err.rfind("config_unreadable", 0) == 0, "missing file");
}

void test_env_overrides() {
  ::setenv("PROOFMAN_AUDIT_LOG", "/tmp/proofman-audit.ndjson", 1);
  ::setenv("PROOFMAN_EVENT_LOG", "", 1);
  proofman::LedgerConfig cfg;
  cfg.event_log_path = "/tmp/keep.jsonl";
  proofman::apply_env_overrides(cfg);
  expect(cfg.audit_log_path == "/tmp/proofman-audit.ndjson", "audit path from env");
  expect(cfg.event_log_path == "/tmp/keep.jsonl", "empty env value ignored");
  ::unsetenv("PROOFMAN_AUDIT_LOG");
  ::unsetenv("PROOFMAN_EVENT_LOG");
}

void test_version_manifest() {
  const auto m = proofman::version::current_manifest("9.9.9");
  const std::string j = proofman::version::manifest_to_json(m);
  expect(!proofman::jsonlite::validate_strict(j), "manifest is valid JSON");
  expect(j.find("\"semver\":\"9.9.9\"") != std::string::npos, "semver");
  expect(m.hash_primitive == "blake3", "hash primitive");
  expect(m.audit_log == proofman::version::AUDIT_LOG_VERSION, "audit version");
}

// ============================================================================
// Concurrency
// ============================================================================

void test_concurrent_submissions() {
  Ledger l(default_config(), 400 * kCeiling);
  l->set_preferred_network(kAdmin, ProvingNetwork::fermah);
  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&l, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        const RequestKey k{static_cast<std::uint64_t>(t + 1), static_cast<std::uint64_t>(i)};
        auto r = l->submit_request(kSubmitter, k, params());
        if (!r.ok()) std::abort();
      }
    });
  }
  for (auto& th : threads) th.join();
  const auto total = static_cast<std::uint64_t>(kThreads * kPerThread);
  expect(l->request_counter() == total, "every submission counted once");
  expect(l->in_flight_count() == total, "every request queued");
  expect(l->events().count(EventType::request_submitted) == total, "every submission emitted");

  std::vector<bool> seen(total, false);
  for (int t = 0; t < kThreads; ++t) {
    for (int i = 0; i < kPerThread; ++i) {
      const RequestKey k{static_cast<std::uint64_t>(t + 1), static_cast<std::uint64_t>(i)};
      const auto id = l->get_request(k).value->request_id;
      expect(id < total && !seen[id], "request ids unique");
      seen[id] = true;
    }
  }
}

}  // namespace

int main() {
  std::cout << "=== proofman Test Suite ===\n";

  std::cout << "\n[Foundations]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("strict JSON parsing", test_json_strict_parsing);
  run_test("error taxonomy", test_error_taxonomy);
  run_test("status strings", test_status_strings);

  std::cout << "\n[Expiry queue]\n";
  run_test("basic operations", test_queue_basic);
  run_test("randomized against a model (5000 ops)", test_queue_randomized_against_model);
  run_test("count_expired matches extraction", test_queue_count_expired_matches_extraction);

  std::cout << "\n[State machine, assignment, admission]\n";
  run_test("transition matrix", test_transition_matrix);
  run_test("assignment policy", test_assignment_policy);
  run_test("capacity formula", test_capacity_formula);

  std::cout << "\n[Construction and access control]\n";
  run_test("create validation", test_create_validation);
  run_test("role gates", test_role_gates);
  run_test("registry administration", test_registry_admin);

  std::cout << "\n[Request lifecycle]\n";
  run_test("duplicate rejection", test_duplicate_rejection);
  run_test("parameter validation", test_param_validation);
  run_test("round robin", test_round_robin);
  run_test("unassignable requests refused", test_unassignable_requests_refused);
  run_test("acknowledgement deadline", test_acknowledgement_deadline);
  run_test("acknowledge checks", test_acknowledge_checks);
  run_test("proving deadline", test_proving_deadline);
  run_test("proof checks and reward clamping", test_proof_checks_and_clamping);
  run_test("validation results", test_validation_results);
  run_test("update_status gating", test_update_status_gating);

  std::cout << "\n[Payout]\n";
  run_test("claim is idempotent", test_claim_payout_idempotent);
  run_test("claim with insufficient funds", test_claim_insufficient_funds);
  run_test("claim with transfer failure", test_claim_transfer_failure);

  std::cout << "\n[Admission control]\n";
  run_test("admission boundary", test_admission_boundary);
  run_test("rejected submission is atomic", test_rejected_submission_is_atomic);
  run_test("purge frees capacity", test_purge_capacity_reuse);
  run_test("purge limit", test_purge_limit);
  run_test("submission at the exact ack deadline", test_submission_at_exact_ack_deadline);

  std::cout << "\n[End to end]\n";
  run_test("submit to claim", test_end_to_end_scenario);

  std::cout << "\n[Events, audit, statistics]\n";
  run_test("event stream", test_event_stream);
  run_test("event JSONL file", test_event_jsonl_file);
  run_test("audit chain", test_audit_chain);
  run_test("audit records only legal transitions", test_audit_records_only_legal_transitions);
  run_test("failure statistics", test_failure_statistics);

  std::cout << "\n[Configuration]\n";
  run_test("config loading", test_config_loading);
  run_test("environment overrides", test_env_overrides);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Concurrency]\n";
  run_test("concurrent submissions (8 threads)", test_concurrent_submissions);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
