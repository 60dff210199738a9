#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "proofman/audit.hpp"
#include "proofman/clock.hpp"
#include "proofman/config.hpp"
#include "proofman/escrow.hpp"
#include "proofman/hash.hpp"
#include "proofman/jsonlite.hpp"
#include "proofman/observability.hpp"
#include "proofman/proof_manager.hpp"
#include "proofman/rbac.hpp"
#include "proofman/version.hpp"

#ifndef PROOFMAN_VERSION
#define PROOFMAN_VERSION "0.1.0"
#endif

namespace {

namespace jl = proofman::jsonlite;

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  out->assign((std::istreambuf_iterator<char>(ifs)),
              std::istreambuf_iterator<char>());
  return true;
}

void usage() {
  std::cerr << "usage: proofman version\n"
               "       proofman health\n"
               "       proofman config check --config FILE\n"
               "       proofman audit verify --log FILE\n"
               "       proofman replay --config FILE --script FILE [--start T]\n";
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (proofman::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262")
    return false;
  if (proofman::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f")
    return false;
  return true;
}

// ---------------------------------------------------------------------------
// Replay script
// ---------------------------------------------------------------------------
// One JSON object per line, e.g.
//   {"op":"grant","role":"submitter","account":"0x5b"}
//   {"op":"mint","to":"0xe5c0","amount":100000000}
//   {"op":"submit","caller":"0x5b","chain_id":1,"block_number":7,
//    "proof_inputs_url":"ipfs://x","timeout_after":3600,"max_reward":4000000}
//   {"op":"ack","caller":"0xfe","chain_id":1,"block_number":7,"accept":true}
//   {"op":"proof","caller":"0xfe","chain_id":1,"block_number":7,
//    "proof":"...","requested_reward":3000000}
//   {"op":"validate","caller":"0x5b","chain_id":1,"block_number":7,"valid":true}
//   {"op":"claim","caller":"0xfe"}
//   {"op":"advance","seconds":60}
// Blank lines and lines starting with '#' are skipped.

struct ScriptError {
  std::string code;
  std::string message;
};

class ScriptRunner {
public:
  ScriptRunner(proofman::ProofManager &mgr, proofman::InMemoryToken &token,
               proofman::rbac::RoleTable &roles, proofman::ManualClock &clock)
      : mgr_(mgr), token_(token), roles_(roles), clock_(clock) {}

  // Runs one parsed line. Returns false (and fills *err) on malformed input.
  bool run(const jl::Object &obj, std::string *out, ScriptError *err);

private:
  bool need_string(const jl::Object &obj, const std::string &key,
                   std::string *out, ScriptError *err) const;
  bool need_u64(const jl::Object &obj, const std::string &key,
                std::uint64_t *out, ScriptError *err) const;
  bool need_bool(const jl::Object &obj, const std::string &key, bool *out,
                 ScriptError *err) const;
  bool need_key(const jl::Object &obj, proofman::RequestKey *key,
                ScriptError *err) const;
  bool need_network(const jl::Object &obj, proofman::ProvingNetwork *n,
                    ScriptError *err) const;

  proofman::ProofManager &mgr_;
  proofman::InMemoryToken &token_;
  proofman::rbac::RoleTable &roles_;
  proofman::ManualClock &clock_;
};

bool ScriptRunner::need_string(const jl::Object &obj, const std::string &key,
                               std::string *out, ScriptError *err) const {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) {
    *err = {"script_missing_field", "expected string field '" + key + "'"};
    return false;
  }
  *out = std::get<std::string>(it->second.v);
  return true;
}

bool ScriptRunner::need_u64(const jl::Object &obj, const std::string &key,
                            std::uint64_t *out, ScriptError *err) const {
  if (!jl::has_key(obj, key) || !jl::read_u64(obj, key, out)) {
    *err = {"script_missing_field", "expected integer field '" + key + "'"};
    return false;
  }
  return true;
}

bool ScriptRunner::need_bool(const jl::Object &obj, const std::string &key,
                             bool *out, ScriptError *err) const {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) {
    *err = {"script_missing_field", "expected boolean field '" + key + "'"};
    return false;
  }
  *out = std::get<bool>(it->second.v);
  return true;
}

bool ScriptRunner::need_key(const jl::Object &obj, proofman::RequestKey *key,
                            ScriptError *err) const {
  return need_u64(obj, "chain_id", &key->chain_id, err) &&
         need_u64(obj, "block_number", &key->block_number, err);
}

bool ScriptRunner::need_network(const jl::Object &obj,
                                proofman::ProvingNetwork *n,
                                ScriptError *err) const {
  std::string s;
  if (!need_string(obj, "network", &s, err))
    return false;
  auto parsed = proofman::proving_network_from_string(s);
  if (!parsed) {
    *err = {"script_bad_value", "unknown network '" + s + "'"};
    return false;
  }
  *n = *parsed;
  return true;
}

bool ScriptRunner::run(const jl::Object &obj, std::string *out,
                       ScriptError *err) {
  using namespace proofman;
  std::string op, caller;
  if (!need_string(obj, "op", &op, err))
    return false;

  if (op == "advance") {
    std::uint64_t seconds = 0;
    if (!need_u64(obj, "seconds", &seconds, err))
      return false;
    clock_.advance(seconds);
    *out = "{\"ok\":true,\"now\":" + std::to_string(clock_.now()) + "}";
    return true;
  }
  if (op == "mint") {
    std::string to;
    std::uint64_t amount = 0;
    if (!need_string(obj, "to", &to, err) ||
        !need_u64(obj, "amount", &amount, err))
      return false;
    token_.mint(to, amount);
    *out = "{\"ok\":true,\"balance\":" + std::to_string(token_.balance_of(to)) +
           "}";
    return true;
  }
  if (op == "grant") {
    std::string role_s, account;
    if (!need_string(obj, "role", &role_s, err) ||
        !need_string(obj, "account", &account, err))
      return false;
    auto role = rbac::role_from_string(role_s);
    if (!role) {
      *err = {"script_bad_value", "unknown role '" + role_s + "'"};
      return false;
    }
    const bool granted = roles_.grant(*role, account);
    *out = std::string("{\"ok\":true,\"granted\":") +
           (granted ? "true" : "false") + "}";
    return true;
  }

  if (!need_string(obj, "caller", &caller, err))
    return false;

  if (op == "submit") {
    RequestKey key;
    RequestParams p;
    std::uint64_t v = 0;
    if (!need_key(obj, &key, err) ||
        !need_u64(obj, "timeout_after", &p.timeout_after, err) ||
        !need_u64(obj, "max_reward", &p.max_reward, err))
      return false;
    p.proof_inputs_url = jl::get_string(obj, "proof_inputs_url", "");
    v = jl::get_u64(obj, "protocol_major", 0);
    p.protocol_major = static_cast<std::uint32_t>(v);
    v = jl::get_u64(obj, "protocol_minor", 0);
    p.protocol_minor = static_cast<std::uint32_t>(v);
    v = jl::get_u64(obj, "protocol_patch", 0);
    p.protocol_patch = static_cast<std::uint32_t>(v);
    auto r = mgr_.submit_request(caller, key, p);
    *out = r.ok() ? "{\"ok\":true,\"request\":" + r.value->to_json() + "}"
                  : r.status.to_json();
    return true;
  }
  if (op == "ack") {
    RequestKey key;
    bool accept = false;
    if (!need_key(obj, &key, err) || !need_bool(obj, "accept", &accept, err))
      return false;
    *out = mgr_.acknowledge(caller, key, accept).to_json();
    return true;
  }
  if (op == "proof") {
    RequestKey key;
    std::string proof;
    std::uint64_t reward = 0;
    if (!need_key(obj, &key, err) || !need_string(obj, "proof", &proof, err) ||
        !need_u64(obj, "requested_reward", &reward, err))
      return false;
    *out = mgr_.submit_proof(caller, key, Bytes(proof.begin(), proof.end()),
                             reward)
               .to_json();
    return true;
  }
  if (op == "validate") {
    RequestKey key;
    bool valid = false;
    if (!need_key(obj, &key, err) || !need_bool(obj, "valid", &valid, err))
      return false;
    *out = mgr_.submit_validation_result(caller, key, valid).to_json();
    return true;
  }
  if (op == "update_status") {
    RequestKey key;
    std::string status_s;
    if (!need_key(obj, &key, err) ||
        !need_string(obj, "status", &status_s, err))
      return false;
    auto status = request_status_from_string(status_s);
    if (!status) {
      *err = {"script_bad_value", "unknown status '" + status_s + "'"};
      return false;
    }
    *out = mgr_.update_status(caller, key, *status).to_json();
    return true;
  }
  if (op == "claim") {
    auto r = mgr_.claim_reward(caller);
    *out = r.ok() ? "{\"ok\":true,\"amount\":" + std::to_string(*r.value) + "}"
                  : r.status.to_json();
    return true;
  }
  if (op == "set_status") {
    ProvingNetwork n;
    std::string status_s;
    if (!need_network(obj, &n, err) ||
        !need_string(obj, "status", &status_s, err))
      return false;
    auto status = network_status_from_string(status_s);
    if (!status) {
      *err = {"script_bad_value", "unknown network status '" + status_s + "'"};
      return false;
    }
    *out = mgr_.set_network_status(caller, n, *status).to_json();
    return true;
  }
  if (op == "set_preferred") {
    ProvingNetwork n;
    if (!need_network(obj, &n, err))
      return false;
    *out = mgr_.set_preferred_network(caller, n).to_json();
    return true;
  }
  if (op == "set_address") {
    ProvingNetwork n;
    std::string address;
    if (!need_network(obj, &n, err) ||
        !need_string(obj, "address", &address, err))
      return false;
    *out = mgr_.set_network_address(caller, n, address).to_json();
    return true;
  }

  *err = {"script_unknown_op", "unknown op '" + op + "'"};
  return false;
}

int cmd_replay(int argc, char **argv) {
  std::string config_path, script_path;
  std::uint64_t start = 0;
  for (int i = 2; i < argc; ++i) {
    if (std::string(argv[i]) == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (std::string(argv[i]) == "--script" && i + 1 < argc)
      script_path = argv[++i];
    else if (std::string(argv[i]) == "--start" && i + 1 < argc)
      start = std::strtoull(argv[++i], nullptr, 10);
  }
  if (config_path.empty() || script_path.empty()) {
    usage();
    return 2;
  }

  std::string error;
  proofman::LedgerConfig cfg = proofman::load_config_file(config_path, &error);
  if (!error.empty()) {
    std::cerr << "{\"error\":\"" << jl::escape(error) << "\"}\n";
    return 2;
  }
  proofman::apply_env_overrides(cfg);

  std::string script;
  if (!read_file(script_path, &script)) {
    std::cerr << "{\"error\":\"script_unreadable\"}\n";
    return 2;
  }

  proofman::InMemoryToken token;
  proofman::rbac::RoleTable roles;
  proofman::ManualClock clock(start);
  proofman::Status st;
  auto mgr = proofman::ProofManager::create({token, roles, clock}, cfg, &st);
  if (!mgr) {
    std::cerr << st.to_json() << "\n";
    return 2;
  }

  ScriptRunner runner(*mgr, token, roles, clock);
  std::istringstream lines(script);
  std::string line;
  std::uint64_t line_no = 0;
  while (std::getline(lines, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#')
      continue;
    std::optional<jl::JsonError> jerr;
    const jl::Object obj = jl::parse(line, &jerr);
    if (jerr) {
      std::cerr << "{\"error\":\"" << jerr->code << "\",\"line\":" << line_no
                << "}\n";
      return 2;
    }
    std::string out;
    ScriptError serr;
    if (!runner.run(obj, &out, &serr)) {
      std::cerr << "{\"error\":\"" << serr.code << "\",\"line\":" << line_no
                << ",\"message\":\"" << jl::escape(serr.message) << "\"}\n";
      return 2;
    }
    std::cout << "{\"line\":" << line_no << ",\"op\":\""
              << jl::escape(jl::get_string(obj, "op")) << "\",\"result\":" << out
              << "}\n";
  }
  std::cout << "{\"snapshot\":" << mgr->snapshot_json() << "}\n";
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd = argc >= 2 ? argv[1] : "";
  if (cmd.empty()) {
    usage();
    return 1;
  }

  if (cmd == "version") {
    std::cout << proofman::version::manifest_to_json(
                     proofman::version::current_manifest(PROOFMAN_VERSION))
              << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = proofman::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_available\":"
              << (h.blake3_available ? "true" : "false")
              << ",\"hash_vectors_ok\":"
              << (verify_hash_vectors() ? "true" : "false")
              << ",\"stats\":" << proofman::global_ledger_stats().to_json()
              << "}\n";
    return 0;
  }

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "check") {
    std::string path;
    for (int i = 3; i < argc; ++i) {
      if (std::string(argv[i]) == "--config" && i + 1 < argc)
        path = argv[++i];
    }
    if (path.empty()) {
      usage();
      return 2;
    }
    std::string error;
    proofman::LedgerConfig cfg = proofman::load_config_file(path, &error);
    if (!error.empty()) {
      std::cout << "{\"ok\":false,\"error\":\"" << jl::escape(error)
                << "\"}\n";
      return 2;
    }
    std::cout << "{\"ok\":true,\"config\":" << proofman::config_to_json(cfg)
              << "}\n";
    return 0;
  }

  if (cmd == "audit" && argc >= 3 && std::string(argv[2]) == "verify") {
    std::string path;
    for (int i = 3; i < argc; ++i) {
      if (std::string(argv[i]) == "--log" && i + 1 < argc)
        path = argv[++i];
    }
    if (path.empty()) {
      usage();
      return 2;
    }
    const auto res = proofman::verify_audit_chain(path);
    std::cout << res.to_json() << "\n";
    return res.ok ? 0 : 2;
  }

  if (cmd == "replay")
    return cmd_replay(argc, argv);

  usage();
  return 1;
}
