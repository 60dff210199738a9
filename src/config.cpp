#include "proofman/config.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include "proofman/jsonlite.hpp"

namespace proofman {

namespace {

const std::set<std::string> kKnownKeys = {
  "ack_timeout", "max_timeout_after", "reward_ceiling", "purge_limit",
  "escrow_address", "fermah_address", "lagrange_address",
  "event_log_path", "audit_log_path",
};

bool read_string(const jsonlite::Object& obj, const std::string& key, std::string* out) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!std::holds_alternative<std::string>(it->second.v)) return false;
  *out = std::get<std::string>(it->second.v);
  return true;
}

}  // namespace

LedgerConfig load_config_json(const std::string& text, std::string* error) {
  LedgerConfig defaults;

  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = err->code;
    return defaults;
  }

  for (const auto& [k, v] : obj) {
    if (kKnownKeys.count(k) == 0) {
      if (error) *error = "config_invalid: unknown key '" + k + "'";
      return defaults;
    }
  }

  LedgerConfig cfg;
  std::uint64_t purge_limit = cfg.purge_limit;
  const char* bad = nullptr;
  if (!jsonlite::read_u64(obj, "ack_timeout", &cfg.ack_timeout)) bad = "ack_timeout";
  else if (!jsonlite::read_u64(obj, "max_timeout_after", &cfg.max_timeout_after)) bad = "max_timeout_after";
  else if (!jsonlite::read_u64(obj, "reward_ceiling", &cfg.reward_ceiling)) bad = "reward_ceiling";
  else if (!jsonlite::read_u64(obj, "purge_limit", &purge_limit)) bad = "purge_limit";
  else if (!read_string(obj, "escrow_address", &cfg.escrow_address)) bad = "escrow_address";
  else if (!read_string(obj, "fermah_address", &cfg.fermah_address)) bad = "fermah_address";
  else if (!read_string(obj, "lagrange_address", &cfg.lagrange_address)) bad = "lagrange_address";
  else if (!read_string(obj, "event_log_path", &cfg.event_log_path)) bad = "event_log_path";
  else if (!read_string(obj, "audit_log_path", &cfg.audit_log_path)) bad = "audit_log_path";
  if (bad) {
    if (error) *error = std::string("config_invalid: wrong type for '") + bad + "'";
    return defaults;
  }
  cfg.purge_limit = static_cast<std::size_t>(purge_limit);

  const Status st = validate_config(cfg);
  if (!st.ok()) {
    if (error) *error = "config_invalid: " + st.detail;
    return defaults;
  }
  return cfg;
}

LedgerConfig load_config_file(const std::string& path, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) *error = "config_unreadable: " + path;
    return LedgerConfig{};
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_config_json(ss.str(), error);
}

void apply_env_overrides(LedgerConfig& config) {
  const char* events = std::getenv("PROOFMAN_EVENT_LOG");
  if (events && events[0]) config.event_log_path = events;
  const char* audit = std::getenv("PROOFMAN_AUDIT_LOG");
  if (audit && audit[0]) config.audit_log_path = audit;
}

Status validate_config(const LedgerConfig& config) {
  if (config.ack_timeout == 0) {
    return Status::error(ErrorCode::config_invalid, "ack_timeout must be positive");
  }
  if (config.max_timeout_after <= config.ack_timeout) {
    return Status::error(ErrorCode::config_invalid,
                         "max_timeout_after must exceed ack_timeout");
  }
  if (config.reward_ceiling == 0) {
    return Status::error(ErrorCode::config_invalid, "reward_ceiling must be positive");
  }
  if (config.purge_limit == 0) {
    return Status::error(ErrorCode::config_invalid, "purge_limit must be positive");
  }
  return Status::success();
}

std::string config_to_json(const LedgerConfig& config) {
  std::ostringstream o;
  o << "{"
    << "\"ack_timeout\":" << config.ack_timeout
    << ",\"audit_log_path\":\"" << jsonlite::escape(config.audit_log_path) << "\""
    << ",\"escrow_address\":\"" << jsonlite::escape(config.escrow_address) << "\""
    << ",\"event_log_path\":\"" << jsonlite::escape(config.event_log_path) << "\""
    << ",\"fermah_address\":\"" << jsonlite::escape(config.fermah_address) << "\""
    << ",\"lagrange_address\":\"" << jsonlite::escape(config.lagrange_address) << "\""
    << ",\"max_timeout_after\":" << config.max_timeout_after
    << ",\"purge_limit\":" << config.purge_limit
    << ",\"reward_ceiling\":" << config.reward_ceiling
    << "}";
  return o.str();
}

}  // namespace proofman
