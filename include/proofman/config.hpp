#pragma once

// proofman/config.hpp - Ledger configuration.
//
// Loaded from a strict JSON document (duplicate keys rejected, unknown keys
// rejected, amounts and durations as non-negative integers):
//
//   {
//     "ack_timeout": 120,
//     "max_timeout_after": 7200,
//     "reward_ceiling": 25000000,
//     "purge_limit": 10,
//     "escrow_address": "0xe5c0",
//     "fermah_address": "0xfe",
//     "lagrange_address": "0x1a",
//     "event_log_path": "",
//     "audit_log_path": ""
//   }
//
// Every key is optional; absent keys keep their defaults. Environment
// overrides (PROOFMAN_EVENT_LOG, PROOFMAN_AUDIT_LOG) are applied separately by
// apply_env_overrides() so that callers decide whether the process
// environment participates.

#include <cstddef>
#include <string>

#include "proofman/types.hpp"

namespace proofman {

struct LedgerConfig {
  Timestamp   ack_timeout{120};
  Timestamp   max_timeout_after{7200};
  Amount      reward_ceiling{25'000'000};
  std::size_t purge_limit{10};

  Address escrow_address;
  Address fermah_address;
  Address lagrange_address;

  std::string event_log_path;  // "" = no JSONL event file
  std::string audit_log_path;  // "" = audit log disabled
};

// Parse a config document. On failure returns defaults and sets *error to
// "json_parse_error", "json_duplicate_key" or "config_invalid: <detail>".
LedgerConfig load_config_json(const std::string& text, std::string* error);

// Read and parse a file. Unreadable files report "config_unreadable: <path>".
LedgerConfig load_config_file(const std::string& path, std::string* error);

// PROOFMAN_EVENT_LOG / PROOFMAN_AUDIT_LOG, when set and non-empty, replace the
// corresponding paths.
void apply_env_overrides(LedgerConfig& config);

// Range checks only; addresses are checked by ProofManager::create.
// Returns success or config_invalid with a detail naming the field.
Status validate_config(const LedgerConfig& config);

std::string config_to_json(const LedgerConfig& config);

}  // namespace proofman
