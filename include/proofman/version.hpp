#pragma once

// proofman/version.hpp - Version manifest for every persisted or emitted format.
//
// PURPOSE:
//   Prevent silent format drift between the ledger, its event stream and its
//   audit log. Every component that writes a versioned format stamps or checks
//   its constant here.
//
// INVARIANT:
//   All version constants are compile-time. Bump the constant before changing
//   the corresponding format; readers never accept a newer version than they
//   were compiled against.

#include <cstdint>
#include <string>

namespace proofman {
namespace version {

// ---------------------------------------------------------------------------
// LEDGER_FORMAT_VERSION
// Tracks the snapshot_json() layout (requests, registry, queue, counters).
// ---------------------------------------------------------------------------
constexpr uint32_t LEDGER_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_FORMAT_VERSION
// Tracks the JSONL LedgerEvent line layout.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Version 1 = NDJSON TransitionRecord lines chained by BLAKE3 "audit:" digests.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3, 32-byte output hex-encoded to 64 chars, with domain
// prefixes ("proof:", "audit:").
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t ledger_format{LEDGER_FORMAT_VERSION};
  uint32_t event_format{EVENT_FORMAT_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string semver;           // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // __DATE__ "T" __TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace proofman
