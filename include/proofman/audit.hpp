#pragma once

// proofman/audit.hpp - Hash-chained, append-only audit log of request
// status transitions.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a sequence number one greater than the
//      previous entry in the same file, including across process restarts
//      (the writer resumes from the last line on open).
//   3. CHAINED: `prev` is the BLAKE3 "audit:" digest of the previous line as
//      written; the first entry links to 64 zeros.
//   4. STRUCTURED: one single-line JSON object per entry (NDJSON).
//   5. FAIL-SAFE: write failures never fail the ledger operation. They are
//      counted in failure_count().
//
// One record is written per persisted status change: creation (from = none),
// acknowledgement, proof, validation, payment and purge expiry.
//
// Invariant: AUDIT_LOG_VERSION (version.hpp) must be bumped before any
// structural change to TransitionRecord fields.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "proofman/types.hpp"

namespace proofman {

inline constexpr const char* kAuditGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

// ---------------------------------------------------------------------------
// TransitionRecord
// ---------------------------------------------------------------------------
struct TransitionRecord {
  std::uint64_t                sequence{0};   // assigned by append()
  std::string                  previous_digest;  // assigned by append()
  Timestamp                    timestamp{0};  // ledger clock
  RequestKey                   key;
  std::uint64_t                request_id{0};
  std::optional<RequestStatus> from;          // nullopt on creation
  RequestStatus                to{RequestStatus::pending_acknowledgement};
  ProvingNetwork               network{ProvingNetwork::none};
  Address                      actor;         // caller; empty for purge
  std::string                  cause;         // submit|acknowledge|proof|validation|claim|purge
  Amount                       amount{0};     // reward involved, if any
  std::uint32_t                audit_log_version{0};
};

// Compact single-line JSON (no trailing newline).
std::string transition_to_json(const TransitionRecord& r);

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------
// Thread-safe. Disabled (every append succeeds without writing) when
// constructed with an empty path.
class ImmutableAuditLog {
 public:
  explicit ImmutableAuditLog(const std::string& path = "");
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence + previous_digest in place. Returns false on write error;
  // in that case the entry was NOT written and the chain is unchanged.
  bool append(TransitionRecord& record);

  bool enabled() const { return !path_.empty(); }
  std::uint64_t entry_count() const;
  std::uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

// ---------------------------------------------------------------------------
// verify_audit_chain
// ---------------------------------------------------------------------------
struct AuditVerifyResult {
  bool          ok{false};
  std::uint64_t entries{0};
  std::uint64_t failed_sequence{0};  // 0 when ok or when the file is unreadable
  std::string   error;               // "" | audit_unreadable | audit_parse_error |
                                     // audit_sequence_gap | audit_chain_broken

  std::string to_json() const;
};

// Re-read a log and check sequence continuity (1, 2, 3, ...) and every chain
// link. An existing empty file verifies with zero entries; a missing file is
// audit_unreadable.
AuditVerifyResult verify_audit_chain(const std::string& path);

}  // namespace proofman
