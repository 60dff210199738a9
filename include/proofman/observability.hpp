#pragma once

// proofman/observability.hpp - Ledger events and operation statistics.
//
// DESIGN:
//   LedgerEvent is the canonical observable unit. Every successful state change
//   of the ledger emits exactly one event (the purge emits one per expired
//   request). Events are:
//     - kept in a bounded ring buffer owned by the manager's EventLog,
//     - passed to an optional hook (tests, embedding hosts),
//     - appended as JSONL to a file when an event log path is configured
//       (config `event_log_path` or PROOFMAN_EVENT_LOG).
//   Failed operations emit no event; they are counted in LedgerStats by code.
//
// INVARIANTS:
//   - Event sequence numbers are per EventLog, start at 1 and have no gaps.
//   - Event emission never fails the ledger operation. A JSONL write failure
//     is counted in write_failures() and otherwise ignored.
//   - Amounts are emitted as JSON integers, never floating point.
//
// EXTENSION_POINT: event_exporter
//   Current: in-process ring buffer + JSONL file.
//   Upgrade: forward the hook to a message bus for off-process indexers.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "proofman/jsonlite.hpp"
#include "proofman/types.hpp"

namespace proofman {

// ---------------------------------------------------------------------------
// EventType
// ---------------------------------------------------------------------------
enum class EventType : std::uint8_t {
  request_submitted,
  request_acknowledged,
  proof_submitted,
  validation_result,
  reward_paid,
  request_expired,
  network_address_changed,
  network_status_changed,
  preferred_network_changed,
};

constexpr std::size_t kEventTypeCount = 9;

std::string to_string(EventType type);

// ---------------------------------------------------------------------------
// LedgerEvent
// ---------------------------------------------------------------------------
struct LedgerEvent {
  std::uint64_t                seq{0};        // assigned by EventLog::emit
  Timestamp                    timestamp{0};  // ledger clock
  EventType                    type{EventType::request_submitted};
  std::optional<RequestKey>    key;
  ProvingNetwork               network{ProvingNetwork::none};
  std::optional<RequestStatus> status;        // status after the change
  jsonlite::Object             data;          // event-specific fields

  // One compact JSON line, no trailing newline.
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// EventLog - per-manager event sink
// ---------------------------------------------------------------------------
// Thread-safe. The ring keeps the last kMaxRecentEvents events.
class EventLog {
 public:
  static constexpr std::size_t kMaxRecentEvents = 1000;

  using Hook = std::function<void(const LedgerEvent&)>;

  explicit EventLog(std::string jsonl_path = "");

  // Assigns the sequence number and fans the event out.
  void emit(LedgerEvent ev);

  void set_hook(Hook hook);

  std::vector<LedgerEvent> snapshot() const;     // oldest first
  std::uint64_t count(EventType type) const;     // lifetime count, not ring count
  std::uint64_t total() const;
  std::uint64_t write_failures() const { return write_failures_.load(std::memory_order_relaxed); }
  const std::string& path() const { return path_; }

 private:
  mutable std::mutex mu_;
  std::string path_;
  Hook hook_;
  std::vector<LedgerEvent> ring_;
  std::size_t ring_head_{0};  // next slot to overwrite once the ring is full
  std::uint64_t next_seq_{1};
  std::array<std::uint64_t, kEventTypeCount> counts_{};
  std::atomic<std::uint64_t> write_failures_{0};
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// Bucket boundaries are fixed; readers of serialized stats depend on them.
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 if empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  std::uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// LedgerStats - process-wide aggregated statistics
// ---------------------------------------------------------------------------
// All counters are atomic and only ever grow. Shared by every ProofManager in
// the process; tests compare before/after values.
class LedgerStats {
 public:
  static constexpr std::size_t kErrorCodeCount =
      static_cast<std::size_t>(ErrorCode::invariant_violation) + 1;

  void record_failure(ErrorCode code);
  std::uint64_t failures(ErrorCode code) const;

  std::string to_json() const;

  std::atomic<std::uint64_t> requests_submitted{0};
  std::atomic<std::uint64_t> requests_refused{0};     // refused at submission or by the network
  std::atomic<std::uint64_t> requests_acknowledged{0};
  std::atomic<std::uint64_t> proofs_submitted{0};
  std::atomic<std::uint64_t> proofs_validated{0};
  std::atomic<std::uint64_t> proofs_rejected{0};
  std::atomic<std::uint64_t> requests_expired{0};
  std::atomic<std::uint64_t> claims_paid{0};
  std::atomic<std::uint64_t> amount_paid{0};
  std::atomic<std::uint64_t> failed_operations{0};

  LatencyHistogram latency_histogram;

 private:
  std::array<std::atomic<std::uint64_t>, kErrorCodeCount> failures_by_code_{};
};

LedgerStats& global_ledger_stats();

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture into a histogram
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  LatencyHistogram& histogram;
  explicit ScopeTimer(LatencyHistogram& h) : histogram(h) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    histogram.record(static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count()));
  }
};

}  // namespace proofman
