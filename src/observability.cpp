#include "proofman/observability.hpp"

#include <bit>
#include <cstdio>
#include <sstream>

namespace proofman {

namespace {

// MICRO_OPT: bit_width gives the bucket index without a loop (BSR/CLZ).
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  std::size_t b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

}  // namespace

std::string to_string(EventType type) {
  switch (type) {
    case EventType::request_submitted:         return "request_submitted";
    case EventType::request_acknowledged:      return "request_acknowledged";
    case EventType::proof_submitted:           return "proof_submitted";
    case EventType::validation_result:         return "validation_result";
    case EventType::reward_paid:               return "reward_paid";
    case EventType::request_expired:           return "request_expired";
    case EventType::network_address_changed:   return "network_address_changed";
    case EventType::network_status_changed:    return "network_status_changed";
    case EventType::preferred_network_changed: return "preferred_network_changed";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// LedgerEvent
// ---------------------------------------------------------------------------

std::string LedgerEvent::to_json() const {
  std::string line;
  line.reserve(256);
  line += "{\"seq\":";
  line += std::to_string(seq);
  line += ",\"timestamp\":";
  line += std::to_string(timestamp);
  line += ",\"type\":\"";
  line += to_string(type);
  line += "\"";
  if (key) {
    line += ",\"chain_id\":";
    line += std::to_string(key->chain_id);
    line += ",\"block_number\":";
    line += std::to_string(key->block_number);
  }
  if (network != ProvingNetwork::none) {
    line += ",\"network\":\"";
    line += proofman::to_string(network);
    line += "\"";
  }
  if (status) {
    line += ",\"status\":\"";
    line += proofman::to_string(*status);
    line += "\"";
  }
  if (!data.empty()) {
    line += ",\"data\":";
    line += jsonlite::to_json(jsonlite::Value{data});
  }
  line += '}';
  return line;
}

// ---------------------------------------------------------------------------
// EventLog
// ---------------------------------------------------------------------------

EventLog::EventLog(std::string jsonl_path) : path_(std::move(jsonl_path)) {}

void EventLog::set_hook(Hook hook) {
  std::lock_guard<std::mutex> lk(mu_);
  hook_ = std::move(hook);
}

void EventLog::emit(LedgerEvent ev) {
  Hook hook;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ev.seq = next_seq_++;
    counts_[static_cast<std::size_t>(ev.type)]++;
    // MICRO_OPT: O(1) circular overwrite once the ring is full.
    if (ring_.size() < kMaxRecentEvents) {
      ring_.push_back(ev);
    } else {
      ring_[ring_head_] = ev;
      ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
    }
    hook = hook_;
  }

  if (hook) hook(ev);

  if (path_.empty()) return;
  std::string line = ev.to_json();
  line += '\n';
  // O_APPEND semantics: one fwrite per line keeps lines whole.
  FILE* f = std::fopen(path_.c_str(), "a");
  if (!f) {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  const bool ok = std::fwrite(line.data(), 1, line.size(), f) == line.size();
  if (std::fclose(f) != 0 || !ok) {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
  }
}

std::vector<LedgerEvent> EventLog::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (ring_.size() < kMaxRecentEvents) return ring_;
  std::vector<LedgerEvent> out;
  out.reserve(ring_.size());
  for (std::size_t i = 0; i < ring_.size(); ++i) {
    out.push_back(ring_[(ring_head_ + i) % ring_.size()]);
  }
  return out;
}

std::uint64_t EventLog::count(EventType type) const {
  std::lock_guard<std::mutex> lk(mu_);
  return counts_[static_cast<std::size_t>(type)];
}

std::uint64_t EventLog::total() const {
  std::lock_guard<std::mutex> lk(mu_);
  return next_seq_ - 1;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      // Bucket midpoint; bucket 0 covers [0,1)us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// LedgerStats
// ---------------------------------------------------------------------------

void LedgerStats::record_failure(ErrorCode code) {
  if (code == ErrorCode::none) return;
  failed_operations.fetch_add(1, std::memory_order_relaxed);
  failures_by_code_[static_cast<std::size_t>(code)].fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t LedgerStats::failures(ErrorCode code) const {
  return failures_by_code_[static_cast<std::size_t>(code)].load(std::memory_order_relaxed);
}

std::string LedgerStats::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"requests_submitted\":" << requests_submitted.load(std::memory_order_relaxed)
    << ",\"requests_refused\":" << requests_refused.load(std::memory_order_relaxed)
    << ",\"requests_acknowledged\":" << requests_acknowledged.load(std::memory_order_relaxed)
    << ",\"proofs_submitted\":" << proofs_submitted.load(std::memory_order_relaxed)
    << ",\"proofs_validated\":" << proofs_validated.load(std::memory_order_relaxed)
    << ",\"proofs_rejected\":" << proofs_rejected.load(std::memory_order_relaxed)
    << ",\"requests_expired\":" << requests_expired.load(std::memory_order_relaxed)
    << ",\"claims_paid\":" << claims_paid.load(std::memory_order_relaxed)
    << ",\"amount_paid\":" << amount_paid.load(std::memory_order_relaxed)
    << ",\"failed_operations\":" << failed_operations.load(std::memory_order_relaxed)
    << ",\"failures_by_code\":{";
  bool first = true;
  for (std::size_t i = 1; i < kErrorCodeCount; ++i) {
    const std::uint64_t n = failures_by_code_[i].load(std::memory_order_relaxed);
    if (n == 0) continue;
    if (!first) o << ",";
    first = false;
    o << "\"" << to_string(static_cast<ErrorCode>(i)) << "\":" << n;
  }
  o << "},\"latency\":" << latency_histogram.to_json() << "}";
  return o.str();
}

LedgerStats& global_ledger_stats() {
  static LedgerStats inst;
  return inst;
}

}  // namespace proofman
