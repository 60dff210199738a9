#pragma once

// proofman/types.hpp - Core data structures for the proof request escrow ledger.
//
// ARCHITECTURE NOTES:
//
// IDENTITY:
//   - A proof request is identified by (chain_id, block_number). The pair is
//     globally unique and immutable; once a record exists for a key it can never
//     be recreated, not even after the request reached a terminal status.
//   - request_id is an observability sequence number (value of the request
//     counter at submission). It never identifies a request on its own.
//
// UNITS:
//   - Amount: integer token base units. The escrow token has 6 decimals, so
//     4'000'000 is 4 tokens. No floating point anywhere on the funds path.
//   - Timestamp: integer seconds as reported by the injected Clock.
//
// ERROR MODEL:
//   - No exceptions cross the public API. Every operation returns a Status
//     (or a Result<T>) carrying a typed ErrorCode. Callers branch on the code,
//     never on the detail text.
//   - State-machine violations carry the offending status (or from/to pair)
//     so proving-network agents can tell "too late" from "wrong state".
//
// MEMORY OWNERSHIP:
//   - All members are value-owned. ProofRequest copies handed out by queries
//     are snapshots; mutating them never affects the ledger.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace proofman {

using Amount    = std::uint64_t;
using Timestamp = std::uint64_t;
using Address   = std::string;
using Bytes     = std::vector<std::uint8_t>;

// An address is zero when it is empty or "0x" followed only by zero digits.
bool is_zero_address(const Address& addr);

// ---------------------------------------------------------------------------
// ErrorCode - every failure the ledger can report
// ---------------------------------------------------------------------------
enum class ErrorCode {
  none,
  // authorization
  unauthorized_admin,
  unauthorized_submitter,
  unauthorized_network,
  // validation
  invalid_network,
  zero_address,
  duplicate_network_address,
  duplicate_request,
  invalid_timeout,
  reward_out_of_bounds,
  empty_proof,
  request_not_found,
  config_invalid,
  // state machine
  invalid_status,
  invalid_transition,
  // temporal
  ack_deadline_passed,
  proving_deadline_passed,
  // resource exhaustion
  no_funds_available,
  no_payment_due,
  insufficient_funds,
  // downstream
  transfer_failed,
  // internal (programmer error, never expected)
  empty_queue,
  key_not_found,
  duplicate_key,
  invariant_violation,
};

std::string to_string(ErrorCode code);

enum class ErrorCategory {
  none,
  authorization,
  validation,
  state,
  temporal,
  resource,
  downstream,
  internal,
};

std::string to_string(ErrorCategory category);
ErrorCategory error_category(ErrorCode code);

// True when the same call may succeed later without the caller changing it
// (capacity or escrow balance may recover).
bool is_retryable(ErrorCode code);

// ---------------------------------------------------------------------------
// RequestStatus - lifecycle states (see transitions.hpp for the legal moves)
// ---------------------------------------------------------------------------
enum class RequestStatus : std::uint8_t {
  pending_acknowledgement = 0,
  committed               = 1,
  refused                 = 2,
  unacknowledged          = 3,
  proven                  = 4,
  timed_out               = 5,
  validated               = 6,
  validation_failed       = 7,
  paid                    = 8,
};

constexpr std::size_t kRequestStatusCount = 9;

std::string to_string(RequestStatus status);
std::optional<RequestStatus> request_status_from_string(const std::string& s);

// ---------------------------------------------------------------------------
// ProvingNetwork - the two competing networks plus the `none` sentinel
// ---------------------------------------------------------------------------
// `none` is only an escape value: it is what the assignment policy returns when
// no preferred network is set, and what refused-at-submission requests record.
// It is never a valid target for address or status updates.
enum class ProvingNetwork : std::uint8_t {
  none     = 0,
  fermah   = 1,
  lagrange = 2,
};

constexpr std::size_t kProvingNetworkCount = 2;  // real networks, `none` excluded

std::string to_string(ProvingNetwork network);
std::optional<ProvingNetwork> proving_network_from_string(const std::string& s);

enum class NetworkStatus : std::uint8_t {
  inactive = 0,
  active   = 1,
};

std::string to_string(NetworkStatus status);
std::optional<NetworkStatus> network_status_from_string(const std::string& s);

// ---------------------------------------------------------------------------
// RequestKey - composite identifier (chain_id, block_number)
// ---------------------------------------------------------------------------
struct RequestKey {
  std::uint64_t chain_id{0};
  std::uint64_t block_number{0};

  bool operator==(const RequestKey& o) const {
    return chain_id == o.chain_id && block_number == o.block_number;
  }
  bool operator!=(const RequestKey& o) const { return !(*this == o); }
  bool operator<(const RequestKey& o) const {
    return chain_id != o.chain_id ? chain_id < o.chain_id : block_number < o.block_number;
  }

  // "chain_id:block_number"
  std::string to_string() const;
};

struct RequestKeyHash {
  std::size_t operator()(const RequestKey& k) const noexcept {
    // splitmix-style mix of both halves; chain ids are tiny, block numbers dense.
    std::uint64_t h = k.chain_id * 0x9E3779B97F4A7C15ULL;
    h ^= k.block_number + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
    return static_cast<std::size_t>(h);
  }
};

// ---------------------------------------------------------------------------
// RequestParams - submission payload
// ---------------------------------------------------------------------------
struct RequestParams {
  std::string   proof_inputs_url;      // locator of the prover input data
  std::uint32_t protocol_major{0};
  std::uint32_t protocol_minor{0};
  std::uint32_t protocol_patch{0};
  Timestamp     timeout_after{0};      // seconds after submission
  Amount        max_reward{0};         // ceiling the network may ask for
};

// ---------------------------------------------------------------------------
// ProofRequest - authoritative per-key record
// ---------------------------------------------------------------------------
struct ProofRequest {
  RequestKey     key;
  RequestParams  params;
  Timestamp      submitted_at{0};
  RequestStatus  status{RequestStatus::pending_acknowledgement};
  ProvingNetwork assigned_to{ProvingNetwork::none};
  Amount         requested_reward{0};  // set on proof submission, <= params.max_reward
  Bytes          proof;                // empty until proven
  std::uint64_t  request_id{0};

  // submitted_at + timeout_after. The acknowledgement deadline depends on the
  // ledger's ack_timeout and is computed by the ProofManager.
  Timestamp proving_deadline() const;

  // Compact JSON. The proof is rendered as its size only.
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// Status / Result - typed outcome of every ledger operation
// ---------------------------------------------------------------------------
struct Status {
  ErrorCode code{ErrorCode::none};
  std::string detail;                    // human-readable, never parsed
  std::optional<RequestStatus> current;  // set for invalid_status
  std::optional<RequestStatus> from;     // set for invalid_transition
  std::optional<RequestStatus> to;

  bool ok() const { return code == ErrorCode::none; }

  static Status success() { return Status{}; }
  static Status error(ErrorCode code, std::string detail = "");
  static Status bad_status(RequestStatus current, std::string detail = "");
  static Status bad_transition(RequestStatus from, RequestStatus to);

  std::string to_json() const;
};

template <typename T>
struct Result {
  Status status;
  std::optional<T> value;

  bool ok() const { return status.ok(); }
  ErrorCode code() const { return status.code; }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }
  static Result failure(Status s) {
    Result r;
    r.status = std::move(s);
    return r;
  }
};

}  // namespace proofman
