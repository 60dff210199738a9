#pragma once

// proofman/hash.hpp - BLAKE3 digests for proofs and the audit chain.
//
// BLAKE3 is the sole hash primitive. Domain prefixes keep digests of different
// kinds of payload apart:
//   "proof:"  submitted proof bytes (reported in proof_submitted events)
//   "audit:"  audit log lines (chain links)

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace proofman {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex digest of the payload.
std::string blake3_hex(std::string_view payload);

std::string hash_domain(std::string_view domain, std::string_view payload);

std::string proof_digest(const std::vector<std::uint8_t>& proof);
std::string audit_link_digest(std::string_view line);

}  // namespace proofman
