#include "proofman/hash.hpp"

// The audit chain stores audit_link_digest() of each line in the next record's
// `prev` field. Changing the domain prefix or the primitive invalidates every
// existing audit log: bump version::HASH_ALGORITHM_VERSION if you do.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace proofman {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::array<unsigned char, BLAKE3_OUT_LEN> digest_parts(std::string_view a, std::string_view b) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  if (!a.empty()) blake3_hasher_update(&hasher, a.data(), a.size());
  if (!b.empty()) blake3_hasher_update(&hasher, b.data(), b.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  const char* v = blake3_version();
  info.version = v ? v : "unknown";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  const auto out = digest_parts(payload, {});
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  const auto out = digest_parts(domain, payload);
  return to_hex(out.data(), out.size());
}

std::string proof_digest(const std::vector<std::uint8_t>& proof) {
  return hash_domain("proof:", std::string_view(reinterpret_cast<const char*>(proof.data()),
                                                proof.size()));
}

std::string audit_link_digest(std::string_view line) {
  return hash_domain("audit:", line);
}

}  // namespace proofman
