#include "proofman/audit.hpp"
#include "proofman/hash.hpp"
#include "proofman/jsonlite.hpp"
#include "proofman/version.hpp"

#include <cstdio>
#include <fstream>
#include <mutex>
#include <sstream>

namespace proofman {

// ---------------------------------------------------------------------------
// TransitionRecord → JSON
// ---------------------------------------------------------------------------
std::string transition_to_json(const TransitionRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"seq\":" << r.sequence
    << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"timestamp\":" << r.timestamp
    << ",\"chain_id\":" << r.key.chain_id
    << ",\"block_number\":" << r.key.block_number
    << ",\"request_id\":" << r.request_id
    << ",\"from\":\"" << (r.from ? to_string(*r.from) : std::string("none")) << "\""
    << ",\"to\":\"" << to_string(r.to) << "\""
    << ",\"network\":\"" << to_string(r.network) << "\""
    << ",\"actor\":\"" << jsonlite::escape(r.actor) << "\""
    << ",\"cause\":\"" << r.cause << "\""
    << ",\"amount\":" << r.amount
    << ",\"audit_log_version\":" << r.audit_log_version
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------

struct ImmutableAuditLog::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  std::uint64_t seq{0};
  std::uint64_t entry_count{0};
  std::uint64_t failure_count{0};
  std::string last_digest{kAuditGenesisDigest};
};

namespace {

// Resume sequence and chain head from the last line of an existing log.
void resume_chain(const std::string& path, std::uint64_t* seq, std::string* digest) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return;
  std::string line, last;
  while (std::getline(in, line)) {
    if (!line.empty()) last = line;
  }
  if (last.empty()) return;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(last, &err);
  if (err) return;
  *seq = jsonlite::get_u64(obj, "seq", 0);
  *digest = audit_link_digest(last);
}

}  // namespace

ImmutableAuditLog::ImmutableAuditLog(const std::string& path)
    : path_(path), impl_(std::make_unique<Impl>()) {
  if (path_.empty()) return;
  resume_chain(path_, &impl_->seq, &impl_->last_digest);
  impl_->file = std::fopen(path_.c_str(), "a");
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool ImmutableAuditLog::append(TransitionRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  if (path_.empty()) return true;  // disabled
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence          = impl_->seq + 1;
  record.previous_digest   = impl_->last_digest;
  record.audit_log_version = version::AUDIT_LOG_VERSION;

  const std::string line = transition_to_json(record);
  const std::string final_line = line + "\n";
  const bool written = std::fwrite(final_line.data(), 1, final_line.size(),
                                   impl_->file) == final_line.size();
  std::fflush(impl_->file);

  if (written) {
    const long post_write_pos = std::ftell(impl_->file);
    if (post_write_pos >= 0 &&
        post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
      ++impl_->failure_count;
      return false;
    }
    // The chain only advances once the line is on disk.
    impl_->seq = record.sequence;
    impl_->last_digest = audit_link_digest(line);
    ++impl_->entry_count;
  } else {
    ++impl_->failure_count;
  }
  return written;
}

std::uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

std::uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

// ---------------------------------------------------------------------------
// verify_audit_chain
// ---------------------------------------------------------------------------

std::string AuditVerifyResult::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"ok\":" << (ok ? "true" : "false")
    << ",\"entries\":" << entries;
  if (!ok) {
    o << ",\"error\":\"" << error << "\""
      << ",\"failed_sequence\":" << failed_sequence;
  }
  o << "}";
  return o.str();
}

AuditVerifyResult verify_audit_chain(const std::string& path) {
  AuditVerifyResult res;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    res.error = "audit_unreadable";
    return res;
  }

  std::string expected_prev = kAuditGenesisDigest;
  std::uint64_t expected_seq = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object obj = jsonlite::parse(line, &err);
    if (err) {
      res.error = "audit_parse_error";
      res.failed_sequence = expected_seq + 1;
      return res;
    }
    const std::uint64_t seq = jsonlite::get_u64(obj, "seq", 0);
    if (seq != ++expected_seq) {
      res.error = "audit_sequence_gap";
      res.failed_sequence = seq;
      return res;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      res.error = "audit_chain_broken";
      res.failed_sequence = seq;
      return res;
    }
    expected_prev = audit_link_digest(line);
    ++res.entries;
  }
  res.ok = true;
  return res;
}

}  // namespace proofman
