#include "proofman/expiry_queue.hpp"

namespace proofman {

Status ExpiryQueue::insert(Timestamp expires_at, const RequestKey &key) {
  if (index_.count(key) != 0) {
    return Status::error(ErrorCode::duplicate_key, key.to_string());
  }
  heap_.push_back(ExpiryEntry{expires_at, key});
  index_[key] = heap_.size() - 1;
  sift_up(heap_.size() - 1);
  return Status::success();
}

Result<ExpiryEntry> ExpiryQueue::peek_min() const {
  if (heap_.empty()) {
    return Result<ExpiryEntry>::failure(Status::error(ErrorCode::empty_queue));
  }
  return Result<ExpiryEntry>::success(heap_.front());
}

Result<ExpiryEntry> ExpiryQueue::extract_min() {
  if (heap_.empty()) {
    return Result<ExpiryEntry>::failure(Status::error(ErrorCode::empty_queue));
  }
  ExpiryEntry top = heap_.front();
  remove_at(0);
  return Result<ExpiryEntry>::success(top);
}

Status ExpiryQueue::remove(const RequestKey &key) {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return Status::error(ErrorCode::key_not_found, key.to_string());
  }
  remove_at(it->second);
  return Status::success();
}

Status ExpiryQueue::rekey(const RequestKey &key, Timestamp new_expiry) {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return Status::error(ErrorCode::key_not_found, key.to_string());
  }
  const std::size_t i = it->second;
  const Timestamp old_expiry = heap_[i].expires_at;
  heap_[i].expires_at = new_expiry;
  if (new_expiry < old_expiry) {
    sift_up(i);
  } else {
    sift_down(i);
  }
  return Status::success();
}

bool ExpiryQueue::contains(const RequestKey &key) const {
  return index_.count(key) != 0;
}

std::optional<Timestamp> ExpiryQueue::expiry_of(const RequestKey &key) const {
  auto it = index_.find(key);
  if (it == index_.end()) return std::nullopt;
  return heap_[it->second].expires_at;
}

std::size_t ExpiryQueue::count_expired(Timestamp now, std::size_t limit) const {
  std::size_t count = 0;
  std::vector<std::size_t> stack;
  if (!heap_.empty() && limit > 0) stack.push_back(0);
  while (!stack.empty() && count < limit) {
    const std::size_t i = stack.back();
    stack.pop_back();
    if (heap_[i].expires_at > now) continue;
    ++count;
    const std::size_t l = 2 * i + 1;
    if (l < heap_.size()) stack.push_back(l);
    if (l + 1 < heap_.size()) stack.push_back(l + 1);
  }
  return count;
}

bool ExpiryQueue::verify() const {
  if (index_.size() != heap_.size()) return false;
  for (std::size_t i = 0; i < heap_.size(); ++i) {
    auto it = index_.find(heap_[i].key);
    if (it == index_.end() || it->second != i) return false;
    if (i > 0 && heap_[(i - 1) / 2].expires_at > heap_[i].expires_at) return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Heap maintenance. Every slot move goes through swap_slots so the index
// stays in lockstep with the array.
// ---------------------------------------------------------------------------

void ExpiryQueue::swap_slots(std::size_t a, std::size_t b) {
  std::swap(heap_[a], heap_[b]);
  index_[heap_[a].key] = a;
  index_[heap_[b].key] = b;
}

void ExpiryQueue::sift_up(std::size_t i) {
  while (i > 0) {
    const std::size_t parent = (i - 1) / 2;
    if (heap_[parent].expires_at <= heap_[i].expires_at) break;
    swap_slots(parent, i);
    i = parent;
  }
}

void ExpiryQueue::sift_down(std::size_t i) {
  const std::size_t n = heap_.size();
  for (;;) {
    const std::size_t l = 2 * i + 1;
    const std::size_t r = l + 1;
    std::size_t smallest = i;
    if (l < n && heap_[l].expires_at < heap_[smallest].expires_at) smallest = l;
    if (r < n && heap_[r].expires_at < heap_[smallest].expires_at) smallest = r;
    if (smallest == i) return;
    swap_slots(i, smallest);
    i = smallest;
  }
}

void ExpiryQueue::remove_at(std::size_t i) {
  const std::size_t last = heap_.size() - 1;
  if (i != last) swap_slots(i, last);
  index_.erase(heap_.back().key);
  heap_.pop_back();
  if (i < heap_.size()) {
    // The moved-in entry may violate order in either direction.
    sift_up(i);
    sift_down(i);
  }
}

} // namespace proofman
