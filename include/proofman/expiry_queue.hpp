#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "proofman/types.hpp"

namespace proofman {

struct ExpiryEntry {
  Timestamp  expires_at{0};
  RequestKey key;
};

/**
 * ExpiryQueue is an indexed binary min-heap of in-flight request deadlines.
 *
 * The heap lives in a 0-based array; a key -> array position index makes
 * remove() and rekey() O(log n). Both structures are updated together on every
 * swap, so a key is in the index iff it is in the array, at the recorded slot.
 * Entries with equal expiry are not ordered relative to each other.
 *
 * Not thread-safe: the owning ProofManager serializes access.
 */
class ExpiryQueue {
public:
  /// Fails with duplicate_key if the key already has an entry.
  Status insert(Timestamp expires_at, const RequestKey &key);

  /// Smallest entry. Fails with empty_queue.
  Result<ExpiryEntry> peek_min() const;

  /// Removes and returns the smallest entry. Fails with empty_queue.
  Result<ExpiryEntry> extract_min();

  /// Fails with key_not_found.
  Status remove(const RequestKey &key);

  /// Moves an existing entry to a new deadline. Fails with key_not_found.
  Status rekey(const RequestKey &key, Timestamp new_expiry);

  bool contains(const RequestKey &key) const;
  std::optional<Timestamp> expiry_of(const RequestKey &key) const;
  std::size_t size() const { return heap_.size(); }
  bool empty() const { return heap_.empty(); }

  /**
   * Number of entries whose deadline has been reached (expires_at <= now), capped
   * at `limit`. Walks only the expired part of the heap (a node that has not
   * expired cannot have expired descendants) and does not modify anything. The
   * result is the number of entries `limit` consecutive extract_min() calls
   * guarded by `expires_at <= now` would remove.
   */
  std::size_t count_expired(Timestamp now, std::size_t limit) const;

  /// Checks heap order and index consistency. Test hook.
  bool verify() const;

  /// Array-order view (heap layout), for snapshots.
  const std::vector<ExpiryEntry> &entries() const { return heap_; }

private:
  void swap_slots(std::size_t a, std::size_t b);
  void sift_up(std::size_t i);
  void sift_down(std::size_t i);
  void remove_at(std::size_t i);

  std::vector<ExpiryEntry> heap_;
  std::unordered_map<RequestKey, std::size_t, RequestKeyHash> index_;
};

} // namespace proofman
