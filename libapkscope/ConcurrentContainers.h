/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <utility>

/*
 * A map that entries can be added to but never changed or removed from, short
 * of clearing it as a whole. The key space is split into `n_slots` slots, each
 * guarded by its own mutex.
 *
 * Pointers to stored values stay valid until `clear()`, since the underlying
 * unordered_map never moves its nodes.
 */
template <typename Key,
          typename Value,
          typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>,
          size_t n_slots = 31>
class InsertOnlyConcurrentMap final {
 public:
  InsertOnlyConcurrentMap() = default;
  InsertOnlyConcurrentMap(const InsertOnlyConcurrentMap&) = delete;
  InsertOnlyConcurrentMap& operator=(const InsertOnlyConcurrentMap&) = delete;

  /*
   * This operation is always thread-safe.
   */
  const Value* get(const Key& key) const {
    size_t slot = Hash()(key) % n_slots;
    std::lock_guard<std::mutex> lock(m_locks[slot]);
    const auto& map = m_slots[slot];
    auto it = map.find(key);
    return it == map.end() ? nullptr : &it->second;
  }

  /*
   * Returns a pair consisting of a pointer on the inserted element (or the
   * element that prevented the insertion) and a boolean denoting whether the
   * insertion took place. This operation is always thread-safe.
   */
  std::pair<const Value*, bool> insert(std::pair<Key, Value> entry) {
    size_t slot = Hash()(entry.first) % n_slots;
    std::lock_guard<std::mutex> lock(m_locks[slot]);
    auto result = m_slots[slot].emplace(std::move(entry));
    return std::make_pair(&result.first->second, result.second);
  }

  /*
   * Returns the value stored for `key`, computing it with `creator` first if
   * there is none. The creator runs without holding any lock; when two threads
   * race on the same key, both may compute, the first insertion wins and both
   * get the stored value back.
   */
  template <typename Creator>
  const Value& get_or_create(const Key& key, const Creator& creator) {
    if (const auto* existing = get(key)) {
      return *existing;
    }
    return *insert(std::make_pair(key, creator(key))).first;
  }

  size_t size() const {
    size_t res = 0;
    for (size_t slot = 0; slot < n_slots; ++slot) {
      std::lock_guard<std::mutex> lock(m_locks[slot]);
      res += m_slots[slot].size();
    }
    return res;
  }

  bool empty() const { return size() == 0; }

  /*
   * This operation is not thread-safe with respect to readers holding on to
   * returned pointers.
   */
  void clear() {
    for (size_t slot = 0; slot < n_slots; ++slot) {
      std::lock_guard<std::mutex> lock(m_locks[slot]);
      m_slots[slot].clear();
    }
  }

 private:
  std::array<std::unordered_map<Key, Value, Hash, KeyEqual>, n_slots> m_slots;
  mutable std::array<std::mutex, n_slots> m_locks;
};
