#ifndef __NG_SHARDED_MAP__
#define __NG_SHARDED_MAP__

#include "Headers.hpp"

namespace ng {
/**
 * @brief Hash map split into independently locked shards, so unrelated keys
 * never contend on one global mutex.
 *
 * Values are copied in and out; store shared_ptrs for anything heavy.
 */
template <typename K, typename V, size_t NumShards = 16>
class ShardedMap {
 public:
  ShardedMap() {}

  /** @brief Inserts only when the key is absent. */
  bool insertIfAbsent(const K& key, const V& value) {
    Shard& shard = getShard(key);
    lock_guard<mutex> guard(shard.shardMutex);
    return shard.entries.insert(make_pair(key, value)).second;
  }

  /** @brief Inserts or overwrites. */
  void put(const K& key, const V& value) {
    Shard& shard = getShard(key);
    lock_guard<mutex> guard(shard.shardMutex);
    shard.entries[key] = value;
  }

  optional<V> get(const K& key) const {
    const Shard& shard = getShard(key);
    lock_guard<mutex> guard(shard.shardMutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
      return nullopt;
    }
    return it->second;
  }

  bool contains(const K& key) const {
    const Shard& shard = getShard(key);
    lock_guard<mutex> guard(shard.shardMutex);
    return shard.entries.find(key) != shard.entries.end();
  }

  /** @brief Removes the key and hands back the value it held. */
  optional<V> take(const K& key) {
    Shard& shard = getShard(key);
    lock_guard<mutex> guard(shard.shardMutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
      return nullopt;
    }
    V value = it->second;
    shard.entries.erase(it);
    return value;
  }

  bool erase(const K& key) {
    Shard& shard = getShard(key);
    lock_guard<mutex> guard(shard.shardMutex);
    return shard.entries.erase(key) > 0;
  }

  enum ComputeAction { KEEP, STORE, ERASE };

  /**
   * @brief Runs `fn(value, present)` on the entry for `key` while its shard is
   * locked. When the key is absent `value` is default constructed.
   *
   * The returned action decides what happens next: KEEP leaves the slot as it
   * was, STORE writes `value` back (creating the entry if needed), ERASE
   * removes the entry.
   */
  template <typename Fn>
  void compute(const K& key, Fn fn) {
    Shard& shard = getShard(key);
    lock_guard<mutex> guard(shard.shardMutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
      V value = V();
      if (fn(value, false) == STORE) {
        shard.entries.insert(make_pair(key, value));
      }
      return;
    }
    if (fn(it->second, true) == ERASE) {
      shard.entries.erase(it);
    }
  }

  /** @brief Copies every entry. Each shard is locked in turn, not all at once. */
  vector<pair<K, V>> snapshot() const {
    vector<pair<K, V>> entries;
    for (const Shard& shard : shards) {
      lock_guard<mutex> guard(shard.shardMutex);
      for (const auto& it : shard.entries) {
        entries.push_back(it);
      }
    }
    return entries;
  }

  size_t size() const {
    size_t total = 0;
    for (const Shard& shard : shards) {
      lock_guard<mutex> guard(shard.shardMutex);
      total += shard.entries.size();
    }
    return total;
  }

  void clear() {
    for (Shard& shard : shards) {
      lock_guard<mutex> guard(shard.shardMutex);
      shard.entries.clear();
    }
  }

 protected:
  struct Shard {
    mutable mutex shardMutex;
    unordered_map<K, V> entries;
  };

  array<Shard, NumShards> shards;

  Shard& getShard(const K& key) { return shards[hash<K>()(key) % NumShards]; }

  const Shard& getShard(const K& key) const {
    return shards[hash<K>()(key) % NumShards];
  }
};
}  // namespace ng

#endif  // __NG_SHARDED_MAP__
