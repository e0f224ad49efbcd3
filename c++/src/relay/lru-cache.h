// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include <kj/common.h>
#include <kj/debug.h>

#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

namespace relay {

template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
  // Bounded map which evicts the least recently used entry when full. Entries live in a list
  // ordered from most to least recently used; the index maps each key to its list node, so every
  // operation is O(1).
  //
  // Recency is refreshed by push() and get(). contains() and peek() leave it untouched.

public:
  using Entry = std::pair<Key, Value>;

  explicit LruCache(size_t capacity): maxEntries(capacity) {
    KJ_REQUIRE(capacity > 0, "LRU cache capacity must be positive");
  }
  KJ_DISALLOW_COPY(LruCache);

  size_t size() const { return index.size(); }
  size_t capacity() const { return maxEntries; }
  bool isEmpty() const { return index.empty(); }

  bool contains(const Key& key) const { return index.find(key) != index.end(); }

  kj::Maybe<Value&> get(const Key& key) {
    auto iter = index.find(key);
    if (iter == index.end()) return kj::none;
    entries.splice(entries.begin(), entries, iter->second);
    return iter->second->second;
  }

  kj::Maybe<const Value&> peek(const Key& key) const {
    auto iter = index.find(key);
    if (iter == index.end()) return kj::none;
    return iter->second->second;
  }

  kj::Maybe<const Key&> peekLru() const {
    if (entries.empty()) return kj::none;
    return entries.back().first;
  }

  kj::Maybe<Entry> push(Key key, Value value) {
    // Inserts `value` as the most recently used entry. If `key` was already present its old value
    // is replaced and returned together with the key. Otherwise, if the insertion pushed the
    // cache over capacity, the least recently used entry is evicted and returned.

    auto iter = index.find(key);
    if (iter != index.end()) {
      auto node = iter->second;
      Value displaced = kj::mv(node->second);
      node->second = kj::mv(value);
      entries.splice(entries.begin(), entries, node);
      return Entry(kj::mv(key), kj::mv(displaced));
    }

    entries.emplace_front(key, kj::mv(value));
    index.emplace(kj::mv(key), entries.begin());

    if (index.size() > maxEntries) {
      return popLru();
    }
    return kj::none;
  }

  kj::Maybe<Value> pop(const Key& key) {
    auto iter = index.find(key);
    if (iter == index.end()) return kj::none;

    auto node = iter->second;
    index.erase(iter);
    Value value = kj::mv(node->second);
    entries.erase(node);
    return kj::mv(value);
  }

  kj::Maybe<Entry> popLru() {
    if (entries.empty()) return kj::none;

    auto node = std::prev(entries.end());
    index.erase(node->first);
    Entry entry = kj::mv(*node);
    entries.erase(node);
    return kj::mv(entry);
  }

private:
  using EntryList = std::list<Entry>;

  size_t maxEntries;
  EntryList entries;
  std::unordered_map<Key, typename EntryList::iterator, Hash> index;
};

}  // namespace relay
