#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cachekit {

// Bounded map ordered by recency, front = most recently used. Every
// operation is O(1) except keys() and erase_if(). The index and the order
// list are only touched under mutex_; lookups that reorder take the
// exclusive lock. capacity 0 means unbounded.
template <typename K, typename V, typename Hash = std::hash<K>>
class LruStore {
public:
  explicit LruStore(std::size_t capacity = 0) : capacity_(capacity) {}

  LruStore(const LruStore &) = delete;
  LruStore &operator=(const LruStore &) = delete;

  std::optional<V> get(const K &key) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end())
      return std::nullopt;
    order_.splice(order_.begin(), order_, it->second);
    return it->second->second;
  }

  std::optional<V> peek(const K &key) const {
    std::shared_lock lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end())
      return std::nullopt;
    return it->second->second;
  }

  // Inserts or replaces and marks the entry most recently used. Returns
  // the key evicted to make room, if any.
  std::optional<K> set(const K &key, V value) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = std::move(value);
      order_.splice(order_.begin(), order_, it->second);
      return std::nullopt;
    }
    std::optional<K> evicted;
    if (capacity_ > 0 && index_.size() >= capacity_)
      evicted = evict_back();
    order_.emplace_front(key, std::move(value));
    index_.emplace(key, order_.begin());
    return evicted;
  }

  bool del(const K &key) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end())
      return false;
    order_.erase(it->second);
    index_.erase(it);
    return true;
  }

  std::optional<std::pair<K, V>> pop_oldest() {
    std::unique_lock lock(mutex_);
    if (order_.empty())
      return std::nullopt;
    auto out = std::move(order_.back());
    index_.erase(out.first);
    order_.pop_back();
    return out;
  }

  std::size_t len() const {
    std::shared_lock lock(mutex_);
    return index_.size();
  }

  void clear() {
    std::unique_lock lock(mutex_);
    order_.clear();
    index_.clear();
  }

  std::vector<K> keys() const {
    std::shared_lock lock(mutex_);
    std::vector<K> out;
    out.reserve(order_.size());
    for (const auto &node : order_)
      out.push_back(node.first);
    return out;
  }

  std::size_t capacity() const { return capacity_; }

  // Looks up key and calls visit(value) under the lock. visit may modify
  // the value; returning false removes the entry and reports a miss.
  // A kept entry becomes most recently used.
  template <typename Visit> std::optional<V> get_if(const K &key, Visit visit) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end())
      return std::nullopt;
    if (!visit(it->second->second)) {
      order_.erase(it->second);
      index_.erase(it);
      return std::nullopt;
    }
    order_.splice(order_.begin(), order_, it->second);
    return it->second->second;
  }

  // Like get_if() but leaves recency untouched and copies nothing.
  template <typename Keep> bool contains_if(const K &key, Keep keep) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end())
      return false;
    if (keep(static_cast<const V &>(it->second->second)))
      return true;
    order_.erase(it->second);
    index_.erase(it);
    return false;
  }

  // Removes every entry for which pred(key, value) holds.
  template <typename Pred> std::size_t erase_if(Pred pred) {
    std::unique_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto it = order_.begin(); it != order_.end();) {
      if (pred(static_cast<const K &>(it->first),
               static_cast<const V &>(it->second))) {
        index_.erase(it->first);
        it = order_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

private:
  using Node = std::pair<K, V>;

  K evict_back() {
    K key = std::move(order_.back().first);
    index_.erase(key);
    order_.pop_back();
    return key;
  }

  const std::size_t capacity_;
  mutable std::shared_mutex mutex_;
  std::list<Node> order_;
  std::unordered_map<K, typename std::list<Node>::iterator, Hash> index_;
};

} // namespace cachekit
