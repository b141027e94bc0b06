/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace sealbox {

  /**
   * Map of bounded size. When full, inserting a new key drops the entry that
   * was read or written least recently. Not thread safe.
   */
  template <typename K, typename V>
  class Lru {
    // front is the most recently used entry
    using Order = std::list<std::pair<K, V>>;

   public:
    explicit Lru(size_t capacity) : capacity_{capacity} {
      if (capacity_ == 0) {
        throw std::length_error{"Lru capacity must be positive"};
      }
      index_.reserve(capacity_);
    }

    Lru(const Lru &) = delete;
    Lru &operator=(const Lru &) = delete;

    size_t capacity() const {
      return capacity_;
    }

    size_t size() const {
      return index_.size();
    }

    /// Does not count as a use
    bool contains(const K &key) const {
      return index_.contains(key);
    }

    std::optional<std::reference_wrapper<V>> get(const K &key) {
      auto it = index_.find(key);
      if (it == index_.end()) {
        return std::nullopt;
      }
      touch(it->second);
      return std::ref(it->second->second);
    }

    V &put(const K &key, V value) {
      if (auto it = index_.find(key); it != index_.end()) {
        it->second->second = std::move(value);
        touch(it->second);
        return it->second->second;
      }
      if (index_.size() == capacity_) {
        index_.erase(order_.back().first);
        order_.pop_back();
      }
      order_.emplace_front(key, std::move(value));
      index_.emplace(key, order_.begin());
      return order_.front().second;
    }

    void erase(const K &key) {
      if (auto it = index_.find(key); it != index_.end()) {
        order_.erase(it->second);
        index_.erase(it);
      }
    }

   private:
    void touch(typename Order::iterator entry) {
      order_.splice(order_.begin(), order_, entry);
    }

    size_t capacity_;
    Order order_;
    std::unordered_map<K, typename Order::iterator> index_;
  };

}  // namespace sealbox
