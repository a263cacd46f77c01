#pragma once

#include "batch_cache/config.hpp"
#include "batch_cache/errors.hpp"
#include "batch_cache/stats.hpp"
#include "batch_cache/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace batch_cache {

template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class Cache;

// View over several keys of a Cache, obtained from Cache::entries().
//
// Every terminal operation computes the missing set (requested keys that are
// not live, first-occurrence order, one slot per distinct key) and calls the
// supplied fetch at most once with it. Results hold one pointer per requested
// key, in request order, and stay valid until that key is removed or
// overwritten.
template <typename K, typename V, typename Hash, typename KeyEqual>
class EntriesRequest {
public:
  using CacheType = Cache<K, V, Hash, KeyEqual>;

  EntriesRequest(CacheType &cache, std::vector<K> keys)
      : cache_(cache), keys_(std::move(keys)) {}

  const std::vector<K> &keys() const { return keys_; }

  std::vector<K> missing() const { return scan(nullptr); }

  // fetch: std::vector<V>(const std::vector<K> &missing)
  template <typename Fetch> std::vector<const V *> or_insert_with(Fetch &&fetch) {
    auto resolved = resolve([&](const std::vector<K> &missing) {
      return std::optional<std::vector<V>>(fetch(missing));
    });
    return std::move(*resolved);
  }

  // fetch: std::optional<std::vector<V>>(const std::vector<K> &missing, E *err)
  //
  // A disengaged result from fetch leaves the cache untouched and is returned
  // as std::nullopt. err is handed to fetch as is; the cache never reads it.
  template <typename E = std::string, typename Fetch>
  std::optional<std::vector<const V *>> or_try_insert_with(Fetch &&fetch,
                                                           E *err = nullptr) {
    return resolve([&](const std::vector<K> &missing) {
      return std::optional<std::vector<V>>(fetch(missing, err));
    });
  }

  std::vector<const V *> or_insert(const V &default_value) {
    auto resolved = resolve([&](const std::vector<K> &missing) {
      return std::optional<std::vector<V>>(
          std::vector<V>(missing.size(), default_value));
    });
    return std::move(*resolved);
  }

private:
  template <typename Fill>
  std::optional<std::vector<const V *>> resolve(Fill &&fill) {
    auto &stats = cache_.stats_;
    ++stats.batch_requests;

    std::vector<const V *> out;
    std::vector<K> missing = scan(&out);
    for (const V *v : out) {
      if (v != nullptr)
        ++stats.hits;
      else
        ++stats.misses;
    }
    if (missing.empty())
      return out;

    ++stats.fetch_calls;
    std::optional<std::vector<V>> fresh = fill(missing);
    if (!fresh.has_value()) {
      ++stats.fetch_failures;
      return std::nullopt;
    }
    if (fresh->size() != missing.size()) {
      ++stats.fetch_failures;
      throw FetchContractViolation(missing.size(), fresh->size());
    }

    stats.fetched_keys += missing.size();
    for (std::size_t i = 0; i < missing.size(); ++i)
      cache_.put(std::move(missing[i]), std::move((*fresh)[i]));

    // Fresh entries are read back without the liveness check: with a very
    // short expiry they may already be stale, but they are still the values
    // this call fetched.
    for (std::size_t i = 0; i < keys_.size(); ++i) {
      if (out[i] == nullptr)
        out[i] = &cache_.store_.find(keys_[i])->second.value;
    }
    return out;
  }

  // Missing set in first-occurrence order, one slot per distinct key. When
  // live is given it receives one pointer per requested key, null where the
  // key is missing.
  std::vector<K> scan(std::vector<const V *> *live) const {
    std::vector<K> missing;
    std::unordered_set<K, Hash, KeyEqual> seen;
    if (live)
      live->assign(keys_.size(), nullptr);
    for (std::size_t i = 0; i < keys_.size(); ++i) {
      const V *v = cache_.find_live(keys_[i]);
      if (live)
        (*live)[i] = v;
      if (v == nullptr && seen.insert(keys_[i]).second)
        missing.push_back(keys_[i]);
    }
    return missing;
  }

  CacheType &cache_;
  std::vector<K> keys_;
};

// View over a single key of a Cache, obtained from Cache::entry(). Liveness
// is decided when the view is created.
template <typename K, typename V, typename Hash, typename KeyEqual>
class EntryRequest {
public:
  using CacheType = Cache<K, V, Hash, KeyEqual>;

  EntryRequest(CacheType &cache, K key)
      : cache_(cache), key_(std::move(key)), live_(cache.find_live(key_)) {
    if (live_ != nullptr)
      ++cache_.stats_.hits;
    else
      ++cache_.stats_.misses;
  }

  const K &key() const { return key_; }
  bool is_occupied() const { return live_ != nullptr; }

  V &or_insert(V default_value) {
    if (live_ != nullptr)
      return *live_;
    return cache_.put(key_, std::move(default_value));
  }

  // fetch: V(const K &key)
  template <typename Fetch> V &or_insert_with(Fetch &&fetch) {
    if (live_ != nullptr)
      return *live_;
    ++cache_.stats_.fetch_calls;
    V value = fetch(static_cast<const K &>(key_));
    ++cache_.stats_.fetched_keys;
    return cache_.put(key_, std::move(value));
  }

  // fetch: std::optional<V>(const K &key, E *err)
  template <typename E = std::string, typename Fetch>
  V *or_try_insert_with(Fetch &&fetch, E *err = nullptr) {
    if (live_ != nullptr)
      return live_;
    ++cache_.stats_.fetch_calls;
    std::optional<V> value = fetch(static_cast<const K &>(key_), err);
    if (!value.has_value()) {
      ++cache_.stats_.fetch_failures;
      return nullptr;
    }
    ++cache_.stats_.fetched_keys;
    return &cache_.put(key_, std::move(*value));
  }

private:
  CacheType &cache_;
  K key_;
  V *live_;
};

// In-memory store whose entries optionally go stale after a fixed duration.
//
// Stale entries read as absent but stay in the map until they are removed or
// overwritten. Not synchronized: callers sharing a Cache between threads
// must lock around it.
template <typename K, typename V, typename Hash, typename KeyEqual>
class Cache {
public:
  using key_type = K;
  using mapped_type = V;
  using Request = EntriesRequest<K, V, Hash, KeyEqual>;
  using SingleRequest = EntryRequest<K, V, Hash, KeyEqual>;

  Cache() = default;
  explicit Cache(const CacheConfig &cfg) {
    if (cfg.expiry.has_value())
      expiry_ = std::chrono::duration_cast<Duration>(*cfg.expiry);
  }

  // Keeps the last inserted value forever.
  static Cache keep_last() { return Cache(); }

  static Cache with_expiry_duration(Duration d) {
    Cache c;
    c.expiry_ = d;
    return c;
  }

  // Returns the previous value for key, expired or not.
  std::optional<V> insert(K key, V value) {
    std::optional<V> previous;
    auto it = store_.find(key);
    if (it != store_.end())
      previous = std::move(it->second.value);
    put(std::move(key), std::move(value));
    return previous;
  }

  const V *get(const K &key) const {
    auto it = lookup(*this, key, true);
    return it == store_.end() ? nullptr : &it->second.value;
  }

  // Does not refresh the entry's timestamp.
  V *get_mut(const K &key) {
    auto it = lookup(*this, key, true);
    return it == store_.end() ? nullptr : &it->second.value;
  }

  const V &at(const K &key) const {
    const V *v = get(key);
    if (v == nullptr)
      throw std::out_of_range("batch_cache: no live entry for key");
    return *v;
  }

  bool contains(const K &key) const { return find_live(key) != nullptr; }

  // Removes the entry whether it is live or not.
  std::optional<V> remove(const K &key) {
    auto it = store_.find(key);
    if (it == store_.end())
      return std::nullopt;
    std::optional<V> value(std::move(it->second.value));
    store_.erase(it);
    ++stats_.removals;
    return value;
  }

  void clear() { store_.clear(); }

  Request entries(std::vector<K> keys) { return Request(*this, std::move(keys)); }
  SingleRequest entry(K key) { return SingleRequest(*this, std::move(key)); }

  // Stored entries, expired ones included.
  std::size_t size() const { return store_.size(); }
  const std::optional<Duration> &expiry() const { return expiry_; }
  const CacheStats &stats() const { return stats_; }

  std::string info() const {
    std::optional<std::chrono::nanoseconds> expiry;
    if (expiry_.has_value())
      expiry = std::chrono::duration_cast<std::chrono::nanoseconds>(*expiry_);
    return format_info(stats_, store_.size(), expiry);
  }

private:
  friend class EntriesRequest<K, V, Hash, KeyEqual>;
  friend class EntryRequest<K, V, Hash, KeyEqual>;

  bool expired(const Entry<V> &e) const {
    return expiry_.has_value() && Clock::now() - e.inserted_at >= *expiry_;
  }

  // Iterator to the live entry for key, or store_.end(). Self is Cache or
  // const Cache so both iterator kinds come from one lookup.
  template <typename Self>
  static auto lookup(Self &self, const K &key, bool count_read) {
    auto it = self.store_.find(key);
    const bool absent = it == self.store_.end();
    const bool stale = !absent && self.expired(it->second);
    if (count_read) {
      if (absent || stale)
        ++self.stats_.misses;
      else
        ++self.stats_.hits;
      if (stale)
        ++self.stats_.expired_reads;
    }
    return stale ? self.store_.end() : it;
  }

  const V *find_live(const K &key) const {
    auto it = lookup(*this, key, false);
    return it == store_.end() ? nullptr : &it->second.value;
  }
  V *find_live(const K &key) {
    auto it = lookup(*this, key, false);
    return it == store_.end() ? nullptr : &it->second.value;
  }

  V &put(K key, V value) {
    ++stats_.inserts;
    auto it = store_
                  .insert_or_assign(std::move(key),
                                    Entry<V>{std::move(value), Clock::now()})
                  .first;
    return it->second.value;
  }

  std::unordered_map<K, Entry<V>, Hash, KeyEqual> store_;
  std::optional<Duration> expiry_{};
  mutable CacheStats stats_{};
};

} // namespace batch_cache
