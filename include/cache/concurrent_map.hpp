//! # Concurrent Map
//!
//! Lock-striped hash map: keys are spread over a fixed number of shards, each
//! guarded by its own `std::shared_mutex`, so readers never block each other
//! and writers only contend within one shard.
//!
//! Whole-map operations (`size`, `clear`, `for_each`, `snapshot`) visit the
//! shards one at a time and are not atomic with respect to concurrent writers.

#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace deepclone::cache {

template <typename Key, typename Value, typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>, std::size_t ShardCount = 16>
class ConcurrentMap {
    static_assert(ShardCount > 0, "ConcurrentMap needs at least one shard");

public:
    ConcurrentMap() = default;
    ConcurrentMap(const ConcurrentMap&) = delete;
    ConcurrentMap& operator=(const ConcurrentMap&) = delete;

    [[nodiscard]] std::optional<Value> find(const Key& key) const {
        const Shard& shard = shard_for(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool contains(const Key& key) const {
        const Shard& shard = shard_for(key);
        std::shared_lock lock(shard.mutex);
        return shard.map.find(key) != shard.map.end();
    }

    /// Calls `fn(const Value&)` under the shard's shared lock if `key` exists.
    template <typename F> bool visit(const Key& key, F&& fn) const {
        const Shard& shard = shard_for(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return false;
        }
        fn(it->second);
        return true;
    }

    /// Inserts `value` unless `key` is present. Returns the stored value and
    /// whether this call inserted it.
    std::pair<Value, bool> try_emplace(const Key& key, Value value) {
        Shard& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        auto [it, inserted] = shard.map.try_emplace(key, std::move(value));
        return {it->second, inserted};
    }

    void insert_or_assign(const Key& key, Value value) {
        Shard& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        shard.map.insert_or_assign(key, std::move(value));
    }

    bool erase(const Key& key) {
        Shard& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        return shard.map.erase(key) > 0;
    }

    void clear() {
        for (Shard& shard : shards_) {
            std::unique_lock lock(shard.mutex);
            shard.map.clear();
        }
    }

    [[nodiscard]] std::size_t size() const {
        std::size_t total = 0;
        for (const Shard& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            total += shard.map.size();
        }
        return total;
    }

    [[nodiscard]] bool empty() const {
        return size() == 0;
    }

    /// Calls `fn(const Key&, const Value&)` for every entry, one shard at a time.
    template <typename F> void for_each(F&& fn) const {
        for (const Shard& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            for (const auto& [key, value] : shard.map) {
                fn(key, value);
            }
        }
    }

    [[nodiscard]] std::vector<std::pair<Key, Value>> snapshot() const {
        std::vector<std::pair<Key, Value>> result;
        for_each([&result](const Key& key, const Value& value) { result.emplace_back(key, value); });
        return result;
    }

    static constexpr std::size_t shard_count() {
        return ShardCount;
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<Key, Value, Hash, KeyEqual> map;
    };

    // Pointer hashes have their low bits zeroed by alignment; mix before picking a shard.
    static std::size_t mix(std::size_t h) {
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdULL;
        h ^= h >> 33;
        return h;
    }

    Shard& shard_for(const Key& key) {
        return shards_[mix(hash_(key)) % ShardCount];
    }

    const Shard& shard_for(const Key& key) const {
        return shards_[mix(hash_(key)) % ShardCount];
    }

    std::array<Shard, ShardCount> shards_;
    Hash hash_;
};

} // namespace deepclone::cache
