//! # Clone Plan Cache
//!
//! Two process-wide tiers memoize compiled plans per type:
//!
//! - **Full**: unbounded.
//! - **Limited**: bounded; inserting past capacity evicts the least recently
//!   used plans.
//!
//! Exactly one tier serves automatic lookups: Limited while its capacity is
//! greater than zero, Full otherwise. Both tiers can be inspected, cleared
//! and filled independently. Changing the capacity never clears entries; the
//! new bound applies from the next insertion.
//!
//! ## Usage
//!
//! ```cpp
//! auto& cache = deepclone::cache::PlanCache::instance();
//! cache.set_limited_capacity(0);             // serve from the Full tier
//! auto plan = cache.resolve(type_of<Node>());
//! ```

#pragma once

#include "cache/cache_config.hpp"
#include "cache/concurrent_map.hpp"
#include "plan/clone_plan.hpp"
#include "reflect/type_info.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace deepclone::cache {

using plan::ClonePlanPtr;
using reflect::TypeInfo;

/// Snapshot of one tier: type to plan.
using PlanMap = std::unordered_map<const TypeInfo*, ClonePlanPtr>;

// ============================================================================
// PlanTier
// ============================================================================

/// One cache tier. Lookups stamp the entry with a logical clock so the
/// least recently used entry can be found when a bound is enforced.
class PlanTier {
public:
    explicit PlanTier(std::string name);

    /// The cached plan for `type`, or null. Marks the entry as recently used.
    [[nodiscard]] ClonePlanPtr find(const TypeInfo* type) const;

    [[nodiscard]] bool contains(const TypeInfo* type) const;

    /// Inserts unless `type` is present. With a non-zero `capacity`, evicts
    /// least recently used entries until the tier fits.
    bool try_insert(const TypeInfo* type, ClonePlanPtr plan, size_t capacity = 0);

    /// Inserts unless present and returns the plan the tier ends up holding.
    ClonePlanPtr get_or_insert(const TypeInfo* type, ClonePlanPtr plan, size_t capacity = 0);

    void clear();

    [[nodiscard]] size_t size() const;

    [[nodiscard]] PlanMap contents() const;

    [[nodiscard]] uint64_t evictions() const {
        return evictions_.load(std::memory_order_relaxed);
    }

    void reset_evictions() {
        evictions_.store(0, std::memory_order_relaxed);
    }

    const std::string& name() const {
        return name_;
    }

private:
    struct Entry {
        Entry(ClonePlanPtr plan, uint64_t tick) : plan(std::move(plan)), last_used(tick) {}

        ClonePlanPtr plan;
        mutable std::atomic<uint64_t> last_used;
    };

    std::pair<ClonePlanPtr, bool> insert(const TypeInfo* type, ClonePlanPtr plan, size_t capacity);
    void enforce_capacity(size_t capacity);

    uint64_t tick() const {
        return clock_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    std::string name_;
    ConcurrentMap<const TypeInfo*, std::shared_ptr<Entry>> entries_;
    mutable std::atomic<uint64_t> clock_{0};
    std::mutex eviction_mutex_;
    std::atomic<uint64_t> evictions_{0};
};

// ============================================================================
// PlanCache
// ============================================================================

/// Cache counters.
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t compiles = 0;
    uint64_t evictions = 0;
    size_t full_entries = 0;
    size_t limited_entries = 0;

    double hit_rate() const {
        const uint64_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

class PlanCache {
public:
    static constexpr size_t kDefaultLimitedCapacity = cache::kDefaultLimitedCapacity;

    static PlanCache& instance();

    /// Plan for `type`. With `use_cache`, served from the active tier and
    /// compiled plus inserted on a miss. Without it, a throwaway plan is
    /// compiled and neither tier is touched.
    ClonePlanPtr resolve(const TypeInfo& type, bool use_cache = true);

    // Administration

    void clear_full();
    void clear_limited();
    void clear_all();

    /// Zero selects the Full tier.
    void set_limited_capacity(size_t capacity);

    /// Activates the Limited tier with `capacity`, or selects the Full tier.
    /// Throws std::invalid_argument when activating with a zero capacity.
    void configure_limited(bool active, size_t capacity = kDefaultLimitedCapacity);

    void apply(const CacheConfig& config);

    [[nodiscard]] bool is_limited_active() const {
        return limited_capacity() > 0;
    }

    [[nodiscard]] size_t limited_capacity() const {
        return limited_capacity_.load(std::memory_order_acquire);
    }

    [[nodiscard]] PlanMap full_contents() const;
    [[nodiscard]] PlanMap limited_contents() const;

    /// Forces `plan` into a tier. Returns false if the type is already present.
    bool try_insert_full(const TypeInfo& type, ClonePlanPtr plan);
    bool try_insert_limited(const TypeInfo& type, ClonePlanPtr plan);

    [[nodiscard]] CacheStats stats() const;
    void reset_stats();

private:
    PlanCache();

    PlanTier full_;
    PlanTier limited_;
    std::atomic<size_t> limited_capacity_{kDefaultLimitedCapacity};

    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> compiles_{0};
};

} // namespace deepclone::cache
