//! # Clone Plan Cache Implementation

#include "cache/plan_cache.hpp"

#include "log/log.hpp"
#include "plan/plan_compiler.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace deepclone::cache {

// ============================================================================
// PlanTier
// ============================================================================

PlanTier::PlanTier(std::string name) : name_(std::move(name)) {}

ClonePlanPtr PlanTier::find(const TypeInfo* type) const {
    ClonePlanPtr plan;
    entries_.visit(type, [&](const std::shared_ptr<Entry>& entry) {
        entry->last_used.store(tick(), std::memory_order_relaxed);
        plan = entry->plan;
    });
    return plan;
}

bool PlanTier::contains(const TypeInfo* type) const {
    return entries_.contains(type);
}

bool PlanTier::try_insert(const TypeInfo* type, ClonePlanPtr plan, size_t capacity) {
    return insert(type, std::move(plan), capacity).second;
}

ClonePlanPtr PlanTier::get_or_insert(const TypeInfo* type, ClonePlanPtr plan, size_t capacity) {
    return insert(type, std::move(plan), capacity).first;
}

std::pair<ClonePlanPtr, bool> PlanTier::insert(const TypeInfo* type, ClonePlanPtr plan,
                                               size_t capacity) {
    auto [entry, inserted] =
        entries_.try_emplace(type, std::make_shared<Entry>(std::move(plan), tick()));
    if (!inserted) {
        entry->last_used.store(tick(), std::memory_order_relaxed);
    } else if (capacity > 0) {
        enforce_capacity(capacity);
    }
    return {entry->plan, inserted};
}

void PlanTier::enforce_capacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(eviction_mutex_);

    auto snapshot = entries_.snapshot();
    if (snapshot.size() <= capacity) {
        return;
    }

    std::sort(snapshot.begin(), snapshot.end(), [](const auto& a, const auto& b) {
        return a.second->last_used.load(std::memory_order_relaxed) <
               b.second->last_used.load(std::memory_order_relaxed);
    });

    const size_t excess = snapshot.size() - capacity;
    for (size_t i = 0; i < excess; ++i) {
        if (entries_.erase(snapshot[i].first)) {
            evictions_.fetch_add(1, std::memory_order_relaxed);
            DEEPCLONE_LOG_TRACE("cache", "Evicted plan for " << snapshot[i].first->name << " from "
                                                             << name_ << " tier (capacity "
                                                             << capacity << ")");
        }
    }
}

void PlanTier::clear() {
    entries_.clear();
}

size_t PlanTier::size() const {
    return entries_.size();
}

PlanMap PlanTier::contents() const {
    PlanMap result;
    entries_.for_each([&result](const TypeInfo* type, const std::shared_ptr<Entry>& entry) {
        result.emplace(type, entry->plan);
    });
    return result;
}

// ============================================================================
// PlanCache
// ============================================================================

PlanCache::PlanCache() : full_("full"), limited_("limited") {
    apply(load_cache_config());
}

PlanCache& PlanCache::instance() {
    static PlanCache cache;
    return cache;
}

ClonePlanPtr PlanCache::resolve(const TypeInfo& type, bool use_cache) {
    if (!use_cache) {
        compiles_.fetch_add(1, std::memory_order_relaxed);
        return plan::compile_plan(type);
    }

    const size_t capacity = limited_capacity();
    PlanTier& tier = capacity > 0 ? limited_ : full_;

    if (ClonePlanPtr cached = tier.find(&type)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return cached;
    }
    misses_.fetch_add(1, std::memory_order_relaxed);

    // Concurrent misses may both compile; the first insertion wins.
    ClonePlanPtr compiled = plan::compile_plan(type);
    compiles_.fetch_add(1, std::memory_order_relaxed);
    return tier.get_or_insert(&type, std::move(compiled), capacity);
}

void PlanCache::clear_full() {
    full_.clear();
}

void PlanCache::clear_limited() {
    limited_.clear();
}

void PlanCache::clear_all() {
    full_.clear();
    limited_.clear();
}

void PlanCache::set_limited_capacity(size_t capacity) {
    limited_capacity_.store(capacity, std::memory_order_release);
    DEEPCLONE_LOG_DEBUG("cache", "Limited tier capacity set to "
                                     << capacity << " (" << (capacity > 0 ? "limited" : "full")
                                     << " tier active)");
}

void PlanCache::configure_limited(bool active, size_t capacity) {
    if (active && capacity == 0) {
        throw std::invalid_argument("the limited plan cache needs a capacity greater than zero");
    }
    set_limited_capacity(active ? capacity : 0);
}

void PlanCache::apply(const CacheConfig& config) {
    set_limited_capacity(config.limited_capacity);
}

PlanMap PlanCache::full_contents() const {
    return full_.contents();
}

PlanMap PlanCache::limited_contents() const {
    return limited_.contents();
}

bool PlanCache::try_insert_full(const TypeInfo& type, ClonePlanPtr plan) {
    return full_.try_insert(&type, std::move(plan));
}

bool PlanCache::try_insert_limited(const TypeInfo& type, ClonePlanPtr plan) {
    return limited_.try_insert(&type, std::move(plan), limited_capacity());
}

CacheStats PlanCache::stats() const {
    CacheStats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.compiles = compiles_.load(std::memory_order_relaxed);
    stats.evictions = full_.evictions() + limited_.evictions();
    stats.full_entries = full_.size();
    stats.limited_entries = limited_.size();
    return stats;
}

void PlanCache::reset_stats() {
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    compiles_.store(0, std::memory_order_relaxed);
    full_.reset_evictions();
    limited_.reset_evictions();
}

} // namespace deepclone::cache
