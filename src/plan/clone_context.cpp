#include "plan/clone_context.hpp"

#include "cache/plan_cache.hpp"
#include "plan/classifier.hpp"
#include "reflect/type_registry.hpp"

namespace deepclone::plan {

CloneContext::CloneContext(IdentityMap& identity, bool use_cache)
    : identity_(identity), use_cache_(use_cache) {}

CloneContext::~CloneContext() {
    for (const Object* original : recorded_) {
        identity_.erase(original);
    }
}

void CloneContext::record(const Ref<Object>& source, const Ref<Object>& clone) {
    if (identity_.insert(source, clone)) {
        recorded_.push_back(source.get());
    }
}

ClonePlanPtr CloneContext::plan_for(const reflect::TypeInfo& type) {
    auto& plans = cache::PlanCache::instance();
    if (use_cache_) {
        return plans.resolve(type, true);
    }

    auto it = local_plans_.find(&type);
    if (it != local_plans_.end()) {
        return it->second;
    }
    ClonePlanPtr plan = plans.resolve(type, false);
    local_plans_.emplace(&type, plan);
    return plan;
}

Ref<Object> CloneContext::clone_nested(const Ref<Object>& source,
                                       const reflect::TypeInfo* static_type) {
    if (!source) {
        return nullptr;
    }
    if (Ref<Object> existing = identity_.find(source.get())) {
        return existing;
    }
    if (is_delegate(*source)) {
        return nullptr;
    }

    const reflect::TypeInfo& type = static_type ? *static_type : reflect::runtime_type_of(*source);
    return plan_for(type)->clone_object(source, *this);
}

} // namespace deepclone::plan
