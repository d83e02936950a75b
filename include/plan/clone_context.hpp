//! # Clone Context
//!
//! State of one clone call: the identity map, the cache policy, and (when the
//! shared cache is bypassed) the plans compiled for this call alone.
//!
//! Identity entries recorded during the call are removed again when the
//! context is destroyed without `commit()`, so a call that throws leaves a
//! caller-supplied map as it found it.

#pragma once

#include "core/identity_map.hpp"
#include "plan/clone_plan.hpp"

#include <unordered_map>
#include <vector>

namespace deepclone::plan {

class CloneContext {
public:
    CloneContext(IdentityMap& identity, bool use_cache);
    ~CloneContext();

    CloneContext(const CloneContext&) = delete;
    CloneContext& operator=(const CloneContext&) = delete;

    IdentityMap& identity() {
        return identity_;
    }

    /// Maps `source` to `clone` for the rest of the call.
    void record(const Ref<Object>& source, const Ref<Object>& clone);

    /// Keeps the entries recorded so far once the call has succeeded.
    void commit() {
        recorded_.clear();
    }

    bool use_cache() const {
        return use_cache_;
    }

    /// Plan for `type`: from the shared cache, or compiled at most once per
    /// call when the cache is bypassed.
    ClonePlanPtr plan_for(const reflect::TypeInfo& type);

    /// Clones an object met inside the graph. Null stays null, objects already
    /// in the identity map return their clone, and delegates come out null.
    /// `static_type` skips the runtime type lookup when the type is known.
    Ref<Object> clone_nested(const Ref<Object>& source,
                             const reflect::TypeInfo* static_type = nullptr);

private:
    IdentityMap& identity_;
    bool use_cache_;
    std::unordered_map<const reflect::TypeInfo*, ClonePlanPtr> local_plans_;
    std::vector<const Object*> recorded_;
};

} // namespace deepclone::plan
