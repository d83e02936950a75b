#include "core/clone.hpp"

#include "plan/classifier.hpp"
#include "plan/clone_context.hpp"
#include "reflect/type_registry.hpp"

#include <typeinfo>

namespace deepclone::detail {

Ref<Object> clone_object(const Ref<Object>& source, IdentityMap* identity_map, bool use_cache) {
    if (!source) {
        return nullptr;
    }

    const Object& original = *source;
    if (plan::is_delegate(original)) {
        throw UnsupportedTypeError(reflect::demangle(typeid(original).name()),
                                   "delegates carry executable state and cannot be deep cloned");
    }

    IdentityMap local;
    IdentityMap& identity = identity_map ? *identity_map : local;
    if (Ref<Object> existing = identity.find(source.get())) {
        return existing;
    }
    const reflect::TypeInfo& type = reflect::runtime_type_of(original);

    plan::CloneContext context(identity, use_cache);
    Ref<Object> clone = context.plan_for(type)->clone_object(source, context);
    context.commit();
    return clone;
}

void clone_value(const reflect::TypeInfo& type, const void* source, void* target,
                 IdentityMap* identity_map, bool use_cache) {
    IdentityMap local;
    plan::CloneContext context(identity_map ? *identity_map : local, use_cache);
    context.plan_for(type)->clone_value(source, target, context);
    context.commit();
}

bool needs_deep_copy(const reflect::TypeInfo& type) {
    return plan::needs_deep_copy(type);
}

} // namespace deepclone::detail
