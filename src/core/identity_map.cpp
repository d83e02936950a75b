#include "core/identity_map.hpp"

namespace deepclone {

Ref<Object> IdentityMap::find(const Object* original) const {
    if (!original) {
        return nullptr;
    }
    auto it = entries_.find(original);
    return it != entries_.end() ? it->second.clone : nullptr;
}

bool IdentityMap::contains(const Object* original) const {
    return original && entries_.find(original) != entries_.end();
}

bool IdentityMap::insert(const Ref<Object>& original, const Ref<Object>& clone) {
    if (!original) {
        return false;
    }
    return entries_.try_emplace(original.get(), Entry{original, clone}).second;
}

bool IdentityMap::erase(const Object* original) {
    return original && entries_.erase(original) > 0;
}

} // namespace deepclone
