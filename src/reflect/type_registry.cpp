//! # Type Registry Implementation

#include "reflect/type_registry.hpp"

#include "core/errors.hpp"
#include "log/log.hpp"

#include <mutex>

namespace deepclone::reflect {

TypeRegistry& TypeRegistry::instance() {
    static TypeRegistry registry;
    return registry;
}

const TypeInfo& TypeRegistry::add(std::unique_ptr<TypeInfo> info) {
    const std::type_index id = info->id;
    std::unique_lock lock(mutex_);
    auto [it, inserted] = types_.try_emplace(id, std::move(info));
    if (inserted) {
        DEEPCLONE_LOG_TRACE("reflect", "Registered " << kind_name(it->second->kind) << " "
                                                     << it->second->name << " ("
                                                     << it->second->fields.size() << " fields)");
    }
    return *it->second;
}

const TypeInfo* TypeRegistry::find(std::type_index id) const {
    std::shared_lock lock(mutex_);
    auto it = types_.find(id);
    return it != types_.end() ? it->second.get() : nullptr;
}

const TypeInfo* TypeRegistry::find(std::string_view name) const {
    std::shared_lock lock(mutex_);
    for (const auto& [id, info] : types_) {
        if (info->name == name) {
            return info.get();
        }
    }
    return nullptr;
}

std::vector<const TypeInfo*> TypeRegistry::types() const {
    std::shared_lock lock(mutex_);
    std::vector<const TypeInfo*> result;
    result.reserve(types_.size());
    for (const auto& [id, info] : types_) {
        result.push_back(info.get());
    }
    return result;
}

size_t TypeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return types_.size();
}

const TypeInfo& runtime_type_of(const Object& object) {
    const std::type_info& dynamic = typeid(object);
    if (const TypeInfo* info = TypeRegistry::instance().find(std::type_index(dynamic))) {
        return *info;
    }
    throw UnknownTypeError(demangle(dynamic.name()));
}

} // namespace deepclone::reflect
