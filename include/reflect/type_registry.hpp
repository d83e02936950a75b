//! # Type Registry
//!
//! Process-wide index of every registered `TypeInfo`, keyed by
//! `std::type_index`. The clone engine uses it to find the TypeInfo of an
//! object's dynamic type when the static type of a reference is not enough.
//!
//! Thread-safe: lookups take a shared lock, registration an exclusive one.

#ifndef DEEPCLONE_REFLECT_TYPE_REGISTRY_HPP
#define DEEPCLONE_REFLECT_TYPE_REGISTRY_HPP

#include "reflect/type_info.hpp"

#include <memory>
#include <shared_mutex>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace deepclone::reflect {

class TypeRegistry {
public:
    static TypeRegistry& instance();

    /// Registers a TypeInfo. If the type is already present the existing
    /// record wins and `info` is discarded.
    const TypeInfo& add(std::unique_ptr<TypeInfo> info);

    [[nodiscard]] const TypeInfo* find(std::type_index id) const;

    /// Lookup by demangled name (linear scan, for diagnostics).
    [[nodiscard]] const TypeInfo* find(std::string_view name) const;

    [[nodiscard]] std::vector<const TypeInfo*> types() const;

    [[nodiscard]] size_t size() const;

private:
    TypeRegistry() = default;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<TypeInfo>> types_;
};

/// TypeInfo for the dynamic type of `object`.
/// Throws UnknownTypeError if that type was never registered.
const TypeInfo& runtime_type_of(const Object& object);

} // namespace deepclone::reflect

#endif // DEEPCLONE_REFLECT_TYPE_REGISTRY_HPP
