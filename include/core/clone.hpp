//! # Deep Clone Entry Point
//!
//! `clone()` produces a structurally independent copy of any registered value:
//!
//! - Null references stay null.
//! - Primitives and strings come back as-is (a `String` shares its instance).
//! - Objects are copied field by field, recursively, through compiled plans.
//! - Shared references stay shared and cycles terminate: each original object
//!   is cloned once per identity map.
//! - Delegates nested anywhere in the graph come out null; a delegate passed
//!   directly is rejected with UnsupportedTypeError.
//!
//! ```cpp
//! auto copy = deepclone::clone(graph);                  // fresh identity map
//!
//! deepclone::IdentityMap shared;                        // one identity space
//! auto a = deepclone::clone(first, &shared);
//! auto b = deepclone::clone(second, &shared);           // reuses a's clones
//! ```

#ifndef DEEPCLONE_CORE_CLONE_HPP
#define DEEPCLONE_CORE_CLONE_HPP

#include "core/errors.hpp"
#include "core/identity_map.hpp"
#include "reflect/traits.hpp"
#include "reflect/type_builder.hpp"

#include <memory>
#include <type_traits>

namespace deepclone {

namespace detail {

/// Clones a root object by its runtime type.
Ref<Object> clone_object(const Ref<Object>& source, IdentityMap* identity_map, bool use_cache);

/// Clones a root value of `type` from `source` into `target`.
void clone_value(const reflect::TypeInfo& type, const void* source, void* target,
                 IdentityMap* identity_map, bool use_cache);

/// True if values of `type` need more than a plain copy.
bool needs_deep_copy(const reflect::TypeInfo& type);

} // namespace detail

/// Returns a deep copy of `source`.
///
/// @param identity_map Map shared across calls, or null for a fresh one.
/// @param use_cache    False compiles throwaway plans and leaves the plan cache untouched.
template <typename T>
T clone(const T& source, IdentityMap* identity_map = nullptr, bool use_cache = true) {
    if constexpr (reflect::detail::is_object_ref_v<T>) {
        using U = typename T::element_type;
        if (!source) {
            return nullptr;
        }
        reflect::register_type<U>();
        Ref<Object> cloned = detail::clone_object(source, identity_map, use_cache);
        return std::dynamic_pointer_cast<U>(cloned);
    } else if constexpr (std::is_base_of_v<Object, T>) {
        static_assert(reflect::detail::dependent_false<T>,
                      "reference types are cloned through Ref<T>");
    } else if constexpr (reflect::detail::is_std_function_v<T>) {
        if (!source) {
            return source;
        }
        throw UnsupportedTypeError(reflect::type_of<T>().name,
                                   "delegates carry executable state and cannot be deep cloned");
    } else {
        const reflect::TypeInfo& type = reflect::type_of<T>();
        if (!detail::needs_deep_copy(type)) {
            return source;
        }
        T result{};
        detail::clone_value(type, &source, &result, identity_map, use_cache);
        return result;
    }
}

} // namespace deepclone

#endif // DEEPCLONE_CORE_CLONE_HPP
