//! # Identity Map
//!
//! Maps each original object reached during a clone to its copy. Keys are
//! object addresses, never a type's own equality, so two distinct objects
//! that compare equal still get distinct clones and a shared object gets a
//! single clone.
//!
//! The map holds a strong reference to every original, so an address cannot
//! be recycled while the map is alive.

#ifndef DEEPCLONE_CORE_IDENTITY_MAP_HPP
#define DEEPCLONE_CORE_IDENTITY_MAP_HPP

#include "runtime/object.hpp"

#include <cstddef>
#include <functional>
#include <unordered_map>

namespace deepclone {

// ============================================================================
// Reference identity functors
// ============================================================================

/// Hashes by address. Null hashes to 0.
struct ReferenceHash {
    using is_transparent = void;

    size_t operator()(const Object* object) const noexcept {
        return object ? std::hash<const Object*>{}(object) : 0;
    }

    template <typename T> size_t operator()(const Ref<T>& ref) const noexcept {
        return (*this)(static_cast<const Object*>(ref.get()));
    }
};

/// Compares by address.
struct ReferenceEqual {
    using is_transparent = void;

    bool operator()(const Object* a, const Object* b) const noexcept {
        return a == b;
    }

    template <typename T, typename U> bool operator()(const Ref<T>& a, const Ref<U>& b) const noexcept {
        return static_cast<const Object*>(a.get()) == static_cast<const Object*>(b.get());
    }

    template <typename T> bool operator()(const Object* a, const Ref<T>& b) const noexcept {
        return a == static_cast<const Object*>(b.get());
    }

    template <typename T> bool operator()(const Ref<T>& a, const Object* b) const noexcept {
        return static_cast<const Object*>(a.get()) == b;
    }
};

// ============================================================================
// IdentityMap
// ============================================================================

/// Original-to-clone map for one clone call, or for several calls that
/// should share one identity space. Not thread-safe.
class IdentityMap {
public:
    IdentityMap() = default;
    IdentityMap(const IdentityMap&) = delete;
    IdentityMap& operator=(const IdentityMap&) = delete;
    IdentityMap(IdentityMap&&) = default;
    IdentityMap& operator=(IdentityMap&&) = default;

    /// The clone of `original`, or null if it has not been cloned.
    [[nodiscard]] Ref<Object> find(const Object* original) const;

    /// Typed lookup. Returns null if absent or not a `T`.
    template <typename T, typename U> [[nodiscard]] Ref<T> find(const Ref<U>& original) const {
        return std::dynamic_pointer_cast<T>(find(static_cast<const Object*>(original.get())));
    }

    [[nodiscard]] bool contains(const Object* original) const;

    /// Records `original -> clone`. Returns false if `original` is null or
    /// already mapped (the existing entry is kept).
    bool insert(const Ref<Object>& original, const Ref<Object>& clone);

    /// Drops the entry for `original`. Returns false if there was none.
    bool erase(const Object* original);

    [[nodiscard]] size_t size() const {
        return entries_.size();
    }

    [[nodiscard]] bool empty() const {
        return entries_.empty();
    }

    void clear() {
        entries_.clear();
    }

    /// Calls `fn(original, clone)` for every entry.
    template <typename F> void for_each(F&& fn) const {
        for (const auto& [key, entry] : entries_) {
            fn(entry.original, entry.clone);
        }
    }

private:
    struct Entry {
        Ref<Object> original;
        Ref<Object> clone;
    };

    std::unordered_map<const Object*, Entry, ReferenceHash, ReferenceEqual> entries_;
};

} // namespace deepclone

#endif // DEEPCLONE_CORE_IDENTITY_MAP_HPP
