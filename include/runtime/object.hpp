//! # Runtime Object Model
//!
//! The vocabulary deepclone works with:
//!
//! | C++ form                     | Role                                   |
//! |------------------------------|----------------------------------------|
//! | `Object`                     | Polymorphic root of every reference type |
//! | `Ref<T>`                     | A reference slot (empty = null)        |
//! | `String`                     | Immutable shared string                |
//! | arithmetic, enum, chrono     | Primitive values                       |
//! | registered structs           | Value types with fields                |
//! | `std::vector`, `std::array`  | Value-typed sequences                  |
//!
//! Reference types are always held through `Ref<T>`; value types are held
//! directly. Arrays and delegates live in `runtime/array.hpp` and
//! `runtime/delegate.hpp`.

#pragma once

#include <memory>
#include <string>
#include <utility>

namespace deepclone {

/// Root of every reference type. A plain `Object` carries no state and is
/// itself clonable.
class Object {
public:
    Object() = default;
    Object(const Object&) = default;
    Object& operator=(const Object&) = default;
    virtual ~Object() = default;
};

/// A reference slot.
template <typename T> using Ref = std::shared_ptr<T>;

/// Immutable shared string. Clones share the instance.
using String = std::shared_ptr<const std::string>;

/// Allocates a reference-type instance.
template <typename T, typename... Args> Ref<T> make(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

inline String make_string(std::string value) {
    return std::make_shared<const std::string>(std::move(value));
}

} // namespace deepclone
