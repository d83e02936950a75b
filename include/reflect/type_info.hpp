//! # Type Information
//!
//! `TypeInfo` is the runtime description of one C++ type: its kind, its
//! ordered storage locations (fields), and a table of type-erased operations
//! the clone engine uses to copy, reset, allocate and traverse values of the
//! type without knowing it statically.
//!
//! TypeInfo records are created once by `type_of<T>()` and live for the rest
//! of the process; plans and caches refer to them by address.

#pragma once

#include "runtime/object.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace deepclone::reflect {

// ============================================================================
// Kinds and Flags
// ============================================================================

/// Clone-relevant category of a type.
enum class TypeKind : uint8_t {
    Null,      ///< Empty reference (only produced by runtime classification)
    Primitive, ///< Arithmetic, enum, chrono, or a value type with no reference storage
    String,    ///< `std::string` or the shared immutable `String`
    Delegate,  ///< `std::function` slot or `Delegate<Sig>` object
    Reference, ///< A `Ref<T>` slot
    Array,     ///< `Array<T>` object
    Struct,    ///< Registered value type with fields
    Sequence,  ///< `std::vector<T>` or `std::array<T, N>`
    Optional,  ///< `std::optional<T>`
    Container, ///< Node-based or associative standard container, rebuilt on clone
    Class      ///< Registered `Object`-derived type
};

/// Returns a lower-case name for a kind ("primitive", "class", ...).
const char* kind_name(TypeKind kind);

/// Field metadata flags. Every registered field is cloned regardless of flags.
enum class FieldFlags : uint8_t {
    None = 0,
    NonPublic = 1 << 0, ///< Not part of the type's public interface
    InitOnly = 1 << 1,  ///< Set once at construction, no setter
};

inline constexpr FieldFlags operator|(FieldFlags a, FieldFlags b) {
    return static_cast<FieldFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline constexpr bool has_flag(FieldFlags flags, FieldFlags flag) {
    return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(flag)) != 0;
}

// ============================================================================
// Fields
// ============================================================================

struct TypeInfo;

/// Lazily resolves a TypeInfo. Resolution is deferred so self-referential
/// types can be described without recursing at registration time.
using TypeResolver = const TypeInfo& (*)();

/// Maps the address of an owning value to the address of one of its fields.
using SlotAccessor = std::function<void*(void*)>;

/// Clones one container element from `from` into the default-constructed `to`.
using ElementCloner = std::function<void(const void* from, void* to)>;

/// One storage location of a struct or class.
struct FieldInfo {
    std::string name;
    TypeResolver type = nullptr;
    SlotAccessor slot;
    FieldFlags flags = FieldFlags::None;
    std::string declaring_type;

    const TypeInfo& field_type() const {
        return type();
    }

    bool is_non_public() const {
        return has_flag(flags, FieldFlags::NonPublic);
    }

    bool is_init_only() const {
        return has_flag(flags, FieldFlags::InitOnly);
    }
};

// ============================================================================
// Type Operations
// ============================================================================

/// Type-erased operations. Only the entries meaningful for a kind are set.
struct TypeOps {
    // Value slots (every kind except Class, Array and Delegate objects)
    void (*assign)(void* dst, const void* src) = nullptr;
    void (*reset)(void* slot) = nullptr;

    // Reference slots
    Ref<Object> (*load)(const void* slot) = nullptr;
    /// Stores through a checked down-cast. Returns false if `value` is not
    /// an instance of the slot's declared target.
    bool (*store)(void* slot, const Ref<Object>& value) = nullptr;

    // Sequences and optionals
    std::size_t (*count)(const void* value) = nullptr;
    void* (*data)(void* value) = nullptr;

    // Containers: clears `dst` and refills it with a clone of every entry of
    // `src`. `key` is only called for maps.
    void (*rebuild)(const void* src, void* dst, const ElementCloner& key,
                    const ElementCloner& element) = nullptr;

    // Object types
    std::function<Ref<Object>()> create;
    /// Views an object as this type, or nullptr if it is not one.
    void* (*self)(Object* object) = nullptr;

    // Arrays
    Ref<Object> (*create_like)(const Object& source) = nullptr;
    void (*copy_elements)(const Object& src, Object& dst) = nullptr;
    void* (*elements)(Object& array) = nullptr;
    std::size_t (*element_count)(const Object& array) = nullptr;
};

// ============================================================================
// TypeInfo
// ============================================================================

struct TypeInfo {
    explicit TypeInfo(std::type_index id) : id(id) {}

    std::type_index id;
    std::string name;
    TypeKind kind = TypeKind::Primitive;
    std::size_t size = 0;
    bool object = false; ///< Derives from Object
    bool is_final = false;
    bool is_abstract = false;

    /// Inherited fields first, then own fields, in registration order.
    std::vector<FieldInfo> fields;

    TypeResolver element = nullptr; ///< Array / Sequence / Optional element type, map value type
    TypeResolver key = nullptr;     ///< Map key type
    TypeResolver target = nullptr;  ///< Reference target type

    TypeOps ops;

    const TypeInfo* element_type() const {
        return element ? &element() : nullptr;
    }

    const TypeInfo* key_type() const {
        return key ? &key() : nullptr;
    }

    const TypeInfo* target_type() const {
        return target ? &target() : nullptr;
    }

    const FieldInfo* find_field(std::string_view field_name) const;
};

/// Demangles a `typeid(...).name()` string. Returns the input on failure.
std::string demangle(const char* mangled);

} // namespace deepclone::reflect
