//! # Type Registration
//!
//! C++ has no runtime reflection, so every class and struct that takes part
//! in a clone declares its storage locations once, through a `TypeBuilder`.
//!
//! ## In-class description
//!
//! ```cpp
//! class Node : public deepclone::Object {
//! public:
//!     int value = 0;
//!     deepclone::Ref<Node> next;
//!
//!     static void describe(deepclone::reflect::TypeBuilder<Node>& type) {
//!         type.field<&Node::value>("value").field<&Node::next>("next");
//!     }
//! };
//! ```
//!
//! ## Out-of-class description
//!
//! ```cpp
//! template <> struct deepclone::reflect::Describe<Point> {
//!     static void describe(TypeBuilder<Point>& type) {
//!         type.field<&Point::x>("x").field<&Point::y>("y");
//!     }
//! };
//! ```
//!
//! Standard containers (`vector`, `array`, `list`, `deque`, the ordered and
//! unordered sets and maps), `optional` and `pair` need no description; their
//! element types must themselves be clonable.
//!
//! A type is registered the first time `type_of<T>()` is called for it.
//! Types only ever reached through a `Ref<Base>` must be registered up front
//! with `register_type<T>()`.

#pragma once

#include "reflect/traits.hpp"
#include "reflect/type_info.hpp"
#include "reflect/type_registry.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace deepclone::reflect {

template <typename T> class TypeBuilder;

/// Returns the TypeInfo of `T`, registering it on first use.
template <typename T> const TypeInfo& type_of();

/// Specialize to describe a type without touching its definition.
template <typename T> struct Describe {};

/// Grants the registry access to private `describe` hooks and private
/// default constructors. Befriend it with `friend class deepclone::reflect::Access;`.
class Access {
    template <typename T>
    static auto probe_describe(int)
        -> decltype(T::describe(std::declval<TypeBuilder<T>&>()), std::true_type{});
    template <typename T> static std::false_type probe_describe(...);

    template <typename T> static auto probe_create(int) -> decltype(::new T(), std::true_type{});
    template <typename T> static std::false_type probe_create(...);

public:
    template <typename T>
    static constexpr bool has_describe = decltype(probe_describe<T>(0))::value;

    template <typename T> static constexpr bool can_create = decltype(probe_create<T>(0))::value;

    template <typename T> static void describe(TypeBuilder<T>& builder) {
        T::describe(builder);
    }

    template <typename T> static Ref<T> create() {
        return Ref<T>(new T());
    }
};

namespace detail {

template <typename T, typename = void> struct has_describe_specialization : std::false_type {};
template <typename T>
struct has_describe_specialization<
    T, std::void_t<decltype(Describe<T>::describe(std::declval<TypeBuilder<T>&>()))>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_describable_v =
    Access::has_describe<T> || has_describe_specialization<T>::value;

} // namespace detail

// ============================================================================
// TypeBuilder
// ============================================================================

/// Collects the fields, bases and factory of a class or struct.
template <typename T> class TypeBuilder {
public:
    explicit TypeBuilder(TypeInfo& info) : info_(info) {}

    /// Registers the data member `Member` under `name`.
    template <auto Member>
    TypeBuilder& field(std::string name, FieldFlags flags = FieldFlags::None) {
        using traits = detail::member_pointer_traits<decltype(Member)>;
        using M = typename traits::member_type;

        static_assert(std::is_base_of_v<typename traits::class_type, T>,
                      "field must belong to the described type or one of its bases");
        static_assert(!std::is_const_v<M>,
                      "const data members cannot be rewritten by a clone; declare the member "
                      "private and non-const with no setter, and flag it InitOnly");
        static_assert(!std::is_base_of_v<Object, M>,
                      "reference types must be held through Ref<T>, not by value");

        FieldInfo field;
        field.name = std::move(name);
        field.type = &type_of<M>;
        field.slot = [](void* owner) -> void* {
            return std::addressof(static_cast<T*>(owner)->*Member);
        };
        field.flags = flags;
        field.declaring_type = info_.name;
        info_.fields.push_back(std::move(field));
        return *this;
    }

    /// Imports the fields of base `B` ahead of the fields declared here.
    template <typename B> TypeBuilder& base() {
        static_assert(std::is_base_of_v<B, T> && !std::is_same_v<B, T>,
                      "base<B>() requires B to be a proper base of the described type");

        const TypeInfo& base_info = type_of<B>();
        std::vector<FieldInfo> inherited;
        inherited.reserve(base_info.fields.size());
        for (const FieldInfo& field : base_info.fields) {
            FieldInfo copy = field;
            copy.slot = [inner = field.slot](void* owner) -> void* {
                return inner(static_cast<B*>(static_cast<T*>(owner)));
            };
            inherited.push_back(std::move(copy));
        }

        auto position = info_.fields.begin() + static_cast<std::ptrdiff_t>(inherited_count_);
        info_.fields.insert(position, std::make_move_iterator(inherited.begin()),
                            std::make_move_iterator(inherited.end()));
        inherited_count_ += inherited.size();
        return *this;
    }

    /// Allocation function for classes without a reachable default constructor.
    TypeBuilder& factory(std::function<Ref<T>()> make) {
        static_assert(std::is_base_of_v<Object, T>, "factories apply to reference types only");
        info_.ops.create = [make = std::move(make)]() -> Ref<Object> { return make(); };
        return *this;
    }

    TypeInfo& info() {
        return info_;
    }

private:
    TypeInfo& info_;
    size_t inherited_count_ = 0;
};

// ============================================================================
// Type-erased operations
// ============================================================================

namespace detail {

template <typename T> void assign_value(void* dst, const void* src) {
    *static_cast<T*>(dst) = *static_cast<const T*>(src);
}

template <typename T> void reset_value(void* slot) {
    *static_cast<T*>(slot) = T{};
}

template <typename R> Ref<Object> load_ref(const void* slot) {
    return *static_cast<const R*>(slot);
}

template <typename R> bool store_ref(void* slot, const Ref<Object>& value) {
    using U = typename R::element_type;
    auto& dst = *static_cast<R*>(slot);
    if (!value) {
        dst.reset();
        return true;
    }
    auto typed = std::dynamic_pointer_cast<U>(value);
    if (!typed) {
        return false;
    }
    dst = std::move(typed);
    return true;
}

template <typename S> std::size_t sequence_count(const void* value) {
    return static_cast<const S*>(value)->size();
}

template <typename S> void* sequence_data(void* value) {
    return static_cast<S*>(value)->data();
}

template <typename O> std::size_t optional_count(const void* value) {
    return static_cast<const O*>(value)->has_value() ? 1 : 0;
}

template <typename O> void* optional_data(void* value) {
    auto& optional = *static_cast<O*>(value);
    return optional ? std::addressof(*optional) : nullptr;
}

template <typename C>
void rebuild_container(const void* src, void* dst, const ElementCloner& key,
                       const ElementCloner& element) {
    constexpr ContainerForm form = container_form<C>::value;
    const auto& from = *static_cast<const C*>(src);
    auto& to = *static_cast<C*>(dst);
    to.clear();

    for (const auto& entry : from) {
        if constexpr (form == ContainerForm::Map) {
            typename C::key_type cloned_key{};
            typename C::mapped_type cloned_value{};
            key(std::addressof(entry.first), std::addressof(cloned_key));
            element(std::addressof(entry.second), std::addressof(cloned_value));
            to.emplace(std::move(cloned_key), std::move(cloned_value));
        } else {
            typename C::value_type cloned{};
            element(std::addressof(entry), std::addressof(cloned));
            if constexpr (form == ContainerForm::Append) {
                to.push_back(std::move(cloned));
            } else {
                to.insert(std::move(cloned));
            }
        }
    }
}

template <typename T> void* object_self(Object* object) {
    return dynamic_cast<T*>(object);
}

template <typename A> Ref<Object> array_create_like(const Object& source) {
    return std::make_shared<A>(static_cast<const A&>(source).lengths());
}

template <typename A> void array_copy_elements(const Object& src, Object& dst) {
    const auto& from = static_cast<const A&>(src);
    std::copy(from.begin(), from.end(), static_cast<A&>(dst).begin());
}

template <typename A> void* array_elements(Object& array) {
    return static_cast<A&>(array).data();
}

template <typename A> std::size_t array_element_count(const Object& array) {
    return static_cast<const A&>(array).size();
}

template <typename T> void describe_type(TypeBuilder<T>& builder) {
    if constexpr (Access::has_describe<T>) {
        Access::describe(builder);
    } else {
        Describe<T>::describe(builder);
    }
}

template <typename T> void set_value_ops(TypeInfo& info) {
    info.ops.assign = &assign_value<T>;
    info.ops.reset = &reset_value<T>;
}

template <typename T> std::unique_ptr<TypeInfo> build_type_info() {
    static_assert(!std::is_const_v<T> && !std::is_volatile_v<T> && !std::is_reference_v<T>,
                  "type_of<T>() expects an unqualified type");

    auto info = std::make_unique<TypeInfo>(std::type_index(typeid(T)));
    info->name = demangle(typeid(T).name());
    info->size = sizeof(T);

    if constexpr (is_primitive_like_v<T>) {
        info->kind = TypeKind::Primitive;
        set_value_ops<T>(*info);
    } else if constexpr (is_string_like_v<T>) {
        info->kind = TypeKind::String;
        set_value_ops<T>(*info);
    } else if constexpr (is_std_function_v<T>) {
        info->kind = TypeKind::Delegate;
        set_value_ops<T>(*info);
    } else if constexpr (is_object_ref_v<T>) {
        info->kind = TypeKind::Reference;
        info->target = &type_of<typename T::element_type>;
        set_value_ops<T>(*info);
        info->ops.load = &load_ref<T>;
        info->ops.store = &store_ref<T>;
    } else if constexpr (is_sequence_v<T>) {
        info->kind = TypeKind::Sequence;
        info->element = &type_of<typename T::value_type>;
        set_value_ops<T>(*info);
        info->ops.count = &sequence_count<T>;
        if constexpr (has_element_storage<T>::value) {
            info->ops.data = &sequence_data<T>;
        }
    } else if constexpr (is_optional_v<T>) {
        info->kind = TypeKind::Optional;
        info->element = &type_of<typename T::value_type>;
        set_value_ops<T>(*info);
        info->ops.count = &optional_count<T>;
        info->ops.data = &optional_data<T>;
    } else if constexpr (is_container_v<T>) {
        info->kind = TypeKind::Container;
        if constexpr (container_form<T>::value == ContainerForm::Map) {
            static_assert(std::is_default_constructible_v<typename T::key_type> &&
                              std::is_default_constructible_v<typename T::mapped_type>,
                          "map keys and values must be default constructible");
            info->key = &type_of<typename T::key_type>;
            info->element = &type_of<typename T::mapped_type>;
        } else {
            static_assert(std::is_default_constructible_v<typename T::value_type>,
                          "container elements must be default constructible");
            info->element = &type_of<typename T::value_type>;
        }
        set_value_ops<T>(*info);
        info->ops.rebuild = &rebuild_container<T>;
    } else if constexpr (is_pair_v<T>) {
        static_assert(!std::is_const_v<typename T::first_type> &&
                          !std::is_const_v<typename T::second_type>,
                      "pairs with const members cannot be rewritten by a clone");
        info->kind = TypeKind::Struct;
        set_value_ops<T>(*info);
        TypeBuilder<T> builder(*info);
        builder.template field<&T::first>("first").template field<&T::second>("second");
    } else if constexpr (std::is_base_of_v<Object, T>) {
        info->object = true;
        info->is_final = std::is_final_v<T>;
        info->is_abstract = std::is_abstract_v<T>;
        info->ops.self = &object_self<T>;

        if constexpr (is_array_object_v<T>) {
            info->kind = TypeKind::Array;
            info->element = &type_of<typename T::value_type>;
            info->ops.create_like = &array_create_like<T>;
            info->ops.copy_elements = &array_copy_elements<T>;
            info->ops.elements = &array_elements<T>;
            info->ops.element_count = &array_element_count<T>;
        } else if constexpr (is_delegate_object_v<T>) {
            info->kind = TypeKind::Delegate;
        } else {
            info->kind = TypeKind::Class;
            if constexpr (Access::can_create<T>) {
                info->ops.create = []() -> Ref<Object> { return Access::create<T>(); };
            }
            if constexpr (is_describable_v<T>) {
                TypeBuilder<T> builder(*info);
                describe_type<T>(builder);
            } else {
                static_assert(std::is_same_v<T, Object>,
                              "classes must declare their fields with a static "
                              "describe(TypeBuilder<T>&) member or a Describe<T> specialization");
            }
        }
    } else if constexpr (is_describable_v<T>) {
        static_assert(std::is_default_constructible_v<T> && std::is_copy_assignable_v<T>,
                      "value types must be default constructible and copy assignable");
        info->kind = TypeKind::Struct;
        set_value_ops<T>(*info);
        TypeBuilder<T> builder(*info);
        describe_type<T>(builder);
    } else {
        static_assert(dependent_false<T>,
                      "type is not clonable: describe it with a static describe(TypeBuilder<T>&) "
                      "member or a Describe<T> specialization");
    }

    return info;
}

} // namespace detail

// ============================================================================
// Registration entry points
// ============================================================================

template <typename T> const TypeInfo& type_of() {
    static const TypeInfo& info = TypeRegistry::instance().add(detail::build_type_info<T>());
    return info;
}

/// Registers `T` eagerly. Needed for types only reached through `Ref<Base>`.
template <typename T> const TypeInfo& register_type() {
    return type_of<T>();
}

} // namespace deepclone::reflect
