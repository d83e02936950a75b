//! # Type Traits
//!
//! Compile-time classification used by `type_of<T>()` to pick a TypeKind.

#pragma once

#include "runtime/array.hpp"
#include "runtime/delegate.hpp"
#include "runtime/object.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace deepclone::reflect::detail {

template <typename T> inline constexpr bool dependent_false = false;

// Chrono values copy like primitives.
template <typename T> struct is_duration : std::false_type {};
template <typename R, typename P> struct is_duration<std::chrono::duration<R, P>> : std::true_type {};

template <typename T> struct is_time_point : std::false_type {};
template <typename C, typename D>
struct is_time_point<std::chrono::time_point<C, D>> : std::true_type {};

template <typename T>
inline constexpr bool is_primitive_like_v = std::is_arithmetic_v<T> || std::is_enum_v<T> ||
                                            is_duration<T>::value || is_time_point<T>::value;

template <typename T>
inline constexpr bool is_string_like_v =
    std::is_same_v<T, std::string> || std::is_same_v<T, String>;

template <typename T> struct is_std_function : std::false_type {};
template <typename Sig> struct is_std_function<std::function<Sig>> : std::true_type {};

template <typename T> inline constexpr bool is_std_function_v = is_std_function<T>::value;

/// `Ref<U>` where U is a mutable Object-derived type.
template <typename T> struct is_object_ref : std::false_type {};
template <typename U>
struct is_object_ref<std::shared_ptr<U>>
    : std::bool_constant<std::is_base_of_v<Object, U> && !std::is_const_v<U>> {};

template <typename T> inline constexpr bool is_object_ref_v = is_object_ref<T>::value;

template <typename T> struct is_sequence : std::false_type {};
template <typename E, typename A> struct is_sequence<std::vector<E, A>> : std::true_type {};
template <typename E, std::size_t N> struct is_sequence<std::array<E, N>> : std::true_type {};

template <typename T> inline constexpr bool is_sequence_v = is_sequence<T>::value;

/// vector<bool> has no addressable element storage.
template <typename T> struct has_element_storage : std::true_type {};
template <typename A> struct has_element_storage<std::vector<bool, A>> : std::false_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename E> struct is_optional<std::optional<E>> : std::true_type {};

template <typename T> inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename T> struct is_pair : std::false_type {};
template <typename A, typename B> struct is_pair<std::pair<A, B>> : std::true_type {};

template <typename T> inline constexpr bool is_pair_v = is_pair<T>::value;

/// How a container is refilled when cloned.
enum class ContainerForm { None, Append, Insert, Map };

template <ContainerForm F> using container_form_constant = std::integral_constant<ContainerForm, F>;

template <typename T> struct container_form : container_form_constant<ContainerForm::None> {};

template <typename E, typename A>
struct container_form<std::list<E, A>> : container_form_constant<ContainerForm::Append> {};
template <typename E, typename A>
struct container_form<std::deque<E, A>> : container_form_constant<ContainerForm::Append> {};

template <typename K, typename C, typename A>
struct container_form<std::set<K, C, A>> : container_form_constant<ContainerForm::Insert> {};
template <typename K, typename C, typename A>
struct container_form<std::multiset<K, C, A>> : container_form_constant<ContainerForm::Insert> {};
template <typename K, typename H, typename E, typename A>
struct container_form<std::unordered_set<K, H, E, A>>
    : container_form_constant<ContainerForm::Insert> {};
template <typename K, typename H, typename E, typename A>
struct container_form<std::unordered_multiset<K, H, E, A>>
    : container_form_constant<ContainerForm::Insert> {};

template <typename K, typename V, typename C, typename A>
struct container_form<std::map<K, V, C, A>> : container_form_constant<ContainerForm::Map> {};
template <typename K, typename V, typename C, typename A>
struct container_form<std::multimap<K, V, C, A>> : container_form_constant<ContainerForm::Map> {};
template <typename K, typename V, typename H, typename E, typename A>
struct container_form<std::unordered_map<K, V, H, E, A>>
    : container_form_constant<ContainerForm::Map> {};
template <typename K, typename V, typename H, typename E, typename A>
struct container_form<std::unordered_multimap<K, V, H, E, A>>
    : container_form_constant<ContainerForm::Map> {};

template <typename T>
inline constexpr bool is_container_v = container_form<T>::value != ContainerForm::None;

template <typename T> struct is_array_object : std::false_type {};
template <typename E> struct is_array_object<Array<E>> : std::true_type {};

template <typename T> inline constexpr bool is_array_object_v = is_array_object<T>::value;

template <typename T>
inline constexpr bool is_delegate_object_v = std::is_base_of_v<DelegateBase, T>;

template <typename M> struct member_pointer_traits;
template <typename C, typename M> struct member_pointer_traits<M C::*> {
    using class_type = C;
    using member_type = M;
};

} // namespace deepclone::reflect::detail
