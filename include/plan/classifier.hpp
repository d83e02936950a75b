//! # Type Classifier
//!
//! Decides the clone strategy of a type. Value types (structs, sequences,
//! optionals and containers) whose storage holds no references and no
//! delegates clone as plain copies;
//! the answer is computed once per type and memoized.

#ifndef DEEPCLONE_PLAN_CLASSIFIER_HPP
#define DEEPCLONE_PLAN_CLASSIFIER_HPP

#include "reflect/type_info.hpp"
#include "runtime/object.hpp"

namespace deepclone::plan {

/// True if a value of `type` cannot be duplicated by a plain copy.
bool needs_deep_copy(const reflect::TypeInfo& type);

/// Clone strategy of a static type. Value types that need no deep copy
/// classify as Primitive.
reflect::TypeKind classify(const reflect::TypeInfo& type);

/// Clone strategy of a runtime object: Null for an empty reference, Delegate
/// for any `Delegate<Sig>`, otherwise the kind of its registered dynamic type.
/// Throws UnknownTypeError for unregistered dynamic types.
reflect::TypeKind classify(const Ref<Object>& value);

/// True if `object` is a `Delegate<Sig>` of any signature.
bool is_delegate(const Object& object);

/// Drops the memoized deep-copy answers (tests only).
void reset_classifier_memo();

} // namespace deepclone::plan

#endif // DEEPCLONE_PLAN_CLASSIFIER_HPP
