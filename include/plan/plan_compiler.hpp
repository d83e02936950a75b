//! # Clone Plan Compiler
//!
//! Builds the `ClonePlan` of a type from its registered fields:
//!
//! - Classes get one step per field, inherited fields first.
//! - Arrays get a single element step; elements that clone by plain copy
//!   are block-copied.
//! - Structs, sequences, primitives and strings get a single root step.
//!
//! Each compilation is logged at debug level under the `plan` module.

#pragma once

#include "plan/clone_plan.hpp"
#include "reflect/type_info.hpp"

namespace deepclone::plan {

/// Compiles a fresh plan for `type`.
///
/// Throws UnsupportedTypeError for delegate types, reference slot types and
/// classes with no way to construct an instance.
ClonePlanPtr compile_plan(const reflect::TypeInfo& type);

} // namespace deepclone::plan
