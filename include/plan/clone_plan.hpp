//! # Clone Plans
//!
//! A `ClonePlan` is the compiled recipe for cloning one concrete type. It is
//! built once by `compile_plan()` and then shared, immutable, by every clone
//! call that meets the type.
//!
//! ## Steps
//!
//! | Action      | Effect on the destination slot                          |
//! |-------------|---------------------------------------------------------|
//! | `Copy`      | Plain value copy                                        |
//! | `Reset`     | Set to null / empty (delegates)                         |
//! | `Value`     | Copy, then re-clone the nested steps in place           |
//! | `Reference` | Clone the referenced object and store the clone         |
//!
//! Reference steps never hold the target's plan; it is resolved when the step
//! runs, so self-referential and mutually referential types compile without
//! recursion.

#pragma once

#include "reflect/type_info.hpp"
#include "runtime/object.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace deepclone::plan {

class CloneContext;

enum class StepAction : uint8_t { Copy, Reset, Value, Reference };

const char* action_name(StepAction action);

/// One storage location of a plan.
struct CloneStep {
    StepAction action = StepAction::Copy;
    const reflect::TypeInfo* type = nullptr; ///< Declared type of the slot
    /// Maps the owner address to the slot address. Empty for array and
    /// sequence elements and for a value plan's root step.
    reflect::SlotAccessor slot;
    std::string name;
    /// Reference steps: the target when it is statically known (final class).
    const reflect::TypeInfo* target = nullptr;
    /// Value steps: struct fields or the single sequence element step.
    std::vector<CloneStep> members;
    /// Value step whose members are resolved from the type's own plan at run
    /// time (recursive value types).
    bool deferred = false;
};

/// What a plan produces.
enum class PlanShape : uint8_t {
    Class, ///< A new object populated field by field
    Array, ///< A new array with the source's rank and lengths
    Value  ///< A value written into caller-provided storage
};

const char* shape_name(PlanShape shape);

class ClonePlan {
public:
    ClonePlan(const reflect::TypeInfo& type, PlanShape shape, std::vector<CloneStep> steps);

    const reflect::TypeInfo& type() const {
        return type_;
    }

    PlanShape shape() const {
        return shape_;
    }

    const std::vector<CloneStep>& steps() const {
        return steps_;
    }

    /// Total number of steps, nested members included.
    size_t step_count() const;

    /// Clones a Class or Array instance. The result has exactly this plan's type
    /// and is recorded in the context's identity map before any field is cloned.
    Ref<Object> clone_object(const Ref<Object>& source, CloneContext& context) const;

    /// Clones a value of this plan's type from `source` into `target`.
    void clone_value(const void* source, void* target, CloneContext& context) const;

private:
    Ref<Object> clone_class(const Ref<Object>& source, CloneContext& context) const;
    Ref<Object> clone_array(const Ref<Object>& source, CloneContext& context) const;

    const reflect::TypeInfo& type_;
    PlanShape shape_;
    std::vector<CloneStep> steps_;
};

using ClonePlanPtr = std::shared_ptr<const ClonePlan>;

/// Runs one step, reading from `source` and writing to `target` (slot addresses).
void run_step(const CloneStep& step, const void* source, void* target, CloneContext& context);

/// Renders the plan as an indented step tree, one line per step.
std::string describe_plan(const ClonePlan& plan);

} // namespace deepclone::plan
