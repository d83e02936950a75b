//! # Clone Plan Compiler Implementation

#include "plan/plan_compiler.hpp"

#include "core/errors.hpp"
#include "log/log.hpp"
#include "plan/classifier.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace deepclone::plan {

using reflect::SlotAccessor;
using reflect::TypeInfo;
using reflect::TypeKind;

namespace {

/// Compiles the step for one slot. Tracks the value types being expanded so
/// a recursive value type becomes a deferred step instead of looping.
class StepCompiler {
public:
    CloneStep compile(const TypeInfo& type, std::string name, SlotAccessor slot) {
        CloneStep step;
        step.type = &type;
        step.name = std::move(name);
        step.slot = std::move(slot);

        switch (type.kind) {
        case TypeKind::Null:
        case TypeKind::Primitive:
        case TypeKind::String:
            step.action = StepAction::Copy;
            break;

        case TypeKind::Delegate:
            step.action = StepAction::Reset;
            break;

        case TypeKind::Reference: {
            const TypeInfo& target = type.target();
            if (target.kind == TypeKind::Delegate) {
                step.action = StepAction::Reset;
                break;
            }
            step.action = StepAction::Reference;
            if (target.is_final) {
                step.target = &target;
            }
            break;
        }

        case TypeKind::Struct:
        case TypeKind::Sequence:
        case TypeKind::Optional:
        case TypeKind::Container:
            compile_value(type, step);
            break;

        case TypeKind::Array:
        case TypeKind::Class:
            throw UnsupportedTypeError(type.name,
                                       "reference types must be held through Ref<T>, not by value");
        }
        return step;
    }

private:
    void compile_value(const TypeInfo& type, CloneStep& step) {
        if (!needs_deep_copy(type)) {
            step.action = StepAction::Copy;
            return;
        }

        step.action = StepAction::Value;
        if (std::find(expanding_.begin(), expanding_.end(), &type) != expanding_.end()) {
            step.deferred = true;
            return;
        }

        expanding_.push_back(&type);
        if (type.kind == TypeKind::Struct) {
            // Only fields that cannot be plainly copied need a step; the
            // initial value copy already covers the rest.
            for (const auto& field : type.fields) {
                const TypeInfo& field_type = field.field_type();
                if (needs_deep_copy(field_type)) {
                    step.members.push_back(compile(field_type, field.name, field.slot));
                }
            }
        } else {
            // Map keys come first so the element step is always last.
            if (const TypeInfo* key = type.key_type()) {
                step.members.push_back(compile(*key, "key", {}));
            }
            step.members.push_back(compile(*type.element_type(), "[]", {}));
        }
        expanding_.pop_back();
    }

    std::vector<const TypeInfo*> expanding_;
};

} // namespace

ClonePlanPtr compile_plan(const TypeInfo& type) {
    StepCompiler compiler;
    std::vector<CloneStep> steps;
    PlanShape shape = PlanShape::Value;

    switch (type.kind) {
    case TypeKind::Delegate:
        throw UnsupportedTypeError(type.name,
                                   "delegates carry executable state and cannot be deep cloned");

    case TypeKind::Reference:
        throw UnsupportedTypeError(type.name, "a reference slot has no plan of its own");

    case TypeKind::Class:
        if (!type.ops.create) {
            throw UnsupportedTypeError(type.name, type.is_abstract
                                                      ? "abstract classes cannot be instantiated"
                                                      : "no default constructor or factory");
        }
        shape = PlanShape::Class;
        steps.reserve(type.fields.size());
        for (const auto& field : type.fields) {
            steps.push_back(compiler.compile(field.field_type(), field.name, field.slot));
        }
        break;

    case TypeKind::Array:
        shape = PlanShape::Array;
        steps.push_back(compiler.compile(*type.element_type(), "[]", {}));
        break;

    case TypeKind::Null:
    case TypeKind::Primitive:
    case TypeKind::String:
    case TypeKind::Struct:
    case TypeKind::Sequence:
    case TypeKind::Optional:
    case TypeKind::Container:
        shape = PlanShape::Value;
        steps.push_back(compiler.compile(type, "value", {}));
        break;
    }

    auto plan = std::make_shared<const ClonePlan>(type, shape, std::move(steps));
    DEEPCLONE_LOG_DEBUG("plan", "Compiled " << shape_name(shape) << " plan for " << type.name
                                            << " (" << plan->step_count() << " steps)");
    return plan;
}

} // namespace deepclone::plan
