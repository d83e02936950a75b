//! # Clone Plan Execution

#include "plan/clone_plan.hpp"

#include "core/errors.hpp"
#include "plan/clone_context.hpp"

#include <cstddef>
#include <sstream>
#include <typeindex>
#include <typeinfo>

namespace deepclone::plan {

using reflect::TypeInfo;
using reflect::TypeKind;

const char* action_name(StepAction action) {
    switch (action) {
    case StepAction::Copy:
        return "copy";
    case StepAction::Reset:
        return "reset";
    case StepAction::Value:
        return "value";
    case StepAction::Reference:
        return "reference";
    }
    return "unknown";
}

const char* shape_name(PlanShape shape) {
    switch (shape) {
    case PlanShape::Class:
        return "class";
    case PlanShape::Array:
        return "array";
    case PlanShape::Value:
        return "value";
    }
    return "unknown";
}

// ============================================================================
// Step execution
// ============================================================================

static void run_elements(const CloneStep& element, const std::byte* from, std::byte* to,
                         size_t count, CloneContext& context) {
    const size_t stride = element.type->size;
    for (size_t i = 0; i < count; ++i) {
        run_step(element, from + i * stride, to + i * stride, context);
    }
}

static void run_container(const CloneStep& step, const void* source, void* target,
                          CloneContext& context) {
    const CloneStep& element = step.members.back();
    reflect::ElementCloner clone_key;
    if (step.members.size() > 1) {
        const CloneStep& key = step.members.front();
        clone_key = [&key, &context](const void* from, void* to) {
            run_step(key, from, to, context);
        };
    }
    step.type->ops.rebuild(source, target, clone_key,
                           [&element, &context](const void* from, void* to) {
                               run_step(element, from, to, context);
                           });
}

static void run_value(const CloneStep& step, const void* source, void* target,
                      CloneContext& context) {
    const auto& ops = step.type->ops;
    if (step.type->kind == TypeKind::Container) {
        run_container(step, source, target, context);
        return;
    }
    ops.assign(target, source);

    if (step.type->kind == TypeKind::Sequence || step.type->kind == TypeKind::Optional) {
        const size_t count = ops.count(target);
        if (count == 0) {
            return;
        }
        if (!ops.data) {
            throw MemberAccessError(step.type->name, step.name,
                                    "sequence has no addressable element storage");
        }
        run_elements(step.members.front(),
                     static_cast<const std::byte*>(ops.data(const_cast<void*>(source))),
                     static_cast<std::byte*>(ops.data(target)), count, context);
        return;
    }

    // Slot accessors only compute addresses; the source is never written.
    void* owner = const_cast<void*>(source);
    for (const auto& member : step.members) {
        run_step(member, member.slot(owner), member.slot(target), context);
    }
}

void run_step(const CloneStep& step, const void* source, void* target, CloneContext& context) {
    const auto& ops = step.type->ops;

    switch (step.action) {
    case StepAction::Copy:
        ops.assign(target, source);
        return;

    case StepAction::Reset:
        ops.reset(target);
        return;

    case StepAction::Value:
        if (step.deferred) {
            context.plan_for(*step.type)->clone_value(source, target, context);
        } else {
            run_value(step, source, target, context);
        }
        return;

    case StepAction::Reference: {
        Ref<Object> cloned = context.clone_nested(ops.load(source), step.target);
        if (!ops.store(target, cloned)) {
            const Object& produced = *cloned;
            throw MemberAccessError(step.type->name, step.name,
                                    "a clone of type " + reflect::demangle(typeid(produced).name()) +
                                        " cannot be stored in this slot");
        }
        return;
    }
    }
}

// ============================================================================
// ClonePlan
// ============================================================================

ClonePlan::ClonePlan(const TypeInfo& type, PlanShape shape, std::vector<CloneStep> steps)
    : type_(type), shape_(shape), steps_(std::move(steps)) {}

static size_t count_steps(const std::vector<CloneStep>& steps) {
    size_t total = steps.size();
    for (const auto& step : steps) {
        total += count_steps(step.members);
    }
    return total;
}

size_t ClonePlan::step_count() const {
    return count_steps(steps_);
}

Ref<Object> ClonePlan::clone_object(const Ref<Object>& source, CloneContext& context) const {
    switch (shape_) {
    case PlanShape::Class:
        return clone_class(source, context);
    case PlanShape::Array:
        return clone_array(source, context);
    case PlanShape::Value:
        break;
    }
    throw UnsupportedTypeError(type_.name, "value types are cloned into storage, not as objects");
}

Ref<Object> ClonePlan::clone_class(const Ref<Object>& source, CloneContext& context) const {
    void* from = type_.ops.self(source.get());
    if (!from) {
        const Object& actual = *source;
        throw MemberAccessError(type_.name, "",
                                "source object is a " + reflect::demangle(typeid(actual).name()));
    }

    Ref<Object> clone = type_.ops.create();
    if (!clone) {
        throw UnsupportedTypeError(type_.name, "factory returned null");
    }
    const Object& created = *clone;
    if (std::type_index(typeid(created)) != type_.id) {
        throw UnsupportedTypeError(type_.name, "factory produced a " +
                                                   reflect::demangle(typeid(created).name()));
    }
    void* to = type_.ops.self(clone.get());

    // Registered before any field so cycles back to `source` resolve to `clone`.
    context.record(source, clone);

    for (const auto& step : steps_) {
        run_step(step, step.slot(from), step.slot(to), context);
    }
    return clone;
}

Ref<Object> ClonePlan::clone_array(const Ref<Object>& source, CloneContext& context) const {
    Ref<Object> clone = type_.ops.create_like(*source);
    context.record(source, clone);

    const CloneStep& element = steps_.front();
    if (element.action == StepAction::Copy) {
        type_.ops.copy_elements(*source, *clone);
        return clone;
    }

    run_elements(element, static_cast<const std::byte*>(type_.ops.elements(*source)),
                 static_cast<std::byte*>(type_.ops.elements(*clone)),
                 type_.ops.element_count(*source), context);
    return clone;
}

void ClonePlan::clone_value(const void* source, void* target, CloneContext& context) const {
    if (shape_ != PlanShape::Value) {
        throw UnsupportedTypeError(type_.name, "reference types are cloned as objects");
    }
    run_step(steps_.front(), source, target, context);
}

// ============================================================================
// Diagnostics
// ============================================================================

static void describe_steps(std::ostringstream& out, const std::vector<CloneStep>& steps,
                           int depth) {
    for (const auto& step : steps) {
        out << std::string(static_cast<size_t>(depth) * 2, ' ') << step.name << ": "
            << action_name(step.action) << " " << step.type->name;
        if (step.target) {
            out << " -> " << step.target->name;
        }
        if (step.deferred) {
            out << " (deferred)";
        }
        out << "\n";
        describe_steps(out, step.members, depth + 1);
    }
}

std::string describe_plan(const ClonePlan& plan) {
    std::ostringstream out;
    out << plan.type().name << " [" << shape_name(plan.shape()) << ", " << plan.step_count()
        << " steps]\n";
    describe_steps(out, plan.steps(), 1);
    return out.str();
}

} // namespace deepclone::plan
