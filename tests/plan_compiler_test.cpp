// Clone plan compiler tests
//
// Step selection per slot type, plan shapes, diagnostics output and the
// compile-time failure modes.

#include "test_types.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace deepclone;
using namespace deepclone::plan;
using namespace fixtures;
using deepclone::reflect::type_of;

namespace {

const CloneStep* find_step(const ClonePlan& plan, const std::string& name) {
    for (const auto& step : plan.steps()) {
        if (step.name == name) {
            return &step;
        }
    }
    return nullptr;
}

} // namespace

// ============================================================================
// Class plans
// ============================================================================

TEST(PlanCompilerTest, ClassPlanHasOneStepPerField) {
    auto plan = compile_plan(type_of<Person>());

    EXPECT_EQ(plan->shape(), PlanShape::Class);
    EXPECT_EQ(&plan->type(), &type_of<Person>());
    ASSERT_EQ(plan->steps().size(), 6u);
    EXPECT_EQ(plan->steps()[0].name, "name");
    EXPECT_EQ(plan->steps()[5].name, "best_friend");
}

TEST(PlanCompilerTest, StepActionsFollowSlotTypes) {
    auto plan = compile_plan(type_of<WithCallbacks>());

    EXPECT_EQ(find_step(*plan, "marker")->action, StepAction::Copy);
    EXPECT_EQ(find_step(*plan, "on_change")->action, StepAction::Reset);
    EXPECT_EQ(find_step(*plan, "transform")->action, StepAction::Reset);
    EXPECT_EQ(find_step(*plan, "anything")->action, StepAction::Reference);
    EXPECT_EQ(find_step(*plan, "fixed")->action, StepAction::Reset);
}

TEST(PlanCompilerTest, StringsAndEnumsAreCopied) {
    auto plan = compile_plan(type_of<Person>());

    EXPECT_EQ(find_step(*plan, "name")->action, StepAction::Copy);
    EXPECT_EQ(find_step(*plan, "favorite")->action, StepAction::Copy);
    EXPECT_EQ(find_step(*plan, "nickname")->action, StepAction::Copy);
    EXPECT_EQ(find_step(*plan, "timeout")->action, StepAction::Copy);
}

TEST(PlanCompilerTest, FinalTargetIsResolvedStatically) {
    auto plan = compile_plan(type_of<Drawing>());

    const CloneStep* badge = find_step(*plan, "badge");
    ASSERT_NE(badge, nullptr);
    EXPECT_EQ(badge->action, StepAction::Reference);
    EXPECT_EQ(badge->target, &type_of<Circle>());

    const CloneStep* main = find_step(*plan, "main");
    ASSERT_NE(main, nullptr);
    EXPECT_EQ(main->target, nullptr);
}

TEST(PlanCompilerTest, InheritedFieldsComeFirst) {
    auto plan = compile_plan(type_of<Square>());

    ASSERT_EQ(plan->steps().size(), 3u);
    EXPECT_EQ(plan->steps()[0].name, "label");
    EXPECT_EQ(plan->steps()[1].name, "side");
    EXPECT_EQ(plan->steps()[2].name, "inset");
}

TEST(PlanCompilerTest, ValueFieldOnlyExpandsDeepMembers) {
    auto plan = compile_plan(type_of<Inventory>());

    EXPECT_EQ(find_step(*plan, "ids")->action, StepAction::Copy);
    EXPECT_EQ(find_step(*plan, "corners")->action, StepAction::Copy);

    const CloneStep* holders = find_step(*plan, "holders");
    ASSERT_NE(holders, nullptr);
    EXPECT_EQ(holders->action, StepAction::Value);
    ASSERT_EQ(holders->members.size(), 1u);

    const CloneStep& element = holders->members[0];
    EXPECT_EQ(element.action, StepAction::Value);
    // Holder: only `node` needs a step; `id` and `where` ride on the copy.
    ASSERT_EQ(element.members.size(), 1u);
    EXPECT_EQ(element.members[0].name, "node");
    EXPECT_EQ(element.members[0].action, StepAction::Reference);
}

TEST(PlanCompilerTest, ContainerFieldsCompileKeyAndElementSteps) {
    auto plan = compile_plan(type_of<Catalog>());

    EXPECT_EQ(find_step(*plan, "labels")->action, StepAction::Copy);
    EXPECT_EQ(find_step(*plan, "limit")->action, StepAction::Copy);

    const CloneStep* by_name = find_step(*plan, "by_name");
    ASSERT_NE(by_name, nullptr);
    EXPECT_EQ(by_name->action, StepAction::Value);
    ASSERT_EQ(by_name->members.size(), 2u);
    EXPECT_EQ(by_name->members[0].name, "key");
    EXPECT_EQ(by_name->members[0].action, StepAction::Copy);
    EXPECT_EQ(by_name->members[1].name, "[]");
    EXPECT_EQ(by_name->members[1].action, StepAction::Reference);

    const CloneStep* ranks = find_step(*plan, "ranks");
    ASSERT_EQ(ranks->members.size(), 2u);
    EXPECT_EQ(ranks->members[0].action, StepAction::Reference);
    EXPECT_EQ(ranks->members[1].action, StepAction::Copy);

    const CloneStep* members = find_step(*plan, "members");
    ASSERT_EQ(members->members.size(), 1u);
    EXPECT_EQ(members->members[0].action, StepAction::Reference);
}

TEST(PlanCompilerTest, OptionalAndPairExpandLikeValues) {
    auto plan = compile_plan(type_of<Catalog>());

    const CloneStep* pinned = find_step(*plan, "pinned");
    ASSERT_NE(pinned, nullptr);
    EXPECT_EQ(pinned->action, StepAction::Value);
    ASSERT_EQ(pinned->members.size(), 1u);
    EXPECT_EQ(pinned->members[0].type, &type_of<Holder>());
    EXPECT_EQ(pinned->members[0].action, StepAction::Value);

    // The string half of the pair rides on the initial copy.
    const CloneStep* primary = find_step(*plan, "primary");
    ASSERT_EQ(primary->members.size(), 1u);
    EXPECT_EQ(primary->members[0].name, "second");
    EXPECT_EQ(primary->members[0].action, StepAction::Reference);
}

// ============================================================================
// Array and value plans
// ============================================================================

TEST(PlanCompilerTest, ArrayOfPrimitivesIsBlockCopied) {
    auto plan = compile_plan(type_of<Array<int>>());

    EXPECT_EQ(plan->shape(), PlanShape::Array);
    ASSERT_EQ(plan->steps().size(), 1u);
    EXPECT_EQ(plan->steps()[0].action, StepAction::Copy);
}

TEST(PlanCompilerTest, ArrayOfReferencesClonesElements) {
    auto plan = compile_plan(type_of<Array<Ref<Node>>>());

    ASSERT_EQ(plan->steps().size(), 1u);
    EXPECT_EQ(plan->steps()[0].action, StepAction::Reference);
}

TEST(PlanCompilerTest, StructPlanIsValueShaped) {
    auto plan = compile_plan(type_of<Outer>());

    EXPECT_EQ(plan->shape(), PlanShape::Value);
    ASSERT_EQ(plan->steps().size(), 1u);
    const CloneStep& root = plan->steps()[0];
    EXPECT_EQ(root.action, StepAction::Value);
    ASSERT_EQ(root.members.size(), 1u);
    EXPECT_EQ(root.members[0].name, "inner");
    EXPECT_EQ(plan->step_count(), 3u);
}

TEST(PlanCompilerTest, RecursiveValueTypeDefersInnerSteps) {
    auto plan = compile_plan(type_of<TreeValue>());

    const CloneStep& root = plan->steps()[0];
    ASSERT_EQ(root.members.size(), 2u);
    EXPECT_EQ(root.members[0].name, "link");

    const CloneStep& children = root.members[1];
    EXPECT_EQ(children.name, "children");
    ASSERT_EQ(children.members.size(), 1u);
    EXPECT_TRUE(children.members[0].deferred);
    EXPECT_EQ(children.members[0].type, &type_of<TreeValue>());
}

// ============================================================================
// Failures
// ============================================================================

TEST(PlanCompilerTest, DelegateTypeHasNoPlan) {
    EXPECT_THROW(compile_plan(type_of<Delegate<void()>>()), UnsupportedTypeError);
    EXPECT_THROW(compile_plan(type_of<std::function<void()>>()), UnsupportedTypeError);
}

TEST(PlanCompilerTest, AbstractClassHasNoPlan) {
    EXPECT_THROW(compile_plan(type_of<Shape>()), UnsupportedTypeError);
}

TEST(PlanCompilerTest, ClassWithoutFactoryHasNoPlan) {
    try {
        compile_plan(type_of<NoDefault>());
        FAIL() << "expected UnsupportedTypeError";
    } catch (const UnsupportedTypeError& e) {
        EXPECT_NE(e.type_name().find("NoDefault"), std::string::npos);
    }
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(PlanCompilerTest, DescribePlanListsEverySlot) {
    auto plan = compile_plan(type_of<Node>());
    std::string text = describe_plan(*plan);

    EXPECT_NE(text.find("fixtures::Node [class, 2 steps]"), std::string::npos);
    EXPECT_NE(text.find("  value: copy int"), std::string::npos);
    EXPECT_NE(text.find("  next: reference"), std::string::npos);
}

TEST(PlanCompilerTest, DescribePlanIndentsNestedSteps) {
    auto plan = compile_plan(type_of<Outer>());
    std::string text = describe_plan(*plan);

    EXPECT_NE(text.find("\n  value: value fixtures::Outer"), std::string::npos);
    EXPECT_NE(text.find("\n    inner: value fixtures::Holder"), std::string::npos);
    EXPECT_NE(text.find("\n      node: reference"), std::string::npos);
}
