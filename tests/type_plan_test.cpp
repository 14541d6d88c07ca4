#include <gtest/gtest.h>

#include <string>

#include "forge/partial.hpp"
#include "forge/type_plan.hpp"
#include "test_env.hpp"
#include "test_types.hpp"

using namespace forge;
using namespace forge_test;

TEST(TypePlan, MirrorsStructShape){
    auto plan = TypePlan::build(shape_of<Outer>());
    const PlanNode& root = plan->node(plan->root());
    EXPECT_EQ(root.kind, PlanKind::Struct);
    EXPECT_EQ(&plan->shape(), &shape_of<Outer>());
    ASSERT_EQ(root.fields.size(), 4u);
    EXPECT_FALSE(root.fields[2].is_required); // optional note
    EXPECT_TRUE(root.fields[3].has_default);

    const PlanNode& inner = plan->resolve(root.fields[0].child);
    EXPECT_EQ(inner.kind, PlanKind::Struct);
    EXPECT_EQ(inner.lookup.find("w"), std::optional<size_t>(1));
    EXPECT_EQ(inner.lookup.find("weight"), std::optional<size_t>(1));
    EXPECT_FALSE(inner.lookup.find("nope").has_value());

    const PlanNode& items = plan->resolve(root.fields[1].child);
    EXPECT_EQ(items.kind, PlanKind::List);
    EXPECT_EQ(plan->node(items.elem).kind, PlanKind::Scalar);
}

TEST(TypePlan, RecursionBecomesBackRef){
    auto plan = TypePlan::build(shape_of<Node>());
    const PlanNode& root = plan->node(plan->root());
    const PlanNode& children = plan->resolve(root.fields[1].child);
    ASSERT_EQ(children.kind, PlanKind::List);
    const PlanNode& back = plan->node(children.elem);
    EXPECT_EQ(back.kind, PlanKind::BackRef);
    EXPECT_EQ(back.target, plan->root());
    EXPECT_EQ(plan->resolve_id(children.elem), plan->root());
    EXPECT_NE(plan->dump().find("backref Node"), std::string::npos);
}

TEST(TypePlan, LookupSwitchesToSortedAboveThreshold){
    auto wide = TypePlan::build(shape_of<Wide>());
    EXPECT_TRUE(wide->node(wide->root()).lookup.is_sorted());
    auto point = TypePlan::build(shape_of<Point>());
    EXPECT_FALSE(point->node(point->root()).lookup.is_sorted());
    auto tight = TypePlan::build(shape_of<Point>(), 2);
    EXPECT_TRUE(tight->node(tight->root()).lookup.is_sorted());
    EXPECT_EQ(tight->lookup_threshold(), 2u);
}

TEST(TypePlan, NameLookupBothModes){
    NameLookup linear({{"b", 0}, {"a", 1}}, 8);
    NameLookup sorted({{"b", 0}, {"a", 1}}, 1);
    EXPECT_FALSE(linear.is_sorted());
    EXPECT_TRUE(sorted.is_sorted());
    for(const NameLookup* l : {&linear, &sorted}){
        EXPECT_EQ(l->find("a"), std::optional<size_t>(1));
        EXPECT_EQ(l->find("b"), std::optional<size_t>(0));
        EXPECT_FALSE(l->find("c").has_value());
    }
}

TEST(TypePlan, EnumVariantsAreIndexed){
    auto plan = TypePlan::build(shape_of<Command>(), 1);
    const PlanNode& root = plan->node(plan->root());
    ASSERT_EQ(root.variants.size(), 3u);
    EXPECT_EQ(root.variant_lookup.find("Write"), std::optional<size_t>(2));
    EXPECT_EQ(root.variants[1].lookup.find("y"), std::optional<size_t>(1));
}

TEST(TypePlan, PartialUsesPlanLookups){
    auto plan = TypePlan::build(shape_of<Wide>());
    TypedPartial<Wide> p(plan);
    p->set_field("f9", int32_t(9)).set_field("f0", int32_t(1));
    auto e = capture_error([&]{ p->begin_field("f10"); });
    EXPECT_EQ(e.kind, ErrorKind::NoSuchField);

    TypedPartial<Wide> q(plan);
    for(int i = 9; i >= 0; --i) q->set_field("f" + std::to_string(i), int32_t(i));
    Wide w = q.build();
    EXPECT_EQ(w.f9, 9);
    EXPECT_EQ(w.f3, 3);
}

TEST(TypePlan, PartialFollowsBackRefs){
    auto plan = TypePlan::build(shape_of<Node>());
    TypedPartial<Node> p(plan);
    p->set_field("value", int32_t(1));
    p->begin_field("children").begin_list_item();
    p->set_field("value", int32_t(2));
    p->begin_field("children").begin_list_item().set_field("value", int32_t(3)).end().end();
    p->end().end();
    Node n = p.build();
    ASSERT_EQ(n.children.size(), 1u);
    ASSERT_EQ(n.children[0].children.size(), 1u);
    EXPECT_EQ(n.children[0].children[0].value, 3);
}

TEST(TypePlan, EnumSelectionThroughPlan){
    auto plan = TypePlan::build(shape_of<Command>());
    TypedPartial<Command> p(plan);
    p->select_variant_named("Move").set_field("y", int32_t(2)).set_field("x", int32_t(1));
    EXPECT_EQ(p.build().mv.x, 1);
}

TEST(TypePlan, PlanMustMatchShape){
    auto plan = TypePlan::build(shape_of<Point>());
    auto e = capture_error([&]{ Partial::alloc(shape_of<Inner>(), plan); });
    EXPECT_EQ(e.kind, ErrorKind::ShapeMismatch);
}

TEST(TypePlan, ThresholdFromEnvironment){
    ScopedEnv threshold("FORGE_LOOKUP_THRESHOLD", "2");
    auto plan = TypePlan::build(shape_of<Point>());
    EXPECT_EQ(plan->lookup_threshold(), 2u);
    EXPECT_TRUE(plan->node(plan->root()).lookup.is_sorted());

    auto explicit_plan = TypePlan::build(shape_of<Point>(), kLookupThreshold);
    EXPECT_FALSE(explicit_plan->node(explicit_plan->root()).lookup.is_sorted());
}

TEST(TypePlan, RecursionThroughOptionalBox){
    auto plan = TypePlan::build(shape_of<Chain>());
    const PlanNode& root = plan->node(plan->root());
    const PlanNode& opt = plan->resolve(root.fields[1].child);
    ASSERT_EQ(opt.kind, PlanKind::Option);
    const PlanNode& box = plan->resolve(opt.elem);
    ASSERT_EQ(box.kind, PlanKind::Pointer);
    const PlanNode& back = plan->node(box.elem);
    EXPECT_EQ(back.kind, PlanKind::BackRef);
    EXPECT_EQ(plan->resolve_id(box.elem), plan->root());

    TypedPartial<Chain> p(plan);
    p->set_field("value", int32_t(1));
    p->begin_field("next").begin_optional_payload().begin_pointer_inner();
    EXPECT_EQ(p->path(), "Chain.next?*");
    p->set_field("value", int32_t(2)).end().end().end();
    Chain c = p.build();
    EXPECT_EQ(c.value, 1);
    ASSERT_TRUE(c.next.has_value());
    EXPECT_EQ((*c.next)->value, 2);
    EXPECT_FALSE((*c.next)->next.has_value());
}
