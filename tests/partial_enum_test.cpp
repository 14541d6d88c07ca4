#include <gtest/gtest.h>

#include <string>

#include "forge/partial.hpp"
#include "test_env.hpp"
#include "test_types.hpp"

using namespace forge;
using namespace forge_test;

TEST(PartialEnum, StructVariant){
    TypedPartial<Command> p;
    p->select_variant_named("Move").set_field("x", int32_t(1)).set_field("y", int32_t(-2));
    EXPECT_EQ(p->selected_variant(), std::optional<size_t>(1));
    Command c = p.build();
    ASSERT_EQ(c.tag, 1);
    EXPECT_EQ(c.mv.x, 1);
    EXPECT_EQ(c.mv.y, -2);
}

TEST(PartialEnum, TupleVariant){
    TypedPartial<Command> p;
    p->select_variant(2).begin_nth_field(0).set(std::string("hello")).end();
    Command c = p.build();
    ASSERT_EQ(c.tag, 2);
    EXPECT_EQ(c.text, "hello");
}

TEST(PartialEnum, UnitVariantIsComplete){
    TypedPartial<Command> p;
    p->select_variant_named("Quit");
    EXPECT_EQ(p.build().tag, 0);
}

TEST(PartialEnum, UnknownVariants){
    Partial p = Partial::alloc<Command>();
    auto e = capture_error([&]{ p.select_variant_named("Jump"); });
    EXPECT_EQ(e.kind, ErrorKind::NoSuchVariant);
    EXPECT_EQ(e.hint, "available: Quit Move Write");

    Partial q = Partial::alloc<Command>();
    EXPECT_EQ(capture_error([&]{ q.select_variant(3); }).kind, ErrorKind::VariantIndexOutOfBounds);
}

TEST(PartialEnum, FieldBeforeVariantIsRejected){
    Partial p = Partial::alloc<Command>();
    EXPECT_EQ(capture_error([&]{ p.begin_field("x"); }).kind, ErrorKind::InvariantViolation);
}

TEST(PartialEnum, FieldsAreScopedToTheVariant){
    Partial p = Partial::alloc<Command>();
    p.select_variant_named("Move");
    auto e = capture_error([&]{ p.set_field("0", std::string("nope")); });
    EXPECT_EQ(e.kind, ErrorKind::NoSuchField);
    EXPECT_EQ(e.hint, "available: x y");
}

TEST(PartialEnum, SwitchingVariantResetsFields){
    TypedPartial<Command> p;
    p->select_variant_named("Write").set_field("0", std::string("discard me"));
    p->select_variant_named("Move").set_field("x", int32_t(5));
    EXPECT_FALSE(p->is_field_set(1));
    p->set_field("y", int32_t(6));
    Command c = p.build();
    ASSERT_EQ(c.tag, 1);
    EXPECT_EQ(c.mv.x, 5);
}

TEST(PartialEnum, ReselectingKeepsProgress){
    TypedPartial<Command> p;
    p->select_variant_named("Move").set_field("x", int32_t(1));
    p->select_variant_named("Move");
    EXPECT_TRUE(p->is_field_set(0));
    p->set_field("y", int32_t(2));
    EXPECT_EQ(p.build().mv.x, 1);
}

TEST(PartialEnum, IncompleteVariantNamesMissingField){
    Partial p = Partial::alloc<Command>();
    p.select_variant_named("Move").set_field("x", int32_t(1));
    auto e = capture_error([&]{ p.build(); });
    EXPECT_EQ(e.kind, ErrorKind::NotFullyInitialized);
    EXPECT_NE(e.message.find("y"), std::string::npos);
}

TEST(PartialEnum, NoVariantSelected){
    Partial p = Partial::alloc<Command>();
    auto e = capture_error([&]{ p.build(); });
    EXPECT_EQ(e.kind, ErrorKind::NotFullyInitialized);
    EXPECT_NE(e.message.find("Command"), std::string::npos);
}

TEST(PartialEnum, DefaultIsFirstVariant){
    TypedPartial<Command> p;
    p->set_default();
    EXPECT_EQ(p->selected_variant(), std::optional<size_t>(0));
    EXPECT_EQ(p.build().tag, 0);
}

TEST(PartialEnum, EditingAWholeValue){
    Command src;
    src.tag = 1;
    src.mv = MovePayload{3, 4};
    TypedPartial<Command> p;
    p->set(std::move(src));
    // a whole value can still be edited field by field
    p->set_field("y", int32_t(40));
    Command c = p.build();
    EXPECT_EQ(c.mv.x, 3);
    EXPECT_EQ(c.mv.y, 40);
}

TEST(PartialEnum, SelectVariantOnStructIsWrongKind){
    Partial p = Partial::alloc<Point>();
    EXPECT_EQ(capture_error([&]{ p.select_variant(0); }).kind, ErrorKind::WrongKind);
}
