#include <gtest/gtest.h>

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "forge/partial.hpp"
#include "test_env.hpp"
#include "test_types.hpp"

using namespace forge;
using namespace forge_test;

TEST(PartialList, PushAndItemFrames){
    TypedPartial<std::vector<int32_t>> p;
    p->begin_list().push(int32_t(1));
    p->begin_list_item().set(int32_t(2)).end();
    p->push(int16_t(3)); // converted to i32
    std::vector<int32_t> v = p.build();
    EXPECT_EQ(v, (std::vector<int32_t>{1, 2, 3}));
}

TEST(PartialList, PushStartsTheList){
    TypedPartial<std::vector<std::string>> p;
    p->push(std::string("a")).push(std::string("b"));
    EXPECT_EQ(p.build().size(), 2u);
}

TEST(PartialList, EmptyListNeedsBegin){
    TypedPartial<std::vector<int32_t>> p;
    p->begin_list();
    EXPECT_TRUE(p.build().empty());

    Partial q = Partial::alloc<std::vector<int32_t>>();
    auto e = capture_error([&]{ q.build(); });
    EXPECT_EQ(e.kind, ErrorKind::NotFullyInitialized);
    EXPECT_NE(e.message.find("never begun"), std::string::npos);
}

TEST(PartialList, StructItemsAndPath){
    Partial p = Partial::alloc<std::vector<Point>>();
    p.begin_list_item().set_field("x", int32_t(1)).set_field("y", int32_t(2)).end();
    p.begin_list_item();
    EXPECT_EQ(p.path(), "Vec<Point>[1]");
    p.set_field("x", int32_t(3));
    auto e = capture_error([&]{ p.end(); });
    EXPECT_EQ(e.kind, ErrorKind::NotFullyInitialized);
    EXPECT_EQ(e.path, "Vec<Point>[1]");
}

TEST(PartialList, WrongElementShape){
    Partial p = Partial::alloc<std::vector<int32_t>>();
    EXPECT_EQ(capture_error([&]{ p.push(std::string("x")); }).kind, ErrorKind::ShapeMismatch);

    Partial q = Partial::alloc<Point>();
    EXPECT_EQ(capture_error([&]{ q.begin_list(); }).kind, ErrorKind::WrongKind);
}

TEST(PartialList, ExistingListIsExtended){
    TypedPartial<std::vector<int32_t>> p;
    p->set(std::vector<int32_t>{7, 8});
    p->push(int32_t(9));
    EXPECT_EQ(p.build(), (std::vector<int32_t>{7, 8, 9}));
}

TEST(PartialSet, InsertsDeduplicate){
    TypedPartial<std::set<int32_t>> p;
    p->begin_set().push(int32_t(3)).push(int32_t(1)).push(int32_t(3));
    p->begin_set_item().set(int32_t(2)).end();
    EXPECT_EQ(p.build(), (std::set<int32_t>{1, 2, 3}));
}

TEST(PartialMap, InsertAndFrames){
    TypedPartial<std::map<std::string, int32_t>> p;
    p->begin_map();
    p->insert(std::string("a"), int32_t(1));
    p->begin_key().set(std::string("b")).end();
    p->begin_value().set(int32_t(2)).end();
    p->insert(std::string("a"), int32_t(5));
    auto m = p.build();
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m["a"], 5);
    EXPECT_EQ(m["b"], 2);
}

TEST(PartialMap, ValueNeedsKey){
    Partial p = Partial::alloc<std::map<std::string, int32_t>>();
    p.begin_map();
    EXPECT_EQ(capture_error([&]{ p.begin_value(); }).kind, ErrorKind::InvariantViolation);
}

TEST(PartialMap, PendingKeyBlocksCompletion){
    Partial p = Partial::alloc<std::unordered_map<int32_t, std::string>>();
    p.set_key(int32_t(4));
    auto e = capture_error([&]{ p.build(); });
    EXPECT_EQ(e.kind, ErrorKind::NotFullyInitialized);
}

TEST(PartialMap, SecondKeyWhilePending){
    Partial p = Partial::alloc<std::map<int32_t, int32_t>>();
    p.set_key(int32_t(1));
    EXPECT_EQ(capture_error([&]{ p.set_key(int32_t(2)); }).kind, ErrorKind::InvariantViolation);
}

TEST(PartialMap, PendingEntriesAreReleased){
    Tracked::reset();
    {
        Partial p = Partial::alloc<std::map<Tracked, Tracked>>();
        p.insert(Tracked(1), Tracked(10));
        p.begin_key().set(Tracked(2)).end();
        p.begin_value().set(Tracked(20));
        EXPECT_GT(Tracked::live, 0);
    }
    EXPECT_EQ(Tracked::live, 0);
}

TEST(PartialMap, StructValues){
    TypedPartial<std::map<std::string, Point>> p;
    p->begin_map().set_key(std::string("origin"));
    p->begin_value().set_default().end();
    p->set_key(std::string("p"));
    p->begin_value();
    EXPECT_EQ(p->path(), "Map<String, Point>{value}");
    p->set_field("x", int32_t(1)).set_field("y", int32_t(1)).end();
    auto m = p.build();
    EXPECT_EQ(m.at("p").x, 1);
    EXPECT_EQ(m.at("origin").y, 0);
}

TEST(PartialSlice, BuilderCollectsItems){
    TypedPartial<IntSlice> p;
    p->begin_list().push(int32_t(4));
    p->begin_list_item().set(int32_t(5)).end();
    IntSlice s = p.build();
    ASSERT_EQ(s.len, 2u);
    EXPECT_EQ(s.data[0], 4);
    EXPECT_EQ(s.data[1], 5);
}

TEST(PartialSlice, EmptySliceAndMisuse){
    TypedPartial<IntSlice> p;
    p->begin_list();
    EXPECT_EQ(p.build().len, 0u);

    Partial q = Partial::alloc<IntSlice>();
    EXPECT_EQ(capture_error([&]{ q.begin_pointer_inner(); }).kind, ErrorKind::WrongKind);

    // dropped mid-build: the builder is freed with the frame
    Partial r = Partial::alloc<IntSlice>();
    r.begin_list().push(int32_t(1)).begin_list_item();
}
