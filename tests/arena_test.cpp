#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "forge/arena.hpp"

using forge::Arena;
using forge::ArenaIdx;

TEST(Arena, AllocGetFree){
    Arena<std::string> a;
    ArenaIdx x = a.alloc("x");
    ArenaIdx y = a.alloc("y");
    EXPECT_EQ(a.size(), 2u);
    EXPECT_EQ(a.get(x), "x");
    EXPECT_EQ(a.get(y), "y");

    std::string out = a.free(x);
    EXPECT_EQ(out, "x");
    EXPECT_FALSE(a.contains(x));
    EXPECT_TRUE(a.contains(y));
    EXPECT_EQ(a.size(), 1u);
}

TEST(Arena, StaleIndexIsRejected){
    Arena<int> a;
    ArenaIdx x = a.alloc(1);
    (void)a.free(x);
    ArenaIdx z = a.alloc(2);
    // the slot is reused under a new generation
    EXPECT_EQ(z.slot, x.slot);
    EXPECT_NE(z, x);
    EXPECT_THROW(a.get(x), std::out_of_range);
    EXPECT_THROW((void)a.free(x), std::out_of_range);
    EXPECT_EQ(a.get(z), 2);
}

TEST(Arena, DefaultIndexIsInvalid){
    Arena<int> a;
    ArenaIdx none;
    EXPECT_FALSE(none.valid());
    EXPECT_FALSE(a.contains(none));
    EXPECT_TRUE(a.empty());
}

TEST(Arena, ReferencesSurviveGrowth){
    Arena<int> a;
    ArenaIdx first = a.alloc(42);
    int& ref = a.get(first);
    for(int i = 0; i < 1000; ++i) a.alloc(i);
    EXPECT_EQ(ref, 42);
    ref = 7;
    EXPECT_EQ(a.get(first), 7);
}
