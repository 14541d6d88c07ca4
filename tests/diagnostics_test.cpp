#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "forge/diagnostics_json.hpp"
#include "forge/env.hpp"
#include "forge/partial.hpp"
#include "forge/shape.hpp"
#include "test_env.hpp"
#include "test_types.hpp"

using namespace forge;
using namespace forge_test;

TEST(Diagnostics, CodesAndNames){
    EXPECT_STREQ(error_code(ErrorKind::ShapeMismatch), "E2001");
    EXPECT_STREQ(error_code(ErrorKind::NotFullyInitialized), "E2011");
    EXPECT_STREQ(error_code(ErrorKind::ParseFailed), "E2015");
    EXPECT_STREQ(error_kind_name(ErrorKind::WrongKind), "WrongKind");
    build_error e(ErrorKind::NoDefault, "no default");
    EXPECT_STREQ(e.code(), "E2008");
}

TEST(Diagnostics, WhatCarriesPathAndHint){
    build_error bare(ErrorKind::Unsized, "str has no size");
    EXPECT_STREQ(bare.what(), "E2010 Unsized: str has no size");

    build_error full(ErrorKind::NoSuchVariant, "no variant 'Jump'", "available: Quit Move");
    full.set_path("Command");
    EXPECT_STREQ(full.what(), "E2004 NoSuchVariant at Command: no variant 'Jump' (hint: available: Quit Move)");
    EXPECT_EQ(full.message, "no variant 'Jump'");
}

TEST(Diagnostics, JsonEscape){
    EXPECT_EQ(json_escape("plain"), "\"plain\"");
    EXPECT_EQ(json_escape("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(json_escape("line\nnext\t"), "\"line\\nnext\\t\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
    // invalid UTF-8 becomes U+FFFD
    EXPECT_EQ(json_escape(std::string("a\xff", 2)), "\"a\xEF\xBF\xBD\"");
}

TEST(Diagnostics, ErrorToJson){
    build_error e(ErrorKind::ShapeMismatch, "expected i32, got \"String\"");
    e.set_path("Outer.items[0]");
    EXPECT_EQ(error_to_json(e),
              "{\"code\":\"E2001\",\"kind\":\"ShapeMismatch\","
              "\"message\":\"expected i32, got \\\"String\\\"\","
              "\"hint\":\"\",\"path\":\"Outer.items[0]\"}");
}

TEST(Diagnostics, JsonPrintedOnlyWhenEnabled){
    build_error e(ErrorKind::Poisoned, "builder is poisoned");
    BuildEnv off;
    testing::internal::CaptureStderr();
    maybe_print_json(e, off);
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");

    BuildEnv on;
    on.diag_json = true;
    testing::internal::CaptureStderr();
    maybe_print_json(e, on);
    std::string out = testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("\"kind\":\"Poisoned\""), std::string::npos);
}

TEST(Diagnostics, DetectEnvDefaults){
    BuildEnv e = detect_env();
    EXPECT_FALSE(e.trace);
    EXPECT_FALSE(e.check_invariants);
    EXPECT_EQ(e.lookup_threshold, kLookupThreshold);
}

TEST(Diagnostics, DetectEnvReadsVariables){
    ScopedEnv trace("FORGE_TRACE", "1");
    ScopedEnv json("FORGE_DIAG_JSON", "1");
    ScopedEnv inv("FORGE_CHECK_INVARIANTS", "0");
    ScopedEnv threshold("FORGE_LOOKUP_THRESHOLD", "3");
    BuildEnv e = detect_env();
    EXPECT_TRUE(e.trace);
    EXPECT_TRUE(e.diag_json);
    EXPECT_FALSE(e.check_invariants);
    EXPECT_EQ(e.lookup_threshold, 3u);
}

TEST(Diagnostics, InvalidThresholdIgnored){
    {
        ScopedEnv threshold("FORGE_LOOKUP_THRESHOLD", "lots");
        EXPECT_EQ(detect_env().lookup_threshold, kLookupThreshold);
    }
    {
        ScopedEnv threshold("FORGE_LOOKUP_THRESHOLD", "0");
        EXPECT_EQ(detect_env().lookup_threshold, kLookupThreshold);
    }
}

TEST(Diagnostics, BuilderPicksUpEnvironment){
    ScopedEnv inv("FORGE_CHECK_INVARIANTS", "1");
    Partial p = Partial::alloc<Point>();
    EXPECT_TRUE(p.env().check_invariants);
}

TEST(Diagnostics, PoisonAttachesPathAndPrintsJson){
    ScopedEnv json("FORGE_DIAG_JSON", "1");
    Partial p = Partial::alloc<Outer>();
    p.begin_field("inner");
    testing::internal::CaptureStderr();
    auto e = capture_error([&]{ p.begin_field("height"); });
    std::string out = testing::internal::GetCapturedStderr();
    EXPECT_EQ(e.path, "Outer.inner");
    EXPECT_NE(std::string(e.what()).find("at Outer.inner"), std::string::npos);
    EXPECT_NE(out.find("\"path\":\"Outer.inner\""), std::string::npos);
    EXPECT_EQ(capture_error([&]{ p.end(); }).kind, ErrorKind::Poisoned);
}

TEST(Diagnostics, DescribeShapes){
    EXPECT_EQ(describe(shape_of<int32_t>()), "i32 (scalar, size 4, align 4)");
    EXPECT_EQ(describe(shape_of<char[]>()), "str (scalar, unsized)");
}
