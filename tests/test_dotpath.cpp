/**
 * @file test_dotpath.cpp
 * @brief Unit tests for dot-path field addressing (GoogleTest)
 *
 * Tests cover:
 * - split/join of field paths
 * - get_by_dot across objects and arrays, KeyError / TypeError
 * - set_by_dot with and without create_missing, including array slots
 * - contains_dot
 */

#include <gtest/gtest.h>
#include "dualform/DotPath.hpp"
#include "dualform/Errors.hpp"

using namespace dualform;

// ============================================================================
// split / join
// ============================================================================

TEST(SplitDotPath, Segments) {
    EXPECT_EQ(split_dot_path("service.options"), (std::vector<std::string>{"service", "options"}));
    EXPECT_EQ(split_dot_path("single"), (std::vector<std::string>{"single"}));
    EXPECT_TRUE(split_dot_path("").empty());
}

TEST(SplitDotPath, IgnoresEmptySegments) {
    EXPECT_EQ(split_dot_path(".a..b."), (std::vector<std::string>{"a", "b"}));
}

TEST(JoinDotPath, Segments) {
    EXPECT_EQ(join_dot_path({}), "");
    EXPECT_EQ(join_dot_path({"single"}), "single");
    EXPECT_EQ(join_dot_path({"services", "0", "options"}), "services.0.options");
}

// ============================================================================
// get_by_dot
// ============================================================================

class GetByDotTest : public ::testing::Test {
protected:
    Value doc = {
        {"name", "svc"},
        {"service", {
            {"options", R"({"opt1":"val1"})"},
            {"limits", {{"cpu", 2}}}
        }},
        {"services", {
            {{"options", {{"opt1", "first"}}}},
            {{"options", {{"opt1", "second"}}}}
        }}
    };
};

TEST_F(GetByDotTest, NestedField) {
    const Value* v = get_by_dot(doc, "service.options");
    ASSERT_NE(v, nullptr);
    EXPECT_TRUE(v->is_string());
    EXPECT_EQ(*get_by_dot(doc, "service.limits.cpu"), 2);
}

TEST_F(GetByDotTest, EmptyPathReturnsRoot) {
    EXPECT_EQ(get_by_dot(doc, ""), &doc);
}

TEST_F(GetByDotTest, ArrayElement) {
    EXPECT_EQ(*get_by_dot(doc, "services.1.options.opt1"), "second");
}

TEST_F(GetByDotTest, MissingKey) {
    try {
        get_by_dot(doc, "service.missing");
        FAIL() << "Should have thrown KeyError";
    } catch (const KeyError& e) {
        EXPECT_EQ(e.path(), "service.missing");
        EXPECT_EQ(e.segment(), "missing");
    }
}

TEST_F(GetByDotTest, BadArrayIndex) {
    EXPECT_THROW(get_by_dot(doc, "services.5"), KeyError);
    EXPECT_THROW(get_by_dot(doc, "services.first"), KeyError);
    EXPECT_THROW(get_by_dot(doc, "services.01"), KeyError);
}

TEST_F(GetByDotTest, IndexBeyondIntegerRange) {
    const std::string path = "services.99999999999999999999999";
    try {
        get_by_dot(doc, path);
        FAIL() << "Should have thrown KeyError";
    } catch (const KeyError& e) {
        EXPECT_EQ(e.segment(), "99999999999999999999999");
    }
    EXPECT_FALSE(contains_dot(doc, path));
    EXPECT_THROW(set_by_dot(doc, path, 1, false), KeyError);
}

TEST_F(GetByDotTest, TraverseIntoString) {
    try {
        get_by_dot(doc, "service.options.opt1");
        FAIL() << "Should have thrown TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.path(), "service.options.opt1");
        EXPECT_EQ(e.actual(), "string");
    }
}

// ============================================================================
// set_by_dot
// ============================================================================

TEST(SetByDot, ReplacesExistingField) {
    Value doc = {{"options", "{}"}};
    set_by_dot(doc, "options", Value{{"opt1", "v"}}, false);
    EXPECT_TRUE(doc["options"].is_object());
}

TEST(SetByDot, WithoutCreateMissing) {
    Value doc = {{"service", {{"name", "svc"}}}};
    EXPECT_THROW(set_by_dot(doc, "other.options", 1, false), KeyError);
    EXPECT_THROW(set_by_dot(doc, "service.name.x", 1, false), TypeError);
}

TEST(SetByDot, CreatesIntermediates) {
    Value doc = Value::object();
    set_by_dot(doc, "a.b.options", "x");
    EXPECT_EQ(doc["a"]["b"]["options"], "x");
}

TEST(SetByDot, OverwritesScalarIntermediateWhenCreating) {
    Value doc = {{"name", "scalar"}};
    set_by_dot(doc, "name.nested", "value", true);
    EXPECT_EQ(doc["name"]["nested"], "value");
}

TEST(SetByDot, ArraySlot) {
    Value doc = {{"services", {"a", "b"}}};
    set_by_dot(doc, "services.1", Value{{"opt1", "b"}}, false);
    EXPECT_TRUE(doc["services"][1].is_object());
    EXPECT_THROW(set_by_dot(doc, "services.2", 1, true), KeyError);
}

TEST(SetByDot, EmptyPathReplacesRoot) {
    Value doc = Value::object();
    set_by_dot(doc, "", "replaced");
    EXPECT_EQ(doc, "replaced");
}

// ============================================================================
// contains_dot
// ============================================================================

TEST(ContainsDot, ExistingAndMissing) {
    Value doc = {{"service", {{"options", "{}"}}}, {"list", {1, 2}}};
    EXPECT_TRUE(contains_dot(doc, ""));
    EXPECT_TRUE(contains_dot(doc, "service.options"));
    EXPECT_TRUE(contains_dot(doc, "list.1"));
    EXPECT_FALSE(contains_dot(doc, "service.missing"));
    EXPECT_FALSE(contains_dot(doc, "list.2"));
}

TEST(ContainsDot, ScalarTraversalRaises) {
    Value doc = {{"count", 42}};
    EXPECT_THROW(contains_dot(doc, "count.sub"), TypeError);
}
