/**
 * @file test_merge.cpp
 * @brief Deep merge tests
 *
 * Results are compared as minified text where member order matters.
 */

#include <gtest/gtest.h>
#include "jsonops/Merge.hpp"
#include "jsonops/Format.hpp"
#include "TestHelpers.hpp"

using namespace jsonops;
using jsonops::testing::j;

namespace {
    std::string merged(const std::string& base, const std::string& over) {
        return format(deep_merge(j(base), j(over)), 0);
    }
}

// ============================================================================
// Object + object
// ============================================================================

TEST(DeepMerge, EmptyObjects) {
    EXPECT_EQ(merged("{}", "{}"), "{}");
}

TEST(DeepMerge, DisjointKeysAppended) {
    EXPECT_EQ(merged(R"({"name":"svc"})", R"({"port":80})"), R"({"name":"svc","port":80})");
}

TEST(DeepMerge, SharedScalarKeyTakesOverride) {
    EXPECT_EQ(merged(R"({"x":1,"y":2})", R"({"y":20,"z":30})"), R"({"x":1,"y":20,"z":30})");
}

TEST(DeepMerge, OverridePrecedenceExample) {
    Value result = deep_merge(j(R"({"a":1,"nested":{"x":1,"y":2}})"),
                              j(R"({"b":2,"nested":{"y":99}})"));
    EXPECT_TRUE(structurally_equal(result, j(R"({"a":1,"b":2,"nested":{"x":1,"y":99}})")));
    EXPECT_EQ(format(result, 0), R"({"a":1,"nested":{"x":1,"y":99},"b":2})");
}

TEST(DeepMerge, SiblingsSurviveNestedOverride) {
    Value result = deep_merge(j(R"({"server":{"tls":{"cert":"a.pem","key":"a.key"},"workers":4}})"),
                              j(R"({"server":{"tls":{"key":"b.key"}}})"));
    EXPECT_EQ(result["server"]["tls"]["cert"], "a.pem");
    EXPECT_EQ(result["server"]["tls"]["key"], "b.key");
    EXPECT_EQ(result["server"]["workers"], 4);
}

// ============================================================================
// Key order
// ============================================================================

TEST(DeepMerge, BaseOrderThenNewOverrideKeys) {
    EXPECT_EQ(merged(R"({"z":1,"m":2,"a":3})", R"({"q":4,"a":5,"b":6})"),
              R"({"z":1,"m":2,"a":5,"q":4,"b":6})");
}

TEST(DeepMerge, NestedKeyOrderFollowsSameRule) {
    EXPECT_EQ(merged(R"({"db":{"port":1,"host":"a"}})", R"({"db":{"user":"u","port":2}})"),
              R"({"db":{"port":2,"host":"a","user":"u"}})");
}

// ============================================================================
// Identity and determinism
// ============================================================================

TEST(DeepMerge, EmptyOverrideIsIdentity) {
    Value x = j(R"({"b":[1,2],"a":{"d":null,"c":"s"}})");
    Value result = deep_merge(x, Value::object());
    EXPECT_EQ(result, x);
    EXPECT_EQ(format(result, 0), format(x, 0));
}

TEST(DeepMerge, EmptyBaseYieldsOverride) {
    Value x = j(R"({"b":[1,2],"a":{"d":null,"c":"s"}})");
    EXPECT_EQ(format(deep_merge(Value::object(), x), 0), format(x, 0));
}

TEST(DeepMerge, Deterministic) {
    Value a = j(R"({"k":{"x":[1,{"y":2}],"z":true},"w":1.5})");
    Value b = j(R"({"k":{"x":"s","n":null},"v":[]})");
    EXPECT_EQ(format(deep_merge(a, b), 0), format(deep_merge(a, b), 0));
}

TEST(DeepMerge, InputsUnchanged) {
    Value base = j(R"({"a":{"x":1},"arr":[1,2]})");
    Value over = j(R"({"a":{"y":2},"arr":[3]})");
    const Value base_before = base;
    const Value over_before = over;
    (void)deep_merge(base, over);
    EXPECT_EQ(base, base_before);
    EXPECT_EQ(over, over_before);
}

// ============================================================================
// Override wins unless both sides are objects
// ============================================================================

TEST(DeepMerge, ScalarReplacesObject) {
    EXPECT_EQ(merged(R"({"cache":{"ttl":60}})", R"({"cache":"off"})"), R"({"cache":"off"})");
}

TEST(DeepMerge, ObjectReplacesScalar) {
    EXPECT_EQ(merged(R"({"cache":false})", R"({"cache":{"ttl":5}})"), R"({"cache":{"ttl":5}})");
}

TEST(DeepMerge, ArraysReplacedWhole) {
    EXPECT_EQ(merged(R"({"hosts":["a","b","c"]})", R"({"hosts":["z"]})"), R"({"hosts":["z"]})");
    EXPECT_EQ(merged(R"({"hosts":{"a":1}})", R"({"hosts":[1]})"), R"({"hosts":[1]})");
}

TEST(DeepMerge, NullOverrideWins) {
    EXPECT_EQ(merged(R"({"a":{"x":1}})", R"({"a":null})"), R"({"a":null})");
}

TEST(DeepMerge, NonObjectRoots) {
    EXPECT_EQ(deep_merge(j("[1,2]"), j("3")), 3);
    EXPECT_EQ(deep_merge(j(R"({"a":1})"), j("[1]")), j("[1]"));
    EXPECT_EQ(deep_merge(j("null"), j(R"({"a":1})")), j(R"({"a":1})"));
    EXPECT_TRUE(deep_merge(j(R"({"a":1})"), j("null")).is_null());
}

// ============================================================================
// deep_merge_all
// ============================================================================

TEST(DeepMergeAll, FoldsLeftToRight) {
    std::vector<Value> layers{
        j(R"({"level":"info","sinks":["stderr"]})"),
        j(R"({"level":"debug","file":{"path":"a.log"}})"),
        j(R"({"file":{"rotate":true},"sinks":["file"]})")
    };
    EXPECT_EQ(format(deep_merge_all(layers), 0),
              R"({"level":"debug","sinks":["file"],"file":{"path":"a.log","rotate":true}})");
}

TEST(DeepMergeAll, NoSourcesGivesEmptyObject) {
    Value result = deep_merge_all({});
    ASSERT_TRUE(result.is_object());
    EXPECT_TRUE(result.empty());
}

TEST(DeepMergeAll, OneSourceReturnedAsIs) {
    Value only = j(R"({"k":[1]})");
    EXPECT_EQ(deep_merge_all({only}), only);
}
