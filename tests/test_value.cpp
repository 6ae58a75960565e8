/**
 * @file test_value.cpp
 * @brief Tests for variant classification and structural equality
 */

#include <gtest/gtest.h>
#include "jsonops/Value.hpp"
#include "jsonops/Errors.hpp"
#include "TestHelpers.hpp"

using namespace jsonops;
using jsonops::testing::j;

// ============================================================================
// kind_of
// ============================================================================

TEST(KindOf, Scalars) {
    EXPECT_EQ(kind_of(Value(nullptr)), Kind::Null);
    EXPECT_EQ(kind_of(Value(true)), Kind::Boolean);
    EXPECT_EQ(kind_of(Value("text")), Kind::String);
}

TEST(KindOf, AllNumberStoragesAreNumber) {
    EXPECT_EQ(kind_of(Value(-3)), Kind::Number);
    EXPECT_EQ(kind_of(Value(3u)), Kind::Number);
    EXPECT_EQ(kind_of(Value(2.5)), Kind::Number);
}

TEST(KindOf, Containers) {
    EXPECT_EQ(kind_of(Value::array()), Kind::Array);
    EXPECT_EQ(kind_of(Value::object()), Kind::Object);
}

TEST(KindOf, BinaryIsUnsupported) {
    Value bin = Value::binary({0x01, 0x02});
    EXPECT_THROW(kind_of(bin), UnsupportedValue);
}

TEST(KindName, Names) {
    EXPECT_STREQ(kind_name(Kind::Null), "null");
    EXPECT_STREQ(kind_name(Kind::Number), "number");
    EXPECT_STREQ(kind_name(Kind::Object), "object");
}

// ============================================================================
// type_name
// ============================================================================

TEST(TypeName, DistinguishesIntegerAndFloat) {
    EXPECT_EQ(type_name(j("1")), "integer");
    EXPECT_EQ(type_name(j("-1")), "integer");
    EXPECT_EQ(type_name(j("1.0")), "float");
    EXPECT_EQ(type_name(j("\"s\"")), "string");
    EXPECT_EQ(type_name(j("[]")), "array");
    EXPECT_EQ(type_name(j("{}")), "object");
    EXPECT_EQ(type_name(j("null")), "null");
    EXPECT_EQ(type_name(j("false")), "boolean");
}

// ============================================================================
// structurally_equal
// ============================================================================

TEST(StructurallyEqual, IgnoresMemberOrder) {
    EXPECT_TRUE(structurally_equal(j(R"({"a":1,"b":2})"), j(R"({"b":2,"a":1})")));
}

TEST(StructurallyEqual, NumbersCompareByValue) {
    EXPECT_TRUE(structurally_equal(j("1"), j("1.0")));
    EXPECT_FALSE(structurally_equal(j("1"), j("2")));
}

TEST(StructurallyEqual, ArrayOrderMatters) {
    EXPECT_FALSE(structurally_equal(j("[1,2]"), j("[2,1]")));
}

TEST(StructurallyEqual, DifferentKindsDiffer) {
    EXPECT_FALSE(structurally_equal(j("1"), j("\"1\"")));
    EXPECT_FALSE(structurally_equal(j("{}"), j("[]")));
    EXPECT_FALSE(structurally_equal(j("null"), j("false")));
}

TEST(StructurallyEqual, Nested) {
    EXPECT_TRUE(structurally_equal(j(R"({"a":[{"x":1,"y":[true]}]})"),
                                   j(R"({"a":[{"y":[true],"x":1}]})")));
    EXPECT_FALSE(structurally_equal(j(R"({"a":[{"x":1}]})"), j(R"({"a":[{"x":1,"y":2}]})")));
}
