/**
 * @file test_document.cpp
 * @brief Tests for guarded document parsing
 */

#include <gtest/gtest.h>
#include "jsonops/Document.hpp"
#include "jsonops/Errors.hpp"
#include "TestHelpers.hpp"

using namespace jsonops;
using jsonops::testing::j;

TEST(ParseDocument, ParsesObject) {
    Value v = parse_document(R"({"a": [1, 2], "b": {"c": null}})");
    EXPECT_EQ(v["a"][1], 2);
    EXPECT_TRUE(v["b"]["c"].is_null());
}

TEST(ParseDocument, KeepsMemberOrder) {
    Value v = parse_document(R"({"z": 1, "a": 2, "m": 3})");
    auto it = v.begin();
    EXPECT_EQ(it.key(), "z");
    ++it;
    EXPECT_EQ(it.key(), "a");
    ++it;
    EXPECT_EQ(it.key(), "m");
}

TEST(ParseDocument, KeepsIntegerFloatDistinction) {
    Value v = parse_document("[1, 1.0, -2, 9007199254740993]");
    EXPECT_TRUE(v[0].is_number_integer());
    EXPECT_TRUE(v[1].is_number_float());
    EXPECT_TRUE(v[2].is_number_integer());
    EXPECT_EQ(v[3].get<std::uint64_t>(), 9007199254740993ULL);
}

TEST(ParseDocument, ScalarRoot) {
    EXPECT_EQ(parse_document("  \"x\"  "), "x");
}

TEST(ParseDocument, EmptyInputRejected) {
    EXPECT_THROW(parse_document(""), EmptyInput);
    EXPECT_THROW(parse_document(" \n\t "), EmptyInput);
}

TEST(ParseDocument, EmptyInputNamesTheRole) {
    try {
        parse_document("", "base");
        FAIL() << "expected EmptyInput";
    } catch (const EmptyInput& e) {
        EXPECT_EQ(e.name(), "base");
        EXPECT_STREQ(e.what(), "base cannot be empty");
    }
}

TEST(ParseDocument, MalformedJsonRejected) {
    EXPECT_THROW(parse_document("{\"a\": }"), ParseError);
    EXPECT_THROW(parse_document("[1, 2"), ParseError);
    EXPECT_THROW(parse_document("{} trailing"), ParseError);
}

TEST(ParseDocument, ParseErrorMessage) {
    try {
        parse_document("{oops}", "first");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.name(), "first");
        EXPECT_EQ(std::string(e.what()).rfind("Invalid JSON in first: ", 0), 0u);
    }
}

TEST(ParseDocument, ErrorsShareBaseClass) {
    EXPECT_THROW(parse_document(""), DocumentError);
    EXPECT_THROW(parse_document("nope"), Error);
}
