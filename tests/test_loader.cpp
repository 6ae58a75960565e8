/**
 * @file test_loader.cpp
 * @brief Tests for document and settings file loading
 */

#include <gtest/gtest.h>
#include "jsonops/Loader.hpp"
#include "jsonops/Errors.hpp"
#include "TestHelpers.hpp"

#include <sstream>

using namespace jsonops;
using jsonops::testing::j;
using jsonops::testing::TempFile;

// ============================================================================
// Raw text
// ============================================================================

TEST(ReadTextFile, ReadsWholeFile) {
    TempFile file("jsonops_loader_text.json", "{\"a\": 1}\n");
    EXPECT_EQ(read_text_file(file.path()), "{\"a\": 1}\n");
}

TEST(ReadTextFile, MissingFile) {
    try {
        read_text_file("/nonexistent/jsonops.json");
        FAIL() << "expected FileNotFoundError";
    } catch (const FileNotFoundError& e) {
        EXPECT_EQ(e.path(), "/nonexistent/jsonops.json");
    }
}

TEST(ReadStream, ReadsEverything) {
    std::istringstream in("line one\nline two");
    EXPECT_EQ(read_stream(in), "line one\nline two");
}

// ============================================================================
// Documents
// ============================================================================

TEST(LoadDocumentFile, ParsesJson) {
    TempFile file("jsonops_loader_doc.json", R"({"z": [1, 2], "a": null})");
    Value v = load_document_file(file.path(), "data");
    EXPECT_EQ(v, j(R"({"z": [1, 2], "a": null})"));
    EXPECT_EQ(v.begin().key(), "z");
}

TEST(LoadDocumentFile, ErrorsNameTheRole) {
    TempFile file("jsonops_loader_bad.json", "{\"a\":");
    try {
        load_document_file(file.path(), "base");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.name(), "base");
    }
}

TEST(LoadDocumentFile, EmptyFile) {
    TempFile file("jsonops_loader_empty.json", "");
    EXPECT_THROW(load_document_file(file.path(), "data"), EmptyInput);
}

TEST(LoadDocumentFile, LimitsApplied) {
    TempFile file("jsonops_loader_deep.json", "[[[1]]]");
    Limits limits;
    limits.max_depth = 2;
    EXPECT_THROW(load_document_file(file.path(), "data", limits), NestingTooDeep);

    limits = Limits{};
    limits.max_input_bytes = 3;
    EXPECT_THROW(load_document_file(file.path(), "data", limits), InputTooLarge);
}

// ============================================================================
// Settings files
// ============================================================================

TEST(LoadSettingsFile, Json) {
    TempFile file("jsonops_loader_settings.json", R"({"format": {"indent": 4}})");
    EXPECT_EQ(load_settings_file(file.path()), j(R"({"format": {"indent": 4}})"));
}

TEST(LoadSettingsFile, Toml) {
    TempFile file("jsonops_loader_settings.toml",
                  "title = \"ops\"\n"
                  "ratio = 0.5\n"
                  "\n"
                  "[limits]\n"
                  "max_depth = 10\n"
                  "tags = [\"a\", \"b\"]\n"
                  "\n"
                  "[format]\n"
                  "sort_keys = true\n");
    Value v = load_settings_file(file.path());
    EXPECT_EQ(v["title"], "ops");
    EXPECT_DOUBLE_EQ(v["ratio"].get<double>(), 0.5);
    EXPECT_EQ(v["limits"]["max_depth"], 10);
    EXPECT_EQ(v["limits"]["tags"], j(R"(["a", "b"])"));
    EXPECT_EQ(v["format"]["sort_keys"], true);
}

TEST(LoadSettingsFile, UnsupportedExtension) {
    TempFile file("jsonops_loader_settings.yaml", "format:\n  indent: 2\n");
    EXPECT_THROW(load_settings_file(file.path()), SettingsError);
}

TEST(LoadSettingsFile, InvalidJson) {
    TempFile file("jsonops_loader_invalid.json", "{\"format\": ");
    EXPECT_THROW(load_settings_file(file.path()), SettingsError);
}

TEST(LoadSettingsFile, InvalidToml) {
    TempFile file("jsonops_loader_invalid.toml", "[format\nindent = 2\n");
    EXPECT_THROW(load_settings_file(file.path()), SettingsError);
}

TEST(LoadSettingsFile, MissingFile) {
    EXPECT_THROW(load_settings_file("/nonexistent/jsonops.toml"), FileNotFoundError);
}

TEST(ParseToml, DatesBecomeStrings) {
    Value v = parse_toml("released = 1979-05-27\n");
    EXPECT_EQ(v["released"], "1979-05-27");
}

TEST(ParseToml, ArrayOfTables) {
    Value v = parse_toml("[[profile]]\nname = \"a\"\n\n[[profile]]\nname = \"b\"\n");
    ASSERT_TRUE(v["profile"].is_array());
    EXPECT_EQ(v["profile"][1]["name"], "b");
}

TEST(ParseToml, ErrorMentionsSource) {
    try {
        parse_toml("= 1\n", "inline.toml");
        FAIL() << "expected SettingsError";
    } catch (const SettingsError& e) {
        EXPECT_NE(std::string(e.what()).find("inline.toml"), std::string::npos);
    }
}

TEST(GetFileExtension, Lowercased) {
    EXPECT_EQ(get_file_extension("dir/Settings.TOML"), ".toml");
    EXPECT_EQ(get_file_extension("a.json"), ".json");
    EXPECT_EQ(get_file_extension("noext"), "");
}
