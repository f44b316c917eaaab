/**
 * @file test_loader.cpp
 * @brief Tests for document loading (GoogleTest)
 *
 * Tests cover:
 * - JSON text and file loading, parse error positions
 * - TOML file loading: tables, strings, arrays, dates
 * - Extension detection and unsupported/missing files
 */

#include <gtest/gtest.h>
#include "dualform/Loader.hpp"
#include "dualform/Errors.hpp"
#include "TempFile.hpp"

using namespace dualform;
using testtypes::TempFile;

// ============================================================================
// JSON
// ============================================================================

TEST(ParseJsonText, Object) {
    Value v = parse_json_text(R"({"options": {"opt1": "val1"}})");
    ASSERT_TRUE(v.is_object());
    EXPECT_EQ(v["options"]["opt1"], "val1");
}

TEST(ParseJsonText, SyntaxErrorHasPosition) {
    try {
        parse_json_text("{\n  \"a\": ,\n}", "inline.json");
        FAIL() << "expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.origin(), "inline.json");
        EXPECT_EQ(e.line(), 2);
        EXPECT_GT(e.column(), 0);
        EXPECT_NE(e.details().find("parse_error"), std::string::npos);
    }
}

TEST(LoadJsonFile, ReadsFile) {
    TempFile f(R"({"options": "{\"opt1\": \"val1\"}"})");
    Value v = load_json_file(f.path());
    EXPECT_TRUE(v["options"].is_string());
}

TEST(LoadJsonFile, MissingFile) {
    EXPECT_THROW(load_json_file("/nonexistent/dualform.json"), FileNotFoundError);
}

TEST(LoadJsonFile, InvalidContent) {
    TempFile f("{ not json");
    try {
        load_json_file(f.path());
        FAIL() << "expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.origin(), f.path());
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadTomlFile, TableAndStringForms) {
    TempFile f(
        "name = \"svc\"\n"
        "as_string = '{\"opt1\": \"val1\"}'\n"
        "\n"
        "[as_table]\n"
        "opt1 = \"val1\"\n"
        "opt2 = \"val2\"\n",
        ".toml");

    Value v = load_toml_file(f.path());
    EXPECT_EQ(v["name"], "svc");
    EXPECT_TRUE(v["as_string"].is_string());
    EXPECT_EQ(v["as_string"], "{\"opt1\": \"val1\"}");
    ASSERT_TRUE(v["as_table"].is_object());
    EXPECT_EQ(v["as_table"]["opt2"], "val2");
}

TEST(LoadTomlFile, ScalarsAndArrays) {
    TempFile f(
        "count = 3\n"
        "ratio = 0.5\n"
        "enabled = true\n"
        "ports = [80, 443]\n"
        "day = 2024-01-15\n",
        ".toml");

    Value v = load_toml_file(f.path());
    EXPECT_EQ(v["count"], 3);
    EXPECT_DOUBLE_EQ(v["ratio"].get<double>(), 0.5);
    EXPECT_EQ(v["enabled"], true);
    ASSERT_TRUE(v["ports"].is_array());
    EXPECT_EQ(v["ports"][1], 443);
    EXPECT_EQ(v["day"], "2024-01-15");
}

TEST(LoadTomlFile, SyntaxError) {
    TempFile f("[broken\nkey = ", ".toml");
    try {
        load_toml_file(f.path());
        FAIL() << "expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_GT(e.line(), 0);
    }
}

// ============================================================================
// Auto-detection
// ============================================================================

TEST(LoadDocumentFile, DetectsByExtension) {
    TempFile json_file(R"({"k": 1})", ".json");
    TempFile toml_file("k = 1\n", ".toml");
    TempFile upper_file(R"({"k": 1})", ".JSON");

    EXPECT_EQ(load_document_file(json_file.path())["k"], 1);
    EXPECT_EQ(load_document_file(toml_file.path())["k"], 1);
    EXPECT_EQ(load_document_file(upper_file.path())["k"], 1);
}

TEST(LoadDocumentFile, UnsupportedExtension) {
    TempFile f("k: 1\n", ".yaml");
    EXPECT_THROW(load_document_file(f.path()), std::runtime_error);
}

TEST(LoadDocumentFile, MissingFile) {
    EXPECT_THROW(load_document_file("/nonexistent/doc.toml"), FileNotFoundError);
}

TEST(GetFileExtension, Lowercased) {
    EXPECT_EQ(get_file_extension("a/b/doc.JSON"), ".json");
    EXPECT_EQ(get_file_extension("doc.toml"), ".toml");
    EXPECT_EQ(get_file_extension("noext"), "");
}

TEST(TempFileHelper, NamesUniquePerTestAndInstance) {
    TempFile a("{}");
    TempFile b("{}");
    EXPECT_NE(a.path(), b.path());
    EXPECT_NE(a.path().find("TempFileHelper_NamesUniquePerTestAndInstance"), std::string::npos);
}
