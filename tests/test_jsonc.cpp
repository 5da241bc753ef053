#include <catch2/catch.hpp>
#include "jsonc.hpp"
#include "test_helpers.hpp"
#include <string>
#include <vector>

using namespace lmcfg;

// ============================================================================
// Trailing commas
// ============================================================================

TEST_CASE("Trailing commas before closers are removed", "[jsonc]") {
    CHECK(strip_trailing_commas("{\"a\": 1,}") == "{\"a\": 1}");
    CHECK(strip_trailing_commas("[1, 2, ]") == "[1, 2 ]");
    CHECK(strip_trailing_commas("{\"a\": [1,],\n}") == "{\"a\": [1]\n}");
}

TEST_CASE("Commas inside strings are kept", "[jsonc]") {
    std::string text = R"({"a": ",}", "b": "x,]"})";
    CHECK(strip_trailing_commas(text) == text);
}

TEST_CASE("Escaped quotes do not end a string", "[jsonc]") {
    std::string text = R"({"a": "say \",}\" ok"})";
    CHECK(strip_trailing_commas(text) == text);
}

TEST_CASE("Comments between comma and closer are skipped", "[jsonc]") {
    std::string text = "{\"a\": 1, // last\n /* note */ }";
    CHECK(strip_trailing_commas(text) == "{\"a\": 1 // last\n /* note */ }");
}

TEST_CASE("Separating commas are kept", "[jsonc]") {
    std::string text = "{\"a\": 1, \"b\": [1, 2]}";
    CHECK(strip_trailing_commas(text) == text);
}

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("Parses VS Code style settings", "[jsonc]") {
    std::string text = R"({
    // Editor
    "editor.fontSize": 14,
    /* block
       comment */
    "files.exclude": {
        "**/.git": true,
    },
    "url": "http://example.com/path", // not a comment start inside a string
})";

    auto result = parse_jsonc(text);

    REQUIRE(result.success());
    CHECK(result.document["editor.fontSize"] == 14);
    CHECK(result.document["files.exclude"]["**/.git"] == true);
    CHECK(result.document["url"] == "http://example.com/path");
}

TEST_CASE("Key order is preserved", "[jsonc]") {
    auto result = parse_jsonc(R"({"zeta": 1, "alpha": 2, "mid": 3})");

    REQUIRE(result.success());
    std::vector<std::string> keys;
    for (auto it = result.document.begin(); it != result.document.end(); ++it) {
        keys.push_back(it.key());
    }
    CHECK(keys == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("Blank text is an empty object", "[jsonc]") {
    auto result = parse_jsonc("  \n\t ");

    CHECK(result.success());
    CHECK(result.document.is_object());
    CHECK(result.document.empty());
}

TEST_CASE("Blank text is noted in the verbose trace", "[jsonc]") {
    lmcfg::testing::CapturedTrace trace;

    auto result = parse_jsonc("\n");

    CHECK(result.success());
    CHECK(trace.text().find("[JSONC]") != std::string::npos);
    CHECK(trace.text().find("treating it as {}") != std::string::npos);
}

TEST_CASE("Malformed text reports an error", "[jsonc]") {
    auto result = parse_jsonc("{\"a\": }");

    CHECK_FALSE(result.success());
    CHECK_FALSE(result.error.empty());
    CHECK(result.document.is_object());
    CHECK(result.document.empty());
}

TEST_CASE("Non-object top level is an error", "[jsonc]") {
    auto result = parse_jsonc("[1, 2, 3]");

    CHECK_FALSE(result.success());
    CHECK(result.document.empty());
}
