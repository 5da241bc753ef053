#pragma once

/**
 * Tolerant parsing of JSON with comments (JSONC), the format VS Code uses
 * for settings.json.
 */

#include <string>
#include <nlohmann/json.hpp>

namespace lmcfg {

/**
 * Result of parsing a JSONC document.
 */
struct JsoncParseResult {
    nlohmann::ordered_json document;  // Parsed top-level object (empty object on error).
    std::string error;                // Parser message (empty on success).

    bool success() const { return error.empty(); }
};

/**
 * Removes commas that directly precede a closing '}' or ']', skipping over
 * whitespace and comments in between. String literals are left untouched.
 */
std::string strip_trailing_commas(const std::string& text);

/**
 * Parses text that may contain // and block comments and trailing commas.
 *
 * Whitespace-only text yields an empty object. A top-level value that is not
 * an object is reported as an error, since it cannot hold settings keys.
 * Key order is preserved.
 */
JsoncParseResult parse_jsonc(const std::string& text);

} // namespace lmcfg
