#include "jsonc.hpp"
#include "verbose.hpp"
#include <cctype>
#include <utility>

namespace lmcfg {

using ordered_json = nlohmann::ordered_json;

namespace {

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Returns the index just past a comment starting at pos, or pos if none starts there.
size_t skip_comment(const std::string& text, size_t pos) {
    if (pos + 1 >= text.size() || text[pos] != '/') {
        return pos;
    }
    if (text[pos + 1] == '/') {
        size_t end = text.find('\n', pos + 2);
        return end == std::string::npos ? text.size() : end;
    }
    if (text[pos + 1] == '*') {
        size_t end = text.find("*/", pos + 2);
        return end == std::string::npos ? text.size() : end + 2;
    }
    return pos;
}

// Index of the next character that is neither whitespace nor inside a comment.
size_t next_significant(const std::string& text, size_t pos) {
    while (pos < text.size()) {
        if (std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
            continue;
        }
        size_t after = skip_comment(text, pos);
        if (after == pos) {
            return pos;
        }
        pos = after;
    }
    return pos;
}

} // namespace

std::string strip_trailing_commas(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool in_string = false;
    bool escaped = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (in_string) {
            out += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
            out += c;
            continue;
        }

        size_t after_comment = skip_comment(text, i);
        if (after_comment != i) {
            out.append(text, i, after_comment - i);
            i = after_comment - 1;
            continue;
        }

        if (c == ',') {
            size_t next = next_significant(text, i + 1);
            if (next < text.size() && (text[next] == '}' || text[next] == ']')) {
                continue;
            }
        }

        out += c;
    }

    return out;
}

JsoncParseResult parse_jsonc(const std::string& text) {
    JsoncParseResult result;
    result.document = ordered_json::object();

    // Strict JSON and JSON5 readers reject empty input; here it is an empty object.
    if (is_blank(text)) {
        verbose_log("JSONC", "Document is empty or whitespace only, treating it as {}");
        return result;
    }

    try {
        ordered_json parsed = ordered_json::parse(strip_trailing_commas(text),
                                                  /*cb=*/nullptr,
                                                  /*allow_exceptions=*/true,
                                                  /*ignore_comments=*/true);
        if (!parsed.is_object()) {
            result.error = std::string("top-level value is ") + parsed.type_name() + ", expected object";
            return result;
        }
        result.document = std::move(parsed);
    } catch (const ordered_json::parse_error& e) {
        verbose_err("JSONC", e.what());
        result.error = e.what();
    }

    return result;
}

} // namespace lmcfg
