#include "compat_fixes.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace lmcfg {

using ordered_json = nlohmann::ordered_json;

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// Media type without parameters, lowercased: "Application/JSON; charset=utf-8" -> "application/json".
static std::string media_type(const std::string& content_type) {
    std::string type = content_type.substr(0, content_type.find(';'));
    size_t begin = type.find_first_not_of(" \t");
    size_t end = type.find_last_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    return to_lower(type.substr(begin, end - begin + 1));
}

int fix_tool_schemas(ordered_json& request) {
    if (!request.is_object() || !request.contains("tools") || !request["tools"].is_array()) {
        return 0;
    }

    int fixed = 0;
    for (auto& tool : request["tools"]) {
        if (!tool.is_object()) {
            continue;
        }
        ordered_json* holder = &tool;
        if (tool.contains("function")) {
            holder = &tool["function"];
            if (!holder->is_object()) {
                continue;
            }
        }
        if (!holder->contains("parameters")) {
            continue;
        }

        ordered_json& parameters = (*holder)["parameters"];
        if (parameters.is_object() && !parameters.contains("type")) {
            parameters["type"] = "object";
            if (!parameters.contains("properties")) {
                parameters["properties"] = ordered_json::object();
            }
            ++fixed;
        }
    }
    return fixed;
}

bool fill_usage_details(ordered_json& usage) {
    if (!usage.is_object()) {
        return false;
    }

    bool changed = false;
    if (!usage.contains("input_tokens_details")) {
        usage["input_tokens_details"] = {{"cached_tokens", 0}};
        changed = true;
    }
    if (!usage.contains("output_tokens_details")) {
        usage["output_tokens_details"] = {{"reasoning_tokens", 0}};
        changed = true;
    }
    return changed;
}

// Fills the usage member of holder, if it has one.
static bool fill_member_usage(ordered_json& holder) {
    if (!holder.is_object() || !holder.contains("usage")) {
        return false;
    }
    return fill_usage_details(holder["usage"]);
}

// Parses body, applies repair and re-serializes only when something changed.
template <typename Repair>
static BodyFix rewrite_json(const std::string& body, Repair repair) {
    BodyFix result;
    try {
        ordered_json document = ordered_json::parse(body);
        result.fixes = repair(document);
        if (result.changed()) {
            result.body = document.dump();
        }
    } catch (const ordered_json::exception& e) {
        result.fixes = 0;
        result.body.clear();
        result.error = e.what();
    }
    return result;
}

BodyFix fix_request_body(const std::string& body) {
    return rewrite_json(body, [](ordered_json& document) {
        return fix_tool_schemas(document);
    });
}

BodyFix fix_response_body(const std::string& body) {
    return rewrite_json(body, [](ordered_json& document) {
        return fill_member_usage(document) ? 1 : 0;
    });
}

std::string fix_event_line(const std::string& line) {
    if (!starts_with(line, "data:")) {
        return line;
    }
    std::string data = line.substr(5);
    if (!data.empty() && data[0] == ' ') {
        data.erase(0, 1);
    }
    if (data == "[DONE]") {
        return line;
    }

    BodyFix fix = rewrite_json(data, [](ordered_json& event) {
        int fixes = fill_member_usage(event) ? 1 : 0;
        if (event.is_object() && event.contains("response")) {
            fixes += fill_member_usage(event["response"]) ? 1 : 0;
        }
        return fixes;
    });
    if (!fix.changed()) {
        return line;
    }
    verbose_log("PROXY", "Filled usage details in stream event");
    return "data: " + fix.body;
}

std::string EventStreamRewriter::feed(const std::string& chunk) {
    pending_ += chunk;

    std::string out;
    size_t start = 0;
    size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        size_t end = newline;
        if (end > start && pending_[end - 1] == '\r') {
            --end;
        }
        out += fix_event_line(pending_.substr(start, end - start));
        out.append(pending_, end, newline + 1 - end);
        start = newline + 1;
    }
    pending_.erase(0, start);
    return out;
}

std::string EventStreamRewriter::finish() {
    std::string rest = fix_event_line(pending_);
    pending_.clear();
    return rest;
}

bool is_json_content_type(const std::string& content_type) {
    return media_type(content_type) == "application/json";
}

bool is_event_stream(const std::string& content_type) {
    return media_type(content_type) == "text/event-stream";
}

bool is_forwarded_request_header(const std::string& name) {
    static const char* const skipped[] = {
        "host", "connection", "keep-alive", "proxy-connection", "transfer-encoding",
        "te", "trailer", "upgrade", "expect", "content-length", "accept-encoding",
        // Peer addresses httplib records among the request headers.
        "remote_addr", "remote_port", "local_addr", "local_port",
    };
    std::string lower = to_lower(name);
    if (starts_with(lower, "sec-")) {
        return false;
    }
    return std::none_of(std::begin(skipped), std::end(skipped),
        [&](const char* skip) { return lower == skip; });
}

bool is_dropped_response_header(const std::string& name) {
    std::string lower = to_lower(name);
    return lower == "content-encoding" || lower == "transfer-encoding" || lower == "content-length" ||
           lower == "connection" || lower == "keep-alive";
}

} // namespace lmcfg
