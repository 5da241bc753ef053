#pragma once

/**
 * Payload repairs applied by the serve proxy between Copilot and LM Studio.
 *
 * Requests: tool parameter schemas without a "type" become
 * {"type": "object", "properties": {}}, which LM Studio requires.
 * Responses: usage objects get the input_tokens_details and
 * output_tokens_details members Copilot reads, both for plain JSON bodies
 * and for server-sent event streams.
 */

#include <nlohmann/json.hpp>
#include <string>

namespace lmcfg {

/**
 * Outcome of repairing one JSON body.
 */
struct BodyFix {
    std::string body;   // Rewritten body; only set when fixes > 0.
    int fixes = 0;      // Number of repairs applied.
    std::string error;  // Set when the body is not JSON.

    bool success() const { return error.empty(); }
    bool changed() const { return fixes > 0; }
};

// Repairs the parameter schema of each entry in request["tools"], in either
// the {"function": {"parameters": ...}} or the {"parameters": ...} layout.
// Returns the number of schemas changed.
int fix_tool_schemas(nlohmann::ordered_json& request);

// Adds {"cached_tokens": 0} and {"reasoning_tokens": 0} details where missing.
// Returns true if usage was changed.
bool fill_usage_details(nlohmann::ordered_json& usage);

BodyFix fix_request_body(const std::string& body);

// Fills usage details at the top level of a response body.
BodyFix fix_response_body(const std::string& body);

// Rewrites one event-stream line (without its terminator). Data lines whose
// JSON carries a usage object, at the top level or under "response", get
// their details filled; every other line comes back unchanged.
std::string fix_event_line(const std::string& line);

/**
 * Applies fix_event_line to a text/event-stream body that arrives in
 * arbitrary pieces. Output is produced line by line, so a JSON event split
 * across network reads is still repaired.
 */
class EventStreamRewriter {
public:
    // Consumes a piece of the stream and returns the rewritten complete lines.
    std::string feed(const std::string& chunk);

    // Returns whatever is left after the last line break, rewritten.
    std::string finish();

private:
    std::string pending_;
};

// True for application/json, with or without parameters.
bool is_json_content_type(const std::string& content_type);

bool is_event_stream(const std::string& content_type);

// False for hop-by-hop and encoding headers the proxy must not pass upstream.
bool is_forwarded_request_header(const std::string& name);

// True for headers that no longer describe the body once the proxy has
// decoded and possibly rewritten it.
bool is_dropped_response_header(const std::string& name);

} // namespace lmcfg
