#include <catch2/catch.hpp>
#include "model_config.hpp"
#include "lmstudio_client.hpp"
#include "errors.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace lmcfg;

namespace {

ModelDescriptor model(const std::string& id, const std::string& type,
                      std::vector<std::string> capabilities = {}, int context = 8192) {
    ModelDescriptor d;
    d.id = id;
    d.type = type;
    d.capabilities = std::move(capabilities);
    d.max_context_length = context;
    return d;
}

} // namespace

// ============================================================================
// Filtering
// ============================================================================

TEST_CASE("Only llm and vlm models produce entries", "[model_config]") {
    std::vector<ModelDescriptor> models = {
        model("text-embedding-nomic", "embeddings"),
        model("embedder", "embedding"),
        model("qwen", "llm"),
        model("llava", "vlm"),
        model("untyped", "")
    };

    auto entries = synthesize_config(models, "http://x/v1");

    REQUIRE(entries.size() == 2);
    CHECK(entries[0].name == "llava");
    CHECK(entries[1].name == "qwen");
}

TEST_CASE("Allowed model types", "[model_config]") {
    CHECK(is_allowed_model_type("llm"));
    CHECK(is_allowed_model_type("vlm"));
    CHECK_FALSE(is_allowed_model_type("embedding"));
    CHECK_FALSE(is_allowed_model_type("LLM"));
    CHECK_FALSE(is_allowed_model_type(""));
}

// ============================================================================
// Field mapping
// ============================================================================

TEST_CASE("Capabilities map to toolCalling and vision", "[model_config]") {
    auto entries = synthesize_config({
        model("tools-only", "llm", {"tool_use"}),
        model("vision-only", "vlm", {"vision"}),
        model("neither", "llm", {})
    }, "http://x/v1");

    REQUIRE(entries.size() == 3);

    const auto& neither = entries[0];
    const auto& tools = entries[1];
    const auto& vision = entries[2];

    CHECK(tools.name == "tools-only");
    CHECK(tools.tool_calling);
    CHECK_FALSE(tools.vision);

    CHECK(vision.name == "vision-only");
    CHECK_FALSE(vision.tool_calling);
    CHECK(vision.vision);

    CHECK_FALSE(neither.tool_calling);
    CHECK_FALSE(neither.vision);
}

TEST_CASE("Fixed fields and token limits", "[model_config]") {
    auto entries = synthesize_config({model("m", "llm", {}, 32768)}, "http://host:3000/v1");

    REQUIRE(entries.size() == 1);
    CHECK(entries[0].url == "http://host:3000/v1");
    CHECK(entries[0].thinking);
    CHECK_FALSE(entries[0].requires_api_key);
    CHECK(entries[0].max_input_tokens == 32768);
    CHECK(entries[0].max_output_tokens == 32768);
}

TEST_CASE("Missing context length defaults to 8192", "[model_config]") {
    auto models = parse_models_response(R"({"data": [{"id": "m", "type": "llm"}]})");
    auto entries = synthesize_config(models, "http://x/v1");

    REQUIRE(entries.size() == 1);
    CHECK(entries[0].max_input_tokens == 8192);
    CHECK(entries[0].max_output_tokens == 8192);
}

TEST_CASE("Repeated ids keep the first occurrence", "[model_config]") {
    auto entries = synthesize_config({
        model("dup", "llm", {"tool_use"}),
        model("dup", "llm", {})
    }, "http://x/v1");

    REQUIRE(entries.size() == 1);
    CHECK(entries[0].tool_calling);
}

// ============================================================================
// Ordering and serialization
// ============================================================================

TEST_CASE("Entries are sorted by id byte-wise", "[model_config]") {
    auto entries = synthesize_config({
        model("b-model", "llm"),
        model("Zeta", "llm"),
        model("a-model", "llm"),
        model("B-model", "llm")
    }, "u");

    REQUIRE(entries.size() == 4);
    CHECK(entries[0].name == "B-model");
    CHECK(entries[1].name == "Zeta");
    CHECK(entries[2].name == "a-model");
    CHECK(entries[3].name == "b-model");
}

TEST_CASE("Entry fields serialize in alphabetical order", "[model_config]") {
    ModelConfigEntry entry;
    entry.name = "m";
    entry.url = "http://x/v1";

    auto j = to_json(entry);
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) {
        keys.push_back(it.key());
    }

    CHECK(keys == std::vector<std::string>{
        "maxInputTokens", "maxOutputTokens", "name", "requiresAPIKey",
        "thinking", "toolCalling", "url", "vision"
    });
}

TEST_CASE("Serialization is deterministic regardless of input order", "[model_config]") {
    std::vector<ModelDescriptor> forward = {
        model("alpha", "llm", {"tool_use"}, 4096),
        model("beta", "vlm", {"vision"}, 16384),
        model("gamma", "llm")
    };
    std::vector<ModelDescriptor> backward(forward.rbegin(), forward.rend());

    std::string first = to_json(synthesize_config(forward, "http://x/v1")).dump(2);
    std::string second = to_json(synthesize_config(backward, "http://x/v1")).dump(2);
    std::string third = to_json(synthesize_config(forward, "http://x/v1")).dump(2);

    CHECK(first == second);
    CHECK(first == third);
}

TEST_CASE("Single tool-capable model end to end", "[model_config]") {
    auto models = parse_models_response(
        R"({"data":[{"id":"m1","type":"llm","capabilities":["tool_use"],"max_context_length":4096}]})");
    auto j = to_json(synthesize_config(models, "http://x/v1"));

    REQUIRE(j.size() == 1);
    REQUIRE(j.contains("m1"));
    const auto& m1 = j["m1"];
    CHECK(m1["name"] == "m1");
    CHECK(m1["url"] == "http://x/v1");
    CHECK(m1["toolCalling"] == true);
    CHECK(m1["vision"] == false);
    CHECK(m1["thinking"] == true);
    CHECK(m1["maxInputTokens"] == 4096);
    CHECK(m1["maxOutputTokens"] == 4096);
    CHECK(m1["requiresAPIKey"] == false);
    CHECK(m1.size() == 8);
}

// ============================================================================
// Catalog decoding
// ============================================================================

TEST_CASE("Catalog entries decode with defaults", "[catalog]") {
    auto models = parse_models_response(R"({
        "object": "list",
        "data": [
            {"id": "a", "type": "llm", "capabilities": ["tool_use", 7], "max_context_length": 131072},
            {"id": "b", "type": "embeddings"},
            {"id": "c", "max_context_length": 0}
        ]
    })");

    REQUIRE(models.size() == 3);
    CHECK(models[0].capabilities == std::vector<std::string>{"tool_use"});
    CHECK(models[0].max_context_length == 131072);
    CHECK(models[1].type == "embeddings");
    CHECK(models[1].capabilities.empty());
    CHECK(models[1].max_context_length == 8192);
    CHECK(models[2].type.empty());
    CHECK(models[2].max_context_length == 8192);
}

TEST_CASE("Catalog entry without id is rejected", "[catalog]") {
    CHECK_THROWS_AS(parse_models_response(R"({"data": [{"type": "llm"}]})"), CatalogFormatError);
    CHECK_THROWS_AS(parse_models_response(R"({"data": [{"id": 5}]})"), CatalogFormatError);
}

TEST_CASE("Catalog without data array is rejected", "[catalog]") {
    CHECK_THROWS_AS(parse_models_response(R"({"models": []})"), CatalogFormatError);
    CHECK_THROWS_AS(parse_models_response("not json"), CatalogFormatError);
    CHECK(parse_models_response(R"({"data": []})").empty());
}
