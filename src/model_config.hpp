#pragma once

/**
 * Model descriptors from the LM Studio catalog and the Copilot config
 * entries derived from them.
 */

#include "config.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lmcfg {

/**
 * One model advertised by the catalog endpoint.
 */
struct ModelDescriptor {
    std::string id;                         // Unique within one catalog response.
    std::string type;                       // "llm", "vlm", "embeddings", ... (may be empty).
    std::vector<std::string> capabilities;  // e.g. "tool_use", "vision".
    int max_context_length = DEFAULT_CONTEXT_LENGTH;

    bool has_capability(const std::string& capability) const;
};

/**
 * A single entry of the github.copilot.chat.customOAIModels block.
 */
struct ModelConfigEntry {
    std::string name;
    std::string url;
    bool tool_calling = false;
    bool vision = false;
    bool thinking = true;
    int max_input_tokens = DEFAULT_CONTEXT_LENGTH;
    int max_output_tokens = DEFAULT_CONTEXT_LENGTH;
    bool requires_api_key = false;
};

// True if the type tag is one that should produce a config entry.
bool is_allowed_model_type(const std::string& type);

/**
 * Builds config entries for every allowed descriptor, pointing at target_url.
 *
 * Entries come back sorted by name (byte-wise ascending). If the catalog
 * repeats an id, the first occurrence is kept.
 */
std::vector<ModelConfigEntry> synthesize_config(const std::vector<ModelDescriptor>& descriptors,
                                                const std::string& target_url);

// Serializes one entry with its fields in alphabetical key order.
nlohmann::ordered_json to_json(const ModelConfigEntry& entry);

// Serializes entries as an object keyed by name, in the order given.
nlohmann::ordered_json to_json(const std::vector<ModelConfigEntry>& entries);

} // namespace lmcfg
