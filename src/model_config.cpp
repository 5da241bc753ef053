#include "model_config.hpp"
#include "config.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <set>
#include <utility>

namespace lmcfg {

using ordered_json = nlohmann::ordered_json;

bool ModelDescriptor::has_capability(const std::string& capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

bool is_allowed_model_type(const std::string& type) {
    return std::any_of(ALLOWED_MODEL_TYPES.begin(), ALLOWED_MODEL_TYPES.end(),
        [&type](const char* allowed) { return type == allowed; });
}

std::vector<ModelConfigEntry> synthesize_config(const std::vector<ModelDescriptor>& descriptors,
                                                const std::string& target_url) {
    std::vector<ModelConfigEntry> entries;
    std::set<std::string> seen;

    for (const auto& model : descriptors) {
        if (!is_allowed_model_type(model.type)) {
            verbose_log("CONFIG", "Skipping " + model.id + " (type '" + model.type + "')");
            continue;
        }
        if (!seen.insert(model.id).second) {
            verbose_log("CONFIG", "Skipping duplicate id " + model.id);
            continue;
        }

        ModelConfigEntry entry;
        entry.name = model.id;
        entry.url = target_url;
        entry.tool_calling = model.has_capability(CAPABILITY_TOOL_USE);
        entry.vision = model.has_capability(CAPABILITY_VISION);
        entry.thinking = true;
        entry.max_input_tokens = model.max_context_length;
        entry.max_output_tokens = model.max_context_length;
        entry.requires_api_key = false;
        entries.push_back(std::move(entry));
    }

    // std::string comparison is byte-wise, which keeps output stable across locales.
    std::sort(entries.begin(), entries.end(),
        [](const ModelConfigEntry& a, const ModelConfigEntry& b) { return a.name < b.name; });
    return entries;
}

ordered_json to_json(const ModelConfigEntry& entry) {
    std::vector<std::pair<std::string, ordered_json>> fields = {
        {"name", entry.name},
        {"url", entry.url},
        {"toolCalling", entry.tool_calling},
        {"vision", entry.vision},
        {"thinking", entry.thinking},
        {"maxInputTokens", entry.max_input_tokens},
        {"maxOutputTokens", entry.max_output_tokens},
        {"requiresAPIKey", entry.requires_api_key}
    };
    std::sort(fields.begin(), fields.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    ordered_json j = ordered_json::object();
    for (auto& [key, value] : fields) {
        j[key] = std::move(value);
    }
    return j;
}

ordered_json to_json(const std::vector<ModelConfigEntry>& entries) {
    ordered_json j = ordered_json::object();
    for (const auto& entry : entries) {
        j[entry.name] = to_json(entry);
    }
    return j;
}

} // namespace lmcfg
