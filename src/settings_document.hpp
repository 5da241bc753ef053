#pragma once

/**
 * Loading, merging and rendering of the VS Code settings document.
 *
 * The document is held as an insertion-ordered JSON object so that keys the
 * tool does not own keep their values and their position across a rewrite.
 */

#include "model_config.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lmcfg {

/**
 * A settings file as found on disk.
 */
struct LoadedSettings {
    nlohmann::ordered_json document = nlohmann::ordered_json::object();
    std::string raw_text;      // Original file content, empty if the file is missing.
    bool existed = false;      // True if the file was present.
    std::string parse_error;   // Set when the file existed but could not be parsed.
    int indent_width = DEFAULT_INDENT;  // Inferred from raw_text.

    bool parse_failed() const { return !parse_error.empty(); }
};

// Width of the leading whitespace on the first indented line, or 2 if none.
int detect_indentation(const std::string& text);

/**
 * Reads and tolerantly parses the settings file at path.
 *
 * A missing file yields an empty document. An unparsable file also yields an
 * empty document, with parse_error describing why; deciding what to do about
 * it is left to the caller. Throws FilesystemError if the file exists but
 * cannot be read.
 */
LoadedSettings load_settings_document(const std::string& path);

// Sets CUSTOM_MODELS_KEY to the given entries. All other keys are left as they are.
void merge_model_config(nlohmann::ordered_json& document,
                        const std::vector<ModelConfigEntry>& entries);

// Pretty-prints the document with indent_width spaces and no trailing newline.
std::string render_settings(const nlohmann::ordered_json& document, int indent_width);

} // namespace lmcfg
