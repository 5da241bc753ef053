#include "settings_document.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "jsonc.hpp"
#include "verbose.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace lmcfg {

namespace fs = std::filesystem;
using ordered_json = nlohmann::ordered_json;

int detect_indentation(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty() || (line[0] != ' ' && line[0] != '\t')) {
            continue;
        }
        char indent_char = line[0];
        size_t width = line.find_first_not_of(indent_char);
        if (width == std::string::npos) {
            width = line.size();
        }
        return static_cast<int>(width);
    }
    return DEFAULT_INDENT;
}

LoadedSettings load_settings_document(const std::string& path) {
    LoadedSettings loaded;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        verbose_log("SETTINGS", path + " does not exist, starting from an empty document");
        return loaded;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FilesystemError(path, "Cannot open " + path + " for reading");
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FilesystemError(path, "Failed to read " + path);
    }

    loaded.existed = true;
    loaded.raw_text = buffer.str();
    loaded.indent_width = detect_indentation(loaded.raw_text);
    verbose_in("SETTINGS", "Read " + std::to_string(loaded.raw_text.size()) + " bytes from " + path);

    JsoncParseResult parsed = parse_jsonc(loaded.raw_text);
    if (parsed.success()) {
        loaded.document = std::move(parsed.document);
    } else {
        loaded.parse_error = parsed.error;
    }
    return loaded;
}

void merge_model_config(ordered_json& document, const std::vector<ModelConfigEntry>& entries) {
    if (!document.is_object()) {
        document = ordered_json::object();
    }
    document[CUSTOM_MODELS_KEY] = to_json(entries);
}

std::string render_settings(const ordered_json& document, int indent_width) {
    return document.dump(indent_width);
}

} // namespace lmcfg
