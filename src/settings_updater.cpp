#include "settings_updater.hpp"
#include "backup_writer.hpp"
#include "config.hpp"
#include "console.hpp"
#include "line_diff.hpp"
#include "settings_document.hpp"
#include "verbose.hpp"
#include <utility>

namespace lmcfg {

SettingsUpdater::SettingsUpdater(Console& console, ConfirmationGate& gate, TimeSource now)
    : console_(console), gate_(gate), now_(std::move(now)) {}

UpdateResult SettingsUpdater::update(const std::string& path, const std::vector<ModelConfigEntry>& entries) {
    UpdateResult result;
    result.model_count = entries.size();

    LoadedSettings loaded = load_settings_document(path);
    if (loaded.parse_failed()) {
        console_.print_warning("Warning: Could not parse existing settings (" + loaded.parse_error +
                               "), creating new structure...");
        console_.print_warning("Applying this change REPLACES every other setting in " + path +
                               "; the original is kept in a dated backup.");
    }

    merge_model_config(loaded.document, entries);
    std::string new_content = render_settings(loaded.document, loaded.indent_width);
    verbose_log("SETTINGS", "Rendered " + std::to_string(new_content.size()) + " bytes with indent " +
                std::to_string(loaded.indent_width));

    std::vector<DiffLine> changes = compute_line_diff(loaded.raw_text, new_content);
    DiffDecision decision = changes.empty() ? DiffDecision::Unchanged : gate_.ask(path, changes);
    verbose_log("CONFIRM", std::string("Decision: ") + to_string(decision));

    switch (decision) {
        case DiffDecision::Unchanged:
            console_.println("No changes detected.");
            result.outcome = UpdateOutcome::Unchanged;
            return result;
        case DiffDecision::Cancel:
            console_.print_warning("Operation cancelled by user");
            result.outcome = UpdateOutcome::Cancelled;
            return result;
        case DiffDecision::Apply:
            break;
    }

    // The backup must exist before the original is touched.
    if (loaded.existed) {
        auto backup = create_backup(path, format_date_tag(now_()));
        result.backup_path = backup.string();
        console_.print_info("Created backup at " + result.backup_path);
    }

    write_file_atomically(path, new_content);
    console_.print_success("Updated " + path + " with " + std::to_string(entries.size()) + " models");

    result.outcome = UpdateOutcome::Applied;
    return result;
}

std::string render_standalone_config(const std::vector<ModelConfigEntry>& entries) {
    nlohmann::ordered_json output = nlohmann::ordered_json::object();
    output[CUSTOM_MODELS_KEY] = to_json(entries);
    return output.dump(DEFAULT_INDENT);
}

} // namespace lmcfg
