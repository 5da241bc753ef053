#pragma once

/**
 * The merge pipeline that updates a settings file in place:
 * load, merge, diff, confirm, back up, replace.
 */

#include "confirmation.hpp"
#include "model_config.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace lmcfg {

class Console;

enum class UpdateOutcome {
    Unchanged,  // Rendered document equals the file; nothing touched.
    Applied,    // Backup (if any) written, then the file replaced.
    Cancelled   // User declined; nothing touched.
};

/**
 * What an update did.
 */
struct UpdateResult {
    UpdateOutcome outcome = UpdateOutcome::Unchanged;
    std::string backup_path;  // Empty unless a backup was created.
    size_t model_count = 0;   // Entries written under the models key.
};

// Supplies the time used to date backups.
using TimeSource = std::function<std::chrono::system_clock::time_point()>;

/**
 * Applies a generated model block to one settings file.
 *
 * Nothing on disk changes unless the rendered document differs from the
 * current file and the gate answers Apply. When it does, the backup is
 * completed before the settings file is replaced; if the backup fails the
 * file is left alone and FilesystemError propagates.
 */
class SettingsUpdater {
public:
    SettingsUpdater(Console& console, ConfirmationGate& gate,
                    TimeSource now = [] { return std::chrono::system_clock::now(); });

    UpdateResult update(const std::string& path, const std::vector<ModelConfigEntry>& entries);

private:
    Console& console_;
    ConfirmationGate& gate_;
    TimeSource now_;
};

// Standalone {"github.copilot.chat.customOAIModels": {...}} document, indented by 2.
std::string render_standalone_config(const std::vector<ModelConfigEntry>& entries);

} // namespace lmcfg
