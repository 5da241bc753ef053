#pragma once

/**
 * Location of VS Code user settings files.
 */

#include <filesystem>
#include <optional>
#include <string>

namespace lmcfg {

enum class EditorKind {
    Code,
    CodeInsiders
};

// Parses "code" or "code-insiders" (case-insensitive).
std::optional<EditorKind> parse_editor_kind(const std::string& name);

// Home directory from HOME (USERPROFILE on Windows). Throws std::runtime_error if unset.
std::filesystem::path home_directory();

// Expands a leading "~" or "~/" to the home directory. Other paths are returned as is.
std::string expand_user_path(const std::string& path);

/**
 * Platform default settings.json for the given editor:
 *   macOS:   ~/Library/Application Support/<dir>/User/settings.json
 *   Windows: %APPDATA%/<dir>/User/settings.json (falls back to ~/AppData/Roaming)
 *   other:   ~/.config/<dir>/User/settings.json
 * where <dir> is "Code" or "Code - Insiders".
 */
std::filesystem::path vscode_settings_path(EditorKind editor);

} // namespace lmcfg
