#include "editor_paths.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace lmcfg {

namespace fs = std::filesystem;

std::optional<EditorKind> parse_editor_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "code") {
        return EditorKind::Code;
    }
    if (lower == "code-insiders") {
        return EditorKind::CodeInsiders;
    }
    return std::nullopt;
}

fs::path home_directory() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home || std::string(home).empty()) {
        throw std::runtime_error("Could not determine home directory");
    }
    return fs::path(home);
}

std::string expand_user_path(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() == 1) {
        return home_directory().string();
    }
    if (path[1] == '/' || path[1] == '\\') {
        return (home_directory() / path.substr(2)).string();
    }
    // ~user forms are left alone.
    return path;
}

fs::path vscode_settings_path(EditorKind editor) {
    const std::string dir = editor == EditorKind::Code ? "Code" : "Code - Insiders";
    fs::path home = home_directory();

#if defined(__APPLE__)
    return home / "Library" / "Application Support" / dir / "User" / "settings.json";
#elif defined(_WIN32)
    const char* appdata_env = std::getenv("APPDATA");
    fs::path appdata = (appdata_env && *appdata_env) ? fs::path(appdata_env) : home / "AppData" / "Roaming";
    return appdata / dir / "User" / "settings.json";
#else
    return home / ".config" / dir / "User" / "settings.json";
#endif
}

} // namespace lmcfg
