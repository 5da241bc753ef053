#include <catch2/catch.hpp>
#include "settings_updater.hpp"
#include "backup_writer.hpp"
#include "config.hpp"
#include "console.hpp"
#include "errors.hpp"
#include "lmstudio_client.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace lmcfg;
using lmcfg::testing::ScriptedGate;
using lmcfg::testing::TempDir;
using lmcfg::testing::count_files;
using lmcfg::testing::local_noon;
using lmcfg::testing::read_text;
using lmcfg::testing::write_text;

namespace fs = std::filesystem;

namespace {

const char* CATALOG = R"({"data": [
    {"id": "qwen3-coder", "type": "llm", "capabilities": ["tool_use"], "max_context_length": 65536},
    {"id": "gemma-vision", "type": "vlm", "capabilities": ["vision"]},
    {"id": "nomic-embed", "type": "embeddings", "max_context_length": 2048}
]})";

std::vector<ModelConfigEntry> catalog_entries() {
    return synthesize_config(parse_models_response(CATALOG), "http://localhost:3000/v1");
}

// Console writing into string streams, with no input.
struct QuietConsole {
    std::ostringstream out;
    std::ostringstream err;
    std::istringstream in;
    Console console{out, err, in};
};

TimeSource fixed_time() {
    return [] { return local_noon(2025, 9, 24); };
}

} // namespace

// ============================================================================
// Fresh files
// ============================================================================

TEST_CASE("Missing file is created without a backup", "[updater]") {
    TempDir dir;
    auto path = dir.file("settings.json");
    QuietConsole io;
    ScriptedGate gate(DiffDecision::Apply);
    SettingsUpdater updater(io.console, gate, fixed_time());

    auto result = updater.update(path.string(), catalog_entries());

    CHECK(result.outcome == UpdateOutcome::Applied);
    CHECK(result.backup_path.empty());
    CHECK(result.model_count == 2);
    CHECK(count_files(dir.path()) == 1);

    auto written = nlohmann::ordered_json::parse(read_text(path));
    CHECK(written[CUSTOM_MODELS_KEY].size() == 2);
    CHECK(io.out.str().find("Updated " + path.string() + " with 2 models") != std::string::npos);
}

TEST_CASE("Empty settings file gets the single model block", "[updater]") {
    TempDir dir;
    auto path = dir.file("settings.json");
    write_text(path, "");
    QuietConsole io;
    ScriptedGate gate(DiffDecision::Apply);
    SettingsUpdater updater(io.console, gate, fixed_time());

    auto entries = synthesize_config(parse_models_response(
        R"({"data":[{"id":"m1","type":"llm","capabilities":["tool_use"],"max_context_length":4096}]})"),
        "http://x/v1");
    updater.update(path.string(), entries);

    std::string expected =
        "{\n"
        "  \"github.copilot.chat.customOAIModels\": {\n"
        "    \"m1\": {\n"
        "      \"maxInputTokens\": 4096,\n"
        "      \"maxOutputTokens\": 4096,\n"
        "      \"name\": \"m1\",\n"
        "      \"requiresAPIKey\": false,\n"
        "      \"thinking\": true,\n"
        "      \"toolCalling\": true,\n"
        "      \"url\": \"http://x/v1\",\n"
        "      \"vision\": false\n"
        "    }\n"
        "  }\n"
        "}";
    CHECK(read_text(path) == expected);
}

// ============================================================================
// Existing files
// ============================================================================

TEST_CASE("Unrelated settings survive and a backup is made first", "[updater]") {
    TempDir dir;
    auto path = dir.file("settings.json");
    std::string original = "{\n    // keep me\n    \"editor.fontSize\": 14,\n    \"files.autoSave\": \"afterDelay\",\n}";
    write_text(path, original);
    QuietConsole io;
    ScriptedGate gate(DiffDecision::Apply);
    SettingsUpdater updater(io.console, gate, fixed_time());

    auto result = updater.update(path.string(), catalog_entries());

    REQUIRE(result.outcome == UpdateOutcome::Applied);
    CHECK(fs::path(result.backup_path) == dir.file("settings.250924-0.backup.json"));
    CHECK(read_text(result.backup_path) == original);

    std::string written = read_text(path);
    auto doc = nlohmann::ordered_json::parse(written);
    CHECK(doc["editor.fontSize"] == 14);
    CHECK(doc["files.autoSave"] == "afterDelay");
    CHECK(doc.begin().key() == "editor.fontSize");
    // Indentation follows the original file.
    CHECK(written.find("\n    \"editor.fontSize\": 14,") != std::string::npos);
}

TEST_CASE("Second run against the same catalog is a no-op", "[updater]") {
    TempDir dir;
    auto path = dir.file("settings.json");
    write_text(path, "{\n  \"editor.fontSize\": 14\n}");
    QuietConsole io;
    ScriptedGate apply(DiffDecision::Apply);
    SettingsUpdater(io.console, apply, fixed_time()).update(path.string(), catalog_entries());

    std::string after_first = read_text(path);
    auto mtime = fs::last_write_time(path);
    size_t files = count_files(dir.path());

    ScriptedGate second_gate(DiffDecision::Apply);
    auto result = SettingsUpdater(io.console, second_gate, fixed_time()).update(path.string(), catalog_entries());

    CHECK(result.outcome == UpdateOutcome::Unchanged);
    CHECK(second_gate.calls == 0);
    CHECK(result.backup_path.empty());
    CHECK(read_text(path) == after_first);
    CHECK(fs::last_write_time(path) == mtime);
    CHECK(count_files(dir.path()) == files);
    CHECK(io.out.str().find("No changes detected.") != std::string::npos);
}

TEST_CASE("Declining leaves the file byte-identical and creates no backup", "[updater]") {
    TempDir dir;
    auto path = dir.file("settings.json");
    std::string original = "{\n  // comment\n  \"editor.fontSize\": 14,\n}\n";
    write_text(path, original);
    QuietConsole io;
    ScriptedGate gate(DiffDecision::Cancel);
    SettingsUpdater updater(io.console, gate, fixed_time());

    auto result = updater.update(path.string(), catalog_entries());

    CHECK(result.outcome == UpdateOutcome::Cancelled);
    CHECK(gate.calls == 1);
    CHECK(read_text(path) == original);
    CHECK(count_files(dir.path()) == 1);
    CHECK(io.err.str().find("Operation cancelled by user") != std::string::npos);
}

TEST_CASE("The gate sees only changed lines", "[updater]") {
    TempDir dir;
    auto path = dir.file("settings.json");
    write_text(path, "{\n  \"editor.fontSize\": 14\n}");
    QuietConsole io;
    ScriptedGate gate(DiffDecision::Cancel);
    SettingsUpdater updater(io.console, gate, fixed_time());

    updater.update(path.string(), catalog_entries());

    REQUIRE(gate.calls == 1);
    CHECK(gate.last_path == path.string());
    REQUIRE_FALSE(gate.last_changes.empty());
    for (const auto& change : gate.last_changes) {
        CHECK(change.text != "{\n");
    }
    CHECK(gate.last_changes.front().kind == DiffKind::Delete);
    CHECK(gate.last_changes.front().text == "  \"editor.fontSize\": 14\n");
}

TEST_CASE("Corrupt settings are replaced only after a loud warning", "[updater]") {
    TempDir dir;
    auto path = dir.file("settings.json");
    write_text(path, "{ \"editor.fontSize\": 14 oops");
    QuietConsole io;
    ScriptedGate gate(DiffDecision::Apply);
    SettingsUpdater updater(io.console, gate, fixed_time());

    auto result = updater.update(path.string(), catalog_entries());

    CHECK(io.err.str().find("Could not parse existing settings") != std::string::npos);
    CHECK(io.err.str().find("REPLACES every other setting") != std::string::npos);
    REQUIRE(result.outcome == UpdateOutcome::Applied);
    CHECK(read_text(result.backup_path) == "{ \"editor.fontSize\": 14 oops");

    auto doc = nlohmann::ordered_json::parse(read_text(path));
    CHECK(doc.size() == 1);
    CHECK(doc.contains(CUSTOM_MODELS_KEY));
}

TEST_CASE("Existing backups for the day are not overwritten", "[updater]") {
    TempDir dir;
    auto path = dir.file("settings.json");
    write_text(path, "{\n  \"a\": 1\n}");
    write_text(dir.file("settings.250924-0.backup.json"), "first");
    write_text(dir.file("settings.250924-1.backup.json"), "second");
    QuietConsole io;
    ScriptedGate gate(DiffDecision::Apply);
    SettingsUpdater updater(io.console, gate, fixed_time());

    auto result = updater.update(path.string(), catalog_entries());

    CHECK(fs::path(result.backup_path) == dir.file("settings.250924-2.backup.json"));
    CHECK(read_text(dir.file("settings.250924-0.backup.json")) == "first");
    CHECK(read_text(dir.file("settings.250924-1.backup.json")) == "second");
    CHECK(read_text(result.backup_path) == "{\n  \"a\": 1\n}");
}

TEST_CASE("A failed backup prevents the write", "[updater]") {
    TempDir dir;
    auto path = dir.file("settings.json");
    write_text(path, "{\n  \"a\": 1\n}");
    QuietConsole io;
    ScriptedGate gate(DiffDecision::Apply);
    // Fails while preparing the backup, before anything has been copied.
    SettingsUpdater updater(io.console, gate, []() -> std::chrono::system_clock::time_point {
        throw FilesystemError("settings.json", "backup unavailable");
    });

    CHECK_THROWS_AS(updater.update(path.string(), catalog_entries()), FilesystemError);
    CHECK(read_text(path) == "{\n  \"a\": 1\n}");
    CHECK(count_files(dir.path()) == 1);
}

// ============================================================================
// Standalone output
// ============================================================================

TEST_CASE("Standalone config wraps the models block", "[updater]") {
    auto text = render_standalone_config(catalog_entries());
    auto doc = nlohmann::ordered_json::parse(text);

    REQUIRE(doc.size() == 1);
    const auto& models = doc[CUSTOM_MODELS_KEY];
    REQUIRE(models.size() == 2);
    CHECK(models.begin().key() == "gemma-vision");
    CHECK(models["gemma-vision"]["vision"] == true);
    CHECK(models["gemma-vision"]["maxInputTokens"] == 8192);
    CHECK(models["qwen3-coder"]["toolCalling"] == true);
    CHECK(models["qwen3-coder"]["maxOutputTokens"] == 65536);
    CHECK(text.rfind("{\n  \"github.copilot.chat.customOAIModels\": {\n    \"gemma-vision\"", 0) == 0);
}
