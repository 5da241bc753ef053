#pragma once

/**
 * Application configuration constants.
 *
 * Defines the settings key, default URLs, model defaults and backup naming
 * for the lmcfg CLI.
 */

#include <array>

namespace lmcfg {

// ========== Settings Document ==========

// Key in VS Code settings.json that holds the generated model block.
constexpr const char* CUSTOM_MODELS_KEY = "github.copilot.chat.customOAIModels";

constexpr int DEFAULT_INDENT = 2;  // Indent width when none can be inferred.

// ========== Backups ==========

constexpr const char* BACKUP_SUFFIX = ".backup.json";   // <stem>.<YYMMDD>-<n>.backup.json
constexpr const char* FALLBACK_STEM = "settings";       // Used when the file has no stem.
constexpr int MAX_SYMLINK_HOPS = 40;                    // Same limit as Linux path resolution.

// ========== Endpoints ==========

constexpr const char* DEFAULT_BASE_URL = "http://localhost:3000/v1";  // Written into each entry.
constexpr const char* DEFAULT_LMSTUDIO_URL = "http://localhost:1234";
constexpr int LMSTUDIO_PORT = 1234;
constexpr int DEFAULT_PROXY_PORT = 3000;  // Where DEFAULT_BASE_URL points.
constexpr const char* MODELS_PATH = "/api/v0/models";  // LM Studio REST catalog.

// ========== Model Defaults ==========

constexpr int DEFAULT_CONTEXT_LENGTH = 8192;  // When the catalog omits max_context_length.

// Model type tags that produce a config entry. Embedding models are skipped.
inline const std::array<const char*, 2> ALLOWED_MODEL_TYPES = {"llm", "vlm"};

constexpr const char* CAPABILITY_TOOL_USE = "tool_use";
constexpr const char* CAPABILITY_VISION = "vision";

// ========== Exit Codes ==========

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_CODE = 1;
constexpr int EXIT_CANCELLED = 2;  // User declined a real diff.

} // namespace lmcfg
