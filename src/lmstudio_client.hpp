#pragma once

/**
 * LM Studio REST client for the lmcfg CLI.
 *
 * Fetches the model catalog from a running LM Studio server using libcurl
 * for HTTP transport.
 */

#include "model_config.hpp"
#include <string>
#include <vector>

namespace lmcfg {

// Root URL of the LM Studio server to query when none is given: the host of
// base_url on port 1234, or http://localhost:1234 if base_url has no host.
std::string derive_lmstudio_url(const std::string& base_url);

// Catalog endpoint for an LM Studio server root, e.g. http://host:1234/api/v0/models.
std::string models_endpoint(const std::string& lmstudio_url);

/**
 * Decodes a catalog body of the form {"data": [{id, type, capabilities, max_context_length}, ...]}.
 *
 * Throws CatalogFormatError if the body is not JSON, has no "data" array,
 * or contains an entry without a string "id".
 */
std::vector<ModelDescriptor> parse_models_response(const std::string& body);

/**
 * HTTP client for the LM Studio model catalog.
 *
 * Performs exactly one request per list_models() call; there are no retries.
 */
class LMStudioClient {
public:
    // Creates a client for the server at base_url, e.g. "http://localhost:1234".
    explicit LMStudioClient(const std::string& base_url);

    // Cleans up CURL global state.
    ~LMStudioClient();

    LMStudioClient(const LMStudioClient&) = delete;
    LMStudioClient& operator=(const LMStudioClient&) = delete;

    // Lists every model the server knows about. Throws NetworkError or CatalogFormatError.
    std::vector<ModelDescriptor> list_models();

    // Full URL of the catalog endpoint.
    const std::string& models_url() const { return models_url_; }

private:
    std::string models_url_;  // Server root + MODELS_PATH.

    // Performs an HTTP GET request. Throws NetworkError on transport failure or non-2xx status.
    std::string http_get(const std::string& url);
};

} // namespace lmcfg
