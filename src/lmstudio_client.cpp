#include "lmstudio_client.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <utility>

namespace lmcfg {

using json = nlohmann::json;

// CURL write callback for collecting response data into a string.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string derive_lmstudio_url(const std::string& base_url) {
    std::string base = strip_trailing_slashes(base_url);
    const std::string v1 = "/v1";
    if (base.size() >= v1.size() && base.compare(base.size() - v1.size(), v1.size(), v1) == 0) {
        base = strip_trailing_slashes(base.substr(0, base.size() - v1.size()));
    }

    size_t scheme_end = base.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return DEFAULT_LMSTUDIO_URL;
    }
    std::string scheme = base.substr(0, scheme_end);

    std::string authority = base.substr(scheme_end + 3);
    authority = authority.substr(0, authority.find_first_of("/?#"));
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return DEFAULT_LMSTUDIO_URL;
        }
        host = authority.substr(0, close + 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }
    if (host.empty()) {
        return DEFAULT_LMSTUDIO_URL;
    }
    std::transform(host.begin(), host.end(), host.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return scheme + "://" + host + ":" + std::to_string(LMSTUDIO_PORT);
}

std::string models_endpoint(const std::string& lmstudio_url) {
    return strip_trailing_slashes(lmstudio_url) + MODELS_PATH;
}

std::vector<ModelDescriptor> parse_models_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw CatalogFormatError(std::string("Model catalog is not valid JSON: ") + e.what());
    }

    if (!j.is_object() || !j.contains("data") || !j["data"].is_array()) {
        throw CatalogFormatError("Model catalog response has no \"data\" array");
    }

    std::vector<ModelDescriptor> models;
    for (const auto& entry : j["data"]) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            throw CatalogFormatError("Model catalog entry without an \"id\": " + truncate(entry.dump(), 200));
        }

        ModelDescriptor model;
        model.id = entry["id"].get<std::string>();

        if (entry.contains("type") && entry["type"].is_string()) {
            model.type = entry["type"].get<std::string>();
        }

        if (entry.contains("capabilities") && entry["capabilities"].is_array()) {
            for (const auto& capability : entry["capabilities"]) {
                if (capability.is_string()) {
                    model.capabilities.push_back(capability.get<std::string>());
                }
            }
        }

        if (entry.contains("max_context_length") && entry["max_context_length"].is_number_integer()) {
            auto length = entry["max_context_length"].get<int64_t>();
            if (length > 0 && length <= std::numeric_limits<int>::max()) {
                model.max_context_length = static_cast<int>(length);
            }
        }

        models.push_back(std::move(model));
    }
    return models;
}

LMStudioClient::LMStudioClient(const std::string& base_url)
    : models_url_(models_endpoint(base_url)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LMStudioClient::~LMStudioClient() {
    curl_global_cleanup();
}

std::string LMStudioClient::http_get(const std::string& url) {
    verbose_out("CURL", "GET " + url);

    CURL* curl = curl_easy_init();
    if (!curl) {
        verbose_err("CURL", "Failed to initialize CURL");
        throw NetworkError(url, "Failed to initialize CURL for " + url);
    }

    std::string response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    // Enable verbose CURL output in verbose mode
    if (is_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        verbose_err("CURL", std::string("GET failed: ") + curl_easy_strerror(res));
        bool connect_failed = res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST;
        throw NetworkError(url, "Error connecting to " + url + ": " + curl_easy_strerror(res), connect_failed);
    }

    verbose_in("CURL", "HTTP " + std::to_string(http_code) + " - " + truncate(response, 500));

    if (http_code < 200 || http_code >= 300) {
        throw NetworkError(url, "Failed to fetch models from " + url + ": HTTP " + std::to_string(http_code));
    }
    return response;
}

std::vector<ModelDescriptor> LMStudioClient::list_models() {
    std::string response = http_get(models_url_);
    std::vector<ModelDescriptor> models = parse_models_response(response);
    verbose_log("CATALOG", std::to_string(models.size()) + " models listed at " + models_url_);
    return models;
}

} // namespace lmcfg
