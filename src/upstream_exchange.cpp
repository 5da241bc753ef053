#include "upstream_exchange.hpp"
#include "verbose.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace lmcfg {

static bool equals_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

static std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

struct UpstreamExchange::Callbacks {
    // Header lines arrive one at a time, status line first. Interim 1xx
    // responses are followed by another status line, which starts over.
    static size_t on_header(char* data, size_t size, size_t count, void* userdata) {
        auto* self = static_cast<UpstreamExchange*>(userdata);
        size_t total = size * count;
        std::string line = trim(std::string(data, total));

        std::lock_guard<std::mutex> lock(self->mutex_);
        if (self->cancelled_) {
            return 0;
        }
        if (line.compare(0, 5, "HTTP/") == 0) {
            self->headers_.clear();
            size_t space = line.find(' ');
            self->status_ = space == std::string::npos ? 0 : std::strtol(line.c_str() + space + 1, nullptr, 10);
        } else if (line.empty()) {
            if (self->status_ >= 200) {
                self->response_ready_ = true;
                self->changed_.notify_all();
            }
        } else {
            size_t colon = line.find(':');
            if (colon != std::string::npos) {
                self->headers_.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
            }
        }
        return total;
    }

    static size_t on_body(char* data, size_t size, size_t count, void* userdata) {
        auto* self = static_cast<UpstreamExchange*>(userdata);
        size_t total = size * count;

        std::lock_guard<std::mutex> lock(self->mutex_);
        if (self->cancelled_) {
            return 0;  // Aborts the transfer.
        }
        self->response_ready_ = true;
        self->pending_.append(data, total);
        self->changed_.notify_all();
        return total;
    }

    // Returns non-zero to abort a transfer that is waiting on the network.
    static int on_progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* self = static_cast<UpstreamExchange*>(userdata);
        std::lock_guard<std::mutex> lock(self->mutex_);
        return self->cancelled_ ? 1 : 0;
    }
};

UpstreamExchange::UpstreamExchange(UpstreamRequest request) : request_(std::move(request)) {
    worker_ = std::thread(&UpstreamExchange::run, this);
}

UpstreamExchange::~UpstreamExchange() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void UpstreamExchange::run() {
    verbose_out("UPSTREAM", request_.method + " " + request_.url);

    CURL* curl = curl_easy_init();
    if (!curl) {
        verbose_err("UPSTREAM", "Failed to initialize CURL");
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = "Failed to initialize CURL";
        finished_ = true;
        changed_.notify_all();
        return;
    }

    struct curl_slist* headers = nullptr;
    bool has_content_type = false;
    for (const auto& header : request_.headers) {
        std::string line = header.first + ": " + header.second;
        headers = curl_slist_append(headers, line.c_str());
        has_content_type = has_content_type || equals_ignore_case(header.first, "Content-Type");
    }
    // Disable the headers libcurl would otherwise add on its own.
    headers = curl_slist_append(headers, "Expect:");
    if (!has_content_type) {
        headers = curl_slist_append(headers, "Content-Type:");
    }

    curl_easy_setopt(curl, CURLOPT_URL, request_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    // Accept every encoding libcurl can decode and hand out decoded data.
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    if (request_.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request_.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request_.method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request_.body.size()));
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_.body.data());
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, Callbacks::on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, Callbacks::on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, Callbacks::on_progress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (is_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    std::lock_guard<std::mutex> lock(mutex_);
    if (res != CURLE_OK && !cancelled_) {
        verbose_err("UPSTREAM", request_.method + " " + request_.url + " failed: " +
                    curl_easy_strerror(res));
        error_ = std::string("Error connecting to ") + request_.url + ": " + curl_easy_strerror(res);
    } else if (res == CURLE_OK && !response_ready_) {
        // A response with neither body nor a header block terminator still has a status.
        status_ = http_code;
        response_ready_ = true;
    }
    if (res == CURLE_OK) {
        verbose_in("UPSTREAM", "HTTP " + std::to_string(http_code) + " for " + request_.url);
    }
    finished_ = true;
    changed_.notify_all();
}

bool UpstreamExchange::wait_for_response() {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [this] { return response_ready_ || finished_; });
    return response_ready_;
}

long UpstreamExchange::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

HeaderList UpstreamExchange::headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return headers_;
}

std::string UpstreamExchange::header(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& header : headers_) {
        if (equals_ignore_case(header.first, name)) {
            return header.second;
        }
    }
    return "";
}

bool UpstreamExchange::next_chunk(std::string& chunk) {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [this] { return !pending_.empty() || finished_ || cancelled_; });
    chunk.clear();
    if (pending_.empty()) {
        return false;
    }
    chunk.swap(pending_);
    return true;
}

std::string UpstreamExchange::read_body() {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [this] { return finished_; });
    std::string body;
    body.swap(pending_);
    return body;
}

void UpstreamExchange::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finished_) {
        cancelled_ = true;
    }
    changed_.notify_all();
}

bool UpstreamExchange::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_ && !error_.empty();
}

std::string UpstreamExchange::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

} // namespace lmcfg
