#include "proxy_server.hpp"
#include "compat_fixes.hpp"
#include "console.hpp"
#include "upstream_exchange.hpp"
#include "verbose.hpp"
#include <curl/curl.h>
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <utility>

namespace lmcfg {

static std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

ProxyServer::ProxyServer(Console& console, ProxyOptions options)
    : console_(console),
      options_(std::move(options)),
      upstream_root_(options_.upstream_url),
      server_(std::make_unique<httplib::Server>()) {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    while (!upstream_root_.empty() && upstream_root_.back() == '/') {
        upstream_root_.pop_back();
    }

    // Every method on every path goes upstream.
    auto handler = [this](const httplib::Request& req, httplib::Response& res) { handle(req, res); };
    const std::string any_path = ".*";
    server_->Get(any_path, handler);
    server_->Post(any_path, handler);
    server_->Put(any_path, handler);
    server_->Patch(any_path, handler);
    server_->Delete(any_path, handler);
    server_->Options(any_path, handler);
}

ProxyServer::~ProxyServer() {
    stop();
    curl_global_cleanup();
}

std::string ProxyServer::address() const {
    return options_.bind_all ? "0.0.0.0" : "127.0.0.1";
}

int ProxyServer::bind() {
    if (options_.port == 0) {
        return server_->bind_to_any_port(address());
    }
    return server_->bind_to_port(address(), options_.port) ? options_.port : -1;
}

bool ProxyServer::listen() {
    return server_->listen_after_bind();
}

void ProxyServer::stop() {
    if (server_->is_running()) {
        server_->stop();
    }
}

bool ProxyServer::is_running() const {
    return server_->is_running();
}

void ProxyServer::add_cors_headers(httplib::Response& res) const {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "*");
    res.set_header("Access-Control-Allow-Headers", "*");
}

void ProxyServer::handle(const httplib::Request& req, httplib::Response& res) {
    log_info(req.method + " " + req.target);

    if (options_.cors) {
        add_cors_headers(res);
        if (req.method == "OPTIONS" && req.has_header("Access-Control-Request-Method")) {
            res.status = 204;
            return;
        }
    }

    UpstreamRequest upstream;
    upstream.method = req.method;
    upstream.url = upstream_root_ + req.target;
    for (const auto& header : req.headers) {
        if (is_forwarded_request_header(header.first)) {
            upstream.headers.emplace_back(header.first, header.second);
        }
    }
    upstream.body = req.body;

    if (!req.body.empty() && is_json_content_type(req.get_header_value("Content-Type"))) {
        BodyFix fix = fix_request_body(req.body);
        if (!fix.success()) {
            log_warning("Could not fix request body: " + fix.error);
        } else if (fix.changed()) {
            log_info("Fixed " + std::to_string(fix.fixes) + " tool parameter schema(s)");
            upstream.body = std::move(fix.body);
        }
    }

    auto exchange = std::make_shared<UpstreamExchange>(std::move(upstream));
    if (!exchange->wait_for_response()) {
        log_error("Failed to proxy request: " + exchange->error());
        res.status = 502;
        res.set_content("Bad Gateway: " + exchange->error(), "text/plain");
        return;
    }

    const int status = static_cast<int>(exchange->status());
    const std::string content_type = exchange->header("Content-Type");
    const bool streaming = is_event_stream(content_type);

    std::string body;
    if (!streaming) {
        body = exchange->read_body();
        if (exchange->failed()) {
            log_error("Failed to read response body: " + exchange->error());
            res.status = 502;
            res.set_content("Bad Gateway: " + exchange->error(), "text/plain");
            return;
        }
    }

    res.status = status;
    if (status < 200 || status >= 300) {
        log_warning("Response: " + std::to_string(status));
    }

    for (const auto& header : exchange->headers()) {
        std::string name = lowercase(header.first);
        if (is_dropped_response_header(name) || name == "content-type") {
            continue;
        }
        if (options_.cors && name.compare(0, 15, "access-control-") == 0) {
            continue;
        }
        res.set_header(header.first, header.second);
    }

    if (streaming) {
        auto rewriter = std::make_shared<EventStreamRewriter>();
        res.set_chunked_content_provider(content_type,
            [exchange, rewriter](size_t, httplib::DataSink& sink) {
                std::string chunk;
                if (exchange->next_chunk(chunk)) {
                    std::string out = rewriter->feed(chunk);
                    if (!out.empty() && !sink.write(out.data(), out.size())) {
                        exchange->cancel();
                        return false;
                    }
                    return true;
                }
                std::string rest = rewriter->finish();
                if (!rest.empty()) {
                    sink.write(rest.data(), rest.size());
                }
                sink.done();
                return true;
            });
        return;
    }

    if (is_json_content_type(content_type)) {
        BodyFix fix = fix_response_body(body);
        if (fix.changed()) {
            log_info("Fixed usage details in response");
            body = std::move(fix.body);
        }
    }
    res.body = std::move(body);
    if (!content_type.empty()) {
        res.set_header("Content-Type", content_type);
    }
}

void ProxyServer::log_info(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_.println(timestamp() + " " + message);
}

void ProxyServer::log_warning(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_.print_warning(timestamp() + " " + message);
}

void ProxyServer::log_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_.print_error(timestamp() + " " + message);
}

} // namespace lmcfg
