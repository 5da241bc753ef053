#pragma once

/**
 * Compatibility proxy between GitHub Copilot and LM Studio.
 *
 * Listens where the generated settings point Copilot (port 3000 by
 * default), forwards every request to LM Studio and repairs the payloads
 * the two disagree on; see compat_fixes.hpp. Streaming responses are
 * relayed as they arrive.
 */

#include "config.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace lmcfg {

class Console;

struct ProxyOptions {
    int port = DEFAULT_PROXY_PORT;
    std::string upstream_url = DEFAULT_LMSTUDIO_URL;  // LM Studio root.
    bool bind_all = false;  // Listen on 0.0.0.0 instead of 127.0.0.1.
    bool cors = false;      // Answer preflights and allow any origin.
};

class ProxyServer {
public:
    ProxyServer(Console& console, ProxyOptions options);
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // Binds the listening socket. With port 0 an ephemeral port is chosen.
    // Returns the bound port, or -1 if binding failed.
    int bind();

    // Serves requests until stop() is called. bind() must have succeeded.
    // Returns false if the server could not run.
    bool listen();

    // Stops a running listen(). Safe to call from another thread.
    void stop();

    bool is_running() const;

    // Address the server listens on, e.g. "127.0.0.1".
    std::string address() const;

private:
    Console& console_;
    ProxyOptions options_;
    std::string upstream_root_;  // upstream_url without trailing '/'.
    std::unique_ptr<httplib::Server> server_;
    std::mutex log_mutex_;

    void handle(const httplib::Request& req, httplib::Response& res);
    void add_cors_headers(httplib::Response& res) const;

    void log_info(const std::string& message);
    void log_warning(const std::string& message);
    void log_error(const std::string& message);
};

} // namespace lmcfg
