#pragma once

/**
 * One proxied HTTP request to LM Studio, performed with libcurl on a worker
 * thread so the response can be relayed while it is still arriving.
 */

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace lmcfg {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct UpstreamRequest {
    std::string method;  // "GET", "POST", ...
    std::string url;     // Absolute URL including any query string.
    HeaderList headers;
    std::string body;
};

/**
 * Runs an upstream request in the background.
 *
 * The transfer starts in the constructor. Compressed responses are decoded
 * by libcurl, so body data is always identity-encoded. Destroying the
 * exchange aborts a transfer that is still running.
 */
class UpstreamExchange {
public:
    explicit UpstreamExchange(UpstreamRequest request);
    ~UpstreamExchange();

    UpstreamExchange(const UpstreamExchange&) = delete;
    UpstreamExchange& operator=(const UpstreamExchange&) = delete;

    // Blocks until the final status line and headers arrived. Returns false
    // if the transfer ended without a response; error() says why.
    bool wait_for_response();

    // Only meaningful after wait_for_response() returned true.
    long status() const;
    HeaderList headers() const;

    // First value of the named header (case-insensitive), or "".
    std::string header(const std::string& name) const;

    // Blocks until more body data arrived and moves it into chunk. Returns
    // false once the body is complete and fully consumed.
    bool next_chunk(std::string& chunk);

    // Blocks until the transfer ends and returns the remaining body.
    std::string read_body();

    // Aborts the transfer; pending and future reads end.
    void cancel();

    // True if the transfer ended with a transport error.
    bool failed() const;

    std::string error() const;

private:
    UpstreamRequest request_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    bool response_ready_ = false;  // Final status and headers are in.
    bool finished_ = false;        // curl_easy_perform returned.
    bool cancelled_ = false;
    long status_ = 0;
    HeaderList headers_;
    std::string pending_;          // Body data not yet handed out.
    std::string error_;

    std::thread worker_;

    void run();

    // libcurl callbacks, defined next to run().
    struct Callbacks;
    friend struct Callbacks;
};

} // namespace lmcfg
