#pragma once

/**
 * Exception types for the fatal failure paths of lmcfg.
 *
 * Recoverable conditions (an unparsable settings file) are reported through
 * result structs instead; see jsonc.hpp.
 */

#include <stdexcept>
#include <string>

namespace lmcfg {

/**
 * The model catalog endpoint was unreachable or answered with a non-2xx
 * status. The message always names the attempted URL.
 */
class NetworkError : public std::runtime_error {
public:
    NetworkError(const std::string& url, const std::string& message, bool connect_failed = false)
        : std::runtime_error(message), url_(url), connect_failed_(connect_failed) {}

    const std::string& url() const { return url_; }

    // True when no connection could be established at all.
    bool connect_failed() const { return connect_failed_; }

private:
    std::string url_;
    bool connect_failed_;
};

/**
 * The catalog response body did not have the expected shape.
 */
class CatalogFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Reading, backing up or writing a settings file failed.
 */
class FilesystemError : public std::runtime_error {
public:
    FilesystemError(const std::string& path, const std::string& message)
        : std::runtime_error(message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace lmcfg
