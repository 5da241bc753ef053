#pragma once

/**
 * Verbose tracing for lmcfg, enabled with -v/--verbose.
 *
 * Lines go to stderr as "[HH:MM:SS.mmm] [CATEGORY] message". Categories in
 * use: CURL and CATALOG for the model catalog, JSONC, SETTINGS, CONFIRM,
 * BACKUP and WRITE for the settings update, PROXY and UPSTREAM for serve
 * mode. The proxy traces from several threads, so each line is written
 * under a lock.
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <mutex>
#include <sstream>
#include <ctime>

namespace lmcfg {

/**
 * Global verbose mode flag. Set once at startup, before any thread runs.
 */
inline bool g_verbose = false;

inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

inline bool is_verbose() {
    return g_verbose;
}

/**
 * Current local wall-clock time as HH:MM:SS.mmm.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
#ifdef _WIN32
    localtime_s(&tm_now, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_now);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

namespace detail {

inline std::mutex verbose_mutex;

// Writes one trace line; marker follows the category inside the brackets.
inline void verbose_line(const char* color, const std::string& category,
                         const char* marker, const std::string& message) {
    std::string line = "\033[90m[" + timestamp() + "] " + color + "[" + category + marker + "]\033[0m " + message;
    std::lock_guard<std::mutex> lock(verbose_mutex);
    std::cerr << line << std::endl;
}

} // namespace detail

inline void verbose_log(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::verbose_line("\033[36m", category, "", message);
}

// Outgoing data: requests sent, files written.
inline void verbose_out(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::verbose_line("\033[33m", category, " >>>", message);
}

// Incoming data: responses received, files read.
inline void verbose_in(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::verbose_line("\033[32m", category, " <<<", message);
}

inline void verbose_err(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::verbose_line("\033[31m", category, " ERR", message);
}

/**
 * Shortens s to max_len characters for display, noting the full size.
 */
inline std::string truncate(const std::string& s, size_t max_len = 200) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

} // namespace lmcfg
