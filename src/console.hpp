#pragma once

#include <string>
#include <iostream>

namespace lmcfg {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Terminal output helper with color support.
 *
 * Provides styled output methods that automatically handle ANSI color codes
 * based on terminal capabilities. Falls back to plain text when colors are
 * not supported (e.g., when TERM=dumb). Errors and warnings go to the error
 * stream so that generated JSON on stdout stays clean.
 */
class Console {
public:
    // Creates a Console on the process streams and detects color support.
    Console();

    // Creates a Console on the given streams with colors disabled.
    Console(std::ostream& out, std::ostream& err, std::istream& in);

    // ========== Basic Output ==========

    // Prints text followed by a newline.
    void println(const std::string& text = "") const;

    // ========== Colored Output ==========

    // Prints error message in red on the error stream.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow on the error stream.
    void print_warning(const std::string& text) const;

    // Prints success message in green with a checkmark prefix.
    void print_success(const std::string& text) const;

    // Prints informational message in cyan.
    void print_info(const std::string& text) const;

    // Prints header text in bold cyan.
    void print_header(const std::string& text) const;

    // Prints text with a specific ANSI color code.
    void print_colored(const std::string& text, const char* color) const;

    // ========== Interactive Input ==========

    // Prints message and reads one line. Returns false if no input could be read.
    bool prompt_line(const std::string& message, std::string& line) const;

    // Overrides the detected color support.
    void set_colors_enabled(bool enabled) { colors_enabled_ = enabled; }

private:
    std::ostream& out_;
    std::ostream& err_;
    std::istream& in_;
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();
};

} // namespace lmcfg
