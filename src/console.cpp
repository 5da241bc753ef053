#include "console.hpp"
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#endif

namespace lmcfg {

Console::Console() : out_(std::cout), err_(std::cerr), in_(std::cin), colors_enabled_(true) {
    enable_colors();
}

Console::Console(std::ostream& out, std::ostream& err, std::istream& in)
    : out_(out), err_(err), in_(in), colors_enabled_(false) {}

void Console::enable_colors() {
#ifdef _WIN32
    // Enable ANSI escape codes on Windows 10+
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD mode = 0;
        if (GetConsoleMode(hOut, &mode)) {
            mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, mode);
        }
    }
#endif
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") {
        colors_enabled_ = false;
    }
    if (std::getenv("NO_COLOR")) {
        colors_enabled_ = false;
    }
}

void Console::println(const std::string& text) const {
    out_ << text << std::endl;
}

void Console::print_error(const std::string& text) const {
    if (colors_enabled_) {
        err_ << ansi::RED << text << ansi::RESET << std::endl;
    } else {
        err_ << text << std::endl;
    }
}

void Console::print_warning(const std::string& text) const {
    if (colors_enabled_) {
        err_ << ansi::YELLOW << text << ansi::RESET << std::endl;
    } else {
        err_ << text << std::endl;
    }
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        out_ << "* " << text << std::endl;
    }
}

void Console::print_info(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_header(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::BOLD << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_colored(const std::string& text, const char* color) const {
    if (colors_enabled_) {
        out_ << color << text << ansi::RESET;
    } else {
        out_ << text;
    }
}

bool Console::prompt_line(const std::string& message, std::string& line) const {
    out_ << message << std::flush;
    if (!std::getline(in_, line)) {
        line.clear();
        return false;
    }
    return true;
}

} // namespace lmcfg
