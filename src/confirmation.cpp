#include "confirmation.hpp"
#include "console.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <cctype>

namespace lmcfg {

const char* to_string(DiffDecision decision) {
    switch (decision) {
        case DiffDecision::Unchanged: return "unchanged";
        case DiffDecision::Apply: return "apply";
        case DiffDecision::Cancel: return "cancel";
    }
    return "unknown";
}

bool is_affirmative(const std::string& answer) {
    size_t start = answer.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return false;
    }
    size_t end = answer.find_last_not_of(" \t\r\n");
    std::string trimmed = answer.substr(start, end - start + 1);
    std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimmed == "y" || trimmed == "yes";
}

void print_diff(Console& console, const std::vector<DiffLine>& changes) {
    for (const auto& change : changes) {
        std::string line = change.text;
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
        }
        if (change.kind == DiffKind::Insert) {
            console.print_colored("+ " + line, ansi::GREEN);
        } else {
            console.print_colored("- " + line, ansi::RED);
        }
        console.println();
    }
}

ConsoleConfirmation::ConsoleConfirmation(Console& console) : console_(console) {}

DiffDecision ConsoleConfirmation::ask(const std::string& path, const std::vector<DiffLine>& changes) {
    console_.println();
    console_.print_header("Diff preview for: " + path);
    console_.println();
    print_diff(console_, changes);
    console_.println();

    std::string answer;
    if (!console_.prompt_line("Apply these changes? [y/N]: ", answer)) {
        console_.println();
        verbose_log("CONFIRM", "No input available, treating as cancel");
        return DiffDecision::Cancel;
    }
    return is_affirmative(answer) ? DiffDecision::Apply : DiffDecision::Cancel;
}

} // namespace lmcfg
