#pragma once

/**
 * Line-level diff between the current and the proposed settings text.
 */

#include <string>
#include <vector>

namespace lmcfg {

enum class DiffKind {
    Insert,
    Delete
};

/**
 * One changed line. Unchanged lines are never reported.
 */
struct DiffLine {
    DiffKind kind;
    std::string text;  // Line content including its '\n', if it had one.
};

// Splits text into lines, keeping each line's terminating '\n'.
std::vector<std::string> split_lines(const std::string& text);

/**
 * Computes a shortest edit script from old_text to new_text (Myers, linear
 * space variant) and returns only the inserted and deleted lines, in display
 * order. Within each changed region deletions come before insertions.
 *
 * Lines are compared including their line terminator, so adding or removing
 * a final newline counts as a change.
 */
std::vector<DiffLine> compute_line_diff(const std::string& old_text, const std::string& new_text);

} // namespace lmcfg
