#pragma once

/**
 * Confirmation gate between a computed diff and any file mutation.
 */

#include "line_diff.hpp"
#include <string>
#include <vector>

namespace lmcfg {

class Console;

/**
 * Outcome of reviewing a proposed settings change.
 */
enum class DiffDecision {
    Unchanged,  // Nothing to write.
    Apply,      // User confirmed the change.
    Cancel      // User declined, or no answer could be read.
};

const char* to_string(DiffDecision decision);

/**
 * Decides whether a non-empty change set may be written to path.
 *
 * Implementations are only consulted when there is at least one changed line.
 */
class ConfirmationGate {
public:
    virtual ~ConfirmationGate() = default;

    virtual DiffDecision ask(const std::string& path, const std::vector<DiffLine>& changes) = 0;
};

/**
 * Shows the colored diff on the console and asks "Apply these changes? [y/N]".
 */
class ConsoleConfirmation : public ConfirmationGate {
public:
    explicit ConsoleConfirmation(Console& console);

    DiffDecision ask(const std::string& path, const std::vector<DiffLine>& changes) override;

private:
    Console& console_;
};

// Prints each change with a +/- marker, additions green and deletions red.
void print_diff(Console& console, const std::vector<DiffLine>& changes);

// True for "y" or "yes", ignoring case and surrounding whitespace.
bool is_affirmative(const std::string& answer);

} // namespace lmcfg
