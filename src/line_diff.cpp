#include "line_diff.hpp"
#include <utility>

namespace lmcfg {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start + 1));
        start = end + 1;
    }
    return lines;
}

namespace {

using Lines = std::vector<std::string>;

// A matched line: index into the old lines and index into the new lines.
using Match = std::pair<size_t, size_t>;

struct Split {
    size_t x;
    size_t y;
};

/**
 * Finds a point on a shortest edit path through a[a0, a1) x b[b0, b1) by
 * running the Myers search from both corners until the two frontiers meet.
 * Memory is linear in the size of the range.
 *
 * Returns false when the ranges share no line at all.
 */
bool find_split(const Lines& a, size_t a0, size_t a1,
                const Lines& b, size_t b0, size_t b1, Split& split) {
    const long n = static_cast<long>(a1 - a0);
    const long m = static_cast<long>(b1 - b0);
    const long max_d = (n + m + 1) / 2;
    const long offset = max_d;
    const long length = 2 * max_d + 2;

    // forward[k]: furthest x reached from the top-left on diagonal k = x - y.
    // backward[k]: the same measured from the bottom-right corner.
    std::vector<long> forward(length, -1);
    std::vector<long> backward(length, -1);
    forward[offset + 1] = 0;
    backward[offset + 1] = 0;

    const long delta = n - m;
    const bool odd = (delta % 2) != 0;

    // Diagonals that ran off the edge of the grid are skipped from then on.
    long forward_start = 0;
    long forward_end = 0;
    long backward_start = 0;
    long backward_end = 0;

    for (long d = 0; d < max_d; ++d) {
        for (long k = -d + forward_start; k <= d - forward_end; k += 2) {
            const long i = offset + k;
            long x;
            if (k == -d || (k != d && forward[i - 1] < forward[i + 1])) {
                x = forward[i + 1];
            } else {
                x = forward[i - 1] + 1;
            }
            long y = x - k;
            while (x < n && y < m && a[a0 + x] == b[b0 + y]) {
                ++x;
                ++y;
            }
            forward[i] = x;

            if (x > n) {
                forward_end += 2;
            } else if (y > m) {
                forward_start += 2;
            } else if (odd) {
                const long j = offset + delta - k;
                if (j >= 0 && j < length && backward[j] != -1 && x >= n - backward[j]) {
                    split = {static_cast<size_t>(x), static_cast<size_t>(y)};
                    return true;
                }
            }
        }

        for (long k = -d + backward_start; k <= d - backward_end; k += 2) {
            const long i = offset + k;
            long x;
            if (k == -d || (k != d && backward[i - 1] < backward[i + 1])) {
                x = backward[i + 1];
            } else {
                x = backward[i - 1] + 1;
            }
            long y = x - k;
            while (x < n && y < m && a[a1 - 1 - x] == b[b1 - 1 - y]) {
                ++x;
                ++y;
            }
            backward[i] = x;

            if (x > n) {
                backward_end += 2;
            } else if (y > m) {
                backward_start += 2;
            } else if (!odd) {
                const long j = offset + delta - k;
                if (j >= 0 && j < length && forward[j] != -1) {
                    const long fx = forward[j];
                    const long fy = fx - (j - offset);
                    if (fx >= n - x) {
                        split = {static_cast<size_t>(fx), static_cast<size_t>(fy)};
                        return true;
                    }
                }
            }
        }
    }
    return false;
}

// Appends the matched lines of a longest common subsequence of the two
// ranges to matches, in increasing order.
void align(const Lines& a, size_t a0, size_t a1,
           const Lines& b, size_t b0, size_t b1, std::vector<Match>& matches) {
    while (a0 < a1 && b0 < b1 && a[a0] == b[b0]) {
        matches.emplace_back(a0++, b0++);
    }
    size_t suffix = 0;
    while (a0 < a1 - suffix && b0 < b1 - suffix && a[a1 - 1 - suffix] == b[b1 - 1 - suffix]) {
        ++suffix;
    }
    a1 -= suffix;
    b1 -= suffix;

    Split split;
    if (a0 < a1 && b0 < b1 && find_split(a, a0, a1, b, b0, b1, split)) {
        align(a, a0, a0 + split.x, b, b0, b0 + split.y, matches);
        align(a, a0 + split.x, a1, b, b0 + split.y, b1, matches);
    }

    for (size_t i = 0; i < suffix; ++i) {
        matches.emplace_back(a1 + i, b1 + i);
    }
}

} // namespace

std::vector<DiffLine> compute_line_diff(const std::string& old_text, const std::string& new_text) {
    const Lines a = split_lines(old_text);
    const Lines b = split_lines(new_text);

    std::vector<Match> matches;
    align(a, 0, a.size(), b, 0, b.size(), matches);
    matches.emplace_back(a.size(), b.size());

    // Each gap between matched lines becomes its deletions followed by its insertions.
    std::vector<DiffLine> changes;
    size_t i = 0;
    size_t j = 0;
    for (const Match& match : matches) {
        for (; i < match.first; ++i) {
            changes.push_back({DiffKind::Delete, a[i]});
        }
        for (; j < match.second; ++j) {
            changes.push_back({DiffKind::Insert, b[j]});
        }
        i = match.first + 1;
        j = match.second + 1;
    }
    return changes;
}

} // namespace lmcfg
