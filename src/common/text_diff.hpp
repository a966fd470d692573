#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace keepsake {

struct DiffLine {
    enum class Kind {
        Same,
        Removed,
        Added
    };

    Kind kind;
    std::string text;
};

// Splits on '\n' and drops a '\r' before it; a trailing newline does not
// produce an empty last line.
std::vector<std::string> splitLines(const std::string &text);

// Longest-common-subsequence line diff. Very large inputs fall back to
// "everything removed, everything added".
std::vector<DiffLine> diffLines(const std::string &before, const std::string &after);

// Renders "-", "+" and " " prefixed lines; unchanged runs further than
// contextLines from any change are collapsed into a single marker line.
std::string renderLineDiff(const std::vector<DiffLine> &lines, std::size_t contextLines = 3);

inline std::string lineDiff(const std::string &before, const std::string &after)
{
    return renderLineDiff(diffLines(before, after));
}

} // namespace keepsake
