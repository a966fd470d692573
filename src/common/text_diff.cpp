#include "common/text_diff.hpp"

#include <algorithm>
#include <cstdint>

namespace keepsake {

namespace {

constexpr std::size_t kMaxDiffCells = 4 * 1024 * 1024;

void appendRun(std::vector<DiffLine> &out,
               DiffLine::Kind kind,
               const std::vector<std::string> &lines,
               std::size_t from,
               std::size_t to)
{
    for (std::size_t i = from; i < to; ++i) {
        out.push_back({kind, lines[i]});
    }
}

} // namespace

std::vector<std::string> splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        const std::size_t next = end == std::string::npos ? text.size() : end + 1;
        if (end == std::string::npos) {
            end = text.size();
        }
        // CRLF and LF line endings compare equal.
        if (end > start && text[end - 1] == '\r') {
            --end;
        }
        lines.push_back(text.substr(start, end - start));
        start = next;
    }
    return lines;
}

std::vector<DiffLine> diffLines(const std::string &before, const std::string &after)
{
    const std::vector<std::string> a = splitLines(before);
    const std::vector<std::string> b = splitLines(after);

    std::size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix
           && a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    std::vector<DiffLine> out;
    appendRun(out, DiffLine::Kind::Same, a, 0, prefix);

    const std::size_t aEnd = a.size() - suffix;
    const std::size_t bEnd = b.size() - suffix;
    const std::size_t n = aEnd - prefix;
    const std::size_t m = bEnd - prefix;

    if (n == 0 || m == 0 || (n + 1) * (m + 1) > kMaxDiffCells) {
        appendRun(out, DiffLine::Kind::Removed, a, prefix, aEnd);
        appendRun(out, DiffLine::Kind::Added, b, prefix, bEnd);
        appendRun(out, DiffLine::Kind::Same, a, aEnd, a.size());
        return out;
    }

    // lcs[i][j] = LCS length of a[prefix + i ..] and b[prefix + j ..]
    std::vector<std::uint32_t> lcs((n + 1) * (m + 1), 0);
    const auto at = [m](std::size_t i, std::size_t j) { return i * (m + 1) + j; };
    for (std::size_t i = n; i-- > 0;) {
        for (std::size_t j = m; j-- > 0;) {
            if (a[prefix + i] == b[prefix + j]) {
                lcs[at(i, j)] = lcs[at(i + 1, j + 1)] + 1;
            } else {
                lcs[at(i, j)] = std::max(lcs[at(i + 1, j)], lcs[at(i, j + 1)]);
            }
        }
    }

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < n && j < m) {
        if (a[prefix + i] == b[prefix + j]) {
            out.push_back({DiffLine::Kind::Same, a[prefix + i]});
            ++i;
            ++j;
        } else if (lcs[at(i + 1, j)] >= lcs[at(i, j + 1)]) {
            out.push_back({DiffLine::Kind::Removed, a[prefix + i]});
            ++i;
        } else {
            out.push_back({DiffLine::Kind::Added, b[prefix + j]});
            ++j;
        }
    }
    appendRun(out, DiffLine::Kind::Removed, a, prefix + i, aEnd);
    appendRun(out, DiffLine::Kind::Added, b, prefix + j, bEnd);
    appendRun(out, DiffLine::Kind::Same, a, aEnd, a.size());
    return out;
}

std::string renderLineDiff(const std::vector<DiffLine> &lines, std::size_t contextLines)
{
    std::vector<bool> visible(lines.size(), false);
    bool anyChange = false;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].kind == DiffLine::Kind::Same) {
            continue;
        }
        anyChange = true;
        const std::size_t from = i > contextLines ? i - contextLines : 0;
        const std::size_t to = std::min(lines.size(), i + contextLines + 1);
        for (std::size_t k = from; k < to; ++k) {
            visible[k] = true;
        }
    }
    if (!anyChange) {
        return {};
    }

    std::string out;
    std::size_t hidden = 0;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!visible[i]) {
            ++hidden;
            continue;
        }
        if (hidden > 0) {
            out += "@@ " + std::to_string(hidden) + " unchanged line(s) @@\n";
            hidden = 0;
        }
        switch (lines[i].kind) {
        case DiffLine::Kind::Same:
            out += " ";
            break;
        case DiffLine::Kind::Removed:
            out += "-";
            break;
        case DiffLine::Kind::Added:
            out += "+";
            break;
        }
        out += lines[i].text;
        out += "\n";
    }
    if (hidden > 0) {
        out += "@@ " + std::to_string(hidden) + " unchanged line(s) @@\n";
    }
    return out;
}

} // namespace keepsake
