#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/content.hpp"

namespace keepsake {

// Compiled path expression, e.g. ".users[0].password", "*.id", "**.token",
// ".\"key.with.dots\"". Parsing is pure; matching works on ContentPaths.
class Selector {
public:
    struct Segment {
        enum class Kind {
            Key,
            Index,
            Wildcard,
            RecursiveWildcard
        };

        Kind kind = Kind::Key;
        std::string key;
        std::size_t index = 0;
    };

    // Throws SelectorParseError.
    static Selector parse(const std::string &text);

    const std::vector<Segment> &segments() const { return m_segments; }

    // Key and Index match one element exactly, "*" any one element, "**"
    // zero or more elements.
    bool matches(const ContentPath &path) const;

    std::string toString() const;

private:
    std::vector<Segment> m_segments;
};

} // namespace keepsake
