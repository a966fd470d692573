#pragma once

#include <string>
#include <vector>

#include "common/content.hpp"
#include "engine/selector.hpp"

namespace keepsake {

// A selector paired with the primitive value that replaces every node it
// matches.
class RedactionRule {
public:
    // Throws std::invalid_argument unless replacement is a bool, integer,
    // float or string.
    RedactionRule(Selector selector, Content replacement);

    // Parses selectorText first; throws SelectorParseError.
    static RedactionRule compile(const std::string &selectorText, Content replacement);

    const Selector &selector() const { return m_selector; }
    const Content &replacement() const { return m_replacement; }

private:
    Selector m_selector;
    Content m_replacement;
};

// Returns a redacted copy of tree. Rules are tried in declaration order and
// the last rule matching a node wins; matched nodes are replaced whole, so
// neither their children nor the replacement are visited again. Rules that
// match nothing are ignored.
Content applyRedactions(const Content &tree, const std::vector<RedactionRule> &rules);

} // namespace keepsake
