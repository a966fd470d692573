#include "engine/redaction.hpp"

#include <stdexcept>
#include <utility>

namespace keepsake {

namespace {

const Content *lastMatchingReplacement(const std::vector<RedactionRule> &rules,
                                       const ContentPath &path)
{
    const Content *match = nullptr;
    for (const auto &rule : rules) {
        if (rule.selector().matches(path)) {
            match = &rule.replacement();
        }
    }
    return match;
}

// Rebuilds node with its redacted children in a single pre-order pass.
Content redactNode(const Content &node, ContentPath &path, const std::vector<RedactionRule> &rules)
{
    if (const Content *value = lastMatchingReplacement(rules, path)) {
        return *value;
    }

    switch (node.kind()) {
    case ContentKind::Seq: {
        std::vector<Content> items;
        items.reserve(node.items().size());
        for (std::size_t i = 0; i < node.items().size(); ++i) {
            path.push_back(PathElement::indexed(i));
            items.push_back(redactNode(node.items()[i], path, rules));
            path.pop_back();
        }
        return Content::seq(std::move(items));
    }
    case ContentKind::Map: {
        std::vector<Content::Entry> entries;
        entries.reserve(node.entries().size());
        for (std::size_t i = 0; i < node.entries().size(); ++i) {
            const auto &entry = node.entries()[i];
            path.push_back(mapKeyElement(entry.first, i));
            entries.emplace_back(entry.first, redactNode(entry.second, path, rules));
            path.pop_back();
        }
        return Content::map(std::move(entries));
    }
    case ContentKind::Struct: {
        std::vector<Content::Field> fields;
        fields.reserve(node.fields().size());
        for (const auto &field : node.fields()) {
            path.push_back(PathElement::keyed(field.first));
            fields.emplace_back(field.first, redactNode(field.second, path, rules));
            path.pop_back();
        }
        return Content::structure(node.typeName(), std::move(fields));
    }
    case ContentKind::Enum:
        // The payload sits at the enum's own path.
        if (const Content *payload = node.payload()) {
            return Content::variant(node.typeName(), node.variantName(),
                                    redactNode(*payload, path, rules));
        }
        return node;
    default:
        return node;
    }
}

} // namespace

RedactionRule::RedactionRule(Selector selector, Content replacement)
    : m_selector(std::move(selector))
    , m_replacement(std::move(replacement))
{
    if (!m_replacement.isPrimitive()) {
        throw std::invalid_argument("redaction replacement must be a bool, integer, float or string, got "
                                    + toKindString(m_replacement.kind()));
    }
}

RedactionRule RedactionRule::compile(const std::string &selectorText, Content replacement)
{
    return RedactionRule(Selector::parse(selectorText), std::move(replacement));
}

Content applyRedactions(const Content &tree, const std::vector<RedactionRule> &rules)
{
    if (rules.empty()) {
        return tree;
    }

    ContentPath path;
    return redactNode(tree, path, rules);
}

} // namespace keepsake
