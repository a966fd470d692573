#include "common/content.hpp"

#include <cmath>
#include <cstring>

#include <nlohmann/json.hpp>

namespace keepsake {

namespace {

// Bitwise so that 0.0 and -0.0 (which render differently) are not equal.
bool sameFloat(double a, double b)
{
    std::uint64_t bitsA = 0;
    std::uint64_t bitsB = 0;
    std::memcpy(&bitsA, &a, sizeof(a));
    std::memcpy(&bitsB, &b, sizeof(b));
    return bitsA == bitsB;
}

Content replaceAtDepth(const Content &node,
                       const ContentPath &path,
                       std::size_t depth,
                       const Content &value)
{
    if (depth == path.size()) {
        return value;
    }

    const PathElement &element = path[depth];
    switch (node.kind()) {
    case ContentKind::Seq: {
        if (element.kind != PathElement::Kind::Index
            || element.index >= node.items().size()) {
            return node;
        }
        std::vector<Content> items = node.items();
        items[element.index] = replaceAtDepth(items[element.index], path, depth + 1, value);
        return Content::seq(std::move(items));
    }
    case ContentKind::Map: {
        std::vector<Content::Entry> entries = node.entries();
        for (std::size_t i = 0; i < entries.size(); ++i) {
            if (mapKeyElement(entries[i].first, i) == element) {
                entries[i].second = replaceAtDepth(entries[i].second, path, depth + 1, value);
            }
        }
        return Content::map(std::move(entries));
    }
    case ContentKind::Struct: {
        if (element.kind != PathElement::Kind::Key) {
            return node;
        }
        std::vector<Content::Field> fields = node.fields();
        for (auto &field : fields) {
            if (field.first == element.key) {
                field.second = replaceAtDepth(field.second, path, depth + 1, value);
            }
        }
        return Content::structure(node.typeName(), std::move(fields));
    }
    case ContentKind::Enum: {
        const Content *payload = node.payload();
        if (!payload) {
            return node;
        }
        return Content::variant(node.typeName(),
                                node.variantName(),
                                replaceAtDepth(*payload, path, depth, value));
    }
    default:
        return node;
    }
}

} // namespace

Content Content::nil()
{
    return Content();
}

Content Content::boolean(bool value)
{
    Content c;
    c.m_kind = ContentKind::Bool;
    c.m_bool = value;
    return c;
}

Content Content::integer(std::int64_t value)
{
    Content c;
    c.m_kind = ContentKind::Integer;
    c.m_integer = value;
    return c;
}

Content Content::floating(double value)
{
    Content c;
    c.m_kind = ContentKind::Float;
    c.m_float = value;
    return c;
}

Content Content::string(std::string value)
{
    Content c;
    c.m_kind = ContentKind::String;
    c.m_text = std::move(value);
    return c;
}

Content Content::bytes(std::vector<std::uint8_t> value)
{
    Content c;
    c.m_kind = ContentKind::Bytes;
    c.m_bytes = std::move(value);
    return c;
}

Content Content::seq(std::vector<Content> items)
{
    Content c;
    c.m_kind = ContentKind::Seq;
    c.m_items = std::move(items);
    return c;
}

Content Content::map(std::vector<Entry> entries)
{
    Content c;
    c.m_kind = ContentKind::Map;
    c.m_entries = std::move(entries);
    return c;
}

Content Content::structure(std::string typeName, std::vector<Field> fields)
{
    Content c;
    c.m_kind = ContentKind::Struct;
    c.m_typeName = std::move(typeName);
    c.m_fields = std::move(fields);
    return c;
}

Content Content::unitVariant(std::string typeName, std::string variantName)
{
    Content c;
    c.m_kind = ContentKind::Enum;
    c.m_typeName = std::move(typeName);
    c.m_variantName = std::move(variantName);
    return c;
}

Content Content::variant(std::string typeName, std::string variantName, Content payload)
{
    Content c = unitVariant(std::move(typeName), std::move(variantName));
    c.m_items.push_back(std::move(payload));
    return c;
}

bool Content::isPrimitive() const
{
    return m_kind == ContentKind::Bool
        || m_kind == ContentKind::Integer
        || m_kind == ContentKind::Float
        || m_kind == ContentKind::String;
}

const Content *Content::payload() const
{
    if (m_kind != ContentKind::Enum || m_items.empty()) {
        return nullptr;
    }
    return &m_items.front();
}

bool Content::operator==(const Content &other) const
{
    if (m_kind != other.m_kind) {
        return false;
    }

    switch (m_kind) {
    case ContentKind::Nil:
        return true;
    case ContentKind::Bool:
        return m_bool == other.m_bool;
    case ContentKind::Integer:
        return m_integer == other.m_integer;
    case ContentKind::Float:
        return sameFloat(m_float, other.m_float);
    case ContentKind::String:
        return m_text == other.m_text;
    case ContentKind::Bytes:
        return m_bytes == other.m_bytes;
    case ContentKind::Seq:
        return m_items == other.m_items;
    case ContentKind::Map:
        return m_entries == other.m_entries;
    case ContentKind::Struct:
        return m_typeName == other.m_typeName && m_fields == other.m_fields;
    case ContentKind::Enum:
        return m_typeName == other.m_typeName
            && m_variantName == other.m_variantName
            && m_items == other.m_items;
    }
    return false;
}

PathElement PathElement::keyed(std::string key)
{
    PathElement element;
    element.kind = Kind::Key;
    element.key = std::move(key);
    return element;
}

PathElement PathElement::indexed(std::size_t index)
{
    PathElement element;
    element.kind = Kind::Index;
    element.index = index;
    return element;
}

PathElement PathElement::entry(std::size_t ordinal)
{
    PathElement element;
    element.kind = Kind::Entry;
    element.index = ordinal;
    return element;
}

bool PathElement::operator==(const PathElement &other) const
{
    if (kind != other.kind) {
        return false;
    }
    if (kind == Kind::Key) {
        return key == other.key;
    }
    return index == other.index;
}

std::string toKindString(ContentKind kind)
{
    switch (kind) {
    case ContentKind::Nil:
        return "nil";
    case ContentKind::Bool:
        return "bool";
    case ContentKind::Integer:
        return "integer";
    case ContentKind::Float:
        return "float";
    case ContentKind::String:
        return "string";
    case ContentKind::Bytes:
        return "bytes";
    case ContentKind::Seq:
        return "seq";
    case ContentKind::Map:
        return "map";
    case ContentKind::Struct:
        return "struct";
    case ContentKind::Enum:
        return "enum";
    }
    return "nil";
}

std::string pathToString(const ContentPath &path)
{
    if (path.empty()) {
        return ".";
    }

    std::string out;
    for (const auto &element : path) {
        switch (element.kind) {
        case PathElement::Kind::Key:
            out += "." + element.key;
            break;
        case PathElement::Kind::Index:
            out += "[" + std::to_string(element.index) + "]";
            break;
        case PathElement::Kind::Entry:
            out += "[#" + std::to_string(element.index) + "]";
            break;
        }
    }
    return out;
}

std::string formatFloat(double value)
{
    return nlohmann::json(value).dump();
}

PathElement mapKeyElement(const Content &key, std::size_t ordinal)
{
    switch (key.kind()) {
    case ContentKind::String:
        return PathElement::keyed(key.text());
    case ContentKind::Integer:
        if (key.asInteger() >= 0) {
            return PathElement::indexed(static_cast<std::size_t>(key.asInteger()));
        }
        return PathElement::keyed(std::to_string(key.asInteger()));
    case ContentKind::Bool:
        return PathElement::keyed(key.asBool() ? "true" : "false");
    case ContentKind::Float:
        if (std::isfinite(key.asFloat())) {
            return PathElement::keyed(formatFloat(key.asFloat()));
        }
        return PathElement::entry(ordinal);
    default:
        return PathElement::entry(ordinal);
    }
}

Content replaceAt(const Content &tree, const ContentPath &path, const Content &value)
{
    return replaceAtDepth(tree, path, 0, value);
}

} // namespace keepsake
