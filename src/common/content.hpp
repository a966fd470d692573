#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "common/enums.hpp"

namespace keepsake {

// Content is the format-agnostic tree every captured value is turned into
// before it is redacted and rendered. Nodes are built through the static
// factories and never modified afterwards; transformations return new trees.
class Content {
public:
    using Entry = std::pair<Content, Content>;
    using Field = std::pair<std::string, Content>;

    Content() = default;

    static Content nil();
    static Content boolean(bool value);
    static Content integer(std::int64_t value);
    static Content floating(double value);
    static Content string(std::string value);
    static Content bytes(std::vector<std::uint8_t> value);
    static Content seq(std::vector<Content> items);
    // Entries keep insertion order; duplicate keys are kept as given.
    static Content map(std::vector<Entry> entries);
    static Content structure(std::string typeName, std::vector<Field> fields);
    static Content unitVariant(std::string typeName, std::string variantName);
    static Content variant(std::string typeName, std::string variantName, Content payload);

    ContentKind kind() const { return m_kind; }
    bool is(ContentKind kind) const { return m_kind == kind; }

    // Bool, Integer, Float or String: the only kinds usable as a redaction
    // replacement.
    bool isPrimitive() const;

    bool asBool() const { return m_bool; }
    std::int64_t asInteger() const { return m_integer; }
    double asFloat() const { return m_float; }
    const std::string &text() const { return m_text; }
    const std::vector<std::uint8_t> &byteValues() const { return m_bytes; }

    const std::vector<Content> &items() const { return m_items; }
    const std::vector<Entry> &entries() const { return m_entries; }
    const std::vector<Field> &fields() const { return m_fields; }

    // Struct and Enum.
    const std::string &typeName() const { return m_typeName; }
    const std::string &variantName() const { return m_variantName; }
    // nullptr for unit variants and every non-Enum node.
    const Content *payload() const;

    bool operator==(const Content &other) const;
    bool operator!=(const Content &other) const { return !(*this == other); }

private:
    ContentKind m_kind = ContentKind::Nil;
    bool m_bool = false;
    std::int64_t m_integer = 0;
    double m_float = 0.0;
    std::string m_text;
    std::string m_typeName;
    std::string m_variantName;
    std::vector<std::uint8_t> m_bytes;
    // Seq items; holds the single payload of a non-unit Enum.
    std::vector<Content> m_items;
    std::vector<Entry> m_entries;
    std::vector<Field> m_fields;
};

// One step of a ContentPath. Map entries keyed by a string (or by a bool,
// negative integer or float, using the scalar's text) are Keys, entries keyed
// by a non-negative integer are Indexes. Entries whose key is a composite or
// nil value are addressed by their ordinal and only wildcards reach them.
struct PathElement {
    enum class Kind {
        Key,
        Index,
        Entry
    };

    Kind kind = Kind::Key;
    std::string key;
    std::size_t index = 0;

    static PathElement keyed(std::string key);
    static PathElement indexed(std::size_t index);
    static PathElement entry(std::size_t ordinal);

    bool operator==(const PathElement &other) const;
};

using ContentPath = std::vector<PathElement>;

std::string toKindString(ContentKind kind);
std::string pathToString(const ContentPath &path);

// Shortest round-trippable decimal form; integral values keep a ".0".
// Non-finite values are the caller's business.
std::string formatFloat(double value);

// The element a map entry key is addressed by; ordinal is the entry position.
PathElement mapKeyElement(const Content &key, std::size_t ordinal);

// Returns a copy of tree with every node addressed by path replaced by value.
// Enum nodes are transparent: their payload sits at the enum's own path. A
// path that does not resolve leaves the copy unchanged.
Content replaceAt(const Content &tree, const ContentPath &path, const Content &value);

} // namespace keepsake
