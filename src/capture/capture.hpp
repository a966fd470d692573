#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QList>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/content.hpp"
#include "common/errors.hpp"

namespace keepsake {

// Turns a native value into a Content tree.
//
// Supported out of the box: bool, integers, floating point, char, strings,
// QString, QByteArray (as bytes), std::optional, std::vector, QList,
// std::map (in map order), std::pair, nlohmann::json / ordered_json and
// Content itself. Other types provide
//
//     void to_content(keepsake::Content &out, const MyType &value);
//
// in their own namespace (found by argument-dependent lookup), usually built
// with StructBuilder so the field order is explicit. Values the model cannot
// represent throw CaptureError; types without a to_content overload fail to
// compile.
template <typename T>
Content capture(const T &value);

inline void to_content(Content &out, const Content &value)
{
    out = value;
}

inline void to_content(Content &out, std::nullptr_t)
{
    out = Content::nil();
}

inline void to_content(Content &out, bool value)
{
    out = Content::boolean(value);
}

inline void to_content(Content &out, char value)
{
    out = Content::string(std::string(1, value));
}

template <typename T,
          std::enable_if_t<std::is_integral<T>::value
                               && !std::is_same<T, bool>::value
                               && !std::is_same<T, char>::value,
                           int> = 0>
void to_content(Content &out, T value)
{
    if constexpr (std::is_unsigned<T>::value) {
        constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (static_cast<std::uint64_t>(value) > kMax) {
            throw CaptureError("unsigned value " + std::to_string(value)
                               + " does not fit a signed 64-bit integer");
        }
    }
    out = Content::integer(static_cast<std::int64_t>(value));
}

template <typename T, std::enable_if_t<std::is_floating_point<T>::value, int> = 0>
void to_content(Content &out, T value)
{
    out = Content::floating(static_cast<double>(value));
}

inline void to_content(Content &out, const std::string &value)
{
    out = Content::string(value);
}

inline void to_content(Content &out, std::string_view value)
{
    out = Content::string(std::string(value));
}

inline void to_content(Content &out, const char *value)
{
    out = value ? Content::string(value) : Content::nil();
}

void to_content(Content &out, const QString &value);
void to_content(Content &out, const QByteArray &value);

template <typename T>
void to_content(Content &out, const std::optional<T> &value)
{
    out = value ? capture(*value) : Content::nil();
}

template <typename A, typename B>
void to_content(Content &out, const std::pair<A, B> &value)
{
    out = Content::seq({capture(value.first), capture(value.second)});
}

template <typename T, typename Alloc>
void to_content(Content &out, const std::vector<T, Alloc> &values)
{
    std::vector<Content> items;
    items.reserve(values.size());
    for (const auto &value : values) {
        items.push_back(capture(value));
    }
    out = Content::seq(std::move(items));
}

template <typename T>
void to_content(Content &out, const QList<T> &values)
{
    std::vector<Content> items;
    items.reserve(static_cast<std::size_t>(values.size()));
    for (const auto &value : values) {
        items.push_back(capture(value));
    }
    out = Content::seq(std::move(items));
}

template <typename K, typename V, typename Compare, typename Alloc>
void to_content(Content &out, const std::map<K, V, Compare, Alloc> &values)
{
    std::vector<Content::Entry> entries;
    entries.reserve(values.size());
    for (const auto &item : values) {
        entries.emplace_back(capture(item.first), capture(item.second));
    }
    out = Content::map(std::move(entries));
}

// nlohmann::json objects come out in key order, ordered_json objects in
// insertion order. Discarded values throw CaptureError.
template <typename Json,
          std::enable_if_t<std::is_same<Json, nlohmann::json>::value
                               || std::is_same<Json, nlohmann::ordered_json>::value,
                           int> = 0>
void to_content(Content &out, const Json &value)
{
    switch (value.type()) {
    case nlohmann::json::value_t::null:
        out = Content::nil();
        return;
    case nlohmann::json::value_t::boolean:
        out = Content::boolean(value.template get<bool>());
        return;
    case nlohmann::json::value_t::number_integer:
        out = Content::integer(value.template get<std::int64_t>());
        return;
    case nlohmann::json::value_t::number_unsigned:
        to_content(out, value.template get<std::uint64_t>());
        return;
    case nlohmann::json::value_t::number_float:
        out = Content::floating(value.template get<double>());
        return;
    case nlohmann::json::value_t::string:
        out = Content::string(value.template get<std::string>());
        return;
    case nlohmann::json::value_t::binary: {
        const auto &binary = value.get_binary();
        out = Content::bytes(std::vector<std::uint8_t>(binary.begin(), binary.end()));
        return;
    }
    case nlohmann::json::value_t::array: {
        std::vector<Content> items;
        items.reserve(value.size());
        for (const auto &item : value) {
            items.push_back(capture(item));
        }
        out = Content::seq(std::move(items));
        return;
    }
    case nlohmann::json::value_t::object: {
        std::vector<Content::Entry> entries;
        entries.reserve(value.size());
        for (const auto &item : value.items()) {
            entries.emplace_back(Content::string(item.key()), capture(item.value()));
        }
        out = Content::map(std::move(entries));
        return;
    }
    case nlohmann::json::value_t::discarded:
        break;
    }
    throw CaptureError("discarded json value cannot be captured");
}

template <typename T>
Content capture(const T &value)
{
    Content content;
    to_content(content, value);
    return content;
}

// Builds a Struct node with fields in the order they are added.
class StructBuilder {
public:
    explicit StructBuilder(std::string typeName);

    template <typename T>
    StructBuilder &field(std::string name, const T &value)
    {
        m_fields.emplace_back(std::move(name), capture(value));
        return *this;
    }

    Content build() const;

private:
    std::string m_typeName;
    std::vector<Content::Field> m_fields;
};

// Builds a Map node with entries in insertion order.
class MapBuilder {
public:
    template <typename K, typename V>
    MapBuilder &entry(const K &key, const V &value)
    {
        m_entries.emplace_back(capture(key), capture(value));
        return *this;
    }

    Content build() const;

private:
    std::vector<Content::Entry> m_entries;
};

} // namespace keepsake
