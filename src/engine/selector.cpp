#include "engine/selector.hpp"

#include <cctype>
#include <limits>

#include "common/errors.hpp"

namespace keepsake {

namespace {

bool isIdentifierStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentifierChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool isPlainIdentifier(const std::string &key)
{
    if (key.empty() || !isIdentifierStart(key.front())) {
        return false;
    }
    for (char c : key) {
        if (!isIdentifierChar(c)) {
            return false;
        }
    }
    return true;
}

// Recursive descent over the selector grammar:
//   path    := ["."] segment ("." segment | bracket)*
//   segment := identifier | quoted | integer | "*" | "**" | bracket
//   bracket := "[" (integer | quoted) "]"
class SelectorParser {
public:
    explicit SelectorParser(const std::string &text)
        : m_text(text)
    {
    }

    std::vector<Selector::Segment> run()
    {
        if (m_text.empty()) {
            throw SelectorParseError(0, "empty selector");
        }
        if (m_text.front() == '.') {
            ++m_pos;
        }

        std::vector<Selector::Segment> segments;
        segments.push_back(parseSegment());
        while (!atEnd()) {
            const char c = m_text[m_pos];
            if (c == '[') {
                segments.push_back(parseBracket());
                continue;
            }
            if (c != '.') {
                throw SelectorParseError(m_pos,
                                         std::string("expected '.' but found '") + c + "'");
            }
            ++m_pos;
            if (atEnd()) {
                throw SelectorParseError(m_pos - 1, "trailing separator");
            }
            segments.push_back(parseSegment());
        }
        return segments;
    }

private:
    bool atEnd() const
    {
        return m_pos >= m_text.size();
    }

    Selector::Segment parseSegment()
    {
        if (atEnd() || m_text[m_pos] == '.') {
            throw SelectorParseError(m_pos, "empty segment");
        }

        const char c = m_text[m_pos];
        Selector::Segment segment;
        if (c == '[') {
            return parseBracket();
        }
        if (c == '"') {
            segment.kind = Selector::Segment::Kind::Key;
            segment.key = parseQuoted();
            return segment;
        }
        if (c == '*') {
            ++m_pos;
            segment.kind = Selector::Segment::Kind::Wildcard;
            if (!atEnd() && m_text[m_pos] == '*') {
                ++m_pos;
                segment.kind = Selector::Segment::Kind::RecursiveWildcard;
            }
            return segment;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
            segment.kind = Selector::Segment::Kind::Index;
            segment.index = parseInteger();
            return segment;
        }
        if (isIdentifierStart(c)) {
            const std::size_t start = m_pos;
            while (!atEnd() && isIdentifierChar(m_text[m_pos])) {
                ++m_pos;
            }
            segment.kind = Selector::Segment::Kind::Key;
            segment.key = m_text.substr(start, m_pos - start);
            return segment;
        }
        throw SelectorParseError(m_pos, std::string("unexpected character '") + c + "'");
    }

    Selector::Segment parseBracket()
    {
        const std::size_t start = m_pos;
        ++m_pos;
        if (atEnd()) {
            throw SelectorParseError(start, "unterminated bracket");
        }

        Selector::Segment segment;
        const char c = m_text[m_pos];
        if (c == ']') {
            throw SelectorParseError(start, "empty segment");
        }
        if (c == '"') {
            segment.kind = Selector::Segment::Kind::Key;
            segment.key = parseQuoted();
        } else if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
            segment.kind = Selector::Segment::Kind::Index;
            segment.index = parseInteger();
        } else {
            throw SelectorParseError(m_pos, "expected integer or quoted key in brackets");
        }

        if (atEnd() || m_text[m_pos] != ']') {
            throw SelectorParseError(start, "unterminated bracket");
        }
        ++m_pos;
        return segment;
    }

    std::string parseQuoted()
    {
        const std::size_t start = m_pos;
        ++m_pos;
        std::string out;
        while (!atEnd()) {
            const char c = m_text[m_pos];
            if (c == '\\') {
                if (m_pos + 1 >= m_text.size()) {
                    break;
                }
                const char next = m_text[m_pos + 1];
                if (next != '"' && next != '\\') {
                    throw SelectorParseError(m_pos, "invalid escape sequence");
                }
                out += next;
                m_pos += 2;
                continue;
            }
            if (c == '"') {
                ++m_pos;
                return out;
            }
            out += c;
            ++m_pos;
        }
        throw SelectorParseError(start, "unterminated quote");
    }

    std::size_t parseInteger()
    {
        const std::size_t start = m_pos;
        if (m_text[m_pos] == '-') {
            ++m_pos;
        }
        while (!atEnd() && isIdentifierChar(m_text[m_pos])) {
            ++m_pos;
        }
        const std::string token = m_text.substr(start, m_pos - start);

        std::size_t value = 0;
        constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
        for (char c : token) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw SelectorParseError(start, "invalid integer '" + token + "'");
            }
            const std::size_t digit = static_cast<std::size_t>(c - '0');
            if (value > (kMax - digit) / 10) {
                throw SelectorParseError(start, "invalid integer '" + token + "' (out of range)");
            }
            value = value * 10 + digit;
        }
        return value;
    }

    const std::string &m_text;
    std::size_t m_pos = 0;
};

bool matchFrom(const std::vector<Selector::Segment> &segments,
               std::size_t segmentIndex,
               const ContentPath &path,
               std::size_t pathIndex)
{
    if (segmentIndex == segments.size()) {
        return pathIndex == path.size();
    }

    const Selector::Segment &segment = segments[segmentIndex];
    if (segment.kind == Selector::Segment::Kind::RecursiveWildcard) {
        for (std::size_t next = pathIndex; next <= path.size(); ++next) {
            if (matchFrom(segments, segmentIndex + 1, path, next)) {
                return true;
            }
        }
        return false;
    }

    if (pathIndex == path.size()) {
        return false;
    }

    const PathElement &element = path[pathIndex];
    switch (segment.kind) {
    case Selector::Segment::Kind::Wildcard:
        break;
    case Selector::Segment::Kind::Key:
        if (element.kind != PathElement::Kind::Key || element.key != segment.key) {
            return false;
        }
        break;
    case Selector::Segment::Kind::Index:
        if (element.kind != PathElement::Kind::Index || element.index != segment.index) {
            return false;
        }
        break;
    case Selector::Segment::Kind::RecursiveWildcard:
        break;
    }
    return matchFrom(segments, segmentIndex + 1, path, pathIndex + 1);
}

} // namespace

Selector Selector::parse(const std::string &text)
{
    Selector selector;
    selector.m_segments = SelectorParser(text).run();
    return selector;
}

bool Selector::matches(const ContentPath &path) const
{
    return matchFrom(m_segments, 0, path, 0);
}

std::string Selector::toString() const
{
    std::string out;
    for (const auto &segment : m_segments) {
        out += ".";
        switch (segment.kind) {
        case Segment::Kind::Key:
            if (isPlainIdentifier(segment.key)) {
                out += segment.key;
            } else {
                out += "\"";
                for (char c : segment.key) {
                    if (c == '"' || c == '\\') {
                        out += '\\';
                    }
                    out += c;
                }
                out += "\"";
            }
            break;
        case Segment::Kind::Index:
            out += std::to_string(segment.index);
            break;
        case Segment::Kind::Wildcard:
            out += "*";
            break;
        case Segment::Kind::RecursiveWildcard:
            out += "**";
            break;
        }
    }
    return out;
}

} // namespace keepsake
