#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace keepsake {

// Raised by Selector::parse. Position is a 0-based byte offset into the
// selector text.
class SelectorParseError : public std::runtime_error {
public:
    SelectorParseError(std::size_t position, const std::string &reason)
        : std::runtime_error("invalid selector at position "
                             + std::to_string(position) + ": " + reason)
        , m_position(position)
        , m_reason(reason)
    {
    }

    std::size_t position() const { return m_position; }
    const std::string &reason() const { return m_reason; }

private:
    std::size_t m_position;
    std::string m_reason;
};

// The content tree cannot be expressed in the requested snapshot format.
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string &reason)
        : std::runtime_error("serialization failed: " + reason)
    {
    }
};

// A native value has a shape the content model cannot represent.
class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string &reason)
        : std::runtime_error("capture failed: " + reason)
    {
    }
};

class IoError : public std::runtime_error {
public:
    IoError(const std::string &path, const std::string &cause)
        : std::runtime_error(path + ": " + cause)
        , m_path(path)
        , m_cause(cause)
    {
    }

    const std::string &path() const { return m_path; }
    const std::string &cause() const { return m_cause; }

private:
    std::string m_path;
    std::string m_cause;
};

} // namespace keepsake
