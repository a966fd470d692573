#include "engine/snapshot_file.hpp"

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

#ifndef KEEPSAKE_VERSION
#define KEEPSAKE_VERSION "0.0.0"
#endif

namespace keepsake {

namespace {

constexpr const char *kHeaderDelimiter = "---";

std::string stripCarriageReturn(std::string line)
{
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::string stripTerminator(std::string body)
{
    if (!body.empty() && body.back() == '\n') {
        body.pop_back();
        if (!body.empty() && body.back() == '\r') {
            body.pop_back();
        }
    }
    return body;
}

std::string quoted(const std::string &value)
{
    return nlohmann::json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Reads the next line starting at pos; pos is left after the newline.
bool readLine(const std::string &text, std::size_t &pos, std::string &line)
{
    if (pos >= text.size()) {
        return false;
    }
    const std::size_t end = text.find('\n', pos);
    if (end == std::string::npos) {
        line = text.substr(pos);
        pos = text.size();
    } else {
        line = text.substr(pos, end - pos);
        pos = end + 1;
    }
    line = stripCarriageReturn(line);
    return true;
}

} // namespace

std::string creatorString()
{
    return std::string("keepsake@") + KEEPSAKE_VERSION;
}

std::string serializeSnapshotFile(const SnapshotFile &file)
{
    std::string out;
    out += kHeaderDelimiter;
    out += "\n";
    out += "creator: " + quoted(file.metadata.creator) + "\n";
    out += "source: " + quoted(file.metadata.source) + "\n";
    out += "expression: " + quoted(file.metadata.expression) + "\n";
    out += "snapshot: " + quoted(file.metadata.snapshot) + "\n";
    out += kHeaderDelimiter;
    out += "\n";
    // Exactly one terminator; parseSnapshotFile strips exactly one.
    out += file.contents;
    out += "\n";
    return out;
}

SnapshotFile parseSnapshotFile(const std::string &text)
{
    SnapshotFile file;

    std::size_t pos = 0;
    std::string line;
    if (!readLine(text, pos, line) || line != kHeaderDelimiter) {
        file.contents = text;
        return file;
    }

    nlohmann::json header = nlohmann::json::object();
    bool closed = false;
    while (readLine(text, pos, line)) {
        if (line == kHeaderDelimiter) {
            closed = true;
            break;
        }
        const std::size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = line.substr(0, colon);
        std::string raw = line.substr(colon + 1);
        if (!raw.empty() && raw.front() == ' ') {
            raw.erase(0, 1);
        }
        const nlohmann::json value = nlohmann::json::parse(raw, nullptr, false);
        header[key] = value.is_string() ? value.get<std::string>() : raw;
    }

    if (!closed) {
        file.contents = text;
        return file;
    }

    file.metadata = header.get<SnapshotMetadata>();
    file.contents = stripTerminator(text.substr(pos));
    return file;
}

} // namespace keepsake
