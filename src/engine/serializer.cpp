#include "engine/serializer.hpp"

#include <cctype>
#include <cmath>
#include <set>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "common/errors.hpp"

namespace keepsake {

namespace {

// ---------------------------------------------------------------- json

std::string jsonObjectKey(const Content &key)
{
    switch (key.kind()) {
    case ContentKind::String:
        return key.text();
    case ContentKind::Integer:
        return std::to_string(key.asInteger());
    case ContentKind::Bool:
        return key.asBool() ? "true" : "false";
    default:
        throw SerializationError("json object keys must be strings, integers or bools, got "
                                 + toKindString(key.kind()));
    }
}

void insertUnique(nlohmann::ordered_json &object,
                  const std::string &key,
                  nlohmann::ordered_json value)
{
    if (object.contains(key)) {
        throw SerializationError("duplicate json object key \"" + key + "\"");
    }
    object[key] = std::move(value);
}

nlohmann::ordered_json toJson(const Content &content)
{
    switch (content.kind()) {
    case ContentKind::Nil:
        return nullptr;
    case ContentKind::Bool:
        return content.asBool();
    case ContentKind::Integer:
        return content.asInteger();
    case ContentKind::Float:
        return content.asFloat();
    case ContentKind::String:
        return content.text();
    case ContentKind::Bytes: {
        nlohmann::ordered_json array = nlohmann::ordered_json::array();
        for (std::uint8_t byte : content.byteValues()) {
            array.push_back(static_cast<int>(byte));
        }
        return array;
    }
    case ContentKind::Seq: {
        nlohmann::ordered_json array = nlohmann::ordered_json::array();
        for (const auto &item : content.items()) {
            array.push_back(toJson(item));
        }
        return array;
    }
    case ContentKind::Map: {
        nlohmann::ordered_json object = nlohmann::ordered_json::object();
        for (const auto &entry : content.entries()) {
            insertUnique(object, jsonObjectKey(entry.first), toJson(entry.second));
        }
        return object;
    }
    case ContentKind::Struct: {
        nlohmann::ordered_json object = nlohmann::ordered_json::object();
        for (const auto &field : content.fields()) {
            insertUnique(object, field.first, toJson(field.second));
        }
        return object;
    }
    case ContentKind::Enum: {
        const Content *payload = content.payload();
        if (!payload) {
            return content.variantName();
        }
        nlohmann::ordered_json object = nlohmann::ordered_json::object();
        object[content.variantName()] = toJson(*payload);
        return object;
    }
    }
    return nullptr;
}

std::string renderJson(const Content &content)
{
    const nlohmann::ordered_json document = toJson(content);
    try {
        return document.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error &error) {
        throw SerializationError(error.what());
    }
}

// ---------------------------------------------------------------- yaml

// YAML 1.1 binary integers: [-+]?0b[0-1_]+
bool isYamlBinary(const std::string &value, std::size_t i)
{
    if (value.size() - i < 3 || value[i] != '0' || value[i + 1] != 'b') {
        return false;
    }
    bool digits = false;
    for (std::size_t k = i + 2; k < value.size(); ++k) {
        if (value[k] == '0' || value[k] == '1') {
            digits = true;
        } else if (value[k] != '_') {
            return false;
        }
    }
    return digits;
}

// YAML 1.1 base 60 numbers: [-+]?[1-9][0-9_]*(:[0-5]?[0-9])+ with an optional
// fraction, such as "1:30" or "190:20:30.15".
bool isYamlSexagesimal(const std::string &value, std::size_t i)
{
    if (i >= value.size() || value[i] < '1' || value[i] > '9') {
        return false;
    }
    ++i;
    while (i < value.size()
           && (std::isdigit(static_cast<unsigned char>(value[i])) || value[i] == '_')) {
        ++i;
    }

    bool groups = false;
    while (i < value.size() && value[i] == ':') {
        ++i;
        const std::size_t start = i;
        while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) {
            ++i;
        }
        const std::size_t length = i - start;
        if (length == 0 || length > 2 || (length == 2 && value[start] > '5')) {
            return false;
        }
        groups = true;
    }
    if (!groups) {
        return false;
    }
    if (i < value.size() && value[i] == '.') {
        ++i;
        while (i < value.size()
               && (std::isdigit(static_cast<unsigned char>(value[i])) || value[i] == '_')) {
            ++i;
        }
    }
    return i == value.size();
}

bool isYamlNumber(const std::string &value)
{
    std::size_t i = 0;
    if (value[i] == '+' || value[i] == '-') {
        ++i;
    }
    if (i == value.size()) {
        return false;
    }

    if (isYamlBinary(value, i) || isYamlSexagesimal(value, i)) {
        return true;
    }
    if (value.size() - i > 2 && value[i] == '0'
        && (value[i + 1] == 'x' || value[i + 1] == 'o')) {
        for (std::size_t k = i + 2; k < value.size(); ++k) {
            if (!std::isxdigit(static_cast<unsigned char>(value[k]))) {
                return false;
            }
        }
        return true;
    }

    bool digits = false;
    while (i < value.size()
           && (std::isdigit(static_cast<unsigned char>(value[i])) || value[i] == '_')) {
        digits = digits || value[i] != '_';
        ++i;
    }
    if (i < value.size() && value[i] == '.') {
        ++i;
        while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) {
            digits = true;
            ++i;
        }
    }
    if (!digits) {
        return false;
    }
    if (i < value.size() && (value[i] == 'e' || value[i] == 'E')) {
        ++i;
        if (i < value.size() && (value[i] == '+' || value[i] == '-')) {
            ++i;
        }
        const std::size_t exponentStart = i;
        while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) {
            ++i;
        }
        if (i == exponentStart) {
            return false;
        }
    }
    return i == value.size();
}

// Strings a YAML reader would resolve to null, bool or a number must be
// quoted; everything else is left to the emitter's plain-scalar rules.
bool needsYamlQuotes(const std::string &value)
{
    static const std::set<std::string> kReserved = {
        "~", "null", "Null", "NULL",
        "true", "True", "TRUE", "false", "False", "FALSE",
        "yes", "Yes", "YES", "no", "No", "NO",
        "on", "On", "ON", "off", "Off", "OFF",
        "y", "Y", "n", "N",
        ".nan", ".NaN", ".NAN",
        ".inf", ".Inf", ".INF", "+.inf", "+.Inf", "+.INF", "-.inf", "-.Inf", "-.INF"
    };

    if (value.empty()) {
        return true;
    }
    if (kReserved.count(value) > 0) {
        return true;
    }
    return isYamlNumber(value);
}

std::string yamlFloat(double value)
{
    if (std::isnan(value)) {
        return ".nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? ".inf" : "-.inf";
    }
    return formatFloat(value);
}

void emitYamlString(YAML::Emitter &out, const std::string &value)
{
    if (needsYamlQuotes(value)) {
        out << YAML::DoubleQuoted << value;
    } else {
        out << value;
    }
}

void emitYaml(YAML::Emitter &out, const Content &content)
{
    switch (content.kind()) {
    case ContentKind::Nil:
        out << YAML::Null;
        break;
    case ContentKind::Bool:
        out << content.asBool();
        break;
    case ContentKind::Integer:
        out << static_cast<long long>(content.asInteger());
        break;
    case ContentKind::Float:
        out << yamlFloat(content.asFloat());
        break;
    case ContentKind::String:
        emitYamlString(out, content.text());
        break;
    case ContentKind::Bytes:
        out << YAML::BeginSeq;
        for (std::uint8_t byte : content.byteValues()) {
            out << static_cast<int>(byte);
        }
        out << YAML::EndSeq;
        break;
    case ContentKind::Seq:
        out << YAML::BeginSeq;
        for (const auto &item : content.items()) {
            emitYaml(out, item);
        }
        out << YAML::EndSeq;
        break;
    case ContentKind::Map:
        out << YAML::BeginMap;
        for (const auto &entry : content.entries()) {
            out << YAML::Key;
            emitYaml(out, entry.first);
            out << YAML::Value;
            emitYaml(out, entry.second);
        }
        out << YAML::EndMap;
        break;
    case ContentKind::Struct:
        out << YAML::BeginMap;
        for (const auto &field : content.fields()) {
            out << YAML::Key;
            emitYamlString(out, field.first);
            out << YAML::Value;
            emitYaml(out, field.second);
        }
        out << YAML::EndMap;
        break;
    case ContentKind::Enum:
        if (const Content *payload = content.payload()) {
            out << YAML::BeginMap << YAML::Key;
            emitYamlString(out, content.variantName());
            out << YAML::Value;
            emitYaml(out, *payload);
            out << YAML::EndMap;
        } else {
            emitYamlString(out, content.variantName());
        }
        break;
    }
}

std::string renderYaml(const Content &content)
{
    YAML::Emitter out;
    out.SetIndent(2);
    out.SetNullFormat(YAML::TildeNull);
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetBoolFormat(YAML::LowerCase);
    out.SetMapFormat(YAML::Block);
    out.SetSeqFormat(YAML::Block);

    emitYaml(out, content);
    if (!out.good()) {
        throw SerializationError("yaml emitter: " + out.GetLastError());
    }
    return std::string(out.c_str(), out.size());
}

// ---------------------------------------------------------------- ron

class RonWriter {
public:
    std::string take()
    {
        return std::move(m_out);
    }

    void write(const Content &content, int depth)
    {
        switch (content.kind()) {
        case ContentKind::Nil:
            m_out += "None";
            break;
        case ContentKind::Bool:
            m_out += content.asBool() ? "true" : "false";
            break;
        case ContentKind::Integer:
            m_out += std::to_string(content.asInteger());
            break;
        case ContentKind::Float:
            writeFloat(content.asFloat());
            break;
        case ContentKind::String:
            writeString(content.text());
            break;
        case ContentKind::Bytes: {
            std::vector<Content> items;
            items.reserve(content.byteValues().size());
            for (std::uint8_t byte : content.byteValues()) {
                items.push_back(Content::integer(byte));
            }
            writeList(items, depth);
            break;
        }
        case ContentKind::Seq:
            writeList(content.items(), depth);
            break;
        case ContentKind::Map:
            writeMap(content.entries(), depth);
            break;
        case ContentKind::Struct:
            writeStruct(content.typeName(), content.fields(), depth);
            break;
        case ContentKind::Enum: {
            const Content *payload = content.payload();
            if (!payload) {
                m_out += content.variantName();
            } else if (payload->is(ContentKind::Struct)) {
                writeStruct(content.variantName(), payload->fields(), depth);
            } else {
                m_out += content.variantName();
                m_out += "(";
                write(*payload, depth);
                m_out += ")";
            }
            break;
        }
        }
    }

private:
    void indent(int depth)
    {
        m_out.append(static_cast<std::size_t>(depth) * 2, ' ');
    }

    void writeFloat(double value)
    {
        if (std::isnan(value)) {
            m_out += "NaN";
        } else if (std::isinf(value)) {
            m_out += value > 0 ? "inf" : "-inf";
        } else {
            m_out += formatFloat(value);
        }
    }

    void writeString(const std::string &value)
    {
        try {
            m_out += nlohmann::json(value).dump(-1, ' ', false,
                                                nlohmann::json::error_handler_t::strict);
        } catch (const nlohmann::json::type_error &error) {
            throw SerializationError(error.what());
        }
    }

    void writeList(const std::vector<Content> &items, int depth)
    {
        if (items.empty()) {
            m_out += "[]";
            return;
        }
        m_out += "[\n";
        for (const auto &item : items) {
            indent(depth + 1);
            write(item, depth + 1);
            m_out += ",\n";
        }
        indent(depth);
        m_out += "]";
    }

    void writeMap(const std::vector<Content::Entry> &entries, int depth)
    {
        if (entries.empty()) {
            m_out += "{}";
            return;
        }
        m_out += "{\n";
        for (const auto &entry : entries) {
            indent(depth + 1);
            write(entry.first, depth + 1);
            m_out += ": ";
            write(entry.second, depth + 1);
            m_out += ",\n";
        }
        indent(depth);
        m_out += "}";
    }

    void writeStruct(const std::string &name,
                     const std::vector<Content::Field> &fields,
                     int depth)
    {
        m_out += name;
        if (fields.empty()) {
            m_out += "()";
            return;
        }
        m_out += "(\n";
        for (const auto &field : fields) {
            indent(depth + 1);
            m_out += field.first;
            m_out += ": ";
            write(field.second, depth + 1);
            m_out += ",\n";
        }
        indent(depth);
        m_out += ")";
    }

    std::string m_out;
};

std::string renderRon(const Content &content)
{
    RonWriter writer;
    writer.write(content, 0);
    return writer.take();
}

} // namespace

std::string renderContent(const Content &content, SnapshotFormat format)
{
    switch (format) {
    case SnapshotFormat::Json:
        return renderJson(content);
    case SnapshotFormat::Yaml:
        return renderYaml(content);
    case SnapshotFormat::Ron:
        return renderRon(content);
    }
    throw SerializationError("unknown snapshot format");
}

} // namespace keepsake
