#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace keepsake {

inline std::string toFormatString(SnapshotFormat format)
{
    switch (format) {
    case SnapshotFormat::Json:
        return "json";
    case SnapshotFormat::Yaml:
        return "yaml";
    case SnapshotFormat::Ron:
        return "ron";
    }
    return "yaml";
}

inline void to_json(nlohmann::json &j, const SnapshotMetadata &metadata)
{
    j = nlohmann::json{
        {"creator", metadata.creator},
        {"source", metadata.source},
        {"expression", metadata.expression},
        {"snapshot", metadata.snapshot}
    };
}

inline void from_json(const nlohmann::json &j, SnapshotMetadata &metadata)
{
    metadata.creator = j.value("creator", "");
    metadata.source = j.value("source", "");
    metadata.expression = j.value("expression", "");
    metadata.snapshot = j.value("snapshot", "");
}

inline void to_json(nlohmann::json &j, const PendingSnapshot &pending)
{
    j = nlohmann::json{
        {"pendingPath", pending.pendingPath},
        {"baselinePath", pending.baselinePath},
        {"baselineExists", pending.baselineExists},
        {"metadata", pending.metadata}
    };
}

} // namespace keepsake
