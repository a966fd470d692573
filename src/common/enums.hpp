#pragma once

namespace keepsake {

enum class ContentKind {
    Nil,
    Bool,
    Integer,
    Float,
    String,
    Bytes,
    Seq,
    Map,
    Struct,
    Enum
};

enum class SnapshotFormat {
    Json,
    Yaml,
    Ron
};

enum class CompareResult {
    Equal,
    Different
};

enum class AssertionStatus {
    Passed,
    Failed,
    Updated
};

} // namespace keepsake
