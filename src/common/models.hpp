#pragma once

#include <cstdint>
#include <string>

#include "common/enums.hpp"

namespace keepsake {

// Identifies one snapshot slot. Supplied by the caller; the call-site macros
// fill in file, line and the running test function.
struct SnapshotIdentity {
    // Logical root relative source files are resolved against. Empty means
    // the store's own root.
    std::string workspaceRoot;
    std::string modulePath;
    std::string sourceFile;
    int line = 0;
    // Optional; defaults to "<source stem>-<line>".
    std::string name;
    // Source text of the asserted expression. Diagnostic only.
    std::string expression;
};

struct SnapshotLocation {
    std::string path;
    std::string snapshotName;
    // 1 for the first resolution of a path within a store, then 2, 3, ...
    std::uint32_t sequence = 1;
};

// Header of a snapshot file. Informational; never compared.
struct SnapshotMetadata {
    std::string creator;
    std::string source;
    std::string expression;
    std::string snapshot;
};

struct SnapshotFile {
    SnapshotMetadata metadata;
    std::string contents;
};

struct AssertionOutcome {
    AssertionStatus status = AssertionStatus::Failed;
    SnapshotIdentity identity;
    std::string snapshotName;
    std::string baselinePath;
    // Set for Failed outcomes only.
    std::string pendingPath;
    std::string rendered;
    std::string diff;
    bool baselineMissing = false;

    bool passed() const { return status != AssertionStatus::Failed; }
    // Human readable report used by the test harness on failure.
    std::string describe() const;
};

struct PendingSnapshot {
    std::string pendingPath;
    std::string baselinePath;
    bool baselineExists = false;
    SnapshotMetadata metadata;
};

} // namespace keepsake
