#pragma once

#include <string>
#include <vector>

#include "common/content.hpp"
#include "common/models.hpp"
#include "engine/snapshot_store.hpp"

namespace keepsake {

// Uncompiled redaction: selector text plus primitive replacement.
struct Redaction {
    std::string selector;
    Content replacement;
};

// Runs one snapshot assertion end to end:
//   Start     compile redaction selectors (SelectorParseError, no I/O yet)
//   Rendered  redact, then render (SerializationError, no I/O yet)
//   Compared  resolve the identity and compare against the baseline
// and settles in Passed, Failed (pending snapshot written, diff attached) or
// Updated (baseline overwritten, update mode only).
class AssertionCoordinator {
public:
    explicit AssertionCoordinator(SnapshotStore &store);

    AssertionOutcome assertSnapshot(const SnapshotIdentity &identity,
                                    const Content &value,
                                    const std::vector<Redaction> &redactions,
                                    SnapshotFormat format,
                                    bool updateMode);

    // Snapshot of already rendered text; no redaction, no serialization.
    AssertionOutcome assertText(const SnapshotIdentity &identity,
                                const std::string &text,
                                bool updateMode);

private:
    AssertionOutcome compareRendered(const SnapshotIdentity &identity,
                                     const std::string &rendered,
                                     bool updateMode);

    SnapshotStore &m_store;
};

} // namespace keepsake
