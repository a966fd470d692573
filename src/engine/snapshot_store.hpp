#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace keepsake {

// SnapshotStore owns everything that touches the filesystem: mapping
// identities to snapshot paths, reading baselines and atomically writing
// baselines and pending snapshots.
//
// The per-path sequence counter used to disambiguate repeated identities is
// the only mutable state. It lives as long as the store and is only reset by
// resetSequences(); resolve() is safe to call from several threads.
class SnapshotStore {
public:
    // Root used for identities that do not carry their own workspace root.
    // Empty means the current directory.
    explicit SnapshotStore(std::string workspaceRoot = {});
    ~SnapshotStore();

    SnapshotStore(const SnapshotStore &) = delete;
    SnapshotStore &operator=(const SnapshotStore &) = delete;

    // <root>/<source dir>/snapshots/<module>__<name>[-<seq>].snap
    SnapshotLocation resolve(const SnapshotIdentity &identity);
    void resetSequences();

    // std::nullopt when no baseline exists; throws IoError when it exists but
    // cannot be read.
    std::optional<SnapshotFile> loadBaseline(const std::string &path) const;

    // Compares snapshot bodies, ignoring CRLF vs LF and trailing whitespace at
    // the end of the text.
    static CompareResult compare(const std::string &baseline, const std::string &rendered);

    static std::string pendingPathFor(const std::string &baselinePath);

    // Both writes go through a temporary file that is renamed into place, so
    // readers never observe partial content. Throw IoError.
    std::string writePending(const std::string &baselinePath, const SnapshotFile &file) const;
    void writeBaseline(const std::string &path, const SnapshotFile &file) const;

    // Review operations. Pending snapshots are returned sorted by path.
    std::vector<PendingSnapshot> listPending(const std::string &rootDir) const;
    void acceptPending(const std::string &pendingPath) const;
    void rejectPending(const std::string &pendingPath) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace keepsake
