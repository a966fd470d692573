#pragma once

#include <QString>
#include <QStringList>

#include "engine/snapshot_store.hpp"

namespace keepsake {

class ReviewCli
{
public:
    // CLI dispatcher for reviewing pending snapshots.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand works on the filesystem through SnapshotStore and
    // renders output in the chosen format.
    int runList(const QStringList &args);
    int runShow(const QStringList &args);
    int runAccept(const QStringList &args);
    int runReject(const QStringList &args);

    QString rootDir(const QStringList &args) const;

    SnapshotStore m_store;
};

} // namespace keepsake
