#include "engine/snapshot_store.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "engine/snapshot_file.hpp"

namespace keepsake {

namespace {

constexpr const char *kSnapshotDirName = "snapshots";
constexpr const char *kSnapshotExtension = ".snap";
constexpr const char *kPendingSuffix = ".new";

constexpr char kSequenceSeparator = '~';

void appendEscaped(std::string &out, unsigned char c)
{
    static const char kHex[] = "0123456789ABCDEF";
    out += '%';
    out += kHex[c >> 4];
    out += kHex[c & 0x0F];
}

// One-to-one file name encoding: [A-Za-z0-9_.-] pass through, every other
// byte becomes %XX. The sequence separator is therefore never produced.
std::string encodeName(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '_' || c == '-' || c == '.') {
            out += c;
        } else {
            appendEscaped(out, byte);
        }
    }
    return out;
}

// Like encodeName, but a '_' that starts a "__" run or ends the module is
// escaped too, so the first "__" of "<module>__<name>" is the separator.
std::string encodeModule(const std::string &value)
{
    const std::string plain = encodeName(value);
    std::string out;
    out.reserve(plain.size());
    for (std::size_t i = 0; i < plain.size(); ++i) {
        const bool last = i + 1 == plain.size();
        if (plain[i] == '_' && (last || plain[i + 1] == '_')) {
            appendEscaped(out, '_');
        } else {
            out += plain[i];
        }
    }
    return out;
}

std::string normalizeBody(std::string text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        out += text[i];
    }
    while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) {
        out.pop_back();
    }
    return out;
}

QByteArray readAllOrThrow(const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        throw IoError(path, file.errorString().toStdString());
    }
    return file.readAll();
}

void writeAtomically(const std::string &path, const QByteArray &data)
{
    const QString qpath = QString::fromStdString(path);
    const QString dir = QFileInfo(qpath).absolutePath();
    if (!QDir().mkpath(dir)) {
        throw IoError(path, "cannot create directory " + dir.toStdString());
    }

    QSaveFile file(qpath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw IoError(path, file.errorString().toStdString());
    }
    if (file.write(data) != data.size()) {
        const std::string cause = file.errorString().toStdString();
        file.cancelWriting();
        throw IoError(path, cause);
    }
    if (!file.commit()) {
        throw IoError(path, file.errorString().toStdString());
    }
}

} // namespace

struct SnapshotStore::Impl {
    std::string workspaceRoot;
    std::mutex mutex;
    std::map<std::string, std::uint32_t> sequences;
};

SnapshotStore::SnapshotStore(std::string workspaceRoot)
    : impl(std::make_unique<Impl>())
{
    impl->workspaceRoot = std::move(workspaceRoot);
}

SnapshotStore::~SnapshotStore() = default;

SnapshotLocation SnapshotStore::resolve(const SnapshotIdentity &identity)
{
    QString root = QString::fromStdString(
        identity.workspaceRoot.empty() ? impl->workspaceRoot : identity.workspaceRoot);
    if (root.isEmpty()) {
        root = QDir::currentPath();
    }

    const QFileInfo sourceInfo(QString::fromStdString(identity.sourceFile));
    const QString snapshotDir = QDir::cleanPath(
        QDir(root).filePath(sourceInfo.path()) + QDir::separator() + kSnapshotDirName);

    std::string name = identity.name;
    if (name.empty()) {
        name = sourceInfo.completeBaseName().toStdString() + "-" + std::to_string(identity.line);
    }
    std::string baseName = encodeName(name);
    const std::string module = encodeModule(identity.modulePath);
    if (!module.empty()) {
        baseName = module + "__" + baseName;
    }

    const std::string key = snapshotDir.toStdString() + "/" + baseName;
    std::uint32_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(impl->mutex);
        sequence = ++impl->sequences[key];
    }

    SnapshotLocation location;
    location.sequence = sequence;
    location.snapshotName = sequence == 1
        ? baseName
        : baseName + kSequenceSeparator + std::to_string(sequence);
    location.path = snapshotDir.toStdString() + "/" + location.snapshotName + kSnapshotExtension;
    return location;
}

void SnapshotStore::resetSequences()
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->sequences.clear();
}

std::optional<SnapshotFile> SnapshotStore::loadBaseline(const std::string &path) const
{
    if (!QFileInfo::exists(QString::fromStdString(path))) {
        return std::nullopt;
    }
    return parseSnapshotFile(readAllOrThrow(path).toStdString());
}

CompareResult SnapshotStore::compare(const std::string &baseline, const std::string &rendered)
{
    return normalizeBody(baseline) == normalizeBody(rendered)
        ? CompareResult::Equal
        : CompareResult::Different;
}

std::string SnapshotStore::pendingPathFor(const std::string &baselinePath)
{
    return baselinePath + kPendingSuffix;
}

std::string SnapshotStore::writePending(const std::string &baselinePath,
                                        const SnapshotFile &file) const
{
    const std::string pendingPath = pendingPathFor(baselinePath);
    writeAtomically(pendingPath, QByteArray::fromStdString(serializeSnapshotFile(file)));
    return pendingPath;
}

void SnapshotStore::writeBaseline(const std::string &path, const SnapshotFile &file) const
{
    writeAtomically(path, QByteArray::fromStdString(serializeSnapshotFile(file)));
}

std::vector<PendingSnapshot> SnapshotStore::listPending(const std::string &rootDir) const
{
    const QString root = QString::fromStdString(rootDir);
    if (!QFileInfo(root).isDir()) {
        throw IoError(rootDir, "not a directory");
    }

    std::vector<std::string> paths;
    QDirIterator it(root,
                    {QStringLiteral("*") + kSnapshotExtension + kPendingSuffix},
                    QDir::Files,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        paths.push_back(it.next().toStdString());
    }
    std::sort(paths.begin(), paths.end());

    std::vector<PendingSnapshot> pending;
    pending.reserve(paths.size());
    for (const auto &path : paths) {
        PendingSnapshot entry;
        entry.pendingPath = path;
        entry.baselinePath = path.substr(0, path.size() - std::string(kPendingSuffix).size());
        entry.baselineExists = QFileInfo::exists(QString::fromStdString(entry.baselinePath));
        entry.metadata = parseSnapshotFile(readAllOrThrow(path).toStdString()).metadata;
        pending.push_back(std::move(entry));
    }
    return pending;
}

void SnapshotStore::acceptPending(const std::string &pendingPath) const
{
    const std::string suffix = kPendingSuffix;
    if (pendingPath.size() <= suffix.size()
        || pendingPath.compare(pendingPath.size() - suffix.size(), suffix.size(), suffix) != 0) {
        throw IoError(pendingPath, "not a pending snapshot");
    }

    const std::string baselinePath = pendingPath.substr(0, pendingPath.size() - suffix.size());
    writeAtomically(baselinePath, readAllOrThrow(pendingPath));

    QFile pending(QString::fromStdString(pendingPath));
    if (!pending.remove()) {
        throw IoError(pendingPath, pending.errorString().toStdString());
    }

    KSLOG_INFO(QStringLiteral("SnapshotStore"),
               QStringLiteral("acceptPending"),
               QStringLiteral("pending_accepted"),
               QStringLiteral("review_action"),
               QStringLiteral("atomic_replace"),
               keepsake::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"baseline", baselinePath}}));
}

void SnapshotStore::rejectPending(const std::string &pendingPath) const
{
    QFile pending(QString::fromStdString(pendingPath));
    if (!pending.remove()) {
        throw IoError(pendingPath, pending.errorString().toStdString());
    }

    KSLOG_INFO(QStringLiteral("SnapshotStore"),
               QStringLiteral("rejectPending"),
               QStringLiteral("pending_rejected"),
               QStringLiteral("review_action"),
               QStringLiteral("remove"),
               keepsake::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"pending", pendingPath}}));
}

} // namespace keepsake
