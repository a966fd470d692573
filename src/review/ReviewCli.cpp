#include "review/ReviewCli.hpp"

#include <iostream>
#include <optional>

#include <QFileInfo>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "common/settings.hpp"
#include "common/text_diff.hpp"

namespace keepsake {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  keepsake-review list [--root DIR] [--format text|json]\n"
        "  keepsake-review show --pending PATH [--format text|json]\n"
        "  keepsake-review accept --pending PATH | --all [--root DIR]\n"
        "  keepsake-review reject --pending PATH | --all [--root DIR]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

bool isValidFormat(const QString &format)
{
    return format == QStringLiteral("text") || format == QStringLiteral("json");
}

std::string baselinePathOf(const std::string &pendingPath)
{
    const std::string suffix = ".new";
    if (pendingPath.size() <= suffix.size()
        || pendingPath.compare(pendingPath.size() - suffix.size(), suffix.size(), suffix) != 0) {
        throw IoError(pendingPath, "not a pending snapshot");
    }
    return pendingPath.substr(0, pendingPath.size() - suffix.size());
}

void renderListText(const std::vector<PendingSnapshot> &pending, const QString &root)
{
    std::cout << "Pending snapshots under " << root.toStdString() << ": "
              << pending.size() << "\n";
    if (pending.empty()) {
        std::cout << "No pending snapshots.\n";
        return;
    }

    for (const auto &entry : pending) {
        std::cout << "- " << entry.pendingPath << " ("
                  << (entry.baselineExists ? "changed" : "new") << ")";
        if (!entry.metadata.source.empty()) {
            std::cout << " from " << entry.metadata.source;
        }
        std::cout << "\n";
    }
}

void renderListJson(const std::vector<PendingSnapshot> &pending, const QString &root)
{
    nlohmann::json payload;
    payload["root"] = root.toStdString();
    payload["total"] = pending.size();
    payload["pending"] = pending;

    std::cout << payload.dump(2) << std::endl;
}

void renderShowText(const PendingSnapshot &entry, const std::string &diff)
{
    std::cout << "Snapshot:   " << entry.metadata.snapshot << "\n";
    std::cout << "Source:     " << entry.metadata.source << "\n";
    if (!entry.metadata.expression.empty()) {
        std::cout << "Expression: " << entry.metadata.expression << "\n";
    }
    std::cout << "Baseline:   " << entry.baselinePath
              << (entry.baselineExists ? "" : " (missing)") << "\n";
    std::cout << "Pending:    " << entry.pendingPath << "\n\n";
    if (diff.empty()) {
        std::cout << "No differences in the snapshot body.\n";
        return;
    }
    std::cout << diff;
}

void renderShowJson(const PendingSnapshot &entry, const std::string &diff)
{
    nlohmann::json payload = entry;
    payload["diff"] = diff;

    std::cout << payload.dump(2) << std::endl;
}

} // namespace

int ReviewCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    KSLOG_INFO(QStringLiteral("ReviewCli"),
               QStringLiteral("run"),
               QStringLiteral("review_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               keepsake::logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});

    try {
        if (command == QStringLiteral("list")) {
            return runList(args);
        }
        if (command == QStringLiteral("show")) {
            return runShow(args);
        }
        if (command == QStringLiteral("accept")) {
            return runAccept(args);
        }
        if (command == QStringLiteral("reject")) {
            return runReject(args);
        }
    } catch (const std::exception &ex) {
        KSLOG_ERROR(QStringLiteral("ReviewCli"),
                    QStringLiteral("run"),
                    QStringLiteral("review_cli_failed"),
                    QStringLiteral("exception"),
                    QStringLiteral("cli"),
                    keepsake::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"command", command.toStdString()},
                                    {"error", ex.what()}}));
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

QString ReviewCli::rootDir(const QStringList &args) const
{
    const QString root = getArgValue(args, QStringLiteral("--root"));
    if (!root.isEmpty()) {
        return root;
    }
    return QString::fromStdString(RunSettings::fromEnvironment().workspaceRoot);
}

int ReviewCli::runList(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    const QString root = rootDir(args);
    const auto pending = m_store.listPending(root.toStdString());

    KSLOG_INFO(QStringLiteral("ReviewCli"),
               QStringLiteral("runList"),
               QStringLiteral("review_list"),
               QStringLiteral("user_invocation"),
               QStringLiteral("directory_scan"),
               keepsake::logging::defaultWho(),
               QString(),
               nlohmann::json{{"root", root.toStdString()},
                              {"pending", pending.size()},
                              {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        renderListJson(pending, root);
    } else {
        renderListText(pending, root);
    }

    return 0;
}

int ReviewCli::runShow(const QStringList &args)
{
    // Show compares the pending body against the current baseline body.
    const QString pendingPath = getArgValue(args, QStringLiteral("--pending"));
    if (pendingPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    PendingSnapshot entry;
    entry.pendingPath = pendingPath.toStdString();
    entry.baselinePath = baselinePathOf(entry.pendingPath);

    const std::optional<SnapshotFile> pending = m_store.loadBaseline(entry.pendingPath);
    if (!pending.has_value()) {
        std::cerr << "Pending snapshot not found: " << entry.pendingPath << std::endl;
        return 1;
    }
    const std::optional<SnapshotFile> baseline = m_store.loadBaseline(entry.baselinePath);
    entry.baselineExists = baseline.has_value();
    entry.metadata = pending->metadata;

    const std::string diff =
        lineDiff(baseline ? baseline->contents : std::string(), pending->contents);

    KSLOG_INFO(QStringLiteral("ReviewCli"),
               QStringLiteral("runShow"),
               QStringLiteral("review_show"),
               QStringLiteral("user_invocation"),
               QStringLiteral("line_diff"),
               keepsake::logging::defaultWho(),
               QString(),
               nlohmann::json{{"pending", entry.pendingPath},
                              {"baselineExists", entry.baselineExists},
                              {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        renderShowJson(entry, diff);
    } else {
        renderShowText(entry, diff);
    }

    return 0;
}

int ReviewCli::runAccept(const QStringList &args)
{
    const QString pendingPath = getArgValue(args, QStringLiteral("--pending"));
    if (!pendingPath.isEmpty()) {
        m_store.acceptPending(pendingPath.toStdString());
        std::cout << "Accepted " << baselinePathOf(pendingPath.toStdString()) << "\n";
        return 0;
    }
    if (!args.contains(QStringLiteral("--all"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const auto pending = m_store.listPending(rootDir(args).toStdString());
    for (const auto &entry : pending) {
        m_store.acceptPending(entry.pendingPath);
        std::cout << "Accepted " << entry.baselinePath << "\n";
    }
    std::cout << "Accepted " << pending.size() << " pending snapshot(s).\n";
    return 0;
}

int ReviewCli::runReject(const QStringList &args)
{
    const QString pendingPath = getArgValue(args, QStringLiteral("--pending"));
    if (!pendingPath.isEmpty()) {
        if (!QFileInfo::exists(pendingPath)) {
            std::cerr << "Pending snapshot not found: " << pendingPath.toStdString()
                      << std::endl;
            return 1;
        }
        m_store.rejectPending(pendingPath.toStdString());
        std::cout << "Rejected " << pendingPath.toStdString() << "\n";
        return 0;
    }
    if (!args.contains(QStringLiteral("--all"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const auto pending = m_store.listPending(rootDir(args).toStdString());
    for (const auto &entry : pending) {
        m_store.rejectPending(entry.pendingPath);
        std::cout << "Rejected " << entry.pendingPath << "\n";
    }
    std::cout << "Rejected " << pending.size() << " pending snapshot(s).\n";
    return 0;
}

} // namespace keepsake
