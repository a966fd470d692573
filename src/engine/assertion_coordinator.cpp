#include "engine/assertion_coordinator.hpp"

#include <sstream>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/text_diff.hpp"
#include "engine/redaction.hpp"
#include "engine/serializer.hpp"
#include "engine/snapshot_file.hpp"

namespace keepsake {

namespace {

std::string sourceLocation(const SnapshotIdentity &identity)
{
    return identity.sourceFile + ":" + std::to_string(identity.line);
}

nlohmann::json outcomeContext(const AssertionOutcome &outcome)
{
    return nlohmann::json{
        {"snapshot", outcome.snapshotName},
        {"status", outcome.status},
        {"source", sourceLocation(outcome.identity)},
        {"baseline", outcome.baselinePath},
        {"pending", outcome.pendingPath},
        {"baselineMissing", outcome.baselineMissing}
    };
}

} // namespace

std::string AssertionOutcome::describe() const
{
    std::ostringstream out;
    switch (status) {
    case AssertionStatus::Passed:
        out << "Snapshot '" << snapshotName << "' matches.\n";
        return out.str();
    case AssertionStatus::Updated:
        out << "Snapshot '" << snapshotName << "' updated: " << baselinePath << "\n";
        return out.str();
    case AssertionStatus::Failed:
        break;
    }

    if (baselineMissing) {
        out << "Snapshot '" << snapshotName << "' has no baseline yet.\n";
    } else {
        out << "Snapshot '" << snapshotName << "' does not match the baseline.\n";
    }
    out << "Source:     " << sourceLocation(identity) << "\n";
    if (!identity.expression.empty()) {
        out << "Expression: " << identity.expression << "\n";
    }
    out << "Baseline:   " << baselinePath << "\n";
    out << "Pending:    " << pendingPath << "\n";
    out << "\n" << diff;
    out << "\nAccept with `keepsake-review accept --pending " << pendingPath
        << "` or rerun with KEEPSAKE_UPDATE=always.\n";
    return out.str();
}

AssertionCoordinator::AssertionCoordinator(SnapshotStore &store)
    : m_store(store)
{
}

AssertionOutcome AssertionCoordinator::assertSnapshot(const SnapshotIdentity &identity,
                                                      const Content &value,
                                                      const std::vector<Redaction> &redactions,
                                                      SnapshotFormat format,
                                                      bool updateMode)
{
    std::vector<RedactionRule> rules;
    rules.reserve(redactions.size());
    for (const auto &redaction : redactions) {
        rules.push_back(RedactionRule::compile(redaction.selector, redaction.replacement));
    }

    const std::string rendered = renderContent(applyRedactions(value, rules), format);

    KSLOG_DEBUG(QStringLiteral("AssertionCoordinator"),
                QStringLiteral("assertSnapshot"),
                QStringLiteral("snapshot_rendered"),
                QStringLiteral("assertion"),
                QStringLiteral("redact_then_render"),
                keepsake::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"source", sourceLocation(identity)},
                                {"format", toFormatString(format)},
                                {"rules", rules.size()},
                                {"bytes", rendered.size()}}));

    return compareRendered(identity, rendered, updateMode);
}

AssertionOutcome AssertionCoordinator::assertText(const SnapshotIdentity &identity,
                                                  const std::string &text,
                                                  bool updateMode)
{
    return compareRendered(identity, text, updateMode);
}

AssertionOutcome AssertionCoordinator::compareRendered(const SnapshotIdentity &identity,
                                                       const std::string &rendered,
                                                       bool updateMode)
{
    const SnapshotLocation location = m_store.resolve(identity);
    logging::CorrelationScope scope(QString::fromStdString(location.snapshotName));

    AssertionOutcome outcome;
    outcome.identity = identity;
    outcome.snapshotName = location.snapshotName;
    outcome.baselinePath = location.path;
    outcome.rendered = rendered;

    const std::optional<SnapshotFile> baseline = m_store.loadBaseline(location.path);
    outcome.baselineMissing = !baseline.has_value();

    if (baseline && SnapshotStore::compare(baseline->contents, rendered) == CompareResult::Equal) {
        outcome.status = AssertionStatus::Passed;
        KSLOG_DEBUG(QStringLiteral("AssertionCoordinator"),
                    QStringLiteral("compareRendered"),
                    QStringLiteral("snapshot_passed"),
                    QStringLiteral("baseline_equal"),
                    QStringLiteral("compare_body"),
                    keepsake::logging::defaultWho(),
                    QString(),
                    outcomeContext(outcome));
        return outcome;
    }

    SnapshotFile file;
    file.metadata.creator = creatorString();
    file.metadata.source = sourceLocation(identity);
    file.metadata.expression = identity.expression;
    file.metadata.snapshot = location.snapshotName;
    file.contents = rendered;

    if (updateMode) {
        m_store.writeBaseline(location.path, file);
        outcome.status = AssertionStatus::Updated;
        KSLOG_INFO(QStringLiteral("AssertionCoordinator"),
                   QStringLiteral("compareRendered"),
                   QStringLiteral("snapshot_updated"),
                   QStringLiteral("update_mode"),
                   QStringLiteral("atomic_write_baseline"),
                   keepsake::logging::defaultWho(),
                   QString(),
                   outcomeContext(outcome));
        return outcome;
    }

    outcome.pendingPath = m_store.writePending(location.path, file);
    outcome.diff = lineDiff(baseline ? baseline->contents : std::string(), rendered);
    outcome.status = AssertionStatus::Failed;
    KSLOG_INFO(QStringLiteral("AssertionCoordinator"),
               QStringLiteral("compareRendered"),
               QStringLiteral("snapshot_failed"),
               outcome.baselineMissing ? QStringLiteral("baseline_missing")
                                       : QStringLiteral("baseline_different"),
               QStringLiteral("atomic_write_pending"),
               keepsake::logging::defaultWho(),
               QString(),
               outcomeContext(outcome));
    return outcome;
}

} // namespace keepsake
