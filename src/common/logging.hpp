#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace keepsake::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Sets the process name used for file naming and whether debug events are
// recorded. Events go to <logsDirPath()>/<process>.log; with trace enabled
// every event is also mirrored to <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory log files are written to: $KEEPSAKE_LOG_DIR when set, otherwise
// ~/.local/share/keepsake/logs.
QString logsDirPath();

// The correlation id ties together the events of one snapshot assertion.
// It is thread-local; CorrelationScope restores the previous id on exit.
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Writes one JSON line: ts, level, process, pid, thread, component, where,
// what, why, how, who, corr, context. An empty correlationId falls back to
// currentCorrelationId().
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace keepsake::logging

#define KSLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::keepsake::logging::logEvent(::keepsake::logging::LogLevel::Debug, \
                                  ::keepsake::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KSLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::keepsake::logging::logEvent(::keepsake::logging::LogLevel::Info, \
                                  ::keepsake::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KSLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::keepsake::logging::logEvent(::keepsake::logging::LogLevel::Warn, \
                                  ::keepsake::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KSLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::keepsake::logging::logEvent(::keepsake::logging::LogLevel::Error, \
                                  ::keepsake::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
