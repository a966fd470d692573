#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSysInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <memory>
#include <mutex>

namespace keepsake::logging {

namespace {

// A log file that stays open between events. Reopened when the target path
// changes (KEEPSAKE_LOG_DIR may move between test cases) and rolled over to
// "<path>.1" once it grows past the size limit.
class LogSink
{
public:
    static constexpr qint64 kRollOverBytes = 5 * 1024 * 1024;

    void append(const QString &path, const QByteArray &line)
    {
        if (!ensureOpen(path)) {
            std::fprintf(stderr, "%s\n", line.constData());
            return;
        }
        if (m_file->size() >= kRollOverBytes) {
            rollOver();
            if (!ensureOpen(path)) {
                std::fprintf(stderr, "%s\n", line.constData());
                return;
            }
        }
        m_file->write(line);
        m_file->write("\n", 1);
        m_file->flush();
    }

    void close()
    {
        m_file.reset();
    }

private:
    bool ensureOpen(const QString &path)
    {
        if (m_file && m_file->fileName() == path && m_file->isOpen()) {
            return true;
        }
        m_file.reset();
        QDir().mkpath(QFileInfo(path).absolutePath());
        auto file = std::make_unique<QFile>(path);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append)) {
            return false;
        }
        m_file = std::move(file);
        return true;
    }

    void rollOver()
    {
        const QString path = m_file->fileName();
        m_file.reset();
        const QString previous = path + QStringLiteral(".1");
        QFile::remove(previous);
        QFile::rename(path, previous);
    }

    std::unique_ptr<QFile> m_file;
};

struct LoggerState
{
    std::mutex mutex;
    QString processName;
    bool traceEnabled = false;
    LogSink mainSink;
    LogSink traceSink;
};

LoggerState &state()
{
    static LoggerState instance;
    return instance;
}

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString sinkPath(const QString &process, const char *suffix)
{
    return logsDirPath() + QLatin1Char('/') + process + QLatin1String(suffix);
}

std::string currentThreadTag()
{
    const auto id = reinterpret_cast<quintptr>(QThread::currentThreadId());
    return QStringLiteral("0x%1").arg(id, 0, 16).toStdString();
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    logger.processName = processName;
    logger.traceEnabled = traceEnabled;
    logger.mainSink.close();
    logger.traceSink.close();
}

bool isTraceEnabled()
{
    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    return logger.traceEnabled;
}

QString logsDirPath()
{
    const QString configured = qEnvironmentVariable("KEEPSAKE_LOG_DIR");
    if (!configured.isEmpty()) {
        return configured;
    }
    const QString suffix = QStringLiteral(".local/share/keepsake/logs");
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty() ? suffix : home + QLatin1Char('/') + suffix;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        LoggerState &logger = state();
        std::lock_guard<std::mutex> lock(logger.mutex);
        if (!logger.processName.isEmpty()) {
            return logger.processName;
        }
    }
    const QString appName = QCoreApplication::instance()
        ? QCoreApplication::applicationName()
        : QString();
    return appName.isEmpty() ? QStringLiteral("keepsake") : appName;
}

QString defaultWho()
{
    return QStringLiteral("host:%1,uid:%2")
        .arg(QSysInfo::machineHostName())
        .arg(static_cast<qulonglong>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    nlohmann::json record = nlohmann::json::object();
    record["ts"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
    record["level"] = levelName(level);
    record["process"] = process.toStdString();
    record["pid"] = static_cast<qint64>(QCoreApplication::applicationPid());
    record["thread"] = currentThreadTag();
    record["component"] = component.toStdString();
    record["where"] = where.toStdString();
    record["what"] = what.toStdString();
    record["why"] = why.toStdString();
    record["how"] = how.toStdString();
    record["who"] = who.toStdString();
    record["corr"] = (correlationId.isEmpty() ? currentCorrelationId() : correlationId).toStdString();
    record["context"] = context;

    // Snapshot bodies land in the context; invalid UTF-8 is replaced, not thrown.
    const std::string text = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const QByteArray line = QByteArray::fromStdString(text);

    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    if (level != LogLevel::Debug || logger.traceEnabled) {
        logger.mainSink.append(sinkPath(process, ".log"), line);
    }
    if (logger.traceEnabled) {
        logger.traceSink.append(sinkPath(process, "-trace.log"), line);
    }
}

} // namespace keepsake::logging
