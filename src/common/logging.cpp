#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace apwatch::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
LogOptions g_options;
QString g_processName;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString logFilePath(const QString &processName)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("apwatch")
        : processName;
    return g_options.logDirectory + QDir::separator() + base + QStringLiteral(".log");
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeFileLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(g_options.logDirectory);
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }

    file.write(line);
    file.write("\n");
}

void writeConsoleLine(const QByteArray &line)
{
    fprintf(stdout, "%s\n", line.constData());
    fflush(stdout);
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

// ts LEVEL component/where what why=... how=... corr=... {context}
QByteArray formatText(const nlohmann::json &payload)
{
    QString line = QStringLiteral("%1 %2 %3/%4 %5")
                       .arg(QString::fromStdString(payload["ts"].get<std::string>()))
                       .arg(QString::fromStdString(payload["level"].get<std::string>()), -5)
                       .arg(QString::fromStdString(payload["component"].get<std::string>()))
                       .arg(QString::fromStdString(payload["where"].get<std::string>()))
                       .arg(QString::fromStdString(payload["what"].get<std::string>()));

    for (const char *key : {"why", "how", "corr"}) {
        const std::string value = payload[key].get<std::string>();
        if (!value.empty()) {
            line += QStringLiteral(" %1=%2")
                        .arg(QString::fromLatin1(key), QString::fromStdString(value));
        }
    }

    const nlohmann::json &context = payload["context"];
    if (!context.is_null() && !context.empty()) {
        line += QLatin1Char(' ')
            + QString::fromStdString(
                context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
    return line.toUtf8();
}

} // namespace

void initLogging(const QString &processName, const LogOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_options = options;
}

bool isDebugEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_options.debugEnabled;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
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
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("apwatch");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
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
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Context may carry raw log text; invalid UTF-8 must not abort the record.
    const QByteArray jsonLine = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level == LogLevel::Debug && !g_options.debugEnabled) {
        return;
    }

    writeConsoleLine(g_options.jsonFormat ? jsonLine : formatText(payload));

    if (!g_options.logDirectory.isEmpty()) {
        writeFileLine(logFilePath(process), jsonLine);
    }
}

} // namespace apwatch::logging
