#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace apwatch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    // One JSON object per line instead of the human-readable form.
    bool jsonFormat = false;
    bool debugEnabled = false;
    // When set, records are also appended as JSON to <dir>/<process>.log.
    QString logDirectory;
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, const LogOptions &options);

bool isDebugEnabled();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
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

} // namespace apwatch::logging

#define APWLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::apwatch::logging::logEvent(::apwatch::logging::LogLevel::Debug, \
                                 ::apwatch::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define APWLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::apwatch::logging::logEvent(::apwatch::logging::LogLevel::Info, \
                                 ::apwatch::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define APWLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::apwatch::logging::logEvent(::apwatch::logging::LogLevel::Warn, \
                                 ::apwatch::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define APWLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::apwatch::logging::logEvent(::apwatch::logging::LogLevel::Error, \
                                 ::apwatch::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
