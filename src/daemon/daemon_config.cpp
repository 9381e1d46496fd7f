#include "daemon/daemon_config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace apwatch {

namespace {

QString envOr(const char *name, const QString &fallback)
{
    const QString value = qEnvironmentVariable(name);
    return value.isEmpty() ? fallback : value;
}

} // namespace

bool parseListenAddress(const QString &value, QHostAddress *address, quint16 *port)
{
    const int colon = value.lastIndexOf(QLatin1Char(':'));
    if (colon <= 0 || colon == value.size() - 1) {
        return false;
    }

    QString host = value.left(colon);
    if (host.startsWith(QLatin1Char('[')) && host.endsWith(QLatin1Char(']'))) {
        host = host.mid(1, host.size() - 2);
    } else if (host.contains(QLatin1Char(':'))) {
        // Bare IPv6 needs brackets to separate the port.
        return false;
    }

    bool ok = false;
    const uint portValue = value.mid(colon + 1).toUInt(&ok);
    if (!ok || portValue > 65535) {
        return false;
    }

    QHostAddress parsed;
    if (host == QStringLiteral("localhost")) {
        parsed = QHostAddress(QHostAddress::LocalHost);
    } else if (!parsed.setAddress(host)) {
        return false;
    }

    *address = parsed;
    *port = static_cast<quint16>(portValue);
    return true;
}

bool loadDaemonConfig(const QStringList &arguments, DaemonConfig *config, QString *error)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Tracks which Wi-Fi devices are associated with which access point "
                       "by tailing hostapd events from a syslog-ng JSON log."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    QCommandLineOption fileOption(QStringList() << "f" << "file",
                                  "Log file to follow (env APWATCH_FILE).",
                                  "path");
    QCommandLineOption listenOption(QStringList() << "l" << "listen",
                                    "HTTP listen address (env APWATCH_LISTEN).",
                                    "host:port");
    QCommandLineOption jsonLogsOption(QStringList() << "json-logs",
                                      "Write log records as JSON (env APWATCH_JSON_LOGS=1).");
    QCommandLineOption debugOption(QStringList() << "debug",
                                   "Emit debug records (env APWATCH_DEBUG=1).");
    QCommandLineOption logDirOption(QStringList() << "log-dir",
                                    "Also append JSON records to a rotating file in this "
                                    "directory (env APWATCH_LOG_DIR).",
                                    "dir");
    QCommandLineOption programOption(QStringList() << "program",
                                     "Program name of the AP daemon (env APWATCH_PROGRAM).",
                                     "name");
    QCommandLineOption pollOption(QStringList() << "poll-interval",
                                  "Milliseconds between checks for new log lines.",
                                  "ms");
    QCommandLineOption watchdogMinutesOption(QStringList() << "watchdog-minutes",
                                             "Minutes without events before the watchdog "
                                             "sends a notification.",
                                             "minutes");
    parser.addOption(fileOption);
    parser.addOption(listenOption);
    parser.addOption(jsonLogsOption);
    parser.addOption(debugOption);
    parser.addOption(logDirOption);
    parser.addOption(programOption);
    parser.addOption(pollOption);
    parser.addOption(watchdogMinutesOption);
    parser.addPositionalArgument(QStringLiteral("watchdog-url"),
                                 QStringLiteral("URL that receives a JSON POST {\"text\": ...} "
                                                "when no events arrive (env WATCHDOG_URL)."),
                                 QStringLiteral("[watchdog-url]"));

    if (!parser.parse(arguments)) {
        *error = parser.errorText();
        return false;
    }

    config->helpText = parser.helpText();
    config->showHelp = parser.isSet(helpOption);
    config->showVersion = parser.isSet(versionOption);
    if (config->showHelp || config->showVersion) {
        return true;
    }

    config->logFile = parser.isSet(fileOption)
        ? parser.value(fileOption)
        : envOr("APWATCH_FILE", config->logFile);
    if (config->logFile.isEmpty()) {
        *error = QStringLiteral("log file path is empty");
        return false;
    }

    const QString listen = parser.isSet(listenOption)
        ? parser.value(listenOption)
        : envOr("APWATCH_LISTEN", QString());
    if (!listen.isEmpty()
        && !parseListenAddress(listen, &config->listenAddress, &config->listenPort)) {
        *error = QStringLiteral("invalid listen address: %1").arg(listen);
        return false;
    }

    config->jsonLogs = parser.isSet(jsonLogsOption)
        || qEnvironmentVariableIntValue("APWATCH_JSON_LOGS") == 1;
    config->debug = parser.isSet(debugOption)
        || qEnvironmentVariableIntValue("APWATCH_DEBUG") == 1;
    config->logDirectory = parser.isSet(logDirOption)
        ? parser.value(logDirOption)
        : envOr("APWATCH_LOG_DIR", config->logDirectory);
    config->apProgram = parser.isSet(programOption)
        ? parser.value(programOption)
        : envOr("APWATCH_PROGRAM", config->apProgram);
    if (config->apProgram.isEmpty()) {
        *error = QStringLiteral("program name is empty");
        return false;
    }

    if (parser.isSet(pollOption)) {
        bool ok = false;
        const int interval = parser.value(pollOption).toInt(&ok);
        if (!ok || interval <= 0) {
            *error = QStringLiteral("invalid poll interval: %1").arg(parser.value(pollOption));
            return false;
        }
        config->pollIntervalMs = interval;
    }

    if (parser.isSet(watchdogMinutesOption)) {
        bool ok = false;
        const int minutes = parser.value(watchdogMinutesOption).toInt(&ok);
        if (!ok || minutes <= 0) {
            *error = QStringLiteral("invalid watchdog period: %1")
                         .arg(parser.value(watchdogMinutesOption));
            return false;
        }
        config->watchdogThreshold = std::chrono::minutes(minutes);
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        *error = QStringLiteral("unexpected arguments: %1").arg(positional.mid(1).join(' '));
        return false;
    }
    const QString watchdogUrl = positional.isEmpty()
        ? qEnvironmentVariable("WATCHDOG_URL")
        : positional.first();
    if (!watchdogUrl.isEmpty()) {
        const QUrl url(watchdogUrl, QUrl::StrictMode);
        if (!url.isValid() || url.scheme().isEmpty() || url.host().isEmpty()) {
            *error = QStringLiteral("invalid watchdog URL: %1").arg(watchdogUrl);
            return false;
        }
        config->watchdogUrl = url;
    }

    return true;
}

} // namespace apwatch
