#pragma once

#include <chrono>

#include <QHostAddress>
#include <QString>
#include <QStringList>
#include <QUrl>

namespace apwatch {

struct DaemonConfig {
    // syslog-ng JSON log followed from its start.
    QString logFile = QStringLiteral("/var/log/messages");
    QHostAddress listenAddress = QHostAddress(QHostAddress::AnyIPv4);
    quint16 listenPort = 5580;
    QString apProgram = QStringLiteral("hostapd");
    int pollIntervalMs = 250;

    bool jsonLogs = false;
    bool debug = false;
    QString logDirectory;

    // Empty disables the watchdog.
    QUrl watchdogUrl;
    std::chrono::minutes watchdogThreshold{30};

    bool showHelp = false;
    bool showVersion = false;
    QString helpText;
};

/**
 * Build the daemon configuration from command-line arguments (arguments[0] is
 * the program name) with APWATCH_* / WATCHDOG_URL environment fallbacks.
 * Command-line values win over the environment.
 *
 * Returns false and fills *error on invalid input.
 */
bool loadDaemonConfig(const QStringList &arguments, DaemonConfig *config, QString *error);

// Parse "HOST:PORT" or "[V6HOST]:PORT".
bool parseListenAddress(const QString &value, QHostAddress *address, quint16 *port);

} // namespace apwatch
