#include <QCoreApplication>

#include <cstdio>

#include <nlohmann/json.hpp>

#include "common/apwatch_version.hpp"
#include "common/logging.hpp"
#include "daemon/apwatch_daemon.hpp"
#include "daemon/daemon_config.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("apwatch-daemon"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APWATCH_VERSION));

    apwatch::DaemonConfig config;
    QString error;
    if (!apwatch::loadDaemonConfig(app.arguments(), &config, &error)) {
        fprintf(stderr, "apwatch-daemon: %s\n\n%s",
                error.toLocal8Bit().constData(),
                config.helpText.toLocal8Bit().constData());
        return 2;
    }
    if (config.showHelp) {
        fputs(config.helpText.toLocal8Bit().constData(), stdout);
        return 0;
    }
    if (config.showVersion) {
        printf("apwatch-daemon %s\n", APWATCH_VERSION);
        return 0;
    }

    apwatch::logging::LogOptions logOptions;
    logOptions.jsonFormat = config.jsonLogs;
    logOptions.debugEnabled = config.debug;
    logOptions.logDirectory = config.logDirectory;
    apwatch::logging::initLogging(QStringLiteral("apwatch-daemon"), logOptions);
    APWLOG_INFO(QStringLiteral("main"),
                QStringLiteral("main"),
                QStringLiteral("daemon_start"),
                QStringLiteral("user_start"),
                QStringLiteral("cli_config"),
                apwatch::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"listen", QStringLiteral("%1:%2")
                                               .arg(config.listenAddress.toString())
                                               .arg(config.listenPort)
                                               .toStdString()},
                                {"jsonLogs", config.jsonLogs},
                                {"debug", config.debug}}));

    // The daemon lives for the lifetime of the process.
    apwatch::ApwatchDaemon daemon(config);
    QObject::connect(&daemon, &apwatch::ApwatchDaemon::stopped, &app, [](int exitCode) {
        QCoreApplication::exit(exitCode);
    });
    if (!daemon.start()) {
        return 1;
    }

    return app.exec();
}
