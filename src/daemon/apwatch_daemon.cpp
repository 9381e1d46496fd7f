#include "daemon/apwatch_daemon.hpp"

#include <QMetaObject>

#include <nlohmann/json.hpp>

#include "common/apwatch_version.hpp"
#include "common/logging.hpp"
#include "daemon/api_server.hpp"
#include "daemon/line_ingestor.hpp"
#include "daemon/log_follower.hpp"
#include "daemon/watchdog.hpp"

namespace apwatch {

ApwatchDaemon::ApwatchDaemon(const DaemonConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_ingestor(std::make_unique<LineIngestor>(m_store, config.apProgram.toStdString()))
    , m_apiServer(std::make_unique<ApiServer>(m_store))
{
    if (!m_config.watchdogUrl.isEmpty()) {
        m_watchdog = std::make_unique<Watchdog>(m_store,
                                                m_config.watchdogUrl,
                                                m_config.watchdogThreshold,
                                                m_config.apProgram);
    }
    m_ingestThread.setObjectName(QStringLiteral("apwatch-ingest"));
}

ApwatchDaemon::~ApwatchDaemon()
{
    shutdown();
}

PresenceStore &ApwatchDaemon::store()
{
    return m_store;
}

quint16 ApwatchDaemon::apiPort() const
{
    return m_apiServer->serverPort();
}

bool ApwatchDaemon::start()
{
    APWLOG_INFO(QStringLiteral("ApwatchDaemon"),
                QStringLiteral("start"),
                QStringLiteral("daemon_starting"),
                QStringLiteral("process_start"),
                QStringLiteral("qt_event_loop"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"version", APWATCH_VERSION},
                                {"file", m_config.logFile.toStdString()},
                                {"program", m_config.apProgram.toStdString()},
                                {"watchdog", m_watchdog != nullptr}}));

    if (!m_apiServer->start(m_config.listenAddress, m_config.listenPort)) {
        return false;
    }

    // The follower and every witness() call run on the ingestion thread; the
    // API server reads the store from this thread.
    m_follower = new LogFollower();
    m_follower->setPath(m_config.logFile);
    m_follower->moveToThread(&m_ingestThread);

    LineIngestor *ingestor = m_ingestor.get();
    connect(m_follower, &LogFollower::lineRead, m_follower, [ingestor](const QString &line) {
        ingestor->ingest(line.toStdString());
    });
    connect(m_follower, &LogFollower::fatalError,
            this, &ApwatchDaemon::handleFollowerFatal);
    connect(&m_ingestThread, &QThread::finished, m_follower, &QObject::deleteLater);

    m_ingestThread.start();

    LogFollower *follower = m_follower;
    const int interval = m_config.pollIntervalMs;
    QMetaObject::invokeMethod(follower, [follower, interval]() {
        follower->start(interval);
    }, Qt::QueuedConnection);

    if (m_watchdog) {
        m_watchdog->start();
    }
    return true;
}

void ApwatchDaemon::shutdown()
{
    if (m_stopping) {
        return;
    }
    m_stopping = true;

    if (m_watchdog) {
        m_watchdog->stop();
    }
    m_apiServer->stop();
    stopIngestion();
}

void ApwatchDaemon::stopIngestion()
{
    if (!m_ingestThread.isRunning()) {
        return;
    }

    LogFollower *follower = m_follower;
    QMetaObject::invokeMethod(follower, [follower]() {
        follower->stop();
    }, Qt::BlockingQueuedConnection);

    m_ingestThread.quit();
    m_ingestThread.wait();
    m_follower = nullptr;

    const IngestStats &stats = m_ingestor->stats();
    APWLOG_INFO(QStringLiteral("ApwatchDaemon"),
                QStringLiteral("stopIngestion"),
                QStringLiteral("ingestion_stopped"),
                QStringLiteral("daemon_shutdown"),
                QStringLiteral("thread_join"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"lines", stats.lines},
                                {"witnessed", stats.witnessed},
                                {"notApplicable", stats.notApplicable},
                                {"ignored", stats.ignored},
                                {"decodeFailures", stats.decodeFailures},
                                {"grammarFailures", stats.grammarFailures}}));
}

void ApwatchDaemon::handleFollowerFatal(const QString &message)
{
    APWLOG_ERROR(QStringLiteral("ApwatchDaemon"),
                 QStringLiteral("handleFollowerFatal"),
                 QStringLiteral("log_follow_failed"),
                 message,
                 QStringLiteral("shutdown"),
                 logging::defaultWho(),
                 QString(),
                 (nlohmann::json{{"file", m_config.logFile.toStdString()}}));
    shutdown();
    emit stopped(1);
}

} // namespace apwatch
