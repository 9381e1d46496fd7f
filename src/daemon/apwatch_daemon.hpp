#pragma once

#include <memory>

#include <QObject>
#include <QString>
#include <QThread>

#include "daemon/daemon_config.hpp"
#include "daemon/presence_store.hpp"

namespace apwatch {

class ApiServer;
class LineIngestor;
class LogFollower;
class Watchdog;

/**
 * ApwatchDaemon coordinates:
 * - following the syslog file on a dedicated ingestion thread
 * - feeding each line through LineIngestor into the PresenceStore
 * - serving the store over HTTP and, optionally, running the watchdog
 *
 * It is owned from main() and driven by Qt's event loop. A fatal follower
 * error shuts everything down and emits stopped(1).
 */
class ApwatchDaemon : public QObject
{
    Q_OBJECT
public:
    explicit ApwatchDaemon(const DaemonConfig &config, QObject *parent = nullptr);
    ~ApwatchDaemon() override;

    // Bind the API server and begin ingestion. False if the listener failed.
    bool start();
    void shutdown();

    PresenceStore &store();
    quint16 apiPort() const;

signals:
    void stopped(int exitCode);

private slots:
    void handleFollowerFatal(const QString &message);

private:
    void stopIngestion();

    DaemonConfig m_config;
    PresenceStore m_store;
    std::unique_ptr<LineIngestor> m_ingestor;
    std::unique_ptr<ApiServer> m_apiServer;
    std::unique_ptr<Watchdog> m_watchdog;

    QThread m_ingestThread;
    // Lives on m_ingestThread once started.
    LogFollower *m_follower = nullptr;
    bool m_stopping = false;
};

} // namespace apwatch
