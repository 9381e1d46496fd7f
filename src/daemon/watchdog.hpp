#pragma once

#include <chrono>
#include <optional>

#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QUrl>

#include "common/models.hpp"
#include "daemon/presence_store.hpp"

class QTimer;

namespace apwatch {

/**
 * Watchdog notices when the event stream goes quiet. Once a minute it reads
 * the store's last event timestamp; when nothing has arrived for the
 * threshold it POSTs {"text": "No <program> events in N minutes"} to the
 * configured URL. One notification per quiet period: it re-arms after a
 * newer event is seen.
 */
class Watchdog : public QObject
{
    Q_OBJECT
public:
    Watchdog(PresenceStore &store,
             const QUrl &url,
             std::chrono::minutes threshold,
             const QString &programName,
             QObject *parent = nullptr);
    ~Watchdog() override;

    void start();
    void stop();

    // Decide whether to alert at `now`. Returns the quiet duration when a
    // notification is due and marks it as sent.
    std::optional<std::chrono::minutes> evaluate(Timestamp now);

    // evaluate() plus delivery.
    void checkAt(Timestamp now);

signals:
    void alertDelivered(bool ok);

private slots:
    void check();

private:
    void sendAlert(std::chrono::minutes quiet);

    PresenceStore &m_store;
    QUrl m_url;
    std::chrono::minutes m_threshold;
    QString m_programName;
    Timestamp m_startedAt;

    bool m_fired = false;
    std::optional<Timestamp> m_firedFor;

    QNetworkAccessManager m_network;
    QTimer *m_timer = nullptr;
};

} // namespace apwatch
