#include "daemon/watchdog.hpp"

#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace apwatch {

namespace {

constexpr int kCheckIntervalMs = 60 * 1000;

} // namespace

Watchdog::Watchdog(PresenceStore &store,
                   const QUrl &url,
                   std::chrono::minutes threshold,
                   const QString &programName,
                   QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_url(url)
    , m_threshold(threshold)
    , m_programName(programName)
    , m_startedAt(std::chrono::system_clock::now())
{
}

Watchdog::~Watchdog() = default;

void Watchdog::start()
{
    if (!m_timer) {
        m_timer = new QTimer(this);
        m_timer->setInterval(kCheckIntervalMs);
        connect(m_timer, &QTimer::timeout, this, &Watchdog::check);
    }
    m_startedAt = std::chrono::system_clock::now();
    m_timer->start();

    APWLOG_INFO(QStringLiteral("Watchdog"),
                QStringLiteral("start"),
                QStringLiteral("watchdog_started"),
                QStringLiteral("url_configured"),
                QStringLiteral("periodic_timer"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"thresholdMinutes", m_threshold.count()}}));
}

void Watchdog::stop()
{
    if (m_timer) {
        m_timer->stop();
    }
}

std::optional<std::chrono::minutes> Watchdog::evaluate(Timestamp now)
{
    const auto lastEvent = m_store.lastEventTimestamp();

    if (m_fired) {
        const bool freshEvent = lastEvent.has_value()
            && (!m_firedFor.has_value() || *lastEvent > *m_firedFor);
        if (!freshEvent) {
            return std::nullopt;
        }
        m_fired = false;
        m_firedFor.reset();
    }

    const Timestamp reference = lastEvent.value_or(m_startedAt);
    if (now - reference < m_threshold) {
        return std::nullopt;
    }

    m_fired = true;
    m_firedFor = lastEvent;
    return std::chrono::duration_cast<std::chrono::minutes>(now - reference);
}

void Watchdog::checkAt(Timestamp now)
{
    const auto quiet = evaluate(now);
    if (!quiet.has_value()) {
        return;
    }

    const auto lastEvent = m_store.lastEventTimestamp();
    APWLOG_WARN(QStringLiteral("Watchdog"),
                QStringLiteral("checkAt"),
                QStringLiteral("event_stream_stale"),
                lastEvent.has_value() ? QStringLiteral("no_recent_events")
                                      : QStringLiteral("no_events_since_start"),
                QStringLiteral("http_post"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"quietMinutes", quiet->count()},
                                {"lastEvent", optionalTimestampJson(lastEvent)}}));
    sendAlert(*quiet);
}

void Watchdog::check()
{
    checkAt(std::chrono::system_clock::now());
}

void Watchdog::sendAlert(std::chrono::minutes quiet)
{
    QNetworkRequest request(m_url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    const nlohmann::json body = {
        {"text", QStringLiteral("No %1 events in %2 minutes")
                     .arg(m_programName)
                     .arg(quiet.count())
                     .toStdString()}
    };

    QNetworkReply *reply = m_network.post(request, QByteArray::fromStdString(body.dump()));
    connect(reply, &QNetworkReply::finished, this, [this, reply]() {
        reply->deleteLater();
        const bool ok = reply->error() == QNetworkReply::NoError;
        if (ok) {
            APWLOG_INFO(QStringLiteral("Watchdog"),
                        QStringLiteral("sendAlert"),
                        QStringLiteral("watchdog_alert_sent"),
                        QStringLiteral("event_stream_stale"),
                        QStringLiteral("http_post"),
                        logging::defaultWho(),
                        QString(),
                        nlohmann::json::object());
        } else {
            APWLOG_ERROR(QStringLiteral("Watchdog"),
                         QStringLiteral("sendAlert"),
                         QStringLiteral("watchdog_alert_failed"),
                         reply->errorString(),
                         QStringLiteral("http_post"),
                         logging::defaultWho(),
                         QString(),
                         (nlohmann::json{{"host", m_url.host().toStdString()}}));
        }
        emit alertDelivered(ok);
    });
}

} // namespace apwatch
