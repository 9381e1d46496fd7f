#include "daemon/api_server.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <QStringList>
#include <QUrl>
#include <QUuid>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/message_grammar.hpp"

namespace apwatch {

namespace {

constexpr int kMaxRequestHeadBytes = 16 * 1024;

const char *reasonPhrase(int status)
{
    switch (status) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 431:
        return "Request Header Fields Too Large";
    default:
        return "Internal Server Error";
    }
}

HttpResponse makeResult(nlohmann::json body)
{
    HttpResponse response;
    response.status = 200;
    response.body = std::move(body);
    return response;
}

HttpResponse makeError(int status, const std::string &message)
{
    HttpResponse response;
    response.status = status;
    response.body = nlohmann::json{{"error", message}};
    return response;
}

// Offset of the blank line ending the request head, or -1.
int headEnd(const QByteArray &buffer)
{
    const int index = buffer.indexOf("\r\n\r\n");
    if (index >= 0) {
        return index;
    }
    return buffer.indexOf("\n\n");
}

} // namespace

ApiServer::ApiServer(PresenceStore &store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
    connect(&m_server, &QTcpServer::newConnection,
            this, &ApiServer::handleNewConnection);
}

ApiServer::~ApiServer() = default;

bool ApiServer::start(const QHostAddress &address, quint16 port)
{
    if (!m_server.listen(address, port)) {
        APWLOG_ERROR(QStringLiteral("ApiServer"),
                     QStringLiteral("start"),
                     QStringLiteral("api_listen_failed"),
                     m_server.errorString(),
                     QStringLiteral("tcp_listen"),
                     logging::defaultWho(),
                     QString(),
                     (nlohmann::json{{"address", address.toString().toStdString()},
                                     {"port", port}}));
        return false;
    }

    APWLOG_INFO(QStringLiteral("ApiServer"),
                QStringLiteral("start"),
                QStringLiteral("api_listening"),
                QStringLiteral("daemon_start"),
                QStringLiteral("tcp_listen"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"address", m_server.serverAddress().toString().toStdString()},
                                {"port", m_server.serverPort()}}));
    return true;
}

void ApiServer::stop()
{
    m_server.close();
}

quint16 ApiServer::serverPort() const
{
    return m_server.serverPort();
}

void ApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QTcpSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        m_buffers.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead,
                this, &ApiServer::handleClientReadyRead);
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            m_buffers.remove(socket);
            socket->deleteLater();
        });
    }
}

void ApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QTcpSocket *>(sender());
    if (!socket || !m_buffers.contains(socket)) {
        return;
    }

    QByteArray &buffer = m_buffers[socket];
    buffer.append(socket->readAll());

    const int end = headEnd(buffer);
    if (end < 0) {
        if (buffer.size() > kMaxRequestHeadBytes) {
            respond(socket, makeError(431, "request head too large"));
        }
        return;
    }

    // Request line: METHOD SP request-target SP HTTP-version
    const QByteArray head = buffer.left(end);
    const int lineEnd = head.indexOf('\n');
    const QByteArray requestLine = (lineEnd < 0 ? head : head.left(lineEnd)).trimmed();
    const QList<QByteArray> parts = requestLine.split(' ');
    if (parts.size() != 3 || !parts[2].startsWith("HTTP/")) {
        respond(socket, makeError(400, "malformed request line"));
        return;
    }

    respond(socket, handleRequest(QString::fromLatin1(parts[0]),
                                  QString::fromUtf8(parts[1])));
}

void ApiServer::respond(QTcpSocket *socket, const HttpResponse &response)
{
    const QByteArray body = QByteArray::fromStdString(
        response.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    QByteArray payload;
    payload += "HTTP/1.1 " + QByteArray::number(response.status) + ' '
        + reasonPhrase(response.status) + "\r\n";
    payload += "Content-Type: application/json\r\n";
    payload += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    if (response.status == 405) {
        payload += "Allow: GET\r\n";
    }
    payload += "Connection: close\r\n\r\n";
    payload += body;

    // No further reads on this connection.
    m_buffers.remove(socket);
    disconnect(socket, &QTcpSocket::readyRead, this, &ApiServer::handleClientReadyRead);
    socket->write(payload);
    socket->flush();
    socket->disconnectFromHost();
}

HttpResponse ApiServer::handleRequest(const QString &method, const QString &target)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);

    QString path = target;
    for (const QChar stop : {QLatin1Char('?'), QLatin1Char('#')}) {
        const int index = path.indexOf(stop);
        if (index >= 0) {
            path.truncate(index);
        }
    }

    APWLOG_DEBUG(QStringLiteral("ApiServer"),
                 QStringLiteral("handleRequest"),
                 QStringLiteral("api_request_received"),
                 QStringLiteral("client_call"),
                 QStringLiteral("http"),
                 logging::defaultWho(),
                 corrId,
                 (nlohmann::json{{"method", method.toStdString()},
                                 {"path", path.toStdString()}}));

    if (method != QStringLiteral("GET")) {
        APWLOG_WARN(QStringLiteral("ApiServer"),
                    QStringLiteral("handleRequest"),
                    QStringLiteral("api_request_error"),
                    QStringLiteral("method_not_allowed"),
                    QStringLiteral("http"),
                    logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"method", method.toStdString()}}));
        return makeError(405, "method not allowed");
    }
    if (!path.startsWith(QLatin1Char('/'))) {
        return makeError(400, "request target must be an absolute path");
    }

    QStringList segments;
    for (const QString &raw : path.split(QLatin1Char('/'), Qt::SkipEmptyParts)) {
        segments << QUrl::fromPercentEncoding(raw.toUtf8());
    }

    const auto start = std::chrono::steady_clock::now();
    HttpResponse response;
    try {
        response = route(segments);
    } catch (const std::exception &ex) {
        APWLOG_ERROR(QStringLiteral("ApiServer"),
                     QStringLiteral("handleRequest"),
                     QStringLiteral("api_request_error"),
                     QStringLiteral("exception"),
                     QStringLiteral("http"),
                     logging::defaultWho(),
                     corrId,
                     (nlohmann::json{{"what", ex.what()}}));
        return makeError(500, ex.what());
    }

    APWLOG_INFO(QStringLiteral("ApiServer"),
                QStringLiteral("handleRequest"),
                QStringLiteral("api_request_completed"),
                QStringLiteral("client_call"),
                QStringLiteral("http"),
                logging::defaultWho(),
                corrId,
                (nlohmann::json{{"path", path.toStdString()},
                                {"status", response.status},
                                {"durationMs",
                                 std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start).count()}}));
    return response;
}

HttpResponse ApiServer::route(const QStringList &segments)
{
    const int count = segments.size();
    if (count == 0) {
        return makeResult({{"devices", m_store.list(DeviceFilter::all())}});
    }

    const QString &resource = segments.first();

    if (resource == QStringLiteral("mac") && count == 2) {
        // Canonicalise so /mac/AA:BB:... finds the same device as /mac/aa:bb:...
        const std::string requested = segments[1].toStdString();
        const auto canonical = parseHardwareAddress(requested);
        const auto view = m_store.get(canonical.value_or(requested));
        nlohmann::json device = nullptr;
        if (view.has_value()) {
            device = *view;
        }
        return makeResult({{"device", device}});
    }

    if (resource == QStringLiteral("stations") && count == 1) {
        return makeResult({{"stations", m_store.stationsIndex()}});
    }

    if (resource == QStringLiteral("ap")) {
        if (count == 1) {
            return makeResult({{"access_points", m_store.accessPoints()}});
        }
        if (count == 2) {
            const auto filter = DeviceFilter::byHostname(segments[1].toStdString());
            return makeResult({{"devices", m_store.list(filter)}});
        }
        if (count == 3) {
            const auto filter = DeviceFilter::byStation(segments[1].toStdString(),
                                                        segments[2].toStdString());
            return makeResult({{"devices", m_store.list(filter)}});
        }
    }

    if (resource == QStringLiteral("interface") && count == 2) {
        const auto filter = DeviceFilter::byInterface(segments[1].toStdString());
        return makeResult({{"devices", m_store.list(filter)}});
    }

    if (resource == QStringLiteral("online") && count == 1) {
        return makeResult({{"devices", m_store.list(DeviceFilter::online())}});
    }

    if (resource == QStringLiteral("offline") && count == 1) {
        return makeResult({{"devices", m_store.list(DeviceFilter::offline())}});
    }

    if (resource == QStringLiteral("map")) {
        if (count == 1) {
            return makeResult({{"device_map", m_store.deviceMap()}});
        }
        if (count == 2 && segments[1] == QStringLiteral("stations")) {
            return makeResult({{"station_map", m_store.stationMap()}});
        }
    }

    if (resource == QStringLiteral("status") && count == 1) {
        return makeResult(nlohmann::json(m_store.status()));
    }

    return makeError(404, "not found");
}

} // namespace apwatch
