#pragma once

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QObject>
#include <QString>
#include <QTcpServer>
#include <QTcpSocket>

#include <nlohmann/json.hpp>

#include "daemon/presence_store.hpp"

namespace apwatch {

struct HttpResponse {
    int status = 200;
    nlohmann::json body;
};

/**
 * ApiServer exposes PresenceStore queries as a read-only JSON HTTP API.
 * Each connection carries one GET request and is closed after the reply.
 */
class ApiServer : public QObject
{
    Q_OBJECT
public:
    explicit ApiServer(PresenceStore &store, QObject *parent = nullptr);
    ~ApiServer() override;

    bool start(const QHostAddress &address, quint16 port);
    void stop();
    quint16 serverPort() const;

    // Route one request without a socket round-trip.
    HttpResponse handleRequest(const QString &method, const QString &target);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    HttpResponse route(const QStringList &segments);
    void respond(QTcpSocket *socket, const HttpResponse &response);

    PresenceStore &m_store;
    QTcpServer m_server;
    QHash<QTcpSocket *, QByteArray> m_buffers;
};

} // namespace apwatch
