#pragma once

#include "../SyncHub.h"

#include <QHostAddress>
#include <QObject>
#include <QString>
#include <QWebSocketServer>

#include <map>
#include <memory>

class AudioCaptureService;
class QWebSocket;

// Accepts display and remote clients over WebSocket and plugs each one into the SyncHub.
// A client picks its role with the URL path (/display or /remote, default remote).
class RemoteControlServer : public QObject {
    Q_OBJECT
public:
    static constexpr qint64 kMaxUnsentBytes = 256 * 1024;

    RemoteControlServer(SyncHub& hub, AudioCaptureService& capture, QObject* parent=nullptr);
    ~RemoteControlServer() override;

    bool listen(const QHostAddress& address, quint16 port);
    void close();

    [[nodiscard]] quint16 serverPort() const { return m_server.serverPort(); }
    [[nodiscard]] int connectionCount() const { return static_cast<int>(m_connections.size()); }

    // ws://<first non-loopback IPv4>:<port>, what a phone on the same network should open.
    [[nodiscard]] QString remoteUrl() const;

    static QString roleForPath(const QString& path);

private:
    class Connection;

    void handleNewConnection();
    void handleTextMessage(const QString& clientId, const QString& message);
    void handleDisconnected(const QString& clientId);
    void replyWithInputs(Connection& connection, qint64 requestId);

    SyncHub& m_hub;
    AudioCaptureService& m_capture;
    QWebSocketServer m_server;
    std::map<QString, std::unique_ptr<Connection>> m_connections;
    quint64 m_nextClientId {1};
};
