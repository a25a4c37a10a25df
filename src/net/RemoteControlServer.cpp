#include "RemoteControlServer.h"

#include "../SessionLogger.h"
#include "../util.h"
#include "../audio/AudioCaptureService.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkInterface>
#include <QUrl>
#include <QUrlQuery>
#include <QWebSocket>

#include <algorithm>
#include <optional>

class RemoteControlServer::Connection : public SyncClient {
public:
    Connection(RemoteControlServer& server, QString clientId, QString role, QWebSocket* socket)
        : m_server(server)
        , m_clientId(std::move(clientId))
        , m_role(std::move(role))
        , m_socket(socket) {
        QObject::connect(m_socket, &QWebSocket::bytesWritten, &m_server, [this](qint64 bytes) {
            const bool wasBusy = !readyForSnapshot();
            m_unsent = std::max<qint64>(0, m_unsent - bytes);
            if (wasBusy && readyForSnapshot())
                m_server.m_hub.flushClient(m_clientId);
        });
    }

    ~Connection() override {
        if (m_socket) {
            QObject::disconnect(m_socket, nullptr, &m_server, nullptr);
            m_socket->deleteLater();
        }
    }

    const QString& clientId() const { return m_clientId; }
    const QString& role() const { return m_role; }
    QWebSocket* socket() const { return m_socket; }

    bool readyForSnapshot() const override { return m_unsent < kMaxUnsentBytes; }

    void sendSnapshot(const SnapshotPtr& snapshot) override {
        send(snapshotToJson(*snapshot));
    }

    void sendReply(const CommandReply& reply) override {
        send(replyToJson(reply));
    }

    void sendLevels(const QMap<QString, float>& levels) override {
        QJsonObject values;
        for (auto it = levels.cbegin(); it != levels.cend(); ++it)
            values.insert(it.key(), static_cast<double>(it.value()));
        send(QJsonObject {{QStringLiteral("type"), QStringLiteral("levels")}, {QStringLiteral("levels"), values}});
    }

    void send(const QJsonObject& obj) {
        if (!m_socket || !m_socket->isValid())
            return;
        const QString text = QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
        m_unsent += m_socket->sendTextMessage(text);
    }

private:
    RemoteControlServer& m_server;
    QString m_clientId;
    QString m_role;
    QWebSocket* m_socket {nullptr};
    qint64 m_unsent {0};
};

RemoteControlServer::RemoteControlServer(SyncHub& hub, AudioCaptureService& capture, QObject* parent)
    : QObject(parent)
    , m_hub(hub)
    , m_capture(capture)
    , m_server(QStringLiteral("OrganRec"), QWebSocketServer::NonSecureMode) {
    connect(&m_server, &QWebSocketServer::newConnection, this, &RemoteControlServer::handleNewConnection);
    connect(&m_server, &QWebSocketServer::acceptError, this, [](QAbstractSocket::SocketError error) {
        qWarning() << "RemoteControlServer" << "accept error" << error;
    });
}

RemoteControlServer::~RemoteControlServer() {
    close();
}

bool RemoteControlServer::listen(const QHostAddress& address, quint16 port) {
    if (!m_server.listen(address, port)) {
        qWarning() << "RemoteControlServer" << "cannot listen on" << address.toString() << port << m_server.errorString();
        return false;
    }
    qInfo() << "RemoteControlServer" << "listening on" << address.toString() << m_server.serverPort();
    SessionLogger::instance().logf("server", "listening on %s:%u",
                                   qPrintable(address.toString()), static_cast<unsigned>(m_server.serverPort()));
    return true;
}

void RemoteControlServer::close() {
    if (m_server.isListening())
        m_server.close();
    while (!m_connections.empty())
        handleDisconnected(m_connections.begin()->first);
}

QString RemoteControlServer::remoteUrl() const {
    QString host = QStringLiteral("127.0.0.1");
    for (const QHostAddress& address : QNetworkInterface::allAddresses()) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback()) {
            host = address.toString();
            break;
        }
    }
    return QStringLiteral("ws://%1:%2").arg(host).arg(m_server.serverPort());
}

QString RemoteControlServer::roleForPath(const QString& path) {
    const QString trimmed = path.section(QLatin1Char('/'), 1, 1).toLower();
    return trimmed == QLatin1String("display") ? QStringLiteral("display") : QStringLiteral("remote");
}

void RemoteControlServer::handleNewConnection() {
    while (QWebSocket* socket = m_server.nextPendingConnection()) {
        const QUrl url = socket->requestUrl();
        QString role = roleForPath(url.path());
        const QString queryRole = QUrlQuery(url).queryItemValue(QStringLiteral("role"));
        if (!queryRole.isEmpty())
            role = roleForPath(QLatin1Char('/') + queryRole);

        const QString clientId = QStringLiteral("%1-%2").arg(role).arg(m_nextClientId++);
        auto connection = std::make_unique<Connection>(*this, clientId, role, socket);
        Connection* raw = connection.get();
        m_connections[clientId] = std::move(connection);

        connect(socket, &QWebSocket::textMessageReceived, this, [this, clientId](const QString& message) {
            handleTextMessage(clientId, message);
        });
        connect(socket, &QWebSocket::disconnected, this, [this, clientId]() {
            handleDisconnected(clientId);
        });

        qInfo() << "RemoteControlServer" << "client" << clientId << "from" << socket->peerAddress().toString();
        SessionLogger::instance().logf("server", "client %s connected from %s",
                                       qPrintable(clientId), qPrintable(socket->peerAddress().toString()));
        m_hub.connectClient(clientId, role, raw);
    }
}

void RemoteControlServer::handleTextMessage(const QString& clientId, const QString& message) {
    const auto it = m_connections.find(clientId);
    if (it == m_connections.end())
        return;
    Connection& connection = *it->second;

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &parseError);
    QString problem;
    std::optional<RemoteCommand> command;
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        problem = parseError.error != QJsonParseError::NoError ? parseError.errorString()
                                                               : QStringLiteral("expected a JSON object");
    } else {
        command = RemoteCommand::fromJson(doc.object(), &problem);
    }

    if (!command) {
        CommandReply reply;
        const QJsonValue requestId = doc.isObject() ? doc.object().value(QStringLiteral("requestId")) : QJsonValue();
        const std::optional<long long> echoed = requestId.isDouble() ? exactRequestId(requestId.toDouble()) : std::nullopt;
        reply.requestId = echoed ? static_cast<qint64>(*echoed) : -1;
        reply.result = CommandResult::failure(CommandError::MalformedCommand, problem);
        connection.sendReply(reply);
        qInfo() << "RemoteControlServer" << "malformed message from" << clientId << problem;
        return;
    }

    if (command->type == RemoteCommandType::ListInputs) {
        replyWithInputs(connection, command->requestId);
        return;
    }
    m_hub.submit(clientId, *command);
}

void RemoteControlServer::replyWithInputs(Connection& connection, qint64 requestId) {
    QJsonArray inputs;
    for (const auto& input : m_capture.availableInputs())
        inputs.append(QJsonObject {{QStringLiteral("id"), input.id}, {QStringLiteral("name"), input.name}});

    QJsonObject obj {
        {QStringLiteral("type"), QStringLiteral("reply")},
        {QStringLiteral("command"), remoteCommandName(RemoteCommandType::ListInputs)},
        {QStringLiteral("ok"), true},
        {QStringLiteral("inputs"), inputs}
    };
    if (requestId >= 0)
        obj.insert(QStringLiteral("requestId"), requestId);
    connection.send(obj);
}

void RemoteControlServer::handleDisconnected(const QString& clientId) {
    const auto it = m_connections.find(clientId);
    if (it == m_connections.end())
        return;
    m_hub.disconnectClient(clientId);
    m_connections.erase(it);
    SessionLogger::instance().logf("server", "client %s disconnected", qPrintable(clientId));
}
