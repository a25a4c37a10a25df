#include "SyncHub.h"

#include "SessionLogger.h"

#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>

QJsonObject replyToJson(const CommandReply& reply) {
    QJsonObject obj {
        {QStringLiteral("type"), QStringLiteral("reply")},
        {QStringLiteral("command"), remoteCommandName(reply.command)},
        {QStringLiteral("ok"), reply.result.ok()}
    };
    if (reply.requestId >= 0)
        obj.insert(QStringLiteral("requestId"), reply.requestId);
    if (!reply.result.ok()) {
        obj.insert(QStringLiteral("error"), commandErrorName(reply.result.error));
        obj.insert(QStringLiteral("message"), reply.result.message);
    } else if (reply.result.snapshot) {
        obj.insert(QStringLiteral("version"), static_cast<qint64>(reply.result.snapshot->version));
    }
    return obj;
}

SyncHub::SyncHub(Sequencer& sequencer, QObject* parent)
    : QObject(parent)
    , m_sequencer(sequencer) {
    connect(&m_sequencer, &Sequencer::committed, this, &SyncHub::broadcast);
    connect(&m_sequencer, &Sequencer::eventReady, this, &SyncHub::enqueueEvent);
}

SyncHub::~SyncHub() = default;

void SyncHub::connectClient(const QString& clientId, const QString& role, SyncClient* client) {
    if (!client)
        return;
    ClientEntry& entry = m_clients[clientId];
    entry.role = role;
    entry.sink = client;
    entry.deliveredVersion = 0;
    entry.anyDelivered = false;
    entry.outbox.clear();
    qInfo() << "SyncHub" << "client connected" << clientId << role;
    deliver(clientId, entry, m_sequencer.snapshot());

    SequencerEvent event;
    event.kind = SequencerEvent::Kind::ClientJoined;
    event.clientId = clientId;
    event.role = role;
    enqueueEvent(event);
}

void SyncHub::disconnectClient(const QString& clientId) {
    if (m_clients.erase(clientId) == 0)
        return;
    qInfo() << "SyncHub" << "client disconnected" << clientId;

    SequencerEvent event;
    event.kind = SequencerEvent::Kind::ClientLeft;
    event.clientId = clientId;
    enqueueEvent(event);
}

void SyncHub::submit(const QString& clientId, const RemoteCommand& command) {
    QueueItem item;
    item.kind = QueueItem::Kind::Command;
    item.clientId = clientId;
    item.command = command;
    push(std::move(item));
}

void SyncHub::enqueueEvent(const SequencerEvent& event) {
    QueueItem item;
    item.kind = QueueItem::Kind::Event;
    item.event = event;
    push(std::move(item));
}

void SyncHub::push(QueueItem item) {
    {
        QMutexLocker locker(&m_queueMutex);
        m_queue.push_back(std::move(item));
    }
    if (!m_drainScheduled.exchange(true))
        QMetaObject::invokeMethod(this, &SyncHub::drainQueue, Qt::QueuedConnection);
}

void SyncHub::drainQueue() {
    m_drainScheduled.store(false);
    if (m_draining)
        return;
    m_draining = true;
    for (;;) {
        QueueItem item;
        {
            QMutexLocker locker(&m_queueMutex);
            if (m_queue.empty())
                break;
            item = std::move(m_queue.front());
            m_queue.pop_front();
        }
        process(item);
    }
    m_draining = false;
}

void SyncHub::process(const QueueItem& item) {
    if (item.kind == QueueItem::Kind::Event) {
        m_sequencer.handleEvent(item.event);
        return;
    }

    const CommandResult result = m_sequencer.handleCommand(item.command);
    if (!result.ok()) {
        SessionLogger::instance().logf("hub", "%s from %s rejected: %s %s",
                                       qPrintable(remoteCommandName(item.command.type)),
                                       qPrintable(item.clientId),
                                       qPrintable(commandErrorName(result.error)),
                                       qPrintable(result.message));
    }

    // The command counts even if its sender left; only the reply is lost.
    const auto it = m_clients.find(item.clientId);
    if (it != m_clients.end() && it->second.sink) {
        CommandReply reply;
        reply.requestId = item.command.requestId;
        reply.command = item.command.type;
        reply.result = result;
        it->second.sink->sendReply(reply);
    }
    emit commandProcessed(item.clientId, item.command.requestId, result.ok());
}

void SyncHub::broadcast(const SnapshotPtr& snapshot) {
    if (!snapshot)
        return;
    for (auto& [clientId, entry] : m_clients)
        deliver(clientId, entry, snapshot);
}

void SyncHub::deliver(const QString& clientId, ClientEntry& entry, const SnapshotPtr& snapshot) {
    if (!snapshot || (entry.anyDelivered && snapshot->version <= entry.deliveredVersion))
        return;
    if (!entry.outbox.empty() && entry.outbox.back()->version >= snapshot->version)
        return;

    entry.outbox.push_back(snapshot);
    while (entry.outbox.size() > kMaxOutboxSnapshots) {
        entry.outbox.pop_front();
        ++entry.dropped;
    }
    if (entry.dropped > 0 && entry.dropped % kMaxOutboxSnapshots == 0)
        qInfo() << "SyncHub" << "client" << clientId << "is behind, dropped" << entry.dropped << "snapshots";
    pump(entry);
}

void SyncHub::pump(ClientEntry& entry) {
    while (!entry.outbox.empty() && entry.sink && entry.sink->readyForSnapshot()) {
        SnapshotPtr next = entry.outbox.front();
        entry.outbox.pop_front();
        if (entry.anyDelivered && next->version <= entry.deliveredVersion)
            continue;
        entry.deliveredVersion = next->version;
        entry.anyDelivered = true;
        entry.sink->sendSnapshot(next);
    }
}

void SyncHub::flushClient(const QString& clientId) {
    const auto it = m_clients.find(clientId);
    if (it != m_clients.end())
        pump(it->second);
}

void SyncHub::publishLevels(const QMap<QString, float>& levels) {
    for (auto& [clientId, entry] : m_clients) {
        Q_UNUSED(clientId);
        if (entry.sink && entry.sink->readyForSnapshot())
            entry.sink->sendLevels(levels);
    }
}

quint64 SyncHub::deliveredVersion(const QString& clientId) const {
    const auto it = m_clients.find(clientId);
    return it == m_clients.end() ? 0 : it->second.deliveredVersion;
}

std::size_t SyncHub::outboxSize(const QString& clientId) const {
    const auto it = m_clients.find(clientId);
    return it == m_clients.end() ? 0 : it->second.outbox.size();
}

std::size_t SyncHub::droppedSnapshots(const QString& clientId) const {
    const auto it = m_clients.find(clientId);
    return it == m_clients.end() ? 0 : it->second.dropped;
}

std::size_t SyncHub::pendingItems() const {
    QMutexLocker locker(&m_queueMutex);
    return m_queue.size();
}
