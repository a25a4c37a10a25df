#pragma once

#include "RemoteCommand.h"
#include "Sequencer.h"
#include "SessionState.h"

#include <QJsonObject>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QString>

#include <atomic>
#include <deque>
#include <map>

struct CommandReply {
    qint64 requestId {-1};
    RemoteCommandType command {RemoteCommandType::Start};
    CommandResult result;
};

QJsonObject replyToJson(const CommandReply& reply);

// Outbound side of one connected client. Implementations must not block.
class SyncClient {
public:
    virtual ~SyncClient() = default;

    // False while the transport still has a backlog; the hub parks snapshots in the outbox.
    virtual bool readyForSnapshot() const { return true; }
    virtual void sendSnapshot(const SnapshotPtr& snapshot) = 0;
    virtual void sendReply(const CommandReply& reply) = 0;
    virtual void sendLevels(const QMap<QString, float>& levels) { Q_UNUSED(levels); }
};

// Serializes every command and event into one FIFO consumed on the hub thread and fans
// the resulting snapshots out to all clients in version order.
class SyncHub : public QObject {
    Q_OBJECT
public:
    static constexpr std::size_t kMaxOutboxSnapshots = 8;

    explicit SyncHub(Sequencer& sequencer, QObject* parent=nullptr);
    ~SyncHub() override;

    // Hub thread only. The current snapshot is delivered right away; the join itself is queued.
    void connectClient(const QString& clientId, const QString& role, SyncClient* client);
    void disconnectClient(const QString& clientId);

    // Thread-safe.
    void submit(const QString& clientId, const RemoteCommand& command);
    void enqueueEvent(const SequencerEvent& event);

    // Called by a transport once its backlog cleared.
    void flushClient(const QString& clientId);
    void publishLevels(const QMap<QString, float>& levels);

    [[nodiscard]] int clientCount() const { return static_cast<int>(m_clients.size()); }
    [[nodiscard]] quint64 deliveredVersion(const QString& clientId) const;
    [[nodiscard]] std::size_t outboxSize(const QString& clientId) const;
    [[nodiscard]] std::size_t droppedSnapshots(const QString& clientId) const;
    [[nodiscard]] std::size_t pendingItems() const;

signals:
    void commandProcessed(const QString& clientId, qint64 requestId, bool ok);

private:
    struct QueueItem {
        enum class Kind { Command, Event };
        Kind kind {Kind::Command};
        QString clientId;
        RemoteCommand command;
        SequencerEvent event;
    };

    struct ClientEntry {
        QString role;
        SyncClient* sink {nullptr};
        quint64 deliveredVersion {0};
        bool anyDelivered {false};
        std::deque<SnapshotPtr> outbox;
        std::size_t dropped {0};
    };

    void push(QueueItem item);
    void drainQueue();
    void process(const QueueItem& item);
    void broadcast(const SnapshotPtr& snapshot);
    void deliver(const QString& clientId, ClientEntry& entry, const SnapshotPtr& snapshot);
    void pump(ClientEntry& entry);

    Sequencer& m_sequencer;
    mutable QMutex m_queueMutex;
    std::deque<QueueItem> m_queue;
    std::atomic<bool> m_drainScheduled {false};
    bool m_draining {false};
    std::map<QString, ClientEntry> m_clients;
};
