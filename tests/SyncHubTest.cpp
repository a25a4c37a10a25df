#include "FakeCaptureService.h"
#include "RecordingClient.h"
#include "Sequencer.h"
#include "SyncHub.h"

#include <QSignalSpy>
#include <QTemporaryDir>
#include <QtTest>

#include <thread>

namespace {

const QString kDisplay = QStringLiteral("display-1");
const QString kRemote = QStringLiteral("remote-1");

RecordingSettings quickSettings() {
    RecordingSettings settings;
    settings.countdownSeconds = 1;
    settings.recordSeconds = 1;
    return settings;
}

RemoteCommand setNote(int note, qint64 requestId) {
    RemoteCommand command = RemoteCommand::simple(RemoteCommandType::SetNote, requestId);
    command.note = note;
    return command;
}

bool strictlyIncreasing(const std::vector<SnapshotPtr>& snapshots) {
    for (std::size_t i = 1; i < snapshots.size(); ++i) {
        if (snapshots[i]->version <= snapshots[i - 1]->version)
            return false;
    }
    return true;
}

struct HubRig {
    HubRig()
        : state(QStringLiteral("Bavokerk"), quickSettings())
        , sequencer(state, capture)
        , hub(sequencer) {
        sequencer.setSecondDurationMs(10);
    }

    bool settle(std::size_t processed, QSignalSpy& spy, int timeoutMs = 3000) {
        return QTest::qWaitFor([&]() { return static_cast<std::size_t>(spy.count()) >= processed; }, timeoutMs);
    }

    bool waitForClients(int count) {
        return QTest::qWaitFor([&]() {
            return static_cast<int>(state.snapshot()->clients.size()) == count && hub.pendingItems() == 0;
        }, 3000);
    }

    QTemporaryDir dir;
    FakeCaptureService capture {dir.path()};
    RecordingClient display;
    RecordingClient remote;
    SessionState state;
    Sequencer sequencer;
    SyncHub hub;
};

} // namespace

class SyncHubTest : public QObject {
    Q_OBJECT

private slots:
    void connectDeliversCurrentSnapshot();
    void simultaneousNextAdvancesOnce();
    void repliesGoOnlyToSubmitter();
    void slowClientOutboxStaysBounded();
    void commandOutlivesDisconnect();
    void levelsSkipBusyClients();
    void submitFromWorkerThreads();
    void replyJsonShape();
};

void SyncHubTest::connectDeliversCurrentSnapshot() {
    HubRig rig;
    rig.hub.connectClient(kDisplay, QStringLiteral("display"), &rig.display);
    QCOMPARE(rig.display.snapshots.size(), std::size_t(1));
    QCOMPARE(rig.display.snapshots.front()->version, quint64(0));
    QCOMPARE(rig.hub.clientCount(), 1);

    QVERIFY(rig.waitForClients(1));
    QCOMPARE(rig.display.latest()->version, quint64(1));
    QCOMPARE(rig.display.latest()->clients.front().id, kDisplay);
    QCOMPARE(rig.display.latest()->clients.front().role, QStringLiteral("display"));
    QCOMPARE(rig.hub.deliveredVersion(kDisplay), quint64(1));
}

void SyncHubTest::simultaneousNextAdvancesOnce() {
    HubRig rig;
    rig.hub.connectClient(kDisplay, QStringLiteral("remote"), &rig.display);
    rig.hub.connectClient(kRemote, QStringLiteral("remote"), &rig.remote);

    RemoteCommand select = RemoteCommand::simple(RemoteCommandType::SelectRegister, 1);
    select.selection.label = QStringLiteral("Prestant 8'");
    rig.hub.submit(kRemote, select);
    rig.hub.submit(kRemote, RemoteCommand::simple(RemoteCommandType::Start, 2));
    QVERIFY(QTest::qWaitFor([&]() {
        return rig.state.snapshot()->phase == SequencerPhase::ReviewPending;
    }, 3000));

    // Both arrive before the hub drains; the second sees the countdown the first started.
    rig.hub.submit(kDisplay, RemoteCommand::simple(RemoteCommandType::Next, 100));
    rig.hub.submit(kRemote, RemoteCommand::simple(RemoteCommandType::Next, 200));
    QVERIFY(QTest::qWaitFor([&]() {
        return rig.display.replyFor(100) && rig.remote.replyFor(200);
    }, 3000));

    QVERIFY(rig.display.replyFor(100)->result.ok());
    QCOMPARE(rig.remote.replyFor(200)->result.error, CommandError::IllegalTransition);
    QCOMPARE(rig.state.snapshot()->note, 37);
    QVERIFY(strictlyIncreasing(rig.display.snapshots));
    QVERIFY(strictlyIncreasing(rig.remote.snapshots));
}

void SyncHubTest::repliesGoOnlyToSubmitter() {
    HubRig rig;
    rig.hub.connectClient(kDisplay, QStringLiteral("display"), &rig.display);
    rig.hub.connectClient(kRemote, QStringLiteral("remote"), &rig.remote);

    rig.hub.submit(kRemote, RemoteCommand::simple(RemoteCommandType::Start, 5));
    QVERIFY(QTest::qWaitFor([&]() { return rig.remote.replyFor(5) != nullptr; }, 3000));
    QCOMPARE(rig.remote.replyFor(5)->result.error, CommandError::NoRegisterSelected);
    QVERIFY(rig.display.replies.empty());
}

void SyncHubTest::slowClientOutboxStaysBounded() {
    HubRig rig;
    QSignalSpy processed(&rig.hub, &SyncHub::commandProcessed);
    rig.display.ready = false;
    rig.hub.connectClient(kDisplay, QStringLiteral("display"), &rig.display);
    rig.hub.connectClient(kRemote, QStringLiteral("remote"), &rig.remote);

    constexpr int kCommands = 20;
    for (int i = 0; i < kCommands; ++i)
        rig.hub.submit(kRemote, setNote(36 + i, i));
    QVERIFY(rig.settle(kCommands, processed));
    QVERIFY(rig.waitForClients(2));

    QVERIFY(rig.display.snapshots.empty());
    QVERIFY(rig.hub.outboxSize(kDisplay) <= SyncHub::kMaxOutboxSnapshots);
    QVERIFY(rig.hub.droppedSnapshots(kDisplay) > 0);
    QCOMPARE(rig.hub.droppedSnapshots(kRemote), std::size_t(0));

    // The fast client saw every version.
    const auto& fast = rig.remote.snapshots;
    for (std::size_t i = 1; i < fast.size(); ++i)
        QCOMPARE(fast[i]->version, fast[i - 1]->version + 1);

    rig.display.ready = true;
    rig.hub.flushClient(kDisplay);
    QVERIFY(!rig.display.snapshots.empty());
    QVERIFY(rig.display.snapshots.size() <= SyncHub::kMaxOutboxSnapshots);
    QVERIFY(strictlyIncreasing(rig.display.snapshots));
    QCOMPARE(rig.display.latest()->version, rig.state.version());
    QCOMPARE(rig.display.latest()->note, 36 + kCommands - 1);
    QCOMPARE(rig.hub.outboxSize(kDisplay), std::size_t(0));
}

void SyncHubTest::commandOutlivesDisconnect() {
    HubRig rig;
    QSignalSpy processed(&rig.hub, &SyncHub::commandProcessed);
    rig.hub.connectClient(kRemote, QStringLiteral("remote"), &rig.remote);
    rig.hub.connectClient(kDisplay, QStringLiteral("display"), &rig.display);

    rig.hub.submit(kRemote, setNote(50, 9));
    rig.hub.disconnectClient(kRemote);
    QCOMPARE(rig.hub.clientCount(), 1);

    QVERIFY(rig.settle(1, processed));
    QVERIFY(rig.waitForClients(1));
    QCOMPARE(rig.state.snapshot()->note, 50);
    QVERIFY(rig.remote.replies.empty());
    QCOMPARE(processed.first().at(0).toString(), kRemote);
    QCOMPARE(processed.first().at(1).toLongLong(), qint64(9));
    QVERIFY(processed.first().at(2).toBool());
    QCOMPARE(rig.state.snapshot()->clients.front().id, kDisplay);
    QCOMPARE(rig.display.latest()->version, rig.state.version());
}

void SyncHubTest::levelsSkipBusyClients() {
    HubRig rig;
    rig.hub.connectClient(kDisplay, QStringLiteral("display"), &rig.display);
    rig.hub.connectClient(kRemote, QStringLiteral("remote"), &rig.remote);
    rig.remote.ready = false;

    QMap<QString, float> levels;
    levels.insert(QStringLiteral("main"), 0.25f);
    rig.hub.publishLevels(levels);
    QCOMPARE(rig.display.levels.size(), std::size_t(1));
    QCOMPARE(rig.display.levels.front().value(QStringLiteral("main")), 0.25f);
    QVERIFY(rig.remote.levels.empty());
}

void SyncHubTest::submitFromWorkerThreads() {
    HubRig rig;
    QSignalSpy processed(&rig.hub, &SyncHub::commandProcessed);
    rig.hub.connectClient(kRemote, QStringLiteral("remote"), &rig.remote);

    constexpr int kPerThread = 25;
    std::thread first([&rig]() {
        for (int i = 0; i < kPerThread; ++i)
            rig.hub.submit(kRemote, setNote(40, i));
    });
    std::thread second([&rig]() {
        for (int i = 0; i < kPerThread; ++i)
            rig.hub.submit(kRemote, setNote(60, 1000 + i));
    });
    first.join();
    second.join();

    QVERIFY(rig.settle(2 * kPerThread, processed));
    QCOMPARE(rig.remote.replies.size(), std::size_t(2 * kPerThread));
    for (const auto& reply : rig.remote.replies)
        QVERIFY(reply.result.ok());
    QVERIFY(rig.waitForClients(1));

    // Join plus one commit per command.
    QCOMPARE(rig.state.version(), quint64(2 * kPerThread + 1));
    const auto& seen = rig.remote.snapshots;
    for (std::size_t i = 1; i < seen.size(); ++i)
        QCOMPARE(seen[i]->version, seen[i - 1]->version + 1);
}

void SyncHubTest::replyJsonShape() {
    CommandReply failed;
    failed.requestId = 3;
    failed.command = RemoteCommandType::Start;
    failed.result = CommandResult::failure(CommandError::IllegalTransition, QStringLiteral("busy"));
    const QJsonObject json = replyToJson(failed);
    QCOMPARE(json.value(QStringLiteral("type")).toString(), QStringLiteral("reply"));
    QCOMPARE(json.value(QStringLiteral("command")).toString(), QStringLiteral("start"));
    QCOMPARE(json.value(QStringLiteral("ok")).toBool(), false);
    QCOMPARE(json.value(QStringLiteral("requestId")).toInteger(), qint64(3));
    QCOMPARE(json.value(QStringLiteral("error")).toString(), QStringLiteral("IllegalTransition"));

    SessionState state;
    CommandReply accepted;
    accepted.command = RemoteCommandType::SetNote;
    accepted.result = state.applyCommand(StateCommand::setNote(40));
    const QJsonObject ok = replyToJson(accepted);
    QVERIFY(ok.value(QStringLiteral("ok")).toBool());
    QVERIFY(!ok.contains(QStringLiteral("requestId")));
    QCOMPARE(ok.value(QStringLiteral("version")).toInteger(), qint64(1));
}

QTEST_GUILESS_MAIN(SyncHubTest)
#include "SyncHubTest.moc"
