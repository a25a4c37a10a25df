#pragma once

#include "CaptureWorker.h"
#include "RemoteCommand.h"
#include "SessionState.h"
#include "audio/AudioCaptureService.h"

#include <QObject>
#include <QTimer>

#include <optional>
#include <vector>

// Something that happened outside a client command: a timer fired, the capture worker
// finished a job, or a client came or went. Events run through the same queue as commands.
struct SequencerEvent {
    enum class Kind {
        CountdownTick,
        RecordTimerExpired,
        AdvanceTimerExpired,
        CaptureStarted,
        CaptureFinished,
        ClientJoined,
        ClientLeft
    };

    Kind kind {Kind::CountdownTick};
    quint64 generation {0};
    QString clientId;
    QString role;
    CaptureBegin begin;
    CaptureResults results;
};

// Walks the note range: countdown, record, review, advance. Owns every write to SessionState.
class Sequencer : public QObject {
    Q_OBJECT
public:
    Sequencer(SessionState& state, AudioCaptureService& capture, QObject* parent=nullptr);
    ~Sequencer() override;

    CommandResult handleCommand(const RemoteCommand& command);
    void handleEvent(const SequencerEvent& event);

    [[nodiscard]] SnapshotPtr snapshot() const { return m_state.snapshot(); }
    [[nodiscard]] bool captureActive() const noexcept { return m_activeHandle != 0; }
    [[nodiscard]] AudioCaptureService& captureService() const noexcept { return m_capture; }

    // Length of one countdown/record "second". Only tests shorten it.
    void setSecondDurationMs(int ms);
    [[nodiscard]] int secondDurationMs() const noexcept { return m_secondMs; }

signals:
    void committed(const SnapshotPtr& snapshot);
    void eventReady(const SequencerEvent& event);
    void registerCompleted(const SnapshotPtr& snapshot);
    void shutdownRequested();

private:
    CommandResult commit(const StateCommand& command);
    CommandResult illegal(RemoteCommandType type, SequencerPhase phase) const;
    CommandResult beginCountdown(int note, std::optional<bool> continuous = std::nullopt);
    CommandResult stopSession();
    CommandResult advance(const SessionSnapshot& current);
    CommandResult recordAll(const SessionSnapshot& current);
    CommandResult pause(const SessionSnapshot& current);
    CommandResult shutdown(const SessionSnapshot& current);
    CommandResult updateSettings(const SessionSnapshot& current, const QJsonObject& patch);

    void onCountdownTick();
    void startRecording();
    void onCaptureStarted(const CaptureBegin& begin);
    void onRecordTimerExpired();
    void onAdvanceTimerExpired();
    void onCaptureFinished(const CaptureResults& results);
    void enterReview(int note, const QMap<QString, QString>& failures);
    void discardTake(CaptureHandle handle);
    void postEvent(SequencerEvent event);
    void journal(const SessionSnapshot& snapshot) const;

    SessionState& m_state;
    AudioCaptureService& m_capture;
    QTimer m_countdownTimer;
    QTimer m_recordTimer;
    QTimer m_advanceTimer;   // pause between notes in a continuous run
    int m_secondMs {1000};
    quint64 m_generation {0};
    CaptureHandle m_activeHandle {0};
    std::vector<CaptureTarget> m_targets;

    // Declared last: its destructor drains pending capture jobs before anything above goes away.
    CaptureWorker m_worker;
};
