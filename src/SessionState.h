#pragma once

#include "OrganModel.h"
#include "RecordingSettings.h"

#include <QJsonObject>
#include <QMap>
#include <QString>

#include <memory>
#include <optional>
#include <vector>

enum class SequencerPhase {
    Idle,
    CountingDown,
    Recording,
    ReviewPending,
    Finished
};

QString phaseName(SequencerPhase phase);

enum class CommandError {
    None,
    InvalidRange,
    InvalidSettings,
    OutOfRange,
    IllegalTransition,
    NoRegisterSelected,
    MalformedCommand
};

QString commandErrorName(CommandError error);

struct ConnectedClient {
    QString id;
    QString role;   // "display" or "remote"
};

// One immutable view of the session. Paths are derived, never stored.
struct SessionSnapshot {
    quint64 version {0};
    SequencerPhase phase {SequencerPhase::Idle};
    Organ organ;
    std::optional<RegisterSelection> selection;
    int note {36};
    int countdownRemaining {0};
    bool continuous {false};   // recording the whole range hands-free
    RecordingSettings settings;
    std::vector<MicrophoneChannel> microphones;
    QMap<QString, QString> channelFailures;   // channel id -> capture status name
    std::vector<ConnectedClient> clients;

    [[nodiscard]] std::optional<RegisterLocation> registerLocation() const;
    // Channel id -> relative path for the current note, one entry per enabled channel.
    [[nodiscard]] QMap<QString, QString> resolvedPaths() const;
    [[nodiscard]] QMap<QString, QString> resolvedPathsFor(int noteIndex) const;
    [[nodiscard]] int notesDone() const;
};

using SnapshotPtr = std::shared_ptr<const SessionSnapshot>;

QJsonObject snapshotToJson(const SessionSnapshot& snapshot);

struct StateCommand {
    enum class Kind {
        SelectOrgan,
        SelectRegister,
        UpdateSettings,
        ConfigureMicrophones,
        SetNote,
        EnterPhase,
        CountdownTick,
        SetContinuous,
        ClientJoined,
        ClientLeft
    };

    Kind kind {Kind::SetNote};
    QString name;                 // organ name or client id
    QString role;
    QStringList keyboards;
    RegisterSelection selection;
    RecordingSettings settings;
    std::vector<MicrophoneChannel> microphones;
    SequencerPhase phase {SequencerPhase::Idle};
    int note {0};
    int countdown {0};
    QMap<QString, QString> failures;
    std::optional<bool> continuous;   // EnterPhase: leave unchanged when unset

    static StateCommand selectOrgan(const QString& organ, const QStringList& keyboards = {});
    static StateCommand selectRegister(const RegisterSelection& selection);
    static StateCommand updateSettings(const RecordingSettings& settings);
    static StateCommand configureMicrophones(const std::vector<MicrophoneChannel>& microphones);
    static StateCommand setNote(int note);
    static StateCommand enterPhase(SequencerPhase phase, int note, int countdown = 0,
                                   const QMap<QString, QString>& failures = {});
    static StateCommand countdownTick(int remaining);
    static StateCommand setContinuous(bool continuous);
    static StateCommand clientJoined(const QString& id, const QString& role);
    static StateCommand clientLeft(const QString& id);
};

struct CommandResult {
    CommandError error {CommandError::None};
    QString message;
    SnapshotPtr snapshot;

    [[nodiscard]] bool ok() const noexcept { return error == CommandError::None; }

    static CommandResult success(SnapshotPtr snapshot);
    static CommandResult failure(CommandError error, const QString& message);
};

// Single source of truth for the session. Only the Sequencer calls applyCommand().
class SessionState {
public:
    explicit SessionState(const QString& organName = QStringLiteral("Organ"),
                          const RecordingSettings& settings = {},
                          const std::vector<MicrophoneChannel>& microphones = {});

    [[nodiscard]] SnapshotPtr snapshot() const { return m_published; }
    [[nodiscard]] quint64 version() const noexcept { return m_current.version; }

    CommandResult applyCommand(const StateCommand& command);

private:
    CommandError apply(const StateCommand& command, SessionSnapshot& next, QString& message) const;
    void publish();

    SessionSnapshot m_current;
    SnapshotPtr m_published;
};
