#include "SessionState.h"

#include "NamingEngine.h"

#include <QDebug>
#include <QJsonArray>

#include <algorithm>

QString phaseName(SequencerPhase phase) {
    switch (phase) {
        case SequencerPhase::Idle: return QStringLiteral("Idle");
        case SequencerPhase::CountingDown: return QStringLiteral("CountingDown");
        case SequencerPhase::Recording: return QStringLiteral("Recording");
        case SequencerPhase::ReviewPending: return QStringLiteral("ReviewPending");
        case SequencerPhase::Finished: return QStringLiteral("Finished");
    }
    return QStringLiteral("Unknown");
}

QString commandErrorName(CommandError error) {
    switch (error) {
        case CommandError::None: return QString();
        case CommandError::InvalidRange: return QStringLiteral("InvalidRange");
        case CommandError::InvalidSettings: return QStringLiteral("InvalidSettings");
        case CommandError::OutOfRange: return QStringLiteral("OutOfRange");
        case CommandError::IllegalTransition: return QStringLiteral("IllegalTransition");
        case CommandError::NoRegisterSelected: return QStringLiteral("NoRegisterSelected");
        case CommandError::MalformedCommand: return QStringLiteral("MalformedCommand");
    }
    return QStringLiteral("Unknown");
}

std::optional<RegisterLocation> SessionSnapshot::registerLocation() const {
    if (!selection)
        return std::nullopt;
    return RegisterLocation {organ.name, selection->keyboard, selection->label};
}

QMap<QString, QString> SessionSnapshot::resolvedPaths() const {
    return resolvedPathsFor(note);
}

QMap<QString, QString> SessionSnapshot::resolvedPathsFor(int noteIndex) const {
    QMap<QString, QString> paths;
    const auto location = registerLocation();
    if (!location)
        return paths;
    const auto enabled = enabledMicrophones(microphones);
    // A single microphone records straight into the register folder.
    const bool perPosition = enabled.size() > 1;
    for (const auto& mic : enabled) {
        const auto position = perPosition ? std::optional<QString>(mic.position) : std::nullopt;
        paths.insert(mic.id, NamingEngine::pathFor(*location, selection->tremulant, position, noteIndex));
    }
    return paths;
}

int SessionSnapshot::notesDone() const {
    int done = note - settings.startNote;
    if (phase == SequencerPhase::ReviewPending || phase == SequencerPhase::Finished)
        ++done;
    return std::clamp(done, 0, settings.noteCount());
}

QJsonObject snapshotToJson(const SessionSnapshot& snapshot) {
    QJsonObject obj;
    obj.insert(QStringLiteral("type"), QStringLiteral("snapshot"));
    obj.insert(QStringLiteral("version"), static_cast<qint64>(snapshot.version));
    obj.insert(QStringLiteral("phase"), phaseName(snapshot.phase));
    obj.insert(QStringLiteral("organ"), organToJson(snapshot.organ));

    if (snapshot.selection) {
        obj.insert(QStringLiteral("keyboard"), snapshot.selection->keyboard);
        obj.insert(QStringLiteral("register"), QJsonObject {
            {QStringLiteral("label"), snapshot.selection->label},
            {QStringLiteral("canonical"), NamingEngine::format(snapshot.selection->label, snapshot.selection->tremulant)},
            {QStringLiteral("tremulant"), snapshot.selection->tremulant}
        });
    } else {
        obj.insert(QStringLiteral("keyboard"), QJsonValue::Null);
        obj.insert(QStringLiteral("register"), QJsonValue::Null);
    }

    const int total = snapshot.settings.noteCount();
    const int done = snapshot.notesDone();
    obj.insert(QStringLiteral("note"), QJsonObject {
        {QStringLiteral("index"), snapshot.note},
        {QStringLiteral("name"), NamingEngine::noteDisplayName(snapshot.note)},
        {QStringLiteral("file"), NamingEngine::noteFileName(snapshot.note)},
        {QStringLiteral("progress"), QJsonObject {
            {QStringLiteral("total"), total},
            {QStringLiteral("done"), done},
            {QStringLiteral("remaining"), total - done}
        }}
    });
    obj.insert(QStringLiteral("countdown"), snapshot.countdownRemaining);
    obj.insert(QStringLiteral("continuous"), snapshot.continuous);
    obj.insert(QStringLiteral("settings"), settingsToJson(snapshot.settings));
    obj.insert(QStringLiteral("microphones"), microphonesToJson(snapshot.microphones));

    QJsonObject failures;
    for (auto it = snapshot.channelFailures.cbegin(); it != snapshot.channelFailures.cend(); ++it)
        failures.insert(it.key(), it.value());
    obj.insert(QStringLiteral("failures"), failures);

    QJsonObject paths;
    const auto resolved = snapshot.resolvedPaths();
    for (auto it = resolved.cbegin(); it != resolved.cend(); ++it)
        paths.insert(it.key(), it.value());
    obj.insert(QStringLiteral("paths"), paths);

    QJsonArray clients;
    for (const auto& client : snapshot.clients)
        clients.append(QJsonObject {{QStringLiteral("id"), client.id}, {QStringLiteral("role"), client.role}});
    obj.insert(QStringLiteral("clients"), clients);
    return obj;
}

StateCommand StateCommand::selectOrgan(const QString& organ, const QStringList& keyboards) {
    StateCommand cmd;
    cmd.kind = Kind::SelectOrgan;
    cmd.name = organ;
    cmd.keyboards = keyboards;
    return cmd;
}

StateCommand StateCommand::selectRegister(const RegisterSelection& selection) {
    StateCommand cmd;
    cmd.kind = Kind::SelectRegister;
    cmd.selection = selection;
    return cmd;
}

StateCommand StateCommand::updateSettings(const RecordingSettings& settings) {
    StateCommand cmd;
    cmd.kind = Kind::UpdateSettings;
    cmd.settings = settings;
    return cmd;
}

StateCommand StateCommand::configureMicrophones(const std::vector<MicrophoneChannel>& microphones) {
    StateCommand cmd;
    cmd.kind = Kind::ConfigureMicrophones;
    cmd.microphones = microphones;
    return cmd;
}

StateCommand StateCommand::setNote(int note) {
    StateCommand cmd;
    cmd.kind = Kind::SetNote;
    cmd.note = note;
    return cmd;
}

StateCommand StateCommand::enterPhase(SequencerPhase phase, int note, int countdown,
                                      const QMap<QString, QString>& failures) {
    StateCommand cmd;
    cmd.kind = Kind::EnterPhase;
    cmd.phase = phase;
    cmd.note = note;
    cmd.countdown = countdown;
    cmd.failures = failures;
    return cmd;
}

StateCommand StateCommand::countdownTick(int remaining) {
    StateCommand cmd;
    cmd.kind = Kind::CountdownTick;
    cmd.countdown = remaining;
    return cmd;
}

StateCommand StateCommand::setContinuous(bool continuous) {
    StateCommand cmd;
    cmd.kind = Kind::SetContinuous;
    cmd.continuous = continuous;
    return cmd;
}

StateCommand StateCommand::clientJoined(const QString& id, const QString& role) {
    StateCommand cmd;
    cmd.kind = Kind::ClientJoined;
    cmd.name = id;
    cmd.role = role;
    return cmd;
}

StateCommand StateCommand::clientLeft(const QString& id) {
    StateCommand cmd;
    cmd.kind = Kind::ClientLeft;
    cmd.name = id;
    return cmd;
}

CommandResult CommandResult::success(SnapshotPtr snapshot) {
    CommandResult result;
    result.snapshot = std::move(snapshot);
    return result;
}

CommandResult CommandResult::failure(CommandError error, const QString& message) {
    CommandResult result;
    result.error = error;
    result.message = message;
    return result;
}

SessionState::SessionState(const QString& organName,
                           const RecordingSettings& settings,
                           const std::vector<MicrophoneChannel>& microphones) {
    m_current.organ = makeOrgan(organName.trimmed().isEmpty() ? QStringLiteral("Organ") : organName);

    QString problem;
    if (validateSettings(settings, &problem) == SettingsProblem::None) {
        m_current.settings = settings;
    } else {
        qWarning() << "SessionState" << "ignoring configured settings:" << problem;
    }

    if (validateMicrophones(microphones, &problem)) {
        m_current.microphones = microphones;
    } else {
        if (!microphones.empty())
            qWarning() << "SessionState" << "ignoring configured microphones:" << problem;
        m_current.microphones = {defaultMicrophone()};
    }

    m_current.note = m_current.settings.startNote;
    publish();
}

void SessionState::publish() {
    m_published = std::make_shared<const SessionSnapshot>(m_current);
}

CommandResult SessionState::applyCommand(const StateCommand& command) {
    SessionSnapshot next = m_current;
    QString message;
    const CommandError error = apply(command, next, message);
    if (error != CommandError::None)
        return CommandResult::failure(error, message);

    next.version = m_current.version + 1;
    m_current = std::move(next);
    publish();
    return CommandResult::success(m_published);
}

CommandError SessionState::apply(const StateCommand& command, SessionSnapshot& next, QString& message) const {
    using Kind = StateCommand::Kind;

    switch (command.kind) {
        case Kind::SelectOrgan: {
            if (command.name.trimmed().isEmpty()) {
                message = QStringLiteral("organ name must not be empty");
                return CommandError::InvalidSettings;
            }
            next.organ = makeOrgan(command.name, command.keyboards);
            next.selection.reset();
            next.phase = SequencerPhase::Idle;
            next.continuous = false;
            next.note = next.settings.startNote;
            next.countdownRemaining = 0;
            next.channelFailures.clear();
            return CommandError::None;
        }

        case Kind::SelectRegister: {
            RegisterSelection selection = command.selection;
            selection.label = selection.label.trimmed();
            selection.keyboard = selection.keyboard.trimmed();
            if (selection.label.isEmpty()) {
                message = QStringLiteral("register label must not be empty");
                return CommandError::NoRegisterSelected;
            }
            if (selection.keyboard.isEmpty()) {
                if (next.organ.keyboards.empty()) {
                    message = QStringLiteral("organ has no keyboards");
                    return CommandError::InvalidSettings;
                }
                selection.keyboard = next.organ.keyboards.front().name;
            }
            // Saying "tremulant" in the label is the same as ticking the box.
            selection.tremulant = selection.tremulant || NamingEngine::mentionsTremulant(selection.label);
            Keyboard& keyboard = next.organ.ensureKeyboard(selection.keyboard);
            selection.keyboard = keyboard.name;
            keyboard.ensureRegister(selection.label, selection.tremulant);

            next.selection = selection;
            next.phase = SequencerPhase::Idle;
            next.continuous = false;
            next.note = next.settings.startNote;
            next.countdownRemaining = 0;
            next.channelFailures.clear();
            return CommandError::None;
        }

        case Kind::UpdateSettings: {
            switch (validateSettings(command.settings, &message)) {
                case SettingsProblem::InvalidRange: return CommandError::InvalidRange;
                case SettingsProblem::InvalidValue: return CommandError::InvalidSettings;
                case SettingsProblem::None: break;
            }
            next.settings = command.settings;
            next.note = std::clamp(next.note, next.settings.startNote, next.settings.endNote);
            return CommandError::None;
        }

        case Kind::ConfigureMicrophones: {
            if (!validateMicrophones(command.microphones, &message))
                return CommandError::InvalidSettings;
            next.microphones = command.microphones;
            next.channelFailures.clear();
            return CommandError::None;
        }

        case Kind::SetNote: {
            if (!next.settings.containsNote(command.note)) {
                message = QStringLiteral("note %1 is outside %2..%3")
                              .arg(command.note).arg(next.settings.startNote).arg(next.settings.endNote);
                return CommandError::OutOfRange;
            }
            next.note = command.note;
            next.phase = SequencerPhase::Idle;
            next.continuous = false;
            next.countdownRemaining = 0;
            next.channelFailures.clear();
            return CommandError::None;
        }

        case Kind::EnterPhase: {
            if (!next.settings.containsNote(command.note)) {
                message = QStringLiteral("note %1 is outside %2..%3")
                              .arg(command.note).arg(next.settings.startNote).arg(next.settings.endNote);
                return CommandError::OutOfRange;
            }
            const bool capturing = command.phase == SequencerPhase::CountingDown
                || command.phase == SequencerPhase::Recording;
            if (capturing && !next.selection) {
                message = QStringLiteral("select a register first");
                return CommandError::NoRegisterSelected;
            }
            next.phase = command.phase;
            next.note = command.note;
            next.countdownRemaining = command.phase == SequencerPhase::CountingDown ? command.countdown : 0;
            if (command.phase == SequencerPhase::CountingDown || command.phase == SequencerPhase::Idle)
                next.channelFailures.clear();
            else if (command.phase == SequencerPhase::ReviewPending)
                next.channelFailures = command.failures;
            if (command.continuous)
                next.continuous = *command.continuous;
            if (command.phase == SequencerPhase::Idle || command.phase == SequencerPhase::Finished)
                next.continuous = false;
            return CommandError::None;
        }

        case Kind::SetContinuous: {
            const bool wanted = command.continuous.value_or(false);
            if (next.continuous == wanted) {
                message = wanted ? QStringLiteral("already recording continuously")
                                 : QStringLiteral("not recording continuously");
                return CommandError::IllegalTransition;
            }
            next.continuous = wanted;
            return CommandError::None;
        }

        case Kind::CountdownTick: {
            if (next.phase != SequencerPhase::CountingDown) {
                message = QStringLiteral("no countdown running");
                return CommandError::IllegalTransition;
            }
            next.countdownRemaining = std::max(0, command.countdown);
            return CommandError::None;
        }

        case Kind::ClientJoined: {
            const auto it = std::find_if(next.clients.begin(), next.clients.end(),
                                         [&](const ConnectedClient& c) { return c.id == command.name; });
            if (it != next.clients.end()) {
                it->role = command.role;
            } else {
                next.clients.push_back(ConnectedClient {command.name, command.role});
            }
            return CommandError::None;
        }

        case Kind::ClientLeft: {
            const auto it = std::remove_if(next.clients.begin(), next.clients.end(),
                                           [&](const ConnectedClient& c) { return c.id == command.name; });
            if (it == next.clients.end()) {
                message = QStringLiteral("unknown client %1").arg(command.name);
                return CommandError::IllegalTransition;
            }
            next.clients.erase(it, next.clients.end());
            return CommandError::None;
        }
    }

    message = QStringLiteral("unknown command");
    return CommandError::MalformedCommand;
}
