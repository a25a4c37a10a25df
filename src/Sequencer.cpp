#include "Sequencer.h"

#include "NamingEngine.h"
#include "SessionLogger.h"

#include <QDebug>
#include <QMetaObject>

#include <algorithm>

Sequencer::Sequencer(SessionState& state, AudioCaptureService& capture, QObject* parent)
    : QObject(parent)
    , m_state(state)
    , m_capture(capture) {
    m_countdownTimer.setTimerType(Qt::PreciseTimer);
    m_recordTimer.setTimerType(Qt::PreciseTimer);
    m_recordTimer.setSingleShot(true);
    m_advanceTimer.setSingleShot(true);

    connect(&m_countdownTimer, &QTimer::timeout, this, [this]() {
        SequencerEvent event;
        event.kind = SequencerEvent::Kind::CountdownTick;
        event.generation = m_generation;
        emit eventReady(event);
    });
    connect(&m_recordTimer, &QTimer::timeout, this, [this]() {
        SequencerEvent event;
        event.kind = SequencerEvent::Kind::RecordTimerExpired;
        event.generation = m_generation;
        emit eventReady(event);
    });
    connect(&m_advanceTimer, &QTimer::timeout, this, [this]() {
        SequencerEvent event;
        event.kind = SequencerEvent::Kind::AdvanceTimerExpired;
        event.generation = m_generation;
        emit eventReady(event);
    });
}

Sequencer::~Sequencer() {
    m_countdownTimer.stop();
    m_recordTimer.stop();
    m_advanceTimer.stop();
    if (m_activeHandle != 0) {
        m_capture.cancel(m_activeHandle);
        m_activeHandle = 0;
    }
}

void Sequencer::setSecondDurationMs(int ms) {
    m_secondMs = std::max(1, ms);
}

CommandResult Sequencer::handleCommand(const RemoteCommand& command) {
    const SnapshotPtr current = m_state.snapshot();
    const SequencerPhase phase = current->phase;
    const bool reviewing = phase == SequencerPhase::ReviewPending || phase == SequencerPhase::Finished;
    const bool editable = phase == SequencerPhase::Idle || reviewing;

    switch (command.type) {
        case RemoteCommandType::Start:
            if (phase != SequencerPhase::Idle)
                return illegal(command.type, phase);
            if (!current->selection)
                return CommandResult::failure(CommandError::NoRegisterSelected, QStringLiteral("select a register first"));
            return beginCountdown(current->note);

        case RemoteCommandType::RecordAll:
            return recordAll(*current);

        case RemoteCommandType::Pause:
            return pause(*current);

        case RemoteCommandType::Stop:
            if (phase == SequencerPhase::Idle)
                return illegal(command.type, phase);
            return stopSession();

        case RemoteCommandType::Retry:
            if (!reviewing)
                return illegal(command.type, phase);
            // Re-recording a note ends a continuous run.
            return beginCountdown(current->note, false);

        case RemoteCommandType::Next:
            if (!reviewing)
                return illegal(command.type, phase);
            return advance(*current);

        case RemoteCommandType::Previous:
            if (!reviewing)
                return illegal(command.type, phase);
            if (current->note <= current->settings.startNote)
                return CommandResult::success(current);
            return beginCountdown(current->note - 1);

        case RemoteCommandType::SelectOrgan:
            if (!editable)
                return illegal(command.type, phase);
            return commit(StateCommand::selectOrgan(command.organ, command.keyboards));

        case RemoteCommandType::SelectRegister:
            if (!editable)
                return illegal(command.type, phase);
            return commit(StateCommand::selectRegister(command.selection));

        case RemoteCommandType::UpdateSettings:
            if (!editable)
                return illegal(command.type, phase);
            return updateSettings(*current, command.settingsPatch);

        case RemoteCommandType::ConfigureMicrophones:
            if (!editable)
                return illegal(command.type, phase);
            return commit(StateCommand::configureMicrophones(command.microphones));

        case RemoteCommandType::SetNote:
            if (!editable)
                return illegal(command.type, phase);
            return commit(StateCommand::setNote(command.note));

        case RemoteCommandType::ListInputs:
            return CommandResult::success(current);

        case RemoteCommandType::Shutdown:
            return shutdown(*current);
    }
    return CommandResult::failure(CommandError::MalformedCommand, QStringLiteral("unsupported command"));
}

void Sequencer::handleEvent(const SequencerEvent& event) {
    using Kind = SequencerEvent::Kind;

    if (event.kind == Kind::ClientJoined) {
        commit(StateCommand::clientJoined(event.clientId, event.role));
        return;
    }
    if (event.kind == Kind::ClientLeft) {
        commit(StateCommand::clientLeft(event.clientId));
        return;
    }

    if (event.generation != m_generation) {
        if (event.kind == Kind::CaptureStarted && event.begin.ok())
            discardTake(event.begin.handle);
        qInfo() << "Sequencer" << "dropping stale event" << static_cast<int>(event.kind)
                << "generation" << event.generation << "current" << m_generation;
        return;
    }

    switch (event.kind) {
        case Kind::CountdownTick: onCountdownTick(); break;
        case Kind::RecordTimerExpired: onRecordTimerExpired(); break;
        case Kind::AdvanceTimerExpired: onAdvanceTimerExpired(); break;
        case Kind::CaptureStarted: onCaptureStarted(event.begin); break;
        case Kind::CaptureFinished: onCaptureFinished(event.results); break;
        default: break;
    }
}

CommandResult Sequencer::commit(const StateCommand& command) {
    CommandResult result = m_state.applyCommand(command);
    if (!result.ok()) {
        qInfo() << "Sequencer" << "rejected" << commandErrorName(result.error) << result.message;
        return result;
    }
    journal(*result.snapshot);
    emit committed(result.snapshot);
    return result;
}

CommandResult Sequencer::illegal(RemoteCommandType type, SequencerPhase phase) const {
    return CommandResult::failure(CommandError::IllegalTransition,
                                  QStringLiteral("%1 is not allowed while %2")
                                      .arg(remoteCommandName(type), phaseName(phase)));
}

CommandResult Sequencer::beginCountdown(int note, std::optional<bool> continuous) {
    const int countdown = m_state.snapshot()->settings.countdownSeconds;
    StateCommand command = StateCommand::enterPhase(SequencerPhase::CountingDown, note, countdown);
    command.continuous = continuous;
    CommandResult result = commit(command);
    if (!result.ok())
        return result;

    ++m_generation;
    m_recordTimer.stop();
    m_advanceTimer.stop();
    m_countdownTimer.start(m_secondMs);
    return result;
}

CommandResult Sequencer::stopSession() {
    m_countdownTimer.stop();
    m_recordTimer.stop();
    m_advanceTimer.stop();
    ++m_generation;

    if (m_activeHandle != 0) {
        qInfo() << "Sequencer" << "cancelling take" << m_activeHandle;
        m_capture.cancel(m_activeHandle);
        m_activeHandle = 0;
    }
    m_targets.clear();

    const SnapshotPtr current = m_state.snapshot();
    return commit(StateCommand::enterPhase(SequencerPhase::Idle, current->note));
}

CommandResult Sequencer::advance(const SessionSnapshot& current) {
    if (current.note < current.settings.endNote)
        return beginCountdown(current.note + 1);

    if (current.phase == SequencerPhase::Finished)
        return CommandResult::failure(CommandError::OutOfRange,
                                      QStringLiteral("already at the last note %1").arg(current.settings.endNote));

    CommandResult result = commit(StateCommand::enterPhase(SequencerPhase::Finished, current.note));
    if (result.ok()) {
        SessionLogger::instance().logf("sequencer", "register %s finished",
                                       qPrintable(current.selection ? current.selection->label : QString()));
        emit registerCompleted(result.snapshot);
    }
    return result;
}

// Hands-free run: countdown, record and move on until the last note, a failed channel or pause.
CommandResult Sequencer::recordAll(const SessionSnapshot& current) {
    if (current.phase == SequencerPhase::Idle) {
        if (!current.selection)
            return CommandResult::failure(CommandError::NoRegisterSelected, QStringLiteral("select a register first"));
        return beginCountdown(current.note, true);
    }
    if (current.phase != SequencerPhase::ReviewPending)
        return illegal(RemoteCommandType::RecordAll, current.phase);

    // Resuming after a pause: the reviewed note is kept.
    if (current.note < current.settings.endNote)
        return beginCountdown(current.note + 1, true);
    return advance(current);
}

CommandResult Sequencer::pause(const SessionSnapshot& current) {
    const bool running = current.phase == SequencerPhase::CountingDown
        || current.phase == SequencerPhase::Recording
        || current.phase == SequencerPhase::ReviewPending;
    if (!running || !current.continuous)
        return illegal(RemoteCommandType::Pause, current.phase);

    // The note in progress still finishes; the run halts in ReviewPending.
    m_advanceTimer.stop();
    return commit(StateCommand::setContinuous(false));
}

CommandResult Sequencer::shutdown(const SessionSnapshot& current) {
    CommandResult result = CommandResult::success(m_state.snapshot());
    if (current.phase != SequencerPhase::Idle || m_activeHandle != 0) {
        result = stopSession();
        if (!result.ok())
            return result;
    }
    qInfo() << "Sequencer" << "shutdown requested";
    SessionLogger::instance().log("sequencer", "shutdown requested");
    emit shutdownRequested();
    return result;
}

CommandResult Sequencer::updateSettings(const SessionSnapshot& current, const QJsonObject& patch) {
    RecordingSettings settings = current.settings;
    QString message;
    if (!applySettingsPatch(patch, settings, &message))
        return CommandResult::failure(CommandError::InvalidSettings, message);
    return commit(StateCommand::updateSettings(settings));
}

void Sequencer::onCountdownTick() {
    const SnapshotPtr current = m_state.snapshot();
    if (current->phase != SequencerPhase::CountingDown) {
        m_countdownTimer.stop();
        return;
    }

    const int remaining = current->countdownRemaining - 1;
    if (remaining > 0) {
        commit(StateCommand::countdownTick(remaining));
        return;
    }

    m_countdownTimer.stop();
    startRecording();
}

void Sequencer::startRecording() {
    const CommandResult result = commit(StateCommand::enterPhase(SequencerPhase::Recording, m_state.snapshot()->note));
    if (!result.ok())
        return;

    const SnapshotPtr snap = result.snapshot;
    const QMap<QString, QString> paths = snap->resolvedPaths();
    m_targets.clear();
    for (const auto& mic : enabledMicrophones(snap->microphones)) {
        CaptureTarget target;
        target.channel = mic;
        target.relativePath = paths.value(mic.id);
        target.note = snap->note;
        m_targets.push_back(target);
    }

    const quint64 generation = m_generation;
    const std::vector<CaptureTarget> targets = m_targets;
    const RecordingSettings settings = snap->settings;
    AudioCaptureService* capture = &m_capture;
    m_worker.post([this, capture, targets, settings, generation]() {
        SequencerEvent event;
        event.kind = SequencerEvent::Kind::CaptureStarted;
        event.generation = generation;
        event.begin = capture->begin(targets, settings);
        postEvent(std::move(event));
    });
}

void Sequencer::onCaptureStarted(const CaptureBegin& begin) {
    const SnapshotPtr current = m_state.snapshot();
    if (current->phase != SequencerPhase::Recording) {
        if (begin.ok())
            discardTake(begin.handle);
        return;
    }

    if (!begin.ok()) {
        QMap<QString, QString> failures;
        const CaptureStatus status = begin.status == CaptureStatus::Ok ? CaptureStatus::DeviceUnavailable : begin.status;
        for (const auto& target : m_targets)
            failures.insert(target.channel.id, captureStatusName(status));
        qWarning() << "Sequencer" << "capture failed to start:" << captureStatusName(status) << begin.message;
        SessionLogger::instance().logf("capture", "begin failed: %s %s",
                                       qPrintable(captureStatusName(status)), qPrintable(begin.message));
        m_targets.clear();
        enterReview(current->note, failures);
        return;
    }

    m_activeHandle = begin.handle;
    m_recordTimer.start(current->settings.recordSeconds * m_secondMs);
}

void Sequencer::onRecordTimerExpired() {
    if (m_activeHandle == 0 || m_state.snapshot()->phase != SequencerPhase::Recording)
        return;

    const CaptureHandle handle = m_activeHandle;
    const quint64 generation = m_generation;
    AudioCaptureService* capture = &m_capture;
    m_worker.post([this, capture, handle, generation]() {
        SequencerEvent event;
        event.kind = SequencerEvent::Kind::CaptureFinished;
        event.generation = generation;
        event.results = capture->stop(handle);
        postEvent(std::move(event));
    });
}

void Sequencer::onCaptureFinished(const CaptureResults& results) {
    m_activeHandle = 0;
    const SnapshotPtr current = m_state.snapshot();
    if (current->phase != SequencerPhase::Recording)
        return;

    QMap<QString, QString> failures;
    for (const auto& target : m_targets) {
        const auto it = results.constFind(target.channel.id);
        if (it == results.cend()) {
            failures.insert(target.channel.id, captureStatusName(CaptureStatus::EncodeFailed));
            continue;
        }
        if (it->status != CaptureStatus::Ok) {
            failures.insert(target.channel.id, captureStatusName(it->status));
            qWarning() << "Sequencer" << "channel" << target.channel.id << "failed:" << it->message;
            continue;
        }
        SessionLogger::instance().logf("capture", "wrote %s (%lld bytes)",
                                       qPrintable(it->path), static_cast<long long>(it->bytesWritten));
    }
    m_targets.clear();
    enterReview(current->note, failures);
}

void Sequencer::enterReview(int note, const QMap<QString, QString>& failures) {
    StateCommand command = StateCommand::enterPhase(SequencerPhase::ReviewPending, note, 0, failures);
    // A failed channel halts a continuous run so the note can be retried.
    if (!failures.isEmpty())
        command.continuous = false;
    const CommandResult result = commit(command);
    if (result.ok() && result.snapshot->continuous)
        m_advanceTimer.start(std::max(1, m_secondMs / 2));
}

void Sequencer::onAdvanceTimerExpired() {
    const SnapshotPtr current = m_state.snapshot();
    if (current->phase != SequencerPhase::ReviewPending || !current->continuous)
        return;
    advance(*current);
}

void Sequencer::discardTake(CaptureHandle handle) {
    if (handle == 0)
        return;
    qInfo() << "Sequencer" << "discarding orphaned take" << handle;
    m_capture.cancel(handle);
}

void Sequencer::postEvent(SequencerEvent event) {
    QMetaObject::invokeMethod(this, [this, event = std::move(event)]() { emit eventReady(event); }, Qt::QueuedConnection);
}

void Sequencer::journal(const SessionSnapshot& snapshot) const {
    const auto paths = snapshot.resolvedPaths();
    const QString path = paths.isEmpty() ? QStringLiteral("-") : paths.first();
    qInfo().noquote() << "Sequencer" << "v" + QString::number(snapshot.version) << phaseName(snapshot.phase)
                      << NamingEngine::noteDisplayName(snapshot.note) << path;
    SessionLogger::instance().logf("sequencer", "v%llu %s note=%d countdown=%d %s",
                                   static_cast<unsigned long long>(snapshot.version),
                                   qPrintable(phaseName(snapshot.phase)),
                                   snapshot.note,
                                   snapshot.countdownRemaining,
                                   qPrintable(path));
}
