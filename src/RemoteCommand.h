#pragma once

#include "OrganModel.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

enum class RemoteCommandType {
    SelectOrgan,
    SelectRegister,
    Start,
    RecordAll,
    Pause,
    Stop,
    Retry,
    Next,
    Previous,
    UpdateSettings,
    ConfigureMicrophones,
    SetNote,
    ListInputs,
    Shutdown
};

QString remoteCommandName(RemoteCommandType type);

// A command as submitted by a display or remote client.
struct RemoteCommand {
    RemoteCommandType type {RemoteCommandType::Start};
    qint64 requestId {-1};
    QString organ;
    QStringList keyboards;
    RegisterSelection selection;
    QJsonObject settingsPatch;   // only the keys the client sent
    std::vector<MicrophoneChannel> microphones;
    int note {0};

    static RemoteCommand simple(RemoteCommandType type, qint64 requestId = -1);

    // Parses {"command": "...", "requestId": n, ...}. On failure |error| says what was wrong.
    static std::optional<RemoteCommand> fromJson(const QJsonObject& obj, QString* error);
};
