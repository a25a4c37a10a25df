#pragma once

#include "OrganModel.h"
#include "RecordingSettings.h"

#include <QString>

#include <vector>

enum class CaptureBackend {
    Jack,
    Simulated
};

struct RecorderOptions {
    CaptureBackend capture {CaptureBackend::Jack};
    QString host {QStringLiteral("0.0.0.0")};
    quint16 port {5555};
    QString outputDir;
    QString configDir;
    QString jackCommand;

    // Optional starting selection from the command line.
    QString project;
    QString keyboard;
    QString registerLabel;
    bool tremulant {false};

    RecordingSettings settings;
    std::vector<MicrophoneChannel> microphones;

    [[nodiscard]] bool isSimulated() const noexcept {
        return capture == CaptureBackend::Simulated;
    }
};
