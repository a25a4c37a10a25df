#pragma once

#include "../OrganModel.h"
#include "../RecordingSettings.h"

#include <QList>
#include <QMap>
#include <QObject>
#include <QString>

#include <vector>

using CaptureHandle = quint64;

enum class CaptureStatus {
    Ok,
    DeviceUnavailable,
    InvalidSettings,
    EncodeFailed,
    Cancelled
};

QString captureStatusName(CaptureStatus status);

struct CaptureTarget {
    MicrophoneChannel channel;
    QString relativePath;   // below the output root
    int note {0};
};

struct CaptureBegin {
    CaptureHandle handle {0};
    CaptureStatus status {CaptureStatus::Ok};
    QString message;

    [[nodiscard]] bool ok() const noexcept { return status == CaptureStatus::Ok && handle != 0; }
};

struct ChannelCaptureResult {
    QString channelId;
    QString path;            // absolute path of the finished file
    qint64 bytesWritten {0};
    CaptureStatus status {CaptureStatus::Ok};
    QString message;
};

using CaptureResults = QMap<QString, ChannelCaptureResult>;

struct AudioInputInfo {
    QString id;
    QString name;
};

// Records one take on 1..N microphone channels. begin() and stop() may block and are
// called from the capture worker; cancel() may be called from any thread at any time.
class AudioCaptureService : public QObject {
    Q_OBJECT
public:
    explicit AudioCaptureService(QObject* parent=nullptr) : QObject(parent) {}
    virtual ~AudioCaptureService() = default;

    virtual CaptureBegin begin(const std::vector<CaptureTarget>& targets, const RecordingSettings& settings) = 0;
    virtual CaptureResults stop(CaptureHandle handle) = 0;   // finalizes every channel of the take
    virtual void cancel(CaptureHandle handle) = 0;           // discards partial output
    virtual QList<AudioInputInfo> availableInputs() const = 0;

signals:
    void inputLevelsChanged(const QMap<QString, float>& levels);
};
