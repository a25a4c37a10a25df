#pragma once

#include "AudioCaptureService.h"
#include "SampleWriter.h"

#include <QElapsedTimer>
#include <QString>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>

class QTimer;

// Stand-in for the JACK backend: every take is a synthesized organ-like tone at the
// recorded note's pitch, encoded through the same SampleWriter path as real audio.
class SimulatedCaptureService : public AudioCaptureService {
    Q_OBJECT
public:
    explicit SimulatedCaptureService(const QString& outputRoot, QObject* parent=nullptr);
    ~SimulatedCaptureService() override;

    CaptureBegin begin(const std::vector<CaptureTarget>& targets, const RecordingSettings& settings) override;
    CaptureResults stop(CaptureHandle handle) override;
    void cancel(CaptureHandle handle) override;
    QList<AudioInputInfo> availableInputs() const override;

    static constexpr int kSimulatedInputs = 8;

    static std::vector<float> synthesize(int note, int frames, int sampleRate, int channels, float gain);

private:
    struct Take {
        std::vector<CaptureTarget> targets;
        RecordingSettings settings;
        QElapsedTimer clock;
        CancelToken cancellation;
        bool stopping {false};   // guarded by m_mutex
    };

    void emitLevels();

    QString m_outputRoot;
    mutable std::mutex m_mutex;
    std::map<CaptureHandle, std::shared_ptr<Take>> m_takes;
    CaptureHandle m_nextHandle {1};
    std::unique_ptr<QTimer> m_meterTimer;
};
