#pragma once

#include "AudioCaptureService.h"
#include "SampleWriter.h"

#include <QString>
#include <jack/types.h>

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

typedef struct _jack_client jack_client_t;
typedef struct _jack_port jack_port_t;

class QTimer;

// Records takes from the JACK graph. One input port per physical capture port is registered
// when the client opens and stays for the life of the client; a take only points the process
// callback at its own preallocated buffers, so the callback never allocates, frees or touches
// port registration.
class JackCaptureService : public AudioCaptureService {
    Q_OBJECT
public:
    JackCaptureService(const QString& outputRoot, const QString& jackCommand, QObject* parent=nullptr);
    ~JackCaptureService() override;

    CaptureBegin begin(const std::vector<CaptureTarget>& targets, const RecordingSettings& settings) override;
    CaptureResults stop(CaptureHandle handle) override;
    void cancel(CaptureHandle handle) override;
    QList<AudioInputInfo> availableInputs() const override;

private:
    struct ChannelTake {
        CaptureTarget target;
        std::array<std::size_t, 2> inputs {};   // indices into m_inputs
        int portCount {1};
        std::vector<float> buffer;              // interleaved
        std::size_t capacityFrames {0};
        std::atomic<std::size_t> framesWritten {0};
        std::atomic<float> level {0.0f};
    };

    struct Take {
        CaptureHandle handle {0};
        RecordingSettings settings;
        std::vector<std::unique_ptr<ChannelTake>> channels;
        CancelToken cancellation;
        int xrunsAtStart {0};
    };

    static int processCallback(jack_nframes_t nframes, void* arg);
    static int sampleRateCallback(jack_nframes_t nframes, void* arg);
    static int xrunCallback(void* arg);
    static void shutdownCallback(void* arg);

    bool ensureClient(QString* error);
    bool registerInputs(QString* error);
    void connectPhysicalInputs();
    void closeClient();
    bool ensureJackServerRunning();
    void logJackStatus(jack_status_t status) const;
    bool launchJackServer(const QString& command) const;
    void detachFromProcess(Take* take);
    std::shared_ptr<Take> takeFor(CaptureHandle handle) const;
    void forgetTake(CaptureHandle handle);
    void emitLevels();
    void handleClientShutdown();

    QString m_outputRoot;
    QString m_jackCommand;
    jack_client_t* m_client {nullptr};
    std::atomic<int> m_currentSampleRate {0};
    std::atomic<int> m_xruns {0};

    // Written only while the client is inactive; read by the process callback.
    std::vector<jack_port_t*> m_inputs;
    std::vector<std::string> m_physical;
    std::vector<bool> m_connected;

    mutable std::mutex m_takeMutex;   // guards m_takes, the client and the input tables
    std::map<CaptureHandle, std::shared_ptr<Take>> m_takes;
    CaptureHandle m_nextHandle {1};

    // The process callback borrows the take; m_takes keeps it alive until detachFromProcess().
    std::atomic<Take*> m_recording {nullptr};
    std::atomic<bool> m_processBusy {false};

    std::unique_ptr<QTimer> m_meterTimer;
};
