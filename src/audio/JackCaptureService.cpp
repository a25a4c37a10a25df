#include "JackCaptureService.h"
#include "../SessionLogger.h"
#include "../util.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QMetaObject>
#include <QProcess>
#include <QThread>
#include <QTimer>

#include <jack/jack.h>

#include <algorithm>
#include <cerrno>
#include <thread>

namespace {
constexpr const char* kClientName = "organrec";
constexpr const char* kCheckClientName = "organrec_check";
constexpr const char* kDefaultJackCommand = "JACK_NO_AUDIO_RESERVATION=1 jackd -R -P70 -d alsa -d hw:0 -p256 -n3 -r44100";
constexpr std::size_t kMaxInputs = 64;
constexpr int kSlackSeconds = 2;   // timer jitter between begin() and stop()
constexpr int kMeterIntervalMs = 50;

float computeLevel(const jack_default_audio_sample_t* buffer, jack_nframes_t frames) {
    return std::clamp(rms(buffer, static_cast<int>(frames)), 0.0f, 1.0f);
}

// Physical capture ports in JACK order; entry 0 is input 1.
std::vector<std::string> physicalCapturePorts(jack_client_t* client) {
    std::vector<std::string> names;
    if (!client)
        return names;
    const char** ports = jack_get_ports(client, nullptr, JACK_DEFAULT_AUDIO_TYPE, JackPortIsPhysical | JackPortIsOutput);
    if (!ports)
        return names;
    for (const char** p = ports; *p; ++p)
        names.emplace_back(*p);
    jack_free(ports);
    return names;
}

CaptureBegin beginFailure(CaptureStatus status, const QString& message) {
    qWarning() << "JackCaptureService" << message;
    CaptureBegin result;
    result.status = status;
    result.message = message;
    return result;
}
} // namespace

JackCaptureService::JackCaptureService(const QString& outputRoot, const QString& jackCommand, QObject* parent)
    : AudioCaptureService(parent)
    , m_outputRoot(outputRoot)
    , m_jackCommand(jackCommand) {
    m_meterTimer = std::make_unique<QTimer>();
    m_meterTimer->setTimerType(Qt::CoarseTimer);
    m_meterTimer->setInterval(kMeterIntervalMs);
    QObject::connect(m_meterTimer.get(), &QTimer::timeout, this, [this]() { emitLevels(); });
    m_meterTimer->start();
}

JackCaptureService::~JackCaptureService() {
    m_meterTimer.reset();
    m_recording.store(nullptr);
    std::lock_guard<std::mutex> lock(m_takeMutex);
    // Closing the client ends the process thread before the takes go away.
    closeClient();
    for (auto& [handle, take] : m_takes) {
        Q_UNUSED(handle);
        take->cancellation.cancel();
    }
    m_takes.clear();
}

CaptureBegin JackCaptureService::begin(const std::vector<CaptureTarget>& targets, const RecordingSettings& settings) {
    if (targets.empty())
        return beginFailure(CaptureStatus::InvalidSettings, QStringLiteral("no enabled microphone"));

    std::lock_guard<std::mutex> lock(m_takeMutex);
    QString error;
    if (!ensureClient(&error))
        return beginFailure(CaptureStatus::DeviceUnavailable, error);

    const int jackRate = m_currentSampleRate.load(std::memory_order_acquire);
    if (settings.sampleRate != jackRate) {
        return beginFailure(CaptureStatus::InvalidSettings,
                            QStringLiteral("JACK runs at %1 Hz, %2 Hz requested").arg(jackRate).arg(settings.sampleRate));
    }

    const int portCount = settings.channelCount();
    const std::size_t capacity = static_cast<std::size_t>(settings.recordSeconds + kSlackSeconds)
                                 * static_cast<std::size_t>(jackRate);
    auto take = std::make_shared<Take>();
    take->settings = settings;

    for (const auto& target : targets) {
        auto channel = std::make_unique<ChannelTake>();
        channel->target = target;
        channel->portCount = portCount;
        for (int p = 0; p < portCount; ++p) {
            const int input = target.channel.input + p;
            if (input < 1 || static_cast<std::size_t>(input) > m_inputs.size()) {
                return beginFailure(CaptureStatus::DeviceUnavailable,
                                    QStringLiteral("input %1 for %2 is not available (%3 capture ports)")
                                        .arg(input).arg(target.channel.id).arg(m_inputs.size()));
            }
            const std::size_t index = static_cast<std::size_t>(input - 1);
            if (!m_connected[index]) {
                return beginFailure(CaptureStatus::DeviceUnavailable,
                                    QStringLiteral("%1 is not connected").arg(QString::fromStdString(m_physical[index])));
            }
            channel->inputs[static_cast<std::size_t>(p)] = index;
        }
        channel->capacityFrames = capacity;
        channel->buffer.assign(capacity * static_cast<std::size_t>(portCount), 0.0f);
        take->channels.push_back(std::move(channel));
    }

    take->handle = m_nextHandle++;
    take->xrunsAtStart = m_xruns.load();
    m_takes[take->handle] = take;
    // A take still attached here was abandoned without stop(); it simply stops receiving frames.
    m_recording.store(take.get());
    SessionLogger::instance().logf("capture", "take %llu started on %zu channel(s) at %d Hz",
                                   static_cast<unsigned long long>(take->handle), take->channels.size(), jackRate);

    CaptureBegin result;
    result.handle = take->handle;
    return result;
}

CaptureResults JackCaptureService::stop(CaptureHandle handle) {
    CaptureResults results;
    const std::shared_ptr<Take> take = takeFor(handle);
    if (!take) {
        qWarning() << "JackCaptureService" << "stop for unknown take" << handle;
        return results;
    }
    detachFromProcess(take.get());

    const int xruns = m_xruns.load() - take->xrunsAtStart;
    if (xruns > 0) {
        qWarning() << "JackCaptureService" << "take" << handle << "saw" << xruns << "xrun(s)";
        SessionLogger::instance().logf("capture", "take %llu: %d xrun(s) while recording",
                                       static_cast<unsigned long long>(handle), xruns);
    }

    for (const auto& channel : take->channels) {
        ChannelCaptureResult result;
        result.channelId = channel->target.channel.id;
        result.path = QDir(m_outputRoot).filePath(channel->target.relativePath);

        const std::size_t frames = std::min(channel->framesWritten.load(std::memory_order_acquire), channel->capacityFrames);
        if (take->cancellation.isCancelled()) {
            result.status = CaptureStatus::Cancelled;
        } else if (frames == 0) {
            result.status = CaptureStatus::EncodeFailed;
            result.message = QStringLiteral("no audio captured");
        } else {
            const std::size_t samples = frames * static_cast<std::size_t>(channel->portCount);
            const std::vector<float> interleaved(channel->buffer.begin(),
                                                 channel->buffer.begin() + static_cast<std::ptrdiff_t>(samples));
            const SampleWriteResult written = SampleWriter::write(result.path, interleaved, channel->portCount,
                                                                  take->settings, &take->cancellation);
            if (written.ok) {
                result.bytesWritten = written.bytes;
            } else {
                result.status = written.cancelled ? CaptureStatus::Cancelled : CaptureStatus::EncodeFailed;
                result.message = written.error;
                if (!written.cancelled)
                    qWarning() << "JackCaptureService" << "encode failed for" << result.path << written.error;
            }
        }
        results.insert(result.channelId, result);
    }

    forgetTake(handle);
    return results;
}

void JackCaptureService::cancel(CaptureHandle handle) {
    const std::shared_ptr<Take> take = takeFor(handle);
    if (!take)
        return;
    take->cancellation.cancel();
    detachFromProcess(take.get());
    forgetTake(handle);
    SessionLogger::instance().logf("capture", "take %llu cancelled", static_cast<unsigned long long>(handle));
}

QList<AudioInputInfo> JackCaptureService::availableInputs() const {
    QList<AudioInputInfo> inputs;
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(m_takeMutex);
        if (m_client) {
            names = m_physical;
        } else {
            jack_status_t status = static_cast<jack_status_t>(0);
            if (jack_client_t* check = jack_client_open(kCheckClientName, JackNoStartServer, &status)) {
                names = physicalCapturePorts(check);
                jack_client_close(check);
            } else {
                logJackStatus(status);
            }
        }
    }
    for (std::size_t i = 0; i < names.size(); ++i)
        inputs.append(AudioInputInfo {QString::number(i + 1), QString::fromStdString(names[i])});
    return inputs;
}

bool JackCaptureService::ensureClient(QString* error) {
    if (m_client)
        return true;

    if (!ensureJackServerRunning()) {
        if (error)
            *error = QStringLiteral("JACK server unavailable");
        return false;
    }

    jack_status_t status = static_cast<jack_status_t>(0);
    m_client = jack_client_open(kClientName, JackNoStartServer, &status);
    if (!m_client) {
        logJackStatus(status);
        if (error)
            *error = QStringLiteral("failed to open JACK client (status=%1)").arg(static_cast<int>(status));
        return false;
    }

    jack_set_process_callback(m_client, &JackCaptureService::processCallback, this);
    jack_set_sample_rate_callback(m_client, &JackCaptureService::sampleRateCallback, this);
    jack_set_xrun_callback(m_client, &JackCaptureService::xrunCallback, this);
    jack_on_shutdown(m_client, &JackCaptureService::shutdownCallback, this);

    if (!registerInputs(error)) {
        closeClient();
        return false;
    }
    m_currentSampleRate.store(static_cast<int>(jack_get_sample_rate(m_client)));

    if (jack_activate(m_client) != 0) {
        closeClient();
        if (error)
            *error = QStringLiteral("failed to activate JACK client");
        return false;
    }
    connectPhysicalInputs();

    qInfo("JackCaptureService: connected to JACK at %d Hz, buffer %u frames, %zu input(s)",
          m_currentSampleRate.load(), jack_get_buffer_size(m_client), m_inputs.size());
    return true;
}

bool JackCaptureService::registerInputs(QString* error) {
    m_physical = physicalCapturePorts(m_client);
    if (m_physical.size() > kMaxInputs)
        m_physical.resize(kMaxInputs);

    m_inputs.assign(m_physical.size(), nullptr);
    m_connected.assign(m_physical.size(), false);
    for (std::size_t i = 0; i < m_physical.size(); ++i) {
        const std::string name = "in_" + std::to_string(i + 1);
        m_inputs[i] = jack_port_register(m_client, name.c_str(), JACK_DEFAULT_AUDIO_TYPE, JackPortIsInput, 0);
        if (!m_inputs[i]) {
            if (error)
                *error = QStringLiteral("failed to register port %1").arg(QString::fromStdString(name));
            return false;
        }
    }
    return true;
}

void JackCaptureService::connectPhysicalInputs() {
    for (std::size_t i = 0; i < m_inputs.size(); ++i) {
        const int rc = jack_connect(m_client, m_physical[i].c_str(), jack_port_name(m_inputs[i]));
        m_connected[i] = rc == 0 || rc == EEXIST;
        if (!m_connected[i])
            qWarning("JackCaptureService: cannot connect %s (err=%d)", m_physical[i].c_str(), rc);
    }
}

void JackCaptureService::closeClient() {
    if (m_client) {
        jack_client_t* client = m_client;
        m_client = nullptr;
        jack_client_close(client);
    }
    m_inputs.clear();
    m_physical.clear();
    m_connected.clear();
    m_currentSampleRate.store(0);
}

void JackCaptureService::detachFromProcess(Take* take) {
    Take* expected = take;
    m_recording.compare_exchange_strong(expected, nullptr);
    // A cycle that loaded |take| before the swap sets m_processBusy first; wait for it to end.
    while (m_processBusy.load())
        std::this_thread::yield();
}

std::shared_ptr<JackCaptureService::Take> JackCaptureService::takeFor(CaptureHandle handle) const {
    std::lock_guard<std::mutex> lock(m_takeMutex);
    const auto it = m_takes.find(handle);
    return it == m_takes.end() ? nullptr : it->second;
}

void JackCaptureService::forgetTake(CaptureHandle handle) {
    std::lock_guard<std::mutex> lock(m_takeMutex);
    m_takes.erase(handle);
}

int JackCaptureService::processCallback(jack_nframes_t nframes, void* arg) {
    auto* self = static_cast<JackCaptureService*>(arg);
    self->m_processBusy.store(true);
    Take* take = self->m_recording.load();
    if (!take || take->cancellation.isCancelled()) {
        self->m_processBusy.store(false);
        return 0;
    }

    for (const auto& channel : take->channels) {
        const std::size_t written = channel->framesWritten.load(std::memory_order_relaxed);
        const std::size_t room = channel->capacityFrames - std::min(written, channel->capacityFrames);
        const std::size_t frames = std::min<std::size_t>(nframes, room);
        const auto stride = static_cast<std::size_t>(channel->portCount);
        float level = 0.0f;
        for (int p = 0; p < channel->portCount; ++p) {
            jack_port_t* port = self->m_inputs[channel->inputs[static_cast<std::size_t>(p)]];
            const auto* src = static_cast<const jack_default_audio_sample_t*>(jack_port_get_buffer(port, nframes));
            if (!src)
                continue;
            float* dst = channel->buffer.data() + written * stride + static_cast<std::size_t>(p);
            for (std::size_t i = 0; i < frames; ++i)
                dst[i * stride] = src[i];
            level = std::max(level, computeLevel(src, nframes));
        }
        channel->level.store(level, std::memory_order_relaxed);
        channel->framesWritten.store(written + frames, std::memory_order_release);
    }
    self->m_processBusy.store(false);
    return 0;
}

int JackCaptureService::sampleRateCallback(jack_nframes_t nframes, void* arg) {
    auto* self = static_cast<JackCaptureService*>(arg);
    self->m_currentSampleRate.store(static_cast<int>(nframes));
    return 0;
}

int JackCaptureService::xrunCallback(void* arg) {
    auto* self = static_cast<JackCaptureService*>(arg);
    self->m_xruns.fetch_add(1);
    return 0;
}

void JackCaptureService::shutdownCallback(void* arg) {
    auto* self = static_cast<JackCaptureService*>(arg);
    QMetaObject::invokeMethod(self, [self]() { self->handleClientShutdown(); }, Qt::QueuedConnection);
}

void JackCaptureService::emitLevels() {
    QMap<QString, float> levels;
    {
        // Under the lock a take still attached to the callback cannot be forgotten. A begin()
        // that is busy launching jackd holds it; skip the tick rather than stall the event loop.
        std::unique_lock<std::mutex> lock(m_takeMutex, std::try_to_lock);
        if (!lock.owns_lock())
            return;
        const Take* take = m_recording.load();
        if (!take)
            return;
        for (const auto& channel : take->channels)
            levels.insert(channel->target.channel.id, channel->level.load(std::memory_order_relaxed));
    }
    emit inputLevelsChanged(levels);
}

void JackCaptureService::handleClientShutdown() {
    qWarning("JackCaptureService: JACK server shut down");
    SessionLogger::instance().log("capture", "JACK server shut down");
    m_recording.store(nullptr);
    std::lock_guard<std::mutex> lock(m_takeMutex);
    closeClient();
}

bool JackCaptureService::ensureJackServerRunning() {
    jack_status_t status = static_cast<jack_status_t>(0);
    if (jack_client_t* check = jack_client_open(kCheckClientName, JackNoStartServer, &status)) {
        jack_client_close(check);
        return true;
    }

    if (!(status & JackServerFailed)) {
        logJackStatus(status);
        return false;
    }

    const QString command = m_jackCommand.isEmpty() ? QString::fromUtf8(kDefaultJackCommand) : m_jackCommand;
    qInfo("JackCaptureService: launching JACK via command: %s", command.toUtf8().constData());
    if (!launchJackServer(command))
        return false;

    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < 8000) {
        QThread::msleep(200);
        status = static_cast<jack_status_t>(0);
        if (jack_client_t* retry = jack_client_open(kCheckClientName, JackNoStartServer, &status)) {
            jack_client_close(retry);
            return true;
        }
    }

    qWarning("JackCaptureService: jackd did not become ready in time");
    return false;
}

void JackCaptureService::logJackStatus(jack_status_t status) const {
    if (status == 0)
        return;

    if (status & JackNameNotUnique)
        qWarning("JackCaptureService: JACK client name not unique");
    if (status & JackServerFailed)
        qWarning("JackCaptureService: JACK server not running");
    if (status & JackShmFailure)
        qWarning("JackCaptureService: JACK shared memory setup failed");
    if (status & JackVersionError)
        qWarning("JackCaptureService: JACK protocol version mismatch");
    if (status & JackInitFailure)
        qWarning("JackCaptureService: JACK driver failed to initialize");
    if (status & JackFailure)
        qWarning("JackCaptureService: JACK operation reported failure");
}

bool JackCaptureService::launchJackServer(const QString& command) const {
    if (command.trimmed().isEmpty()) {
        qWarning("JackCaptureService: empty JACK command");
        return false;
    }

    if (!QProcess::startDetached(QStringLiteral("/bin/sh"), {QStringLiteral("-c"), command})) {
        qWarning("JackCaptureService: failed to start JACK via %s", command.toUtf8().constData());
        return false;
    }
    return true;
}
