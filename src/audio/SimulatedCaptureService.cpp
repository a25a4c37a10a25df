#include "SimulatedCaptureService.h"
#include "SampleWriter.h"
#include "../util.h"

#include <QDebug>
#include <QDir>
#include <QTimer>

#include <algorithm>
#include <array>
#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr int kMeterIntervalMs = 50;
constexpr double kAttackSeconds = 0.08;
constexpr double kReleaseSeconds = 0.25;
// Relative strengths of the first partials of a principal pipe.
constexpr std::array<float, 5> kPartials {1.0f, 0.45f, 0.22f, 0.12f, 0.06f};
} // namespace

SimulatedCaptureService::SimulatedCaptureService(const QString& outputRoot, QObject* parent)
    : AudioCaptureService(parent)
    , m_outputRoot(outputRoot) {
    m_meterTimer = std::make_unique<QTimer>();
    m_meterTimer->setTimerType(Qt::CoarseTimer);
    m_meterTimer->setInterval(kMeterIntervalMs);
    QObject::connect(m_meterTimer.get(), &QTimer::timeout, this, [this]() { emitLevels(); });
    m_meterTimer->start();
}

SimulatedCaptureService::~SimulatedCaptureService() = default;

std::vector<float> SimulatedCaptureService::synthesize(int note, int frames, int sampleRate, int channels, float gain) {
    std::vector<float> out(static_cast<std::size_t>(std::max(0, frames)) * static_cast<std::size_t>(std::max(1, channels)), 0.0f);
    if (frames <= 0 || sampleRate <= 0 || channels <= 0)
        return out;

    const double fundamental = midiToHz(note);
    const double nyquist = sampleRate * 0.5;
    const double attack = kAttackSeconds * sampleRate;
    const double release = kReleaseSeconds * sampleRate;
    for (int i = 0; i < frames; ++i) {
        const double t = static_cast<double>(i) / sampleRate;
        double env = 1.0;
        if (i < attack)
            env = i / attack;
        if (frames - i < release)
            env = std::min(env, (frames - i) / release);
        for (int c = 0; c < channels; ++c) {
            // Detune the right side a touch so stereo takes are not identical.
            const double detune = 1.0 + 0.0007 * c;
            double sample = 0.0;
            for (std::size_t h = 0; h < kPartials.size(); ++h) {
                const double freq = fundamental * static_cast<double>(h + 1) * detune;
                if (freq >= nyquist)
                    break;
                sample += kPartials[h] * std::sin(2.0 * kPi * freq * t);
            }
            out[static_cast<std::size_t>(i) * static_cast<std::size_t>(channels) + static_cast<std::size_t>(c)] =
                static_cast<float>(sample * env * gain * 0.4);
        }
    }
    return out;
}

CaptureBegin SimulatedCaptureService::begin(const std::vector<CaptureTarget>& targets, const RecordingSettings& settings) {
    CaptureBegin result;
    if (targets.empty()) {
        result.status = CaptureStatus::InvalidSettings;
        result.message = QStringLiteral("no enabled microphone");
        return result;
    }
    for (const auto& target : targets) {
        if (target.channel.input < 1 || target.channel.input + settings.channelCount() - 1 > kSimulatedInputs) {
            result.status = CaptureStatus::DeviceUnavailable;
            result.message = QStringLiteral("simulated input %1 does not exist").arg(target.channel.input);
            return result;
        }
    }

    auto take = std::make_shared<Take>();
    take->targets = targets;
    take->settings = settings;
    take->clock.start();

    std::lock_guard<std::mutex> lock(m_mutex);
    result.handle = m_nextHandle++;
    m_takes[result.handle] = take;
    return result;
}

CaptureResults SimulatedCaptureService::stop(CaptureHandle handle) {
    CaptureResults results;
    std::shared_ptr<Take> take;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto it = m_takes.find(handle);
        if (it == m_takes.end())
            return results;
        // Stays registered while encoding so cancel() can still reach it.
        take = it->second;
        take->stopping = true;
    }

    const RecordingSettings& settings = take->settings;
    const qint64 elapsedMs = std::min<qint64>(take->clock.elapsed(), settings.recordSeconds * 1000LL);
    const int frames = static_cast<int>(std::max<qint64>(elapsedMs, 100) * settings.sampleRate / 1000);

    for (std::size_t i = 0; i < take->targets.size(); ++i) {
        const CaptureTarget& target = take->targets[i];
        ChannelCaptureResult result;
        result.channelId = target.channel.id;
        result.path = QDir(m_outputRoot).filePath(target.relativePath);

        const float gain = 1.0f / (1.0f + 0.35f * static_cast<float>(i));
        const auto audio = synthesize(target.note, frames, settings.sampleRate, settings.channelCount(), gain);
        const SampleWriteResult written = SampleWriter::write(result.path, audio, settings.channelCount(), settings, &take->cancellation);
        if (written.ok) {
            result.bytesWritten = written.bytes;
        } else {
            result.status = written.cancelled ? CaptureStatus::Cancelled : CaptureStatus::EncodeFailed;
            result.message = written.error;
        }
        results.insert(result.channelId, result);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_takes.erase(handle);
    return results;
}

void SimulatedCaptureService::cancel(CaptureHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_takes.find(handle);
    if (it == m_takes.end())
        return;
    it->second->cancellation.cancel();
    m_takes.erase(it);
}

QList<AudioInputInfo> SimulatedCaptureService::availableInputs() const {
    QList<AudioInputInfo> inputs;
    for (int i = 1; i <= kSimulatedInputs; ++i)
        inputs.append(AudioInputInfo {QString::number(i), QStringLiteral("simulated:capture_%1").arg(i)});
    return inputs;
}

void SimulatedCaptureService::emitLevels() {
    QMap<QString, float> levels;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [handle, take] : m_takes) {
            Q_UNUSED(handle);
            if (take->stopping)
                continue;
            const int blockFrames = take->settings.sampleRate * kMeterIntervalMs / 1000;
            const int note = take->targets.empty() ? 60 : take->targets.front().note;
            const int channels = take->settings.channelCount();
            const auto block = synthesize(note, blockFrames, take->settings.sampleRate, channels, 1.0f);
            const float level = rmsInterleaved(block.data(), blockFrames, channels, 0);
            for (std::size_t i = 0; i < take->targets.size(); ++i)
                levels.insert(take->targets[i].channel.id, level / (1.0f + 0.35f * static_cast<float>(i)));
        }
    }
    if (!levels.isEmpty())
        emit inputLevelsChanged(levels);
}
