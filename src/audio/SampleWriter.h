#pragma once

#include "../RecordingSettings.h"

#include <QString>

#include <atomic>
#include <mutex>
#include <vector>

// Cancellation flag shared by a take's encoder and whoever may abandon it. Publishing the
// finished file and cancelling exclude each other: once cancel() returns, no file from this
// take appears, and a file published first stays.
class CancelToken {
public:
    void cancel() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled.store(true, std::memory_order_release);
    }

    // Lock-free; safe from the JACK process thread.
    [[nodiscard]] bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

    // Runs |publish| unless the take was cancelled first.
    template<typename Publish>
    bool commit(Publish&& publish) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled.load(std::memory_order_acquire))
            return false;
        publish();
        return true;
    }

private:
    std::mutex m_mutex;
    std::atomic<bool> m_cancelled {false};
};

struct SampleWriteResult {
    bool ok {false};
    bool cancelled {false};
    qint64 bytes {0};
    QString error;
};

// Encodes interleaved float frames with libsndfile. The container follows the file
// extension (.mp3, .wav, .flac). Output goes to "<path>.part" and is renamed over
// |path| only once the encoder has closed cleanly, so a reader never sees half a file.
class SampleWriter {
public:
    static SampleWriteResult write(const QString& path,
                                   const std::vector<float>& interleaved,
                                   int channels,
                                   const RecordingSettings& settings,
                                   CancelToken* cancellation = nullptr);

    static QString partialPathFor(const QString& path);

    // libsndfile expresses CBR MP3 bitrate as a compression level in [0, 1].
    static double mp3CompressionLevel(int kbps);

private:
    static int formatFor(const QString& path, int bitDepth);
};
