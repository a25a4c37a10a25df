#include "SampleWriter.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <sndfile.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace {
constexpr sf_count_t kChunkFrames = 4096;
constexpr int kMp3MinKbps = 32;
constexpr int kMp3MaxKbps = 320;

bool isCancelled(const CancelToken* token) {
    return token && token->isCancelled();
}

SampleWriteResult failure(const QString& message) {
    SampleWriteResult result;
    result.error = message;
    return result;
}

SampleWriteResult cancelledResult() {
    SampleWriteResult result;
    result.cancelled = true;
    result.error = QStringLiteral("cancelled");
    return result;
}
} // namespace

QString SampleWriter::partialPathFor(const QString& path) {
    return path + QStringLiteral(".part");
}

double SampleWriter::mp3CompressionLevel(int kbps) {
    const int clamped = std::clamp(kbps, kMp3MinKbps, kMp3MaxKbps);
    return static_cast<double>(kMp3MaxKbps - clamped) / static_cast<double>(kMp3MaxKbps - kMp3MinKbps);
}

int SampleWriter::formatFor(const QString& path, int bitDepth) {
    const QString suffix = QFileInfo(path).suffix().toLower();
    const int pcm = bitDepth == 24 ? SF_FORMAT_PCM_24 : SF_FORMAT_PCM_16;
    if (suffix == QLatin1String("wav"))
        return SF_FORMAT_WAV | pcm;
    if (suffix == QLatin1String("flac"))
        return SF_FORMAT_FLAC | pcm;
    return SF_FORMAT_MPEG | SF_FORMAT_MPEG_LAYER_III;
}

SampleWriteResult SampleWriter::write(const QString& path,
                                      const std::vector<float>& interleaved,
                                      int channels,
                                      const RecordingSettings& settings,
                                      CancelToken* cancellation) {
    if (channels <= 0)
        return failure(QStringLiteral("no channels to encode"));
    if (isCancelled(cancellation))
        return cancelledResult();

    const QFileInfo target(path);
    if (!QDir().mkpath(target.absolutePath()))
        return failure(QStringLiteral("cannot create %1").arg(target.absolutePath()));

    const QString partial = partialPathFor(path);
    const QByteArray partialName = QFile::encodeName(partial);

    SF_INFO info {};
    info.samplerate = settings.sampleRate;
    info.channels = channels;
    info.format = formatFor(path, settings.bitDepth);

    SNDFILE* sf = sf_open(partialName.constData(), SFM_WRITE, &info);
    if (!sf)
        return failure(QStringLiteral("sf_open %1: %2").arg(partial, QString::fromUtf8(sf_strerror(nullptr))));

    if ((info.format & SF_FORMAT_TYPEMASK) == SF_FORMAT_MPEG) {
        int mode = SF_BITRATE_MODE_CONSTANT;
        double level = mp3CompressionLevel(settings.mp3Bitrate);
        if (sf_command(sf, SFC_SET_BITRATE_MODE, &mode, sizeof(mode)) != SF_TRUE
            || sf_command(sf, SFC_SET_COMPRESSION_LEVEL, &level, sizeof(level)) != SF_TRUE) {
            qWarning() << "SampleWriter" << "encoder rejected bitrate" << settings.mp3Bitrate << "kbps for" << path;
        }
    }

    const sf_count_t totalFrames = static_cast<sf_count_t>(interleaved.size() / static_cast<std::size_t>(channels));
    sf_count_t written = 0;
    bool aborted = false;
    QString error;
    while (written < totalFrames) {
        if (isCancelled(cancellation)) {
            aborted = true;
            break;
        }
        const sf_count_t chunk = std::min(kChunkFrames, totalFrames - written);
        const float* src = interleaved.data() + written * channels;
        const sf_count_t done = sf_writef_float(sf, src, chunk);
        if (done != chunk) {
            error = QString::fromUtf8(sf_strerror(sf));
            break;
        }
        written += done;
    }

    const int closeRc = sf_close(sf);
    if (!aborted && error.isEmpty() && closeRc != 0)
        error = QString::fromUtf8(sf_error_number(closeRc));

    if (aborted || !error.isEmpty() || isCancelled(cancellation)) {
        QFile::remove(partial);
        return error.isEmpty() ? cancelledResult() : failure(error);
    }

    std::error_code ec;
    const std::filesystem::path from(partialName.toStdString());
    const std::filesystem::path to(QFile::encodeName(path).toStdString());
    const auto publish = [&]() { std::filesystem::rename(from, to, ec); };
    if (cancellation) {
        // A cancel that lands after the loop above still wins until the rename runs.
        if (!cancellation->commit(publish)) {
            QFile::remove(partial);
            return cancelledResult();
        }
    } else {
        publish();
    }
    if (ec) {
        QFile::remove(partial);
        return failure(QStringLiteral("rename to %1 failed: %2").arg(path, QString::fromStdString(ec.message())));
    }

    SampleWriteResult result;
    result.ok = true;
    const auto size = std::filesystem::file_size(to, ec);
    result.bytes = ec ? 0 : static_cast<qint64>(size);
    return result;
}
