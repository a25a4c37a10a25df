#include "RecordingSettings.h"
#include "util.h"

#include <QJsonValue>

#include <algorithm>

namespace {

const std::array<SettingsDescriptor, 8> kDescriptors {{
    {SettingsField::SampleRate, "sampleRate", "Sample Rate", 44100, 96000, {44100, 48000, 96000}},
    {SettingsField::BitDepth, "bitDepth", "Bit Depth", 16, 24, {16, 24}},
    {SettingsField::Channels, "channels", "Channels", 1, 2, {1, 2}},
    {SettingsField::Mp3Bitrate, "mp3Bitrate", "MP3 Bitrate (kbps)", 128, 320, {128, 192, 256, 320}},
    {SettingsField::CountdownSeconds, "countdownSeconds", "Countdown (s)", 1, 30, {}},
    {SettingsField::RecordSeconds, "recordSeconds", "Record Length (s)", 1, 60, {}},
    {SettingsField::StartNote, "startNote", "First Note", 0, 127, {}},
    {SettingsField::EndNote, "endNote", "Last Note", 0, 127, {}}
}};

int fieldValue(const RecordingSettings& settings, SettingsField id) {
    switch (id) {
        case SettingsField::SampleRate: return settings.sampleRate;
        case SettingsField::BitDepth: return settings.bitDepth;
        case SettingsField::Channels: return settings.channelCount();
        case SettingsField::Mp3Bitrate: return settings.mp3Bitrate;
        case SettingsField::CountdownSeconds: return settings.countdownSeconds;
        case SettingsField::RecordSeconds: return settings.recordSeconds;
        case SettingsField::StartNote: return settings.startNote;
        case SettingsField::EndNote: return settings.endNote;
    }
    return 0;
}

void setFieldValue(RecordingSettings& settings, SettingsField id, int value) {
    switch (id) {
        case SettingsField::SampleRate: settings.sampleRate = value; break;
        case SettingsField::BitDepth: settings.bitDepth = value; break;
        case SettingsField::Channels:
            settings.channels = (value == 2) ? ChannelLayout::Stereo : ChannelLayout::Mono;
            break;
        case SettingsField::Mp3Bitrate: settings.mp3Bitrate = value; break;
        case SettingsField::CountdownSeconds: settings.countdownSeconds = value; break;
        case SettingsField::RecordSeconds: settings.recordSeconds = value; break;
        case SettingsField::StartNote: settings.startNote = value; break;
        case SettingsField::EndNote: settings.endNote = value; break;
    }
}

} // namespace

const std::array<SettingsDescriptor, 8>& settingsDescriptors() {
    return kDescriptors;
}

SettingsProblem validateSettings(const RecordingSettings& settings, QString* message) {
    for (const auto& desc : kDescriptors) {
        const int value = fieldValue(settings, desc.id);
        bool valid = value >= desc.minValue && value <= desc.maxValue;
        if (valid && desc.allowed.size() > 0)
            valid = std::find(desc.allowed.begin(), desc.allowed.end(), value) != desc.allowed.end();
        if (!valid) {
            if (message)
                *message = QStringLiteral("%1 does not accept %2").arg(QString::fromLatin1(desc.key)).arg(value);
            return SettingsProblem::InvalidValue;
        }
    }

    if (settings.startNote > settings.endNote) {
        if (message)
            *message = QStringLiteral("startNote %1 is above endNote %2").arg(settings.startNote).arg(settings.endNote);
        return SettingsProblem::InvalidRange;
    }
    return SettingsProblem::None;
}

QJsonObject settingsToJson(const RecordingSettings& settings) {
    QJsonObject obj;
    for (const auto& desc : kDescriptors)
        obj.insert(QString::fromLatin1(desc.key), fieldValue(settings, desc.id));
    return obj;
}

bool applySettingsPatch(const QJsonObject& patch, RecordingSettings& settings, QString* message) {
    RecordingSettings merged = settings;
    for (const auto& desc : kDescriptors) {
        const QString key = QString::fromLatin1(desc.key);
        if (!patch.contains(key))
            continue;
        const QJsonValue value = patch.value(key);
        if (desc.id == SettingsField::Channels && value.isString()) {
            const QString layout = value.toString().toLower();
            if (layout == QLatin1String("mono")) {
                merged.channels = ChannelLayout::Mono;
                continue;
            }
            if (layout == QLatin1String("stereo")) {
                merged.channels = ChannelLayout::Stereo;
                continue;
            }
        }
        if (!value.isDouble()) {
            if (message)
                *message = QStringLiteral("%1 must be a number").arg(key);
            return false;
        }
        const std::optional<int> raw = exactInt(value.toDouble());
        if (!raw) {
            if (message)
                *message = QStringLiteral("%1 must be an integer").arg(key);
            return false;
        }
        // A channel count other than 1 or 2 must surface as a validation error, not be coerced.
        if (desc.id == SettingsField::Channels && *raw != 1 && *raw != 2) {
            if (message)
                *message = QStringLiteral("channels does not accept %1").arg(*raw);
            return false;
        }
        setFieldValue(merged, desc.id, *raw);
    }
    settings = merged;
    return true;
}

QString channelLayoutName(ChannelLayout layout) {
    return layout == ChannelLayout::Stereo ? QStringLiteral("stereo") : QStringLiteral("mono");
}
