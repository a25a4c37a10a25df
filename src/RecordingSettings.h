#pragma once

#include <QJsonObject>
#include <QString>

#include <array>
#include <initializer_list>

enum class ChannelLayout {
    Mono = 1,
    Stereo = 2
};

struct RecordingSettings {
    int sampleRate {44100};
    int bitDepth {16};
    ChannelLayout channels {ChannelLayout::Mono};
    int mp3Bitrate {192};
    int countdownSeconds {5};
    int recordSeconds {5};
    int startNote {36};   // C2
    int endNote {96};     // C7

    [[nodiscard]] int channelCount() const noexcept { return static_cast<int>(channels); }
    [[nodiscard]] int noteCount() const noexcept { return endNote - startNote + 1; }
    [[nodiscard]] bool containsNote(int note) const noexcept { return note >= startNote && note <= endNote; }

    bool operator==(const RecordingSettings&) const = default;
};

enum class SettingsField {
    SampleRate,
    BitDepth,
    Channels,
    Mp3Bitrate,
    CountdownSeconds,
    RecordSeconds,
    StartNote,
    EndNote
};

struct SettingsDescriptor {
    SettingsField id;
    const char* key;
    const char* label;
    int minValue;
    int maxValue;
    std::initializer_list<int> allowed;   // empty: any value in [minValue, maxValue]
};

const std::array<SettingsDescriptor, 8>& settingsDescriptors();

enum class SettingsProblem {
    None,
    InvalidRange,   // startNote > endNote
    InvalidValue    // a field outside its allowed set or bounds
};

// Checks every field against its descriptor. The first problem found is reported in |message|.
SettingsProblem validateSettings(const RecordingSettings& settings, QString* message = nullptr);

QJsonObject settingsToJson(const RecordingSettings& settings);

// Overlays the keys present in |patch| onto |settings|. Keys that are missing are left alone.
// Returns false (and leaves |settings| untouched) when a present key has the wrong type.
bool applySettingsPatch(const QJsonObject& patch, RecordingSettings& settings, QString* message = nullptr);

QString channelLayoutName(ChannelLayout layout);
