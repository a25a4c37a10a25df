#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

struct MicrophoneChannel {
    QString id;
    QString position;
    bool enabled {true};
    int input {1};   // 1-based capture port

    bool operator==(const MicrophoneChannel&) const = default;
};

struct Register {
    QString label;
    bool tremulant {false};

    // NamingEngine::format(label, tremulant); recomputed on every call.
    [[nodiscard]] QString canonicalName() const;
};

struct Keyboard {
    QString name;
    std::vector<Register> registers;

    [[nodiscard]] const Register* findRegister(const QString& label, bool tremulant) const;
    Register& ensureRegister(const QString& label, bool tremulant);
};

struct Organ {
    QString name;
    std::vector<Keyboard> keyboards;

    [[nodiscard]] const Keyboard* findKeyboard(const QString& name) const;
    Keyboard& ensureKeyboard(const QString& name);
};

// Which register the sequencer is walking through.
struct RegisterSelection {
    QString keyboard;
    QString label;
    bool tremulant {false};

    bool operator==(const RegisterSelection&) const = default;
};

QStringList defaultKeyboardNames();
Organ makeOrgan(const QString& name, const QStringList& keyboards = {});
MicrophoneChannel defaultMicrophone();

std::vector<MicrophoneChannel> enabledMicrophones(const std::vector<MicrophoneChannel>& channels);

// Empty list, duplicate/empty ids, bad inputs or no enabled channel are rejected.
bool validateMicrophones(const std::vector<MicrophoneChannel>& channels, QString* message = nullptr);

QJsonObject organToJson(const Organ& organ);
QJsonObject microphoneToJson(const MicrophoneChannel& channel);
QJsonArray microphonesToJson(const std::vector<MicrophoneChannel>& channels);
std::optional<std::vector<MicrophoneChannel>> microphonesFromJson(const QJsonArray& array, QString* message = nullptr);
