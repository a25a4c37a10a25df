#include "OrganModel.h"

#include "NamingEngine.h"

#include <QHash>
#include <QJsonValue>
#include <QSet>

#include <algorithm>

QString Register::canonicalName() const {
    return NamingEngine::format(label, tremulant);
}

const Register* Keyboard::findRegister(const QString& label, bool tremulant) const {
    const auto it = std::find_if(registers.begin(), registers.end(), [&](const Register& reg) {
        return reg.label == label && reg.tremulant == tremulant;
    });
    return it == registers.end() ? nullptr : &*it;
}

Register& Keyboard::ensureRegister(const QString& label, bool tremulant) {
    for (auto& reg : registers) {
        if (reg.label == label && reg.tremulant == tremulant)
            return reg;
    }
    registers.push_back(Register {label, tremulant});
    return registers.back();
}

const Keyboard* Organ::findKeyboard(const QString& keyboardName) const {
    const auto it = std::find_if(keyboards.begin(), keyboards.end(), [&](const Keyboard& kb) {
        return kb.name.compare(keyboardName, Qt::CaseInsensitive) == 0;
    });
    return it == keyboards.end() ? nullptr : &*it;
}

Keyboard& Organ::ensureKeyboard(const QString& keyboardName) {
    for (auto& kb : keyboards) {
        if (kb.name.compare(keyboardName, Qt::CaseInsensitive) == 0)
            return kb;
    }
    keyboards.push_back(Keyboard {keyboardName, {}});
    return keyboards.back();
}

QStringList defaultKeyboardNames() {
    return {QStringLiteral("Hoofdwerk"), QStringLiteral("Bovenwerk"), QStringLiteral("Pedaal")};
}

Organ makeOrgan(const QString& name, const QStringList& keyboards) {
    Organ organ;
    organ.name = name.trimmed();
    const QStringList names = keyboards.isEmpty() ? defaultKeyboardNames() : keyboards;
    for (const auto& kb : names) {
        const QString trimmed = kb.trimmed();
        if (!trimmed.isEmpty())
            organ.ensureKeyboard(trimmed);
    }
    return organ;
}

MicrophoneChannel defaultMicrophone() {
    return MicrophoneChannel {QStringLiteral("main"), QStringLiteral("Main"), true, 1};
}

std::vector<MicrophoneChannel> enabledMicrophones(const std::vector<MicrophoneChannel>& channels) {
    std::vector<MicrophoneChannel> enabled;
    std::copy_if(channels.begin(), channels.end(), std::back_inserter(enabled),
                 [](const MicrophoneChannel& ch) { return ch.enabled; });
    return enabled;
}

bool validateMicrophones(const std::vector<MicrophoneChannel>& channels, QString* message) {
    auto fail = [message](const QString& text) {
        if (message)
            *message = text;
        return false;
    };

    if (channels.empty())
        return fail(QStringLiteral("at least one microphone channel is required"));

    QSet<QString> ids;
    bool anyEnabled = false;
    for (const auto& ch : channels) {
        if (ch.id.trimmed().isEmpty())
            return fail(QStringLiteral("microphone id must not be empty"));
        if (ids.contains(ch.id))
            return fail(QStringLiteral("duplicate microphone id %1").arg(ch.id));
        if (ch.input < 1)
            return fail(QStringLiteral("microphone %1 has invalid input %2").arg(ch.id).arg(ch.input));
        ids.insert(ch.id);
        anyEnabled = anyEnabled || ch.enabled;
    }
    if (!anyEnabled)
        return fail(QStringLiteral("at least one microphone must stay enabled"));

    // Each enabled channel records into its own position folder. Folder names are compared
    // without case so a layout also works on case-insensitive filesystems.
    QHash<QString, QString> folders;
    for (const auto& ch : enabledMicrophones(channels)) {
        const QString folder = NamingEngine::sanitizeSegment(ch.position, QStringLiteral("Mic")).toLower();
        const auto taken = folders.constFind(folder);
        if (taken != folders.cend()) {
            return fail(QStringLiteral("microphones %1 and %2 would share the folder %3")
                            .arg(taken.value(), ch.id, NamingEngine::sanitizeSegment(ch.position, QStringLiteral("Mic"))));
        }
        folders.insert(folder, ch.id);
    }
    return true;
}

QJsonObject organToJson(const Organ& organ) {
    QJsonArray keyboards;
    for (const auto& kb : organ.keyboards) {
        QJsonArray registers;
        for (const auto& reg : kb.registers) {
            registers.append(QJsonObject {
                {QStringLiteral("label"), reg.label},
                {QStringLiteral("tremulant"), reg.tremulant},
                {QStringLiteral("canonical"), reg.canonicalName()}
            });
        }
        keyboards.append(QJsonObject {
            {QStringLiteral("name"), kb.name},
            {QStringLiteral("registers"), registers}
        });
    }
    return QJsonObject {
        {QStringLiteral("name"), organ.name},
        {QStringLiteral("keyboards"), keyboards}
    };
}

QJsonObject microphoneToJson(const MicrophoneChannel& channel) {
    return QJsonObject {
        {QStringLiteral("id"), channel.id},
        {QStringLiteral("position"), channel.position},
        {QStringLiteral("enabled"), channel.enabled},
        {QStringLiteral("input"), channel.input}
    };
}

QJsonArray microphonesToJson(const std::vector<MicrophoneChannel>& channels) {
    QJsonArray array;
    for (const auto& ch : channels)
        array.append(microphoneToJson(ch));
    return array;
}

std::optional<std::vector<MicrophoneChannel>> microphonesFromJson(const QJsonArray& array, QString* message) {
    std::vector<MicrophoneChannel> channels;
    for (const auto& value : array) {
        if (!value.isObject()) {
            if (message)
                *message = QStringLiteral("microphone entries must be objects");
            return std::nullopt;
        }
        const QJsonObject obj = value.toObject();
        MicrophoneChannel ch;
        ch.id = obj.value(QStringLiteral("id")).toString().trimmed();
        ch.position = obj.value(QStringLiteral("position")).toString(ch.id).trimmed();
        ch.enabled = obj.value(QStringLiteral("enabled")).toBool(true);
        ch.input = obj.value(QStringLiteral("input")).toInt(static_cast<int>(channels.size()) + 1);
        if (ch.position.isEmpty())
            ch.position = ch.id;
        channels.push_back(ch);
    }
    return channels;
}
