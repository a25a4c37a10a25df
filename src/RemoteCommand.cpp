#include "RemoteCommand.h"
#include "util.h"

#include <QJsonArray>
#include <QJsonValue>

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<RemoteCommandType, const char*>, 14> kCommandNames {{
    {RemoteCommandType::SelectOrgan, "selectOrgan"},
    {RemoteCommandType::SelectRegister, "selectRegister"},
    {RemoteCommandType::Start, "start"},
    {RemoteCommandType::RecordAll, "recordAll"},
    {RemoteCommandType::Pause, "pause"},
    {RemoteCommandType::Stop, "stop"},
    {RemoteCommandType::Retry, "retry"},
    {RemoteCommandType::Next, "next"},
    {RemoteCommandType::Previous, "previous"},
    {RemoteCommandType::UpdateSettings, "updateSettings"},
    {RemoteCommandType::ConfigureMicrophones, "configureMicrophones"},
    {RemoteCommandType::SetNote, "setNote"},
    {RemoteCommandType::ListInputs, "listInputs"},
    {RemoteCommandType::Shutdown, "shutdown"}
}};

std::optional<RemoteCommand> malformed(QString* error, const QString& message) {
    if (error)
        *error = message;
    return std::nullopt;
}

} // namespace

QString remoteCommandName(RemoteCommandType type) {
    for (const auto& [candidate, name] : kCommandNames) {
        if (candidate == type)
            return QString::fromLatin1(name);
    }
    return QStringLiteral("unknown");
}

RemoteCommand RemoteCommand::simple(RemoteCommandType type, qint64 requestId) {
    RemoteCommand cmd;
    cmd.type = type;
    cmd.requestId = requestId;
    return cmd;
}

std::optional<RemoteCommand> RemoteCommand::fromJson(const QJsonObject& obj, QString* error) {
    const QString name = obj.value(QStringLiteral("command")).toString();
    if (name.isEmpty())
        return malformed(error, QStringLiteral("missing \"command\""));

    RemoteCommand cmd;
    bool known = false;
    for (const auto& [type, candidate] : kCommandNames) {
        if (name == QLatin1String(candidate)) {
            cmd.type = type;
            known = true;
            break;
        }
    }
    if (!known)
        return malformed(error, QStringLiteral("unknown command \"%1\"").arg(name));

    const QJsonValue requestId = obj.value(QStringLiteral("requestId"));
    if (!requestId.isUndefined() && !requestId.isNull()) {
        const std::optional<long long> id = requestId.isDouble() ? exactRequestId(requestId.toDouble()) : std::nullopt;
        if (!id)
            return malformed(error, QStringLiteral("requestId must be a whole number from 0 to 2^53"));
        cmd.requestId = static_cast<qint64>(*id);
    }

    switch (cmd.type) {
        case RemoteCommandType::SelectOrgan: {
            const QJsonValue organ = obj.value(QStringLiteral("organ"));
            if (!organ.isString())
                return malformed(error, QStringLiteral("selectOrgan needs \"organ\""));
            cmd.organ = organ.toString();
            for (const auto& kb : obj.value(QStringLiteral("keyboards")).toArray()) {
                if (!kb.isString())
                    return malformed(error, QStringLiteral("keyboards must be strings"));
                cmd.keyboards << kb.toString();
            }
            break;
        }
        case RemoteCommandType::SelectRegister: {
            const QJsonValue label = obj.value(QStringLiteral("register"));
            if (!label.isString())
                return malformed(error, QStringLiteral("selectRegister needs \"register\""));
            cmd.selection.label = label.toString();
            cmd.selection.keyboard = obj.value(QStringLiteral("keyboard")).toString();
            cmd.selection.tremulant = obj.value(QStringLiteral("tremulant")).toBool(false);
            break;
        }
        case RemoteCommandType::UpdateSettings: {
            const QJsonValue settings = obj.value(QStringLiteral("settings"));
            if (!settings.isObject())
                return malformed(error, QStringLiteral("updateSettings needs a \"settings\" object"));
            cmd.settingsPatch = settings.toObject();
            break;
        }
        case RemoteCommandType::ConfigureMicrophones: {
            const QJsonValue microphones = obj.value(QStringLiteral("microphones"));
            if (!microphones.isArray())
                return malformed(error, QStringLiteral("configureMicrophones needs a \"microphones\" array"));
            QString problem;
            auto parsed = microphonesFromJson(microphones.toArray(), &problem);
            if (!parsed)
                return malformed(error, problem);
            cmd.microphones = std::move(*parsed);
            break;
        }
        case RemoteCommandType::SetNote: {
            const QJsonValue note = obj.value(QStringLiteral("note"));
            if (!note.isDouble())
                return malformed(error, QStringLiteral("setNote needs a numeric \"note\""));
            const std::optional<int> index = exactInt(note.toDouble());
            if (!index)
                return malformed(error, QStringLiteral("note must be an integer"));
            cmd.note = *index;
            break;
        }
        default:
            break;
    }
    return cmd;
}
