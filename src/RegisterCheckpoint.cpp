#include "RegisterCheckpoint.h"

#include "NamingEngine.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>

RegisterCheckpoint::RegisterCheckpoint(const QString& outputRoot)
    : m_outputRoot(outputRoot) {
}

QString RegisterCheckpoint::checkpointPath(const SessionSnapshot& snapshot) const {
    const auto location = snapshot.registerLocation();
    if (!location)
        return {};
    // Any note's path shares the register folder; strip the file (and mic folder) off it.
    const QString sample = NamingEngine::pathFor(*location, snapshot.selection->tremulant, std::nullopt,
                                                 snapshot.settings.startNote);
    const QString registerDir = QFileInfo(sample).path();
    return QDir(m_outputRoot).filePath(registerDir + QStringLiteral("/register.json"));
}

QJsonObject RegisterCheckpoint::describe(const SessionSnapshot& snapshot) const {
    QJsonObject obj;
    obj.insert(QStringLiteral("organ"), snapshot.organ.name);
    if (snapshot.selection) {
        obj.insert(QStringLiteral("keyboard"), snapshot.selection->keyboard);
        obj.insert(QStringLiteral("register"), snapshot.selection->label);
        obj.insert(QStringLiteral("canonical"),
                   NamingEngine::format(snapshot.selection->label, snapshot.selection->tremulant));
        obj.insert(QStringLiteral("tremulant"), snapshot.selection->tremulant);
    }
    obj.insert(QStringLiteral("settings"), settingsToJson(snapshot.settings));
    obj.insert(QStringLiteral("microphones"), microphonesToJson(snapshot.microphones));
    obj.insert(QStringLiteral("completedAt"), QDateTime::currentDateTimeUtc().toString(Qt::ISODate));

    QJsonArray notes;
    int missing = 0;
    const QDir root(m_outputRoot);
    for (int note = snapshot.settings.startNote; note <= snapshot.settings.endNote; ++note) {
        QJsonObject files;
        const auto paths = snapshot.resolvedPathsFor(note);
        for (auto it = paths.cbegin(); it != paths.cend(); ++it) {
            const bool present = QFileInfo::exists(root.filePath(it.value()));
            if (!present)
                ++missing;
            files.insert(it.key(), QJsonObject {
                {QStringLiteral("path"), it.value()},
                {QStringLiteral("present"), present}
            });
        }
        notes.append(QJsonObject {
            {QStringLiteral("note"), note},
            {QStringLiteral("name"), NamingEngine::noteDisplayName(note)},
            {QStringLiteral("files"), files}
        });
    }
    obj.insert(QStringLiteral("notes"), notes);
    obj.insert(QStringLiteral("missingFiles"), missing);
    return obj;
}

bool RegisterCheckpoint::write(const SessionSnapshot& snapshot, QString* error) const {
    const QString path = checkpointPath(snapshot);
    if (path.isEmpty()) {
        if (error)
            *error = QStringLiteral("no register selected");
        return false;
    }
    if (!QDir().mkpath(QFileInfo(path).path())) {
        if (error)
            *error = QStringLiteral("cannot create %1").arg(QFileInfo(path).path());
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "checkpoint" << "open-failed" << path;
        if (error)
            *error = file.errorString();
        return false;
    }
    file.write(QJsonDocument(describe(snapshot)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "checkpoint" << "commit-failed" << path;
        if (error)
            *error = file.errorString();
        return false;
    }
    qInfo() << "checkpoint" << "written" << path;
    return true;
}
