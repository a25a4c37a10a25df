#pragma once

#include "SessionState.h"

#include <QJsonObject>
#include <QString>

// Writes register.json into a finished register's folder: what was recorded, with
// which settings and microphones, and which sample files made it to disk.
class RegisterCheckpoint {
public:
    explicit RegisterCheckpoint(const QString& outputRoot);

    bool write(const SessionSnapshot& snapshot, QString* error = nullptr) const;

    // Absolute path of register.json for the snapshot's register; empty without a selection.
    QString checkpointPath(const SessionSnapshot& snapshot) const;
    QJsonObject describe(const SessionSnapshot& snapshot) const;

private:
    QString m_outputRoot;
};
