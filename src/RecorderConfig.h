#pragma once

#include "RecorderOptions.h"

#include <QProcessEnvironment>
#include <QString>

#include <optional>

class QCommandLineParser;

// Layers: built-in defaults <- settings.json <- ORGANREC_* environment <- command line.
class RecorderConfig {
public:
    static RecorderOptions defaults();

    static void configureParser(QCommandLineParser& parser);

    // Resolves the config directory first (--config, ORGANREC_CONFIG_DIR, AppConfigLocation),
    // then applies every layer in order.
    static std::optional<RecorderOptions> load(const QCommandLineParser& parser,
                                               const QProcessEnvironment& env,
                                               QString* error);

    static bool applySettingsFile(const QString& path, RecorderOptions& options, QString* error);
    static bool applyEnvironment(const QProcessEnvironment& env, RecorderOptions& options, QString* error);
    static bool applyCommandLine(const QCommandLineParser& parser, RecorderOptions& options, QString* error);

    static bool saveSettings(const QString& configDir,
                             const RecordingSettings& settings,
                             const std::vector<MicrophoneChannel>& microphones,
                             QString* error = nullptr);

    static QString settingsFilePath(const QString& configDir);
    static QString defaultConfigDir();
    static QString defaultOutputDir();
    static std::optional<CaptureBackend> parseBackend(const QString& name);
    static QString backendName(CaptureBackend backend);
};
