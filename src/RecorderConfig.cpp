#include "RecorderConfig.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QStandardPaths>

namespace {
constexpr const char* kSettingsFileName = "settings.json";

const QString kOptPort = QStringLiteral("port");
const QString kOptHost = QStringLiteral("host");
const QString kOptProject = QStringLiteral("project");
const QString kOptRegister = QStringLiteral("register");
const QString kOptKeyboard = QStringLiteral("keyboard");
const QString kOptTremulant = QStringLiteral("tremulant");
const QString kOptOutput = QStringLiteral("output");
const QString kOptCapture = QStringLiteral("capture");
const QString kOptConfig = QStringLiteral("config");

bool parsePort(const QString& text, quint16& port) {
    bool ok = false;
    const uint value = text.trimmed().toUInt(&ok);
    if (!ok || value == 0 || value > 65535)
        return false;
    port = static_cast<quint16>(value);
    return true;
}

bool fail(QString* error, const QString& message) {
    if (error)
        *error = message;
    return false;
}

QString expandHome(const QString& path) {
    if (path == QLatin1String("~"))
        return QDir::homePath();
    if (path.startsWith(QLatin1String("~/")))
        return QDir::homePath() + path.mid(1);
    return path;
}
} // namespace

RecorderOptions RecorderConfig::defaults() {
    RecorderOptions options;
    options.outputDir = defaultOutputDir();
    options.configDir = defaultConfigDir();
    options.microphones = {defaultMicrophone()};
    return options;
}

QString RecorderConfig::defaultConfigDir() {
    const QString location = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return location.isEmpty() ? QDir::current().filePath(QStringLiteral("config")) : location;
}

QString RecorderConfig::defaultOutputDir() {
    return QDir::home().filePath(QStringLiteral("OrganRec"));
}

QString RecorderConfig::settingsFilePath(const QString& configDir) {
    return QDir(configDir).filePath(QString::fromLatin1(kSettingsFileName));
}

std::optional<CaptureBackend> RecorderConfig::parseBackend(const QString& name) {
    const QString lower = name.trimmed().toLower();
    if (lower == QLatin1String("jack"))
        return CaptureBackend::Jack;
    if (lower == QLatin1String("simulated") || lower == QLatin1String("sim"))
        return CaptureBackend::Simulated;
    return std::nullopt;
}

QString RecorderConfig::backendName(CaptureBackend backend) {
    return backend == CaptureBackend::Simulated ? QStringLiteral("simulated") : QStringLiteral("jack");
}

void RecorderConfig::configureParser(QCommandLineParser& parser) {
    parser.setApplicationDescription(QStringLiteral("Pipe organ sample recorder with a networked remote control"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {kOptPort, QStringLiteral("WebSocket port (default 5555)."), QStringLiteral("port")},
        {kOptHost, QStringLiteral("Address to listen on (default 0.0.0.0)."), QStringLiteral("host")},
        {kOptProject, QStringLiteral("Organ/project name to start with."), QStringLiteral("name")},
        {kOptRegister, QStringLiteral("Register label to start with."), QStringLiteral("label")},
        {kOptKeyboard, QStringLiteral("Keyboard of the starting register."), QStringLiteral("name")},
        {kOptTremulant, QStringLiteral("Starting register is recorded with tremulant.")},
        {kOptOutput, QStringLiteral("Root folder for recorded samples (default ~/OrganRec)."), QStringLiteral("dir")},
        {kOptCapture, QStringLiteral("Capture backend: jack or simulated."), QStringLiteral("backend")},
        {kOptConfig, QStringLiteral("Folder holding settings.json."), QStringLiteral("dir")}
    });
}

std::optional<RecorderOptions> RecorderConfig::load(const QCommandLineParser& parser,
                                                    const QProcessEnvironment& env,
                                                    QString* error) {
    RecorderOptions options = defaults();
    if (parser.isSet(kOptConfig))
        options.configDir = expandHome(parser.value(kOptConfig));
    else if (env.contains(QStringLiteral("ORGANREC_CONFIG_DIR")))
        options.configDir = expandHome(env.value(QStringLiteral("ORGANREC_CONFIG_DIR")));

    QString problem;
    if (!applySettingsFile(settingsFilePath(options.configDir), options, &problem))
        qWarning() << "config" << "ignoring settings file:" << problem;

    if (!applyEnvironment(env, options, error))
        return std::nullopt;
    if (!applyCommandLine(parser, options, error))
        return std::nullopt;
    return options;
}

bool RecorderConfig::applySettingsFile(const QString& path, RecorderOptions& options, QString* error) {
    QFile file(path);
    if (!file.exists())
        return true;
    if (!file.open(QIODevice::ReadOnly))
        return fail(error, QStringLiteral("cannot read %1: %2").arg(path, file.errorString()));

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        return fail(error, QStringLiteral("%1: %2").arg(path, parseError.errorString()));
    const QJsonObject root = doc.object();

    if (root.contains(QStringLiteral("settings"))) {
        RecordingSettings settings = options.settings;
        QString message;
        if (!applySettingsPatch(root.value(QStringLiteral("settings")).toObject(), settings, &message)
            || validateSettings(settings, &message) != SettingsProblem::None) {
            return fail(error, QStringLiteral("%1: %2").arg(path, message));
        }
        options.settings = settings;
    }

    if (root.contains(QStringLiteral("microphones"))) {
        QString message;
        auto microphones = microphonesFromJson(root.value(QStringLiteral("microphones")).toArray(), &message);
        if (!microphones || !validateMicrophones(*microphones, &message))
            return fail(error, QStringLiteral("%1: %2").arg(path, message));
        options.microphones = std::move(*microphones);
    }

    if (root.contains(QStringLiteral("outputDir")))
        options.outputDir = expandHome(root.value(QStringLiteral("outputDir")).toString(options.outputDir));
    if (root.contains(QStringLiteral("port"))) {
        const int port = root.value(QStringLiteral("port")).toInt(-1);
        if (port > 0 && port <= 65535)
            options.port = static_cast<quint16>(port);
    }
    return true;
}

bool RecorderConfig::applyEnvironment(const QProcessEnvironment& env, RecorderOptions& options, QString* error) {
    if (env.contains(QStringLiteral("ORGANREC_OUTPUT_DIR")))
        options.outputDir = expandHome(env.value(QStringLiteral("ORGANREC_OUTPUT_DIR")));
    if (env.contains(QStringLiteral("ORGANREC_JACK_COMMAND")))
        options.jackCommand = env.value(QStringLiteral("ORGANREC_JACK_COMMAND"));

    if (env.contains(QStringLiteral("ORGANREC_PORT"))) {
        const QString value = env.value(QStringLiteral("ORGANREC_PORT"));
        if (!parsePort(value, options.port))
            return fail(error, QStringLiteral("ORGANREC_PORT=%1 is not a valid port").arg(value));
    }
    if (env.contains(QStringLiteral("ORGANREC_CAPTURE"))) {
        const QString value = env.value(QStringLiteral("ORGANREC_CAPTURE"));
        const auto backend = parseBackend(value);
        if (!backend)
            return fail(error, QStringLiteral("ORGANREC_CAPTURE=%1 is not jack or simulated").arg(value));
        options.capture = *backend;
    }
    return true;
}

bool RecorderConfig::applyCommandLine(const QCommandLineParser& parser, RecorderOptions& options, QString* error) {
    if (parser.isSet(kOptPort) && !parsePort(parser.value(kOptPort), options.port))
        return fail(error, QStringLiteral("--port %1 is not a valid port").arg(parser.value(kOptPort)));
    if (parser.isSet(kOptHost))
        options.host = parser.value(kOptHost);
    if (parser.isSet(kOptOutput))
        options.outputDir = expandHome(parser.value(kOptOutput));
    if (parser.isSet(kOptCapture)) {
        const auto backend = parseBackend(parser.value(kOptCapture));
        if (!backend)
            return fail(error, QStringLiteral("--capture %1 is not jack or simulated").arg(parser.value(kOptCapture)));
        options.capture = *backend;
    }
    if (parser.isSet(kOptProject))
        options.project = parser.value(kOptProject);
    if (parser.isSet(kOptKeyboard))
        options.keyboard = parser.value(kOptKeyboard);
    if (parser.isSet(kOptRegister))
        options.registerLabel = parser.value(kOptRegister);
    options.tremulant = options.tremulant || parser.isSet(kOptTremulant);
    return true;
}

bool RecorderConfig::saveSettings(const QString& configDir,
                                  const RecordingSettings& settings,
                                  const std::vector<MicrophoneChannel>& microphones,
                                  QString* error) {
    if (!QDir().mkpath(configDir))
        return fail(error, QStringLiteral("cannot create %1").arg(configDir));

    const QString path = settingsFilePath(configDir);
    QJsonObject root;
    // Keep keys this process does not own (outputDir, port) intact.
    QFile existing(path);
    if (existing.open(QIODevice::ReadOnly)) {
        const QJsonDocument doc = QJsonDocument::fromJson(existing.readAll());
        if (doc.isObject())
            root = doc.object();
        existing.close();
    }
    root.insert(QStringLiteral("settings"), settingsToJson(settings));
    root.insert(QStringLiteral("microphones"), microphonesToJson(microphones));

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "config" << "settings-save-open-failed" << path;
        return fail(error, file.errorString());
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "config" << "settings-save-commit-failed" << path;
        return fail(error, file.errorString());
    }
    return true;
}
