#include <QByteArray>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QHostAddress>
#include <QProcessEnvironment>
#include <QStringList>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "RecorderConfig.h"
#include "RegisterCheckpoint.h"
#include "Sequencer.h"
#include "SessionLogger.h"
#include "SessionState.h"
#include "SyncHub.h"
#include "audio/JackCaptureService.h"
#include "audio/SimulatedCaptureService.h"
#include "net/RemoteControlServer.h"

namespace {

constexpr const char* kStartupLogName = "organrec-startup.log";
constexpr const char* kCommandLineClient = "cli";

std::string formatTimestamp() {
    using clock = std::chrono::system_clock;
    const std::time_t nowTime = clock::to_time_t(clock::now());
    std::tm tm {};
    localtime_r(&nowTime, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

struct StartupLog {
    std::mutex mutex;
    std::ofstream stream;
    bool verbose {false};
};

StartupLog& startupLog() {
    static StartupLog log;
    return log;
}

// Routes SIGINT and SIGTERM to a queued quit so captures in flight are finalized by the
// normal teardown path.
class ShutdownSignalGuard {
public:
    explicit ShutdownSignalGuard(QCoreApplication& app) {
        if (s_installed.exchange(true))
            return;
        s_app = &app;
        s_previousInt = std::signal(SIGINT, &ShutdownSignalGuard::onSignal);
        s_previousTerm = std::signal(SIGTERM, &ShutdownSignalGuard::onSignal);
    }

    ~ShutdownSignalGuard() {
        s_app = nullptr;
        if (!s_installed.exchange(false))
            return;
        std::signal(SIGINT, s_previousInt);
        std::signal(SIGTERM, s_previousTerm);
    }

    ShutdownSignalGuard(const ShutdownSignalGuard&) = delete;
    ShutdownSignalGuard& operator=(const ShutdownSignalGuard&) = delete;

private:
    static void onSignal(int) {
        if (s_app)
            QMetaObject::invokeMethod(s_app, &QCoreApplication::quit, Qt::QueuedConnection);
    }

    static inline std::atomic<bool> s_installed {false};
    static inline QCoreApplication* s_app {nullptr};
    static inline __sighandler_t s_previousInt {SIG_DFL};
    static inline __sighandler_t s_previousTerm {SIG_DFL};
};

const char* levelName(QtMsgType type) {
    switch (type) {
    case QtDebugMsg: return "debug";
    case QtInfoMsg: return "info";
    case QtWarningMsg: return "warning";
    case QtCriticalMsg: return "critical";
    case QtFatalMsg: return "fatal";
    }
    return "info";
}

void writeStartupLine(const char* level, const QMessageLogContext& ctx, const QByteArray& message) {
    StartupLog& log = startupLog();
    std::lock_guard<std::mutex> lock(log.mutex);
    if (!log.stream.is_open())
        return;
    log.stream << formatTimestamp() << ' ' << level;
    if (ctx.category && std::strcmp(ctx.category, "default") != 0)
        log.stream << ' ' << ctx.category;
    if (ctx.file)
        log.stream << " (" << std::filesystem::path(ctx.file).filename().string() << ':' << ctx.line << ')';
    log.stream << ": " << message.constData() << '\n';
    log.stream.flush();
}

// Qt messages go to stderr and to a startup log beside the session logs. Debug output is
// dropped unless ORGANREC_DEBUG is set.
void installMessageHandler(const std::filesystem::path& logFile, bool verbose) {
    StartupLog& log = startupLog();
    log.verbose = verbose;
    std::error_code ec;
    std::filesystem::create_directories(logFile.parent_path(), ec);
    log.stream.open(logFile, std::ios::out | std::ios::app);
    if (!log.stream)
        std::cerr << "organrec: cannot write " << logFile.string() << '\n';

    qInstallMessageHandler([](QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
        if (type == QtDebugMsg && !startupLog().verbose)
            return;
        const QByteArray text = msg.toLocal8Bit();
        const char* level = levelName(type);
        std::fprintf(stderr, "organrec %s: %s\n", level, text.constData());
        writeStartupLine(level, ctx, text);
        if (type == QtFatalMsg)
            std::abort();
    });
}

void logOptions(const RecorderOptions& options) {
    auto& logger = SessionLogger::instance();
    logger.logf("config",
                "capture=%s listen=%s:%u output='%s' config='%s'",
                qPrintable(RecorderConfig::backendName(options.capture)),
                qPrintable(options.host),
                static_cast<unsigned>(options.port),
                qPrintable(options.outputDir),
                qPrintable(options.configDir));
    logger.logf("config",
                "rate=%d depth=%d channels=%d mp3=%dkbps countdown=%ds record=%ds notes=%d..%d mics=%zu",
                options.settings.sampleRate,
                options.settings.bitDepth,
                options.settings.channelCount(),
                options.settings.mp3Bitrate,
                options.settings.countdownSeconds,
                options.settings.recordSeconds,
                options.settings.startNote,
                options.settings.endNote,
                options.microphones.size());
    qInfo() << "startup" << "capture" << RecorderConfig::backendName(options.capture)
            << "output" << options.outputDir;
}

std::unique_ptr<AudioCaptureService> makeCaptureService(const RecorderOptions& options) {
    if (options.isSimulated())
        return std::make_unique<SimulatedCaptureService>(options.outputDir);
    return std::make_unique<JackCaptureService>(options.outputDir, options.jackCommand);
}

void submitStartupSelection(SyncHub& hub, const RecorderOptions& options) {
    if (options.registerLabel.trimmed().isEmpty())
        return;
    RemoteCommand command = RemoteCommand::simple(RemoteCommandType::SelectRegister);
    command.selection.keyboard = options.keyboard;
    command.selection.label = options.registerLabel;
    command.selection.tremulant = options.tremulant;
    hub.submit(QString::fromLatin1(kCommandLineClient), command);
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("OrganRec"));
    QCoreApplication::setApplicationName(QStringLiteral("OrganRec"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    installMessageHandler(std::filesystem::path(SessionLogger::resolveLogDirectory()) / kStartupLogName,
                          qEnvironmentVariableIsSet("ORGANREC_DEBUG"));

    QCommandLineParser parser;
    RecorderConfig::configureParser(parser);
    parser.process(app);

    QString error;
    const auto loaded = RecorderConfig::load(parser, QProcessEnvironment::systemEnvironment(), &error);
    if (!loaded) {
        qCritical().noquote() << "startup" << "configuration error:" << error;
        return 2;
    }
    const RecorderOptions options = *loaded;
    logOptions(options);
    ShutdownSignalGuard signalGuard(app);

    std::unique_ptr<AudioCaptureService> capture = makeCaptureService(options);
    SessionState state(options.project.isEmpty() ? QStringLiteral("Organ") : options.project,
                       options.settings, options.microphones);
    Sequencer sequencer(state, *capture);
    SyncHub hub(sequencer);
    RegisterCheckpoint checkpoint(options.outputDir);

    QObject::connect(capture.get(), &AudioCaptureService::inputLevelsChanged, &hub, &SyncHub::publishLevels);
    QObject::connect(&sequencer, &Sequencer::registerCompleted, &sequencer, [&checkpoint](const SnapshotPtr& snapshot) {
        QString problem;
        if (!checkpoint.write(*snapshot, &problem))
            qWarning() << "checkpoint" << "failed:" << problem;
    });

    // A remote shutdown replies first, then leaves the event loop.
    QObject::connect(&sequencer, &Sequencer::shutdownRequested, &app, &QCoreApplication::quit, Qt::QueuedConnection);

    // Accepted settings and microphone layouts survive a restart.
    RecordingSettings savedSettings = state.snapshot()->settings;
    std::vector<MicrophoneChannel> savedMicrophones = state.snapshot()->microphones;
    QObject::connect(&sequencer, &Sequencer::committed, &sequencer, [&](const SnapshotPtr& snapshot) {
        if (snapshot->settings == savedSettings && snapshot->microphones == savedMicrophones)
            return;
        savedSettings = snapshot->settings;
        savedMicrophones = snapshot->microphones;
        QString problem;
        if (!RecorderConfig::saveSettings(options.configDir, savedSettings, savedMicrophones, &problem))
            qWarning() << "config" << "could not persist settings:" << problem;
    });

    RemoteControlServer server(hub, *capture);
    if (!server.listen(QHostAddress(options.host), options.port))
        return 1;
    qInfo().noquote() << "startup" << "remote control at" << server.remoteUrl();
    SessionLogger::instance().logf("startup", "remote control at %s", qPrintable(server.remoteUrl()));

    submitStartupSelection(hub, options);

    const int rc = app.exec();
    server.close();
    SessionLogger::instance().log("shutdown", "event loop finished");
    SessionLogger::instance().flush();
    return rc;
}
