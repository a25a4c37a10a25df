#include "SessionLogger.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace {
std::string localTime(const char* pattern) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

std::string envValue(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::string();
}

// A recording day produces one log per service start; keep the newest few.
void pruneSessionLogs(const std::filesystem::path& dir, std::size_t keep) {
    namespace fs = std::filesystem;
    std::vector<fs::path> logs;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind("session-", 0) == 0 && it->path().extension() == ".log")
            logs.push_back(it->path());
    }
    if (logs.size() <= keep)
        return;
    // Timestamped names sort chronologically.
    std::sort(logs.begin(), logs.end());
    for (std::size_t i = 0; i + keep < logs.size(); ++i)
        fs::remove(logs[i], ec);
}
} // namespace

SessionLogger& SessionLogger::instance() {
    static SessionLogger g_logger;
    return g_logger;
}

std::string SessionLogger::resolveLogDirectory() {
    namespace fs = std::filesystem;
    if (auto dir = envValue("ORGANREC_LOG_DIR"); !dir.empty())
        return dir;
    if (auto state = envValue("XDG_STATE_HOME"); !state.empty())
        return (fs::path(state) / "OrganRec" / "logs").string();
    std::error_code ec;
    const auto cwd = fs::current_path(ec);
    return ec ? std::string() : (cwd / "logs").string();
}

SessionLogger::SessionLogger() {
    namespace fs = std::filesystem;
    const std::string dir = resolveLogDirectory();
    if (dir.empty())
        return;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        return;
    pruneSessionLogs(dir, kKeptSessionLogs - 1);

    const fs::path path = fs::path(dir) / ("session-" + localTime("%Y%m%d-%H%M%S") + ".log");
    m_stream.open(path, std::ios::out | std::ios::trunc);
    if (!m_stream.is_open())
        return;
    m_logPath = path.string();

    m_stream << "# OrganRec session log\n"
             << "# Started at " << localTime("%Y-%m-%d %H:%M:%S") << "\n";
    m_stream.flush();

    m_started = std::chrono::steady_clock::now();
    m_running = true;
    m_worker = std::thread(&SessionLogger::workerLoop, this);
    m_ready = true;
}

SessionLogger::~SessionLogger() {
    if (m_ready) {
        {
            std::lock_guard<std::mutex> guard(m_queueMutex);
            m_running = false;
        }
        m_cv.notify_all();
        if (m_worker.joinable())
            m_worker.join();
    }
    if (m_stream.is_open()) {
        m_stream << "# Session closed at " << localTime("%Y-%m-%d %H:%M:%S") << "\n";
        m_stream.flush();
    }
}

void SessionLogger::log(const std::string& component, const std::string& message) {
    if (m_ready)
        enqueue(composeLine(component, message));
}

void SessionLogger::log(const std::string& component, const QString& message) {
    if (m_ready)
        enqueue(composeLine(component, message.toStdString()));
}

void SessionLogger::logf(const std::string& component, const char* fmt, ...) {
    if (!m_ready || !fmt)
        return;
    va_list args;
    va_start(args, fmt);
    const std::string formatted = formatString(fmt, args);
    va_end(args);
    enqueue(composeLine(component, formatted));
}

void SessionLogger::flush() {
    if (!m_ready)
        return;
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_drained.wait(lock, [this]() { return m_pending.empty() && !m_writing; });
}

void SessionLogger::enqueue(std::string line) {
    {
        std::lock_guard<std::mutex> guard(m_queueMutex);
        m_pending.emplace_back(std::move(line));
    }
    m_cv.notify_one();
}

void SessionLogger::workerLoop() {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    while (m_running || !m_pending.empty()) {
        if (m_pending.empty()) {
            m_cv.wait(lock, [this]() { return !m_running || !m_pending.empty(); });
            continue;
        }
        std::deque<std::string> batch;
        batch.swap(m_pending);
        m_writing = true;
        lock.unlock();
        for (const auto& line : batch)
            m_stream << line << '\n';
        m_stream.flush();
        lock.lock();
        m_writing = false;
        if (m_pending.empty())
            m_drained.notify_all();
    }
    m_drained.notify_all();
}

std::string SessionLogger::composeLine(const std::string& component, const std::string& message) const {
    // Wall clock for the archive, session offset for lining lines up with takes.
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_started).count();
    char offset[32];
    std::snprintf(offset, sizeof(offset), " +%lld.%03llds ",
                  static_cast<long long>(elapsed / 1000), static_cast<long long>(elapsed % 1000));
    std::string line = localTime("%Y-%m-%d %H:%M:%S");
    line += offset;
    if (!component.empty())
        line += '[' + component + "] ";
    line += message;
    return line;
}

std::string SessionLogger::formatString(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed <= 0)
        return {};
    std::string buffer(static_cast<std::size_t>(needed) + 1, '\0');
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    buffer.resize(static_cast<std::size_t>(needed));
    return buffer;
}
