#pragma once

#include <QString>

#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

// Append-only session journal. Lines are queued by any thread and written by a
// background thread, so callers on the event loop never wait on the disk.
class SessionLogger {
public:
    static SessionLogger& instance();

    void log(const std::string& component, const std::string& message);
    void log(const std::string& component, const QString& message);
    void log(const std::string& component, const char* message) { log(component, std::string(message ? message : "")); }
    void logf(const std::string& component, const char* fmt, ...);

    // Blocks until every queued line has reached the file.
    void flush();

    [[nodiscard]] bool enabled() const { return m_ready; }
    [[nodiscard]] const std::string& logFilePath() const { return m_logPath; }

    static std::string resolveLogDirectory();

    static constexpr std::size_t kKeptSessionLogs = 20;

private:
    SessionLogger();
    ~SessionLogger();

    SessionLogger(const SessionLogger&) = delete;
    SessionLogger& operator=(const SessionLogger&) = delete;

    void enqueue(std::string line);
    void workerLoop();
    std::string composeLine(const std::string& component, const std::string& message) const;
    static std::string formatString(const char* fmt, va_list args);

    std::string m_logPath;
    std::chrono::steady_clock::time_point m_started {std::chrono::steady_clock::now()};
    bool m_ready {false};
    std::ofstream m_stream;
    std::mutex m_queueMutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    std::deque<std::string> m_pending;
    bool m_writing {false};
    bool m_running {false};
    std::thread m_worker;
};
