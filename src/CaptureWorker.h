#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

// One background thread that runs blocking capture jobs in submission order.
class CaptureWorker {
public:
    CaptureWorker();
    ~CaptureWorker();

    CaptureWorker(const CaptureWorker&) = delete;
    CaptureWorker& operator=(const CaptureWorker&) = delete;

    void post(std::function<void()> job);

private:
    void workerLoop();

    std::mutex m_queueMutex;
    std::condition_variable m_cv;
    std::deque<std::function<void()>> m_jobs;
    bool m_running {true};
    std::thread m_worker;
};
