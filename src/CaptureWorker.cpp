#include "CaptureWorker.h"

CaptureWorker::CaptureWorker() {
    m_worker = std::thread(&CaptureWorker::workerLoop, this);
}

CaptureWorker::~CaptureWorker() {
    {
        std::lock_guard<std::mutex> guard(m_queueMutex);
        m_running = false;
    }
    m_cv.notify_all();
    if (m_worker.joinable())
        m_worker.join();
}

void CaptureWorker::post(std::function<void()> job) {
    if (!job)
        return;
    {
        std::lock_guard<std::mutex> guard(m_queueMutex);
        m_jobs.emplace_back(std::move(job));
    }
    m_cv.notify_one();
}

void CaptureWorker::workerLoop() {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    // Jobs queued before shutdown still run so a take in progress gets finalized.
    while (m_running || !m_jobs.empty()) {
        if (m_jobs.empty()) {
            m_cv.wait(lock, [this]() { return !m_running || !m_jobs.empty(); });
            continue;
        }
        auto job = std::move(m_jobs.front());
        m_jobs.pop_front();
        lock.unlock();
        job();
        lock.lock();
    }
}
