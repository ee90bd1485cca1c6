#include "clipfolio/DebouncedSaver.hpp"
#include <spdlog/spdlog.h>

namespace clipfolio {

DebouncedSaver::DebouncedSaver(SaveFn save, std::chrono::milliseconds delay)
    : m_save(std::move(save)), m_delay(delay) {
    m_worker = std::thread([this] { workerLoop(); });
}

DebouncedSaver::~DebouncedSaver() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();
    if (m_worker.joinable()) m_worker.join();
    flush();
}

void DebouncedSaver::schedule(const std::string& key, nlohmann::json data) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending[key] = std::move(data);
        m_deadline = std::chrono::steady_clock::now() + m_delay;
    }
    m_cv.notify_all();
}

void DebouncedSaver::flush() {
    // Writers are serialized so an older batch never lands after a newer one
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    std::map<std::string, nlohmann::json> batch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        batch.swap(m_pending);
    }
    writeAll(std::move(batch));
}

size_t DebouncedSaver::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

void DebouncedSaver::workerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping) {
        if (m_pending.empty()) {
            m_cv.wait(lock, [this] { return m_stopping || !m_pending.empty(); });
            continue;
        }
        // Deadline moves forward while writes keep arriving
        if (m_cv.wait_until(lock, m_deadline, [this] { return m_stopping; })) break;
        if (std::chrono::steady_clock::now() < m_deadline) continue;

        lock.unlock();
        flush();
        lock.lock();
    }
}

void DebouncedSaver::writeAll(std::map<std::string, nlohmann::json> batch) {
    for (auto& [key, data] : batch) {
        try {
            m_save(key, data);
        } catch (const std::exception& e) {
            spdlog::error("[DebouncedSaver] Failed to save {}: {}", key, e.what());
        }
    }
}

} // namespace clipfolio
