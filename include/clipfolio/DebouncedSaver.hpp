#pragma once
// Single Responsibility: coalesce bursts of writes into one save per key

#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace clipfolio {

class DebouncedSaver {
public:
    using SaveFn = std::function<void(const std::string& key, const nlohmann::json& data)>;

    DebouncedSaver(SaveFn save, std::chrono::milliseconds delay);
    ~DebouncedSaver();   // flushes pending writes

    DebouncedSaver(const DebouncedSaver&) = delete;
    DebouncedSaver& operator=(const DebouncedSaver&) = delete;

    // Replaces any pending data for key and restarts the quiet period
    void schedule(const std::string& key, nlohmann::json data);

    // Writes everything pending now, on the calling thread
    void flush();

    size_t pendingCount() const;

private:
    void workerLoop();
    void writeAll(std::map<std::string, nlohmann::json> batch);

    SaveFn m_save;
    std::chrono::milliseconds m_delay;

    std::mutex m_writeMutex;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, nlohmann::json> m_pending;
    std::chrono::steady_clock::time_point m_deadline;
    bool m_stopping = false;
    std::thread m_worker;
};

} // namespace clipfolio
