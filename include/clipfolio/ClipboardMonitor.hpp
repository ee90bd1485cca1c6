#pragma once
// Single Responsibility: detect new clipboard text/images by polling

#include "Forward.hpp"
#include "Model.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace clipfolio {

class ClipboardMonitor {
public:
    using Sink = std::function<void(const ClipboardContent&)>;

    ClipboardMonitor(std::shared_ptr<ClipboardBackend> backend, ImageStore& images,
                     Sink sink, std::chrono::milliseconds interval);
    ~ClipboardMonitor();

    ClipboardMonitor(const ClipboardMonitor&) = delete;
    ClipboardMonitor& operator=(const ClipboardMonitor&) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_thread.joinable(); }

    // One polling round; true when content was forwarded to the sink
    bool poll();

    // Size plus the first and last 64 bytes
    static std::string fingerprint(const std::string& bytes);

private:
    void run();

    std::shared_ptr<ClipboardBackend> m_backend;
    ImageStore& m_images;
    Sink m_sink;
    std::chrono::milliseconds m_interval;

    std::string m_lastText;
    std::string m_lastImageFingerprint;

    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopping = false;
};

} // namespace clipfolio
