#include "clipfolio/ClipboardMonitor.hpp"
#include "clipfolio/ClipboardBackend.hpp"
#include "clipfolio/ContentDetector.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/ImageStore.hpp"
#include <spdlog/spdlog.h>

namespace clipfolio {

static constexpr size_t FINGERPRINT_EDGE = 64;

ClipboardMonitor::ClipboardMonitor(std::shared_ptr<ClipboardBackend> backend, ImageStore& images,
                                   Sink sink, std::chrono::milliseconds interval)
    : m_backend(std::move(backend))
    , m_images(images)
    , m_sink(std::move(sink))
    , m_interval(interval) {
}

ClipboardMonitor::~ClipboardMonitor() {
    stop();
}

void ClipboardMonitor::start() {
    if (m_thread.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = false;
    }
    m_thread = std::thread([this] { run(); });
    spdlog::info("[Monitor] Polling clipboard every {} ms", m_interval.count());
}

void ClipboardMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
        spdlog::debug("[Monitor] Stopped");
    }
}

void ClipboardMonitor::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping) {
        lock.unlock();
        try {
            poll();
        } catch (const std::exception& e) {
            spdlog::error("[Monitor] Poll failed: {}", e.what());
        }
        lock.lock();
        m_cv.wait_for(lock, m_interval, [this] { return m_stopping; });
    }
}

std::string ClipboardMonitor::fingerprint(const std::string& bytes) {
    std::string fp = std::to_string(bytes.size()) + ":";
    if (bytes.size() <= FINGERPRINT_EDGE * 2) {
        fp += bytes;
    } else {
        fp.append(bytes, 0, FINGERPRINT_EDGE);
        fp.append(bytes, bytes.size() - FINGERPRINT_EDGE, FINGERPRINT_EDGE);
    }
    return fp;
}

bool ClipboardMonitor::poll() {
    auto text = m_backend->readText();
    if (text && !trimCopy(*text).empty() && *text != m_lastText) {
        m_lastText = *text;
        m_sink(ClipboardContent::text(*text));
        return true;
    }

    auto image = m_backend->readImage();
    if (!image || image->empty()) return false;

    std::string fp = fingerprint(*image);
    if (fp == m_lastImageFingerprint) return false;
    m_lastImageFingerprint = fp;

    try {
        std::string fileName = m_images.save(*image);
        m_sink(ClipboardContent::image(fileName));
        return true;
    } catch (const StorageError& e) {
        spdlog::error("[Monitor] Could not save clipboard image: {}", e.what());
        return false;
    }
}

} // namespace clipfolio
