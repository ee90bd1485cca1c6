#include "clipfolio/ClipboardPlugin.hpp"
#include "clipfolio/AppContext.hpp"
#include "clipfolio/AppStore.hpp"
#include "clipfolio/Base64.hpp"
#include "clipfolio/ClipboardMonitor.hpp"
#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/ImageStore.hpp"
#include "clipfolio/Runtime.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace clipfolio {

ClipboardPlugin::ClipboardPlugin(std::shared_ptr<ClipboardBackend> backend)
    : m_backend(std::move(backend)) {
}

ClipboardPlugin::~ClipboardPlugin() = default;

void ClipboardPlugin::setup(PluginHost& host) {
    if (!m_backend) throw StartupError("clipboard plugin has no backend");

    auto backend = m_backend;
    ImageStore& images = host.images;
    constexpr Capability cap = Capability::Clipboard;

    host.router.registerCommand("clipboard:has_text", [backend](const json&) -> json {
        return backend->readText().has_value();
    }, cap);

    host.router.registerCommand("clipboard:read_text", [backend](const json&) -> json {
        auto text = backend->readText();
        if (!text) return nullptr;
        return *text;
    }, cap);

    host.router.registerCommand("clipboard:write_text", [backend](const json& args) -> json {
        if (!backend->writeText(requireString(args, "text")))
            throw CommandError("clipboard write failed");
        return true;
    }, cap);

    host.router.registerCommand("clipboard:has_image", [backend](const json&) -> json {
        return backend->readImage().has_value();
    }, cap);

    // Base64 PNG, or null
    host.router.registerCommand("clipboard:read_image", [backend](const json&) -> json {
        auto bytes = backend->readImage();
        if (!bytes) return nullptr;
        return base64Encode(*bytes);
    }, cap);

    // {image: base64 or data URI}
    host.router.registerCommand("clipboard:write_image", [backend](const json& args) -> json {
        auto bytes = base64Decode(requireString(args, "image"));
        if (!bytes || bytes->empty()) throw CommandError("image is not valid base64");
        if (!backend->writeImage(*bytes)) throw CommandError("clipboard write failed");
        return true;
    }, cap);

    // {name: file under <data>/images}
    host.router.registerCommand("clipboard:write_image_file",
                                [backend, &images](const json& args) -> json {
        std::string fileName = requireString(args, "name");
        auto bytes = images.load(fileName);
        if (!bytes) throw CommandError("image not found: " + fileName);
        if (!backend->writeImage(*bytes)) throw CommandError("clipboard write failed");
        return true;
    }, cap);

    if (!host.context.monitorClipboard || !host.router.isPermitted(cap)) {
        spdlog::info("[Clipboard] Monitoring disabled");
        return;
    }

    AppStore& store = host.store;
    Runtime& runtime = host.runtime;
    m_monitor = std::make_unique<ClipboardMonitor>(
        m_backend, images,
        [&store, &runtime](const ClipboardContent& content) {
            runtime.post([&store, content] { store.processClipboardContent(content); });
        },
        std::chrono::milliseconds(host.context.clipboardPollMs));
    m_monitor->start();
}

void ClipboardPlugin::shutdown() {
    if (m_monitor) {
        m_monitor->stop();
        m_monitor.reset();
    }
}

bool ClipboardPlugin::isMonitoring() const {
    return m_monitor && m_monitor->isRunning();
}

} // namespace clipfolio
