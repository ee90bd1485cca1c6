#pragma once
// Single Responsibility: clipboard:* commands and the clipboard monitor

#include "ClipboardBackend.hpp"
#include "Plugin.hpp"
#include <memory>

namespace clipfolio {

class ClipboardPlugin : public Plugin {
public:
    explicit ClipboardPlugin(std::shared_ptr<ClipboardBackend> backend);
    ~ClipboardPlugin() override;

    std::string name() const override { return "clipboard"; }
    Capability capability() const override { return Capability::Clipboard; }

    void setup(PluginHost& host) override;
    void shutdown() override;

    bool isMonitoring() const;

private:
    std::shared_ptr<ClipboardBackend> m_backend;
    std::unique_ptr<ClipboardMonitor> m_monitor;
};

} // namespace clipfolio
