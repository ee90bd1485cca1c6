#pragma once
// Single Responsibility: opener:* commands (URLs and local paths)

#include "Plugin.hpp"
#include <memory>
#include <string>

namespace clipfolio {

class UrlLauncher {
public:
    virtual ~UrlLauncher() = default;
    // Hands target to the desktop's default handler; false if that failed
    virtual bool open(const std::string& target) = 0;
};

class XdgOpenLauncher : public UrlLauncher {
public:
    bool open(const std::string& target) override;
};

class OpenerPlugin : public Plugin {
public:
    explicit OpenerPlugin(std::shared_ptr<UrlLauncher> launcher);

    std::string name() const override { return "opener"; }
    Capability capability() const override { return Capability::Opener; }

    void setup(PluginHost& host) override;

private:
    std::shared_ptr<UrlLauncher> m_launcher;
};

} // namespace clipfolio
