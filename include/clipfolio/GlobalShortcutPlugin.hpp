#pragma once
// Single Responsibility: global_shortcut:* commands (desktop targets only)

#include "Plugin.hpp"
#include "Shortcut.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>

namespace clipfolio {

class GlobalShortcutPlugin : public Plugin {
public:
    explicit GlobalShortcutPlugin(std::shared_ptr<ShortcutBinder> binder);

    std::string name() const override { return "global-shortcut"; }
    Capability capability() const override { return Capability::GlobalShortcut; }

    void setup(PluginHost& host) override;
    void shutdown() override;

    // Throws CommandError for a bad accelerator, a duplicate or a failed bind
    void registerShortcut(const std::string& shortcut, const std::string& action);
    bool unregisterShortcut(const std::string& shortcut);
    void unregisterAll();
    bool isRegistered(const std::string& shortcut) const;

    // Runs the action bound to shortcut through the router
    nlohmann::json trigger(const std::string& shortcut);

private:
    struct Registration {
        Accelerator accelerator;
        std::string action;
    };

    std::shared_ptr<ShortcutBinder> m_binder;
    CommandRouter* m_router = nullptr;
    std::map<std::string, Registration> m_registered; // keyed by canonical form
};

} // namespace clipfolio
