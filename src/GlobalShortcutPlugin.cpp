#include "clipfolio/GlobalShortcutPlugin.hpp"
#include "clipfolio/AppContext.hpp"
#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/Errors.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace clipfolio {

static Accelerator parseOrThrow(const std::string& shortcut) {
    auto accel = parseAccelerator(shortcut);
    if (!accel) throw CommandError("invalid shortcut '" + shortcut + "'");
    return *accel;
}

GlobalShortcutPlugin::GlobalShortcutPlugin(std::shared_ptr<ShortcutBinder> binder)
    : m_binder(std::move(binder)) {
}

void GlobalShortcutPlugin::setup(PluginHost& host) {
    if (!m_binder) throw StartupError("global-shortcut plugin has no binder");
    m_router = &host.router;
    constexpr Capability cap = Capability::GlobalShortcut;

    // {shortcut, action}
    host.router.registerCommand("global_shortcut:register", [this](const json& args) -> json {
        registerShortcut(requireString(args, "shortcut"), requireString(args, "action"));
        return true;
    }, cap);

    host.router.registerCommand("global_shortcut:unregister", [this](const json& args) -> json {
        return unregisterShortcut(requireString(args, "shortcut"));
    }, cap);

    host.router.registerCommand("global_shortcut:unregister_all", [this](const json&) -> json {
        unregisterAll();
        return true;
    }, cap);

    host.router.registerCommand("global_shortcut:is_registered", [this](const json& args) -> json {
        return isRegistered(requireString(args, "shortcut"));
    }, cap);

    host.router.registerCommand("global_shortcut:trigger", [this](const json& args) -> json {
        return trigger(requireString(args, "shortcut"));
    }, cap);

    const std::string& toggle = host.context.toggleShortcut;
    if (toggle.empty() || !host.router.isPermitted(cap)) return;

    try {
        registerShortcut(toggle, "app:toggle");
    } catch (const CommandError& e) {
        spdlog::warn("[Shortcut] Toggle shortcut not available: {}", e.what());
    }
}

void GlobalShortcutPlugin::shutdown() {
    unregisterAll();
    m_router = nullptr;
}

void GlobalShortcutPlugin::registerShortcut(const std::string& shortcut, const std::string& action) {
    Accelerator accel = parseOrThrow(shortcut);
    std::string key = accel.toString();

    if (action.empty() || action.rfind("global_shortcut:", 0) == 0) {
        throw CommandError("invalid shortcut action '" + action + "'");
    }
    if (m_registered.count(key)) {
        throw CommandError("shortcut " + key + " is already registered");
    }
    if (!m_binder->bind(accel)) {
        throw CommandError("could not bind " + key);
    }

    m_registered[key] = Registration{accel, action};
    spdlog::info("[Shortcut] {} -> {}", key, action);
}

bool GlobalShortcutPlugin::unregisterShortcut(const std::string& shortcut) {
    std::string key = parseOrThrow(shortcut).toString();
    auto it = m_registered.find(key);
    if (it == m_registered.end()) return false;

    m_binder->unbind(it->second.accelerator);
    m_registered.erase(it);
    return true;
}

void GlobalShortcutPlugin::unregisterAll() {
    for (const auto& [key, reg] : m_registered) {
        m_binder->unbind(reg.accelerator);
    }
    if (!m_registered.empty()) spdlog::debug("[Shortcut] Released {} bindings", m_registered.size());
    m_registered.clear();
}

bool GlobalShortcutPlugin::isRegistered(const std::string& shortcut) const {
    auto accel = parseAccelerator(shortcut);
    return accel && m_registered.count(accel->toString()) > 0;
}

json GlobalShortcutPlugin::trigger(const std::string& shortcut) {
    std::string key = parseOrThrow(shortcut).toString();
    auto it = m_registered.find(key);
    if (it == m_registered.end()) {
        throw CommandError("shortcut " + key + " is not registered");
    }
    if (!m_router) throw CommandError("global-shortcut plugin is not running");

    spdlog::debug("[Shortcut] Triggered {}", key);
    return m_router->invoke(it->second.action);
}

} // namespace clipfolio
