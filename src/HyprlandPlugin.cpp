// Clipfolio - Hyprland plugin entry point
// LIGHTWEIGHT: no GTK, no threads. The UI runs as a separate process and is
// reached through its control socket or by exec'ing `clipfolio --<cmd>`.

#define WLR_USE_UNSTABLE
#include <hyprland/src/plugins/PluginAPI.hpp>
#include <hyprland/src/Compositor.hpp>

#include "clipfolio/AppContext.hpp"
#include "clipfolio/Config.hpp"
#include "clipfolio/ConfigParser.hpp"
#include "clipfolio/ControlSocket.hpp"
#include "clipfolio/Process.hpp"

using namespace clipfolio;

inline HANDLE g_pHandle = nullptr;
static Config g_config;

// Never block the compositor for long
static constexpr int SOCKET_TIMEOUT_SEC = 1;

// ============================================================================
// Forwarding
// ============================================================================

// The spawned client forwards to the running instance or starts one
static void sendAppCommand(const std::vector<std::string>& args) {
    Argv argv = {"clipfolio"};
    argv.insert(argv.end(), args.begin(), args.end());
    spawnDetached(argv);
}

// ============================================================================
// IPC Command Handler (hyprctl clipfolio <command> [json])
// ============================================================================

static std::string cmdClipfolio(eHyprCtlOutputFormat, std::string request) {
    // hyprctl passes the full request including our command name
    const std::string prefix = "clipfolio";
    if (request.rfind(prefix, 0) == 0) request.erase(0, prefix.size());
    while (!request.empty() && request.front() == ' ') request.erase(0, 1);

    if (request.empty()) return "usage: hyprctl clipfolio <command> [json args]";

    auto reply = sendControlLine(g_config.socketPath, request, SOCKET_TIMEOUT_SEC);
    return reply ? *reply : "error: clipfolio is not running";
}

// ============================================================================
// Dispatchers
// ============================================================================

static SDispatchResult dispatchShow(std::string) {
    sendAppCommand({"--show"});
    return {.success = true};
}

static SDispatchResult dispatchHide(std::string) {
    sendAppCommand({"--hide"});
    return {.success = true};
}

static SDispatchResult dispatchToggle(std::string) {
    sendAppCommand({"--toggle"});
    return {.success = true};
}

// clipfolio:shortcut <accelerator>, bound by the global-shortcut plugin
static SDispatchResult dispatchShortcut(std::string accelerator) {
    if (accelerator.empty()) return {.success = false, .error = "missing accelerator"};
    sendAppCommand({"--shortcut", accelerator});
    return {.success = true};
}

// ============================================================================
// Plugin Lifecycle
// ============================================================================

APICALL EXPORT std::string PLUGIN_API_VERSION() {
    return HYPRLAND_API_VERSION;
}

APICALL EXPORT PLUGIN_DESCRIPTION_INFO PLUGIN_INIT(HANDLE handle) {
    g_pHandle = handle;
    g_config = loadConfig();

    HyprlandAPI::registerHyprCtlCommand(handle,
        SHyprCtlCommand{"clipfolio", false, cmdClipfolio});

    HyprlandAPI::addDispatcherV2(handle, "clipfolio:show", dispatchShow);
    HyprlandAPI::addDispatcherV2(handle, "clipfolio:hide", dispatchHide);
    HyprlandAPI::addDispatcherV2(handle, "clipfolio:toggle", dispatchToggle);
    HyprlandAPI::addDispatcherV2(handle, "clipfolio:shortcut", dispatchShortcut);

    HyprlandAPI::addNotification(handle,
        "[Clipfolio] Loaded successfully!",
        CHyprColor(0.2f, 0.8f, 0.2f, 1.0f),
        5000);

    return {
        "clipfolio",
        "Clipboard history and snippet organizer bridge",
        "Clipfolio",
        CLIPFOLIO_VERSION
    };
}

APICALL EXPORT void PLUGIN_EXIT() {
    HyprlandAPI::addNotification(g_pHandle,
        "[Clipfolio] Unloaded",
        CHyprColor(0.8f, 0.8f, 0.2f, 1.0f),
        3000);
}
