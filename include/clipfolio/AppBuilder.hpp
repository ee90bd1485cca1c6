#pragma once
// Single Responsibility: assemble plugins and hand control to the runtime

#include "ClipboardBackend.hpp"
#include "ClipboardPlugin.hpp"
#include "FsPlugin.hpp"
#include "GlobalShortcutPlugin.hpp"
#include "OpenerPlugin.hpp"
#include "Platform.hpp"
#include "Plugin.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace clipfolio {

// Native services the plugins are built on
struct PlatformServices {
    std::shared_ptr<ClipboardBackend> clipboard;
    std::shared_ptr<UrlLauncher> launcher;
    std::shared_ptr<ShortcutBinder> shortcuts;
};

// wl-clipboard, xdg-open and hyprctl
PlatformServices defaultServices(const AppContext& context);

class AppBuilder {
public:
    AppBuilder() = default;
    AppBuilder(AppBuilder&&) = default;
    AppBuilder& operator=(AppBuilder&&) = default;

    // A second plugin for an already registered capability is ignored
    AppBuilder& plugin(std::unique_ptr<Plugin> plugin);

    std::set<Capability> capabilities() const;
    bool hasCapability(Capability capability) const;
    std::vector<std::string> pluginNames() const;

    // Opens storage, sets up plugins, starts the runtime and blocks in its
    // event loop. Failures before the loop starts throw StartupError.
    void run(const AppContext& context, Runtime& runtime);

private:
    void shutdownPlugins(size_t count);

    std::vector<std::unique_ptr<Plugin>> m_plugins;
};

// Clipboard, opener and filesystem everywhere; global shortcuts on desktop only
template <TargetPlatform Target>
AppBuilder makeBuilder(const PlatformServices& services) {
    AppBuilder builder;
    builder.plugin(std::make_unique<ClipboardPlugin>(services.clipboard))
        .plugin(std::make_unique<OpenerPlugin>(services.launcher))
        .plugin(std::make_unique<FsPlugin>());

    if constexpr (!isMobile(Target)) {
        builder.plugin(std::make_unique<GlobalShortcutPlugin>(services.shortcuts));
    }
    return builder;
}

// Logs "error while running application: <reason>" and exits with status 1
// on any failure.
void runOrExit(AppBuilder& builder, const AppContext& context, Runtime& runtime);

} // namespace clipfolio
