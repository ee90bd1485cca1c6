#include "clipfolio/AppBuilder.hpp"
#include "clipfolio/AppContext.hpp"
#include "clipfolio/AppStore.hpp"
#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/CoreCommands.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/ImageStore.hpp"
#include "clipfolio/KeyValueStorage.hpp"
#include "clipfolio/Runtime.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace clipfolio {

PlatformServices defaultServices(const AppContext& context) {
    return PlatformServices{
        .clipboard = std::make_shared<WlClipboard>(),
        .launcher = std::make_shared<XdgOpenLauncher>(),
        .shortcuts = std::make_shared<HyprctlBinder>(context.compositorPlugin),
    };
}

// ============================================================================
// Plugin registration
// ============================================================================

AppBuilder& AppBuilder::plugin(std::unique_ptr<Plugin> plugin) {
    if (!plugin) return *this;

    if (hasCapability(plugin->capability())) {
        spdlog::warn("[App] Capability {} already provided, ignoring plugin {}",
                     capabilityName(plugin->capability()), plugin->name());
        return *this;
    }
    m_plugins.push_back(std::move(plugin));
    return *this;
}

std::set<Capability> AppBuilder::capabilities() const {
    std::set<Capability> caps;
    for (const auto& p : m_plugins) caps.insert(p->capability());
    return caps;
}

bool AppBuilder::hasCapability(Capability capability) const {
    for (const auto& p : m_plugins) {
        if (p->capability() == capability) return true;
    }
    return false;
}

std::vector<std::string> AppBuilder::pluginNames() const {
    std::vector<std::string> names;
    for (const auto& p : m_plugins) names.push_back(p->name());
    return names;
}

void AppBuilder::shutdownPlugins(size_t count) {
    for (size_t i = count; i-- > 0;) {
        try {
            m_plugins[i]->shutdown();
        } catch (const std::exception& e) {
            spdlog::error("[App] Plugin {} failed to shut down: {}", m_plugins[i]->name(), e.what());
        }
    }
}

// ============================================================================
// Run
// ============================================================================

void AppBuilder::run(const AppContext& context, Runtime& runtime) {
    validateContext(context);
    spdlog::info("[App] Starting {} {} ({})", context.productName, context.version,
                 platformName(kTargetPlatform));

    std::unique_ptr<KeyValueStorage> storage;
    std::unique_ptr<ImageStore> images;
    try {
        storage = std::make_unique<KeyValueStorage>(context.dataDir);
        images = std::make_unique<ImageStore>(context.dataDir / "images");
    } catch (const StorageError& e) {
        throw StartupError(std::string("cannot open storage: ") + e.what());
    }

    AppStore store(storage.get(), StoreOptions{
        .maxHistoryItems = context.maxHistoryItems,
        .saveDebounce = std::chrono::milliseconds(context.saveDebounceMs),
    });
    store.load();

    CommandRouter router(context.permissions);
    registerCoreCommands(router, store, context.dataDir);

    PluginHost host{router, *storage, store, *images, context, runtime};

    size_t ready = 0;
    for (; ready < m_plugins.size(); ++ready) {
        Plugin& p = *m_plugins[ready];
        try {
            p.setup(host);
            spdlog::debug("[App] Plugin {} ready", p.name());
        } catch (const std::exception& e) {
            shutdownPlugins(ready);
            throw StartupError("plugin " + p.name() + " failed to start: " + e.what());
        }
    }

    try {
        runtime.start(host);
    } catch (const StartupError&) {
        shutdownPlugins(ready);
        throw;
    } catch (const std::exception& e) {
        shutdownPlugins(ready);
        throw StartupError(std::string("cannot create window: ") + e.what());
    }

    try {
        runtime.run();
    } catch (const std::exception&) {
        shutdownPlugins(ready);
        store.flush();
        throw;
    }

    shutdownPlugins(ready);
    store.flush();
    spdlog::info("[App] Stopped");
}

void runOrExit(AppBuilder& builder, const AppContext& context, Runtime& runtime) {
    try {
        builder.run(context, runtime);
    } catch (const std::exception& e) {
        spdlog::critical("error while running application: {}", e.what());
        spdlog::default_logger()->flush();
        std::exit(EXIT_FAILURE);
    }
}

} // namespace clipfolio
