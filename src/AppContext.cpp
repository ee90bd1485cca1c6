#include "clipfolio/AppContext.hpp"
#include "clipfolio/Config.hpp"
#include "clipfolio/ConfigParser.hpp"
#include "clipfolio/Errors.hpp"
#include <algorithm>

namespace clipfolio {

AppContext generateContext(const Config& config) {
    AppContext context;
    context.window.width = config.windowWidth;
    context.window.height = config.windowHeight;
    context.window.alwaysOnTop = config.alwaysOnTop;

    context.permissions = parseCapabilityList(config.capabilities);
    context.dataDir = config.dataDir.empty() ? getDataDir() : config.dataDir;
    context.socketPath = config.socketPath;

    context.maxHistoryItems = config.maxHistoryItems;
    context.clipboardPollMs = std::max(config.clipboardPollMs, 100);
    context.saveDebounceMs = std::max(config.saveDebounceMs, 0);
    context.monitorClipboard = config.monitorClipboard;
    context.toggleShortcut = config.toggleShortcut;
    context.compositorPlugin = config.compositorPlugin;
    return context;
}

void validateContext(const AppContext& context) {
    if (context.identifier.empty()) {
        throw StartupError("application identifier is empty");
    }
    if (context.window.width <= 0 || context.window.height <= 0) {
        throw StartupError("invalid window size " + std::to_string(context.window.width) + "x" +
                           std::to_string(context.window.height));
    }
    if (context.dataDir.empty()) {
        throw StartupError("data directory is not set");
    }
    if (context.maxHistoryItems <= 0) {
        throw StartupError("max_history_items must be positive");
    }
}

} // namespace clipfolio
