// Clipfolio - standalone GTK4 process
// Without a running instance this starts the app; otherwise command flags are
// forwarded to the running instance through the control socket.

#include "clipfolio/AppBuilder.hpp"
#include "clipfolio/AppContext.hpp"
#include "clipfolio/AppStore.hpp"
#include "clipfolio/Backup.hpp"
#include "clipfolio/ConfigParser.hpp"
#include "clipfolio/ControlSocket.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/GtkRuntime.hpp"
#include "clipfolio/KeyValueStorage.hpp"
#include "clipfolio/Logging.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

using namespace clipfolio;
using json = nlohmann::json;

static void printUsage() {
    std::printf(
        "Usage: clipfolio [options]\n"
        "  --toggle | --show | --hide | --quit   control a running instance\n"
        "  --shortcut ACCEL                      trigger a registered global shortcut\n"
        "  --export PATH                         write a backup\n"
        "  --import PATH                         restore a backup\n"
        "  --config PATH                         use another config file\n"
        "  --verbose                             debug logging\n"
        "  --version\n");
}

// ============================================================================
// Forward to a running instance (returns exit code, or -1 if none answered)
// ============================================================================

static int forwardToInstance(const std::string& socketPath, const std::string& line) {
    auto reply = sendControlLine(socketPath, line);
    if (!reply) return -1;

    try {
        json doc = json::parse(*reply);
        if (doc.value("status", "") == "error") {
            std::fprintf(stderr, "clipfolio: %s\n", doc.value("message", "").c_str());
            return 1;
        }
        if (doc.contains("data") && !doc["data"].is_null()) {
            std::printf("%s\n", doc["data"].dump().c_str());
        }
    } catch (const json::parse_error&) {
        std::printf("%s\n", reply->c_str());
    }
    return 0;
}

// Backup without a window when no instance is running
static int runHeadlessBackup(const Config& config, bool isExport, const std::string& path) {
    try {
        AppContext context = generateContext(config);
        KeyValueStorage storage(context.dataDir);
        AppStore store(&storage, StoreOptions{.maxHistoryItems = context.maxHistoryItems});
        store.load();

        if (isExport) {
            writeBackupFile(store, path);
        } else {
            readBackupFile(store, path);
            store.flush();
        }
        return 0;
    } catch (const Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    std::string line;
    std::string configPath;
    std::string backupPath;
    bool isExport = false;
    bool verbose = false;
    bool showOnStart = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "clipfolio: %s needs a value\n", arg.c_str());
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "--toggle" || arg == "toggle") { line = "app:toggle"; showOnStart = true; }
        else if (arg == "--show" || arg == "show") { line = "app:show"; showOnStart = true; }
        else if (arg == "--hide" || arg == "hide") line = "app:hide";
        else if (arg == "--quit") line = "app:quit";
        else if (arg == "--shortcut") {
            line = "global_shortcut:trigger " + json{{"shortcut", next()}}.dump();
            showOnStart = true;
        }
        else if (arg == "--export") { backupPath = next(); isExport = true; }
        else if (arg == "--import") { backupPath = next(); isExport = false; }
        else if (arg == "--config") configPath = next();
        else if (arg == "--verbose" || arg == "-v") verbose = true;
        else if (arg == "--version") { std::printf("clipfolio %s\n", CLIPFOLIO_VERSION); return 0; }
        else if (arg == "--help" || arg == "-h") { printUsage(); return 0; }
        else {
            std::fprintf(stderr, "clipfolio: unknown option %s\n", arg.c_str());
            printUsage();
            return 2;
        }
    }

    Config config = configPath.empty() ? loadConfig() : loadConfig(configPath);
    initLogging(verbose ? "debug" : config.logLevel, config.dataDir + "/clipfolio.log");

    // First run: leave an editable config with the defaults behind
    std::error_code configEc;
    if (!std::filesystem::exists(config.configPath, configEc) && !configEc) {
        if (saveConfig(config)) spdlog::info("[Config] Wrote defaults to {}", config.configPath);
    }

    if (!backupPath.empty()) {
        // The running instance may have another working directory
        std::error_code ec;
        auto absolute = std::filesystem::absolute(backupPath, ec);
        if (!ec) backupPath = absolute.string();

        std::string cmd = isExport ? "backup:export" : "backup:import";
        int rc = forwardToInstance(config.socketPath, cmd + " " + json{{"path", backupPath}}.dump());
        return rc >= 0 ? rc : runHeadlessBackup(config, isExport, backupPath);
    }

    // If we have a command, try sending to existing instance first
    if (!line.empty()) {
        int rc = forwardToInstance(config.socketPath, line);
        if (rc >= 0) return rc;
        if (line == "app:hide" || line == "app:quit") return 0;  // nothing running
        // No running instance → start one (shown when asked)
    } else if (sendControlLine(config.socketPath, "app:show")) {
        return 0;
    }

    AppContext context = generateContext(config);
    AppBuilder builder = makeBuilder<kTargetPlatform>(defaultServices(context));
    GtkRuntime runtime(showOnStart);
    runOrExit(builder, context, runtime);
    return 0;
}
