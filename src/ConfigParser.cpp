// Single Responsibility: Configuration file parsing

#include "clipfolio/ConfigParser.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace clipfolio {

std::string getConfigPath() {
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    std::string configDir;

    if (xdgConfig && *xdgConfig) {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        configDir = home ? std::string(home) + "/.config" : "/tmp";
    }

    return configDir + "/clipfolio/clipfolio.toml";
}

static std::string defaultDataDir() {
    const char* xdgData = std::getenv("XDG_DATA_HOME");
    std::string dataDir;

    if (xdgData && *xdgData) {
        dataDir = xdgData;
    } else {
        const char* home = std::getenv("HOME");
        dataDir = home ? std::string(home) + "/.local/share" : "/tmp";
    }

    return dataDir + "/clipfolio";
}

static void ensureDirectory(const std::string& dataDir) {
    std::error_code ec;
    fs::create_directories(dataDir, ec);
    if (ec) {
        spdlog::warn("[Config] Cannot create data directory {}: {}", dataDir, ec.message());
    }
}

std::string getDataDir() {
    std::string dataDir = defaultDataDir();
    ensureDirectory(dataDir);
    return dataDir;
}

// Simple TOML-like parser (manual, no external dependency)
static std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    size_t end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

static std::string parseString(const std::string& value) {
    std::string v = trim(value);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

static void parseInt(const std::string& key, const std::string& value, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(trim(value), &used);
        if (used != trim(value).size()) throw std::invalid_argument("trailing characters");
        out = parsed;
    } catch (const std::exception&) {
        spdlog::warn("[Config] Invalid integer for {}: '{}', keeping {}", key, value, out);
    }
}

static bool parseBool(const std::string& value) {
    std::string v = trim(value);
    return v == "true" || v == "1";
}

Config loadConfig() {
    return loadConfig(getConfigPath());
}

Config loadConfig(const std::string& path) {
    Config config;
    config.configPath = path;
    config.dataDir = getDataDir();

    std::ifstream file(config.configPath);
    if (!file.is_open()) {
        // Return defaults if config doesn't exist
        return config;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments, empty lines and section headers
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "window_width") parseInt(key, value, config.windowWidth);
        else if (key == "window_height") parseInt(key, value, config.windowHeight);
        else if (key == "always_on_top") config.alwaysOnTop = parseBool(value);
        else if (key == "max_history_items") parseInt(key, value, config.maxHistoryItems);
        else if (key == "clipboard_poll_ms") parseInt(key, value, config.clipboardPollMs);
        else if (key == "save_debounce_ms") parseInt(key, value, config.saveDebounceMs);
        else if (key == "monitor_clipboard") config.monitorClipboard = parseBool(value);
        else if (key == "toggle_shortcut") config.toggleShortcut = parseString(value);
        else if (key == "compositor_plugin") config.compositorPlugin = parseBool(value);
        else if (key == "capabilities") config.capabilities = parseString(value);
        else if (key == "log_level") config.logLevel = parseString(value);
        else if (key == "socket_path") config.socketPath = parseString(value);
        else if (key == "data_dir") {
            std::string dir = parseString(value);
            if (!dir.empty()) {
                ensureDirectory(dir);
                config.dataDir = dir;
            }
        }
        else spdlog::debug("[Config] Ignoring unknown key '{}'", key);
    }

    return config;
}

bool saveConfig(const Config& config) {
    std::error_code ec;
    fs::create_directories(fs::path(config.configPath).parent_path(), ec);

    std::ofstream file(config.configPath);
    if (!file.is_open()) {
        spdlog::error("[Config] Cannot write {}", config.configPath);
        return false;
    }

    file << "# Clipfolio Configuration\n\n";
    file << "[general]\n";
    file << "max_history_items = " << config.maxHistoryItems << "\n";
    file << "clipboard_poll_ms = " << config.clipboardPollMs << "\n";
    file << "save_debounce_ms = " << config.saveDebounceMs << "\n";
    file << "monitor_clipboard = " << (config.monitorClipboard ? "true" : "false") << "\n";
    file << "capabilities = \"" << config.capabilities << "\"\n";
    file << "log_level = \"" << config.logLevel << "\"\n";
    file << "socket_path = \"" << config.socketPath << "\"\n";
    // The XDG default is implied; only a relocated data directory is written
    if (!config.dataDir.empty() && config.dataDir != defaultDataDir()) {
        file << "data_dir = \"" << config.dataDir << "\"\n";
    }
    file << "\n";

    file << "[window]\n";
    file << "window_width = " << config.windowWidth << "\n";
    file << "window_height = " << config.windowHeight << "\n";
    file << "always_on_top = " << (config.alwaysOnTop ? "true" : "false") << "\n\n";

    file << "[shortcuts]\n";
    file << "toggle_shortcut = \"" << config.toggleShortcut << "\"\n";
    file << "compositor_plugin = " << (config.compositorPlugin ? "true" : "false") << "\n";

    return file.good();
}

} // namespace clipfolio
