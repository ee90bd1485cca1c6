#pragma once
// Single Responsibility: Configuration file parsing

#include "Config.hpp"
#include <string>

namespace clipfolio {

// Load config from ~/.config/clipfolio/clipfolio.toml
Config loadConfig();
Config loadConfig(const std::string& path);

// Save config to config.configPath
bool saveConfig(const Config& config);

// Get config file path
std::string getConfigPath();

// Get data directory path (created if missing)
std::string getDataDir();

} // namespace clipfolio
