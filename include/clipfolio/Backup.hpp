#pragma once
// Single Responsibility: backup documents (export / import of the whole store)

#include "Forward.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace clipfolio {

inline constexpr int BACKUP_VERSION = 2;

// {history, projects, globalTags, version, date}
nlohmann::json exportBackup(const AppStore& store);

// "backup-YYYY-MM-DD.json" for today's UTC date
std::string defaultBackupFileName();

// Pretty-printed (2 spaces); throws StorageError
void writeBackupFile(const AppStore& store, const std::filesystem::path& path);

// Throws ImportError and leaves the store untouched when the document is
// not a backup. globalTags is only replaced when present as an array.
void importBackup(AppStore& store, const nlohmann::json& doc);

void readBackupFile(AppStore& store, const std::filesystem::path& path);

} // namespace clipfolio
