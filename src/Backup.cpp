#include "clipfolio/Backup.hpp"
#include "clipfolio/AppStore.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/Ids.hpp"
#include "clipfolio/ModelJson.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace clipfolio {

json exportBackup(const AppStore& store) {
    return json{
        {"history", store.history()},
        {"projects", store.projects()},
        {"globalTags", store.globalTags()},
        {"version", BACKUP_VERSION},
        {"date", isoTimestampUtc()},
    };
}

std::string defaultBackupFileName() {
    return "backup-" + isoDateUtc() + ".json";
}

void writeBackupFile(const AppStore& store, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) throw StorageError("cannot open " + path.string() + " for writing");

    file << exportBackup(store).dump(2);
    if (!file.good()) throw StorageError("write failed for " + path.string());
    spdlog::info("[Backup] Exported to {}", path.string());
}

void importBackup(AppStore& store, const json& doc) {
    if (!doc.is_object()) throw ImportError("backup is not a JSON object");
    if (!doc.contains("history") || !doc["history"].is_array())
        throw ImportError("backup has no history array");
    if (!doc.contains("projects") || !doc["projects"].is_array())
        throw ImportError("backup has no projects array");

    std::vector<HistoryItem> history;
    std::vector<Project> projects;
    std::optional<std::vector<std::string>> tags;
    try {
        history = doc["history"].get<std::vector<HistoryItem>>();
        projects = doc["projects"].get<std::vector<Project>>();
        if (doc.contains("globalTags") && doc["globalTags"].is_array())
            tags = doc["globalTags"].get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        throw ImportError(std::string("malformed backup entry: ") + e.what());
    }

    size_t historyCount = history.size();
    size_t projectCount = projects.size();
    store.setHistory(std::move(history));
    store.setProjects(std::move(projects));
    if (tags) store.setGlobalTags(std::move(*tags));

    spdlog::info("[Backup] Imported {} history items and {} projects", historyCount, projectCount);
}

void readBackupFile(AppStore& store, const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw ImportError("cannot open " + path.string());

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ImportError("invalid JSON in " + path.string() + ": " + e.what());
    }
    importBackup(store, doc);
}

} // namespace clipfolio
