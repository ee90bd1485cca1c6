#pragma once
// Single Responsibility: projects, clipboard history and tags (CRUD + persistence)

#include "Forward.hpp"
#include "Model.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace clipfolio {

struct StoreOptions {
    int maxHistoryItems = 50;
    std::chrono::milliseconds saveDebounce{500};
};

// Storage keys
inline constexpr const char* KEY_HISTORY = "history";
inline constexpr const char* KEY_PROJECTS = "projects";
inline constexpr const char* KEY_GLOBAL_TAGS = "globalTags";

class AppStore {
public:
    // storage may be null for a purely in-memory store
    AppStore(KeyValueStorage* storage, StoreOptions options = {});
    ~AppStore();

    AppStore(const AppStore&) = delete;
    AppStore& operator=(const AppStore&) = delete;

    void load();

    // Snapshots
    std::vector<Project> projects() const;
    std::vector<HistoryItem> history() const;
    std::vector<std::string> globalTags() const;
    std::optional<Project> findProject(const std::string& projectId) const;

    // Whole-collection setters (used by import)
    void setProjects(std::vector<Project> projects);
    void setHistory(std::vector<HistoryItem> history);
    void setGlobalTags(std::vector<std::string> tags);

    // Projects
    std::string addProject(const std::string& name);
    bool deleteProject(const std::string& projectId);
    bool renameProject(const std::string& projectId, const std::string& name);

    // Folders
    std::optional<std::string> addFolder(const std::string& projectId, const std::string& name);
    bool deleteFolder(const std::string& projectId, const std::string& folderId);
    bool renameFolder(const std::string& projectId, const std::string& folderId,
                      const std::string& name);

    // Notes
    std::optional<std::string> addNote(const std::string& projectId, const std::string& folderId,
                                       const std::string& text,
                                       std::vector<std::string> tags = {});
    // tags == nullopt keeps the note's current tags
    bool editNote(const std::string& projectId, const std::string& folderId,
                  const std::string& noteId, const std::string& text,
                  std::optional<std::vector<std::string>> tags = std::nullopt);
    bool deleteNote(const std::string& projectId, const std::string& folderId,
                    const std::string& noteId);

    // History
    bool processClipboardContent(const ClipboardContent& content);
    bool deleteHistoryItem(const std::string& id);
    size_t deleteHistoryItems(const std::set<std::string>& ids);
    void clearHistory();
    bool toggleHistoryFavorite(const std::string& id);

    // Tags
    bool addGlobalTag(const std::string& tag);
    bool deleteGlobalTag(const std::string& tag);

    // Copy a history item or note into a project folder. Without folderId the
    // "General" folder is used and created if missing. Returns the new note id.
    std::optional<std::string> copyItemToProject(const std::string& itemId,
                                                 const std::string& projectId,
                                                 const std::optional<std::string>& folderId = std::nullopt);

    // Called after every mutation, outside the lock
    void setOnChange(std::function<void()> callback);

    // Write pending changes immediately
    void flush();

    int maxHistoryItems() const { return m_options.maxHistoryItems; }

private:
    Project* projectById(const std::string& projectId);
    Folder* folderById(const std::string& projectId, const std::string& folderId);
    std::optional<std::string> findItemText(const std::string& itemId) const;

    // Must be called with the lock held; persists and queues notification
    void commitProjects();
    void commitHistory();
    void commitTags();
    void notify();

    KeyValueStorage* m_storage;
    StoreOptions m_options;
    std::unique_ptr<DebouncedSaver> m_saver;

    std::vector<Project> m_projects;
    std::vector<HistoryItem> m_history;
    std::vector<std::string> m_globalTags;

    mutable std::mutex m_mutex;
    std::function<void()> m_onChange;
};

} // namespace clipfolio
