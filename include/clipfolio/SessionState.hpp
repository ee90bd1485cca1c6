#pragma once
// UI session state: active view, search, selection, expanded folders

#include "Forward.hpp"
#include "Model.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace clipfolio {

enum class ViewKind {
    History,
    Project,
    Favorites,
    Images,
    Links,
    Code
};

inline constexpr const char* KEY_UI_STATE = "uiState";

const char* viewName(ViewKind view);

struct SessionState {
    ViewKind view = ViewKind::History;
    std::optional<std::string> selectedProjectId;
    std::string search;
    bool focusMode = false;
    bool pinned = false;
    std::set<std::string> selectedItems;   // batch selection (history ids)
    std::set<std::string> expandedFolders; // persisted

    void toggleFolder(const std::string& folderId);
    void toggleSelectItem(const std::string& itemId);
    void clearSelection() { selectedItems.clear(); }

    // Tab / Shift+Tab order: History, Favorites, Images, Links, Code, Project
    void cycleView(int direction, bool hasProject);

    nlohmann::json persisted() const;
    void restore(const nlohmann::json& doc);
};

// One visible line of the main list
struct ListRow {
    enum class Kind { History, Folder, Note };

    Kind kind = Kind::History;
    std::string id;          // history, folder or note id
    std::string folderId;    // notes only
    std::string label;
    std::string detail;      // date, or note count for folders
    ContentType contentType = ContentType::Text;
    std::optional<std::string> imageData;
    bool favorite = false;
    bool expanded = false;   // folders only
};

// Rows for the current view; also merges search hits into expandedFolders
std::vector<ListRow> buildRows(const AppStore& store, SessionState& session);

// Inline prompt (create / rename / edit)
struct PromptRequest {
    enum class Kind {
        CreateProject,
        CreateFolder,
        CreateNote,
        EditNote,
        RenameProject,
        RenameFolder
    };

    Kind kind = Kind::CreateProject;
    std::string title;
    std::string initialValue;
    std::vector<std::string> initialTags;
    std::string projectId;
    std::string folderId;
    std::string noteId;
};

// Applies a confirmed prompt. Blank values are ignored (returns false).
bool applyPrompt(AppStore& store, SessionState& session, const PromptRequest& request,
                 const std::string& value, const std::vector<std::string>& tags);

// Deletes a project and leaves the project view if it was selected
bool deleteProjectFromSession(AppStore& store, SessionState& session,
                              const std::string& projectId);

bool deleteFolderFromSession(AppStore& store, SessionState& session,
                             const std::string& projectId, const std::string& folderId);

// Deletes every batch-selected history item; returns the count
size_t deleteSelectedItems(AppStore& store, SessionState& session);

// "tag1, tag2" -> {"tag1", "tag2"}
std::vector<std::string> parseTagList(const std::string& text);

} // namespace clipfolio
