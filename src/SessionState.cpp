#include "clipfolio/SessionState.hpp"
#include "clipfolio/AppStore.hpp"
#include "clipfolio/ContentDetector.hpp"
#include "clipfolio/Queries.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace clipfolio {

const char* viewName(ViewKind view) {
    switch (view) {
        case ViewKind::History:   return "history";
        case ViewKind::Project:   return "project";
        case ViewKind::Favorites: return "favorites";
        case ViewKind::Images:    return "images";
        case ViewKind::Links:     return "links";
        case ViewKind::Code:      return "code";
    }
    return "history";
}

void SessionState::toggleFolder(const std::string& folderId) {
    if (!expandedFolders.erase(folderId)) expandedFolders.insert(folderId);
}

void SessionState::toggleSelectItem(const std::string& itemId) {
    if (!selectedItems.erase(itemId)) selectedItems.insert(itemId);
}

void SessionState::cycleView(int direction, bool hasProject) {
    std::vector<ViewKind> order = {ViewKind::History, ViewKind::Favorites, ViewKind::Images,
                                   ViewKind::Links, ViewKind::Code};
    if (hasProject) order.push_back(ViewKind::Project);

    auto it = std::find(order.begin(), order.end(), view);
    int idx = it == order.end() ? 0 : static_cast<int>(it - order.begin());
    int n = static_cast<int>(order.size());
    view = order[static_cast<size_t>(((idx + direction) % n + n) % n)];
}

nlohmann::json SessionState::persisted() const {
    return nlohmann::json{
        {"expandedFolders", expandedFolders},
        {"pinned", pinned},
    };
}

void SessionState::restore(const nlohmann::json& doc) {
    if (!doc.is_object()) return;
    try {
        if (doc.contains("expandedFolders") && doc["expandedFolders"].is_array())
            expandedFolders = doc["expandedFolders"].get<std::set<std::string>>();
        if (doc.contains("pinned") && doc["pinned"].is_boolean())
            pinned = doc["pinned"].get<bool>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("[Session] Ignoring malformed ui state: {}", e.what());
    }
}

// ============================================================================
// Rows
// ============================================================================

static ListRow historyRow(const HistoryItem& item) {
    ListRow row;
    row.kind = ListRow::Kind::History;
    row.id = item.id;
    row.label = item.text;
    row.detail = item.date;
    row.contentType = item.contentType;
    row.imageData = item.imageData;
    row.favorite = item.isFavorite;
    return row;
}

std::vector<ListRow> buildRows(const AppStore& store, SessionState& session) {
    std::vector<ListRow> rows;

    if (session.view == ViewKind::Project) {
        if (!session.selectedProjectId) return rows;
        auto project = store.findProject(*session.selectedProjectId);
        if (!project) return rows;

        auto hits = foldersToExpand(*project, session.search);
        session.expandedFolders.insert(hits.begin(), hits.end());

        for (const auto& folder : filterFolders(*project, session.search)) {
            ListRow f;
            f.kind = ListRow::Kind::Folder;
            f.id = folder.id;
            f.label = folder.name;
            f.detail = std::to_string(folder.notes.size());
            f.expanded = session.expandedFolders.count(folder.id) > 0;
            rows.push_back(f);
            if (!f.expanded) continue;

            for (const auto& note : folder.notes) {
                ListRow n;
                n.kind = ListRow::Kind::Note;
                n.id = note.id;
                n.folderId = folder.id;
                n.label = note.text;
                n.detail = note.date;
                n.contentType = note.contentType;
                n.imageData = note.imageData;
                n.favorite = note.isFavorite;
                rows.push_back(std::move(n));
            }
        }
        return rows;
    }

    auto history = store.history();
    std::vector<HistoryItem> items;
    switch (session.view) {
        case ViewKind::History:   items = filterHistory(history, session.search); break;
        case ViewKind::Favorites: items = smartCollections(history, session.search).favorites; break;
        case ViewKind::Images:    items = smartCollections(history, session.search).images; break;
        case ViewKind::Links:     items = smartCollections(history, session.search).links; break;
        case ViewKind::Code:      items = smartCollections(history, session.search).code; break;
        case ViewKind::Project:   break;
    }
    rows.reserve(items.size());
    for (const auto& item : items) rows.push_back(historyRow(item));
    return rows;
}

// ============================================================================
// Prompts
// ============================================================================

bool applyPrompt(AppStore& store, SessionState& session, const PromptRequest& request,
                 const std::string& value, const std::vector<std::string>& tags) {
    if (trimCopy(value).empty()) return false;

    switch (request.kind) {
        case PromptRequest::Kind::CreateProject: {
            std::string id = store.addProject(value);
            session.selectedProjectId = id;
            session.view = ViewKind::Project;
            return true;
        }
        case PromptRequest::Kind::CreateFolder: {
            if (request.projectId.empty()) return false;
            auto id = store.addFolder(request.projectId, value);
            if (!id) return false;
            session.expandedFolders.insert(*id);
            return true;
        }
        case PromptRequest::Kind::CreateNote:
            if (request.projectId.empty() || request.folderId.empty()) return false;
            return store.addNote(request.projectId, request.folderId, value, tags).has_value();
        case PromptRequest::Kind::EditNote:
            if (request.projectId.empty() || request.folderId.empty() || request.noteId.empty())
                return false;
            return store.editNote(request.projectId, request.folderId, request.noteId, value, tags);
        case PromptRequest::Kind::RenameProject:
            if (request.projectId.empty()) return false;
            return store.renameProject(request.projectId, value);
        case PromptRequest::Kind::RenameFolder:
            if (request.projectId.empty() || request.folderId.empty()) return false;
            return store.renameFolder(request.projectId, request.folderId, value);
    }
    return false;
}

bool deleteProjectFromSession(AppStore& store, SessionState& session,
                              const std::string& projectId) {
    if (!store.deleteProject(projectId)) return false;
    if (session.selectedProjectId == projectId) {
        session.view = ViewKind::History;
        session.selectedProjectId.reset();
    }
    return true;
}

bool deleteFolderFromSession(AppStore& store, SessionState& session,
                             const std::string& projectId, const std::string& folderId) {
    if (!store.deleteFolder(projectId, folderId)) return false;
    session.expandedFolders.erase(folderId);
    return true;
}

size_t deleteSelectedItems(AppStore& store, SessionState& session) {
    if (session.selectedItems.empty()) return 0;
    size_t removed = store.deleteHistoryItems(session.selectedItems);
    session.clearSelection();
    return removed;
}

std::vector<std::string> parseTagList(const std::string& text) {
    std::vector<std::string> tags;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        std::string tag = trimCopy(token);
        if (!tag.empty() && std::find(tags.begin(), tags.end(), tag) == tags.end())
            tags.push_back(tag);
    }
    return tags;
}

} // namespace clipfolio
