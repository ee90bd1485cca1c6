#include "clipfolio/AppStore.hpp"
#include "clipfolio/ContentDetector.hpp"
#include "clipfolio/DebouncedSaver.hpp"
#include "clipfolio/Ids.hpp"
#include "clipfolio/KeyValueStorage.hpp"
#include "clipfolio/ModelJson.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace clipfolio {

static const char* GENERAL_FOLDER = "General";

AppStore::AppStore(KeyValueStorage* storage, StoreOptions options)
    : m_storage(storage), m_options(options) {
    m_projects.push_back(defaultProject());
    if (m_storage) {
        m_saver = std::make_unique<DebouncedSaver>(
            [storage](const std::string& key, const json& data) { storage->save(key, data); },
            m_options.saveDebounce);
    }
}

AppStore::~AppStore() {
    // Saver destructor flushes whatever is still pending
    m_saver.reset();
}

// ============================================================================
// Loading
// ============================================================================

template <typename T>
static std::optional<T> decodeKey(KeyValueStorage& storage, const char* key) {
    auto doc = storage.load(key);
    if (!doc || doc->is_null()) return std::nullopt;
    try {
        return doc->get<T>();
    } catch (const json::exception& e) {
        spdlog::error("[AppStore] Ignoring malformed '{}': {}", key, e.what());
        return std::nullopt;
    }
}

void AppStore::load() {
    std::optional<std::vector<HistoryItem>> history;
    std::optional<std::vector<Project>> projects;
    std::optional<std::vector<std::string>> tags;

    if (m_storage) {
        history = decodeKey<std::vector<HistoryItem>>(*m_storage, KEY_HISTORY);
        projects = decodeKey<std::vector<Project>>(*m_storage, KEY_PROJECTS);
        tags = decodeKey<std::vector<std::string>>(*m_storage, KEY_GLOBAL_TAGS);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history = history.value_or(std::vector<HistoryItem>{});
        m_projects = projects.value_or(std::vector<Project>{defaultProject()});
        m_globalTags = tags.value_or(std::vector<std::string>{});
        spdlog::info("[AppStore] Loaded {} history items, {} projects, {} tags",
                     m_history.size(), m_projects.size(), m_globalTags.size());
    }
    notify();
}

// ============================================================================
// Snapshots & setters
// ============================================================================

std::vector<Project> AppStore::projects() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_projects;
}

std::vector<HistoryItem> AppStore::history() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history;
}

std::vector<std::string> AppStore::globalTags() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_globalTags;
}

std::optional<Project> AppStore::findProject(const std::string& projectId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& p : m_projects) {
        if (p.id == projectId) return p;
    }
    return std::nullopt;
}

void AppStore::setProjects(std::vector<Project> projects) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_projects = std::move(projects);
        commitProjects();
    }
    notify();
}

void AppStore::setHistory(std::vector<HistoryItem> history) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history = std::move(history);
        commitHistory();
    }
    notify();
}

void AppStore::setGlobalTags(std::vector<std::string> tags) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_globalTags = std::move(tags);
        commitTags();
    }
    notify();
}

// ============================================================================
// Projects
// ============================================================================

std::string AppStore::addProject(const std::string& name) {
    Project project{nextId(), name, {}};
    std::string id = project.id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_projects.push_back(std::move(project));
        commitProjects();
    }
    notify();
    return id;
}

bool AppStore::deleteProject(const std::string& projectId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::remove_if(m_projects.begin(), m_projects.end(),
                                 [&](const Project& p) { return p.id == projectId; });
        if (it == m_projects.end()) return false;
        m_projects.erase(it, m_projects.end());
        commitProjects();
    }
    notify();
    return true;
}

bool AppStore::renameProject(const std::string& projectId, const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Project* project = projectById(projectId);
        if (!project) return false;
        project->name = name;
        commitProjects();
    }
    notify();
    return true;
}

// ============================================================================
// Folders
// ============================================================================

std::optional<std::string> AppStore::addFolder(const std::string& projectId,
                                               const std::string& name) {
    std::string id = nextId();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Project* project = projectById(projectId);
        if (!project) return std::nullopt;
        project->folders.push_back(Folder{id, name, {}});
        commitProjects();
    }
    notify();
    return id;
}

bool AppStore::deleteFolder(const std::string& projectId, const std::string& folderId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Project* project = projectById(projectId);
        if (!project) return false;
        auto& folders = project->folders;
        auto it = std::remove_if(folders.begin(), folders.end(),
                                 [&](const Folder& f) { return f.id == folderId; });
        if (it == folders.end()) return false;
        folders.erase(it, folders.end());
        commitProjects();
    }
    notify();
    return true;
}

bool AppStore::renameFolder(const std::string& projectId, const std::string& folderId,
                            const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Folder* folder = folderById(projectId, folderId);
        if (!folder) return false;
        folder->name = name;
        commitProjects();
    }
    notify();
    return true;
}

// ============================================================================
// Notes
// ============================================================================

static NoteItem makeNote(const std::string& text, std::vector<std::string> tags) {
    NoteItem note;
    note.id = nextId();
    note.text = text;
    note.date = currentTimeLabel();
    note.contentType = detectContentType(text);
    note.tags = std::move(tags);
    return note;
}

std::optional<std::string> AppStore::addNote(const std::string& projectId,
                                             const std::string& folderId,
                                             const std::string& text,
                                             std::vector<std::string> tags) {
    NoteItem note = makeNote(text, std::move(tags));
    std::string id = note.id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Folder* folder = folderById(projectId, folderId);
        if (!folder) return std::nullopt;
        folder->notes.push_back(std::move(note));
        commitProjects();
    }
    notify();
    return id;
}

bool AppStore::editNote(const std::string& projectId, const std::string& folderId,
                        const std::string& noteId, const std::string& text,
                        std::optional<std::vector<std::string>> tags) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Folder* folder = folderById(projectId, folderId);
        if (!folder) return false;
        auto it = std::find_if(folder->notes.begin(), folder->notes.end(),
                               [&](const NoteItem& n) { return n.id == noteId; });
        if (it == folder->notes.end()) return false;
        it->text = text;
        it->contentType = detectContentType(text);
        if (tags) it->tags = std::move(*tags);
        commitProjects();
    }
    notify();
    return true;
}

bool AppStore::deleteNote(const std::string& projectId, const std::string& folderId,
                          const std::string& noteId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Folder* folder = folderById(projectId, folderId);
        if (!folder) return false;
        auto& notes = folder->notes;
        auto it = std::remove_if(notes.begin(), notes.end(),
                                 [&](const NoteItem& n) { return n.id == noteId; });
        if (it == notes.end()) return false;
        notes.erase(it, notes.end());
        commitProjects();
    }
    notify();
    return true;
}

// ============================================================================
// History
// ============================================================================

bool AppStore::processClipboardContent(const ClipboardContent& content) {
    bool isImage = content.kind == ClipboardContent::Kind::Image;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        // Only the newest entry is compared; older duplicates are allowed
        if (!m_history.empty()) {
            const HistoryItem& last = m_history.front();
            if (!isImage && last.text == content.value) return false;
            if (isImage && last.isImage() && last.imageData == content.value) return false;
        }

        HistoryItem item;
        item.id = nextId();
        item.date = currentTimeLabel();
        item.text = isImage ? "Image" : content.value;
        item.contentType = isImage ? ContentType::Image : detectContentType(content.value);
        if (isImage) item.imageData = content.value;

        m_history.insert(m_history.begin(), std::move(item));
        if (m_options.maxHistoryItems > 0 &&
            m_history.size() > static_cast<size_t>(m_options.maxHistoryItems)) {
            m_history.resize(static_cast<size_t>(m_options.maxHistoryItems));
        }
        commitHistory();
    }
    notify();
    return true;
}

bool AppStore::deleteHistoryItem(const std::string& id) {
    return deleteHistoryItems({id}) > 0;
}

size_t AppStore::deleteHistoryItems(const std::set<std::string>& ids) {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::remove_if(m_history.begin(), m_history.end(),
                                 [&](const HistoryItem& h) { return ids.count(h.id) > 0; });
        removed = static_cast<size_t>(std::distance(it, m_history.end()));
        if (removed == 0) return 0;
        m_history.erase(it, m_history.end());
        commitHistory();
    }
    notify();
    return removed;
}

void AppStore::clearHistory() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.clear();
        commitHistory();
    }
    notify();
}

bool AppStore::toggleHistoryFavorite(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_history.begin(), m_history.end(),
                               [&](const HistoryItem& h) { return h.id == id; });
        if (it == m_history.end()) return false;
        it->isFavorite = !it->isFavorite;
        commitHistory();
    }
    notify();
    return true;
}

// ============================================================================
// Tags
// ============================================================================

bool AppStore::addGlobalTag(const std::string& tag) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (std::find(m_globalTags.begin(), m_globalTags.end(), tag) != m_globalTags.end())
            return false;
        m_globalTags.push_back(tag);
        commitTags();
    }
    notify();
    return true;
}

bool AppStore::deleteGlobalTag(const std::string& tag) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::remove(m_globalTags.begin(), m_globalTags.end(), tag);
        if (it == m_globalTags.end()) return false;
        m_globalTags.erase(it, m_globalTags.end());
        commitTags();
    }
    notify();
    return true;
}

// ============================================================================
// Copy into project
// ============================================================================

std::optional<std::string> AppStore::copyItemToProject(const std::string& itemId,
                                                       const std::string& projectId,
                                                       const std::optional<std::string>& folderId) {
    std::string noteId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto text = findItemText(itemId);
        if (!text) {
            spdlog::warn("[AppStore] copyItemToProject: item {} not found", itemId);
            return std::nullopt;
        }

        Project* project = projectById(projectId);
        if (!project) return std::nullopt;

        Folder* target = nullptr;
        if (folderId) {
            target = folderById(projectId, *folderId);
            if (!target) {
                spdlog::warn("[AppStore] copyItemToProject: folder {} not found", *folderId);
                return std::nullopt;
            }
        } else {
            auto it = std::find_if(project->folders.begin(), project->folders.end(),
                                   [](const Folder& f) { return f.name == GENERAL_FOLDER; });
            if (it == project->folders.end()) {
                project->folders.push_back(Folder{nextId(), GENERAL_FOLDER, {}});
                target = &project->folders.back();
            } else {
                target = &*it;
            }
        }

        NoteItem note = makeNote(*text, {});
        noteId = note.id;
        target->notes.push_back(std::move(note));
        spdlog::info("[AppStore] Copied item into {} / {}", project->name, target->name);
        commitProjects();
    }
    notify();
    return noteId;
}

// ============================================================================
// Internals
// ============================================================================

void AppStore::setOnChange(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onChange = std::move(callback);
}

void AppStore::flush() {
    if (m_saver) m_saver->flush();
}

Project* AppStore::projectById(const std::string& projectId) {
    for (auto& p : m_projects) {
        if (p.id == projectId) return &p;
    }
    return nullptr;
}

Folder* AppStore::folderById(const std::string& projectId, const std::string& folderId) {
    Project* project = projectById(projectId);
    if (!project) return nullptr;
    for (auto& f : project->folders) {
        if (f.id == folderId) return &f;
    }
    return nullptr;
}

std::optional<std::string> AppStore::findItemText(const std::string& itemId) const {
    for (const auto& h : m_history) {
        if (h.id == itemId) return h.text;
    }
    for (const auto& p : m_projects) {
        for (const auto& f : p.folders) {
            for (const auto& n : f.notes) {
                if (n.id == itemId) return n.text;
            }
        }
    }
    return std::nullopt;
}

void AppStore::commitProjects() {
    if (m_saver) m_saver->schedule(KEY_PROJECTS, json(m_projects));
}

void AppStore::commitHistory() {
    if (m_saver) m_saver->schedule(KEY_HISTORY, json(m_history));
}

void AppStore::commitTags() {
    if (m_saver) m_saver->schedule(KEY_GLOBAL_TAGS, json(m_globalTags));
}

void AppStore::notify() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callback = m_onChange;
    }
    if (callback) callback();
}

} // namespace clipfolio
