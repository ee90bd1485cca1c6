#include "clipfolio/Queries.hpp"
#include "clipfolio/ContentDetector.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace clipfolio {

static std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool matchesSearch(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

static bool noteMatches(const NoteItem& note, const std::string& search) {
    if (matchesSearch(note.text, search)) return true;
    return std::any_of(note.tags.begin(), note.tags.end(),
                       [&](const std::string& tag) { return matchesSearch(tag, search); });
}

std::vector<HistoryItem> filterHistory(const std::vector<HistoryItem>& history,
                                       const std::string& search) {
    if (search.empty()) return history;
    std::vector<HistoryItem> out;
    std::copy_if(history.begin(), history.end(), std::back_inserter(out),
                 [&](const HistoryItem& h) { return matchesSearch(h.text, search); });
    return out;
}

SmartCollections smartCollections(const std::vector<HistoryItem>& history,
                                  const std::string& search) {
    SmartCollections c;
    for (const auto& item : history) {
        if (!matchesSearch(item.text, search)) continue;
        if (item.isFavorite) c.favorites.push_back(item);
        if (item.contentType == ContentType::Image) c.images.push_back(item);
        if (item.contentType == ContentType::Url) c.links.push_back(item);
        if (item.contentType == ContentType::Code) c.code.push_back(item);
    }
    return c;
}

std::vector<Folder> filterFolders(const Project& project, const std::string& search) {
    if (search.empty()) return project.folders;

    std::vector<Folder> out;
    for (const auto& folder : project.folders) {
        Folder filtered{folder.id, folder.name, {}};
        std::copy_if(folder.notes.begin(), folder.notes.end(), std::back_inserter(filtered.notes),
                     [&](const NoteItem& n) { return noteMatches(n, search); });
        if (!filtered.notes.empty() || matchesSearch(folder.name, search)) {
            out.push_back(std::move(filtered));
        }
    }
    return out;
}

std::set<std::string> foldersToExpand(const Project& project, const std::string& search) {
    std::set<std::string> ids;
    if (search.empty()) return ids;
    for (const auto& folder : project.folders) {
        bool hit = std::any_of(folder.notes.begin(), folder.notes.end(),
                               [&](const NoteItem& n) { return noteMatches(n, search); });
        if (hit || matchesSearch(folder.name, search)) ids.insert(folder.id);
    }
    return ids;
}

std::optional<std::string> folderClipboardText(const Folder& folder) {
    if (folder.notes.empty()) return std::nullopt;

    std::string out;
    for (size_t i = 0; i < folder.notes.size(); i++) {
        const NoteItem& note = folder.notes[i];
        if (i > 0) out += "\r\n";
        if (note.isImage()) {
            out += "[Image]";
            continue;
        }
        std::string line = trimCopy(note.text);
        // Each CRLF, CR or LF becomes a single space
        std::string flat;
        for (size_t k = 0; k < line.size(); k++) {
            if (line[k] == '\r') {
                if (k + 1 < line.size() && line[k + 1] == '\n') k++;
                flat += ' ';
            } else if (line[k] == '\n') {
                flat += ' ';
            } else {
                flat += line[k];
            }
        }
        out += flat;
    }
    return out;
}

} // namespace clipfolio
