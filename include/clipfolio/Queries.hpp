#pragma once
// Read-only views over the store: search, smart collections, folder export

#include "Model.hpp"
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace clipfolio {

struct SmartCollections {
    std::vector<HistoryItem> favorites;
    std::vector<HistoryItem> images;
    std::vector<HistoryItem> links;
    std::vector<HistoryItem> code;
};

// ASCII case-insensitive substring match; empty needle matches everything
bool matchesSearch(std::string_view haystack, std::string_view needle);

std::vector<HistoryItem> filterHistory(const std::vector<HistoryItem>& history,
                                       const std::string& search);

SmartCollections smartCollections(const std::vector<HistoryItem>& history,
                                  const std::string& search = "");

// Folders whose notes match (text or tag) keep only the matching notes;
// folders whose name matches are kept with their matching notes.
std::vector<Folder> filterFolders(const Project& project, const std::string& search);

// Ids of folders that should be expanded to reveal search hits
std::set<std::string> foldersToExpand(const Project& project, const std::string& search);

// Notes joined by CRLF, one line each; nullopt for an empty folder
std::optional<std::string> folderClipboardText(const Folder& folder);

} // namespace clipfolio
