#include "clipfolio/ModelJson.hpp"

namespace clipfolio {

// Older exports omit optional fields, so every read falls back to a default.

void to_json(json& j, const ContentType& type) {
    j = contentTypeName(type);
}

void from_json(const json& j, ContentType& type) {
    type = j.is_string() ? parseContentType(j.get<std::string>()) : ContentType::Text;
}

static std::optional<std::string> optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

void to_json(json& j, const HistoryItem& item) {
    j = json{
        {"id", item.id},
        {"text", item.text},
        {"date", item.date},
        {"contentType", item.contentType},
    };
    if (item.imageData) j["imageData"] = *item.imageData;
    if (item.isFavorite) j["isFavorite"] = true;
}

void from_json(const json& j, HistoryItem& item) {
    item.id = j.at("id").get<std::string>();
    item.text = j.value("text", "");
    item.date = j.value("date", "");
    item.contentType = j.value("contentType", ContentType::Text);
    item.imageData = optionalString(j, "imageData");
    item.isFavorite = j.value("isFavorite", false);
}

void to_json(json& j, const NoteItem& note) {
    j = json{
        {"id", note.id},
        {"text", note.text},
        {"date", note.date},
        {"contentType", note.contentType},
        {"tags", note.tags},
    };
    if (note.imageData) j["imageData"] = *note.imageData;
    if (note.isFavorite) j["isFavorite"] = true;
}

void from_json(const json& j, NoteItem& note) {
    note.id = j.at("id").get<std::string>();
    note.text = j.value("text", "");
    note.date = j.value("date", "");
    note.contentType = j.value("contentType", ContentType::Text);
    note.tags = j.value("tags", std::vector<std::string>{});
    note.imageData = optionalString(j, "imageData");
    note.isFavorite = j.value("isFavorite", false);
}

void to_json(json& j, const Folder& folder) {
    j = json{{"id", folder.id}, {"name", folder.name}, {"notes", folder.notes}};
}

void from_json(const json& j, Folder& folder) {
    folder.id = j.at("id").get<std::string>();
    folder.name = j.value("name", "");
    folder.notes = j.value("notes", std::vector<NoteItem>{});
}

void to_json(json& j, const Project& project) {
    j = json{{"id", project.id}, {"name", project.name}, {"folders", project.folders}};
}

void from_json(const json& j, Project& project) {
    project.id = j.at("id").get<std::string>();
    project.name = j.value("name", "");
    project.folders = j.value("folders", std::vector<Folder>{});
}

} // namespace clipfolio
