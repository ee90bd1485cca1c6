#pragma once
// JSON mapping for the data model (field names match the backup format)

#include "Model.hpp"
#include <nlohmann/json.hpp>

namespace clipfolio {

using json = nlohmann::json;

void to_json(json& j, const ContentType& type);
void from_json(const json& j, ContentType& type);

void to_json(json& j, const HistoryItem& item);
void from_json(const json& j, HistoryItem& item);

void to_json(json& j, const NoteItem& note);
void from_json(const json& j, NoteItem& note);

void to_json(json& j, const Folder& folder);
void from_json(const json& j, Folder& folder);

void to_json(json& j, const Project& project);
void from_json(const json& j, Project& project);

} // namespace clipfolio
