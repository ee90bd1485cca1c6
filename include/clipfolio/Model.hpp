#pragma once
// Data structures for history entries and the project/folder/note tree

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clipfolio {

enum class ContentType {
    Url,
    Color,
    Code,
    Text,
    Image
};

const char* contentTypeName(ContentType type);
ContentType parseContentType(std::string_view name);

struct HistoryItem {
    std::string id;
    std::string text;
    std::string date;                     // "HH:MM", local time
    ContentType contentType = ContentType::Text;
    std::optional<std::string> imageData; // file name under <data>/images
    bool isFavorite = false;

    bool isImage() const { return contentType == ContentType::Image; }
};

struct NoteItem {
    std::string id;
    std::string text;
    std::string date;
    ContentType contentType = ContentType::Text;
    std::vector<std::string> tags;
    std::optional<std::string> imageData;
    bool isFavorite = false;

    bool isImage() const { return contentType == ContentType::Image; }
};

struct Folder {
    std::string id;
    std::string name;
    std::vector<NoteItem> notes;
};

struct Project {
    std::string id;
    std::string name;
    std::vector<Folder> folders;
};

// Payload produced by the clipboard monitor
struct ClipboardContent {
    enum class Kind { Text, Image };

    Kind kind = Kind::Text;
    std::string value; // text, or image file name

    static ClipboardContent text(std::string v) { return {Kind::Text, std::move(v)}; }
    static ClipboardContent image(std::string fileName) { return {Kind::Image, std::move(fileName)}; }
};

Project defaultProject();

} // namespace clipfolio
