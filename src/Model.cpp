#include "clipfolio/Model.hpp"

namespace clipfolio {

const char* contentTypeName(ContentType type) {
    switch (type) {
        case ContentType::Url:   return "url";
        case ContentType::Color: return "color";
        case ContentType::Code:  return "code";
        case ContentType::Image: return "image";
        case ContentType::Text:  break;
    }
    return "text";
}

ContentType parseContentType(std::string_view name) {
    if (name == "url")   return ContentType::Url;
    if (name == "color") return ContentType::Color;
    if (name == "code")  return ContentType::Code;
    if (name == "image") return ContentType::Image;
    return ContentType::Text;
}

Project defaultProject() {
    return Project{"p1", "Personal", {Folder{"f1", "Inbox", {}}}};
}

} // namespace clipfolio
