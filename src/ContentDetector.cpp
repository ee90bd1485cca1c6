// Heuristic content classification for history entries and notes

#include "clipfolio/ContentDetector.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace clipfolio {

static constexpr std::array<std::string_view, 25> CODE_KEYWORDS = {
    "function", "const ", "let ", "var ", "import ",
    "export ", "npm ", "class ", "interface ", "{}", "=>",
    "<div>", "console.log", "return ", "<?php", "public static",
    "#include", "fn ", "impl ", "struct ", "def ", "package ",
    "go mod", "pip install", "cargo "
};

static bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

static bool contains(std::string_view s, std::string_view needle) {
    return s.find(needle) != std::string_view::npos;
}

std::string trimCopy(std::string_view text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return std::string(text.substr(start, end - start));
}

bool isSafeUrl(std::string_view url) {
    std::string_view rest;
    if (startsWith(url, "http://")) rest = url.substr(7);
    else if (startsWith(url, "https://")) rest = url.substr(8);
    else return false;

    if (std::any_of(url.begin(), url.end(),
                    [](char c) { return std::isspace(static_cast<unsigned char>(c)); }))
        return false;

    // Host runs until the first path, query or fragment delimiter
    size_t hostEnd = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, hostEnd);
    size_t at = authority.rfind('@');
    if (at != std::string_view::npos) authority = authority.substr(at + 1);
    size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        std::string_view port = authority.substr(colon + 1);
        if (!std::all_of(port.begin(), port.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
            return false;
        authority = authority.substr(0, colon);
    }
    return !authority.empty();
}

ContentType detectContentType(std::string_view text) {
    if (text.empty()) return ContentType::Text;
    const std::string trimmed = trimCopy(text);

    if ((startsWith(trimmed, "http://") || startsWith(trimmed, "https://")) && isSafeUrl(trimmed))
        return ContentType::Url;

    static const std::regex hexColor("^#([A-Fa-f0-9]{3}|[A-Fa-f0-9]{6})$");
    if (std::regex_match(trimmed, hexColor)) return ContentType::Color;
    if (startsWith(trimmed, "rgb(") || startsWith(trimmed, "rgba(")) return ContentType::Color;
    if (startsWith(trimmed, "hsl(") || startsWith(trimmed, "hsla(")) return ContentType::Color;

    bool keyword = std::any_of(CODE_KEYWORDS.begin(), CODE_KEYWORDS.end(),
                               [&](std::string_view kw) { return contains(trimmed, kw); });
    bool braces = contains(trimmed, ";") && contains(trimmed, "{") && contains(trimmed, "}");
    bool markup = !trimmed.empty() && trimmed.front() == '<' && trimmed.back() == '>';
    if (keyword || braces || markup) return ContentType::Code;

    return ContentType::Text;
}

} // namespace clipfolio
