// wl-clipboard bridge: every call is one short-lived wl-paste / wl-copy process

#include "clipfolio/ClipboardBackend.hpp"
#include "clipfolio/Process.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace clipfolio {

std::string WlClipboard::offeredTypes() {
    return captureOutput({"wl-paste", "--list-types"}).value_or("");
}

static bool hasType(const std::string& types, std::string_view mimeType) {
    std::istringstream lines(types);
    std::string line;
    while (std::getline(lines, line)) {
        if (line == mimeType) return true;
    }
    return false;
}

std::optional<std::string> WlClipboard::readText() {
    std::string types = offeredTypes();
    if (!hasType(types, "text/plain") && !hasType(types, "text/plain;charset=utf-8") &&
        !hasType(types, "UTF8_STRING"))
        return std::nullopt;
    return captureOutput({"wl-paste", "--no-newline", "--type", "text/plain"});
}

bool WlClipboard::writeText(std::string_view text) {
    bool ok = feedInput({"wl-copy", "--type", "text/plain;charset=utf-8"}, text);
    if (!ok) spdlog::warn("[Clipboard] wl-copy failed for text");
    return ok;
}

std::optional<std::string> WlClipboard::readImage() {
    if (!hasType(offeredTypes(), "image/png")) return std::nullopt;
    auto bytes = captureOutput({"wl-paste", "--type", "image/png"});
    if (!bytes || bytes->empty()) return std::nullopt;
    return bytes;
}

bool WlClipboard::writeImage(std::string_view pngBytes) {
    bool ok = feedInput({"wl-copy", "--type", "image/png"}, pngBytes);
    if (!ok) spdlog::warn("[Clipboard] wl-copy failed for image");
    return ok;
}

} // namespace clipfolio
