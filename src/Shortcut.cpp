#include "clipfolio/Shortcut.hpp"
#include "clipfolio/ContentDetector.hpp"
#include "clipfolio/Process.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace clipfolio {

// ============================================================================
// Accelerator
// ============================================================================

std::string Accelerator::toString() const {
    std::string out;
    if (ctrl) out += "Ctrl+";
    if (alt) out += "Alt+";
    if (shift) out += "Shift+";
    if (super) out += "Super+";
    return out + key;
}

std::string Accelerator::hyprlandMods() const {
    std::vector<std::string> mods;
    if (ctrl) mods.push_back("CTRL");
    if (alt) mods.push_back("ALT");
    if (shift) mods.push_back("SHIFT");
    if (super) mods.push_back("SUPER");

    std::string out;
    for (const auto& m : mods) {
        if (!out.empty()) out += ' ';
        out += m;
    }
    return out;
}

static std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<Accelerator> parseAccelerator(std::string_view text) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start <= text.size()) {
        size_t plus = text.find('+', start);
        if (plus == std::string_view::npos) plus = text.size();
        tokens.push_back(trimCopy(text.substr(start, plus - start)));
        start = plus + 1;
    }
    if (tokens.empty() || tokens.back().empty()) return std::nullopt;

    Accelerator accel;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        std::string mod = lower(tokens[i]);
        if (mod == "super" || mod == "meta" || mod == "cmd" || mod == "command" || mod == "win") {
            accel.super = true;
        } else if (mod == "ctrl" || mod == "control" || mod == "commandorcontrol" ||
                   mod == "cmdorctrl") {
            accel.ctrl = true;
        } else if (mod == "alt" || mod == "option") {
            accel.alt = true;
        } else if (mod == "shift") {
            accel.shift = true;
        } else {
            return std::nullopt;
        }
    }

    accel.key = tokens.back();
    if (accel.key.size() == 1) {
        accel.key[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(accel.key[0])));
    }
    return accel;
}

// ============================================================================
// Hyprland binding
// ============================================================================

HyprctlBinder::HyprctlBinder(bool useDispatcher, std::string executable)
    : m_useDispatcher(useDispatcher)
    , m_executable(std::move(executable)) {
}

std::string HyprctlBinder::bindSpec(const Accelerator& accelerator) const {
    std::string spec = accelerator.hyprlandMods() + "," + accelerator.key + ",";
    if (m_useDispatcher) {
        spec += "clipfolio:shortcut," + accelerator.toString();
    } else {
        spec += "exec," + m_executable + " --shortcut " + accelerator.toString();
    }
    return spec;
}

bool HyprctlBinder::bind(const Accelerator& accelerator) {
    std::string spec = bindSpec(accelerator);
    bool ok = runCommand({"hyprctl", "keyword", "bind", spec});
    if (ok) spdlog::info("[Shortcut] Bound {}", spec);
    else spdlog::warn("[Shortcut] hyprctl bind failed for {}", accelerator.toString());
    return ok;
}

bool HyprctlBinder::unbind(const Accelerator& accelerator) {
    std::string spec = accelerator.hyprlandMods() + "," + accelerator.key;
    bool ok = runCommand({"hyprctl", "keyword", "unbind", spec});
    if (!ok) spdlog::warn("[Shortcut] hyprctl unbind failed for {}", accelerator.toString());
    return ok;
}

} // namespace clipfolio
