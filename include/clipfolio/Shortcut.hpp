#pragma once
// Keyboard accelerators ("CommandOrControl+Shift+K") and compositor binding

#include <optional>
#include <string>
#include <string_view>

namespace clipfolio {

struct Accelerator {
    bool ctrl = false;
    bool alt = false;
    bool shift = false;
    bool super = false;
    std::string key;

    // Canonical "Ctrl+Alt+Shift+Super+Key"
    std::string toString() const;

    // Hyprland modifier list, e.g. "SUPER SHIFT"
    std::string hyprlandMods() const;

    bool operator==(const Accelerator&) const = default;
};

// Modifiers are case-insensitive; the last token is the key. Single letters
// are upper-cased. nullopt for an empty key or an unknown modifier.
std::optional<Accelerator> parseAccelerator(std::string_view text);

class ShortcutBinder {
public:
    virtual ~ShortcutBinder() = default;
    virtual bool bind(const Accelerator& accelerator) = 0;
    virtual bool unbind(const Accelerator& accelerator) = 0;
};

// Binds through `hyprctl keyword bind`. The binding either runs
// `clipfolio --shortcut <accel>` or, with the compositor plugin loaded,
// the clipfolio:shortcut dispatcher.
class HyprctlBinder : public ShortcutBinder {
public:
    explicit HyprctlBinder(bool useDispatcher, std::string executable = "clipfolio");

    bool bind(const Accelerator& accelerator) override;
    bool unbind(const Accelerator& accelerator) override;

    // "SUPER,V,exec,clipfolio --shortcut Super+V"
    std::string bindSpec(const Accelerator& accelerator) const;

private:
    bool m_useDispatcher;
    std::string m_executable;
};

} // namespace clipfolio
