#pragma once
// Single Responsibility: named command dispatch with capability checks

#include "Capability.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace clipfolio {

class CommandRouter {
public:
    using Handler = std::function<nlohmann::json(const nlohmann::json& args)>;

    explicit CommandRouter(std::set<Capability> permissions);

    // Command registration; capability == nullopt means always allowed
    void registerCommand(const std::string& name, Handler handler,
                         std::optional<Capability> capability = std::nullopt);
    bool removeCommand(const std::string& name);
    bool hasCommand(const std::string& name) const;
    std::vector<std::string> commandNames() const;

    bool isPermitted(Capability capability) const;
    const std::set<Capability>& permissions() const { return m_permissions; }

    // Command execution; throws CommandError (and the handler's Error subclasses)
    nlohmann::json invoke(const std::string& name,
                          const nlohmann::json& args = nlohmann::json::object());

    // "name {json}" -> {"status":"ok","data":...} / {"status":"error","message":...}
    std::string handleLine(const std::string& line);

private:
    struct Entry {
        Handler handler;
        std::optional<Capability> capability;
    };

    std::map<std::string, Entry> m_commands;
    std::set<Capability> m_permissions;
};

// Argument helpers for handlers; throw CommandError when missing or mistyped
std::string requireString(const nlohmann::json& args, const char* key);
std::optional<std::string> optionalString(const nlohmann::json& args, const char* key);

} // namespace clipfolio
