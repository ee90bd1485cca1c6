// Single Responsibility: command dispatch for the control socket and the UI

#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/Errors.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace clipfolio {

CommandRouter::CommandRouter(std::set<Capability> permissions)
    : m_permissions(std::move(permissions)) {
}

void CommandRouter::registerCommand(const std::string& name, Handler handler,
                                    std::optional<Capability> capability) {
    if (m_commands.count(name)) {
        spdlog::warn("[Router] Replacing command '{}'", name);
    }
    m_commands[name] = Entry{std::move(handler), capability};
}

bool CommandRouter::removeCommand(const std::string& name) {
    return m_commands.erase(name) > 0;
}

bool CommandRouter::hasCommand(const std::string& name) const {
    return m_commands.count(name) > 0;
}

std::vector<std::string> CommandRouter::commandNames() const {
    std::vector<std::string> names;
    names.reserve(m_commands.size());
    for (const auto& [name, entry] : m_commands) names.push_back(name);
    return names;
}

bool CommandRouter::isPermitted(Capability capability) const {
    return m_permissions.count(capability) > 0;
}

json CommandRouter::invoke(const std::string& name, const json& args) {
    auto it = m_commands.find(name);
    if (it == m_commands.end()) {
        throw CommandError("unknown command: " + name);
    }

    const Entry& entry = it->second;
    if (entry.capability && !isPermitted(*entry.capability)) {
        throw CommandError(std::string("permission denied: ") + capabilityName(*entry.capability) +
                           " is not enabled");
    }

    // Handlers run on the caller's copy so they may re-register commands
    Handler handler = entry.handler;
    try {
        return handler(args.is_null() ? json::object() : args);
    } catch (const json::exception& e) {
        throw CommandError(name + ": invalid arguments: " + e.what());
    }
}

std::string CommandRouter::handleLine(const std::string& line) {
    std::string name = line;
    std::string rawArgs;

    size_t spacePos = name.find(' ');
    if (spacePos != std::string::npos) {
        rawArgs = name.substr(spacePos + 1);
        name = name.substr(0, spacePos);
    }

    auto fail = [](const std::string& message) {
        return json{{"status", "error"}, {"message", message}}.dump();
    };

    json args = json::object();
    if (rawArgs.find_first_not_of(" \t\r\n") != std::string::npos) {
        try {
            args = json::parse(rawArgs);
        } catch (const json::parse_error& e) {
            return fail(std::string("invalid JSON arguments: ") + e.what());
        }
    }

    try {
        json data = invoke(name, args);
        return json{{"status", "ok"}, {"data", data}}.dump();
    } catch (const Error& e) {
        spdlog::warn("[Router] {} failed: {}", name, e.what());
        return fail(e.what());
    } catch (const std::exception& e) {
        spdlog::error("[Router] {} raised: {}", name, e.what());
        return fail(e.what());
    }
}

// ============================================================================
// Argument helpers
// ============================================================================

std::string requireString(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
        throw CommandError(std::string("missing string argument '") + key + "'");
    }
    return args[key].get<std::string>();
}

std::optional<std::string> optionalString(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) return std::nullopt;
    if (!args[key].is_string()) {
        throw CommandError(std::string("argument '") + key + "' must be a string");
    }
    return args[key].get<std::string>();
}

} // namespace clipfolio
