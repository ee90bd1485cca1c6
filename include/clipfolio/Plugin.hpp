#pragma once
// Plugin interface: one capability, a set of commands, an optional lifecycle

#include "Capability.hpp"
#include "Forward.hpp"
#include <string>

namespace clipfolio {

// Everything a plugin may touch during setup. Owned by AppBuilder::run and
// valid until every plugin has been shut down.
struct PluginHost {
    CommandRouter& router;
    KeyValueStorage& storage;
    AppStore& store;
    ImageStore& images;
    const AppContext& context;
    Runtime& runtime;
};

class Plugin {
public:
    virtual ~Plugin() = default;

    virtual std::string name() const = 0;
    virtual Capability capability() const = 0;

    // Registers commands and starts background work; throws on failure
    virtual void setup(PluginHost& host) = 0;

    // Called in reverse setup order, only for plugins whose setup succeeded
    virtual void shutdown() {}
};

} // namespace clipfolio
