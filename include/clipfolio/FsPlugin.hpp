#pragma once
// Single Responsibility: fs:* commands scoped to the application data directory

#include "Plugin.hpp"
#include <filesystem>
#include <string>

namespace clipfolio {

// root / relative, normalized. Throws ScopeError for absolute paths and for
// paths that leave root.
std::filesystem::path resolveScoped(const std::filesystem::path& root,
                                    const std::string& relative);

class FsPlugin : public Plugin {
public:
    std::string name() const override { return "fs"; }
    Capability capability() const override { return Capability::Filesystem; }

    void setup(PluginHost& host) override;
};

} // namespace clipfolio
