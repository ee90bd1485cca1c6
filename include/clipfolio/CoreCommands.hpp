#pragma once
// history:*, projects:* and backup:* commands (always permitted)

#include "Forward.hpp"
#include <filesystem>

namespace clipfolio {

void registerCoreCommands(CommandRouter& router, AppStore& store,
                          const std::filesystem::path& dataDir);

} // namespace clipfolio
