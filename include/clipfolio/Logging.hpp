#pragma once
// Default spdlog logger setup (stderr + rotating file)

#include <string>

namespace clipfolio {

// logFile may be empty to log to stderr only
void initLogging(const std::string& level, const std::string& logFile);

} // namespace clipfolio
