#include "clipfolio/Logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace clipfolio {

static constexpr size_t LOG_FILE_SIZE = 1024 * 1024;
static constexpr size_t LOG_FILE_COUNT = 3;

void initLogging(const std::string& level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, LOG_FILE_SIZE, LOG_FILE_COUNT));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("[Logging] File sink disabled ({}): {}", logFile, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("clipfolio", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace clipfolio
