#include "core/logging.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <vector>

namespace occm {

namespace {

constexpr std::size_t kMaxLogFileSize = 2 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

}

void Logger::setup_loggers(const std::string& log_dir, spdlog::level::level_enum level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (!ec) {
            const std::string log_file = (std::filesystem::path(log_dir) / "occm.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, kMaxLogFileSize, kMaxLogFiles));
        }
    }

    for (const char* name : {"core_logger", "ui_logger"}) {
        if (spdlog::get(name)) {
            spdlog::drop(name);
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name) {
    return spdlog::get(name);
}

spdlog::level::level_enum Logger::parse_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"; only honour an explicit "off".
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

}
