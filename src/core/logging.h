#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <memory>
#include <string>
#include <utility>

namespace occm {

class Logger {
public:
    // Creates "core_logger" and "ui_logger", both writing to stderr and to a
    // rotating file under log_dir. Throws spdlog::spdlog_ex on sink failure.
    static void setup_loggers(const std::string& log_dir,
                              spdlog::level::level_enum level = spdlog::level::info);

    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static spdlog::level::level_enum parse_level(const std::string& name);
};

template <typename... Args>
void log_to(const char* logger_name, spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger(logger_name)) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

template <typename... Args>
void core_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    log_to("core_logger", level, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void ui_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    log_to("ui_logger", level, fmt, std::forward<Args>(args)...);
}

}
