#include "lanshare/core/logger.hpp"
#include "lanshare/core/utils.hpp"
#include <spdlog/pattern_formatter.h>
#include <array>
#include <utility>

namespace lanshare::core {

namespace {
    constexpr std::size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
    constexpr std::size_t LOG_FILE_BACKUPS = 3;

    spdlog::level::level_enum to_spdlog(LogLevel level) {
        return static_cast<spdlog::level::level_enum>(level);
    }
}

std::mutex Logger::mutex_;
std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(to_spdlog(level));
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, LOG_FILE_MAX_BYTES, LOG_FILE_BACKUPS);
    file->set_level(to_spdlog(level));
    file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");

    auto logger = std::make_shared<spdlog::logger>("lanshare", spdlog::sinks_init_list{console, file});
    logger->set_level(to_spdlog(level));
    logger->flush_on(spdlog::level::warn);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        logger_ = logger;
    }
    spdlog::set_default_logger(logger);

    LOG_DEBUG("Logging to {} at level {}", log_file,
              spdlog::level::to_string_view(to_spdlog(level)));
}

void Logger::shutdown() {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logger.swap(logger_);
    }
    if (!logger) {
        return;
    }
    logger->flush();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logger_) {
            return logger_;
        }
    }

    // Warnings raised before initialize(), e.g. while reading the config file
    static auto early = [] {
        auto stderr_logger = std::make_shared<spdlog::logger>(
            "lanshare-early", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        stderr_logger->set_level(spdlog::level::warn);
        return stderr_logger;
    }();
    return early;
}

LogLevel Logger::parse_level(const std::string& name, LogLevel default_level) {
    static const std::array<std::pair<const char*, LogLevel>, 8> names = {{
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"critical", LogLevel::Critical},
        {"off", LogLevel::Off},
    }};

    auto wanted = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    for (const auto& [text, level] : names) {
        if (wanted == text) {
            return level;
        }
    }
    return default_level;
}

}
