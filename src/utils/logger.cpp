#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace trustpath::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {
    std::mutex logger_mutex;

    constexpr const char* LOG_FILE = "trustpath.log";
    constexpr size_t LOG_FILE_SIZE = 10 * 1024 * 1024;
    constexpr size_t LOG_FILE_COUNT = 3;

    spdlog::level::level_enum parse_level(const std::string& level) {
        auto parsed = spdlog::level::from_str(level);
        // from_str maps unknown names to "off"
        if (parsed == spdlog::level::off && level != "off") {
            return spdlog::level::info;
        }
        return parsed;
    }
}

void Logger::init(const std::string& level, bool log_to_file) {
    std::vector<spdlog::sink_ptr> sinks;

    // stdout carries query results; diagnostics go to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    if (log_to_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            LOG_FILE, LOG_FILE_SIZE, LOG_FILE_COUNT);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("trustpath", sinks.begin(), sinks.end());
    logger->set_level(parse_level(level));
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(logger_mutex);
    logger_ = logger;
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(logger_mutex);
        if (logger_) {
            return logger_;
        }
    }
    // Library use without explicit init: warnings and up only
    init("warn");
    std::lock_guard<std::mutex> lock(logger_mutex);
    return logger_;
}

} // namespace trustpath::utils
