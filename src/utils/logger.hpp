#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace trustpath::utils {

/**
 * Process-wide engine logger on top of spdlog
 */
class Logger {
public:
    /**
     * Replace the engine logger
     * @param level spdlog level name (trace, debug, info, warn, error,
     *              critical, off); unknown names select info
     * @param log_to_file Also write to a rotating trustpath.log
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    // Lazily initialized at warn level when init() was never called
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trustpath::utils

#define TRUSTPATH_LOG_TRACE(...)    trustpath::utils::Logger::get()->trace(__VA_ARGS__)
#define TRUSTPATH_LOG_DEBUG(...)    trustpath::utils::Logger::get()->debug(__VA_ARGS__)
#define TRUSTPATH_LOG_INFO(...)     trustpath::utils::Logger::get()->info(__VA_ARGS__)
#define TRUSTPATH_LOG_WARN(...)     trustpath::utils::Logger::get()->warn(__VA_ARGS__)
#define TRUSTPATH_LOG_ERROR(...)    trustpath::utils::Logger::get()->error(__VA_ARGS__)
#define TRUSTPATH_LOG_CRITICAL(...) trustpath::utils::Logger::get()->critical(__VA_ARGS__)
