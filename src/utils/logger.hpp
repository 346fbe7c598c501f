#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace powgate::utils {

struct LogOptions {
    std::string level = "info";          // trace, debug, info, warn, error, critical, off
    bool log_to_file = false;
    std::string file_path = "powgate.log";
};

/**
 * Process-wide spdlog logger
 *
 * Console output goes to stderr so command output on stdout stays clean.
 * Until init() is called the logger only reports warnings and above.
 */
class Logger {
public:
    static void init(const LogOptions& options);
    
    // Change the level of the current logger; unknown names map to info
    static void set_level(const std::string& level);
    
    static std::shared_ptr<spdlog::logger> get();
    
private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace powgate::utils

#define POWGATE_LOG_TRACE(...)    ::powgate::utils::Logger::get()->trace(__VA_ARGS__)
#define POWGATE_LOG_DEBUG(...)    ::powgate::utils::Logger::get()->debug(__VA_ARGS__)
#define POWGATE_LOG_INFO(...)     ::powgate::utils::Logger::get()->info(__VA_ARGS__)
#define POWGATE_LOG_WARN(...)     ::powgate::utils::Logger::get()->warn(__VA_ARGS__)
#define POWGATE_LOG_ERROR(...)    ::powgate::utils::Logger::get()->error(__VA_ARGS__)
#define POWGATE_LOG_CRITICAL(...) ::powgate::utils::Logger::get()->critical(__VA_ARGS__)
