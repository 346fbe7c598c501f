#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace powgate::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {
    std::mutex logger_mutex;
    
    spdlog::level::level_enum parse_level(const std::string& level) {
        auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off") {
            return spdlog::level::info;
        }
        return parsed;
    }
    
    std::shared_ptr<spdlog::logger> create_logger(const LogOptions& options) {
        std::vector<spdlog::sink_ptr> sinks;
        
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
        
        if (options.log_to_file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file_path,
                1024 * 1024 * 5,  // 5MB
                3                  // 3 rotating files
            );
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }
        
        auto logger = std::make_shared<spdlog::logger>("powgate", sinks.begin(), sinks.end());
        logger->set_level(parse_level(options.level));
        logger->flush_on(spdlog::level::err);
        return logger;
    }
}

void Logger::init(const LogOptions& options) {
    auto logger = create_logger(options);
    
    std::lock_guard<std::mutex> lock(logger_mutex);
    logger_ = logger;
    spdlog::set_default_logger(logger_);
}

void Logger::set_level(const std::string& level) {
    get()->set_level(parse_level(level));
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!logger_) {
        LogOptions quiet;
        quiet.level = "warn";
        logger_ = create_logger(quiet);
        spdlog::set_default_logger(logger_);
    }
    return logger_;
}

} // namespace powgate::utils
