#include "tallow/core/logger.hpp"
#include <mutex>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tallow::transfer {

std::shared_ptr<spdlog::logger> Logger::core_logger_;

namespace {
    constexpr const char* kLoggerName = "tallow";
    std::mutex& LoggerMutex() {
        static std::mutex mutex;
        return mutex;
    }

    std::shared_ptr<spdlog::logger> BuildLogger(const Logger::Options& options) {
        std::vector<spdlog::sink_ptr> sinks;
        if (options.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [tallow] %v");
            sinks.push_back(std::move(console_sink));
        }
        if (!options.file_path.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file_path, options.max_file_bytes, options.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(std::move(file_sink));
        }
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(options.level);
        logger->flush_on(spdlog::level::warn);
        return logger;
    }
}

// Call before any engine is started; loggers handed out earlier keep their sinks.
void Logger::Init(const Options& options) {
    std::lock_guard<std::mutex> guard(LoggerMutex());
    core_logger_ = BuildLogger(options);
    spdlog::drop(kLoggerName);
    spdlog::register_logger(core_logger_);
}

void Logger::SetLevel(const spdlog::level::level_enum level) {
    Get()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    std::lock_guard<std::mutex> guard(LoggerMutex());
    if (!core_logger_) {
        core_logger_ = BuildLogger(Options{});
        spdlog::drop(kLoggerName);
        spdlog::register_logger(core_logger_);
    }
    return core_logger_;
}

}
