#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace tallow::transfer {

/// Process-wide engine logger. Init() is optional; the first Get() installs a
/// console logger at info level if nobody configured one.
class Logger {
public:
    struct Options {
        spdlog::level::level_enum level = spdlog::level::info;
        bool console = true;
        std::string file_path;
        size_t max_file_bytes = 5u * 1024u * 1024u;
        size_t max_files = 3;
    };

    static void Init(const Options& options);
    static void SetLevel(spdlog::level::level_enum level);
    static std::shared_ptr<spdlog::logger>& Get();

private:
    static std::shared_ptr<spdlog::logger> core_logger_;
};

}

#define TALLOW_LOG_TRACE(...) ::tallow::transfer::Logger::Get()->trace(__VA_ARGS__)
#define TALLOW_LOG_DEBUG(...) ::tallow::transfer::Logger::Get()->debug(__VA_ARGS__)
#define TALLOW_LOG_INFO(...)  ::tallow::transfer::Logger::Get()->info(__VA_ARGS__)
#define TALLOW_LOG_WARN(...)  ::tallow::transfer::Logger::Get()->warn(__VA_ARGS__)
#define TALLOW_LOG_ERROR(...) ::tallow::transfer::Logger::Get()->error(__VA_ARGS__)
