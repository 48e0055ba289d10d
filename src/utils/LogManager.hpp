#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns plog appenders; settings come from [global] and [app.debug] in the config file.
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 5 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const std::string& config_path = "config.toml");

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Drops appenders and settings. Loggers registered earlier must no longer be used.
    static void Shutdown();

    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();

private:
    LogManager() = default;

    static void ReadConfig(const std::string& config_path);
    static void PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
