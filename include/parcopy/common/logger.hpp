#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <optional>
#include <string>

namespace parcopy {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

// Process-wide logger. Until initialize() runs every call is a no-op, so
// library code and tests may log freely.
class Logger {
public:
    static Logger& instance();
    
    void initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config);
    void shutdown();
    
    // Console lines below `level` are dropped until releaseConsole(), so they
    // cannot break into a progress bar. Never lowers the configured level.
    void holdConsole(LogLevel level);
    void releaseConsole();
    std::optional<LogLevel> consoleLevel() const;
    
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (logger_) logger_->error(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (logger_) logger_->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (logger_) logger_->info(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (logger_) logger_->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::sink_ptr console_sink_;
    spdlog::level::level_enum console_level_ = spdlog::level::warn;
    bool initialized_ = false;
    
    spdlog::sink_ptr createConsoleSink(spdlog::level::level_enum level) const;
    spdlog::sink_ptr createFileSink(const std::string& log_file, spdlog::level::level_enum level,
                                    const LoggingConfig& logging_config) const;
    void applyPattern(LogMode mode, LogFormat format);
    
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level);
    static LogLevel fromSpdlogLevel(spdlog::level::level_enum level);
    static std::string getLogFileWithSuffix(LogFormat format, const std::string& base_path);
};

}}
