#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <cstddef>

namespace parcopy {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct CopyConfig {
    int threads;
    int64_t buffer_kb;
    int max_retries;
};

struct ProgressConfig {
    int refresh_interval_ms;
    std::string bar_format;
    bool show_speed;
    int64_t channel_capacity;
    int width;
};

struct LoggingConfig {
    int64_t rotation_size_mb;
    int64_t max_files;
    LogFormat format;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    CopyConfig copy;
    ProgressConfig progress;
    LoggingConfig logging;
};

LogLevel parseLogLevel(const std::string& level, LogLevel fallback);

class Config {
public:
    static Config& instance();
    
    bool load(const std::string& config_file = "");
    std::optional<std::string> findBestConfig() const;
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    std::string getConfigPath() const { return current_config_path_; }
    
    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

}}
