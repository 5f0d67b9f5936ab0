#include "parcopy/common/config.hpp"
#include "parcopy/common/constants.hpp"
#include "parcopy/common/paths.hpp"
#include "parcopy/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <unistd.h>

namespace parcopy {
namespace common {

LogLevel parseLogLevel(const std::string& level, LogLevel fallback) {
    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "INFO") return LogLevel::INFO;
    if (level == "WARN") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    return fallback;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.log_level = LogLevel::WARN;
    config.log_file = "";
    
    config.copy.threads = COPY_THREADS;
    config.copy.buffer_kb = COPY_BUFFER_KB;
    config.copy.max_retries = COPY_MAX_RETRIES;
    
    config.progress.refresh_interval_ms = PROGRESS_REFRESH_INTERVAL_MS;
    config.progress.bar_format = PROGRESS_BAR_FORMAT;
    config.progress.show_speed = PROGRESS_SHOW_SPEED;
    config.progress.channel_capacity = PROGRESS_CHANNEL_CAPACITY;
    config.progress.width = PROGRESS_WIDTH;
    
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    return config;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();
    
    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    current_config_path_.clear();
    
    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }
    
    if (!tryLoadTomlFile(effective_config_file)) {
        global_ = createDefaultConfig();
        return false;
    }
    
    current_config_path_ = effective_config_file;
    return true;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warn("[Config] File not found | path={}", path);
        return false;
    }
    
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] File not readable | path={}", path);
        return false;
    }
    
    try {
        auto data = toml::parse(path);
        
        if (data.contains("global")) {
            auto global_section = data.at("global");
            
            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                std::string level = toml::find<std::string>(global_section, "log_level");
                global_.log_level = parseLogLevel(level, global_.log_level);
            }
        }
        
        if (data.contains("copy")) {
            auto copy_section = data.at("copy");
            
            if (copy_section.contains("threads")) {
                global_.copy.threads = toml::find<int>(copy_section, "threads");
            }
            if (copy_section.contains("buffer_kb")) {
                global_.copy.buffer_kb = toml::find<int64_t>(copy_section, "buffer_kb");
            }
            if (copy_section.contains("max_retries")) {
                global_.copy.max_retries = toml::find<int>(copy_section, "max_retries");
            }
        }
        
        if (data.contains("progress")) {
            auto progress_section = data.at("progress");
            
            if (progress_section.contains("refresh_interval_ms")) {
                global_.progress.refresh_interval_ms = toml::find<int>(progress_section, "refresh_interval_ms");
            }
            if (progress_section.contains("bar_format")) {
                global_.progress.bar_format = toml::find<std::string>(progress_section, "bar_format");
            }
            if (progress_section.contains("show_speed")) {
                global_.progress.show_speed = toml::find<bool>(progress_section, "show_speed");
            }
            if (progress_section.contains("channel_capacity")) {
                global_.progress.channel_capacity = toml::find<int64_t>(progress_section, "channel_capacity");
            }
            if (progress_section.contains("width")) {
                global_.progress.width = toml::find<int>(progress_section, "width");
            }
        }
        
        if (data.contains("logging")) {
            auto logging_section = data.at("logging");
            
            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<int64_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<int64_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                if (format_str == "json") {
                    global_.logging.format = LogFormat::JSON;
                } else {
                    global_.logging.format = LogFormat::TEXT;
                }
            }
        }
        
        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

}}
