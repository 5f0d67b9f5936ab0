#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace parcopy {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("parcopy v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "parcopy";
    constexpr const char* CONFIG_ENV = "PARCOPY_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "parcopy.conf";
    constexpr const char* SYSTEM_CONFIG_DIR = "/etc/parcopy";
    constexpr const char* LOGGER_NAME = "parcopy";
}

namespace terminal {
    constexpr int DEFAULT_WIDTH = 80;
    constexpr const char* CURSOR_UP = "\033[1A";
}

namespace limits {
    constexpr int DEFAULT_COPY_THREADS = 4;
    constexpr int MAX_COPY_THREADS = 64;
    constexpr int64_t DEFAULT_BUFFER_KB = 128;
    constexpr int DEFAULT_MAX_RETRIES = 1;
    constexpr int MAX_RETRIES = 10;
    
    constexpr int DEFAULT_REFRESH_INTERVAL_MS = 10;
    constexpr int64_t DEFAULT_CHANNEL_CAPACITY = 1;
    
    constexpr int64_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr int64_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr int COPY_THREADS = limits::DEFAULT_COPY_THREADS;
    constexpr int64_t COPY_BUFFER_KB = limits::DEFAULT_BUFFER_KB;
    constexpr int COPY_MAX_RETRIES = limits::DEFAULT_MAX_RETRIES;
    
    constexpr int PROGRESS_REFRESH_INTERVAL_MS = limits::DEFAULT_REFRESH_INTERVAL_MS;
    // Feels like wget
    constexpr const char* PROGRESS_BAR_FORMAT = "[=> ]";
    constexpr bool PROGRESS_SHOW_SPEED = true;
    constexpr int64_t PROGRESS_CHANNEL_CAPACITY = limits::DEFAULT_CHANNEL_CAPACITY;
    constexpr int PROGRESS_WIDTH = 0;
    
    constexpr int64_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr int64_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
