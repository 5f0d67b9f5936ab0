#include "parcopy/common/logger.hpp"
#include "parcopy/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <iostream>
#include <filesystem>

namespace parcopy {
namespace common {

namespace {
// Console lines share the terminal with the progress bar; keep them short.
constexpr const char* CONSOLE_PATTERN = "parcopy: %^%l%$: %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
constexpr const char* JSON_PATTERN =
    R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"message":"%v"})";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        return;
    }
    
    auto spdlog_level = toSpdlogLevel(level);
    spdlog::sink_ptr sink;
    
    if (mode == LogMode::FILE_ONLY) {
        try {
            sink = createFileSink(log_file, spdlog_level, logging_config);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "parcopy: cannot open log file " << log_file << ": " << ex.what()
                      << ", logging to stderr" << std::endl;
            mode = LogMode::CONSOLE_ONLY;
        }
    }
    if (!sink) {
        sink = createConsoleSink(spdlog_level);
        console_sink_ = sink;
        console_level_ = spdlog_level;
    }
    
    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sink);
    logger_->set_level(spdlog_level);
    applyPattern(mode, logging_config.format);
    
    if (mode == LogMode::FILE_ONLY) {
        logger_->flush_on(spdlog::level::warn);
    }
    
    spdlog::register_logger(logger_);
    initialized_ = true;
    
    logger_->debug("[Logger] Initialized | mode={} | level={}",
                   mode == LogMode::FILE_ONLY ? "file" : "console",
                   spdlog::level::to_string_view(spdlog_level));
}

spdlog::sink_ptr Logger::createConsoleSink(spdlog::level::level_enum level) const {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_level(level);
    return sink;
}

spdlog::sink_ptr Logger::createFileSink(const std::string& log_file, spdlog::level::level_enum level,
                                        const LoggingConfig& logging_config) const {
    if (log_file.empty()) {
        throw spdlog::spdlog_ex("log file path required for FILE_ONLY mode");
    }
    
    std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
    std::error_code ec;
    if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
        std::filesystem::create_directories(log_dir, ec);
    }
    
    // Sizes arrive validated as positive
    size_t max_size = static_cast<size_t>(logging_config.rotation_size_mb) * 1024 * 1024;
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        getLogFileWithSuffix(logging_config.format, log_file), max_size,
        static_cast<size_t>(logging_config.max_files));
    sink->set_level(level);
    return sink;
}

void Logger::applyPattern(LogMode mode, LogFormat format) {
    if (mode == LogMode::CONSOLE_ONLY) {
        logger_->set_pattern(CONSOLE_PATTERN);
    } else if (format == LogFormat::JSON) {
        logger_->set_pattern(JSON_PATTERN);
    } else {
        logger_->set_pattern(FILE_PATTERN);
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    console_sink_.reset();
    initialized_ = false;
}

void Logger::holdConsole(LogLevel level) {
    if (!console_sink_) {
        return;
    }
    console_sink_->flush();
    console_sink_->set_level(std::max(console_level_, toSpdlogLevel(level)));
}

void Logger::releaseConsole() {
    if (console_sink_) {
        console_sink_->set_level(console_level_);
    }
}

std::optional<LogLevel> Logger::consoleLevel() const {
    if (!console_sink_) {
        return std::nullopt;
    }
    return fromSpdlogLevel(console_sink_->level());
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::warn;
}

LogLevel Logger::fromSpdlogLevel(spdlog::level::level_enum level) {
    if (level >= spdlog::level::err) return LogLevel::ERROR;
    if (level == spdlog::level::warn) return LogLevel::WARN;
    if (level == spdlog::level::info) return LogLevel::INFO;
    return LogLevel::DEBUG;
}

// copy.log becomes copy.json.log so text and JSON logs never share a file
std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) {
    if (format != LogFormat::JSON) {
        return base_path;
    }
    
    std::filesystem::path p(base_path);
    std::filesystem::path renamed = p.stem().string() + ".json" + p.extension().string();
    return (p.parent_path() / renamed).string();
}

}}
