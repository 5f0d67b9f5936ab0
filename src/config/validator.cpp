#include "parcopy/config/validator.hpp"
#include "parcopy/common/constants.hpp"
#include "parcopy/common/logger.hpp"
#include <filesystem>
#include <thread>

namespace parcopy {
namespace config {

namespace {
constexpr int64_t MAX_BUFFER_KB = 65536;
constexpr int MAX_REFRESH_INTERVAL_MS = 10000;
constexpr int64_t LARGE_CHANNEL_CAPACITY = 4096;
constexpr int64_t MAX_LOG_ROTATION_SIZE_MB = 10240;
constexpr int64_t MAX_LOG_FILES = 1000;
}

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;
    
    common::Logger::instance().debug("[Validator] Starting validation");
    
    if (!config.log_file.empty() &&
        !canCreateDirectory(std::filesystem::path(config.log_file).parent_path().string())) {
        result.errors.push_back("log_file: Cannot create parent directory");
        result.is_valid = false;
    }
    
    if (config.copy.threads < 1 || config.copy.threads > constants::limits::MAX_COPY_THREADS) {
        result.errors.push_back("copy.threads: Must be between 1-" +
                                std::to_string(constants::limits::MAX_COPY_THREADS));
        result.is_valid = false;
    }
    
    unsigned int cores = std::thread::hardware_concurrency();
    if (cores > 0 && config.copy.threads > static_cast<int>(cores) * 4) {
        result.warnings.push_back("copy.threads: Far more workers than CPU cores (" +
                                  std::to_string(cores) + ")");
    }
    
    if (config.copy.buffer_kb < 1 || config.copy.buffer_kb > MAX_BUFFER_KB) {
        result.errors.push_back("copy.buffer_kb: Must be between 1-" + std::to_string(MAX_BUFFER_KB));
        result.is_valid = false;
    }
    
    if (config.copy.max_retries < 0 || config.copy.max_retries > constants::limits::MAX_RETRIES) {
        result.errors.push_back("copy.max_retries: Must be between 0-" +
                                std::to_string(constants::limits::MAX_RETRIES));
        result.is_valid = false;
    }
    
    if (config.progress.refresh_interval_ms < 0 ||
        config.progress.refresh_interval_ms > MAX_REFRESH_INTERVAL_MS) {
        result.errors.push_back("progress.refresh_interval_ms: Must be between 0-" +
                                std::to_string(MAX_REFRESH_INTERVAL_MS));
        result.is_valid = false;
    }
    
    if (!validateBarFormat(config.progress.bar_format)) {
        result.errors.push_back("progress.bar_format: Must be exactly 5 characters (start, fill, head, empty, end)");
        result.is_valid = false;
    }
    
    if (config.progress.channel_capacity < 1) {
        result.errors.push_back("progress.channel_capacity: Must be >= 1");
        result.is_valid = false;
    }
    
    if (config.progress.channel_capacity > LARGE_CHANNEL_CAPACITY) {
        result.warnings.push_back(
            "progress.channel_capacity: Very high value, the bar may lag behind the copy"
        );
    }
    
    if (config.progress.width < 0) {
        result.errors.push_back("progress.width: Must be >= 0 (0=terminal width)");
        result.is_valid = false;
    }
    
    if (config.logging.rotation_size_mb < 1 || config.logging.rotation_size_mb > MAX_LOG_ROTATION_SIZE_MB) {
        result.errors.push_back("logging.rotation_size_mb: Must be between 1-" +
                                std::to_string(MAX_LOG_ROTATION_SIZE_MB));
        result.is_valid = false;
    }
    
    if (config.logging.max_files < 1 || config.logging.max_files > MAX_LOG_FILES) {
        result.errors.push_back("logging.max_files: Must be between 1-" + std::to_string(MAX_LOG_FILES));
        result.is_valid = false;
    }
    
    if (result.is_valid) {
        common::Logger::instance().info("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[Validator] Failed | errors={}", result.errors.size());
    }
    
    return result;
}

bool ConfigValidator::validateBarFormat(const std::string& format) {
    return format.size() == 5;
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    if (path.empty()) return true;
    
    std::error_code ec;
    std::filesystem::path p(path);
    
    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::is_directory(p, ec);
    }
    if (ec) return false;
    
    auto parent = p.parent_path();
    if (parent.empty() || parent == p) return true;
    
    if (std::filesystem::exists(parent, ec)) {
        auto perms = std::filesystem::status(parent, ec).permissions();
        if (ec) return false;
        return (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
    }
    
    return canCreateDirectory(parent.string());
}

}}
