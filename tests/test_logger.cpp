/**
 * Logger tests
 */

#include "test_harness.hpp"
#include "parcopy/common/config.hpp"
#include "parcopy/common/logger.hpp"

using namespace parcopy::common;

static LoggingConfig textLogging() {
    auto config = Config::createDefaultConfig();
    return config.logging;
}

TEST(calls_before_initialize_are_ignored) {
    auto& logger = Logger::instance();
    logger.warn("[Test] Not initialized | value={}", 1);
    logger.holdConsole(LogLevel::ERROR);
    logger.releaseConsole();
    ASSERT(!logger.consoleLevel());
}

TEST(console_hold_raises_threshold) {
    auto& logger = Logger::instance();
    logger.initialize(LogMode::CONSOLE_ONLY, "", LogLevel::WARN, textLogging());
    ASSERT(logger.consoleLevel() == LogLevel::WARN);
    
    logger.holdConsole(LogLevel::ERROR);
    ASSERT(logger.consoleLevel() == LogLevel::ERROR);
    
    logger.releaseConsole();
    ASSERT(logger.consoleLevel() == LogLevel::WARN);
    logger.shutdown();
}

TEST(console_hold_never_lowers_threshold) {
    auto& logger = Logger::instance();
    logger.initialize(LogMode::CONSOLE_ONLY, "", LogLevel::ERROR, textLogging());
    
    logger.holdConsole(LogLevel::DEBUG);
    ASSERT(logger.consoleLevel() == LogLevel::ERROR);
    
    logger.releaseConsole();
    ASSERT(logger.consoleLevel() == LogLevel::ERROR);
    logger.shutdown();
}

TEST(file_mode_ignores_console_hold) {
    TempDir dir;
    auto log_file = dir.path() / "logs" / "copy.log";
    
    auto& logger = Logger::instance();
    logger.initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::INFO, textLogging());
    ASSERT(!logger.consoleLevel());
    
    logger.holdConsole(LogLevel::ERROR);
    logger.warn("[Copy] Retrying | source={} | attempt={}", "/src/a", 1);
    logger.releaseConsole();
    logger.shutdown();
    
    std::string contents = readFile(log_file);
    ASSERT(contents.find("[Copy] Retrying | source=/src/a | attempt=1") != std::string::npos);
}

TEST(json_log_file_gets_suffix) {
    TempDir dir;
    auto logging = textLogging();
    logging.format = LogFormat::JSON;
    
    auto& logger = Logger::instance();
    logger.initialize(LogMode::FILE_ONLY, (dir.path() / "copy.log").string(), LogLevel::WARN, logging);
    logger.error("[Copy] Aborted | error={}", "disk full");
    logger.shutdown();
    
    std::string contents = readFile(dir.path() / "copy.json.log");
    ASSERT(contents.find("\"level\":\"error\"") != std::string::npos);
    ASSERT(contents.find("disk full") != std::string::npos);
}

int main() {
    printf("Logger tests\n");
    
    RUN_TEST(calls_before_initialize_are_ignored);
    RUN_TEST(console_hold_raises_threshold);
    RUN_TEST(console_hold_never_lowers_threshold);
    RUN_TEST(file_mode_ignores_console_hold);
    RUN_TEST(json_log_file_gets_suffix);
    
    return finishTests();
}
