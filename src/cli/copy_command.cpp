#include "copy_command.hpp"
#include "parcopy/common/config.hpp"
#include "parcopy/common/console.hpp"
#include "parcopy/common/constants.hpp"
#include "parcopy/common/logger.hpp"
#include "parcopy/copy/summary_formatter.hpp"
#include "parcopy/progress/progress_handle.hpp"
#include <filesystem>
#include <iostream>
#include <memory>

namespace parcopy {
namespace cli {

void CopyCommand::setup(CLI::App* subcommand) {
    bind(subcommand);
    
    subcommand->add_option("paths", paths_, "SOURCE... TARGET")
               ->required();
    
    subcommand->add_flag("-r,--recursive", recursive_,
                        "Copy directories recursively");
    subcommand->add_option("-t,--threads", threads_,
                          "Number of copy workers (default: from config)")
                          ->check(CLI::Range(1, constants::limits::MAX_COPY_THREADS));
    subcommand->add_option("--retries", retries_,
                          "Retries per file after a read or write error (default: from config)")
                          ->check(CLI::Range(0, constants::limits::MAX_RETRIES));
    subcommand->add_option("--buffer-kb", buffer_kb_,
                          "Copy buffer size in KiB (default: from config)")
                          ->check(CLI::Range(1, 65536));
    subcommand->add_flag("-p,--no-progress", no_progress_,
                        "Disable progress bar");
    subcommand->add_flag("--json", json_output_,
                        "Print the summary as JSON");
    subcommand->add_flag("-q,--quiet", quiet_,
                        "Quiet mode");
}

bool CopyCommand::validateArguments() const {
    return paths_.size() >= 2;
}

copy::CopyOptions CopyCommand::buildOptions() const {
    const auto& config = common::Config::instance().global();
    
    copy::CopyOptions options;
    options.threads = threads_ > 0 ? threads_ : config.copy.threads;
    options.max_retries = retries_ >= 0 ? retries_ : config.copy.max_retries;
    options.buffer_size = static_cast<size_t>(buffer_kb_ > 0 ? buffer_kb_ : config.copy.buffer_kb) * 1024;
    options.recursive = recursive_;
    return options;
}

bool CopyCommand::shouldShowProgress() const {
    return !no_progress_ && !quiet_ && !json_output_ && common::isTerminal();
}

int CopyCommand::execute() {
    if (!validateArguments()) {
        std::cerr << "Error: cp requires at least one SOURCE and a TARGET" << std::endl;
        return 1;
    }
    
    const auto& config = common::Config::instance().global();
    
    std::vector<std::filesystem::path> sources(paths_.begin(), paths_.end() - 1);
    std::filesystem::path target(paths_.back());
    
    auto& logger = common::Logger::instance();
    std::shared_ptr<common::ConsoleSink> console;
    if (shouldShowProgress()) {
        console = std::make_shared<common::TerminalConsole>();
        // The bar owns the terminal until finish()
        logger.holdConsole(common::LogLevel::ERROR);
    } else {
        console = std::make_shared<common::NullConsole>();
    }
    
    auto handle = progress::startProgressBar(console, progress::ProgressOptions::fromConfig(config.progress));
    
    copy::CopySummary summary;
    try {
        copy::Copier copier(handle, buildOptions());
        summary = copier.copy(sources, target);
    } catch (const std::exception& e) {
        handle.finish();
        logger.releaseConsole();
        logger.error("[Copy] Aborted | error={}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    
    auto bar = handle.finish();
    logger.releaseConsole();
    logger.debug("[Progress] Finished | total={} | current={} | redraws={}",
                                     bar.total, bar.current, bar.redraws);
    
    if (json_output_) {
        copy::SummaryFormatter formatter(copy::OutputFormat::JSON);
        formatter.formatSummary(summary, std::cout);
    } else if (!quiet_) {
        copy::SummaryFormatter formatter(copy::OutputFormat::TEXT);
        formatter.setColorsEnabled(common::isTerminal());
        formatter.formatSummary(summary, std::cout);
    }
    
    return summary.files_failed == 0 ? 0 : 1;
}

}}
