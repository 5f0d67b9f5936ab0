#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "parcopy/common/config.hpp"
#include "parcopy/common/constants.hpp"
#include "parcopy/common/logger.hpp"
#include "parcopy/config/validator.hpp"
#include "cli/copy_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Parallel file copy with a progress bar", parcopy::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", parcopy::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        bool debug = false;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_flag("--debug", debug, "Enable debug logging");
        
        std::unique_ptr<parcopy::cli::MainCommand> copy_cmd = std::make_unique<parcopy::cli::CopyCommand>();
        copy_cmd->setup(app.add_subcommand("cp", "Copy files and directories"));
        
        CLI11_PARSE(app, argc, argv);
        
        auto& config = parcopy::common::Config::instance();
        if (!config.load(config_file)) {
            std::cerr << "Error: Failed to load configuration: "
                      << (config_file.empty() ? std::string("(search path)") : config_file) << std::endl;
            return 1;
        }
        
        parcopy::config::ConfigValidator validator;
        auto validation = validator.validate(config.global());
        if (!validation.is_valid) {
            std::cerr << "Error: Invalid configuration";
            if (!config.getConfigPath().empty()) {
                std::cerr << " in " << config.getConfigPath();
            }
            std::cerr << std::endl;
            for (const auto& error : validation.errors) {
                std::cerr << "  " << error << std::endl;
            }
            return 1;
        }
        
        auto level = debug ? parcopy::common::LogLevel::DEBUG : config.global().log_level;
        auto mode = config.global().log_file.empty()
            ? parcopy::common::LogMode::CONSOLE_ONLY
            : parcopy::common::LogMode::FILE_ONLY;
        
        parcopy::common::Logger::instance().initialize(
            mode,
            config.global().log_file,
            level,
            config.global().logging
        );
        
        for (const auto& warning : validation.warnings) {
            parcopy::common::Logger::instance().warn("[Config] {}", warning);
        }
        
        int rc = 0;
        if (copy_cmd->wasCalled()) {
            parcopy::common::Logger::instance().debug("[CLI] Running | command={}", copy_cmd->name());
            rc = copy_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        parcopy::common::Logger::instance().shutdown();
        return rc;
        
    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
