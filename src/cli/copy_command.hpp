#pragma once

#include "main_command.hpp"
#include "parcopy/copy/copier.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace parcopy {
namespace cli {

class CopyCommand : public MainCommand {
public:
    void setup(CLI::App* subcommand) override;
    int execute() override;
    
    bool validateArguments() const override;

private:
    std::vector<std::string> paths_;
    bool recursive_ = false;
    int threads_ = 0;
    int retries_ = -1;
    int buffer_kb_ = 0;
    bool no_progress_ = false;
    bool json_output_ = false;
    bool quiet_ = false;
    
    copy::CopyOptions buildOptions() const;
    bool shouldShowProgress() const;
};

}}
