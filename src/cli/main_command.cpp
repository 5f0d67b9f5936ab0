#include "main_command.hpp"

namespace parcopy {
namespace cli {

MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

std::string MainCommand::name() const {
    return subcommand_ ? subcommand_->get_name() : std::string();
}

void MainCommand::bind(CLI::App* subcommand) {
    subcommand_ = subcommand;
    subcommand_->callback([this]() { was_called_ = true; });
}

}}
