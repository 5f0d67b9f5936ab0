#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace parcopy {
namespace cli {

// Base for subcommands. setup() declares the options on the CLI11
// subcommand and must call bind(); execute() runs only if it was invoked.
class MainCommand {
public:
    virtual ~MainCommand();
    
    virtual void setup(CLI::App* subcommand) = 0;
    virtual int execute() = 0;
    virtual bool validateArguments() const;
    
    bool wasCalled() const { return was_called_; }
    std::string name() const;

protected:
    CLI::App* subcommand_ = nullptr;
    
    void bind(CLI::App* subcommand);

private:
    bool was_called_ = false;
};

}}
