#pragma once

#include <string>
#include <mutex>
#include <cstdio>

namespace parcopy {
namespace common {

class ConsoleSink {
public:
    virtual ~ConsoleSink() = default;
    
    virtual void write(const std::string& text) = 0;
    virtual void flush() = 0;
};

// Raw terminal writer. Text is passed through as is, escape sequences included.
class TerminalConsole : public ConsoleSink {
public:
    explicit TerminalConsole(FILE* stream = stdout);
    
    void write(const std::string& text) override;
    void flush() override;

private:
    FILE* stream_;
    std::mutex mutex_;
};

class NullConsole : public ConsoleSink {
public:
    void write(const std::string&) override {}
    void flush() override {}
};

bool isTerminal();
int terminalWidth();

}}
