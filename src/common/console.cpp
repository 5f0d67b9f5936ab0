#include "parcopy/common/console.hpp"
#include "parcopy/common/constants.hpp"
#include <sys/ioctl.h>
#include <unistd.h>

namespace parcopy {
namespace common {

TerminalConsole::TerminalConsole(FILE* stream) : stream_(stream) {}

void TerminalConsole::write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    fwrite(text.data(), 1, text.size(), stream_);
}

void TerminalConsole::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stream_);
}

bool isTerminal() {
    return isatty(STDOUT_FILENO) != 0;
}

int terminalWidth() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return constants::terminal::DEFAULT_WIDTH;
}

}}
