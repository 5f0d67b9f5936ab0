#include "parcopy/progress/command.hpp"

namespace parcopy {
namespace progress {

namespace {

struct CommandNamer {
    const char* operator()(const commands::Extend&) const { return "extend"; }
    const char* operator()(const commands::Progress&) const { return "progress"; }
    const char* operator()(const commands::Finish&) const { return "finish"; }
    const char* operator()(const commands::ErrorOnWrite&) const { return "error_on_write"; }
    const char* operator()(const commands::ErrorOnRead&) const { return "error_on_read"; }
    const char* operator()(const commands::SetCaption&) const { return "set_caption"; }
};

}

const char* commandName(const Command& command) {
    return std::visit(CommandNamer{}, command);
}

}}
