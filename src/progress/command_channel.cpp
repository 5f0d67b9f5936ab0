#include "parcopy/progress/command_channel.hpp"
#include <stdexcept>
#include <string>

namespace parcopy {
namespace progress {

CommandChannel::CommandChannel(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {
    queue_.set_capacity(static_cast<Queue::size_type>(capacity_));
}

void CommandChannel::send(Command command) {
    if (isClosed()) {
        throw std::logic_error(std::string("progress channel closed, cannot send ") + commandName(command));
    }
    queue_.push(std::move(command));
}

Command CommandChannel::receive() {
    Command command;
    queue_.pop(command);
    return command;
}

void CommandChannel::close() {
    closed_.store(true, std::memory_order_release);
}

}}
