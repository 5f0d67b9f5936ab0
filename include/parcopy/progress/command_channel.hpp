#pragma once

#include "command.hpp"
#include <tbb/concurrent_queue.h>
#include <atomic>
#include <cstddef>

namespace parcopy {
namespace progress {

// Bounded FIFO between producers and the progress actor. Senders block while
// the queue is full. Once closed, any further send throws std::logic_error.
class CommandChannel {
public:
    explicit CommandChannel(size_t capacity);
    
    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;
    
    void send(Command command);
    Command receive();
    
    void close();
    bool isClosed() const { return closed_.load(std::memory_order_acquire); }
    
    size_t capacity() const { return capacity_; }

private:
    using Queue = tbb::concurrent_bounded_queue<Command>;
    
    Queue queue_;
    size_t capacity_;
    std::atomic<bool> closed_{false};
};

}}
