#pragma once

#include "bar_renderer.hpp"
#include "command.hpp"
#include "command_channel.hpp"
#include "types.hpp"
#include "parcopy/common/console.hpp"
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace parcopy {
namespace progress {

// Owns the progress state and the terminal line. A single thread consumes the
// command channel, applies each command in arrival order and drives the
// renderer; the renderer's draw callback runs on that same thread, so the
// state needs no locking.
class ProgressActor {
public:
    ProgressActor(std::unique_ptr<BarRenderer> renderer,
                  std::shared_ptr<common::ConsoleSink> console,
                  size_t channel_capacity);
    ~ProgressActor();
    
    ProgressActor(const ProgressActor&) = delete;
    ProgressActor& operator=(const ProgressActor&) = delete;
    
    std::shared_ptr<CommandChannel> channel() const { return channel_; }
    std::shared_future<ProgressSummary> completion() const { return completion_; }

private:
    struct ProgressState {
        int64_t total = 0;
        int64_t current = 0;
        bool started = false;
        bool pending_redraw = false;
        std::string caption;
        size_t commands_processed = 0;
        size_t redraws = 0;
    };
    
    std::unique_ptr<BarRenderer> renderer_;
    std::shared_ptr<common::ConsoleSink> console_;
    std::shared_ptr<CommandChannel> channel_;
    std::promise<ProgressSummary> done_;
    std::shared_future<ProgressSummary> completion_;
    std::thread thread_;
    
    void run();
    
    bool apply(const commands::Extend& command, ProgressState& state);
    bool apply(const commands::Progress& command, ProgressState& state);
    bool apply(const commands::ErrorOnWrite& command, ProgressState& state);
    bool apply(const commands::ErrorOnRead& command, ProgressState& state);
    bool apply(const commands::SetCaption& command, ProgressState& state);
    bool apply(const commands::Finish& command, ProgressState& state);
    
    void draw(const std::string& bar_line, ProgressState& state);
};

}}
