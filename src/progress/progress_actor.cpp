#include "parcopy/progress/progress_actor.hpp"
#include "parcopy/progress/caption.hpp"
#include "parcopy/common/constants.hpp"
#include "parcopy/common/logger.hpp"
#include <chrono>
#include <stdexcept>

namespace parcopy {
namespace progress {

ProgressActor::ProgressActor(std::unique_ptr<BarRenderer> renderer,
                             std::shared_ptr<common::ConsoleSink> console,
                             size_t channel_capacity)
    : renderer_(std::move(renderer)),
      console_(std::move(console)),
      channel_(std::make_shared<CommandChannel>(channel_capacity)),
      completion_(done_.get_future().share()) {
    if (!renderer_) {
        throw std::invalid_argument("progress actor requires a renderer");
    }
    if (!console_) {
        console_ = std::make_shared<common::NullConsole>();
    }
    thread_ = std::thread(&ProgressActor::run, this);
}

ProgressActor::~ProgressActor() {
    if (!thread_.joinable()) {
        return;
    }
    
    if (completion_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        common::Logger::instance().warn("[Progress] Released without finish, shutting down");
        if (!channel_->isClosed()) {
            channel_->send(commands::Finish{});
        }
        completion_.wait();
        channel_->close();
    }
    
    thread_.join();
}

void ProgressActor::run() {
    ProgressState state;
    
    renderer_->setCallback([this, &state](const std::string& bar_line) {
        draw(bar_line, state);
    });
    
    common::Logger::instance().debug("[Progress] Actor started | capacity={}", channel_->capacity());
    
    bool running = true;
    while (running) {
        Command command = channel_->receive();
        state.commands_processed++;
        
        try {
            running = std::visit([this, &state](const auto& cmd) {
                return apply(cmd, state);
            }, command);
            
            if (running && state.started) {
                renderer_->refresh();
            }
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Progress] Command failed | command={} | error={}",
                                             commandName(command), e.what());
        }
    }
    
    renderer_->setCallback(nullptr);
    common::Logger::instance().debug("[Progress] Actor stopped | total={} | current={} | commands={}",
                                     state.total, state.current, state.commands_processed);
}

bool ProgressActor::apply(const commands::Extend& command, ProgressState& state) {
    if (command.total < 0) {
        common::Logger::instance().debug("[Progress] Negative extend ignored | total={}", command.total);
        return true;
    }
    state.total += command.total;
    renderer_->setTotal(state.total);
    return true;
}

bool ProgressActor::apply(const commands::Progress& command, ProgressState& state) {
    if (state.total > 0 && !state.started) {
        state.started = true;
        state.pending_redraw = true;
        renderer_->start();
    }
    if (command.delta > 0) {
        state.current += command.delta;
        renderer_->add(command.delta);
    }
    return true;
}

bool ProgressActor::apply(const commands::ErrorOnWrite& command, ProgressState& state) {
    state.pending_redraw = true;
    if (state.current > command.size) {
        state.current -= command.size;
        renderer_->set(state.current);
    }
    return true;
}

bool ProgressActor::apply(const commands::ErrorOnRead& command, ProgressState& state) {
    state.pending_redraw = true;
    if (command.size > 0) {
        state.current += command.size;
        renderer_->add(command.size);
    }
    return true;
}

bool ProgressActor::apply(const commands::SetCaption& command, ProgressState& state) {
    state.caption = trimCaption(command.caption, renderer_->width());
    return true;
}

bool ProgressActor::apply(const commands::Finish&, ProgressState& state) {
    try {
        if (state.started) {
            renderer_->finish();
            console_->write("\n");
        }
        console_->flush();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Progress] Final render failed | error={}", e.what());
    }
    
    ProgressSummary summary;
    summary.total = state.total;
    summary.current = state.current;
    summary.started = state.started;
    summary.commands_processed = state.commands_processed;
    summary.redraws = state.redraws;
    done_.set_value(summary);
    return false;
}

void ProgressActor::draw(const std::string& bar_line, ProgressState& state) {
    if (state.pending_redraw) {
        console_->write("\n");
    }
    // Clear the caption line
    console_->write("\r" + std::string(constants::terminal::CURSOR_UP) +
                    std::string(bar_line.size(), ' ') + "\r");
    console_->write(state.caption + "\n" + bar_line);
    console_->flush();
    
    state.pending_redraw = false;
    state.redraws++;
}

}}
