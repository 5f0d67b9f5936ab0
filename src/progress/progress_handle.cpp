#include "parcopy/progress/progress_handle.hpp"
#include "parcopy/progress/command_channel.hpp"
#include "parcopy/progress/progress_actor.hpp"
#include "parcopy/progress/progress_reader.hpp"
#include "parcopy/progress/terminal_bar.hpp"
#include <stdexcept>

namespace parcopy {
namespace progress {

ProgressOptions ProgressOptions::fromConfig(const common::ProgressConfig& config) {
    ProgressOptions options;
    options.refresh_interval = std::chrono::milliseconds(config.refresh_interval_ms);
    options.bar_format = config.bar_format;
    options.show_speed = config.show_speed;
    options.channel_capacity = static_cast<size_t>(config.channel_capacity);
    options.width = config.width;
    return options;
}

ProgressHandle::ProgressHandle(std::shared_ptr<ProgressActor> actor)
    : actor_(std::move(actor)) {
    if (!actor_) {
        throw std::invalid_argument("progress handle requires an actor");
    }
    channel_ = actor_->channel();
    completion_ = actor_->completion();
}

void ProgressHandle::extend(int64_t total) const {
    channel_->send(commands::Extend{total});
}

void ProgressHandle::progress(int64_t delta) const {
    channel_->send(commands::Progress{delta});
}

void ProgressHandle::errorOnWrite(int64_t size) const {
    channel_->send(commands::ErrorOnWrite{size});
}

void ProgressHandle::errorOnRead(int64_t size) const {
    channel_->send(commands::ErrorOnRead{size});
}

void ProgressHandle::setCaption(Caption caption) const {
    channel_->send(commands::SetCaption{std::move(caption)});
}

ProgressSummary ProgressHandle::finish() const {
    channel_->send(commands::Finish{});
    auto summary = completion_.get();
    channel_->close();
    return summary;
}

std::unique_ptr<ProgressReader> ProgressHandle::newProxyReader(std::unique_ptr<io::ByteReader> reader,
                                                               int64_t already_counted) const {
    return std::make_unique<ProgressReader>(std::move(reader), *this, already_counted);
}

ProgressHandle startProgressBar(std::shared_ptr<common::ConsoleSink> console,
                                const ProgressOptions& options) {
    BarStyle style;
    style.format = options.bar_format;
    style.refresh_interval = options.refresh_interval;
    style.show_speed = options.show_speed;
    style.width = options.width;
    
    return startProgressBar(std::make_unique<TerminalBar>(style), std::move(console),
                            options.channel_capacity);
}

ProgressHandle startProgressBar(std::unique_ptr<BarRenderer> renderer,
                                std::shared_ptr<common::ConsoleSink> console,
                                size_t channel_capacity) {
    auto actor = std::make_shared<ProgressActor>(std::move(renderer), std::move(console),
                                                 channel_capacity);
    return ProgressHandle(std::move(actor));
}

}}
