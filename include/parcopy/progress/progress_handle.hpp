#pragma once

#include "bar_renderer.hpp"
#include "types.hpp"
#include "parcopy/common/config.hpp"
#include "parcopy/common/constants.hpp"
#include "parcopy/common/console.hpp"
#include "parcopy/io/reader.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace parcopy {
namespace progress {

class CommandChannel;
class ProgressActor;
class ProgressReader;

struct ProgressOptions {
    std::chrono::milliseconds refresh_interval{constants::config_defaults::PROGRESS_REFRESH_INTERVAL_MS};
    std::string bar_format = constants::config_defaults::PROGRESS_BAR_FORMAT;
    bool show_speed = constants::config_defaults::PROGRESS_SHOW_SPEED;
    size_t channel_capacity = constants::config_defaults::PROGRESS_CHANNEL_CAPACITY;
    int width = constants::config_defaults::PROGRESS_WIDTH;
    
    static ProgressOptions fromConfig(const common::ProgressConfig& config);
};

// Producer side of the progress bar. Copies share one actor and may be used
// from any thread. finish() is called once, by the coordinator, after every
// producer has stopped sending.
class ProgressHandle {
public:
    explicit ProgressHandle(std::shared_ptr<ProgressActor> actor);
    
    void extend(int64_t total) const;
    void progress(int64_t delta) const;
    void errorOnWrite(int64_t size) const;
    void errorOnRead(int64_t size) const;
    void setCaption(Caption caption) const;
    
    // Blocks until the actor has drawn its last frame, then closes the channel.
    ProgressSummary finish() const;
    
    std::unique_ptr<ProgressReader> newProxyReader(std::unique_ptr<io::ByteReader> reader,
                                                   int64_t already_counted = 0) const;

private:
    std::shared_ptr<ProgressActor> actor_;
    std::shared_ptr<CommandChannel> channel_;
    std::shared_future<ProgressSummary> completion_;
};

ProgressHandle startProgressBar(std::shared_ptr<common::ConsoleSink> console,
                                const ProgressOptions& options = ProgressOptions());

ProgressHandle startProgressBar(std::unique_ptr<BarRenderer> renderer,
                                std::shared_ptr<common::ConsoleSink> console,
                                size_t channel_capacity);

}}
