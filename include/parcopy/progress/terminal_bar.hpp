#pragma once

#include "bar_renderer.hpp"
#include "parcopy/common/constants.hpp"
#include <chrono>
#include <string>

namespace parcopy {
namespace progress {

struct BarStyle {
    // Five characters: start, fill, head, empty, end.
    std::string format = constants::config_defaults::PROGRESS_BAR_FORMAT;
    std::chrono::milliseconds refresh_interval{constants::config_defaults::PROGRESS_REFRESH_INTERVAL_MS};
    bool show_speed = constants::config_defaults::PROGRESS_SHOW_SPEED;
    // 0 follows the terminal width.
    int width = 0;
};

class TerminalBar : public BarRenderer {
public:
    explicit TerminalBar(BarStyle style = BarStyle());
    
    void setCallback(DrawCallback callback) override;
    
    void setTotal(int64_t total) override;
    int64_t total() const override { return total_; }
    
    void add(int64_t delta) override;
    void set(int64_t position) override;
    int64_t current() const override { return current_; }
    
    void start() override;
    void finish() override;
    void refresh() override;
    
    int width() const override;
    
    std::string line() const;
    
    bool isStarted() const { return started_; }
    bool isFinished() const { return finished_; }

private:
    using Clock = std::chrono::steady_clock;
    
    BarStyle style_;
    DrawCallback callback_;
    
    int64_t total_ = 0;
    int64_t current_ = 0;
    bool started_ = false;
    bool finished_ = false;
    
    Clock::time_point start_time_;
    Clock::time_point last_draw_;
    
    void draw();
    std::string buildBar(int bar_width) const;
    double elapsedSeconds() const;
};

std::string formatBytes(int64_t bytes);
std::string formatRemaining(std::chrono::seconds remaining);

}}
