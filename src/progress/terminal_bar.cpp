#include "parcopy/progress/terminal_bar.hpp"
#include "parcopy/common/console.hpp"
#include "parcopy/common/constants.hpp"
#include "parcopy/common/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace parcopy {
namespace progress {

namespace {
constexpr size_t FORMAT_SIZE = 5;
}

TerminalBar::TerminalBar(BarStyle style) : style_(std::move(style)) {
    if (style_.format.size() != FORMAT_SIZE) {
        common::Logger::instance().warn("[Bar] Invalid format, using default | format={}", style_.format);
        style_.format = constants::config_defaults::PROGRESS_BAR_FORMAT;
    }
    start_time_ = Clock::now();
    last_draw_ = start_time_;
}

void TerminalBar::setCallback(DrawCallback callback) {
    callback_ = std::move(callback);
}

void TerminalBar::setTotal(int64_t total) {
    total_ = std::max<int64_t>(total, 0);
}

void TerminalBar::add(int64_t delta) {
    current_ = std::max<int64_t>(current_ + delta, 0);
}

void TerminalBar::set(int64_t position) {
    current_ = std::max<int64_t>(position, 0);
}

void TerminalBar::start() {
    if (started_) {
        return;
    }
    started_ = true;
    start_time_ = Clock::now();
    draw();
}

void TerminalBar::finish() {
    if (finished_) {
        return;
    }
    if (started_) {
        draw();
    }
    finished_ = true;
}

void TerminalBar::refresh() {
    if (!started_ || finished_) {
        return;
    }
    if (Clock::now() - last_draw_ >= style_.refresh_interval) {
        draw();
    }
}

int TerminalBar::width() const {
    if (style_.width > 0) {
        return style_.width;
    }
    return common::terminalWidth();
}

void TerminalBar::draw() {
    last_draw_ = Clock::now();
    if (callback_) {
        callback_(line());
    }
}

double TerminalBar::elapsedSeconds() const {
    return std::chrono::duration<double>(Clock::now() - start_time_).count();
}

std::string TerminalBar::line() const {
    if (total_ <= 0) {
        return formatBytes(current_);
    }
    
    std::string counters = formatBytes(current_) + " / " + formatBytes(total_);
    
    double ratio = std::clamp(static_cast<double>(current_) / static_cast<double>(total_), 0.0, 1.0);
    std::string tail = fmt::format(" {:.2f}%", ratio * 100.0);
    
    double elapsed = elapsedSeconds();
    if (started_ && elapsed > 0.0) {
        double rate = static_cast<double>(current_) / elapsed;
        if (style_.show_speed) {
            tail += " " + formatBytes(static_cast<int64_t>(rate)) + "/s";
        }
        if (rate > 0.0 && current_ < total_) {
            auto remaining = static_cast<int64_t>(static_cast<double>(total_ - current_) / rate);
            tail += " " + formatRemaining(std::chrono::seconds(remaining));
        }
    }
    
    // One column is kept free so the line never wraps.
    int bar_width = width() - static_cast<int>(counters.size() + tail.size()) - 2;
    if (bar_width < 3) {
        return counters + tail;
    }
    
    return counters + " " + buildBar(bar_width) + tail;
}

std::string TerminalBar::buildBar(int bar_width) const {
    const std::string& format = style_.format;
    int inner = bar_width - 2;
    
    double ratio = std::clamp(static_cast<double>(current_) / static_cast<double>(total_), 0.0, 1.0);
    int filled = static_cast<int>(inner * ratio);
    
    std::string bar;
    bar.reserve(static_cast<size_t>(bar_width));
    bar += format[0];
    if (filled > 0) {
        bar.append(static_cast<size_t>(filled - 1), format[1]);
        bar += (filled < inner) ? format[2] : format[1];
    }
    bar.append(static_cast<size_t>(inner - filled), format[3]);
    bar += format[4];
    return bar;
}

std::string formatBytes(int64_t bytes) {
    if (bytes < 0) bytes = 0;
    
    constexpr double KIB = 1024.0;
    double value = static_cast<double>(bytes);
    
    if (value < KIB) return fmt::format("{} B", bytes);
    if (value < KIB * KIB) return fmt::format("{:.2f} KiB", value / KIB);
    if (value < KIB * KIB * KIB) return fmt::format("{:.2f} MiB", value / (KIB * KIB));
    if (value < KIB * KIB * KIB * KIB) return fmt::format("{:.2f} GiB", value / (KIB * KIB * KIB));
    return fmt::format("{:.2f} TiB", value / (KIB * KIB * KIB * KIB));
}

std::string formatRemaining(std::chrono::seconds remaining) {
    auto total = remaining.count();
    if (total < 0) total = 0;
    
    if (total < 60) {
        return fmt::format("{}s", total);
    }
    if (total < 3600) {
        return fmt::format("{}m{}s", total / 60, total % 60);
    }
    return fmt::format("{}h{}m", total / 3600, (total % 3600) / 60);
}

}}
