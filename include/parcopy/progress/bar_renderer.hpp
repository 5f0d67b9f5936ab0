#pragma once

#include <functional>
#include <string>
#include <cstdint>

namespace parcopy {
namespace progress {

// One-line progress bar. Implementations format the line and pass it to the
// draw callback; they never write to the terminal themselves. All calls,
// including the callback, happen on the thread that drives the renderer.
class BarRenderer {
public:
    using DrawCallback = std::function<void(const std::string& line)>;
    
    virtual ~BarRenderer() = default;
    
    virtual void setCallback(DrawCallback callback) = 0;
    
    virtual void setTotal(int64_t total) = 0;
    virtual int64_t total() const = 0;
    
    virtual void add(int64_t delta) = 0;
    virtual void set(int64_t position) = 0;
    virtual int64_t current() const = 0;
    
    virtual void start() = 0;
    virtual void finish() = 0;
    
    // Draws if the minimum refresh interval has elapsed since the last draw.
    virtual void refresh() = 0;
    
    virtual int width() const = 0;
};

}}
