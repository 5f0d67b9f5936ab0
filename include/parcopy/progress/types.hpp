#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace parcopy {
namespace progress {

struct Caption {
    std::string message;
    char separator = '/';
};

struct ProgressSummary {
    int64_t total = 0;
    int64_t current = 0;
    bool started = false;
    size_t commands_processed = 0;
    size_t redraws = 0;
};

}}
