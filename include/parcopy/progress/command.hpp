#pragma once

#include "types.hpp"
#include <variant>
#include <cstdint>

namespace parcopy {
namespace progress {

namespace commands {

struct Extend {
    int64_t total = 0;
};

struct Progress {
    int64_t delta = 0;
};

struct Finish {};

// Bytes already counted as progress whose write failed afterwards.
struct ErrorOnWrite {
    int64_t size = 0;
};

// Bytes a reader gave up on; they will not be transferred.
struct ErrorOnRead {
    int64_t size = 0;
};

struct SetCaption {
    Caption caption;
};

}

using Command = std::variant<
    commands::Extend,
    commands::Progress,
    commands::Finish,
    commands::ErrorOnWrite,
    commands::ErrorOnRead,
    commands::SetCaption>;

const char* commandName(const Command& command);

}}
