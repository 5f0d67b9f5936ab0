#pragma once

#include "types.hpp"
#include <string>

namespace parcopy {
namespace progress {

// Fits caption.message into width columns. Keeps the tail of the message,
// prefixed with "..." and cut back to the first separator when there is one.
// The result is never longer than width.
std::string trimCaption(const Caption& caption, int width);

}}
