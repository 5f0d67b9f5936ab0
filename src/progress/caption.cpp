#include "parcopy/progress/caption.hpp"
#include <algorithm>

namespace parcopy {
namespace progress {

namespace {
constexpr const char* ELLIPSIS = "...";
constexpr size_t ELLIPSIS_SIZE = 3;
}

std::string trimCaption(const Caption& caption, int width) {
    const std::string& message = caption.message;
    const auto length = static_cast<long long>(message.size());
    
    if (length <= width) {
        return message;
    }
    
    // Ellipsis plus one column so the cursor never wraps.
    long long trim_size = length - width + static_cast<long long>(ELLIPSIS_SIZE) + 1;
    
    if (trim_size < length) {
        std::string trimmed = ELLIPSIS + message.substr(static_cast<size_t>(trim_size));
        
        // Drop the partial leading name.
        auto partial = trimmed.find(caption.separator);
        if (partial != std::string::npos && partial > 0) {
            trimmed = trimmed.substr(partial);
        }
        return trimmed;
    }
    
    auto keep = static_cast<size_t>(std::max(width, 0));
    return message.substr(message.size() - keep);
}

}}
