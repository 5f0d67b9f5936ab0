#include "parcopy/progress/progress_reader.hpp"
#include <algorithm>

namespace parcopy {
namespace progress {

ProgressReader::ProgressReader(std::unique_ptr<io::ByteReader> reader, ProgressHandle handle,
                               int64_t already_counted)
    : reader_(std::move(reader)), handle_(std::move(handle)),
      already_counted_(std::max<int64_t>(already_counted, 0)) {}

io::ReadResult ProgressReader::read(char* buffer, size_t size) {
    auto result = reader_->read(buffer, size);
    
    int64_t delta = static_cast<int64_t>(result.bytes);
    if (already_counted_ > 0) {
        int64_t skipped = std::min(already_counted_, delta);
        already_counted_ -= skipped;
        delta -= skipped;
    }
    
    handle_.progress(delta);
    return result;
}

}}
