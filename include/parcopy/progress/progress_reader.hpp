#pragma once

#include "progress_handle.hpp"
#include "parcopy/io/reader.hpp"
#include <cstdint>
#include <memory>

namespace parcopy {
namespace progress {

// Pass-through reader: every read is reported to the progress bar, even when
// it returned no bytes. Results and errors are returned untouched.
// The first already_counted bytes were reported by an earlier attempt and are
// reported as zero.
class ProgressReader : public io::ByteReader {
public:
    ProgressReader(std::unique_ptr<io::ByteReader> reader, ProgressHandle handle,
                   int64_t already_counted = 0);
    
    io::ReadResult read(char* buffer, size_t size) override;

private:
    std::unique_ptr<io::ByteReader> reader_;
    ProgressHandle handle_;
    int64_t already_counted_;
};

}}
