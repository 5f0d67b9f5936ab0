#pragma once

#include <cstddef>
#include <system_error>

namespace parcopy {
namespace io {

struct ReadResult {
    size_t bytes = 0;
    bool eof = false;
    std::error_code error;
    
    bool ok() const { return !error; }
};

class ByteReader {
public:
    virtual ~ByteReader() = default;
    
    virtual ReadResult read(char* buffer, size_t size) = 0;
};

}}
