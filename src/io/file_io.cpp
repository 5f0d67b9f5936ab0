#include "parcopy/io/file_io.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace parcopy {
namespace io {

std::unique_ptr<FileReader> FileReader::open(const std::filesystem::path& path, std::error_code& ec) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        ec = std::error_code(errno, std::system_category());
        return nullptr;
    }
    ec.clear();
    return std::unique_ptr<FileReader>(new FileReader(fd));
}

FileReader::FileReader(int fd) : fd_(fd) {}

FileReader::~FileReader() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

ReadResult FileReader::read(char* buffer, size_t size) {
    ReadResult result;
    
    while (true) {
        ssize_t n = ::read(fd_, buffer, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::error_code(errno, std::system_category());
            return result;
        }
        result.bytes = static_cast<size_t>(n);
        result.eof = (n == 0 && size > 0);
        return result;
    }
}

std::unique_ptr<FileWriter> FileWriter::open(const std::filesystem::path& path, std::error_code& ec) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        ec = std::error_code(errno, std::system_category());
        return nullptr;
    }
    ec.clear();
    return std::unique_ptr<FileWriter>(new FileWriter(fd));
}

FileWriter::FileWriter(int fd) : fd_(fd) {}

FileWriter::~FileWriter() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::error_code FileWriter::write(const char* data, size_t size) {
    size_t written = 0;
    
    while (written < size) {
        ssize_t n = ::write(fd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::error_code(errno, std::system_category());
        }
        written += static_cast<size_t>(n);
    }
    
    return {};
}

std::error_code FileWriter::close() {
    if (fd_ < 0) {
        return {};
    }
    
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

}}
