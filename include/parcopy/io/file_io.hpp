#pragma once

#include "reader.hpp"
#include <filesystem>
#include <memory>
#include <system_error>

namespace parcopy {
namespace io {

class FileReader : public ByteReader {
public:
    static std::unique_ptr<FileReader> open(const std::filesystem::path& path, std::error_code& ec);
    ~FileReader() override;
    
    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;
    
    ReadResult read(char* buffer, size_t size) override;

private:
    explicit FileReader(int fd);
    int fd_;
};

class FileWriter {
public:
    static std::unique_ptr<FileWriter> open(const std::filesystem::path& path, std::error_code& ec);
    ~FileWriter();
    
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    
    std::error_code write(const char* data, size_t size);
    std::error_code close();

private:
    explicit FileWriter(int fd);
    int fd_;
};

}}
