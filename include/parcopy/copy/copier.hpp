#pragma once

#include "error_codes.hpp"
#include "parcopy/common/constants.hpp"
#include "parcopy/io/reader.hpp"
#include "parcopy/progress/progress_handle.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parcopy {
namespace copy {

struct CopyOptions {
    int threads = constants::config_defaults::COPY_THREADS;
    size_t buffer_size = static_cast<size_t>(constants::config_defaults::COPY_BUFFER_KB) * 1024;
    int max_retries = constants::config_defaults::COPY_MAX_RETRIES;
    bool recursive = false;
};

struct CopyJob {
    std::filesystem::path source;
    std::filesystem::path target;
    int64_t size = 0;
};

struct CopyFailure {
    std::string source;
    std::string target;
    CopyErrorCode code = CopyErrorCode::SOURCE_NOT_FOUND;
    std::string message;
    common::ErrorContext context;
};

struct CopySummary {
    size_t files_total = 0;
    size_t files_copied = 0;
    size_t files_failed = 0;
    int64_t bytes_total = 0;
    int64_t bytes_copied = 0;
    std::chrono::milliseconds total_time{0};
    std::vector<CopyFailure> failures;
};

class Copier {
public:
    using ReaderFactory = std::function<std::unique_ptr<io::ByteReader>(
        const std::filesystem::path& path, std::error_code& ec)>;
    
    Copier(progress::ProgressHandle handle, CopyOptions options);
    
    CopySummary copy(const std::vector<std::filesystem::path>& sources,
                     const std::filesystem::path& target);
    
    void setReaderFactory(ReaderFactory factory);

private:
    progress::ProgressHandle handle_;
    CopyOptions options_;
    ReaderFactory reader_factory_;
    
    std::vector<CopyJob> planJobs(const std::vector<std::filesystem::path>& sources,
                                  const std::filesystem::path& target,
                                  CopySummary& summary);
    void planDirectory(const std::filesystem::path& source,
                       const std::filesystem::path& target_root,
                       std::vector<CopyJob>& jobs,
                       CopySummary& summary);
    void addJob(const std::filesystem::path& source,
                const std::filesystem::path& target,
                std::vector<CopyJob>& jobs,
                CopySummary& summary);
    
    std::optional<CopyFailure> copyFile(const CopyJob& job, int64_t& bytes_written);
    // Bytes up to already_reported are on the bar from an earlier attempt.
    std::optional<CopyFailure> attemptCopy(const CopyJob& job, int64_t already_reported, int64_t& counted);
    
    static bool isRetryable(CopyErrorCode code);
};

CopyFailure makeFailure(const std::filesystem::path& source,
                        const std::filesystem::path& target,
                        CopyErrorCode code,
                        const std::error_code& ec = std::error_code());

}}
