#include "parcopy/copy/copier.hpp"
#include "parcopy/common/logger.hpp"
#include "parcopy/io/file_io.hpp"
#include "parcopy/progress/progress_reader.hpp"
#include <tbb/concurrent_queue.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>
#include <atomic>

namespace parcopy {
namespace copy {

namespace {

bool isInside(const std::filesystem::path& child, const std::filesystem::path& parent) {
    std::error_code ec;
    auto canonical_child = std::filesystem::weakly_canonical(child, ec);
    if (ec) return false;
    auto canonical_parent = std::filesystem::weakly_canonical(parent, ec);
    if (ec) return false;
    
    auto relative = canonical_child.lexically_relative(canonical_parent);
    return !relative.empty() && *relative.begin() != "..";
}

}

CopyFailure makeFailure(const std::filesystem::path& source,
                        const std::filesystem::path& target,
                        CopyErrorCode code,
                        const std::error_code& ec) {
    CopyFailure failure;
    failure.source = source.string();
    failure.target = target.string();
    failure.code = code;
    failure.message = CopyErrorCodeHelper::describe(code, ec);
    
    failure.context.component = "copy";
    failure.context.cause = ec;
    if (!failure.source.empty()) {
        failure.context.add("source", failure.source);
    }
    if (!failure.target.empty()) {
        failure.context.add("target", failure.target);
    }
    return failure;
}

Copier::Copier(progress::ProgressHandle handle, CopyOptions options)
    : handle_(std::move(handle)), options_(std::move(options)) {
    reader_factory_ = [](const std::filesystem::path& path, std::error_code& ec)
            -> std::unique_ptr<io::ByteReader> {
        return io::FileReader::open(path, ec);
    };
}

void Copier::setReaderFactory(ReaderFactory factory) {
    reader_factory_ = std::move(factory);
}

CopySummary Copier::copy(const std::vector<std::filesystem::path>& sources,
                         const std::filesystem::path& target) {
    auto start_time = std::chrono::steady_clock::now();
    CopySummary summary;
    
    auto jobs = planJobs(sources, target, summary);
    summary.files_total = jobs.size() + summary.failures.size();
    
    int threads = std::max(1, options_.threads);
    common::Logger::instance().info("[Copy] Starting | files={} | bytes={} | threads={}",
                                    jobs.size(), summary.bytes_total, threads);
    
    tbb::concurrent_queue<CopyFailure> failures;
    std::atomic<size_t> copied{0};
    std::atomic<int64_t> bytes_copied{0};
    
    tbb::task_arena arena(threads);
    arena.execute([&] {
        tbb::parallel_for(size_t(0), jobs.size(), [&](size_t i) {
            int64_t written = 0;
            auto failure = copyFile(jobs[i], written);
            if (failure) {
                failures.push(std::move(*failure));
            } else {
                copied.fetch_add(1);
                bytes_copied.fetch_add(written);
            }
        });
    });
    
    CopyFailure failure;
    while (failures.try_pop(failure)) {
        summary.failures.push_back(std::move(failure));
    }
    
    summary.files_copied = copied.load();
    summary.files_failed = summary.failures.size();
    summary.bytes_copied = bytes_copied.load();
    summary.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    
    common::Logger::instance().info("[Copy] Complete | copied={} | failed={} | bytes={} | time_ms={}",
                                    summary.files_copied, summary.files_failed,
                                    summary.bytes_copied, summary.total_time.count());
    return summary;
}

std::vector<CopyJob> Copier::planJobs(const std::vector<std::filesystem::path>& sources,
                                      const std::filesystem::path& target,
                                      CopySummary& summary) {
    std::vector<CopyJob> jobs;
    
    std::error_code ec;
    bool target_is_dir = std::filesystem::is_directory(target, ec);
    
    if (sources.size() > 1 && !target_is_dir) {
        summary.failures.push_back(makeFailure("", target, CopyErrorCode::TARGET_NOT_DIRECTORY));
        return jobs;
    }
    
    for (const auto& source : sources) {
        std::error_code sec;
        auto status = std::filesystem::status(source, sec);
        if (sec || !std::filesystem::exists(status)) {
            summary.failures.push_back(makeFailure(source, target, CopyErrorCode::SOURCE_NOT_FOUND, sec));
            continue;
        }
        
        if (std::filesystem::is_directory(status)) {
            if (!options_.recursive) {
                summary.failures.push_back(makeFailure(source, target, CopyErrorCode::SOURCE_IS_DIRECTORY));
                continue;
            }
            
            auto name = source.filename();
            if (name.empty()) {
                name = source.parent_path().filename();
            }
            planDirectory(source, target_is_dir ? target / name : target, jobs, summary);
            continue;
        }
        
        addJob(source, target_is_dir ? target / source.filename() : target, jobs, summary);
    }
    
    return jobs;
}

void Copier::planDirectory(const std::filesystem::path& source,
                           const std::filesystem::path& target_root,
                           std::vector<CopyJob>& jobs,
                           CopySummary& summary) {
    if (isInside(target_root, source)) {
        summary.failures.push_back(makeFailure(source, target_root, CopyErrorCode::TARGET_CREATE_DIR_FAILED,
                                               std::make_error_code(std::errc::invalid_argument)));
        return;
    }
    
    std::error_code ec;
    std::filesystem::create_directories(target_root, ec);
    if (ec) {
        summary.failures.push_back(makeFailure(source, target_root, CopyErrorCode::TARGET_CREATE_DIR_FAILED, ec));
        return;
    }
    
    for (auto it = std::filesystem::recursive_directory_iterator(source, ec);
         it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
        
        if (ec) {
            common::Logger::instance().warn("[Copy] Directory walk error | path={} | error={}",
                                            source.string(), ec.message());
            ec.clear();
            continue;
        }
        
        auto dest = target_root / it->path().lexically_relative(source);
        
        std::error_code fec;
        if (it->is_directory(fec)) {
            std::filesystem::create_directories(dest, fec);
            if (fec) {
                summary.failures.push_back(makeFailure(it->path(), dest, CopyErrorCode::TARGET_CREATE_DIR_FAILED, fec));
            }
        } else if (it->is_regular_file(fec)) {
            addJob(it->path(), dest, jobs, summary);
        } else {
            common::Logger::instance().debug("[Copy] Skipping special file | path={}", it->path().string());
        }
    }
    
    if (ec) {
        summary.failures.push_back(makeFailure(source, target_root, CopyErrorCode::SOURCE_READ_FAILED, ec));
    }
}

void Copier::addJob(const std::filesystem::path& source,
                    const std::filesystem::path& target,
                    std::vector<CopyJob>& jobs,
                    CopySummary& summary) {
    std::error_code ec;
    auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        summary.failures.push_back(makeFailure(source, target, CopyErrorCode::SOURCE_OPEN_FAILED, ec));
        return;
    }
    
    if (std::filesystem::exists(target, ec) && std::filesystem::equivalent(source, target, ec)) {
        summary.failures.push_back(makeFailure(source, target, CopyErrorCode::TARGET_OPEN_FAILED,
                                               std::make_error_code(std::errc::file_exists)));
        return;
    }
    
    CopyJob job;
    job.source = source;
    job.target = target;
    job.size = static_cast<int64_t>(size);
    
    handle_.extend(job.size);
    summary.bytes_total += job.size;
    jobs.push_back(std::move(job));
}

std::optional<CopyFailure> Copier::copyFile(const CopyJob& job, int64_t& bytes_written) {
    handle_.setCaption({job.source.string(), '/'});
    
    // Highest byte count any attempt has shown on the bar for this file
    int64_t reported = 0;
    int attempt = 0;
    while (true) {
        int64_t counted = 0;
        auto failure = attemptCopy(job, reported, counted);
        reported = std::max(reported, counted);
        
        if (!failure) {
            bytes_written = counted;
            common::Logger::instance().debug("[Copy] Done | source={} | bytes={}", job.source.string(), counted);
            return std::nullopt;
        }
        
        if (attempt < options_.max_retries && isRetryable(failure->code)) {
            attempt++;
            common::Logger::instance().warn("[Copy] Retrying | source={} | attempt={} | code={} | counted={}",
                                            job.source.string(), attempt,
                                            CopyErrorCodeHelper::toString(failure->code), reported);
            continue;
        }
        
        int64_t remaining = job.size - reported;
        if (remaining > 0) {
            handle_.errorOnRead(remaining);
        }
        
        failure->context.add("attempts", std::to_string(attempt + 1));
        common::Logger::instance().warn("[Copy] Failed | code={} | {}",
                                        CopyErrorCodeHelper::toString(failure->code),
                                        common::formatContext(failure->context));
        return failure;
    }
}

std::optional<CopyFailure> Copier::attemptCopy(const CopyJob& job, int64_t already_reported, int64_t& counted) {
    std::error_code ec;
    
    auto source = reader_factory_(job.source, ec);
    if (!source) {
        return makeFailure(job.source, job.target, CopyErrorCode::SOURCE_OPEN_FAILED, ec);
    }
    
    auto target = io::FileWriter::open(job.target, ec);
    if (!target) {
        return makeFailure(job.source, job.target, CopyErrorCode::TARGET_OPEN_FAILED, ec);
    }
    
    auto reader = handle_.newProxyReader(std::move(source), already_reported);
    std::vector<char> buffer(std::max<size_t>(options_.buffer_size, 1));
    
    while (true) {
        auto result = reader->read(buffer.data(), buffer.size());
        counted += static_cast<int64_t>(result.bytes);
        
        if (result.bytes > 0) {
            auto wec = target->write(buffer.data(), result.bytes);
            if (wec) {
                return makeFailure(job.source, job.target, CopyErrorCode::TARGET_WRITE_FAILED, wec);
            }
        }
        
        if (!result.ok()) {
            return makeFailure(job.source, job.target, CopyErrorCode::SOURCE_READ_FAILED, result.error);
        }
        
        if (result.eof) {
            break;
        }
    }
    
    auto cec = target->close();
    if (cec) {
        return makeFailure(job.source, job.target, CopyErrorCode::TARGET_WRITE_FAILED, cec);
    }
    return std::nullopt;
}

bool Copier::isRetryable(CopyErrorCode code) {
    return code == CopyErrorCode::SOURCE_READ_FAILED || code == CopyErrorCode::TARGET_WRITE_FAILED;
}

}}
