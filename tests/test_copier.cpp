/**
 * Parallel copier tests
 */

#include "test_harness.hpp"
#include "test_support.hpp"
#include "parcopy/copy/copier.hpp"
#include "parcopy/copy/summary_formatter.hpp"
#include "parcopy/io/file_io.hpp"
#include <atomic>
#include <cerrno>
#include <memory>
#include <sstream>

using namespace parcopy;
using copy::CopyErrorCode;
using copy::CopyErrorCodeHelper;

namespace fs = std::filesystem;

static progress::ProgressHandle startQuiet(std::shared_ptr<RenderLog> log) {
    return progress::startProgressBar(std::make_unique<RecordingRenderer>(log),
                                      std::make_shared<common::NullConsole>(), 1);
}

static copy::CopyOptions smallBuffers(int threads = 4) {
    copy::CopyOptions options;
    options.threads = threads;
    options.buffer_size = 1024;
    options.max_retries = 1;
    return options;
}

TEST(error_code_names) {
    ASSERT_EQ(CopyErrorCodeHelper::toString(CopyErrorCode::SOURCE_NOT_FOUND), std::string("SOURCE_NOT_FOUND"));
    ASSERT_EQ(CopyErrorCodeHelper::toString(CopyErrorCode::TARGET_WRITE_FAILED), std::string("TARGET_WRITE_FAILED"));
    
    auto failure = copy::makeFailure("/src/a", "/dst/a", CopyErrorCode::SOURCE_OPEN_FAILED,
                                     std::make_error_code(std::errc::permission_denied));
    ASSERT(failure.message.find("Cannot open source file") == 0);
    ASSERT_EQ(failure.context.details["source"], std::string("/src/a"));
    ASSERT(failure.context.cause == std::errc::permission_denied);
    
    std::string formatted = common::formatContext(failure.context);
    ASSERT(formatted.find("source=/src/a | target=/dst/a") == 0);
    ASSERT(formatted.find("errno=" + std::to_string(EACCES)) != std::string::npos);
    
    ASSERT(CopyErrorCodeHelper::isKnown(CopyErrorCode::SOURCE_READ_FAILED));
    ASSERT(!CopyErrorCodeHelper::isKnown(static_cast<CopyErrorCode>(999)));
    ASSERT_EQ(CopyErrorCodeHelper::toString(static_cast<CopyErrorCode>(999)), std::string("UNKNOWN"));
}

TEST(single_file_into_directory) {
    TempDir dir;
    std::string data = patternData(100000);
    auto source = dir.writeFile("src/file.bin", data);
    fs::create_directories(dir.path() / "dst");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    copy::Copier copier(handle, smallBuffers());
    auto summary = copier.copy({source}, dir.path() / "dst");
    auto progress_summary = handle.finish();
    
    ASSERT_EQ(summary.files_total, 1u);
    ASSERT_EQ(summary.files_copied, 1u);
    ASSERT_EQ(summary.files_failed, 0u);
    ASSERT_EQ(summary.bytes_copied, static_cast<int64_t>(data.size()));
    ASSERT_EQ(readFile(dir.path() / "dst" / "file.bin"), data);
    
    ASSERT_EQ(progress_summary.total, static_cast<int64_t>(data.size()));
    ASSERT_EQ(progress_summary.current, progress_summary.total);
}

TEST(single_file_to_new_name) {
    TempDir dir;
    auto source = dir.writeFile("a.txt", "hello");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    copy::Copier copier(handle, smallBuffers());
    auto summary = copier.copy({source}, dir.path() / "b.txt");
    handle.finish();
    
    ASSERT_EQ(summary.files_copied, 1u);
    ASSERT_EQ(readFile(dir.path() / "b.txt"), std::string("hello"));
}

TEST(recursive_directory) {
    TempDir dir;
    dir.writeFile("src/a.txt", patternData(3000));
    dir.writeFile("src/sub/b.txt", patternData(5000));
    dir.writeFile("src/sub/deeper/c.txt", patternData(7));
    dir.writeFile("src/empty.txt", "");
    fs::create_directories(dir.path() / "src" / "hollow");
    fs::create_directories(dir.path() / "dst");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    auto options = smallBuffers();
    options.recursive = true;
    copy::Copier copier(handle, options);
    auto summary = copier.copy({dir.path() / "src"}, dir.path() / "dst");
    auto progress_summary = handle.finish();
    
    ASSERT_EQ(summary.files_copied, 4u);
    ASSERT_EQ(summary.files_failed, 0u);
    ASSERT_EQ(summary.bytes_total, 8007);
    ASSERT_EQ(readFile(dir.path() / "dst/src/a.txt"), patternData(3000));
    ASSERT_EQ(readFile(dir.path() / "dst/src/sub/b.txt"), patternData(5000));
    ASSERT_EQ(readFile(dir.path() / "dst/src/sub/deeper/c.txt"), patternData(7));
    ASSERT_EQ(readFile(dir.path() / "dst/src/empty.txt"), std::string(""));
    ASSERT(fs::is_directory(dir.path() / "dst/src/hollow"));
    
    ASSERT_EQ(progress_summary.current, 8007);
    ASSERT_EQ(progress_summary.current, progress_summary.total);
}

TEST(recursive_into_new_directory) {
    TempDir dir;
    dir.writeFile("src/a.txt", "alpha");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    auto options = smallBuffers();
    options.recursive = true;
    copy::Copier copier(handle, options);
    auto summary = copier.copy({dir.path() / "src"}, dir.path() / "fresh");
    handle.finish();
    
    ASSERT_EQ(summary.files_copied, 1u);
    ASSERT_EQ(readFile(dir.path() / "fresh/a.txt"), std::string("alpha"));
}

TEST(directory_without_recursive) {
    TempDir dir;
    dir.writeFile("src/a.txt", "alpha");
    fs::create_directories(dir.path() / "dst");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    copy::Copier copier(handle, smallBuffers());
    auto summary = copier.copy({dir.path() / "src"}, dir.path() / "dst");
    handle.finish();
    
    ASSERT_EQ(summary.files_failed, 1u);
    ASSERT(summary.failures[0].code == CopyErrorCode::SOURCE_IS_DIRECTORY);
    ASSERT(!fs::exists(dir.path() / "dst/src"));
}

TEST(multiple_sources) {
    TempDir dir;
    auto a = dir.writeFile("a.txt", patternData(2000));
    auto b = dir.writeFile("b.txt", patternData(4000));
    auto c = dir.writeFile("c.txt", patternData(6000));
    fs::create_directories(dir.path() / "dst");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    copy::Copier copier(handle, smallBuffers(2));
    auto summary = copier.copy({a, b, c}, dir.path() / "dst");
    auto progress_summary = handle.finish();
    
    ASSERT_EQ(summary.files_copied, 3u);
    ASSERT_EQ(readFile(dir.path() / "dst/b.txt"), patternData(4000));
    ASSERT_EQ(progress_summary.total, 12000);
    ASSERT_EQ(progress_summary.current, 12000);
}

TEST(multiple_sources_need_directory_target) {
    TempDir dir;
    auto a = dir.writeFile("a.txt", "a");
    auto b = dir.writeFile("b.txt", "b");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    copy::Copier copier(handle, smallBuffers());
    auto summary = copier.copy({a, b}, dir.path() / "not_a_dir");
    handle.finish();
    
    ASSERT_EQ(summary.files_copied, 0u);
    ASSERT_EQ(summary.failures.size(), 1u);
    ASSERT(summary.failures[0].code == CopyErrorCode::TARGET_NOT_DIRECTORY);
}

TEST(missing_source_reported) {
    TempDir dir;
    auto present = dir.writeFile("present.txt", "here");
    fs::create_directories(dir.path() / "dst");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    copy::Copier copier(handle, smallBuffers());
    auto summary = copier.copy({dir.path() / "absent.txt", present}, dir.path() / "dst");
    handle.finish();
    
    ASSERT_EQ(summary.files_total, 2u);
    ASSERT_EQ(summary.files_copied, 1u);
    ASSERT_EQ(summary.files_failed, 1u);
    ASSERT(summary.failures[0].code == CopyErrorCode::SOURCE_NOT_FOUND);
    ASSERT_EQ(readFile(dir.path() / "dst/present.txt"), std::string("here"));
}

TEST(copy_onto_itself_rejected) {
    TempDir dir;
    auto source = dir.writeFile("same.txt", "keep me");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    copy::Copier copier(handle, smallBuffers());
    auto summary = copier.copy({source}, source);
    handle.finish();
    
    ASSERT_EQ(summary.files_failed, 1u);
    ASSERT(summary.failures[0].code == CopyErrorCode::TARGET_OPEN_FAILED);
    ASSERT_EQ(readFile(source), std::string("keep me"));
}

TEST(directory_into_itself_rejected) {
    TempDir dir;
    dir.writeFile("src/a.txt", "a");
    fs::create_directories(dir.path() / "src" / "inner");
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    auto options = smallBuffers();
    options.recursive = true;
    copy::Copier copier(handle, options);
    auto summary = copier.copy({dir.path() / "src"}, dir.path() / "src" / "inner");
    handle.finish();
    
    ASSERT_EQ(summary.files_copied, 0u);
    ASSERT_EQ(summary.files_failed, 1u);
    ASSERT(summary.failures[0].code == CopyErrorCode::TARGET_CREATE_DIR_FAILED);
}

TEST(retry_of_lone_file_stays_within_total) {
    TempDir dir;
    std::string data = patternData(10000);
    auto source = dir.writeFile("flaky.bin", data);
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    
    std::atomic<int> opens{0};
    copy::Copier copier(handle, smallBuffers(1));
    copier.setReaderFactory([&opens](const fs::path& path, std::error_code& ec)
            -> std::unique_ptr<io::ByteReader> {
        if (opens.fetch_add(1) == 0) {
            ec.clear();
            return std::make_unique<FailingReader>(1024);
        }
        return io::FileReader::open(path, ec);
    });
    
    auto summary = copier.copy({source}, dir.path() / "copy.bin");
    auto progress_summary = handle.finish();
    
    ASSERT_EQ(opens.load(), 2);
    ASSERT_EQ(summary.files_copied, 1u);
    ASSERT_EQ(summary.bytes_copied, 10000);
    ASSERT_EQ(readFile(dir.path() / "copy.bin"), data);
    ASSERT_EQ(progress_summary.total, 10000);
    ASSERT_EQ(progress_summary.current, 10000);
    ASSERT_EQ(log->peak, 10000);
}

TEST(retry_counts_each_byte_once) {
    TempDir dir;
    std::string data = patternData(10000);
    auto source = dir.writeFile("flaky.bin", data);
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    // Another file already finished on the same bar
    handle.extend(500);
    handle.progress(500);
    
    std::atomic<int> opens{0};
    copy::Copier copier(handle, smallBuffers(1));
    copier.setReaderFactory([&opens](const fs::path& path, std::error_code& ec)
            -> std::unique_ptr<io::ByteReader> {
        if (opens.fetch_add(1) == 0) {
            ec.clear();
            return std::make_unique<FailingReader>(4096);
        }
        return io::FileReader::open(path, ec);
    });
    
    auto summary = copier.copy({source}, dir.path() / "copy.bin");
    auto progress_summary = handle.finish();
    
    ASSERT_EQ(opens.load(), 2);
    ASSERT_EQ(summary.files_copied, 1u);
    ASSERT_EQ(readFile(dir.path() / "copy.bin"), data);
    ASSERT_EQ(progress_summary.total, 10500);
    ASSERT_EQ(progress_summary.current, 10500);
}

TEST(exhausted_retries_complete_the_bar) {
    TempDir dir;
    auto source = dir.writeFile("broken.bin", patternData(10000));
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    
    // Each attempt gets further than the last before failing
    std::atomic<int> opens{0};
    copy::Copier copier(handle, smallBuffers(1));
    copier.setReaderFactory([&opens](const fs::path&, std::error_code& ec)
            -> std::unique_ptr<io::ByteReader> {
        ec.clear();
        size_t good = opens.fetch_add(1) == 0 ? 1024 : 3072;
        return std::make_unique<FailingReader>(good);
    });
    
    auto summary = copier.copy({source}, dir.path() / "copy.bin");
    auto progress_summary = handle.finish();
    
    ASSERT_EQ(opens.load(), 2);
    ASSERT_EQ(summary.files_failed, 1u);
    ASSERT(summary.failures[0].code == CopyErrorCode::SOURCE_READ_FAILED);
    ASSERT_EQ(summary.failures[0].context.details["attempts"], std::string("2"));
    ASSERT_EQ(progress_summary.total, 10000);
    ASSERT_EQ(progress_summary.current, 10000);
}

TEST(exhausted_retries_on_short_second_attempt) {
    TempDir dir;
    auto source = dir.writeFile("broken.bin", patternData(10000));
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    
    std::atomic<int> opens{0};
    copy::Copier copier(handle, smallBuffers(1));
    copier.setReaderFactory([&opens](const fs::path&, std::error_code& ec)
            -> std::unique_ptr<io::ByteReader> {
        ec.clear();
        size_t good = opens.fetch_add(1) == 0 ? 3072 : 1024;
        return std::make_unique<FailingReader>(good);
    });
    
    copier.copy({source}, dir.path() / "copy.bin");
    auto progress_summary = handle.finish();
    
    ASSERT_EQ(progress_summary.total, 10000);
    ASSERT_EQ(progress_summary.current, 10000);
}

TEST(open_failure_not_retried) {
    TempDir dir;
    auto source = dir.writeFile("locked.bin", patternData(4096));
    
    auto log = std::make_shared<RenderLog>();
    auto handle = startQuiet(log);
    
    std::atomic<int> opens{0};
    copy::Copier copier(handle, smallBuffers(1));
    copier.setReaderFactory([&opens](const fs::path&, std::error_code& ec)
            -> std::unique_ptr<io::ByteReader> {
        opens++;
        ec = std::make_error_code(std::errc::permission_denied);
        return nullptr;
    });
    
    auto summary = copier.copy({source}, dir.path() / "copy.bin");
    auto progress_summary = handle.finish();
    
    ASSERT_EQ(opens.load(), 1);
    ASSERT(summary.failures[0].code == CopyErrorCode::SOURCE_OPEN_FAILED);
    ASSERT_EQ(progress_summary.current, 4096);
}

TEST(text_summary) {
    copy::CopySummary summary;
    summary.files_total = 3;
    summary.files_copied = 2;
    summary.files_failed = 1;
    summary.bytes_copied = 2048;
    summary.total_time = std::chrono::milliseconds(500);
    summary.failures.push_back(copy::makeFailure("/src/x", "/dst/x", CopyErrorCode::SOURCE_NOT_FOUND));
    
    copy::SummaryFormatter formatter(copy::OutputFormat::TEXT);
    formatter.setColorsEnabled(false);
    std::ostringstream out;
    formatter.formatSummary(summary, out);
    
    std::string text = out.str();
    ASSERT(text.find("ERROR: /src/x: Source not found") != std::string::npos);
    ASSERT(text.find("Copied 2/3 files, 2.00 KiB in 0.50s (4.00 KiB/s)") != std::string::npos);
    ASSERT(text.find("1 failed") != std::string::npos);
}

TEST(json_summary) {
    copy::CopySummary summary;
    summary.files_total = 1;
    summary.files_failed = 1;
    summary.failures.push_back(copy::makeFailure("/src/x", "/dst/x", CopyErrorCode::SOURCE_IS_DIRECTORY));
    
    copy::SummaryFormatter formatter(copy::OutputFormat::JSON);
    std::ostringstream out;
    formatter.formatSummary(summary, out);
    
    std::string text = out.str();
    ASSERT(text.find("\"files_failed\": 1") != std::string::npos);
    ASSERT(text.find("\"code\": \"SOURCE_IS_DIRECTORY\"") != std::string::npos);
    ASSERT(text.find("\033[") == std::string::npos);
}

int main() {
    printf("Copier tests\n");
    
    RUN_TEST(error_code_names);
    RUN_TEST(single_file_into_directory);
    RUN_TEST(single_file_to_new_name);
    RUN_TEST(recursive_directory);
    RUN_TEST(recursive_into_new_directory);
    RUN_TEST(directory_without_recursive);
    RUN_TEST(multiple_sources);
    RUN_TEST(multiple_sources_need_directory_target);
    RUN_TEST(missing_source_reported);
    RUN_TEST(copy_onto_itself_rejected);
    RUN_TEST(directory_into_itself_rejected);
    RUN_TEST(retry_of_lone_file_stays_within_total);
    RUN_TEST(retry_counts_each_byte_once);
    RUN_TEST(exhausted_retries_complete_the_bar);
    RUN_TEST(exhausted_retries_on_short_second_attempt);
    RUN_TEST(open_failure_not_retried);
    RUN_TEST(text_summary);
    RUN_TEST(json_summary);
    
    return finishTests();
}
