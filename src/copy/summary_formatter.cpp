#include "parcopy/copy/summary_formatter.hpp"
#include "parcopy/progress/terminal_bar.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>

namespace parcopy {
namespace copy {

SummaryFormatter::SummaryFormatter(OutputFormat format) : format_(format) {}

void SummaryFormatter::formatSummary(const CopySummary& summary, std::ostream& out) {
    if (format_ == OutputFormat::JSON) {
        formatJsonSummary(summary, out);
    } else {
        formatTextSummary(summary, out);
    }
}

void SummaryFormatter::formatTextSummary(const CopySummary& summary, std::ostream& out) {
    for (const auto& failure : summary.failures) {
        out << colorize("ERROR", "\033[31m") << ": ";
        if (!failure.source.empty()) {
            out << failure.source << ": ";
        } else if (!failure.target.empty()) {
            out << failure.target << ": ";
        }
        out << failure.message << "\n";
    }
    
    double seconds = summary.total_time.count() / 1000.0;
    
    out << "Copied " << summary.files_copied << "/" << summary.files_total << " files, "
        << progress::formatBytes(summary.bytes_copied) << " in "
        << std::fixed << std::setprecision(2) << seconds << "s";
    
    if (seconds > 0.0) {
        out << " (" << progress::formatBytes(static_cast<int64_t>(summary.bytes_copied / seconds)) << "/s)";
    }
    out << "\n";
    
    if (summary.files_failed > 0) {
        out << colorize(std::to_string(summary.files_failed) + " failed", "\033[31m") << "\n";
    }
}

void SummaryFormatter::formatJsonSummary(const CopySummary& summary, std::ostream& out) {
    nlohmann::json json;
    
    json["files_total"] = summary.files_total;
    json["files_copied"] = summary.files_copied;
    json["files_failed"] = summary.files_failed;
    json["bytes_total"] = summary.bytes_total;
    json["bytes_copied"] = summary.bytes_copied;
    json["total_time_ms"] = summary.total_time.count();
    
    json["failures"] = nlohmann::json::array();
    for (const auto& failure : summary.failures) {
        nlohmann::json item;
        item["source"] = failure.source;
        item["target"] = failure.target;
        item["code"] = CopyErrorCodeHelper::toString(failure.code);
        item["message"] = failure.message;
        if (failure.context.cause) {
            item["errno"] = failure.context.cause.value();
        }
        if (!failure.context.details.empty()) {
            item["details"] = failure.context.details;
        }
        json["failures"].push_back(item);
    }
    
    out << json.dump(2) << "\n";
}

std::string SummaryFormatter::colorize(const std::string& text, const std::string& color) {
    if (!colors_enabled_) {
        return text;
    }
    return color + text + "\033[0m";
}

}}
