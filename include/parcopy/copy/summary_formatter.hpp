#pragma once

#include "copier.hpp"
#include <ostream>
#include <string>

namespace parcopy {
namespace copy {

enum class OutputFormat {
    TEXT,
    JSON
};

class SummaryFormatter {
public:
    explicit SummaryFormatter(OutputFormat format = OutputFormat::TEXT);
    
    void formatSummary(const CopySummary& summary, std::ostream& out);
    
    void setColorsEnabled(bool enabled) { colors_enabled_ = enabled; }

private:
    OutputFormat format_;
    bool colors_enabled_ = true;
    
    void formatTextSummary(const CopySummary& summary, std::ostream& out);
    void formatJsonSummary(const CopySummary& summary, std::ostream& out);
    
    std::string colorize(const std::string& text, const std::string& color);
};

}}
