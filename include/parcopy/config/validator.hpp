#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace parcopy {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    
    static bool validateBarFormat(const std::string& format);
    static bool canCreateDirectory(const std::string& path);
};

}}
