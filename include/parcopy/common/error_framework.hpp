#pragma once

#include <string>
#include <map>
#include <system_error>
#include <unordered_map>

namespace parcopy {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

// Where a failure happened. `cause` is the OS error behind it, if any.
struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
    std::error_code cause;
    
    ErrorContext& add(const std::string& key, const std::string& value) {
        details[key] = value;
        return *this;
    }
};

// Each error enum specializes getInfoMap() next to its definition.
template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        static const ErrorInfo<EnumType> fallback{EnumType{}, "UNKNOWN", "Unknown error"};
        return fallback;
    }
    
    static bool isKnown(EnumType code) {
        return getInfoMap().count(code) > 0;
    }
    
    static const char* toString(EnumType code) {
        return getInfo(code).code_str;
    }
    
    static const char* getMessage(EnumType code) {
        return getInfo(code).default_message;
    }
    
    static std::string describe(EnumType code, const std::error_code& cause) {
        std::string message = getMessage(code);
        if (cause) {
            message += ": " + cause.message();
        }
        return message;
    }
    
protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    if (ctx.cause) {
        if (!result.empty()) {
            result += " | ";
        }
        result += "errno=" + std::to_string(ctx.cause.value()) + " | error=" + ctx.cause.message();
    }
    return result;
}

}}
