#pragma once

#include "../common/error_framework.hpp"
#include <unordered_map>

namespace parcopy {
namespace copy {

enum class CopyErrorCode {
    SOURCE_NOT_FOUND = 100,
    SOURCE_IS_DIRECTORY = 101,
    SOURCE_OPEN_FAILED = 102,
    SOURCE_READ_FAILED = 103,
    
    TARGET_NOT_DIRECTORY = 200,
    TARGET_OPEN_FAILED = 201,
    TARGET_WRITE_FAILED = 202,
    TARGET_CREATE_DIR_FAILED = 203
};

using CopyErrorCodeHelper = common::ErrorRegistry<CopyErrorCode>;

}
}

namespace parcopy {
namespace common {

template<>
inline const std::unordered_map<copy::CopyErrorCode, ErrorInfo<copy::CopyErrorCode>>& 
ErrorRegistry<copy::CopyErrorCode>::getInfoMap() {
    static const std::unordered_map<copy::CopyErrorCode, ErrorInfo<copy::CopyErrorCode>> map = {
        {copy::CopyErrorCode::SOURCE_NOT_FOUND, {
            copy::CopyErrorCode::SOURCE_NOT_FOUND,
            "SOURCE_NOT_FOUND",
            "Source not found"
        }},
        {copy::CopyErrorCode::SOURCE_IS_DIRECTORY, {
            copy::CopyErrorCode::SOURCE_IS_DIRECTORY,
            "SOURCE_IS_DIRECTORY",
            "Source is a directory (use --recursive)"
        }},
        {copy::CopyErrorCode::SOURCE_OPEN_FAILED, {
            copy::CopyErrorCode::SOURCE_OPEN_FAILED,
            "SOURCE_OPEN_FAILED",
            "Cannot open source file"
        }},
        {copy::CopyErrorCode::SOURCE_READ_FAILED, {
            copy::CopyErrorCode::SOURCE_READ_FAILED,
            "SOURCE_READ_FAILED",
            "Reading source file failed"
        }},
        {copy::CopyErrorCode::TARGET_NOT_DIRECTORY, {
            copy::CopyErrorCode::TARGET_NOT_DIRECTORY,
            "TARGET_NOT_DIRECTORY",
            "Target must be a directory for multiple sources"
        }},
        {copy::CopyErrorCode::TARGET_OPEN_FAILED, {
            copy::CopyErrorCode::TARGET_OPEN_FAILED,
            "TARGET_OPEN_FAILED",
            "Cannot open target file"
        }},
        {copy::CopyErrorCode::TARGET_WRITE_FAILED, {
            copy::CopyErrorCode::TARGET_WRITE_FAILED,
            "TARGET_WRITE_FAILED",
            "Writing target file failed"
        }},
        {copy::CopyErrorCode::TARGET_CREATE_DIR_FAILED, {
            copy::CopyErrorCode::TARGET_CREATE_DIR_FAILED,
            "TARGET_CREATE_DIR_FAILED",
            "Cannot create target directory"
        }}
    };
    return map;
}

}
}
