#pragma once

#include <cstdint>
#include <string>

/**
 * @file types.hpp
 * @brief Common type definitions for the Proctor attention analysis library
 */

namespace proctor {
namespace core {

/**
 * @brief Result codes used by exceptions and status-returning calls
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_INVALID_PARAMETER = -2,
    ERROR_FILE_NOT_FOUND = -10,
    ERROR_FILE_IO = -11,
    ERROR_PARSE_FAILURE = -12,
    ERROR_CONFIG_INVALID = -20,
    ERROR_PROCESSING_FAILURE = -30
};

/**
 * @brief Library version
 */
struct Version {
    uint8_t major;
    uint8_t minor;
    uint8_t patch;

    std::string toString() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

constexpr Version API_VERSION{1, 2, 0};

} // namespace core
} // namespace proctor
