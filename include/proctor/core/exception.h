#pragma once

#include "proctor/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for the Proctor library
 */

namespace proctor {
namespace core {

/**
 * @brief Base exception class for all Proctor exceptions
 *
 * Carries a result code plus the original message and the throw-site context.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    /**
     * @brief Get the result code
     */
    ResultCode getResultCode() const noexcept { return result_code_; }

    /**
     * @brief Get the original error message
     * @return Error message without formatting
     */
    const std::string& getMessage() const noexcept { return message_; }

    /**
     * @brief Get the error context
     */
    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Invalid or inconsistent configuration values
 */
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIG_INVALID, message, context) {}
};

/**
 * @brief Caller supplied input that violates an API contract
 */
class InputException : public Exception {
public:
    InputException(const std::string& message,
                   const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_PARAMETER, message, context) {}
};

/**
 * @brief File I/O related exceptions
 */
class FileException : public Exception {
public:
    FileException(ResultCode code,
                  const std::string& message,
                  const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Session level processing failures
 */
class ProcessingException : public Exception {
public:
    ProcessingException(const std::string& message,
                        const std::string& context = "")
        : Exception(ResultCode::ERROR_PROCESSING_FAILURE, message, context) {}
};

/**
 * @brief Convert result code to string representation
 * @param code Result code to convert
 * @return String representation of result code
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define PROCTOR_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define PROCTOR_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace proctor
