/**
 * @file exceptions.h
 * @brief Exception hierarchy for process-level failures
 *
 * Per-record parse outcomes are reported through ParseResult, never thrown.
 * These exceptions cover configuration and I/O failures only.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace uvci {
namespace common {

/**
 * @brief Base exception for all UVCI exceptions
 */
class UvciException : public std::runtime_error {
public:
    explicit UvciException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public UvciException {
public:
    explicit ConfigException(const std::string& message)
        : UvciException("Configuration error: " + message) {}
};

/**
 * @brief File read/write failed
 */
class IoException : public UvciException {
public:
    explicit IoException(const std::string& message)
        : UvciException("I/O error: " + message) {}
};

} // namespace common
} // namespace uvci
