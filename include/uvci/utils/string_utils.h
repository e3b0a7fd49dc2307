/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Small ASCII-only helpers shared by the UVCI parser, the record
 * formatters and uvci-tool.
 *
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>

namespace uvci {
namespace utils {

/**
 * @brief Convert string to uppercase (ASCII)
 *
 * @param str Input string
 * @return Uppercase string
 */
std::string toUpper(const std::string& str);

/**
 * @brief Convert string to lowercase (ASCII)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * Empty input yields a single empty token; a trailing delimiter yields a
 * trailing empty token.
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Check if string starts with prefix, ignoring ASCII case
 *
 * @param str Input string
 * @param prefix Prefix to check
 * @return true if str starts with prefix
 */
bool startsWithIgnoreCase(const std::string& str, const std::string& prefix);

/**
 * @brief Check if string is non-empty and contains only decimal digits
 */
bool isAllDigits(const std::string& str);

/**
 * @brief Check if string is non-empty and contains only A-Z
 */
bool isAllUpperAlpha(const std::string& str);

} // namespace utils
} // namespace uvci
