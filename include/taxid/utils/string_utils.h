/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * ASCII-only helpers shared by the normalizer, the strategies and the CLI.
 * Identifiers handled by this library are plain ASCII, so no locale or
 * UTF-8 awareness is needed here.
 */

#pragma once

#include <string>
#include <vector>

namespace taxid {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase
 *
 * @param str Input string
 * @return Uppercase string
 */
std::string toUpper(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Join strings with delimiter
 *
 * @param parts Vector of strings
 * @param delimiter Delimiter string
 * @return Joined string
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/// @brief 0-9
bool isDigit(char c);

/// @brief A-Z only; normalized identifiers are upper case
bool isUpperAlpha(char c);

bool isUpperAlnum(char c);

/// @brief True if non-empty and every character is 0-9
bool isAllDigits(const std::string& str);

/**
 * @brief Remove every character contained in @p chars
 *
 * @param str Input string
 * @param chars Characters to drop
 * @return String without those characters
 */
std::string removeChars(const std::string& str, const std::string& chars);

} // namespace utils
} // namespace taxid
