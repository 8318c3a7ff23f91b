/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "taxid/utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace taxid {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isUpperAlpha(char c) {
    return c >= 'A' && c <= 'Z';
}

bool isUpperAlnum(char c) {
    return isDigit(c) || isUpperAlpha(c);
}

bool isAllDigits(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), isDigit);
}

std::string removeChars(const std::string& str, const std::string& chars) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        if (chars.find(c) == std::string::npos) {
            result += c;
        }
    }
    return result;
}

} // namespace utils
} // namespace taxid
