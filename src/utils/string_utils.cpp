/**
 * @file string_utils.cpp
 * @brief String utility functions implementation
 */

#include "brdocs/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace brdocs {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 32) : static_cast<char>(c); });
    return result;
}

std::string trim(const std::string& str) {
    // Find first non-whitespace character
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    // If all whitespace, return empty string
    if (start == str.length()) {
        return "";
    }

    // Find last non-whitespace character
    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

bool isBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string trimLeft(const std::string& str, char ch) {
    size_t start = str.find_first_not_of(ch);
    if (start == std::string::npos) {
        return "";
    }
    return str.substr(start);
}

std::string padLeft(const std::string& str, size_t width, char fill) {
    if (str.length() >= width) {
        return str;
    }
    return std::string(width - str.length(), fill) + str;
}

std::optional<int64_t> parseInteger(const std::string& str) {
    const std::string text = trim(str);
    if (text.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.length()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<double> parseDouble(const std::string& str) {
    const std::string text = trim(str);
    if (text.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.length()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace utils
} // namespace brdocs
