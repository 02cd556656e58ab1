/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * ASCII-only helpers shared by the codecs, the exceptions and the CLI.
 * Locale-independent: document identifiers are plain ASCII.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace brdocs {
namespace utils {

/**
 * @brief Convert ASCII letters to lowercase
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert ASCII letters to uppercase
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
 * @brief Check if string is empty or made only of whitespace
 */
bool isBlank(const std::string& str);

/**
 * @brief Remove every leading occurrence of a character
 *
 * @param str Input string
 * @param ch Character to strip (e.g. '0')
 * @return String without the leading run of ch
 */
std::string trimLeft(const std::string& str, char ch);

/**
 * @brief Left-pad a string to a fixed width
 *
 * Strings already at or above width are returned unchanged.
 *
 * @param str Input string
 * @param width Target width
 * @param fill Padding character
 * @return Padded string
 */
std::string padLeft(const std::string& str, size_t width, char fill = '0');

/**
 * @brief Parse a whole string as a decimal integer
 *
 * Surrounding whitespace is allowed; anything else after the number is not.
 * @return Value, or std::nullopt for malformed or out-of-range text
 */
std::optional<int64_t> parseInteger(const std::string& str);

/**
 * @brief Parse a whole string as a floating-point number
 * @return Value, or std::nullopt for malformed or out-of-range text
 */
std::optional<double> parseDouble(const std::string& str);

} // namespace utils
} // namespace brdocs
