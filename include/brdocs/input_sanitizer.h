/**
 * @file input_sanitizer.h
 * @brief Make untrusted input safe to embed in messages and logs
 */

#pragma once

#include <cstddef>
#include <string>

namespace brdocs {

/// @brief Maximum number of input characters echoed back in a message
constexpr size_t MAX_SANITIZED_LENGTH = 20;

/**
 * @brief Sanitize an input string for inclusion in an error message
 *
 * Keeps at most MAX_SANITIZED_LENGTH bytes, backing up so a multi-byte
 * UTF-8 character is never split. Drops ASCII control characters (log
 * injection) and appends "..." when the input was truncated.
 * Empty or whitespace-only input yields an empty string.
 *
 * @param input Raw input, as received from the caller
 * @return Sanitized copy
 */
std::string sanitizeForMessage(const std::string& input);

} // namespace brdocs
