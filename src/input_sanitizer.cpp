/**
 * @file input_sanitizer.cpp
 * @brief Input sanitizer implementation
 */

#include "brdocs/input_sanitizer.h"
#include "brdocs/utils/string_utils.h"

#include <algorithm>

namespace brdocs {

std::string sanitizeForMessage(const std::string& input) {
    if (utils::isBlank(input)) {
        return "";
    }

    size_t length = std::min(input.length(), MAX_SANITIZED_LENGTH);
    const bool needsTruncation = input.length() > MAX_SANITIZED_LENGTH;

    // Never cut a UTF-8 sequence: drop the partial code point at the cut
    if (needsTruncation) {
        while (length > 0 && (static_cast<unsigned char>(input[length]) & 0xC0) == 0x80) {
            --length;
        }
    }

    std::string result;
    result.reserve(length + (needsTruncation ? 3 : 0));

    for (size_t i = 0; i < length; ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        // Skip control characters (C0 and DEL)
        if (c < 0x20 || c == 0x7F) {
            continue;
        }
        result.push_back(input[i]);
    }

    if (needsTruncation) {
        result += "...";
    }

    return result;
}

} // namespace brdocs
