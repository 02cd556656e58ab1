/**
 * @file check_digits.cpp
 * @brief Modulo-11 check-digit engine implementation
 */

#include "brdocs/check_digits.h"
#include "brdocs/utils/string_utils.h"

#include <stdexcept>

namespace brdocs::check {

const int CNPJ_WEIGHTS_DV1[CNPJ_BASE_LENGTH] = {5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
const int CNPJ_WEIGHTS_DV2[CNPJ_BASE_LENGTH + 1] = {6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

// ============================================================================
// CPF
// ============================================================================

int computeCpfCheckDigits(int64_t base) {
    int64_t sum1 = 0;
    int64_t sum2 = 0;
    int64_t remaining = base;

    // 9 digits, right to left
    for (int i = 0; i < 9; i++) {
        const int64_t digit = remaining % 10;
        remaining /= 10;

        sum1 += digit * (i + 2);
        sum2 += digit * (i + 3);
    }

    const int dv1 = mod11Digit(sum1);
    sum2 += dv1 * 2;
    const int dv2 = mod11Digit(sum2);

    return dv1 * 10 + dv2;
}

ErrorKind verifyCpfNumber(int64_t value) {
    if (value < 0 || value > CPF_MAX_VALUE) {
        return ErrorKind::OutOfRange;
    }

    const int64_t checkDigits = value % 100;
    const int64_t base = value / 100;

    return checkDigits == computeCpfCheckDigits(base) ? ErrorKind::None : ErrorKind::ChecksumMismatch;
}

ParseResult<int64_t> normalizeCpf(const std::string& input) {
    if (utils::isBlank(input)) {
        return ParseResult<int64_t>::failure(ErrorKind::NullOrEmptyInput);
    }

    // Longest sensible form is "000.000.000-00"; cap the scan cost
    if (input.length() > CPF_MAX_INPUT_LENGTH) {
        return ParseResult<int64_t>::failure(ErrorKind::InputTooLong);
    }

    size_t digitCount = 0;
    int64_t value = 0;
    for (char c : input) {
        if (c >= '0' && c <= '9') {
            // Stop accumulating past 11 digits, the count check below rejects it
            if (++digitCount <= CPF_LENGTH) {
                value = value * 10 + (c - '0');
            }
        } else if (c != '.' && c != '-') {
            return ParseResult<int64_t>::failure(ErrorKind::InvalidCharacter);
        }
    }

    if (digitCount < 1 || digitCount > CPF_LENGTH) {
        return ParseResult<int64_t>::failure(ErrorKind::WrongValidCharacterCount);
    }

    return ParseResult<int64_t>::success(value);
}

// ============================================================================
// CNPJ
// ============================================================================

ErrorKind verifyCnpj(const std::string& input) {
    if (utils::isBlank(input)) {
        return ErrorKind::NullOrEmptyInput;
    }
    if (input.length() > CNPJ_MAX_INPUT_LENGTH) {
        return ErrorKind::InputTooLong;
    }
    if (input.length() < CNPJ_MIN_INPUT_LENGTH) {
        return ErrorKind::WrongValidCharacterCount;
    }

    size_t validChars = 0;
    for (char c : input) {
        if (isCnpjInputChar(c)) {
            validChars++;
        }
    }

    if (validChars < CNPJ_MIN_VALID_CHARS || validChars > CNPJ_LENGTH) {
        return ErrorKind::WrongValidCharacterCount;
    }

    // Omitted leading zeros: the first significant character sits further ahead
    size_t position = CNPJ_LENGTH - validChars;
    int64_t totalDigit1 = 0;
    int64_t totalDigit2 = 0;

    for (char c : input) {
        if (!isCnpjInputChar(c)) continue;

        const int digit = cnpjCharValue(c);

        if (position < CNPJ_BASE_LENGTH) {
            totalDigit1 += digit * CNPJ_WEIGHTS_DV1[position];
            totalDigit2 += digit * CNPJ_WEIGHTS_DV2[position];
        } else if (position == CNPJ_BASE_LENGTH) {
            const int dv1 = mod11Digit(totalDigit1);
            if (digit != dv1) {
                return ErrorKind::ChecksumMismatch;
            }
            totalDigit2 += dv1 * CNPJ_WEIGHTS_DV2[CNPJ_BASE_LENGTH];
        } else {
            const int dv2 = mod11Digit(totalDigit2);
            if (digit != dv2) {
                return ErrorKind::ChecksumMismatch;
            }
        }

        position++;

        // Trailing punctuation is not consumed
        if (position == CNPJ_LENGTH) {
            break;
        }
    }

    return position == CNPJ_LENGTH ? ErrorKind::None : ErrorKind::WrongValidCharacterCount;
}

std::string canonicalizeCnpj(const std::string& input) {
    std::string result;
    result.reserve(CNPJ_LENGTH);

    for (char c : input) {
        if (!isCnpjInputChar(c)) continue;
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 32);
        }
        result.push_back(c);
    }

    return utils::padLeft(result, CNPJ_LENGTH, '0');
}

namespace {

/// Reject empty, over-long or non-alphanumeric creation parts
void requireCnpjPart(const std::string& part, size_t maxLength, const std::string& name) {
    if (utils::isBlank(part)) {
        throw std::invalid_argument("CNPJ " + name + " must not be empty");
    }
    if (part.length() > maxLength) {
        throw std::invalid_argument("CNPJ " + name + " must have at most " +
                                    std::to_string(maxLength) + " characters");
    }
    for (char c : part) {
        if (!isCnpjInputChar(c)) {
            throw std::invalid_argument("CNPJ " + name + " must contain only digits and letters");
        }
    }
}

} // anonymous namespace

CnpjCreation createCnpj(const std::string& root, const std::string& branch) {
    requireCnpjPart(root, CNPJ_ROOT_LENGTH, "root");
    requireCnpjPart(branch, CNPJ_BRANCH_LENGTH, "branch");

    std::string base = utils::padLeft(utils::toUpper(root), CNPJ_ROOT_LENGTH, '0') +
                       utils::padLeft(utils::toUpper(branch), CNPJ_BRANCH_LENGTH, '0');

    int64_t total1 = 0;
    int64_t total2 = 0;
    for (size_t pos = 0; pos < CNPJ_BASE_LENGTH; pos++) {
        const int digit = cnpjCharValue(base[pos]);
        total1 += digit * CNPJ_WEIGHTS_DV1[pos];
        total2 += digit * CNPJ_WEIGHTS_DV2[pos];
    }

    const int dv1 = mod11Digit(total1);
    total2 += dv1 * CNPJ_WEIGHTS_DV2[CNPJ_BASE_LENGTH];
    const int dv2 = mod11Digit(total2);

    CnpjCreation result;
    result.cnpj = base;
    result.cnpj.push_back(static_cast<char>('0' + dv1));
    result.cnpj.push_back(static_cast<char>('0' + dv2));
    result.checkDigits = static_cast<uint8_t>(dv1 * 10 + dv2);
    return result;
}

CnpjCreation createCnpj(const std::string& rootAndBranch) {
    if (utils::isBlank(rootAndBranch)) {
        throw std::invalid_argument("CNPJ root and branch must not be empty");
    }

    std::string significant;
    significant.reserve(CNPJ_BASE_LENGTH);
    for (char c : rootAndBranch) {
        if (!isCnpjInputChar(c)) continue;
        significant.push_back(c);
        if (significant.length() == CNPJ_BASE_LENGTH) break;
    }

    const std::string base = utils::padLeft(significant, CNPJ_BASE_LENGTH, '0');
    return createCnpj(base.substr(0, CNPJ_ROOT_LENGTH),
                      base.substr(CNPJ_ROOT_LENGTH, CNPJ_BRANCH_LENGTH));
}

} // namespace brdocs::check
