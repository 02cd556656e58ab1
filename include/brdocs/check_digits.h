/**
 * @file check_digits.h
 * @brief Modulo-11 check-digit engine for CPF and CNPJ
 *
 * Pure functions, no I/O, no shared state. Inputs are scanned in place;
 * only the CNPJ creation and canonicalization helpers allocate.
 *
 * Both documents use the same digit rule: r = weightedSum % 11, and the
 * check digit is 0 when r < 2, otherwise 11 - r. The second check digit
 * includes the first one in its weighted sum.
 */

#pragma once

#include "brdocs/types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace brdocs::check {

// --- CPF bounds ---

constexpr int64_t CPF_MAX_VALUE = 99999999999LL;  ///< 11 digits
constexpr int64_t CPF_MAX_BASE = 999999999LL;     ///< 9 base digits
constexpr size_t CPF_LENGTH = 11;
constexpr size_t CPF_MAX_INPUT_LENGTH = 20;

// --- CNPJ bounds ---

constexpr size_t CNPJ_LENGTH = 14;
constexpr size_t CNPJ_BASE_LENGTH = 12;    ///< root + branch
constexpr size_t CNPJ_ROOT_LENGTH = 8;
constexpr size_t CNPJ_BRANCH_LENGTH = 4;
constexpr size_t CNPJ_MIN_INPUT_LENGTH = 7;   ///< "1000136" is the shortest valid CNPJ
constexpr size_t CNPJ_MAX_INPUT_LENGTH = 18;  ///< "RR.RRR.RRR/BBBB-DD"
constexpr size_t CNPJ_MIN_VALID_CHARS = 7;

/**
 * @brief Reduce a weighted sum to a check digit
 * @return 0 when sum % 11 < 2, otherwise 11 - sum % 11
 */
constexpr int mod11Digit(int64_t weightedSum) {
    const int remainder = static_cast<int>(weightedSum % 11);
    return remainder < 2 ? 0 : 11 - remainder;
}

// ============================================================================
// CPF
// ============================================================================

/**
 * @brief Compute both CPF check digits for a 9-digit base
 *
 * Digits are read from least to most significant; position i weighs i+2 for
 * the first digit and i+3 for the second, which also adds dv1 * 2.
 *
 * @param base Base digits, in [0, CPF_MAX_BASE]
 * @return Packed check digits, dv1 * 10 + dv2
 */
int computeCpfCheckDigits(int64_t base);

/**
 * @brief Verify a complete CPF number
 * @return ErrorKind::None when the last two digits match the computed ones,
 *         OutOfRange outside [0, CPF_MAX_VALUE], ChecksumMismatch otherwise
 */
ErrorKind verifyCpfNumber(int64_t value);

/**
 * @brief Convert CPF text to its numeric value, without checksum verification
 *
 * Accepts at most CPF_MAX_INPUT_LENGTH characters; strips '.' and '-' only.
 * Any other non-digit rejects the input. 1 to 11 digits are accepted, shorter
 * values standing for the zero-padded 11-digit form.
 *
 * @param input Raw text
 * @return Numeric value, or the ErrorKind explaining the rejection
 */
ParseResult<int64_t> normalizeCpf(const std::string& input);

// ============================================================================
// CNPJ
// ============================================================================

/// @brief Weights of positions 0..11 for the first CNPJ check digit
extern const int CNPJ_WEIGHTS_DV1[CNPJ_BASE_LENGTH];

/// @brief Weights of positions 0..12 for the second CNPJ check digit
extern const int CNPJ_WEIGHTS_DV2[CNPJ_BASE_LENGTH + 1];

/**
 * @brief Whether a character is significant in a CNPJ (0-9, A-Z, a-z)
 *
 * Everything else is punctuation and is skipped.
 */
constexpr bool isCnpjInputChar(char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/**
 * @brief Numeric value of a significant CNPJ character
 *
 * Always c - '0', so 'A' is 17, 'B' is 18 and so on. Lowercase letters map
 * to the value of their uppercase form. This is the value the published
 * alphanumeric check-digit tables are built on; it is not Base-36.
 */
constexpr int cnpjCharValue(char c) {
    int value = c - '0';
    if (value > 42) {
        value -= 32;
    }
    return value;
}

/**
 * @brief Verify a CNPJ text, punctuation and omitted leading zeros allowed
 *
 * Raw length must be in [CNPJ_MIN_INPUT_LENGTH, CNPJ_MAX_INPUT_LENGTH] and the
 * significant characters in [CNPJ_MIN_VALID_CHARS, CNPJ_LENGTH]. With k < 14
 * significant characters the first one sits at position 14 - k. Scanning stops
 * at the first mismatching check character.
 *
 * @return ErrorKind::None when the input is a valid CNPJ
 */
ErrorKind verifyCnpj(const std::string& input);

/**
 * @brief Canonical form of an already verified CNPJ text
 * @return Uppercase, significant characters only, zero-padded to 14
 */
std::string canonicalizeCnpj(const std::string& input);

/// @brief Complete CNPJ built from root and branch
struct CnpjCreation {
    std::string cnpj;          ///< 14 canonical characters
    uint8_t checkDigits = 0;   ///< Packed, dv1 * 10 + dv2
};

/**
 * @brief Build a CNPJ from its root and branch
 *
 * Root and branch are left-padded with '0' to 8 and 4 characters and
 * uppercased before the check digits are appended.
 *
 * @param root Up to 8 characters of [0-9A-Za-z]
 * @param branch Up to 4 characters of [0-9A-Za-z]
 * @throws std::invalid_argument for empty, over-long or non-alphanumeric parts
 */
CnpjCreation createCnpj(const std::string& root, const std::string& branch);

/**
 * @brief Build a CNPJ from root and branch given as a single string
 *
 * Significant characters are kept (punctuation dropped), at most 12 of them,
 * left-padded to 12 and split into root and branch.
 *
 * @throws std::invalid_argument for empty or whitespace-only input
 */
CnpjCreation createCnpj(const std::string& rootAndBranch);

} // namespace brdocs::check
