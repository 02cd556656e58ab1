/**
 * @file cnpj.h
 * @brief Value Object for CNPJ (Cadastro Nacional da Pessoa Juridica)
 *
 * A CNPJ is 14 characters: an 8-character root identifying the company, a
 * 4-character branch ("0001" is the headquarters) and 2 numeric check digits.
 * Since the 2026 revision root and branch may contain letters A-Z.
 */

#pragma once

#include "brdocs/types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace brdocs {

/**
 * @brief Always-valid alphanumeric CNPJ
 *
 * Stored canonically: uppercase, zero-padded, no punctuation.
 *
 * Accepted input:
 *   - 7 to 18 raw characters, 7 to 14 of them in [0-9A-Za-z]
 *   - any other character is punctuation and is ignored
 *   - leading zeros of the root may be omitted ("1/0001-36")
 *
 * Format styles (case-insensitive):
 *   - "S": without leading zeros (9358105000191)
 *   - "B": 14 characters (09358105000191)
 *   - "BS": root only (09358105)
 *   - "G": punctuated (09.358.105/0001-91), the default
 */
class Cnpj {
private:
    std::string value_;

    explicit Cnpj(std::string canonical) : value_(std::move(canonical)) {}

public:
    /// @brief Canonical all-zero CNPJ ("00000000000000"), itself valid
    static Cnpj empty();

    // --- Validation (never throws) ---

    static bool isValid(const std::string& input);

    // --- Parsing ---

    /**
     * @brief Parse and report why the input was rejected
     * @return Cnpj, or the ErrorKind explaining the rejection
     */
    static ParseResult<Cnpj> inspect(const std::string& input);

    /**
     * @brief Parse a CNPJ
     * @param input e.g. "09.358.105/0001-91", "12.ABC.345/01DE-35", "1/0001-36"
     * @throws BadCnpjException if the input is not a valid CNPJ
     */
    static Cnpj parse(const std::string& input);

    static std::optional<Cnpj> tryParse(const std::string& input);

    // --- Creation ---

    /**
     * @brief Create a CNPJ from root and branch, computing the check digits
     * @param root Up to 8 characters of [0-9A-Za-z], zero-padded on the left
     * @param branch Up to 4 characters of [0-9A-Za-z], zero-padded on the left
     * @throws std::invalid_argument for empty, over-long or non-alphanumeric parts
     */
    static Cnpj create(const std::string& root, const std::string& branch);

    /**
     * @brief Create a CNPJ from root and branch as one string ("09.358.105/0001")
     * @throws std::invalid_argument for empty input
     */
    static Cnpj create(const std::string& rootAndBranch);

    /**
     * @brief Compute packed check digits (dv1 * 10 + dv2) for root and branch
     * @throws std::invalid_argument for empty input
     */
    static uint8_t computeCheckDigits(const std::string& rootAndBranch);

    // --- Accessors ---

    /// @brief 14 canonical characters
    [[nodiscard]] const std::string& getValue() const noexcept { return value_; }

    [[nodiscard]] std::string root() const { return value_.substr(0, 8); }

    [[nodiscard]] std::string branch() const { return value_.substr(8, 4); }

    [[nodiscard]] std::string checkDigits() const { return value_.substr(12, 2); }

    /// @brief True for the headquarters branch "0001"
    [[nodiscard]] bool isHeadquarters() const { return branch() == "0001"; }

    /// @brief Whether toString accepts the style (S, B, BS or G, any case)
    static bool supportsFormatStyle(const std::string& style);

    /**
     * @brief Format the CNPJ
     * @param style "S", "B", "BS" or "G" (case-insensitive)
     * @throws std::out_of_range for any other style
     */
    [[nodiscard]] std::string toString(const std::string& style = "G") const;

    int compare(const Cnpj& other) const noexcept { return value_.compare(other.value_); }

    bool operator==(const Cnpj& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const Cnpj& other) const noexcept { return !(*this == other); }
    bool operator<(const Cnpj& other) const noexcept { return value_ < other.value_; }
};

/// @brief Writes the "G" format
std::ostream& operator<<(std::ostream& os, const Cnpj& cnpj);

} // namespace brdocs

namespace std {
    template<>
    struct hash<brdocs::Cnpj> {
        size_t operator()(const brdocs::Cnpj& cnpj) const {
            return hash<string>()(cnpj.getValue());
        }
    };
}
