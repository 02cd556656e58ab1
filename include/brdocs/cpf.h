/**
 * @file cpf.h
 * @brief Value Object for CPF (Cadastro de Pessoas Fisicas)
 *
 * A CPF is 11 numeric digits: 9 base digits and 2 modulo-11 check digits.
 * Instances only come out of validating factories, so a Cpf is always valid.
 */

#pragma once

#include "brdocs/types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace brdocs {

/**
 * @brief Always-valid CPF
 *
 * Stored as its numeric value in [0, 99 999 999 999]. Leading zeros are not
 * stored; the "B" and "G" formats restore them.
 *
 * Format styles (case-insensitive):
 *   - "S": decimal, no leading zeros (12345678909)
 *   - "B": 11 digits, zero-padded (01234567890)
 *   - "G": punctuated (123.456.789-09), the default
 */
class Cpf {
private:
    int64_t value_ = 0;

    explicit Cpf(int64_t value) : value_(value) {}

public:
    /// @brief Canonical all-zero CPF ("000.000.000-00"), itself valid
    static Cpf empty() noexcept { return Cpf(0); }

    // --- Validation (never throws) ---

    static bool isValid(const std::string& input);
    static bool isValid(int64_t value);

    // --- Parsing ---

    /**
     * @brief Parse and report why the input was rejected
     * @return Cpf, or the ErrorKind explaining the rejection
     */
    static ParseResult<Cpf> inspect(const std::string& input);
    static ParseResult<Cpf> inspect(int64_t value);

    /**
     * @brief Parse a CPF
     * @param input Digits with optional '.' and '-' (e.g. "123.456.789-09")
     * @throws BadCpfException if the input is not a valid CPF
     */
    static Cpf parse(const std::string& input);
    static Cpf parse(int64_t value);

    static std::optional<Cpf> tryParse(const std::string& input);
    static std::optional<Cpf> tryParse(int64_t value);

    // --- Creation ---

    /**
     * @brief Create a CPF by appending check digits to its base
     * @param baseDigits 9 base digits, in [0, 999 999 999]
     * @throws std::out_of_range if baseDigits is outside that range
     */
    static Cpf create(int64_t baseDigits);

    /**
     * @brief Create a CPF from base digits given as text (e.g. "123.456.789")
     * @throws BadCpfException if the text is not a number
     * @throws std::out_of_range if the number exceeds 9 digits
     */
    static Cpf create(const std::string& baseDigits);

    /**
     * @brief Compute packed check digits (dv1 * 10 + dv2) for a base
     * @throws std::out_of_range if baseDigits is outside [0, 999 999 999]
     */
    static int computeCheckDigits(int64_t baseDigits);

    // --- Accessors ---

    [[nodiscard]] int64_t toInt64() const noexcept { return value_; }

    [[nodiscard]] int64_t baseDigits() const noexcept { return value_ / 100; }

    [[nodiscard]] int checkDigits() const noexcept { return static_cast<int>(value_ % 100); }

    /// @brief Whether toString accepts the style (S, B or G, any case)
    static bool supportsFormatStyle(const std::string& style);

    /**
     * @brief Format the CPF
     * @param style "S", "B" or "G" (case-insensitive)
     * @throws std::out_of_range for any other style
     */
    [[nodiscard]] std::string toString(const std::string& style = "G") const;

    int compare(const Cpf& other) const noexcept {
        return value_ < other.value_ ? -1 : (value_ > other.value_ ? 1 : 0);
    }

    bool operator==(const Cpf& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const Cpf& other) const noexcept { return !(*this == other); }
    bool operator<(const Cpf& other) const noexcept { return value_ < other.value_; }
};

/// @brief Writes the "G" format
std::ostream& operator<<(std::ostream& os, const Cpf& cpf);

} // namespace brdocs

namespace std {
    template<>
    struct hash<brdocs::Cpf> {
        size_t operator()(const brdocs::Cpf& cpf) const {
            return hash<int64_t>()(cpf.toInt64());
        }
    };
}
