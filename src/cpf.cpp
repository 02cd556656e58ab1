/**
 * @file cpf.cpp
 * @brief CPF value object implementation
 */

#include "brdocs/cpf.h"
#include "brdocs/check_digits.h"
#include "brdocs/exceptions.h"
#include "brdocs/input_sanitizer.h"
#include "brdocs/utils/string_utils.h"

#include <stdexcept>

namespace brdocs {

bool Cpf::isValid(const std::string& input) {
    auto number = check::normalizeCpf(input);
    if (!number) {
        return false;
    }
    return check::verifyCpfNumber(*number.value) == ErrorKind::None;
}

bool Cpf::isValid(int64_t value) {
    return check::verifyCpfNumber(value) == ErrorKind::None;
}

ParseResult<Cpf> Cpf::inspect(const std::string& input) {
    auto number = check::normalizeCpf(input);
    if (!number) {
        return ParseResult<Cpf>::failure(number.error);
    }
    return inspect(*number.value);
}

ParseResult<Cpf> Cpf::inspect(int64_t value) {
    ErrorKind error = check::verifyCpfNumber(value);
    if (error != ErrorKind::None) {
        return ParseResult<Cpf>::failure(error);
    }
    return ParseResult<Cpf>::success(Cpf(value));
}

Cpf Cpf::parse(const std::string& input) {
    auto result = inspect(input);
    if (!result) {
        throw BadCpfException(input, result.error);
    }
    return *result.value;
}

Cpf Cpf::parse(int64_t value) {
    auto result = inspect(value);
    if (!result) {
        throw BadCpfException(std::to_string(value), result.error);
    }
    return *result.value;
}

std::optional<Cpf> Cpf::tryParse(const std::string& input) {
    return inspect(input).value;
}

std::optional<Cpf> Cpf::tryParse(int64_t value) {
    return inspect(value).value;
}

Cpf Cpf::create(int64_t baseDigits) {
    const int checkDigits = computeCheckDigits(baseDigits);
    return Cpf(baseDigits * 100 + checkDigits);
}

Cpf Cpf::create(const std::string& baseDigits) {
    auto number = check::normalizeCpf(baseDigits);
    if (!number) {
        throw BadCpfException(baseDigits, number.error);
    }
    return create(*number.value);
}

int Cpf::computeCheckDigits(int64_t baseDigits) {
    if (baseDigits < 0) {
        throw std::out_of_range("CPF base digits must be greater than or equal to zero");
    }
    if (baseDigits > check::CPF_MAX_BASE) {
        throw std::out_of_range("CPF base digits must be less than or equal to 999999999");
    }
    return check::computeCpfCheckDigits(baseDigits);
}

bool Cpf::supportsFormatStyle(const std::string& style) {
    const std::string upper = utils::toUpper(style);
    return upper == "S" || upper == "B" || upper == "G";
}

std::string Cpf::toString(const std::string& style) const {
    const std::string upper = utils::toUpper(style);

    if (upper == "S") {
        return std::to_string(value_);
    }

    const std::string padded = utils::padLeft(std::to_string(value_), check::CPF_LENGTH, '0');
    if (upper == "B") {
        return padded;
    }
    if (upper == "G") {
        return padded.substr(0, 3) + "." + padded.substr(3, 3) + "." +
               padded.substr(6, 3) + "-" + padded.substr(9, 2);
    }

    throw std::out_of_range("CPF format style must be S, B, or G (got '" + sanitizeForMessage(style) + "')");
}

std::ostream& operator<<(std::ostream& os, const Cpf& cpf) {
    return os << cpf.toString("G");
}

} // namespace brdocs
