/**
 * @file cnpj.cpp
 * @brief CNPJ value object implementation
 */

#include "brdocs/cnpj.h"
#include "brdocs/check_digits.h"
#include "brdocs/exceptions.h"
#include "brdocs/input_sanitizer.h"
#include "brdocs/utils/string_utils.h"

#include <stdexcept>

namespace brdocs {

Cnpj Cnpj::empty() {
    return Cnpj(std::string(check::CNPJ_LENGTH, '0'));
}

bool Cnpj::isValid(const std::string& input) {
    return check::verifyCnpj(input) == ErrorKind::None;
}

ParseResult<Cnpj> Cnpj::inspect(const std::string& input) {
    ErrorKind error = check::verifyCnpj(input);
    if (error != ErrorKind::None) {
        return ParseResult<Cnpj>::failure(error);
    }
    return ParseResult<Cnpj>::success(Cnpj(check::canonicalizeCnpj(input)));
}

Cnpj Cnpj::parse(const std::string& input) {
    auto result = inspect(input);
    if (!result) {
        throw BadCnpjException(input, result.error);
    }
    return *result.value;
}

std::optional<Cnpj> Cnpj::tryParse(const std::string& input) {
    return inspect(input).value;
}

Cnpj Cnpj::create(const std::string& root, const std::string& branch) {
    return Cnpj(check::createCnpj(root, branch).cnpj);
}

Cnpj Cnpj::create(const std::string& rootAndBranch) {
    return Cnpj(check::createCnpj(rootAndBranch).cnpj);
}

uint8_t Cnpj::computeCheckDigits(const std::string& rootAndBranch) {
    return check::createCnpj(rootAndBranch).checkDigits;
}

bool Cnpj::supportsFormatStyle(const std::string& style) {
    const std::string upper = utils::toUpper(style);
    return upper == "S" || upper == "B" || upper == "BS" || upper == "G";
}

std::string Cnpj::toString(const std::string& style) const {
    const std::string upper = utils::toUpper(style);

    if (upper == "S") {
        return utils::trimLeft(value_, '0');
    }
    if (upper == "B") {
        return value_;
    }
    if (upper == "BS") {
        return root();
    }
    if (upper == "G") {
        return value_.substr(0, 2) + "." + value_.substr(2, 3) + "." + value_.substr(5, 3) +
               "/" + value_.substr(8, 4) + "-" + value_.substr(12, 2);
    }

    throw std::out_of_range("CNPJ format style must be S, B, BS, or G (got '" +
                            sanitizeForMessage(style) + "')");
}

std::ostream& operator<<(std::ostream& os, const Cnpj& cnpj) {
    return os << cnpj.toString("G");
}

} // namespace brdocs
