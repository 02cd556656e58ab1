/**
 * @file types.cpp
 * @brief DocumentType name parsing
 */

#include "brdocs/types.h"
#include "brdocs/utils/string_utils.h"

namespace brdocs {

std::optional<DocumentType> documentTypeFromString(const std::string& name) {
    const std::string lower = utils::toLower(utils::trim(name));

    if (lower == "cpf") return DocumentType::Cpf;
    if (lower == "cnpj") return DocumentType::Cnpj;
    if (lower == "none" || lower == "unknown") return DocumentType::Unknown;

    return std::nullopt;
}

} // namespace brdocs
