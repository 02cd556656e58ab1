/**
 * @file brazilian_document.h
 * @brief Decide whether an input is a CPF, a CNPJ, both or neither
 *
 * The hint is a preference order, not a filter: the other type is still
 * tried when the preferred one rejects the input.
 */

#pragma once

#include "brdocs/cnpj.h"
#include "brdocs/cpf.h"
#include "brdocs/types.h"

#include <string>

namespace brdocs {

/**
 * @brief Document disambiguator
 *
 * Decision table:
 *   - hint Cpf     : CPF, else CNPJ
 *   - hint Cnpj    : CNPJ, else CPF
 *   - hint Unknown : exactly one of CPF and CNPJ must accept the input
 */
class BrazilianDocument {
public:
    /**
     * @brief Check validity and report the detected type
     * @return {valid, type}; type is Unknown when invalid or ambiguous
     */
    static DetectionResult isValid(const std::string& input,
                                   DocumentType hint = DocumentType::Unknown);

    /**
     * @brief Same as isValid, with the ErrorKind explaining a rejection
     *
     * Ambiguous when both types accept the input without a hint. Otherwise the
     * more specific of the two codec diagnoses, the preferred type winning ties.
     */
    static DetectionResult inspect(const std::string& input,
                                   DocumentType hint = DocumentType::Unknown);

    /**
     * @brief Parse into whichever type the input resolves to
     *
     * Both out-values are reset to their Empty sentinel first; only the one
     * matching the returned type is filled in.
     * @return Detected type, Unknown on failure
     */
    static DocumentType tryParse(const std::string& input, Cpf& cpf, Cnpj& cnpj,
                                 DocumentType hint = DocumentType::Unknown);

    /**
     * @brief Parse into whichever type the input resolves to
     * @throws BadDocumentException with type Unknown when the input is invalid or ambiguous
     */
    static DocumentType parse(const std::string& input, Cpf& cpf, Cnpj& cnpj,
                              DocumentType hint = DocumentType::Unknown);
};

} // namespace brdocs
