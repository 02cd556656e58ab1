/**
 * @file brazilian_document.cpp
 * @brief Document disambiguator implementation
 */

#include "brdocs/brazilian_document.h"
#include "brdocs/exceptions.h"
#include "brdocs/input_sanitizer.h"

#include <spdlog/spdlog.h>

namespace brdocs {

namespace {

/// How far a codec got before rejecting the input
int diagnosisDepth(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NullOrEmptyInput:         return 0;
        case ErrorKind::InputTooLong:             return 1;
        case ErrorKind::InvalidCharacter:         return 2;
        case ErrorKind::WrongValidCharacterCount: return 3;
        case ErrorKind::OutOfRange:               return 3;
        case ErrorKind::ChecksumMismatch:         return 4;
        default:                                  return 0;
    }
}

DetectionResult accepted(DocumentType type) {
    DetectionResult result;
    result.valid = true;
    result.type = type;
    return result;
}

DetectionResult rejected(ErrorKind kind) {
    DetectionResult result;
    result.error = kind;
    return result;
}

DetectionResult resolve(const ParseResult<Cpf>& cpf, const ParseResult<Cnpj>& cnpj,
                        DocumentType hint, const std::string& input) {
    switch (hint) {
        case DocumentType::Cpf:
            if (cpf) return accepted(DocumentType::Cpf);
            if (cnpj) {
                spdlog::debug("Document '{}' is not a CPF, accepted as CNPJ", sanitizeForMessage(input));
                return accepted(DocumentType::Cnpj);
            }
            break;

        case DocumentType::Cnpj:
            if (cnpj) return accepted(DocumentType::Cnpj);
            if (cpf) {
                spdlog::debug("Document '{}' is not a CNPJ, accepted as CPF", sanitizeForMessage(input));
                return accepted(DocumentType::Cpf);
            }
            break;

        case DocumentType::Unknown:
            if (cpf && cnpj) {
                spdlog::debug("Document '{}' is valid as both CPF and CNPJ, a hint is required",
                              sanitizeForMessage(input));
                return rejected(ErrorKind::Ambiguous);
            }
            if (cpf) return accepted(DocumentType::Cpf);
            if (cnpj) return accepted(DocumentType::Cnpj);
            break;
    }

    // Neither accepted: report the deeper diagnosis
    const int cpfDepth = diagnosisDepth(cpf.error);
    const int cnpjDepth = diagnosisDepth(cnpj.error);
    if (hint == DocumentType::Cnpj) {
        return rejected(cpfDepth > cnpjDepth ? cpf.error : cnpj.error);
    }
    return rejected(cnpjDepth > cpfDepth ? cnpj.error : cpf.error);
}

} // anonymous namespace

DetectionResult BrazilianDocument::isValid(const std::string& input, DocumentType hint) {
    return inspect(input, hint);
}

DetectionResult BrazilianDocument::inspect(const std::string& input, DocumentType hint) {
    return resolve(Cpf::inspect(input), Cnpj::inspect(input), hint, input);
}

DocumentType BrazilianDocument::tryParse(const std::string& input, Cpf& cpf, Cnpj& cnpj,
                                         DocumentType hint) {
    cpf = Cpf::empty();
    cnpj = Cnpj::empty();

    auto cpfResult = Cpf::inspect(input);
    auto cnpjResult = Cnpj::inspect(input);
    DetectionResult detection = resolve(cpfResult, cnpjResult, hint, input);

    if (detection.type == DocumentType::Cpf) {
        cpf = *cpfResult.value;
    } else if (detection.type == DocumentType::Cnpj) {
        cnpj = *cnpjResult.value;
    }
    return detection.type;
}

DocumentType BrazilianDocument::parse(const std::string& input, Cpf& cpf, Cnpj& cnpj,
                                      DocumentType hint) {
    cpf = Cpf::empty();
    cnpj = Cnpj::empty();

    auto cpfResult = Cpf::inspect(input);
    auto cnpjResult = Cnpj::inspect(input);
    DetectionResult detection = resolve(cpfResult, cnpjResult, hint, input);

    if (!detection.valid) {
        throw BadDocumentException(input, DocumentType::Unknown, detection.error);
    }

    if (detection.type == DocumentType::Cpf) {
        cpf = *cpfResult.value;
    } else {
        cnpj = *cnpjResult.value;
    }
    return detection.type;
}

} // namespace brdocs
