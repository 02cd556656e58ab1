/**
 * @file document_report.cpp
 * @brief Per-input validation report implementation
 */

#include "brdocs/document_report.h"
#include "brdocs/brazilian_document.h"
#include "brdocs/input_sanitizer.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace brdocs {

bool isKnownFormatStyle(const std::string& style) {
    return Cpf::supportsFormatStyle(style) || Cnpj::supportsFormatStyle(style);
}

DocumentReport describeDocument(const std::string& input, DocumentType hint,
                                const std::string& style) {
    DocumentReport report;
    report.input = input;

    Cpf cpf = Cpf::empty();
    Cnpj cnpj = Cnpj::empty();
    report.detection = BrazilianDocument::inspect(input, hint);
    if (!report.detection.valid) {
        return report;
    }

    // Same hint, same input: resolves to the type inspect reported
    const DocumentType parsed = BrazilianDocument::tryParse(input, cpf, cnpj, hint);

    if (parsed == DocumentType::Cpf) {
        if (Cpf::supportsFormatStyle(style)) {
            report.formatted = cpf.toString(style);
        } else {
            report.formatError = ErrorKind::UnknownFormatStyle;
        }
    } else {
        if (Cnpj::supportsFormatStyle(style)) {
            report.formatted = cnpj.toString(style);
        } else {
            report.formatError = ErrorKind::UnknownFormatStyle;
        }
    }

    if (report.formatError != ErrorKind::None) {
        spdlog::debug("Style '{}' does not apply to {} '{}'", sanitizeForMessage(style),
                      documentTypeToString(report.detection.type), sanitizeForMessage(input));
    }
    return report;
}

std::vector<DocumentReport> describeDocuments(const std::vector<std::string>& inputs,
                                              DocumentType hint, const std::string& style) {
    std::vector<DocumentReport> reports;
    reports.reserve(inputs.size());
    for (const auto& input : inputs) {
        reports.push_back(describeDocument(input, hint, style));
    }
    return reports;
}

bool allValid(const std::vector<DocumentReport>& reports) {
    return std::all_of(reports.begin(), reports.end(),
                       [](const DocumentReport& report) { return report.detection.valid; });
}

} // namespace brdocs
