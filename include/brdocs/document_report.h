/**
 * @file document_report.h
 * @brief Per-input validation report used by front-ends
 *
 * One report per input, always: a style that only one document type
 * supports (e.g. "BS") is recorded on the affected report instead of
 * aborting the batch.
 */

#pragma once

#include "brdocs/types.h"

#include <optional>
#include <string>
#include <vector>

namespace brdocs {

/**
 * @brief Outcome of detecting and formatting one input
 */
struct DocumentReport {
    std::string input;
    DetectionResult detection;
    std::optional<std::string> formatted;      ///< Set when valid and the style applies
    ErrorKind formatError = ErrorKind::None;   ///< UnknownFormatStyle when it does not
};

/// @brief True for a style at least one document type supports
bool isKnownFormatStyle(const std::string& style);

/**
 * @brief Detect the document type of an input and format it
 * @param hint Preferred type, see BrazilianDocument
 * @param style Format style for the detected type
 */
DocumentReport describeDocument(const std::string& input, DocumentType hint,
                                const std::string& style = "G");

std::vector<DocumentReport> describeDocuments(const std::vector<std::string>& inputs,
                                              DocumentType hint,
                                              const std::string& style = "G");

/// @brief True when every report holds a valid document
bool allValid(const std::vector<DocumentReport>& reports);

} // namespace brdocs
