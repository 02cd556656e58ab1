/**
 * @file exceptions.h
 * @brief Exception hierarchy of the Brazilian documents library
 *
 * Parse-style entry points throw these; validity checks never do.
 * Creation arguments out of bounds are reported with std::out_of_range and
 * std::invalid_argument instead.
 */

#pragma once

#include "brdocs/input_sanitizer.h"
#include "brdocs/types.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace brdocs {

/**
 * @brief Base exception for all library errors
 */
class DocumentException : public std::runtime_error {
public:
    explicit DocumentException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Input is not a well-formed CPF, CNPJ or document
 *
 * Keeps the raw offending input for diagnostics. The message only ever
 * contains its sanitized form.
 */
class BadDocumentException : public DocumentException {
private:
    std::optional<std::string> invalidDocument_;
    DocumentType sourceType_ = DocumentType::Unknown;
    ErrorKind errorKind_ = ErrorKind::None;

protected:
    struct MessageTag {};

    BadDocumentException(MessageTag, const std::string& message, DocumentType sourceType, ErrorKind kind)
        : DocumentException(message),
          sourceType_(sourceType),
          errorKind_(kind) {}

private:
    static std::string documentName(DocumentType type) {
        switch (type) {
            case DocumentType::Cpf:  return "CPF";
            case DocumentType::Cnpj: return "CNPJ";
            default:                 return "document";
        }
    }

public:
    BadDocumentException()
        : DocumentException("Invalid document.") {}

    /**
     * @brief Construct from the offending input
     * @param invalidDocument Raw input that failed to parse
     * @param sourceType Document type being attempted
     * @param kind Why the input was rejected
     */
    explicit BadDocumentException(const std::string& invalidDocument,
                                  DocumentType sourceType = DocumentType::Unknown,
                                  ErrorKind kind = ErrorKind::None)
        : DocumentException("Invalid " + documentName(sourceType) + ": '" +
                            sanitizeForMessage(invalidDocument) + "'."),
          invalidDocument_(invalidDocument),
          sourceType_(sourceType),
          errorKind_(kind) {}

    /**
     * @brief Build an exception with a custom message and no input
     */
    static BadDocumentException withMessage(const std::string& message,
                                            DocumentType sourceType = DocumentType::Unknown,
                                            ErrorKind kind = ErrorKind::None) {
        return BadDocumentException(MessageTag{}, message, sourceType, kind);
    }

    /// @brief Raw offending input, if one was supplied
    [[nodiscard]] const std::optional<std::string>& getInvalidDocument() const noexcept {
        return invalidDocument_;
    }

    /// @brief Document type being attempted when the error occurred
    [[nodiscard]] DocumentType getSourceType() const noexcept {
        return sourceType_;
    }

    /// @brief Reason for the rejection
    [[nodiscard]] ErrorKind getErrorKind() const noexcept {
        return errorKind_;
    }
};

/**
 * @brief Input is not a valid CPF
 */
class BadCpfException : public BadDocumentException {
public:
    BadCpfException()
        : BadDocumentException(MessageTag{}, "Invalid CPF.", DocumentType::Cpf, ErrorKind::None) {}

    explicit BadCpfException(const std::string& invalidCpf, ErrorKind kind = ErrorKind::None)
        : BadDocumentException(invalidCpf, DocumentType::Cpf, kind) {}
};

/**
 * @brief Input is not a valid CNPJ
 */
class BadCnpjException : public BadDocumentException {
public:
    BadCnpjException()
        : BadDocumentException(MessageTag{}, "Invalid CNPJ.", DocumentType::Cnpj, ErrorKind::None) {}

    explicit BadCnpjException(const std::string& invalidCnpj, ErrorKind kind = ErrorKind::None)
        : BadDocumentException(invalidCnpj, DocumentType::Cnpj, kind) {}
};

/**
 * @brief JSON (de)serialization of a document failed
 */
class SerializationException : public DocumentException {
public:
    explicit SerializationException(const std::string& message)
        : DocumentException("Serialization error: " + message) {}
};

} // namespace brdocs
