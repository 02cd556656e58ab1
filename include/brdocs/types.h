/**
 * @file types.h
 * @brief Common types for the Brazilian documents library
 *
 * Shared enums and result structs used across the CPF codec, the CNPJ codec
 * and the document disambiguator.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace brdocs {

/// @brief Kind of Brazilian tax identifier
enum class DocumentType {
    Unknown = 0,  ///< Not recognized, or ambiguous without a hint
    Cpf = 1,      ///< Individual taxpayer (Cadastro de Pessoas Fisicas)
    Cnpj = 2      ///< Company registration (Cadastro Nacional da Pessoa Juridica)
};

/// @brief Reason an input was rejected
enum class ErrorKind {
    None,                      ///< No error, input accepted
    NullOrEmptyInput,          ///< Empty or whitespace-only input
    InputTooLong,              ///< Raw input exceeds the codec length cap
    InvalidCharacter,          ///< Character outside the codec alphabet
    WrongValidCharacterCount,  ///< Too few or too many significant characters
    ChecksumMismatch,          ///< Check digits do not match
    OutOfRange,                ///< Numeric value or creation input out of bounds
    Ambiguous,                 ///< Valid as both CPF and CNPJ, no hint given
    UnknownFormatStyle         ///< Style not supported by the type (toString throws std::out_of_range)
};

/**
 * @brief Result-style outcome of a parse attempt
 *
 * Holds either a value or the ErrorKind explaining the rejection, never both.
 */
template <typename T>
struct ParseResult {
    std::optional<T> value;
    ErrorKind error = ErrorKind::None;

    static ParseResult success(T v) {
        ParseResult result;
        result.value = std::move(v);
        return result;
    }

    static ParseResult failure(ErrorKind kind) {
        ParseResult result;
        result.error = kind;
        return result;
    }

    bool ok() const { return value.has_value(); }
    explicit operator bool() const { return ok(); }
};

/// @brief Validity check outcome of the disambiguator
struct DetectionResult {
    bool valid = false;
    DocumentType type = DocumentType::Unknown;
    ErrorKind error = ErrorKind::None;  ///< Set when valid is false
};

/// @brief Convert DocumentType to string
inline std::string documentTypeToString(DocumentType t) {
    switch (t) {
        case DocumentType::Cpf:     return "CPF";
        case DocumentType::Cnpj:    return "CNPJ";
        case DocumentType::Unknown: return "Unknown";
    }
    return "Unknown";
}

/// @brief Convert ErrorKind to string
inline std::string errorKindToString(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:                     return "None";
        case ErrorKind::NullOrEmptyInput:         return "NullOrEmptyInput";
        case ErrorKind::InputTooLong:             return "InputTooLong";
        case ErrorKind::InvalidCharacter:         return "InvalidCharacter";
        case ErrorKind::WrongValidCharacterCount: return "WrongValidCharacterCount";
        case ErrorKind::ChecksumMismatch:         return "ChecksumMismatch";
        case ErrorKind::OutOfRange:               return "OutOfRange";
        case ErrorKind::Ambiguous:                return "Ambiguous";
        case ErrorKind::UnknownFormatStyle:       return "UnknownFormatStyle";
    }
    return "Unknown";
}

/**
 * @brief Parse DocumentType from a user-supplied name
 *
 * Accepts "cpf", "cnpj", "none" and "unknown" in any case.
 * @return DocumentType, or std::nullopt for unrecognized names
 */
std::optional<DocumentType> documentTypeFromString(const std::string& name);

} // namespace brdocs
