/**
 * @file document_json.h
 * @brief jsoncpp adapter for CPF, CNPJ and detection results
 *
 * Documents are written as their "G" formatted string and read back from a
 * JSON string token only.
 */

#pragma once

#include "brdocs/cnpj.h"
#include "brdocs/cpf.h"
#include "brdocs/document_report.h"
#include "brdocs/types.h"

#include <json/json.h>

#include <string>
#include <vector>

namespace brdocs {
namespace json {

Json::Value toJson(const Cpf& cpf);
Json::Value toJson(const Cnpj& cnpj);

/// @brief "CPF", "CNPJ" or "Unknown"
Json::Value toJson(DocumentType type);

/**
 * @brief Read a CPF from a JSON string token
 * @throws SerializationException if the token is not a string
 * @throws BadCpfException if the string is not a valid CPF
 */
Cpf cpfFromJson(const Json::Value& value);

/**
 * @brief Read a CNPJ from a JSON string token
 * @throws SerializationException if the token is not a string
 * @throws BadCnpjException if the string is not a valid CNPJ
 */
Cnpj cnpjFromJson(const Json::Value& value);

/// @brief Compact JSON text of a document ("\"123.456.789-09\"")
std::string toJsonString(const Cpf& cpf);
std::string toJsonString(const Cnpj& cnpj);

/**
 * @brief Parse JSON text holding a single string token
 * @throws SerializationException for malformed JSON or a non-string token
 */
Cpf cpfFromJsonString(const std::string& text);
Cnpj cnpjFromJsonString(const std::string& text);

/**
 * @brief One validation report, as printed by brdocs-cli
 *
 * Fields: input, valid, type, error (when invalid), formatted (when the
 * style applies) and formatError (when it does not).
 */
Json::Value reportToJson(const DocumentReport& report);

/// @brief Array of reportToJson entries
Json::Value reportsToJson(const std::vector<DocumentReport>& reports);

} // namespace json
} // namespace brdocs
