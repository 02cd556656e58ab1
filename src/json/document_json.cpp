/**
 * @file document_json.cpp
 * @brief jsoncpp adapter implementation
 */

#include "brdocs/json/document_json.h"
#include "brdocs/exceptions.h"

#include <spdlog/spdlog.h>

#include <sstream>

namespace brdocs {
namespace json {

namespace {

std::string tokenTypeName(const Json::Value& value) {
    switch (value.type()) {
        case Json::nullValue:    return "null";
        case Json::intValue:
        case Json::uintValue:
        case Json::realValue:    return "number";
        case Json::stringValue:  return "string";
        case Json::booleanValue: return "boolean";
        case Json::arrayValue:   return "array";
        case Json::objectValue:  return "object";
    }
    return "unknown";
}

std::string requireString(const Json::Value& value, const char* typeName) {
    if (!value.isString()) {
        spdlog::warn("Refusing JSON {} token for {}", tokenTypeName(value), typeName);
        throw SerializationException(std::string("Expected string value for ") + typeName +
                                     ", but found " + tokenTypeName(value));
    }
    return value.asString();
}

std::string writeCompact(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

Json::Value readJson(const std::string& text) {
    Json::Value root;
    Json::CharReaderBuilder reader;
    std::istringstream iss(text);
    std::string errs;

    if (!Json::parseFromStream(reader, iss, &root, &errs)) {
        spdlog::warn("Malformed JSON document: {}", errs);
        throw SerializationException("Malformed JSON: " + errs);
    }
    return root;
}

} // anonymous namespace

Json::Value toJson(const Cpf& cpf) {
    return Json::Value(cpf.toString("G"));
}

Json::Value toJson(const Cnpj& cnpj) {
    return Json::Value(cnpj.toString("G"));
}

Json::Value toJson(DocumentType type) {
    return Json::Value(documentTypeToString(type));
}

Cpf cpfFromJson(const Json::Value& value) {
    return Cpf::parse(requireString(value, "Cpf"));
}

Cnpj cnpjFromJson(const Json::Value& value) {
    return Cnpj::parse(requireString(value, "Cnpj"));
}

std::string toJsonString(const Cpf& cpf) {
    return writeCompact(toJson(cpf));
}

std::string toJsonString(const Cnpj& cnpj) {
    return writeCompact(toJson(cnpj));
}

Cpf cpfFromJsonString(const std::string& text) {
    return cpfFromJson(readJson(text));
}

Cnpj cnpjFromJsonString(const std::string& text) {
    return cnpjFromJson(readJson(text));
}

Json::Value reportToJson(const DocumentReport& report) {
    Json::Value json;
    json["input"] = report.input;
    json["valid"] = report.detection.valid;
    json["type"] = toJson(report.detection.type);

    if (!report.detection.valid) {
        json["error"] = errorKindToString(report.detection.error);
    }
    if (report.formatted) {
        json["formatted"] = *report.formatted;
    }
    if (report.formatError != ErrorKind::None) {
        json["formatError"] = errorKindToString(report.formatError);
    }
    return json;
}

Json::Value reportsToJson(const std::vector<DocumentReport>& reports) {
    Json::Value array = Json::arrayValue;
    for (const auto& report : reports) {
        array.append(reportToJson(report));
    }
    return array;
}

} // namespace json
} // namespace brdocs
