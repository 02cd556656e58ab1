/**
 * @file brdocs_cli.cpp
 * @brief Command-line front-end for CPF and CNPJ handling
 *
 * Usage:
 *   brdocs-cli [--log-level L] validate [--hint cpf|cnpj] [--style S] [--json] [input...]
 *   brdocs-cli create-cpf <base>
 *   brdocs-cli create-cnpj <root> <branch> | <rootAndBranch>
 *   brdocs-cli format --style <S|B|BS|G> [--hint cpf|cnpj] <input>
 *   brdocs-cli bench [--count N] [--seed N] [--alpha P]
 *
 * Environment: LOG_LEVEL, LOG_FILE, BRDOCS_DEFAULT_HINT, BRDOCS_OUTPUT_STYLE,
 * BRDOCS_OUTPUT_JSON, BRDOCS_BENCH_COUNT. Flags take precedence.
 */

#include "brdocs/brazilian_document.h"
#include "brdocs/cnpj.h"
#include "brdocs/config/config_manager.h"
#include "brdocs/cpf.h"
#include "brdocs/document_report.h"
#include "brdocs/exceptions.h"
#include "brdocs/json/document_json.h"
#include "brdocs/logging/logger.h"
#include "brdocs/utils/string_utils.h"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace brdocs;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--log-level LEVEL] <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  validate [--hint cpf|cnpj] [--style S|B|BS|G] [--json] [input...]\n"
              << "      Detect and validate documents (reads stdin lines when no input)\n"
              << "  create-cpf <base>\n"
              << "      Append check digits to a 9-digit CPF base\n"
              << "  create-cnpj <root> <branch> | <rootAndBranch>\n"
              << "      Append check digits to a CNPJ root and branch\n"
              << "  format --style <S|B|BS|G> [--hint cpf|cnpj] <input>\n"
              << "      Parse a document and print it in the given style\n"
              << "  bench [--count N] [--seed N] [--alpha P]\n"
              << "      Time validation of random CPFs and CNPJs\n";
}

size_t parseCount(const std::string& text) {
    auto value = utils::parseInteger(text);
    if (!value || *value < 0) {
        throw std::invalid_argument("Invalid value '" + text + "' for --count (expected a non-negative integer)");
    }
    return static_cast<size_t>(*value);
}

uint32_t parseSeed(const std::string& text) {
    auto value = utils::parseInteger(text);
    if (!value || *value < 0 || *value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw std::invalid_argument("Invalid value '" + text + "' for --seed (expected 0 to 4294967295)");
    }
    return static_cast<uint32_t>(*value);
}

double parseAlpha(const std::string& text) {
    auto value = utils::parseDouble(text);
    if (!value || !(*value >= 0.0 && *value <= 1.0)) {
        throw std::invalid_argument("Invalid value '" + text + "' for --alpha (expected a ratio from 0 to 1)");
    }
    return *value;
}

DocumentType parseHint(const std::string& text) {
    auto type = documentTypeFromString(text);
    if (!type) {
        throw std::invalid_argument("Unknown document hint '" + text + "' (expected cpf, cnpj or none)");
    }
    return *type;
}

// ============================================================================
// validate
// ============================================================================

int runValidate(const std::vector<std::string>& args) {
    auto& config = ConfigManager::getInstance();
    DocumentType hint = parseHint(config.getString(ConfigManager::DEFAULT_HINT, "none"));
    std::string style = config.getString(ConfigManager::OUTPUT_STYLE, "G");
    bool asJson = config.getBool(ConfigManager::OUTPUT_JSON, false);
    std::vector<std::string> inputs;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--hint" && i + 1 < args.size()) {
            hint = parseHint(args[++i]);
        } else if (arg == "--style" && i + 1 < args.size()) {
            style = args[++i];
        } else if (arg == "--json") {
            asJson = true;
        } else {
            inputs.push_back(arg);
        }
    }

    // A style no document type knows is a usage error; one that only fits
    // CNPJ (BS) is reported per input
    if (!isKnownFormatStyle(style)) {
        throw std::invalid_argument("Unknown format style '" + style + "' (expected S, B, BS or G)");
    }

    if (inputs.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty()) {
                inputs.push_back(line);
            }
        }
    }

    std::vector<DocumentReport> reports = describeDocuments(inputs, hint, style);

    if (asJson) {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        std::cout << Json::writeString(writer, json::reportsToJson(reports)) << std::endl;
    } else {
        for (const auto& report : reports) {
            std::cout << report.input << "\t";
            if (!report.detection.valid) {
                std::cout << "invalid\t" << errorKindToString(report.detection.error);
            } else {
                std::cout << (report.detection.type == DocumentType::Cpf ? "CPF" : "CNPJ") << "\t"
                          << (report.formatted ? *report.formatted : errorKindToString(report.formatError));
            }
            std::cout << "\n";
        }
    }

    spdlog::debug("Validated {} input(s)", inputs.size());
    return allValid(reports) ? EXIT_OK : EXIT_INVALID;
}

// ============================================================================
// create-cpf / create-cnpj / format
// ============================================================================

int runCreateCpf(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "create-cpf expects exactly one base\n";
        return EXIT_USAGE;
    }
    std::cout << Cpf::create(args[0]).toString("G") << std::endl;
    return EXIT_OK;
}

int runCreateCnpj(const std::vector<std::string>& args) {
    if (args.size() == 1) {
        std::cout << Cnpj::create(args[0]).toString("G") << std::endl;
        return EXIT_OK;
    }
    if (args.size() == 2) {
        std::cout << Cnpj::create(args[0], args[1]).toString("G") << std::endl;
        return EXIT_OK;
    }
    std::cerr << "create-cnpj expects <root> <branch> or <rootAndBranch>\n";
    return EXIT_USAGE;
}

int runFormat(const std::vector<std::string>& args) {
    auto& config = ConfigManager::getInstance();
    DocumentType hint = parseHint(config.getString(ConfigManager::DEFAULT_HINT, "none"));
    std::string style = config.getString(ConfigManager::OUTPUT_STYLE, "G");
    std::string input;
    bool haveInput = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--style" && i + 1 < args.size()) {
            style = args[++i];
        } else if (arg == "--hint" && i + 1 < args.size()) {
            hint = parseHint(args[++i]);
        } else if (!haveInput) {
            input = arg;
            haveInput = true;
        } else {
            std::cerr << "format expects a single input\n";
            return EXIT_USAGE;
        }
    }

    if (!haveInput) {
        std::cerr << "format expects an input\n";
        return EXIT_USAGE;
    }

    Cpf cpf = Cpf::empty();
    Cnpj cnpj = Cnpj::empty();
    DocumentType type = BrazilianDocument::parse(input, cpf, cnpj, hint);
    std::cout << (type == DocumentType::Cpf ? cpf.toString(style) : cnpj.toString(style)) << std::endl;
    return EXIT_OK;
}

// ============================================================================
// bench
// ============================================================================

struct BenchResult {
    size_t tested = 0;
    size_t valid = 0;
    double seconds = 0.0;
};

template <typename Validator>
BenchResult timeValidation(const std::vector<std::string>& candidates, Validator validator) {
    BenchResult result;
    auto start = std::chrono::steady_clock::now();
    for (const auto& candidate : candidates) {
        if (validator(candidate)) {
            result.valid++;
        }
    }
    auto end = std::chrono::steady_clock::now();
    result.tested = candidates.size();
    result.seconds = std::chrono::duration<double>(end - start).count();
    return result;
}

void printBench(const std::string& name, const BenchResult& result) {
    const double rate = result.seconds > 0.0 ? result.tested / result.seconds : 0.0;
    std::cout << "Tested " << result.tested << " " << name << "s, " << result.valid
              << " valid, " << static_cast<uint64_t>(rate) << " validations/s" << std::endl;
}

int runBench(const std::vector<std::string>& args) {
    auto& config = ConfigManager::getInstance();
    int configuredCount = config.getInt(ConfigManager::BENCH_COUNT, 100000);
    size_t count = configuredCount > 0 ? static_cast<size_t>(configuredCount) : 0;
    uint32_t seed = std::random_device{}();
    double alphaRatio = 0.5;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--count" && i + 1 < args.size()) {
            count = parseCount(args[++i]);
        } else if (arg == "--seed" && i + 1 < args.size()) {
            seed = parseSeed(args[++i]);
        } else if (arg == "--alpha" && i + 1 < args.size()) {
            alphaRatio = parseAlpha(args[++i]);
        } else {
            std::cerr << "Unknown bench option: " << arg << "\n";
            return EXIT_USAGE;
        }
    }

    spdlog::info("Benchmark: count={}, seed={}, alpha={}", count, seed, alphaRatio);

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int64_t> cpfBase(0, 999999999);
    std::uniform_int_distribution<int> percent(0, 99);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_int_distribution<int> alnum(0, 35);
    std::uniform_int_distribution<int> digit(0, 9);

    const std::string alphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    // A fifth of the candidates get a corrupted last digit
    std::vector<std::string> cpfs;
    cpfs.reserve(count);
    for (size_t i = 0; i < count; i++) {
        std::string text = Cpf::create(cpfBase(rng)).toString("B");
        if (percent(rng) < 20) {
            text.back() = static_cast<char>('0' + (text.back() - '0' + 1) % 10);
        }
        cpfs.push_back(text);
    }

    std::vector<std::string> cnpjs;
    cnpjs.reserve(count);
    for (size_t i = 0; i < count; i++) {
        const bool alpha = unit(rng) < alphaRatio;
        std::string base;
        for (size_t pos = 0; pos < 12; pos++) {
            base.push_back(alpha ? alphabet[alnum(rng)] : static_cast<char>('0' + digit(rng)));
        }
        std::string text = Cnpj::create(base).getValue();
        if (percent(rng) < 20) {
            text.back() = static_cast<char>('0' + (text.back() - '0' + 1) % 10);
        }
        cnpjs.push_back(text);
    }

    printBench("CPF", timeValidation(cpfs, [](const std::string& s) { return Cpf::isValid(s); }));
    printBench("CNPJ", timeValidation(cnpjs, [](const std::string& s) { return Cnpj::isValid(s); }));
    printBench("document", timeValidation(cnpjs, [](const std::string& s) {
        return BrazilianDocument::isValid(s).valid;
    }));
    return EXIT_OK;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto& config = ConfigManager::getInstance();
    std::string logLevel = config.getString(ConfigManager::LOG_LEVEL, "warn");
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (command.empty() && arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        } else if (command.empty() && (arg == "--help" || arg == "-h")) {
            printUsage(argv[0]);
            return EXIT_OK;
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    Logger::initialize("brdocs-cli", logLevel, config.getString(ConfigManager::LOG_FILE));

    if (command.empty()) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        if (command == "validate") return runValidate(args);
        if (command == "create-cpf") return runCreateCpf(args);
        if (command == "create-cnpj") return runCreateCnpj(args);
        if (command == "format") return runFormat(args);
        if (command == "bench") return runBench(args);

        std::cerr << "Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return EXIT_USAGE;

    } catch (const BadDocumentException& e) {
        spdlog::error("{} ({})", e.what(), errorKindToString(e.getErrorKind()));
        std::cerr << e.what() << std::endl;
        return EXIT_INVALID;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE;
    }
}
