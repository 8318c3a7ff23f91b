/**
 * @file taxid_cli.cpp
 * @brief Command-line front end for the taxid library
 *
 * Prints JSON on stdout; diagnostics go to stderr through spdlog.
 *
 * Environment:
 *   TAXID_LOG_LEVEL          trace|debug|info|warn|error (default: warn)
 *   TAXID_LOG_FILE           optional rotating log file
 *   TAXID_OUTPUT_PRETTY      indent JSON output (default: true)
 *   TAXID_DEFAULT_SEPARATOR  separator for 'format' when none is given
 */

#include "taxid/common/config_manager.h"
#include "taxid/common/exceptions.h"
#include "taxid/common/logger.h"
#include "taxid/utils/string_utils.h"
#include "taxid/validation/gst_transaction.h"
#include "taxid/validation/lookup_tables.h"
#include "taxid/validation/registry.h"

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

using namespace taxid;
using namespace taxid::validation;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  validate <kind> <value>...          Validate one or more values\n"
              << "  parse <kind> <value>                Segments and lookup rows of a valid value\n"
              << "  format <kind> <value> [separator]   Canonical display form\n"
              << "  generate <kind> [segment=value]...  Compose a valid identifier\n"
              << "  lookup <table> [code]               List a lookup table or resolve one code\n"
              << "  transaction <gstin> <gstin> [rate]  GST transaction type and rate split\n"
              << "  kinds                               List identifier kinds\n"
              << "\n"
              << "Kinds:  GSTIN PAN HSN SAC NIF NIE CIF ES_VAT JP_CORPORATE_NUMBER\n"
              << "        JP_INVOICE_REGISTRATION_NUMBER UK_VAT UK_COMPANY_NUMBER UK_UTR\n"
              << "        UK_NINO UK_PAYE\n"
              << "Tables: INDIA_STATE PAN_ENTITY_TYPE CIF_TYPE_LETTER UK_COMPANY_PREFIX\n";
}

void printJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    bool pretty = common::ConfigManager::getInstance().getBool(common::ConfigManager::OUTPUT_PRETTY, true);
    builder["indentation"] = pretty ? "  " : "";
    std::cout << Json::writeString(builder, value) << std::endl;
}

IdentifierKind requireKind(const std::string& name) {
    auto kind = identifierKindFromString(name);
    if (!kind) {
        throw common::UnsupportedKindException(name);
    }
    return *kind;
}

int runValidate(IdentifierKind kind, const std::vector<std::string>& values) {
    auto results = validateMany(kind, values);

    bool allValid = true;
    Json::Value output(Json::arrayValue);
    for (const auto& result : results) {
        allValid = allValid && result.isValid;
        output.append(result.toJson());
    }

    printJson(results.size() == 1 ? output[0] : output);
    return allValid ? 0 : 1;
}

int runParse(IdentifierKind kind, const std::string& value) {
    auto parsed = parse(kind, value);
    if (!parsed) {
        printJson(validate(kind, value).toJson());
        return 1;
    }
    printJson(parsed->toJson());
    return 0;
}

int runFormat(IdentifierKind kind, const std::string& value, std::optional<std::string> separator) {
    if (!separator) {
        separator = common::ConfigManager::getInstance().getOptional(common::ConfigManager::DEFAULT_SEPARATOR);
    }

    Json::Value output;
    output["kind"] = identifierKindToString(kind);
    output["input"] = value;
    output["formatted"] = format(kind, value, separator);
    printJson(output);
    return 0;
}

int runGenerate(IdentifierKind kind, const std::vector<std::string>& assignments) {
    Segments components;
    for (const auto& assignment : assignments) {
        auto pos = assignment.find('=');
        if (pos == std::string::npos || pos == 0) {
            spdlog::error("Expected segment=value, got '{}'", assignment);
            return 1;
        }
        components[assignment.substr(0, pos)] = assignment.substr(pos + 1);
    }

    std::string value = generate(kind, components);

    Json::Value output;
    output["kind"] = identifierKindToString(kind);
    output["value"] = value;
    output["formatted"] = format(kind, value);
    printJson(output);
    return 0;
}

int runLookup(const std::string& tableName, const std::optional<std::string>& code) {
    auto table = lookupTableFromString(tableName);
    if (!table) {
        spdlog::error("Unknown lookup table: {}", tableName);
        return 1;
    }

    if (code) {
        auto entry = byCode(*table, utils::toUpper(*code));
        if (!entry) {
            entry = byName(*table, *code);
        }
        if (!entry) {
            spdlog::error("No {} entry for '{}'", lookupTableToString(*table), *code);
            return 1;
        }
        printJson(entry->toJson());
        return 0;
    }

    Json::Value output(Json::arrayValue);
    for (const auto& entry : list(*table)) {
        output.append(entry.toJson());
    }
    printJson(output);
    return 0;
}

int runTransaction(const std::string& supplier, const std::string& recipient,
                   const std::optional<std::string>& rate) {
    auto result = india::determineTransactionType(supplier, recipient);
    if (!result) {
        spdlog::error("Both arguments must be valid GSTINs");
        return 1;
    }

    Json::Value output = result->toJson();
    if (rate) {
        double totalRate = std::stod(*rate);
        bool unionTerritory = std::find(result->taxComponents.begin(), result->taxComponents.end(),
                                        india::TaxComponent::UTGST) != result->taxComponents.end();
        output["rateSplit"] = india::splitRate(totalRate, result->type, unionTerritory).toJson();
    }
    printJson(output);
    return 0;
}

int runKinds() {
    Json::Value output(Json::arrayValue);
    for (IdentifierKind kind : Registry::instance().kinds()) {
        Json::Value item;
        item["kind"] = identifierKindToString(kind);
        item["country"] = countryToString(countryOf(kind));
        output.append(item);
    }
    printJson(output);
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    auto& config = common::ConfigManager::getInstance();
    common::Logger::initialize(
        "taxid-cli",
        config.getString(common::ConfigManager::LOG_LEVEL, "warn"),
        config.has(common::ConfigManager::LOG_FILE),
        config.getString(common::ConfigManager::LOG_FILE)
    );

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "kinds") {
            return runKinds();
        }
        if (command == "validate" && args.size() >= 2) {
            return runValidate(requireKind(args[0]), std::vector<std::string>(args.begin() + 1, args.end()));
        }
        if (command == "parse" && args.size() == 2) {
            return runParse(requireKind(args[0]), args[1]);
        }
        if (command == "format" && (args.size() == 2 || args.size() == 3)) {
            std::optional<std::string> separator;
            if (args.size() == 3) separator = args[2];
            return runFormat(requireKind(args[0]), args[1], separator);
        }
        if (command == "generate" && !args.empty()) {
            return runGenerate(requireKind(args[0]), std::vector<std::string>(args.begin() + 1, args.end()));
        }
        if (command == "lookup" && (args.size() == 1 || args.size() == 2)) {
            std::optional<std::string> code;
            if (args.size() == 2) code = args[1];
            return runLookup(args[0], code);
        }
        if (command == "transaction" && (args.size() == 2 || args.size() == 3)) {
            std::optional<std::string> rate;
            if (args.size() == 3) rate = args[2];
            return runTransaction(args[0], args[1], rate);
        }
    } catch (const common::TaxIdException& e) {
        spdlog::error("{}", e.what());
        common::Logger::flush();
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        common::Logger::flush();
        return 2;
    }

    printUsage(argv[0]);
    return 1;
}
