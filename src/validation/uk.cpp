/**
 * @file uk.cpp
 * @brief UK VAT, Company Number, UTR, NINO and PAYE strategies
 */

#include "taxid/validation/uk.h"
#include "taxid/validation/checksum.h"
#include "taxid/validation/lookup_tables.h"
#include "taxid/common/exceptions.h"

#include <spdlog/spdlog.h>

namespace taxid::validation::uk {

namespace {

constexpr size_t PAYE_MAX_REFERENCE = 10;

Segment countryPrefix() {
    return Segment::literal("countryCode", "country prefix", {"GB"}, SegmentRole::PREFIX);
}

ValidationError makeError(ValidationErrorKind kind, const std::string& message) {
    ValidationError error;
    error.kind = kind;
    error.message = message;
    return error;
}

} // anonymous namespace

// =============================================================================
// VAT
// =============================================================================

VatStrategy::VatStrategy() {
    schemas_.push_back(Schema::of("standard", {
        countryPrefix(),
        Segment::digits("number", "registration number", 9),
    }));
    schemas_.push_back(Schema::of("branch", {
        countryPrefix(),
        Segment::digits("number", "registration number", 9),
        Segment::digits("branch", "branch identifier", 3, SegmentRole::ENTITY_NUMBER),
    }));
    schemas_.push_back(Schema::of("government", {
        countryPrefix(),
        Segment::literal("departmentType", "department type", {"GD"}, SegmentRole::ENTITY_TYPE),
        Segment::digits("number", "department number", 3),
    }));
    schemas_.push_back(Schema::of("health", {
        countryPrefix(),
        Segment::literal("departmentType", "department type", {"HA"}, SegmentRole::ENTITY_TYPE),
        Segment::digits("number", "health authority number", 3),
    }));
}

std::vector<std::string> VatStrategy::formatGroups(const Schema& schema, const std::string& value) const {
    if (schema.length == 7) {
        return {value.substr(0, 2), value.substr(2)};
    }

    std::vector<std::string> groups = {value.substr(0, 2), value.substr(2, 3),
                                       value.substr(5, 4), value.substr(9, 2)};
    if (schema.variant == "branch") {
        groups.push_back(value.substr(11, 3));
    }
    return groups;
}

std::string VatStrategy::generate(const Segments& components) const {
    std::string type = component(components, "type", "STANDARD");

    if (type == "STANDARD") {
        return checkedGenerate("GB" + digitComponent(components, "number", 9, "000000001"));
    }
    if (type == "BRANCH") {
        return checkedGenerate("GB" + digitComponent(components, "number", 9, "000000001") +
                               digitComponent(components, "branch", 3, "001"));
    }
    if (type == "GOVERNMENT") {
        return checkedGenerate("GBGD" + digitComponent(components, "number", 3, "001"));
    }
    if (type == "HEALTH") {
        return checkedGenerate("GBHA" + digitComponent(components, "number", 3, "001"));
    }

    spdlog::warn("UK VAT generation got unknown type '{}'", type);
    throw common::GenerationException("type", "Unknown UK VAT number type: " + type);
}

// =============================================================================
// Company Number
// =============================================================================

CompanyNumberStrategy::CompanyNumberStrategy() {
    schemas_.push_back(Schema::of("england-wales", {
        Segment::digits("number", "company number", 8),
    }));
    schemas_.push_back(Schema::of("prefixed", {
        Segment::literal("prefix", "registry prefix", {"SC", "NI"}, SegmentRole::PREFIX),
        Segment::digits("number", "company number", 6),
    }));
    schemas_.push_back(Schema::of("legacy", {
        Segment::digits("number", "company number", 6),
    }));
}

std::map<std::string, LookupEntry> CompanyNumberStrategy::resolveLookups(const Segments& segments) const {
    std::map<std::string, LookupEntry> lookups;
    auto it = segments.find("prefix");
    if (it != segments.end()) {
        if (auto prefix = byCode(LookupTable::UK_COMPANY_PREFIX, it->second)) {
            lookups["prefix"] = *prefix;
        }
    }
    return lookups;
}

std::string CompanyNumberStrategy::generate(const Segments& components) const {
    std::string jurisdiction = component(components, "jurisdiction", "EW");

    if (jurisdiction == "EW") {
        return checkedGenerate(digitComponent(components, "number", 8, "00000001"));
    }
    if (jurisdiction == "LEGACY") {
        return checkedGenerate(digitComponent(components, "number", 6, "000001"));
    }
    if (byCode(LookupTable::UK_COMPANY_PREFIX, jurisdiction)) {
        return checkedGenerate(jurisdiction + digitComponent(components, "number", 6, "000001"));
    }

    spdlog::warn("UK company number generation got unknown jurisdiction '{}'", jurisdiction);
    throw common::GenerationException("jurisdiction", "Unknown company registry: " + jurisdiction);
}

// =============================================================================
// UTR
// =============================================================================

UtrStrategy::UtrStrategy() {
    schemas_.push_back(Schema::of("UTR", {
        Segment::digits("reference", "reference", 9),
        Segment::digits("checkDigit", "check digit", 1, SegmentRole::CHECK_DIGIT),
    }, ChecksumFamily::MOD11_WEIGHTED));
}

std::optional<std::string> UtrStrategy::computeCheck(const Schema&, const std::string& value) const {
    return std::to_string(calculateUtrCheckDigit(value.substr(0, 9)));
}

std::vector<std::string> UtrStrategy::formatGroups(const Schema&, const std::string& value) const {
    return {value.substr(0, 5), value.substr(5, 5)};
}

std::string UtrStrategy::generate(const Segments& components) const {
    std::string reference = digitComponent(components, "reference", 9, "000000001");
    return checkedGenerate(reference + std::to_string(calculateUtrCheckDigit(reference)));
}

int calculateUtrCheckDigit(const std::string& reference) {
    return checksum::mod11WeightedCheckDigit(reference);
}

// =============================================================================
// NINO
// =============================================================================

NinoStrategy::NinoStrategy() {
    schemas_.push_back(Schema::of("NINO", {
        Segment::alpha("prefix", "prefix", 2, SegmentRole::PREFIX),
        Segment::digits("number", "number", 6),
        Segment::charset("suffix", "suffix", "ABCD", SegmentRole::CHECK_DIGIT),
    }, ChecksumFamily::NINO_LETTER_RULES));
}

std::optional<ValidationError> NinoStrategy::validateStructure(const Schema& schema,
                                                               const std::string& value) const {
    if (auto error = IdentifierStrategy::validateStructure(schema, value)) {
        return error;
    }

    switch (checksum::checkNinoLetters(value.substr(0, 2))) {
        case checksum::NinoLetterCheck::FIRST_LETTER_EXCLUDED:
            return makeError(ValidationErrorKind::INVALID_FORMAT,
                             "Invalid NINO format: first letter '" + value.substr(0, 1) + "' is not allowed");
        case checksum::NinoLetterCheck::SECOND_LETTER_EXCLUDED:
            return makeError(ValidationErrorKind::INVALID_FORMAT,
                             "Invalid NINO format: second letter '" + value.substr(1, 1) + "' is not allowed");
        case checksum::NinoLetterCheck::PREFIX_EXCLUDED:
        case checksum::NinoLetterCheck::OK:
            break;
    }
    return std::nullopt;
}

std::optional<ValidationError> NinoStrategy::validateLookups(const Schema&,
                                                             const Segments& segments) const {
    const std::string& prefix = segments.at("prefix");
    if (isNinoPrefixExcluded(prefix)) {
        return makeError(ValidationErrorKind::INVALID_LOOKUP_CODE,
                         "NINO prefix " + prefix + " is never allocated");
    }
    return std::nullopt;
}

std::vector<std::string> NinoStrategy::formatGroups(const Schema&, const std::string& value) const {
    return {value.substr(0, 2), value.substr(2, 2), value.substr(4, 2),
            value.substr(6, 2), value.substr(8, 1)};
}

std::string NinoStrategy::generate(const Segments& components) const {
    return checkedGenerate(component(components, "prefix", "AA") +
                           digitComponent(components, "number", 6, "000000") +
                           component(components, "suffix", "A"));
}

// =============================================================================
// PAYE
// =============================================================================

PayeStrategy::PayeStrategy() {
    for (size_t length = 1; length <= PAYE_MAX_REFERENCE; ++length) {
        schemas_.push_back(Schema::of("reference-" + std::to_string(length), {
            Segment::digits("taxOfficeNumber", "tax office number", 3, SegmentRole::ENTITY_NUMBER),
            Segment::literal("separator", "separator", {"/"}),
            Segment::alphanumeric("employerReference", "employer reference", length),
        }));
    }
}

std::string PayeStrategy::generate(const Segments& components) const {
    return checkedGenerate(digitComponent(components, "taxOfficeNumber", 3, "001") + "/" +
                           component(components, "employerReference", "A1"));
}

} // namespace taxid::validation::uk
