/**
 * @file india.cpp
 * @brief GSTIN, PAN, HSN and SAC strategies
 */

#include "taxid/validation/india.h"
#include "taxid/validation/checksum.h"
#include "taxid/validation/lookup_tables.h"
#include "taxid/validation/normalizer.h"
#include "taxid/common/exceptions.h"

#include <spdlog/spdlog.h>

namespace taxid::validation::india {

namespace {

constexpr const char* GSTIN_ENTITY_NUMBER_CHARS = "123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

/// PAN grammar shared by the PAN schema and the PAN block inside a GSTIN
std::vector<Segment> panSegments() {
    return {
        Segment::alpha("holderPrefix", "PAN holder prefix", 3),
        Segment::charset("entityType", "PAN entity type", PAN_ENTITY_TYPE_LETTERS, SegmentRole::ENTITY_TYPE),
        Segment::alpha("nameInitial", "PAN name initial", 1),
        Segment::digits("sequence", "PAN sequence", 4),
        Segment::alpha("checkLetter", "PAN check letter", 1, SegmentRole::CHECK_DIGIT),
    };
}

ValidationError lookupError(const std::string& message) {
    ValidationError error;
    error.kind = ValidationErrorKind::INVALID_LOOKUP_CODE;
    error.message = message;
    return error;
}

const GstinStrategy& gstinStrategy() {
    static const GstinStrategy strategy;
    return strategy;
}

const HsnStrategy& hsnStrategy() {
    static const HsnStrategy strategy;
    return strategy;
}

} // anonymous namespace

// =============================================================================
// GSTIN
// =============================================================================

GstinStrategy::GstinStrategy() {
    std::vector<Segment> segments;
    segments.push_back(Segment::digits("stateCode", "state code", 2, SegmentRole::STATE_CODE));
    for (const auto& segment : panSegments()) {
        Segment panPart = segment;
        // the PAN's trailing letter is not the GSTIN check character
        if (panPart.role == SegmentRole::CHECK_DIGIT) {
            panPart.role = SegmentRole::SEQUENCE;
        }
        segments.push_back(panPart);
    }
    segments.push_back(Segment::charset("entityNumber", "entity number", GSTIN_ENTITY_NUMBER_CHARS,
                                        SegmentRole::ENTITY_NUMBER));
    segments.push_back(Segment::literal("defaultChar", "default character", {"Z"}));
    segments.push_back(Segment::alphanumeric("checkDigit", "check character", 1, SegmentRole::CHECK_DIGIT));

    schemas_.push_back(Schema::of("GSTIN", segments, ChecksumFamily::MOD36_ALPHANUMERIC));
}

Segments GstinStrategy::extractSegments(const Schema&, const std::string& value) const {
    Segments segments;
    segments["stateCode"] = value.substr(0, 2);
    segments["pan"] = value.substr(2, 10);
    segments["entityType"] = value.substr(5, 1);
    segments["entityNumber"] = value.substr(12, 1);
    segments["defaultChar"] = value.substr(13, 1);
    segments["checkDigit"] = value.substr(14, 1);
    return segments;
}

std::optional<ValidationError> GstinStrategy::validateLookups(const Schema&,
                                                              const Segments& segments) const {
    const std::string& stateCode = segments.at("stateCode");
    auto state = byCode(LookupTable::INDIA_STATE, stateCode);
    if (!state) {
        return lookupError("Invalid GSTIN state code: " + stateCode);
    }
    if (!state->active) {
        return lookupError("Inactive GSTIN state code: " + stateCode + " (" + state->name + ")");
    }
    return std::nullopt;
}

std::optional<std::string> GstinStrategy::computeCheck(const Schema&, const std::string& value) const {
    return std::string(1, calculateGstinCheckDigit(value.substr(0, 14)));
}

std::map<std::string, LookupEntry> GstinStrategy::resolveLookups(const Segments& segments) const {
    std::map<std::string, LookupEntry> lookups;
    if (auto state = byCode(LookupTable::INDIA_STATE, segments.at("stateCode"))) {
        lookups["stateCode"] = *state;
    }
    if (auto entityType = byCode(LookupTable::PAN_ENTITY_TYPE, segments.at("entityType"))) {
        lookups["entityType"] = *entityType;
    }
    return lookups;
}

std::vector<std::string> GstinStrategy::formatGroups(const Schema&, const std::string& value) const {
    return {value.substr(0, 2), value.substr(2, 10), value.substr(12, 3)};
}

std::string GstinStrategy::generate(const Segments& components) const {
    requireComponent(components, "stateCode");
    std::string stateCode = digitComponent(components, "stateCode", 2, "");

    auto state = byCode(LookupTable::INDIA_STATE, stateCode);
    if (!state || !state->active) {
        spdlog::warn("GSTIN generation rejected state code {}", stateCode);
        throw common::GenerationException("stateCode", "Unknown or inactive state code: " + stateCode);
    }

    std::string pan = requireComponent(components, "pan");
    static const PanStrategy panStrategy;
    ValidationResult panResult = panStrategy.validate(pan);
    if (!panResult.isValid) {
        throw common::GenerationException("pan", panResult.error->message);
    }

    std::string entityNumber = component(components, "entityNumber", "1");
    if (entityNumber.size() != 1 ||
        std::string(GSTIN_ENTITY_NUMBER_CHARS).find(entityNumber[0]) == std::string::npos) {
        throw common::GenerationException("entityNumber",
                                          "Entity number must be one of 1-9 or A-Z, got '" + entityNumber + "'");
    }

    std::string body = stateCode + panResult.normalizedValue + entityNumber + "Z";
    return checkedGenerate(body + calculateGstinCheckDigit(body));
}

// =============================================================================
// PAN
// =============================================================================

PanStrategy::PanStrategy() {
    schemas_.push_back(Schema::of("PAN", panSegments()));
}

std::map<std::string, LookupEntry> PanStrategy::resolveLookups(const Segments& segments) const {
    std::map<std::string, LookupEntry> lookups;
    if (auto entityType = byCode(LookupTable::PAN_ENTITY_TYPE, segments.at("entityType"))) {
        lookups["entityType"] = *entityType;
    }
    return lookups;
}

std::string PanStrategy::generate(const Segments& components) const {
    std::string pan = component(components, "holderPrefix", "AAA") +
                      component(components, "entityType", "P") +
                      component(components, "nameInitial", "A") +
                      digitComponent(components, "sequence", 4, "0001") +
                      component(components, "checkLetter", "A");
    return checkedGenerate(pan);
}

// =============================================================================
// HSN
// =============================================================================

HsnStrategy::HsnStrategy() {
    Segment chapter = Segment::digits("chapter", "chapter", 2, SegmentRole::CLASSIFICATION);
    Segment heading = Segment::digits("heading", "heading", 2, SegmentRole::CLASSIFICATION);
    Segment subheading = Segment::digits("subheading", "subheading", 2, SegmentRole::CLASSIFICATION);
    Segment tariffItem = Segment::digits("tariffItem", "tariff item", 2, SegmentRole::CLASSIFICATION);

    schemas_.push_back(Schema::of("4-digit", {chapter, heading}));
    schemas_.push_back(Schema::of("6-digit", {chapter, heading, subheading}));
    schemas_.push_back(Schema::of("8-digit", {chapter, heading, subheading, tariffItem}));
}

std::string HsnStrategy::normalize(const std::string& raw) const {
    return normalizeIdentifier(raw, ".");
}

std::optional<ValidationError> HsnStrategy::validateLookups(const Schema&,
                                                            const Segments& segments) const {
    const std::string& chapter = segments.at("chapter");
    if (chapter == "00") {
        return lookupError("Invalid HSN chapter: 00");
    }
    if (chapter == "99") {
        return lookupError("HSN chapter 99 is reserved for services (use SAC)");
    }
    return std::nullopt;
}

std::vector<std::string> HsnStrategy::formatGroups(const Schema&, const std::string& value) const {
    std::vector<std::string> groups = {value.substr(0, 4)};
    for (size_t offset = 4; offset < value.size(); offset += 2) {
        groups.push_back(value.substr(offset, 2));
    }
    return groups;
}

std::string HsnStrategy::generate(const Segments& components) const {
    requireComponent(components, "chapter");
    std::string code = digitComponent(components, "chapter", 2, "") +
                       digitComponent(components, "heading", 2, "01");

    std::string subheading = component(components, "subheading", "");
    std::string tariffItem = component(components, "tariffItem", "");
    if (!tariffItem.empty() && subheading.empty()) {
        throw common::GenerationException("tariffItem", "tariffItem requires a subheading");
    }
    if (!subheading.empty()) {
        code += digitComponent(components, "subheading", 2, "");
    }
    if (!tariffItem.empty()) {
        code += digitComponent(components, "tariffItem", 2, "");
    }
    return checkedGenerate(code);
}

// =============================================================================
// SAC
// =============================================================================

SacStrategy::SacStrategy() {
    schemas_.push_back(Schema::of("SAC", {
        Segment::literal("section", "section prefix", {"99"}, SegmentRole::PREFIX),
        Segment::digits("heading", "heading", 2, SegmentRole::CLASSIFICATION),
        Segment::digits("group", "group", 1, SegmentRole::CLASSIFICATION),
        Segment::digits("service", "service code", 1, SegmentRole::CLASSIFICATION),
    }));
}

std::string SacStrategy::normalize(const std::string& raw) const {
    return normalizeIdentifier(raw, ".");
}

std::vector<std::string> SacStrategy::formatGroups(const Schema&, const std::string& value) const {
    return {value.substr(0, 4), value.substr(4, 2)};
}

std::string SacStrategy::generate(const Segments& components) const {
    std::string code = "99" + digitComponent(components, "heading", 2, "83") +
                       digitComponent(components, "group", 1, "1") +
                       digitComponent(components, "service", 1, "1");
    return checkedGenerate(code);
}

// =============================================================================
// Helpers
// =============================================================================

char calculateGstinCheckDigit(const std::string& first14) {
    return checksum::mod36CheckCharacter(first14);
}

std::optional<std::string> extractStateCode(const std::string& gstin) {
    ValidationResult result = gstinStrategy().validate(gstin);
    if (!result.isValid) {
        return std::nullopt;
    }
    return result.segments.at("stateCode");
}

bool isGstinFromState(const std::string& gstin, const std::string& stateCode) {
    auto code = extractStateCode(gstin);
    return code.has_value() && *code == stateCode;
}

int requiredHsnDigits(double annualTurnover) {
    if (annualTurnover > HSN_SIX_DIGIT_TURNOVER) return 6;
    if (annualTurnover > HSN_FOUR_DIGIT_TURNOVER) return 4;
    return 0;
}

ValidationResult validateHsnForTurnover(const std::string& code, double annualTurnover) {
    ValidationResult result = hsnStrategy().validate(code);
    if (!result.isValid) {
        return result;
    }

    size_t required = static_cast<size_t>(requiredHsnDigits(annualTurnover));
    if (result.normalizedValue.size() < required) {
        ValidationError error;
        error.kind = ValidationErrorKind::INVALID_LENGTH;
        error.message = "HSN code must have at least " + std::to_string(required) +
                        " digits for this turnover (got " +
                        std::to_string(result.normalizedValue.size()) + ")";
        result.isValid = false;
        result.error = error;
    }
    return result;
}

} // namespace taxid::validation::india
