/**
 * @file spain.cpp
 * @brief NIF, NIE, CIF and ES VAT strategies
 */

#include "taxid/validation/spain.h"
#include "taxid/validation/checksum.h"
#include "taxid/validation/lookup_tables.h"
#include "taxid/common/exceptions.h"
#include "taxid/utils/string_utils.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace taxid::validation::spain {

namespace {

std::vector<Segment> nifSegments() {
    return {
        Segment::digits("number", "number", 8),
        Segment::alpha("controlLetter", "control letter", 1, SegmentRole::CHECK_DIGIT),
    };
}

std::vector<Segment> nieSegments() {
    return {
        Segment::charset("prefixLetter", "NIE prefix letter", "XYZ", SegmentRole::TYPE_LETTER),
        Segment::digits("number", "number", 7),
        Segment::alpha("controlLetter", "control letter", 1, SegmentRole::CHECK_DIGIT),
    };
}

std::vector<Segment> cifSegments() {
    return {
        Segment::alpha("typeLetter", "CIF type letter", 1, SegmentRole::TYPE_LETTER),
        Segment::digits("number", "number", 7),
        Segment::alphanumeric("control", "control character", 1, SegmentRole::CHECK_DIGIT),
    };
}

/// @brief "ES" literal followed by a national identifier grammar
std::vector<Segment> withCountryPrefix(const std::vector<Segment>& national) {
    std::vector<Segment> segments = {
        Segment::literal("countryCode", "country prefix", {"ES"}, SegmentRole::PREFIX)
    };
    segments.insert(segments.end(), national.begin(), national.end());
    return segments;
}

std::optional<ValidationError> checkCifTypeLetter(const std::string& typeLetter) {
    if (byCode(LookupTable::CIF_TYPE_LETTER, typeLetter)) {
        return std::nullopt;
    }
    ValidationError error;
    error.kind = ValidationErrorKind::INVALID_LOOKUP_CODE;
    error.message = "Unknown CIF type letter: " + typeLetter;
    return error;
}

std::map<std::string, LookupEntry> resolveCifType(const Segments& segments) {
    std::map<std::string, LookupEntry> lookups;
    auto it = segments.find("typeLetter");
    if (it != segments.end()) {
        if (auto type = byCode(LookupTable::CIF_TYPE_LETTER, it->second)) {
            lookups["typeLetter"] = *type;
        }
    }
    return lookups;
}

/**
 * @brief Expected control character of a 9-character national identifier
 * @param variant "NIF", "NIE" or "CIF"
 */
std::optional<std::string> expectedControl(const std::string& variant, const std::string& national) {
    if (variant == "NIF") {
        return std::string(1, calculateNifLetter(national.substr(0, 8)));
    }
    if (variant == "NIE") {
        return std::string(1, calculateNieLetter(national[0], national.substr(1, 7)));
    }
    auto control = calculateCifControl(national[0], national.substr(1, 7));
    if (!control) {
        return std::nullopt;
    }
    return std::string(1, *control);
}

/// @brief Display groups of a 9-character national identifier
std::vector<std::string> nationalGroups(const std::string& variant, const std::string& national) {
    if (variant == "NIF") {
        return {national.substr(0, 8), national.substr(8, 1)};
    }
    return {national.substr(0, 1), national.substr(1, 7), national.substr(8, 1)};
}

} // anonymous namespace

// =============================================================================
// NIF
// =============================================================================

NifStrategy::NifStrategy() {
    schemas_.push_back(Schema::of("NIF", nifSegments(), ChecksumFamily::MOD23_LETTER));
}

std::optional<std::string> NifStrategy::computeCheck(const Schema&, const std::string& value) const {
    return expectedControl("NIF", value);
}

std::vector<std::string> NifStrategy::formatGroups(const Schema&, const std::string& value) const {
    return nationalGroups("NIF", value);
}

std::string NifStrategy::generate(const Segments& components) const {
    std::string number = digitComponent(components, "number", 8, "00000000");
    return checkedGenerate(number + calculateNifLetter(number));
}

// =============================================================================
// NIE
// =============================================================================

NieStrategy::NieStrategy() {
    schemas_.push_back(Schema::of("NIE", nieSegments(), ChecksumFamily::MOD23_LETTER));
}

std::optional<std::string> NieStrategy::computeCheck(const Schema&, const std::string& value) const {
    return expectedControl("NIE", value);
}

std::vector<std::string> NieStrategy::formatGroups(const Schema&, const std::string& value) const {
    return nationalGroups("NIE", value);
}

std::string NieStrategy::generate(const Segments& components) const {
    std::string prefix = component(components, "prefixLetter", "X");
    if (prefix != "X" && prefix != "Y" && prefix != "Z") {
        throw common::GenerationException("prefixLetter", "NIE prefix must be X, Y or Z, got '" + prefix + "'");
    }
    std::string number = digitComponent(components, "number", 7, "0000000");
    return checkedGenerate(prefix + number + calculateNieLetter(prefix[0], number));
}

// =============================================================================
// CIF
// =============================================================================

CifStrategy::CifStrategy() {
    schemas_.push_back(Schema::of("CIF", cifSegments(), ChecksumFamily::MOD10_DUAL));
}

Segments CifStrategy::extractSegments(const Schema& schema, const std::string& value) const {
    Segments segments = IdentifierStrategy::extractSegments(schema, value);
    segments["provinceCode"] = value.substr(1, 2);
    return segments;
}

std::optional<ValidationError> CifStrategy::validateLookups(const Schema&,
                                                            const Segments& segments) const {
    return checkCifTypeLetter(segments.at("typeLetter"));
}

std::optional<std::string> CifStrategy::computeCheck(const Schema&, const std::string& value) const {
    return expectedControl("CIF", value);
}

std::map<std::string, LookupEntry> CifStrategy::resolveLookups(const Segments& segments) const {
    return resolveCifType(segments);
}

std::vector<std::string> CifStrategy::formatGroups(const Schema&, const std::string& value) const {
    return nationalGroups("CIF", value);
}

std::string CifStrategy::generate(const Segments& components) const {
    std::string typeLetter = requireComponent(components, "typeLetter");
    if (typeLetter.size() != 1 || checkCifTypeLetter(typeLetter)) {
        spdlog::warn("CIF generation rejected type letter '{}'", typeLetter);
        throw common::GenerationException("typeLetter", "Unknown CIF type letter: " + typeLetter);
    }

    std::string number = digitComponent(components, "number", 7, "0000000");
    auto control = calculateCifControl(typeLetter[0], number);
    if (!control) {
        throw common::GenerationException("typeLetter", "No control class for CIF type letter: " + typeLetter);
    }
    return checkedGenerate(typeLetter + number + *control);
}

// =============================================================================
// ES VAT
// =============================================================================

SpanishVatStrategy::SpanishVatStrategy() {
    schemas_.push_back(Schema::of("NIF", withCountryPrefix(nifSegments()), ChecksumFamily::MOD23_LETTER));
    schemas_.push_back(Schema::of("NIE", withCountryPrefix(nieSegments()), ChecksumFamily::MOD23_LETTER));
    schemas_.push_back(Schema::of("CIF", withCountryPrefix(cifSegments()), ChecksumFamily::MOD10_DUAL));
}

Segments SpanishVatStrategy::extractSegments(const Schema& schema, const std::string& value) const {
    Segments segments = IdentifierStrategy::extractSegments(schema, value);
    segments["nationalId"] = value.substr(2);
    segments["nationalIdKind"] = schema.variant;
    return segments;
}

std::optional<ValidationError> SpanishVatStrategy::validateLookups(const Schema& schema,
                                                                   const Segments& segments) const {
    if (schema.variant == "CIF") {
        return checkCifTypeLetter(segments.at("typeLetter"));
    }
    return std::nullopt;
}

std::optional<std::string> SpanishVatStrategy::computeCheck(const Schema& schema,
                                                            const std::string& value) const {
    return expectedControl(schema.variant, value.substr(2));
}

std::map<std::string, LookupEntry> SpanishVatStrategy::resolveLookups(const Segments& segments) const {
    return resolveCifType(segments);
}

std::vector<std::string> SpanishVatStrategy::formatGroups(const Schema& schema,
                                                          const std::string& value) const {
    std::vector<std::string> groups = {value.substr(0, 2)};
    for (const auto& group : nationalGroups(schema.variant, value.substr(2))) {
        groups.push_back(group);
    }
    return groups;
}

std::string SpanishVatStrategy::generate(const Segments& components) const {
    std::string nationalId = component(components, "nationalId", "");

    if (nationalId.empty()) {
        std::string nationalKind = component(components, "nationalIdKind", "NIF");
        if (nationalKind == "NIF") {
            nationalId = nif_.generate(components);
        } else if (nationalKind == "NIE") {
            nationalId = nie_.generate(components);
        } else if (nationalKind == "CIF") {
            nationalId = cif_.generate(components);
        } else {
            throw common::GenerationException("nationalIdKind",
                                              "Unknown national identifier kind: " + nationalKind);
        }
    } else if (utils::startsWith(nationalId, "ES")) {
        nationalId = nationalId.substr(2);
    }

    return checkedGenerate("ES" + nationalId);
}

// =============================================================================
// Helpers
// =============================================================================

char calculateNifLetter(const std::string& number) {
    return checksum::mod23ControlLetter(number);
}

char calculateNieLetter(char prefixLetter, const std::string& number) {
    char prefixDigit;
    switch (prefixLetter) {
        case 'X': prefixDigit = '0'; break;
        case 'Y': prefixDigit = '1'; break;
        case 'Z': prefixDigit = '2'; break;
        default:
            throw std::invalid_argument(std::string("NIE prefix must be X, Y or Z, got '") + prefixLetter + "'");
    }
    return checksum::mod23ControlLetter(prefixDigit + number);
}

std::optional<char> calculateCifControl(char typeLetter, const std::string& number) {
    auto controlClass = cifControlClass(typeLetter);
    if (!controlClass) {
        return std::nullopt;
    }

    int digit = checksum::mod10DualControlDigit(number);
    if (*controlClass == CifControlClass::LETTER) {
        return checksum::cifControlLetter(digit);
    }
    return static_cast<char>('0' + digit);
}

} // namespace taxid::validation::spain
