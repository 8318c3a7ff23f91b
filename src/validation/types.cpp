/**
 * @file types.cpp
 * @brief Schema helpers, JSON views and enum conversions
 */

#include "taxid/validation/types.h"
#include "taxid/utils/string_utils.h"

#include <cctype>
#include <stdexcept>

namespace taxid::validation {

namespace {

Segment makeSegment(const std::string& name, const std::string& label, size_t length,
                    CharClass charClass, SegmentRole role) {
    Segment segment;
    segment.name = name;
    segment.label = label;
    segment.length = length;
    segment.charClass = charClass;
    segment.role = role;
    return segment;
}

Json::Value segmentsToJson(const Segments& segments) {
    Json::Value json(Json::objectValue);
    for (const auto& [name, value] : segments) {
        json[name] = value;
    }
    return json;
}

} // anonymous namespace

// =============================================================================
// Segment / Schema
// =============================================================================

Segment Segment::digits(const std::string& name, const std::string& label, size_t length,
                        SegmentRole role) {
    return makeSegment(name, label, length, CharClass::DIGIT, role);
}

Segment Segment::alpha(const std::string& name, const std::string& label, size_t length,
                       SegmentRole role) {
    return makeSegment(name, label, length, CharClass::ALPHA, role);
}

Segment Segment::alphanumeric(const std::string& name, const std::string& label, size_t length,
                              SegmentRole role) {
    return makeSegment(name, label, length, CharClass::ALPHANUMERIC, role);
}

Segment Segment::charset(const std::string& name, const std::string& label,
                         const std::string& allowed, SegmentRole role) {
    Segment segment = makeSegment(name, label, 1, CharClass::CHARSET, role);
    segment.allowed = allowed;
    return segment;
}

Segment Segment::literal(const std::string& name, const std::string& label,
                         const std::vector<std::string>& literals, SegmentRole role) {
    if (literals.empty()) {
        throw std::invalid_argument("Literal segment '" + name + "' needs at least one value");
    }
    Segment segment = makeSegment(name, label, literals.front().size(), CharClass::FIXED_LITERAL, role);
    for (const auto& literal : literals) {
        if (literal.size() != segment.length) {
            throw std::invalid_argument("Literal segment '" + name + "' mixes value lengths");
        }
    }
    segment.literals = literals;
    return segment;
}

bool Segment::acceptsAt(size_t index, char c) const {
    switch (charClass) {
        case CharClass::DIGIT:
            return utils::isDigit(c);
        case CharClass::ALPHA:
            return utils::isUpperAlpha(c);
        case CharClass::ALPHANUMERIC:
            return utils::isUpperAlnum(c);
        case CharClass::CHARSET:
            return allowed.find(c) != std::string::npos;
        case CharClass::FIXED_LITERAL: {
            for (const auto& literal : literals) {
                char expected = literal[index];
                if (utils::isUpperAlnum(expected)) {
                    if (utils::isUpperAlnum(c)) return true;
                } else if (c == expected) {
                    return true;
                }
            }
            return false;
        }
    }
    return false;
}

bool Segment::matchesLiteral(const std::string& value) const {
    for (const auto& literal : literals) {
        if (literal == value) return true;
    }
    return false;
}

Schema Schema::of(const std::string& variant, std::vector<Segment> segments,
                  ChecksumFamily checksum) {
    Schema schema;
    schema.variant = variant;
    schema.checksum = checksum;

    size_t offset = 0;
    for (auto& segment : segments) {
        segment.offset = offset;
        offset += segment.length;
    }
    schema.length = offset;
    schema.segments = std::move(segments);
    return schema;
}

const Segment* Schema::find(const std::string& name) const {
    for (const auto& segment : segments) {
        if (segment.name == name) return &segment;
    }
    return nullptr;
}

const Segment* Schema::findRole(SegmentRole role) const {
    for (const auto& segment : segments) {
        if (segment.role == role) return &segment;
    }
    return nullptr;
}

// =============================================================================
// JSON views
// =============================================================================

Json::Value ValidationResult::toJson() const {
    Json::Value json;
    json["isValid"] = isValid;
    json["normalizedValue"] = normalizedValue;
    json["segments"] = segmentsToJson(segments);
    if (error) {
        Json::Value err;
        err["kind"] = validationErrorKindToString(error->kind);
        err["message"] = error->message;
        json["error"] = err;
    } else {
        json["error"] = Json::nullValue;
    }
    return json;
}

Json::Value LookupEntry::toJson() const {
    Json::Value json;
    json["code"] = code;
    json["name"] = name;
    json["active"] = active;
    json["class"] = lookupClassToString(lookupClass);
    return json;
}

Json::Value ParsedIdentifier::toJson() const {
    Json::Value json;
    json["kind"] = identifierKindToString(kind);
    json["country"] = countryToString(countryOf(kind));
    json["value"] = value;
    json["segments"] = segmentsToJson(segments);

    Json::Value lookupJson(Json::objectValue);
    for (const auto& [name, entry] : lookups) {
        lookupJson[name] = entry.toJson();
    }
    json["lookups"] = lookupJson;
    return json;
}

// =============================================================================
// Enum conversions
// =============================================================================

Country countryOf(IdentifierKind kind) {
    switch (kind) {
        case IdentifierKind::GSTIN:
        case IdentifierKind::PAN:
        case IdentifierKind::HSN:
        case IdentifierKind::SAC:
            return Country::INDIA;
        case IdentifierKind::NIF:
        case IdentifierKind::NIE:
        case IdentifierKind::CIF:
        case IdentifierKind::SPANISH_VAT:
            return Country::SPAIN;
        case IdentifierKind::JP_CORPORATE_NUMBER:
        case IdentifierKind::JP_INVOICE_REGISTRATION_NUMBER:
            return Country::JAPAN;
        case IdentifierKind::UK_VAT:
        case IdentifierKind::UK_COMPANY_NUMBER:
        case IdentifierKind::UK_UTR:
        case IdentifierKind::UK_NINO:
        case IdentifierKind::UK_PAYE:
            return Country::UNITED_KINGDOM;
    }
    throw std::invalid_argument("Unknown identifier kind");
}

std::string identifierKindToString(IdentifierKind kind) {
    switch (kind) {
        case IdentifierKind::GSTIN:                          return "GSTIN";
        case IdentifierKind::PAN:                            return "PAN";
        case IdentifierKind::HSN:                            return "HSN";
        case IdentifierKind::SAC:                            return "SAC";
        case IdentifierKind::NIF:                            return "NIF";
        case IdentifierKind::NIE:                            return "NIE";
        case IdentifierKind::CIF:                            return "CIF";
        case IdentifierKind::SPANISH_VAT:                    return "ES_VAT";
        case IdentifierKind::JP_CORPORATE_NUMBER:            return "JP_CORPORATE_NUMBER";
        case IdentifierKind::JP_INVOICE_REGISTRATION_NUMBER: return "JP_INVOICE_REGISTRATION_NUMBER";
        case IdentifierKind::UK_VAT:                         return "UK_VAT";
        case IdentifierKind::UK_COMPANY_NUMBER:              return "UK_COMPANY_NUMBER";
        case IdentifierKind::UK_UTR:                         return "UK_UTR";
        case IdentifierKind::UK_NINO:                        return "UK_NINO";
        case IdentifierKind::UK_PAYE:                        return "UK_PAYE";
    }
    return "UNKNOWN";
}

const std::vector<IdentifierKind>& allIdentifierKinds() {
    static const std::vector<IdentifierKind> kinds = {
        IdentifierKind::GSTIN, IdentifierKind::PAN, IdentifierKind::HSN, IdentifierKind::SAC,
        IdentifierKind::NIF, IdentifierKind::NIE, IdentifierKind::CIF, IdentifierKind::SPANISH_VAT,
        IdentifierKind::JP_CORPORATE_NUMBER, IdentifierKind::JP_INVOICE_REGISTRATION_NUMBER,
        IdentifierKind::UK_VAT, IdentifierKind::UK_COMPANY_NUMBER, IdentifierKind::UK_UTR,
        IdentifierKind::UK_NINO, IdentifierKind::UK_PAYE
    };
    return kinds;
}

std::optional<IdentifierKind> identifierKindFromString(const std::string& name) {
    std::string key = utils::toUpper(utils::trim(name));
    for (char& c : key) {
        if (c == '-') c = '_';
    }
    if (key == "SPANISH_VAT") key = "ES_VAT";

    for (IdentifierKind kind : allIdentifierKinds()) {
        if (identifierKindToString(kind) == key) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string countryToString(Country country) {
    switch (country) {
        case Country::INDIA:          return "IN";
        case Country::SPAIN:          return "ES";
        case Country::JAPAN:          return "JP";
        case Country::UNITED_KINGDOM: return "GB";
    }
    return "UNKNOWN";
}

std::string validationErrorKindToString(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::MISSING_VALUE:       return "MISSING_VALUE";
        case ValidationErrorKind::INVALID_LENGTH:      return "INVALID_LENGTH";
        case ValidationErrorKind::INVALID_FORMAT:      return "INVALID_FORMAT";
        case ValidationErrorKind::INVALID_LOOKUP_CODE: return "INVALID_LOOKUP_CODE";
        case ValidationErrorKind::INVALID_PREFIX:      return "INVALID_PREFIX";
        case ValidationErrorKind::INVALID_CHECK_DIGIT: return "INVALID_CHECK_DIGIT";
    }
    return "UNKNOWN";
}

std::string lookupClassToString(LookupClass lookupClass) {
    switch (lookupClass) {
        case LookupClass::ORDINARY:             return "ORDINARY";
        case LookupClass::UNION_TERRITORY:      return "UNION_TERRITORY";
        case LookupClass::SPECIAL_JURISDICTION: return "SPECIAL_JURISDICTION";
    }
    return "UNKNOWN";
}

} // namespace taxid::validation
