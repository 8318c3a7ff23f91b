/**
 * @file types.h
 * @brief Common types for the taxid validation library
 *
 * Shared enums, schema descriptions and result structs used by every
 * identifier strategy. All of these are plain value types created per call.
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace taxid::validation {

/// @brief Issuing country of an identifier
enum class Country {
    INDIA,
    SPAIN,
    JAPAN,
    UNITED_KINGDOM
};

/// @brief Identifier category; each kind maps to exactly one strategy
enum class IdentifierKind {
    GSTIN,                          ///< India GST Identification Number
    PAN,                            ///< India Permanent Account Number
    HSN,                            ///< India goods classification code
    SAC,                            ///< India services classification code
    NIF,                            ///< Spain resident tax number
    NIE,                            ///< Spain foreigner identity number
    CIF,                            ///< Spain legal entity tax code
    SPANISH_VAT,                    ///< ES + NIF/NIE/CIF
    JP_CORPORATE_NUMBER,            ///< Japan 13-digit Corporate Number
    JP_INVOICE_REGISTRATION_NUMBER, ///< Japan T + Corporate Number
    UK_VAT,                         ///< UK VAT registration number
    UK_COMPANY_NUMBER,              ///< Companies House number
    UK_UTR,                         ///< Unique Taxpayer Reference
    UK_NINO,                        ///< National Insurance Number
    UK_PAYE                         ///< Employer PAYE reference
};

/// @brief Validation failure kinds, in the order they are checked
enum class ValidationErrorKind {
    MISSING_VALUE,
    INVALID_LENGTH,
    INVALID_FORMAT,
    INVALID_LOOKUP_CODE,
    INVALID_PREFIX,
    INVALID_CHECK_DIGIT
};

/// @brief Character class of a schema segment
enum class CharClass {
    DIGIT,
    ALPHA,
    ALPHANUMERIC,
    CHARSET,        ///< Explicit member list (e.g., PAN entity types)
    FIXED_LITERAL   ///< One of a fixed set of literal strings
};

/// @brief Semantic role of a schema segment
enum class SegmentRole {
    STATE_CODE,
    ENTITY_TYPE,
    ENTITY_NUMBER,
    TYPE_LETTER,
    CLASSIFICATION,
    PREFIX,
    SEQUENCE,
    FIXED_MARKER,
    CHECK_DIGIT
};

/// @brief Checksum family bound to a schema
enum class ChecksumFamily {
    NONE,
    MOD36_ALPHANUMERIC,  ///< GSTIN
    MOD23_LETTER,        ///< NIF / NIE
    MOD10_DUAL,          ///< CIF
    MOD9_POSITIONAL,     ///< Japan Corporate Number
    MOD11_WEIGHTED,      ///< UK UTR
    NINO_LETTER_RULES    ///< UK NINO letter exclusions
};

/// @brief Segment name -> segment value
using Segments = std::map<std::string, std::string>;

/**
 * @brief One positional field of an identifier grammar
 *
 * Offsets are assigned by Schema::of() from segment order, so the factory
 * functions below only take a length.
 */
struct Segment {
    std::string name;                   ///< Key used in ValidationResult::segments
    std::string label;                  ///< Human-readable name for error messages
    size_t offset = 0;
    size_t length = 0;
    CharClass charClass = CharClass::ALPHANUMERIC;
    SegmentRole role = SegmentRole::SEQUENCE;
    std::string allowed;                ///< CHARSET members
    std::vector<std::string> literals;  ///< FIXED_LITERAL accepted values

    static Segment digits(const std::string& name, const std::string& label, size_t length,
                          SegmentRole role = SegmentRole::SEQUENCE);
    static Segment alpha(const std::string& name, const std::string& label, size_t length,
                         SegmentRole role = SegmentRole::SEQUENCE);
    static Segment alphanumeric(const std::string& name, const std::string& label, size_t length,
                                SegmentRole role = SegmentRole::SEQUENCE);
    static Segment charset(const std::string& name, const std::string& label,
                           const std::string& allowed, SegmentRole role);
    static Segment literal(const std::string& name, const std::string& label,
                           const std::vector<std::string>& literals,
                           SegmentRole role = SegmentRole::FIXED_MARKER);

    /**
     * @brief Character-class test for one position of this segment
     *
     * Alphanumeric literals only require an alphanumeric character here;
     * their exact value is checked later as a prefix rule. Punctuation
     * literals (e.g., the PAYE '/') must match exactly.
     *
     * @param index Position inside the segment (0-based)
     * @param c Character to test (already normalized)
     */
    bool acceptsAt(size_t index, char c) const;

    /// @brief True if @p value equals one of the accepted literals
    bool matchesLiteral(const std::string& value) const;

    /// @brief Slice this segment out of a full identifier
    std::string slice(const std::string& value) const {
        return value.substr(offset, length);
    }
};

/**
 * @brief Fixed-length grammar of one identifier shape
 */
struct Schema {
    std::string variant;                ///< Variant name (e.g., "standard", "branch")
    size_t length = 0;
    std::vector<Segment> segments;
    ChecksumFamily checksum = ChecksumFamily::NONE;

    /**
     * @brief Build a schema, assigning segment offsets in order
     */
    static Schema of(const std::string& variant, std::vector<Segment> segments,
                     ChecksumFamily checksum = ChecksumFamily::NONE);

    const Segment* find(const std::string& name) const;
    const Segment* findRole(SegmentRole role) const;
};

/// @brief Primary validation failure
struct ValidationError {
    ValidationErrorKind kind = ValidationErrorKind::MISSING_VALUE;
    std::string message;
};

/// @brief Outcome of validate(); exactly one error when invalid
struct ValidationResult {
    bool isValid = false;
    std::string normalizedValue;
    Segments segments;                     ///< Filled once the structure is recognized
    std::optional<ValidationError> error;

    Json::Value toJson() const;
};

/// @brief Classification of lookup entries
enum class LookupClass {
    ORDINARY,
    UNION_TERRITORY,
    SPECIAL_JURISDICTION
};

/// @brief One row of a static lookup table
struct LookupEntry {
    std::string code;
    std::string name;
    bool active = true;
    LookupClass lookupClass = LookupClass::ORDINARY;

    Json::Value toJson() const;
};

/// @brief Segments of a valid identifier plus resolved lookup rows
struct ParsedIdentifier {
    IdentifierKind kind = IdentifierKind::GSTIN;
    std::string value;                          ///< Normalized identifier
    Segments segments;
    std::map<std::string, LookupEntry> lookups; ///< Keyed by segment name

    Json::Value toJson() const;
};

/// @brief Country that issues @p kind
Country countryOf(IdentifierKind kind);

std::string identifierKindToString(IdentifierKind kind);

/**
 * @brief Parse an identifier kind name (case-insensitive, '-' == '_')
 * @return Kind, or std::nullopt for unknown names
 */
std::optional<IdentifierKind> identifierKindFromString(const std::string& name);

/// @brief All identifier kinds in declaration order
const std::vector<IdentifierKind>& allIdentifierKinds();

std::string countryToString(Country country);
std::string validationErrorKindToString(ValidationErrorKind kind);
std::string lookupClassToString(LookupClass lookupClass);

} // namespace taxid::validation
