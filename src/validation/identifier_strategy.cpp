/**
 * @file identifier_strategy.cpp
 * @brief Validation pipeline shared by every identifier kind
 */

#include "taxid/validation/identifier_strategy.h"
#include "taxid/validation/normalizer.h"
#include "taxid/common/exceptions.h"
#include "taxid/utils/string_utils.h"

#include <set>
#include <spdlog/spdlog.h>

namespace taxid::validation {

namespace {

ValidationError makeError(ValidationErrorKind kind, const std::string& message) {
    ValidationError error;
    error.kind = kind;
    error.message = message;
    return error;
}

std::string expectedClass(const Segment& segment, size_t index) {
    switch (segment.charClass) {
        case CharClass::DIGIT:        return "a digit";
        case CharClass::ALPHA:        return "a letter";
        case CharClass::ALPHANUMERIC: return "a letter or digit";
        case CharClass::CHARSET:      return "one of " + segment.allowed;
        case CharClass::FIXED_LITERAL: {
            std::string expected = "'";
            expected += segment.literals.front()[index];
            return expected + "'";
        }
    }
    return "a valid character";
}

/// "15 characters", "4, 6 or 8 characters", "between 5 and 14 characters"
std::string describeLengths(const std::set<size_t>& lengths) {
    std::vector<std::string> parts;
    for (size_t length : lengths) {
        parts.push_back(std::to_string(length));
    }

    if (parts.size() == 1) {
        return parts.front() + " characters";
    }

    size_t lo = *lengths.begin();
    size_t hi = *lengths.rbegin();
    if (parts.size() > 2 && hi - lo + 1 == lengths.size()) {
        return "between " + parts.front() + " and " + parts.back() + " characters";
    }

    std::string last = parts.back();
    parts.pop_back();
    return utils::join(parts, ", ") + " or " + last + " characters";
}

} // anonymous namespace

// =============================================================================
// Pipeline
// =============================================================================

std::string IdentifierStrategy::normalize(const std::string& raw) const {
    return normalizeIdentifier(raw);
}

std::string IdentifierStrategy::displayName() const {
    return identifierKindToString(kind());
}

ValidationResult IdentifierStrategy::validate(const std::string& raw) const {
    ValidationResult result;
    result.normalizedValue = normalize(raw);
    const std::string& value = result.normalizedValue;

    if (value.empty()) {
        result.error = makeError(ValidationErrorKind::MISSING_VALUE, displayName() + " is required");
        return result;
    }

    std::optional<ValidationError> error;
    const Schema* schema = matchSchema(value, error);
    if (!schema) {
        result.error = error;
        return result;
    }

    result.segments = extractSegments(*schema, value);

    if (auto lookupError = validateLookups(*schema, result.segments)) {
        result.error = lookupError;
        return result;
    }

    if (auto prefixError = validatePrefix(*schema, value)) {
        result.error = prefixError;
        return result;
    }

    if (auto expected = computeCheck(*schema, value)) {
        const Segment* checkSegment = schema->findRole(SegmentRole::CHECK_DIGIT);
        std::string actual = checkSegment ? checkSegment->slice(value) : "";
        if (actual != *expected) {
            result.error = makeError(ValidationErrorKind::INVALID_CHECK_DIGIT,
                                     "Invalid " + displayName() + " check digit: expected '" +
                                     *expected + "', got '" + actual + "'");
            return result;
        }
    }

    result.isValid = true;
    return result;
}

std::optional<ParsedIdentifier> IdentifierStrategy::parse(const std::string& raw) const {
    ValidationResult result = validate(raw);
    if (!result.isValid) {
        return std::nullopt;
    }

    ParsedIdentifier parsed;
    parsed.kind = kind();
    parsed.value = result.normalizedValue;
    parsed.segments = result.segments;
    parsed.lookups = resolveLookups(result.segments);
    return parsed;
}

std::string IdentifierStrategy::format(const std::string& raw,
                                       const std::optional<std::string>& separator) const {
    std::string value = normalize(raw);
    if (value.empty()) {
        return raw;
    }

    std::optional<ValidationError> error;
    const Schema* schema = matchSchema(value, error);
    if (!schema || validatePrefix(*schema, value)) {
        return raw;
    }

    return utils::join(formatGroups(*schema, value), separator ? *separator : defaultSeparator());
}

const Schema* IdentifierStrategy::matchSchema(const std::string& value,
                                              std::optional<ValidationError>& error) const {
    std::set<size_t> lengths;
    std::vector<const Schema*> candidates;
    for (const auto& schema : schemas()) {
        lengths.insert(schema.length);
        if (schema.length == value.size()) {
            candidates.push_back(&schema);
        }
    }

    if (candidates.empty()) {
        error = makeError(ValidationErrorKind::INVALID_LENGTH,
                          displayName() + " must be " + describeLengths(lengths) +
                          " (got " + std::to_string(value.size()) + ")");
        return nullptr;
    }

    const Schema* structural = nullptr;
    std::optional<ValidationError> firstFormatError;
    for (const Schema* candidate : candidates) {
        auto formatError = validateStructure(*candidate, value);
        if (formatError) {
            if (!firstFormatError) firstFormatError = formatError;
            continue;
        }
        if (!validatePrefix(*candidate, value)) {
            return candidate;
        }
        if (!structural) structural = candidate;
    }

    if (structural) {
        return structural;
    }

    error = firstFormatError;
    return nullptr;
}

// =============================================================================
// Default stage implementations
// =============================================================================

std::optional<ValidationError> IdentifierStrategy::validateStructure(const Schema& schema,
                                                                     const std::string& value) const {
    for (const auto& segment : schema.segments) {
        for (size_t i = 0; i < segment.length; ++i) {
            size_t position = segment.offset + i;
            char c = value[position];
            if (!segment.acceptsAt(i, c)) {
                return makeError(ValidationErrorKind::INVALID_FORMAT,
                                 "Invalid " + displayName() + " format: '" + std::string(1, c) +
                                 "' at position " + std::to_string(position + 1) + " (" +
                                 segment.label + ") must be " + expectedClass(segment, i));
            }
        }
    }
    return std::nullopt;
}

Segments IdentifierStrategy::extractSegments(const Schema& schema, const std::string& value) const {
    Segments segments;
    for (const auto& segment : schema.segments) {
        segments[segment.name] = segment.slice(value);
    }
    return segments;
}

std::optional<ValidationError> IdentifierStrategy::validateLookups(const Schema&,
                                                                   const Segments&) const {
    return std::nullopt;
}

std::optional<ValidationError> IdentifierStrategy::validatePrefix(const Schema& schema,
                                                                  const std::string& value) const {
    for (const auto& segment : schema.segments) {
        if (segment.charClass != CharClass::FIXED_LITERAL) continue;

        std::string actual = segment.slice(value);
        if (segment.matchesLiteral(actual)) continue;

        std::string expected = segment.literals.size() == 1
            ? "'" + segment.literals.front() + "'"
            : "one of " + utils::join(segment.literals, ", ");
        return makeError(ValidationErrorKind::INVALID_PREFIX,
                         "Invalid " + displayName() + " " + segment.label + ": expected " +
                         expected + ", got '" + actual + "'");
    }
    return std::nullopt;
}

std::optional<std::string> IdentifierStrategy::computeCheck(const Schema&, const std::string&) const {
    return std::nullopt;
}

std::map<std::string, LookupEntry> IdentifierStrategy::resolveLookups(const Segments&) const {
    return {};
}

std::vector<std::string> IdentifierStrategy::formatGroups(const Schema&, const std::string& value) const {
    return {value};
}

// =============================================================================
// Generation helpers
// =============================================================================

std::string IdentifierStrategy::checkedGenerate(const std::string& candidate) const {
    ValidationResult result = validate(candidate);
    if (!result.isValid) {
        std::string message = result.error ? result.error->message : "invalid identifier";
        spdlog::warn("{} generation rejected '{}': {}", displayName(), candidate, message);
        throw common::GenerationException(message);
    }

    spdlog::debug("Generated {}: {}", displayName(), result.normalizedValue);
    return result.normalizedValue;
}

std::string IdentifierStrategy::component(const Segments& components, const std::string& key,
                                          const std::string& fallback) {
    auto it = components.find(key);
    if (it == components.end()) {
        return fallback;
    }
    std::string value = normalizeIdentifier(it->second);
    return value.empty() ? fallback : value;
}

std::string IdentifierStrategy::requireComponent(const Segments& components,
                                                 const std::string& key) const {
    std::string value = component(components, key, "");
    if (value.empty()) {
        spdlog::warn("{} generation is missing required segment '{}'", displayName(), key);
        throw common::GenerationException(key, displayName() + " requires segment '" + key + "'");
    }
    return value;
}

std::string IdentifierStrategy::digitComponent(const Segments& components, const std::string& key,
                                               size_t width, const std::string& fallback) const {
    std::string value = component(components, key, fallback);
    if (value.size() > width || !utils::isAllDigits(value)) {
        spdlog::warn("{} generation got malformed segment '{}': {}", displayName(), key, value);
        throw common::GenerationException(
            key, "'" + key + "' must be 1 to " + std::to_string(width) + " digits, got '" + value + "'");
    }
    return std::string(width - value.size(), '0') + value;
}

} // namespace taxid::validation
