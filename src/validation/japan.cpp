/**
 * @file japan.cpp
 * @brief Corporate Number and Invoice Registration Number strategies
 */

#include "taxid/validation/japan.h"
#include "taxid/validation/checksum.h"
#include "taxid/common/exceptions.h"

namespace taxid::validation::japan {

namespace {

std::vector<Segment> corporateSegments() {
    return {
        Segment::digits("checkDigit", "check digit", 1, SegmentRole::CHECK_DIGIT),
        Segment::digits("baseNumber", "base number", 12),
    };
}

/// @brief "C-BBBB-BBBB-BBBB" groups of a 13-digit Corporate Number
std::vector<std::string> corporateGroups(const std::string& corporate) {
    return {corporate.substr(0, 1), corporate.substr(1, 4),
            corporate.substr(5, 4), corporate.substr(9, 4)};
}

const InvoiceRegistrationNumberStrategy& invoiceStrategy() {
    static const InvoiceRegistrationNumberStrategy strategy;
    return strategy;
}

} // anonymous namespace

// =============================================================================
// Corporate Number
// =============================================================================

CorporateNumberStrategy::CorporateNumberStrategy() {
    schemas_.push_back(Schema::of("corporate", corporateSegments(), ChecksumFamily::MOD9_POSITIONAL));
}

std::optional<std::string> CorporateNumberStrategy::computeCheck(const Schema&,
                                                                 const std::string& value) const {
    return std::to_string(calculateCorporateCheckDigit(value.substr(1, 12)));
}

std::vector<std::string> CorporateNumberStrategy::formatGroups(const Schema&,
                                                               const std::string& value) const {
    return corporateGroups(value);
}

std::string CorporateNumberStrategy::generate(const Segments& components) const {
    std::string base = digitComponent(components, "baseNumber", 12, "000000000001");
    return checkedGenerate(std::to_string(calculateCorporateCheckDigit(base)) + base);
}

// =============================================================================
// Invoice Registration Number
// =============================================================================

InvoiceRegistrationNumberStrategy::InvoiceRegistrationNumberStrategy() {
    std::vector<Segment> segments = {
        Segment::literal("prefix", "registration prefix", {"T"}, SegmentRole::PREFIX)
    };
    for (const auto& segment : corporateSegments()) {
        segments.push_back(segment);
    }
    schemas_.push_back(Schema::of("invoice", segments, ChecksumFamily::MOD9_POSITIONAL));
}

Segments InvoiceRegistrationNumberStrategy::extractSegments(const Schema& schema,
                                                            const std::string& value) const {
    Segments segments = IdentifierStrategy::extractSegments(schema, value);
    segments["corporateNumber"] = value.substr(1);
    return segments;
}

std::optional<std::string> InvoiceRegistrationNumberStrategy::computeCheck(const Schema&,
                                                                           const std::string& value) const {
    return std::to_string(calculateCorporateCheckDigit(value.substr(2, 12)));
}

std::vector<std::string> InvoiceRegistrationNumberStrategy::formatGroups(const Schema&,
                                                                         const std::string& value) const {
    std::vector<std::string> groups = corporateGroups(value.substr(1));
    groups.insert(groups.begin(), value.substr(0, 1));
    return groups;
}

std::string InvoiceRegistrationNumberStrategy::generate(const Segments& components) const {
    std::string corporate = component(components, "corporateNumber", "");
    if (corporate.empty()) {
        corporate = corporateNumber_.generate(components);
    } else {
        ValidationResult result = corporateNumber_.validate(corporate);
        if (!result.isValid) {
            throw common::GenerationException("corporateNumber", result.error->message);
        }
        corporate = result.normalizedValue;
    }
    return checkedGenerate("T" + corporate);
}

// =============================================================================
// Helpers
// =============================================================================

int calculateCorporateCheckDigit(const std::string& baseNumber) {
    return checksum::mod9CheckDigit(baseNumber);
}

std::optional<std::string> extractCorporateNumber(const std::string& invoiceNumber) {
    ValidationResult result = invoiceStrategy().validate(invoiceNumber);
    if (!result.isValid) {
        return std::nullopt;
    }
    return result.segments.at("corporateNumber");
}

bool isInvoiceRegistrationRecommended(int64_t taxableSalesJpy) {
    return taxableSalesJpy > INVOICE_REGISTRATION_THRESHOLD_JPY;
}

} // namespace taxid::validation::japan
