/**
 * @file india.h
 * @brief India identifiers: GSTIN, PAN, HSN and SAC
 *
 * GSTIN layout (15 characters):
 * @code
 *   27 AAPFU0939F 1 Z V
 *   |  |          | | +-- check character (modulus 36)
 *   |  |          | +---- fixed 'Z'
 *   |  |          +------ entity number (1-9, A-Z)
 *   |  +----------------- PAN of the holder
 *   +-------------------- GST state code
 * @endcode
 */

#pragma once

#include "taxid/validation/identifier_strategy.h"

#include <optional>
#include <string>
#include <vector>

namespace taxid::validation::india {

/// Annual turnover (INR) above which 4-digit HSN codes are mandatory (50 lakh)
constexpr double HSN_FOUR_DIGIT_TURNOVER = 5000000.0;

/// Annual turnover (INR) above which 6-digit HSN codes are mandatory (5 crore)
constexpr double HSN_SIX_DIGIT_TURNOVER = 50000000.0;

class GstinStrategy : public IdentifierStrategy {
public:
    GstinStrategy();

    IdentifierKind kind() const override { return IdentifierKind::GSTIN; }
    const std::vector<Schema>& schemas() const override { return schemas_; }

    /**
     * @brief Compose a GSTIN
     *
     * Required: stateCode, pan. Optional: entityNumber (default "1").
     */
    std::string generate(const Segments& components) const override;

protected:
    Segments extractSegments(const Schema& schema, const std::string& value) const override;
    std::optional<ValidationError> validateLookups(const Schema& schema,
                                                   const Segments& segments) const override;
    std::optional<std::string> computeCheck(const Schema& schema, const std::string& value) const override;
    std::map<std::string, LookupEntry> resolveLookups(const Segments& segments) const override;
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
};

class PanStrategy : public IdentifierStrategy {
public:
    PanStrategy();

    IdentifierKind kind() const override { return IdentifierKind::PAN; }
    const std::vector<Schema>& schemas() const override { return schemas_; }

    /**
     * @brief Compose a PAN
     *
     * All segments optional: holderPrefix ("AAA"), entityType ("P"),
     * nameInitial ("A"), sequence ("0001"), checkLetter ("A").
     */
    std::string generate(const Segments& components) const override;

protected:
    std::map<std::string, LookupEntry> resolveLookups(const Segments& segments) const override;

private:
    std::vector<Schema> schemas_;
};

/**
 * @brief Goods classification code (4, 6 or 8 digits)
 *
 * Dots are accepted as group separators ("8471.30.10").
 */
class HsnStrategy : public IdentifierStrategy {
public:
    HsnStrategy();

    IdentifierKind kind() const override { return IdentifierKind::HSN; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string normalize(const std::string& raw) const override;
    std::string defaultSeparator() const override { return " "; }

    /**
     * @brief Compose an HSN code
     *
     * Required: chapter. Optional: heading (default "01"), subheading,
     * tariffItem (needs subheading).
     */
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "HSN code"; }
    std::optional<ValidationError> validateLookups(const Schema& schema,
                                                   const Segments& segments) const override;
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
};

/**
 * @brief Services accounting code (6 digits starting with 99)
 */
class SacStrategy : public IdentifierStrategy {
public:
    SacStrategy();

    IdentifierKind kind() const override { return IdentifierKind::SAC; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string normalize(const std::string& raw) const override;
    std::string defaultSeparator() const override { return " "; }

    /**
     * @brief Compose a SAC code
     *
     * Optional: heading ("83"), group ("1"), service ("1").
     */
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "SAC code"; }
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
};

// --- Helpers ---

/**
 * @brief GSTIN check character for the first 14 characters
 * @throws std::invalid_argument if @p first14 is not 14 characters of 0-9A-Z
 */
char calculateGstinCheckDigit(const std::string& first14);

/**
 * @brief State code of a valid GSTIN
 * @return Two-digit code, std::nullopt if the GSTIN does not validate
 */
std::optional<std::string> extractStateCode(const std::string& gstin);

/// @brief True if @p gstin is valid and registered in @p stateCode
bool isGstinFromState(const std::string& gstin, const std::string& stateCode);

/**
 * @brief Minimum HSN digits required for an annual turnover
 * @return 6 above 5 crore, 4 above 50 lakh, 0 (optional) otherwise
 */
int requiredHsnDigits(double annualTurnover);

/**
 * @brief Validate an HSN code and enforce the turnover digit mandate
 *
 * A code that is valid but shorter than requiredHsnDigits() fails with
 * INVALID_LENGTH.
 */
ValidationResult validateHsnForTurnover(const std::string& code, double annualTurnover);

} // namespace taxid::validation::india
