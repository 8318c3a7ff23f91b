/**
 * @file japan.h
 * @brief Japan identifiers: Corporate Number and Invoice Registration Number
 *
 * Corporate Number (houjin bangou): 13 digits, the FIRST digit is the check
 * digit over the remaining 12. The Qualified Invoice System registration
 * number is "T" followed by the Corporate Number.
 */

#pragma once

#include "taxid/validation/identifier_strategy.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taxid::validation::japan {

/// Taxable sales (JPY) above which invoice registration is recommended
constexpr int64_t INVOICE_REGISTRATION_THRESHOLD_JPY = 10000000;

class CorporateNumberStrategy : public IdentifierStrategy {
public:
    CorporateNumberStrategy();

    IdentifierKind kind() const override { return IdentifierKind::JP_CORPORATE_NUMBER; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string defaultSeparator() const override { return "-"; }

    /// @brief Optional: baseNumber (up to 12 digits, zero-padded; default "000000000001")
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "Corporate Number"; }
    std::optional<std::string> computeCheck(const Schema& schema, const std::string& value) const override;
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
};

class InvoiceRegistrationNumberStrategy : public IdentifierStrategy {
public:
    InvoiceRegistrationNumberStrategy();

    IdentifierKind kind() const override { return IdentifierKind::JP_INVOICE_REGISTRATION_NUMBER; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string defaultSeparator() const override { return "-"; }

    /**
     * @brief Compose a registration number
     *
     * Uses corporateNumber (a complete valid Corporate Number) when given,
     * otherwise generates one from baseNumber.
     */
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "Invoice Registration Number"; }
    Segments extractSegments(const Schema& schema, const std::string& value) const override;
    std::optional<std::string> computeCheck(const Schema& schema, const std::string& value) const override;
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
    CorporateNumberStrategy corporateNumber_;
};

// --- Helpers ---

/**
 * @brief Check digit for a 12-digit base number
 * @throws std::invalid_argument unless @p baseNumber is 12 digits
 */
int calculateCorporateCheckDigit(const std::string& baseNumber);

/**
 * @brief Corporate Number embedded in a valid registration number
 * @return 13 digits, std::nullopt if @p invoiceNumber does not validate
 */
std::optional<std::string> extractCorporateNumber(const std::string& invoiceNumber);

/// @brief True when annual taxable sales exceed INVOICE_REGISTRATION_THRESHOLD_JPY
bool isInvoiceRegistrationRecommended(int64_t taxableSalesJpy);

} // namespace taxid::validation::japan
