/**
 * @file uk.h
 * @brief United Kingdom identifiers: VAT, Company Number, UTR, NINO, PAYE
 *
 * VAT, Company Number and PAYE references are validated structurally;
 * UTR carries a modulus-11 check digit and NINO is constrained by letter
 * exclusion rules.
 */

#pragma once

#include "taxid/validation/identifier_strategy.h"

#include <string>
#include <vector>

namespace taxid::validation::uk {

/**
 * @brief UK VAT registration number
 *
 * Variants: standard (GB + 9 digits), branch (GB + 12 digits),
 * government (GBGD + 3 digits), health (GBHA + 3 digits).
 */
class VatStrategy : public IdentifierStrategy {
public:
    VatStrategy();

    IdentifierKind kind() const override { return IdentifierKind::UK_VAT; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string defaultSeparator() const override { return " "; }

    /**
     * @brief Compose a VAT number
     *
     * type: standard (default), branch, government, health.
     * number: 9 digits (3 for government/health); branch: 3 digits.
     */
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "UK VAT number"; }
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
};

/**
 * @brief Companies House registration number
 *
 * Variants: England and Wales (8 digits), Scotland / Northern Ireland
 * (SC / NI + 6 digits), legacy (6 digits).
 */
class CompanyNumberStrategy : public IdentifierStrategy {
public:
    CompanyNumberStrategy();

    IdentifierKind kind() const override { return IdentifierKind::UK_COMPANY_NUMBER; }
    const std::vector<Schema>& schemas() const override { return schemas_; }

    /// @brief jurisdiction: EW (default), SC, NI or LEGACY; number: zero-padded digits
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "UK company number"; }
    std::map<std::string, LookupEntry> resolveLookups(const Segments& segments) const override;

private:
    std::vector<Schema> schemas_;
};

/// @brief Unique Taxpayer Reference: 9 digits + modulus-11 check digit
class UtrStrategy : public IdentifierStrategy {
public:
    UtrStrategy();

    IdentifierKind kind() const override { return IdentifierKind::UK_UTR; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string defaultSeparator() const override { return " "; }

    /// @brief Optional: reference (up to 9 digits, default "000000001")
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "UTR"; }
    std::optional<std::string> computeCheck(const Schema& schema, const std::string& value) const override;
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
};

/**
 * @brief National Insurance Number: 2 letters + 6 digits + suffix A-D
 *
 * An excluded first or second letter is a format error; a blacklisted
 * prefix (BG, GB, NK, KN, TN, NT, ZZ) is a lookup error.
 */
class NinoStrategy : public IdentifierStrategy {
public:
    NinoStrategy();

    IdentifierKind kind() const override { return IdentifierKind::UK_NINO; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string defaultSeparator() const override { return " "; }

    /// @brief Optional: prefix ("AA"), number (6 digits, "000000"), suffix ("A")
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "NINO"; }
    std::optional<ValidationError> validateStructure(const Schema& schema,
                                                     const std::string& value) const override;
    std::optional<ValidationError> validateLookups(const Schema& schema,
                                                   const Segments& segments) const override;
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
};

/// @brief Employer PAYE reference: 3-digit tax office + '/' + 1-10 alphanumerics
class PayeStrategy : public IdentifierStrategy {
public:
    PayeStrategy();

    IdentifierKind kind() const override { return IdentifierKind::UK_PAYE; }
    const std::vector<Schema>& schemas() const override { return schemas_; }

    /// @brief Optional: taxOfficeNumber ("001"), employerReference ("A1")
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "PAYE reference"; }

private:
    std::vector<Schema> schemas_;
};

/**
 * @brief UTR check digit for the first nine digits
 * @throws std::invalid_argument unless @p reference is 9 digits
 */
int calculateUtrCheckDigit(const std::string& reference);

} // namespace taxid::validation::uk
