/**
 * @file spain.h
 * @brief Spain identifiers: NIF, NIE, CIF and ES VAT numbers
 *
 * - NIF: 8 digits + control letter (number % 23)
 * - NIE: X/Y/Z + 7 digits + control letter (prefix read as 0/1/2)
 * - CIF: type letter + 7 digits + control digit or letter
 * - ES VAT: "ES" + NIF | NIE | CIF
 */

#pragma once

#include "taxid/validation/identifier_strategy.h"

#include <string>
#include <vector>

namespace taxid::validation::spain {

class NifStrategy : public IdentifierStrategy {
public:
    NifStrategy();

    IdentifierKind kind() const override { return IdentifierKind::NIF; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string defaultSeparator() const override { return "-"; }

    /// @brief Optional: number (up to 8 digits, zero-padded; default "00000000")
    std::string generate(const Segments& components) const override;

protected:
    std::optional<std::string> computeCheck(const Schema& schema, const std::string& value) const override;
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
};

class NieStrategy : public IdentifierStrategy {
public:
    NieStrategy();

    IdentifierKind kind() const override { return IdentifierKind::NIE; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string defaultSeparator() const override { return "-"; }

    /// @brief Optional: prefixLetter (X/Y/Z, default "X"), number (up to 7 digits)
    std::string generate(const Segments& components) const override;

protected:
    std::optional<std::string> computeCheck(const Schema& schema, const std::string& value) const override;
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
};

/**
 * @brief CIF strategy
 *
 * The control character form depends on the type letter: digit for
 * A, B, E, H; letter (JABCDEFGHI) for N, P, Q, R, S, W; the remaining
 * letters C, D, F, G, J, U, V accept the digit form only.
 */
class CifStrategy : public IdentifierStrategy {
public:
    CifStrategy();

    IdentifierKind kind() const override { return IdentifierKind::CIF; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string defaultSeparator() const override { return "-"; }

    /// @brief Required: typeLetter. Optional: number (up to 7 digits)
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

/**
 * @brief Intra-community VAT number "ES" + national identifier
 *
 * One schema variant per national identifier kind ("NIF", "NIE", "CIF").
 */
class SpanishVatStrategy : public IdentifierStrategy {
public:
    SpanishVatStrategy();

    IdentifierKind kind() const override { return IdentifierKind::SPANISH_VAT; }
    const std::vector<Schema>& schemas() const override { return schemas_; }
    std::string defaultSeparator() const override { return "-"; }

    /**
     * @brief Compose an ES VAT number
     *
     * Either nationalId (a complete NIF/NIE/CIF) or nationalIdKind
     * ("NIF" default, "NIE", "CIF") plus that kind's components.
     */
    std::string generate(const Segments& components) const override;

protected:
    std::string displayName() const override { return "ES VAT"; }
    Segments extractSegments(const Schema& schema, const std::string& value) const override;
    std::optional<ValidationError> validateLookups(const Schema& schema,
                                                   const Segments& segments) const override;
    std::optional<std::string> computeCheck(const Schema& schema, const std::string& value) const override;
    std::map<std::string, LookupEntry> resolveLookups(const Segments& segments) const override;
    std::vector<std::string> formatGroups(const Schema& schema, const std::string& value) const override;

private:
    std::vector<Schema> schemas_;
    NifStrategy nif_;
    NieStrategy nie_;
    CifStrategy cif_;
};

// --- Helpers ---

/// @throws std::invalid_argument unless @p number is 8 digits
char calculateNifLetter(const std::string& number);

/// @throws std::invalid_argument for a prefix outside X/Y/Z or a malformed number
char calculateNieLetter(char prefixLetter, const std::string& number);

/**
 * @brief CIF control character as rendered for @p typeLetter
 * @return Control character, std::nullopt for an unknown type letter
 * @throws std::invalid_argument unless @p number is 7 digits
 */
std::optional<char> calculateCifControl(char typeLetter, const std::string& number);

} // namespace taxid::validation::spain
