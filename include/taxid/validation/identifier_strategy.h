/**
 * @file identifier_strategy.h
 * @brief Abstract base class for identifier kinds
 *
 * Each identifier kind bundles its normalizer, structural grammar, segment
 * extractor, cross-field rules, checksum, formatter and generator behind
 * this interface (Strategy pattern). The non-virtual validate() runs the
 * stages in a fixed order so the first failure is always the same kind:
 *
 * 1. MISSING_VALUE       - empty after normalization
 * 2. INVALID_LENGTH      - no schema variant of this length
 * 3. INVALID_FORMAT      - character class mismatch
 * 4. INVALID_LOOKUP_CODE - segment absent from its lookup table
 * 5. INVALID_PREFIX      - fixed literal mismatch
 * 6. INVALID_CHECK_DIGIT - checksum mismatch
 */

#pragma once

#include "taxid/validation/types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taxid::validation {

class IdentifierStrategy {
public:
    virtual ~IdentifierStrategy() = default;

    virtual IdentifierKind kind() const = 0;

    Country country() const { return countryOf(kind()); }

    /// @brief Schema variants; validate() picks the one matching the input
    virtual const std::vector<Schema>& schemas() const = 0;

    /**
     * @brief Normalize raw input (strip whitespace and hyphens, upper-case)
     */
    virtual std::string normalize(const std::string& raw) const;

    /**
     * @brief Validate raw input through every stage
     * @return Result with the normalized value, extracted segments and the
     *         first failure (if any). Never throws for malformed input.
     */
    ValidationResult validate(const std::string& raw) const;

    /**
     * @brief Decompose a valid identifier and resolve its lookup segments
     * @return std::nullopt if the input does not validate
     */
    std::optional<ParsedIdentifier> parse(const std::string& raw) const;

    /**
     * @brief Insert canonical display separators
     *
     * Input that is not structurally well-formed is returned unchanged.
     *
     * @param raw Identifier in any accepted spelling
     * @param separator Replaces defaultSeparator() when given
     */
    std::string format(const std::string& raw,
                       const std::optional<std::string>& separator = std::nullopt) const;

    /**
     * @brief Compose a valid identifier from partial segments
     *
     * Missing sequence fields are filled with deterministic defaults and the
     * check character is computed.
     *
     * @throws common::GenerationException on malformed components or
     *         unknown lookup codes
     */
    virtual std::string generate(const Segments& components) const = 0;

    /// @brief Separator used by format() when none is given
    virtual std::string defaultSeparator() const { return ""; }

protected:
    /// @brief Name used in error messages (defaults to the kind name)
    virtual std::string displayName() const;

    /**
     * @brief Character-class check of @p value against @p schema
     * @return INVALID_FORMAT error for the first offending character
     */
    virtual std::optional<ValidationError> validateStructure(const Schema& schema,
                                                             const std::string& value) const;

    /// @brief Named segments exported in ValidationResult (default: one per schema segment)
    virtual Segments extractSegments(const Schema& schema, const std::string& value) const;

    /// @brief Cross-field lookup rules (default: none)
    virtual std::optional<ValidationError> validateLookups(const Schema& schema,
                                                           const Segments& segments) const;

    /// @brief Fixed-literal rules (default: every FIXED_LITERAL segment must match)
    virtual std::optional<ValidationError> validatePrefix(const Schema& schema,
                                                          const std::string& value) const;

    /**
     * @brief Expected check character(s) for @p value
     * @return std::nullopt when the schema carries no computed checksum
     */
    virtual std::optional<std::string> computeCheck(const Schema& schema,
                                                    const std::string& value) const;

    /// @brief Lookup rows for parse(), keyed by segment name (default: none)
    virtual std::map<std::string, LookupEntry> resolveLookups(const Segments& segments) const;

    /// @brief Display groups joined by the separator in format() (default: whole value)
    virtual std::vector<std::string> formatGroups(const Schema& schema,
                                                  const std::string& value) const;

    /**
     * @brief Validate a freshly composed identifier
     * @return @p candidate if it validates
     * @throws common::GenerationException with the validation message otherwise
     */
    std::string checkedGenerate(const std::string& candidate) const;

    /// @brief Component value, or @p fallback when absent or empty
    static std::string component(const Segments& components, const std::string& key,
                                 const std::string& fallback);

    /// @throws common::GenerationException if @p key is absent or empty
    std::string requireComponent(const Segments& components, const std::string& key) const;

    /**
     * @brief Upper-cased numeric component left-padded with zeros to @p width
     * @throws common::GenerationException if not 1..width digits
     */
    std::string digitComponent(const Segments& components, const std::string& key,
                               size_t width, const std::string& fallback) const;

private:
    /**
     * @brief Pick the schema variant for @p value
     *
     * Among variants of matching length the first one that passes both the
     * structure and the literal rules wins, then the first one that passes
     * the structure. When none passes, the first candidate's format error is
     * reported.
     */
    const Schema* matchSchema(const std::string& value, std::optional<ValidationError>& error) const;
};

} // namespace taxid::validation
