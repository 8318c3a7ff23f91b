/**
 * @file registry.h
 * @brief Strategy registry and the public validation API
 *
 * The registry owns one IdentifierStrategy per identifier kind, keyed by
 * (country, kind). It is built once on first use and never mutated, so the
 * free functions below are safe to call from any thread.
 *
 * @code
 *   auto result = taxid::validation::validate(IdentifierKind::GSTIN, "27AAPFU0939F1ZV");
 *   if (result.isValid) {
 *       std::cout << result.segments.at("stateCode");   // "27"
 *   }
 * @endcode
 */

#pragma once

#include "taxid/validation/identifier_strategy.h"
#include "taxid/validation/types.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace taxid::validation {

class Registry {
public:
    using Key = std::pair<Country, IdentifierKind>;

    static const Registry& instance();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /**
     * @brief Strategy for @p kind
     * @throws common::UnsupportedKindException if no strategy is registered
     */
    const IdentifierStrategy& strategy(IdentifierKind kind) const;

    /// @brief Registered kinds in key order
    std::vector<IdentifierKind> kinds() const;

    size_t size() const { return strategies_.size(); }

private:
    Registry();

    void add(std::unique_ptr<IdentifierStrategy> strategy);

    std::map<Key, std::unique_ptr<IdentifierStrategy>> strategies_;

    static std::unique_ptr<Registry> instance_;
    static std::once_flag initFlag_;
};

/// @brief Validate @p raw as @p kind; never throws for malformed input
ValidationResult validate(IdentifierKind kind, const std::string& raw);

bool isValid(IdentifierKind kind, const std::string& raw);

/// @brief Segments and resolved lookups, std::nullopt if @p raw is invalid
std::optional<ParsedIdentifier> parse(IdentifierKind kind, const std::string& raw);

/**
 * @brief Canonical display form
 * @param separator Replaces the kind's default separator when given
 * @return Formatted value, or @p raw unchanged if it is not well-formed
 */
std::string format(IdentifierKind kind, const std::string& raw,
                   const std::optional<std::string>& separator = std::nullopt);

/**
 * @brief Compose a valid identifier from partial segments
 * @throws common::GenerationException on malformed components or unknown lookup codes
 */
std::string generate(IdentifierKind kind, const Segments& components = {});

/// @brief Validate a batch; results are index-aligned with @p raws
std::vector<ValidationResult> validateMany(IdentifierKind kind, const std::vector<std::string>& raws);

} // namespace taxid::validation
