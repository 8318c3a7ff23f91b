/**
 * @file lookup_tables.h
 * @brief Static code tables consulted by cross-field validation
 *
 * Tables are built once on first use and never mutated afterwards.
 *
 * - INDIA_STATE: GST state codes 01-38 (28 retired), 97/99 special jurisdictions
 * - PAN_ENTITY_TYPE: 4th character of a PAN
 * - CIF_TYPE_LETTER: Spanish legal entity type letters
 * - UK_COMPANY_PREFIX: Companies House registry prefixes
 */

#pragma once

#include "taxid/validation/types.h"

#include <optional>
#include <string>
#include <vector>

namespace taxid::validation {

enum class LookupTable {
    INDIA_STATE,
    PAN_ENTITY_TYPE,
    CIF_TYPE_LETTER,
    UK_COMPANY_PREFIX
};

/// @brief Optional criteria for list(); unset fields match everything
struct LookupFilter {
    std::optional<bool> active;
    std::optional<LookupClass> lookupClass;
};

/// @brief All rows of @p table in code order
const std::vector<LookupEntry>& entries(LookupTable table);

/**
 * @brief Exact code lookup
 * @return Entry (active or not), std::nullopt if the code is unknown
 */
std::optional<LookupEntry> byCode(LookupTable table, const std::string& code);

/**
 * @brief Case-insensitive display name lookup
 *
 * When two codes share a name (India 25/26), the lower code wins.
 */
std::optional<LookupEntry> byName(LookupTable table, const std::string& name);

/// @brief Rows matching @p filter, in code order
std::vector<LookupEntry> list(LookupTable table, const LookupFilter& filter = {});

std::string lookupTableToString(LookupTable table);

/// @brief Parse a table name (case-insensitive, '-' == '_')
std::optional<LookupTable> lookupTableFromString(const std::string& name);

// --- PAN ---

/// Letters allowed as the PAN entity-type character
constexpr const char* PAN_ENTITY_TYPE_LETTERS = "ABCFGHJLPT";

// --- CIF ---

/// @brief How the CIF control character is rendered for a type letter
enum class CifControlClass {
    DIGIT,   ///< A, B, E, H
    LETTER,  ///< N, P, Q, R, S, W
    EITHER   ///< C, D, F, G, J, U, V (digit form is the one accepted)
};

/**
 * @brief Control class of a CIF type letter
 * @return Class, std::nullopt if @p typeLetter has no control class
 */
std::optional<CifControlClass> cifControlClass(char typeLetter);

std::string cifControlClassToString(CifControlClass controlClass);

// --- UK NINO ---

bool isNinoFirstLetterExcluded(char letter);
bool isNinoSecondLetterExcluded(char letter);

/// @brief True for administrative prefixes that are never allocated (BG, GB, NK, KN, TN, NT, ZZ)
bool isNinoPrefixExcluded(const std::string& prefix);

} // namespace taxid::validation
