/**
 * @file normalizer.h
 * @brief Canonical form of raw identifier input
 */

#pragma once

#include <string>

namespace taxid::validation {

/// Separator characters removed from every identifier before validation
constexpr const char* DEFAULT_STRIP_CHARS = "-";

/**
 * @brief Normalize raw identifier text
 *
 * Removes all whitespace and hyphens (plus any @p extraStripChars) and
 * upper-cases ASCII letters. Idempotent; never fails.
 *
 * @param raw Raw input as typed by a user
 * @param extraStripChars Additional characters to drop (e.g., "." for HSN)
 * @return Normalized value (may be empty)
 */
std::string normalizeIdentifier(const std::string& raw, const std::string& extraStripChars = "");

} // namespace taxid::validation
