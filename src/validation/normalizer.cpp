/**
 * @file normalizer.cpp
 * @brief Identifier normalization
 */

#include "taxid/validation/normalizer.h"
#include "taxid/utils/string_utils.h"

#include <cctype>

namespace taxid::validation {

std::string normalizeIdentifier(const std::string& raw, const std::string& extraStripChars) {
    std::string stripped;
    stripped.reserve(raw.size());
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        stripped += c;
    }

    stripped = utils::removeChars(stripped, std::string(DEFAULT_STRIP_CHARS) + extraStripChars);
    return utils::toUpper(stripped);
}

} // namespace taxid::validation
