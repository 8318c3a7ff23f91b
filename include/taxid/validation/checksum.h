/**
 * @file checksum.h
 * @brief Check-character algorithms
 *
 * Pure functions over already-normalized payloads. Callers are expected to
 * pass structurally valid input; anything else is a programming error and
 * raises std::invalid_argument.
 */

#pragma once

#include <string>

namespace taxid::validation::checksum {

/// GSTIN character alphabet; index == code point value
constexpr const char* MOD36_ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

/// NIF/NIE control letters indexed by number % 23
constexpr const char* MOD23_CONTROL_LETTERS = "TRWAGMYFPDXBNJZSQVHLCKE";

/// CIF letter-form control characters indexed by control digit
constexpr const char* CIF_CONTROL_LETTERS = "JABCDEFGHI";

/// UTR weights applied to the first nine digits
constexpr int UTR_WEIGHTS[9] = {6, 7, 8, 9, 10, 5, 4, 3, 2};

/**
 * @brief GSTIN modulus-36 check character
 *
 * Weights 1,2 alternate from position 0; each product p is folded as
 * p/36 + p%36 before summing. check = (36 - sum%36) % 36.
 *
 * @param payload First 14 GSTIN characters (0-9, A-Z)
 * @return Check character from MOD36_ALPHABET
 */
char mod36CheckCharacter(const std::string& payload);

/**
 * @brief NIF control letter
 * @param digits Eight-digit number (NIE callers substitute the prefix digit)
 */
char mod23ControlLetter(const std::string& digits);

/**
 * @brief CIF control digit
 *
 * Digits at even 0-based positions are doubled and digit-summed, the rest
 * are added as-is. control = unit == 0 ? 0 : 10 - unit.
 *
 * @param digits Seven CIF body digits
 * @return Control digit 0-9
 */
int mod10DualControlDigit(const std::string& digits);

/// @brief Letter form of a CIF control digit (0 -> 'J', 1 -> 'A', ...)
char cifControlLetter(int controlDigit);

/**
 * @brief Japan Corporate Number check digit
 *
 * Weights alternate 1,2 counted from the rightmost base digit.
 * check = 9 - sum%9, where 9 becomes 0.
 *
 * @param baseDigits Twelve base digits (without the leading check digit)
 */
int mod9CheckDigit(const std::string& baseDigits);

/**
 * @brief UK UTR check digit
 *
 * raw = 11 - weighted%11; 10 maps to 0 and 11 maps to 1.
 *
 * @param digits First nine UTR digits
 */
int mod11WeightedCheckDigit(const std::string& digits);

/// @brief Outcome of the NINO prefix letter rules
enum class NinoLetterCheck {
    OK,
    FIRST_LETTER_EXCLUDED,
    SECOND_LETTER_EXCLUDED,
    PREFIX_EXCLUDED
};

/**
 * @brief Apply NINO letter exclusions to a two-letter prefix
 *
 * Individual letter exclusions are reported before the prefix blacklist.
 */
NinoLetterCheck checkNinoLetters(const std::string& prefix);

} // namespace taxid::validation::checksum
