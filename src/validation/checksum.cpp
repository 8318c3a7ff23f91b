/**
 * @file checksum.cpp
 * @brief Check-character algorithms implementation
 */

#include "taxid/validation/checksum.h"
#include "taxid/validation/lookup_tables.h"
#include "taxid/utils/string_utils.h"

#include <cstring>
#include <stdexcept>

namespace taxid::validation::checksum {

namespace {

void requireDigits(const std::string& digits, size_t length, const char* what) {
    if (digits.size() != length || !utils::isAllDigits(digits)) {
        throw std::invalid_argument(std::string(what) + " expects " + std::to_string(length) +
                                    " digits, got '" + digits + "'");
    }
}

int mod36Value(char c) {
    const char* pos = std::strchr(MOD36_ALPHABET, c);
    if (c == '\0' || pos == nullptr) {
        throw std::invalid_argument(std::string("Character outside 0-9A-Z: '") + c + "'");
    }
    return static_cast<int>(pos - MOD36_ALPHABET);
}

} // anonymous namespace

char mod36CheckCharacter(const std::string& payload) {
    if (payload.size() != 14) {
        throw std::invalid_argument("GSTIN checksum expects 14 characters, got " +
                                    std::to_string(payload.size()));
    }

    int sum = 0;
    for (size_t i = 0; i < payload.size(); ++i) {
        int factor = (i % 2 == 0) ? 1 : 2;
        int product = mod36Value(payload[i]) * factor;
        sum += product / 36 + product % 36;
    }

    int check = (36 - sum % 36) % 36;
    return MOD36_ALPHABET[check];
}

char mod23ControlLetter(const std::string& digits) {
    requireDigits(digits, 8, "NIF control letter");
    unsigned long number = std::stoul(digits);
    return MOD23_CONTROL_LETTERS[number % 23];
}

int mod10DualControlDigit(const std::string& digits) {
    requireDigits(digits, 7, "CIF control digit");

    int sum = 0;
    for (size_t i = 0; i < digits.size(); ++i) {
        int d = digits[i] - '0';
        if (i % 2 == 0) {
            int doubled = d * 2;
            sum += doubled / 10 + doubled % 10;
        } else {
            sum += d;
        }
    }

    int unit = sum % 10;
    return unit == 0 ? 0 : 10 - unit;
}

char cifControlLetter(int controlDigit) {
    if (controlDigit < 0 || controlDigit > 9) {
        throw std::invalid_argument("CIF control digit out of range: " + std::to_string(controlDigit));
    }
    return CIF_CONTROL_LETTERS[controlDigit];
}

int mod9CheckDigit(const std::string& baseDigits) {
    requireDigits(baseDigits, 12, "Corporate Number check digit");

    int sum = 0;
    for (size_t i = 0; i < baseDigits.size(); ++i) {
        // position counted from the right-hand end: 1, 2, 1, 2, ...
        size_t fromRight = baseDigits.size() - i;
        int weight = (fromRight % 2 == 1) ? 1 : 2;
        sum += (baseDigits[i] - '0') * weight;
    }

    int check = 9 - sum % 9;
    return check == 9 ? 0 : check;
}

int mod11WeightedCheckDigit(const std::string& digits) {
    requireDigits(digits, 9, "UTR check digit");

    int sum = 0;
    for (size_t i = 0; i < digits.size(); ++i) {
        sum += (digits[i] - '0') * UTR_WEIGHTS[i];
    }

    int raw = 11 - sum % 11;
    if (raw == 10) return 0;
    if (raw == 11) return 1;
    return raw;
}

NinoLetterCheck checkNinoLetters(const std::string& prefix) {
    if (prefix.size() != 2) {
        throw std::invalid_argument("NINO prefix must be two letters, got '" + prefix + "'");
    }
    if (isNinoFirstLetterExcluded(prefix[0])) {
        return NinoLetterCheck::FIRST_LETTER_EXCLUDED;
    }
    if (isNinoSecondLetterExcluded(prefix[1])) {
        return NinoLetterCheck::SECOND_LETTER_EXCLUDED;
    }
    if (isNinoPrefixExcluded(prefix)) {
        return NinoLetterCheck::PREFIX_EXCLUDED;
    }
    return NinoLetterCheck::OK;
}

} // namespace taxid::validation::checksum
