/**
 * @file test_checksum.cpp
 * @brief Unit tests for the check-character algorithms
 */

#include <gtest/gtest.h>
#include <taxid/validation/checksum.h>

#include <stdexcept>

using namespace taxid::validation::checksum;

class ChecksumTest : public ::testing::Test {
};

// ============================================================================
// Modulus 36 (GSTIN)
// ============================================================================

TEST_F(ChecksumTest, Mod36_KnownVectors) {
    EXPECT_EQ(mod36CheckCharacter("27AAPFU0939F1Z"), 'V');
    EXPECT_EQ(mod36CheckCharacter("29AAGCR4375J1Z"), 'U');
    EXPECT_EQ(mod36CheckCharacter("99AAPFU0939F1Z"), 'K');
    EXPECT_EQ(mod36CheckCharacter("04AAPFU0939F1Z"), '3');
}

TEST_F(ChecksumTest, Mod36_SingleSubstitutionChangesCheck) {
    std::string payload = "27AAPFU0939F1Z";
    char original = mod36CheckCharacter(payload);
    for (size_t i = 0; i < payload.size(); ++i) {
        std::string changed = payload;
        changed[i] = changed[i] == '5' ? '6' : '5';
        EXPECT_NE(mod36CheckCharacter(changed), original) << "position " << i;
    }
}

TEST_F(ChecksumTest, Mod36_RejectsMalformedPayload) {
    EXPECT_THROW(mod36CheckCharacter("27AAPFU0939F1"), std::invalid_argument);
    EXPECT_THROW(mod36CheckCharacter("27AAPFU0939F-Z"), std::invalid_argument);
    EXPECT_THROW(mod36CheckCharacter("27aapfu0939f1z"), std::invalid_argument);
}

// ============================================================================
// Modulus 23 (NIF / NIE)
// ============================================================================

TEST_F(ChecksumTest, Mod23_KnownVectors) {
    EXPECT_EQ(mod23ControlLetter("12345678"), 'Z');
    EXPECT_EQ(mod23ControlLetter("00000000"), 'T');
    EXPECT_EQ(mod23ControlLetter("87654321"), 'X');
    EXPECT_EQ(mod23ControlLetter("01234567"), 'L');  // NIE X1234567
}

TEST_F(ChecksumTest, Mod23_RejectsWrongLength) {
    EXPECT_THROW(mod23ControlLetter("1234567"), std::invalid_argument);
    EXPECT_THROW(mod23ControlLetter("1234567A"), std::invalid_argument);
}

// ============================================================================
// Modulus 10 dual (CIF)
// ============================================================================

TEST_F(ChecksumTest, Mod10Dual_KnownVectors) {
    EXPECT_EQ(mod10DualControlDigit("1234567"), 4);
    EXPECT_EQ(mod10DualControlDigit("0000000"), 0);
    EXPECT_EQ(mod10DualControlDigit("5880005"), 3);
    EXPECT_EQ(mod10DualControlDigit("2815200"), 7);
}

TEST_F(ChecksumTest, CifControlLetter_Mapping) {
    EXPECT_EQ(cifControlLetter(0), 'J');
    EXPECT_EQ(cifControlLetter(1), 'A');
    EXPECT_EQ(cifControlLetter(4), 'D');
    EXPECT_EQ(cifControlLetter(9), 'I');
    EXPECT_THROW(cifControlLetter(10), std::invalid_argument);
    EXPECT_THROW(cifControlLetter(-1), std::invalid_argument);
}

// ============================================================================
// Modulus 9 (Japan Corporate Number)
// ============================================================================

TEST_F(ChecksumTest, Mod9_KnownVectors) {
    EXPECT_EQ(mod9CheckDigit("000012050002"), 7);
    EXPECT_EQ(mod9CheckDigit("000012345678"), 2);
    EXPECT_EQ(mod9CheckDigit("000000000001"), 8);
    EXPECT_EQ(mod9CheckDigit("180301018771"), 1);
}

TEST_F(ChecksumTest, Mod9_RejectsWrongLength) {
    EXPECT_THROW(mod9CheckDigit("00001205000"), std::invalid_argument);
}

// ============================================================================
// Modulus 11 weighted (UTR)
// ============================================================================

TEST_F(ChecksumTest, Mod11_KnownVectors) {
    EXPECT_EQ(mod11WeightedCheckDigit("123456789"), 1);
    EXPECT_EQ(mod11WeightedCheckDigit("987654321"), 9);
    EXPECT_EQ(mod11WeightedCheckDigit("000000001"), 9);
}

TEST_F(ChecksumTest, Mod11_ZeroRemainderMapsToOne) {
    // sum 0 -> raw 11 -> 1
    EXPECT_EQ(mod11WeightedCheckDigit("000000000"), 1);
}

// ============================================================================
// NINO letter rules
// ============================================================================

TEST_F(ChecksumTest, NinoLetters_Ok) {
    EXPECT_EQ(checkNinoLetters("AA"), NinoLetterCheck::OK);
    EXPECT_EQ(checkNinoLetters("OA"), NinoLetterCheck::OK);
}

TEST_F(ChecksumTest, NinoLetters_FirstExcluded) {
    for (const char* prefix : {"DA", "FA", "IA", "QA", "UA", "VA"}) {
        EXPECT_EQ(checkNinoLetters(prefix), NinoLetterCheck::FIRST_LETTER_EXCLUDED) << prefix;
    }
}

TEST_F(ChecksumTest, NinoLetters_SecondExcluded) {
    for (const char* prefix : {"AD", "AF", "AI", "AO", "AQ", "AU", "AV"}) {
        EXPECT_EQ(checkNinoLetters(prefix), NinoLetterCheck::SECOND_LETTER_EXCLUDED) << prefix;
    }
}

TEST_F(ChecksumTest, NinoLetters_PrefixBlacklist) {
    for (const char* prefix : {"BG", "GB", "NK", "KN", "TN", "NT", "ZZ"}) {
        EXPECT_EQ(checkNinoLetters(prefix), NinoLetterCheck::PREFIX_EXCLUDED) << prefix;
    }
}
