/**
 * @file test_spain.cpp
 * @brief Unit tests for NIF, NIE, CIF and ES VAT strategies
 */

#include <gtest/gtest.h>
#include <taxid/validation/spain.h>
#include <taxid/common/exceptions.h>

#include <stdexcept>

using namespace taxid::validation;
using namespace taxid::validation::spain;
using taxid::common::GenerationException;

class SpainTest : public ::testing::Test {
protected:
    NifStrategy nif_;
    NieStrategy nie_;
    CifStrategy cif_;
    SpanishVatStrategy vat_;
};

// ============================================================================
// NIF
// ============================================================================

TEST_F(SpainTest, Nif_Valid) {
    for (const char* value : {"12345678Z", "00000000T", "00000123P", "87654321X", "99999999R"}) {
        EXPECT_TRUE(nif_.validate(value).isValid) << value;
    }
}

TEST_F(SpainTest, Nif_Segments) {
    ValidationResult result = nif_.validate("12345678-z");
    ASSERT_TRUE(result.isValid);
    EXPECT_EQ(result.normalizedValue, "12345678Z");
    EXPECT_EQ(result.segments.at("number"), "12345678");
    EXPECT_EQ(result.segments.at("controlLetter"), "Z");
}

TEST_F(SpainTest, Nif_WrongLetter) {
    ValidationResult result = nif_.validate("12345678A");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ValidationErrorKind::INVALID_CHECK_DIGIT);
    EXPECT_EQ(result.error->message, "Invalid NIF check digit: expected 'Z', got 'A'");
}

TEST_F(SpainTest, Nif_Malformed) {
    EXPECT_EQ(nif_.validate("1234567Z").error->kind, ValidationErrorKind::INVALID_LENGTH);
    EXPECT_EQ(nif_.validate("1234567AZ").error->kind, ValidationErrorKind::INVALID_FORMAT);
    EXPECT_EQ(nif_.validate("123456789").error->kind, ValidationErrorKind::INVALID_FORMAT);
    EXPECT_EQ(nif_.validate("").error->kind, ValidationErrorKind::MISSING_VALUE);
}

TEST_F(SpainTest, Nif_Format) {
    EXPECT_EQ(nif_.format("12345678z"), "12345678-Z");
    EXPECT_EQ(nif_.format("12345678Z", std::string("")), "12345678Z");
}

TEST_F(SpainTest, Nif_Generate) {
    EXPECT_EQ(nif_.generate({}), "00000000T");
    EXPECT_EQ(nif_.generate({{"number", "123"}}), "00000123P");
    EXPECT_EQ(nif_.generate({{"number", "12345678"}}), "12345678Z");
    EXPECT_THROW(nif_.generate({{"number", "123456789"}}), GenerationException);
    EXPECT_THROW(nif_.generate({{"number", "12A"}}), GenerationException);
}

// ============================================================================
// NIE
// ============================================================================

TEST_F(SpainTest, Nie_Valid) {
    for (const char* value : {"X1234567L", "X0000000T", "Y1234567X", "Y0000000Z", "Z1234567R", "Z0000000M"}) {
        EXPECT_TRUE(nie_.validate(value).isValid) << value;
    }
}

TEST_F(SpainTest, Nie_Invalid) {
    EXPECT_EQ(nie_.validate("A1234567L").error->kind, ValidationErrorKind::INVALID_FORMAT);
    EXPECT_EQ(nie_.validate("X1234567A").error->kind, ValidationErrorKind::INVALID_CHECK_DIGIT);
    EXPECT_EQ(nie_.validate("X123456L").error->kind, ValidationErrorKind::INVALID_LENGTH);
}

TEST_F(SpainTest, Nie_FormatAndSegments) {
    EXPECT_EQ(nie_.format("x1234567l"), "X-1234567-L");
    ValidationResult result = nie_.validate("X-1234567-L");
    ASSERT_TRUE(result.isValid);
    EXPECT_EQ(result.segments.at("prefixLetter"), "X");
    EXPECT_EQ(result.segments.at("number"), "1234567");
}

TEST_F(SpainTest, Nie_Generate) {
    EXPECT_EQ(nie_.generate({}), "X0000000T");
    EXPECT_EQ(nie_.generate({{"prefixLetter", "y"}, {"number", "1234567"}}), "Y1234567X");
    EXPECT_EQ(nie_.generate({{"prefixLetter", "Z"}}), "Z0000000M");
    EXPECT_THROW(nie_.generate({{"prefixLetter", "A"}}), GenerationException);
}

// ============================================================================
// CIF
// ============================================================================

TEST_F(SpainTest, Cif_DigitControl) {
    EXPECT_TRUE(cif_.validate("B12345674").isValid);
    EXPECT_TRUE(cif_.validate("A58800053").isValid);
}

TEST_F(SpainTest, Cif_LetterControl) {
    EXPECT_TRUE(cif_.validate("P1234567D").isValid);
    EXPECT_TRUE(cif_.validate("Q2815200G").isValid);
    EXPECT_EQ(cif_.validate("P12345674").error->kind, ValidationErrorKind::INVALID_CHECK_DIGIT);
}

TEST_F(SpainTest, Cif_EitherClassAcceptsDigitForm) {
    EXPECT_TRUE(cif_.validate("C12345674").isValid);
    EXPECT_EQ(cif_.validate("C1234567D").error->kind, ValidationErrorKind::INVALID_CHECK_DIGIT);
}

TEST_F(SpainTest, Cif_WrongControl) {
    ValidationResult result = cif_.validate("B12345678");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ValidationErrorKind::INVALID_CHECK_DIGIT);
    EXPECT_EQ(result.error->message, "Invalid CIF check digit: expected '4', got '8'");
}

TEST_F(SpainTest, Cif_UnknownTypeLetter) {
    ValidationResult result = cif_.validate("K1234567X");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ValidationErrorKind::INVALID_LOOKUP_CODE);
    EXPECT_EQ(result.error->message, "Unknown CIF type letter: K");
}

TEST_F(SpainTest, Cif_Malformed) {
    EXPECT_EQ(cif_.validate("B1234567").error->kind, ValidationErrorKind::INVALID_LENGTH);
    EXPECT_EQ(cif_.validate("B123456A4").error->kind, ValidationErrorKind::INVALID_FORMAT);
    EXPECT_EQ(cif_.validate("112345674").error->kind, ValidationErrorKind::INVALID_FORMAT);
}

TEST_F(SpainTest, Cif_SegmentsAndLookups) {
    auto parsed = cif_.parse("b-1234567-4");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->segments.at("typeLetter"), "B");
    EXPECT_EQ(parsed->segments.at("provinceCode"), "12");
    EXPECT_EQ(parsed->segments.at("control"), "4");
    EXPECT_EQ(parsed->lookups.at("typeLetter").name, "Sociedad de Responsabilidad Limitada");
}

TEST_F(SpainTest, Cif_Format) {
    EXPECT_EQ(cif_.format("B12345674"), "B-1234567-4");
}

TEST_F(SpainTest, Cif_Generate) {
    EXPECT_EQ(cif_.generate({{"typeLetter", "B"}, {"number", "1234567"}}), "B12345674");
    EXPECT_EQ(cif_.generate({{"typeLetter", "p"}, {"number", "1234567"}}), "P1234567D");
    EXPECT_EQ(cif_.generate({{"typeLetter", "C"}}), "C00000000");
}

TEST_F(SpainTest, Cif_GenerateRejects) {
    EXPECT_THROW(cif_.generate({}), GenerationException);
    try {
        cif_.generate({{"typeLetter", "K"}});
        FAIL() << "expected GenerationException";
    } catch (const GenerationException& e) {
        EXPECT_EQ(e.getSegment(), "typeLetter");
    }
}

// ============================================================================
// ES VAT
// ============================================================================

TEST_F(SpainTest, Vat_AllNationalKinds) {
    auto nif = vat_.validate("ES12345678Z");
    auto nie = vat_.validate("ESX1234567L");
    auto cif = vat_.validate("ESB12345674");
    ASSERT_TRUE(nif.isValid);
    ASSERT_TRUE(nie.isValid);
    ASSERT_TRUE(cif.isValid);
    EXPECT_EQ(nif.segments.at("nationalIdKind"), "NIF");
    EXPECT_EQ(nie.segments.at("nationalIdKind"), "NIE");
    EXPECT_EQ(cif.segments.at("nationalIdKind"), "CIF");
    EXPECT_EQ(cif.segments.at("nationalId"), "B12345674");
    EXPECT_EQ(cif.segments.at("countryCode"), "ES");
}

TEST_F(SpainTest, Vat_WrongCountryPrefix) {
    ValidationResult result = vat_.validate("FR12345678Z");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ValidationErrorKind::INVALID_PREFIX);
}

TEST_F(SpainTest, Vat_NationalErrorsPropagate) {
    EXPECT_EQ(vat_.validate("ES12345678A").error->kind, ValidationErrorKind::INVALID_CHECK_DIGIT);
    EXPECT_EQ(vat_.validate("ESK1234567X").error->kind, ValidationErrorKind::INVALID_LOOKUP_CODE);
    EXPECT_EQ(vat_.validate("ES1234567").error->kind, ValidationErrorKind::INVALID_LENGTH);
}

TEST_F(SpainTest, Vat_Format) {
    EXPECT_EQ(vat_.format("es12345678z"), "ES-12345678-Z");
    EXPECT_EQ(vat_.format("ESB12345674"), "ES-B-1234567-4");
}

TEST_F(SpainTest, Vat_Generate) {
    EXPECT_EQ(vat_.generate({}), "ES00000000T");
    EXPECT_EQ(vat_.generate({{"nationalId", "B12345674"}}), "ESB12345674");
    EXPECT_EQ(vat_.generate({{"nationalId", "esx1234567l"}}), "ESX1234567L");
    EXPECT_EQ(vat_.generate({{"nationalIdKind", "CIF"}, {"typeLetter", "A"}, {"number", "5880005"}}),
              "ESA58800053");
    EXPECT_EQ(vat_.generate({{"nationalIdKind", "nie"}, {"prefixLetter", "Y"}, {"number", "1234567"}}),
              "ESY1234567X");
}

TEST_F(SpainTest, Vat_GenerateRejects) {
    EXPECT_THROW(vat_.generate({{"nationalIdKind", "DNI"}}), GenerationException);
    EXPECT_THROW(vat_.generate({{"nationalId", "12345678A"}}), GenerationException);
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(SpainTest, Helpers) {
    EXPECT_EQ(calculateNifLetter("12345678"), 'Z');
    EXPECT_EQ(calculateNieLetter('Y', "1234567"), 'X');
    EXPECT_THROW(calculateNieLetter('W', "1234567"), std::invalid_argument);
    EXPECT_EQ(calculateCifControl('G', "2815200").value_or('?'), '7');
    EXPECT_EQ(calculateCifControl('Q', "2815200").value_or('?'), 'G');
    EXPECT_FALSE(calculateCifControl('X', "1234567").has_value());
}
