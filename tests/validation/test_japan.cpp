/**
 * @file test_japan.cpp
 * @brief Unit tests for Corporate Number and Invoice Registration Number
 */

#include <gtest/gtest.h>
#include <taxid/validation/japan.h>
#include <taxid/common/exceptions.h>

using namespace taxid::validation;
using namespace taxid::validation::japan;
using taxid::common::GenerationException;

class JapanTest : public ::testing::Test {
protected:
    CorporateNumberStrategy corporate_;
    InvoiceRegistrationNumberStrategy invoice_;
};

// ============================================================================
// Corporate Number
// ============================================================================

TEST_F(JapanTest, Corporate_Valid) {
    for (const char* value : {"7000012050002", "2000012345678", "8000000000001",
                              "7123456789012", "1180301018771"}) {
        EXPECT_TRUE(corporate_.validate(value).isValid) << value;
    }
}

TEST_F(JapanTest, Corporate_Segments) {
    ValidationResult result = corporate_.validate("7-0000-1205-0002");
    ASSERT_TRUE(result.isValid);
    EXPECT_EQ(result.normalizedValue, "7000012050002");
    EXPECT_EQ(result.segments.at("checkDigit"), "7");
    EXPECT_EQ(result.segments.at("baseNumber"), "000012050002");
}

TEST_F(JapanTest, Corporate_WrongCheckDigit) {
    ValidationResult result = corporate_.validate("3000012345678");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ValidationErrorKind::INVALID_CHECK_DIGIT);
    EXPECT_EQ(result.error->message, "Invalid Corporate Number check digit: expected '2', got '3'");
}

TEST_F(JapanTest, Corporate_Malformed) {
    EXPECT_EQ(corporate_.validate("700001205000").error->kind, ValidationErrorKind::INVALID_LENGTH);
    EXPECT_EQ(corporate_.validate("700001205000A").error->kind, ValidationErrorKind::INVALID_FORMAT);
    EXPECT_EQ(corporate_.validate("T7000012050002").error->kind, ValidationErrorKind::INVALID_LENGTH);
}

TEST_F(JapanTest, Corporate_Format) {
    EXPECT_EQ(corporate_.format("7000012050002"), "7-0000-1205-0002");
    EXPECT_EQ(corporate_.format("7000012050002", std::string(" ")), "7 0000 1205 0002");
}

TEST_F(JapanTest, Corporate_Generate) {
    EXPECT_EQ(corporate_.generate({}), "8000000000001");
    EXPECT_EQ(corporate_.generate({{"baseNumber", "12050002"}}), "7000012050002");
    EXPECT_EQ(corporate_.generate({{"baseNumber", "180301018771"}}), "1180301018771");
    EXPECT_THROW(corporate_.generate({{"baseNumber", "1234567890123"}}), GenerationException);
}

// ============================================================================
// Invoice Registration Number
// ============================================================================

TEST_F(JapanTest, Invoice_Valid) {
    ValidationResult result = invoice_.validate("t7000012050002");
    ASSERT_TRUE(result.isValid);
    EXPECT_EQ(result.normalizedValue, "T7000012050002");
    EXPECT_EQ(result.segments.at("prefix"), "T");
    EXPECT_EQ(result.segments.at("checkDigit"), "7");
    EXPECT_EQ(result.segments.at("baseNumber"), "000012050002");
    EXPECT_EQ(result.segments.at("corporateNumber"), "7000012050002");
}

TEST_F(JapanTest, Invoice_BareCorporateNumberIsWrongLength) {
    ValidationResult result = invoice_.validate("7000012050002");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ValidationErrorKind::INVALID_LENGTH);
    EXPECT_EQ(result.error->message, "Invoice Registration Number must be 14 characters (got 13)");
}

TEST_F(JapanTest, Invoice_WrongPrefix) {
    EXPECT_EQ(invoice_.validate("X7000012050002").error->kind, ValidationErrorKind::INVALID_PREFIX);
}

TEST_F(JapanTest, Invoice_Invalid) {
    EXPECT_EQ(invoice_.validate("T7000012050003").error->kind, ValidationErrorKind::INVALID_CHECK_DIGIT);
    EXPECT_EQ(invoice_.validate("TA000012050002").error->kind, ValidationErrorKind::INVALID_FORMAT);
}

TEST_F(JapanTest, Invoice_Format) {
    EXPECT_EQ(invoice_.format("T7000012050002"), "T-7-0000-1205-0002");
    EXPECT_EQ(invoice_.format("t7000012050002", std::string(" ")), "T 7 0000 1205 0002");
    EXPECT_TRUE(invoice_.validate("T-7-0000-1205-0002").isValid);
    EXPECT_EQ(invoice_.format("X7000012050002"), "X7000012050002");
}

TEST_F(JapanTest, Invoice_Generate) {
    EXPECT_EQ(invoice_.generate({{"corporateNumber", "7000012050002"}}), "T7000012050002");
    EXPECT_EQ(invoice_.generate({{"baseNumber", "000012345678"}}), "T2000012345678");
    EXPECT_EQ(invoice_.generate({}), "T8000000000001");
}

TEST_F(JapanTest, Invoice_GenerateRejectsBadCorporateNumber) {
    try {
        invoice_.generate({{"corporateNumber", "3000012345678"}});
        FAIL() << "expected GenerationException";
    } catch (const GenerationException& e) {
        EXPECT_EQ(e.getSegment(), "corporateNumber");
    }
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(JapanTest, Helpers_CheckDigit) {
    EXPECT_EQ(calculateCorporateCheckDigit("000012050002"), 7);
    EXPECT_EQ(calculateCorporateCheckDigit("123456789012"), 7);
}

TEST_F(JapanTest, Helpers_ExtractCorporateNumber) {
    EXPECT_EQ(extractCorporateNumber("T2000012345678").value_or(""), "2000012345678");
    EXPECT_FALSE(extractCorporateNumber("T3000012345678").has_value());
    EXPECT_FALSE(extractCorporateNumber("2000012345678").has_value());
}

TEST_F(JapanTest, Helpers_RegistrationThreshold) {
    EXPECT_FALSE(isInvoiceRegistrationRecommended(5000000));
    EXPECT_FALSE(isInvoiceRegistrationRecommended(INVOICE_REGISTRATION_THRESHOLD_JPY));
    EXPECT_TRUE(isInvoiceRegistrationRecommended(INVOICE_REGISTRATION_THRESHOLD_JPY + 1));
}
