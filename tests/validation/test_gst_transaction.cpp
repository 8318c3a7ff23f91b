/**
 * @file test_gst_transaction.cpp
 * @brief Unit tests for GST transaction type derivation and rate split
 */

#include <gtest/gtest.h>
#include <taxid/validation/gst_transaction.h>

#include <utility>

using namespace taxid::validation::india;

class GstTransactionTest : public ::testing::Test {
};

// ============================================================================
// determineTransactionType
// ============================================================================

TEST_F(GstTransactionTest, SameState_IsIntraState) {
    auto result = determineTransactionType("27AAPFU0939F1ZV", "27AABCT1234C1ZW");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, TransactionType::INTRA_STATE);
    ASSERT_EQ(result->taxComponents.size(), 2u);
    EXPECT_EQ(result->taxComponents[0], TaxComponent::CGST);
    EXPECT_EQ(result->taxComponents[1], TaxComponent::SGST);
    EXPECT_EQ(result->supplierStateCode, "27");
    EXPECT_EQ(result->recipientStateCode, "27");
}

TEST_F(GstTransactionTest, DifferentStates_IsInterState) {
    auto result = determineTransactionType("27AAPFU0939F1ZV", "29AAGCR4375J1ZU");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, TransactionType::INTER_STATE);
    ASSERT_EQ(result->taxComponents.size(), 1u);
    EXPECT_EQ(result->taxComponents[0], TaxComponent::IGST);
    EXPECT_EQ(result->recipientStateCode, "29");
}

TEST_F(GstTransactionTest, UnionTerritory_UsesUtgst) {
    auto result = determineTransactionType("04AAPFU0939F1Z3", "04AABCT1234C1Z4");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, TransactionType::INTRA_STATE);
    ASSERT_EQ(result->taxComponents.size(), 2u);
    EXPECT_EQ(result->taxComponents[0], TaxComponent::CGST);
    EXPECT_EQ(result->taxComponents[1], TaxComponent::UTGST);
}

// Delhi, Puducherry and Jammu and Kashmir have legislatures and levy SGST in
// practice; the state table classes them as union territories, so UTGST is
// reported for them too.
TEST_F(GstTransactionTest, UnionTerritoriesWithLegislature_UseUtgst) {
    const std::pair<const char*, const char*> pairs[] = {
        {"07AAPFU0939F1ZX", "07AABCT1234C1ZY"},
        {"34AAPFU0939F1Z0", "34AABCT1234C1Z1"},
        {"01AAPFU0939F1Z9", "01AABCT1234C1ZA"},
    };
    for (const auto& [supplier, recipient] : pairs) {
        auto result = determineTransactionType(supplier, recipient);
        ASSERT_TRUE(result.has_value()) << supplier;
        EXPECT_EQ(result->type, TransactionType::INTRA_STATE) << supplier;
        ASSERT_EQ(result->taxComponents.size(), 2u);
        EXPECT_EQ(result->taxComponents[1], TaxComponent::UTGST) << supplier;
    }
}

TEST_F(GstTransactionTest, SpecialJurisdictions_ComparedAsCodes) {
    auto inter = determineTransactionType("97AAPFU0939F1ZO", "99AAPFU0939F1ZK");
    ASSERT_TRUE(inter.has_value());
    EXPECT_EQ(inter->type, TransactionType::INTER_STATE);

    auto intra = determineTransactionType("99AAPFU0939F1ZK", "99AAPFU0939F1ZK");
    ASSERT_TRUE(intra.has_value());
    EXPECT_EQ(intra->type, TransactionType::INTRA_STATE);
    EXPECT_EQ(intra->taxComponents[1], TaxComponent::SGST);
}

TEST_F(GstTransactionTest, NormalizesInput) {
    auto result = determineTransactionType("27-aapfu0939f-1zv", " 29 AAGCR4375J1ZU ");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, TransactionType::INTER_STATE);
}

TEST_F(GstTransactionTest, InvalidGstin_NoResult) {
    EXPECT_FALSE(determineTransactionType("27AAPFU0939F1ZW", "27AABCT1234C1ZW").has_value());
    EXPECT_FALSE(determineTransactionType("27AAPFU0939F1ZV", "").has_value());
}

TEST_F(GstTransactionTest, ToJson) {
    auto result = determineTransactionType("27AAPFU0939F1ZV", "27AABCT1234C1ZW");
    ASSERT_TRUE(result.has_value());
    Json::Value json = result->toJson();
    EXPECT_EQ(json["type"].asString(), "INTRA_STATE");
    EXPECT_EQ(json["supplierStateCode"].asString(), "27");
    ASSERT_EQ(json["taxComponents"].size(), 2u);
    EXPECT_EQ(json["taxComponents"][0].asString(), "CGST");
    EXPECT_EQ(json["taxComponents"][1].asString(), "SGST");
}

// ============================================================================
// splitRate
// ============================================================================

TEST_F(GstTransactionTest, SplitRate_IntraState) {
    RateSplit split = splitRate(18.0, TransactionType::INTRA_STATE);
    ASSERT_TRUE(split.cgst.has_value());
    ASSERT_TRUE(split.sgst.has_value());
    EXPECT_DOUBLE_EQ(*split.cgst, 9.0);
    EXPECT_DOUBLE_EQ(*split.sgst, 9.0);
    EXPECT_FALSE(split.utgst.has_value());
    EXPECT_FALSE(split.igst.has_value());
    EXPECT_DOUBLE_EQ(split.total(), 18.0);
}

TEST_F(GstTransactionTest, SplitRate_UnionTerritory) {
    RateSplit split = splitRate(5.0, TransactionType::INTRA_STATE, true);
    EXPECT_DOUBLE_EQ(split.cgst.value_or(0.0), 2.5);
    EXPECT_DOUBLE_EQ(split.utgst.value_or(0.0), 2.5);
    EXPECT_FALSE(split.sgst.has_value());
}

TEST_F(GstTransactionTest, SplitRate_InterState) {
    RateSplit split = splitRate(18.0, TransactionType::INTER_STATE);
    EXPECT_DOUBLE_EQ(split.igst.value_or(0.0), 18.0);
    EXPECT_FALSE(split.cgst.has_value());
    EXPECT_FALSE(split.sgst.has_value());
    EXPECT_DOUBLE_EQ(split.total(), 18.0);
}

TEST_F(GstTransactionTest, SplitRate_ToJsonOmitsUnused) {
    Json::Value json = splitRate(28.0, TransactionType::INTER_STATE).toJson();
    EXPECT_TRUE(json.isMember("igst"));
    EXPECT_FALSE(json.isMember("cgst"));
    EXPECT_DOUBLE_EQ(json["igst"].asDouble(), 28.0);
}

TEST_F(GstTransactionTest, EnumNames) {
    EXPECT_EQ(transactionTypeToString(TransactionType::INTER_STATE), "INTER_STATE");
    EXPECT_EQ(taxComponentToString(TaxComponent::UTGST), "UTGST");
}
