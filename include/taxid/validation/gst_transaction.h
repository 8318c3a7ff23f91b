/**
 * @file gst_transaction.h
 * @brief GST transaction type derivation and rate split
 *
 * A supply between two GSTINs with the same state code is intra-state and
 * taxed as CGST + SGST (CGST + UTGST in a union territory). Different
 * state codes make it inter-state and taxed as IGST.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace taxid::validation::india {

enum class TransactionType {
    INTRA_STATE,
    INTER_STATE
};

enum class TaxComponent {
    CGST,   ///< Central GST
    SGST,   ///< State GST
    UTGST,  ///< Union Territory GST
    IGST    ///< Integrated GST
};

struct TransactionTypeResult {
    TransactionType type = TransactionType::INTER_STATE;
    std::vector<TaxComponent> taxComponents;
    std::string supplierStateCode;
    std::string recipientStateCode;

    Json::Value toJson() const;
};

/// @brief Component rates (percent); unset components do not apply
struct RateSplit {
    std::optional<double> cgst;
    std::optional<double> sgst;
    std::optional<double> utgst;
    std::optional<double> igst;

    /// @brief Sum of the applicable components
    double total() const;

    Json::Value toJson() const;
};

/**
 * @brief Derive the transaction type from two GSTINs
 *
 * State codes are compared as plain codes, special jurisdictions (97, 99)
 * included. UTGST replaces SGST when the recipient's state code is a union
 * territory.
 *
 * @param supplierGstin GSTIN of the supplier
 * @param recipientGstin GSTIN of the recipient
 * @return Result, std::nullopt if either GSTIN is invalid
 */
std::optional<TransactionTypeResult> determineTransactionType(const std::string& supplierGstin,
                                                              const std::string& recipientGstin);

/**
 * @brief Split a total GST rate into its components
 *
 * Intra-state halves the rate between CGST and SGST (or UTGST when
 * @p isUnionTerritory); inter-state assigns the whole rate to IGST.
 */
RateSplit splitRate(double totalRate, TransactionType type, bool isUnionTerritory = false);

std::string transactionTypeToString(TransactionType type);
std::string taxComponentToString(TaxComponent component);

} // namespace taxid::validation::india
