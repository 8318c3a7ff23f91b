/**
 * @file gst_transaction.cpp
 * @brief GST transaction type derivation
 */

#include "taxid/validation/gst_transaction.h"
#include "taxid/validation/india.h"
#include "taxid/validation/lookup_tables.h"

namespace taxid::validation::india {

namespace {

bool isUnionTerritoryCode(const std::string& stateCode) {
    auto state = byCode(LookupTable::INDIA_STATE, stateCode);
    return state && state->lookupClass == LookupClass::UNION_TERRITORY;
}

} // anonymous namespace

std::optional<TransactionTypeResult> determineTransactionType(const std::string& supplierGstin,
                                                              const std::string& recipientGstin) {
    auto supplierState = extractStateCode(supplierGstin);
    auto recipientState = extractStateCode(recipientGstin);
    if (!supplierState || !recipientState) {
        return std::nullopt;
    }

    TransactionTypeResult result;
    result.supplierStateCode = *supplierState;
    result.recipientStateCode = *recipientState;

    if (*supplierState == *recipientState) {
        result.type = TransactionType::INTRA_STATE;
        result.taxComponents = {
            TaxComponent::CGST,
            isUnionTerritoryCode(*recipientState) ? TaxComponent::UTGST : TaxComponent::SGST
        };
    } else {
        result.type = TransactionType::INTER_STATE;
        result.taxComponents = {TaxComponent::IGST};
    }
    return result;
}

RateSplit splitRate(double totalRate, TransactionType type, bool isUnionTerritory) {
    RateSplit split;
    if (type == TransactionType::INTER_STATE) {
        split.igst = totalRate;
        return split;
    }

    double half = totalRate / 2.0;
    split.cgst = half;
    if (isUnionTerritory) {
        split.utgst = half;
    } else {
        split.sgst = half;
    }
    return split;
}

double RateSplit::total() const {
    return cgst.value_or(0.0) + sgst.value_or(0.0) + utgst.value_or(0.0) + igst.value_or(0.0);
}

Json::Value RateSplit::toJson() const {
    Json::Value json(Json::objectValue);
    if (cgst) json["cgst"] = *cgst;
    if (sgst) json["sgst"] = *sgst;
    if (utgst) json["utgst"] = *utgst;
    if (igst) json["igst"] = *igst;
    return json;
}

Json::Value TransactionTypeResult::toJson() const {
    Json::Value json;
    json["type"] = transactionTypeToString(type);
    json["supplierStateCode"] = supplierStateCode;
    json["recipientStateCode"] = recipientStateCode;

    Json::Value components(Json::arrayValue);
    for (TaxComponent component : taxComponents) {
        components.append(taxComponentToString(component));
    }
    json["taxComponents"] = components;
    return json;
}

std::string transactionTypeToString(TransactionType type) {
    switch (type) {
        case TransactionType::INTRA_STATE: return "INTRA_STATE";
        case TransactionType::INTER_STATE: return "INTER_STATE";
    }
    return "UNKNOWN";
}

std::string taxComponentToString(TaxComponent component) {
    switch (component) {
        case TaxComponent::CGST:  return "CGST";
        case TaxComponent::SGST:  return "SGST";
        case TaxComponent::UTGST: return "UTGST";
        case TaxComponent::IGST:  return "IGST";
    }
    return "UNKNOWN";
}

} // namespace taxid::validation::india
