/**
 * @file lookup_tables.cpp
 * @brief Static lookup table data
 */

#include "taxid/validation/lookup_tables.h"
#include "taxid/utils/string_utils.h"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace taxid::validation {

namespace {

LookupEntry entry(const std::string& code, const std::string& name,
                  LookupClass lookupClass = LookupClass::ORDINARY, bool active = true) {
    LookupEntry e;
    e.code = code;
    e.name = name;
    e.active = active;
    e.lookupClass = lookupClass;
    return e;
}

constexpr LookupClass UT = LookupClass::UNION_TERRITORY;
constexpr LookupClass SPECIAL = LookupClass::SPECIAL_JURISDICTION;

// 01, 07 and 34 stay UNION_TERRITORY even though they levy SGST;
// determineTransactionType reports UTGST for them.
std::vector<LookupEntry> buildIndiaStates() {
    return {
        entry("01", "Jammu and Kashmir", UT),
        entry("02", "Himachal Pradesh"),
        entry("03", "Punjab"),
        entry("04", "Chandigarh", UT),
        entry("05", "Uttarakhand"),
        entry("06", "Haryana"),
        entry("07", "Delhi", UT),
        entry("08", "Rajasthan"),
        entry("09", "Uttar Pradesh"),
        entry("10", "Bihar"),
        entry("11", "Sikkim"),
        entry("12", "Arunachal Pradesh"),
        entry("13", "Nagaland"),
        entry("14", "Manipur"),
        entry("15", "Mizoram"),
        entry("16", "Tripura"),
        entry("17", "Meghalaya"),
        entry("18", "Assam"),
        entry("19", "West Bengal"),
        entry("20", "Jharkhand"),
        entry("21", "Odisha"),
        entry("22", "Chhattisgarh"),
        entry("23", "Madhya Pradesh"),
        entry("24", "Gujarat"),
        entry("25", "Dadra and Nagar Haveli and Daman and Diu", UT),
        entry("26", "Dadra and Nagar Haveli and Daman and Diu", UT),  // merged 2020
        entry("27", "Maharashtra"),
        entry("28", "Andhra Pradesh (Old)", LookupClass::ORDINARY, false),
        entry("29", "Karnataka"),
        entry("30", "Goa"),
        entry("31", "Lakshadweep", UT),
        entry("32", "Kerala"),
        entry("33", "Tamil Nadu"),
        entry("34", "Puducherry", UT),
        entry("35", "Andaman and Nicobar Islands", UT),
        entry("36", "Telangana"),
        entry("37", "Andhra Pradesh"),
        entry("38", "Ladakh", UT),
        entry("97", "Other Territory", SPECIAL),
        entry("99", "Centre Jurisdiction", SPECIAL),
    };
}

std::vector<LookupEntry> buildPanEntityTypes() {
    return {
        entry("A", "Association of Persons"),
        entry("B", "Body of Individuals"),
        entry("C", "Company"),
        entry("F", "Firm / Limited Liability Partnership"),
        entry("G", "Government"),
        entry("H", "Hindu Undivided Family"),
        entry("J", "Artificial Juridical Person"),
        entry("L", "Local Authority"),
        entry("P", "Individual"),
        entry("T", "Trust"),
    };
}

std::vector<LookupEntry> buildCifTypeLetters() {
    return {
        entry("A", "Sociedad Anonima"),
        entry("B", "Sociedad de Responsabilidad Limitada"),
        entry("C", "Sociedad Colectiva"),
        entry("D", "Sociedad Comanditaria"),
        entry("E", "Comunidad de Bienes"),
        entry("F", "Sociedad Cooperativa"),
        entry("G", "Asociacion"),
        entry("H", "Comunidad de Propietarios"),
        entry("J", "Sociedad Civil"),
        entry("N", "Entidad Extranjera"),
        entry("P", "Corporacion Local"),
        entry("Q", "Organismo Publico"),
        entry("R", "Congregacion o Institucion Religiosa"),
        entry("S", "Organo de la Administracion del Estado"),
        entry("U", "Union Temporal de Empresas"),
        entry("V", "Otros tipos no definidos"),
        entry("W", "Establecimiento permanente de entidad no residente"),
    };
}

std::vector<LookupEntry> buildUkCompanyPrefixes() {
    return {
        entry("NI", "Northern Ireland"),
        entry("SC", "Scotland"),
    };
}

/**
 * @brief Table rows plus a code index, built once
 */
struct IndexedTable {
    std::vector<LookupEntry> rows;
    std::map<std::string, size_t> byCode;

    explicit IndexedTable(std::vector<LookupEntry> data) : rows(std::move(data)) {
        for (size_t i = 0; i < rows.size(); ++i) {
            byCode.emplace(rows[i].code, i);
        }
    }
};

const IndexedTable& table(LookupTable which) {
    static const IndexedTable indiaStates(buildIndiaStates());
    static const IndexedTable panEntityTypes(buildPanEntityTypes());
    static const IndexedTable cifTypeLetters(buildCifTypeLetters());
    static const IndexedTable ukCompanyPrefixes(buildUkCompanyPrefixes());

    switch (which) {
        case LookupTable::INDIA_STATE:       return indiaStates;
        case LookupTable::PAN_ENTITY_TYPE:   return panEntityTypes;
        case LookupTable::CIF_TYPE_LETTER:   return cifTypeLetters;
        case LookupTable::UK_COMPANY_PREFIX: return ukCompanyPrefixes;
    }
    throw std::invalid_argument("Unknown lookup table");
}

const std::set<char>& ninoFirstExcluded() {
    static const std::set<char> letters = {'D', 'F', 'I', 'Q', 'U', 'V'};
    return letters;
}

const std::set<char>& ninoSecondExcluded() {
    static const std::set<char> letters = {'D', 'F', 'I', 'O', 'Q', 'U', 'V'};
    return letters;
}

const std::set<std::string>& ninoPrefixExcluded() {
    static const std::set<std::string> prefixes = {"BG", "GB", "NK", "KN", "TN", "NT", "ZZ"};
    return prefixes;
}

} // anonymous namespace

const std::vector<LookupEntry>& entries(LookupTable which) {
    return table(which).rows;
}

std::optional<LookupEntry> byCode(LookupTable which, const std::string& code) {
    const auto& t = table(which);
    auto it = t.byCode.find(code);
    if (it == t.byCode.end()) {
        return std::nullopt;
    }
    return t.rows[it->second];
}

std::optional<LookupEntry> byName(LookupTable which, const std::string& name) {
    std::string wanted = utils::toLower(utils::trim(name));
    for (const auto& row : table(which).rows) {
        if (utils::toLower(row.name) == wanted) {
            return row;
        }
    }
    return std::nullopt;
}

std::vector<LookupEntry> list(LookupTable which, const LookupFilter& filter) {
    std::vector<LookupEntry> result;
    for (const auto& row : table(which).rows) {
        if (filter.active && row.active != *filter.active) continue;
        if (filter.lookupClass && row.lookupClass != *filter.lookupClass) continue;
        result.push_back(row);
    }
    return result;
}

std::string lookupTableToString(LookupTable which) {
    switch (which) {
        case LookupTable::INDIA_STATE:       return "INDIA_STATE";
        case LookupTable::PAN_ENTITY_TYPE:   return "PAN_ENTITY_TYPE";
        case LookupTable::CIF_TYPE_LETTER:   return "CIF_TYPE_LETTER";
        case LookupTable::UK_COMPANY_PREFIX: return "UK_COMPANY_PREFIX";
    }
    return "UNKNOWN";
}

std::optional<LookupTable> lookupTableFromString(const std::string& name) {
    std::string key = utils::toUpper(utils::trim(name));
    std::replace(key.begin(), key.end(), '-', '_');

    for (LookupTable t : {LookupTable::INDIA_STATE, LookupTable::PAN_ENTITY_TYPE,
                          LookupTable::CIF_TYPE_LETTER, LookupTable::UK_COMPANY_PREFIX}) {
        if (lookupTableToString(t) == key) {
            return t;
        }
    }
    return std::nullopt;
}

std::optional<CifControlClass> cifControlClass(char typeLetter) {
    switch (typeLetter) {
        case 'A': case 'B': case 'E': case 'H':
            return CifControlClass::DIGIT;
        case 'N': case 'P': case 'Q': case 'R': case 'S': case 'W':
            return CifControlClass::LETTER;
        case 'C': case 'D': case 'F': case 'G': case 'J': case 'U': case 'V':
            return CifControlClass::EITHER;
        default:
            return std::nullopt;
    }
}

std::string cifControlClassToString(CifControlClass controlClass) {
    switch (controlClass) {
        case CifControlClass::DIGIT:  return "DIGIT";
        case CifControlClass::LETTER: return "LETTER";
        case CifControlClass::EITHER: return "EITHER";
    }
    return "UNKNOWN";
}

bool isNinoFirstLetterExcluded(char letter) {
    return ninoFirstExcluded().count(letter) > 0;
}

bool isNinoSecondLetterExcluded(char letter) {
    return ninoSecondExcluded().count(letter) > 0;
}

bool isNinoPrefixExcluded(const std::string& prefix) {
    return ninoPrefixExcluded().count(prefix) > 0;
}

} // namespace taxid::validation
