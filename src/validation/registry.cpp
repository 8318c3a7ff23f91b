/**
 * @file registry.cpp
 * @brief Strategy registry implementation
 */

#include "taxid/validation/registry.h"
#include "taxid/validation/india.h"
#include "taxid/validation/japan.h"
#include "taxid/validation/spain.h"
#include "taxid/validation/uk.h"
#include "taxid/common/exceptions.h"

#include <spdlog/spdlog.h>

namespace taxid::validation {

std::unique_ptr<Registry> Registry::instance_ = nullptr;
std::once_flag Registry::initFlag_;

Registry::Registry() {
    add(std::make_unique<india::GstinStrategy>());
    add(std::make_unique<india::PanStrategy>());
    add(std::make_unique<india::HsnStrategy>());
    add(std::make_unique<india::SacStrategy>());

    add(std::make_unique<spain::NifStrategy>());
    add(std::make_unique<spain::NieStrategy>());
    add(std::make_unique<spain::CifStrategy>());
    add(std::make_unique<spain::SpanishVatStrategy>());

    add(std::make_unique<japan::CorporateNumberStrategy>());
    add(std::make_unique<japan::InvoiceRegistrationNumberStrategy>());

    add(std::make_unique<uk::VatStrategy>());
    add(std::make_unique<uk::CompanyNumberStrategy>());
    add(std::make_unique<uk::UtrStrategy>());
    add(std::make_unique<uk::NinoStrategy>());
    add(std::make_unique<uk::PayeStrategy>());

    spdlog::debug("Identifier registry initialized: {} strategies", strategies_.size());
}

const Registry& Registry::instance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new Registry());
    });
    return *instance_;
}

void Registry::add(std::unique_ptr<IdentifierStrategy> strategy) {
    Key key{strategy->country(), strategy->kind()};
    strategies_[key] = std::move(strategy);
}

const IdentifierStrategy& Registry::strategy(IdentifierKind kind) const {
    auto it = strategies_.find(Key{countryOf(kind), kind});
    if (it == strategies_.end()) {
        throw common::UnsupportedKindException(identifierKindToString(kind));
    }
    return *it->second;
}

std::vector<IdentifierKind> Registry::kinds() const {
    std::vector<IdentifierKind> result;
    result.reserve(strategies_.size());
    for (const auto& [key, strategy] : strategies_) {
        result.push_back(key.second);
    }
    return result;
}

// =============================================================================
// Public API
// =============================================================================

ValidationResult validate(IdentifierKind kind, const std::string& raw) {
    return Registry::instance().strategy(kind).validate(raw);
}

bool isValid(IdentifierKind kind, const std::string& raw) {
    return validate(kind, raw).isValid;
}

std::optional<ParsedIdentifier> parse(IdentifierKind kind, const std::string& raw) {
    return Registry::instance().strategy(kind).parse(raw);
}

std::string format(IdentifierKind kind, const std::string& raw,
                   const std::optional<std::string>& separator) {
    return Registry::instance().strategy(kind).format(raw, separator);
}

std::string generate(IdentifierKind kind, const Segments& components) {
    return Registry::instance().strategy(kind).generate(components);
}

std::vector<ValidationResult> validateMany(IdentifierKind kind, const std::vector<std::string>& raws) {
    const IdentifierStrategy& strategy = Registry::instance().strategy(kind);

    std::vector<ValidationResult> results;
    results.reserve(raws.size());
    size_t validCount = 0;
    for (const auto& raw : raws) {
        results.push_back(strategy.validate(raw));
        if (results.back().isValid) ++validCount;
    }

    spdlog::debug("validateMany({}): {} inputs, {} valid",
                  identifierKindToString(kind), raws.size(), validCount);
    return results;
}

} // namespace taxid::validation
