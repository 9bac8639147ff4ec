/**
 * @file market.cpp
 * @brief Implements wholesale pricing and availability.
 */

#include "engine/market.hpp"

#include <algorithm>
#include <stdexcept>

namespace engine {

using namespace core;

MarketConfig MarketConfig::defaults() {
    MarketConfig config;
    config.retailers = {
        {"Amazon",    {{25, 2000}, {50, 4100}, {100, 8400}}},
        {"Starbucks", {{10, 800},  {25, 2050}}},
        {"Target",    {{25, 2150}, {50, 4200}}},
        {"Walmart",   {{20, 1700}, {50, 4250}}},
        {"iTunes",    {{15, 1200}, {25, 2000}}},
    };
    config.bulk_tiers = {
        {5, 200},
        {10, 400},
        {25, 700},
        {50, 1000},
    };
    return config;
}

Market::Market(MarketConfig config)
    : config_(std::move(config)) {
    for (size_t i = 0; i < config_.retailers.size(); ++i) {
        const auto& retailer = config_.retailers[i];
        if (!by_name_.emplace(retailer.name, i).second) {
            throw std::invalid_argument("Duplicate retailer in catalog: " + retailer.name);
        }
    }
    std::sort(config_.bulk_tiers.begin(), config_.bulk_tiers.end(),
              [](const BulkTier& a, const BulkTier& b) { return a.min_quantity < b.min_quantity; });
    if (config_.max_reputation <= config_.neutral_reputation ||
        config_.neutral_reputation <= config_.min_reputation) {
        throw std::invalid_argument("Market reputation bounds must satisfy min < neutral < max");
    }
}

std::optional<Cents> Market::wholesale(const std::string& retailer, uint32_t denomination) const {
    auto it = by_name_.find(retailer);
    if (it == by_name_.end()) return std::nullopt;

    const auto& catalog = config_.retailers[it->second].catalog;
    auto entry = catalog.find(denomination);
    if (entry == catalog.end()) return std::nullopt;
    return entry->second;
}

bool Market::carries(const std::string& retailer, uint32_t denomination) const {
    return wholesale(retailer, denomination).has_value();
}

bool Market::isAvailable(const std::string& retailer, uint32_t denomination) const {
    return carries(retailer, denomination) && unavailable_.count({retailer, denomination}) == 0;
}

void Market::setAvailable(const std::string& retailer, uint32_t denomination, bool available) {
    if (available) {
        unavailable_.erase({retailer, denomination});
    } else {
        unavailable_.insert({retailer, denomination});
    }
}

uint32_t Market::bulkDiscountBps(uint32_t quantity) const {
    uint32_t discount = 0;
    for (const auto& tier : config_.bulk_tiers) {
        if (quantity >= tier.min_quantity) {
            discount = std::max(discount, tier.discount_bps);
        }
    }
    return std::min<uint32_t>(discount, kBasisPoints);
}

int Market::reputationAdjustmentBps(int reputation) const {
    int band = static_cast<int>(config_.reputation_band_bps);
    int r = std::clamp(reputation, config_.min_reputation, config_.max_reputation);

    // better reputation buys cheaper
    if (r >= config_.neutral_reputation) {
        return -band * (r - config_.neutral_reputation) / (config_.max_reputation - config_.neutral_reputation);
    }
    return band * (config_.neutral_reputation - r) / (config_.neutral_reputation - config_.min_reputation);
}

std::optional<Cents> Market::price(const std::string& retailer, uint32_t denomination, uint32_t quantity) const {
    return price(retailer, denomination, quantity, config_.neutral_reputation);
}

std::optional<Cents> Market::price(const std::string& retailer, uint32_t denomination, uint32_t quantity,
                                   int reputation) const {
    auto base = wholesale(retailer, denomination);
    if (!base) return std::nullopt;

    Cents unit = applyBps(*base, priceModifierBps(retailer));
    unit = applyBps(unit, kBasisPoints - bulkDiscountBps(quantity));
    unit = applyBps(unit, kBasisPoints + reputationAdjustmentBps(reputation));

    Cents floor = applyBps(dollars(denomination), config_.floor_bps);
    return std::max(unit, floor);
}

void Market::setPriceModifier(const std::string& retailer, uint32_t bps) {
    price_modifiers_[retailer] = bps;
}

uint32_t Market::priceModifierBps(const std::string& retailer) const {
    auto it = price_modifiers_.find(retailer);
    return it == price_modifiers_.end() ? static_cast<uint32_t>(kBasisPoints) : it->second;
}

void Market::setDemandModifier(const std::string& retailer, uint32_t bps) {
    demand_modifiers_[retailer] = bps;
}

uint32_t Market::demandModifierBps(const std::string& retailer) const {
    auto it = demand_modifiers_.find(retailer);
    return it == demand_modifiers_.end() ? static_cast<uint32_t>(kBasisPoints) : it->second;
}

std::vector<CatalogEntry> Market::entries() const {
    std::vector<CatalogEntry> out;
    for (const auto& [name, index] : by_name_) {
        for (const auto& [denomination, price] : config_.retailers[index].catalog) {
            out.push_back(CatalogEntry{name, denomination, price});
        }
    }
    return out;
}

std::vector<CatalogEntry> Market::availableEntries() const {
    std::vector<CatalogEntry> out;
    for (const auto& entry : entries()) {
        if (unavailable_.count({entry.retailer, entry.denomination}) == 0) {
            out.push_back(entry);
        }
    }
    return out;
}

std::vector<std::string> Market::retailerNames() const {
    std::vector<std::string> names;
    for (const auto& [name, index] : by_name_) {
        names.push_back(name);
    }
    return names;
}

}
