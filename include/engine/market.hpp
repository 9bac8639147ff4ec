/**
 * @file market.hpp
 * @brief Wholesale gift card market: catalog, bulk pricing and availability.
 */

#pragma once

#include "core/money.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace engine {

/**
 * @struct Retailer
 * @brief Reference data: face value (whole dollars) -> base wholesale price.
 */
struct Retailer {
    std::string name;
    std::map<uint32_t, core::Cents> catalog;
};

/**
 * @struct BulkTier
 * @brief Discount applied once a purchase reaches min_quantity cards.
 */
struct BulkTier {
    uint32_t min_quantity;
    uint32_t discount_bps;
};

/**
 * @struct CatalogEntry
 * @brief Flattened view of one retailer/denomination pair.
 */
struct CatalogEntry {
    std::string retailer;
    uint32_t denomination;
    core::Cents wholesale_price;
};

/**
 * @struct MarketConfig
 * @brief Catalog and pricing parameters.
 */
struct MarketConfig {
    std::vector<Retailer> retailers;
    std::vector<BulkTier> bulk_tiers;     ///< Ascending by min_quantity
    uint32_t floor_bps = 7000;            ///< Unit price never below this share of face value
    uint32_t reputation_band_bps = 500;   ///< Max +/- adjustment from reputation
    int neutral_reputation = 300;         ///< Reputation with no price adjustment
    int min_reputation = 0;
    int max_reputation = 500;

    /**
     * @brief Five retailers with the standard catalog and bulk tiers.
     */
    static MarketConfig defaults();
};

/**
 * @class Market
 * @brief Quotes wholesale unit prices.
 *
 * Reads never change state. Price and demand modifiers are pushed in by
 * MarketConditions once per simulated day.
 */
class Market {
public:
    explicit Market(MarketConfig config = MarketConfig::defaults());

    /**
     * @brief True if the retailer sells this denomination at all.
     */
    bool carries(const std::string& retailer, uint32_t denomination) const;

    /**
     * @brief Stock flag. Defaults to true for everything carried.
     */
    bool isAvailable(const std::string& retailer, uint32_t denomination) const;

    void setAvailable(const std::string& retailer, uint32_t denomination, bool available);

    /**
     * @brief Wholesale unit cost for buying `quantity` cards.
     *
     * Non-increasing in quantity, never below the configured floor share
     * of face value.
     *
     * @return Unit price in cents, or nullopt if the pair is not carried
     */
    std::optional<core::Cents> price(const std::string& retailer, uint32_t denomination, uint32_t quantity) const;

    /**
     * @brief Unit cost including the reputation pricing band.
     */
    std::optional<core::Cents> price(const std::string& retailer, uint32_t denomination, uint32_t quantity,
                                     int reputation) const;

    /**
     * @brief Bulk discount for a quantity, in basis points.
     */
    uint32_t bulkDiscountBps(uint32_t quantity) const;

    /**
     * @brief Signed price adjustment for a reputation, in basis points.
     */
    int reputationAdjustmentBps(int reputation) const;

    void setPriceModifier(const std::string& retailer, uint32_t bps);
    uint32_t priceModifierBps(const std::string& retailer) const;

    void setDemandModifier(const std::string& retailer, uint32_t bps);
    uint32_t demandModifierBps(const std::string& retailer) const;

    /**
     * @brief Every carried pair, sorted by retailer then denomination.
     */
    std::vector<CatalogEntry> entries() const;

    /**
     * @brief Carried pairs that are currently in stock, same order as entries().
     */
    std::vector<CatalogEntry> availableEntries() const;

    std::vector<std::string> retailerNames() const;

    const MarketConfig& config() const { return config_; }

private:
    using Key = std::pair<std::string, uint32_t>;

    MarketConfig config_;
    std::map<std::string, size_t> by_name_;               // index into config_.retailers
    std::set<Key> unavailable_;                           // only pairs toggled off
    std::map<std::string, uint32_t> price_modifiers_;     // bps, absent == 10000
    std::map<std::string, uint32_t> demand_modifiers_;    // bps, absent == 10000

    std::optional<core::Cents> wholesale(const std::string& retailer, uint32_t denomination) const;
};

}
