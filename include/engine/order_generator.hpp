/**
 * @file order_generator.hpp
 * @brief Produces customer orders from a seeded random process.
 */

#pragma once

#include "core/customer_order.hpp"
#include "core/config.hpp"
#include "core/pcg32.hpp"
#include "engine/market.hpp"
#include "engine/reputation.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace engine {

/**
 * @struct GeneratorConfig
 * @brief Arrival, sizing and pricing policy for new orders.
 */
struct GeneratorConfig {
    uint32_t max_orders_per_day = 3;       ///< Arrival attempts per day
    uint32_t min_arrival_bps = 2000;       ///< Per-attempt chance at the lowest reputation
    uint32_t max_arrival_bps = 8000;       ///< Per-attempt chance at the highest reputation
    uint32_t arrival_cap_bps = 9500;
    uint32_t max_items_per_order = 2;
    uint32_t max_quantity_per_item = 5;
    core::BpsRange margin_band{10500, 13000};   ///< Offer multiplier over face value
    core::DayRange deadline{2, 6};              ///< Days from creation to deadline
    uint32_t high_priority_margin_bps = 3300;   ///< Implied margin for HIGH
    uint32_t medium_priority_margin_bps = 2700; ///< Implied margin for MEDIUM
    std::vector<std::string> customer_names{
        "Alice", "Bob", "Charlie", "Diana", "Eve", "Frank", "Grace", "Henry"};

    /**
     * @brief Default policy with the preset's margin band and deadline range.
     */
    static GeneratorConfig fromPreset(const core::DifficultyPreset& preset);
};

/**
 * @class OrderGenerator
 * @brief Daily order source.
 *
 * Output depends only on (day, reputation, market state, rng state) and the
 * id counter, so replaying a seed reproduces the same orders.
 */
class OrderGenerator {
public:
    explicit OrderGenerator(GeneratorConfig config = GeneratorConfig{}, uint64_t first_order_id = 1000);

    /**
     * @brief Generates zero or more PENDING orders created on `day`.
     */
    std::vector<core::CustomerOrder> generateForDay(uint32_t day, const Reputation& reputation,
                                                    const Market& market, core::Pcg32& rng);

    /**
     * @brief Per-attempt arrival chance for a reputation and average demand.
     */
    uint32_t arrivalBps(const Reputation& reputation, uint32_t demand_bps) const;

    /**
     * @brief Priority implied by a margin (offered minus wholesale, over offered).
     */
    core::OrderPriority classify(uint32_t margin_bps) const;

    uint64_t nextOrderId() const { return next_order_id_; }
    const GeneratorConfig& config() const { return config_; }

private:
    GeneratorConfig config_;
    uint64_t next_order_id_;

    core::CustomerOrder buildOrder(uint32_t day, const Reputation& reputation, const Market& market,
                                   std::vector<CatalogEntry> choices, core::Pcg32& rng);
};

}
