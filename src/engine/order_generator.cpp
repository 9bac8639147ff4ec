/**
 * @file order_generator.cpp
 * @brief Implements seeded order generation.
 */

#include "engine/order_generator.hpp"

#include <algorithm>
#include <stdexcept>

namespace engine {

using namespace core;

GeneratorConfig GeneratorConfig::fromPreset(const DifficultyPreset& preset) {
    GeneratorConfig config;
    config.margin_band = preset.profit_margin_band;
    config.deadline = preset.order_deadline_range_days;
    return config;
}

OrderGenerator::OrderGenerator(GeneratorConfig config, uint64_t first_order_id)
    : config_(std::move(config)), next_order_id_(first_order_id) {
    if (config_.margin_band.max_bps < config_.margin_band.min_bps ||
        config_.deadline.max_days < config_.deadline.min_days) {
        throw std::invalid_argument("OrderGenerator ranges must have min <= max");
    }
    if (config_.customer_names.empty()) {
        throw std::invalid_argument("OrderGenerator needs at least one customer name");
    }
}

uint32_t OrderGenerator::arrivalBps(const Reputation& reputation, uint32_t demand_bps) const {
    uint64_t span = config_.max_arrival_bps - std::min(config_.min_arrival_bps, config_.max_arrival_bps);
    uint64_t base = config_.min_arrival_bps + span * reputation.normalizedBps() / kBasisPoints;
    uint64_t scaled = base * demand_bps / kBasisPoints;
    return static_cast<uint32_t>(std::min<uint64_t>(scaled, config_.arrival_cap_bps));
}

OrderPriority OrderGenerator::classify(uint32_t margin_bps) const {
    if (margin_bps >= config_.high_priority_margin_bps) return OrderPriority::HIGH;
    if (margin_bps >= config_.medium_priority_margin_bps) return OrderPriority::MEDIUM;
    return OrderPriority::LOW;
}

std::vector<CustomerOrder> OrderGenerator::generateForDay(uint32_t day, const Reputation& reputation,
                                                          const Market& market, Pcg32& rng) {
    std::vector<CustomerOrder> orders;
    std::vector<CatalogEntry> choices = market.availableEntries();
    if (choices.empty()) {
        return orders;
    }

    uint64_t demand_sum = 0;
    for (const auto& entry : choices) {
        demand_sum += market.demandModifierBps(entry.retailer);
    }
    uint32_t demand = static_cast<uint32_t>(demand_sum / choices.size());
    uint32_t chance = arrivalBps(reputation, demand);

    for (uint32_t attempt = 0; attempt < config_.max_orders_per_day; ++attempt) {
        if (rng.uniform(static_cast<uint32_t>(kBasisPoints)) >= chance) {
            continue;
        }
        orders.push_back(buildOrder(day, reputation, market, choices, rng));
    }
    return orders;
}

CustomerOrder OrderGenerator::buildOrder(uint32_t day, const Reputation& reputation, const Market& market,
                                         std::vector<CatalogEntry> choices, Pcg32& rng) {
    CustomerOrder order;
    order.id = next_order_id_++;
    order.created_day = day;
    order.state = OrderState::PENDING;
    order.customer.name = config_.customer_names[rng.uniform(static_cast<uint32_t>(config_.customer_names.size()))];

    uint32_t max_items = std::min<uint32_t>(std::max<uint32_t>(config_.max_items_per_order, 1),
                                            static_cast<uint32_t>(choices.size()));
    uint32_t item_count = rng.range(1, max_items);

    Cents wholesale_total = 0;
    for (uint32_t i = 0; i < item_count; ++i) {
        size_t pick = rng.uniform(static_cast<uint32_t>(choices.size()));
        const CatalogEntry entry = choices[pick];
        choices.erase(choices.begin() + static_cast<std::ptrdiff_t>(pick));

        OrderItem item;
        item.retailer = entry.retailer;
        item.denomination = entry.denomination;
        item.quantity = rng.range(1, std::max<uint32_t>(config_.max_quantity_per_item, 1));
        order.items.push_back(item);

        auto unit = market.price(item.retailer, item.denomination, item.quantity);
        wholesale_total += unit.value_or(entry.wholesale_price) * static_cast<Cents>(item.quantity);
    }

    // a uniform draw over the band, pulled toward its top by reputation
    uint32_t span = config_.margin_band.max_bps - config_.margin_band.min_bps;
    uint32_t draw = rng.range(0, span);
    uint64_t pull = static_cast<uint64_t>(span - draw) * reputation.normalizedBps() / (2 * kBasisPoints);
    uint32_t multiplier = config_.margin_band.min_bps + draw + static_cast<uint32_t>(pull);

    order.offered_price = applyBps(order.faceValue(), multiplier);

    uint32_t margin_bps = 0;
    if (order.offered_price > wholesale_total) {
        margin_bps = static_cast<uint32_t>((order.offered_price - wholesale_total) * kBasisPoints / order.offered_price);
    }
    order.priority = classify(margin_bps);
    order.deadline_day = day + rng.range(config_.deadline.min_days, config_.deadline.max_days);

    return order;
}

}
