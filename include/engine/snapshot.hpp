/**
 * @file snapshot.hpp
 * @brief Immutable, internally consistent view of the game for readers.
 */

#pragma once

#include "core/activity_log.hpp"
#include "core/customer_order.hpp"
#include "core/game_time.hpp"
#include "core/money.hpp"
#include "engine/achievements.hpp"
#include "engine/analytics.hpp"
#include "engine/market_conditions.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace engine {

/**
 * @struct InventoryGroup
 * @brief All lots of one retailer/denomination, summarized.
 */
struct InventoryGroup {
    std::string retailer;
    uint32_t denomination = 0;
    uint32_t quantity = 0;
    core::Cents total_cost = 0;
    uint32_t lot_count = 0;
    uint32_t soonest_expiration_day = 0;
    uint32_t soonest_quantity = 0;      ///< Cards in lots expiring on soonest_expiration_day
    bool expiring_soon = false;         ///< Soonest lot expires within kExpiringSoonDays
};

constexpr uint32_t kExpiringSoonDays = 15;

/**
 * @struct MarketQuote
 * @brief Current single-card price for one catalog entry.
 */
struct MarketQuote {
    std::string retailer;
    uint32_t denomination = 0;
    core::Cents face_value = 0;
    core::Cents unit_price = 0;     ///< Price for one card at the player's reputation
    bool available = true;
};

/**
 * @struct Snapshot
 * @brief Copy of the committed state. Never refers back into the engine.
 */
struct Snapshot {
    uint64_t version = 0;                          ///< Increases with every commit
    core::GameTime time;
    bool paused = false;
    core::Cents cash = 0;
    int reputation = 0;                            ///< Points, 100 per star
    int reputation_stars = 0;
    std::vector<InventoryGroup> inventory;         ///< Sorted by retailer, denomination
    std::vector<core::CustomerOrder> orders;       ///< Priority, then deadline, then id
    std::vector<core::ActivityRecord> activity;    ///< Oldest first
    std::vector<MarketQuote> market;
    Season season = Season::SPRING;
    std::vector<std::string> market_events;
    BusinessAnalytics analytics;
    std::vector<Achievement> achievements;         ///< Catalog order
    uint32_t achievements_unlocked = 0;
    core::Cents achievement_rewards = 0;
};

}
