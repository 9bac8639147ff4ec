/**
 * @file achievements.hpp
 * @brief Milestones unlocked by trading, reputation, seasons and inventory.
 */

#pragma once

#include "core/money.hpp"
#include "engine/market_conditions.hpp"

#include <set>
#include <string>
#include <vector>
#include <cstdint>

namespace engine {

/**
 * @enum AchievementType
 * @brief Every milestone the tracker knows about.
 */
enum class AchievementType {
    FIRST_SALE,
    EARLY_BIRD,
    ENTREPRENEUR,
    BUSINESS_MOGUL,
    MILLIONAIRE,
    PERFECT_WEEK,
    SPEED_DEMON,
    EFFICIENCY,
    MARKET_MASTER,
    LEGENDARY_STATUS,
    CUSTOMER_FAVORITE,
    TRUSTED_SELLER,
    WINTER_WINNER,
    SEASON_VETERAN,
    EVENT_SURVIVOR,
    COLLECTOR,
    DIVERSIFIED_PORTFOLIO
};

/**
 * @struct Achievement
 * @brief One milestone with its progress toward the target.
 *
 * Progress and target share a unit that depends on the type: orders, cents,
 * days, stars, cards or retailers.
 */
struct Achievement {
    AchievementType type;
    std::string name;
    std::string description;
    uint64_t target = 0;
    core::Cents reward = 0;        ///< Bonus shown on unlock; never paid into cash
    uint64_t progress = 0;         ///< Best value seen so far
    bool unlocked = false;
    uint32_t unlock_day = 0;
};

/**
 * @class AchievementTracker
 * @brief Watches engine events and unlocks achievements once each.
 *
 * Every record method returns the achievements it unlocked, in catalog
 * order, so the caller can log them.
 */
class AchievementTracker {
public:
    static constexpr uint32_t kFavorablePriceBps = 9000;   ///< Prices 10% or more below normal

    AchievementTracker();

    /**
     * @brief A customer order was fulfilled.
     * @param orders_completed Lifetime completed orders, including this one
     * @param reputation_stars Reputation after the fulfillment
     * @param profit Offered price minus the cost of the cards handed over
     * @param season Current season; winter profit counts toward its own goal
     */
    std::vector<Achievement> recordOrderCompletion(uint32_t day, uint32_t orders_completed, int reputation_stars,
                                                   core::Cents profit, Season season);

    /**
     * @brief Cards were bought at the given price modifier.
     */
    std::vector<Achievement> recordPurchase(uint32_t day, uint32_t price_modifier_bps);

    std::vector<Achievement> recordCash(uint32_t day, core::Cents cash);

    std::vector<Achievement> recordInventory(uint32_t day, uint32_t total_cards, uint32_t distinct_retailers);

    /**
     * @brief End-of-day bookkeeping, run once per daily pass.
     *
     * Closes the previous day's completion count, then updates the perfect
     * and efficient day streaks, the seasons seen and the events survived.
     *
     * @param orders_expired_today Orders expired in this pass
     * @param orders_completed Lifetime completed orders
     * @param orders_expired Lifetime expired orders
     * @param events_ended Lifetime market events that ran their course
     */
    std::vector<Achievement> recordDay(uint32_t day, uint32_t orders_expired_today, uint32_t orders_completed,
                                       uint32_t orders_expired, Season season, uint32_t events_ended);

    const std::vector<Achievement>& achievements() const { return achievements_; }
    const Achievement& get(AchievementType type) const;

    uint32_t totalUnlocked() const { return total_unlocked_; }
    core::Cents totalRewards() const;

    uint32_t ordersToday() const { return orders_today_; }
    uint32_t perfectDayStreak() const { return perfect_days_; }
    uint32_t efficientDayStreak() const { return efficient_days_; }
    core::Cents winterProfit() const { return winter_profit_; }

private:
    std::vector<Achievement> achievements_;
    uint32_t total_unlocked_ = 0;

    uint32_t orders_today_ = 0;
    uint32_t perfect_days_ = 0;
    uint32_t efficient_days_ = 0;
    uint32_t favorable_purchases_ = 0;
    core::Cents winter_profit_ = 0;
    Season last_season_ = Season::SPRING;
    std::set<Season> seasons_seen_;

    /**
     * @brief Raises progress and unlocks once the target is reached.
     */
    void advance(AchievementType type, uint64_t progress, uint32_t day, std::vector<Achievement>& unlocked);
};

const char* toString(AchievementType type);

}
