/**
 * @file achievements.cpp
 * @brief Implements the achievement catalog and unlock rules.
 */

#include "engine/achievements.hpp"

#include <algorithm>
#include <stdexcept>

namespace engine {

using namespace core;

namespace {

Achievement makeAchievement(AchievementType type, const char* name, const char* description,
                            uint64_t target, Cents reward) {
    Achievement a;
    a.type = type;
    a.name = name;
    a.description = description;
    a.target = target;
    a.reward = reward;
    return a;
}

}

const char* toString(AchievementType type) {
    switch (type) {
        case AchievementType::FIRST_SALE: return "FirstSale";
        case AchievementType::EARLY_BIRD: return "EarlyBird";
        case AchievementType::ENTREPRENEUR: return "Entrepreneur";
        case AchievementType::BUSINESS_MOGUL: return "BusinessMogul";
        case AchievementType::MILLIONAIRE: return "Millionaire";
        case AchievementType::PERFECT_WEEK: return "PerfectWeek";
        case AchievementType::SPEED_DEMON: return "SpeedDemon";
        case AchievementType::EFFICIENCY: return "Efficiency";
        case AchievementType::MARKET_MASTER: return "MarketMaster";
        case AchievementType::LEGENDARY_STATUS: return "LegendaryStatus";
        case AchievementType::CUSTOMER_FAVORITE: return "CustomerFavorite";
        case AchievementType::TRUSTED_SELLER: return "TrustedSeller";
        case AchievementType::WINTER_WINNER: return "WinterWinner";
        case AchievementType::SEASON_VETERAN: return "SeasonVeteran";
        case AchievementType::EVENT_SURVIVOR: return "EventSurvivor";
        case AchievementType::COLLECTOR: return "Collector";
        case AchievementType::DIVERSIFIED_PORTFOLIO: return "DiversifiedPortfolio";
    }
    return "Unknown";
}

AchievementTracker::AchievementTracker() {
    using T = AchievementType;
    achievements_ = {
        makeAchievement(T::FIRST_SALE, "First Sale", "Complete your first customer order", 1, dollars(100)),
        makeAchievement(T::EARLY_BIRD, "Early Bird", "Complete your first 10 orders", 10, dollars(500)),
        makeAchievement(T::ENTREPRENEUR, "Entrepreneur", "Accumulate $10,000 in cash", dollars(10000), dollars(1000)),
        makeAchievement(T::BUSINESS_MOGUL, "Business Mogul", "Accumulate $50,000 in cash", dollars(50000), dollars(5000)),
        makeAchievement(T::MILLIONAIRE, "Millionaire", "Accumulate $1,000,000 in cash", dollars(1000000), dollars(50000)),
        makeAchievement(T::PERFECT_WEEK, "Perfect Week", "7 consecutive days with 100% order completion", 7, dollars(2000)),
        makeAchievement(T::SPEED_DEMON, "Speed Demon", "Fulfill 5 orders in a single day", 5, dollars(1500)),
        makeAchievement(T::EFFICIENCY, "Efficiency Expert", "Maintain 90%+ success rate for 30 days", 30, dollars(3000)),
        makeAchievement(T::MARKET_MASTER, "Market Master", "Make purchases during 5 favorable market events", 5, dollars(2500)),
        makeAchievement(T::LEGENDARY_STATUS, "Legendary Status", "Reach maximum 5-star reputation", 5, dollars(2000)),
        makeAchievement(T::CUSTOMER_FAVORITE, "Customer Favorite", "Complete 100 customer orders", 100, dollars(3000)),
        makeAchievement(T::TRUSTED_SELLER, "Trusted Seller", "Complete 500 customer orders", 500, dollars(10000)),
        makeAchievement(T::WINTER_WINNER, "Winter Winner", "Earn $5,000 profit during Winter season", dollars(5000), dollars(2000)),
        makeAchievement(T::SEASON_VETERAN, "Season Veteran", "Experience all 4 seasons", 4, dollars(3000)),
        makeAchievement(T::EVENT_SURVIVOR, "Event Survivor", "Survive 10 market events", 10, dollars(2500)),
        makeAchievement(T::COLLECTOR, "Collector", "Own 100+ gift cards simultaneously", 100, dollars(2000)),
        makeAchievement(T::DIVERSIFIED_PORTFOLIO, "Diversified Portfolio", "Own cards from all 5 retailers", 5, dollars(1000)),
    };
}

const Achievement& AchievementTracker::get(AchievementType type) const {
    auto it = std::find_if(achievements_.begin(), achievements_.end(),
                           [type](const Achievement& a) { return a.type == type; });
    if (it == achievements_.end()) {
        throw std::logic_error(std::string("Achievement not in catalog: ") + toString(type));
    }
    return *it;
}

void AchievementTracker::advance(AchievementType type, uint64_t progress, uint32_t day,
                                 std::vector<Achievement>& unlocked) {
    for (auto& a : achievements_) {
        if (a.type != type || a.unlocked) continue;

        a.progress = std::max(a.progress, progress);
        if (a.progress >= a.target) {
            a.unlocked = true;
            a.unlock_day = day;
            ++total_unlocked_;
            unlocked.push_back(a);
        }
        return;
    }
}

std::vector<Achievement> AchievementTracker::recordOrderCompletion(uint32_t day, uint32_t orders_completed,
                                                                   int reputation_stars, Cents profit,
                                                                   Season season) {
    std::vector<Achievement> unlocked;
    ++orders_today_;

    advance(AchievementType::FIRST_SALE, orders_completed, day, unlocked);
    advance(AchievementType::EARLY_BIRD, orders_completed, day, unlocked);
    advance(AchievementType::SPEED_DEMON, orders_today_, day, unlocked);
    advance(AchievementType::LEGENDARY_STATUS, static_cast<uint64_t>(std::max(0, reputation_stars)), day, unlocked);
    advance(AchievementType::CUSTOMER_FAVORITE, orders_completed, day, unlocked);
    advance(AchievementType::TRUSTED_SELLER, orders_completed, day, unlocked);

    if (season == Season::WINTER) {
        winter_profit_ += profit;
        if (winter_profit_ > 0) {
            advance(AchievementType::WINTER_WINNER, static_cast<uint64_t>(winter_profit_), day, unlocked);
        }
    }
    return unlocked;
}

std::vector<Achievement> AchievementTracker::recordPurchase(uint32_t day, uint32_t price_modifier_bps) {
    std::vector<Achievement> unlocked;
    if (price_modifier_bps <= kFavorablePriceBps) {
        ++favorable_purchases_;
        advance(AchievementType::MARKET_MASTER, favorable_purchases_, day, unlocked);
    }
    return unlocked;
}

std::vector<Achievement> AchievementTracker::recordCash(uint32_t day, Cents cash) {
    std::vector<Achievement> unlocked;
    uint64_t held = cash > 0 ? static_cast<uint64_t>(cash) : 0;
    advance(AchievementType::ENTREPRENEUR, held, day, unlocked);
    advance(AchievementType::BUSINESS_MOGUL, held, day, unlocked);
    advance(AchievementType::MILLIONAIRE, held, day, unlocked);
    return unlocked;
}

std::vector<Achievement> AchievementTracker::recordInventory(uint32_t day, uint32_t total_cards,
                                                             uint32_t distinct_retailers) {
    std::vector<Achievement> unlocked;
    advance(AchievementType::COLLECTOR, total_cards, day, unlocked);
    advance(AchievementType::DIVERSIFIED_PORTFOLIO, distinct_retailers, day, unlocked);
    return unlocked;
}

std::vector<Achievement> AchievementTracker::recordDay(uint32_t day, uint32_t orders_expired_today,
                                                       uint32_t orders_completed, uint32_t orders_expired,
                                                       Season season, uint32_t events_ended) {
    std::vector<Achievement> unlocked;

    // a perfect day completed something and let nothing expire
    if (orders_today_ > 0 && orders_expired_today == 0) {
        ++perfect_days_;
    } else {
        perfect_days_ = 0;
    }
    orders_today_ = 0;
    advance(AchievementType::PERFECT_WEEK, perfect_days_, day, unlocked);

    uint64_t resolved = static_cast<uint64_t>(orders_completed) + orders_expired;
    if (resolved > 0) {
        if (static_cast<uint64_t>(orders_completed) * 10 >= resolved * 9) {
            ++efficient_days_;
        } else {
            efficient_days_ = 0;
        }
    }
    advance(AchievementType::EFFICIENCY, efficient_days_, day, unlocked);

    if (season == Season::WINTER && last_season_ != Season::WINTER) {
        winter_profit_ = 0;
    }
    last_season_ = season;
    seasons_seen_.insert(season);
    advance(AchievementType::SEASON_VETERAN, seasons_seen_.size(), day, unlocked);

    advance(AchievementType::EVENT_SURVIVOR, events_ended, day, unlocked);
    return unlocked;
}

Cents AchievementTracker::totalRewards() const {
    Cents total = 0;
    for (const auto& a : achievements_) {
        if (a.unlocked) total += a.reward;
    }
    return total;
}

}
