/**
 * @file analytics.hpp
 * @brief Running business statistics for the player's trading.
 */

#pragma once

#include "core/money.hpp"

#include <deque>
#include <vector>
#include <cstdint>

namespace engine {

/**
 * @class BusinessAnalytics
 * @brief Revenue, spending, order outcomes and per-day revenue history.
 */
class BusinessAnalytics {
public:
    static constexpr size_t kDailyHistory = 30;
    static constexpr size_t kRecentDays = 7;

    BusinessAnalytics();

    void recordPurchase(core::Cents amount);

    /**
     * @brief Records a completed sale (order fulfillment or liquidation).
     * @param revenue Cash received
     * @param cost Purchase cost of the cards sold
     * @param cards Number of cards sold
     * @param is_order True for fulfilled orders, false for liquidation
     */
    void recordSale(core::Cents revenue, core::Cents cost, uint32_t cards, bool is_order);

    void recordExpiredOrder() { ++orders_expired_; }
    void recordDeclinedOrder() { ++orders_declined_; }
    void recordExpiredCards(uint32_t count, core::Cents value);

    /**
     * @brief Opens a new revenue bucket, keeping the last kDailyHistory days.
     */
    void startNewDay();

    core::Cents totalRevenue() const { return total_revenue_; }
    core::Cents totalPurchases() const { return total_purchases_; }
    core::Cents totalProfit() const { return total_revenue_ - total_purchases_; }
    core::Cents expiredValue() const { return expired_value_; }
    core::Cents bestDayRevenue() const { return best_day_revenue_; }
    uint32_t ordersCompleted() const { return orders_completed_; }
    uint32_t ordersExpired() const { return orders_expired_; }
    uint32_t ordersDeclined() const { return orders_declined_; }
    uint32_t cardsSold() const { return cards_sold_; }
    uint32_t cardsExpired() const { return cards_expired_; }
    const std::deque<core::Cents>& dailyRevenues() const { return daily_revenues_; }

    /**
     * @brief Mean per-sale margin, (revenue - cost) / revenue, in basis points.
     */
    int64_t averageProfitMarginBps() const;

    /**
     * @brief Mean revenue over the most recent kRecentDays buckets.
     */
    core::Cents recentDailyAverage() const;

private:
    core::Cents total_revenue_ = 0;
    core::Cents total_purchases_ = 0;
    core::Cents expired_value_ = 0;
    core::Cents best_day_revenue_ = 0;
    uint32_t orders_completed_ = 0;
    uint32_t orders_expired_ = 0;
    uint32_t orders_declined_ = 0;
    uint32_t cards_sold_ = 0;
    uint32_t cards_expired_ = 0;
    std::deque<core::Cents> daily_revenues_;
    int64_t margin_sum_bps_ = 0;
    uint32_t margin_samples_ = 0;
};

}
