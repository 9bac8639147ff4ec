/**
 * @file analytics.cpp
 * @brief Implements business analytics bookkeeping.
 */

#include "engine/analytics.hpp"

#include <algorithm>

namespace engine {

using namespace core;

BusinessAnalytics::BusinessAnalytics() {
    daily_revenues_.push_back(0);
}

void BusinessAnalytics::recordPurchase(Cents amount) {
    total_purchases_ += amount;
}

void BusinessAnalytics::recordSale(Cents revenue, Cents cost, uint32_t cards, bool is_order) {
    total_revenue_ += revenue;
    cards_sold_ += cards;
    if (is_order) {
        ++orders_completed_;
    }

    if (revenue > 0) {
        margin_sum_bps_ += (revenue - cost) * kBasisPoints / revenue;
        ++margin_samples_;
    }

    daily_revenues_.back() += revenue;
    best_day_revenue_ = std::max(best_day_revenue_, daily_revenues_.back());
}

void BusinessAnalytics::recordExpiredCards(uint32_t count, Cents value) {
    cards_expired_ += count;
    expired_value_ += value;
}

void BusinessAnalytics::startNewDay() {
    daily_revenues_.push_back(0);
    while (daily_revenues_.size() > kDailyHistory) {
        daily_revenues_.pop_front();
    }
}

int64_t BusinessAnalytics::averageProfitMarginBps() const {
    return margin_samples_ == 0 ? 0 : margin_sum_bps_ / margin_samples_;
}

Cents BusinessAnalytics::recentDailyAverage() const {
    size_t days = std::min(daily_revenues_.size(), kRecentDays);
    if (days == 0) return 0;

    Cents sum = 0;
    for (auto it = daily_revenues_.rbegin(); it != daily_revenues_.rbegin() + static_cast<std::ptrdiff_t>(days); ++it) {
        sum += *it;
    }
    return sum / static_cast<Cents>(days);
}

}
