/**
 * @file reputation.cpp
 * @brief Implements reputation gains, penalties and clamping.
 */

#include "engine/reputation.hpp"

#include <algorithm>
#include <stdexcept>

namespace engine {

using namespace core;

Reputation::Reputation(int initial_points, ReputationConfig config)
    : config_(config), points_(0) {
    if (config_.max_points <= config_.min_points) {
        throw std::invalid_argument("Reputation bounds are empty");
    }
    points_ = std::clamp(initial_points, config_.min_points, config_.max_points);
}

int Reputation::adjust(int delta) {
    int before = points_;
    points_ = std::clamp(points_ + delta, config_.min_points, config_.max_points);
    return points_ - before;
}

int Reputation::fulfillmentGain(const CustomerOrder& order, uint32_t fulfilled_day) const {
    int days_early = order.deadline_day > fulfilled_day ? static_cast<int>(order.deadline_day - fulfilled_day) : 0;
    // bonus * d / (d + half): 0 on the deadline, half at `half` days, approaching the full bonus
    int bonus = config_.fulfill_early_bonus * days_early / (days_early + std::max(1, config_.early_half_days));
    return config_.fulfill_base + bonus;
}

int Reputation::expiryPenalty(OrderPriority priority) const {
    switch (priority) {
        case OrderPriority::HIGH: return config_.expire_penalty_high;
        case OrderPriority::MEDIUM: return config_.expire_penalty_medium;
        case OrderPriority::LOW: return config_.expire_penalty_low;
    }
    return config_.expire_penalty_low;
}

int Reputation::onOrderFulfilled(const CustomerOrder& order, uint32_t fulfilled_day) {
    return adjust(fulfillmentGain(order, fulfilled_day));
}

int Reputation::onOrderExpired(const CustomerOrder& order) {
    return adjust(-expiryPenalty(order.priority));
}

uint32_t Reputation::normalizedBps() const {
    return static_cast<uint32_t>(
        static_cast<int64_t>(points_ - config_.min_points) * 10000 / (config_.max_points - config_.min_points));
}

std::string Reputation::description() const {
    switch (stars()) {
        case 5: return "Legendary";
        case 4: return "Excellent";
        case 3: return "Good";
        case 2: return "Fair";
        case 1: return "Poor";
        default: return "Unknown";
    }
}

}
