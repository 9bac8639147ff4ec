/**
 * @file reputation.hpp
 * @brief Bounded reputation score driven by fulfillment history.
 */

#pragma once

#include "core/customer_order.hpp"

#include <string>
#include <cstdint>

namespace engine {

/**
 * @struct ReputationConfig
 * @brief Bounds and adjustment amounts, in reputation points (100 per star).
 */
struct ReputationConfig {
    int min_points = 0;
    int max_points = 500;
    int fulfill_base = 10;          ///< Gain for fulfilling on the deadline day
    int fulfill_early_bonus = 30;   ///< Asymptotic extra gain for early fulfillment
    int early_half_days = 2;        ///< Days early that earn half the bonus
    int expire_penalty_low = 20;
    int expire_penalty_medium = 35;
    int expire_penalty_high = 50;
};

/**
 * @class Reputation
 * @brief Scalar reputation, always within [min_points, max_points].
 */
class Reputation {
public:
    explicit Reputation(int initial_points = 300, ReputationConfig config = ReputationConfig{});

    /**
     * @brief Rewards a fulfilled order. Earlier fulfillment earns more, with
     *        diminishing returns per extra day.
     * @return Applied change after clamping
     */
    int onOrderFulfilled(const core::CustomerOrder& order, uint32_t fulfilled_day);

    /**
     * @brief Penalizes a missed order, more for higher priority.
     * @return Applied change after clamping (zero or negative)
     */
    int onOrderExpired(const core::CustomerOrder& order);

    /**
     * @brief Unclamped gain that onOrderFulfilled would request.
     */
    int fulfillmentGain(const core::CustomerOrder& order, uint32_t fulfilled_day) const;

    int expiryPenalty(core::OrderPriority priority) const;

    int points() const { return points_; }

    /**
     * @brief Whole stars, 0 to 5.
     */
    int stars() const { return points_ / 100; }

    /**
     * @brief Position within the bounds, 0 to 10000 basis points.
     */
    uint32_t normalizedBps() const;

    std::string description() const;

    const ReputationConfig& config() const { return config_; }

private:
    ReputationConfig config_;
    int points_;

    int adjust(int delta);
};

}
