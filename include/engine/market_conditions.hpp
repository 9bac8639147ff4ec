/**
 * @file market_conditions.hpp
 * @brief Seasons and scheduled market events that shift prices and demand.
 */

#pragma once

#include "engine/market.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace engine {

/**
 * @enum Season
 * @brief Four 90-day seasons of a 360-day year.
 */
enum class Season {
    SPRING,
    SUMMER,
    FALL,
    WINTER
};

const char* toString(Season season);

Season seasonForDay(uint32_t day);

/**
 * @brief Overall demand for a season, in basis points.
 */
uint32_t seasonDemandBps(Season season);

/**
 * @brief Seasonal bonus for a retailer, applied to both price and demand.
 */
uint32_t seasonRetailerBonusBps(Season season, const std::string& retailer);

/**
 * @struct MarketEvent
 * @brief Temporary shift in price and demand, optionally for one retailer.
 */
struct MarketEvent {
    std::string name;
    std::string description;
    std::optional<std::string> retailer;   ///< nullopt affects every retailer
    uint32_t price_bps;
    uint32_t demand_bps;
    uint32_t remaining_days;

    bool affects(const std::string& r) const { return !retailer || *retailer == r; }
};

/**
 * @brief The event scheduled for a given day (eight kinds, cycling by day).
 */
MarketEvent marketEventForDay(uint32_t day);

/**
 * @class MarketConditions
 * @brief Tracks the season and active events, and pushes their effect into Market.
 *
 * Fully determined by the sequence of days it is advanced through.
 */
class MarketConditions {
public:
    explicit MarketConditions(uint32_t start_day = 1);

    /**
     * @brief Rolls conditions forward to `day`: ages events, starts scheduled ones.
     * @return Player-facing messages for events that ended, started, or a new season
     */
    std::vector<std::string> advanceToDay(uint32_t day);

    /**
     * @brief Combined price multiplier for a retailer, in basis points.
     */
    uint32_t priceMultiplierBps(const std::string& retailer) const;

    /**
     * @brief Combined demand multiplier for a retailer, in basis points.
     */
    uint32_t demandMultiplierBps(const std::string& retailer) const;

    /**
     * @brief Writes the current per-retailer modifiers into the market.
     */
    void applyTo(Market& market) const;

    Season season() const { return season_; }
    const std::vector<MarketEvent>& activeEvents() const { return events_; }
    uint32_t daysUntilNextEvent() const { return next_event_in_days_; }

    /**
     * @brief Number of events that have run their full course so far.
     */
    uint32_t eventsEnded() const { return events_ended_; }

private:
    Season season_;
    std::vector<MarketEvent> events_;
    uint32_t next_event_in_days_ = 4;
    uint32_t events_ended_ = 0;
};

}
