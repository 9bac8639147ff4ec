/**
 * @file market_conditions.cpp
 * @brief Implements seasons and the market event schedule.
 */

#include "engine/market_conditions.hpp"

#include <algorithm>

namespace engine {

using namespace core;

const char* toString(Season season) {
    switch (season) {
        case Season::SPRING: return "Spring";
        case Season::SUMMER: return "Summer";
        case Season::FALL: return "Fall";
        case Season::WINTER: return "Winter";
    }
    return "Unknown";
}

Season seasonForDay(uint32_t day) {
    uint32_t season_day = (day == 0 ? 0 : day - 1) % 360;
    if (season_day < 90) return Season::SPRING;
    if (season_day < 180) return Season::SUMMER;
    if (season_day < 270) return Season::FALL;
    return Season::WINTER;
}

uint32_t seasonDemandBps(Season season) {
    switch (season) {
        case Season::SPRING: return 10000;
        case Season::SUMMER: return 11000;   // vacations
        case Season::FALL: return 9000;      // back to school
        case Season::WINTER: return 14000;   // holidays
    }
    return 10000;
}

uint32_t seasonRetailerBonusBps(Season season, const std::string& retailer) {
    switch (season) {
        case Season::SUMMER:
            if (retailer == "Target") return 12000;
            if (retailer == "Walmart") return 11000;
            return 10000;
        case Season::FALL:
            if (retailer == "iTunes") return 13000;
            if (retailer == "Amazon") return 12000;
            return 10000;
        case Season::WINTER:
            if (retailer == "Amazon") return 15000;
            if (retailer == "iTunes") return 14000;
            if (retailer == "Starbucks") return 13000;
            return 12000;
        case Season::SPRING:
            return 10000;
    }
    return 10000;
}

MarketEvent marketEventForDay(uint32_t day) {
    switch (day % 8) {
        case 0: return {"Tech Surge", "New gadget releases drive tech gift card demand",
                        std::string("iTunes"), 9000, 15000, 4};
        case 1: return {"Coffee Festival", "Local coffee festival increases Starbucks popularity",
                        std::string("Starbucks"), 11000, 18000, 3};
        case 2: return {"Supply Chain Issues", "Logistics problems affect all retailers",
                        std::nullopt, 13000, 7000, 5};
        case 3: return {"Amazon Prime Day", "Special Amazon promotion increases demand",
                        std::string("Amazon"), 8500, 20000, 2};
        case 4: return {"Back to School", "Students need supplies, Target benefits",
                        std::string("Target"), 10500, 14000, 7};
        case 5: return {"Economic Downturn", "Customers tighten budgets, demand drops",
                        std::nullopt, 10000, 6000, 6};
        case 6: return {"Walmart Expansion", "New Walmart stores increase accessibility",
                        std::string("Walmart"), 9500, 13000, 4};
        default: return {"Market Boom", "General economic growth benefits all retailers",
                         std::nullopt, 9000, 12000, 5};
    }
}

MarketConditions::MarketConditions(uint32_t start_day)
    : season_(seasonForDay(start_day)) {}

std::vector<std::string> MarketConditions::advanceToDay(uint32_t day) {
    std::vector<std::string> messages;

    Season season = seasonForDay(day);
    if (season != season_) {
        season_ = season;
        messages.push_back(std::string(toString(season_)) + " season begins");
    }

    // age events; an event with duration N is active for N days
    for (auto it = events_.begin(); it != events_.end();) {
        if (it->remaining_days > 0) {
            --it->remaining_days;
        }
        if (it->remaining_days == 0) {
            messages.push_back("Market event '" + it->name + "' has ended");
            ++events_ended_;
            it = events_.erase(it);
        } else {
            ++it;
        }
    }

    if (next_event_in_days_ > 0) {
        --next_event_in_days_;
    } else {
        MarketEvent event = marketEventForDay(day);
        messages.push_back("New market event: " + event.name + " - " + event.description);
        events_.push_back(std::move(event));
        next_event_in_days_ = 5 + day % 10;
    }

    return messages;
}

uint32_t MarketConditions::priceMultiplierBps(const std::string& retailer) const {
    Cents multiplier = seasonRetailerBonusBps(season_, retailer);
    for (const auto& event : events_) {
        if (event.affects(retailer)) {
            multiplier = applyBps(multiplier, event.price_bps);
        }
    }
    return static_cast<uint32_t>(multiplier);
}

uint32_t MarketConditions::demandMultiplierBps(const std::string& retailer) const {
    Cents multiplier = seasonDemandBps(season_);
    multiplier = applyBps(multiplier, seasonRetailerBonusBps(season_, retailer));
    for (const auto& event : events_) {
        if (event.affects(retailer)) {
            multiplier = applyBps(multiplier, event.demand_bps);
        }
    }
    return static_cast<uint32_t>(multiplier);
}

void MarketConditions::applyTo(Market& market) const {
    for (const auto& retailer : market.retailerNames()) {
        market.setPriceModifier(retailer, priceMultiplierBps(retailer));
        market.setDemandModifier(retailer, demandMultiplierBps(retailer));
    }
}

}
