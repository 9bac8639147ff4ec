/**
 * @file game_time.hpp
 * @brief Simulated game instant (day + minute of day).
 */

#pragma once

#include <cstdint>
#include <string>

namespace core {

constexpr uint32_t kMinutesPerDay = 1440;

/**
 * @struct GameTime
 * @brief A simulated instant. Days start at 1, minutes run 0..1439.
 */
struct GameTime {
    uint32_t day = 1;             ///< Simulated day, 1-based
    uint32_t minute_of_day = 0;   ///< Minutes since midnight

    uint32_t hour() const { return minute_of_day / 60; }
    uint32_t minute() const { return minute_of_day % 60; }

    /**
     * @brief Minutes since day 1 00:00, used for ordering.
     */
    uint64_t absoluteMinutes() const {
        return static_cast<uint64_t>(day - 1) * kMinutesPerDay + minute_of_day;
    }

    /**
     * @brief Renders "Day 3 09:20".
     */
    std::string toString() const;

    bool operator==(const GameTime& other) const {
        return day == other.day && minute_of_day == other.minute_of_day;
    }
    bool operator!=(const GameTime& other) const { return !(*this == other); }
    bool operator<(const GameTime& other) const {
        return absoluteMinutes() < other.absoluteMinutes();
    }
};

}
