/**
 * @file clock.cpp
 * @brief Implements the pausable game clock.
 */

#include "engine/clock.hpp"

#include <stdexcept>

namespace engine {

using namespace core;

Clock::Clock(const ClockConfig& config)
    : config_(config) {
    if (config_.sim_minutes_per_period == 0 || config_.real_ms_per_period == 0) {
        throw std::invalid_argument("Clock ratio must be positive");
    }
    if (config_.start_day == 0 || config_.start_minute >= kMinutesPerDay) {
        throw std::invalid_argument("Clock start time out of range");
    }
    now_ = GameTime{config_.start_day, config_.start_minute};
}

std::vector<uint32_t> Clock::advance(std::chrono::milliseconds elapsed) {
    std::vector<uint32_t> crossings;
    if (paused_ || elapsed.count() <= 0) {
        return crossings;
    }

    carry_ += static_cast<uint64_t>(elapsed.count()) * config_.sim_minutes_per_period;
    uint64_t minutes = carry_ / config_.real_ms_per_period;
    carry_ %= config_.real_ms_per_period;

    uint64_t total = now_.minute_of_day + minutes;
    uint64_t days = total / kMinutesPerDay;
    for (uint64_t i = 1; i <= days; ++i) {
        crossings.push_back(now_.day + static_cast<uint32_t>(i));
    }

    now_.day += static_cast<uint32_t>(days);
    now_.minute_of_day = static_cast<uint32_t>(total % kMinutesPerDay);
    return crossings;
}

}
