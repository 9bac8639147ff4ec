/**
 * @file clock.hpp
 * @brief Converts wall-clock time into simulated minutes and day crossings.
 */

#pragma once

#include "core/game_time.hpp"

#include <chrono>
#include <vector>
#include <cstdint>

namespace engine {

/**
 * @struct ClockConfig
 * @brief Simulation speed and starting instant.
 *
 * The default ratio is 10 simulated minutes per 3 real seconds.
 */
struct ClockConfig {
    uint32_t sim_minutes_per_period = 10;
    uint32_t real_ms_per_period = 3000;
    uint32_t start_day = 1;
    uint32_t start_minute = 9 * 60;
};

/**
 * @class Clock
 * @brief Pausable game clock.
 *
 * Sub-minute remainders carry over between calls, so many small advances
 * add up to the same time as one large advance.
 */
class Clock {
public:
    /**
     * @throws std::invalid_argument on a zero ratio or an out of range start
     */
    explicit Clock(const ClockConfig& config = ClockConfig{});

    /**
     * @brief Advances simulated time by the real time elapsed.
     * @param elapsed Wall-clock time since the previous call
     * @return Every new day entered, in ascending order (empty while paused)
     */
    std::vector<uint32_t> advance(std::chrono::milliseconds elapsed);

    void pause() { paused_ = true; }
    void resume() { paused_ = false; }
    bool paused() const { return paused_; }

    core::GameTime now() const { return now_; }
    const ClockConfig& config() const { return config_; }

private:
    ClockConfig config_;
    core::GameTime now_;
    uint64_t carry_ = 0;    // real ms * sim minutes not yet converted
    bool paused_ = false;
};

}
