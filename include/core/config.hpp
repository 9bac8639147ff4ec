/**
 * @file config.hpp
 * @brief Difficulty presets and game configuration loaded from JSON.
 */

#pragma once

#include "core/money.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace core {

/**
 * @struct BpsRange
 * @brief Inclusive range of basis-point multipliers (10000 == 1.0x).
 */
struct BpsRange {
    uint32_t min_bps;
    uint32_t max_bps;
};

/**
 * @struct DayRange
 * @brief Inclusive range of day offsets.
 */
struct DayRange {
    uint32_t min_days;
    uint32_t max_days;
};

/**
 * @struct DifficultyPreset
 * @brief Economic parameters fixed at game start.
 */
struct DifficultyPreset {
    std::string name;
    Cents starting_cash;
    int starting_reputation;           ///< Reputation points, 100 per star
    BpsRange profit_margin_band;       ///< Customer offer multiplier over face value
    DayRange expiration_range_days;    ///< Shelf life of purchased cards
    DayRange order_deadline_range_days;
};

DifficultyPreset easyPreset();
DifficultyPreset normalPreset();
DifficultyPreset hardPreset();

/**
 * @brief Looks up a preset by name ("easy", "normal", "hard").
 * @throws std::invalid_argument for an unknown name
 */
DifficultyPreset presetByName(const std::string& name);

/**
 * @brief Names of all presets, in difficulty order.
 */
std::vector<std::string> presetNames();

/**
 * @struct GameConfig
 * @brief Everything the engine needs to start a game.
 */
struct GameConfig {
    DifficultyPreset preset = normalPreset();
    uint64_t seed = 42;
    uint32_t minutes_per_period = 10;      ///< Simulated minutes per real period
    uint32_t real_ms_per_period = 3000;    ///< Real milliseconds per period
    uint32_t start_minute = 9 * 60;        ///< Day 1 opens at 09:00
    size_t activity_log_capacity = 50;
    bool verbose = false;                  ///< Echo engine events to stdout
};

/**
 * @brief Rejects settings the clock or activity log cannot run with.
 * @throws std::invalid_argument for a zero period, a zero log capacity or a
 *         start minute past the end of the day
 */
void validateConfig(const GameConfig& config);

/**
 * @brief Builds a GameConfig from a JSON object. Missing keys keep defaults.
 * @throws nlohmann::json::exception on wrongly typed values
 * @throws std::invalid_argument for an unknown preset name or out-of-range values
 */
GameConfig configFromJson(const nlohmann::json& doc);

/**
 * @brief Reads and parses a JSON configuration file.
 * @throws std::runtime_error if the file cannot be opened
 */
GameConfig loadConfig(const std::string& path);

/**
 * @struct HostOptions
 * @brief Command-line settings for the headless host.
 */
struct HostOptions {
    std::string config_path = "config.json";
    std::optional<std::string> preset;
    std::optional<uint64_t> seed;
    std::optional<bool> verbose;    ///< Overrides the config file when given
    bool fast = false;          ///< Skip the real-time sleep between ticks
    uint32_t days = 30;         ///< Stop once this day has been played
    uint32_t speed = 1;         ///< Simulated periods per real period, at least 1
};

/**
 * @brief Parses host arguments, excluding the program name.
 *
 * --verbose and --fast are switches; every other option takes a value:
 * --config, --preset, --seed, --days and --speed.
 *
 * @throws std::invalid_argument for an unknown option, a missing value or a
 *         value that is not a number where one is expected
 */
HostOptions parseHostOptions(const std::vector<std::string>& args);

}
