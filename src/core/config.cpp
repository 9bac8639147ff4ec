/**
 * @file config.cpp
 * @brief Implements difficulty presets and JSON configuration loading.
 */

#include "core/config.hpp"

#include "core/game_time.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace core {

using json = nlohmann::json;

DifficultyPreset easyPreset() {
    return DifficultyPreset{"easy", dollars(7500), 350, {11000, 13000}, {45, 120}, {3, 7}};
}

DifficultyPreset normalPreset() {
    return DifficultyPreset{"normal", dollars(5000), 300, {10500, 13000}, {30, 90}, {2, 6}};
}

DifficultyPreset hardPreset() {
    return DifficultyPreset{"hard", dollars(3000), 250, {10500, 12000}, {20, 60}, {2, 4}};
}

DifficultyPreset presetByName(const std::string& name) {
    if (name == "easy") return easyPreset();
    if (name == "normal") return normalPreset();
    if (name == "hard") return hardPreset();
    throw std::invalid_argument("Unknown difficulty preset: " + name);
}

std::vector<std::string> presetNames() {
    return {"easy", "normal", "hard"};
}

void validateConfig(const GameConfig& config) {
    if (config.minutes_per_period == 0) {
        throw std::invalid_argument("minutes_per_period must be positive");
    }
    if (config.real_ms_per_period == 0) {
        throw std::invalid_argument("real_ms_per_period must be positive");
    }
    if (config.start_minute >= kMinutesPerDay) {
        throw std::invalid_argument("start_minute must be below " + std::to_string(kMinutesPerDay) +
                                    ", got " + std::to_string(config.start_minute));
    }
    if (config.activity_log_capacity == 0) {
        throw std::invalid_argument("activity_log_capacity must be positive");
    }
}

GameConfig configFromJson(const json& doc) {
    GameConfig config;
    if (!doc.is_object()) {
        return config;
    }

    if (doc.contains("preset")) {
        config.preset = presetByName(doc.at("preset").get<std::string>());
    }
    config.seed = doc.value("seed", config.seed);
    config.minutes_per_period = doc.value("minutes_per_period", config.minutes_per_period);
    config.real_ms_per_period = doc.value("real_ms_per_period", config.real_ms_per_period);
    config.start_minute = doc.value("start_minute", config.start_minute);
    config.activity_log_capacity = doc.value("activity_log_capacity", config.activity_log_capacity);
    config.verbose = doc.value("verbose", config.verbose);

    validateConfig(config);
    return config;
}

GameConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json doc;
    in >> doc;
    return configFromJson(doc);
}

namespace {

uint64_t parseNumber(const std::string& option, const std::string& text) {
    size_t used = 0;
    uint64_t value = 0;
    try {
        if (!text.empty() && text[0] != '-') value = std::stoull(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw std::invalid_argument("--" + option + " expects a number, got '" + text + "'");
    }
    return value;
}

uint32_t parseCount(const std::string& option, const std::string& text) {
    uint64_t value = parseNumber(option, text);
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("--" + option + " is out of range: " + text);
    }
    return static_cast<uint32_t>(value);
}

}

HostOptions parseHostOptions(const std::vector<std::string>& args) {
    HostOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
        std::string key = arg.substr(2);

        if (key == "verbose" || key == "fast") {
            bool value = true;
            // an explicit true/false after a switch is accepted and consumed
            if (i + 1 < args.size() && (args[i + 1] == "true" || args[i + 1] == "false")) {
                value = args[++i] == "true";
            }
            if (key == "verbose") {
                options.verbose = value;
            } else {
                options.fast = value;
            }
            continue;
        }

        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Missing value for " + arg);
        }
        const std::string& value = args[++i];

        if (key == "config") {
            options.config_path = value;
        } else if (key == "preset") {
            options.preset = value;
        } else if (key == "seed") {
            options.seed = parseNumber(key, value);
        } else if (key == "days") {
            options.days = parseCount(key, value);
        } else if (key == "speed") {
            options.speed = std::max<uint32_t>(1, parseCount(key, value));
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return options;
}

}
