/**
 * @file game_time.cpp
 * @brief Implements GameTime formatting.
 */

#include "core/game_time.hpp"

#include <cstdio>

namespace core {

std::string GameTime::toString() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "Day %u %02u:%02u", day, hour(), minute());
    return buf;
}

}
