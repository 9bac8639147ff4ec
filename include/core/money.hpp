/**
 * @file money.hpp
 * @brief Integer currency helpers. All cash amounts are whole cents.
 */

#pragma once

#include <cstdint>
#include <string>

namespace core {

using Cents = int64_t;

constexpr int64_t kBasisPoints = 10000;   ///< 100% expressed in basis points

/**
 * @brief Converts whole dollars to cents.
 */
constexpr Cents dollars(int64_t whole) { return whole * 100; }

/**
 * @brief Scales a non-negative amount by a basis-point factor, rounding half up.
 *
 * applyBps(800, 9800) == 784
 */
constexpr Cents applyBps(Cents amount, int64_t bps) {
    return (amount * bps + kBasisPoints / 2) / kBasisPoints;
}

/**
 * @brief Formats cents as a dollar string, e.g. 499200 -> "$4,992.00".
 */
std::string formatCents(Cents amount);

}
