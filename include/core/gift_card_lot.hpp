/**
 * @file gift_card_lot.hpp
 * @brief Defines a purchase batch of identical gift cards.
 */

#pragma once

#include "core/money.hpp"

#include <string>
#include <cstdint>

namespace core {

/**
 * @struct GiftCardLot
 * @brief One purchase batch: same retailer, denomination, cost and purchase day.
 *
 * Lots from different purchases are never merged so that consumption can
 * follow expiration order.
 */
struct GiftCardLot {
    uint64_t lot_id = 0;          ///< Insertion sequence, unique within an inventory
    std::string retailer;         ///< Retailer name, e.g. "Starbucks"
    uint32_t denomination = 0;    ///< Face value in whole dollars
    Cents unit_cost = 0;          ///< Wholesale cost paid per card
    uint32_t quantity = 0;        ///< Cards remaining in this lot
    uint32_t purchase_day = 0;    ///< Day the lot was bought
    uint32_t expiration_day = 0;  ///< First day the cards are worthless

    Cents faceValue() const { return dollars(denomination); }
    Cents totalCost() const { return unit_cost * static_cast<Cents>(quantity); }

    bool matches(const std::string& r, uint32_t d) const {
        return denomination == d && retailer == r;
    }
};

}
