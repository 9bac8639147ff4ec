/**
 * @file inventory.hpp
 * @brief Owned, perishable gift card lots with expiration-ordered consumption.
 */

#pragma once

#include "core/gift_card_lot.hpp"
#include "core/customer_order.hpp"
#include "core/command.hpp"

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace engine {

/**
 * @struct ConsumeResult
 * @brief Outcome of removing cards from inventory.
 */
struct ConsumeResult {
    core::ErrorCode code = core::ErrorCode::NONE;
    uint32_t quantity = 0;        ///< Cards removed
    core::Cents cost_basis = 0;   ///< What the removed cards cost to buy

    bool ok() const { return code == core::ErrorCode::NONE; }
};

/**
 * @class Inventory
 * @brief Collection of GiftCardLots, kept sorted by (expiration_day, lot_id).
 *
 * Every mutation keeps three invariants: expiration_day > purchase_day,
 * quantity > 0 for every stored lot, and the sort order above.
 */
class Inventory {
public:
    /**
     * @brief Stores a new lot. Never merges with existing lots.
     * @return The new lot's id
     * @throws std::invalid_argument on zero quantity, negative cost, or
     *         expiration_day <= purchase_day
     */
    uint64_t addLot(const std::string& retailer, uint32_t denomination, uint32_t quantity,
                    core::Cents unit_cost, uint32_t purchase_day, uint32_t expiration_day);

    /**
     * @brief Removes every lot with expiration_day <= current_day.
     * @return Removed lots, ascending by expiration then insertion
     */
    std::vector<core::GiftCardLot> ageOneDay(uint32_t current_day);

    /**
     * @brief Removes `quantity` cards, soonest expiration first, splitting a lot if needed.
     *
     * All or nothing: on INSUFFICIENT_STOCK the inventory is unchanged.
     */
    ConsumeResult consume(const std::string& retailer, uint32_t denomination, uint32_t quantity);

    /**
     * @brief Consumes every item or none of them.
     *
     * Items naming the same retailer/denomination are summed before checking.
     */
    ConsumeResult consumeAll(const std::vector<core::OrderItem>& items);

    /**
     * @brief True if consumeAll(items) would succeed.
     */
    bool canSatisfy(const std::vector<core::OrderItem>& items) const;

    uint32_t available(const std::string& retailer, uint32_t denomination) const;

    /**
     * @brief Earliest expiration for a retailer/denomination, if any is held.
     */
    std::optional<uint32_t> soonestExpiration(const std::string& retailer, uint32_t denomination) const;

    const std::vector<core::GiftCardLot>& lots() const { return lots_; }
    bool empty() const { return lots_.empty(); }
    uint32_t totalCards() const;
    core::Cents totalCost() const;

private:
    std::vector<core::GiftCardLot> lots_;
    uint64_t next_lot_id_ = 1;

    /**
     * @brief Takes cards from matching lots in order. Caller has checked availability.
     */
    ConsumeResult take(const std::string& retailer, uint32_t denomination, uint32_t quantity);
};

}
