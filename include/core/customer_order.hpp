/**
 * @file customer_order.hpp
 * @brief Defines customer orders, their items, priorities and lifecycle states.
 */

#pragma once

#include "core/money.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace core {

/**
 * @enum OrderPriority
 * @brief Desirability of an order, derived from its implied profit margin.
 */
enum class OrderPriority {
    LOW,
    MEDIUM,
    HIGH
};

/**
 * @enum OrderState
 * @brief Lifecycle of a customer order. PENDING is the only non-terminal state.
 */
enum class OrderState {
    PENDING,
    FULFILLED,
    EXPIRED,
    DECLINED
};

const char* toString(OrderPriority priority);
const char* toString(OrderState state);

/**
 * @struct OrderItem
 * @brief One requested line: quantity cards of retailer/denomination.
 */
struct OrderItem {
    std::string retailer;
    uint32_t denomination = 0;    ///< Face value in whole dollars
    uint32_t quantity = 0;
};

/**
 * @struct CustomerProfile
 * @brief Who placed the order.
 */
struct CustomerProfile {
    std::string name;
};

/**
 * @struct CustomerOrder
 * @brief A time-boxed request to buy gift cards from the player.
 */
struct CustomerOrder {
    uint64_t id = 0;                      ///< Unique, monotonically increasing
    CustomerProfile customer;
    std::vector<OrderItem> items;         ///< Requested lines, in order
    Cents offered_price = 0;              ///< Total the customer pays on fulfillment
    OrderPriority priority = OrderPriority::LOW;
    uint32_t deadline_day = 0;            ///< Last day the order can be fulfilled
    uint32_t created_day = 0;
    OrderState state = OrderState::PENDING;

    /**
     * @brief Sum of face values across all items.
     */
    Cents faceValue() const;

    /**
     * @brief Total number of cards requested.
     */
    uint32_t cardCount() const;

    bool isTerminal() const { return state != OrderState::PENDING; }

    /**
     * @brief Short description, e.g. "2x Amazon $25, 1x iTunes $15".
     */
    std::string describeItems() const;
};

}
