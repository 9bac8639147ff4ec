/**
 * @file order_book.hpp
 * @brief Active customer orders: deadlines, fulfillment and terminal transitions.
 */

#pragma once

#include "core/customer_order.hpp"
#include "core/command.hpp"
#include "engine/inventory.hpp"
#include "engine/player.hpp"

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace engine {

/**
 * @struct FulfillResult
 * @brief Outcome of accepting an order.
 */
struct FulfillResult {
    core::ErrorCode code = core::ErrorCode::NONE;
    core::CustomerOrder order;        ///< The order as it ended (FULFILLED on success)
    core::Cents cost_basis = 0;       ///< Purchase cost of the cards handed over
    int reputation_delta = 0;

    bool ok() const { return code == core::ErrorCode::NONE; }
};

/**
 * @class OrderBook
 * @brief Owns PENDING orders until they reach a terminal state.
 *
 * PENDING -> {FULFILLED | EXPIRED | DECLINED}. Terminal orders leave the
 * active set and are kept in a short history for display.
 */
class OrderBook {
public:
    using TerminalCallback = std::function<void(const core::CustomerOrder&)>;

    explicit OrderBook(size_t history_capacity = 100);

    /**
     * @brief Adds a new PENDING order.
     * @throws std::invalid_argument if the order is not PENDING or its id is already known
     */
    void insert(const core::CustomerOrder& order);

    /**
     * @brief Expires every PENDING order with deadline_day < current_day.
     * @return Expired orders, ascending by id
     */
    std::vector<core::CustomerOrder> expireOverdue(uint32_t current_day);

    /**
     * @brief Fulfills an order from inventory, crediting the player.
     *
     * All or nothing across every requested item: on UNFULFILLABLE_ORDER the
     * inventory, cash and reputation are untouched. On success the offer is
     * credited, the order leaves the active set and reputation is notified.
     */
    FulfillResult acceptAndFulfill(uint64_t order_id, Inventory& inventory, Player& player, uint32_t current_day);

    /**
     * @brief Turns an order down. No inventory, cash or reputation effect.
     * @return The declined order, or nullopt (UNKNOWN_ORDER) if not active
     */
    std::optional<core::CustomerOrder> decline(uint64_t order_id);

    /**
     * @brief True if the order is active and inventory covers all of it.
     */
    bool canFulfill(uint64_t order_id, const Inventory& inventory) const;

    std::optional<core::CustomerOrder> find(uint64_t order_id) const;

    /**
     * @brief Returns a const reference to the active orders keyed by id.
     */
    const std::map<uint64_t, core::CustomerOrder>& getOrders() const;

    /**
     * @brief Active orders, HIGH priority first, then earliest deadline, then id.
     */
    std::vector<core::CustomerOrder> sortedByPriority() const;

    /**
     * @brief Most recent terminal orders, oldest first.
     */
    const std::deque<core::CustomerOrder>& history() const { return history_; }

    size_t size() const { return orders_.size(); }
    bool empty() const { return orders_.empty(); }

    /**
     * @brief Number of disjoint id ranges remembered for reuse checks.
     *
     * Sequential ids collapse into a single range, so this stays at 1 for a
     * generator that never skips an id.
     */
    size_t idRangeCount() const { return used_ids_.size(); }

    /**
     * @brief Called once for every order that reaches a terminal state.
     */
    void setTerminalCallback(TerminalCallback cb);

private:
    std::map<uint64_t, core::CustomerOrder> orders_;   // active, PENDING only
    std::deque<core::CustomerOrder> history_;
    size_t history_capacity_;
    std::map<uint64_t, uint64_t> used_ids_;            // first -> last, inclusive

    TerminalCallback terminal_callback_;

    /**
     * @brief Records id as used, merging it into neighbouring ranges.
     * @return false if id was already used
     */
    bool claimId(uint64_t id);

    /**
     * @brief Moves an active order to a terminal state and out of the active set.
     */
    core::CustomerOrder finish(std::map<uint64_t, core::CustomerOrder>::iterator it, core::OrderState state);
};

}
