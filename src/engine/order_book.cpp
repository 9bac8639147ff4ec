/**
 * @file order_book.cpp
 * @brief Implements order lifecycle management.
 */

#include "engine/order_book.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace engine {

using namespace core;

OrderBook::OrderBook(size_t history_capacity)
    : history_capacity_(history_capacity) {}

/**
 * Insert a fresh order. A reused id is a defect.
 */
bool OrderBook::claimId(uint64_t id) {
    auto next = used_ids_.upper_bound(id);
    if (next != used_ids_.begin()) {
        auto prev = std::prev(next);
        if (id <= prev->second) return false;
        if (prev->second + 1 == id) {
            prev->second = id;
            if (next != used_ids_.end() && next->first == id + 1) {
                prev->second = next->second;
                used_ids_.erase(next);
            }
            return true;
        }
    }
    if (next != used_ids_.end() && next->first == id + 1) {
        uint64_t last = next->second;
        used_ids_.erase(next);
        used_ids_.emplace(id, last);
        return true;
    }
    used_ids_.emplace(id, id);
    return true;
}

void OrderBook::insert(const CustomerOrder& order) {
    if (order.state != OrderState::PENDING) {
        throw std::invalid_argument("OrderBook accepts only PENDING orders (order #" +
                                    std::to_string(order.id) + " is " + toString(order.state) + ")");
    }
    if (!claimId(order.id)) {
        throw std::invalid_argument("Order id #" + std::to_string(order.id) + " is not new");
    }

    orders_.emplace(order.id, order);
}

CustomerOrder OrderBook::finish(std::map<uint64_t, CustomerOrder>::iterator it, OrderState state) {
    CustomerOrder done = it->second;
    done.state = state;
    orders_.erase(it);

    history_.push_back(done);
    while (history_.size() > history_capacity_) {
        history_.pop_front();
    }

    if (terminal_callback_) {
        terminal_callback_(done);
    }
    return done;
}

/**
 * Expire overdue orders. Must run before the day's new orders are inserted.
 */
std::vector<CustomerOrder> OrderBook::expireOverdue(uint32_t current_day) {
    std::vector<CustomerOrder> expired;

    for (auto it = orders_.begin(); it != orders_.end();) {
        if (it->second.deadline_day < current_day) {
            auto next = std::next(it);
            expired.push_back(finish(it, OrderState::EXPIRED));
            it = next;
        } else {
            ++it;
        }
    }
    return expired;
}

/**
 * Fulfill an order against inventory. Nothing changes unless every item is covered.
 */
FulfillResult OrderBook::acceptAndFulfill(uint64_t order_id, Inventory& inventory, Player& player,
                                          uint32_t current_day) {
    FulfillResult result;

    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        result.code = ErrorCode::UNKNOWN_ORDER;
        return result;
    }
    result.order = it->second;

    ConsumeResult consumed = inventory.consumeAll(it->second.items);
    if (!consumed.ok()) {
        result.code = ErrorCode::UNFULFILLABLE_ORDER;
        return result;
    }

    player.credit(it->second.offered_price);
    result.reputation_delta = player.reputation.onOrderFulfilled(it->second, current_day);
    result.cost_basis = consumed.cost_basis;
    result.order = finish(it, OrderState::FULFILLED);
    return result;
}

std::optional<CustomerOrder> OrderBook::decline(uint64_t order_id) {
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return finish(it, OrderState::DECLINED);
}

bool OrderBook::canFulfill(uint64_t order_id, const Inventory& inventory) const {
    auto it = orders_.find(order_id);
    return it != orders_.end() && inventory.canSatisfy(it->second.items);
}

std::optional<CustomerOrder> OrderBook::find(uint64_t order_id) const {
    auto it = orders_.find(order_id);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}

const std::map<uint64_t, CustomerOrder>& OrderBook::getOrders() const {
    return orders_;
}

std::vector<CustomerOrder> OrderBook::sortedByPriority() const {
    std::vector<CustomerOrder> sorted;
    sorted.reserve(orders_.size());
    for (const auto& [id, order] : orders_) {
        sorted.push_back(order);
    }

    std::stable_sort(sorted.begin(), sorted.end(), [](const CustomerOrder& a, const CustomerOrder& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.deadline_day != b.deadline_day) return a.deadline_day < b.deadline_day;
        return a.id < b.id;
    });
    return sorted;
}

void OrderBook::setTerminalCallback(TerminalCallback cb) {
    terminal_callback_ = std::move(cb);
}

}
