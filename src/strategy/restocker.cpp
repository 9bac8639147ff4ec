/**
 * @file restocker.cpp
 * @brief Implements the Restocker strategy logic.
 */

#include "strategy/restocker.hpp"

#include <algorithm>
#include <iostream>

namespace strategy {

using namespace core;
using namespace engine;

Restocker::Restocker(SubmitCommandCallback submit, Cents cash_reserve)
    : submit_(std::move(submit)),
      cash_reserve_(cash_reserve) {}

std::string Restocker::name() const {
    return "Restocker";
}

bool Restocker::send(const Command& command) {
    ++issued_;
    CommandResult result = submit_(command);
    if (!result.ok()) {
        ++rejected_;
        std::cerr << "[Restocker] " << describe(command) << " rejected: " << result.message << std::endl;
    }
    return result.ok();
}

Cents Restocker::shortfallCost(const CustomerOrder& order, const std::map<Key, uint32_t>& stock,
                               const Snapshot& snapshot) const {
    std::map<Key, uint32_t> needed;
    for (const auto& item : order.items) {
        needed[{item.retailer, item.denomination}] += item.quantity;
    }

    Cents cost = 0;
    for (const auto& [key, quantity] : needed) {
        auto held = stock.find(key);
        uint32_t have = held == stock.end() ? 0 : held->second;
        if (have >= quantity) continue;

        auto quote = std::find_if(snapshot.market.begin(), snapshot.market.end(), [&](const MarketQuote& q) {
            return q.retailer == key.first && q.denomination == key.second;
        });
        if (quote == snapshot.market.end() || !quote->available) {
            return -1;
        }
        cost += quote->unit_price * static_cast<Cents>(quantity - have);
    }
    return cost;
}

void Restocker::onSnapshot(const Snapshot& snapshot) {
    // act once per simulated day
    if (snapshot.time.day == last_day_) return;
    last_day_ = snapshot.time.day;

    std::map<Key, uint32_t> stock;
    for (const auto& group : snapshot.inventory) {
        stock[{group.retailer, group.denomination}] = group.quantity;
    }
    Cents cash = snapshot.cash;

    for (const auto& order : snapshot.orders) {
        Cents shortfall = shortfallCost(order, stock, snapshot);
        if (shortfall < 0) {
            continue;   // market cannot supply it today
        }

        if (shortfall > 0) {
            if (order.offered_price <= shortfall) {
                if (send(DeclineOrder{order.id})) ++declined_;
                continue;
            }
            if (cash - shortfall < cash_reserve_) {
                continue;
            }

            bool restocked = true;
            for (const auto& item : order.items) {
                Key key{item.retailer, item.denomination};
                uint32_t have = stock[key];
                if (have >= item.quantity) continue;

                uint32_t missing = item.quantity - have;
                if (!send(Purchase{item.retailer, item.denomination, missing})) {
                    restocked = false;
                    break;
                }
                stock[key] += missing;
                cards_bought_ += missing;
            }
            cash -= shortfall;
            if (!restocked) continue;
        }

        if (send(AcceptOrder{order.id})) {
            ++accepted_;
            cash += order.offered_price;
            for (const auto& item : order.items) {
                stock[{item.retailer, item.denomination}] -= item.quantity;
            }
        }
    }

    // sell what would otherwise expire overnight
    for (const auto& group : snapshot.inventory) {
        if (group.soonest_expiration_day > snapshot.time.day + 1) continue;

        uint32_t remaining = stock[{group.retailer, group.denomination}];
        uint32_t quantity = std::min(remaining, group.soonest_quantity);
        if (quantity == 0) continue;

        if (send(Liquidate{group.retailer, group.denomination, quantity})) {
            cards_liquidated_ += quantity;
        }
    }
}

void Restocker::printSummary() const {
    std::cout << "\n[SUMMARY] Restocker Strategy\n"
              << "[SUMMARY] Commands Issued: " << issued_ << "\n"
              << "[SUMMARY] Commands Rejected: " << rejected_ << "\n"
              << "[SUMMARY] Orders Accepted: " << accepted_ << "\n"
              << "[SUMMARY] Orders Declined: " << declined_ << "\n"
              << "[SUMMARY] Cards Bought: " << cards_bought_ << "\n"
              << "[SUMMARY] Cards Liquidated: " << cards_liquidated_ << "\n";
}

}
