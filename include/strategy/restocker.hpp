/**
 * @file restocker.hpp
 * @brief Declares a strategy that buys what open orders need and fulfills them.
 */

#pragma once

#include "strategy/strategy.hpp"

#include <map>
#include <string>
#include <cstdint>

namespace strategy {

/**
 * @class Restocker
 * @brief Order-driven player.
 *
 * Once per simulated day it walks open orders by priority, buys missing
 * cards when the offer still covers the wholesale cost and a cash reserve
 * remains, accepts every order it can cover, and liquidates stock about to
 * expire that no open order wants.
 */
class Restocker : public Strategy {
public:
    /**
     * @brief Constructs a Restocker.
     * @param submit Function to issue commands to the engine
     * @param cash_reserve Cash the strategy never spends on restocking
     */
    Restocker(SubmitCommandCallback submit, core::Cents cash_reserve);

    void onSnapshot(const engine::Snapshot& snapshot) override;
    std::string name() const override;
    void printSummary() const override;

    size_t commandsIssued() const override { return issued_; }
    size_t commandsRejected() const override { return rejected_; }
    size_t ordersAccepted() const { return accepted_; }
    size_t ordersDeclined() const { return declined_; }

private:
    using Key = std::pair<std::string, uint32_t>;

    SubmitCommandCallback submit_;
    core::Cents cash_reserve_;
    uint32_t last_day_ = 0;

    size_t issued_ = 0;
    size_t rejected_ = 0;
    size_t accepted_ = 0;
    size_t declined_ = 0;
    size_t cards_bought_ = 0;
    size_t cards_liquidated_ = 0;

    bool send(const core::Command& command);

    /**
     * @brief Wholesale cost of the cards `order` still needs beyond `stock`.
     */
    core::Cents shortfallCost(const core::CustomerOrder& order, const std::map<Key, uint32_t>& stock,
                              const engine::Snapshot& snapshot) const;
};

}
