/**
 * @file player.hpp
 * @brief The player's cash and reputation.
 */

#pragma once

#include "core/money.hpp"
#include "engine/reputation.hpp"

#include <stdexcept>
#include <utility>

namespace engine {

/**
 * @struct Player
 * @brief Singular player state, owned by SimulationEngine.
 *
 * Cash never goes below zero: debit refuses amounts it cannot cover.
 */
struct Player {
    core::Cents cash = 0;
    Reputation reputation;

    Player(core::Cents starting_cash, Reputation rep)
        : cash(starting_cash), reputation(std::move(rep)) {
        if (cash < 0) {
            throw std::invalid_argument("Starting cash must not be negative");
        }
    }

    bool canAfford(core::Cents amount) const { return amount <= cash; }

    /**
     * @return False and no change if amount exceeds cash
     */
    bool debit(core::Cents amount) {
        if (amount < 0 || !canAfford(amount)) return false;
        cash -= amount;
        return true;
    }

    void credit(core::Cents amount) {
        if (amount < 0) {
            throw std::logic_error("Player::credit called with a negative amount");
        }
        cash += amount;
    }
};

}
