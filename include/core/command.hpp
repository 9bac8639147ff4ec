/**
 * @file command.hpp
 * @brief Player commands and the typed result returned for each of them.
 */

#pragma once

#include <string>
#include <variant>
#include <cstdint>

namespace core {

/**
 * @enum ErrorCode
 * @brief Recoverable command failures surfaced to the player.
 */
enum class ErrorCode {
    NONE,
    INSUFFICIENT_FUNDS,   ///< Purchase would drive cash below zero
    INSUFFICIENT_STOCK,   ///< Market unavailable or inventory short
    UNFULFILLABLE_ORDER,  ///< Accept failed: some requested item is short
    UNKNOWN_ORDER,        ///< Order id not in the active set
    INVALID_REQUEST       ///< Malformed command, e.g. zero quantity
};

const char* toString(ErrorCode code);

/**
 * @struct CommandResult
 * @brief Outcome of a player command. code == NONE means success.
 */
struct CommandResult {
    ErrorCode code = ErrorCode::NONE;
    std::string message;

    bool ok() const { return code == ErrorCode::NONE; }

    static CommandResult success(const std::string& msg) {
        return CommandResult{ErrorCode::NONE, msg};
    }

    static CommandResult failure(ErrorCode c, const std::string& msg) {
        return CommandResult{c, msg};
    }
};

/// Buy `quantity` cards from the wholesale market.
struct Purchase {
    std::string retailer;
    uint32_t denomination = 0;
    uint32_t quantity = 0;
};

/// Fulfill a pending order from inventory.
struct AcceptOrder {
    uint64_t order_id = 0;
};

/// Turn a pending order down without reputation penalty.
struct DeclineOrder {
    uint64_t order_id = 0;
};

/// Sell owned cards back at a discount to face value.
struct Liquidate {
    std::string retailer;
    uint32_t denomination = 0;
    uint32_t quantity = 0;
};

struct Pause {};
struct Resume {};

using Command = std::variant<Purchase, AcceptOrder, DeclineOrder, Liquidate, Pause, Resume>;

/**
 * @brief Human readable form of a command, used in logs.
 */
std::string describe(const Command& command);

}
