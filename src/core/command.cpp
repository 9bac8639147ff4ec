/**
 * @file command.cpp
 * @brief Implements command descriptions and error names.
 */

#include "core/command.hpp"

namespace core {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "None";
        case ErrorCode::INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case ErrorCode::INSUFFICIENT_STOCK: return "InsufficientStock";
        case ErrorCode::UNFULFILLABLE_ORDER: return "UnfulfillableOrder";
        case ErrorCode::UNKNOWN_ORDER: return "UnknownOrder";
        case ErrorCode::INVALID_REQUEST: return "InvalidRequest";
    }
    return "Unknown";
}

std::string describe(const Command& command) {
    if (auto p = std::get_if<Purchase>(&command)) {
        return "Purchase " + std::to_string(p->quantity) + "x " + p->retailer + " $" + std::to_string(p->denomination);
    }
    if (auto a = std::get_if<AcceptOrder>(&command)) {
        return "AcceptOrder #" + std::to_string(a->order_id);
    }
    if (auto d = std::get_if<DeclineOrder>(&command)) {
        return "DeclineOrder #" + std::to_string(d->order_id);
    }
    if (auto l = std::get_if<Liquidate>(&command)) {
        return "Liquidate " + std::to_string(l->quantity) + "x " + l->retailer + " $" + std::to_string(l->denomination);
    }
    if (std::holds_alternative<Pause>(command)) {
        return "Pause";
    }
    return "Resume";
}

}
