/**
 * @file customer_order.cpp
 * @brief Implements CustomerOrder helpers and enum names.
 */

#include "core/customer_order.hpp"

namespace core {

const char* toString(OrderPriority priority) {
    switch (priority) {
        case OrderPriority::HIGH: return "High";
        case OrderPriority::MEDIUM: return "Medium";
        case OrderPriority::LOW: return "Low";
    }
    return "Unknown";
}

const char* toString(OrderState state) {
    switch (state) {
        case OrderState::PENDING: return "Pending";
        case OrderState::FULFILLED: return "Fulfilled";
        case OrderState::EXPIRED: return "Expired";
        case OrderState::DECLINED: return "Declined";
    }
    return "Unknown";
}

Cents CustomerOrder::faceValue() const {
    Cents total = 0;
    for (const auto& item : items) {
        total += dollars(item.denomination) * static_cast<Cents>(item.quantity);
    }
    return total;
}

uint32_t CustomerOrder::cardCount() const {
    uint32_t total = 0;
    for (const auto& item : items) {
        total += item.quantity;
    }
    return total;
}

std::string CustomerOrder::describeItems() const {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += std::to_string(item.quantity) + "x " + item.retailer + " $" + std::to_string(item.denomination);
    }
    return out;
}

}
