/**
 * @file inventory.cpp
 * @brief Implements lot storage, aging and FIFO-by-expiration consumption.
 */

#include "engine/inventory.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace engine {

using namespace core;

namespace {

bool expiresBefore(const GiftCardLot& a, const GiftCardLot& b) {
    if (a.expiration_day != b.expiration_day) return a.expiration_day < b.expiration_day;
    return a.lot_id < b.lot_id;
}

}

uint64_t Inventory::addLot(const std::string& retailer, uint32_t denomination, uint32_t quantity,
                           Cents unit_cost, uint32_t purchase_day, uint32_t expiration_day) {
    if (quantity == 0) {
        throw std::invalid_argument("Lot quantity must be positive");
    }
    if (unit_cost < 0) {
        throw std::invalid_argument("Lot unit cost must not be negative");
    }
    if (expiration_day <= purchase_day) {
        throw std::invalid_argument("Lot must expire after its purchase day");
    }

    GiftCardLot lot;
    lot.lot_id = next_lot_id_++;
    lot.retailer = retailer;
    lot.denomination = denomination;
    lot.unit_cost = unit_cost;
    lot.quantity = quantity;
    lot.purchase_day = purchase_day;
    lot.expiration_day = expiration_day;

    // new ids are the largest, so upper_bound keeps insertion order among equal expirations
    auto pos = std::upper_bound(lots_.begin(), lots_.end(), lot, expiresBefore);
    lots_.insert(pos, lot);
    return lot.lot_id;
}

std::vector<GiftCardLot> Inventory::ageOneDay(uint32_t current_day) {
    // lots are sorted by expiration, so the expired ones form a prefix
    auto first_alive = std::find_if(lots_.begin(), lots_.end(),
        [current_day](const GiftCardLot& lot) { return lot.expiration_day > current_day; });

    std::vector<GiftCardLot> expired(lots_.begin(), first_alive);
    lots_.erase(lots_.begin(), first_alive);
    return expired;
}

uint32_t Inventory::available(const std::string& retailer, uint32_t denomination) const {
    uint32_t total = 0;
    for (const auto& lot : lots_) {
        if (lot.matches(retailer, denomination)) {
            total += lot.quantity;
        }
    }
    return total;
}

std::optional<uint32_t> Inventory::soonestExpiration(const std::string& retailer, uint32_t denomination) const {
    for (const auto& lot : lots_) {
        if (lot.matches(retailer, denomination)) {
            return lot.expiration_day;
        }
    }
    return std::nullopt;
}

ConsumeResult Inventory::take(const std::string& retailer, uint32_t denomination, uint32_t quantity) {
    ConsumeResult result;
    uint32_t needed = quantity;

    for (auto it = lots_.begin(); it != lots_.end() && needed > 0;) {
        if (!it->matches(retailer, denomination)) {
            ++it;
            continue;
        }

        uint32_t taken = std::min(needed, it->quantity);
        result.quantity += taken;
        result.cost_basis += it->unit_cost * static_cast<Cents>(taken);
        needed -= taken;

        if (taken == it->quantity) {
            it = lots_.erase(it);
        } else {
            it->quantity -= taken;
            ++it;
        }
    }

    if (needed != 0) {
        throw std::logic_error("Inventory::take ran out of stock after availability check");
    }
    return result;
}

ConsumeResult Inventory::consume(const std::string& retailer, uint32_t denomination, uint32_t quantity) {
    if (available(retailer, denomination) < quantity) {
        return ConsumeResult{ErrorCode::INSUFFICIENT_STOCK, 0, 0};
    }
    return take(retailer, denomination, quantity);
}

bool Inventory::canSatisfy(const std::vector<OrderItem>& items) const {
    std::map<std::pair<std::string, uint32_t>, uint64_t> demand;
    for (const auto& item : items) {
        demand[{item.retailer, item.denomination}] += item.quantity;
    }
    for (const auto& [key, quantity] : demand) {
        if (available(key.first, key.second) < quantity) {
            return false;
        }
    }
    return true;
}

ConsumeResult Inventory::consumeAll(const std::vector<OrderItem>& items) {
    if (!canSatisfy(items)) {
        return ConsumeResult{ErrorCode::INSUFFICIENT_STOCK, 0, 0};
    }

    ConsumeResult total;
    for (const auto& item : items) {
        ConsumeResult part = take(item.retailer, item.denomination, item.quantity);
        total.quantity += part.quantity;
        total.cost_basis += part.cost_basis;
    }
    return total;
}

uint32_t Inventory::totalCards() const {
    uint32_t total = 0;
    for (const auto& lot : lots_) {
        total += lot.quantity;
    }
    return total;
}

Cents Inventory::totalCost() const {
    Cents total = 0;
    for (const auto& lot : lots_) {
        total += lot.totalCost();
    }
    return total;
}

}
