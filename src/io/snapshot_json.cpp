/**
 * @file snapshot_json.cpp
 * @brief Implements JSON export with nlohmann::json.
 */

#include "io/snapshot_json.hpp"

#include <fstream>
#include <stdexcept>

namespace io {

using json = nlohmann::json;
using namespace core;
using namespace engine;

namespace {

void writeJson(const json& doc, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    out << doc.dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

}

json toJson(const CustomerOrder& order) {
    json items = json::array();
    for (const auto& item : order.items) {
        items.push_back({
            {"retailer", item.retailer},
            {"denomination", item.denomination},
            {"quantity", item.quantity},
        });
    }

    return {
        {"id", order.id},
        {"customer", order.customer.name},
        {"items", items},
        {"offered_price", order.offered_price},
        {"priority", toString(order.priority)},
        {"state", toString(order.state)},
        {"created_day", order.created_day},
        {"deadline_day", order.deadline_day},
    };
}

json toJson(const BusinessAnalytics& analytics) {
    return {
        {"total_revenue", analytics.totalRevenue()},
        {"total_purchases", analytics.totalPurchases()},
        {"total_profit", analytics.totalProfit()},
        {"orders_completed", analytics.ordersCompleted()},
        {"orders_expired", analytics.ordersExpired()},
        {"orders_declined", analytics.ordersDeclined()},
        {"cards_sold", analytics.cardsSold()},
        {"cards_expired", analytics.cardsExpired()},
        {"expired_value", analytics.expiredValue()},
        {"best_day_revenue", analytics.bestDayRevenue()},
        {"recent_daily_average", analytics.recentDailyAverage()},
        {"average_profit_margin_bps", analytics.averageProfitMarginBps()},
        {"daily_revenues", json(analytics.dailyRevenues())},
    };
}

json toJson(const Achievement& achievement) {
    json doc = {
        {"type", toString(achievement.type)},
        {"name", achievement.name},
        {"description", achievement.description},
        {"progress", achievement.progress},
        {"target", achievement.target},
        {"reward", achievement.reward},
        {"unlocked", achievement.unlocked},
    };
    if (achievement.unlocked) {
        doc["unlock_day"] = achievement.unlock_day;
    }
    return doc;
}

json toJson(const Snapshot& snapshot) {
    json inventory = json::array();
    for (const auto& group : snapshot.inventory) {
        inventory.push_back({
            {"retailer", group.retailer},
            {"denomination", group.denomination},
            {"quantity", group.quantity},
            {"total_cost", group.total_cost},
            {"lot_count", group.lot_count},
            {"soonest_expiration_day", group.soonest_expiration_day},
            {"soonest_quantity", group.soonest_quantity},
            {"expiring_soon", group.expiring_soon},
        });
    }

    json orders = json::array();
    for (const auto& order : snapshot.orders) {
        orders.push_back(toJson(order));
    }

    json activity = json::array();
    for (const auto& record : snapshot.activity) {
        activity.push_back({
            {"sequence", record.sequence},
            {"day", record.day},
            {"minute", record.minute},
            {"message", record.message},
        });
    }

    json market = json::array();
    for (const auto& quote : snapshot.market) {
        market.push_back({
            {"retailer", quote.retailer},
            {"denomination", quote.denomination},
            {"face_value", quote.face_value},
            {"unit_price", quote.unit_price},
            {"available", quote.available},
        });
    }

    json achievements = json::array();
    for (const auto& achievement : snapshot.achievements) {
        achievements.push_back(toJson(achievement));
    }

    return {
        {"version", snapshot.version},
        {"day", snapshot.time.day},
        {"minute_of_day", snapshot.time.minute_of_day},
        {"paused", snapshot.paused},
        {"cash", snapshot.cash},
        {"reputation", snapshot.reputation},
        {"reputation_stars", snapshot.reputation_stars},
        {"season", toString(snapshot.season)},
        {"market_events", snapshot.market_events},
        {"inventory", inventory},
        {"orders", orders},
        {"market", market},
        {"activity", activity},
        {"analytics", toJson(snapshot.analytics)},
        {"achievements", achievements},
        {"achievements_unlocked", snapshot.achievements_unlocked},
        {"achievement_rewards", snapshot.achievement_rewards},
    };
}

void exportSnapshot(const Snapshot& snapshot, const std::string& path) {
    writeJson(toJson(snapshot), path);
}

void exportSummary(const Snapshot& snapshot, const std::string& path) {
    json summary = {
        {"day", snapshot.time.day},
        {"cash", snapshot.cash},
        {"cash_display", formatCents(snapshot.cash)},
        {"reputation", snapshot.reputation},
        {"reputation_stars", snapshot.reputation_stars},
        {"open_orders", snapshot.orders.size()},
        {"analytics", toJson(snapshot.analytics)},
        {"achievements_unlocked", snapshot.achievements_unlocked},
        {"achievement_rewards", snapshot.achievement_rewards},
    };
    writeJson(summary, path);
}

}
