/**
 * @file simulation_engine.cpp
 * @brief Implements the tick loop, command handling and the daily pass.
 */

#include "engine/simulation_engine.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

namespace engine {

using namespace core;

namespace {

constexpr uint32_t kLiquidationBps = 8500;   // sell-back at 85% of face value

ClockConfig clockConfigFor(const GameConfig& config) {
    ClockConfig clock;
    clock.sim_minutes_per_period = config.minutes_per_period;
    clock.real_ms_per_period = config.real_ms_per_period;
    clock.start_day = 1;
    clock.start_minute = config.start_minute;
    return clock;
}

std::string cardLabel(uint32_t quantity, const std::string& retailer, uint32_t denomination) {
    return std::to_string(quantity) + "x " + retailer + " $" + std::to_string(denomination);
}

}

SimulationEngine::SimulationEngine(const GameConfig& config, MarketConfig market_config)
    : config_(config),
      clock_(clockConfigFor(config)),
      market_(std::move(market_config)),
      conditions_(1),
      generator_(GeneratorConfig::fromPreset(config.preset)),
      player_(config.preset.starting_cash, Reputation(config.preset.starting_reputation)),
      activity_(config.activity_log_capacity),
      order_rng_(config.seed, 1),
      purchase_rng_(config.seed, 2) {
    order_book_.setTerminalCallback([this](const CustomerOrder& order) {
        if (order.state == OrderState::EXPIRED) {
            analytics_.recordExpiredOrder();
        } else if (order.state == OrderState::DECLINED) {
            analytics_.recordDeclinedOrder();
        }
    });

    conditions_.applyTo(market_);

    GameTime start = clock_.now();
    note(start, "Welcome to the gift card business!");
    note(start, "Starting with " + formatCents(player_.cash) + " capital (" + config_.preset.name + ")");
    note(GameTime{start.day, 0}, "Day " + std::to_string(start.day) + " begins (" +
                                 toString(conditions_.season()) + " season)");
    generateOrders(start.day);
    commit();
}

std::shared_ptr<const Snapshot> SimulationEngine::tick(std::chrono::milliseconds elapsed) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    std::deque<PendingCommand> pending;
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex_);
        pending.swap(queue_);
    }
    for (auto& item : pending) {
        item.promise.set_value(execute(item.command));
    }

    for (uint32_t day : clock_.advance(elapsed)) {
        runDailyPass(day);
    }

    return commit();
}

std::future<CommandResult> SimulationEngine::submit(Command command) {
    PendingCommand item{std::move(command), std::promise<CommandResult>()};
    std::future<CommandResult> result = item.promise.get_future();

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(item));
    return result;
}

CommandResult SimulationEngine::apply(const Command& command) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    CommandResult result = execute(command);
    commit();
    return result;
}

std::shared_ptr<const Snapshot> SimulationEngine::latest() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return latest_;
}

CommandResult SimulationEngine::execute(const Command& command) {
    if (auto p = std::get_if<Purchase>(&command)) return purchase(*p);
    if (auto a = std::get_if<AcceptOrder>(&command)) return acceptOrder(*a);
    if (auto d = std::get_if<DeclineOrder>(&command)) return declineOrder(*d);
    if (auto l = std::get_if<Liquidate>(&command)) return liquidate(*l);
    if (std::holds_alternative<Pause>(command)) return pause();
    return resume();
}

CommandResult SimulationEngine::purchase(const Purchase& cmd) {
    if (cmd.quantity == 0) {
        return reject(ErrorCode::INVALID_REQUEST, "Purchase quantity must be positive");
    }
    if (!market_.isAvailable(cmd.retailer, cmd.denomination)) {
        return reject(ErrorCode::INSUFFICIENT_STOCK,
                      cmd.retailer + " $" + std::to_string(cmd.denomination) + " cards are not available");
    }

    Cents unit = market_.price(cmd.retailer, cmd.denomination, cmd.quantity,
                               player_.reputation.points()).value();
    Cents total = unit * static_cast<Cents>(cmd.quantity);
    if (!player_.debit(total)) {
        return reject(ErrorCode::INSUFFICIENT_FUNDS,
                      "Insufficient funds for " + cardLabel(cmd.quantity, cmd.retailer, cmd.denomination) +
                      " (need " + formatCents(total) + ", have " + formatCents(player_.cash) + ")");
    }

    uint32_t today = clock_.now().day;
    const DayRange& shelf = config_.preset.expiration_range_days;
    uint32_t expiration = today + std::max<uint32_t>(1, purchase_rng_.range(shelf.min_days, shelf.max_days));
    inventory_.addLot(cmd.retailer, cmd.denomination, cmd.quantity, unit, today, expiration);
    analytics_.recordPurchase(total);

    std::string message = "Purchased " + cardLabel(cmd.quantity, cmd.retailer, cmd.denomination) +
                          " cards for " + formatCents(total) + " (expires day " + std::to_string(expiration) + ")";
    note(clock_.now(), message);
    noteUnlocks(clock_.now(), achievements_.recordPurchase(today, market_.priceModifierBps(cmd.retailer)));
    return CommandResult::success(message);
}

CommandResult SimulationEngine::acceptOrder(const AcceptOrder& cmd) {
    FulfillResult result = order_book_.acceptAndFulfill(cmd.order_id, inventory_, player_, clock_.now().day);

    if (result.code == ErrorCode::UNKNOWN_ORDER) {
        return reject(result.code, "Order #" + std::to_string(cmd.order_id) + " is not active");
    }
    if (!result.ok()) {
        return reject(result.code, "Cannot fulfill order #" + std::to_string(cmd.order_id) +
                                   " - insufficient inventory for " + result.order.describeItems());
    }

    const CustomerOrder& order = result.order;
    analytics_.recordSale(order.offered_price, result.cost_basis, order.cardCount(), true);

    std::string message = "Completed order #" + std::to_string(order.id) + " for " + order.customer.name + ": " +
                          order.describeItems() + " for " + formatCents(order.offered_price) +
                          " (profit: " + formatCents(order.offered_price - result.cost_basis) + ")";
    note(clock_.now(), message);
    if (result.reputation_delta > 0) {
        note(clock_.now(), "Reputation improved by " + std::to_string(result.reputation_delta) + " points");
    }

    uint32_t today = clock_.now().day;
    noteUnlocks(clock_.now(), achievements_.recordOrderCompletion(
        today, analytics_.ordersCompleted(), player_.reputation.stars(),
        order.offered_price - result.cost_basis, conditions_.season()));
    noteUnlocks(clock_.now(), achievements_.recordCash(today, player_.cash));
    return CommandResult::success(message);
}

CommandResult SimulationEngine::declineOrder(const DeclineOrder& cmd) {
    auto declined = order_book_.decline(cmd.order_id);
    if (!declined) {
        return reject(ErrorCode::UNKNOWN_ORDER, "Order #" + std::to_string(cmd.order_id) + " is not active");
    }

    std::string message = "Declined order #" + std::to_string(declined->id) + " from " + declined->customer.name;
    note(clock_.now(), message);
    return CommandResult::success(message);
}

CommandResult SimulationEngine::liquidate(const Liquidate& cmd) {
    if (cmd.quantity == 0) {
        return reject(ErrorCode::INVALID_REQUEST, "Liquidation quantity must be positive");
    }

    ConsumeResult consumed = inventory_.consume(cmd.retailer, cmd.denomination, cmd.quantity);
    if (!consumed.ok()) {
        return reject(ErrorCode::INSUFFICIENT_STOCK,
                      "Only " + std::to_string(inventory_.available(cmd.retailer, cmd.denomination)) + " " +
                      cmd.retailer + " $" + std::to_string(cmd.denomination) + " cards in stock");
    }

    Cents revenue = applyBps(dollars(cmd.denomination) * static_cast<Cents>(cmd.quantity), kLiquidationBps);
    player_.credit(revenue);
    analytics_.recordSale(revenue, consumed.cost_basis, consumed.quantity, false);

    std::string message = "Sold " + cardLabel(cmd.quantity, cmd.retailer, cmd.denomination) + " cards for " +
                          formatCents(revenue) + " (profit: " + formatCents(revenue - consumed.cost_basis) + ")";
    note(clock_.now(), message);
    noteUnlocks(clock_.now(), achievements_.recordCash(clock_.now().day, player_.cash));
    return CommandResult::success(message);
}

CommandResult SimulationEngine::pause() {
    if (clock_.paused()) {
        return CommandResult::success("Already paused");
    }
    clock_.pause();
    note(clock_.now(), "Paused");
    return CommandResult::success("Paused");
}

CommandResult SimulationEngine::resume() {
    if (!clock_.paused()) {
        return CommandResult::success("Already running");
    }
    clock_.resume();
    note(clock_.now(), "Resumed");
    return CommandResult::success("Resumed");
}

void SimulationEngine::runDailyPass(uint32_t day) {
    GameTime dawn{day, 0};

    std::vector<std::string> market_news = conditions_.advanceToDay(day);
    conditions_.applyTo(market_);
    analytics_.startNewDay();

    note(dawn, "Day " + std::to_string(day) + " begins (" + toString(conditions_.season()) + " season)");
    for (const auto& news : market_news) {
        note(dawn, news);
    }

    // 1. inventory aging
    for (const auto& lot : inventory_.ageOneDay(day)) {
        analytics_.recordExpiredCards(lot.quantity, lot.totalCost());
        note(dawn, "Lost " + cardLabel(lot.quantity, lot.retailer, lot.denomination) + " cards worth " +
                   formatCents(lot.totalCost()) + " to expiration");
    }

    // 2. order expiry, 3. reputation penalty per missed order
    std::vector<CustomerOrder> expired = order_book_.expireOverdue(day);
    for (const auto& order : expired) {
        int delta = player_.reputation.onOrderExpired(order);
        note(dawn, "Order #" + std::to_string(order.id) + " from " + order.customer.name + " expired (" +
                   toString(order.priority) + " priority), reputation " + std::to_string(delta));
    }

    std::set<std::string> retailers;
    for (const auto& lot : inventory_.lots()) {
        retailers.insert(lot.retailer);
    }
    noteUnlocks(dawn, achievements_.recordDay(day, static_cast<uint32_t>(expired.size()),
                                              analytics_.ordersCompleted(), analytics_.ordersExpired(),
                                              conditions_.season(), conditions_.eventsEnded()));
    noteUnlocks(dawn, achievements_.recordCash(day, player_.cash));
    noteUnlocks(dawn, achievements_.recordInventory(day, inventory_.totalCards(),
                                                    static_cast<uint32_t>(retailers.size())));

    // 4. new orders
    generateOrders(day);
}

void SimulationEngine::generateOrders(uint32_t day) {
    GameTime dawn{day, 0};
    for (const auto& order : generator_.generateForDay(day, player_.reputation, market_, order_rng_)) {
        order_book_.insert(order);
        note(dawn, "New order #" + std::to_string(order.id) + ": " + order.customer.name + " wants " +
                   order.describeItems() + " for " + formatCents(order.offered_price) + " (" +
                   toString(order.priority) + " priority, due day " + std::to_string(order.deadline_day) + ")");
    }
}

std::shared_ptr<const Snapshot> SimulationEngine::commit() {
    checkInvariants();

    auto snapshot = std::make_shared<Snapshot>();
    snapshot->version = ++version_;
    snapshot->time = clock_.now();
    snapshot->paused = clock_.paused();
    snapshot->cash = player_.cash;
    snapshot->reputation = player_.reputation.points();
    snapshot->reputation_stars = player_.reputation.stars();

    // lots are in expiration order, so the first lot seen per pair is the soonest
    std::map<std::pair<std::string, uint32_t>, InventoryGroup> groups;
    for (const auto& lot : inventory_.lots()) {
        auto [it, inserted] = groups.try_emplace(std::make_pair(lot.retailer, lot.denomination));
        InventoryGroup& group = it->second;
        if (inserted) {
            group.retailer = lot.retailer;
            group.denomination = lot.denomination;
            group.soonest_expiration_day = lot.expiration_day;
            group.expiring_soon = lot.expiration_day <= snapshot->time.day + kExpiringSoonDays;
        }
        if (lot.expiration_day == group.soonest_expiration_day) {
            group.soonest_quantity += lot.quantity;
        }
        group.quantity += lot.quantity;
        group.total_cost += lot.totalCost();
        ++group.lot_count;
    }
    for (auto& [key, group] : groups) {
        snapshot->inventory.push_back(std::move(group));
    }

    snapshot->orders = order_book_.sortedByPriority();
    snapshot->activity.assign(activity_.records().begin(), activity_.records().end());

    for (const auto& entry : market_.entries()) {
        MarketQuote quote;
        quote.retailer = entry.retailer;
        quote.denomination = entry.denomination;
        quote.face_value = dollars(entry.denomination);
        quote.unit_price = market_.price(entry.retailer, entry.denomination, 1, player_.reputation.points()).value();
        quote.available = market_.isAvailable(entry.retailer, entry.denomination);
        snapshot->market.push_back(std::move(quote));
    }

    snapshot->season = conditions_.season();
    for (const auto& event : conditions_.activeEvents()) {
        snapshot->market_events.push_back(event.name);
    }
    snapshot->analytics = analytics_;
    snapshot->achievements = achievements_.achievements();
    snapshot->achievements_unlocked = achievements_.totalUnlocked();
    snapshot->achievement_rewards = achievements_.totalRewards();

    std::shared_ptr<const Snapshot> committed = std::move(snapshot);
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        latest_ = committed;
    }
    return committed;
}

void SimulationEngine::checkInvariants() const {
    if (player_.cash < 0) {
        throw std::logic_error("Invariant violated: negative cash");
    }
    for (const auto& lot : inventory_.lots()) {
        if (lot.quantity == 0 || lot.expiration_day <= lot.purchase_day) {
            throw std::logic_error("Invariant violated: bad inventory lot #" + std::to_string(lot.lot_id));
        }
    }
    for (const auto& [id, order] : order_book_.getOrders()) {
        if (order.state != OrderState::PENDING) {
            throw std::logic_error("Invariant violated: terminal order #" + std::to_string(id) + " still active");
        }
    }
}

void SimulationEngine::note(const GameTime& at, const std::string& message) {
    activity_.append(at, message);
    if (config_.verbose) {
        std::cout << "[Engine] " << at.toString() << " " << message << std::endl;
    }
}

void SimulationEngine::noteUnlocks(const GameTime& at, const std::vector<Achievement>& unlocked) {
    for (const auto& achievement : unlocked) {
        note(at, "Achievement Unlocked: " + achievement.name + " (bonus " + formatCents(achievement.reward) + ")");
    }
}

CommandResult SimulationEngine::reject(ErrorCode code, const std::string& message) {
    activity_.append(clock_.now(), "Failed: " + message);
    if (config_.verbose) {
        std::cerr << "[Engine] " << toString(code) << ": " << message << std::endl;
    }
    return CommandResult::failure(code, message);
}

}
