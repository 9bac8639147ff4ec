/**
 * @file simulation_engine.hpp
 * @brief Tick-driven driver that owns the game state and commits snapshots.
 */

#pragma once

#include "core/activity_log.hpp"
#include "core/command.hpp"
#include "core/config.hpp"
#include "core/pcg32.hpp"
#include "engine/achievements.hpp"
#include "engine/analytics.hpp"
#include "engine/clock.hpp"
#include "engine/inventory.hpp"
#include "engine/market.hpp"
#include "engine/market_conditions.hpp"
#include "engine/order_book.hpp"
#include "engine/order_generator.hpp"
#include "engine/player.hpp"
#include "engine/snapshot.hpp"

#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>

namespace engine {

/**
 * @class SimulationEngine
 * @brief Single owner of all mutable game state.
 *
 * tick() and apply() run on the owning thread and are serialized against
 * each other. Any thread may submit() commands or read latest(); readers
 * only ever see fully committed snapshots.
 */
class SimulationEngine {
public:
    explicit SimulationEngine(const core::GameConfig& config,
                              MarketConfig market_config = MarketConfig::defaults());

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    /**
     * @brief Advances the game by one host-loop step.
     *
     * Drains queued commands first, then advances the clock and runs one
     * full daily pass for every day boundary crossed, in day order.
     *
     * @param elapsed Real time since the previous tick
     * @return The snapshot committed by this tick
     */
    std::shared_ptr<const Snapshot> tick(std::chrono::milliseconds elapsed);

    /**
     * @brief Queues a command for the next tick. Thread-safe.
     * @return Future resolved with the command's result when it is applied
     */
    std::future<core::CommandResult> submit(core::Command command);

    /**
     * @brief Applies a command immediately and commits a snapshot.
     *
     * Owning thread only; blocks while a tick is in progress.
     */
    core::CommandResult apply(const core::Command& command);

    /**
     * @brief Most recently committed snapshot. Thread-safe.
     */
    std::shared_ptr<const Snapshot> latest() const;

    // Read-only access to the owned state, for tests and serializers.
    const Clock& clock() const { return clock_; }
    const Market& market() const { return market_; }
    const MarketConditions& conditions() const { return conditions_; }
    const Inventory& inventory() const { return inventory_; }
    const OrderBook& orders() const { return order_book_; }
    const Player& player() const { return player_; }
    const BusinessAnalytics& analytics() const { return analytics_; }
    const AchievementTracker& achievements() const { return achievements_; }
    const core::ActivityLog& activityLog() const { return activity_; }
    const core::GameConfig& config() const { return config_; }

private:
    struct PendingCommand {
        core::Command command;
        std::promise<core::CommandResult> promise;
    };

    core::GameConfig config_;
    Clock clock_;
    Market market_;
    MarketConditions conditions_;
    Inventory inventory_;
    OrderBook order_book_;
    OrderGenerator generator_;
    Player player_;
    BusinessAnalytics analytics_;
    AchievementTracker achievements_;
    core::ActivityLog activity_;
    core::Pcg32 order_rng_;      // order generation stream
    core::Pcg32 purchase_rng_;   // purchase expiration stream
    uint64_t version_ = 0;

    std::mutex state_mutex_;                 // serializes tick() and apply()
    std::mutex queue_mutex_;
    std::deque<PendingCommand> queue_;
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const Snapshot> latest_;

    core::CommandResult execute(const core::Command& command);
    core::CommandResult purchase(const core::Purchase& cmd);
    core::CommandResult acceptOrder(const core::AcceptOrder& cmd);
    core::CommandResult declineOrder(const core::DeclineOrder& cmd);
    core::CommandResult liquidate(const core::Liquidate& cmd);
    core::CommandResult pause();
    core::CommandResult resume();

    /**
     * @brief One day boundary: market roll, aging, expiry, reputation, generation.
     */
    void runDailyPass(uint32_t day);

    void generateOrders(uint32_t day);

    std::shared_ptr<const Snapshot> commit();

    /**
     * @throws std::logic_error if a state invariant is broken
     */
    void checkInvariants() const;

    void note(const core::GameTime& at, const std::string& message);
    void noteUnlocks(const core::GameTime& at, const std::vector<Achievement>& unlocked);
    core::CommandResult reject(core::ErrorCode code, const std::string& message);

 #ifdef UNIT_TESTING
public:
    /**
     * @brief Places an order directly into the book for testing purposes.
     */
    void injectOrder(const core::CustomerOrder& order) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        order_book_.insert(order);
        commit();
    }

    /**
     * @brief Places a lot directly into inventory for testing purposes.
     */
    void injectLot(const std::string& retailer, uint32_t denomination, uint32_t quantity,
                   core::Cents unit_cost, uint32_t expiration_day) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        inventory_.addLot(retailer, denomination, quantity, unit_cost, clock_.now().day, expiration_day);
        commit();
    }
 #endif
};

}
