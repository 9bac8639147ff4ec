#define UNIT_TESTING
#include <catch2/catch.hpp>

#include "engine/achievements.hpp"
#include "engine/simulation_engine.hpp"
#include "io/snapshot_json.hpp"

using namespace core;
using namespace engine;

namespace {

bool contains(const std::vector<Achievement>& unlocked, AchievementType type) {
    for (const auto& a : unlocked) {
        if (a.type == type) return true;
    }
    return false;
}

}

TEST_CASE("AchievementTracker - Catalog starts locked", "[achievements]") {
    AchievementTracker tracker;

    REQUIRE(tracker.achievements().size() == 17);
    for (const auto& a : tracker.achievements()) {
        REQUIRE_FALSE(a.unlocked);
        REQUIRE(a.progress == 0);
        REQUIRE(a.target > 0);
    }
    REQUIRE(tracker.totalUnlocked() == 0);
    REQUIRE(tracker.totalRewards() == 0);
}

TEST_CASE("AchievementTracker - First sale unlocks exactly once", "[achievements]") {
    AchievementTracker tracker;

    auto first = tracker.recordOrderCompletion(3, 1, 3, 500, Season::SPRING);
    REQUIRE(contains(first, AchievementType::FIRST_SALE));
    REQUIRE(tracker.get(AchievementType::FIRST_SALE).unlock_day == 3);
    REQUIRE(tracker.totalRewards() == dollars(100));

    auto second = tracker.recordOrderCompletion(3, 2, 3, 500, Season::SPRING);
    REQUIRE_FALSE(contains(second, AchievementType::FIRST_SALE));
    REQUIRE(tracker.totalUnlocked() == 1);
}

TEST_CASE("AchievementTracker - Cash milestones follow the balance", "[achievements]") {
    AchievementTracker tracker;

    REQUIRE(tracker.recordCash(1, dollars(9999)).empty());
    REQUIRE(tracker.get(AchievementType::ENTREPRENEUR).progress == static_cast<uint64_t>(dollars(9999)));

    auto unlocked = tracker.recordCash(2, dollars(60000));
    REQUIRE(unlocked.size() == 2);
    REQUIRE(unlocked[0].type == AchievementType::ENTREPRENEUR);
    REQUIRE(unlocked[1].type == AchievementType::BUSINESS_MOGUL);
    REQUIRE_FALSE(tracker.get(AchievementType::MILLIONAIRE).unlocked);

    // a later drop in cash does not lower progress
    tracker.recordCash(3, 0);
    REQUIRE(tracker.get(AchievementType::MILLIONAIRE).progress == static_cast<uint64_t>(dollars(60000)));
}

TEST_CASE("AchievementTracker - Speed demon counts orders within one day", "[achievements]") {
    AchievementTracker tracker;

    for (uint32_t n = 1; n <= 4; ++n) {
        tracker.recordOrderCompletion(1, n, 3, 100, Season::SPRING);
    }
    REQUIRE(tracker.ordersToday() == 4);

    tracker.recordDay(2, 0, 4, 0, Season::SPRING, 0);
    REQUIRE(tracker.ordersToday() == 0);

    for (uint32_t n = 5; n <= 8; ++n) {
        tracker.recordOrderCompletion(2, n, 3, 100, Season::SPRING);
    }
    REQUIRE_FALSE(tracker.get(AchievementType::SPEED_DEMON).unlocked);

    auto unlocked = tracker.recordOrderCompletion(2, 9, 3, 100, Season::SPRING);
    REQUIRE(contains(unlocked, AchievementType::SPEED_DEMON));
}

TEST_CASE("AchievementTracker - Perfect week needs seven clean days in a row", "[achievements]") {
    AchievementTracker tracker;
    uint32_t completed = 0;

    for (uint32_t day = 1; day <= 6; ++day) {
        tracker.recordOrderCompletion(day, ++completed, 3, 100, Season::SPRING);
        tracker.recordDay(day + 1, 0, completed, 0, Season::SPRING, 0);
    }
    REQUIRE(tracker.perfectDayStreak() == 6);

    // an expired order breaks the streak
    tracker.recordOrderCompletion(7, ++completed, 3, 100, Season::SPRING);
    tracker.recordDay(8, 1, completed, 1, Season::SPRING, 0);
    REQUIRE(tracker.perfectDayStreak() == 0);
    REQUIRE_FALSE(tracker.get(AchievementType::PERFECT_WEEK).unlocked);

    std::vector<Achievement> unlocked;
    for (uint32_t day = 8; day <= 14; ++day) {
        tracker.recordOrderCompletion(day, ++completed, 3, 100, Season::SPRING);
        unlocked = tracker.recordDay(day + 1, 0, completed, 1, Season::SPRING, 0);
    }
    REQUIRE(contains(unlocked, AchievementType::PERFECT_WEEK));
    REQUIRE(tracker.get(AchievementType::PERFECT_WEEK).unlock_day == 15);
}

TEST_CASE("AchievementTracker - Idle days are not perfect", "[achievements]") {
    AchievementTracker tracker;

    tracker.recordDay(2, 0, 0, 0, Season::SPRING, 0);
    REQUIRE(tracker.perfectDayStreak() == 0);
    REQUIRE(tracker.efficientDayStreak() == 0);
}

TEST_CASE("AchievementTracker - Efficiency tracks the lifetime success rate", "[achievements]") {
    AchievementTracker tracker;

    tracker.recordDay(2, 0, 9, 1, Season::SPRING, 0);
    REQUIRE(tracker.efficientDayStreak() == 1);

    tracker.recordDay(3, 0, 9, 2, Season::SPRING, 0);
    REQUIRE(tracker.efficientDayStreak() == 0);
}

TEST_CASE("AchievementTracker - Favorable purchases count toward market master", "[achievements]") {
    AchievementTracker tracker;

    REQUIRE(tracker.recordPurchase(1, 10000).empty());
    REQUIRE(tracker.recordPurchase(1, 9500).empty());
    for (int i = 0; i < 4; ++i) {
        REQUIRE(tracker.recordPurchase(1, AchievementTracker::kFavorablePriceBps).empty());
    }
    auto unlocked = tracker.recordPurchase(2, 8000);
    REQUIRE(contains(unlocked, AchievementType::MARKET_MASTER));
}

TEST_CASE("AchievementTracker - Winter profit resets each winter", "[achievements]") {
    AchievementTracker tracker;

    tracker.recordDay(2, 0, 0, 0, Season::WINTER, 0);
    tracker.recordOrderCompletion(2, 1, 3, dollars(3000), Season::WINTER);
    tracker.recordOrderCompletion(2, 2, 3, dollars(500), Season::SPRING);
    REQUIRE(tracker.winterProfit() == dollars(3000));

    tracker.recordDay(3, 0, 2, 0, Season::SPRING, 0);
    tracker.recordDay(4, 0, 2, 0, Season::WINTER, 0);
    REQUIRE(tracker.winterProfit() == 0);

    tracker.recordOrderCompletion(4, 3, 3, dollars(4000), Season::WINTER);
    REQUIRE_FALSE(tracker.get(AchievementType::WINTER_WINNER).unlocked);
    auto unlocked = tracker.recordOrderCompletion(4, 4, 3, dollars(1000), Season::WINTER);
    REQUIRE(contains(unlocked, AchievementType::WINTER_WINNER));
}

TEST_CASE("AchievementTracker - Seasons, events and holdings", "[achievements]") {
    AchievementTracker tracker;

    tracker.recordDay(2, 0, 0, 0, Season::SPRING, 0);
    tracker.recordDay(3, 0, 0, 0, Season::SUMMER, 4);
    tracker.recordDay(4, 0, 0, 0, Season::SUMMER, 9);
    REQUIRE_FALSE(tracker.get(AchievementType::SEASON_VETERAN).unlocked);
    tracker.recordDay(5, 0, 0, 0, Season::FALL, 9);

    auto unlocked = tracker.recordDay(6, 0, 0, 0, Season::WINTER, 10);
    REQUIRE(contains(unlocked, AchievementType::SEASON_VETERAN));
    REQUIRE(contains(unlocked, AchievementType::EVENT_SURVIVOR));

    REQUIRE(tracker.recordInventory(6, 99, 4).empty());
    unlocked = tracker.recordInventory(7, 100, 5);
    REQUIRE(unlocked.size() == 2);
    REQUIRE(tracker.get(AchievementType::LEGENDARY_STATUS).progress == 0);
}

TEST_CASE("AchievementTracker - Five stars unlock legendary status", "[achievements]") {
    AchievementTracker tracker;

    REQUIRE_FALSE(contains(tracker.recordOrderCompletion(1, 1, 4, 0, Season::SPRING),
                           AchievementType::LEGENDARY_STATUS));
    REQUIRE(contains(tracker.recordOrderCompletion(1, 2, 5, 0, Season::SPRING),
                     AchievementType::LEGENDARY_STATUS));
}

TEST_CASE("SimulationEngine - First completed order logs its achievement", "[achievements]") {
    GameConfig config;
    config.seed = 7;
    config.activity_log_capacity = 1000;
    SimulationEngine engine(config);

    CustomerOrder order;
    order.id = 1;
    order.customer.name = "Test Customer";
    order.items = {{"Starbucks", 10, 2}};
    order.offered_price = 2600;
    order.deadline_day = 5;
    order.created_day = 1;
    engine.injectOrder(order);

    REQUIRE(engine.apply(Purchase{"Starbucks", 10, 2}).ok());
    REQUIRE(engine.apply(AcceptOrder{1}).ok());

    // the bonus is reported, not paid
    REQUIRE(engine.player().cash == Cents{500000 - 1600 + 2600});
    REQUIRE(engine.achievements().get(AchievementType::FIRST_SALE).unlocked);

    bool logged = false;
    for (const auto& record : engine.activityLog().records()) {
        if (record.message.rfind("Achievement Unlocked: First Sale", 0) == 0) logged = true;
    }
    REQUIRE(logged);

    auto snapshot = engine.latest();
    REQUIRE(snapshot->achievements_unlocked == 1);
    REQUIRE(snapshot->achievement_rewards == dollars(100));

    auto doc = io::toJson(*snapshot);
    REQUIRE(doc["achievements"].size() == 17);
    REQUIRE(doc["achievements"][0]["name"] == "First Sale");
    REQUIRE(doc["achievements"][0]["unlocked"] == true);
    REQUIRE(doc["achievements"][0]["unlock_day"] == 1);
    REQUIRE(doc["achievements_unlocked"] == 1);
}
