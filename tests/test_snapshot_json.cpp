#define UNIT_TESTING
#include <catch2/catch.hpp>

#include "engine/simulation_engine.hpp"
#include "io/snapshot_json.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace core;
using namespace engine;
using json = nlohmann::json;

TEST_CASE("SnapshotJson - Order fields are exported", "[json]") {
    CustomerOrder order;
    order.id = 1005;
    order.customer.name = "Grace";
    order.items = {{"Amazon", 25, 2}, {"iTunes", 15, 1}};
    order.offered_price = 7000;
    order.priority = OrderPriority::HIGH;
    order.deadline_day = 8;
    order.created_day = 4;

    json doc = io::toJson(order);

    REQUIRE(doc["id"] == 1005);
    REQUIRE(doc["customer"] == "Grace");
    REQUIRE(doc["items"].size() == 2);
    REQUIRE(doc["items"][1]["retailer"] == "iTunes");
    REQUIRE(doc["offered_price"] == 7000);
    REQUIRE(doc["priority"] == toString(OrderPriority::HIGH));
    REQUIRE(doc["state"] == toString(OrderState::PENDING));
}

TEST_CASE("SnapshotJson - Snapshot mirrors engine state", "[json]") {
    GameConfig config;
    SimulationEngine engine(config);
    REQUIRE(engine.apply(Purchase{"Starbucks", 10, 3}).ok());
    engine.injectOrder(CustomerOrder{1, {"Bob"}, {{"Starbucks", 10, 1}}, 1200, OrderPriority::LOW, 3, 1,
                                     OrderState::PENDING});

    auto snapshot = engine.latest();
    json doc = io::toJson(*snapshot);

    REQUIRE(doc["day"] == 1);
    REQUIRE(doc["cash"] == snapshot->cash);
    REQUIRE(doc["reputation"] == 300);
    REQUIRE(doc["season"] == "Spring");
    REQUIRE(doc["orders"].size() == snapshot->orders.size());
    REQUIRE(doc["inventory"].size() == 1);
    REQUIRE(doc["inventory"][0]["quantity"] == 3);
    REQUIRE(doc["inventory"][0]["total_cost"] == 2400);
    REQUIRE(doc["market"].size() == engine.market().entries().size());
    REQUIRE(doc["analytics"]["total_purchases"] == 2400);
}

TEST_CASE("SnapshotJson - Export writes readable files", "[json]") {
    GameConfig config;
    SimulationEngine engine(config);
    auto dir = std::filesystem::temp_directory_path();
    auto state_path = dir / "cardbroker_state_test.json";
    auto summary_path = dir / "cardbroker_summary_test.json";

    io::exportSnapshot(*engine.latest(), state_path.string());
    io::exportSummary(*engine.latest(), summary_path.string());

    std::ifstream state_in(state_path);
    json state = json::parse(state_in);
    std::ifstream summary_in(summary_path);
    json summary = json::parse(summary_in);
    state_in.close();
    summary_in.close();
    std::filesystem::remove(state_path);
    std::filesystem::remove(summary_path);

    REQUIRE(state == io::toJson(*engine.latest()));
    REQUIRE(summary["cash_display"] == "$5,000.00");
    REQUIRE(summary["day"] == 1);
}

TEST_CASE("SnapshotJson - Unwritable path throws", "[json]") {
    GameConfig config;
    SimulationEngine engine(config);

    REQUIRE_THROWS_AS(io::exportSummary(*engine.latest(), "/nonexistent_dir/summary.json"), std::runtime_error);
}
