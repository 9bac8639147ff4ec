#include <catch2/catch.hpp>

#include "engine/order_book.hpp"

#include <stdexcept>

using namespace core;
using namespace engine;

namespace {

CustomerOrder makeOrder(uint64_t id, std::vector<OrderItem> items, Cents offered, uint32_t deadline,
                        OrderPriority priority = OrderPriority::MEDIUM) {
    CustomerOrder order;
    order.id = id;
    order.customer.name = "Alice";
    order.items = std::move(items);
    order.offered_price = offered;
    order.priority = priority;
    order.deadline_day = deadline;
    order.created_day = 1;
    return order;
}

}

TEST_CASE("OrderBook - Insert and find orders", "[orderbook]") {
    OrderBook book;
    book.insert(makeOrder(1, {{"Starbucks", 10, 1}}, 1100, 5));

    REQUIRE(book.size() == 1);
    auto found = book.find(1);
    REQUIRE(found.has_value());
    REQUIRE(found->state == OrderState::PENDING);
    REQUIRE_FALSE(book.find(2).has_value());
}

TEST_CASE("OrderBook - Rejects reused ids and terminal orders", "[orderbook]") {
    OrderBook book;
    book.insert(makeOrder(1, {{"Starbucks", 10, 1}}, 1100, 5));

    REQUIRE_THROWS_AS(book.insert(makeOrder(1, {{"Amazon", 25, 1}}, 2700, 5)), std::invalid_argument);

    auto done = makeOrder(2, {{"Amazon", 25, 1}}, 2700, 5);
    done.state = OrderState::FULFILLED;
    REQUIRE_THROWS_AS(book.insert(done), std::invalid_argument);

    book.decline(1);
    REQUIRE_THROWS_AS(book.insert(makeOrder(1, {{"Starbucks", 10, 1}}, 1100, 5)), std::invalid_argument);
}

TEST_CASE("OrderBook - Used ids are kept as compact ranges", "[orderbook]") {
    OrderBook book;
    for (uint64_t id = 1000; id < 2000; ++id) {
        book.insert(makeOrder(id, {{"Starbucks", 10, 1}}, 1100, 5));
        book.decline(id);
    }
    REQUIRE(book.idRangeCount() == 1);
    REQUIRE(book.empty());
    REQUIRE_THROWS_AS(book.insert(makeOrder(1500, {{"Starbucks", 10, 1}}, 1100, 5)), std::invalid_argument);

    // out-of-order ids open new ranges and merge once the gap fills
    book.insert(makeOrder(2002, {{"Starbucks", 10, 1}}, 1100, 5));
    book.insert(makeOrder(1, {{"Starbucks", 10, 1}}, 1100, 5));
    REQUIRE(book.idRangeCount() == 3);
    book.insert(makeOrder(2000, {{"Starbucks", 10, 1}}, 1100, 5));
    book.insert(makeOrder(2001, {{"Starbucks", 10, 1}}, 1100, 5));
    REQUIRE(book.idRangeCount() == 2);

    REQUIRE_THROWS_AS(book.insert(makeOrder(2002, {{"Amazon", 25, 1}}, 2700, 5)), std::invalid_argument);
    REQUIRE_THROWS_AS(book.insert(makeOrder(1, {{"Amazon", 25, 1}}, 2700, 5)), std::invalid_argument);
    REQUIRE_NOTHROW(book.insert(makeOrder(999, {{"Amazon", 25, 1}}, 2700, 5)));
    REQUIRE(book.idRangeCount() == 2);
}

TEST_CASE("OrderBook - Overdue order expires and becomes unknown", "[orderbook]") {
    OrderBook book;
    Inventory inventory;
    Player player(100000, Reputation(300));
    inventory.addLot("Starbucks", 10, 5, 800, 1, 60);
    book.insert(makeOrder(7, {{"Starbucks", 10, 1}}, 1100, 5));

    REQUIRE(book.expireOverdue(5).empty());

    auto expired = book.expireOverdue(6);
    REQUIRE(expired.size() == 1);
    REQUIRE(expired[0].id == 7);
    REQUIRE(expired[0].state == OrderState::EXPIRED);
    REQUIRE(book.empty());
    REQUIRE(book.history().back().state == OrderState::EXPIRED);

    auto result = book.acceptAndFulfill(7, inventory, player, 6);
    REQUIRE(result.code == ErrorCode::UNKNOWN_ORDER);
    REQUIRE(player.cash == Cents{100000});
    REQUIRE(inventory.available("Starbucks", 10) == 5);
    REQUIRE_FALSE(book.decline(7).has_value());
}

TEST_CASE("OrderBook - Expired orders are returned by ascending id", "[orderbook]") {
    OrderBook book;
    book.insert(makeOrder(30, {{"Amazon", 25, 1}}, 2700, 2));
    book.insert(makeOrder(10, {{"Amazon", 25, 1}}, 2700, 3));
    book.insert(makeOrder(20, {{"Amazon", 25, 1}}, 2700, 9));

    auto expired = book.expireOverdue(4);

    REQUIRE(expired.size() == 2);
    REQUIRE(expired[0].id == 10);
    REQUIRE(expired[1].id == 30);
    REQUIRE(book.size() == 1);
}

TEST_CASE("OrderBook - Fulfillment pays out and consumes inventory", "[orderbook]") {
    OrderBook book;
    Inventory inventory;
    Player player(0, Reputation(300));
    inventory.addLot("Starbucks", 10, 2, 800, 1, 60);
    book.insert(makeOrder(1, {{"Starbucks", 10, 2}}, 2600, 5));

    auto result = book.acceptAndFulfill(1, inventory, player, 3);

    REQUIRE(result.ok());
    REQUIRE(result.order.state == OrderState::FULFILLED);
    REQUIRE(result.cost_basis == Cents{1600});
    REQUIRE(result.reputation_delta == 25);
    REQUIRE(player.cash == Cents{2600});
    REQUIRE(player.reputation.points() == 325);
    REQUIRE(inventory.empty());
    REQUIRE(book.empty());
}

TEST_CASE("OrderBook - Unfulfillable order changes nothing", "[orderbook]") {
    OrderBook book;
    Inventory inventory;
    Player player(5000, Reputation(300));
    inventory.addLot("Starbucks", 10, 1, 800, 1, 60);
    book.insert(makeOrder(1, {{"Starbucks", 10, 2}}, 2600, 5));

    REQUIRE_FALSE(book.canFulfill(1, inventory));
    auto result = book.acceptAndFulfill(1, inventory, player, 2);

    REQUIRE(result.code == ErrorCode::UNFULFILLABLE_ORDER);
    REQUIRE(player.cash == Cents{5000});
    REQUIRE(player.reputation.points() == 300);
    REQUIRE(inventory.available("Starbucks", 10) == 1);
    REQUIRE(book.find(1)->state == OrderState::PENDING);
}

TEST_CASE("OrderBook - Multi-item order fails atomically", "[orderbook]") {
    OrderBook book;
    Inventory inventory;
    Player player(0, Reputation(300));
    inventory.addLot("Starbucks", 10, 1, 800, 1, 60);
    book.insert(makeOrder(1, {{"Starbucks", 10, 1}, {"Amazon", 25, 1}}, 4000, 5));

    auto result = book.acceptAndFulfill(1, inventory, player, 2);

    REQUIRE(result.code == ErrorCode::UNFULFILLABLE_ORDER);
    REQUIRE(inventory.available("Starbucks", 10) == 1);
    REQUIRE(player.cash == 0);
}

TEST_CASE("OrderBook - Declining leaves reputation unchanged", "[orderbook]") {
    OrderBook book;
    book.insert(makeOrder(4, {{"Target", 50, 1}}, 5500, 5));

    auto declined = book.decline(4);

    REQUIRE(declined.has_value());
    REQUIRE(declined->state == OrderState::DECLINED);
    REQUIRE(book.empty());
}

TEST_CASE("OrderBook - Priority ordering", "[orderbook]") {
    OrderBook book;
    book.insert(makeOrder(1, {{"Amazon", 25, 1}}, 2700, 3, OrderPriority::LOW));
    book.insert(makeOrder(2, {{"Amazon", 25, 1}}, 2700, 6, OrderPriority::HIGH));
    book.insert(makeOrder(3, {{"Amazon", 25, 1}}, 2700, 4, OrderPriority::HIGH));
    book.insert(makeOrder(4, {{"Amazon", 25, 1}}, 2700, 2, OrderPriority::MEDIUM));

    auto sorted = book.sortedByPriority();

    REQUIRE(sorted.size() == 4);
    REQUIRE(sorted[0].id == 3);
    REQUIRE(sorted[1].id == 2);
    REQUIRE(sorted[2].id == 4);
    REQUIRE(sorted[3].id == 1);
}

TEST_CASE("OrderBook - Terminal callback fires once per order", "[orderbook]") {
    OrderBook book;
    std::vector<std::pair<uint64_t, OrderState>> seen;
    book.setTerminalCallback([&seen](const CustomerOrder& order) {
        seen.emplace_back(order.id, order.state);
    });

    book.insert(makeOrder(1, {{"Amazon", 25, 1}}, 2700, 2));
    book.insert(makeOrder(2, {{"Amazon", 25, 1}}, 2700, 9));

    book.expireOverdue(3);
    book.expireOverdue(4);
    book.decline(2);
    book.decline(2);

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0] == std::make_pair(uint64_t{1}, OrderState::EXPIRED));
    REQUIRE(seen[1] == std::make_pair(uint64_t{2}, OrderState::DECLINED));
}

TEST_CASE("OrderBook - History is bounded", "[orderbook]") {
    OrderBook book(2);
    for (uint64_t id = 1; id <= 4; ++id) {
        book.insert(makeOrder(id, {{"Amazon", 25, 1}}, 2700, 9));
        book.decline(id);
    }

    REQUIRE(book.history().size() == 2);
    REQUIRE(book.history().front().id == 3);
}
