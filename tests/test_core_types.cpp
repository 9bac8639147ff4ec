#include <catch2/catch.hpp>

#include "core/command.hpp"
#include "core/customer_order.hpp"
#include "core/game_time.hpp"
#include "core/money.hpp"
#include "core/pcg32.hpp"

using namespace core;

TEST_CASE("Money - Basis point rounding and formatting", "[money]") {
    REQUIRE(applyBps(800, 9800) == 784);
    REQUIRE(applyBps(1, 5000) == 1);
    REQUIRE(applyBps(1, 4999) == 0);
    REQUIRE(dollars(25) == 2500);

    REQUIRE(formatCents(499200) == "$4,992.00");
    REQUIRE(formatCents(5) == "$0.05");
    REQUIRE(formatCents(123456789) == "$1,234,567.89");
    REQUIRE(formatCents(-1600) == "-$16.00");
}

TEST_CASE("GameTime - Formatting and ordering", "[clock]") {
    GameTime morning{3, 9 * 60 + 20};
    GameTime evening{3, 20 * 60};

    REQUIRE(morning.toString() == "Day 3 09:20");
    REQUIRE(morning.hour() == 9);
    REQUIRE(morning.minute() == 20);
    REQUIRE(morning < evening);
    REQUIRE(evening < GameTime{4, 0});
    REQUIRE(morning != evening);
    REQUIRE(GameTime{2, 0}.absoluteMinutes() == kMinutesPerDay);
}

TEST_CASE("Pcg32 - Matches the reference sequence", "[rng]") {
    Pcg32 rng(42u, 54u);

    REQUIRE(rng.next() == 0xa15c02b7u);
    REQUIRE(rng.next() == 0x7b47f409u);
    REQUIRE(rng.next() == 0xba1d3330u);
    REQUIRE(rng.next() == 0x83d2f293u);
}

TEST_CASE("Pcg32 - Streams are independent and bounded", "[rng]") {
    Pcg32 orders(7, 1);
    Pcg32 purchases(7, 2);
    REQUIRE(orders.next() != purchases.next());

    Pcg32 rng(99, 1);
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(rng.uniform(10) < 10);
        uint32_t value = rng.range(30, 90);
        REQUIRE(value >= 30);
        REQUIRE(value <= 90);
    }
    REQUIRE(rng.uniform(0) == 0);
    REQUIRE(rng.range(5, 5) == 5);
    REQUIRE(rng.range(9, 3) == 9);
}

TEST_CASE("CustomerOrder - Face value and description", "[orderbook]") {
    CustomerOrder order;
    order.items = {{"Amazon", 25, 2}, {"iTunes", 15, 1}};

    REQUIRE(order.faceValue() == dollars(65));
    REQUIRE(order.cardCount() == 3);
    REQUIRE(order.describeItems() == "2x Amazon $25, 1x iTunes $15");
    REQUIRE_FALSE(order.isTerminal());

    order.state = OrderState::EXPIRED;
    REQUIRE(order.isTerminal());
}

TEST_CASE("Command - Descriptions and error names", "[engine]") {
    REQUIRE(describe(Purchase{"Starbucks", 10, 1}) == "Purchase 1x Starbucks $10");
    REQUIRE(describe(AcceptOrder{1004}) == "AcceptOrder #1004");
    REQUIRE(describe(Pause{}) == "Pause");
    REQUIRE(std::string(toString(ErrorCode::INSUFFICIENT_FUNDS)) == "InsufficientFunds");
    REQUIRE(std::string(toString(ErrorCode::UNFULFILLABLE_ORDER)) == "UnfulfillableOrder");

    auto failed = CommandResult::failure(ErrorCode::UNKNOWN_ORDER, "gone");
    REQUIRE_FALSE(failed.ok());
    REQUIRE(CommandResult::success("done").ok());
}
