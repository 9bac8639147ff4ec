#include <catch2/catch.hpp>

#include "engine/market.hpp"

using namespace core;
using namespace engine;

TEST_CASE("Market - Single card is quoted at the wholesale price", "[market]") {
    Market market;

    REQUIRE(market.carries("Starbucks", 10));
    REQUIRE(market.price("Starbucks", 10, 1) == Cents{800});
    REQUIRE(market.price("Amazon", 25, 1) == Cents{2000});
}

TEST_CASE("Market - Unknown retailer or denomination has no price", "[market]") {
    Market market;

    REQUIRE_FALSE(market.carries("Starbucks", 15));
    REQUIRE_FALSE(market.carries("Nowhere", 10));
    REQUIRE_FALSE(market.price("Nowhere", 10, 1).has_value());
    REQUIRE_FALSE(market.isAvailable("Nowhere", 10));
}

TEST_CASE("Market - Bulk tiers lower the unit price", "[market]") {
    Market market;

    REQUIRE(market.bulkDiscountBps(4) == 0);
    REQUIRE(market.bulkDiscountBps(5) == 200);
    REQUIRE(market.bulkDiscountBps(49) == 700);
    REQUIRE(market.bulkDiscountBps(500) == 1000);

    REQUIRE(market.price("Amazon", 25, 5) == Cents{1960});
    REQUIRE(market.price("Amazon", 25, 10) == Cents{1920});
    REQUIRE(market.price("Amazon", 25, 50) == Cents{1800});
}

TEST_CASE("Market - Unit price is non-increasing and respects the floor", "[market]") {
    Market market;

    for (const auto& entry : market.entries()) {
        Cents floor = applyBps(dollars(entry.denomination), market.config().floor_bps);
        Cents previous = *market.price(entry.retailer, entry.denomination, 1);
        for (uint32_t qty = 2; qty <= 120; ++qty) {
            Cents unit = *market.price(entry.retailer, entry.denomination, qty);
            REQUIRE(unit <= previous);
            REQUIRE(unit >= floor);
            previous = unit;
        }
    }
}

TEST_CASE("Market - Floor caps a deep price modifier", "[market]") {
    Market market;
    market.setPriceModifier("Amazon", 8000);

    REQUIRE(market.priceModifierBps("Amazon") == 8000);
    // 2000 * 0.8 = 1600 is below 70% of $25
    REQUIRE(market.price("Amazon", 25, 1) == Cents{1750});
    REQUIRE(market.price("Starbucks", 10, 1) == Cents{800});
}

TEST_CASE("Market - Reputation moves price within the band", "[market]") {
    Market market;

    REQUIRE(market.reputationAdjustmentBps(300) == 0);
    REQUIRE(market.reputationAdjustmentBps(500) == -500);
    REQUIRE(market.reputationAdjustmentBps(0) == 500);

    REQUIRE(market.price("Starbucks", 10, 1, 300) == Cents{800});
    REQUIRE(market.price("Starbucks", 10, 1, 500) == Cents{760});
    REQUIRE(market.price("Starbucks", 10, 1, 400) == Cents{780});
    REQUIRE(market.price("Starbucks", 10, 1, 0) == Cents{840});
}

TEST_CASE("Market - Availability can be toggled", "[market]") {
    Market market;
    size_t all = market.entries().size();

    REQUIRE(market.isAvailable("Target", 50));
    market.setAvailable("Target", 50, false);

    REQUIRE_FALSE(market.isAvailable("Target", 50));
    REQUIRE(market.carries("Target", 50));
    REQUIRE(market.availableEntries().size() == all - 1);
    REQUIRE(market.entries().size() == all);

    market.setAvailable("Target", 50, true);
    REQUIRE(market.isAvailable("Target", 50));
}

TEST_CASE("Market - Entries are sorted by retailer then denomination", "[market]") {
    Market market;
    auto entries = market.entries();

    REQUIRE_FALSE(entries.empty());
    REQUIRE(entries.front().retailer == "Amazon");
    REQUIRE(entries.front().denomination == 25);
    for (size_t i = 1; i < entries.size(); ++i) {
        bool ordered = entries[i - 1].retailer < entries[i].retailer ||
                       (entries[i - 1].retailer == entries[i].retailer &&
                        entries[i - 1].denomination < entries[i].denomination);
        REQUIRE(ordered);
    }
}
