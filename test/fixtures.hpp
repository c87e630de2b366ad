// Pledge - shared test fixtures

#ifndef PLEDGE_TEST_FIXTURES_HPP
#define PLEDGE_TEST_FIXTURES_HPP

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif
#include <pledge/protocol.hpp>

#include <algorithm>
#include <vector>

namespace pledge {
namespace testing {

const Address OWNER = addresses::from_id(1);
const Address LENDER = addresses::from_id(100);
const Address LENDER2 = addresses::from_id(101);
const Address BORROWER = addresses::from_id(200);
const Address OTHER = addresses::from_id(201);
const Address KEEPER = addresses::from_id(300);
const Address KEEPER2 = addresses::from_id(301);
const Address ART = addresses::from_id(0xA000);
const Address GAMES = addresses::from_id(0xB000);

constexpr uint64_t THIRTY_DAYS = 30 * SECONDS_PER_DAY;

inline I128 units(int64_t v) { return x18::from_int(v); }

inline I128 dec(const char* text) {
    I128 value = 0;
    REQUIRE(x18::from_string(text, value));
    return value;
}

// Full protocol over in-memory primitives with ART listed at a floor of 10
struct Harness {
    ManualClock clock;
    InMemoryBalances balances;
    InMemoryCustody custody;
    Protocol protocol;
    std::vector<Event> events;

    explicit Harness(const Config& config = Config())
        : protocol(config, OWNER, balances, custody, clock) {
        protocol.set_event_callback([this](const Event& event) { events.push_back(event); });

        REQUIRE(oracle().set_asset_class_support(OWNER, ART, true) == errors::OK);
        REQUIRE(oracle().set_floor_price(OWNER, ART, units(10)) == errors::OK);
        REQUIRE(protocol.set_asset_allowed(OWNER, ART, true) == errors::OK);

        balances.credit(LENDER, units(1000000));
        balances.credit(LENDER2, units(1000000));
        balances.credit(BORROWER, units(100));
        balances.credit(KEEPER, units(1000));
        balances.credit(KEEPER2, units(1000));
        events.clear();
    }

    ValuationOracle& oracle() { return protocol.oracle(); }
    CollateralLedger& ledger() { return protocol.ledger(); }
    LiquidityPool& pool() { return protocol.pool(); }
    LiquidationController& liquidation() { return protocol.liquidation(); }

    AssetRef mint(uint64_t id, const Address& holder = BORROWER) {
        AssetRef asset{ART, id};
        REQUIRE(custody.mint(asset, holder) == errors::OK);
        return asset;
    }

    // Pool with 100,000 from LENDER
    void fund() {
        REQUIRE(pool().provide(LENDER, units(100000)).error_code == errors::OK);
    }

    // Deposit `asset` and borrow `amount` against it
    BorrowResult borrow(const AssetRef& asset, I128 amount, uint64_t duration = THIRTY_DAYS) {
        BorrowResult result = protocol.deposit_and_borrow(BORROWER, asset, amount, duration);
        REQUIRE(result.error_code == errors::OK);
        return result;
    }

    size_t count(EventKind kind) const {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
            [kind](const Event& event) { return event.kind == kind; }));
    }
};

} // namespace testing
} // namespace pledge

#endif // PLEDGE_TEST_FIXTURES_HPP
