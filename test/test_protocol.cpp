// Pledge - Protocol Facade Tests

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif
#include "fixtures.hpp"

#include <string>

using namespace pledge;
using namespace pledge::testing;

TEST_CASE("Happy-path borrow", "[protocol]") {
    Harness h;
    h.fund();
    AssetRef asset = h.mint(1);

    BorrowResult result = h.protocol.deposit_and_borrow(BORROWER, asset, units(8), THIRTY_DAYS);
    REQUIRE(result.error_code == errors::OK);
    REQUIRE(result.position_id == 1);
    REQUIRE(result.loan_id == 1);
    REQUIRE(result.rate_x18 == x18::from_percent(5));

    REQUIRE(h.custody.holder_of(asset) == addresses::PLEDGE_LEDGER);
    REQUIRE(h.balances.balance_of(BORROWER) == units(108));
    REQUIRE(h.ledger().get_position(result.position_id)->bound_loan == result.loan_id);
    REQUIRE(h.count(EventKind::COLLATERAL_DEPOSITED) == 1);
    REQUIRE(h.count(EventKind::LOAN_ORIGINATED) == 1);

    ProtocolInfo info = h.protocol.protocol_info();
    REQUIRE(info.total_collateral_value_x18 == units(10));
    REQUIRE(info.total_loans_outstanding_x18 == units(8));
    REQUIRE(info.total_liquidity_x18 == units(100000));
    REQUIRE(info.total_reserves_x18 == 0);
    REQUIRE(info.active_positions == 1);
    REQUIRE(info.active_loans == 1);
}

TEST_CASE("Repay and reclaim collateral", "[protocol]") {
    Harness h;
    h.fund();
    AssetRef asset = h.mint(1);
    BorrowResult loan = h.borrow(asset, units(8));
    h.clock.advance(SECONDS_PER_DAY * 10);

    SECTION("Partial repayment keeps the collateral pledged") {
        RepayResult result = h.protocol.repay_and_withdraw(BORROWER, loan.loan_id, units(2));
        REQUIRE(result.error_code == errors::OK);
        REQUIRE_FALSE(result.closed);
        REQUIRE(h.custody.holder_of(asset) == addresses::PLEDGE_LEDGER);
        REQUIRE(h.count(EventKind::COLLATERAL_WITHDRAWN) == 0);
    }

    SECTION("Full repayment returns the asset") {
        I128 debt = h.pool().outstanding_debt(loan.loan_id);
        RepayResult result = h.protocol.repay_and_withdraw(BORROWER, loan.loan_id, debt);
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.closed);
        REQUIRE(result.applied_x18 == debt);

        REQUIRE(h.custody.holder_of(asset) == BORROWER);
        REQUIRE(h.pool().get_loan(loan.loan_id)->status == LoanStatus::REPAID);
        REQUIRE(h.ledger().get_position(loan.position_id)->status == PositionStatus::WITHDRAWN);
        REQUIRE(h.count(EventKind::LOAN_CLOSED) == 1);
        REQUIRE(h.count(EventKind::COLLATERAL_WITHDRAWN) == 1);

        // Asset can back a new loan
        REQUIRE(h.protocol.deposit_and_borrow(BORROWER, asset, units(4), THIRTY_DAYS).error_code ==
                errors::OK);
    }

    SECTION("Only the borrower") {
        REQUIRE(h.protocol.repay_and_withdraw(OTHER, loan.loan_id, units(2)).error_code ==
                errors::NOT_BORROWER);
    }
}

TEST_CASE("Asset allow-list", "[protocol]") {
    Harness h;
    h.fund();

    REQUIRE(h.oracle().set_asset_class_support(OWNER, GAMES, true) == errors::OK);
    REQUIRE(h.oracle().set_floor_price(OWNER, GAMES, units(10)) == errors::OK);
    AssetRef game{GAMES, 1};
    REQUIRE(h.custody.mint(game, BORROWER) == errors::OK);

    REQUIRE_FALSE(h.protocol.is_asset_allowed(GAMES));
    REQUIRE(h.protocol.deposit_and_borrow(BORROWER, game, units(5), THIRTY_DAYS).error_code ==
            errors::ASSET_NOT_ALLOWED);
    REQUIRE(h.custody.holder_of(game) == BORROWER);

    REQUIRE(h.protocol.set_asset_allowed(BORROWER, GAMES, true) == errors::UNAUTHORIZED);
    REQUIRE(h.protocol.set_asset_allowed(OWNER, Address{}, true) == errors::INVALID_PARAMETER);
    REQUIRE(h.protocol.set_asset_allowed(OWNER, GAMES, true) == errors::OK);
    REQUIRE(h.count(EventKind::ASSET_ALLOWED) == 1);
    REQUIRE(h.protocol.deposit_and_borrow(BORROWER, game, units(5), THIRTY_DAYS).error_code == errors::OK);

    REQUIRE(h.protocol.set_asset_allowed(OWNER, GAMES, false) == errors::OK);
    REQUIRE_FALSE(h.protocol.is_asset_allowed(GAMES));
}

TEST_CASE("Combined borrow is all-or-nothing", "[protocol]") {
    Harness h;
    AssetRef asset = h.mint(1);

    SECTION("Empty pool unwinds the deposit") {
        BorrowResult result = h.protocol.deposit_and_borrow(BORROWER, asset, units(8), THIRTY_DAYS);
        REQUIRE(result.error_code == errors::INSUFFICIENT_LIQUIDITY);
        REQUIRE(result.position_id == 0);
    }

    SECTION("Invalid duration unwinds the deposit") {
        h.fund();
        h.events.clear();
        BorrowResult result = h.protocol.deposit_and_borrow(BORROWER, asset, units(8), 0);
        REQUIRE(result.error_code == errors::INVALID_DURATION);
    }

    REQUIRE(h.custody.holder_of(asset) == BORROWER);
    REQUIRE(h.protocol.user_positions(BORROWER).empty());
    REQUIRE_FALSE(h.ledger().active_position_for(asset).has_value());
    REQUIRE(h.protocol.user_loans(BORROWER).empty());
    REQUIRE(h.count(EventKind::COLLATERAL_DEPOSITED) == 0);
    REQUIRE(h.balances.balance_of(BORROWER) == units(100));
}

TEST_CASE("Refused compensation is reported", "[protocol]") {
    Harness h;
    AssetRef asset = h.mint(1);

    // Once the ledger takes custody, the asset is moved on behind its back
    h.custody.set_transfer_hook([&](const AssetRef& moved, const Address& from, const Address&) {
        if (moved == asset && from == BORROWER) {
            REQUIRE(h.custody.transfer(asset, h.ledger().address(), OTHER));
        }
    });

    // Empty pool: originate fails and the deposit cannot be handed back
    BorrowResult result = h.protocol.deposit_and_borrow(BORROWER, asset, units(8), THIRTY_DAYS);
    REQUIRE(result.error_code == errors::ROLLBACK_INCOMPLETE);
    REQUIRE(errors::category(result.error_code) == errors::Category::HOST);
    REQUIRE(result.position_id == 0);

    // Bookkeeping is still unwound
    REQUIRE(h.custody.holder_of(asset) == OTHER);
    REQUIRE_FALSE(h.ledger().active_position_for(asset).has_value());
    REQUIRE(h.protocol.user_positions(BORROWER).empty());
    REQUIRE(h.count(EventKind::COLLATERAL_DEPOSITED) == 0);
}

TEST_CASE("Role changes are announced", "[protocol]") {
    Harness h;

    REQUIRE(h.protocol.roles().grant(KEEPER, Role::PRICE_UPDATER, KEEPER) == errors::UNAUTHORIZED);
    REQUIRE(h.protocol.roles().grant(OWNER, Role::PRICE_UPDATER, Address{}) == errors::INVALID_PARAMETER);
    REQUIRE(h.events.empty());

    REQUIRE(h.protocol.roles().grant(OWNER, Role::PRICE_UPDATER, KEEPER) == errors::OK);
    REQUIRE(h.count(EventKind::ROLE_GRANTED) == 1);
    REQUIRE(h.events.back().subject_id == static_cast<uint64_t>(Role::PRICE_UPDATER));
    REQUIRE(h.events.back().party == KEEPER);
    REQUIRE(h.events.back().timestamp == h.clock.now());
    REQUIRE(h.oracle().set_floor_price(KEEPER, ART, units(12)) == errors::OK);

    // Granting a held role is silent
    REQUIRE(h.protocol.roles().grant(OWNER, Role::PRICE_UPDATER, KEEPER) == errors::OK);
    REQUIRE(h.count(EventKind::ROLE_GRANTED) == 1);

    REQUIRE(h.protocol.roles().revoke(OWNER, Role::PRICE_UPDATER, KEEPER) == errors::OK);
    REQUIRE(h.count(EventKind::ROLE_REVOKED) == 1);
    REQUIRE(h.events.back().party == KEEPER);
    REQUIRE(h.oracle().set_floor_price(KEEPER, ART, units(11)) == errors::UNAUTHORIZED);

    // The owner's implicit roles are not grants and cannot be revoked
    REQUIRE(h.protocol.roles().revoke(OWNER, Role::PRICE_UPDATER, OWNER) == errors::OK);
    REQUIRE(h.count(EventKind::ROLE_REVOKED) == 1);
    REQUIRE(h.oracle().set_floor_price(OWNER, ART, units(11)) == errors::OK);
}

TEST_CASE("User listings", "[protocol]") {
    Harness h;
    h.fund();
    h.borrow(h.mint(1), units(3));
    h.borrow(h.mint(2), units(4));
    REQUIRE(h.ledger().deposit(BORROWER, h.mint(3), units(1)).error_code == errors::OK);

    REQUIRE(h.protocol.user_positions(BORROWER).size() == 3);
    REQUIRE(h.protocol.user_loans(BORROWER).size() == 2);
    REQUIRE(h.protocol.user_positions(OTHER).empty());

    auto stats = h.protocol.get_stats();
    REQUIRE(stats.ledger_stats.active_positions == 3);
    REQUIRE(stats.pool_stats.total_originated_x18 == units(7));
    REQUIRE(stats.liquidation_stats.triggered == 0);
}

TEST_CASE("Protocol construction", "[protocol]") {
    ManualClock clock;
    InMemoryBalances balances;
    InMemoryCustody custody;

    SECTION("Component roles are wired") {
        Protocol protocol(Config(), OWNER, balances, custody, clock);
        REQUIRE(protocol.roles().is_authorized(addresses::PLEDGE_POOL, Role::LOAN_BOOK));
        REQUIRE(protocol.roles().is_authorized(addresses::PLEDGE_LIQUIDATION, Role::LIQUIDATOR));
        REQUIRE(protocol.ledger().address() == addresses::PLEDGE_LEDGER);
        REQUIRE(protocol.pool().address() == addresses::PLEDGE_POOL);
        REQUIRE(protocol.liquidation().address() == addresses::PLEDGE_LIQUIDATION);
    }

    SECTION("Zero owner rejected") {
        REQUIRE_THROWS_AS(Protocol(Config(), Address{}, balances, custody, clock), ConfigError);
    }

    SECTION("Invalid configuration rejected") {
        Config config;
        config.set_max_ltv(X18_ONE + 1);
        REQUIRE_THROWS_AS(Protocol(config, OWNER, balances, custody, clock), ConfigError);
    }

    SECTION("Component table") {
        auto components = Protocol::components();
        REQUIRE(components.size() == 3);
        REQUIRE(components[0].address == addresses::PLEDGE_LEDGER);
        REQUIRE(std::string(Protocol::version()) == "1.0.0");
    }
}
