// Pledge - Liquidation Controller Tests

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif
#include "fixtures.hpp"

using namespace pledge;
using namespace pledge::testing;

namespace {

// Funded pool, 8 borrowed against ART #1, floor dropped to 3 a day later
struct DistressedLoan {
    Harness h;
    AssetRef asset;
    BorrowResult loan;

    DistressedLoan() {
        h.fund();
        asset = h.mint(1);
        loan = h.borrow(asset, units(8));
        REQUIRE(h.oracle().set_floor_price(OWNER, ART, units(3)) == errors::OK);
        h.clock.advance(SECONDS_PER_DAY);
        h.events.clear();
    }
};

} // namespace

TEST_CASE("Liquidation after a price drop", "[liquidation]") {
    DistressedLoan d;
    Harness& h = d.h;
    const uint64_t position = d.loan.position_id;

    REQUIRE(h.liquidation().is_eligible(position));

    LiquidationResult triggered = h.liquidation().trigger(KEEPER, position);
    REQUIRE(triggered.error_code == errors::OK);
    REQUIRE(triggered.loan_id == d.loan.loan_id);
    REQUIRE(triggered.value_x18 == units(3));
    REQUIRE(triggered.bonus_x18 == dec("0.15"));
    REQUIRE(triggered.debt_x18 == h.pool().outstanding_debt(d.loan.loan_id));
    REQUIRE(h.liquidation().is_pending(position));
    REQUIRE(h.count(EventKind::LIQUIDATION_TRIGGERED) == 1);

    REQUIRE(h.liquidation().execute(KEEPER, position).error_code == errors::DELAY_NOT_ELAPSED);
    REQUIRE(h.liquidation().remaining_delay(position) == SECONDS_PER_HOUR);

    h.clock.advance(h.liquidation().remaining_delay(position));
    I128 debt = h.pool().outstanding_debt(d.loan.loan_id);
    I128 pool_balance = h.balances.balance_of(h.pool().address());

    LiquidationResult executed = h.liquidation().execute(KEEPER, position);
    REQUIRE(executed.error_code == errors::OK);
    REQUIRE(executed.debt_x18 == debt);
    REQUIRE(executed.bonus_x18 == dec("0.15"));

    SECTION("Custody moves to the liquidator") {
        REQUIRE(h.custody.holder_of(d.asset) == KEEPER);
        REQUIRE(h.ledger().get_position(position)->status == PositionStatus::LIQUIDATED);
        REQUIRE_FALSE(h.ledger().active_position_for(d.asset).has_value());
    }

    SECTION("Pool is made whole") {
        REQUIRE(h.pool().get_loan(d.loan.loan_id)->status == LoanStatus::LIQUIDATED);
        REQUIRE(h.pool().state().total_borrowed_x18 == 0);
        REQUIRE(h.balances.balance_of(h.pool().address()) == pool_balance + debt);
    }

    SECTION("Liquidator pays the debt and keeps the bonus") {
        REQUIRE(h.balances.balance_of(KEEPER) == units(1000) - debt);
        REQUIRE(h.balances.balance_of(h.liquidation().address()) == 0);
    }

    SECTION("Record and events") {
        auto record = h.liquidation().get_record(position);
        REQUIRE(record->status == LiquidationStatus::EXECUTED);
        REQUIRE(record->executor == KEEPER);
        REQUIRE(record->execution_time == h.clock.now());
        REQUIRE_FALSE(h.liquidation().is_pending(position));

        REQUIRE(h.count(EventKind::LOAN_LIQUIDATED) == 1);
        REQUIRE(h.count(EventKind::COLLATERAL_SEIZED) == 1);
        REQUIRE(h.count(EventKind::LIQUIDATION_EXECUTED) == 1);

        auto stats = h.liquidation().get_stats();
        REQUIRE(stats.triggered == 1);
        REQUIRE(stats.executed == 1);
        REQUIRE(stats.pending == 0);
        REQUIRE(stats.total_debt_settled_x18 == debt);
        REQUIRE(stats.total_bonus_paid_x18 == dec("0.15"));
    }

    SECTION("Executed is final") {
        REQUIRE(h.liquidation().trigger(KEEPER2, position).error_code == errors::ALREADY_LIQUIDATED);
        REQUIRE(h.liquidation().execute(KEEPER2, position).error_code == errors::ALREADY_LIQUIDATED);
        REQUIRE(h.liquidation().cancel_stale(position) == errors::ALREADY_LIQUIDATED);
        h.clock.advance(SECONDS_PER_YEAR);
        REQUIRE(h.liquidation().execute(KEEPER2, position).error_code == errors::ALREADY_LIQUIDATED);
    }
}

TEST_CASE("Delay boundary", "[liquidation]") {
    DistressedLoan d;
    Harness& h = d.h;
    const uint64_t position = d.loan.position_id;

    REQUIRE(h.liquidation().trigger(KEEPER, position).error_code == errors::OK);

    h.clock.advance(SECONDS_PER_HOUR - 1);
    REQUIRE(h.liquidation().remaining_delay(position) == 1);
    REQUIRE(h.liquidation().execute(KEEPER, position).error_code == errors::DELAY_NOT_ELAPSED);

    SECTION("Exactly at the delay") {
        h.clock.advance(1);
        REQUIRE(h.liquidation().remaining_delay(position) == 0);
        REQUIRE(h.liquidation().execute(KEEPER2, position).error_code == errors::OK);
        REQUIRE(h.custody.holder_of(d.asset) == KEEPER2);
    }

    SECTION("Re-trigger refreshes the snapshot but not the clock") {
        const uint64_t first_trigger = h.liquidation().get_record(position)->trigger_time;
        REQUIRE(h.oracle().set_floor_price(OWNER, ART, units(2)) == errors::OK);

        LiquidationResult refreshed = h.liquidation().trigger(BORROWER, position);
        REQUIRE(refreshed.error_code == errors::OK);
        REQUIRE(refreshed.value_x18 == units(2));

        auto record = h.liquidation().get_record(position);
        REQUIRE(record->trigger_time == first_trigger);
        REQUIRE(record->value_x18 == units(2));
        REQUIRE(record->bonus_x18 == dec("0.1"));
        REQUIRE(h.liquidation().remaining_delay(position) == 1);
        REQUIRE(h.liquidation().get_stats().triggered == 2);
        REQUIRE(h.liquidation().get_stats().pending == 1);

        h.clock.advance(1);
        LiquidationResult executed = h.liquidation().execute(KEEPER, position);
        REQUIRE(executed.error_code == errors::OK);
        REQUIRE(executed.bonus_x18 == dec("0.1"));
    }
}

TEST_CASE("Repeated triggers cannot postpone execution", "[liquidation]") {
    DistressedLoan d;
    Harness& h = d.h;
    const uint64_t position = d.loan.position_id;

    REQUIRE(h.liquidation().trigger(KEEPER, position).error_code == errors::OK);

    const uint64_t first_trigger = h.clock.now();

    // Borrower re-triggers one second before every deadline
    int rounds = 0;
    bool executed = false;
    while (rounds < 48 && !executed) {
        ++rounds;
        h.clock.advance(SECONDS_PER_HOUR - 1);
        REQUIRE(h.liquidation().trigger(BORROWER, position).error_code == errors::OK);
        h.clock.advance(1);
        executed = h.liquidation().execute(KEEPER, position).error_code == errors::OK;
    }

    REQUIRE(executed);
    REQUIRE(rounds == 1);
    REQUIRE(h.liquidation().get_record(position)->trigger_time == first_trigger);
    REQUIRE(h.liquidation().get_record(position)->execution_time == first_trigger + SECONDS_PER_HOUR);
    REQUIRE(h.custody.holder_of(d.asset) == KEEPER);
    REQUIRE_FALSE(h.liquidation().is_pending(position));
}

TEST_CASE("Zero delay executes immediately", "[liquidation]") {
    Config config;
    config.set_liquidation(x18::from_percent(80), x18::from_percent(5), 0);
    Harness h(config);
    h.fund();
    BorrowResult loan = h.borrow(h.mint(1), units(8));
    REQUIRE(h.oracle().set_floor_price(OWNER, ART, units(3)) == errors::OK);

    REQUIRE(h.liquidation().trigger(KEEPER, loan.position_id).error_code == errors::OK);
    REQUIRE(h.liquidation().execute(KEEPER, loan.position_id).error_code == errors::OK);
}

TEST_CASE("Trigger preconditions", "[liquidation]") {
    Harness h;
    h.fund();

    SECTION("Unknown position") {
        REQUIRE(h.liquidation().trigger(KEEPER, 99).error_code == errors::POSITION_NOT_FOUND);
        REQUIRE(h.liquidation().execute(KEEPER, 99).error_code == errors::NO_LIQUIDATION);
        REQUIRE(h.liquidation().cancel_stale(99) == errors::NO_LIQUIDATION);
    }

    SECTION("Position without a loan") {
        DepositResult deposit = h.ledger().deposit(BORROWER, h.mint(1), units(5));
        REQUIRE(deposit.error_code == errors::OK);
        REQUIRE(h.oracle().set_floor_price(OWNER, ART, units(1)) == errors::OK);
        REQUIRE_FALSE(h.liquidation().is_eligible(deposit.position_id));
        REQUIRE(h.liquidation().trigger(KEEPER, deposit.position_id).error_code == errors::NOT_ELIGIBLE);

        REQUIRE(h.ledger().withdraw(BORROWER, deposit.position_id) == errors::OK);
        REQUIRE(h.liquidation().trigger(KEEPER, deposit.position_id).error_code ==
                errors::POSITION_NOT_ACTIVE);
    }

    SECTION("Healthy loan") {
        BorrowResult loan = h.borrow(h.mint(1), units(5));
        h.clock.advance(SECONDS_PER_DAY);
        REQUIRE_FALSE(h.liquidation().is_eligible(loan.position_id));
        REQUIRE(h.liquidation().trigger(KEEPER, loan.position_id).error_code == errors::NOT_ELIGIBLE);
        REQUIRE_FALSE(h.liquidation().get_record(loan.position_id).has_value());
        REQUIRE(h.count(EventKind::LIQUIDATION_TRIGGERED) == 0);
    }

    SECTION("Threshold boundary") {
        // value * 0.8 == debt is not eligible
        BorrowResult loan = h.borrow(h.mint(1), units(8));
        REQUIRE_FALSE(h.liquidation().is_eligible(loan.position_id));
        h.clock.advance(1);
        REQUIRE(h.liquidation().is_eligible(loan.position_id));
    }
}

TEST_CASE("Borrower escapes during the delay", "[liquidation]") {
    DistressedLoan d;
    Harness& h = d.h;
    const uint64_t position = d.loan.position_id;

    REQUIRE(h.liquidation().trigger(KEEPER, position).error_code == errors::OK);

    SECTION("Repayment leaves a stale record") {
        RepayResult repaid = h.pool().repay(BORROWER, d.loan.loan_id,
                                            h.pool().outstanding_debt(d.loan.loan_id));
        REQUIRE(repaid.closed);
        h.clock.advance(SECONDS_PER_HOUR);

        REQUIRE(h.liquidation().execute(KEEPER, position).error_code == errors::LOAN_NOT_ACTIVE);
        // Failure has no effect
        REQUIRE(h.liquidation().is_pending(position));
        REQUIRE(h.custody.holder_of(d.asset) == h.ledger().address());

        LiquidationRecord stale = *h.liquidation().get_record(position);
        REQUIRE(h.count(EventKind::LIQUIDATION_CANCELLED) == 0);
        REQUIRE(h.liquidation().cancel_stale(position) == errors::OK);
        REQUIRE_FALSE(h.liquidation().get_record(position).has_value());
        REQUIRE(h.count(EventKind::LIQUIDATION_CANCELLED) == 1);
        const Event& cancelled = h.events.back();
        REQUIRE(cancelled.kind == EventKind::LIQUIDATION_CANCELLED);
        REQUIRE(cancelled.subject_id == position);
        REQUIRE(cancelled.party == BORROWER);
        REQUIRE(cancelled.amount0_x18 == stale.debt_x18);
        REQUIRE(cancelled.amount1_x18 == stale.bonus_x18);
        REQUIRE(h.liquidation().execute(KEEPER, position).error_code == errors::NO_LIQUIDATION);

        REQUIRE(h.ledger().withdraw(BORROWER, position) == errors::OK);
        REQUIRE(h.custody.holder_of(d.asset) == BORROWER);
    }

    SECTION("Live record cannot be cancelled") {
        REQUIRE(h.liquidation().cancel_stale(position) == errors::INVALID_PARAMETER);
        REQUIRE(h.count(EventKind::LIQUIDATION_CANCELLED) == 0);
    }

    SECTION("Price recovery") {
        REQUIRE(h.oracle().set_floor_price(OWNER, ART, units(10)) == errors::OK);
        h.clock.advance(SECONDS_PER_HOUR);
        REQUIRE(h.liquidation().execute(KEEPER, position).error_code == errors::NOT_ELIGIBLE);
        REQUIRE(h.pool().get_loan(d.loan.loan_id)->status == LoanStatus::ACTIVE);
    }
}

TEST_CASE("Failed execution rolls back", "[liquidation]") {
    DistressedLoan d;
    Harness& h = d.h;
    const uint64_t position = d.loan.position_id;

    REQUIRE(h.liquidation().trigger(KEEPER, position).error_code == errors::OK);
    h.clock.advance(SECONDS_PER_HOUR);
    h.events.clear();

    SECTION("Liquidator cannot cover debt and bonus") {
        const Address broke = addresses::from_id(999);
        h.balances.credit(broke, units(8));

        PoolState before = h.pool().state();
        REQUIRE(h.liquidation().execute(broke, position).error_code == errors::TRANSFER_FAILED);

        REQUIRE(h.balances.balance_of(broke) == units(8));
        REQUIRE(h.liquidation().is_pending(position));
        REQUIRE(h.liquidation().get_stats().executed == 0);
        REQUIRE(h.pool().get_loan(d.loan.loan_id)->status == LoanStatus::ACTIVE);
        REQUIRE(h.pool().state().total_borrowed_x18 == before.total_borrowed_x18);
        REQUIRE(h.custody.holder_of(d.asset) == h.ledger().address());
        REQUIRE(h.events.empty());

        // A funded liquidator still can
        REQUIRE(h.liquidation().execute(KEEPER, position).error_code == errors::OK);
    }

    SECTION("Reentrant execute from the payment hook") {
        int32_t nested = errors::OK;
        h.balances.set_transfer_hook([&](const Address& from, const Address& to, I128) {
            if (from == KEEPER && to == h.liquidation().address()) {
                nested = h.liquidation().execute(KEEPER2, position).error_code;
            }
        });

        REQUIRE(h.liquidation().execute(KEEPER, position).error_code == errors::OK);
        REQUIRE(nested == errors::REENTRANCY);
        REQUIRE(h.custody.holder_of(d.asset) == KEEPER);
        REQUIRE(h.balances.balance_of(KEEPER2) == units(1000));
    }
}

TEST_CASE("Revoking the controller's liquidator role", "[liquidation]") {
    DistressedLoan d;
    Harness& h = d.h;
    const uint64_t position = d.loan.position_id;
    const Address controller = h.liquidation().address();

    REQUIRE(h.liquidation().trigger(KEEPER, position).error_code == errors::OK);
    h.clock.advance(SECONDS_PER_HOUR);

    REQUIRE(h.protocol.roles().revoke(OWNER, Role::LIQUIDATOR, controller) == errors::OK);
    REQUIRE(h.count(EventKind::ROLE_REVOKED) == 1);
    REQUIRE(h.events.back().subject_id == static_cast<uint64_t>(Role::LIQUIDATOR));
    REQUIRE(h.events.back().party == controller);

    // Revoking again changes nothing
    REQUIRE(h.protocol.roles().revoke(OWNER, Role::LIQUIDATOR, controller) == errors::OK);
    REQUIRE(h.count(EventKind::ROLE_REVOKED) == 1);

    // Settlement is refused and the liquidator's payment comes back
    REQUIRE(h.liquidation().execute(KEEPER, position).error_code == errors::UNAUTHORIZED);
    REQUIRE(h.balances.balance_of(KEEPER) == units(1000));
    REQUIRE(h.liquidation().is_pending(position));
    REQUIRE(h.pool().get_loan(d.loan.loan_id)->status == LoanStatus::ACTIVE);
    REQUIRE(h.custody.holder_of(d.asset) == h.ledger().address());
    REQUIRE(h.count(EventKind::LIQUIDATION_EXECUTED) == 0);

    REQUIRE(h.protocol.roles().grant(OWNER, Role::LIQUIDATOR, controller) == errors::OK);
    REQUIRE(h.count(EventKind::ROLE_GRANTED) == 1);
    REQUIRE(h.liquidation().execute(KEEPER, position).error_code == errors::OK);
    REQUIRE(h.custody.holder_of(d.asset) == KEEPER);
}

TEST_CASE("Liquidation parameters", "[liquidation]") {
    Harness h;

    REQUIRE(h.liquidation().liquidation_bonus(units(3)) == dec("0.15"));
    REQUIRE(h.liquidation().set_parameters(KEEPER, x18::from_percent(90), x18::from_percent(5),
                                           60) == errors::UNAUTHORIZED);
    REQUIRE(h.liquidation().set_parameters(OWNER, x18::from_percent(90), x18::from_percent(25),
                                           60) == errors::INVALID_PARAMETER);
    REQUIRE(h.liquidation().set_parameters(OWNER, x18::from_percent(90), x18::from_percent(5),
                                           limits::MAX_LIQUIDATION_DELAY + 1) == errors::INVALID_PARAMETER);

    REQUIRE(h.liquidation().set_parameters(OWNER, x18::from_percent(90), x18::from_percent(10),
                                           60) == errors::OK);
    REQUIRE(h.liquidation().params().delay == 60);
    REQUIRE(h.liquidation().liquidation_bonus(units(3)) == dec("0.3"));
    REQUIRE(h.count(EventKind::LIQUIDATION_PARAMETERS_UPDATED) == 1);

    // A higher threshold makes an 80% loan healthy again
    h.fund();
    BorrowResult loan = h.borrow(h.mint(1), units(8));
    h.clock.advance(SECONDS_PER_DAY);
    REQUIRE_FALSE(h.liquidation().is_eligible(loan.position_id));
}
