// =============================================================================
// protocol.cpp - Component wiring, allow-list and combined user flows
// =============================================================================

#include "pledge/protocol.hpp"

#include <spdlog/spdlog.h>

namespace pledge {

// =============================================================================
// Constructor / Destructor
// =============================================================================

Protocol::Protocol(const Config& config, const Address& owner, IBalances& balances,
                   ICustody& custody, const IClock& clock)
    : clock_(clock), roles_(owner, clock) {
    if (addresses::is_zero(owner)) {
        throw ConfigError("Protocol owner must be a non-zero address");
    }
    config.validate();

    oracle_ = std::make_unique<ValuationOracle>(config.oracle, clock, roles_);
    ledger_ = std::make_unique<CollateralLedger>(config.ledger, addresses::PLEDGE_LEDGER,
                                                 *oracle_, custody, clock, roles_);
    pool_ = std::make_unique<LiquidityPool>(config.pool, addresses::PLEDGE_POOL,
                                            *ledger_, balances, clock, roles_);
    liquidation_ = std::make_unique<LiquidationController>(config.liquidation,
                                                           addresses::PLEDGE_LIQUIDATION,
                                                           *ledger_, *pool_, balances, clock, roles_);

    // The pool binds loans to positions; the controller force-closes them
    if (roles_.grant(owner, Role::LOAN_BOOK, addresses::PLEDGE_POOL) != errors::OK ||
        roles_.grant(owner, Role::LIQUIDATOR, addresses::PLEDGE_LIQUIDATION) != errors::OK) {
        throw ConfigError("Could not grant component roles");
    }

    spdlog::info("protocol: pledge {} initialised, owner {}", version(), addresses::to_hex(owner));
}

Protocol::~Protocol() = default;

// =============================================================================
// Asset Allow-List
// =============================================================================

int32_t Protocol::set_asset_allowed(const Address& caller, const Address& asset_class, bool allowed) {
    if (!roles_.is_authorized(caller, Role::PARAMETER_ADMIN)) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(asset_class)) return errors::INVALID_PARAMETER;

    if (allowed) {
        allowed_.insert(asset_class);
    } else {
        allowed_.erase(asset_class);
    }

    if (event_callback_) {
        event_callback_(Event{EventKind::ASSET_ALLOWED, 0, asset_class, allowed ? 1 : 0, 0, clock_.now()});
    }
    return errors::OK;
}

bool Protocol::is_asset_allowed(const Address& asset_class) const {
    return allowed_.count(asset_class) > 0;
}

// =============================================================================
// Combined User Flows
// =============================================================================

BorrowResult Protocol::deposit_and_borrow(const Address& borrower, const AssetRef& asset,
                                          I128 amount_x18, uint64_t duration) {
    BorrowResult result{errors::OK, 0, 0, 0};

    if (!is_asset_allowed(asset.asset_class)) {
        result.error_code = errors::ASSET_NOT_ALLOWED;
        return result;
    }

    Journal journal;

    DepositResult deposited = ledger_->deposit(borrower, asset, amount_x18, &journal);
    if (deposited.error_code != errors::OK) {
        result.error_code = deposited.error_code;
        return result;
    }

    OriginateResult loan = pool_->originate(borrower, deposited.position_id, amount_x18,
                                            duration, &journal);
    if (loan.error_code != errors::OK) {
        spdlog::debug("protocol: borrow against {}#{} failed ({}), deposit unwound",
                      addresses::to_hex(asset.asset_class), asset.asset_id,
                      errors::name(loan.error_code));
        result.error_code = journal.rollback() ? loan.error_code : errors::ROLLBACK_INCOMPLETE;
        return result;
    }

    journal.commit();

    result.position_id = deposited.position_id;
    result.loan_id = loan.loan_id;
    result.rate_x18 = loan.rate_x18;
    return result;
}

RepayResult Protocol::repay_and_withdraw(const Address& borrower, uint64_t loan_id, I128 amount_x18) {
    Journal journal;

    RepayResult repaid = pool_->repay(borrower, loan_id, amount_x18, &journal);
    if (repaid.error_code != errors::OK) {
        return repaid;
    }

    if (repaid.closed) {
        auto loan = pool_->get_loan(loan_id);
        int32_t rc = loan ? ledger_->withdraw(borrower, loan->position_id, &journal)
                          : errors::LOAN_NOT_FOUND;
        if (rc != errors::OK) {
            return RepayResult{journal.rollback() ? rc : errors::ROLLBACK_INCOMPLETE, 0, 0, false};
        }
    }

    journal.commit();
    return repaid;
}

// =============================================================================
// Queries
// =============================================================================

ProtocolInfo Protocol::protocol_info() const {
    auto ledger_stats = ledger_->get_stats();
    auto pool_stats = pool_->get_stats();
    const PoolState& state = pool_->state();

    return ProtocolInfo{
        ledger_stats.total_value_locked_x18,
        state.total_borrowed_x18,
        state.total_liquidity_x18,
        state.total_reserves_x18,
        ledger_stats.active_positions,
        pool_stats.active_loans
    };
}

std::vector<CollateralPosition> Protocol::user_positions(const Address& owner) const {
    return ledger_->positions_of(owner);
}

std::vector<Loan> Protocol::user_loans(const Address& borrower) const {
    return pool_->loans_of(borrower);
}

void Protocol::set_event_callback(EventCallback callback) {
    event_callback_ = callback;
    roles_.set_event_callback(callback);
    oracle_->set_event_callback(callback);
    ledger_->set_event_callback(callback);
    pool_->set_event_callback(callback);
    liquidation_->set_event_callback(std::move(callback));
}

// =============================================================================
// Statistics
// =============================================================================

Protocol::GlobalStats Protocol::get_stats() const {
    return GlobalStats{
        oracle_->get_stats(),
        ledger_->get_stats(),
        pool_->get_stats(),
        liquidation_->get_stats()
    };
}

} // namespace pledge
