// =============================================================================
// pool.cpp - LiquidityPool share accounting, loans and interest
// =============================================================================

#include "pledge/pool.hpp"
#include "pledge/math.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace pledge {

// =============================================================================
// Constructor
// =============================================================================

LiquidityPool::LiquidityPool(const PoolParams& params, const Address& self, CollateralLedger& ledger,
                             IBalances& balances, const IClock& clock, const IAuthority& authority)
    : params_(params)
    , self_(self)
    , ledger_(ledger)
    , balances_(balances)
    , clock_(clock)
    , authority_(authority) {}

// =============================================================================
// Lender Shares
// =============================================================================

ProvideResult LiquidityPool::provide(const Address& lender, I128 amount_x18, Journal* parent) {
    ProvideResult result{errors::OK, 0};

    EntryGuard guard(entered_);
    if (!guard.acquired()) {
        result.error_code = errors::REENTRANCY;
        return result;
    }
    if (amount_x18 <= 0) {
        result.error_code = errors::INVALID_AMOUNT;
        return result;
    }

    // Rounded down: earlier providers keep the remainder
    I128 shares = amount_x18;
    if (state_.total_shares_x18 > 0 && state_.total_liquidity_x18 > 0) {
        shares = math::mul_div(amount_x18, state_.total_shares_x18, state_.total_liquidity_x18);
    }
    if (shares <= 0) {
        result.error_code = errors::INVALID_AMOUNT;
        return result;
    }

    uint64_t now = clock_.now();
    Journal journal(parent);

    PoolState before = state_;
    state_.total_liquidity_x18 += amount_x18;
    state_.total_shares_x18 += shares;
    journal.on_rollback([this, before] { state_ = before; });
    adjust_shares(lender, shares, journal);

    if (!balances_.transfer(lender, self_, amount_x18)) {
        spdlog::warn("pool: deposit of {} from {} refused", x18::to_string(amount_x18),
                     addresses::to_hex(lender));
        result.error_code = errors::TRANSFER_FAILED;
        return result;
    }
    journal.on_compensate([this, lender, amount_x18] {
        if (balances_.transfer(self_, lender, amount_x18)) return true;
        spdlog::critical("pool: could not refund {} to {} during rollback",
                         x18::to_string(amount_x18), addresses::to_hex(lender));
        return false;
    });

    journal.on_commit([this, lender, amount_x18, shares, now] {
        emit(EventKind::LIQUIDITY_PROVIDED, 0, lender, amount_x18, shares, now);
    });
    journal.commit();

    spdlog::debug("pool: {} provided {} for {} shares", addresses::to_hex(lender),
                  x18::to_string(amount_x18), x18::to_string(shares));

    result.shares_x18 = shares;
    return result;
}

WithdrawResult LiquidityPool::withdraw(const Address& lender, I128 shares_x18, Journal* parent) {
    WithdrawResult result{errors::OK, 0};

    EntryGuard guard(entered_);
    if (!guard.acquired()) {
        result.error_code = errors::REENTRANCY;
        return result;
    }
    if (shares_x18 <= 0) {
        result.error_code = errors::INVALID_AMOUNT;
        return result;
    }
    if (shares_of(lender) < shares_x18) {
        result.error_code = errors::INSUFFICIENT_SHARES;
        return result;
    }

    I128 amount = math::mul_div(shares_x18, state_.total_liquidity_x18, state_.total_shares_x18);
    if (amount > state_.available_x18()) {
        result.error_code = errors::INSUFFICIENT_AVAILABLE_LIQUIDITY;
        return result;
    }
    if (amount <= 0) {
        result.error_code = errors::INVALID_AMOUNT;
        return result;
    }

    uint64_t now = clock_.now();
    Journal journal(parent);

    PoolState before = state_;
    state_.total_liquidity_x18 -= amount;
    state_.total_shares_x18 -= shares_x18;
    journal.on_rollback([this, before] { state_ = before; });
    adjust_shares(lender, -shares_x18, journal);

    if (!balances_.transfer(self_, lender, amount)) {
        spdlog::warn("pool: payout of {} to {} refused", x18::to_string(amount),
                     addresses::to_hex(lender));
        result.error_code = errors::TRANSFER_FAILED;
        return result;
    }
    journal.on_compensate([this, lender, amount] {
        if (balances_.transfer(lender, self_, amount)) return true;
        spdlog::critical("pool: could not reclaim {} from {} during rollback",
                         x18::to_string(amount), addresses::to_hex(lender));
        return false;
    });

    journal.on_commit([this, lender, amount, shares_x18, now] {
        emit(EventKind::LIQUIDITY_WITHDRAWN, 0, lender, amount, shares_x18, now);
    });
    journal.commit();

    result.amount_x18 = amount;
    return result;
}

I128 LiquidityPool::shares_of(const Address& lender) const {
    auto it = shares_.find(lender);
    return it == shares_.end() ? 0 : it->second;
}

// =============================================================================
// Rate Model
// =============================================================================

I128 LiquidityPool::utilization() const {
    return math::ratio(state_.total_borrowed_x18, state_.total_liquidity_x18);
}

I128 LiquidityPool::current_rate() const {
    return params_.base_rate_x18 + math::apply_rate(utilization(), params_.slope_x18);
}

// =============================================================================
// Loans
// =============================================================================

OriginateResult LiquidityPool::originate(const Address& borrower, uint64_t position_id,
                                         I128 amount_x18, uint64_t duration, Journal* parent) {
    OriginateResult result{errors::OK, 0, 0};

    EntryGuard guard(entered_);
    if (!guard.acquired()) {
        result.error_code = errors::REENTRANCY;
        return result;
    }

    if (amount_x18 <= 0) {
        result.error_code = errors::INVALID_AMOUNT;
        return result;
    }
    if (duration == 0 || duration > limits::MAX_LOAN_DURATION) {
        result.error_code = errors::INVALID_DURATION;
        return result;
    }
    if (amount_x18 > state_.available_x18()) {
        result.error_code = errors::INSUFFICIENT_LIQUIDITY;
        return result;
    }

    auto position = ledger_.get_position(position_id);
    if (!position) {
        result.error_code = errors::POSITION_NOT_FOUND;
        return result;
    }
    if (position->owner != borrower) {
        result.error_code = errors::NOT_OWNER;
        return result;
    }
    if (position->status != PositionStatus::ACTIVE) {
        result.error_code = errors::POSITION_NOT_ACTIVE;
        return result;
    }
    if (position->bound_loan != 0 || active_by_position_.count(position_id) > 0) {
        result.error_code = errors::POSITION_ENCUMBERED;
        return result;
    }

    // Bounded by the LTV and value fixed at deposit
    if (math::compare_products(amount_x18, X18_ONE, position->ltv_x18,
                               position->value_at_deposit_x18) > 0) {
        result.error_code = errors::EXCEEDS_LOAN_TO_VALUE;
        return result;
    }

    // Rate is priced off utilization before this loan
    I128 rate = current_rate();
    uint64_t now = clock_.now();
    Journal journal(parent);

    uint64_t id = next_loan_id_++;
    loans_.emplace(id, Loan{
        id, borrower, position_id, amount_x18, rate, now, now + duration,
        0, 0, LoanStatus::ACTIVE
    });
    by_borrower_[borrower].push_back(id);
    active_by_position_[position_id] = id;

    PoolState before = state_;
    state_.total_borrowed_x18 += amount_x18;
    ++active_count_;
    total_originated_x18_ += amount_x18;

    journal.on_rollback([this, id, borrower, position_id, amount_x18, before] {
        loans_.erase(id);
        auto& owned = by_borrower_[borrower];
        owned.pop_back();
        if (owned.empty()) by_borrower_.erase(borrower);
        active_by_position_.erase(position_id);
        state_ = before;
        --active_count_;
        total_originated_x18_ -= amount_x18;
        next_loan_id_ = id;
    });

    int32_t rc = ledger_.bind_loan(self_, position_id, id, &journal);
    if (rc != errors::OK) {
        result.error_code = rc;
        return result;
    }

    if (!balances_.transfer(self_, borrower, amount_x18)) {
        spdlog::warn("pool: disbursement of loan {} to {} refused", id, addresses::to_hex(borrower));
        result.error_code = errors::TRANSFER_FAILED;
        return result;
    }
    journal.on_compensate([this, borrower, amount_x18] {
        if (balances_.transfer(borrower, self_, amount_x18)) return true;
        spdlog::critical("pool: could not reclaim disbursement of {} from {} during rollback",
                         x18::to_string(amount_x18), addresses::to_hex(borrower));
        return false;
    });

    journal.on_commit([this, id, borrower, amount_x18, rate, now] {
        emit(EventKind::LOAN_ORIGINATED, id, borrower, amount_x18, rate, now);
    });
    journal.commit();

    spdlog::info("pool: loan {} of {} at rate {} against position {}", id,
                 x18::to_string(amount_x18), x18::to_string(rate), position_id);

    result.loan_id = id;
    result.rate_x18 = rate;
    return result;
}

RepayResult LiquidityPool::repay(const Address& payer, uint64_t loan_id, I128 amount_x18,
                                 Journal* parent) {
    RepayResult result{errors::OK, 0, 0, false};

    EntryGuard guard(entered_);
    if (!guard.acquired()) {
        result.error_code = errors::REENTRANCY;
        return result;
    }
    if (amount_x18 <= 0) {
        result.error_code = errors::INVALID_AMOUNT;
        return result;
    }

    auto it = loans_.find(loan_id);
    if (it == loans_.end()) {
        result.error_code = errors::LOAN_NOT_FOUND;
        return result;
    }
    Loan& loan = it->second;
    if (loan.status != LoanStatus::ACTIVE) {
        result.error_code = errors::LOAN_NOT_ACTIVE;
        return result;
    }
    if (loan.borrower != payer) {
        result.error_code = errors::NOT_BORROWER;
        return result;
    }

    uint64_t now = clock_.now();
    I128 applied = std::min(amount_x18, outstanding_at(loan, now));

    Journal journal(parent);
    int32_t rc = apply_payment(loan, applied, now, LoanStatus::REPAID, journal, result);
    if (rc != errors::OK) {
        result.error_code = rc;
        return result;
    }

    if (!balances_.transfer(payer, self_, applied)) {
        spdlog::warn("pool: repayment of {} on loan {} refused", x18::to_string(applied), loan_id);
        result = RepayResult{errors::TRANSFER_FAILED, 0, 0, false};
        return result;
    }
    journal.on_compensate([this, payer, applied] {
        if (balances_.transfer(self_, payer, applied)) return true;
        spdlog::critical("pool: could not refund repayment of {} to {} during rollback",
                         x18::to_string(applied), addresses::to_hex(payer));
        return false;
    });

    I128 interest = result.interest_x18;
    bool closed = result.closed;
    I128 principal = loan.principal_x18;
    I128 repaid = loan.repaid_x18();
    journal.on_commit([this, loan_id, payer, applied, interest, closed, principal, repaid, now] {
        emit(EventKind::LOAN_REPAID, loan_id, payer, applied, interest, now);
        if (closed) {
            emit(EventKind::LOAN_CLOSED, loan_id, payer, principal, repaid, now);
        }
    });
    journal.commit();

    spdlog::debug("pool: loan {} repaid {} (interest {}){}", loan_id, x18::to_string(applied),
                  x18::to_string(interest), closed ? ", closed" : "");
    return result;
}

I128 LiquidityPool::accrued_interest(uint64_t loan_id) const {
    auto it = loans_.find(loan_id);
    if (it == loans_.end()) return 0;
    if (it->second.status != LoanStatus::ACTIVE) return it->second.interest_repaid_x18;
    return accrued_at(it->second, clock_.now());
}

I128 LiquidityPool::outstanding_debt(uint64_t loan_id) const {
    auto it = loans_.find(loan_id);
    if (it == loans_.end()) return 0;
    if (it->second.status != LoanStatus::ACTIVE) return 0;
    return outstanding_at(it->second, clock_.now());
}

bool LiquidityPool::is_healthy(uint64_t loan_id) const {
    auto it = loans_.find(loan_id);
    if (it == loans_.end()) return false;

    const Loan& loan = it->second;
    uint64_t now = clock_.now();
    if (now > loan.maturity_time && outstanding_debt(loan_id) > 0) {
        return false;
    }
    return ledger_.is_healthy(loan.position_id);
}

RepayResult LiquidityPool::settle_liquidation(const Address& caller, uint64_t loan_id,
                                              const Address& payer, I128 amount_x18,
                                              Journal* parent) {
    RepayResult result{errors::OK, 0, 0, false};

    EntryGuard guard(entered_);
    if (!guard.acquired()) {
        result.error_code = errors::REENTRANCY;
        return result;
    }
    if (!authority_.is_authorized(caller, Role::LIQUIDATOR)) {
        result.error_code = errors::UNAUTHORIZED;
        return result;
    }

    auto it = loans_.find(loan_id);
    if (it == loans_.end()) {
        result.error_code = errors::LOAN_NOT_FOUND;
        return result;
    }
    Loan& loan = it->second;
    if (loan.status != LoanStatus::ACTIVE) {
        result.error_code = errors::LOAN_NOT_ACTIVE;
        return result;
    }

    uint64_t now = clock_.now();
    I128 debt = outstanding_at(loan, now);
    if (amount_x18 < debt) {
        result.error_code = errors::INVALID_AMOUNT;
        return result;
    }

    Journal journal(parent);
    int32_t rc = apply_payment(loan, debt, now, LoanStatus::LIQUIDATED, journal, result);
    if (rc != errors::OK) {
        result.error_code = rc;
        return result;
    }

    if (!balances_.transfer(payer, self_, debt)) {
        spdlog::warn("pool: liquidation proceeds of {} for loan {} refused", x18::to_string(debt), loan_id);
        result = RepayResult{errors::TRANSFER_FAILED, 0, 0, false};
        return result;
    }
    journal.on_compensate([this, payer, debt] {
        if (balances_.transfer(self_, payer, debt)) return true;
        spdlog::critical("pool: could not refund liquidation proceeds of {} to {} during rollback",
                         x18::to_string(debt), addresses::to_hex(payer));
        return false;
    });

    Address borrower = loan.borrower;
    I128 interest = result.interest_x18;
    journal.on_commit([this, loan_id, borrower, debt, interest, now] {
        emit(EventKind::LOAN_LIQUIDATED, loan_id, borrower, debt, interest, now);
    });
    journal.commit();

    spdlog::info("pool: loan {} settled by liquidation for {}", loan_id, x18::to_string(debt));
    return result;
}

// =============================================================================
// Administration
// =============================================================================

int32_t LiquidityPool::set_rate_model(const Address& caller, I128 base_rate_x18, I128 slope_x18) {
    if (!authority_.is_authorized(caller, Role::PARAMETER_ADMIN)) {
        return errors::UNAUTHORIZED;
    }

    PoolParams updated = params_;
    updated.base_rate_x18 = base_rate_x18;
    updated.slope_x18 = slope_x18;
    int32_t rc = updated.validate();
    if (rc != errors::OK) return rc;

    params_ = updated;
    spdlog::info("pool: rate model base={} slope={}", x18::to_string(base_rate_x18),
                 x18::to_string(slope_x18));
    emit(EventKind::RATE_MODEL_UPDATED, 0, caller, base_rate_x18, slope_x18, clock_.now());
    return errors::OK;
}

int32_t LiquidityPool::set_reserve_factor(const Address& caller, I128 factor_x18) {
    if (!authority_.is_authorized(caller, Role::PARAMETER_ADMIN)) {
        return errors::UNAUTHORIZED;
    }

    PoolParams updated = params_;
    updated.reserve_factor_x18 = factor_x18;
    int32_t rc = updated.validate();
    if (rc != errors::OK) return rc;

    params_ = updated;
    emit(EventKind::RESERVE_FACTOR_UPDATED, 0, caller, factor_x18, 0, clock_.now());
    return errors::OK;
}

int32_t LiquidityPool::withdraw_reserves(const Address& caller, const Address& to, I128 amount_x18) {
    EntryGuard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (!authority_.is_authorized(caller, Role::PARAMETER_ADMIN)) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(to)) return errors::INVALID_PARAMETER;
    if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
    if (amount_x18 > state_.total_reserves_x18) return errors::INSUFFICIENT_RESERVES;

    uint64_t now = clock_.now();
    Journal journal;

    PoolState before = state_;
    state_.total_reserves_x18 -= amount_x18;
    journal.on_rollback([this, before] { state_ = before; });

    if (!balances_.transfer(self_, to, amount_x18)) {
        spdlog::warn("pool: reserve payout of {} to {} refused", x18::to_string(amount_x18),
                     addresses::to_hex(to));
        return errors::TRANSFER_FAILED;
    }

    journal.on_commit([this, to, amount_x18, now] {
        emit(EventKind::RESERVES_WITHDRAWN, 0, to, amount_x18, 0, now);
    });
    journal.commit();
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Loan> LiquidityPool::get_loan(uint64_t loan_id) const {
    auto it = loans_.find(loan_id);
    if (it == loans_.end()) return std::nullopt;
    return it->second;
}

std::vector<Loan> LiquidityPool::loans_of(const Address& borrower) const {
    std::vector<Loan> result;
    auto it = by_borrower_.find(borrower);
    if (it == by_borrower_.end()) return result;

    result.reserve(it->second.size());
    for (uint64_t id : it->second) {
        result.push_back(loans_.at(id));
    }
    return result;
}

std::optional<uint64_t> LiquidityPool::active_loan_for(uint64_t position_id) const {
    auto it = active_by_position_.find(position_id);
    if (it == active_by_position_.end()) return std::nullopt;
    return it->second;
}

PoolInfo LiquidityPool::pool_info() const {
    return PoolInfo{
        state_,
        utilization(),
        current_rate(),
        params_.base_rate_x18,
        params_.slope_x18,
        params_.reserve_factor_x18
    };
}

LiquidityPool::Stats LiquidityPool::get_stats() const {
    return Stats{
        static_cast<uint64_t>(loans_.size()),
        active_count_,
        liquidated_count_,
        total_originated_x18_,
        total_interest_x18_,
        static_cast<uint64_t>(shares_.size())
    };
}

// =============================================================================
// Internal Helpers
// =============================================================================

I128 LiquidityPool::accrued_at(const Loan& loan, uint64_t now) const {
    if (now <= loan.start_time) return 0;
    I128 elapsed = static_cast<I128>(now - loan.start_time);
    return math::mul_div(loan.principal_x18, loan.rate_x18 * elapsed,
                         static_cast<I128>(SECONDS_PER_YEAR) * X18_ONE);
}

I128 LiquidityPool::outstanding_at(const Loan& loan, uint64_t now) const {
    I128 debt = loan.principal_x18 + accrued_at(loan, now) - loan.repaid_x18();
    return debt > 0 ? debt : 0;
}

int32_t LiquidityPool::apply_payment(Loan& loan, I128 amount_x18, uint64_t now,
                                     LoanStatus final_status, Journal& journal,
                                     RepayResult& result) {
    I128 interest_owed = accrued_at(loan, now) - loan.interest_repaid_x18;
    if (interest_owed < 0) interest_owed = 0;

    I128 interest = std::min(amount_x18, interest_owed);
    I128 principal = std::min(amount_x18 - interest, loan.principal_x18 - loan.principal_repaid_x18);
    I128 reserve = math::apply_rate(interest, params_.reserve_factor_x18);

    Loan before = loan;
    PoolState state_before = state_;
    uint64_t active_before = active_count_;
    uint64_t liquidated_before = liquidated_count_;
    I128 interest_total_before = total_interest_x18_;

    loan.interest_repaid_x18 += interest;
    loan.principal_repaid_x18 += principal;
    state_.total_borrowed_x18 -= principal;
    state_.total_reserves_x18 += reserve;
    state_.total_liquidity_x18 += interest - reserve;
    total_interest_x18_ += interest;

    bool closed = outstanding_at(loan, now) == 0;
    if (closed) {
        loan.status = final_status;
        active_by_position_.erase(loan.position_id);
        --active_count_;
        if (final_status == LoanStatus::LIQUIDATED) ++liquidated_count_;
    }

    Loan* booked = &loan;
    journal.on_rollback([this, booked, before, state_before, active_before,
                         liquidated_before, interest_total_before] {
        *booked = before;
        if (before.status == LoanStatus::ACTIVE) {
            active_by_position_[before.position_id] = before.id;
        }
        state_ = state_before;
        active_count_ = active_before;
        liquidated_count_ = liquidated_before;
        total_interest_x18_ = interest_total_before;
    });

    if (closed) {
        int32_t rc = ledger_.release_loan(self_, loan.position_id, loan.id, &journal);
        if (rc != errors::OK) {
            spdlog::error("pool: release of position {} for loan {} failed: {}",
                          loan.position_id, loan.id, errors::name(rc));
            return rc;
        }
    }

    result.applied_x18 = amount_x18;
    result.interest_x18 = interest;
    result.closed = closed;
    return errors::OK;
}

void LiquidityPool::adjust_shares(const Address& lender, I128 delta_x18, Journal& journal) {
    I128 before = shares_of(lender);
    I128 after = before + delta_x18;
    if (after == 0) {
        shares_.erase(lender);
    } else {
        shares_[lender] = after;
    }

    journal.on_rollback([this, lender, before] {
        if (before == 0) {
            shares_.erase(lender);
        } else {
            shares_[lender] = before;
        }
    });
}

void LiquidityPool::emit(EventKind kind, uint64_t subject_id, const Address& party,
                         I128 amount0, I128 amount1, uint64_t now) const {
    if (event_callback_) {
        event_callback_(Event{kind, subject_id, party, amount0, amount1, now});
    }
}

} // namespace pledge
