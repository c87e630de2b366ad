// =============================================================================
// liquidation.cpp - LiquidationController trigger / execute state machine
// =============================================================================

#include "pledge/liquidation.hpp"
#include "pledge/math.hpp"

#include <spdlog/spdlog.h>

namespace pledge {

// =============================================================================
// Constructor
// =============================================================================

LiquidationController::LiquidationController(const LiquidationParams& params, const Address& self,
                                             CollateralLedger& ledger, LiquidityPool& pool,
                                             IBalances& balances, const IClock& clock,
                                             const IAuthority& authority)
    : params_(params)
    , self_(self)
    , ledger_(ledger)
    , pool_(pool)
    , balances_(balances)
    , clock_(clock)
    , authority_(authority) {}

// =============================================================================
// Eligibility
// =============================================================================

bool LiquidationController::is_eligible(uint64_t position_id) const {
    Assessment assessment = assess(position_id);
    return assessment.error_code == errors::OK && assessment.eligible;
}

LiquidationController::Assessment LiquidationController::assess(uint64_t position_id) const {
    Assessment result{errors::OK, 0, 0, 0, false};

    auto position = ledger_.get_position(position_id);
    if (!position) {
        result.error_code = errors::POSITION_NOT_FOUND;
        return result;
    }
    if (position->status != PositionStatus::ACTIVE) {
        result.error_code = errors::POSITION_NOT_ACTIVE;
        return result;
    }

    auto loan_id = pool_.active_loan_for(position_id);
    if (!loan_id) {
        result.error_code = errors::NOT_ELIGIBLE;
        return result;
    }
    result.loan_id = *loan_id;
    result.debt_x18 = pool_.outstanding_debt(*loan_id);

    PriceQuote quote = ledger_.value_of(position_id);
    if (quote.error_code != errors::OK) {
        result.error_code = quote.error_code;
        return result;
    }
    result.value_x18 = quote.price_x18;

    // value * threshold < debt
    result.eligible = math::compare_products(result.value_x18, params_.threshold_x18,
                                             result.debt_x18, X18_ONE) < 0;
    return result;
}

// =============================================================================
// Liquidation Flow
// =============================================================================

LiquidationResult LiquidationController::trigger(const Address& caller, uint64_t position_id) {
    LiquidationResult result{errors::OK, position_id, 0, caller, 0, 0, 0};

    EntryGuard guard(entered_);
    if (!guard.acquired()) {
        result.error_code = errors::REENTRANCY;
        return result;
    }

    auto existing = records_.find(position_id);
    if (existing != records_.end() && existing->second.status == LiquidationStatus::EXECUTED) {
        result.error_code = errors::ALREADY_LIQUIDATED;
        return result;
    }

    Assessment assessment = assess(position_id);
    if (assessment.error_code != errors::OK) {
        result.error_code = assessment.error_code;
        return result;
    }
    if (!assessment.eligible) {
        result.error_code = errors::NOT_ELIGIBLE;
        return result;
    }

    uint64_t now = clock_.now();
    I128 bonus = liquidation_bonus(assessment.value_x18);
    // A record left over from an earlier loan on the position starts afresh
    bool refresh = existing != records_.end() && existing->second.loan_id == assessment.loan_id;

    if (refresh) {
        // Snapshot only; the delay keeps counting from the first trigger
        LiquidationRecord& record = existing->second;
        record.debt_x18 = assessment.debt_x18;
        record.value_x18 = assessment.value_x18;
        record.bonus_x18 = bonus;
    } else {
        records_[position_id] = LiquidationRecord{
            position_id, assessment.loan_id, assessment.debt_x18, assessment.value_x18, bonus,
            LiquidationStatus::TRIGGERED, now, Address{}, 0
        };
    }
    ++triggered_count_;

    spdlog::info("liquidation: position {} {} by {} (debt {}, value {})", position_id,
                 refresh ? "re-triggered" : "triggered", addresses::to_hex(caller),
                 x18::to_string(assessment.debt_x18), x18::to_string(assessment.value_x18));
    emit(EventKind::LIQUIDATION_TRIGGERED, position_id, caller, assessment.debt_x18,
         assessment.value_x18, now);

    result.loan_id = assessment.loan_id;
    result.debt_x18 = assessment.debt_x18;
    result.bonus_x18 = bonus;
    result.value_x18 = assessment.value_x18;
    return result;
}

LiquidationResult LiquidationController::execute(const Address& caller, uint64_t position_id) {
    LiquidationResult result{errors::OK, position_id, 0, caller, 0, 0, 0};

    EntryGuard guard(entered_);
    if (!guard.acquired()) {
        result.error_code = errors::REENTRANCY;
        return result;
    }

    auto it = records_.find(position_id);
    if (it == records_.end()) {
        result.error_code = errors::NO_LIQUIDATION;
        return result;
    }
    LiquidationRecord& record = it->second;
    if (record.status == LiquidationStatus::EXECUTED) {
        result.error_code = errors::ALREADY_LIQUIDATED;
        return result;
    }

    uint64_t now = clock_.now();
    if (now - record.trigger_time < params_.delay) {
        result.error_code = errors::DELAY_NOT_ELAPSED;
        return result;
    }

    auto loan = pool_.get_loan(record.loan_id);
    if (!loan || loan->status != LoanStatus::ACTIVE) {
        result.error_code = errors::LOAN_NOT_ACTIVE;
        return result;
    }

    // Repayment or a price recovery during the delay defeats the liquidation
    Assessment assessment = assess(position_id);
    if (assessment.error_code != errors::OK) {
        result.error_code = assessment.error_code;
        return result;
    }
    if (!assessment.eligible || assessment.loan_id != record.loan_id) {
        result.error_code = errors::NOT_ELIGIBLE;
        return result;
    }

    I128 debt = assessment.debt_x18;
    I128 bonus = record.bonus_x18;
    I128 total = debt + bonus;
    uint64_t loan_id = record.loan_id;

    Journal journal;

    LiquidationRecord before = record;
    record.status = LiquidationStatus::EXECUTED;
    record.executor = caller;
    record.execution_time = now;
    ++executed_count_;
    total_debt_settled_x18_ += debt;
    total_bonus_paid_x18_ += bonus;

    LiquidationRecord* executed = &record;
    journal.on_rollback([this, executed, before, debt, bonus] {
        *executed = before;
        --executed_count_;
        total_debt_settled_x18_ -= debt;
        total_bonus_paid_x18_ -= bonus;
    });

    if (!balances_.transfer(caller, self_, total)) {
        spdlog::warn("liquidation: {} could not cover {} for position {}", addresses::to_hex(caller),
                     x18::to_string(total), position_id);
        result.error_code = errors::TRANSFER_FAILED;
        return result;
    }
    journal.on_compensate([this, caller, total] {
        if (balances_.transfer(self_, caller, total)) return true;
        spdlog::critical("liquidation: could not refund {} to {} during rollback",
                         x18::to_string(total), addresses::to_hex(caller));
        return false;
    });

    RepayResult settled = pool_.settle_liquidation(self_, loan_id, self_, debt, &journal);
    if (settled.error_code != errors::OK) {
        spdlog::error("liquidation: settlement of loan {} failed: {}", loan_id,
                      errors::name(settled.error_code));
        result.error_code = journal.rollback() ? settled.error_code : errors::ROLLBACK_INCOMPLETE;
        return result;
    }

    if (bonus > 0) {
        if (!balances_.transfer(self_, caller, bonus)) {
            spdlog::warn("liquidation: bonus payout of {} to {} refused", x18::to_string(bonus),
                         addresses::to_hex(caller));
            result.error_code = journal.rollback() ? errors::TRANSFER_FAILED : errors::ROLLBACK_INCOMPLETE;
            return result;
        }
        journal.on_compensate([this, caller, bonus] {
            if (balances_.transfer(caller, self_, bonus)) return true;
            spdlog::critical("liquidation: could not reclaim bonus {} from {} during rollback",
                             x18::to_string(bonus), addresses::to_hex(caller));
            return false;
        });
    }

    int32_t rc = ledger_.force_close(self_, position_id, caller, &journal);
    if (rc != errors::OK) {
        spdlog::error("liquidation: force close of position {} failed: {}", position_id, errors::name(rc));
        result.error_code = journal.rollback() ? rc : errors::ROLLBACK_INCOMPLETE;
        return result;
    }

    journal.on_commit([this, position_id, caller, debt, bonus, now] {
        emit(EventKind::LIQUIDATION_EXECUTED, position_id, caller, debt, bonus, now);
    });
    journal.commit();

    spdlog::info("liquidation: position {} executed by {} (debt {}, bonus {})", position_id,
                 addresses::to_hex(caller), x18::to_string(debt), x18::to_string(bonus));

    result.loan_id = loan_id;
    result.debt_x18 = debt;
    result.bonus_x18 = bonus;
    result.value_x18 = assessment.value_x18;
    return result;
}

int32_t LiquidationController::cancel_stale(uint64_t position_id) {
    EntryGuard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    auto it = records_.find(position_id);
    if (it == records_.end()) return errors::NO_LIQUIDATION;
    if (it->second.status == LiquidationStatus::EXECUTED) return errors::ALREADY_LIQUIDATED;

    auto loan = pool_.get_loan(it->second.loan_id);
    if (loan && loan->status == LoanStatus::ACTIVE) return errors::INVALID_PARAMETER;

    LiquidationRecord dropped = it->second;
    records_.erase(it);
    spdlog::debug("liquidation: stale record for position {} dropped", position_id);
    emit(EventKind::LIQUIDATION_CANCELLED, position_id, loan ? loan->borrower : Address{},
         dropped.debt_x18, dropped.bonus_x18, clock_.now());
    return errors::OK;
}

// =============================================================================
// Parameters
// =============================================================================

int32_t LiquidationController::set_parameters(const Address& caller, I128 threshold_x18,
                                              I128 bonus_x18, uint64_t delay) {
    if (!authority_.is_authorized(caller, Role::PARAMETER_ADMIN)) {
        return errors::UNAUTHORIZED;
    }

    LiquidationParams updated{threshold_x18, bonus_x18, delay};
    int32_t rc = updated.validate();
    if (rc != errors::OK) return rc;

    params_ = updated;
    spdlog::info("liquidation: threshold={} bonus={} delay={}s", x18::to_string(threshold_x18),
                 x18::to_string(bonus_x18), delay);
    emit(EventKind::LIQUIDATION_PARAMETERS_UPDATED, delay, caller, threshold_x18, bonus_x18,
         clock_.now());
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<LiquidationRecord> LiquidationController::get_record(uint64_t position_id) const {
    auto it = records_.find(position_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

bool LiquidationController::is_pending(uint64_t position_id) const {
    auto it = records_.find(position_id);
    return it != records_.end() && it->second.status == LiquidationStatus::TRIGGERED;
}

uint64_t LiquidationController::remaining_delay(uint64_t position_id) const {
    auto it = records_.find(position_id);
    if (it == records_.end() || it->second.status != LiquidationStatus::TRIGGERED) {
        return 0;
    }

    uint64_t elapsed = clock_.now() - it->second.trigger_time;
    return elapsed >= params_.delay ? 0 : params_.delay - elapsed;
}

I128 LiquidationController::liquidation_bonus(I128 value_x18) const {
    return math::apply_rate(value_x18, params_.bonus_x18);
}

LiquidationController::Stats LiquidationController::get_stats() const {
    uint64_t pending = 0;
    for (const auto& [id, record] : records_) {
        if (record.status == LiquidationStatus::TRIGGERED) ++pending;
    }
    return Stats{
        triggered_count_,
        executed_count_,
        pending,
        total_debt_settled_x18_,
        total_bonus_paid_x18_
    };
}

// =============================================================================
// Internal Helpers
// =============================================================================

void LiquidationController::emit(EventKind kind, uint64_t subject_id, const Address& party,
                                 I128 amount0, I128 amount1, uint64_t now) const {
    if (event_callback_) {
        event_callback_(Event{kind, subject_id, party, amount0, amount1, now});
    }
}

} // namespace pledge
