#ifndef PLEDGE_LIQUIDATION_HPP
#define PLEDGE_LIQUIDATION_HPP

#include <map>
#include <optional>

#include "types.hpp"
#include "config.hpp"
#include "host.hpp"
#include "journal.hpp"
#include "ledger.hpp"
#include "pool.hpp"

namespace pledge {

// =============================================================================
// Liquidation Record
// =============================================================================

struct LiquidationRecord {
    uint64_t position_id;
    uint64_t loan_id;
    I128 debt_x18;                // Snapshot at trigger
    I128 value_x18;               // Snapshot at trigger
    I128 bonus_x18;               // value * bonus rate at trigger
    LiquidationStatus status;
    uint64_t trigger_time;
    Address executor;             // Zero until executed
    uint64_t execution_time;
};

struct LiquidationResult {
    int32_t error_code;
    uint64_t position_id;
    uint64_t loan_id;
    Address liquidator;
    I128 debt_x18;                // Debt settled at execution
    I128 bonus_x18;
    I128 value_x18;
};

// =============================================================================
// LiquidationController - eligibility, trigger and seize-and-settle
//
// Healthy -> Eligible -> Triggered -> (Executed | re-Eligible)
//
// Anyone may trigger an eligible position. Execution is open to anyone too,
// but only after the delay has elapsed since the last trigger, giving the
// borrower a window to repay. The first successful execute wins.
// =============================================================================

class LiquidationController {
public:
    LiquidationController(const LiquidationParams& params, const Address& self,
                          CollateralLedger& ledger, LiquidityPool& pool, IBalances& balances,
                          const IClock& clock, const IAuthority& authority);
    ~LiquidationController() = default;

    // Non-copyable
    LiquidationController(const LiquidationController&) = delete;
    LiquidationController& operator=(const LiquidationController&) = delete;

    // =========================================================================
    // Eligibility
    // =========================================================================

    // value * threshold < outstanding debt of the position's active loan
    bool is_eligible(uint64_t position_id) const;

    // =========================================================================
    // Liquidation Flow
    // =========================================================================

    // Snapshot debt/value/bonus. Re-triggering a live record refreshes the
    // snapshot but keeps the first trigger time.
    LiquidationResult trigger(const Address& caller, uint64_t position_id);

    // Collect debt + bonus from the caller, close the loan, pay the bonus
    // back and move custody to the caller
    LiquidationResult execute(const Address& caller, uint64_t position_id);

    // Drop a live record whose loan is no longer active; emits LIQUIDATION_CANCELLED
    int32_t cancel_stale(uint64_t position_id);

    // =========================================================================
    // Parameters (PARAMETER_ADMIN)
    // =========================================================================

    int32_t set_parameters(const Address& caller, I128 threshold_x18, I128 bonus_x18, uint64_t delay);
    const LiquidationParams& params() const { return params_; }

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<LiquidationRecord> get_record(uint64_t position_id) const;
    bool is_pending(uint64_t position_id) const;

    // Seconds until execute is allowed, 0 when allowed or not pending
    uint64_t remaining_delay(uint64_t position_id) const;

    I128 liquidation_bonus(I128 value_x18) const;

    const Address& address() const { return self_; }

    // =========================================================================
    // Events & Statistics
    // =========================================================================

    void set_event_callback(EventCallback callback) { event_callback_ = std::move(callback); }

    struct Stats {
        uint64_t triggered;
        uint64_t executed;
        uint64_t pending;
        I128 total_debt_settled_x18;
        I128 total_bonus_paid_x18;
    };
    Stats get_stats() const;

private:
    LiquidationParams params_;
    Address self_;
    CollateralLedger& ledger_;
    LiquidityPool& pool_;
    IBalances& balances_;
    const IClock& clock_;
    const IAuthority& authority_;

    std::map<uint64_t, LiquidationRecord> records_;

    uint64_t triggered_count_{0};
    uint64_t executed_count_{0};
    I128 total_debt_settled_x18_{0};
    I128 total_bonus_paid_x18_{0};

    bool entered_{false};
    EventCallback event_callback_;

    struct Assessment {
        int32_t error_code;
        uint64_t loan_id;
        I128 debt_x18;
        I128 value_x18;
        bool eligible;
    };
    Assessment assess(uint64_t position_id) const;

    void emit(EventKind kind, uint64_t subject_id, const Address& party,
              I128 amount0, I128 amount1, uint64_t now) const;
};

} // namespace pledge

#endif // PLEDGE_LIQUIDATION_HPP
