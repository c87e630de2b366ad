#ifndef PLEDGE_POOL_HPP
#define PLEDGE_POOL_HPP

#include <map>
#include <unordered_map>
#include <optional>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "host.hpp"
#include "journal.hpp"
#include "ledger.hpp"

namespace pledge {

// =============================================================================
// Loan
// =============================================================================

struct Loan {
    uint64_t id;
    Address borrower;
    uint64_t position_id;
    I128 principal_x18;
    I128 rate_x18;                // Annual rate snapshotted at origination
    uint64_t start_time;
    uint64_t maturity_time;
    I128 principal_repaid_x18;
    I128 interest_repaid_x18;
    LoanStatus status;

    I128 repaid_x18() const { return principal_repaid_x18 + interest_repaid_x18; }
};

// =============================================================================
// Pool State
// =============================================================================

struct PoolState {
    I128 total_liquidity_x18;     // Lender-owned balance, reserves excluded
    I128 total_borrowed_x18;      // Outstanding principal
    I128 total_reserves_x18;
    I128 total_shares_x18;

    I128 available_x18() const { return total_liquidity_x18 - total_borrowed_x18; }
};

struct PoolInfo {
    PoolState state;
    I128 utilization_x18;
    I128 current_rate_x18;
    I128 base_rate_x18;
    I128 slope_x18;
    I128 reserve_factor_x18;
};

// =============================================================================
// Operation Results
// =============================================================================

struct ProvideResult {
    int32_t error_code;
    I128 shares_x18;
};

struct WithdrawResult {
    int32_t error_code;
    I128 amount_x18;
};

struct OriginateResult {
    int32_t error_code;
    uint64_t loan_id;
    I128 rate_x18;
};

struct RepayResult {
    int32_t error_code;
    I128 applied_x18;             // Amount actually taken from the payer
    I128 interest_x18;            // Portion of applied that paid interest
    bool closed;
};

// =============================================================================
// LiquidityPool - lender shares, loans and interest
// =============================================================================

class LiquidityPool {
public:
    LiquidityPool(const PoolParams& params, const Address& self, CollateralLedger& ledger,
                  IBalances& balances, const IClock& clock, const IAuthority& authority);
    ~LiquidityPool() = default;

    // Non-copyable
    LiquidityPool(const LiquidityPool&) = delete;
    LiquidityPool& operator=(const LiquidityPool&) = delete;

    // =========================================================================
    // Lender Shares
    // =========================================================================

    // First provider (or empty pool) receives shares 1:1
    ProvideResult provide(const Address& lender, I128 amount_x18, Journal* parent = nullptr);

    // Redeem shares pro-rata; bounded by unborrowed liquidity
    WithdrawResult withdraw(const Address& lender, I128 shares_x18, Journal* parent = nullptr);

    I128 shares_of(const Address& lender) const;

    // =========================================================================
    // Rate Model
    // =========================================================================

    // totalBorrowed / totalLiquidity, 0 for an empty pool
    I128 utilization() const;

    // base_rate + utilization * slope
    I128 current_rate() const;

    // =========================================================================
    // Loans
    // =========================================================================

    OriginateResult originate(const Address& borrower, uint64_t position_id, I128 amount_x18,
                              uint64_t duration, Journal* parent = nullptr);

    // Interest is taken first; the loan closes once nothing is outstanding
    RepayResult repay(const Address& payer, uint64_t loan_id, I128 amount_x18,
                      Journal* parent = nullptr);

    // principal * rate * elapsed / YEAR, simple interest
    I128 accrued_interest(uint64_t loan_id) const;

    // principal + accrued - repaid, never negative
    I128 outstanding_debt(uint64_t loan_id) const;

    // False past maturity with outstanding debt, else the position's health
    bool is_healthy(uint64_t loan_id) const;

    // LIQUIDATOR only: `payer` covers the full debt, the loan closes as LIQUIDATED
    RepayResult settle_liquidation(const Address& caller, uint64_t loan_id, const Address& payer,
                                   I128 amount_x18, Journal* parent = nullptr);

    // =========================================================================
    // Administration (PARAMETER_ADMIN)
    // =========================================================================

    int32_t set_rate_model(const Address& caller, I128 base_rate_x18, I128 slope_x18);
    int32_t set_reserve_factor(const Address& caller, I128 factor_x18);
    int32_t withdraw_reserves(const Address& caller, const Address& to, I128 amount_x18);

    const PoolParams& params() const { return params_; }

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Loan> get_loan(uint64_t loan_id) const;
    std::vector<Loan> loans_of(const Address& borrower) const;
    std::optional<uint64_t> active_loan_for(uint64_t position_id) const;

    const PoolState& state() const { return state_; }
    PoolInfo pool_info() const;

    const Address& address() const { return self_; }

    // =========================================================================
    // Events & Statistics
    // =========================================================================

    void set_event_callback(EventCallback callback) { event_callback_ = std::move(callback); }

    struct Stats {
        uint64_t total_loans;
        uint64_t active_loans;
        uint64_t liquidated_loans;
        I128 total_originated_x18;
        I128 total_interest_x18;
        uint64_t lenders;
    };
    Stats get_stats() const;

private:
    PoolParams params_;
    Address self_;
    CollateralLedger& ledger_;
    IBalances& balances_;
    const IClock& clock_;
    const IAuthority& authority_;

    PoolState state_{0, 0, 0, 0};
    std::unordered_map<Address, I128, AddressHash> shares_;

    std::map<uint64_t, Loan> loans_;
    std::unordered_map<Address, std::vector<uint64_t>, AddressHash> by_borrower_;
    std::unordered_map<uint64_t, uint64_t> active_by_position_;
    uint64_t next_loan_id_{1};

    uint64_t active_count_{0};
    uint64_t liquidated_count_{0};
    I128 total_originated_x18_{0};
    I128 total_interest_x18_{0};

    bool entered_{false};
    EventCallback event_callback_;

    I128 accrued_at(const Loan& loan, uint64_t now) const;
    I128 outstanding_at(const Loan& loan, uint64_t now) const;

    // Book `amount` against the loan (interest first) and close it with
    // `final_status` once nothing is outstanding. Fills applied/interest/closed.
    int32_t apply_payment(Loan& loan, I128 amount_x18, uint64_t now, LoanStatus final_status,
                          Journal& journal, RepayResult& result);

    void adjust_shares(const Address& lender, I128 delta_x18, Journal& journal);

    void emit(EventKind kind, uint64_t subject_id, const Address& party,
              I128 amount0, I128 amount1, uint64_t now) const;
};

} // namespace pledge

#endif // PLEDGE_POOL_HPP
