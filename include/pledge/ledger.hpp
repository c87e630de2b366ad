#ifndef PLEDGE_LEDGER_HPP
#define PLEDGE_LEDGER_HPP

#include <map>
#include <unordered_map>
#include <optional>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "host.hpp"
#include "journal.hpp"
#include "oracle.hpp"

namespace pledge {

// =============================================================================
// Collateral Position
// =============================================================================

struct CollateralPosition {
    uint64_t id;
    AssetRef asset;
    Address owner;
    I128 value_at_deposit_x18;
    I128 ltv_x18;                 // Max LTV in force at deposit
    I128 requested_x18;           // Loan amount requested at deposit
    PositionStatus status;
    uint64_t deposit_time;
    uint64_t bound_loan;          // Active loan encumbering the position, 0 = none
};

struct DepositResult {
    int32_t error_code;
    uint64_t position_id;
    I128 value_x18;
};

// =============================================================================
// CollateralLedger - custody records for pledged unique assets
// =============================================================================

class CollateralLedger {
public:
    CollateralLedger(const LedgerParams& params, const Address& self,
                     IValuation& valuation, ICustody& custody,
                     const IClock& clock, const IAuthority& authority);
    ~CollateralLedger() = default;

    // Non-copyable
    CollateralLedger(const CollateralLedger&) = delete;
    CollateralLedger& operator=(const CollateralLedger&) = delete;

    // =========================================================================
    // Custody
    // =========================================================================

    // Pledge `asset`; fails ALREADY_PLEDGED / EXCEEDS_LOAN_TO_VALUE
    DepositResult deposit(const Address& owner, const AssetRef& asset,
                          I128 loan_amount_requested_x18, Journal* parent = nullptr);

    // Owner-only, unencumbered and active
    int32_t withdraw(const Address& caller, uint64_t position_id, Journal* parent = nullptr);

    // LIQUIDATOR only: close and send custody to `recipient`
    int32_t force_close(const Address& caller, uint64_t position_id,
                        const Address& recipient, Journal* parent = nullptr);

    // =========================================================================
    // Loan Binding (LOAN_BOOK)
    // =========================================================================

    int32_t bind_loan(const Address& caller, uint64_t position_id, uint64_t loan_id,
                      Journal* parent = nullptr);
    int32_t release_loan(const Address& caller, uint64_t position_id, uint64_t loan_id,
                         Journal* parent = nullptr);

    // =========================================================================
    // Health & Valuation
    // =========================================================================

    // True iff the position is active; debt-aware health lives in the controller
    bool is_healthy(uint64_t position_id) const;

    // Current valuation of the stored asset reference
    PriceQuote value_of(uint64_t position_id) const;

    // =========================================================================
    // Parameters (PARAMETER_ADMIN)
    // =========================================================================

    int32_t set_max_ltv(const Address& caller, I128 ltv_x18);
    I128 max_ltv() const { return params_.max_ltv_x18; }

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<CollateralPosition> get_position(uint64_t position_id) const;
    std::vector<CollateralPosition> positions_of(const Address& owner) const;
    std::optional<uint64_t> active_position_for(const AssetRef& asset) const;

    const Address& address() const { return self_; }

    // =========================================================================
    // Events & Statistics
    // =========================================================================

    void set_event_callback(EventCallback callback) { event_callback_ = std::move(callback); }

    struct Stats {
        uint64_t total_positions;
        uint64_t active_positions;
        uint64_t liquidated_positions;
        I128 total_value_locked_x18;      // Sum of value at deposit, active positions
    };
    Stats get_stats() const;

private:
    LedgerParams params_;
    Address self_;
    IValuation& valuation_;
    ICustody& custody_;
    const IClock& clock_;
    const IAuthority& authority_;

    std::map<uint64_t, CollateralPosition> positions_;
    std::unordered_map<AssetRef, uint64_t> active_by_asset_;
    std::unordered_map<Address, std::vector<uint64_t>, AddressHash> by_owner_;
    uint64_t next_position_id_{1};

    uint64_t active_count_{0};
    uint64_t liquidated_count_{0};
    I128 value_locked_x18_{0};

    bool entered_{false};
    EventCallback event_callback_;

    // Mark an active position closed with `status`; undo registered on `journal`
    void close_position(CollateralPosition& position, PositionStatus status, Journal& journal);

    void emit(EventKind kind, uint64_t subject_id, const Address& party,
              I128 amount0, I128 amount1, uint64_t now) const;
};

} // namespace pledge

#endif // PLEDGE_LEDGER_HPP
