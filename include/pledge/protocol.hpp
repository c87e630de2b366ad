#ifndef PLEDGE_PROTOCOL_HPP
#define PLEDGE_PROTOCOL_HPP

// =============================================================================
// Pledge - Collateralized Lending Core
//
// Component accounts (balances and custody are held under these):
//   0x...9101: CollateralLedger      (Custody of pledged assets)
//   0x...9102: LiquidityPool         (Lender funds, loans, reserves)
//   0x...9103: LiquidationController (Seize-and-settle escrow)
//
// =============================================================================

#include <memory>
#include <unordered_set>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "host.hpp"
#include "oracle.hpp"
#include "ledger.hpp"
#include "pool.hpp"
#include "liquidation.hpp"

namespace pledge {

namespace addresses {
constexpr Address PLEDGE_LEDGER = from_id(0x9101);
constexpr Address PLEDGE_POOL = from_id(0x9102);
constexpr Address PLEDGE_LIQUIDATION = from_id(0x9103);
} // namespace addresses

// =============================================================================
// Facade Results
// =============================================================================

struct BorrowResult {
    int32_t error_code;
    uint64_t position_id;
    uint64_t loan_id;
    I128 rate_x18;
};

struct ProtocolInfo {
    I128 total_collateral_value_x18;    // Value at deposit of active positions
    I128 total_loans_outstanding_x18;   // Outstanding principal
    I128 total_liquidity_x18;
    I128 total_reserves_x18;
    uint64_t active_positions;
    uint64_t active_loans;
};

// =============================================================================
// Protocol - owns and wires the four components
// =============================================================================

class Protocol {
public:
    // Throws ConfigError on invalid configuration or a zero owner
    Protocol(const Config& config, const Address& owner, IBalances& balances,
             ICustody& custody, const IClock& clock);
    ~Protocol();

    // Non-copyable
    Protocol(const Protocol&) = delete;
    Protocol& operator=(const Protocol&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    ValuationOracle& oracle() { return *oracle_; }
    const ValuationOracle& oracle() const { return *oracle_; }

    CollateralLedger& ledger() { return *ledger_; }
    const CollateralLedger& ledger() const { return *ledger_; }

    LiquidityPool& pool() { return *pool_; }
    const LiquidityPool& pool() const { return *pool_; }

    LiquidationController& liquidation() { return *liquidation_; }
    const LiquidationController& liquidation() const { return *liquidation_; }

    RoleRegistry& roles() { return roles_; }
    const RoleRegistry& roles() const { return roles_; }

    // =========================================================================
    // Asset Allow-List (PARAMETER_ADMIN)
    // =========================================================================

    int32_t set_asset_allowed(const Address& caller, const Address& asset_class, bool allowed);
    bool is_asset_allowed(const Address& asset_class) const;

    // =========================================================================
    // Combined User Flows
    // =========================================================================

    // Pledge and borrow `amount` in one step; both happen or neither
    BorrowResult deposit_and_borrow(const Address& borrower, const AssetRef& asset,
                                    I128 amount_x18, uint64_t duration);

    // Repay; when the loan closes the collateral is returned in the same call
    RepayResult repay_and_withdraw(const Address& borrower, uint64_t loan_id, I128 amount_x18);

    // =========================================================================
    // Queries
    // =========================================================================

    ProtocolInfo protocol_info() const;
    std::vector<CollateralPosition> user_positions(const Address& owner) const;
    std::vector<Loan> user_loans(const Address& borrower) const;

    // Install one callback on every component
    void set_event_callback(EventCallback callback);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct GlobalStats {
        ValuationOracle::Stats oracle_stats;
        CollateralLedger::Stats ledger_stats;
        LiquidityPool::Stats pool_stats;
        LiquidationController::Stats liquidation_stats;
    };
    GlobalStats get_stats() const;

    static constexpr const char* version() { return "1.0.0"; }

    struct ComponentInfo {
        const char* name;
        Address address;
        const char* description;
    };
    static std::vector<ComponentInfo> components() {
        return {
            {"CollateralLedger",      addresses::PLEDGE_LEDGER,      "Custody of pledged assets"},
            {"LiquidityPool",         addresses::PLEDGE_POOL,        "Lender shares, loans and interest"},
            {"LiquidationController", addresses::PLEDGE_LIQUIDATION, "Trigger and seize-and-settle"},
        };
    }

private:
    const IClock& clock_;
    RoleRegistry roles_;

    std::unique_ptr<ValuationOracle> oracle_;
    std::unique_ptr<CollateralLedger> ledger_;
    std::unique_ptr<LiquidityPool> pool_;
    std::unique_ptr<LiquidationController> liquidation_;

    std::unordered_set<Address, AddressHash> allowed_;
    EventCallback event_callback_;
};

} // namespace pledge

#endif // PLEDGE_PROTOCOL_HPP
