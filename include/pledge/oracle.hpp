#ifndef PLEDGE_ORACLE_HPP
#define PLEDGE_ORACLE_HPP

#include <unordered_map>
#include <unordered_set>
#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "host.hpp"

namespace pledge {

// =============================================================================
// Price Records
// =============================================================================

struct SpotPrice {
    I128 price_x18;
    uint64_t timestamp;      // When the spot was reported
};

struct PriceQuote {
    int32_t error_code;
    I128 price_x18;
    bool from_spot;          // false = class floor fallback
    uint64_t timestamp;
};

// =============================================================================
// Valuation Interface
//
// The ledger only needs "what is this asset worth now". Keeping that behind
// an interface lets a reporter set or model replace the oracle below.
// =============================================================================

class IValuation {
public:
    virtual ~IValuation() = default;

    virtual PriceQuote quote(const AssetRef& asset) const = 0;
};

// =============================================================================
// Reference Rate Source
//
// Latest rate of the valuation currency in a reference currency (a fiat unit,
// say). The host adapts its feed; the oracle only reads it.
// =============================================================================

struct ReferenceRate {
    I128 rate_x18;           // Reference units per valuation unit
    uint64_t timestamp;      // When the feed last reported
};

class IReferenceRateSource {
public:
    virtual ~IReferenceRateSource() = default;

    virtual bool is_available() const = 0;
    virtual std::optional<ReferenceRate> latest_rate() const = 0;
};

// Host-pushed rate for simulations and tests
class ManualReferenceRate : public IReferenceRateSource {
public:
    void set_rate(I128 rate_x18, uint64_t timestamp) { rate_ = ReferenceRate{rate_x18, timestamp}; }
    void clear() { rate_.reset(); }

    bool is_available() const override { return rate_.has_value(); }
    std::optional<ReferenceRate> latest_rate() const override { return rate_; }

private:
    std::optional<ReferenceRate> rate_;
};

// =============================================================================
// ValuationOracle - floor / spot price book per asset class
// =============================================================================

class ValuationOracle : public IValuation {
public:
    ValuationOracle(const OracleParams& params, const IClock& clock, const IAuthority& authority);
    ~ValuationOracle() override = default;

    // Non-copyable
    ValuationOracle(const ValuationOracle&) = delete;
    ValuationOracle& operator=(const ValuationOracle&) = delete;

    // =========================================================================
    // Configuration (PARAMETER_ADMIN)
    // =========================================================================

    int32_t set_asset_class_support(const Address& caller, const Address& asset_class, bool supported);
    bool is_supported(const Address& asset_class) const;

    int32_t set_params(const Address& caller, const OracleParams& params);
    const OracleParams& params() const { return params_; }

    // Not owned; nullptr detaches
    int32_t set_reference_source(const Address& caller, const IReferenceRateSource* source);
    bool has_reference_source() const { return reference_source_ != nullptr; }

    // =========================================================================
    // Price Updates (PRICE_UPDATER)
    // =========================================================================

    // Administrative re-anchor; no deviation cap
    int32_t set_floor_price(const Address& caller, const Address& asset_class, I128 price_x18);

    // Rejected with DEVIATION_EXCEEDED when |new - prev| / prev > max_deviation
    int32_t set_spot_price(const Address& caller, const Address& asset_class,
                           uint64_t asset_id, I128 price_x18);

    // All-or-nothing: any bad element fails the whole batch
    int32_t batch_update_prices(const Address& caller, const Address& asset_class,
                                const std::vector<uint64_t>& asset_ids,
                                const std::vector<I128>& prices_x18);

    int32_t batch_update_valuations(const Address& caller,
                                    const std::vector<std::pair<AssetRef, I128>>& updates);

    // =========================================================================
    // Price Queries
    // =========================================================================

    // Valid spot, else floor
    PriceQuote quote(const AssetRef& asset) const override;

    // quote() converted at the reference rate. The rate obeys the same
    // validity window as spot prices; timestamp is the older of the two.
    PriceQuote quote_in_reference(const AssetRef& asset) const;

    std::optional<I128> get_price(const Address& asset_class, uint64_t asset_id) const;
    std::optional<I128> get_floor_price(const Address& asset_class) const;
    std::optional<SpotPrice> get_spot_price(const AssetRef& asset) const;

    // =========================================================================
    // Staleness & Validity
    // =========================================================================

    bool is_price_valid(const AssetRef& asset) const;
    std::optional<uint64_t> price_age(const AssetRef& asset) const;

    // =========================================================================
    // Events & Statistics
    // =========================================================================

    void set_event_callback(EventCallback callback) { event_callback_ = std::move(callback); }

    struct Stats {
        uint64_t supported_classes;
        uint64_t spot_prices;
        uint64_t total_updates;
        uint64_t rejected_updates;
    };
    Stats get_stats() const;

private:
    OracleParams params_;
    const IClock& clock_;
    const IAuthority& authority_;
    const IReferenceRateSource* reference_source_{nullptr};

    std::unordered_set<Address, AddressHash> supported_;
    std::unordered_map<Address, I128, AddressHash> floors_;
    std::unordered_map<AssetRef, SpotPrice> spots_;

    EventCallback event_callback_;

    uint64_t total_updates_{0};
    uint64_t rejected_updates_{0};

    // Validate one spot update against `reference` (previous spot, if any)
    int32_t check_spot(const AssetRef& asset, I128 price_x18,
                       std::optional<I128> reference) const;

    void apply_spot(const AssetRef& asset, I128 price_x18, uint64_t now);
    void emit(EventKind kind, uint64_t subject_id, const Address& party,
              I128 amount0, I128 amount1, uint64_t now) const;
};

} // namespace pledge

#endif // PLEDGE_ORACLE_HPP
