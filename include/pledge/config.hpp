#ifndef PLEDGE_CONFIG_HPP
#define PLEDGE_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include "types.hpp"

namespace pledge {

// Configuration load / validation failure
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Protocol Limits
// =============================================================================

namespace limits {
constexpr I128 MAX_LIQUIDATION_BONUS_X18 = x18::from_percent(20);
constexpr uint64_t MAX_LIQUIDATION_DELAY = 24 * SECONDS_PER_HOUR;
constexpr uint64_t MAX_LOAN_DURATION = 10 * SECONDS_PER_YEAR;
}

// =============================================================================
// Component Parameters
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";
};

struct OracleParams {
    uint64_t price_validity = SECONDS_PER_HOUR;         // Spot price lifetime
    I128 max_deviation_x18 = x18::from_percent(20);     // Max relative spot move

    int32_t validate() const;
};

struct LedgerParams {
    I128 max_ltv_x18 = x18::from_percent(80);

    int32_t validate() const;
};

// rate(u) = base_rate + u * slope
struct PoolParams {
    I128 base_rate_x18 = x18::from_percent(5);
    I128 slope_x18 = x18::from_percent(20);
    I128 reserve_factor_x18 = x18::from_percent(10);    // Share of interest kept as reserves

    int32_t validate() const;
};

struct LiquidationParams {
    I128 threshold_x18 = x18::from_percent(80);         // Eligible iff value * threshold < debt
    I128 bonus_x18 = x18::from_percent(5);              // Fraction of collateral value
    uint64_t delay = SECONDS_PER_HOUR;                  // Trigger -> execute grace period

    int32_t validate() const;
};

// =============================================================================
// Config - full protocol configuration
// =============================================================================

class Config {
public:
    GeneralConfig general;
    OracleParams oracle;
    LedgerParams ledger;
    PoolParams pool;
    LiquidationParams liquidation;

    Config() = default;

    // Load from JSON file; throws ConfigError
    static Config from_file(std::string_view path);

    // Load from JSON text; throws ConfigError
    static Config from_json(std::string_view content);

    // Throws ConfigError naming the first invalid section
    void validate() const;

    // Builder methods
    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_price_validity(uint64_t seconds) {
        oracle.price_validity = seconds;
        return *this;
    }

    Config& set_max_deviation(I128 deviation_x18) {
        oracle.max_deviation_x18 = deviation_x18;
        return *this;
    }

    Config& set_max_ltv(I128 ltv_x18) {
        ledger.max_ltv_x18 = ltv_x18;
        return *this;
    }

    Config& set_rate_model(I128 base_rate_x18, I128 slope_x18) {
        pool.base_rate_x18 = base_rate_x18;
        pool.slope_x18 = slope_x18;
        return *this;
    }

    Config& set_reserve_factor(I128 factor_x18) {
        pool.reserve_factor_x18 = factor_x18;
        return *this;
    }

    Config& set_liquidation(I128 threshold_x18, I128 bonus_x18, uint64_t delay) {
        liquidation.threshold_x18 = threshold_x18;
        liquidation.bonus_x18 = bonus_x18;
        liquidation.delay = delay;
        return *this;
    }
};

} // namespace pledge

#endif // PLEDGE_CONFIG_HPP
