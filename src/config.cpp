// =============================================================================
// config.cpp - Parameter validation and JSON configuration loading
// =============================================================================

#include "pledge/config.hpp"
#include "pledge/log.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

namespace pledge {

using json = nlohmann::json;

// =============================================================================
// Parameter Validation
// =============================================================================

int32_t OracleParams::validate() const {
    if (price_validity == 0) return errors::INVALID_PARAMETER;
    if (max_deviation_x18 <= 0) return errors::INVALID_PARAMETER;
    return errors::OK;
}

int32_t LedgerParams::validate() const {
    if (max_ltv_x18 <= 0 || max_ltv_x18 > X18_ONE) return errors::INVALID_PARAMETER;
    return errors::OK;
}

int32_t PoolParams::validate() const {
    if (base_rate_x18 < 0 || slope_x18 < 0) return errors::INVALID_PARAMETER;
    if (reserve_factor_x18 < 0 || reserve_factor_x18 > X18_ONE) return errors::INVALID_PARAMETER;
    return errors::OK;
}

int32_t LiquidationParams::validate() const {
    if (threshold_x18 <= 0 || threshold_x18 > X18_ONE) return errors::INVALID_PARAMETER;
    if (bonus_x18 <= 0 || bonus_x18 > limits::MAX_LIQUIDATION_BONUS_X18) return errors::INVALID_PARAMETER;
    if (delay > limits::MAX_LIQUIDATION_DELAY) return errors::INVALID_PARAMETER;
    return errors::OK;
}

void Config::validate() const {
    log::parse_level(general.log_level);
    if (oracle.validate() != errors::OK) {
        throw ConfigError("Invalid oracle parameters");
    }
    if (ledger.validate() != errors::OK) {
        throw ConfigError("Invalid ledger parameters: max_ltv must be in (0, 1]");
    }
    if (pool.validate() != errors::OK) {
        throw ConfigError("Invalid pool parameters");
    }
    if (liquidation.validate() != errors::OK) {
        throw ConfigError("Invalid liquidation parameters");
    }
}

// =============================================================================
// JSON Loading
// =============================================================================

namespace {

// Same whole-part bound as x18::from_string
constexpr double MAX_DECIMAL_WHOLE = 1e20;

// Decimals may be JSON strings ("0.05", exact) or numbers
I128 read_decimal(const json& section, const char* key, I128 fallback) {
    auto it = section.find(key);
    if (it == section.end()) return fallback;

    I128 value = 0;
    if (it->is_string()) {
        if (!x18::from_string(it->get<std::string>(), value)) {
            throw ConfigError(std::string("Malformed decimal for '") + key + "'");
        }
        return value;
    }
    if (it->is_number_unsigned()) {
        return static_cast<I128>(it->get<uint64_t>()) * X18_ONE;
    }
    if (it->is_number_integer()) {
        return x18::from_int(it->get<int64_t>());
    }
    if (it->is_number_float()) {
        // Shortest round-trip text keeps 0.05 exact; exponents fall back to double
        if (x18::from_string(it->dump(), value)) return value;
        double d = it->get<double>();
        if (!std::isfinite(d) || std::fabs(d) > MAX_DECIMAL_WHOLE) {
            throw ConfigError(std::string("Decimal out of range for '") + key + "'");
        }
        return x18::from_double(d);
    }
    throw ConfigError(std::string("Expected decimal for '") + key + "'");
}

uint64_t read_seconds(const json& section, const char* key, uint64_t fallback) {
    auto it = section.find(key);
    if (it == section.end()) return fallback;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        throw ConfigError(std::string("Expected non-negative integer for '") + key + "'");
    }
    return it->get<uint64_t>();
}

const json& section_or_empty(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return empty;
    if (!it->is_object()) {
        throw ConfigError(std::string("Section '") + name + "' must be an object");
    }
    return *it;
}

} // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Config parse error: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    Config config;

    const json& general = section_or_empty(root, "general");
    if (auto it = general.find("log_level"); it != general.end()) {
        if (!it->is_string()) throw ConfigError("Expected string for 'log_level'");
        config.general.log_level = it->get<std::string>();
    }

    const json& oracle = section_or_empty(root, "oracle");
    config.oracle.price_validity = read_seconds(oracle, "price_validity", config.oracle.price_validity);
    config.oracle.max_deviation_x18 = read_decimal(oracle, "max_deviation", config.oracle.max_deviation_x18);

    const json& ledger = section_or_empty(root, "ledger");
    config.ledger.max_ltv_x18 = read_decimal(ledger, "max_ltv", config.ledger.max_ltv_x18);

    const json& pool = section_or_empty(root, "pool");
    config.pool.base_rate_x18 = read_decimal(pool, "base_rate", config.pool.base_rate_x18);
    config.pool.slope_x18 = read_decimal(pool, "slope", config.pool.slope_x18);
    config.pool.reserve_factor_x18 = read_decimal(pool, "reserve_factor", config.pool.reserve_factor_x18);

    const json& liquidation = section_or_empty(root, "liquidation");
    config.liquidation.threshold_x18 = read_decimal(liquidation, "threshold", config.liquidation.threshold_x18);
    config.liquidation.bonus_x18 = read_decimal(liquidation, "bonus", config.liquidation.bonus_x18);
    config.liquidation.delay = read_seconds(liquidation, "delay", config.liquidation.delay);

    config.validate();
    return config;
}

} // namespace pledge
