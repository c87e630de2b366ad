// =============================================================================
// oracle.cpp - ValuationOracle floor / spot price book
// =============================================================================

#include "pledge/oracle.hpp"
#include "pledge/math.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pledge {

// =============================================================================
// Constructor
// =============================================================================

ValuationOracle::ValuationOracle(const OracleParams& params, const IClock& clock,
                                 const IAuthority& authority)
    : params_(params), clock_(clock), authority_(authority) {}

// =============================================================================
// Configuration
// =============================================================================

int32_t ValuationOracle::set_asset_class_support(const Address& caller, const Address& asset_class,
                                                 bool supported) {
    if (!authority_.is_authorized(caller, Role::PARAMETER_ADMIN)) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(asset_class)) {
        return errors::UNSUPPORTED_ASSET_CLASS;
    }

    if (supported) {
        supported_.insert(asset_class);
    } else {
        supported_.erase(asset_class);
    }

    spdlog::info("oracle: asset class {} support={}", addresses::to_hex(asset_class), supported);
    emit(EventKind::ASSET_CLASS_SUPPORT, 0, asset_class, supported ? 1 : 0, 0, clock_.now());
    return errors::OK;
}

bool ValuationOracle::is_supported(const Address& asset_class) const {
    return supported_.count(asset_class) > 0;
}

int32_t ValuationOracle::set_params(const Address& caller, const OracleParams& params) {
    if (!authority_.is_authorized(caller, Role::PARAMETER_ADMIN)) {
        return errors::UNAUTHORIZED;
    }
    int32_t rc = params.validate();
    if (rc != errors::OK) return rc;

    params_ = params;

    spdlog::info("oracle: params validity={}s max_deviation={}", params.price_validity,
                 x18::to_string(params.max_deviation_x18));
    emit(EventKind::ORACLE_PARAMETERS_UPDATED, params.price_validity, caller,
         params.max_deviation_x18, 0, clock_.now());
    return errors::OK;
}

int32_t ValuationOracle::set_reference_source(const Address& caller,
                                              const IReferenceRateSource* source) {
    if (!authority_.is_authorized(caller, Role::PARAMETER_ADMIN)) {
        return errors::UNAUTHORIZED;
    }

    reference_source_ = source;

    spdlog::info("oracle: reference source {}", source ? "attached" : "detached");
    emit(EventKind::REFERENCE_SOURCE_UPDATED, 0, caller, source ? 1 : 0, 0, clock_.now());
    return errors::OK;
}

// =============================================================================
// Price Updates
// =============================================================================

int32_t ValuationOracle::set_floor_price(const Address& caller, const Address& asset_class,
                                         I128 price_x18) {
    if (!authority_.is_authorized(caller, Role::PRICE_UPDATER)) {
        return errors::UNAUTHORIZED;
    }
    if (!is_supported(asset_class)) {
        return errors::UNSUPPORTED_ASSET_CLASS;
    }
    if (price_x18 <= 0) {
        return errors::INVALID_PRICE;
    }

    floors_[asset_class] = price_x18;
    ++total_updates_;

    spdlog::debug("oracle: floor {} = {}", addresses::to_hex(asset_class), x18::to_string(price_x18));
    emit(EventKind::FLOOR_PRICE_UPDATED, 0, asset_class, price_x18, 0, clock_.now());
    return errors::OK;
}

int32_t ValuationOracle::set_spot_price(const Address& caller, const Address& asset_class,
                                        uint64_t asset_id, I128 price_x18) {
    if (!authority_.is_authorized(caller, Role::PRICE_UPDATER)) {
        return errors::UNAUTHORIZED;
    }

    AssetRef asset{asset_class, asset_id};
    std::optional<I128> reference;
    if (auto it = spots_.find(asset); it != spots_.end()) {
        reference = it->second.price_x18;
    }

    int32_t rc = check_spot(asset, price_x18, reference);
    if (rc != errors::OK) {
        ++rejected_updates_;
        return rc;
    }

    apply_spot(asset, price_x18, clock_.now());
    return errors::OK;
}

int32_t ValuationOracle::batch_update_prices(const Address& caller, const Address& asset_class,
                                             const std::vector<uint64_t>& asset_ids,
                                             const std::vector<I128>& prices_x18) {
    if (asset_ids.size() != prices_x18.size()) {
        return errors::BATCH_LENGTH_MISMATCH;
    }

    std::vector<std::pair<AssetRef, I128>> updates;
    updates.reserve(asset_ids.size());
    for (size_t i = 0; i < asset_ids.size(); ++i) {
        updates.emplace_back(AssetRef{asset_class, asset_ids[i]}, prices_x18[i]);
    }
    return batch_update_valuations(caller, updates);
}

int32_t ValuationOracle::batch_update_valuations(const Address& caller,
                                                 const std::vector<std::pair<AssetRef, I128>>& updates) {
    if (!authority_.is_authorized(caller, Role::PRICE_UPDATER)) {
        return errors::UNAUTHORIZED;
    }

    // Validate every element first; repeated assets are checked against the
    // price staged earlier in the same batch
    std::unordered_map<AssetRef, I128> staged;
    for (const auto& [asset, price] : updates) {
        std::optional<I128> reference;
        if (auto st = staged.find(asset); st != staged.end()) {
            reference = st->second;
        } else if (auto it = spots_.find(asset); it != spots_.end()) {
            reference = it->second.price_x18;
        }

        int32_t rc = check_spot(asset, price, reference);
        if (rc != errors::OK) {
            ++rejected_updates_;
            spdlog::warn("oracle: batch of {} rejected at asset {}: {}",
                         updates.size(), asset.asset_id, errors::name(rc));
            return rc;
        }
        staged[asset] = price;
    }

    uint64_t now = clock_.now();
    for (const auto& [asset, price] : updates) {
        apply_spot(asset, price, now);
    }
    return errors::OK;
}

// =============================================================================
// Price Queries
// =============================================================================

PriceQuote ValuationOracle::quote(const AssetRef& asset) const {
    PriceQuote result{errors::OK, 0, false, 0};

    if (!is_supported(asset.asset_class)) {
        result.error_code = errors::UNSUPPORTED_ASSET_CLASS;
        return result;
    }

    uint64_t now = clock_.now();
    if (auto it = spots_.find(asset); it != spots_.end()) {
        const SpotPrice& spot = it->second;
        if (now - spot.timestamp <= params_.price_validity) {
            result.price_x18 = spot.price_x18;
            result.from_spot = true;
            result.timestamp = spot.timestamp;
            return result;
        }
    }

    auto floor = floors_.find(asset.asset_class);
    if (floor == floors_.end()) {
        result.error_code = errors::PRICE_UNAVAILABLE;
        return result;
    }

    result.price_x18 = floor->second;
    result.timestamp = now;
    return result;
}

PriceQuote ValuationOracle::quote_in_reference(const AssetRef& asset) const {
    PriceQuote result = quote(asset);
    if (result.error_code != errors::OK) return result;

    std::optional<ReferenceRate> rate;
    if (reference_source_ && reference_source_->is_available()) {
        rate = reference_source_->latest_rate();
    }

    uint64_t now = clock_.now();
    if (!rate || rate->rate_x18 <= 0 || rate->timestamp > now ||
        now - rate->timestamp > params_.price_validity) {
        return PriceQuote{errors::REFERENCE_RATE_UNAVAILABLE, 0, result.from_spot, 0};
    }

    result.price_x18 = math::mul_div(result.price_x18, rate->rate_x18, X18_ONE);
    result.timestamp = std::min(result.timestamp, rate->timestamp);
    return result;
}

std::optional<I128> ValuationOracle::get_price(const Address& asset_class, uint64_t asset_id) const {
    PriceQuote q = quote(AssetRef{asset_class, asset_id});
    if (q.error_code != errors::OK) return std::nullopt;
    return q.price_x18;
}

std::optional<I128> ValuationOracle::get_floor_price(const Address& asset_class) const {
    auto it = floors_.find(asset_class);
    if (it == floors_.end()) return std::nullopt;
    return it->second;
}

std::optional<SpotPrice> ValuationOracle::get_spot_price(const AssetRef& asset) const {
    auto it = spots_.find(asset);
    if (it == spots_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Staleness & Validity
// =============================================================================

bool ValuationOracle::is_price_valid(const AssetRef& asset) const {
    auto it = spots_.find(asset);
    if (it == spots_.end()) return false;
    return clock_.now() - it->second.timestamp <= params_.price_validity;
}

std::optional<uint64_t> ValuationOracle::price_age(const AssetRef& asset) const {
    auto it = spots_.find(asset);
    if (it == spots_.end()) return std::nullopt;
    return clock_.now() - it->second.timestamp;
}

// =============================================================================
// Statistics
// =============================================================================

ValuationOracle::Stats ValuationOracle::get_stats() const {
    return Stats{
        static_cast<uint64_t>(supported_.size()),
        static_cast<uint64_t>(spots_.size()),
        total_updates_,
        rejected_updates_
    };
}

// =============================================================================
// Internal Helpers
// =============================================================================

int32_t ValuationOracle::check_spot(const AssetRef& asset, I128 price_x18,
                                    std::optional<I128> reference) const {
    if (!is_supported(asset.asset_class)) {
        return errors::UNSUPPORTED_ASSET_CLASS;
    }
    if (price_x18 <= 0) {
        return errors::INVALID_PRICE;
    }
    if (!reference) {
        return errors::OK;
    }

    // |new - prev| * 1 > max_deviation * prev, evaluated without rounding
    I128 prev = *reference;
    I128 diff = math::abs128(price_x18 - prev);
    if (math::compare_products(diff, X18_ONE, params_.max_deviation_x18, prev) > 0) {
        spdlog::warn("oracle: spot {}#{} {} -> {} exceeds deviation cap",
                     addresses::to_hex(asset.asset_class), asset.asset_id,
                     x18::to_string(prev), x18::to_string(price_x18));
        return errors::DEVIATION_EXCEEDED;
    }
    return errors::OK;
}

void ValuationOracle::apply_spot(const AssetRef& asset, I128 price_x18, uint64_t now) {
    spots_[asset] = SpotPrice{price_x18, now};
    ++total_updates_;

    spdlog::debug("oracle: spot {}#{} = {}", addresses::to_hex(asset.asset_class),
                  asset.asset_id, x18::to_string(price_x18));
    emit(EventKind::SPOT_PRICE_UPDATED, asset.asset_id, asset.asset_class, price_x18, 0, now);
}

void ValuationOracle::emit(EventKind kind, uint64_t subject_id, const Address& party,
                           I128 amount0, I128 amount1, uint64_t now) const {
    if (event_callback_) {
        event_callback_(Event{kind, subject_id, party, amount0, amount1, now});
    }
}

} // namespace pledge
