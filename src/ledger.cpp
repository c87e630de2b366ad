// =============================================================================
// ledger.cpp - CollateralLedger custody records and position lifecycle
// =============================================================================

#include "pledge/ledger.hpp"
#include "pledge/math.hpp"

#include <spdlog/spdlog.h>

namespace pledge {

// =============================================================================
// Constructor
// =============================================================================

CollateralLedger::CollateralLedger(const LedgerParams& params, const Address& self,
                                   IValuation& valuation, ICustody& custody,
                                   const IClock& clock, const IAuthority& authority)
    : params_(params)
    , self_(self)
    , valuation_(valuation)
    , custody_(custody)
    , clock_(clock)
    , authority_(authority) {}

// =============================================================================
// Custody
// =============================================================================

DepositResult CollateralLedger::deposit(const Address& owner, const AssetRef& asset,
                                        I128 loan_amount_requested_x18, Journal* parent) {
    DepositResult result{errors::OK, 0, 0};

    EntryGuard guard(entered_);
    if (!guard.acquired()) {
        result.error_code = errors::REENTRANCY;
        return result;
    }

    if (loan_amount_requested_x18 <= 0) {
        result.error_code = errors::INVALID_AMOUNT;
        return result;
    }
    if (active_by_asset_.count(asset) > 0) {
        result.error_code = errors::ALREADY_PLEDGED;
        return result;
    }

    PriceQuote quote = valuation_.quote(asset);
    if (quote.error_code != errors::OK) {
        result.error_code = quote.error_code;
        return result;
    }
    if (quote.price_x18 <= 0) {
        result.error_code = errors::INVALID_PRICE;
        return result;
    }

    // requested / value > max_ltv, compared as requested * 1 > max_ltv * value
    I128 value = quote.price_x18;
    if (math::compare_products(loan_amount_requested_x18, X18_ONE, params_.max_ltv_x18, value) > 0) {
        spdlog::debug("ledger: deposit of {}#{} rejected, requested {} against value {}",
                      addresses::to_hex(asset.asset_class), asset.asset_id,
                      x18::to_string(loan_amount_requested_x18), x18::to_string(value));
        result.error_code = errors::EXCEEDS_LOAN_TO_VALUE;
        return result;
    }

    uint64_t now = clock_.now();
    Journal journal(parent);

    // Record the position before taking custody
    uint64_t id = next_position_id_++;
    positions_.emplace(id, CollateralPosition{
        id, asset, owner, value, params_.max_ltv_x18, loan_amount_requested_x18,
        PositionStatus::ACTIVE, now, 0
    });
    active_by_asset_[asset] = id;
    by_owner_[owner].push_back(id);
    ++active_count_;
    value_locked_x18_ += value;

    journal.on_rollback([this, id, asset, owner, value] {
        positions_.erase(id);
        active_by_asset_.erase(asset);
        auto& owned = by_owner_[owner];
        owned.pop_back();
        if (owned.empty()) by_owner_.erase(owner);
        --active_count_;
        value_locked_x18_ -= value;
        next_position_id_ = id;
    });

    if (!custody_.transfer(asset, owner, self_)) {
        spdlog::warn("ledger: custody transfer of {}#{} from {} refused",
                     addresses::to_hex(asset.asset_class), asset.asset_id, addresses::to_hex(owner));
        result.error_code = errors::TRANSFER_FAILED;
        return result;
    }
    journal.on_compensate([this, asset, owner] {
        if (custody_.transfer(asset, self_, owner)) return true;
        spdlog::critical("ledger: could not return {}#{} to {} during rollback",
                         addresses::to_hex(asset.asset_class), asset.asset_id,
                         addresses::to_hex(owner));
        return false;
    });

    I128 requested = loan_amount_requested_x18;
    journal.on_commit([this, id, owner, value, requested, now] {
        emit(EventKind::COLLATERAL_DEPOSITED, id, owner, value, requested, now);
    });
    journal.commit();

    spdlog::info("ledger: position {} opened by {} for {}#{} valued {}", id,
                 addresses::to_hex(owner), addresses::to_hex(asset.asset_class),
                 asset.asset_id, x18::to_string(value));

    result.position_id = id;
    result.value_x18 = value;
    return result;
}

int32_t CollateralLedger::withdraw(const Address& caller, uint64_t position_id, Journal* parent) {
    EntryGuard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    auto it = positions_.find(position_id);
    if (it == positions_.end()) return errors::POSITION_NOT_FOUND;

    CollateralPosition& position = it->second;
    if (position.owner != caller) return errors::NOT_OWNER;
    if (!is_healthy(position_id)) return errors::POSITION_NOT_ACTIVE;
    if (position.bound_loan != 0) return errors::POSITION_ENCUMBERED;

    uint64_t now = clock_.now();
    Journal journal(parent);
    close_position(position, PositionStatus::WITHDRAWN, journal);

    AssetRef asset = position.asset;
    Address owner = position.owner;
    if (!custody_.transfer(asset, self_, owner)) {
        spdlog::warn("ledger: custody return of position {} refused", position_id);
        return errors::TRANSFER_FAILED;
    }
    journal.on_compensate([this, asset, owner] {
        if (custody_.transfer(asset, owner, self_)) return true;
        spdlog::critical("ledger: could not reclaim {}#{} from {} during rollback",
                         addresses::to_hex(asset.asset_class), asset.asset_id,
                         addresses::to_hex(owner));
        return false;
    });

    I128 value = position.value_at_deposit_x18;
    journal.on_commit([this, position_id, owner, value, now] {
        emit(EventKind::COLLATERAL_WITHDRAWN, position_id, owner, value, 0, now);
    });
    journal.commit();

    spdlog::info("ledger: position {} withdrawn", position_id);
    return errors::OK;
}

int32_t CollateralLedger::force_close(const Address& caller, uint64_t position_id,
                                      const Address& recipient, Journal* parent) {
    EntryGuard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    if (!authority_.is_authorized(caller, Role::LIQUIDATOR)) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(recipient)) return errors::INVALID_PARAMETER;

    auto it = positions_.find(position_id);
    if (it == positions_.end()) return errors::POSITION_NOT_FOUND;

    CollateralPosition& position = it->second;
    if (position.status != PositionStatus::ACTIVE) return errors::POSITION_NOT_ACTIVE;

    uint64_t now = clock_.now();
    Journal journal(parent);
    close_position(position, PositionStatus::LIQUIDATED, journal);

    AssetRef asset = position.asset;
    if (!custody_.transfer(asset, self_, recipient)) {
        spdlog::warn("ledger: seizure of position {} to {} refused", position_id,
                     addresses::to_hex(recipient));
        return errors::TRANSFER_FAILED;
    }
    journal.on_compensate([this, asset, recipient] {
        if (custody_.transfer(asset, recipient, self_)) return true;
        spdlog::critical("ledger: could not reclaim seized {}#{} from {} during rollback",
                         addresses::to_hex(asset.asset_class), asset.asset_id,
                         addresses::to_hex(recipient));
        return false;
    });

    I128 value = position.value_at_deposit_x18;
    journal.on_commit([this, position_id, recipient, value, now] {
        emit(EventKind::COLLATERAL_SEIZED, position_id, recipient, value, 0, now);
    });
    journal.commit();

    spdlog::info("ledger: position {} seized to {}", position_id, addresses::to_hex(recipient));
    return errors::OK;
}

// =============================================================================
// Loan Binding
// =============================================================================

int32_t CollateralLedger::bind_loan(const Address& caller, uint64_t position_id, uint64_t loan_id,
                                    Journal* parent) {
    if (!authority_.is_authorized(caller, Role::LOAN_BOOK)) {
        return errors::UNAUTHORIZED;
    }
    if (loan_id == 0) return errors::INVALID_PARAMETER;

    auto it = positions_.find(position_id);
    if (it == positions_.end()) return errors::POSITION_NOT_FOUND;

    CollateralPosition& position = it->second;
    if (position.status != PositionStatus::ACTIVE) return errors::POSITION_NOT_ACTIVE;
    if (position.bound_loan != 0) return errors::POSITION_ENCUMBERED;

    Journal journal(parent);
    position.bound_loan = loan_id;
    CollateralPosition* bound = &position;
    journal.on_rollback([bound] { bound->bound_loan = 0; });
    journal.commit();
    return errors::OK;
}

int32_t CollateralLedger::release_loan(const Address& caller, uint64_t position_id, uint64_t loan_id,
                                       Journal* parent) {
    if (!authority_.is_authorized(caller, Role::LOAN_BOOK)) {
        return errors::UNAUTHORIZED;
    }

    auto it = positions_.find(position_id);
    if (it == positions_.end()) return errors::POSITION_NOT_FOUND;

    CollateralPosition& position = it->second;
    if (position.bound_loan != loan_id) return errors::INVALID_PARAMETER;

    Journal journal(parent);
    position.bound_loan = 0;
    CollateralPosition* released = &position;
    journal.on_rollback([released, loan_id] { released->bound_loan = loan_id; });
    journal.commit();
    return errors::OK;
}

// =============================================================================
// Health & Valuation
// =============================================================================

bool CollateralLedger::is_healthy(uint64_t position_id) const {
    auto it = positions_.find(position_id);
    return it != positions_.end() && it->second.status == PositionStatus::ACTIVE;
}

PriceQuote CollateralLedger::value_of(uint64_t position_id) const {
    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
        return PriceQuote{errors::POSITION_NOT_FOUND, 0, false, 0};
    }
    return valuation_.quote(it->second.asset);
}

// =============================================================================
// Parameters
// =============================================================================

int32_t CollateralLedger::set_max_ltv(const Address& caller, I128 ltv_x18) {
    if (!authority_.is_authorized(caller, Role::PARAMETER_ADMIN)) {
        return errors::UNAUTHORIZED;
    }

    LedgerParams updated{ltv_x18};
    int32_t rc = updated.validate();
    if (rc != errors::OK) return rc;

    I128 previous = params_.max_ltv_x18;
    params_ = updated;

    spdlog::info("ledger: max LTV {} -> {}", x18::to_string(previous), x18::to_string(ltv_x18));
    emit(EventKind::LTV_UPDATED, 0, caller, ltv_x18, previous, clock_.now());
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<CollateralPosition> CollateralLedger::get_position(uint64_t position_id) const {
    auto it = positions_.find(position_id);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<CollateralPosition> CollateralLedger::positions_of(const Address& owner) const {
    std::vector<CollateralPosition> result;
    auto it = by_owner_.find(owner);
    if (it == by_owner_.end()) return result;

    result.reserve(it->second.size());
    for (uint64_t id : it->second) {
        result.push_back(positions_.at(id));
    }
    return result;
}

std::optional<uint64_t> CollateralLedger::active_position_for(const AssetRef& asset) const {
    auto it = active_by_asset_.find(asset);
    if (it == active_by_asset_.end()) return std::nullopt;
    return it->second;
}

CollateralLedger::Stats CollateralLedger::get_stats() const {
    return Stats{
        static_cast<uint64_t>(positions_.size()),
        active_count_,
        liquidated_count_,
        value_locked_x18_
    };
}

// =============================================================================
// Internal Helpers
// =============================================================================

void CollateralLedger::close_position(CollateralPosition& position, PositionStatus status,
                                      Journal& journal) {
    uint64_t id = position.id;
    uint64_t bound_loan = position.bound_loan;
    I128 value = position.value_at_deposit_x18;

    position.status = status;
    position.bound_loan = 0;
    active_by_asset_.erase(position.asset);
    --active_count_;
    value_locked_x18_ -= value;
    if (status == PositionStatus::LIQUIDATED) ++liquidated_count_;

    CollateralPosition* closed = &position;
    journal.on_rollback([this, closed, id, bound_loan, value, status] {
        closed->status = PositionStatus::ACTIVE;
        closed->bound_loan = bound_loan;
        active_by_asset_[closed->asset] = id;
        ++active_count_;
        value_locked_x18_ += value;
        if (status == PositionStatus::LIQUIDATED) --liquidated_count_;
    });
}

void CollateralLedger::emit(EventKind kind, uint64_t subject_id, const Address& party,
                            I128 amount0, I128 amount1, uint64_t now) const {
    if (event_callback_) {
        event_callback_(Event{kind, subject_id, party, amount0, amount1, now});
    }
}

} // namespace pledge
