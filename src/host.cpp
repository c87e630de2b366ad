// =============================================================================
// host.cpp - Clocks, role registry and in-memory transfer primitives
// =============================================================================

#include "pledge/host.hpp"

namespace pledge {

// =============================================================================
// RoleRegistry
// =============================================================================

RoleRegistry::RoleRegistry(const Address& owner, const IClock& clock)
    : owner_(owner), clock_(clock) {}

bool RoleRegistry::is_authorized(const Address& caller, Role role) const {
    if (caller == owner_ && (role == Role::PRICE_UPDATER || role == Role::PARAMETER_ADMIN)) {
        return true;
    }
    auto it = grants_.find(static_cast<uint8_t>(role));
    if (it == grants_.end()) return false;
    return it->second.count(caller) > 0;
}

int32_t RoleRegistry::grant(const Address& caller, Role role, const Address& account) {
    if (caller != owner_) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(account)) {
        return errors::INVALID_PARAMETER;
    }
    bool added = grants_[static_cast<uint8_t>(role)].insert(account).second;
    if (added && event_callback_) {
        event_callback_(Event{EventKind::ROLE_GRANTED, static_cast<uint64_t>(role), account, 0, 0,
                              clock_.now()});
    }
    return errors::OK;
}

int32_t RoleRegistry::revoke(const Address& caller, Role role, const Address& account) {
    if (caller != owner_) {
        return errors::UNAUTHORIZED;
    }
    auto it = grants_.find(static_cast<uint8_t>(role));
    if (it != grants_.end() && it->second.erase(account) > 0 && event_callback_) {
        event_callback_(Event{EventKind::ROLE_REVOKED, static_cast<uint64_t>(role), account, 0, 0,
                              clock_.now()});
    }
    return errors::OK;
}

// =============================================================================
// InMemoryBalances
// =============================================================================

bool InMemoryBalances::transfer(const Address& from, const Address& to, I128 amount_x18) {
    if (amount_x18 <= 0) return false;

    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount_x18) {
        return false;
    }

    it->second -= amount_x18;
    balances_[to] += amount_x18;

    if (hook_) {
        hook_(from, to, amount_x18);
    }
    return true;
}

void InMemoryBalances::credit(const Address& account, I128 amount_x18) {
    balances_[account] += amount_x18;
}

I128 InMemoryBalances::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : 0;
}

// =============================================================================
// InMemoryCustody
// =============================================================================

bool InMemoryCustody::transfer(const AssetRef& asset, const Address& from, const Address& to) {
    auto it = holders_.find(asset);
    if (it == holders_.end() || it->second != from) {
        return false;
    }

    it->second = to;

    if (hook_) {
        hook_(asset, from, to);
    }
    return true;
}

int32_t InMemoryCustody::mint(const AssetRef& asset, const Address& holder) {
    if (holders_.find(asset) != holders_.end()) {
        return errors::INVALID_PARAMETER;
    }
    holders_[asset] = holder;
    return errors::OK;
}

std::optional<Address> InMemoryCustody::holder_of(const AssetRef& asset) const {
    auto it = holders_.find(asset);
    if (it == holders_.end()) return std::nullopt;
    return it->second;
}

} // namespace pledge
