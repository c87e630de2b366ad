#ifndef PLEDGE_HOST_HPP
#define PLEDGE_HOST_HPP

#include <unordered_map>
#include <unordered_set>
#include <functional>
#include <optional>
#include <utility>

#include "types.hpp"

namespace pledge {

// =============================================================================
// Host Collaborators
//
// The core assumes a host that serialises calls and provides a monotonic
// clock, atomic transfer primitives and an authorization check. Each is an
// interface so the same components run against a chain, a simulator or tests.
// =============================================================================

class IClock {
public:
    virtual ~IClock() = default;

    // Seconds, monotonically non-decreasing
    virtual uint64_t now() const = 0;
};

// Fungible balance primitive: full success or no effect
class IBalances {
public:
    virtual ~IBalances() = default;

    virtual bool transfer(const Address& from, const Address& to, I128 amount_x18) = 0;
};

// Unique-asset custody primitive: full success or no effect
class ICustody {
public:
    virtual ~ICustody() = default;

    virtual bool transfer(const AssetRef& asset, const Address& from, const Address& to) = 0;
};

class IAuthority {
public:
    virtual ~IAuthority() = default;

    virtual bool is_authorized(const Address& caller, Role role) const = 0;
};

// =============================================================================
// ManualClock - host-driven time for simulations and tests
// =============================================================================

class ManualClock : public IClock {
public:
    explicit ManualClock(uint64_t start = 1704067200) : now_(start) {}

    uint64_t now() const override { return now_; }

    void set(uint64_t t) { if (t > now_) now_ = t; }
    void advance(uint64_t seconds) { now_ += seconds; }

private:
    uint64_t now_;
};

// =============================================================================
// RoleRegistry - owner-administered role table
// =============================================================================

class RoleRegistry : public IAuthority {
public:
    RoleRegistry(const Address& owner, const IClock& clock);

    // Owner holds PRICE_UPDATER and PARAMETER_ADMIN implicitly.
    // LIQUIDATOR / LOAN_BOOK identify components and must be granted.
    bool is_authorized(const Address& caller, Role role) const override;

    int32_t grant(const Address& caller, Role role, const Address& account);
    int32_t revoke(const Address& caller, Role role, const Address& account);

    const Address& owner() const { return owner_; }

    // ROLE_GRANTED / ROLE_REVOKED when membership actually changes
    void set_event_callback(EventCallback callback) { event_callback_ = std::move(callback); }

private:
    Address owner_;
    const IClock& clock_;
    EventCallback event_callback_;
    std::unordered_map<uint8_t, std::unordered_set<Address, AddressHash>> grants_;
};

// =============================================================================
// In-Memory Reference Primitives
// =============================================================================

class InMemoryBalances : public IBalances {
public:
    // Called after a transfer is applied, before transfer() returns
    using TransferHook = std::function<void(const Address& from, const Address& to, I128 amount_x18)>;

    bool transfer(const Address& from, const Address& to, I128 amount_x18) override;

    void credit(const Address& account, I128 amount_x18);
    I128 balance_of(const Address& account) const;

    void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

private:
    std::unordered_map<Address, I128, AddressHash> balances_;
    TransferHook hook_;
};

class InMemoryCustody : public ICustody {
public:
    using TransferHook = std::function<void(const AssetRef& asset, const Address& from, const Address& to)>;

    bool transfer(const AssetRef& asset, const Address& from, const Address& to) override;

    // Register a new asset with its initial holder
    int32_t mint(const AssetRef& asset, const Address& holder);
    std::optional<Address> holder_of(const AssetRef& asset) const;

    void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

private:
    std::unordered_map<AssetRef, Address> holders_;
    TransferHook hook_;
};

} // namespace pledge

#endif // PLEDGE_HOST_HPP
