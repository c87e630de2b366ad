#ifndef PLEDGE_TYPES_HPP
#define PLEDGE_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <cstring>
#include <functional>
#include <vector>

namespace pledge {

// =============================================================================
// Party / Account Address (20-byte)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Build an address whose low 8 bytes carry `id` (convenient for hosts that
// key parties by integer handles)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using X18 = __int128;
using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18

constexpr uint64_t SECONDS_PER_HOUR = 3600;
constexpr uint64_t SECONDS_PER_DAY = 86400;
constexpr uint64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

// X18 conversions. Products of amounts go through math::mul_div.
namespace x18 {

// Caller keeps |v| within I128 range (see config decimal parsing)
inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(X18_ONE));
}

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

// Exact percentage: from_percent(80) == 0.8
constexpr I128 from_percent(int64_t pct) {
    return static_cast<I128>(pct) * X18_ONE / 100;
}

// Parse a decimal literal ("12", "0.05", "-3.25") exactly.
// Returns false on malformed input or more than 18 fractional digits.
bool from_string(std::string_view text, I128& out);

// Render as a decimal string with trailing zeros trimmed ("8.01", "100000")
std::string to_string(I128 v);

} // namespace x18

// =============================================================================
// Asset Reference (asset class + unique id within the class)
// =============================================================================

struct AssetRef {
    Address asset_class;     // Collection / registry address
    uint64_t asset_id;       // Token id within the class

    bool operator==(const AssetRef& other) const {
        return asset_class == other.asset_class && asset_id == other.asset_id;
    }
    bool operator!=(const AssetRef& other) const { return !(*this == other); }
    bool operator<(const AssetRef& other) const {
        if (asset_class != other.asset_class) return asset_class < other.asset_class;
        return asset_id < other.asset_id;
    }
};

// =============================================================================
// Lifecycle Status (one tag per entity, no loose boolean flags)
// =============================================================================

enum class PositionStatus : uint8_t {
    ACTIVE = 0,
    WITHDRAWN = 1,
    LIQUIDATED = 2
};

enum class LoanStatus : uint8_t {
    ACTIVE = 0,
    REPAID = 1,
    LIQUIDATED = 2
};

enum class LiquidationStatus : uint8_t {
    TRIGGERED = 0,
    EXECUTED = 1
};

// =============================================================================
// Roles (checked through IAuthority)
// =============================================================================

enum class Role : uint8_t {
    PRICE_UPDATER = 0,     // Oracle writes
    PARAMETER_ADMIN = 1,   // Protocol parameters, allow-lists, reserves
    LIQUIDATOR = 2,        // Force-close entry points (the controller)
    LOAN_BOOK = 3          // Binding loans to positions (the pool)
};

const char* role_name(Role role);

// =============================================================================
// Events (emitted iff the call commits)
// =============================================================================

enum class EventKind : uint8_t {
    ASSET_CLASS_SUPPORT = 0,
    FLOOR_PRICE_UPDATED = 1,
    SPOT_PRICE_UPDATED = 2,
    ORACLE_PARAMETERS_UPDATED = 3,
    REFERENCE_SOURCE_UPDATED = 4,
    COLLATERAL_DEPOSITED = 10,
    COLLATERAL_WITHDRAWN = 11,
    COLLATERAL_SEIZED = 12,
    LTV_UPDATED = 13,
    LIQUIDITY_PROVIDED = 20,
    LIQUIDITY_WITHDRAWN = 21,
    LOAN_ORIGINATED = 22,
    LOAN_REPAID = 23,
    LOAN_CLOSED = 24,
    LOAN_LIQUIDATED = 25,
    RATE_MODEL_UPDATED = 26,
    RESERVES_WITHDRAWN = 27,
    RESERVE_FACTOR_UPDATED = 28,
    LIQUIDATION_TRIGGERED = 30,
    LIQUIDATION_EXECUTED = 31,
    LIQUIDATION_PARAMETERS_UPDATED = 32,
    LIQUIDATION_CANCELLED = 33,
    ASSET_ALLOWED = 40,
    ROLE_GRANTED = 41,
    ROLE_REVOKED = 42
};

const char* event_name(EventKind kind);

struct Event {
    EventKind kind;
    uint64_t subject_id;     // Position / loan / asset id, 0 when not applicable
    Address party;           // Acting or affected party
    I128 amount0_x18;        // Primary amount (price, principal, shares...)
    I128 amount1_x18;        // Secondary amount (value, rate, bonus...)
    uint64_t timestamp;
};

using EventCallback = std::function<void(const Event&)>;

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation: malformed input, caller-correctable
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t INVALID_PRICE = -2;
constexpr int32_t UNSUPPORTED_ASSET_CLASS = -3;
constexpr int32_t BATCH_LENGTH_MISMATCH = -4;
constexpr int32_t INVALID_PARAMETER = -5;
constexpr int32_t INVALID_DURATION = -6;

// Precondition: state-dependent, retryable once state changes
constexpr int32_t PRICE_UNAVAILABLE = -20;
constexpr int32_t DEVIATION_EXCEEDED = -21;
constexpr int32_t ALREADY_PLEDGED = -22;
constexpr int32_t EXCEEDS_LOAN_TO_VALUE = -23;
constexpr int32_t POSITION_NOT_FOUND = -24;
constexpr int32_t POSITION_NOT_ACTIVE = -25;
constexpr int32_t POSITION_ENCUMBERED = -26;
constexpr int32_t REFERENCE_RATE_UNAVAILABLE = -27;
constexpr int32_t NOT_OWNER = -28;
constexpr int32_t LOAN_NOT_FOUND = -29;
constexpr int32_t LOAN_NOT_ACTIVE = -30;
constexpr int32_t NOT_BORROWER = -31;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -32;
constexpr int32_t INSUFFICIENT_SHARES = -33;
constexpr int32_t INSUFFICIENT_AVAILABLE_LIQUIDITY = -34;
constexpr int32_t INSUFFICIENT_RESERVES = -35;
constexpr int32_t NOT_ELIGIBLE = -36;
constexpr int32_t NO_LIQUIDATION = -37;
constexpr int32_t DELAY_NOT_ELAPSED = -38;
constexpr int32_t ALREADY_LIQUIDATED = -39;
constexpr int32_t ASSET_NOT_ALLOWED = -40;
constexpr int32_t REENTRANCY = -41;

// Authorization: not retryable by the same caller
constexpr int32_t UNAUTHORIZED = -60;

// Host primitive refused the transfer
constexpr int32_t TRANSFER_FAILED = -80;
constexpr int32_t ROLLBACK_INCOMPLETE = -81;  // A compensating transfer was refused

enum class Category : uint8_t {
    NONE = 0,
    VALIDATION = 1,
    PRECONDITION = 2,
    AUTHORIZATION = 3,
    HOST = 4
};

Category category(int32_t code);
const char* name(int32_t code);

} // namespace errors

} // namespace pledge

// Hash specializations (after the pledge types they hash)
namespace std {
template<>
struct hash<pledge::AssetRef> {
    size_t operator()(const pledge::AssetRef& ref) const noexcept {
        size_t h = 0;
        for (auto b : ref.asset_class) {
            h = h * 31 + b;
        }
        return h * 31 + static_cast<size_t>(ref.asset_id);
    }
};
} // namespace std

namespace pledge {

struct AddressHash {
    size_t operator()(const Address& addr) const noexcept {
        size_t h = 0;
        for (auto b : addr) {
            h = h * 31 + b;
        }
        return h;
    }
};

} // namespace pledge

#endif // PLEDGE_TYPES_HPP
