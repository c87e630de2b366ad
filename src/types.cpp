// =============================================================================
// types.cpp - Shared type helpers, X18 text conversion, error names
// =============================================================================

#include "pledge/types.hpp"

namespace pledge {

// =============================================================================
// Addresses
// =============================================================================

std::string addresses::to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

// =============================================================================
// X18 Text Conversion
// =============================================================================

bool x18::from_string(std::string_view text, I128& out) {
    if (text.empty()) return false;

    bool negative = false;
    size_t pos = 0;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) return false;

    I128 whole = 0;
    I128 frac = 0;
    int frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    // Whole part limited to 1e20 so whole * 1e18 stays inside I128
    constexpr I128 WHOLE_LIMIT = static_cast<I128>(10000000000LL) * 10000000000LL;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_dot) return false;
            seen_dot = true;
            continue;
        }
        if (c < '0' || c > '9') return false;
        seen_digit = true;
        int digit = c - '0';
        if (!seen_dot) {
            whole = whole * 10 + digit;
            if (whole > WHOLE_LIMIT) return false;
        } else {
            if (frac_digits == 18) return false;
            frac = frac * 10 + digit;
            ++frac_digits;
        }
    }
    if (!seen_digit) return false;

    for (int i = frac_digits; i < 18; ++i) {
        frac *= 10;
    }

    I128 value = whole * X18_ONE + frac;
    out = negative ? -value : value;
    return true;
}

std::string x18::to_string(I128 v) {
    bool negative = v < 0;
    U128 mag = negative ? static_cast<U128>(-v) : static_cast<U128>(v);
    U128 one = static_cast<U128>(X18_ONE);

    U128 whole = mag / one;
    U128 frac = mag % one;

    std::string whole_str;
    if (whole == 0) {
        whole_str = "0";
    } else {
        while (whole > 0) {
            whole_str.insert(whole_str.begin(), static_cast<char>('0' + static_cast<int>(whole % 10)));
            whole /= 10;
        }
    }

    std::string out = negative ? "-" + whole_str : whole_str;
    if (frac == 0) return out;

    std::string frac_str(18, '0');
    for (int i = 17; i >= 0; --i) {
        frac_str[static_cast<size_t>(i)] = static_cast<char>('0' + static_cast<int>(frac % 10));
        frac /= 10;
    }
    while (!frac_str.empty() && frac_str.back() == '0') {
        frac_str.pop_back();
    }
    return out + "." + frac_str;
}

// =============================================================================
// Names
// =============================================================================

const char* role_name(Role role) {
    switch (role) {
        case Role::PRICE_UPDATER: return "price_updater";
        case Role::PARAMETER_ADMIN: return "parameter_admin";
        case Role::LIQUIDATOR: return "liquidator";
        case Role::LOAN_BOOK: return "loan_book";
    }
    return "unknown";
}

const char* event_name(EventKind kind) {
    switch (kind) {
        case EventKind::ASSET_CLASS_SUPPORT: return "asset_class_support";
        case EventKind::FLOOR_PRICE_UPDATED: return "floor_price_updated";
        case EventKind::SPOT_PRICE_UPDATED: return "spot_price_updated";
        case EventKind::ORACLE_PARAMETERS_UPDATED: return "oracle_parameters_updated";
        case EventKind::REFERENCE_SOURCE_UPDATED: return "reference_source_updated";
        case EventKind::COLLATERAL_DEPOSITED: return "collateral_deposited";
        case EventKind::COLLATERAL_WITHDRAWN: return "collateral_withdrawn";
        case EventKind::COLLATERAL_SEIZED: return "collateral_seized";
        case EventKind::LTV_UPDATED: return "ltv_updated";
        case EventKind::LIQUIDITY_PROVIDED: return "liquidity_provided";
        case EventKind::LIQUIDITY_WITHDRAWN: return "liquidity_withdrawn";
        case EventKind::LOAN_ORIGINATED: return "loan_originated";
        case EventKind::LOAN_REPAID: return "loan_repaid";
        case EventKind::LOAN_CLOSED: return "loan_closed";
        case EventKind::LOAN_LIQUIDATED: return "loan_liquidated";
        case EventKind::RATE_MODEL_UPDATED: return "rate_model_updated";
        case EventKind::RESERVES_WITHDRAWN: return "reserves_withdrawn";
        case EventKind::RESERVE_FACTOR_UPDATED: return "reserve_factor_updated";
        case EventKind::LIQUIDATION_TRIGGERED: return "liquidation_triggered";
        case EventKind::LIQUIDATION_EXECUTED: return "liquidation_executed";
        case EventKind::LIQUIDATION_PARAMETERS_UPDATED: return "liquidation_parameters_updated";
        case EventKind::LIQUIDATION_CANCELLED: return "liquidation_cancelled";
        case EventKind::ASSET_ALLOWED: return "asset_allowed";
        case EventKind::ROLE_GRANTED: return "role_granted";
        case EventKind::ROLE_REVOKED: return "role_revoked";
    }
    return "unknown";
}

// =============================================================================
// Error Taxonomy
// =============================================================================

errors::Category errors::category(int32_t code) {
    if (code == OK) return Category::NONE;
    if (code <= -1 && code > -20) return Category::VALIDATION;
    if (code <= -20 && code > -60) return Category::PRECONDITION;
    if (code <= -60 && code > -80) return Category::AUTHORIZATION;
    return Category::HOST;
}

const char* errors::name(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case INVALID_AMOUNT: return "invalid_amount";
        case INVALID_PRICE: return "invalid_price";
        case UNSUPPORTED_ASSET_CLASS: return "unsupported_asset_class";
        case BATCH_LENGTH_MISMATCH: return "batch_length_mismatch";
        case INVALID_PARAMETER: return "invalid_parameter";
        case INVALID_DURATION: return "invalid_duration";
        case PRICE_UNAVAILABLE: return "price_unavailable";
        case DEVIATION_EXCEEDED: return "deviation_exceeded";
        case ALREADY_PLEDGED: return "already_pledged";
        case EXCEEDS_LOAN_TO_VALUE: return "exceeds_loan_to_value";
        case POSITION_NOT_FOUND: return "position_not_found";
        case POSITION_NOT_ACTIVE: return "position_not_active";
        case POSITION_ENCUMBERED: return "position_encumbered";
        case REFERENCE_RATE_UNAVAILABLE: return "reference_rate_unavailable";
        case NOT_OWNER: return "not_owner";
        case LOAN_NOT_FOUND: return "loan_not_found";
        case LOAN_NOT_ACTIVE: return "loan_not_active";
        case NOT_BORROWER: return "not_borrower";
        case INSUFFICIENT_LIQUIDITY: return "insufficient_liquidity";
        case INSUFFICIENT_SHARES: return "insufficient_shares";
        case INSUFFICIENT_AVAILABLE_LIQUIDITY: return "insufficient_available_liquidity";
        case INSUFFICIENT_RESERVES: return "insufficient_reserves";
        case NOT_ELIGIBLE: return "not_eligible";
        case NO_LIQUIDATION: return "no_liquidation";
        case DELAY_NOT_ELAPSED: return "delay_not_elapsed";
        case ALREADY_LIQUIDATED: return "already_liquidated";
        case ASSET_NOT_ALLOWED: return "asset_not_allowed";
        case REENTRANCY: return "reentrancy";
        case UNAUTHORIZED: return "unauthorized";
        case TRANSFER_FAILED: return "transfer_failed";
        case ROLLBACK_INCOMPLETE: return "rollback_incomplete";
        default: return "unknown";
    }
}

} // namespace pledge
