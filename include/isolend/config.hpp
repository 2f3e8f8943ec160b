#ifndef ISOLEND_CONFIG_HPP
#define ISOLEND_CONFIG_HPP

#include <string>
#include <string_view>

#include "events.hpp"
#include "types.hpp"

namespace isolend {

// =============================================================================
// ProtocolConfig - every protocol-wide parameter in one place
//
// JSON keys match the field names without the _x18 suffix. Fractions are
// decimal strings ("0.95") or numbers; addresses are hex strings.
// Missing keys keep their defaults.
// =============================================================================

struct ProtocolConfig {
    Address owner{};
    Address fee_recipient{};

    // Risk engine
    I128 min_ltv_x18 = X18_ONE / 10;
    I128 max_ltv_x18 = X18_ONE * 98 / 100;

    // Risk module
    I128 close_factor_x18 = X18_ONE / 2;
    I128 liquidation_discount_x18 = X18_ONE / 10;

    // Position manager
    I128 liquidation_fee_x18 = 0;

    // Ledger
    I128 interest_fee_x18 = 0;
    I128 origination_fee_x18 = 0;
    I128 min_borrow = 0;
    I128 min_debt = 0;
    I128 min_burned_shares = 0;

    // Governance timelocks (seconds)
    uint64_t timelock_duration = 24 * 60 * 60;
    uint64_t timelock_deadline = 3 * 24 * 60 * 60;

    LogLevel log_level = LogLevel::Info;

    // Throws std::runtime_error when the file cannot be read
    static ProtocolConfig from_file(std::string_view path);

    // Throws Error(INVALID_PARAMETER) on malformed JSON or values
    static ProtocolConfig from_json(std::string_view text);

    std::string to_json() const;

    // Bounds checks shared by both loaders
    void validate() const;
};

} // namespace isolend

#endif // ISOLEND_CONFIG_HPP
