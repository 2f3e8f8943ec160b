#ifndef ISOLEND_ORACLE_HPP
#define ISOLEND_ORACLE_HPP

#include "types.hpp"

namespace isolend {

// =============================================================================
// Price Oracle Interface
//
// Values `amount` raw units of `asset` in the reference unit (X18).
// Implementations signal stale or unavailable prices by throwing
// Error(PRICE_STALE); callers propagate the failure unchanged.
// =============================================================================

class IOracle {
public:
    virtual ~IOracle() = default;
    virtual I128 value_of(const Address& asset, I128 amount) const = 0;
};

// =============================================================================
// Interest Rate Model Interface
//
// Annual borrow rate (X18) for the given utilization inputs. Pure.
// =============================================================================

class IRateModel {
public:
    virtual ~IRateModel() = default;
    virtual I128 rate(I128 total_borrows, I128 total_idle) const = 0;
};

} // namespace isolend

#endif // ISOLEND_ORACLE_HPP
