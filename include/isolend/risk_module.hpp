#ifndef ISOLEND_RISK_MODULE_HPP
#define ISOLEND_RISK_MODULE_HPP

#include <vector>

#include "ledger.hpp"
#include "position.hpp"
#include "risk_engine.hpp"
#include "token.hpp"
#include "types.hpp"

namespace isolend {

// =============================================================================
// Risk Module Parameters
// =============================================================================

struct RiskModuleParams {
    I128 close_factor_x18 = X18_ONE / 2;             // 50% of a market's debt per call
    I128 liquidation_discount_x18 = X18_ONE / 10;    // seize up to repaid * 1.1
};

// =============================================================================
// Valuation Results
// =============================================================================

struct RiskData {
    I128 total_collateral_value = 0;
    I128 total_debt_value = 0;
    I128 min_required_collateral_value = 0;
};

struct DebtRepayment {
    MarketId market;
    I128 amount;   // MAX_AMOUNT repays the whole debt
};

struct AssetSeizure {
    Address asset;
    I128 amount;   // MAX_AMOUNT seizes the whole balance
};

struct LiquidationCheck {
    bool bad_debt = false;
    I128 repaid_value = 0;
    I128 seized_value = 0;
    // Inputs with MAX_AMOUNT resolved to concrete amounts
    std::vector<DebtRepayment> repayments;
    std::vector<AssetSeizure> seizures;
};

// =============================================================================
// RiskModule - collateralization and liquidation legality
//
// A position without debt markets is trivially healthy; this is decided
// before any oracle is consulted. Collateral held against several debt
// markets is priced at the debt-weighted average of the markets' oracles.
// =============================================================================

class RiskModule {
public:
    RiskModule(const Ledger& ledger, const RiskEngine& engine, const PositionRegistry& positions,
               const TokenBank& tokens, const RiskModuleParams& params);

    const RiskModuleParams& params() const { return params_; }

    RiskData get_risk_data(const Address& position) const;
    bool is_healthy(const Address& position) const;

    // collateral / min required (X18); MAX_AMOUNT without debt
    I128 health_factor(const Address& position) const;

    // Throws LIQUIDATE_HEALTHY_POSITION, CLOSE_FACTOR_EXCEEDED,
    // SEIZED_TOO_MUCH_COLLATERAL and friends
    LiquidationCheck validate_liquidation(const Address& position,
                                          const std::vector<DebtRepayment>& repayments,
                                          const std::vector<AssetSeizure>& seizures) const;

    // Throws NO_BAD_DEBT unless collateral value < debt value
    void validate_bad_debt(const Address& position) const;

private:
    struct DebtBreakdown {
        std::vector<MarketId> markets;
        std::vector<I128> values;
        std::vector<I128> weights;   // X18, rounded up
        I128 total = 0;
    };

    DebtBreakdown debt_breakdown(const Position& p) const;
    // Debt-weighted value of `amount` of `asset`
    I128 weighted_value(const DebtBreakdown& debt, const Address& asset, I128 amount) const;
    RiskData risk_data(const Position& p, const DebtBreakdown& debt) const;
    bool healthy(const RiskData& data) const;

    const Ledger& ledger_;
    const RiskEngine& engine_;
    const PositionRegistry& positions_;
    const TokenBank& tokens_;
    RiskModuleParams params_;
};

} // namespace isolend

#endif // ISOLEND_RISK_MODULE_HPP
