// =============================================================================
// risk_module.cpp - Position valuation and liquidation checks
// =============================================================================

#include "isolend/risk_module.hpp"
#include "isolend/math.hpp"

#include <map>

namespace isolend {

RiskModule::RiskModule(const Ledger& ledger, const RiskEngine& engine, const PositionRegistry& positions,
                       const TokenBank& tokens, const RiskModuleParams& params)
    : ledger_(ledger), engine_(engine), positions_(positions), tokens_(tokens), params_(params) {
    if (params.close_factor_x18 <= 0 || params.close_factor_x18 > X18_ONE) {
        throw Error(errors::INVALID_PARAMETER, "close factor outside (0, 1]");
    }
    if (params.liquidation_discount_x18 < 0 || params.liquidation_discount_x18 >= X18_ONE) {
        throw Error(errors::INVALID_PARAMETER, "liquidation discount outside [0, 1)");
    }
}

// =============================================================================
// Valuation
// =============================================================================

RiskModule::DebtBreakdown RiskModule::debt_breakdown(const Position& p) const {
    DebtBreakdown debt;
    for (MarketId market : p.debt_markets) {
        I128 borrows = ledger_.get_borrows_of(market, p.address);
        I128 value = engine_.value_of(market, ledger_.asset_of(market), borrows);
        debt.markets.push_back(market);
        debt.values.push_back(value);
        debt.total = add_checked(debt.total, value);
    }

    size_t n = debt.markets.size();
    for (size_t i = 0; i < n; ++i) {
        if (debt.total > 0) {
            debt.weights.push_back(mul_div(debt.values[i], X18_ONE, debt.total, Rounding::Ceil));
        } else {
            // Debt too small to register a value: weigh markets equally
            debt.weights.push_back(mul_div(X18_ONE, 1, static_cast<I128>(n), Rounding::Ceil));
        }
    }
    return debt;
}

I128 RiskModule::weighted_value(const DebtBreakdown& debt, const Address& asset, I128 amount) const {
    I128 value = 0;
    for (size_t i = 0; i < debt.markets.size(); ++i) {
        I128 priced = engine_.value_of(debt.markets[i], asset, amount);
        value = add_checked(value, mul_x18(priced, debt.weights[i]));
    }
    return value;
}

RiskData RiskModule::risk_data(const Position& p, const DebtBreakdown& debt) const {
    RiskData data;
    data.total_debt_value = debt.total;

    std::vector<I128> asset_values;
    std::vector<Address> assets;
    for (const Address& asset : p.held_assets) {
        // Every held asset needs an LTV, funded or not; a balance can
        // arrive by direct transfer at any time
        for (MarketId market : debt.markets) {
            if (engine_.ltv_for(market, asset) == 0) {
                throw Error(errors::UNSUPPORTED_ASSET,
                            addresses::to_hex(asset) + " in market " + std::to_string(market));
            }
        }

        I128 balance = tokens_.balance_of(asset, p.address);
        if (balance == 0) continue;

        I128 value = weighted_value(debt, asset, balance);
        assets.push_back(asset);
        asset_values.push_back(value);
        data.total_collateral_value = add_checked(data.total_collateral_value, value);
    }

    if (data.total_collateral_value == 0) {
        // Nothing to weigh LTVs by; require debt / max_ltv so the
        // position can never read as healthy
        I128 max_ltv = engine_.params().max_ltv_x18;
        for (I128 value : debt.values) {
            data.min_required_collateral_value = add_checked(
                data.min_required_collateral_value, div_x18(value, max_ltv, Rounding::Ceil));
        }
        return data;
    }

    // min required = sum_i sum_a debt[i] * share[a] / ltv(market_i, a)
    for (size_t i = 0; i < debt.markets.size(); ++i) {
        for (size_t a = 0; a < assets.size(); ++a) {
            I128 portion = mul_div(debt.values[i], asset_values[a], data.total_collateral_value,
                                   Rounding::Ceil);
            I128 ltv = engine_.ltv_for(debt.markets[i], assets[a]);
            data.min_required_collateral_value = add_checked(
                data.min_required_collateral_value, div_x18(portion, ltv, Rounding::Ceil));
        }
    }
    return data;
}

bool RiskModule::healthy(const RiskData& data) const {
    if (data.total_collateral_value == 0) return false;
    return data.total_collateral_value >= data.min_required_collateral_value;
}

RiskData RiskModule::get_risk_data(const Address& position) const {
    const Position& p = positions_.get(position);
    if (p.debt_markets.empty()) return RiskData{};
    return risk_data(p, debt_breakdown(p));
}

bool RiskModule::is_healthy(const Address& position) const {
    const Position& p = positions_.get(position);
    if (p.debt_markets.empty()) return true;
    return healthy(risk_data(p, debt_breakdown(p)));
}

I128 RiskModule::health_factor(const Address& position) const {
    const Position& p = positions_.get(position);
    if (p.debt_markets.empty()) return MAX_AMOUNT;

    RiskData data = risk_data(p, debt_breakdown(p));
    if (data.total_collateral_value == 0) return 0;
    if (data.min_required_collateral_value == 0) return MAX_AMOUNT;
    return div_x18(data.total_collateral_value, data.min_required_collateral_value);
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationCheck RiskModule::validate_liquidation(const Address& position,
                                                  const std::vector<DebtRepayment>& repayments,
                                                  const std::vector<AssetSeizure>& seizures) const {
    const Position& p = positions_.get(position);
    if (p.debt_markets.empty()) {
        throw Error(errors::LIQUIDATE_HEALTHY_POSITION, "no debt");
    }

    DebtBreakdown debt = debt_breakdown(p);
    RiskData data = risk_data(p, debt);

    LiquidationCheck check;
    check.bad_debt = data.total_collateral_value < data.total_debt_value;
    if (!check.bad_debt && healthy(data)) {
        throw Error(errors::LIQUIDATE_HEALTHY_POSITION, addresses::to_hex(position));
    }

    // Repayments, aggregated per market for the close factor
    std::map<MarketId, I128> repaid;
    for (const auto& r : repayments) {
        if (!p.debt_markets.contains(r.market)) {
            throw Error(errors::INVALID_DEBT_MARKET, std::to_string(r.market));
        }
        I128 borrows = ledger_.get_borrows_of(r.market, position);
        I128 amount = r.amount == MAX_AMOUNT ? borrows : r.amount;
        if (amount < 0) throw Error(errors::INVALID_PARAMETER, "negative repayment");

        I128 total = add_checked(repaid[r.market], amount);
        if (total > borrows) {
            throw Error(errors::REPAY_EXCEEDS_DEBT, std::to_string(r.market));
        }
        if (!check.bad_debt && total > mul_x18(borrows, params_.close_factor_x18, Rounding::Ceil)) {
            throw Error(errors::CLOSE_FACTOR_EXCEEDED, std::to_string(r.market));
        }
        repaid[r.market] = total;

        check.repaid_value = add_checked(
            check.repaid_value, engine_.value_of(r.market, ledger_.asset_of(r.market), amount));
        check.repayments.push_back(DebtRepayment{r.market, amount});
    }

    std::map<Address, I128> seized;
    for (const auto& s : seizures) {
        if (!p.held_assets.contains(s.asset)) {
            throw Error(errors::SEIZE_EXCEEDS_BALANCE, addresses::to_hex(s.asset));
        }
        I128 balance = tokens_.balance_of(s.asset, position);
        I128 amount = s.amount == MAX_AMOUNT ? balance - seized[s.asset] : s.amount;
        if (amount < 0) throw Error(errors::INVALID_PARAMETER, "negative seizure");

        I128 total = add_checked(seized[s.asset], amount);
        if (total > balance) {
            throw Error(errors::SEIZE_EXCEEDS_BALANCE, addresses::to_hex(s.asset));
        }
        seized[s.asset] = total;

        check.seized_value = add_checked(check.seized_value, weighted_value(debt, s.asset, amount));
        check.seizures.push_back(AssetSeizure{s.asset, amount});
    }

    I128 max_seized = mul_x18(check.repaid_value, X18_ONE + params_.liquidation_discount_x18);
    if (check.seized_value > max_seized) {
        throw Error(errors::SEIZED_TOO_MUCH_COLLATERAL,
                    to_string(check.seized_value) + " > " + to_string(max_seized));
    }
    return check;
}

void RiskModule::validate_bad_debt(const Address& position) const {
    const Position& p = positions_.get(position);
    if (p.debt_markets.empty()) {
        throw Error(errors::NO_BAD_DEBT, "no debt");
    }
    RiskData data = risk_data(p, debt_breakdown(p));
    if (data.total_collateral_value >= data.total_debt_value) {
        throw Error(errors::NO_BAD_DEBT, addresses::to_hex(position));
    }
}

} // namespace isolend
