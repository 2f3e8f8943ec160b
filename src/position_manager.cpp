// =============================================================================
// position_manager.cpp - Action dispatch, authorization and liquidation
// =============================================================================

#include "isolend/position_manager.hpp"
#include "isolend/math.hpp"

namespace isolend {

PositionManager::PositionManager(Runtime& runtime, TokenBank& tokens, Ledger& ledger,
                                 PositionRegistry& positions, const RiskModule& risk,
                                 const PositionManagerParams& params, const Address& self)
    : runtime_(runtime), tokens_(tokens), ledger_(ledger), positions_(positions),
      risk_(risk), self_(self) {
    if (params.liquidation_fee_x18 < 0 || params.liquidation_fee_x18 > X18_ONE) {
        throw Error(errors::INVALID_PARAMETER, "liquidation fee outside [0, 1]");
    }
    state_.params = params;
    runtime_.register_state(this);
}

PositionManager::~PositionManager() {
    runtime_.unregister_state(this);
}

// =============================================================================
// Internal Helpers
// =============================================================================

void PositionManager::require_known_asset(const Address& asset) const {
    if (!is_known_asset(asset)) {
        throw Error(errors::UNKNOWN_ASSET, addresses::to_hex(asset));
    }
}

void PositionManager::require_protocol_owner(const Address& caller) const {
    if (caller != state_.params.owner) {
        throw Error(errors::UNAUTHORIZED, "position manager owner only");
    }
}

void PositionManager::prune_asset(const Address& position, const Address& asset) {
    if (tokens_.balance_of(asset, position) == 0) {
        positions_.remove_asset(position, asset);
    }
}

void PositionManager::prune_debt(const Address& position, MarketId market) {
    if (ledger_.borrow_shares_of(market, position) == 0) {
        positions_.remove_debt_market(position, market);
    }
}

Address PositionManager::predict_address(const Address& owner, uint64_t salt) const {
    return PositionRegistry::derive_address(self_, owner, salt);
}

// =============================================================================
// Action Processing
// =============================================================================

void PositionManager::process(const Address& caller, const Address& position, const Action& action) {
    process_batch(caller, position, std::vector<Action>{action});
}

void PositionManager::process_batch(const Address& caller, const Address& position,
                                    const std::vector<Action>& actions) {
    runtime_.atomic("PositionManager::process_batch", [&] {
        for (const auto& action : actions) {
            dispatch(caller, position, action);
        }

        if (positions_.exists(position) && !risk_.is_healthy(position)) {
            throw Error(errors::HEALTH_CHECK_FAILED, addresses::to_hex(position));
        }
    });
}

void PositionManager::dispatch(const Address& caller, const Address& position, const Action& action) {
    if (action.op == Operation::NewPosition) {
        new_position(position, action);
        return;
    }

    if (!positions_.exists(position)) {
        throw Error(errors::POSITION_NOT_FOUND, addresses::to_hex(position));
    }
    if (!positions_.is_auth(position, caller)) {
        throw Error(errors::UNAUTHORIZED, addresses::to_hex(caller) + " on " + addresses::to_hex(position));
    }

    switch (action.op) {
        case Operation::Deposit: deposit(caller, position, action); break;
        case Operation::Withdraw: withdraw(position, action); break;
        case Operation::AddCollateralType: add_collateral(position, action); break;
        case Operation::RemoveCollateralType: remove_collateral(position, action); break;
        case Operation::Borrow: borrow(position, action); break;
        case Operation::Repay: repay(position, action); break;
        case Operation::Approve: approve(position, action); break;
        case Operation::Exec: exec(caller, position, action); break;
        default:
            throw Error(errors::MALFORMED_ACTION, operation_name(action.op));
    }
}

void PositionManager::new_position(const Address& position, const Action& action) {
    auto args = actions::decode_new_position(action);
    if (predict_address(args.owner, args.salt) != position) {
        throw Error(errors::INVALID_POSITION_ADDRESS, addresses::to_hex(position));
    }
    positions_.create(position, args.owner);
    runtime_.emit(Event("PositionDeployed", self_)
                      .with("position", position)
                      .with("owner", args.owner)
                      .with("salt", args.salt));
}

void PositionManager::deposit(const Address& caller, const Address& position, const Action& action) {
    auto args = actions::decode_deposit(action);
    require_known_asset(args.asset);
    tokens_.transfer_from(args.asset, self_, caller, position, args.amount);
    runtime_.emit(Event("Deposit", self_)
                      .with("position", position)
                      .with("depositor", caller)
                      .with("asset", args.asset)
                      .with("amount", args.amount));
}

void PositionManager::withdraw(const Address& position, const Action& action) {
    auto args = actions::decode_withdraw(action);
    require_known_asset(args.asset);
    tokens_.transfer(args.asset, position, args.recipient, args.amount);
    prune_asset(position, args.asset);
    runtime_.emit(Event("Transfer", self_)
                      .with("position", position)
                      .with("recipient", args.recipient)
                      .with("asset", args.asset)
                      .with("amount", args.amount));
}

void PositionManager::add_collateral(const Address& position, const Action& action) {
    Address asset = actions::decode_collateral(action);
    require_known_asset(asset);
    positions_.add_asset(position, asset);
    runtime_.emit(Event("AddToken", self_).with("position", position).with("asset", asset));
}

void PositionManager::remove_collateral(const Address& position, const Action& action) {
    Address asset = actions::decode_collateral(action);
    require_known_asset(asset);
    positions_.remove_asset(position, asset);
    runtime_.emit(Event("RemoveToken", self_).with("position", position).with("asset", asset));
}

void PositionManager::borrow(const Address& position, const Action& action) {
    auto args = actions::decode_debt(action);
    if (!ledger_.exists(args.market)) {
        throw Error(errors::MARKET_NOT_FOUND, std::to_string(args.market));
    }
    positions_.add_debt_market(position, args.market);
    ledger_.borrow(self_, args.market, position, args.amount);
    runtime_.emit(Event("Borrow", self_)
                      .with("position", position)
                      .with("market", args.market)
                      .with("amount", args.amount));
}

void PositionManager::repay(const Address& position, const Action& action) {
    auto args = actions::decode_debt(action);
    if (!positions_.get(position).debt_markets.contains(args.market)) {
        throw Error(errors::INVALID_DEBT_MARKET, std::to_string(args.market));
    }

    ledger_.accrue(args.market);
    I128 amount = args.amount == MAX_AMOUNT ? ledger_.get_borrows_of(args.market, position) : args.amount;

    Address asset = ledger_.asset_of(args.market);
    tokens_.transfer(asset, position, ledger_.address(), amount);
    ledger_.repay(self_, args.market, position, amount);

    prune_debt(position, args.market);
    prune_asset(position, asset);
    runtime_.emit(Event("Repay", self_)
                      .with("position", position)
                      .with("market", args.market)
                      .with("amount", amount));
}

void PositionManager::approve(const Address& position, const Action& action) {
    auto args = actions::decode_approve(action);
    if (!is_known_spender(args.spender)) {
        throw Error(errors::UNKNOWN_SPENDER, addresses::to_hex(args.spender));
    }
    require_known_asset(args.asset);
    tokens_.approve(args.asset, position, args.spender, args.amount);
    runtime_.emit(Event("Approve", self_)
                      .with("position", position)
                      .with("spender", args.spender)
                      .with("asset", args.asset)
                      .with("amount", args.amount));
}

void PositionManager::exec(const Address& caller, const Address& position, const Action& action) {
    auto args = actions::decode_exec(action);
    if (!is_known_func(args.target, args.selector)) {
        throw Error(errors::UNKNOWN_FUNC, addresses::to_hex(args.target));
    }
    auto it = state_.exec_targets.find(args.target);
    if (it == state_.exec_targets.end() || it->second == nullptr) {
        throw Error(errors::UNKNOWN_EXEC_TARGET, addresses::to_hex(args.target));
    }

    ExecContext ctx{position, caller, args.selector, args.calldata, tokens_};
    it->second->exec(ctx);

    // The target may have moved any held asset out
    for (const Address& asset : positions_.get(position).held_assets.to_vector()) {
        prune_asset(position, asset);
    }
    runtime_.emit(Event("Exec", self_)
                      .with("position", position)
                      .with("target", args.target)
                      .with("selector", static_cast<uint64_t>(args.selector)));
}

// =============================================================================
// Position Access
// =============================================================================

void PositionManager::toggle_auth(const Address& caller, const Address& user, const Address& position) {
    runtime_.atomic("PositionManager::toggle_auth", [&] {
        Position& p = positions_.get(position);
        if (p.owner != caller) {
            throw Error(errors::UNAUTHORIZED, "position owner only");
        }
        bool granted = p.operators.count(user) == 0;
        if (granted) {
            p.operators.insert(user);
        } else {
            p.operators.erase(user);
        }
        runtime_.emit(Event("ToggleAuth", self_)
                          .with("position", position)
                          .with("user", user)
                          .with("authorized", granted));
    });
}

std::optional<Address> PositionManager::owner_of(const Address& position) const {
    auto p = positions_.find(position);
    if (!p) return std::nullopt;
    return p->owner;
}

bool PositionManager::is_auth(const Address& position, const Address& user) const {
    return positions_.is_auth(position, user);
}

// =============================================================================
// Liquidation
// =============================================================================

void PositionManager::liquidate(const Address& caller, const Address& position,
                                const std::vector<DebtRepayment>& repayments,
                                const std::vector<AssetSeizure>& seizures) {
    runtime_.atomic("PositionManager::liquidate", [&] {
        for (MarketId market : positions_.get(position).debt_markets.to_vector()) {
            ledger_.accrue(market);
        }

        LiquidationCheck check = risk_.validate_liquidation(position, repayments, seizures);

        for (const auto& r : check.repayments) {
            if (r.amount == 0) continue;
            Address asset = ledger_.asset_of(r.market);
            tokens_.transfer_from(asset, self_, caller, ledger_.address(), r.amount);
            ledger_.repay(self_, r.market, position, r.amount);
            prune_debt(position, r.market);
        }

        const Address& owner = state_.params.owner;
        for (const auto& s : check.seizures) {
            I128 fee = mul_x18(s.amount, state_.params.liquidation_fee_x18);
            if (fee > 0) tokens_.transfer(s.asset, position, owner, fee);
            tokens_.transfer(s.asset, position, caller, s.amount - fee);
            prune_asset(position, s.asset);
        }

        if (!check.bad_debt) {
            RiskData after = risk_.get_risk_data(position);
            if (after.total_collateral_value < after.total_debt_value) {
                throw Error(errors::LIQUIDATION_CREATES_BAD_DEBT, addresses::to_hex(position));
            }
        }

        runtime_.emit(Event("Liquidation", self_)
                          .with("position", position)
                          .with("liquidator", caller)
                          .with("repaid_value", check.repaid_value)
                          .with("seized_value", check.seized_value)
                          .with("bad_debt", check.bad_debt));
    });
}

void PositionManager::liquidate_bad_debt(const Address& caller, const Address& position) {
    runtime_.atomic("PositionManager::liquidate_bad_debt", [&] {
        require_protocol_owner(caller);

        for (MarketId market : positions_.get(position).debt_markets.to_vector()) {
            ledger_.accrue(market);
        }
        risk_.validate_bad_debt(position);

        const Address& owner = state_.params.owner;
        for (const Address& asset : positions_.get(position).held_assets.to_vector()) {
            I128 balance = tokens_.balance_of(asset, position);
            if (balance > 0) tokens_.transfer(asset, position, owner, balance);
            positions_.remove_asset(position, asset);
        }

        I128 written_off = 0;
        for (MarketId market : positions_.get(position).debt_markets.to_vector()) {
            written_off = add_checked(written_off, ledger_.rebalance_bad_debt(self_, market, position));
            positions_.remove_debt_market(position, market);
        }

        runtime_.emit(Event("BadDebtLiquidation", self_)
                          .with("position", position)
                          .with("written_off", written_off));
    });
}

// =============================================================================
// Protocol Owner
// =============================================================================

void PositionManager::toggle_known_asset(const Address& caller, const Address& asset) {
    runtime_.atomic("PositionManager::toggle_known_asset", [&] {
        require_protocol_owner(caller);
        bool known = state_.known_assets.count(asset) == 0;
        if (known) {
            state_.known_assets.insert(asset);
        } else {
            state_.known_assets.erase(asset);
        }
        runtime_.emit(Event("KnownAssetToggled", self_).with("asset", asset).with("known", known));
    });
}

void PositionManager::toggle_known_spender(const Address& caller, const Address& spender) {
    runtime_.atomic("PositionManager::toggle_known_spender", [&] {
        require_protocol_owner(caller);
        bool known = state_.known_spenders.count(spender) == 0;
        if (known) {
            state_.known_spenders.insert(spender);
        } else {
            state_.known_spenders.erase(spender);
        }
        runtime_.emit(Event("KnownSpenderToggled", self_).with("spender", spender).with("known", known));
    });
}

void PositionManager::toggle_known_func(const Address& caller, const Address& target, uint32_t selector) {
    runtime_.atomic("PositionManager::toggle_known_func", [&] {
        require_protocol_owner(caller);
        bool known = state_.known_funcs.count({target, selector}) == 0;
        if (known) {
            state_.known_funcs.insert({target, selector});
        } else {
            state_.known_funcs.erase({target, selector});
        }
        runtime_.emit(Event("KnownFuncToggled", self_)
                          .with("target", target)
                          .with("selector", static_cast<uint64_t>(selector))
                          .with("known", known));
    });
}

void PositionManager::register_exec_target(const Address& caller, const Address& target, IExecTarget* impl) {
    runtime_.atomic("PositionManager::register_exec_target", [&] {
        require_protocol_owner(caller);
        if (impl == nullptr) {
            state_.exec_targets.erase(target);
        } else {
            state_.exec_targets[target] = impl;
        }
    });
}

void PositionManager::set_liquidation_fee(const Address& caller, I128 fee_x18) {
    runtime_.atomic("PositionManager::set_liquidation_fee", [&] {
        require_protocol_owner(caller);
        if (fee_x18 < 0 || fee_x18 > X18_ONE) {
            throw Error(errors::INVALID_PARAMETER, "liquidation fee outside [0, 1]");
        }
        state_.params.liquidation_fee_x18 = fee_x18;
        runtime_.emit(Event("LiquidationFeeSet", self_).with("fee", x18::to_string(fee_x18)));
    });
}

void PositionManager::transfer_ownership(const Address& caller, const Address& new_owner) {
    runtime_.atomic("PositionManager::transfer_ownership", [&] {
        require_protocol_owner(caller);
        state_.params.owner = new_owner;
        runtime_.emit(Event("OwnershipTransferred", self_).with("owner", new_owner));
    });
}

} // namespace isolend
