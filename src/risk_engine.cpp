// =============================================================================
// risk_engine.cpp - Oracle and LTV governance
// =============================================================================

#include "isolend/risk_engine.hpp"

namespace isolend {

namespace {

void validate_bounds(I128 min_ltv, I128 max_ltv) {
    if (min_ltv <= 0 || min_ltv > max_ltv || max_ltv >= X18_ONE) {
        throw Error(errors::INVALID_PARAMETER,
                    "ltv bounds " + x18::to_string(min_ltv) + ".." + x18::to_string(max_ltv));
    }
}

} // namespace

RiskEngine::RiskEngine(Runtime& runtime, const Ledger& ledger, const RiskEngineParams& params,
                       const Address& self)
    : runtime_(runtime), ledger_(ledger), self_(self) {
    validate_bounds(params.min_ltv_x18, params.max_ltv_x18);
    state_.params = params;
    runtime_.register_state(this);
}

RiskEngine::~RiskEngine() {
    runtime_.unregister_state(this);
}

// =============================================================================
// Internal Helpers
// =============================================================================

void RiskEngine::require_market_owner(const Address& caller, MarketId market) const {
    if (ledger_.owner_of(market) != caller) {
        throw Error(errors::UNAUTHORIZED, "market owner only");
    }
}

void RiskEngine::require_protocol_owner(const Address& caller) const {
    if (caller != state_.params.owner) {
        throw Error(errors::UNAUTHORIZED, "risk engine owner only");
    }
}

void RiskEngine::check_timelock(uint64_t valid_after) const {
    uint64_t now = runtime_.now();
    if (now < valid_after) {
        throw Error(errors::TIMELOCK_NOT_ELAPSED, "valid after " + std::to_string(valid_after));
    }
    if (now > valid_after + state_.params.timelock_deadline) {
        throw Error(errors::TIMELOCK_EXPIRED,
                    "expired at " + std::to_string(valid_after + state_.params.timelock_deadline));
    }
}

// =============================================================================
// LTV Governance
// =============================================================================

void RiskEngine::request_ltv_update(const Address& caller, MarketId market, const Address& asset, I128 ltv_x18) {
    runtime_.atomic("RiskEngine::request_ltv_update", [&] {
        require_market_owner(caller, market);

        MarketAsset key{market, asset};
        if (state_.oracles.count(key) == 0) {
            throw Error(errors::NO_ORACLE, addresses::to_hex(asset));
        }
        if (ltv_x18 < state_.params.min_ltv_x18 || ltv_x18 > state_.params.max_ltv_x18) {
            throw Error(errors::LTV_OUT_OF_BOUNDS, x18::to_string(ltv_x18));
        }

        if (state_.ltv.count(key) == 0) {
            state_.ltv[key] = ltv_x18;
            state_.pending_ltv.erase(key);
            runtime_.emit(Event("LtvUpdated", self_)
                              .with("market", market)
                              .with("asset", asset)
                              .with("ltv", x18::to_string(ltv_x18)));
            return;
        }

        PendingLtvUpdate pending{ltv_x18, runtime_.now() + state_.params.timelock_duration};
        state_.pending_ltv[key] = pending;
        runtime_.emit(Event("LtvUpdateRequested", self_)
                          .with("market", market)
                          .with("asset", asset)
                          .with("ltv", x18::to_string(ltv_x18))
                          .with("valid_after", pending.valid_after));
    });
}

void RiskEngine::accept_ltv_update(const Address& caller, MarketId market, const Address& asset) {
    runtime_.atomic("RiskEngine::accept_ltv_update", [&] {
        require_market_owner(caller, market);

        auto it = state_.pending_ltv.find({market, asset});
        if (it == state_.pending_ltv.end()) {
            throw Error(errors::NO_PENDING_UPDATE, "ltv");
        }
        check_timelock(it->second.valid_after);

        I128 ltv = it->second.ltv_x18;
        state_.ltv[{market, asset}] = ltv;
        state_.pending_ltv.erase(it);
        runtime_.emit(Event("LtvUpdated", self_)
                          .with("market", market)
                          .with("asset", asset)
                          .with("ltv", x18::to_string(ltv)));
    });
}

void RiskEngine::reject_ltv_update(const Address& caller, MarketId market, const Address& asset) {
    runtime_.atomic("RiskEngine::reject_ltv_update", [&] {
        require_market_owner(caller, market);
        if (state_.pending_ltv.erase({market, asset}) == 0) {
            throw Error(errors::NO_PENDING_UPDATE, "ltv");
        }
        runtime_.emit(Event("LtvUpdateRejected", self_)
                          .with("market", market)
                          .with("asset", asset));
    });
}

std::optional<PendingLtvUpdate> RiskEngine::pending_ltv_update(MarketId market, const Address& asset) const {
    auto it = state_.pending_ltv.find({market, asset});
    if (it == state_.pending_ltv.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Oracle Governance
// =============================================================================

void RiskEngine::set_oracle(const Address& caller, MarketId market, const Address& asset,
                            std::shared_ptr<const IOracle> oracle) {
    runtime_.atomic("RiskEngine::set_oracle", [&] {
        require_protocol_owner(caller);
        if (!ledger_.exists(market)) {
            throw Error(errors::MARKET_NOT_FOUND, std::to_string(market));
        }
        if (!oracle) throw Error(errors::INVALID_PARAMETER, "null oracle");

        state_.oracles[{market, asset}] = std::move(oracle);
        state_.pending_oracle.erase({market, asset});
        runtime_.emit(Event("OracleSet", self_)
                          .with("market", market)
                          .with("asset", asset));
    });
}

void RiskEngine::request_oracle_update(const Address& caller, MarketId market, const Address& asset,
                                       std::shared_ptr<const IOracle> oracle) {
    runtime_.atomic("RiskEngine::request_oracle_update", [&] {
        require_market_owner(caller, market);
        if (!oracle) throw Error(errors::INVALID_PARAMETER, "null oracle");

        MarketAsset key{market, asset};
        if (state_.oracles.count(key) == 0) {
            state_.oracles[key] = std::move(oracle);
            runtime_.emit(Event("OracleSet", self_)
                              .with("market", market)
                              .with("asset", asset));
            return;
        }

        uint64_t valid_after = runtime_.now() + state_.params.timelock_duration;
        state_.pending_oracle[key] = PendingOracleUpdate{std::move(oracle), valid_after};
        runtime_.emit(Event("OracleUpdateRequested", self_)
                          .with("market", market)
                          .with("asset", asset)
                          .with("valid_after", valid_after));
    });
}

void RiskEngine::accept_oracle_update(const Address& caller, MarketId market, const Address& asset) {
    runtime_.atomic("RiskEngine::accept_oracle_update", [&] {
        require_market_owner(caller, market);

        auto it = state_.pending_oracle.find({market, asset});
        if (it == state_.pending_oracle.end()) {
            throw Error(errors::NO_PENDING_UPDATE, "oracle");
        }
        check_timelock(it->second.valid_after);

        state_.oracles[{market, asset}] = it->second.oracle;
        state_.pending_oracle.erase(it);
        runtime_.emit(Event("OracleSet", self_)
                          .with("market", market)
                          .with("asset", asset));
    });
}

void RiskEngine::reject_oracle_update(const Address& caller, MarketId market, const Address& asset) {
    runtime_.atomic("RiskEngine::reject_oracle_update", [&] {
        require_market_owner(caller, market);
        if (state_.pending_oracle.erase({market, asset}) == 0) {
            throw Error(errors::NO_PENDING_UPDATE, "oracle");
        }
        runtime_.emit(Event("OracleUpdateRejected", self_)
                          .with("market", market)
                          .with("asset", asset));
    });
}

bool RiskEngine::has_pending_oracle_update(MarketId market, const Address& asset) const {
    return state_.pending_oracle.count({market, asset}) != 0;
}

// =============================================================================
// Queries
// =============================================================================

I128 RiskEngine::ltv_for(MarketId market, const Address& asset) const {
    auto it = state_.ltv.find({market, asset});
    return it != state_.ltv.end() ? it->second : 0;
}

std::shared_ptr<const IOracle> RiskEngine::oracle_for(MarketId market, const Address& asset) const {
    auto it = state_.oracles.find({market, asset});
    return it != state_.oracles.end() ? it->second : nullptr;
}

I128 RiskEngine::value_of(MarketId market, const Address& asset, I128 amount) const {
    auto it = state_.oracles.find({market, asset});
    if (it == state_.oracles.end()) {
        throw Error(errors::NO_ORACLE, std::to_string(market) + "/" + addresses::to_hex(asset));
    }
    return it->second->value_of(asset, amount);
}

// =============================================================================
// Protocol Owner
// =============================================================================

void RiskEngine::set_ltv_bounds(const Address& caller, I128 min_ltv_x18, I128 max_ltv_x18) {
    runtime_.atomic("RiskEngine::set_ltv_bounds", [&] {
        require_protocol_owner(caller);
        validate_bounds(min_ltv_x18, max_ltv_x18);
        state_.params.min_ltv_x18 = min_ltv_x18;
        state_.params.max_ltv_x18 = max_ltv_x18;
        runtime_.emit(Event("LtvBoundsSet", self_)
                          .with("min_ltv", x18::to_string(min_ltv_x18))
                          .with("max_ltv", x18::to_string(max_ltv_x18)));
    });
}

void RiskEngine::transfer_ownership(const Address& caller, const Address& new_owner) {
    runtime_.atomic("RiskEngine::transfer_ownership", [&] {
        require_protocol_owner(caller);
        state_.params.owner = new_owner;
        runtime_.emit(Event("OwnershipTransferred", self_).with("owner", new_owner));
    });
}

} // namespace isolend
