#ifndef ISOLEND_RISK_ENGINE_HPP
#define ISOLEND_RISK_ENGINE_HPP

#include <map>
#include <memory>
#include <optional>
#include <utility>

#include "ledger.hpp"
#include "oracle.hpp"
#include "runtime.hpp"
#include "types.hpp"

namespace isolend {

// =============================================================================
// Risk Engine Parameters
// =============================================================================

struct RiskEngineParams {
    Address owner{};
    I128 min_ltv_x18 = X18_ONE / 10;         // 10%
    I128 max_ltv_x18 = X18_ONE * 98 / 100;   // 98%
    uint64_t timelock_duration = 24 * 60 * 60;
    uint64_t timelock_deadline = 3 * 24 * 60 * 60;
};

// =============================================================================
// Governance Records
// =============================================================================

struct PendingLtvUpdate {
    I128 ltv_x18;
    uint64_t valid_after;
};

struct PendingOracleUpdate {
    std::shared_ptr<const IOracle> oracle;
    uint64_t valid_after;
};

using MarketAsset = std::pair<MarketId, Address>;

struct RiskEngineState {
    RiskEngineParams params;
    std::map<MarketAsset, I128> ltv;
    std::map<MarketAsset, PendingLtvUpdate> pending_ltv;
    std::map<MarketAsset, std::shared_ptr<const IOracle>> oracles;
    std::map<MarketAsset, PendingOracleUpdate> pending_oracle;
};

// =============================================================================
// RiskEngine - oracle and LTV bindings per (market, asset)
//
// LTV and oracle changes by a market owner go through request/accept with
// a minimum delay and an acceptance deadline. The first binding of a pair
// applies immediately since nobody can have borrowed against it yet.
// =============================================================================

class RiskEngine : public StatefulBase<RiskEngineState> {
public:
    RiskEngine(Runtime& runtime, const Ledger& ledger, const RiskEngineParams& params,
               const Address& self = addresses::RISK_ENGINE);
    ~RiskEngine() override;

    // Non-copyable
    RiskEngine(const RiskEngine&) = delete;
    RiskEngine& operator=(const RiskEngine&) = delete;

    const Address& address() const { return self_; }
    const RiskEngineParams& params() const { return state_.params; }

    // =========================================================================
    // LTV Governance (market owner)
    // =========================================================================

    void request_ltv_update(const Address& caller, MarketId market, const Address& asset, I128 ltv_x18);
    void accept_ltv_update(const Address& caller, MarketId market, const Address& asset);
    void reject_ltv_update(const Address& caller, MarketId market, const Address& asset);

    std::optional<PendingLtvUpdate> pending_ltv_update(MarketId market, const Address& asset) const;

    // =========================================================================
    // Oracle Governance
    // =========================================================================

    // Protocol owner, immediate
    void set_oracle(const Address& caller, MarketId market, const Address& asset,
                    std::shared_ptr<const IOracle> oracle);

    // Market owner, timelocked
    void request_oracle_update(const Address& caller, MarketId market, const Address& asset,
                               std::shared_ptr<const IOracle> oracle);
    void accept_oracle_update(const Address& caller, MarketId market, const Address& asset);
    void reject_oracle_update(const Address& caller, MarketId market, const Address& asset);

    bool has_pending_oracle_update(MarketId market, const Address& asset) const;

    // =========================================================================
    // Queries
    // =========================================================================

    // 0 when unset
    I128 ltv_for(MarketId market, const Address& asset) const;

    // nullptr when unbound
    std::shared_ptr<const IOracle> oracle_for(MarketId market, const Address& asset) const;

    // Throws NO_ORACLE when unbound; oracle failures propagate
    I128 value_of(MarketId market, const Address& asset, I128 amount) const;

    // =========================================================================
    // Protocol Owner
    // =========================================================================

    void set_ltv_bounds(const Address& caller, I128 min_ltv_x18, I128 max_ltv_x18);
    void transfer_ownership(const Address& caller, const Address& new_owner);

private:
    void require_market_owner(const Address& caller, MarketId market) const;
    void require_protocol_owner(const Address& caller) const;
    // Throws unless valid_after <= now <= valid_after + deadline
    void check_timelock(uint64_t valid_after) const;

    Runtime& runtime_;
    const Ledger& ledger_;
    Address self_;
};

} // namespace isolend

#endif // ISOLEND_RISK_ENGINE_HPP
