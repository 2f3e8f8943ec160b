#ifndef ISOLEND_POSITION_MANAGER_HPP
#define ISOLEND_POSITION_MANAGER_HPP

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "action.hpp"
#include "ledger.hpp"
#include "position.hpp"
#include "risk_module.hpp"
#include "runtime.hpp"
#include "token.hpp"
#include "types.hpp"

namespace isolend {

// =============================================================================
// External Call Targets (Exec action)
// =============================================================================

struct ExecContext {
    Address position;
    Address caller;
    uint32_t selector;
    const std::vector<uint8_t>& calldata;
    TokenBank& tokens;
};

// A contract a position may call once (target, selector) is allow-listed.
// Runs inside the caller's atomic call; throwing reverts the whole batch.
class IExecTarget {
public:
    virtual ~IExecTarget() = default;
    virtual void exec(ExecContext& ctx) = 0;
};

// =============================================================================
// Position Manager State
// =============================================================================

struct PositionManagerParams {
    Address owner{};
    I128 liquidation_fee_x18 = 0;   // Share of seized collateral paid to owner
};

struct PositionManagerState {
    PositionManagerParams params;
    std::set<Address> known_assets;
    std::set<Address> known_spenders;
    std::set<std::pair<Address, uint32_t>> known_funcs;
    std::map<Address, IExecTarget*> exec_targets;
};

// =============================================================================
// PositionManager - the only mutation path into positions
//
// Every batch runs as one atomic call: authorization per action, dispatch,
// then a single health check on the position once all actions applied.
// =============================================================================

class PositionManager : public StatefulBase<PositionManagerState> {
public:
    PositionManager(Runtime& runtime, TokenBank& tokens, Ledger& ledger, PositionRegistry& positions,
                    const RiskModule& risk, const PositionManagerParams& params,
                    const Address& self = addresses::POSITION_MANAGER);
    ~PositionManager() override;

    // Non-copyable
    PositionManager(const PositionManager&) = delete;
    PositionManager& operator=(const PositionManager&) = delete;

    const Address& address() const { return self_; }
    const PositionManagerParams& params() const { return state_.params; }

    // =========================================================================
    // Actions
    // =========================================================================

    void process(const Address& caller, const Address& position, const Action& action);
    void process_batch(const Address& caller, const Address& position, const std::vector<Action>& actions);

    // Address a NewPosition(owner, salt) action must target
    Address predict_address(const Address& owner, uint64_t salt) const;

    // =========================================================================
    // Position Access
    // =========================================================================

    // Position owner only; grants or revokes `user`
    void toggle_auth(const Address& caller, const Address& user, const Address& position);

    std::optional<Address> owner_of(const Address& position) const;
    bool is_auth(const Address& position, const Address& user) const;

    // =========================================================================
    // Liquidation
    // =========================================================================

    // Any caller; repays debt from the caller's tokens and takes collateral
    void liquidate(const Address& caller, const Address& position,
                   const std::vector<DebtRepayment>& repayments,
                   const std::vector<AssetSeizure>& seizures);

    // Protocol owner, and only for a position in bad debt
    void liquidate_bad_debt(const Address& caller, const Address& position);

    // =========================================================================
    // Protocol Owner
    // =========================================================================

    void toggle_known_asset(const Address& caller, const Address& asset);
    void toggle_known_spender(const Address& caller, const Address& spender);
    void toggle_known_func(const Address& caller, const Address& target, uint32_t selector);
    void register_exec_target(const Address& caller, const Address& target, IExecTarget* impl);
    void set_liquidation_fee(const Address& caller, I128 fee_x18);
    void transfer_ownership(const Address& caller, const Address& new_owner);

    bool is_known_asset(const Address& asset) const { return state_.known_assets.count(asset) != 0; }
    bool is_known_spender(const Address& spender) const { return state_.known_spenders.count(spender) != 0; }
    bool is_known_func(const Address& target, uint32_t selector) const {
        return state_.known_funcs.count({target, selector}) != 0;
    }

private:
    void dispatch(const Address& caller, const Address& position, const Action& action);

    void new_position(const Address& position, const Action& action);
    void deposit(const Address& caller, const Address& position, const Action& action);
    void withdraw(const Address& position, const Action& action);
    void add_collateral(const Address& position, const Action& action);
    void remove_collateral(const Address& position, const Action& action);
    void borrow(const Address& position, const Action& action);
    void repay(const Address& position, const Action& action);
    void approve(const Address& position, const Action& action);
    void exec(const Address& caller, const Address& position, const Action& action);

    // Drops a drained asset from the position's held set
    void prune_asset(const Address& position, const Address& asset);
    // Drops a fully repaid market from the position's debt set
    void prune_debt(const Address& position, MarketId market);

    void require_known_asset(const Address& asset) const;
    void require_protocol_owner(const Address& caller) const;

    Runtime& runtime_;
    TokenBank& tokens_;
    Ledger& ledger_;
    PositionRegistry& positions_;
    const RiskModule& risk_;
    Address self_;
};

} // namespace isolend

#endif // ISOLEND_POSITION_MANAGER_HPP
