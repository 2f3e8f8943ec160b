#ifndef ISOLEND_LEDGER_HPP
#define ISOLEND_LEDGER_HPP

#include <map>
#include <memory>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

#include "oracle.hpp"
#include "runtime.hpp"
#include "token.hpp"
#include "types.hpp"

namespace isolend {

// =============================================================================
// Rebasing Share Pair
// =============================================================================

struct SharePair {
    I128 shares = 0;
    I128 assets = 0;

    bool operator==(const SharePair& other) const {
        return shares == other.shares && assets == other.assets;
    }
};

// =============================================================================
// Market (isolated lending pool)
// =============================================================================

struct PendingRateModel {
    Address key;
    uint64_t valid_after;
};

struct Market {
    MarketId id = 0;
    Address owner{};
    Address asset{};
    Address rate_model_key{};
    std::shared_ptr<const IRateModel> rate_model;
    SharePair deposits;
    SharePair borrows;
    I128 deposit_cap = 0;
    I128 borrow_cap = 0;
    uint64_t last_accrual = 0;
    bool paused = false;
    std::optional<PendingRateModel> pending_rate_model;
};

// Read-only projection returned by get_pool_data (accrual simulated)
struct MarketData {
    MarketId id;
    Address owner;
    Address asset;
    Address rate_model_key;
    SharePair deposits;
    SharePair borrows;
    I128 deposit_cap;
    I128 borrow_cap;
    I128 borrow_rate_x18;
    uint64_t last_accrual;
    bool paused;
};

// Result of simulating accrual up to now
struct AccrualPreview {
    I128 interest = 0;
    I128 fee_shares = 0;
    SharePair deposits;
    SharePair borrows;
};

// =============================================================================
// Protocol-wide Ledger Parameters
// =============================================================================

struct LedgerParams {
    Address owner{};
    Address position_manager{};
    Address fee_recipient{};
    I128 interest_fee_x18 = 0;      // Share of accrued interest minted to fee_recipient
    I128 origination_fee_x18 = 0;   // Share of borrowed principal paid to fee_recipient
    I128 min_borrow = 0;
    I128 min_debt = 0;
    I128 min_burned_shares = 0;
    uint64_t timelock_duration = 24 * 60 * 60;
    uint64_t timelock_deadline = 3 * 24 * 60 * 60;
};

struct LedgerState {
    LedgerParams params;
    std::map<MarketId, Market> markets;
    std::map<Address, std::shared_ptr<const IRateModel>> rate_models;

    // (market, account) -> deposit shares
    std::map<std::pair<MarketId, Address>, I128> deposit_shares;
    // (market, position) -> borrow shares
    std::map<std::pair<MarketId, Address>, I128> borrow_shares;
    // (market, owner, spender) -> deposit share allowance
    std::map<std::tuple<MarketId, Address, Address>, I128> allowances;
    // (owner, operator)
    std::map<std::pair<Address, Address>, bool> operators;
};

// =============================================================================
// Ledger - deposit/borrow share accounting for every market
// =============================================================================

class Ledger : public StatefulBase<LedgerState> {
public:
    Ledger(Runtime& runtime, TokenBank& tokens, const LedgerParams& params,
           const Address& self = addresses::LEDGER);
    ~Ledger() override;

    // Non-copyable
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    const Address& address() const { return self_; }
    const LedgerParams& params() const { return state_.params; }

    // =========================================================================
    // Market Lifecycle
    // =========================================================================

    // Creates the market and burns the shares of `initial_deposit` (pulled
    // from caller) to the dead address.
    MarketId initialize_market(const Address& caller, const Address& owner,
                               const Address& asset, const Address& rate_model_key,
                               I128 deposit_cap, I128 borrow_cap, I128 initial_deposit);

    // =========================================================================
    // Deposits
    // =========================================================================

    I128 deposit(const Address& caller, MarketId market, I128 assets, const Address& receiver);

    // Burns the shares covering `assets` (rounded up); returns shares burned
    I128 withdraw(const Address& caller, MarketId market, I128 assets,
                  const Address& receiver, const Address& owner);

    // Burns `shares`; returns assets sent (rounded down)
    I128 redeem(const Address& caller, MarketId market, I128 shares,
                const Address& receiver, const Address& owner);

    // =========================================================================
    // Borrows (position manager only)
    // =========================================================================

    I128 borrow(const Address& caller, MarketId market, const Address& position, I128 assets);

    // Tokens must already be transferred to the ledger. MAX_AMOUNT repays
    // the whole debt. Returns borrow shares burned.
    I128 repay(const Address& caller, MarketId market, const Address& position, I128 assets);

    // Writes the position's whole debt off; depositors absorb the loss.
    // Returns the debt assets written off.
    I128 rebalance_bad_debt(const Address& caller, MarketId market, const Address& position);

    // =========================================================================
    // Interest
    // =========================================================================

    void accrue(MarketId market);
    AccrualPreview simulate_accrual(MarketId market) const;

    // =========================================================================
    // Deposit Share Token
    // =========================================================================

    void transfer(const Address& caller, const Address& to, MarketId market, I128 shares);
    void transfer_from(const Address& caller, const Address& from, const Address& to,
                       MarketId market, I128 shares);
    void approve(const Address& caller, const Address& spender, MarketId market, I128 shares);
    void set_operator(const Address& caller, const Address& op, bool approved);

    I128 balance_of(const Address& owner, MarketId market) const;
    I128 allowance(const Address& owner, const Address& spender, MarketId market) const;
    bool is_operator(const Address& owner, const Address& op) const;
    I128 borrow_shares_of(MarketId market, const Address& position) const;

    // =========================================================================
    // Views (accrual simulated, never mutating)
    // =========================================================================

    bool exists(MarketId market) const;
    std::optional<MarketData> get_pool_data(MarketId market) const;
    std::vector<MarketId> markets() const;
    const Address& owner_of(MarketId market) const;
    const Address& asset_of(MarketId market) const;

    I128 get_assets_of(MarketId market, const Address& account) const;
    I128 get_borrows_of(MarketId market, const Address& position) const;
    I128 get_total_assets(MarketId market) const;
    I128 get_total_borrows(MarketId market) const;
    I128 get_liquidity_of(MarketId market) const;
    I128 max_withdraw(MarketId market, const Address& owner) const;

    // =========================================================================
    // Market Owner Governance
    // =========================================================================

    void set_deposit_cap(const Address& caller, MarketId market, I128 cap);
    void set_borrow_cap(const Address& caller, MarketId market, I128 cap);
    void toggle_pause(const Address& caller, MarketId market);

    void request_rate_model_update(const Address& caller, MarketId market, const Address& rate_model_key);
    void accept_rate_model_update(const Address& caller, MarketId market);
    void reject_rate_model_update(const Address& caller, MarketId market);

    // =========================================================================
    // Protocol Owner Governance
    // =========================================================================

    void register_rate_model(const Address& caller, const Address& key,
                             std::shared_ptr<const IRateModel> model);
    void set_position_manager(const Address& caller, const Address& position_manager);
    void set_interest_fee(const Address& caller, I128 fee_x18);
    void set_origination_fee(const Address& caller, I128 fee_x18);
    void set_fee_recipient(const Address& caller, const Address& recipient);
    void set_min_borrow(const Address& caller, I128 min_borrow);
    void set_min_debt(const Address& caller, I128 min_debt);
    void transfer_ownership(const Address& caller, const Address& new_owner);

private:
    Market& market_ref(MarketId market);
    const Market& market_ref(MarketId market) const;

    AccrualPreview preview(const Market& m) const;
    void accrue_market(Market& m);

    void require_protocol_owner(const Address& caller) const;
    void require_market_owner(const Address& caller, const Market& m) const;
    void require_position_manager(const Address& caller) const;

    // Consumes allowance unless caller is the owner or an operator
    void spend_allowance(MarketId market, const Address& owner, const Address& caller, I128 shares);
    // Burns owner's shares and sends assets out of idle liquidity
    void burn_and_send(Market& m, const Address& owner, const Address& receiver,
                       I128 shares, I128 assets);

    void credit(std::map<std::pair<MarketId, Address>, I128>& book,
                MarketId market, const Address& account, I128 shares);
    void debit(std::map<std::pair<MarketId, Address>, I128>& book,
               MarketId market, const Address& account, I128 shares);

    Runtime& runtime_;
    TokenBank& tokens_;
    Address self_;
};

} // namespace isolend

#endif // ISOLEND_LEDGER_HPP
