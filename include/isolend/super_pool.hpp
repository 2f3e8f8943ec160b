#ifndef ISOLEND_SUPER_POOL_HPP
#define ISOLEND_SUPER_POOL_HPP

#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ledger.hpp"
#include "math.hpp"
#include "runtime.hpp"
#include "token.hpp"
#include "types.hpp"

namespace isolend {

constexpr size_t MAX_SUPER_POOL_MARKETS = 10;

// =============================================================================
// SuperPool Configuration
// =============================================================================

struct SuperPoolParams {
    Address owner{};
    Address asset{};
    Address fee_recipient{};
    I128 fee_x18 = 0;               // Performance fee on asset growth
    I128 super_pool_cap = 0;        // Max total assets
    std::string name;
    std::string symbol;
};

struct SuperPoolState {
    SuperPoolParams params;
    bool paused = false;

    std::map<MarketId, I128> pool_caps;
    std::vector<MarketId> deposit_queue;
    std::vector<MarketId> withdraw_queue;
    std::set<Address> allocators;
    I128 last_total_assets = 0;

    // Share token
    I128 total_supply = 0;
    std::map<Address, I128> balances;
    std::map<std::pair<Address, Address>, I128> allowances;
};

struct ReallocateParams {
    MarketId market;
    I128 assets;
};

// Result of simulating fee accrual up to now
struct SuperPoolAccrual {
    I128 total_assets = 0;
    I128 fee_shares = 0;
};

// =============================================================================
// SuperPool - ERC4626-style vault routing one asset across ledger markets
//
// Deposits fill markets in deposit-queue order up to each pool cap, and
// withdrawals drain idle funds first, then markets in withdraw-queue
// order. Share conversions use a one-unit virtual offset.
// =============================================================================

class SuperPool : public StatefulBase<SuperPoolState> {
public:
    SuperPool(Runtime& runtime, TokenBank& tokens, Ledger& ledger, const Address& self,
              const SuperPoolParams& params);
    ~SuperPool() override;

    // Non-copyable
    SuperPool(const SuperPool&) = delete;
    SuperPool& operator=(const SuperPool&) = delete;

    const Address& address() const { return self_; }
    const Address& asset() const { return state_.params.asset; }
    const SuperPoolParams& params() const { return state_.params; }
    bool paused() const { return state_.paused; }

    // =========================================================================
    // ERC4626
    // =========================================================================

    I128 deposit(const Address& caller, I128 assets, const Address& receiver);
    I128 mint(const Address& caller, I128 shares, const Address& receiver);
    I128 withdraw(const Address& caller, I128 assets, const Address& receiver, const Address& owner);
    I128 redeem(const Address& caller, I128 shares, const Address& receiver, const Address& owner);

    I128 preview_deposit(I128 assets) const;
    I128 preview_mint(I128 shares) const;
    I128 preview_withdraw(I128 assets) const;
    I128 preview_redeem(I128 shares) const;

    I128 convert_to_shares(I128 assets) const;
    I128 convert_to_assets(I128 shares) const;

    I128 max_deposit(const Address& receiver) const;
    I128 max_mint(const Address& receiver) const;
    I128 max_withdraw(const Address& owner) const;
    I128 max_redeem(const Address& owner) const;

    // Idle balance plus ledger assets in every member market
    I128 total_assets() const;
    I128 idle() const;

    // =========================================================================
    // Fees
    // =========================================================================

    void accrue();
    SuperPoolAccrual simulate_accrue() const;
    I128 last_total_assets() const { return state_.last_total_assets; }

    // =========================================================================
    // Share Token
    // =========================================================================

    void transfer(const Address& caller, const Address& to, I128 shares);
    void transfer_from(const Address& caller, const Address& from, const Address& to, I128 shares);
    void approve(const Address& caller, const Address& spender, I128 shares);

    I128 balance_of(const Address& owner) const;
    I128 allowance(const Address& owner, const Address& spender) const;
    I128 total_supply() const { return state_.total_supply; }

    // =========================================================================
    // Allocation
    // =========================================================================

    // Owner or allocator
    void reallocate(const Address& caller, const std::vector<ReallocateParams>& withdrawals,
                    const std::vector<ReallocateParams>& deposits);

    const std::vector<MarketId>& deposit_queue() const { return state_.deposit_queue; }
    const std::vector<MarketId>& withdraw_queue() const { return state_.withdraw_queue; }
    I128 pool_cap(MarketId market) const;
    bool is_allocator(const Address& user) const { return state_.allocators.count(user) != 0; }

    // =========================================================================
    // Owner Administration
    // =========================================================================

    void add_pool(const Address& caller, MarketId market, I128 cap);
    void remove_pool(const Address& caller, MarketId market);
    void modify_pool_cap(const Address& caller, MarketId market, I128 cap);

    // `order[i]` is the current index of the market to place at position i
    void reorder_deposit_queue(const Address& caller, const std::vector<size_t>& order);
    void reorder_withdraw_queue(const Address& caller, const std::vector<size_t>& order);

    void toggle_allocator(const Address& caller, const Address& allocator);
    void set_fee(const Address& caller, I128 fee_x18);
    void set_fee_recipient(const Address& caller, const Address& recipient);
    void set_super_pool_cap(const Address& caller, I128 cap);
    void toggle_pause(const Address& caller);
    void transfer_ownership(const Address& caller, const Address& new_owner);

private:
    I128 to_shares(I128 assets, I128 total_assets, I128 total_supply, Rounding rounding) const;
    I128 to_assets(I128 shares, I128 total_assets, I128 total_supply, Rounding rounding) const;

    // Mints pending fee shares and checkpoints total assets
    void accrue_fees();

    void deposit_flow(const Address& caller, const Address& receiver, I128 assets, I128 shares);
    void withdraw_flow(const Address& caller, const Address& receiver, const Address& owner,
                       I128 assets, I128 shares);

    void supply_to_pools(I128 assets);
    void withdraw_from_pools(I128 assets);
    void deposit_into_market(MarketId market, I128 assets);

    void mint_shares(const Address& to, I128 shares);
    void burn_shares(const Address& from, I128 shares);
    void spend_allowance(const Address& owner, const Address& spender, I128 shares);
    void reorder(std::vector<MarketId>& queue, const std::vector<size_t>& order);

    void require_owner(const Address& caller) const;

    Runtime& runtime_;
    TokenBank& tokens_;
    Ledger& ledger_;
    Address self_;
};

// =============================================================================
// SuperPoolFactory - deploys pools and burns their initial shares
// =============================================================================

struct SuperPoolFactoryState {
    std::vector<std::shared_ptr<SuperPool>> pools;
};

class SuperPoolFactory : public StatefulBase<SuperPoolFactoryState> {
public:
    SuperPoolFactory(Runtime& runtime, TokenBank& tokens, Ledger& ledger, I128 min_burned_shares,
                     const Address& self = addresses::SUPER_POOL_FACTORY);
    ~SuperPoolFactory() override;

    // Non-copyable
    SuperPoolFactory(const SuperPoolFactory&) = delete;
    SuperPoolFactory& operator=(const SuperPoolFactory&) = delete;

    const Address& address() const { return self_; }

    // Pulls `initial_deposit` from caller (allowance to the factory)
    std::shared_ptr<SuperPool> deploy(const Address& caller, const Address& owner, const Address& asset,
                                      const Address& fee_recipient, I128 fee_x18, I128 super_pool_cap,
                                      I128 initial_deposit, const std::string& name,
                                      const std::string& symbol);

    std::shared_ptr<SuperPool> find(const Address& pool) const;
    std::vector<Address> pools() const;

private:
    Address next_address() const;

    Runtime& runtime_;
    TokenBank& tokens_;
    Ledger& ledger_;
    I128 min_burned_shares_;
    Address self_;
};

} // namespace isolend

#endif // ISOLEND_SUPER_POOL_HPP
