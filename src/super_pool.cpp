// =============================================================================
// super_pool.cpp - Multi-market liquidity router
// =============================================================================

#include "isolend/super_pool.hpp"

#include <algorithm>

namespace isolend {

SuperPool::SuperPool(Runtime& runtime, TokenBank& tokens, Ledger& ledger, const Address& self,
                     const SuperPoolParams& params)
    : runtime_(runtime), tokens_(tokens), ledger_(ledger), self_(self) {
    if (addresses::is_zero(params.asset)) {
        throw Error(errors::INVALID_PARAMETER, "zero asset");
    }
    if (params.fee_x18 < 0 || params.fee_x18 > X18_ONE) {
        throw Error(errors::INVALID_PARAMETER, "fee outside [0, 1]");
    }
    if (params.super_pool_cap < 0) {
        throw Error(errors::INVALID_PARAMETER, "negative cap");
    }
    state_.params = params;
    runtime_.register_state(this);
}

SuperPool::~SuperPool() {
    runtime_.unregister_state(this);
}

// =============================================================================
// Share Math
// =============================================================================

I128 SuperPool::to_shares(I128 assets, I128 total_assets, I128 total_supply, Rounding rounding) const {
    return mul_div(assets, total_supply + 1, total_assets + 1, rounding);
}

I128 SuperPool::to_assets(I128 shares, I128 total_assets, I128 total_supply, Rounding rounding) const {
    return mul_div(shares, total_assets + 1, total_supply + 1, rounding);
}

I128 SuperPool::idle() const {
    return tokens_.balance_of(state_.params.asset, self_);
}

I128 SuperPool::total_assets() const {
    I128 total = idle();
    for (MarketId market : state_.deposit_queue) {
        total = add_checked(total, ledger_.get_assets_of(market, self_));
    }
    return total;
}

// =============================================================================
// Fees
// =============================================================================

SuperPoolAccrual SuperPool::simulate_accrue() const {
    SuperPoolAccrual out;
    out.total_assets = total_assets();
    if (out.total_assets <= state_.last_total_assets || state_.params.fee_x18 == 0) return out;

    I128 fee_assets = mul_x18(out.total_assets - state_.last_total_assets, state_.params.fee_x18);
    if (fee_assets == 0) return out;

    // Priced at the share price before the fee is taken out
    out.fee_shares = mul_div(fee_assets, state_.total_supply + 1,
                             out.total_assets - fee_assets + 1, Rounding::Floor);
    return out;
}

void SuperPool::accrue_fees() {
    SuperPoolAccrual acc = simulate_accrue();
    if (acc.fee_shares > 0) {
        mint_shares(state_.params.fee_recipient, acc.fee_shares);
        runtime_.emit(Event("FeesAccrued", self_)
                          .with("recipient", state_.params.fee_recipient)
                          .with("shares", acc.fee_shares));
    }
    state_.last_total_assets = acc.total_assets;
}

void SuperPool::accrue() {
    runtime_.atomic("SuperPool::accrue", [&] { accrue_fees(); });
}

// =============================================================================
// ERC4626
// =============================================================================

I128 SuperPool::deposit(const Address& caller, I128 assets, const Address& receiver) {
    return runtime_.atomic("SuperPool::deposit", [&] {
        if (state_.paused) throw Error(errors::VAULT_PAUSED, addresses::to_hex(self_));
        if (assets < 0) throw Error(errors::INVALID_PARAMETER, "negative deposit");
        accrue_fees();

        I128 shares = to_shares(assets, state_.last_total_assets, state_.total_supply, Rounding::Floor);
        if (shares == 0) throw Error(errors::ZERO_SHARES, "deposit");

        deposit_flow(caller, receiver, assets, shares);
        return shares;
    });
}

I128 SuperPool::mint(const Address& caller, I128 shares, const Address& receiver) {
    return runtime_.atomic("SuperPool::mint", [&] {
        if (state_.paused) throw Error(errors::VAULT_PAUSED, addresses::to_hex(self_));
        if (shares < 0) throw Error(errors::INVALID_PARAMETER, "negative mint");
        accrue_fees();

        I128 assets = to_assets(shares, state_.last_total_assets, state_.total_supply, Rounding::Ceil);
        if (assets == 0) throw Error(errors::ZERO_ASSETS, "mint");

        deposit_flow(caller, receiver, assets, shares);
        return assets;
    });
}

I128 SuperPool::withdraw(const Address& caller, I128 assets, const Address& receiver, const Address& owner) {
    return runtime_.atomic("SuperPool::withdraw", [&] {
        if (assets < 0) throw Error(errors::INVALID_PARAMETER, "negative withdraw");
        accrue_fees();

        I128 shares = to_shares(assets, state_.last_total_assets, state_.total_supply, Rounding::Ceil);
        if (shares == 0) throw Error(errors::ZERO_SHARES, "withdraw");

        withdraw_flow(caller, receiver, owner, assets, shares);
        return shares;
    });
}

I128 SuperPool::redeem(const Address& caller, I128 shares, const Address& receiver, const Address& owner) {
    return runtime_.atomic("SuperPool::redeem", [&] {
        if (shares < 0) throw Error(errors::INVALID_PARAMETER, "negative redeem");
        accrue_fees();

        I128 assets = to_assets(shares, state_.last_total_assets, state_.total_supply, Rounding::Floor);
        if (assets == 0) throw Error(errors::ZERO_ASSETS, "redeem");

        withdraw_flow(caller, receiver, owner, assets, shares);
        return assets;
    });
}

void SuperPool::deposit_flow(const Address& caller, const Address& receiver, I128 assets, I128 shares) {
    I128 new_total = add_checked(state_.last_total_assets, assets);
    if (new_total > state_.params.super_pool_cap) {
        throw Error(errors::SUPER_POOL_CAP_EXCEEDED, to_string(new_total));
    }

    tokens_.transfer_from(state_.params.asset, self_, caller, self_, assets);
    mint_shares(receiver, shares);
    supply_to_pools(assets);
    state_.last_total_assets = new_total;

    runtime_.emit(Event("Deposit", self_)
                      .with("caller", caller)
                      .with("receiver", receiver)
                      .with("assets", assets)
                      .with("shares", shares));
}

void SuperPool::withdraw_flow(const Address& caller, const Address& receiver, const Address& owner,
                              I128 assets, I128 shares) {
    if (caller != owner) spend_allowance(owner, caller, shares);
    burn_shares(owner, shares);
    withdraw_from_pools(assets);
    tokens_.transfer(state_.params.asset, self_, receiver, assets);
    state_.last_total_assets -= std::min(assets, state_.last_total_assets);

    runtime_.emit(Event("Withdraw", self_)
                      .with("caller", caller)
                      .with("receiver", receiver)
                      .with("owner", owner)
                      .with("assets", assets)
                      .with("shares", shares));
}

// =============================================================================
// Previews (fee accrual simulated)
// =============================================================================

I128 SuperPool::preview_deposit(I128 assets) const {
    SuperPoolAccrual acc = simulate_accrue();
    return to_shares(assets, acc.total_assets, state_.total_supply + acc.fee_shares, Rounding::Floor);
}

I128 SuperPool::preview_mint(I128 shares) const {
    SuperPoolAccrual acc = simulate_accrue();
    return to_assets(shares, acc.total_assets, state_.total_supply + acc.fee_shares, Rounding::Ceil);
}

I128 SuperPool::preview_withdraw(I128 assets) const {
    SuperPoolAccrual acc = simulate_accrue();
    return to_shares(assets, acc.total_assets, state_.total_supply + acc.fee_shares, Rounding::Ceil);
}

I128 SuperPool::preview_redeem(I128 shares) const {
    SuperPoolAccrual acc = simulate_accrue();
    return to_assets(shares, acc.total_assets, state_.total_supply + acc.fee_shares, Rounding::Floor);
}

I128 SuperPool::convert_to_shares(I128 assets) const {
    return preview_deposit(assets);
}

I128 SuperPool::convert_to_assets(I128 shares) const {
    return preview_redeem(shares);
}

I128 SuperPool::max_deposit(const Address&) const {
    if (state_.paused) return 0;
    I128 total = simulate_accrue().total_assets;
    return state_.params.super_pool_cap > total ? state_.params.super_pool_cap - total : 0;
}

I128 SuperPool::max_mint(const Address& receiver) const {
    return preview_deposit(max_deposit(receiver));
}

I128 SuperPool::max_withdraw(const Address& owner) const {
    I128 liquid = idle();
    for (MarketId market : state_.withdraw_queue) {
        liquid = add_checked(liquid, std::min(ledger_.get_assets_of(market, self_),
                                              ledger_.get_liquidity_of(market)));
    }
    return std::min(preview_redeem(balance_of(owner)), liquid);
}

I128 SuperPool::max_redeem(const Address& owner) const {
    SuperPoolAccrual acc = simulate_accrue();
    I128 shares = to_shares(max_withdraw(owner), acc.total_assets,
                            state_.total_supply + acc.fee_shares, Rounding::Floor);
    return std::min(shares, balance_of(owner));
}

// =============================================================================
// Routing
// =============================================================================

void SuperPool::deposit_into_market(MarketId market, I128 assets) {
    tokens_.approve(state_.params.asset, self_, ledger_.address(), assets);
    ledger_.deposit(self_, market, assets, self_);
}

void SuperPool::supply_to_pools(I128 assets) {
    for (MarketId market : state_.deposit_queue) {
        if (assets == 0) return;

        auto data = ledger_.get_pool_data(market);
        if (!data || data->paused) continue;
        if (data->deposits.shares > 0 && data->deposits.assets == 0) continue;

        I128 current = ledger_.get_assets_of(market, self_);
        I128 cap = pool_cap(market);
        if (current >= cap) continue;

        I128 amount = std::min(assets, cap - current);
        I128 headroom = data->deposit_cap - data->deposits.assets;
        if (headroom <= 0) continue;
        amount = std::min(amount, headroom);

        // Too small to mint a single ledger share
        if (isolend::to_shares(amount, data->deposits.assets, data->deposits.shares, Rounding::Floor) == 0) {
            continue;
        }

        deposit_into_market(market, amount);
        assets -= amount;
    }
}

void SuperPool::withdraw_from_pools(I128 assets) {
    I128 available = idle();
    if (available >= assets) return;
    assets -= available;

    for (MarketId market : state_.withdraw_queue) {
        I128 amount = std::min({assets, ledger_.get_assets_of(market, self_),
                                ledger_.get_liquidity_of(market)});
        if (amount <= 0) continue;

        ledger_.withdraw(self_, market, amount, self_, self_);
        assets -= amount;
        if (assets == 0) return;
    }
    throw Error(errors::INSUFFICIENT_WITHDRAW_PATH, to_string(assets) + " unsourced");
}

void SuperPool::reallocate(const Address& caller, const std::vector<ReallocateParams>& withdrawals,
                           const std::vector<ReallocateParams>& deposits) {
    runtime_.atomic("SuperPool::reallocate", [&] {
        if (caller != state_.params.owner && !is_allocator(caller)) {
            throw Error(errors::UNAUTHORIZED, "owner or allocator only");
        }

        for (const auto& w : withdrawals) {
            if (state_.pool_caps.count(w.market) == 0) {
                throw Error(errors::MARKET_NOT_IN_QUEUE, std::to_string(w.market));
            }
            ledger_.withdraw(self_, w.market, w.assets, self_, self_);
        }

        for (const auto& d : deposits) {
            if (state_.pool_caps.count(d.market) == 0) {
                throw Error(errors::MARKET_NOT_IN_QUEUE, std::to_string(d.market));
            }
            I128 after = add_checked(ledger_.get_assets_of(d.market, self_), d.assets);
            if (after > pool_cap(d.market)) {
                throw Error(errors::POOL_CAP_EXCEEDED, std::to_string(d.market));
            }
            deposit_into_market(d.market, d.assets);
        }

        runtime_.emit(Event("Reallocated", self_)
                          .with("caller", caller)
                          .with("withdrawals", static_cast<uint64_t>(withdrawals.size()))
                          .with("deposits", static_cast<uint64_t>(deposits.size())));
    });
}

I128 SuperPool::pool_cap(MarketId market) const {
    auto it = state_.pool_caps.find(market);
    return it != state_.pool_caps.end() ? it->second : 0;
}

// =============================================================================
// Share Token
// =============================================================================

void SuperPool::mint_shares(const Address& to, I128 shares) {
    state_.total_supply = add_checked(state_.total_supply, shares);
    state_.balances[to] = add_checked(state_.balances[to], shares);
}

void SuperPool::burn_shares(const Address& from, I128 shares) {
    auto it = state_.balances.find(from);
    if (it == state_.balances.end() || it->second < shares) {
        throw Error(errors::INSUFFICIENT_SHARES, addresses::to_hex(from));
    }
    it->second -= shares;
    if (it->second == 0) state_.balances.erase(it);
    state_.total_supply -= shares;
}

void SuperPool::spend_allowance(const Address& owner, const Address& spender, I128 shares) {
    auto it = state_.allowances.find({owner, spender});
    I128 allowed = it != state_.allowances.end() ? it->second : 0;
    if (allowed < shares) {
        throw Error(errors::INSUFFICIENT_ALLOWANCE, addresses::to_hex(spender));
    }
    if (allowed == MAX_AMOUNT) return;
    it->second -= shares;
    if (it->second == 0) state_.allowances.erase(it);
}

void SuperPool::transfer(const Address& caller, const Address& to, I128 shares) {
    transfer_from(caller, caller, to, shares);
}

void SuperPool::transfer_from(const Address& caller, const Address& from, const Address& to, I128 shares) {
    runtime_.atomic("SuperPool::transfer_from", [&] {
        if (shares < 0) throw Error(errors::INVALID_PARAMETER, "negative transfer");
        if (caller != from) spend_allowance(from, caller, shares);
        burn_shares(from, shares);
        mint_shares(to, shares);
        runtime_.emit(Event("Transfer", self_)
                          .with("from", from)
                          .with("to", to)
                          .with("shares", shares));
    });
}

void SuperPool::approve(const Address& caller, const Address& spender, I128 shares) {
    runtime_.atomic("SuperPool::approve", [&] {
        if (shares < 0) throw Error(errors::INVALID_PARAMETER, "negative allowance");
        if (shares == 0) {
            state_.allowances.erase({caller, spender});
        } else {
            state_.allowances[{caller, spender}] = shares;
        }
        runtime_.emit(Event("Approval", self_)
                          .with("owner", caller)
                          .with("spender", spender)
                          .with("shares", shares));
    });
}

I128 SuperPool::balance_of(const Address& owner) const {
    auto it = state_.balances.find(owner);
    return it != state_.balances.end() ? it->second : 0;
}

I128 SuperPool::allowance(const Address& owner, const Address& spender) const {
    auto it = state_.allowances.find({owner, spender});
    return it != state_.allowances.end() ? it->second : 0;
}

// =============================================================================
// Owner Administration
// =============================================================================

void SuperPool::require_owner(const Address& caller) const {
    if (caller != state_.params.owner) {
        throw Error(errors::UNAUTHORIZED, "super pool owner only");
    }
}

void SuperPool::add_pool(const Address& caller, MarketId market, I128 cap) {
    runtime_.atomic("SuperPool::add_pool", [&] {
        require_owner(caller);
        if (state_.pool_caps.count(market) != 0) {
            throw Error(errors::MARKET_ALREADY_ADDED, std::to_string(market));
        }
        if (ledger_.asset_of(market) != state_.params.asset) {
            throw Error(errors::ASSET_MISMATCH, std::to_string(market));
        }
        if (state_.deposit_queue.size() >= MAX_SUPER_POOL_MARKETS) {
            throw Error(errors::MAX_QUEUE_LENGTH_EXCEEDED, std::to_string(market));
        }
        if (cap <= 0) throw Error(errors::INVALID_PARAMETER, "pool cap must be positive");

        state_.pool_caps[market] = cap;
        state_.deposit_queue.push_back(market);
        state_.withdraw_queue.push_back(market);
        runtime_.emit(Event("PoolAdded", self_).with("market", market).with("cap", cap));
    });
}

void SuperPool::remove_pool(const Address& caller, MarketId market) {
    runtime_.atomic("SuperPool::remove_pool", [&] {
        require_owner(caller);
        if (state_.pool_caps.count(market) == 0) {
            throw Error(errors::MARKET_NOT_IN_QUEUE, std::to_string(market));
        }
        if (ledger_.balance_of(self_, market) != 0) {
            throw Error(errors::NON_ZERO_BALANCE, std::to_string(market));
        }

        state_.pool_caps.erase(market);
        auto drop = [market](std::vector<MarketId>& queue) {
            queue.erase(std::remove(queue.begin(), queue.end(), market), queue.end());
        };
        drop(state_.deposit_queue);
        drop(state_.withdraw_queue);
        runtime_.emit(Event("PoolRemoved", self_).with("market", market));
    });
}

void SuperPool::modify_pool_cap(const Address& caller, MarketId market, I128 cap) {
    runtime_.atomic("SuperPool::modify_pool_cap", [&] {
        require_owner(caller);
        auto it = state_.pool_caps.find(market);
        if (it == state_.pool_caps.end()) {
            throw Error(errors::MARKET_NOT_IN_QUEUE, std::to_string(market));
        }
        if (cap < 0) throw Error(errors::INVALID_PARAMETER, "negative pool cap");
        it->second = cap;
        runtime_.emit(Event("PoolCapSet", self_).with("market", market).with("cap", cap));
    });
}

void SuperPool::reorder(std::vector<MarketId>& queue, const std::vector<size_t>& order) {
    if (order.size() != queue.size()) {
        throw Error(errors::INVALID_QUEUE_REORDER, "length mismatch");
    }
    std::vector<bool> seen(queue.size(), false);
    std::vector<MarketId> next;
    next.reserve(queue.size());
    for (size_t index : order) {
        if (index >= queue.size() || seen[index]) {
            throw Error(errors::INVALID_QUEUE_REORDER, "not a permutation");
        }
        seen[index] = true;
        next.push_back(queue[index]);
    }
    queue = std::move(next);
}

void SuperPool::reorder_deposit_queue(const Address& caller, const std::vector<size_t>& order) {
    runtime_.atomic("SuperPool::reorder_deposit_queue", [&] {
        require_owner(caller);
        reorder(state_.deposit_queue, order);
        runtime_.emit(Event("DepositQueueReordered", self_));
    });
}

void SuperPool::reorder_withdraw_queue(const Address& caller, const std::vector<size_t>& order) {
    runtime_.atomic("SuperPool::reorder_withdraw_queue", [&] {
        require_owner(caller);
        reorder(state_.withdraw_queue, order);
        runtime_.emit(Event("WithdrawQueueReordered", self_));
    });
}

void SuperPool::toggle_allocator(const Address& caller, const Address& allocator) {
    runtime_.atomic("SuperPool::toggle_allocator", [&] {
        require_owner(caller);
        bool enabled = state_.allocators.count(allocator) == 0;
        if (enabled) {
            state_.allocators.insert(allocator);
        } else {
            state_.allocators.erase(allocator);
        }
        runtime_.emit(Event("AllocatorToggled", self_).with("allocator", allocator).with("enabled", enabled));
    });
}

void SuperPool::set_fee(const Address& caller, I128 fee_x18) {
    runtime_.atomic("SuperPool::set_fee", [&] {
        require_owner(caller);
        if (fee_x18 < 0 || fee_x18 > X18_ONE) {
            throw Error(errors::INVALID_PARAMETER, "fee outside [0, 1]");
        }
        accrue_fees();
        state_.params.fee_x18 = fee_x18;
        runtime_.emit(Event("FeeSet", self_).with("fee", x18::to_string(fee_x18)));
    });
}

void SuperPool::set_fee_recipient(const Address& caller, const Address& recipient) {
    runtime_.atomic("SuperPool::set_fee_recipient", [&] {
        require_owner(caller);
        accrue_fees();
        state_.params.fee_recipient = recipient;
        runtime_.emit(Event("FeeRecipientSet", self_).with("recipient", recipient));
    });
}

void SuperPool::set_super_pool_cap(const Address& caller, I128 cap) {
    runtime_.atomic("SuperPool::set_super_pool_cap", [&] {
        require_owner(caller);
        if (cap < 0) throw Error(errors::INVALID_PARAMETER, "negative cap");
        state_.params.super_pool_cap = cap;
        runtime_.emit(Event("SuperPoolCapSet", self_).with("cap", cap));
    });
}

void SuperPool::toggle_pause(const Address& caller) {
    runtime_.atomic("SuperPool::toggle_pause", [&] {
        require_owner(caller);
        state_.paused = !state_.paused;
        runtime_.emit(Event("PauseToggled", self_).with("paused", state_.paused));
    });
}

void SuperPool::transfer_ownership(const Address& caller, const Address& new_owner) {
    runtime_.atomic("SuperPool::transfer_ownership", [&] {
        require_owner(caller);
        state_.params.owner = new_owner;
        runtime_.emit(Event("OwnershipTransferred", self_).with("owner", new_owner));
    });
}

// =============================================================================
// SuperPoolFactory
// =============================================================================

SuperPoolFactory::SuperPoolFactory(Runtime& runtime, TokenBank& tokens, Ledger& ledger,
                                   I128 min_burned_shares, const Address& self)
    : runtime_(runtime), tokens_(tokens), ledger_(ledger),
      min_burned_shares_(min_burned_shares), self_(self) {
    runtime_.register_state(this);
}

SuperPoolFactory::~SuperPoolFactory() {
    runtime_.unregister_state(this);
}

Address SuperPoolFactory::next_address() const {
    Address addr = addresses::from_id(state_.pools.size() + 1);
    addr[0] = 0x5b;
    addr[1] = 0x9e;
    return addr;
}

std::shared_ptr<SuperPool> SuperPoolFactory::deploy(const Address& caller, const Address& owner,
                                                    const Address& asset, const Address& fee_recipient,
                                                    I128 fee_x18, I128 super_pool_cap,
                                                    I128 initial_deposit, const std::string& name,
                                                    const std::string& symbol) {
    return runtime_.atomic("SuperPoolFactory::deploy", [&] {
        Address addr = next_address();
        auto pool = std::make_shared<SuperPool>(runtime_, tokens_, ledger_, addr, SuperPoolParams{
            .owner = owner,
            .asset = asset,
            .fee_recipient = fee_recipient,
            .fee_x18 = fee_x18,
            .super_pool_cap = super_pool_cap,
            .name = name,
            .symbol = symbol
        });
        state_.pools.push_back(pool);

        I128 burned = 0;
        if (initial_deposit > 0) {
            tokens_.transfer_from(asset, self_, caller, self_, initial_deposit);
            tokens_.approve(asset, self_, addr, initial_deposit);
            burned = pool->deposit(self_, initial_deposit, addresses::DEAD);
        }
        if (burned < min_burned_shares_) {
            throw Error(errors::NOT_ENOUGH_BURNED_SHARES, to_string(burned));
        }

        runtime_.emit(Event("SuperPoolDeployed", self_)
                          .with("pool", addr)
                          .with("owner", owner)
                          .with("asset", asset)
                          .with("name", name));
        return pool;
    });
}

std::shared_ptr<SuperPool> SuperPoolFactory::find(const Address& pool) const {
    for (const auto& p : state_.pools) {
        if (p->address() == pool) return p;
    }
    return nullptr;
}

std::vector<Address> SuperPoolFactory::pools() const {
    std::vector<Address> out;
    out.reserve(state_.pools.size());
    for (const auto& p : state_.pools) out.push_back(p->address());
    return out;
}

} // namespace isolend
