// =============================================================================
// ledger.cpp - Rebasing deposit/borrow ledgers with continuous interest
// =============================================================================

#include "isolend/ledger.hpp"
#include "isolend/math.hpp"

#include <algorithm>

namespace isolend {

// =============================================================================
// Constructor
// =============================================================================

Ledger::Ledger(Runtime& runtime, TokenBank& tokens, const LedgerParams& params, const Address& self)
    : runtime_(runtime), tokens_(tokens), self_(self) {
    if (params.interest_fee_x18 < 0 || params.interest_fee_x18 > X18_ONE ||
        params.origination_fee_x18 < 0 || params.origination_fee_x18 > X18_ONE) {
        throw Error(errors::INVALID_PARAMETER, "fee outside [0, 1]");
    }
    state_.params = params;
    runtime_.register_state(this);
}

Ledger::~Ledger() {
    runtime_.unregister_state(this);
}

// =============================================================================
// Internal Helpers
// =============================================================================

Market& Ledger::market_ref(MarketId market) {
    auto it = state_.markets.find(market);
    if (it == state_.markets.end()) {
        throw Error(errors::MARKET_NOT_FOUND, std::to_string(market));
    }
    return it->second;
}

const Market& Ledger::market_ref(MarketId market) const {
    auto it = state_.markets.find(market);
    if (it == state_.markets.end()) {
        throw Error(errors::MARKET_NOT_FOUND, std::to_string(market));
    }
    return it->second;
}

void Ledger::require_protocol_owner(const Address& caller) const {
    if (caller != state_.params.owner) {
        throw Error(errors::UNAUTHORIZED, "ledger owner only");
    }
}

void Ledger::require_market_owner(const Address& caller, const Market& m) const {
    if (caller != m.owner) {
        throw Error(errors::UNAUTHORIZED, "market owner only");
    }
}

void Ledger::require_position_manager(const Address& caller) const {
    if (caller != state_.params.position_manager) {
        throw Error(errors::ONLY_POSITION_MANAGER, addresses::to_hex(caller));
    }
}

void Ledger::credit(std::map<std::pair<MarketId, Address>, I128>& book,
                    MarketId market, const Address& account, I128 shares) {
    auto& balance = book[{market, account}];
    balance = add_checked(balance, shares);
}

void Ledger::debit(std::map<std::pair<MarketId, Address>, I128>& book,
                   MarketId market, const Address& account, I128 shares) {
    auto it = book.find({market, account});
    if (it == book.end() || it->second < shares) {
        throw Error(errors::INSUFFICIENT_SHARES, addresses::to_hex(account));
    }
    it->second -= shares;
    if (it->second == 0) book.erase(it);
}

// =============================================================================
// Interest Accrual
// =============================================================================

AccrualPreview Ledger::preview(const Market& m) const {
    AccrualPreview out;
    out.deposits = m.deposits;
    out.borrows = m.borrows;

    uint64_t now = runtime_.now();
    if (now <= m.last_accrual || m.borrows.assets == 0) return out;

    uint64_t elapsed = now - m.last_accrual;
    I128 idle = m.deposits.assets - m.borrows.assets;
    I128 rate = m.rate_model->rate(m.borrows.assets, idle);
    if (rate < 0) {
        throw Error(errors::INVALID_PARAMETER, "negative borrow rate");
    }

    // interest = borrows * rate * elapsed / (1e18 * YEAR)
    I128 rate_time = mul_div(rate, static_cast<I128>(elapsed), 1);
    I128 interest = mul_div(m.borrows.assets, rate_time,
                            X18_ONE * static_cast<I128>(SECONDS_PER_YEAR));
    if (interest == 0) return out;

    // Fee shares are priced before the interest lands so they do not earn
    // part of the interest they are paid from.
    I128 fee_assets = mul_x18(interest, state_.params.interest_fee_x18);
    I128 fee_shares = 0;
    if (fee_assets > 0) {
        fee_shares = to_shares(fee_assets, m.deposits.assets, m.deposits.shares, Rounding::Floor);
    }

    out.interest = interest;
    out.fee_shares = fee_shares;
    out.borrows.assets = add_checked(m.borrows.assets, interest);
    out.deposits.assets = add_checked(m.deposits.assets, interest);
    out.deposits.shares = add_checked(m.deposits.shares, fee_shares);
    return out;
}

void Ledger::accrue_market(Market& m) {
    uint64_t now = runtime_.now();
    if (now <= m.last_accrual) return;

    AccrualPreview p = preview(m);
    m.last_accrual = now;
    if (p.interest == 0) return;

    m.deposits = p.deposits;
    m.borrows = p.borrows;
    if (p.fee_shares > 0) {
        credit(state_.deposit_shares, m.id, state_.params.fee_recipient, p.fee_shares);
    }

    runtime_.emit(Event("InterestAccrued", self_)
                      .with("market", m.id)
                      .with("interest", p.interest)
                      .with("fee_shares", p.fee_shares));
}

void Ledger::accrue(MarketId market) {
    runtime_.atomic("Ledger::accrue", [&] {
        accrue_market(market_ref(market));
    });
}

AccrualPreview Ledger::simulate_accrual(MarketId market) const {
    return preview(market_ref(market));
}

// =============================================================================
// Market Lifecycle
// =============================================================================

MarketId Ledger::initialize_market(const Address& caller, const Address& owner,
                                   const Address& asset, const Address& rate_model_key,
                                   I128 deposit_cap, I128 borrow_cap, I128 initial_deposit) {
    return runtime_.atomic("Ledger::initialize_market", [&] {
        if (addresses::is_zero(owner) || addresses::is_zero(asset)) {
            throw Error(errors::INVALID_PARAMETER, "zero owner or asset");
        }
        if (deposit_cap < 0 || borrow_cap < 0) {
            throw Error(errors::INVALID_PARAMETER, "negative cap");
        }
        auto model = state_.rate_models.find(rate_model_key);
        if (model == state_.rate_models.end()) {
            throw Error(errors::UNKNOWN_RATE_MODEL, addresses::to_hex(rate_model_key));
        }

        MarketId id = market_id(owner, asset, rate_model_key);
        if (state_.markets.count(id) != 0) {
            throw Error(errors::MARKET_ALREADY_EXISTS, std::to_string(id));
        }

        Market m;
        m.id = id;
        m.owner = owner;
        m.asset = asset;
        m.rate_model_key = rate_model_key;
        m.rate_model = model->second;
        m.deposit_cap = deposit_cap;
        m.borrow_cap = borrow_cap;
        m.last_accrual = runtime_.now();
        state_.markets.emplace(id, std::move(m));

        runtime_.emit(Event("MarketInitialized", self_)
                          .with("market", id)
                          .with("owner", owner)
                          .with("asset", asset)
                          .with("rate_model", rate_model_key));

        I128 burned = 0;
        if (initial_deposit > 0) {
            burned = deposit(caller, id, initial_deposit, addresses::DEAD);
        }
        if (burned < state_.params.min_burned_shares) {
            throw Error(errors::NOT_ENOUGH_BURNED_SHARES, to_string(burned));
        }
        return id;
    });
}

// =============================================================================
// Deposits
// =============================================================================

I128 Ledger::deposit(const Address& caller, MarketId market, I128 assets, const Address& receiver) {
    return runtime_.atomic("Ledger::deposit", [&] {
        Market& m = market_ref(market);
        accrue_market(m);

        if (m.paused) throw Error(errors::MARKET_PAUSED, std::to_string(market));
        if (assets < 0) throw Error(errors::INVALID_PARAMETER, "negative deposit");
        // Every asset written off: a 1:1 mint would hand the deposit to the
        // existing holders
        if (m.deposits.shares > 0 && m.deposits.assets == 0) {
            throw Error(errors::MARKET_INSOLVENT, std::to_string(market));
        }

        I128 shares = to_shares(assets, m.deposits.assets, m.deposits.shares, Rounding::Floor);
        if (shares == 0) throw Error(errors::ZERO_SHARES, "deposit");

        I128 new_assets = add_checked(m.deposits.assets, assets);
        if (new_assets > m.deposit_cap) {
            throw Error(errors::DEPOSIT_CAP_EXCEEDED, to_string(new_assets));
        }

        tokens_.transfer_from(m.asset, self_, caller, self_, assets);

        m.deposits.assets = new_assets;
        m.deposits.shares = add_checked(m.deposits.shares, shares);
        credit(state_.deposit_shares, market, receiver, shares);

        runtime_.emit(Event("Deposit", self_)
                          .with("market", market)
                          .with("caller", caller)
                          .with("receiver", receiver)
                          .with("assets", assets)
                          .with("shares", shares));
        return shares;
    });
}

void Ledger::spend_allowance(MarketId market, const Address& owner, const Address& caller, I128 shares) {
    if (caller == owner || is_operator(owner, caller)) return;

    auto it = state_.allowances.find({market, owner, caller});
    I128 allowed = it != state_.allowances.end() ? it->second : 0;
    if (allowed < shares) {
        throw Error(errors::INSUFFICIENT_ALLOWANCE, addresses::to_hex(caller));
    }
    if (allowed == MAX_AMOUNT) return;

    it->second -= shares;
    if (it->second == 0) state_.allowances.erase(it);
}

void Ledger::burn_and_send(Market& m, const Address& owner, const Address& receiver,
                           I128 shares, I128 assets) {
    if (balance_of(owner, m.id) < shares) {
        throw Error(errors::INSUFFICIENT_SHARES, addresses::to_hex(owner));
    }
    I128 idle = m.deposits.assets - m.borrows.assets;
    if (assets > idle) {
        throw Error(errors::INSUFFICIENT_LIQUIDITY, to_string(idle));
    }

    debit(state_.deposit_shares, m.id, owner, shares);
    m.deposits.shares -= shares;
    m.deposits.assets -= assets;
    if (m.deposits.shares == 0) m.deposits.assets = 0;

    tokens_.transfer(m.asset, self_, receiver, assets);
}

I128 Ledger::withdraw(const Address& caller, MarketId market, I128 assets,
                      const Address& receiver, const Address& owner) {
    return runtime_.atomic("Ledger::withdraw", [&] {
        Market& m = market_ref(market);
        accrue_market(m);

        if (assets < 0) throw Error(errors::INVALID_PARAMETER, "negative withdraw");

        I128 shares = to_shares(assets, m.deposits.assets, m.deposits.shares, Rounding::Ceil);
        if (shares == 0) throw Error(errors::ZERO_SHARES, "withdraw");

        spend_allowance(market, owner, caller, shares);
        burn_and_send(m, owner, receiver, shares, assets);

        runtime_.emit(Event("Withdraw", self_)
                          .with("market", market)
                          .with("caller", caller)
                          .with("receiver", receiver)
                          .with("owner", owner)
                          .with("assets", assets)
                          .with("shares", shares));
        return shares;
    });
}

I128 Ledger::redeem(const Address& caller, MarketId market, I128 shares,
                    const Address& receiver, const Address& owner) {
    return runtime_.atomic("Ledger::redeem", [&] {
        Market& m = market_ref(market);
        accrue_market(m);

        if (shares < 0) throw Error(errors::INVALID_PARAMETER, "negative redeem");

        I128 assets = to_assets(shares, m.deposits.assets, m.deposits.shares, Rounding::Floor);
        if (assets == 0) throw Error(errors::ZERO_ASSETS, "redeem");

        spend_allowance(market, owner, caller, shares);
        burn_and_send(m, owner, receiver, shares, assets);

        runtime_.emit(Event("Withdraw", self_)
                          .with("market", market)
                          .with("caller", caller)
                          .with("receiver", receiver)
                          .with("owner", owner)
                          .with("assets", assets)
                          .with("shares", shares));
        return assets;
    });
}

// =============================================================================
// Borrows
// =============================================================================

I128 Ledger::borrow(const Address& caller, MarketId market, const Address& position, I128 assets) {
    return runtime_.atomic("Ledger::borrow", [&] {
        require_position_manager(caller);

        Market& m = market_ref(market);
        accrue_market(m);

        if (m.paused) throw Error(errors::MARKET_PAUSED, std::to_string(market));
        if (assets < 0) throw Error(errors::INVALID_PARAMETER, "negative borrow");
        if (assets < state_.params.min_borrow) {
            throw Error(errors::BORROW_TOO_SMALL, to_string(assets));
        }

        I128 shares = to_shares(assets, m.borrows.assets, m.borrows.shares, Rounding::Ceil);
        if (shares == 0) throw Error(errors::ZERO_SHARES, "borrow");

        I128 new_borrows = add_checked(m.borrows.assets, assets);
        if (new_borrows > m.borrow_cap) {
            throw Error(errors::BORROW_CAP_EXCEEDED, to_string(new_borrows));
        }
        if (new_borrows > m.deposits.assets) {
            throw Error(errors::INSUFFICIENT_LIQUIDITY, to_string(m.deposits.assets - m.borrows.assets));
        }

        m.borrows.assets = new_borrows;
        m.borrows.shares = add_checked(m.borrows.shares, shares);
        credit(state_.borrow_shares, market, position, shares);

        I128 debt = to_assets(borrow_shares_of(market, position), m.borrows.assets,
                              m.borrows.shares, Rounding::Ceil);
        if (debt < state_.params.min_debt) {
            throw Error(errors::DEBT_TOO_LOW, to_string(debt));
        }

        I128 fee = mul_x18(assets, state_.params.origination_fee_x18);
        if (fee > 0) tokens_.transfer(m.asset, self_, state_.params.fee_recipient, fee);
        tokens_.transfer(m.asset, self_, position, assets - fee);

        runtime_.emit(Event("Borrow", self_)
                          .with("market", market)
                          .with("position", position)
                          .with("assets", assets)
                          .with("shares", shares)
                          .with("fee", fee));
        return shares;
    });
}

I128 Ledger::repay(const Address& caller, MarketId market, const Address& position, I128 assets) {
    return runtime_.atomic("Ledger::repay", [&] {
        require_position_manager(caller);

        Market& m = market_ref(market);
        accrue_market(m);

        I128 owed_shares = borrow_shares_of(market, position);
        if (owed_shares == 0) {
            throw Error(errors::INVALID_DEBT_MARKET, addresses::to_hex(position));
        }
        I128 owed = to_assets(owed_shares, m.borrows.assets, m.borrows.shares, Rounding::Ceil);

        if (assets == MAX_AMOUNT) assets = owed;
        if (assets < 0) throw Error(errors::INVALID_PARAMETER, "negative repay");
        if (assets > owed) throw Error(errors::REPAY_EXCEEDS_DEBT, to_string(owed));

        I128 shares = assets == owed
            ? owed_shares
            : to_shares(assets, m.borrows.assets, m.borrows.shares, Rounding::Floor);
        if (shares == 0) throw Error(errors::ZERO_SHARES, "repay");

        I128 remaining = owed_shares - shares;
        if (remaining > 0) {
            I128 remaining_debt = to_assets(remaining, m.borrows.assets - std::min(assets, m.borrows.assets),
                                            m.borrows.shares - shares, Rounding::Ceil);
            if (remaining_debt < state_.params.min_debt) {
                throw Error(errors::DEBT_TOO_LOW, to_string(remaining_debt));
            }
        }

        debit(state_.borrow_shares, market, position, shares);
        m.borrows.shares -= shares;
        m.borrows.assets -= std::min(assets, m.borrows.assets);
        if (m.borrows.shares == 0) m.borrows.assets = 0;

        runtime_.emit(Event("Repay", self_)
                          .with("market", market)
                          .with("position", position)
                          .with("assets", assets)
                          .with("shares", shares));
        return shares;
    });
}

I128 Ledger::rebalance_bad_debt(const Address& caller, MarketId market, const Address& position) {
    return runtime_.atomic("Ledger::rebalance_bad_debt", [&] {
        require_position_manager(caller);

        Market& m = market_ref(market);
        accrue_market(m);

        I128 shares = borrow_shares_of(market, position);
        if (shares == 0) return I128(0);

        I128 assets = std::min(
            to_assets(shares, m.borrows.assets, m.borrows.shares, Rounding::Ceil),
            m.borrows.assets);

        debit(state_.borrow_shares, market, position, shares);
        m.borrows.shares -= shares;
        m.borrows.assets -= assets;
        if (m.borrows.shares == 0) m.borrows.assets = 0;

        // The written-off loan never comes back to the pool
        m.deposits.assets -= std::min(assets, m.deposits.assets);

        runtime_.emit(Event("BadDebtRebalanced", self_)
                          .with("market", market)
                          .with("position", position)
                          .with("assets", assets)
                          .with("shares", shares));
        return assets;
    });
}

// =============================================================================
// Deposit Share Token
// =============================================================================

void Ledger::transfer(const Address& caller, const Address& to, MarketId market, I128 shares) {
    transfer_from(caller, caller, to, market, shares);
}

void Ledger::transfer_from(const Address& caller, const Address& from, const Address& to,
                           MarketId market, I128 shares) {
    runtime_.atomic("Ledger::transfer_from", [&] {
        market_ref(market);
        if (shares < 0) throw Error(errors::INVALID_PARAMETER, "negative transfer");

        spend_allowance(market, from, caller, shares);
        debit(state_.deposit_shares, market, from, shares);
        credit(state_.deposit_shares, market, to, shares);

        runtime_.emit(Event("Transfer", self_)
                          .with("market", market)
                          .with("from", from)
                          .with("to", to)
                          .with("shares", shares));
    });
}

void Ledger::approve(const Address& caller, const Address& spender, MarketId market, I128 shares) {
    runtime_.atomic("Ledger::approve", [&] {
        if (shares < 0) throw Error(errors::INVALID_PARAMETER, "negative allowance");
        if (shares == 0) {
            state_.allowances.erase({market, caller, spender});
        } else {
            state_.allowances[{market, caller, spender}] = shares;
        }
        runtime_.emit(Event("Approval", self_)
                          .with("market", market)
                          .with("owner", caller)
                          .with("spender", spender)
                          .with("shares", shares));
    });
}

void Ledger::set_operator(const Address& caller, const Address& op, bool approved) {
    runtime_.atomic("Ledger::set_operator", [&] {
        if (approved) {
            state_.operators[{caller, op}] = true;
        } else {
            state_.operators.erase({caller, op});
        }
        runtime_.emit(Event("OperatorSet", self_)
                          .with("owner", caller)
                          .with("operator", op)
                          .with("approved", approved));
    });
}

I128 Ledger::balance_of(const Address& owner, MarketId market) const {
    auto it = state_.deposit_shares.find({market, owner});
    return it != state_.deposit_shares.end() ? it->second : 0;
}

I128 Ledger::allowance(const Address& owner, const Address& spender, MarketId market) const {
    auto it = state_.allowances.find({market, owner, spender});
    return it != state_.allowances.end() ? it->second : 0;
}

bool Ledger::is_operator(const Address& owner, const Address& op) const {
    return state_.operators.count({owner, op}) != 0;
}

I128 Ledger::borrow_shares_of(MarketId market, const Address& position) const {
    auto it = state_.borrow_shares.find({market, position});
    return it != state_.borrow_shares.end() ? it->second : 0;
}

// =============================================================================
// Views
// =============================================================================

bool Ledger::exists(MarketId market) const {
    return state_.markets.count(market) != 0;
}

std::optional<MarketData> Ledger::get_pool_data(MarketId market) const {
    auto it = state_.markets.find(market);
    if (it == state_.markets.end()) return std::nullopt;

    const Market& m = it->second;
    AccrualPreview p = preview(m);
    return MarketData{
        .id = m.id,
        .owner = m.owner,
        .asset = m.asset,
        .rate_model_key = m.rate_model_key,
        .deposits = p.deposits,
        .borrows = p.borrows,
        .deposit_cap = m.deposit_cap,
        .borrow_cap = m.borrow_cap,
        .borrow_rate_x18 = m.rate_model->rate(p.borrows.assets, p.deposits.assets - p.borrows.assets),
        .last_accrual = m.last_accrual,
        .paused = m.paused
    };
}

std::vector<MarketId> Ledger::markets() const {
    std::vector<MarketId> out;
    out.reserve(state_.markets.size());
    for (const auto& [id, m] : state_.markets) out.push_back(id);
    return out;
}

const Address& Ledger::owner_of(MarketId market) const {
    return market_ref(market).owner;
}

const Address& Ledger::asset_of(MarketId market) const {
    return market_ref(market).asset;
}

I128 Ledger::get_assets_of(MarketId market, const Address& account) const {
    AccrualPreview p = preview(market_ref(market));
    return to_assets(balance_of(account, market), p.deposits.assets, p.deposits.shares, Rounding::Floor);
}

I128 Ledger::get_borrows_of(MarketId market, const Address& position) const {
    AccrualPreview p = preview(market_ref(market));
    return to_assets(borrow_shares_of(market, position), p.borrows.assets, p.borrows.shares, Rounding::Ceil);
}

I128 Ledger::get_total_assets(MarketId market) const {
    return preview(market_ref(market)).deposits.assets;
}

I128 Ledger::get_total_borrows(MarketId market) const {
    return preview(market_ref(market)).borrows.assets;
}

I128 Ledger::get_liquidity_of(MarketId market) const {
    const Market& m = market_ref(market);
    return m.deposits.assets - m.borrows.assets;
}

I128 Ledger::max_withdraw(MarketId market, const Address& owner) const {
    return std::min(get_assets_of(market, owner), get_liquidity_of(market));
}

// =============================================================================
// Market Owner Governance
// =============================================================================

void Ledger::set_deposit_cap(const Address& caller, MarketId market, I128 cap) {
    runtime_.atomic("Ledger::set_deposit_cap", [&] {
        Market& m = market_ref(market);
        require_market_owner(caller, m);
        if (cap < 0) throw Error(errors::INVALID_PARAMETER, "negative cap");
        m.deposit_cap = cap;
        runtime_.emit(Event("DepositCapSet", self_).with("market", market).with("cap", cap));
    });
}

void Ledger::set_borrow_cap(const Address& caller, MarketId market, I128 cap) {
    runtime_.atomic("Ledger::set_borrow_cap", [&] {
        Market& m = market_ref(market);
        require_market_owner(caller, m);
        if (cap < 0) throw Error(errors::INVALID_PARAMETER, "negative cap");
        m.borrow_cap = cap;
        runtime_.emit(Event("BorrowCapSet", self_).with("market", market).with("cap", cap));
    });
}

void Ledger::toggle_pause(const Address& caller, MarketId market) {
    runtime_.atomic("Ledger::toggle_pause", [&] {
        Market& m = market_ref(market);
        require_market_owner(caller, m);
        m.paused = !m.paused;
        runtime_.emit(Event("PauseToggled", self_).with("market", market).with("paused", m.paused));
    });
}

void Ledger::request_rate_model_update(const Address& caller, MarketId market, const Address& rate_model_key) {
    runtime_.atomic("Ledger::request_rate_model_update", [&] {
        Market& m = market_ref(market);
        require_market_owner(caller, m);
        if (state_.rate_models.count(rate_model_key) == 0) {
            throw Error(errors::UNKNOWN_RATE_MODEL, addresses::to_hex(rate_model_key));
        }
        m.pending_rate_model = PendingRateModel{
            rate_model_key, runtime_.now() + state_.params.timelock_duration};
        runtime_.emit(Event("RateModelUpdateRequested", self_)
                          .with("market", market)
                          .with("rate_model", rate_model_key));
    });
}

void Ledger::accept_rate_model_update(const Address& caller, MarketId market) {
    runtime_.atomic("Ledger::accept_rate_model_update", [&] {
        Market& m = market_ref(market);
        require_market_owner(caller, m);
        if (!m.pending_rate_model) {
            throw Error(errors::NO_PENDING_UPDATE, std::to_string(market));
        }
        uint64_t now = runtime_.now();
        if (now < m.pending_rate_model->valid_after) {
            throw Error(errors::TIMELOCK_NOT_ELAPSED, std::to_string(m.pending_rate_model->valid_after));
        }
        if (now > m.pending_rate_model->valid_after + state_.params.timelock_deadline) {
            throw Error(errors::TIMELOCK_EXPIRED, std::to_string(market));
        }

        // Interest up to now is owed at the old rate
        accrue_market(m);

        auto model = state_.rate_models.find(m.pending_rate_model->key);
        if (model == state_.rate_models.end()) {
            throw Error(errors::UNKNOWN_RATE_MODEL, addresses::to_hex(m.pending_rate_model->key));
        }
        m.rate_model_key = model->first;
        m.rate_model = model->second;
        m.pending_rate_model.reset();

        runtime_.emit(Event("RateModelUpdated", self_)
                          .with("market", market)
                          .with("rate_model", m.rate_model_key));
    });
}

void Ledger::reject_rate_model_update(const Address& caller, MarketId market) {
    runtime_.atomic("Ledger::reject_rate_model_update", [&] {
        Market& m = market_ref(market);
        require_market_owner(caller, m);
        if (!m.pending_rate_model) {
            throw Error(errors::NO_PENDING_UPDATE, std::to_string(market));
        }
        m.pending_rate_model.reset();
        runtime_.emit(Event("RateModelUpdateRejected", self_).with("market", market));
    });
}

// =============================================================================
// Protocol Owner Governance
// =============================================================================

void Ledger::register_rate_model(const Address& caller, const Address& key,
                                 std::shared_ptr<const IRateModel> model) {
    runtime_.atomic("Ledger::register_rate_model", [&] {
        require_protocol_owner(caller);
        if (!model) throw Error(errors::INVALID_PARAMETER, "null rate model");
        state_.rate_models[key] = std::move(model);
        runtime_.emit(Event("RateModelRegistered", self_).with("key", key));
    });
}

void Ledger::set_position_manager(const Address& caller, const Address& position_manager) {
    runtime_.atomic("Ledger::set_position_manager", [&] {
        require_protocol_owner(caller);
        state_.params.position_manager = position_manager;
        runtime_.emit(Event("PositionManagerSet", self_).with("position_manager", position_manager));
    });
}

void Ledger::set_interest_fee(const Address& caller, I128 fee_x18) {
    runtime_.atomic("Ledger::set_interest_fee", [&] {
        require_protocol_owner(caller);
        if (fee_x18 < 0 || fee_x18 > X18_ONE) {
            throw Error(errors::INVALID_PARAMETER, "fee outside [0, 1]");
        }
        // Interest accrued so far keeps the old fee
        for (auto& [id, m] : state_.markets) accrue_market(m);
        state_.params.interest_fee_x18 = fee_x18;
        runtime_.emit(Event("InterestFeeSet", self_).with("fee", x18::to_string(fee_x18)));
    });
}

void Ledger::set_origination_fee(const Address& caller, I128 fee_x18) {
    runtime_.atomic("Ledger::set_origination_fee", [&] {
        require_protocol_owner(caller);
        if (fee_x18 < 0 || fee_x18 > X18_ONE) {
            throw Error(errors::INVALID_PARAMETER, "fee outside [0, 1]");
        }
        state_.params.origination_fee_x18 = fee_x18;
        runtime_.emit(Event("OriginationFeeSet", self_).with("fee", x18::to_string(fee_x18)));
    });
}

void Ledger::set_fee_recipient(const Address& caller, const Address& recipient) {
    runtime_.atomic("Ledger::set_fee_recipient", [&] {
        require_protocol_owner(caller);
        for (auto& [id, m] : state_.markets) accrue_market(m);
        state_.params.fee_recipient = recipient;
        runtime_.emit(Event("FeeRecipientSet", self_).with("recipient", recipient));
    });
}

void Ledger::set_min_borrow(const Address& caller, I128 min_borrow) {
    runtime_.atomic("Ledger::set_min_borrow", [&] {
        require_protocol_owner(caller);
        if (min_borrow < 0) throw Error(errors::INVALID_PARAMETER, "negative min borrow");
        state_.params.min_borrow = min_borrow;
    });
}

void Ledger::set_min_debt(const Address& caller, I128 min_debt) {
    runtime_.atomic("Ledger::set_min_debt", [&] {
        require_protocol_owner(caller);
        if (min_debt < 0) throw Error(errors::INVALID_PARAMETER, "negative min debt");
        state_.params.min_debt = min_debt;
    });
}

void Ledger::transfer_ownership(const Address& caller, const Address& new_owner) {
    runtime_.atomic("Ledger::transfer_ownership", [&] {
        require_protocol_owner(caller);
        state_.params.owner = new_owner;
        runtime_.emit(Event("OwnershipTransferred", self_).with("owner", new_owner));
    });
}

} // namespace isolend
