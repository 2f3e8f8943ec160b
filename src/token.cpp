// =============================================================================
// token.cpp - TokenBank custody
// =============================================================================

#include "isolend/token.hpp"
#include "isolend/math.hpp"

namespace isolend {

TokenBank::TokenBank(Runtime& runtime) : runtime_(runtime) {
    runtime_.register_state(this);
}

TokenBank::~TokenBank() {
    runtime_.unregister_state(this);
}

void TokenBank::mint(const Address& asset, const Address& to, I128 amount) {
    if (amount < 0) {
        throw Error(errors::INVALID_PARAMETER, "negative mint");
    }
    I128 supply = add_checked(state_.supply[asset], amount);
    I128 balance = add_checked(state_.balances[{asset, to}], amount);
    state_.supply[asset] = supply;
    state_.balances[{asset, to}] = balance;
}

void TokenBank::transfer(const Address& asset, const Address& from, const Address& to, I128 amount) {
    if (amount < 0) {
        throw Error(errors::INVALID_PARAMETER, "negative transfer");
    }
    if (amount == 0 || from == to) {
        if (balance_of(asset, from) < amount) {
            throw Error(errors::INSUFFICIENT_BALANCE, addresses::to_hex(from));
        }
        return;
    }

    auto it = state_.balances.find({asset, from});
    if (it == state_.balances.end() || it->second < amount) {
        throw Error(errors::INSUFFICIENT_BALANCE, addresses::to_hex(from));
    }
    I128 to_balance = add_checked(balance_of(asset, to), amount);

    it->second -= amount;
    if (it->second == 0) state_.balances.erase(it);
    state_.balances[{asset, to}] = to_balance;
}

void TokenBank::transfer_from(const Address& asset, const Address& spender,
                              const Address& from, const Address& to, I128 amount) {
    if (spender != from) {
        I128 allowed = allowance(asset, from, spender);
        if (allowed < amount) {
            throw Error(errors::INSUFFICIENT_ALLOWANCE,
                        addresses::to_hex(spender) + " for " + addresses::to_hex(from));
        }
        transfer(asset, from, to, amount);
        if (allowed != MAX_AMOUNT) {
            state_.allowances[{asset, from, spender}] = allowed - amount;
        }
        return;
    }
    transfer(asset, from, to, amount);
}

void TokenBank::approve(const Address& asset, const Address& owner, const Address& spender, I128 amount) {
    if (amount < 0) {
        throw Error(errors::INVALID_PARAMETER, "negative allowance");
    }
    if (amount == 0) {
        state_.allowances.erase({asset, owner, spender});
        return;
    }
    state_.allowances[{asset, owner, spender}] = amount;
}

I128 TokenBank::balance_of(const Address& asset, const Address& holder) const {
    auto it = state_.balances.find({asset, holder});
    return it != state_.balances.end() ? it->second : 0;
}

I128 TokenBank::allowance(const Address& asset, const Address& owner, const Address& spender) const {
    auto it = state_.allowances.find({asset, owner, spender});
    return it != state_.allowances.end() ? it->second : 0;
}

I128 TokenBank::total_supply(const Address& asset) const {
    auto it = state_.supply.find(asset);
    return it != state_.supply.end() ? it->second : 0;
}

} // namespace isolend
