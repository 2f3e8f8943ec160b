#ifndef ISOLEND_TOKEN_HPP
#define ISOLEND_TOKEN_HPP

#include <map>
#include <tuple>
#include <utility>

#include "runtime.hpp"
#include "types.hpp"

namespace isolend {

// =============================================================================
// Token Bank State
// =============================================================================

struct TokenBankState {
    // (asset, holder) -> balance
    std::map<std::pair<Address, Address>, I128> balances;
    // (asset, owner, spender) -> allowance
    std::map<std::tuple<Address, Address, Address>, I128> allowances;
    // asset -> supply
    std::map<Address, I128> supply;
};

// =============================================================================
// TokenBank - ERC20-style custody for every asset in the system
//
// Each operation validates before mutating, so a failed call leaves no
// partial transfer behind. An allowance of MAX_AMOUNT is never consumed.
// =============================================================================

class TokenBank : public StatefulBase<TokenBankState> {
public:
    explicit TokenBank(Runtime& runtime);
    ~TokenBank() override;

    // Non-copyable
    TokenBank(const TokenBank&) = delete;
    TokenBank& operator=(const TokenBank&) = delete;

    // Issue new units (faucet for hosts and tests)
    void mint(const Address& asset, const Address& to, I128 amount);

    void transfer(const Address& asset, const Address& from, const Address& to, I128 amount);

    // Move `from`'s tokens on behalf of `spender`, consuming its allowance
    void transfer_from(const Address& asset, const Address& spender,
                       const Address& from, const Address& to, I128 amount);

    void approve(const Address& asset, const Address& owner, const Address& spender, I128 amount);

    I128 balance_of(const Address& asset, const Address& holder) const;
    I128 allowance(const Address& asset, const Address& owner, const Address& spender) const;
    I128 total_supply(const Address& asset) const;

private:
    Runtime& runtime_;
};

} // namespace isolend

#endif // ISOLEND_TOKEN_HPP
