#ifndef ISOLEND_ACTION_HPP
#define ISOLEND_ACTION_HPP

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace isolend {

// =============================================================================
// Position Actions
// =============================================================================

enum class Operation : uint8_t {
    NewPosition = 0,
    Deposit = 1,
    Withdraw = 2,
    AddCollateralType = 3,
    RemoveCollateralType = 4,
    Borrow = 5,
    Repay = 6,
    Approve = 7,
    Exec = 8
};

const char* operation_name(Operation op);

// Operation tag plus packed big-endian payload
struct Action {
    Operation op;
    std::vector<uint8_t> data;
};

// =============================================================================
// Builders and Decoders
//
// Payload layouts (addresses 20 bytes, amounts 16 bytes, ids and salts
// 8 bytes, selectors 4 bytes):
//   NewPosition           owner | salt
//   Deposit               asset | amount
//   Withdraw              recipient | asset | amount
//   Add/RemoveCollateral  asset
//   Borrow, Repay         market | amount
//   Approve               spender | asset | amount
//   Exec                  target | selector | calldata...
// Decoders throw Error(MALFORMED_ACTION) on a payload of the wrong size.
// =============================================================================

namespace actions {

struct NewPositionArgs { Address owner; uint64_t salt; };
struct TransferArgs    { Address asset; I128 amount; };
struct WithdrawArgs    { Address recipient; Address asset; I128 amount; };
struct DebtArgs        { MarketId market; I128 amount; };
struct ApproveArgs     { Address spender; Address asset; I128 amount; };
struct ExecArgs        { Address target; uint32_t selector; std::vector<uint8_t> calldata; };

Action new_position(const Address& owner, uint64_t salt);
Action deposit(const Address& asset, I128 amount);
Action withdraw(const Address& recipient, const Address& asset, I128 amount);
Action add_collateral(const Address& asset);
Action remove_collateral(const Address& asset);
Action borrow(MarketId market, I128 amount);
Action repay(MarketId market, I128 amount);   // MAX_AMOUNT repays everything
Action approve(const Address& spender, const Address& asset, I128 amount);
Action exec(const Address& target, uint32_t selector, const std::vector<uint8_t>& calldata = {});

NewPositionArgs decode_new_position(const Action& action);
TransferArgs decode_deposit(const Action& action);
WithdrawArgs decode_withdraw(const Action& action);
Address decode_collateral(const Action& action);
DebtArgs decode_debt(const Action& action);
ApproveArgs decode_approve(const Action& action);
ExecArgs decode_exec(const Action& action);

} // namespace actions

} // namespace isolend

#endif // ISOLEND_ACTION_HPP
