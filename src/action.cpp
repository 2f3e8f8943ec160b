// =============================================================================
// action.cpp - Action payload encoding
// =============================================================================

#include "isolend/action.hpp"

#include <cstring>

namespace isolend {

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::NewPosition: return "NewPosition";
        case Operation::Deposit: return "Deposit";
        case Operation::Withdraw: return "Withdraw";
        case Operation::AddCollateralType: return "AddCollateralType";
        case Operation::RemoveCollateralType: return "RemoveCollateralType";
        case Operation::Borrow: return "Borrow";
        case Operation::Repay: return "Repay";
        case Operation::Approve: return "Approve";
        case Operation::Exec: return "Exec";
    }
    return "Unknown";
}

namespace actions {

namespace {

// =============================================================================
// Packed Big-Endian Helpers
// =============================================================================

class Writer {
public:
    Writer& address(const Address& addr) {
        out_.insert(out_.end(), addr.begin(), addr.end());
        return *this;
    }

    Writer& uint32(uint32_t value) {
        for (int i = 3; i >= 0; --i) {
            out_.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }
        return *this;
    }

    Writer& uint64(uint64_t value) {
        for (int i = 7; i >= 0; --i) {
            out_.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }
        return *this;
    }

    // Two's complement, 16 bytes
    Writer& int128(I128 value) {
        U128 raw = static_cast<U128>(value);
        for (int i = 15; i >= 0; --i) {
            out_.push_back(static_cast<uint8_t>((raw >> (8 * i)) & 0xFF));
        }
        return *this;
    }

    Writer& bytes(const std::vector<uint8_t>& data) {
        out_.insert(out_.end(), data.begin(), data.end());
        return *this;
    }

    Action build(Operation op) { return Action{op, std::move(out_)}; }

private:
    std::vector<uint8_t> out_;
};

class Reader {
public:
    Reader(const Action& action, Operation expected) : data_(action.data) {
        if (action.op != expected) {
            throw Error(errors::MALFORMED_ACTION,
                        std::string("expected ") + operation_name(expected) +
                        ", got " + operation_name(action.op));
        }
    }

    Address address() {
        need(20);
        Address addr;
        std::memcpy(addr.data(), data_.data() + pos_, 20);
        pos_ += 20;
        return addr;
    }

    uint32_t uint32() {
        need(4);
        uint32_t result = 0;
        for (int i = 0; i < 4; ++i) result = (result << 8) | data_[pos_++];
        return result;
    }

    uint64_t uint64() {
        need(8);
        uint64_t result = 0;
        for (int i = 0; i < 8; ++i) result = (result << 8) | data_[pos_++];
        return result;
    }

    I128 int128() {
        need(16);
        U128 raw = 0;
        for (int i = 0; i < 16; ++i) raw = (raw << 8) | data_[pos_++];
        return static_cast<I128>(raw);
    }

    std::vector<uint8_t> rest() {
        std::vector<uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(pos_), data_.end());
        pos_ = data_.size();
        return out;
    }

    void finish() const {
        if (pos_ != data_.size()) {
            throw Error(errors::MALFORMED_ACTION,
                        std::to_string(data_.size() - pos_) + " trailing bytes");
        }
    }

private:
    void need(size_t n) const {
        if (data_.size() - pos_ < n) {
            throw Error(errors::MALFORMED_ACTION, "payload truncated");
        }
    }

    const std::vector<uint8_t>& data_;
    size_t pos_ = 0;
};

} // namespace

// =============================================================================
// Builders
// =============================================================================

Action new_position(const Address& owner, uint64_t salt) {
    return Writer().address(owner).uint64(salt).build(Operation::NewPosition);
}

Action deposit(const Address& asset, I128 amount) {
    return Writer().address(asset).int128(amount).build(Operation::Deposit);
}

Action withdraw(const Address& recipient, const Address& asset, I128 amount) {
    return Writer().address(recipient).address(asset).int128(amount).build(Operation::Withdraw);
}

Action add_collateral(const Address& asset) {
    return Writer().address(asset).build(Operation::AddCollateralType);
}

Action remove_collateral(const Address& asset) {
    return Writer().address(asset).build(Operation::RemoveCollateralType);
}

Action borrow(MarketId market, I128 amount) {
    return Writer().uint64(market).int128(amount).build(Operation::Borrow);
}

Action repay(MarketId market, I128 amount) {
    return Writer().uint64(market).int128(amount).build(Operation::Repay);
}

Action approve(const Address& spender, const Address& asset, I128 amount) {
    return Writer().address(spender).address(asset).int128(amount).build(Operation::Approve);
}

Action exec(const Address& target, uint32_t selector, const std::vector<uint8_t>& calldata) {
    return Writer().address(target).uint32(selector).bytes(calldata).build(Operation::Exec);
}

// =============================================================================
// Decoders
// =============================================================================

NewPositionArgs decode_new_position(const Action& action) {
    Reader r(action, Operation::NewPosition);
    NewPositionArgs args{r.address(), r.uint64()};
    r.finish();
    return args;
}

TransferArgs decode_deposit(const Action& action) {
    Reader r(action, Operation::Deposit);
    TransferArgs args{r.address(), r.int128()};
    r.finish();
    return args;
}

WithdrawArgs decode_withdraw(const Action& action) {
    Reader r(action, Operation::Withdraw);
    WithdrawArgs args{r.address(), r.address(), r.int128()};
    r.finish();
    return args;
}

Address decode_collateral(const Action& action) {
    if (action.op != Operation::AddCollateralType && action.op != Operation::RemoveCollateralType) {
        throw Error(errors::MALFORMED_ACTION, operation_name(action.op));
    }
    Reader r(action, action.op);
    Address asset = r.address();
    r.finish();
    return asset;
}

DebtArgs decode_debt(const Action& action) {
    if (action.op != Operation::Borrow && action.op != Operation::Repay) {
        throw Error(errors::MALFORMED_ACTION, operation_name(action.op));
    }
    Reader r(action, action.op);
    DebtArgs args{r.uint64(), r.int128()};
    r.finish();
    return args;
}

ApproveArgs decode_approve(const Action& action) {
    Reader r(action, Operation::Approve);
    ApproveArgs args{r.address(), r.address(), r.int128()};
    r.finish();
    return args;
}

ExecArgs decode_exec(const Action& action) {
    Reader r(action, Operation::Exec);
    ExecArgs args{r.address(), r.uint32(), r.rest()};
    return args;
}

} // namespace actions

} // namespace isolend
