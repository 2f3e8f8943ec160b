// =============================================================================
// position.cpp - Collateral account registry
// =============================================================================

#include "isolend/position.hpp"

namespace isolend {

PositionRegistry::PositionRegistry(Runtime& runtime) : runtime_(runtime) {
    runtime_.register_state(this);
}

PositionRegistry::~PositionRegistry() {
    runtime_.unregister_state(this);
}

Address PositionRegistry::derive_address(const Address& deployer, const Address& owner, uint64_t salt) {
    // Two independent FNV-1a lanes over (deployer, owner, salt) fill 16 bytes;
    // the leading 4 bytes tag the address as a position.
    uint64_t lanes[2] = {0xcbf29ce484222325ULL, 0x84222325cbf29ce4ULL};
    auto mix = [&lanes](uint8_t b) {
        for (auto& h : lanes) {
            h ^= b;
            h *= 0x100000001b3ULL;
        }
        lanes[1] ^= lanes[0] >> 29;
    };
    for (auto b : deployer) mix(b);
    for (auto b : owner) mix(b);
    for (int i = 7; i >= 0; --i) mix(static_cast<uint8_t>((salt >> (8 * i)) & 0xFF));

    Address out{};
    out[0] = 0x90;
    out[1] = 0x51;
    out[2] = 0x71;
    out[3] = 0x09;
    for (size_t i = 0; i < 8; ++i) {
        out[4 + i] = static_cast<uint8_t>((lanes[0] >> (56 - 8 * i)) & 0xFF);
        out[12 + i] = static_cast<uint8_t>((lanes[1] >> (56 - 8 * i)) & 0xFF);
    }
    return out;
}

Position& PositionRegistry::create(const Address& position, const Address& owner) {
    if (state_.positions.count(position) != 0) {
        throw Error(errors::POSITION_ALREADY_EXISTS, addresses::to_hex(position));
    }
    Position p;
    p.address = position;
    p.owner = owner;
    return state_.positions.emplace(position, std::move(p)).first->second;
}

bool PositionRegistry::exists(const Address& position) const {
    return state_.positions.count(position) != 0;
}

std::optional<Position> PositionRegistry::find(const Address& position) const {
    auto it = state_.positions.find(position);
    if (it == state_.positions.end()) return std::nullopt;
    return it->second;
}

Position& PositionRegistry::get(const Address& position) {
    auto it = state_.positions.find(position);
    if (it == state_.positions.end()) {
        throw Error(errors::POSITION_NOT_FOUND, addresses::to_hex(position));
    }
    return it->second;
}

const Position& PositionRegistry::get(const Address& position) const {
    auto it = state_.positions.find(position);
    if (it == state_.positions.end()) {
        throw Error(errors::POSITION_NOT_FOUND, addresses::to_hex(position));
    }
    return it->second;
}

bool PositionRegistry::is_auth(const Address& position, const Address& user) const {
    auto it = state_.positions.find(position);
    if (it == state_.positions.end()) return false;
    return it->second.owner == user || it->second.operators.count(user) != 0;
}

void PositionRegistry::add_asset(const Address& position, const Address& asset) {
    if (!get(position).held_assets.insert(asset)) {
        throw Error(errors::MAX_ASSETS_EXCEEDED, addresses::to_hex(position));
    }
}

void PositionRegistry::remove_asset(const Address& position, const Address& asset) {
    get(position).held_assets.remove(asset);
}

void PositionRegistry::add_debt_market(const Address& position, MarketId market) {
    if (!get(position).debt_markets.insert(market)) {
        throw Error(errors::MAX_DEBT_MARKETS_EXCEEDED, addresses::to_hex(position));
    }
}

void PositionRegistry::remove_debt_market(const Address& position, MarketId market) {
    get(position).debt_markets.remove(market);
}

} // namespace isolend
