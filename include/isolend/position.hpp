#ifndef ISOLEND_POSITION_HPP
#define ISOLEND_POSITION_HPP

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "runtime.hpp"
#include "types.hpp"

namespace isolend {

constexpr size_t MAX_ASSETS = 5;
constexpr size_t MAX_DEBT_MARKETS = 5;

// =============================================================================
// BoundedSet - fixed-capacity set with swap-with-last removal
// =============================================================================

template <typename T, size_t N>
class BoundedSet {
public:
    // False when full; inserting a present element is a no-op returning true
    bool insert(const T& value) {
        if (contains(value)) return true;
        if (size_ == N) return false;
        items_[size_++] = value;
        return true;
    }

    // False when absent
    bool remove(const T& value) {
        for (size_t i = 0; i < size_; ++i) {
            if (items_[i] == value) {
                items_[i] = items_[size_ - 1];
                items_[size_ - 1] = T{};
                --size_;
                return true;
            }
        }
        return false;
    }

    bool contains(const T& value) const {
        for (size_t i = 0; i < size_; ++i) {
            if (items_[i] == value) return true;
        }
        return false;
    }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == N; }
    static constexpr size_t capacity() { return N; }

    const T* begin() const { return items_.data(); }
    const T* end() const { return items_.data() + size_; }

    std::vector<T> to_vector() const { return std::vector<T>(begin(), end()); }

private:
    std::array<T, N> items_{};
    size_t size_ = 0;
};

// =============================================================================
// Position (collateral account)
// =============================================================================

struct Position {
    Address address{};
    Address owner{};
    std::set<Address> operators;
    BoundedSet<Address, MAX_ASSETS> held_assets;
    BoundedSet<MarketId, MAX_DEBT_MARKETS> debt_markets;
};

// =============================================================================
// PositionRegistry - arena of positions keyed by deterministic address
//
// Token balances of a position live in the TokenBank under its address;
// the registry only tracks ownership and the asset/debt sets.
// =============================================================================

struct PositionRegistryState {
    std::map<Address, Position> positions;
};

class PositionRegistry : public StatefulBase<PositionRegistryState> {
public:
    explicit PositionRegistry(Runtime& runtime);
    ~PositionRegistry() override;

    // Non-copyable
    PositionRegistry(const PositionRegistry&) = delete;
    PositionRegistry& operator=(const PositionRegistry&) = delete;

    // Address derived from (deployer, owner, salt); pure
    static Address derive_address(const Address& deployer, const Address& owner, uint64_t salt);

    // Throws POSITION_ALREADY_EXISTS
    Position& create(const Address& position, const Address& owner);

    bool exists(const Address& position) const;
    std::optional<Position> find(const Address& position) const;

    // Throw POSITION_NOT_FOUND
    Position& get(const Address& position);
    const Position& get(const Address& position) const;

    // Owner or operator
    bool is_auth(const Address& position, const Address& user) const;

    // Throw MAX_ASSETS_EXCEEDED / MAX_DEBT_MARKETS_EXCEEDED when full
    void add_asset(const Address& position, const Address& asset);
    void remove_asset(const Address& position, const Address& asset);
    void add_debt_market(const Address& position, MarketId market);
    void remove_debt_market(const Address& position, MarketId market);

    size_t size() const { return state_.positions.size(); }

private:
    Runtime& runtime_;
};

} // namespace isolend

#endif // ISOLEND_POSITION_HPP
