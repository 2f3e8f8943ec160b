#ifndef ISOLEND_TEST_FIXTURES_HPP
#define ISOLEND_TEST_FIXTURES_HPP

#include <isolend/protocol.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace isolend::test {

// =============================================================================
// Accounts and Assets
// =============================================================================

constexpr Address OWNER = addresses::from_id(1);
constexpr Address FEE_RECIPIENT = addresses::from_id(2);
constexpr Address MARKET_OWNER = addresses::from_id(3);
constexpr Address ALICE = addresses::from_id(10);
constexpr Address BOB = addresses::from_id(11);
constexpr Address LIQUIDATOR = addresses::from_id(12);
constexpr Address CAROL = addresses::from_id(13);

constexpr Address USDC = addresses::from_id(100);
constexpr Address WETH = addresses::from_id(101);
constexpr Address WBTC = addresses::from_id(102);

constexpr Address RATE_KEY = addresses::from_id(200);
constexpr Address RATE_KEY_2 = addresses::from_id(201);

constexpr uint64_t START_TIME = 1'700'000'000;
constexpr uint64_t DAY = 24 * 60 * 60;

inline I128 dec(const char* decimal) { return x18::from_string(decimal); }

// Code of the Error thrown by `fn`, OK when it returns normally
inline int32_t error_code(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    return errors::OK;
}

// =============================================================================
// Mock Collaborators
// =============================================================================

// value = amount * price (X18, floor); prices settable per asset
class MockOracle : public IOracle {
public:
    void set_price(const Address& asset, I128 price_x18) { prices_[asset] = price_x18; }
    void set_stale(bool stale) { stale_ = stale; }

    I128 value_of(const Address& asset, I128 amount) const override {
        if (stale_) throw Error(errors::PRICE_STALE, addresses::to_hex(asset));
        auto it = prices_.find(asset);
        if (it == prices_.end()) throw Error(errors::PRICE_STALE, "no price");
        return mul_x18(amount, it->second);
    }

private:
    std::map<Address, I128> prices_;
    bool stale_ = false;
};

// Constant annual rate
class FixedRateModel : public IRateModel {
public:
    explicit FixedRateModel(I128 rate_x18) : rate_(rate_x18) {}
    I128 rate(I128, I128) const override { return rate_; }

private:
    I128 rate_;
};

// Keeps every delivered event and revert
class RecordingListener : public EventListener {
public:
    void on_event(const Event& event) override { events.push_back(event); }
    void on_revert(std::string_view call, int32_t code, std::string_view) override {
        reverts.emplace_back(std::string(call), code);
    }

    size_t count(const std::string& name) const {
        size_t n = 0;
        for (const auto& e : events) if (e.name == name) ++n;
        return n;
    }

    std::vector<Event> events;
    std::vector<std::pair<std::string, int32_t>> reverts;
};

// =============================================================================
// Manual Clock
// =============================================================================

struct ManualClock {
    uint64_t now = START_TIME;

    void attach(Runtime& runtime) {
        runtime.set_clock([this] { return now; });
    }
    void advance(uint64_t seconds) { now += seconds; }
};

// =============================================================================
// Test Protocol
//
// USDC market owned by MARKET_OWNER at a fixed rate, one oracle pricing
// USDC at 1 and WETH at 20, WETH LTV 0.8, both assets known to the
// position manager.
// =============================================================================

inline ProtocolConfig test_config() {
    ProtocolConfig config;
    config.owner = OWNER;
    config.fee_recipient = FEE_RECIPIENT;
    config.min_ltv_x18 = dec("0.1");
    config.max_ltv_x18 = dec("0.95");
    config.close_factor_x18 = dec("0.5");
    config.liquidation_discount_x18 = dec("0.1");
    return config;
}

struct TestProtocol {
    ManualClock clock;
    Protocol protocol;
    std::shared_ptr<MockOracle> oracle = std::make_shared<MockOracle>();
    MarketId market = 0;

    explicit TestProtocol(const ProtocolConfig& config = test_config(), I128 rate_x18 = 0)
        : protocol(config) {
        clock.attach(protocol.runtime());

        ledger().register_rate_model(OWNER, RATE_KEY, std::make_shared<FixedRateModel>(rate_x18));
        ledger().register_rate_model(OWNER, RATE_KEY_2, std::make_shared<FixedRateModel>(rate_x18));

        oracle->set_price(USDC, X18_ONE);
        oracle->set_price(WETH, x18::from_int(20));
        oracle->set_price(WBTC, x18::from_int(300));

        market = create_market(USDC, RATE_KEY);
        risk_engine().set_oracle(OWNER, market, USDC, oracle);
        risk_engine().set_oracle(OWNER, market, WETH, oracle);
        risk_engine().request_ltv_update(MARKET_OWNER, market, WETH, dec("0.8"));

        pm().toggle_known_asset(OWNER, USDC);
        pm().toggle_known_asset(OWNER, WETH);
    }

    Ledger& ledger() { return protocol.ledger(); }
    TokenBank& tokens() { return protocol.tokens(); }
    RiskEngine& risk_engine() { return protocol.risk_engine(); }
    const RiskModule& risk() { return protocol.risk_module(); }
    PositionManager& pm() { return protocol.position_manager(); }
    SuperPoolFactory& factory() { return protocol.super_pool_factory(); }

    MarketId create_market(const Address& asset, const Address& rate_key,
                           I128 deposit_cap = x18::from_int(1), I128 borrow_cap = x18::from_int(1)) {
        return ledger().initialize_market(MARKET_OWNER, MARKET_OWNER, asset, rate_key,
                                          deposit_cap, borrow_cap, 0);
    }

    // Mints tokens and approves `spender` for all of them
    void fund(const Address& account, const Address& asset, I128 amount, const Address& spender) {
        tokens().mint(asset, account, amount);
        tokens().approve(asset, account, spender, MAX_AMOUNT);
    }

    // Lender liquidity in `m`
    void supply(const Address& lender, MarketId m, I128 amount) {
        fund(lender, ledger().asset_of(m), amount, ledger().address());
        ledger().deposit(lender, m, amount, lender);
    }

    // New position for `owner` holding `collateral` WETH
    Address open_position(const Address& owner, I128 collateral, uint64_t salt = 1) {
        fund(owner, WETH, collateral, pm().address());
        Address position = pm().predict_address(owner, salt);
        pm().process_batch(owner, position, {
            actions::new_position(owner, salt),
            actions::deposit(WETH, collateral),
            actions::add_collateral(WETH),
        });
        return position;
    }
};

} // namespace isolend::test

#endif // ISOLEND_TEST_FIXTURES_HPP
