#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

using namespace isolend;
using namespace isolend::test;

namespace {

constexpr Address TARGET = addresses::from_id(500);
constexpr uint32_t SWAP = 0x12345678;

class RecordingTarget : public IExecTarget {
public:
    void exec(ExecContext& ctx) override {
        ++calls;
        last_position = ctx.position;
        last_selector = ctx.selector;
        last_calldata = ctx.calldata;
        if (sweep) {
            ctx.tokens.transfer(WETH, ctx.position, TARGET, ctx.tokens.balance_of(WETH, ctx.position));
        }
    }

    int calls = 0;
    bool sweep = false;
    Address last_position{};
    uint32_t last_selector = 0;
    std::vector<uint8_t> last_calldata;
};

// 1000 WETH (worth 20000) in ALICE's position, 100000 USDC of liquidity
struct Funded : TestProtocol {
    Address position{};

    Funded() {
        supply(BOB, market, 100000);
        position = open_position(ALICE, 1000);
    }

    void borrow(I128 amount) {
        pm().process(ALICE, position, actions::borrow(market, amount));
    }
};

} // namespace

// =============================================================================
// Action Encoding
// =============================================================================

TEST_CASE("Action payloads", "[position_manager][action]") {
    SECTION("Decoders read what builders write") {
        auto np = actions::decode_new_position(actions::new_position(ALICE, 7));
        REQUIRE(np.owner == ALICE);
        REQUIRE(np.salt == 7);

        auto w = actions::decode_withdraw(actions::withdraw(BOB, WETH, -5));
        REQUIRE(w.recipient == BOB);
        REQUIRE(w.asset == WETH);
        REQUIRE(w.amount == -5);

        auto r = actions::decode_debt(actions::repay(42, MAX_AMOUNT));
        REQUIRE(r.market == 42);
        REQUIRE(r.amount == MAX_AMOUNT);

        auto e = actions::decode_exec(actions::exec(TARGET, SWAP, {1, 2, 3}));
        REQUIRE(e.target == TARGET);
        REQUIRE(e.selector == SWAP);
        REQUIRE(e.calldata == std::vector<uint8_t>{1, 2, 3});
    }

    SECTION("Layout is packed big-endian") {
        Action a = actions::borrow(0x0102, 3);
        REQUIRE(a.op == Operation::Borrow);
        REQUIRE(a.data.size() == 8 + 16);
        REQUIRE(a.data[6] == 0x01);
        REQUIRE(a.data[7] == 0x02);
        REQUIRE(a.data.back() == 0x03);
        REQUIRE(actions::add_collateral(WETH).data.size() == 20);
    }

    SECTION("Malformed payloads") {
        Action truncated = actions::deposit(WETH, 10);
        truncated.data.pop_back();
        REQUIRE(error_code([&] { actions::decode_deposit(truncated); }) == errors::MALFORMED_ACTION);

        Action trailing = actions::add_collateral(WETH);
        trailing.data.push_back(0);
        REQUIRE(error_code([&] { actions::decode_collateral(trailing); }) == errors::MALFORMED_ACTION);

        REQUIRE(error_code([&] { actions::decode_debt(actions::deposit(WETH, 1)); }) == errors::MALFORMED_ACTION);
        REQUIRE(std::string(operation_name(Operation::AddCollateralType)) == "AddCollateralType");
    }
}

// =============================================================================
// Positions
// =============================================================================

TEST_CASE("Position creation", "[position_manager]") {
    Funded f;

    SECTION("Deterministic address owned by the requested owner") {
        REQUIRE(f.position == f.pm().predict_address(ALICE, 1));
        REQUIRE(f.position != f.pm().predict_address(ALICE, 2));
        REQUIRE(f.position != f.pm().predict_address(BOB, 1));
        REQUIRE(f.pm().owner_of(f.position) == ALICE);
        REQUIRE(f.tokens().balance_of(WETH, f.position) == 1000);
        REQUIRE(f.protocol.positions().get(f.position).held_assets.contains(WETH));
    }

    SECTION("Anyone may deploy for an owner") {
        Address other = f.pm().predict_address(ALICE, 5);
        f.pm().process(BOB, other, actions::new_position(ALICE, 5));
        REQUIRE(f.pm().owner_of(other) == ALICE);
        REQUIRE_FALSE(f.pm().is_auth(other, BOB));
    }

    SECTION("Address must match the derivation") {
        REQUIRE(error_code([&] {
            f.pm().process(ALICE, addresses::from_id(999), actions::new_position(ALICE, 2));
        }) == errors::INVALID_POSITION_ADDRESS);
        REQUIRE(error_code([&] {
            f.pm().process(ALICE, f.position, actions::new_position(ALICE, 1));
        }) == errors::POSITION_ALREADY_EXISTS);
    }

    SECTION("Actions need an existing position") {
        REQUIRE(error_code([&] {
            f.pm().process(ALICE, addresses::from_id(999), actions::borrow(f.market, 1));
        }) == errors::POSITION_NOT_FOUND);
        REQUIRE_FALSE(f.pm().owner_of(addresses::from_id(999)).has_value());
    }

    SECTION("Unknown operations and payloads are rejected") {
        REQUIRE(error_code([&] {
            f.pm().process(ALICE, f.position, Action{static_cast<Operation>(42), {}});
        }) == errors::MALFORMED_ACTION);
        REQUIRE(error_code([&] {
            f.pm().process(ALICE, f.position, Action{Operation::Borrow, {1, 2, 3}});
        }) == errors::MALFORMED_ACTION);
    }
}

TEST_CASE("Position authorization", "[position_manager]") {
    Funded f;

    REQUIRE(error_code([&] { f.pm().process(BOB, f.position, actions::borrow(f.market, 100)); }) ==
            errors::UNAUTHORIZED);

    SECTION("Owner grants and revokes operators") {
        f.pm().toggle_auth(ALICE, BOB, f.position);
        REQUIRE(f.pm().is_auth(f.position, BOB));
        f.pm().process(BOB, f.position, actions::borrow(f.market, 100));
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 100);

        f.pm().toggle_auth(ALICE, BOB, f.position);
        REQUIRE_FALSE(f.pm().is_auth(f.position, BOB));
        REQUIRE(error_code([&] { f.pm().process(BOB, f.position, actions::borrow(f.market, 100)); }) ==
                errors::UNAUTHORIZED);
    }

    SECTION("Only the owner toggles") {
        REQUIRE(error_code([&] { f.pm().toggle_auth(BOB, BOB, f.position); }) == errors::UNAUTHORIZED);
    }
}

// =============================================================================
// Collateral and Debt
// =============================================================================

TEST_CASE("Deposit and withdraw collateral", "[position_manager]") {
    Funded f;

    SECTION("Unknown assets are rejected") {
        f.fund(ALICE, WBTC, 10, f.pm().address());
        REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::deposit(WBTC, 10)); }) ==
                errors::UNKNOWN_ASSET);
        REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::add_collateral(WBTC)); }) ==
                errors::UNKNOWN_ASSET);
    }

    SECTION("Draining an asset drops it from the held set") {
        f.pm().process(ALICE, f.position, actions::withdraw(CAROL, WETH, 500));
        REQUIRE(f.tokens().balance_of(WETH, CAROL) == 500);
        REQUIRE(f.protocol.positions().get(f.position).held_assets.contains(WETH));

        f.pm().process(ALICE, f.position, actions::withdraw(CAROL, WETH, 500));
        REQUIRE_FALSE(f.protocol.positions().get(f.position).held_assets.contains(WETH));
    }

    SECTION("Remove collateral type") {
        f.pm().process(ALICE, f.position, actions::remove_collateral(WETH));
        REQUIRE_FALSE(f.protocol.positions().get(f.position).held_assets.contains(WETH));
        REQUIRE(f.tokens().balance_of(WETH, f.position) == 1000);
    }

    SECTION("Held asset limit") {
        for (uint64_t i = 0; i < 5; ++i) {
            f.pm().toggle_known_asset(OWNER, addresses::from_id(300 + i));
        }
        for (uint64_t i = 0; i < 4; ++i) {
            f.pm().process(ALICE, f.position, actions::add_collateral(addresses::from_id(300 + i)));
        }
        REQUIRE(f.protocol.positions().get(f.position).held_assets.full());
        REQUIRE(error_code([&] {
            f.pm().process(ALICE, f.position, actions::add_collateral(addresses::from_id(304)));
        }) == errors::MAX_ASSETS_EXCEEDED);
    }
}

TEST_CASE("Collateral types without an LTV", "[position_manager]") {
    Funded f;
    f.pm().toggle_known_asset(OWNER, WBTC);

    SECTION("Cannot be added while the position owes the market") {
        f.borrow(8000);
        REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::add_collateral(WBTC)); }) ==
                errors::UNSUPPORTED_ASSET);
        REQUIRE_FALSE(f.protocol.positions().get(f.position).held_assets.contains(WBTC));
    }

    SECTION("Unfunded type blocks borrowing until removed") {
        f.pm().process(ALICE, f.position, actions::add_collateral(WBTC));
        REQUIRE(f.tokens().balance_of(WBTC, f.position) == 0);
        REQUIRE(error_code([&] { f.borrow(8000); }) == errors::UNSUPPORTED_ASSET);
        REQUIRE(error_code([&] {
            f.pm().process_batch(ALICE, f.position, {
                actions::add_collateral(WETH),
                actions::borrow(f.market, 8000),
            });
        }) == errors::UNSUPPORTED_ASSET);
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 0);

        f.pm().process(ALICE, f.position, actions::remove_collateral(WBTC));
        f.borrow(8000);
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 8000);
    }

    SECTION("A fresh position cannot set the type up in its opening batch") {
        Address other = f.pm().predict_address(CAROL, 3);
        f.fund(CAROL, WETH, 1000, f.pm().address());
        REQUIRE(error_code([&] {
            f.pm().process_batch(CAROL, other, {
                actions::new_position(CAROL, 3),
                actions::deposit(WETH, 1000),
                actions::add_collateral(WETH),
                actions::add_collateral(WBTC),
                actions::borrow(f.market, 8000),
            });
        }) == errors::UNSUPPORTED_ASSET);
        REQUIRE_FALSE(f.pm().owner_of(other).has_value());
        REQUIRE(f.tokens().balance_of(WETH, CAROL) == 1000);
    }

    SECTION("Tokens sent straight to the position do not block liquidation") {
        f.borrow(8000);
        f.fund(CAROL, WBTC, 10, f.pm().address());
        f.tokens().transfer(WBTC, CAROL, f.position, 10);
        f.fund(LIQUIDATOR, USDC, 10000, f.pm().address());
        f.oracle->set_price(WETH, x18::from_int(9));

        f.pm().liquidate(LIQUIDATOR, f.position, {DebtRepayment{f.market, 4000}}, {AssetSeizure{WETH, 400}});
        REQUIRE(f.tokens().balance_of(WETH, LIQUIDATOR) == 400);
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 4000);
        REQUIRE(f.tokens().balance_of(WBTC, f.position) == 10);
    }
}

TEST_CASE("Borrow and repay through positions", "[position_manager]") {
    Funded f;

    SECTION("Borrow credits the position") {
        f.borrow(8000);
        REQUIRE(f.tokens().balance_of(USDC, f.position) == 8000);
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 8000);
        REQUIRE(f.protocol.positions().get(f.position).debt_markets.contains(f.market));
        REQUIRE(f.risk().is_healthy(f.position));
    }

    SECTION("Health limit") {
        f.borrow(16000);
        REQUIRE(error_code([&] { f.borrow(1); }) == errors::HEALTH_CHECK_FAILED);
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 16000);
        REQUIRE(f.tokens().balance_of(USDC, f.position) == 16000);
    }

    SECTION("Withdrawing backing collateral fails") {
        f.borrow(8000);
        REQUIRE(error_code([&] {
            f.pm().process(ALICE, f.position, actions::withdraw(ALICE, WETH, 600));
        }) == errors::HEALTH_CHECK_FAILED);
        REQUIRE(f.tokens().balance_of(WETH, f.position) == 1000);
        REQUIRE(f.tokens().balance_of(WETH, ALICE) == 0);
    }

    SECTION("Batches are all or nothing") {
        REQUIRE(error_code([&] {
            f.pm().process_batch(ALICE, f.position, {
                actions::borrow(f.market, 1000),
                actions::withdraw(ALICE, USDC, 1000),
                actions::deposit(WBTC, 1),
            });
        }) == errors::UNKNOWN_ASSET);
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 0);
        REQUIRE(f.tokens().balance_of(USDC, ALICE) == 0);
        REQUIRE(f.protocol.positions().get(f.position).debt_markets.empty());
    }

    SECTION("Borrow from an unknown market") {
        REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::borrow(12345, 10)); }) ==
                errors::MARKET_NOT_FOUND);
    }

    SECTION("Repay part then everything") {
        f.borrow(8000);
        f.pm().process(ALICE, f.position, actions::repay(f.market, 3000));
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 5000);

        f.pm().process(ALICE, f.position, actions::repay(f.market, MAX_AMOUNT));
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 0);
        REQUIRE(f.protocol.positions().get(f.position).debt_markets.empty());
        REQUIRE(f.tokens().balance_of(USDC, f.position) == 0);
    }

    SECTION("Repay a market the position does not owe") {
        REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::repay(f.market, 1)); }) ==
                errors::INVALID_DEBT_MARKET);
    }

    SECTION("Debt market limit") {
        std::vector<MarketId> extra;
        for (uint64_t k = 0; k < 5; ++k) {
            Address key = addresses::from_id(210 + k);
            f.ledger().register_rate_model(OWNER, key, std::make_shared<FixedRateModel>(0));
            MarketId m = f.create_market(USDC, key);
            f.risk_engine().set_oracle(OWNER, m, USDC, f.oracle);
            f.risk_engine().set_oracle(OWNER, m, WETH, f.oracle);
            f.risk_engine().request_ltv_update(MARKET_OWNER, m, WETH, dec("0.8"));
            f.supply(BOB, m, 100);
            extra.push_back(m);
        }

        f.borrow(10);
        for (size_t k = 0; k < 4; ++k) {
            f.pm().process(ALICE, f.position, actions::borrow(extra[k], 10));
        }
        REQUIRE(f.protocol.positions().get(f.position).debt_markets.full());
        REQUIRE(f.risk().is_healthy(f.position));
        REQUIRE(error_code([&] {
            f.pm().process(ALICE, f.position, actions::borrow(extra[4], 10));
        }) == errors::MAX_DEBT_MARKETS_EXCEEDED);
    }
}

// =============================================================================
// Approvals and Exec
// =============================================================================

TEST_CASE("Approvals from positions", "[position_manager]") {
    Funded f;

    REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::approve(CAROL, USDC, 100)); }) ==
            errors::UNKNOWN_SPENDER);

    f.pm().toggle_known_spender(OWNER, CAROL);
    f.pm().process(ALICE, f.position, actions::approve(CAROL, USDC, 100));
    REQUIRE(f.tokens().allowance(USDC, f.position, CAROL) == 100);

    REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::approve(CAROL, WBTC, 100)); }) ==
            errors::UNKNOWN_ASSET);
}

TEST_CASE("Exec sandbox", "[position_manager]") {
    Funded f;
    RecordingTarget target;

    SECTION("Selector must be allow-listed") {
        REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::exec(TARGET, SWAP)); }) ==
                errors::UNKNOWN_FUNC);
    }

    f.pm().toggle_known_func(OWNER, TARGET, SWAP);
    REQUIRE(f.pm().is_known_func(TARGET, SWAP));

    SECTION("Target must be registered") {
        REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::exec(TARGET, SWAP)); }) ==
                errors::UNKNOWN_EXEC_TARGET);
    }

    f.pm().register_exec_target(OWNER, TARGET, &target);

    SECTION("Call reaches the target") {
        f.pm().process(ALICE, f.position, actions::exec(TARGET, SWAP, {0xaa, 0xbb}));
        REQUIRE(target.calls == 1);
        REQUIRE(target.last_position == f.position);
        REQUIRE(target.last_selector == SWAP);
        REQUIRE(target.last_calldata == std::vector<uint8_t>{0xaa, 0xbb});
    }

    SECTION("Other selectors stay blocked") {
        REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::exec(TARGET, SWAP + 1)); }) ==
                errors::UNKNOWN_FUNC);
    }

    SECTION("Target effects are health checked") {
        f.borrow(8000);
        target.sweep = true;
        REQUIRE(error_code([&] { f.pm().process(ALICE, f.position, actions::exec(TARGET, SWAP)); }) ==
                errors::HEALTH_CHECK_FAILED);
        REQUIRE(f.tokens().balance_of(WETH, f.position) == 1000);
        REQUIRE(f.tokens().balance_of(WETH, TARGET) == 0);
    }

    SECTION("Assets the target drains leave the held set") {
        target.sweep = true;
        f.pm().process(ALICE, f.position, actions::exec(TARGET, SWAP));
        REQUIRE(f.tokens().balance_of(WETH, TARGET) == 1000);
        REQUIRE(f.tokens().balance_of(WETH, f.position) == 0);
        REQUIRE_FALSE(f.protocol.positions().get(f.position).held_assets.contains(WETH));
    }

    f.pm().register_exec_target(OWNER, TARGET, nullptr);
}

// =============================================================================
// Liquidation
// =============================================================================

TEST_CASE("Liquidation", "[position_manager]") {
    Funded f;
    f.borrow(8000);
    f.fund(LIQUIDATOR, USDC, 10000, f.pm().address());

    SECTION("Healthy positions cannot be liquidated") {
        REQUIRE(error_code([&] {
            f.pm().liquidate(LIQUIDATOR, f.position, {DebtRepayment{f.market, 100}}, {});
        }) == errors::LIQUIDATE_HEALTHY_POSITION);
    }

    f.oracle->set_price(WETH, x18::from_int(9));

    SECTION("Liquidator repays debt and takes collateral") {
        f.pm().liquidate(LIQUIDATOR, f.position, {DebtRepayment{f.market, 4000}}, {AssetSeizure{WETH, 400}});
        REQUIRE(f.tokens().balance_of(USDC, LIQUIDATOR) == 6000);
        REQUIRE(f.tokens().balance_of(WETH, LIQUIDATOR) == 400);
        REQUIRE(f.tokens().balance_of(WETH, f.position) == 600);
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 4000);
    }

    SECTION("Liquidation fee goes to the protocol owner") {
        f.pm().set_liquidation_fee(OWNER, dec("0.1"));
        f.pm().liquidate(LIQUIDATOR, f.position, {DebtRepayment{f.market, 4000}}, {AssetSeizure{WETH, 400}});
        REQUIRE(f.tokens().balance_of(WETH, OWNER) == 40);
        REQUIRE(f.tokens().balance_of(WETH, LIQUIDATOR) == 360);
    }

    SECTION("Close factor and discount") {
        REQUIRE(error_code([&] {
            f.pm().liquidate(LIQUIDATOR, f.position, {DebtRepayment{f.market, 4001}}, {});
        }) == errors::CLOSE_FACTOR_EXCEEDED);
        REQUIRE(error_code([&] {
            f.pm().liquidate(LIQUIDATOR, f.position, {DebtRepayment{f.market, 4000}}, {AssetSeizure{WETH, 489}});
        }) == errors::SEIZED_TOO_MUCH_COLLATERAL);
    }

    SECTION("Liquidation may not leave bad debt behind") {
        f.oracle->set_price(WETH, dec("8.1"));
        REQUIRE(error_code([&] {
            f.pm().liquidate(LIQUIDATOR, f.position, {DebtRepayment{f.market, 4000}}, {AssetSeizure{WETH, 543}});
        }) == errors::LIQUIDATION_CREATES_BAD_DEBT);
        REQUIRE(f.tokens().balance_of(USDC, LIQUIDATOR) == 10000);
        REQUIRE(f.ledger().get_borrows_of(f.market, f.position) == 8000);
    }

    SECTION("Positions in bad debt can be closed out fully") {
        f.oracle->set_price(WETH, x18::from_int(5));
        f.pm().liquidate(LIQUIDATOR, f.position,
                         {DebtRepayment{f.market, MAX_AMOUNT}}, {AssetSeizure{WETH, MAX_AMOUNT}});
        REQUIRE(f.tokens().balance_of(USDC, LIQUIDATOR) == 2000);
        REQUIRE(f.tokens().balance_of(WETH, LIQUIDATOR) == 1000);
        REQUIRE(f.protocol.positions().get(f.position).debt_markets.empty());
        REQUIRE(f.protocol.positions().get(f.position).held_assets.empty());
    }
}

TEST_CASE("Bad debt liquidation", "[position_manager]") {
    Funded f;
    f.borrow(8000);

    SECTION("Requires bad debt") {
        f.oracle->set_price(WETH, x18::from_int(9));
        REQUIRE(error_code([&] { f.pm().liquidate_bad_debt(OWNER, f.position); }) == errors::NO_BAD_DEBT);
    }

    f.oracle->set_price(WETH, x18::from_int(5));

    SECTION("Protocol owner only") {
        REQUIRE(error_code([&] { f.pm().liquidate_bad_debt(ALICE, f.position); }) == errors::UNAUTHORIZED);
    }

    SECTION("Collateral to the owner, debt written off against lenders") {
        f.pm().liquidate_bad_debt(OWNER, f.position);
        REQUIRE(f.tokens().balance_of(WETH, OWNER) == 1000);
        REQUIRE(f.ledger().get_total_borrows(f.market) == 0);
        REQUIRE(f.ledger().get_total_assets(f.market) == 92000);
        REQUIRE(f.ledger().get_assets_of(f.market, BOB) == 92000);
        REQUIRE(f.protocol.positions().get(f.position).debt_markets.empty());
        REQUIRE(f.protocol.positions().get(f.position).held_assets.empty());
        REQUIRE(f.risk().is_healthy(f.position));
    }
}

// =============================================================================
// Protocol Owner
// =============================================================================

TEST_CASE("Position manager administration", "[position_manager]") {
    Funded f;

    REQUIRE(error_code([&] { f.pm().toggle_known_asset(ALICE, WBTC); }) == errors::UNAUTHORIZED);
    REQUIRE(error_code([&] { f.pm().toggle_known_func(ALICE, TARGET, SWAP); }) == errors::UNAUTHORIZED);
    REQUIRE(error_code([&] { f.pm().set_liquidation_fee(OWNER, X18_ONE + 1); }) == errors::INVALID_PARAMETER);

    f.pm().toggle_known_asset(OWNER, WETH);
    REQUIRE_FALSE(f.pm().is_known_asset(WETH));

    f.pm().transfer_ownership(OWNER, CAROL);
    REQUIRE(f.pm().params().owner == CAROL);
    REQUIRE(error_code([&] { f.pm().toggle_known_asset(OWNER, WETH); }) == errors::UNAUTHORIZED);
}
