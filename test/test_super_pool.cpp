#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

using namespace isolend;
using namespace isolend::test;

namespace {

// Pool over two USDC markets with caps 500 and 1000, total cap 10000
struct PoolFixture : TestProtocol {
    MarketId m1 = 0;
    MarketId m2 = 0;
    std::shared_ptr<SuperPool> pool;

    explicit PoolFixture(I128 fee_x18 = 0, I128 rate_x18 = 0)
        : TestProtocol(test_config(), rate_x18) {
        m1 = market;
        m2 = create_market(USDC, RATE_KEY_2);
        pool = factory().deploy(OWNER, OWNER, USDC, FEE_RECIPIENT, fee_x18, 10000, 0,
                                "Pooled USDC", "spUSDC");
        pool->add_pool(OWNER, m1, 500);
        pool->add_pool(OWNER, m2, 1000);
    }

    I128 deposit(const Address& who, I128 amount) {
        fund(who, USDC, amount, pool->address());
        return pool->deposit(who, amount, who);
    }

    I128 in_market(MarketId m) const {
        return protocol.ledger().get_assets_of(m, pool->address());
    }

    // CAROL borrows `amount` from m1 against 1000 WETH
    void borrow_from_m1(I128 amount) {
        Address position = open_position(CAROL, 1000);
        pm().process(CAROL, position, actions::borrow(m1, amount));
    }
};

} // namespace

TEST_CASE("Deposits follow the deposit queue", "[super_pool]") {
    PoolFixture f;

    SECTION("Markets fill up to their pool caps") {
        REQUIRE(f.deposit(ALICE, 1200) == 1200);
        REQUIRE(f.in_market(f.m1) == 500);
        REQUIRE(f.in_market(f.m2) == 700);
        REQUIRE(f.pool->idle() == 0);
        REQUIRE(f.pool->total_assets() == 1200);
        REQUIRE(f.pool->balance_of(ALICE) == 1200);

        // Whatever no market can take stays idle
        REQUIRE(f.deposit(BOB, 500) == 500);
        REQUIRE(f.in_market(f.m1) == 500);
        REQUIRE(f.in_market(f.m2) == 1000);
        REQUIRE(f.pool->idle() == 200);
        REQUIRE(f.pool->total_assets() == 1700);
    }

    SECTION("Market deposit caps limit routing") {
        f.ledger().set_deposit_cap(MARKET_OWNER, f.m1, 300);
        f.deposit(ALICE, 1200);
        REQUIRE(f.in_market(f.m1) == 300);
        REQUIRE(f.in_market(f.m2) == 900);
        REQUIRE(f.pool->idle() == 0);
    }

    SECTION("Paused markets are skipped") {
        f.ledger().toggle_pause(MARKET_OWNER, f.m1);
        f.deposit(ALICE, 800);
        REQUIRE(f.in_market(f.m1) == 0);
        REQUIRE(f.in_market(f.m2) == 800);
    }

    SECTION("Markets with every asset written off are skipped") {
        f.supply(BOB, f.m1, 5000);
        Address position = f.open_position(CAROL, 1000);
        f.pm().process(CAROL, position, actions::borrow(f.m1, 5000));
        f.oracle->set_price(WETH, x18::from_int(4));
        f.pm().liquidate_bad_debt(OWNER, position);

        auto data = f.ledger().get_pool_data(f.m1);
        REQUIRE(data->deposits.assets == 0);
        REQUIRE(data->deposits.shares == 5000);

        f.deposit(ALICE, 800);
        REQUIRE(f.protocol.ledger().balance_of(f.pool->address(), f.m1) == 0);
        REQUIRE(f.in_market(f.m2) == 800);
        REQUIRE(f.pool->total_assets() == 800);
    }

    SECTION("Reordered queue") {
        f.pool->reorder_deposit_queue(OWNER, {1, 0});
        REQUIRE(f.pool->deposit_queue() == std::vector<MarketId>{f.m2, f.m1});

        f.deposit(ALICE, 1200);
        REQUIRE(f.in_market(f.m2) == 1000);
        REQUIRE(f.in_market(f.m1) == 200);
    }

    SECTION("Super pool cap") {
        f.fund(ALICE, USDC, 10001, f.pool->address());
        REQUIRE(error_code([&] { f.pool->deposit(ALICE, 10001, ALICE); }) == errors::SUPER_POOL_CAP_EXCEEDED);
        REQUIRE(f.tokens().balance_of(USDC, ALICE) == 10001);
        REQUIRE(f.pool->total_supply() == 0);
        REQUIRE(f.pool->max_deposit(ALICE) == 10000);

        REQUIRE_NOTHROW(f.pool->deposit(ALICE, 10000, ALICE));
        REQUIRE(f.pool->max_deposit(ALICE) == 0);
    }

    SECTION("Deposit for another receiver") {
        f.fund(ALICE, USDC, 100, f.pool->address());
        f.pool->deposit(ALICE, 100, BOB);
        REQUIRE(f.pool->balance_of(BOB) == 100);
        REQUIRE(f.pool->balance_of(ALICE) == 0);
    }

    SECTION("Zero deposits mint nothing") {
        REQUIRE(error_code([&] { f.pool->deposit(ALICE, 0, ALICE); }) == errors::ZERO_SHARES);
    }

    SECTION("Deposit events") {
        RecordingListener listener;
        f.protocol.runtime().set_event_listener(&listener);
        f.deposit(ALICE, 600);
        REQUIRE(listener.count("Deposit") == 3);
        f.protocol.runtime().set_event_listener(nullptr);

        const Event& last = listener.events.back();
        REQUIRE(last.name == "Deposit");
        REQUIRE(last.emitter == f.pool->address());
        REQUIRE(last.field("assets") == "600");
    }
}

TEST_CASE("Withdrawals drain idle funds then the withdraw queue", "[super_pool]") {
    PoolFixture f;
    f.deposit(ALICE, 1000);
    REQUIRE(f.in_market(f.m1) == 500);
    REQUIRE(f.in_market(f.m2) == 500);

    SECTION("Idle first") {
        f.deposit(BOB, 800);
        REQUIRE(f.pool->idle() == 300);

        f.pool->withdraw(BOB, 200, BOB, BOB);
        REQUIRE(f.pool->idle() == 100);
        REQUIRE(f.in_market(f.m1) == 500);
        REQUIRE(f.in_market(f.m2) == 1000);
        REQUIRE(f.tokens().balance_of(USDC, BOB) == 200);
    }

    SECTION("Queue order with borrowed liquidity") {
        f.borrow_from_m1(450);
        REQUIRE(f.pool->max_withdraw(ALICE) == 550);

        REQUIRE(error_code([&] { f.pool->withdraw(ALICE, 600, ALICE, ALICE); }) ==
                errors::INSUFFICIENT_WITHDRAW_PATH);
        REQUIRE(f.pool->balance_of(ALICE) == 1000);

        REQUIRE(f.pool->withdraw(ALICE, 550, ALICE, ALICE) == 550);
        REQUIRE(f.in_market(f.m1) == 450);
        REQUIRE(f.in_market(f.m2) == 0);
        REQUIRE(f.tokens().balance_of(USDC, ALICE) == 550);
        REQUIRE(f.pool->balance_of(ALICE) == 450);
    }

    SECTION("Reordered withdraw queue") {
        f.pool->reorder_withdraw_queue(OWNER, {1, 0});
        f.pool->withdraw(ALICE, 600, ALICE, ALICE);
        REQUIRE(f.in_market(f.m2) == 0);
        REQUIRE(f.in_market(f.m1) == 400);
    }

    SECTION("Redeem") {
        REQUIRE(f.pool->redeem(ALICE, 200, ALICE, ALICE) == 200);
        REQUIRE(f.pool->balance_of(ALICE) == 800);
        REQUIRE(f.tokens().balance_of(USDC, ALICE) == 200);
        REQUIRE(error_code([&] { f.pool->redeem(ALICE, 801, ALICE, ALICE); }) == errors::INSUFFICIENT_SHARES);
    }

    SECTION("Spenders need an allowance") {
        REQUIRE(error_code([&] { f.pool->withdraw(BOB, 100, BOB, ALICE); }) == errors::INSUFFICIENT_ALLOWANCE);

        f.pool->approve(ALICE, BOB, 300);
        f.pool->withdraw(BOB, 300, BOB, ALICE);
        REQUIRE(f.pool->allowance(ALICE, BOB) == 0);
        REQUIRE(f.tokens().balance_of(USDC, BOB) == 300);
        REQUIRE(f.pool->balance_of(ALICE) == 700);
    }

    SECTION("Withdrawals work while paused") {
        f.pool->toggle_pause(OWNER);
        REQUIRE(f.pool->paused());
        REQUIRE_NOTHROW(f.pool->withdraw(ALICE, 100, ALICE, ALICE));
    }
}

TEST_CASE("Share token", "[super_pool]") {
    PoolFixture f;
    f.deposit(ALICE, 1000);

    SECTION("Transfer") {
        f.pool->transfer(ALICE, BOB, 400);
        REQUIRE(f.pool->balance_of(ALICE) == 600);
        REQUIRE(f.pool->balance_of(BOB) == 400);
        REQUIRE(f.pool->total_supply() == 1000);
        REQUIRE(error_code([&] { f.pool->transfer(BOB, ALICE, 401); }) == errors::INSUFFICIENT_SHARES);
    }

    SECTION("Transfer from") {
        REQUIRE(error_code([&] { f.pool->transfer_from(BOB, ALICE, BOB, 1); }) ==
                errors::INSUFFICIENT_ALLOWANCE);

        f.pool->approve(ALICE, BOB, MAX_AMOUNT);
        f.pool->transfer_from(BOB, ALICE, CAROL, 250);
        REQUIRE(f.pool->balance_of(CAROL) == 250);
        REQUIRE(f.pool->allowance(ALICE, BOB) == MAX_AMOUNT);

        f.pool->approve(ALICE, BOB, 0);
        REQUIRE(f.pool->allowance(ALICE, BOB) == 0);
    }

    SECTION("Mint rounds assets up") {
        f.fund(BOB, USDC, 1000, f.pool->address());
        REQUIRE(f.pool->preview_mint(100) == 100);
        REQUIRE(f.pool->mint(BOB, 100, BOB) == 100);
        REQUIRE(f.pool->balance_of(BOB) == 100);
        REQUIRE(f.tokens().balance_of(USDC, BOB) == 900);
    }

    SECTION("Paused pools reject deposits and mints") {
        f.pool->toggle_pause(OWNER);
        f.fund(BOB, USDC, 100, f.pool->address());
        REQUIRE(error_code([&] { f.pool->deposit(BOB, 100, BOB); }) == errors::VAULT_PAUSED);
        REQUIRE(error_code([&] { f.pool->mint(BOB, 100, BOB); }) == errors::VAULT_PAUSED);
        REQUIRE(f.pool->max_deposit(BOB) == 0);

        f.pool->toggle_pause(OWNER);
        REQUIRE_NOTHROW(f.pool->deposit(BOB, 100, BOB));
    }
}

TEST_CASE("Performance fee", "[super_pool]") {
    PoolFixture f(dec("0.1"), X18_ONE);
    f.deposit(ALICE, 1000);
    f.borrow_from_m1(500);

    f.clock.advance(SECONDS_PER_YEAR);
    REQUIRE(f.in_market(f.m1) == 1000);
    REQUIRE(f.pool->total_assets() == 1500);

    SECTION("Simulated accrual") {
        SuperPoolAccrual acc = f.pool->simulate_accrue();
        REQUIRE(acc.total_assets == 1500);
        // 50 fee assets priced before the fee is taken
        REQUIRE(acc.fee_shares == 34);
        REQUIRE(f.pool->balance_of(FEE_RECIPIENT) == 0);
    }

    SECTION("Accrual mints fee shares") {
        f.pool->accrue();
        REQUIRE(f.pool->balance_of(FEE_RECIPIENT) == 34);
        REQUIRE(f.pool->total_supply() == 1034);
        REQUIRE(f.pool->last_total_assets() == 1500);

        // Checkpointed; nothing new to charge
        f.pool->accrue();
        REQUIRE(f.pool->balance_of(FEE_RECIPIENT) == 34);
    }

    SECTION("Deposits accrue first") {
        f.deposit(BOB, 100);
        REQUIRE(f.pool->balance_of(FEE_RECIPIENT) == 34);
    }

    SECTION("Fee changes settle what is owed") {
        f.pool->set_fee(OWNER, 0);
        REQUIRE(f.pool->balance_of(FEE_RECIPIENT) == 34);
        REQUIRE(error_code([&] { f.pool->set_fee(OWNER, X18_ONE + 1); }) == errors::INVALID_PARAMETER);
    }

    SECTION("Recipient changes settle to the old recipient") {
        f.pool->set_fee_recipient(OWNER, CAROL);
        REQUIRE(f.pool->balance_of(FEE_RECIPIENT) == 34);
        REQUIRE(f.pool->params().fee_recipient == CAROL);
    }
}

TEST_CASE("Pool administration", "[super_pool]") {
    PoolFixture f;

    SECTION("Only pools of the same asset") {
        MarketId weth_market = f.create_market(WETH, RATE_KEY);
        REQUIRE(error_code([&] { f.pool->add_pool(OWNER, weth_market, 100); }) == errors::ASSET_MISMATCH);
        REQUIRE(error_code([&] { f.pool->add_pool(OWNER, f.m1, 100); }) == errors::MARKET_ALREADY_ADDED);
        REQUIRE(error_code([&] { f.pool->add_pool(OWNER, 12345, 100); }) == errors::MARKET_NOT_FOUND);
    }

    SECTION("Queue length is bounded") {
        for (int k = 0; k < 9; ++k) {
            Address key = addresses::from_id(310 + k);
            f.ledger().register_rate_model(OWNER, key, std::make_shared<FixedRateModel>(0));
            MarketId m = f.create_market(USDC, key);
            if (k < 8) {
                f.pool->add_pool(OWNER, m, 100);
            } else {
                REQUIRE(error_code([&] { f.pool->add_pool(OWNER, m, 100); }) ==
                        errors::MAX_QUEUE_LENGTH_EXCEEDED);
            }
        }
        REQUIRE(f.pool->deposit_queue().size() == MAX_SUPER_POOL_MARKETS);
        REQUIRE(f.pool->withdraw_queue().size() == MAX_SUPER_POOL_MARKETS);
    }

    SECTION("Removing pools") {
        f.pool->remove_pool(OWNER, f.m2);
        REQUIRE(f.pool->deposit_queue() == std::vector<MarketId>{f.m1});
        REQUIRE(f.pool->withdraw_queue() == std::vector<MarketId>{f.m1});
        REQUIRE(f.pool->pool_cap(f.m2) == 0);

        f.deposit(ALICE, 100);
        REQUIRE(error_code([&] { f.pool->remove_pool(OWNER, f.m1); }) == errors::NON_ZERO_BALANCE);
        REQUIRE(error_code([&] { f.pool->remove_pool(OWNER, f.m2); }) == errors::MARKET_NOT_IN_QUEUE);
    }

    SECTION("Reorders must be permutations") {
        REQUIRE(error_code([&] { f.pool->reorder_deposit_queue(OWNER, {0, 0}); }) ==
                errors::INVALID_QUEUE_REORDER);
        REQUIRE(error_code([&] { f.pool->reorder_withdraw_queue(OWNER, {0}); }) ==
                errors::INVALID_QUEUE_REORDER);
        REQUIRE(error_code([&] { f.pool->reorder_withdraw_queue(OWNER, {0, 2}); }) ==
                errors::INVALID_QUEUE_REORDER);
    }

    SECTION("Owner only") {
        REQUIRE(error_code([&] { f.pool->add_pool(ALICE, f.m1, 1); }) == errors::UNAUTHORIZED);
        REQUIRE(error_code([&] { f.pool->modify_pool_cap(ALICE, f.m1, 1); }) == errors::UNAUTHORIZED);
        REQUIRE(error_code([&] { f.pool->toggle_pause(ALICE); }) == errors::UNAUTHORIZED);
        REQUIRE(error_code([&] { f.pool->set_super_pool_cap(ALICE, 1); }) == errors::UNAUTHORIZED);

        f.pool->transfer_ownership(OWNER, ALICE);
        REQUIRE_NOTHROW(f.pool->set_super_pool_cap(ALICE, 20000));
        REQUIRE(f.pool->params().super_pool_cap == 20000);
    }
}

TEST_CASE("Reallocation", "[super_pool]") {
    PoolFixture f;
    f.deposit(ALICE, 1200);
    f.pool->modify_pool_cap(OWNER, f.m1, 800);

    SECTION("Moves funds between members") {
        f.pool->reallocate(OWNER, {ReallocateParams{f.m2, 200}}, {ReallocateParams{f.m1, 200}});
        REQUIRE(f.in_market(f.m1) == 700);
        REQUIRE(f.in_market(f.m2) == 500);
        REQUIRE(f.pool->total_assets() == 1200);
    }

    SECTION("Pool caps bind") {
        REQUIRE(error_code([&] {
            f.pool->reallocate(OWNER, {ReallocateParams{f.m2, 400}}, {ReallocateParams{f.m1, 400}});
        }) == errors::POOL_CAP_EXCEEDED);
        REQUIRE(f.in_market(f.m2) == 700);
    }

    SECTION("Members only") {
        Address key = addresses::from_id(299);
        f.ledger().register_rate_model(OWNER, key, std::make_shared<FixedRateModel>(0));
        MarketId other = f.create_market(USDC, key);
        REQUIRE(error_code([&] {
            f.pool->reallocate(OWNER, {}, {ReallocateParams{other, 1}});
        }) == errors::MARKET_NOT_IN_QUEUE);
    }

    SECTION("Owner or allocator") {
        REQUIRE(error_code([&] {
            f.pool->reallocate(CAROL, {ReallocateParams{f.m2, 100}}, {ReallocateParams{f.m1, 100}});
        }) == errors::UNAUTHORIZED);

        f.pool->toggle_allocator(OWNER, CAROL);
        REQUIRE(f.pool->is_allocator(CAROL));
        f.pool->reallocate(CAROL, {ReallocateParams{f.m2, 100}}, {ReallocateParams{f.m1, 100}});
        REQUIRE(f.in_market(f.m1) == 600);

        f.pool->toggle_allocator(OWNER, CAROL);
        REQUIRE_FALSE(f.pool->is_allocator(CAROL));
    }
}

TEST_CASE("Super pool factory", "[super_pool]") {
    TestProtocol f;

    SECTION("Deterministic addresses") {
        auto a = f.factory().deploy(OWNER, OWNER, USDC, FEE_RECIPIENT, 0, 1000, 0, "A", "A");
        auto b = f.factory().deploy(OWNER, OWNER, WETH, FEE_RECIPIENT, 0, 1000, 0, "B", "B");
        REQUIRE(a->address() != b->address());
        REQUIRE(f.factory().pools() == std::vector<Address>{a->address(), b->address()});
        REQUIRE(f.factory().find(b->address()) == b);
        REQUIRE(f.factory().find(ALICE) == nullptr);
        REQUIRE(b->asset() == WETH);
    }

    SECTION("Invalid parameters") {
        REQUIRE(error_code([&] {
            f.factory().deploy(OWNER, OWNER, USDC, FEE_RECIPIENT, X18_ONE + 1, 1000, 0, "A", "A");
        }) == errors::INVALID_PARAMETER);
        REQUIRE(error_code([&] {
            f.factory().deploy(OWNER, OWNER, addresses::ZERO, FEE_RECIPIENT, 0, 1000, 0, "A", "A");
        }) == errors::INVALID_PARAMETER);
        REQUIRE(f.factory().pools().empty());
    }

    SECTION("Initial shares are burned") {
        const Address factory_addr = addresses::from_id(950);
        SuperPoolFactory factory(f.protocol.runtime(), f.tokens(), f.ledger(), 1000, factory_addr);
        f.fund(ALICE, USDC, 5000, factory_addr);

        REQUIRE(error_code([&] {
            factory.deploy(ALICE, ALICE, USDC, FEE_RECIPIENT, 0, 10000, 999, "A", "A");
        }) == errors::NOT_ENOUGH_BURNED_SHARES);
        REQUIRE(factory.pools().empty());
        REQUIRE(f.tokens().balance_of(USDC, ALICE) == 5000);

        auto pool = factory.deploy(ALICE, ALICE, USDC, FEE_RECIPIENT, 0, 10000, 1000, "A", "A");
        REQUIRE(pool->balance_of(addresses::DEAD) == 1000);
        REQUIRE(pool->total_supply() == 1000);
        REQUIRE(pool->idle() == 1000);
        REQUIRE(f.tokens().balance_of(USDC, ALICE) == 4000);
    }
}
