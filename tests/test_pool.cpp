// dlmm - Pool Facade Tests

#include <catch2/catch.hpp>
#include "dlmm/pool.hpp"
#include "test_util.hpp"

#include <stdexcept>
#include <thread>
#include <vector>

using namespace dlmm;
using namespace dlmm::test;

namespace {

class BlockList : public IAccessControl {
public:
    Address blocked_user{};
    Operation blocked_op = Operation::Swap;
    PositionId blocked_position = 0;

    bool is_user_blocked(const Address& user, Operation op) const override {
        return user == blocked_user && op == blocked_op;
    }
    bool is_position_blocked(PositionId position, Operation op) const override {
        return position == blocked_position;
    }
};

struct Transfer {
    bool inbound;
    Address party;
    Currency coin;
    uint64_t amount;
};

class RecordingCustody : public ICustody {
public:
    std::vector<Transfer> transfers;
    bool fail_release = false;

    void lock_funds(const Address& from, const Currency& coin, uint64_t amount) override {
        transfers.push_back(Transfer{true, from, coin, amount});
    }
    void release_funds(const Address& to, const Currency& coin, uint64_t amount) override {
        if (fail_release) throw std::runtime_error("custody offline");
        transfers.push_back(Transfer{false, to, coin, amount});
    }
};

} // anonymous namespace

TEST_CASE("Pool rejects a bad configuration", "[pool]") {
    REQUIRE(error_code([] { Pool pool(PoolConfig{}.with_bin_step(0)); })
            == ErrorCode::InvalidConfig);
    REQUIRE(error_code([] {
        Pool pool(PoolConfig{}.with_coins(make_currency(3), make_currency(3)));
    }) == ErrorCode::InvalidConfig);
    REQUIRE(error_code([] { Pool pool(PoolConfig{}.with_bin_step(10000).with_active_bin(1000)); })
            == ErrorCode::InvalidBinRange);
    REQUIRE(error_code([] { Pool pool(PoolConfig{}.with_base_fee_rate(MAX_FEE_RATE + 1)); })
            == ErrorCode::FeeRateOutOfRange);

    Pool pool(pool_config(25, -40));
    REQUIRE(pool.pool_id() == 7);
    REQUIRE(pool.bin_step() == 25);
    REQUIRE(pool.active_bin_id() == -40);
    REQUIRE(pool.volatility_state().reference_bin_id == -40);
}

TEST_CASE("Version is checked before access control", "[pool]") {
    Pool pool(pool_config(100, 5));
    seed_y(pool, 5, 5, 1000);

    BlockList access;
    access.blocked_user = address(4);
    TxContext ctx = tx(10, address(4));
    ctx.access = &access;

    REQUIRE(error_code([&] { pool.swap_exact_in(ctx, 10, Direction::XtoY); })
            == ErrorCode::Blocked);

    ctx.version = PROTOCOL_VERSION + 1;
    REQUIRE(error_code([&] { pool.swap_exact_in(ctx, 10, Direction::XtoY); })
            == ErrorCode::StaleVersion);

    SECTION("Blocking is per operation") {
        TxContext open = tx(10, address(4));
        open.access = &access;
        PositionId id = pool.open_position(open, 0, 1);
        REQUIRE(pool.get_position(id)->owner == address(4));
    }
}

TEST_CASE("Position checks run after sender checks", "[pool]") {
    Pool pool(pool_config(100, 5));
    PositionId id = seed_y(pool, 5, 5, 1000);

    BlockList access;
    access.blocked_user = address(8);
    access.blocked_position = id;

    TxContext owner = tx(10);
    owner.access = &access;
    REQUIRE(error_code([&] { pool.collect_fee(owner, id); }) == ErrorCode::Blocked);
    REQUIRE(error_code([&] { pool.remove_liquidity(owner, id, {BinShares{5, 1}}); })
            == ErrorCode::Blocked);

    TxContext stranger = tx(10, address(3));
    stranger.access = &access;
    REQUIRE(error_code([&] { pool.collect_fee(stranger, id); }) == ErrorCode::Unauthorized);
    REQUIRE(error_code([&] { pool.collect_fee(tx(10), id + 100); })
            == ErrorCode::PositionNotFound);

    REQUIRE_FALSE(pool.get_position(id + 100).has_value());
    REQUIRE_FALSE(pool.position_info(id + 100, 10).has_value());
    REQUIRE(pool.bin_reserves(5) == Amounts{0, 1000});
}

TEST_CASE("Custody sees every transfer of a swap", "[pool]") {
    Pool pool(pool_config(100, 5));
    seed_y(pool, 5, 5, 1000000);

    RecordingCustody custody;
    TxContext ctx = tx(1000, address(2));
    ctx.custody = &custody;

    SwapRequest request;
    request.amount = 100000;
    request.referral_fee_rate = 100000000;
    request.referrer = address(9);
    SwapResult r = pool.swap(ctx, request);

    REQUIRE(custody.transfers.size() == 3);

    const Transfer& paid = custody.transfers[0];
    REQUIRE(paid.inbound);
    REQUIRE(paid.party == address(2));
    REQUIRE(paid.coin == make_currency(1));
    REQUIRE(paid.amount == 100000);

    const Transfer& received = custody.transfers[1];
    REQUIRE_FALSE(received.inbound);
    REQUIRE(received.party == address(2));
    REQUIRE(received.coin == make_currency(2));
    REQUIRE(received.amount == r.amount_out);

    const Transfer& referral = custody.transfers[2];
    REQUIRE_FALSE(referral.inbound);
    REQUIRE(referral.party == address(9));
    REQUIRE(referral.coin == make_currency(1));
    REQUIRE(referral.amount == r.referral_fee);
}

TEST_CASE("Custody failure leaves the pool unchanged", "[pool]") {
    Pool pool(pool_config(100, 5));
    PositionId id = seed_y(pool, 0, 10, 100);
    const Amounts balances = pool.balances();

    RecordingCustody custody;
    custody.fail_release = true;
    TxContext ctx = tx(1000);
    ctx.custody = &custody;

    REQUIRE_THROWS_AS(pool.swap_exact_in(ctx, 500, Direction::XtoY), std::runtime_error);
    REQUIRE_THROWS_AS(pool.close_position(ctx, id), std::runtime_error);

    REQUIRE(pool.balances() == balances);
    REQUIRE(pool.active_bin_id() == 5);
    REQUIRE(pool.bin_reserves(5) == Amounts{0, 100});
    REQUIRE(pool.get_position(id).has_value());
    REQUIRE(pool.get_stats().total_swaps == 0);

    SECTION("Deposits lock before anything is stored") {
        custody.fail_release = false;
        PositionId second = pool.open_position(tx(1000), 0, 0);
        pool.add_liquidity(ctx, second, {BinAmount{0, 0, 40}});
        REQUIRE(custody.transfers.size() == 1);
        REQUIRE(custody.transfers[0].inbound);
        REQUIRE(custody.transfers[0].amount == 40);
        REQUIRE(pool.bin_reserves(0) == Amounts{0, 140});
    }
}

TEST_CASE("Admin operations", "[pool]") {
    const Address admin = address(1);
    Pool pool(pool_config(100, 5).with_admin(admin));
    seed_y(pool, 5, 5, 1000000);
    SwapResult r = pool.swap_exact_in(tx(1000), 100000, Direction::XtoY);
    REQUIRE(r.protocol_fee == 20);

    SECTION("Fee parameters") {
        FeeParameters params = pool.fee_parameters();
        params.base_fee_rate = 5000000;

        REQUIRE(error_code([&] { pool.set_fee_parameters(tx(1001, address(2)), params); })
                == ErrorCode::Unauthorized);

        FeeParameters bad = params;
        bad.protocol_fee_rate = MAX_PROTOCOL_FEE_RATE + 1;
        REQUIRE(error_code([&] { pool.set_fee_parameters(tx(1001, admin), bad); })
                == ErrorCode::FeeRateOutOfRange);
        REQUIRE(pool.fee_parameters().base_fee_rate == 2000000);

        pool.set_fee_parameters(tx(1001, admin), params);
        REQUIRE(pool.fee_parameters().base_fee_rate == 5000000);
        REQUIRE(pool.current_fee_rate(5000) == 5000000);
    }

    SECTION("Protocol fee collection") {
        REQUIRE(error_code([&] { pool.collect_protocol_fee(tx(1001, address(2))); })
                == ErrorCode::Unauthorized);

        const Amounts before = pool.balances();
        RecordingCustody custody;
        TxContext ctx = tx(1001, admin);
        ctx.custody = &custody;

        Amounts fees = pool.collect_protocol_fee(ctx);
        REQUIRE(fees.amount_x == r.protocol_fee);
        REQUIRE(fees.amount_y == 0);
        REQUIRE(pool.protocol_fees() == Amounts{0, 0});
        REQUIRE(pool.balances().amount_x == before.amount_x - r.protocol_fee);
        REQUIRE(custody.transfers.size() == 1);
        REQUIRE(custody.transfers[0].party == admin);
        REQUIRE(custody.transfers[0].amount == r.protocol_fee);

        REQUIRE(pool.collect_protocol_fee(ctx) == Amounts{0, 0});
    }
}

TEST_CASE("A pool without an admin refuses admin operations", "[pool]") {
    Pool pool(pool_config(100, 5));
    seed_y(pool, 5, 5, 1000000);
    pool.swap_exact_in(tx(1000), 100000, Direction::XtoY);

    REQUIRE(error_code([&] { pool.collect_protocol_fee(tx(1001)); }) == ErrorCode::Unauthorized);
    REQUIRE(error_code([&] { pool.set_fee_parameters(tx(1001), FeeParameters{}); })
            == ErrorCode::Unauthorized);
    REQUIRE(error_code([&] { pool.initialize_reward(tx(1001), make_currency(50)); })
            == ErrorCode::Unauthorized);
    REQUIRE(pool.protocol_fees().amount_x == 20);
}

TEST_CASE("Current fee rate tracks volatility", "[pool]") {
    Pool pool(pool_config(100, 5));
    seed_y(pool, 0, 10, 100);
    REQUIRE(pool.current_fee_rate(0) == 2000000);

    pool.swap_exact_in(tx(1000), 1000, Direction::XtoY);
    REQUIRE(pool.active_bin_id() == 10);

    // Five bins from the reference inside the filter period
    REQUIRE(pool.current_fee_rate(1000) == 12000000);
    // Partly decayed
    const uint64_t decaying = pool.current_fee_rate(1100);
    REQUIRE(decaying > 2000000);
    REQUIRE(decaying < 12000000);
    // Fully decayed, reference moves to the active bin
    REQUIRE(pool.current_fee_rate(2000) == 2000000);
}

TEST_CASE("Statistics", "[pool]") {
    Pool pool(pool_config(100, 5));
    seed_y(pool, 0, 10, 100);
    SwapResult a = pool.swap_exact_in(tx(1000), 50, Direction::XtoY);
    SwapResult b = pool.swap_exact_in(tx(1001), 30, Direction::YtoX);

    Pool::Stats stats = pool.get_stats();
    REQUIRE(stats.total_swaps == 2);
    REQUIRE(stats.total_liquidity_ops == 1);
    REQUIRE(stats.total_flash_loans == 0);
    REQUIRE(stats.total_volume_x == a.amount_in);
    REQUIRE(stats.total_volume_y == b.amount_in);
    REQUIRE(stats.bin_count == 11);
    REQUIRE(stats.position_count == 1);
}

TEST_CASE("Concurrent deposits are serialized", "[pool][concurrency]") {
    Pool pool(pool_config(25, 0));
    constexpr int THREADS = 8;
    constexpr int DEPOSITS = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&pool, t] {
            TxContext ctx = tx(1, address(static_cast<uint8_t>(t + 1)));
            PositionId id = pool.open_position(ctx, 0, 0);
            for (int i = 0; i < DEPOSITS; ++i) {
                pool.add_liquidity(ctx, id, {BinAmount{0, 0, 10}});
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(pool.bin_reserves(0).amount_y == THREADS * DEPOSITS * 10);
    REQUIRE(pool.balances().amount_y == THREADS * DEPOSITS * 10);
    REQUIRE(pool.get_bin(0).liquidity_supply == U128(THREADS * DEPOSITS * 10));

    Pool::Stats stats = pool.get_stats();
    REQUIRE(stats.position_count == THREADS);
    REQUIRE(stats.total_liquidity_ops == THREADS * DEPOSITS);
}
