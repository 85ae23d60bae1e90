// dlmm - Position Accounting Tests

#include <catch2/catch.hpp>
#include "dlmm/pool.hpp"
#include "dlmm/price_math.hpp"
#include "test_util.hpp"

using namespace dlmm;
using namespace dlmm::test;

TEST_CASE("Opening positions validates the range", "[position]") {
    Pool pool(pool_config(25, 0));

    REQUIRE(error_code([&] { pool.open_position(tx(1), 5, 4); }) == ErrorCode::InvalidBinRange);
    REQUIRE(error_code([&] { pool.open_position(tx(1), 0, 1000); }) == ErrorCode::InvalidBinRange);

    PositionId id = pool.open_position(tx(1), 0, 999);
    std::optional<Position> position = pool.get_position(id);
    REQUIRE(position.has_value());
    REQUIRE(position->width() == MAX_BIN_PER_POSITION);
    REQUIRE(position->liquidity_shares.size() == MAX_BIN_PER_POSITION);
    REQUIRE_FALSE(position->has_liquidity());

    SECTION("Ids are distinct") {
        PositionId other = pool.open_position(tx(1), -10, 10);
        REQUIRE(other != id);
    }

    SECTION("Ends must have a price") {
        Pool wide(pool_config(10000, 0));
        REQUIRE(error_code([&] { wide.open_position(tx(1), 40, 50); }) == ErrorCode::InvalidBinRange);
        REQUIRE(error_code([&] { wide.open_position(tx(1), 40, 47); }) == ErrorCode::OK);
    }
}

TEST_CASE("Liquidity round trip", "[position]") {
    Pool pool(pool_config(25, 0));
    PositionId first = pool.open_position(tx(1), -5, 5);

    LiquidityResult added = pool.add_liquidity(tx(1), first, {BinAmount{0, 1000, 1000}});
    REQUIRE(added.amounts == Amounts{1000, 1000});
    REQUIRE(added.shares.size() == 1);
    REQUIRE(added.shares[0] == 2000);  // x at price 1 plus y
    REQUIRE(pool.get_bin(0).liquidity_supply == 2000);

    SECTION("Sole holder gets everything back") {
        LiquidityResult removed = pool.remove_liquidity(tx(2), first, {BinShares{0, 2000}});
        REQUIRE(removed.amounts == Amounts{1000, 1000});
        REQUIRE(pool.bin_reserves(0) == Amounts{0, 0});
        REQUIRE(pool.balances() == Amounts{0, 0});
    }

    SECTION("Later deposits mint pro rata") {
        const Address bob = address(2);
        PositionId second = pool.open_position(tx(2, bob), 0, 0);
        LiquidityResult more = pool.add_liquidity(tx(2, bob), second, {BinAmount{0, 500, 500}});
        REQUIRE(more.shares[0] == 1000);

        LiquidityResult removed = pool.remove_liquidity(tx(3, bob), second, {BinShares{0, 1000}});
        REQUIRE(removed.amounts == Amounts{500, 500});
    }

    SECTION("Proportional deposit at a fractional price loses at most one unit") {
        PositionId base = pool.open_position(tx(2), 7, 7);
        pool.add_liquidity(tx(2), base, {BinAmount{7, 1000, 3000}});

        const Address bob = address(2);
        PositionId second = pool.open_position(tx(2, bob), 7, 7);
        LiquidityResult more = pool.add_liquidity(tx(2, bob), second, {BinAmount{7, 100, 300}});
        LiquidityResult back = pool.remove_liquidity(tx(3, bob), second,
                                                     {BinShares{7, more.shares[0]}});
        REQUIRE(back.amounts.amount_x <= 100);
        REQUIRE(back.amounts.amount_x >= 99);
        REQUIRE(back.amounts.amount_y <= 300);
        REQUIRE(back.amounts.amount_y >= 299);
    }
}

TEST_CASE("Funded bins only take deposits in their own ratio", "[position]") {
    Pool pool(pool_config(25, 0));
    PositionId first = pool.open_position(tx(1), 0, 0);
    pool.add_liquidity(tx(1), first, {BinAmount{0, 1000, 1000}});

    const Address bob = address(2);
    PositionId second = pool.open_position(tx(2, bob), 0, 0);

    SECTION("One-sided deposit into a two-sided bin mints nothing") {
        REQUIRE(error_code([&] {
            pool.add_liquidity(tx(2, bob), second, {BinAmount{0, 0, 1000}});
        }) == ErrorCode::Underflow);
        REQUIRE(pool.bin_reserves(0) == Amounts{1000, 1000});
        REQUIRE(pool.balances() == Amounts{1000, 1000});
    }

    SECTION("Surplus of one token stays with the depositor") {
        LiquidityResult added = pool.add_liquidity(tx(2, bob), second, {BinAmount{0, 1000, 300}});
        REQUIRE(added.amounts == Amounts{300, 300});
        REQUIRE(added.shares[0] == 600);
        REQUIRE(pool.bin_reserves(0) == Amounts{1300, 1300});
        REQUIRE(pool.balances() == Amounts{1300, 1300});

        LiquidityResult back = pool.remove_liquidity(tx(3, bob), second,
                                                     {BinShares{0, added.shares[0]}});
        REQUIRE(back.amounts == Amounts{300, 300});
    }

    SECTION("Round trip after a swap moved the bin's ratio") {
        pool.swap_exact_in(tx(1000), 400, Direction::XtoY);
        Amounts reserves = pool.bin_reserves(0);
        REQUIRE(reserves.amount_x > 1000);
        REQUIRE(reserves.amount_y < 1000);

        LiquidityResult added = pool.add_liquidity(tx(1001, bob), second, {BinAmount{0, 500, 500}});
        REQUIRE(added.amounts.amount_x <= 500);
        REQUIRE(added.amounts.amount_y < 500);

        LiquidityResult back = pool.remove_liquidity(tx(1002, bob), second,
                                                     {BinShares{0, added.shares[0]}});
        REQUIRE(back.amounts.amount_x <= added.amounts.amount_x);
        REQUIRE(back.amounts.amount_x + 1 >= added.amounts.amount_x);
        REQUIRE(back.amounts.amount_y <= added.amounts.amount_y);
        REQUIRE(back.amounts.amount_y + 1 >= added.amounts.amount_y);
    }

    SECTION("One-sided bins keep taking one-sided deposits") {
        PositionId upper = pool.open_position(tx(2, bob), 1, 1);
        pool.add_liquidity(tx(2, bob), upper, {BinAmount{1, 0, 700}});
        LiquidityResult more = pool.add_liquidity(tx(2, bob), upper, {BinAmount{1, 0, 300}});
        REQUIRE(more.amounts == Amounts{0, 300});
        REQUIRE(more.shares[0] == 300);
        REQUIRE(pool.bin_reserves(1) == Amounts{0, 1000});
    }
}

TEST_CASE("Liquidity operations are all or nothing", "[position]") {
    Pool pool(pool_config(25, 0));
    PositionId id = pool.open_position(tx(1), 0, 3);

    SECTION("One bad bin rejects the whole deposit") {
        REQUIRE(error_code([&] {
            pool.add_liquidity(tx(1), id, {BinAmount{0, 10, 10}, BinAmount{4, 10, 10}});
        }) == ErrorCode::InvalidBinRange);
        REQUIRE(pool.bin_reserves(0) == Amounts{0, 0});
        REQUIRE(pool.balances() == Amounts{0, 0});
    }

    SECTION("Deposit that mints nothing") {
        REQUIRE(error_code([&] { pool.add_liquidity(tx(1), id, {BinAmount{1, 0, 0}}); })
                == ErrorCode::Underflow);
    }

    SECTION("Burning more than held") {
        pool.add_liquidity(tx(1), id, {BinAmount{0, 10, 10}});
        REQUIRE(error_code([&] { pool.remove_liquidity(tx(2), id, {BinShares{0, 21}}); })
                == ErrorCode::Underflow);
        REQUIRE(pool.bin_reserves(0) == Amounts{10, 10});
        REQUIRE(pool.get_position(id)->share_at(0) == 20);
    }
}

TEST_CASE("Only the owner manages a position", "[position]") {
    Pool pool(pool_config(25, 0));
    PositionId id = pool.open_position(tx(1), 0, 0);
    const Address mallory = address(66);

    REQUIRE(error_code([&] { pool.add_liquidity(tx(1, mallory), id, {BinAmount{0, 1, 1}}); })
            == ErrorCode::Unauthorized);
    REQUIRE(error_code([&] { pool.collect_fee(tx(1, mallory), id); }) == ErrorCode::Unauthorized);
    REQUIRE(error_code([&] { pool.close_position(tx(1, mallory), id); }) == ErrorCode::Unauthorized);
    REQUIRE(error_code([&] { pool.collect_fee(tx(1), 999); }) == ErrorCode::PositionNotFound);
    REQUIRE_FALSE(pool.position_info(999, 1).has_value());
}

TEST_CASE("Fees are paid once", "[position]") {
    // Swap of 100000 X at 0.2%: 200 fee, 20 to the protocol, 180 to LPs
    Pool pool(pool_config(100, 5));
    PositionId id = seed_y(pool, 5, 5, 1000000);
    pool.swap_exact_in(tx(1000), 100000, Direction::XtoY);
    REQUIRE(pool.protocol_fees().amount_x == 20);

    std::optional<PositionInfo> info = pool.position_info(id, 1000);
    REQUIRE(info.has_value());
    REQUIRE(info->fee_owed_x >= 179);
    REQUIRE(info->fee_owed_x <= 180);
    REQUIRE(info->fee_owed_y == 0);
    REQUIRE(info->bins.size() == 1);
    REQUIRE(info->bins[0].bin_id == 5);
    REQUIRE(info->bins[0].fee_growth_x_snapshot == 0);

    SECTION("Collecting twice pays nothing the second time") {
        Amounts first = pool.collect_fee(tx(1001), id);
        REQUIRE(first.amount_x == info->fee_owed_x);
        REQUIRE(first.amount_y == 0);

        Amounts second = pool.collect_fee(tx(1002), id);
        REQUIRE(second == Amounts{0, 0});
    }

    SECTION("Adding liquidity realizes fees without paying them twice") {
        // The swap left X and Y in the bin, deposit in that ratio
        Amounts reserves = pool.bin_reserves(5);
        LiquidityResult added = pool.add_liquidity(
            tx(1001), id, {BinAmount{5, reserves.amount_x / 10, reserves.amount_y / 10}});
        REQUIRE(added.shares[0] > 0);
        REQUIRE(pool.get_position(id)->fee_owed_x == info->fee_owed_x);

        Amounts collected = pool.collect_fee(tx(1002), id);
        REQUIRE(collected.amount_x == info->fee_owed_x);
        REQUIRE(pool.collect_fee(tx(1003), id) == Amounts{0, 0});
    }

    SECTION("Closing pays liquidity and fees together") {
        Amounts reserves = pool.bin_reserves(5);
        CloseResult closed = pool.close_position(tx(1001), id);
        REQUIRE(closed.amounts.amount_x == reserves.amount_x + info->fee_owed_x);
        REQUIRE(closed.amounts.amount_y == reserves.amount_y);
        REQUIRE_FALSE(pool.get_position(id).has_value());
        REQUIRE(pool.bin_reserves(5) == Amounts{0, 0});
    }
}

TEST_CASE("Shareholders split a bin's fees pro rata", "[position]") {
    Pool pool(pool_config(100, 5));
    const Address alice = address(1);
    const Address bob = address(2);

    PositionId a = pool.open_position(tx(1, alice), 5, 5);
    PositionId b = pool.open_position(tx(1, bob), 5, 5);
    pool.add_liquidity(tx(1, alice), a, {BinAmount{5, 0, 1000000}});
    pool.add_liquidity(tx(1, bob), b, {BinAmount{5, 0, 1000000}});

    pool.swap_exact_in(tx(1000), 100000, Direction::XtoY);

    Amounts fa = pool.collect_fee(tx(1001, alice), a);
    Amounts fb = pool.collect_fee(tx(1001, bob), b);
    REQUIRE(fa.amount_x >= 89);
    REQUIRE(fa.amount_x <= 90);
    REQUIRE(fa.amount_x == fb.amount_x);
    REQUIRE(fa.amount_x + fb.amount_x <= 180);
}
