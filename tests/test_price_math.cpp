// dlmm - Bin Price Math Tests

#include <catch2/catch.hpp>
#include "dlmm/price_math.hpp"
#include "test_util.hpp"

#include <algorithm>
#include <vector>

using namespace dlmm;
using dlmm::test::error_code;

namespace {

// Edges of the id range plus a stride through the middle
std::vector<int32_t> sample_ids(uint16_t step) {
    int32_t hi = price_math::max_bin_id(step);
    int32_t lo = price_math::min_bin_id(step);
    std::vector<int32_t> ids;
    for (int32_t id = lo; id <= hi && id < lo + 40; ++id) ids.push_back(id);
    for (int32_t id = -40; id <= 40; ++id) {
        if (id >= lo && id <= hi) ids.push_back(id);
    }
    for (int32_t id = hi; id >= lo && id > hi - 40; --id) ids.push_back(id);
    int32_t stride = hi / 97 + 1;
    for (int32_t id = lo; id <= hi; id += stride) ids.push_back(id);
    return ids;
}

} // namespace

TEST_CASE("Price of well known bins", "[price]") {
    REQUIRE(price_math::price_from_bin_id(0, 25) == Q64_ONE);
    REQUIRE(price_math::price_from_bin_id(1, 100) == Q64_ONE + Q64_ONE / 100);
    REQUIRE(price_math::price_from_bin_id(3, 10000) == 8 * Q64_ONE);
    REQUIRE(price_math::price_from_bin_id(-3, 10000) == Q64_ONE / 8);
    REQUIRE(price_math::base_for_step(50) == Q64_ONE + Q64_ONE / 200);
}

TEST_CASE("Bin id range per step", "[price]") {
    SECTION("Doubling step stops below 2^48") {
        REQUIRE(price_math::max_bin_id(10000) == 47);
        REQUIRE(price_math::min_bin_id(10000) == -47);
    }

    SECTION("Smallest step stays inside the hard bound") {
        int32_t hi = price_math::max_bin_id(1);
        REQUIRE(hi > 300000);
        REQUIRE(hi <= MAX_BIN_ID);
    }

    SECTION("Ids past the range overflow") {
        int32_t hi = price_math::max_bin_id(25);
        REQUIRE(price_math::is_valid_bin_id(hi, 25));
        REQUIRE_FALSE(price_math::is_valid_bin_id(hi + 1, 25));
        REQUIRE(error_code([&] { price_math::price_from_bin_id(hi + 1, 25); }) == ErrorCode::Overflow);
        REQUIRE(error_code([&] { price_math::price_from_bin_id(-hi - 1, 25); }) == ErrorCode::Overflow);
    }

    SECTION("Invalid steps are configuration errors") {
        REQUIRE(error_code([] { price_math::price_from_bin_id(0, 0); }) == ErrorCode::InvalidConfig);
        REQUIRE(error_code([] { price_math::max_bin_id(10001); }) == ErrorCode::InvalidConfig);
    }
}

TEST_CASE("Prices increase strictly with the bin id", "[price]") {
    for (uint16_t step : {uint16_t(1), uint16_t(25), uint16_t(100), uint16_t(10000)}) {
        int32_t hi = price_math::max_bin_id(step);
        int32_t lo = price_math::min_bin_id(step);

        U128 prev = price_math::price_from_bin_id(lo, step);
        for (int32_t id = lo + 1; id <= hi && id <= lo + 200; ++id) {
            U128 next = price_math::price_from_bin_id(id, step);
            REQUIRE(next > prev);
            prev = next;
        }

        const int32_t start = std::max(lo, -100);
        prev = price_math::price_from_bin_id(start, step);
        for (int32_t id = start + 1; id <= 100 && id <= hi; ++id) {
            U128 next = price_math::price_from_bin_id(id, step);
            REQUIRE(next > prev);
            prev = next;
        }
    }
}

TEST_CASE("Bin id survives a round trip through its price", "[price]") {
    for (uint16_t step : {uint16_t(1), uint16_t(25), uint16_t(100), uint16_t(10000)}) {
        for (int32_t id : sample_ids(step)) {
            U128 price = price_math::price_from_bin_id(id, step);
            REQUIRE(price_math::bin_id_from_price(price, step) == id);
        }
    }
}

TEST_CASE("Prices between bins map down", "[price]") {
    U128 p10 = price_math::price_from_bin_id(10, 25);
    U128 p11 = price_math::price_from_bin_id(11, 25);
    REQUIRE(price_math::bin_id_from_price(p10 + 1, 25) == 10);
    REQUIRE(price_math::bin_id_from_price(p11 - 1, 25) == 10);

    REQUIRE(error_code([] { price_math::bin_id_from_price(0, 25); }) == ErrorCode::Overflow);
    REQUIRE(error_code([] { price_math::bin_id_from_price(~U128(0), 25); }) == ErrorCode::Overflow);
}

TEST_CASE("Amount conversions round as asked", "[price]") {
    const U128 two = 2 * Q64_ONE;
    const U128 three = 3 * Q64_ONE;

    REQUIRE(price_math::x_to_y(100, two) == 200);
    REQUIRE(price_math::y_to_x(200, two) == 100);
    REQUIRE(price_math::y_to_x(1, three) == 0);
    REQUIRE(price_math::y_to_x_up(1, three) == 1);
    REQUIRE(price_math::x_to_y(1, Q64_ONE / 3) == 0);
    REQUIRE(price_math::x_to_y_up(1, Q64_ONE / 3) == 1);
    REQUIRE(price_math::bin_value(10, 5, two) == 25);
}
