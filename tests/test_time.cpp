#include <catch2/catch_test_macros.hpp>
#include "core/time.hpp"
#include <limits>

static int64_t rescaled(int64_t frames, em::TimeRational from, em::TimeRational to) {
    int64_t out = -1;
    REQUIRE(em::rescale_frames(frames, from, to, out));
    return out;
}

TEST_CASE("Make time handles negative denominator", "[time]") {
    using namespace em;
    auto t = make_time(1, -2);
    REQUIRE(t.num == -1);
    REQUIRE(t.den == 2);
}

TEST_CASE("Make time reduces fractions", "[time]") {
    using namespace em;
    auto t = make_time(48, 2);
    REQUIRE(t.num == 24);
    REQUIRE(t.den == 1);
}

TEST_CASE("Normalize rational", "[time]") {
    using namespace em;
    TimeRational r{48000, 2002};
    auto n = normalize(r);
    REQUIRE(n.num == 24000);
    REQUIRE(n.den == 1001);

    TimeRational r2{-300, -600}; // double negative
    auto n2 = normalize(r2);
    REQUIRE(n2.num == 1);
    REQUIRE(n2.den == 2);

    TimeRational r3{0, 500};
    auto n3 = normalize(r3);
    REQUIRE(n3.num == 0);
    REQUIRE(n3.den == 1); // canonical zero
}

TEST_CASE("Rate validity", "[time]") {
    using namespace em;
    REQUIRE(is_valid_rate({24, 1}));
    REQUIRE(is_valid_rate({30000, 1001}));
    REQUIRE(is_valid_rate({-24, -1}));
    REQUIRE_FALSE(is_valid_rate({0, 1}));
    REQUIRE_FALSE(is_valid_rate({-25, 1}));
    REQUIRE_FALSE(is_valid_rate({24, 0}));
}

TEST_CASE("Nominal fps rounds fractional rates", "[time]") {
    using namespace em;
    REQUIRE(nominal_fps({24, 1}) == 24);
    REQUIRE(nominal_fps({50, 2}) == 25);
    REQUIRE(nominal_fps({24000, 1001}) == 24);
    REQUIRE(nominal_fps({30000, 1001}) == 30);
    REQUIRE(nominal_fps({60000, 1001}) == 60);
}

TEST_CASE("Rescale preserves elapsed time", "[time]") {
    using namespace em;
    // 32 frames at 16 fps is two seconds, 48 frames at 24 fps
    REQUIRE(rescaled(32, {16}, {24}) == 48);
    REQUIRE(rescaled(48, {24}, {16}) == 32);
    REQUIRE(rescaled(25, {25}, {30}) == 30);
    REQUIRE(rescaled(0, {25}, {30}) == 0);
    REQUIRE(rescaled(1234, {24}, {48, 2}) == 1234);
}

TEST_CASE("Rescale rounds half away from zero", "[time]") {
    using namespace em;
    REQUIRE(rescaled(1, {48}, {24}) == 1);  // 0.5 -> 1
    REQUIRE(rescaled(3, {48}, {24}) == 2);  // 1.5 -> 2
    REQUIRE(rescaled(5, {48}, {24}) == 3);  // 2.5 -> 3
    REQUIRE(rescaled(1, {30}, {24}) == 1);  // 0.8 -> 1
    REQUIRE(rescaled(1, {25}, {10}) == 0);  // 0.4 -> 0
    REQUIRE(rescaled(-3, {48}, {24}) == -2);
}

TEST_CASE("Rescale with fractional rates", "[time]") {
    using namespace em;
    // 1000 frames at 24000/1001 fps and 1001 frames at 24 fps both last 41.7083 s
    REQUIRE(rescaled(1000, {24000, 1001}, {24}) == 1001);
    REQUIRE(rescaled(1001, {24}, {24000, 1001}) == 1000);
}

TEST_CASE("Rescale reports results that do not fit", "[time]") {
    using namespace em;
    const int64_t big = std::numeric_limits<int64_t>::max() / 2;
    int64_t out = 7;
    REQUIRE_FALSE(rescale_frames(big, {1}, {1000}, out));
    REQUIRE_FALSE(rescale_frames(big, {1}, {3}, out));
    REQUIRE_FALSE(rescale_frames(std::numeric_limits<int64_t>::min(), {1}, {2}, out));
    REQUIRE(out == 7);
    // product overflows int64 but the result fits
    REQUIRE(rescale_frames(std::numeric_limits<int64_t>::max() - 10, {3}, {2}, out));
    REQUIRE(out > 0);
}

TEST_CASE("Nominal fps near the int64 limit", "[time]") {
    using namespace em;
    const int64_t max = std::numeric_limits<int64_t>::max();
    REQUIRE(nominal_fps({max, 1}) == max);
    REQUIRE(nominal_fps({max, 2}) == max / 2);
}

TEST_CASE("Compare frames is exact and symmetric", "[time]") {
    using namespace em;
    REQUIRE(compare_frames(24, {24}, 16, {16}) == 0);
    REQUIRE(compare_frames(16, {16}, 24, {24}) == 0);
    REQUIRE(compare_frames(1, {24}, 1, {48}) > 0);
    REQUIRE(compare_frames(1, {48}, 1, {24}) < 0);
    REQUIRE(compare_frames(1001, {24}, 1000, {24000, 1001}) == 0);
}

TEST_CASE("Rate to string", "[time]") {
    using namespace em;
    REQUIRE(rate_to_string({24}) == "24");
    REQUIRE(rate_to_string({50, 2}) == "25");
    REQUIRE(rate_to_string({30000, 1001}) == "30000/1001");
}
