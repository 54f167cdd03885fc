// Component setters keep total_frames as the single source of truth
#include <catch2/catch_test_macros.hpp>
#include "timecode/timecode.hpp"

using em::timecode::Timecode;
using em::timecode::RangeError;
using em::timecode::ParseError;

namespace {

void require_components(const Timecode& tc, int64_t h, int64_t m, int64_t s, int64_t f) {
    REQUIRE(tc.hours() == h);
    REQUIRE(tc.minutes() == m);
    REQUIRE(tc.seconds() == s);
    REQUIRE(tc.frames() == f);
    REQUIRE(tc.total_frames() == ((h * 60 + m) * 60 + s) * tc.fps() + f);
}

} // namespace

TEST_CASE("Setting one component holds the others", "[timecode][components]") {
    auto tc = Timecode::parse("01:02:03:04", {24});

    tc.set_seconds(45);
    require_components(tc, 1, 2, 45, 4);

    tc.set_minutes(59);
    require_components(tc, 1, 59, 45, 4);

    tc.set_frames(23);
    require_components(tc, 1, 59, 45, 23);

    tc.set_hours(0);
    require_components(tc, 0, 59, 45, 23);

    tc.set_hours(48);
    require_components(tc, 48, 59, 45, 23);
    REQUIRE(tc.timecode() == "48:59:45:23");
}

TEST_CASE("Setting a component to zero", "[timecode][components]") {
    auto tc = Timecode::parse("00:00:05:04", {25});
    tc.set_seconds(0);
    REQUIRE(tc.total_frames() == 4);
    tc.set_frames(0);
    REQUIRE(tc.total_frames() == 0);
}

TEST_CASE("Out of range component values are rejected and leave the timecode unchanged", "[timecode][components]") {
    auto tc = Timecode::parse("00:00:05:04", {24});
    const auto before = tc.total_frames();

    REQUIRE_THROWS_AS(tc.set_seconds(75), RangeError);
    REQUIRE(tc.total_frames() == before);

    REQUIRE_THROWS_AS(tc.set_minutes(60), RangeError);
    REQUIRE_THROWS_AS(tc.set_minutes(70), RangeError);
    REQUIRE_THROWS_AS(tc.set_frames(24), RangeError);
    REQUIRE_THROWS_AS(tc.set_frames(-1), RangeError);
    REQUIRE_THROWS_AS(tc.set_seconds(-1), RangeError);
    REQUIRE_THROWS_AS(tc.set_hours(-1), RangeError);
    REQUIRE(tc.total_frames() == before);
    REQUIRE(tc.timecode() == "00:00:05:04");
}

TEST_CASE("Hour overflow of the frame counter is a range error", "[timecode][components]") {
    auto tc = Timecode::parse("00:00:00:01", {24});
    REQUIRE_THROWS_AS(tc.set_hours(INT64_MAX / 1000), RangeError);
    REQUIRE(tc.total_frames() == 1);
}

TEST_CASE("Frame range follows the timecode's own rate", "[timecode][components]") {
    auto pal = Timecode::parse("00:00:00:00", {25});
    REQUIRE_NOTHROW(pal.set_frames(24));
    REQUIRE(pal.frames() == 24);

    auto hfr = Timecode::parse("00:00:00:00", {60});
    REQUIRE_NOTHROW(hfr.set_frames(59));
    REQUIRE_THROWS_AS(hfr.set_frames(60), RangeError);
}

TEST_CASE("Set timecode re-parses at the same rate", "[timecode][components]") {
    auto tc = Timecode::parse("00:00:00:00", {30});
    tc.set_timecode("00:01:00:15");
    REQUIRE(tc.total_frames() == 60 * 30 + 15);
    REQUIRE(tc.fps() == 30);

    REQUIRE_THROWS_AS(tc.set_timecode("00:01:00:30"), RangeError);
    REQUIRE_THROWS_AS(tc.set_timecode("garbage"), ParseError);
    REQUIRE(tc.timecode() == "00:01:00:15");
}

TEST_CASE("Components recompute after every mutation", "[timecode][components]") {
    // Cross the hour boundary, then edit the result
    auto tc = Timecode::from_total_frames(24 * 3600 - 1, {24});
    require_components(tc, 0, 59, 59, 23);
    tc += Timecode::from_total_frames(1, {24});
    require_components(tc, 1, 0, 0, 0);
    tc.set_frames(12);
    require_components(tc, 1, 0, 0, 12);
}
