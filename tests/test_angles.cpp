#include <doctest/doctest.h>

#include "easel/canvas/angles.h"
#include "easel/errors.h"

#include <cmath>
#include <limits>

using easel::canvas::kNativeAngleUnitsPerTurn;
using easel::canvas::toNativeAngle;
using easel::canvas::toNativeArc;

namespace {
constexpr double kPi = 3.14159265358979323846;
}

TEST_CASE("native angles are exact at the quarter turns") {
    CHECK(toNativeAngle(0.0) == 0);
    CHECK(toNativeAngle(kPi / 2) == 90 * 16);
    CHECK(toNativeAngle(kPi) == 180 * 16);
    CHECK(toNativeAngle(3 * kPi / 2) == 270 * 16);
    CHECK(toNativeAngle(2 * kPi) == kNativeAngleUnitsPerTurn);
}

TEST_CASE("native angles round to the nearest sixteenth of a degree") {
    // 1 degree = 16 units
    CHECK(toNativeAngle(kPi / 180.0) == 16);
    CHECK(toNativeAngle(-kPi / 2) == -1440);
    // 0.03 degrees is under half a unit
    CHECK(toNativeAngle(0.03 * kPi / 180.0) == 0);
}

TEST_CASE("angle round trip through native units stays within half a unit") {
    for (int i = -32; i <= 32; i++) {
        double radians = i * kPi / 16.0 + 0.01;
        int native = toNativeAngle(radians);
        double back = native * 2.0 * kPi / kNativeAngleUnitsPerTurn;
        CHECK(std::fabs(back - radians) <= kPi / kNativeAngleUnitsPerTurn + 1e-12);
    }
}

TEST_CASE("arc sweep is negated") {
    auto arc = toNativeArc(0.0, kPi / 2);
    CHECK(arc.start == 0);
    CHECK(arc.sweep == -1440);

    arc = toNativeArc(kPi, kPi / 2);
    CHECK(arc.start == 2880);
    CHECK(arc.sweep == 1440);
}

TEST_CASE("angles that are not finite are rejected") {
    CHECK_THROWS_AS(toNativeAngle(std::numeric_limits<double>::quiet_NaN()), easel::ArgumentError);
    CHECK_THROWS_AS(toNativeAngle(std::numeric_limits<double>::infinity()), easel::ArgumentError);
    CHECK_THROWS_AS(toNativeArc(0.0, 1e20), easel::ArgumentError);
}
