// ==============================================================================
// PolyBLEP Residual - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/rhythmonics/dsp/core/polyblep.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <rhythmonics/dsp/core/polyblep.h>

using namespace Rhythmonics::DSP;
using Catch::Approx;

TEST_CASE("polyBlepResidual is zero away from the step", "[dsp][core][polyblep]") {
    constexpr double dt = 0.01;
    STATIC_REQUIRE(polyBlepResidual(0.5, dt) == 0.0);
    STATIC_REQUIRE(polyBlepResidual(0.02, dt) == 0.0);
    STATIC_REQUIRE(polyBlepResidual(0.98, dt) == 0.0);
}

TEST_CASE("polyBlepResidual meets the step at half height", "[dsp][core][polyblep]") {
    constexpr double dt = 0.01;

    SECTION("just after the step pulls down by one") {
        REQUIRE(polyBlepResidual(0.0, dt) == Approx(-1.0));
        REQUIRE(polyBlepResidual(dt * 0.5, dt) == Approx(-0.25));
    }

    SECTION("just before the step pushes up by one") {
        REQUIRE(polyBlepResidual(1.0 - 1e-12, dt) == Approx(1.0).margin(1e-6));
        REQUIRE(polyBlepResidual(1.0 - dt * 0.5, dt) == Approx(0.25));
    }

    SECTION("edges of the correction window are continuous") {
        REQUIRE(polyBlepResidual(dt - 1e-12, dt) == Approx(0.0).margin(1e-6));
        REQUIRE(polyBlepResidual(1.0 - dt + 1e-12, dt) == Approx(0.0).margin(1e-6));
    }
}

TEST_CASE("polyBlepResidual ignores a non-positive increment", "[dsp][core][polyblep]") {
    STATIC_REQUIRE(polyBlepResidual(0.0, 0.0) == 0.0);
    STATIC_REQUIRE(polyBlepResidual(0.0, -0.1) == 0.0);
}
