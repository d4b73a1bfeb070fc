// ==============================================================================
// Layer 0: Core Utility Tests - Crossfade Utilities
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <rhythmonics/dsp/core/crossfade_utils.h>

#include <cmath>

using Catch::Approx;
using namespace Rhythmonics::DSP;

TEST_CASE("equalPowerGains endpoints and midpoint", "[crossfade_utils]") {
    float fadeOut = 0.0f;
    float fadeIn = 0.0f;

    SECTION("position 0 is all outgoing") {
        equalPowerGains(0.0f, fadeOut, fadeIn);
        REQUIRE(fadeOut == Approx(1.0f));
        REQUIRE(fadeIn == Approx(0.0f).margin(1e-6));
    }

    SECTION("position 1 is all incoming") {
        equalPowerGains(1.0f, fadeOut, fadeIn);
        REQUIRE(fadeOut == Approx(0.0f).margin(1e-6));
        REQUIRE(fadeIn == Approx(1.0f));
    }

    SECTION("position 0.5 is -3 dB on both sides") {
        const auto [out, in] = equalPowerGains(0.5f);
        REQUIRE(out == Approx(0.70710678f).margin(1e-5));
        REQUIRE(in == Approx(0.70710678f).margin(1e-5));
    }
}

TEST_CASE("equalPowerGains keeps constant power", "[crossfade_utils]") {
    for (int i = 0; i <= 100; ++i) {
        const float position = static_cast<float>(i) / 100.0f;
        const auto [out, in] = equalPowerGains(position);
        REQUIRE(out * out + in * in == Approx(1.0f).margin(1e-5));
    }
}

TEST_CASE("logDomainBlend is linear in log frequency", "[crossfade_utils][regime]") {
    constexpr double kLow = 15.0;
    constexpr double kHigh = 40.0;

    SECTION("clamped outside the thresholds") {
        REQUIRE(logDomainBlend(1.0, kLow, kHigh) == 0.0f);
        REQUIRE(logDomainBlend(kLow, kLow, kHigh) == 0.0f);
        REQUIRE(logDomainBlend(kHigh, kLow, kHigh) == 1.0f);
        REQUIRE(logDomainBlend(1000.0, kLow, kHigh) == 1.0f);
    }

    SECTION("geometric mean of the thresholds is the midpoint") {
        const double mid = std::sqrt(kLow * kHigh);
        REQUIRE(logDomainBlend(mid, kLow, kHigh) == Approx(0.5f).margin(1e-6));
    }

    SECTION("monotonic across the transition") {
        float previous = 0.0f;
        for (double f = 10.0; f <= 50.0; f += 0.1) {
            const float blend = logDomainBlend(f, kLow, kHigh);
            REQUIRE(blend >= previous);
            previous = blend;
        }
    }

    SECTION("non-positive frequency returns 0") {
        REQUIRE(logDomainBlend(0.0, kLow, kHigh) == 0.0f);
        REQUIRE(logDomainBlend(-5.0, kLow, kHigh) == 0.0f);
    }
}

TEST_CASE("crossfadeIncrement", "[crossfade_utils]") {
    REQUIRE(crossfadeIncrement(10.0f, 44100.0) == Approx(1.0f / 441.0f));
    REQUIRE(crossfadeIncrement(0.0f, 44100.0) == 1.0f);
}
