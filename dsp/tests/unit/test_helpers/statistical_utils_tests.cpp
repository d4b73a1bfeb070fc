// ==============================================================================
// Unit Tests: Statistical Utilities
// ==============================================================================
// Tests for the level and sanity measurements used throughout the DSP tests.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "test_helpers/statistical_utils.h"

#include <array>
#include <cmath>
#include <limits>
#include <vector>

using namespace Rhythmonics::DSP::TestUtils;
using Catch::Approx;

TEST_CASE("StatisticalUtils::computeMean - computes arithmetic mean", "[statistical-utils][mean]") {
    SECTION("mean of simple values") {
        std::array<float, 5> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
        REQUIRE(StatisticalUtils::computeMean(data.data(), data.size()) == Approx(3.0f).margin(1e-6f));
    }

    SECTION("mean of negative values") {
        std::array<float, 4> data = {-1.0f, -2.0f, -3.0f, -4.0f};
        REQUIRE(StatisticalUtils::computeMean(data.data(), data.size()) == Approx(-2.5f).margin(1e-6f));
    }

    SECTION("empty data returns zero") {
        REQUIRE(StatisticalUtils::computeMean(nullptr, 0) == 0.0f);
    }
}

TEST_CASE("StatisticalUtils::computeStdDev - computes sample standard deviation", "[statistical-utils][stddev]") {
    SECTION("stddev uses Bessel's correction (n-1 denominator)") {
        // {0, 4}: sample variance = 8
        std::array<float, 2> data = {0.0f, 4.0f};
        const float mean = StatisticalUtils::computeMean(data.data(), data.size());
        REQUIRE(StatisticalUtils::computeStdDev(data.data(), data.size(), mean)
                == Approx(std::sqrt(8.0f)).margin(1e-5f));
    }

    SECTION("single value has zero spread") {
        std::array<float, 1> data = {5.0f};
        REQUIRE(StatisticalUtils::computeStdDev(data.data(), data.size(), 5.0f) == 0.0f);
    }
}

TEST_CASE("StatisticalUtils::computeRMS and computePeak - level measurements", "[statistical-utils][level]") {
    SECTION("full-scale sine has RMS 1/sqrt(2)") {
        std::vector<float> sine(4800);
        for (size_t i = 0; i < sine.size(); ++i) {
            sine[i] = static_cast<float>(std::sin(2.0 * 3.14159265358979323846 * 100.0
                                                  * static_cast<double>(i) / 48000.0));
        }
        REQUIRE(StatisticalUtils::computeRMS(sine.data(), sine.size())
                == Approx(1.0f / std::sqrt(2.0f)).margin(1e-4f));
        REQUIRE(StatisticalUtils::computePeak(sine.data(), sine.size())
                == Approx(1.0f).margin(1e-4f));
    }

    SECTION("peak is the largest magnitude") {
        std::array<float, 4> data = {0.1f, -0.9f, 0.5f, 0.0f};
        REQUIRE(StatisticalUtils::computePeak(data.data(), data.size()) == 0.9f);
    }

    SECTION("empty data measures zero") {
        REQUIRE(StatisticalUtils::computeRMS(nullptr, 0) == 0.0f);
        REQUIRE(StatisticalUtils::computePeak(nullptr, 0) == 0.0f);
    }
}

TEST_CASE("StatisticalUtils::allFinite - detects NaN and infinity", "[statistical-utils][finite]") {
    std::array<float, 3> data = {0.0f, 1.0f, -1.0f};
    REQUIRE(StatisticalUtils::allFinite(data.data(), data.size()));

    data[1] = std::numeric_limits<float>::quiet_NaN();
    REQUIRE_FALSE(StatisticalUtils::allFinite(data.data(), data.size()));

    data[1] = -std::numeric_limits<float>::infinity();
    REQUIRE_FALSE(StatisticalUtils::allFinite(data.data(), data.size()));
}
