// ==============================================================================
// Unit Tests: Artifact Detection
// ==============================================================================
// Tests for the derivative-based click detector.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "test_helpers/artifact_detection.h"

#include <cmath>
#include <vector>

using namespace Rhythmonics::DSP::TestUtils;
using Catch::Approx;

namespace {

std::vector<float> makeSine(size_t numSamples, float frequency, float sampleRate) {
    std::vector<float> out(numSamples);
    for (size_t i = 0; i < numSamples; ++i) {
        out[i] = static_cast<float>(std::sin(2.0 * 3.14159265358979323846 * frequency
                                             * static_cast<double>(i) / sampleRate));
    }
    return out;
}

} // namespace

TEST_CASE("maxAbsDerivative bounds a clean sine by its slope", "[artifact-detection][derivative]") {
    const auto sine = makeSine(4800, 440.0f, 48000.0f);
    const float slope = 2.0f * 3.14159265f * 440.0f / 48000.0f;

    REQUIRE(maxAbsDerivative(sine.data(), sine.size()) <= slope * 1.001f);
    REQUIRE(maxAbsDerivative(sine.data(), sine.size()) > slope * 0.99f);

    SECTION("previous sample is included") {
        REQUIRE(maxAbsDerivative(sine.data(), sine.size(), 0.5f) >= 0.5f);
    }

    SECTION("null input measures zero") {
        REQUIRE(maxAbsDerivative(nullptr, 100) == 0.0f);
    }
}

TEST_CASE("findDiscontinuities locates and merges jumps", "[artifact-detection][clicks]") {
    auto sine = makeSine(4800, 100.0f, 48000.0f);

    SECTION("clean signal has no clicks") {
        REQUIRE(findDiscontinuities(sine.data(), sine.size(), 0.1f, 48000.0f).empty());
    }

    SECTION("an inserted step is found at its sample") {
        for (size_t i = 2400; i < sine.size(); ++i) {
            sine[i] += 0.5f;
        }
        const auto clicks = findDiscontinuities(sine.data(), sine.size(), 0.1f, 48000.0f);
        REQUIRE(clicks.size() == 1);
        REQUIRE(clicks[0].sampleIndex == 2400);
        REQUIRE(clicks[0].amplitude == Approx(0.5f).margin(0.02f));
        REQUIRE(clicks[0].timeSeconds == Approx(0.05f));
    }

    SECTION("a single-sample spike counts once") {
        sine[1000] += 1.0f;
        const auto clicks = findDiscontinuities(sine.data(), sine.size(), 0.1f, 48000.0f);
        REQUIRE(clicks.size() == 1);
        REQUIRE(clicks[0].sampleIndex == 1000);
    }

    SECTION("distant spikes stay separate") {
        sine[1000] += 1.0f;
        sine[3000] += 1.0f;
        REQUIRE(findDiscontinuities(sine.data(), sine.size(), 0.1f, 48000.0f).size() == 2);
    }
}
