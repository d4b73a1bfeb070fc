// ==============================================================================
// Layer 1: DSP Primitive Tests - DC Blocker
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <rhythmonics/dsp/primitives/dc_blocker.h>

#include <cmath>
#include <vector>

using Catch::Approx;
using namespace Rhythmonics::DSP;

TEST_CASE("DCBlocker passes input through before prepare", "[dc_blocker]") {
    DCBlocker blocker;
    REQUIRE_FALSE(blocker.isPrepared());
    REQUIRE(blocker.process(0.5f) == 0.5f);
    REQUIRE(blocker.process(-1.0f) == -1.0f);
}

TEST_CASE("DCBlocker removes a constant offset", "[dc_blocker]") {
    DCBlocker blocker;
    blocker.prepare(44100.0, 10.0f);
    REQUIRE(blocker.isPrepared());
    REQUIRE(blocker.getSampleRate() == 44100.0);

    float y = 0.0f;
    for (int i = 0; i < 44100; ++i) {
        y = blocker.process(0.5f);
    }
    REQUIRE(std::abs(y) < 0.01f);
}

TEST_CASE("DCBlocker passes audio-band signals", "[dc_blocker]") {
    DCBlocker blocker;
    blocker.prepare(44100.0, 10.0f);

    std::vector<float> buffer(44100);
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = std::sin(2.0f * 3.14159265f * 1000.0f * static_cast<float>(i) / 44100.0f);
    }
    blocker.processBlock(buffer.data(), buffer.size());

    float peak = 0.0f;
    for (size_t i = buffer.size() / 2; i < buffer.size(); ++i) {
        peak = std::max(peak, std::abs(buffer[i]));
    }
    REQUIRE(peak == Approx(1.0f).margin(0.01));
}

TEST_CASE("DCBlocker reset clears state", "[dc_blocker]") {
    DCBlocker blocker;
    blocker.prepare(48000.0);
    (void)blocker.process(1.0f);
    blocker.reset();
    REQUIRE(blocker.process(0.0f) == 0.0f);
}
