// ==============================================================================
// Layer 2: Processor Tests - Oscillator
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <rhythmonics/dsp/processors/oscillator.h>

using Catch::Approx;
using namespace Rhythmonics::DSP;

TEST_CASE("polygonSidesForRatio rides the n-th overtone on an n-gon", "[oscillator]") {
    STATIC_REQUIRE(polygonSidesForRatio(1) == 3);
    STATIC_REQUIRE(polygonSidesForRatio(2) == 3);
    STATIC_REQUIRE(polygonSidesForRatio(3) == 3);
    STATIC_REQUIRE(polygonSidesForRatio(4) == 4);
    STATIC_REQUIRE(polygonSidesForRatio(7) == 7);
}

TEST_CASE("Oscillator configure", "[oscillator]") {
    Oscillator osc;
    osc.configure(5, 4, 1.0, CycleAccumulator{});

    REQUIRE(osc.getId() == 5);
    REQUIRE(osc.getRatio() == 4);
    REQUIRE(osc.getSides() == 4);
    REQUIRE(osc.isActive());
    REQUIRE(osc.getPhase() == 0.0);
    REQUIRE(osc.getVertex() == 0);
    REQUIRE(osc.getIntrinsicFrequency() == 4.0);
    REQUIRE(osc.getEffectiveFrequency(2.5) == Approx(10.0));
}

TEST_CASE("Oscillator advance counts every bounce", "[oscillator]") {
    Oscillator osc;
    osc.configure(1, 3, 1.0, CycleAccumulator{});
    BounceBatch events;

    std::uint64_t total = 0;
    for (int i = 0; i < 768; ++i) {  // 12 s at 1/64 s per tick
        total += osc.advance(1.0 / 64.0, events).crossings;
        REQUIRE(events.crossingCount <= 1);
    }
    REQUIRE(total == 36);
    REQUIRE(osc.getBounceCount() == 36);
    REQUIRE(osc.getPhase() == 0.0);
    REQUIRE(osc.getVertex() == 0);
}

TEST_CASE("Oscillator survives a tick far beyond any usable speed", "[oscillator]") {
    Oscillator osc;
    osc.configure(1, 2, 1.0, CycleAccumulator{});
    BounceBatch events;

    (void)osc.advance(0.25, events);
    const Oscillator::Advance result = osc.advance(1.0e21, events);

    REQUIRE(events.saturated);
    REQUIRE(events.eventCount == kMaxBounceEventsPerTick);
    REQUIRE(result.crossings == static_cast<std::uint64_t>(CycleAccumulator::kMaxStepCycles));
    REQUIRE(result.phase == Approx(0.5));
    REQUIRE(osc.getVertex() < osc.getSides());
}

TEST_CASE("Oscillator events are timed in simulation seconds", "[oscillator]") {
    Oscillator osc;
    CycleAccumulator seed;
    seed.fraction = 0.25;
    osc.configure(2, 2, 1.0, seed);

    BounceBatch events;
    const Oscillator::Advance result = osc.advance(1.0, events);

    REQUIRE(result.crossings == 2);
    REQUIRE(result.phase == Approx(0.25));
    REQUIRE(events.eventCount == 2);
    REQUIRE(events.events[0].timestampWithinTick == Approx(0.375));
    REQUIRE(events.events[1].timestampWithinTick == Approx(0.875));
    REQUIRE(events.events[0].oscillatorId == 2);
}

TEST_CASE("Oscillator vertex follows the cycle count modulo sides", "[oscillator]") {
    Oscillator osc;
    osc.configure(1, 5, 1.0, CycleAccumulator{});
    BounceBatch events;

    (void)osc.advance(7.0 / 5.0 + 0.01, events);  // 7 bounces
    REQUIRE(osc.getBounceCount() == 7);
    REQUIRE(osc.getVertex() == 2);
    REQUIRE(events.events[4].vertex == 0);
    REQUIRE(events.events[4].accent);
}

TEST_CASE("Oscillator ignores empty and negative ticks", "[oscillator]") {
    Oscillator osc;
    CycleAccumulator seed;
    seed.fraction = 0.4;
    osc.configure(1, 2, 1.0, seed);
    BounceBatch events;

    REQUIRE(osc.advance(0.0, events).crossings == 0);
    REQUIRE(osc.advance(-1.0, events).crossings == 0);
    REQUIRE(events.empty());
    REQUIRE(osc.getPhase() == Approx(0.4));
}

TEST_CASE("Oscillator setRatio re-seeds", "[oscillator]") {
    Oscillator osc;
    osc.configure(1, 2, 1.0, CycleAccumulator{});
    BounceBatch events;
    (void)osc.advance(0.3, events);

    CycleAccumulator seed;
    seed.cycles = 6;
    seed.fraction = 0.5;
    osc.setRatio(6, seed);

    REQUIRE(osc.getRatio() == 6);
    REQUIRE(osc.getSides() == 6);
    REQUIRE(osc.getPhase() == 0.5);
    REQUIRE(osc.getBounceCount() == 6);
    REQUIRE(osc.getVertex() == 0);
}

TEST_CASE("Oscillator active flag", "[oscillator]") {
    Oscillator osc;
    osc.configure(1, 1, 1.0, CycleAccumulator{});
    osc.setActive(false);
    REQUIRE_FALSE(osc.isActive());

    // Inactive oscillators keep moving
    BounceBatch events;
    REQUIRE(osc.advance(2.0, events).crossings == 2);
}
