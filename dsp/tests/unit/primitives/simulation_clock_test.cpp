// ==============================================================================
// Layer 1: DSP Primitive Tests - Simulation Clock
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <rhythmonics/dsp/primitives/simulation_clock.h>

#include <limits>

using Catch::Approx;
using namespace Rhythmonics::DSP;

TEST_CASE("SimulationClock scales wall time by speed", "[simulation_clock]") {
    SimulationClock clock;
    REQUIRE(clock.getSpeed() == 1.0);

    REQUIRE(clock.tick(1.0 / 60.0) == Approx(1.0 / 60.0));

    REQUIRE(clock.setSpeed(2.0) == EngineError::None);
    REQUIRE(clock.tick(1.0 / 60.0) == Approx(1.0 / 30.0));
    REQUIRE(clock.getLastTickSimulationSeconds() == Approx(1.0 / 30.0));
}

TEST_CASE("SimulationClock rejects invalid speeds and keeps the previous one", "[simulation_clock]") {
    SimulationClock clock;
    REQUIRE(clock.setSpeed(3.0) == EngineError::None);

    REQUIRE(clock.setSpeed(0.0) == EngineError::InvalidSpeed);
    REQUIRE(clock.setSpeed(-1.0) == EngineError::InvalidSpeed);
    REQUIRE(clock.setSpeed(std::numeric_limits<double>::quiet_NaN()) == EngineError::InvalidSpeed);
    REQUIRE(clock.setSpeed(std::numeric_limits<double>::infinity()) == EngineError::InvalidSpeed);

    REQUIRE(clock.getSpeed() == 3.0);
}

TEST_CASE("SimulationClock rejects speeds above its ceiling", "[simulation_clock]") {
    SimulationClock clock;
    REQUIRE(clock.getMaxSpeed() == SimulationClock::kDefaultMaxSpeed);
    REQUIRE(clock.setSpeed(1.0e21) == EngineError::InvalidSpeed);
    REQUIRE(clock.getSpeed() == 1.0);

    clock.configure(SimulationClock::kDefaultMaxFrameDelta, 100.0);
    REQUIRE(clock.setSpeed(100.0) == EngineError::None);
    REQUIRE(clock.setSpeed(100.5) == EngineError::InvalidSpeed);
    REQUIRE(clock.getSpeed() == 100.0);

    SECTION("lowering the ceiling pulls the speed down") {
        clock.configure(SimulationClock::kDefaultMaxFrameDelta, 10.0);
        REQUIRE(clock.getSpeed() == 10.0);
        REQUIRE(clock.tick(0.1) == Approx(1.0));
    }
}

TEST_CASE("SimulationClock speed change applies from the next tick only", "[simulation_clock]") {
    SimulationClock clock;
    REQUIRE(clock.tick(0.1) == Approx(0.1));
    const double elapsedBefore = clock.getElapsedSimulationSeconds();

    REQUIRE(clock.setSpeed(3.0) == EngineError::None);
    // Changing speed does not move simulation time
    REQUIRE(clock.getElapsedSimulationSeconds() == elapsedBefore);

    REQUIRE(clock.tick(0.1) == Approx(0.3));
    REQUIRE(clock.getElapsedSimulationSeconds() == Approx(0.4));
    REQUIRE(clock.getElapsedWallSeconds() == Approx(0.2));
}

TEST_CASE("SimulationClock sanitizes frame deltas", "[simulation_clock]") {
    SimulationClock clock;

    SECTION("negative and non-finite deltas count as zero") {
        REQUIRE(clock.tick(-0.5) == 0.0);
        REQUIRE(clock.tick(std::numeric_limits<double>::quiet_NaN()) == 0.0);
        REQUIRE(clock.tick(std::numeric_limits<double>::infinity()) == 0.0);
        REQUIRE(clock.getElapsedWallSeconds() == 0.0);
    }

    SECTION("stalled frame is clamped to the maximum delta") {
        REQUIRE(clock.tick(5.0) == Approx(SimulationClock::kDefaultMaxFrameDelta));
    }

    SECTION("configured maximum") {
        clock.configure(0.05);
        REQUIRE(clock.setSpeed(2.0) == EngineError::None);
        REQUIRE(clock.tick(1.0) == Approx(0.1));
    }
}

TEST_CASE("SimulationClock freeze stops simulation time only", "[simulation_clock]") {
    SimulationClock clock;
    REQUIRE(clock.setSpeed(4.0) == EngineError::None);
    clock.setFrozen(true);

    REQUIRE(clock.isFrozen());
    REQUIRE(clock.tick(0.1) == 0.0);
    REQUIRE(clock.getElapsedWallSeconds() == Approx(0.1));
    REQUIRE(clock.getElapsedSimulationSeconds() == 0.0);
    REQUIRE(clock.getSpeed() == 4.0);

    clock.setFrozen(false);
    REQUIRE(clock.tick(0.1) == Approx(0.4));
}

TEST_CASE("SimulationClock reset keeps speed", "[simulation_clock]") {
    SimulationClock clock;
    REQUIRE(clock.setSpeed(2.0) == EngineError::None);
    (void)clock.tick(0.2);
    clock.reset();
    REQUIRE(clock.getElapsedSimulationSeconds() == 0.0);
    REQUIRE(clock.getElapsedWallSeconds() == 0.0);
    REQUIRE(clock.getSpeed() == 2.0);
}
