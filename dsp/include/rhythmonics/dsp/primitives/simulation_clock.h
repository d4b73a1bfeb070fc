// ==============================================================================
// Layer 1: DSP Primitive - Simulation Clock
// ==============================================================================
// Converts wall-clock frame deltas into simulation time scaled by the global
// speed multiplier.
//
// Speed is sampled at the start of each tick: a setSpeed() call between two
// ticks changes how fast phase moves from the next tick on, and never
// rescales simulation time that has already elapsed. This is what keeps
// every oscillator's phase continuous across speed changes.
//
// Speed is bounded above as well as below: the phase advanced in one tick is
// speed * frame delta * frequency, and it has to stay well inside the range
// where a double still resolves a position within the cycle.
//
// Dependencies: Layer 0 engine_types.h, db_utils.h
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/db_utils.h>
#include <rhythmonics/dsp/core/engine_types.h>

#include <algorithm>

namespace Rhythmonics {
namespace DSP {

/// @brief Frame-driven clock with a continuously adjustable speed multiplier.
///
/// @par Thread Safety
/// Single-threaded. Owned and ticked by the simulation loop.
///
/// @code
/// SimulationClock clock;
/// clock.configure(0.25);
/// (void)clock.setSpeed(2.0);
/// double dtSim = clock.tick(1.0 / 60.0);  // 1/30 s of simulation time
/// @endcode
class SimulationClock {
public:
    /// Default longest accepted frame delta in seconds
    static constexpr double kDefaultMaxFrameDelta = 0.25;

    /// Default largest accepted speed multiplier
    static constexpr double kDefaultMaxSpeed = 1.0e6;

    SimulationClock() noexcept = default;

    /// @brief Set the longest frame delta accepted by tick() and the
    ///        largest speed accepted by setSpeed().
    /// Non-finite or non-positive values restore the defaults. A current
    /// speed above the new maximum is pulled down to it.
    void configure(double maxFrameDeltaSeconds, double maxSpeed = kDefaultMaxSpeed) noexcept {
        maxFrameDelta_ = (detail::isFinite(maxFrameDeltaSeconds) && maxFrameDeltaSeconds > 0.0)
            ? maxFrameDeltaSeconds
            : kDefaultMaxFrameDelta;
        maxSpeed_ = (detail::isFinite(maxSpeed) && maxSpeed > 0.0) ? maxSpeed : kDefaultMaxSpeed;
        speed_ = std::min(speed_, maxSpeed_);
    }

    /// @brief Change the speed multiplier, effective from the next tick.
    /// @return EngineError::InvalidSpeed (previous speed kept) if speed is
    ///         not finite, not strictly positive or above the maximum
    [[nodiscard]] EngineError setSpeed(double speed) noexcept {
        if (!detail::isFinite(speed) || speed <= 0.0 || speed > maxSpeed_) {
            return EngineError::InvalidSpeed;
        }
        speed_ = speed;
        return EngineError::None;
    }

    [[nodiscard]] double getSpeed() const noexcept { return speed_; }
    [[nodiscard]] double getMaxSpeed() const noexcept { return maxSpeed_; }

    /// @brief Freeze or release simulation time. Speed is left untouched.
    void setFrozen(bool frozen) noexcept { frozen_ = frozen; }

    [[nodiscard]] bool isFrozen() const noexcept { return frozen_; }

    /// @brief Advance by one frame.
    /// @param dtWallClock Wall-clock seconds since the previous frame.
    ///        Negative or non-finite deltas count as 0; deltas longer than
    ///        the configured maximum are clamped.
    /// @return Simulation seconds elapsed in this tick (dtWallClock * speed)
    double tick(double dtWallClock) noexcept {
        if (!detail::isFinite(dtWallClock) || dtWallClock <= 0.0) {
            lastTickSimulation_ = 0.0;
            return 0.0;
        }
        const double dtWall = std::min(dtWallClock, maxFrameDelta_);
        elapsedWall_ += dtWall;

        const double dtSim = frozen_ ? 0.0 : dtWall * speed_;
        elapsedSimulation_ += dtSim;
        lastTickSimulation_ = dtSim;
        return dtSim;
    }

    [[nodiscard]] double getElapsedWallSeconds() const noexcept { return elapsedWall_; }
    [[nodiscard]] double getElapsedSimulationSeconds() const noexcept { return elapsedSimulation_; }
    [[nodiscard]] double getLastTickSimulationSeconds() const noexcept { return lastTickSimulation_; }

    /// @brief Zero the elapsed counters. Speed and freeze state are kept.
    void reset() noexcept {
        elapsedWall_ = 0.0;
        elapsedSimulation_ = 0.0;
        lastTickSimulation_ = 0.0;
    }

private:
    double speed_ = 1.0;
    double maxFrameDelta_ = kDefaultMaxFrameDelta;
    double maxSpeed_ = kDefaultMaxSpeed;
    double elapsedWall_ = 0.0;
    double elapsedSimulation_ = 0.0;
    double lastTickSimulation_ = 0.0;
    bool frozen_ = false;
};

} // namespace DSP
} // namespace Rhythmonics
