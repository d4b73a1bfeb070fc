// ==============================================================================
// Layer 2: Processor - Oscillator
// ==============================================================================
// One ball bouncing around one regular polygon.
//
// The ball strikes a vertex `baseFrequency * ratio` times per simulated
// second; with the clock's speed applied that is the effective frequency
// heard and seen. Phase is an exact unbounded cycle accumulator: the integer
// part counts vertex strikes, the fractional part is the ball's progress
// along the current edge.
//
// Dependencies: Layer 0 phase_utils.h, engine_types.h
//               Layer 1 bounce_detector.h
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/engine_types.h>
#include <rhythmonics/dsp/core/phase_utils.h>
#include <rhythmonics/dsp/primitives/bounce_detector.h>

#include <algorithm>
#include <cstdint>

namespace Rhythmonics {
namespace DSP {

/// @brief Polygon side count for a ratio (the n-th overtone rides an n-gon).
[[nodiscard]] constexpr std::uint32_t polygonSidesForRatio(std::uint32_t ratio) noexcept {
    return std::max(ratio, kMinPolygonSides);
}

/// @brief Phase state and per-tick advance for one polygon/ball pair.
///
/// @par Thread Safety
/// Single-threaded; owned by an Ensemble on the simulation thread.
class Oscillator {
public:
    /// @brief Result of one advance() call
    struct Advance {
        double phase = 0.0;           ///< Phase after the tick, [0, 1)
        std::uint64_t crossings = 0;  ///< Vertices struck during the tick
    };

    Oscillator() noexcept = default;

    /// @brief (Re)initialize the oscillator.
    /// @param id Stable identifier
    /// @param ratio Frequency multiplier (validated by the caller)
    /// @param baseFrequencyHz Ensemble reference frequency
    /// @param seed Starting accumulator (cycle count numbers the vertices)
    void configure(OscillatorId id, std::uint32_t ratio, double baseFrequencyHz,
                   const CycleAccumulator& seed) noexcept {
        id_ = id;
        baseFrequency_ = baseFrequencyHz;
        active_ = true;
        setRatio(ratio, seed);
    }

    /// @brief Change the ratio and restart from seed.
    void setRatio(std::uint32_t ratio, const CycleAccumulator& seed) noexcept {
        ratio_ = ratio;
        sides_ = polygonSidesForRatio(ratio);
        accumulator_.seed(seed.fraction);
        accumulator_.cycles = seed.cycles;
    }

    void setActive(bool active) noexcept { active_ = active; }

    /// @brief Advance by a slice of simulation time.
    ///
    /// Moves the accumulator by `baseFrequency * ratio * dtSimulation`
    /// cycles (speed is already folded into dtSimulation) and records every
    /// vertex struck on the way.
    ///
    /// @param dtSimulation Simulation seconds in this tick (>= 0)
    /// @param events Receives the tick's bounce events (cleared first);
    ///        timestamps are in simulation seconds
    /// @return New phase and exact crossing count
    Advance advance(double dtSimulation, BounceBatch& events) noexcept {
        const double deltaCycles = getIntrinsicFrequency() * dtSimulation;
        BounceDetector::detect(accumulator_, deltaCycles, dtSimulation, id_, sides_, events);
        const std::uint64_t crossings = accumulator_.advance(deltaCycles);
        return {accumulator_.fraction, crossings};
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] OscillatorId getId() const noexcept { return id_; }
    [[nodiscard]] std::uint32_t getRatio() const noexcept { return ratio_; }
    [[nodiscard]] std::uint32_t getSides() const noexcept { return sides_; }
    [[nodiscard]] bool isActive() const noexcept { return active_; }
    [[nodiscard]] double getBaseFrequency() const noexcept { return baseFrequency_; }

    /// Phase within the current edge, [0, 1)
    [[nodiscard]] double getPhase() const noexcept { return accumulator_.fraction; }

    /// Vertex the ball most recently left, [0, sides)
    [[nodiscard]] std::uint32_t getVertex() const noexcept {
        return static_cast<std::uint32_t>(accumulator_.cycles % sides_);
    }

    /// Total vertices struck since configure()/setRatio()
    [[nodiscard]] std::uint64_t getBounceCount() const noexcept { return accumulator_.cycles; }

    [[nodiscard]] const CycleAccumulator& getAccumulator() const noexcept { return accumulator_; }

    /// Bounce rate at speed 1 (baseFrequency * ratio)
    [[nodiscard]] double getIntrinsicFrequency() const noexcept {
        return baseFrequency_ * static_cast<double>(ratio_);
    }

    /// Bounce rate at the given speed. The fundamental is formed first so
    /// that every oscillator scales the same value by its integer ratio.
    [[nodiscard]] double getEffectiveFrequency(double speed) const noexcept {
        return (baseFrequency_ * speed) * static_cast<double>(ratio_);
    }

private:
    CycleAccumulator accumulator_{};
    double baseFrequency_ = 1.0;
    OscillatorId id_ = kInvalidOscillatorId;
    std::uint32_t ratio_ = 1;
    std::uint32_t sides_ = kMinPolygonSides;
    bool active_ = true;
};

} // namespace DSP
} // namespace Rhythmonics
