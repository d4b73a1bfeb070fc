// ==============================================================================
// Layer 0: Core Utility - Phase Accumulator Utilities
// ==============================================================================
// Phase management shared by the simulation oscillators and the audio voices.
//
// Design decisions:
// - Phase is tracked as "unbounded cycles": an integer count of completed
//   cycles plus a fractional part in [0, 1). The pair is the exact unbounded
//   accumulator value, but the fractional part never grows, so sub-cycle
//   resolution does not decay over a long session the way a single double
//   accumulator would.
// - All phase math is double precision. Float phase drifts audibly within
//   minutes at audio rates.
// - Phase wrapping uses subtraction or floor, never std::fmod, so results
//   stay in [0, 1) for negative inputs as well.
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/db_utils.h>

#include <cmath>
#include <cstdint>

namespace Rhythmonics {
namespace DSP {

// =============================================================================
// Phase Utility Functions
// =============================================================================

/// @brief Calculate normalized phase increment from frequency and sample rate.
///
/// @param frequency Oscillator frequency in Hz
/// @param sampleRate Sample rate in Hz
/// @return frequency / sampleRate, or 0.0 if sampleRate is not positive.
[[nodiscard]] constexpr double calculatePhaseIncrement(
    double frequency,
    double sampleRate
) noexcept {
    if (sampleRate <= 0.0) {
        return 0.0;
    }
    return frequency / sampleRate;
}

/// @brief Wrap phase to [0, 1).
///
/// @param phase Phase value to wrap (any finite double value)
/// @return Phase wrapped to [0, 1)
///
/// @example
/// @code
/// double a = wrapPhase(1.3);   // returns 0.3
/// double b = wrapPhase(-0.2);  // returns 0.8
/// @endcode
[[nodiscard]] inline double wrapPhase(double phase) noexcept {
    double wrapped = phase - std::floor(phase);
    // floor() of a value a hair below an integer can leave exactly 1.0
    if (wrapped >= 1.0) {
        wrapped -= 1.0;
    }
    return wrapped;
}

// =============================================================================
// CycleAccumulator
// =============================================================================

/// @brief Exact unbounded phase accumulator.
///
/// The accumulated value is `cycles + fraction`. advance() reports how many
/// integer boundaries were crossed, which is exactly
/// `floor(p1) - floor(p0)` for the unbounded values before and after the
/// step, computed before the fractional part is wrapped.
///
/// Value type with public members for cheap composition, like the other
/// phase carriers in this library.
///
/// @code
/// CycleAccumulator acc;
/// std::uint64_t crossed = acc.advance(2.5);  // 2 crossings, fraction 0.5
/// crossed = acc.advance(0.5);                // 1 crossing, fraction 0.0
/// @endcode
struct CycleAccumulator {
    /// Largest step advance() resolves (2^53). Beyond it a double has no
    /// fractional bits left, so the position within the cycle is undefined.
    static constexpr double kMaxStepCycles = 9007199254740992.0;

    std::uint64_t cycles = 0;  ///< Completed cycles so far
    double fraction = 0.0;     ///< Position within the current cycle [0, 1)

    /// @brief Advance by a non-negative number of cycles.
    /// Non-finite or non-positive deltas leave the accumulator unchanged.
    /// Steps of kMaxStepCycles or more count kMaxStepCycles crossings and
    /// keep the fractional position.
    /// @return Number of integer boundaries crossed.
    std::uint64_t advance(double deltaCycles) noexcept {
        if (!detail::isFinite(deltaCycles) || deltaCycles <= 0.0) {
            return 0;
        }
        if (deltaCycles >= kMaxStepCycles) {
            constexpr auto saturated = static_cast<std::uint64_t>(kMaxStepCycles);
            cycles += saturated;
            return saturated;
        }
        const double unbounded = fraction + deltaCycles;
        const double whole = std::floor(unbounded);
        double next = unbounded - whole;
        auto crossed = static_cast<std::uint64_t>(whole);
        if (next >= 1.0) {
            next -= 1.0;
            ++crossed;
        }
        fraction = next;
        cycles += crossed;
        return crossed;
    }

    /// @brief Unbounded accumulator value (cycles + fraction).
    /// Loses sub-cycle precision once cycles exceeds 2^53; use the members
    /// directly for exact arithmetic.
    [[nodiscard]] double total() const noexcept {
        return static_cast<double>(cycles) + fraction;
    }

    /// @brief Restart at cycle 0 with the given fractional position.
    void seed(double phase) noexcept {
        cycles = 0;
        fraction = detail::isFinite(phase) ? wrapPhase(phase) : 0.0;
    }

    void reset() noexcept {
        cycles = 0;
        fraction = 0.0;
    }
};

/// @brief Accumulator of the ratio-th harmonic of a fundamental.
///
/// A harmonic running at `ratio` times the fundamental's rate since the
/// same origin has accumulated exactly `ratio * (cycles + fraction)`. The
/// integer part is formed in integers so the result stays exact.
[[nodiscard]] inline CycleAccumulator harmonicOf(const CycleAccumulator& fundamental,
                                                 std::uint32_t ratio) noexcept {
    CycleAccumulator harmonic;
    const double scaled = fundamental.fraction * static_cast<double>(ratio);
    const double whole = std::floor(scaled);
    harmonic.cycles = fundamental.cycles * ratio + static_cast<std::uint64_t>(whole);
    harmonic.fraction = wrapPhase(scaled - whole);
    return harmonic;
}

} // namespace DSP
} // namespace Rhythmonics
