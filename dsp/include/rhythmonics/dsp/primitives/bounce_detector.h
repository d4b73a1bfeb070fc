// ==============================================================================
// Layer 1: DSP Primitive - Bounce Detector
// ==============================================================================
// Analytic vertex-crossing detection between two values of an unbounded phase
// accumulator.
//
// A tick that moves the accumulator from p0 to p1 crossed exactly
// floor(p1) - floor(p0) integer boundaries. Crossing k happened at
//
//     t_k = dt * (k - p0) / (p1 - p0)
//
// into the tick, assuming phase moved linearly during the tick. Polling the
// wrapped phase once per frame cannot see more than one wrap per frame, so
// at high speed it silently drops events and the heard pitch no longer
// matches the drawn bounce rate. Counting integer boundaries never does.
//
// A crossing that lands exactly on p1 belongs to the tick that ends there,
// so timestamps fall in (0, dt].
//
// Per-tick event storage is fixed (kMaxBounceEventsPerTick). When a tick
// crosses more boundaries than that, the first kMaxBounceEventsPerTick
// events are timed, the batch is flagged `saturated`, and crossingCount
// still holds the exact total. A saturated oscillator is effectively a
// continuous tone for that tick.
//
// Dependencies: Layer 0 engine_types.h, phase_utils.h
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/engine_types.h>
#include <rhythmonics/dsp/core/phase_utils.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>

namespace Rhythmonics {
namespace DSP {

// =============================================================================
// BounceBatch
// =============================================================================

/// @brief Bounce events produced by one oscillator during one tick.
struct BounceBatch {
    std::array<BounceEvent, kMaxBounceEventsPerTick> events{};
    size_t eventCount = 0;            ///< Valid entries in events
    std::uint64_t crossingCount = 0;  ///< Exact crossings, may exceed eventCount
    bool saturated = false;           ///< crossingCount > kMaxBounceEventsPerTick

    [[nodiscard]] std::span<const BounceEvent> view() const noexcept {
        return {events.data(), eventCount};
    }

    [[nodiscard]] bool empty() const noexcept { return crossingCount == 0; }

    void clear() noexcept {
        eventCount = 0;
        crossingCount = 0;
        saturated = false;
    }
};

// =============================================================================
// BounceDetector
// =============================================================================

/// @brief Stateless crossing counter and sub-tick timestamp generator.
///
/// @par Real-Time Safety
/// No allocation, no exceptions. Work per call is bounded by
/// kMaxBounceEventsPerTick regardless of how many crossings occurred.
class BounceDetector {
public:
    /// @brief Exact number of integer boundaries in (p0, p1].
    /// @return floor(p1) - floor(p0), or 0 if p1 <= p0 or either is non-finite.
    ///         Counts of CycleAccumulator::kMaxStepCycles or more saturate
    ///         at that value.
    [[nodiscard]] static std::uint64_t countCrossings(double p0, double p1) noexcept {
        if (!detail::isFinite(p0) || !detail::isFinite(p1) || p1 <= p0) {
            return 0;
        }
        const double crossings = std::floor(p1) - std::floor(p0);
        if (crossings >= CycleAccumulator::kMaxStepCycles) {
            return static_cast<std::uint64_t>(CycleAccumulator::kMaxStepCycles);
        }
        return static_cast<std::uint64_t>(crossings);
    }

    /// @brief Detect crossings between two unbounded accumulator values.
    ///
    /// @param p0 Accumulator value at the start of the tick
    /// @param p1 Accumulator value at the end of the tick
    /// @param dt Tick duration; timestamps are in the same unit
    /// @param id Oscillator the events belong to
    /// @param sides Polygon side count used to number the struck vertex
    /// @param out Batch to fill (cleared first)
    static void detect(double p0, double p1, double dt, OscillatorId id,
                       std::uint32_t sides, BounceBatch& out) noexcept {
        out.clear();
        const std::uint64_t crossings = countCrossings(p0, p1);
        if (crossings == 0) {
            return;
        }
        const double firstBoundary = std::floor(p0) + 1.0;
        // Only the residue modulo sides is needed, and it stays in range for
        // boundaries too large for an integer
        const double modulus = static_cast<double>(sides == 0 ? 1 : sides);
        const double residue = firstBoundary - modulus * std::floor(firstBoundary / modulus);
        const auto firstIndex = static_cast<std::int64_t>(std::clamp(residue, 0.0, modulus - 1.0));
        fill(out, crossings, id, sides, dt, p1 - p0,
             firstBoundary - p0, firstIndex);
    }

    /// @brief Detect crossings for a CycleAccumulator step.
    ///
    /// Exact for arbitrarily long runs: works on the fractional part and the
    /// integer cycle count separately instead of on the unbounded double.
    ///
    /// @param before Accumulator state at the start of the tick
    /// @param deltaCycles Cycles advanced during the tick (p1 - p0)
    /// @param dt Tick duration; timestamps are in the same unit
    /// @param id Oscillator the events belong to
    /// @param sides Polygon side count used to number the struck vertex
    /// @param out Batch to fill (cleared first)
    static void detect(const CycleAccumulator& before, double deltaCycles, double dt,
                       OscillatorId id, std::uint32_t sides, BounceBatch& out) noexcept {
        out.clear();
        if (!detail::isFinite(deltaCycles) || deltaCycles <= 0.0) {
            return;
        }
        CycleAccumulator after = before;
        const std::uint64_t crossings = after.advance(deltaCycles);
        if (crossings == 0) {
            return;
        }
        fill(out, crossings, id, sides, dt, deltaCycles,
             1.0 - before.fraction,
             static_cast<std::int64_t>(before.cycles % (sides == 0 ? 1 : sides)) + 1);
    }

private:
    /// @param span p1 - p0
    /// @param firstOffset Distance from p0 to the first boundary crossed
    /// @param firstIndex Integer value of the first boundary (only its
    ///        residue modulo sides matters)
    static void fill(BounceBatch& out, std::uint64_t crossings, OscillatorId id,
                     std::uint32_t sides, double dt, double span,
                     double firstOffset, std::int64_t firstIndex) noexcept {
        out.crossingCount = crossings;
        out.saturated = crossings > kMaxBounceEventsPerTick;

        const size_t toEmit = out.saturated
            ? kMaxBounceEventsPerTick
            : static_cast<size_t>(crossings);
        const std::int64_t modulus = (sides == 0) ? 1 : static_cast<std::int64_t>(sides);
        const double secondsPerCycle = dt / span;

        for (size_t i = 0; i < toEmit; ++i) {
            BounceEvent& event = out.events[i];
            event.oscillatorId = id;
            event.timestampWithinTick = (firstOffset + static_cast<double>(i)) * secondsPerCycle;
            if (event.timestampWithinTick > dt) {
                event.timestampWithinTick = dt;
            }
            const std::int64_t index = firstIndex + static_cast<std::int64_t>(i);
            event.vertex = static_cast<std::uint32_t>(((index % modulus) + modulus) % modulus);
            event.accent = (event.vertex == 0);
        }
        out.eventCount = toEmit;
    }
};

} // namespace DSP
} // namespace Rhythmonics
