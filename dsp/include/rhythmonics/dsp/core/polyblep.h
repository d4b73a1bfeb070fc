// ==============================================================================
// Layer 0: Core Utility - PolyBLEP Step Correction
// ==============================================================================
// Two-point polynomial band-limited step (PolyBLEP) residual for removing the
// worst aliasing from waveforms with hard edges. Pure function, no state.
//
// For a unit upward step located at phase 0:
//   naive += polyBlepResidual(t, dt)
// where t is the phase measured from the step and dt the phase increment per
// sample. The residual is non-zero only within one sample of the step.
//
// Reference: Valimaki & Pekonen, "Perceptually informed synthesis of
// bandlimited classical waveforms using integrated polynomial interpolation"
// (2012)
// ==============================================================================

#pragma once

namespace Rhythmonics::DSP {

/// @brief Residual of a band-limited unit step relative to the naive step.
///
/// @param t Phase distance from the step, [0, 1)
/// @param dt Phase increment per sample, 0 < dt < 0.5
/// @return Value in [-1, 1] to add for an upward step of height 2
///         (-1 -> +1), or 0 outside [0, dt) and (1 - dt, 1)
[[nodiscard]] constexpr double polyBlepResidual(double t, double dt) noexcept {
    if (dt <= 0.0) {
        return 0.0;
    }
    if (t < dt) {
        // Just after the step
        const double x = t / dt;
        return -(x - 1.0) * (x - 1.0);
    }
    if (t > 1.0 - dt) {
        // Just before the step (wraps around from the previous cycle)
        const double x = (t - 1.0) / dt;
        return (x + 1.0) * (x + 1.0);
    }
    return 0.0;
}

} // namespace Rhythmonics::DSP
