// ==============================================================================
// Layer 1: DSP Primitive - Phase-Driven Tone
// ==============================================================================
// Stateless waveform shaper for the tonal regime. The caller owns the phase:
// the tone reads the oscillator's own phase instead of running a second
// accumulator, so the pitch heard is exactly the bounce rate drawn and the
// pitch ratios between voices are exactly the ensemble's ratios.
//
// Waveforms:
// - Pulse: a narrow pulse, high at each vertex crossing. Its width is a fixed
//   number of samples (so at low rates it is a click train) capped at a
//   fraction of the period (so at high rates it becomes a buzzy tone).
//   PolyBLEP corrected at both edges and offset to zero mean.
// - Sine: plain sine.
//
// Partials at or above Nyquist cannot be represented. The tone fades out
// linearly over the kNyquistFade increments below kNyquistGuard and is
// silent from there on, so a voice swept up past the guard fades instead of
// cutting off.
//
// Dependencies: Layer 0 polyblep.h, phase_utils.h, math_constants.h,
//               engine_config.h (ToneWaveform)
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/engine_config.h>
#include <rhythmonics/dsp/core/math_constants.h>
#include <rhythmonics/dsp/core/phase_utils.h>
#include <rhythmonics/dsp/core/polyblep.h>

#include <algorithm>
#include <cmath>

namespace Rhythmonics {
namespace DSP {

class PhaseTone {
public:
    /// Sample rate at which pulse widths are specified
    static constexpr double kReferenceSampleRate = 44100.0;

    /// Tone is silent for increments at or above this (cycles per sample)
    static constexpr double kNyquistGuard = 0.45;

    /// Increment span below kNyquistGuard over which the tone fades out
    static constexpr double kNyquistFade = 0.05;

    PhaseTone() noexcept = default;

    /// @param waveform Tonal waveform
    /// @param pulseWidthSamples Pulse width at 44.1 kHz, scaled to sampleRate
    /// @param maxDuty Largest pulse width as a fraction of the period
    /// @param sampleRate Sample rate in Hz
    void configure(ToneWaveform waveform, float pulseWidthSamples, float maxDuty,
                   double sampleRate) noexcept {
        waveform_ = waveform;
        const double sr = (sampleRate > 0.0) ? sampleRate : kReferenceSampleRate;
        pulseWidthSamples_ = static_cast<double>(pulseWidthSamples) * sr / kReferenceSampleRate;
        maxDuty_ = std::clamp(static_cast<double>(maxDuty), 0.01, 0.49);
    }

    [[nodiscard]] ToneWaveform getWaveform() const noexcept { return waveform_; }

    /// @brief Pulse duty cycle used at the given increment.
    [[nodiscard]] double dutyFor(double increment) const noexcept {
        return std::min(pulseWidthSamples_ * increment, maxDuty_);
    }

    /// @brief Gain applied near Nyquist: 1 below the fade, 0 at the guard.
    [[nodiscard]] static double guardGain(double increment) noexcept {
        return std::clamp((kNyquistGuard - increment) / kNyquistFade, 0.0, 1.0);
    }

    /// @brief Render the waveform at a phase.
    /// @param phase Oscillator phase in [0, 1); 0 is the vertex crossing
    /// @param increment Phase advance per sample (frequency / sampleRate)
    /// @return Sample in roughly [-1, 1]
    [[nodiscard]] float render(double phase, double increment) const noexcept {
        if (!(increment > 0.0) || increment >= kNyquistGuard) {
            return 0.0f;
        }
        const double gain = guardGain(increment);
        if (waveform_ == ToneWaveform::Sine) {
            return static_cast<float>(gain * std::sin(kTwoPiD * phase));
        }

        const double duty = dutyFor(increment);
        double value = (phase < duty) ? 1.0 : -1.0;
        value += polyBlepResidual(phase, increment);
        value -= polyBlepResidual(wrapPhase(phase - duty), increment);
        // Remove the DC of the unipolar-heavy pulse: mean is 2*duty - 1
        value -= 2.0 * duty - 1.0;
        return static_cast<float>(0.5 * gain * value);
    }

private:
    ToneWaveform waveform_ = ToneWaveform::Pulse;
    double pulseWidthSamples_ = 50.0;
    double maxDuty_ = 1.0 / 3.0;
};

} // namespace DSP
} // namespace Rhythmonics
