// ==============================================================================
// Layer 0: Core Utility - Engine Configuration
// ==============================================================================
// Immutable tuning for the harmony engine. Built once by the host, validated
// by HarmonyEngine::prepare(), then read-only for the engine's lifetime.
//
// The regime thresholds and the crossfade shape are perceptual tuning
// choices rather than fixed behavior, so they live here instead of in the
// synthesizer.
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/db_utils.h>
#include <rhythmonics/dsp/core/speed_curve.h>

#include <cstdint>

namespace Rhythmonics::DSP {

// =============================================================================
// ToneWaveform
// =============================================================================

/// Continuous waveform used by a voice in the tonal regime
enum class ToneWaveform : uint8_t {
    Pulse = 0,  ///< Narrow band-limited pulse (clicks at low rate, buzz at high)
    Sine        ///< Pure sine
};

// =============================================================================
// EngineConfig
// =============================================================================

struct EngineConfig {
    // Clock ------------------------------------------------------------------
    double baseFrequencyHz = 1.0;       ///< Ratio-1 bounce rate at speed 1
    double initialSpeed = 1.0;          ///< Speed multiplier after prepare()
    double maxFrameDeltaSeconds = 0.25; ///< Longer frame deltas are clamped
    double maxFundamentalHz = 4000.0;   ///< setSpeed() rejects base * speed above this

    // Regime thresholds ------------------------------------------------------
    double lowThresholdHz = 15.0;       ///< Below: pure rhythm
    double highThresholdHz = 40.0;      ///< Above: pure tone

    // Percussive impulse -----------------------------------------------------
    float impulseAttackMs = 1.0f;       ///< Raised-cosine onset
    float impulseDecayMs = 8.0f;        ///< Exponential decay time constant
    float accentGain = 1.0f;            ///< Gain on vertex-0 hits

    // Tone -------------------------------------------------------------------
    ToneWaveform toneWaveform = ToneWaveform::Pulse;
    float pulseWidthSamples = 50.0f;    ///< Pulse width at 44.1 kHz, scaled to other rates
    float maxPulseDuty = 1.0f / 3.0f;   ///< Pulse never wider than this fraction of the period

    // Voice and mix ----------------------------------------------------------
    float voiceFadeMs = 300.0f;         ///< Fade in/out on add, remove, ratio change
    float headroomDb = -1.0f;           ///< Master gain before clamping
    float dcBlockerCutoffHz = 10.0f;

    /// @brief Validate every field.
    /// @return false if any field is non-finite or out of its usable range
    [[nodiscard]] bool isValid() const noexcept {
        if (!detail::isFinite(baseFrequencyHz) || baseFrequencyHz <= 0.0) {
            return false;
        }
        if (!detail::isFinite(initialSpeed) || initialSpeed <= 0.0) {
            return false;
        }
        if (!detail::isFinite(maxFrameDeltaSeconds) || maxFrameDeltaSeconds <= 0.0) {
            return false;
        }
        // The slider's top position must stay reachable
        if (!detail::isFinite(maxFundamentalHz) || maxFundamentalHz < kSliderMaxHz
            || maxFundamentalHz > 100000.0) {
            return false;
        }
        if (baseFrequencyHz * initialSpeed > maxFundamentalHz) {
            return false;
        }
        if (!detail::isFinite(lowThresholdHz) || !detail::isFinite(highThresholdHz)) {
            return false;
        }
        if (lowThresholdHz <= 0.0 || highThresholdHz <= lowThresholdHz) {
            return false;
        }
        if (!(impulseAttackMs >= 0.0f) || !(impulseDecayMs > 0.0f) || impulseDecayMs > 1000.0f) {
            return false;
        }
        if (!(accentGain >= 0.0f) || accentGain > 4.0f) {
            return false;
        }
        if (!(pulseWidthSamples > 0.0f) || !(maxPulseDuty > 0.0f) || maxPulseDuty >= 0.5f) {
            return false;
        }
        if (!(voiceFadeMs >= 0.0f) || voiceFadeMs > 10000.0f) {
            return false;
        }
        if (detail::isNaN(headroomDb) || headroomDb > 0.0f || headroomDb < -60.0f) {
            return false;
        }
        if (!(dcBlockerCutoffHz > 0.0f) || dcBlockerCutoffHz > 100.0f) {
            return false;
        }
        return true;
    }
};

} // namespace Rhythmonics::DSP
