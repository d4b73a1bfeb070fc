// ==============================================================================
// Layer 0: Core Utility - Crossfade Utilities
// ==============================================================================
// Shared crossfade math for the rhythm/harmony regime transition.
//
// Used by:
// - RegimeSynthesizer: percussive/tonal blend per voice
// - classifyRegime(): blend factor reported in snapshots
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/math_constants.h>

#include <cmath>
#include <utility>

namespace Rhythmonics {
namespace DSP {

/// @brief Calculate equal-power crossfade gains (fadeOut^2 + fadeIn^2 = 1)
///
/// At position 0.0: fadeOut=1.0, fadeIn=0.0
/// At position 0.5: fadeOut~0.707, fadeIn~0.707
/// At position 1.0: fadeOut=0.0, fadeIn=1.0
///
/// @param position Crossfade position [0.0 = start, 1.0 = complete]
/// @param fadeOut Output gain for outgoing signal (1.0 -> 0.0)
/// @param fadeIn Output gain for incoming signal (0.0 -> 1.0)
///
/// @note Does NOT clamp position - caller keeps it in [0, 1]
inline void equalPowerGains(float position, float& fadeOut, float& fadeIn) noexcept {
    fadeOut = std::cos(position * kHalfPi);
    fadeIn = std::sin(position * kHalfPi);
}

/// @brief Single-call version returning {fadeOut, fadeIn}
[[nodiscard]] inline std::pair<float, float> equalPowerGains(float position) noexcept {
    return {std::cos(position * kHalfPi), std::sin(position * kHalfPi)};
}

/// @brief Crossfade position linear in log(frequency) between two bounds.
///
/// Perceived transition from pulse train to pitch is roughly logarithmic in
/// rate, so the blend moves by equal amounts per octave.
///
/// @param frequency Frequency in Hz
/// @param lowHz Frequency at which the position is 0
/// @param highHz Frequency at which the position is 1 (must be > lowHz > 0)
/// @return Position clamped to [0, 1]. Frequencies <= 0 return 0.
[[nodiscard]] inline float logDomainBlend(double frequency, double lowHz, double highHz) noexcept {
    if (frequency <= lowHz || lowHz <= 0.0) {
        return 0.0f;
    }
    if (frequency >= highHz || highHz <= lowHz) {
        return 1.0f;
    }
    const double position = std::log(frequency / lowHz) / std::log(highHz / lowHz);
    return static_cast<float>(position);
}

/// @brief Per-sample increment to move a crossfade from 0 to 1 in durationMs
/// @return 1.0 if duration is 0 or negative (instant crossfade)
[[nodiscard]] inline float crossfadeIncrement(float durationMs, double sampleRate) noexcept {
    const float samples = durationMs * 0.001f * static_cast<float>(sampleRate);
    return (samples > 0.0f) ? (1.0f / samples) : 1.0f;
}

} // namespace DSP
} // namespace Rhythmonics
