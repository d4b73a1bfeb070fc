// ==============================================================================
// Layer 0: Core Utility - Speed Slider Curve
// ==============================================================================
// Maps a normalized slider position to the fundamental bounce rate, in four
// quarter-travel segments:
//
//   [0.00, 0.25]  linear  0 Hz -> 1 Hz      (60 BPM), dead zone at the bottom
//   (0.25, 0.50]  linear  1 Hz -> 275/60 Hz (275 BPM)
//   (0.50, 0.75]  log2    275/60 Hz -> 110 Hz
//   (0.75, 1.00]  log2    110 Hz -> 2000 Hz
//
// The lower half gives fine control over tempo; the upper half sweeps
// through pitch. Positions whose rate falls at or below kFreezeThresholdHz
// map to 0 Hz, which the engine treats as "freeze" (speed itself must stay
// positive).
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Rhythmonics::DSP {

/// Rates at or below this (Hz) snap to 0 (freeze)
inline constexpr double kFreezeThresholdHz = 0.02;

/// Segment end points of the slider curve (Hz)
inline constexpr double kSliderGrooveHz = 1.0;
inline constexpr double kSliderChaosHz = 275.0 / 60.0;
inline constexpr double kSliderHarmonyHz = 110.0;
inline constexpr double kSliderMaxHz = 2000.0;

// =============================================================================
// SliderZone
// =============================================================================

/// Labels printed beside the slider travel, bottom to top
enum class SliderZone : uint8_t {
    Freeze = 0,
    Groove,
    Chaos,
    Harmony,
    Eeeeee
};

inline constexpr int kSliderZoneCount = 5;

[[nodiscard]] inline constexpr const char* getSliderZoneName(SliderZone zone) noexcept {
    constexpr const char* kNames[] = {
        "FREEZE",
        "GROOVE",
        "CHAOS",
        "HARMONY",
        "EEEEEE"
    };
    const auto index = static_cast<size_t>(zone);
    return (index < static_cast<size_t>(kSliderZoneCount)) ? kNames[index] : "Unknown";
}

// =============================================================================
// Curve
// =============================================================================

/// @brief Convert a slider position to a fundamental frequency.
/// @param position Normalized position, clamped to [0, 1]. NaN maps to 0.
/// @return Fundamental frequency in Hz, 0 inside the freeze dead zone
[[nodiscard]] inline double sliderToFundamentalHz(double position) noexcept {
    if (!(position > 0.0)) {
        return 0.0;
    }
    const double s = std::min(position, 1.0);

    if (s <= 0.25) {
        const double hz = s / 0.25 * kSliderGrooveHz;
        return (hz <= kFreezeThresholdHz) ? 0.0 : hz;
    }
    if (s <= 0.5) {
        const double t = (s - 0.25) / 0.25;
        return (1.0 - t) * kSliderGrooveHz + t * kSliderChaosHz;
    }
    if (s <= 0.75) {
        const double t = (s - 0.5) / 0.25;
        return kSliderChaosHz + (kSliderHarmonyHz - kSliderChaosHz) * std::log2(1.0 + t);
    }
    const double t = (s - 0.75) / 0.25;
    return kSliderHarmonyHz + (kSliderMaxHz - kSliderHarmonyHz) * std::log2(1.0 + t);
}

/// @brief Beats per minute of a fundamental frequency.
[[nodiscard]] constexpr double fundamentalHzToBpm(double hz) noexcept {
    return hz * 60.0;
}

/// @brief Label nearest to the slider position.
[[nodiscard]] inline SliderZone sliderZone(double position) noexcept {
    if (!(position > 0.0)) {
        return SliderZone::Freeze;
    }
    const double s = std::min(position, 1.0);
    const auto index = static_cast<int>(std::lround(s * 4.0));
    return static_cast<SliderZone>(std::clamp(index, 0, kSliderZoneCount - 1));
}

} // namespace Rhythmonics::DSP
